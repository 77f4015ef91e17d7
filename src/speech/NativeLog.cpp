// SPDX-License-Identifier: Apache-2.0
#include "NativeLog.hpp"

#include <core/Log.hpp>

#include <vosk_api.h>

#include <atomic>
#include <mutex>

namespace vosklink
{

namespace
{
    auto nativeLevelMutex = std::mutex {};
    auto nativeLevel = std::atomic<int> { NativeLogDefault };
} // namespace

void setNativeLogLevel(int level)
{
    // libvosk stores the level in a plain global, so writers must not interleave.
    auto lock = std::lock_guard(nativeLevelMutex);
    vosk_set_log_level(level);
    nativeLevel.store(level, std::memory_order_release);
    log::debug("Native log level set to {}", level);
}

auto nativeLogLevel() -> int
{
    return nativeLevel.load(std::memory_order_acquire);
}

} // namespace vosklink
