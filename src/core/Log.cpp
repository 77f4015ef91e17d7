// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <mutex>
#include <print>

namespace vosklink::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };

    // Worker pools log concurrently, so the sink is guarded.
    auto callbackMutex = std::mutex {};
    auto globalCallback = LogCallback {};
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(callbackMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto parseLevel(std::string_view text) -> std::optional<Level>
{
    if (text == "error")
        return Level::Error;
    if (text == "warning" || text == "warn")
        return Level::Warning;
    if (text == "info")
        return Level::Info;
    if (text == "debug")
        return Level::Debug;
    if (text == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "info";
}

void write(Level level, std::string_view message)
{
    if (level > getLevel())
        return;

    auto lock = std::lock_guard(callbackMutex);
    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    std::println(stderr, "[vosklink {}] {}", levelPrefix(level), message);
}

} // namespace vosklink::log
