// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cmath>
#include <cstddef>
#include <format>
#include <string>
#include <string_view>

namespace vosklink
{

/// @brief Longest model directory path, in bytes, accepted by Model::load().
constexpr auto MaxPathLength = std::size_t { 1023 };

/// @brief Longest word, in bytes, accepted by Model::findWord().
constexpr auto MaxWordLength = std::size_t { 255 };

/// @brief Checks that @p text can be handed to libvosk as a C string.
/// @param text The caller-supplied bytes.
/// @param maxLength Upper bound in bytes, excluding the terminator.
/// @param what Argument name used in the error message.
/// @return Success, or InvalidArgument for oversized or NUL-containing input.
///
/// Empty input is passed through; libvosk reports it like any other unknown value.
[[nodiscard]] inline auto checkNativeString(std::string_view text, std::size_t maxLength, std::string_view what)
    -> VoidResult
{
    if (text.size() > maxLength)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("{} is {} bytes long, limit is {}", what, text.size(), maxLength));
    if (text.find('\0') != std::string_view::npos)
        return makeError(ErrorCode::InvalidArgument, std::format("{} contains a NUL byte", what));
    return {};
}

[[nodiscard]] inline auto checkSampleRate(float sampleRate) -> VoidResult
{
    if (!std::isfinite(sampleRate) || sampleRate <= 0.0f)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Sample rate must be positive and finite, got {}", sampleRate));
    return {};
}

} // namespace vosklink
