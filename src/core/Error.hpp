// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace vosklink
{

/// @brief Error codes for categorizing failures at the binding boundary.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    ModelLoadFailed,
    RecognizerCreationFailed,
    ResourceReleased,
    ResultParseError,
    ConfigError,
    IoError,
    AudioFormatError,
    PoolShutdown,
};

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns the stable tag a caller can branch on, e.g. "model_load_failed".
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::ModelLoadFailed: return "model_load_failed";
        case ErrorCode::RecognizerCreationFailed: return "recognizer_creation_failed";
        case ErrorCode::ResourceReleased: return "resource_released";
        case ErrorCode::ResultParseError: return "result_parse_error";
        case ErrorCode::ConfigError: return "config_error";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::AudioFormatError: return "audio_format_error";
        case ErrorCode::PoolShutdown: return "pool_shutdown";
    }
    return "unknown";
}

} // namespace vosklink

template <>
struct std::formatter<vosklink::Error>: std::formatter<std::string>
{
    auto format(const vosklink::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", vosklink::errorCodeName(error.code), error.message), ctx);
    }
};
