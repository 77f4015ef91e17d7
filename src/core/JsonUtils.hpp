// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

#include "Error.hpp"

namespace vosklink::json
{

/// @brief Parses a JSON document, reporting syntax errors as @p code.
/// @param input The JSON text to parse.
/// @param code The error code to report on failure.
/// @return The parsed JSON value or an Error.
[[nodiscard]] inline auto parse(std::string_view input, ErrorCode code = ErrorCode::ResultParseError)
    -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(code, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts an optional string field from a JSON object.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const it = obj.find(key);
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const it = obj.find(key);
    if (it != obj.end() && it->is_number_integer())
        return it->get<int>();
    return defaultValue;
}

/// @brief Extracts an optional floating-point field from a JSON object.
///
/// Integer values are accepted too, since libvosk prints whole numbers without a fraction.
[[nodiscard]] inline auto getDoubleOr(const nlohmann::json& obj, std::string_view key, double defaultValue)
    -> double
{
    auto const it = obj.find(key);
    if (it != obj.end() && it->is_number())
        return it->get<double>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const it = obj.find(key);
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

} // namespace vosklink::json
