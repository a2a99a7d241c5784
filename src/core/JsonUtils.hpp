// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace tailview::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Returns a pointer to the member @p key of @p obj, or nullptr if absent.
[[nodiscard]] inline auto find(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(std::string(key));
    return it != obj.end() ? &*it : nullptr;
}

/// @brief Extracts a required string field from a JSON object.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const* value = find(obj, key);
    if (!value || !value->is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return value->get<std::string>();
}

/// @brief Extracts an optional string field, or @p defaultValue if missing or not a string.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const* value = find(obj, key);
    if (value && value->is_string())
        return value->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field, or @p defaultValue if missing or not an integer.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const* value = find(obj, key);
    if (value && value->is_number_integer())
        return value->get<int>();
    return defaultValue;
}

/// @brief Extracts an optional 64-bit integer field (durations in milliseconds).
[[nodiscard]] inline auto getInt64Or(const nlohmann::json& obj, std::string_view key, std::int64_t defaultValue)
    -> std::int64_t
{
    auto const* value = find(obj, key);
    if (value && value->is_number())
        return value->get<std::int64_t>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field, or @p defaultValue if missing or not a boolean.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const* value = find(obj, key);
    if (value && value->is_boolean())
        return value->get<bool>();
    return defaultValue;
}

/// @brief Formats a JSON value for display: strings unquoted, everything else compact JSON.
[[nodiscard]] inline auto toDisplayString(const nlohmann::json& value) -> std::string
{
    if (value.is_string())
        return value.get<std::string>();
    return value.dump();
}

} // namespace tailview::json
