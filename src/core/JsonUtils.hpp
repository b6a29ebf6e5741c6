// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace agentmesh::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @param code The error code to report on malformed input.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input, ErrorCode code = ErrorCode::ProtocolError)
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

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value or the default.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Converts a JSON array of strings into a vector.
/// @param value The JSON value, expected to be an array of strings.
/// @return The strings, or a StoreError if the value has another shape.
[[nodiscard]] inline auto toStringList(const nlohmann::json& value) -> Result<std::vector<std::string>>
{
    if (!value.is_array())
        return makeError(ErrorCode::StoreError, "Expected a JSON array of strings");

    auto result = std::vector<std::string> {};
    result.reserve(value.size());
    for (const auto& item: value)
    {
        if (!item.is_string())
            return makeError(ErrorCode::StoreError, "Expected a JSON array of strings");
        result.push_back(item.get<std::string>());
    }
    return result;
}

/// @brief Parses a stored JSON document holding an array of strings.
/// @param input The stored document.
/// @return The strings or a StoreError.
[[nodiscard]] inline auto parseStringList(std::string_view input) -> Result<std::vector<std::string>>
{
    return parse(input, ErrorCode::StoreError).and_then([](const nlohmann::json& value) {
        return toStringList(value);
    });
}

/// @brief Serializes a list of strings into a JSON array document.
[[nodiscard]] inline auto dumpStringList(const std::vector<std::string>& values) -> std::string
{
    return nlohmann::json(values).dump();
}

} // namespace agentmesh::json
