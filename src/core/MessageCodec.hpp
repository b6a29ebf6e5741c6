// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Message.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace agentmesh::codec
{

/// @brief Builds the JSON form of a message.
/// @param message The message to convert.
/// @return A JSON object carrying every message field; the type is written by name.
[[nodiscard]] auto messageToJson(const Message& message) -> nlohmann::json;

/// @brief Parses the JSON form of a message.
/// @param value The JSON object.
/// @return The message, or a ProtocolError on a missing or unknown type or a malformed field.
[[nodiscard]] auto messageFromJson(const nlohmann::json& value) -> Result<Message>;

/// @brief Encodes a message into its wire string.
[[nodiscard]] auto encodeMessage(const Message& message) -> std::string;

/// @brief Decodes a message from its wire string.
[[nodiscard]] auto decodeMessage(std::string_view wire) -> Result<Message>;

[[nodiscard]] auto eventToJson(const Event& event) -> nlohmann::json;
[[nodiscard]] auto eventFromJson(const nlohmann::json& value) -> Result<Event>;

/// @brief Builds the stored form of a chat history record.
[[nodiscard]] auto chatMessageToJson(const ChatMessage& message) -> nlohmann::json;

/// @brief Parses a stored chat history record.
[[nodiscard]] auto chatMessageFromJson(const nlohmann::json& value) -> Result<ChatMessage>;

[[nodiscard]] auto toolDefinitionToJson(const ToolDefinition& tool) -> nlohmann::json;
[[nodiscard]] auto toolDefinitionFromJson(const nlohmann::json& value) -> Result<ToolDefinition>;

} // namespace agentmesh::codec
