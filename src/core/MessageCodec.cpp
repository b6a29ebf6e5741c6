// SPDX-License-Identifier: Apache-2.0
#include "MessageCodec.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace agentmesh::codec
{

namespace
{

    /// @brief Reads an optional string field, failing when it is present with another type.
    auto optionalString(const nlohmann::json& value, std::string_view key) -> Result<std::string>
    {
        auto const keyStr = std::string(key);
        if (!value.contains(keyStr) || value[keyStr].is_null())
            return std::string {};
        if (!value[keyStr].is_string())
            return makeError(ErrorCode::ProtocolError, std::format("Field '{}' must be a string", key));
        return value[keyStr].get<std::string>();
    }

} // namespace

auto messageToJson(const Message& message) -> nlohmann::json
{
    return nlohmann::json {
        { "sender", message.sender },
        { "context_name", message.contextName },
        { "chat_id", message.chatId },
        { "type", messageTypeToString(message.type) },
        { "content", message.content },
    };
}

auto messageFromJson(const nlohmann::json& value) -> Result<Message>
{
    if (!value.is_object())
        return makeError(ErrorCode::ProtocolError, "Message must be a JSON object");

    auto typeName = json::getString(value, "type");
    if (!typeName)
        return std::unexpected(typeName.error());

    auto const type = messageTypeFromString(*typeName);
    if (!type)
        return makeError(ErrorCode::ProtocolError, std::format("Unknown message type: {}", *typeName));

    auto message = Message {};
    message.type = *type;

    for (auto const& [key, field]: { std::pair { "sender", &message.sender },
                                     std::pair { "context_name", &message.contextName },
                                     std::pair { "chat_id", &message.chatId },
                                     std::pair { "content", &message.content } })
    {
        auto text = optionalString(value, key);
        if (!text)
            return std::unexpected(text.error());
        *field = std::move(*text);
    }

    return message;
}

auto encodeMessage(const Message& message) -> std::string
{
    return messageToJson(message).dump();
}

auto decodeMessage(std::string_view wire) -> Result<Message>
{
    return json::parse(wire).and_then([](const nlohmann::json& value) { return messageFromJson(value); });
}

auto eventToJson(const Event& event) -> nlohmann::json
{
    return nlohmann::json {
        { "name", event.name },
        { "source", event.source },
        { "payload", event.payload },
    };
}

auto eventFromJson(const nlohmann::json& value) -> Result<Event>
{
    auto name = json::getString(value, "name");
    if (!name)
        return std::unexpected(name.error());

    return Event {
        .name = std::move(*name),
        .source = json::getStringOr(value, "source", ""),
        .payload = json::getStringOr(value, "payload", ""),
    };
}

auto chatMessageToJson(const ChatMessage& message) -> nlohmann::json
{
    auto result = nlohmann::json {
        { "role", roleToString(message.role) },
        { "content", message.content },
    };

    if (!message.toolCalls.empty())
    {
        auto calls = nlohmann::json::array();
        for (const auto& call: message.toolCalls)
        {
            calls.push_back(nlohmann::json {
                { "id", call.id },
                { "name", call.name },
                { "arguments", call.arguments },
            });
        }
        result["tool_calls"] = std::move(calls);
    }

    if (!message.toolCallId.empty())
        result["tool_call_id"] = message.toolCallId;

    return result;
}

auto chatMessageFromJson(const nlohmann::json& value) -> Result<ChatMessage>
{
    auto role = json::getString(value, "role");
    if (!role)
        return std::unexpected(role.error());

    auto message = ChatMessage {
        .role = roleFromString(*role),
        .content = json::getStringOr(value, "content", ""),
        .toolCalls = {},
        .toolCallId = json::getStringOr(value, "tool_call_id", ""),
    };

    if (value.contains("tool_calls") && value["tool_calls"].is_array())
    {
        for (const auto& call: value["tool_calls"])
        {
            message.toolCalls.push_back(ToolCall {
                .id = json::getStringOr(call, "id", ""),
                .name = json::getStringOr(call, "name", ""),
                .arguments = call.value("arguments", nlohmann::json::object()),
            });
        }
    }

    return message;
}

auto toolDefinitionToJson(const ToolDefinition& tool) -> nlohmann::json
{
    return nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "parameters", tool.inputSchema },
    };
}

auto toolDefinitionFromJson(const nlohmann::json& value) -> Result<ToolDefinition>
{
    auto name = json::getString(value, "name");
    if (!name)
        return std::unexpected(name.error());

    return ToolDefinition {
        .name = std::move(*name),
        .description = json::getStringOr(value, "description", ""),
        .inputSchema = value.value("parameters", nlohmann::json::object()),
    };
}

} // namespace agentmesh::codec
