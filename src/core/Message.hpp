// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace agentmesh
{

/// @brief Kind of a message exchanged between agents.
enum class MessageType
{
    Request,
    Response,
    Ack,
    Event,
};

[[nodiscard]] constexpr auto messageTypeToString(MessageType type) -> std::string_view
{
    switch (type)
    {
        case MessageType::Request: return "REQUEST";
        case MessageType::Response: return "RESPONSE";
        case MessageType::Ack: return "ACK";
        case MessageType::Event: return "EVENT";
    }
    return "REQUEST";
}

[[nodiscard]] constexpr auto messageTypeFromString(std::string_view str) -> std::optional<MessageType>
{
    if (str == "REQUEST")
        return MessageType::Request;
    if (str == "RESPONSE")
        return MessageType::Response;
    if (str == "ACK")
        return MessageType::Ack;
    if (str == "EVENT")
        return MessageType::Event;
    return std::nullopt;
}

/// @brief A message sent from one agent to another.
///
/// The sender field is stamped by the sending agent right before dispatch.
struct Message
{
    std::string sender;
    std::string contextName;
    std::string chatId;
    MessageType type = MessageType::Request;
    std::string content;
};

/// @brief A notification delivered by the transport outside the request/response flow.
struct Event
{
    std::string name;
    std::string source;
    std::string payload;
};

/// @brief Generates a fresh random chat identifier (32 lowercase hex characters).
[[nodiscard]] auto generateChatId() -> std::string;

} // namespace agentmesh
