// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentmesh
{

/// @brief The role of a message participant in a chat conversation.
enum class Role
{
    System,
    User,
    Assistant,
    Tool,
};

/// @brief Converts a Role enum to its string representation.
/// @param role The role to convert.
/// @return The string representation.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

/// @brief Parses a string to a Role enum value.
/// @param str The string to parse.
/// @return The corresponding Role, or Role::User if unknown.
[[nodiscard]] constexpr auto roleFromString(std::string_view str) -> Role
{
    if (str == "system")
        return Role::System;
    if (str == "assistant")
        return Role::Assistant;
    if (str == "tool")
        return Role::Tool;
    return Role::User;
}

/// @brief Mode governing how a chat's responses are routed between agents.
enum class CollaborationType
{
    Sequential,
    Phased,
    Independent,
    Chat,
};

[[nodiscard]] constexpr auto collaborationTypeToString(CollaborationType type) -> std::string_view
{
    switch (type)
    {
        case CollaborationType::Sequential: return "SEQUENTIAL";
        case CollaborationType::Phased: return "PHASED";
        case CollaborationType::Independent: return "INDEPENDENT";
        case CollaborationType::Chat: return "CHAT";
    }
    return "INDEPENDENT";
}

/// @brief Parses a collaboration type name.
/// @return The type, or std::nullopt if the name is not one of the four known names.
[[nodiscard]] constexpr auto collaborationTypeFromString(std::string_view str) -> std::optional<CollaborationType>
{
    if (str == "SEQUENTIAL")
        return CollaborationType::Sequential;
    if (str == "PHASED")
        return CollaborationType::Phased;
    if (str == "INDEPENDENT")
        return CollaborationType::Independent;
    if (str == "CHAT")
        return CollaborationType::Chat;
    return std::nullopt;
}

/// @brief Represents a tool call request from the LLM.
struct ToolCall
{
    std::string id;
    std::string name;
    nlohmann::json arguments;
};

/// @brief Represents the result of executing a tool call.
struct ToolResult
{
    std::string callId;
    std::string content;
    bool isError = false;
};

/// @brief Describes a tool as offered to the LLM.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief A single role-tagged record in a chat history.
struct ChatMessage
{
    Role role = Role::User;
    std::string content;
    std::vector<ToolCall> toolCalls;
    std::string toolCallId; // For Role::Tool messages
};

/// @brief The result of an LLM generation, either text or tool calls.
struct GenerateResult
{
    std::string text;
    std::vector<ToolCall> toolCalls;

    /// @brief Returns true if this result contains tool calls.
    [[nodiscard]] auto hasToolCalls() const -> bool { return !toolCalls.empty(); }
};

} // namespace agentmesh
