// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <span>
#include <string>
#include <string_view>

namespace agentmesh
{

/// @brief A language model as seen by an agent.
///
/// Implementations wrap a concrete inference backend. Agents only pass prompts, chat
/// histories and tool descriptors through this interface.
class Llm
{
  public:
    virtual ~Llm() = default;

    /// @brief The system message prepended to chat completions; may be empty.
    [[nodiscard]] virtual auto systemMessage() const -> std::string = 0;

    /// @brief Answers a single prompt without any conversation context.
    /// @param prompt The prompt text.
    /// @return The answer text or an InferenceError.
    [[nodiscard]] virtual auto processSinglePrompt(std::string_view prompt) -> Result<std::string> = 0;

    /// @brief Runs a chat completion.
    /// @param messages The conversation so far, oldest first.
    /// @param tools The tools the model may call; empty to disallow tool calls.
    /// @return Either answer text or the tool calls the model requested.
    [[nodiscard]] virtual auto processChatCompletion(std::span<const ChatMessage> messages,
                                                     std::span<const ToolDefinition> tools)
        -> Result<GenerateResult> = 0;
};

} // namespace agentmesh
