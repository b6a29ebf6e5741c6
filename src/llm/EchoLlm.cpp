// SPDX-License-Identifier: Apache-2.0
#include "EchoLlm.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace agentmesh
{

EchoLlm::EchoLlm(std::string label, std::string systemMessage):
    _label(std::move(label)), _systemMessage(std::move(systemMessage))
{
}

auto EchoLlm::processSinglePrompt(std::string_view prompt) -> Result<std::string>
{
    return std::format("[{}] {}", _label, prompt);
}

auto EchoLlm::processChatCompletion(std::span<const ChatMessage> messages,
                                    std::span<const ToolDefinition> /*tools*/) -> Result<GenerateResult>
{
    auto reversed = messages | std::views::reverse;
    auto const lastUser = std::ranges::find_if(reversed, [](const ChatMessage& m) { return m.role == Role::User; });
    if (lastUser == reversed.end())
        return makeError(ErrorCode::InferenceError, "No user message to answer");

    return GenerateResult {
        .text = std::format("[{}] {} ({} messages seen)", _label, lastUser->content, messages.size()),
        .toolCalls = {},
    };
}

} // namespace agentmesh
