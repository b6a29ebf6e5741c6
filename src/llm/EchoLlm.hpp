// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/Llm.hpp>

#include <string>

namespace agentmesh
{

/// @brief Llm that answers with the latest user input, prefixed by a fixed label.
///
/// Used by the demo command and in tests where no inference backend is available.
/// It never requests tool calls.
class EchoLlm: public Llm
{
  public:
    explicit EchoLlm(std::string label, std::string systemMessage = {});

    [[nodiscard]] auto systemMessage() const -> std::string override { return _systemMessage; }
    [[nodiscard]] auto processSinglePrompt(std::string_view prompt) -> Result<std::string> override;
    [[nodiscard]] auto processChatCompletion(std::span<const ChatMessage> messages,
                                             std::span<const ToolDefinition> tools)
        -> Result<GenerateResult> override;

  private:
    std::string _label;
    std::string _systemMessage;
};

} // namespace agentmesh
