// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentHandler.hpp>
#include <llm/Llm.hpp>

#include <vector>

namespace agentmesh
{

class Context;
class Registry;

/// @brief Configuration for an LlmAgent.
struct LlmAgentConfig
{
    int maxToolSteps = 10;
};

/// @brief Answers requests with a language model, executing the tool calls it asks for.
///
/// Without history and without tools the request is sent as a single prompt. Otherwise the
/// system message, the history and the request form a chat completion. Tool calls are run
/// through the registry and fed back until the model answers with text or the step budget
/// is used up, in which case one last completion without tools forces an answer.
class LlmAgent: public AgentHandler
{
  public:
    /// @brief Constructs an LlmAgent.
    /// @param llm The model; must outlive the agent.
    /// @param config Agent configuration.
    explicit LlmAgent(Llm& llm, LlmAgentConfig config = {});

    [[nodiscard]] auto processRequest(AgentRuntime& agent,
                                      const Message& request,
                                      std::span<const ChatMessage> history)
        -> Result<std::optional<std::string>> override;

    /// @brief Responses addressed to an LlmAgent are logged and otherwise ignored.
    [[nodiscard]] auto processResponse(AgentRuntime& agent, const Message& response) -> VoidResult override;

    [[nodiscard]] auto config() const -> const LlmAgentConfig& { return _config; }

  private:
    Llm& _llm;
    LlmAgentConfig _config;

    [[nodiscard]] auto executeToolCalls(Registry& registry,
                                        Context& context,
                                        const std::string& chatId,
                                        const std::vector<ToolCall>& calls) -> Result<std::vector<ToolResult>>;
};

} // namespace agentmesh
