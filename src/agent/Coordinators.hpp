// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentHandler.hpp>
#include <context/Context.hpp>

#include <string>
#include <vector>

namespace agentmesh
{

/// @brief Runs a request through a fixed chain of agents.
///
/// The coordinator sets up a SEQUENTIAL chat whose final response goes back to the original
/// requester, then hands the request to the first agent. It never answers by itself.
class SequentialCoordinator: public AgentHandler
{
  public:
    explicit SequentialCoordinator(std::vector<std::string> agents);

    [[nodiscard]] auto processRequest(AgentRuntime& agent,
                                      const Message& request,
                                      std::span<const ChatMessage> history)
        -> Result<std::optional<std::string>> override;

    [[nodiscard]] auto processResponse(AgentRuntime& agent, const Message& response) -> VoidResult override;

    [[nodiscard]] auto agents() const -> const std::vector<std::string>& { return _agents; }

  private:
    std::vector<std::string> _agents;
};

/// @brief Runs a request through groups of agents, one phase after the other.
///
/// All agents of a phase receive the query together and answer into the shared chat history.
/// Each acknowledgement removes its sender from the phase's required agents; only once that
/// set is empty does the coordinator advance to the next phase. After the last phase the
/// latest assistant answer is sent to the original requester.
class PhasedCoordinator: public AgentHandler
{
  public:
    explicit PhasedCoordinator(std::vector<std::vector<std::string>> phases);

    [[nodiscard]] auto processRequest(AgentRuntime& agent,
                                      const Message& request,
                                      std::span<const ChatMessage> history)
        -> Result<std::optional<std::string>> override;

    [[nodiscard]] auto processResponse(AgentRuntime& agent, const Message& response) -> VoidResult override;

    [[nodiscard]] auto phases() const -> const std::vector<std::vector<std::string>>& { return _phases; }

  private:
    std::vector<std::vector<std::string>> _phases;

    [[nodiscard]] auto dispatchPhase(AgentRuntime& agent,
                                     Context& context,
                                     const std::string& chatId,
                                     const std::vector<std::string>& agents) -> VoidResult;

    [[nodiscard]] auto finish(AgentRuntime& agent, Context& context, const std::string& chatId) -> VoidResult;
};

} // namespace agentmesh
