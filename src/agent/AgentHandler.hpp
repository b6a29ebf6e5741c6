// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Message.hpp>
#include <core/Types.hpp>

#include <optional>
#include <span>
#include <string>

namespace agentmesh
{

class AgentRuntime;

/// @brief Behavior of one kind of agent, driven by an AgentRuntime.
class AgentHandler
{
  public:
    virtual ~AgentHandler() = default;

    /// @brief Produces the answer to a request.
    /// @param agent The runtime the request arrived at.
    /// @param request The incoming request.
    /// @param history The shared chat history in PHASED and CHAT collaborations, empty otherwise.
    /// @return The answer, std::nullopt if there is nothing to route yet, or an error.
    [[nodiscard]] virtual auto processRequest(AgentRuntime& agent,
                                              const Message& request,
                                              std::span<const ChatMessage> history)
        -> Result<std::optional<std::string>> = 0;

    /// @brief Handles a response or acknowledgement sent to this agent.
    [[nodiscard]] virtual auto processResponse(AgentRuntime& agent, const Message& response) -> VoidResult = 0;

    [[nodiscard]] virtual auto processEvent(AgentRuntime& agent, const Event& event) -> VoidResult;

    /// @brief Called for transport errors and for failures while handling inbound messages.
    virtual void processError(AgentRuntime& agent, const Error& error);
};

} // namespace agentmesh
