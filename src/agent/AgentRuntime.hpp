// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentHandler.hpp>
#include <core/Error.hpp>
#include <core/Message.hpp>
#include <registry/Registry.hpp>
#include <transport/Transport.hpp>

#include <memory>
#include <string>

namespace agentmesh
{

/// @brief Identity of an agent as published in the registry.
struct AgentInfo
{
    std::string name;
    std::string description;
};

/// @brief Connects an AgentHandler to the registry and a transport.
///
/// The runtime owns the transport. Inbound requests are answered through the handler and
/// routed according to the chat's collaboration type; every outbound message is recorded
/// in its context.
class AgentRuntime
{
  public:
    /// @brief Constructs a stopped agent.
    /// @param info The agent's name and description.
    /// @param registry The registry shared with the other agents.
    /// @param transport The transport the agent sends and receives through.
    /// @param handler The agent behavior; must outlive the runtime.
    AgentRuntime(AgentInfo info, Registry& registry, std::unique_ptr<Transport> transport, AgentHandler& handler);
    ~AgentRuntime();

    AgentRuntime(const AgentRuntime&) = delete;
    AgentRuntime& operator=(const AgentRuntime&) = delete;

    /// @brief Registers the agent, then starts its transport.
    /// @return Success, NamingConflict if the name is taken, or the transport's error.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops the transport, then unregisters the agent.
    void stop();

    [[nodiscard]] auto isRunning() const -> bool { return _running; }

    [[nodiscard]] auto name() const -> const std::string& { return _info.name; }
    [[nodiscard]] auto description() const -> const std::string& { return _info.description; }
    [[nodiscard]] auto registry() -> Registry& { return _registry; }

    /// @brief Sends a request as this agent.
    ///
    /// Stamps the sender, adds this agent to the message's context participants, sends, and
    /// appends the message to the context's trace.
    [[nodiscard]] auto sendRequest(Message message, std::string_view destination) -> VoidResult;

    /// @brief Sends a response or acknowledgement as this agent. See sendRequest().
    [[nodiscard]] auto sendResponse(Message message, std::string_view destination) -> VoidResult;

    /// @brief Answers a request and routes the answer by collaboration type.
    [[nodiscard]] auto handleRequest(const Message& request) -> VoidResult;

  private:
    AgentInfo _info;
    Registry& _registry;
    std::unique_ptr<Transport> _transport;
    AgentHandler& _handler;
    bool _running = false;

    /// @brief Applies the bookkeeping shared by every send and returns the message's context.
    [[nodiscard]] auto prepareSend(Message& message) -> Result<std::shared_ptr<Context>>;

    void fail(const Error& error);
};

} // namespace agentmesh
