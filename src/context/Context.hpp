// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Message.hpp>
#include <core/Types.hpp>
#include <store/SharedStore.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentmesh
{

/// @brief Shared state of one multi-agent conversation, scoped per chat id.
///
/// A Context is a handle: it keeps no data of its own and reads every value from the
/// SharedStore, so handles in different processes always observe the same state.
/// Queries for a chat id that was never written return empty defaults rather than errors.
class Context
{
  public:
    /// @brief Constructs a handle over the store. Use Registry::getOrCreateContext() instead.
    /// @param name The unique context name.
    /// @param store The shared store holding the context data.
    /// @param keyPrefix Prefix of every store key.
    Context(std::string name, std::shared_ptr<SharedStore> store, std::string keyPrefix);

    [[nodiscard]] auto name() const -> const std::string& { return _name; }

    /// @brief Agents that have sent messages within this context, in first-seen order.
    [[nodiscard]] auto participants() const -> Result<std::vector<std::string>>;

    /// @brief Adds an agent to the participants; a no-op if it is already present.
    [[nodiscard]] auto addParticipant(std::string_view agentName) -> VoidResult;

    /// @brief Every message sent within this context, oldest first.
    [[nodiscard]] auto messageTrace() const -> Result<std::vector<Message>>;

    /// @brief Appends a sent message to the trace.
    [[nodiscard]] auto trace(const Message& message) -> VoidResult;

    [[nodiscard]] auto chatHistory(std::string_view chatId) const -> Result<std::vector<ChatMessage>>;

    /// @brief Histories of every chat in this context, keyed by chat id.
    [[nodiscard]] auto chatHistories() const -> Result<std::map<std::string, std::vector<ChatMessage>>>;

    /// @brief Appends one record to a chat history, creating the history if needed.
    [[nodiscard]] auto appendChatHistory(std::string_view chatId, const ChatMessage& message) -> VoidResult;

    [[nodiscard]] auto requiredToolCalls(std::string_view chatId) const -> Result<std::vector<std::string>>;

    /// @brief Marks a tool call as pending; a name already pending is not added twice.
    [[nodiscard]] auto appendRequiredToolCall(std::string_view chatId, std::string_view toolName) -> VoidResult;

    /// @brief Marks a tool call as satisfied. Removing the last one deletes the entry for the chat.
    [[nodiscard]] auto removeRequiredToolCall(std::string_view chatId, std::string_view toolName) -> VoidResult;

    [[nodiscard]] auto availableTools(std::string_view chatId) const -> Result<std::vector<ToolDefinition>>;
    [[nodiscard]] auto appendAvailableTool(std::string_view chatId, const ToolDefinition& tool) -> VoidResult;

    [[nodiscard]] auto agentSequence(std::string_view chatId) const -> Result<std::vector<std::string>>;
    [[nodiscard]] auto setAgentSequence(std::string_view chatId, const std::vector<std::string>& agents)
        -> VoidResult;

    /// @brief Returns the agent following @p currentAgent in the chat's sequence.
    /// @return The next agent, or std::nullopt if @p currentAgent is last or not in the sequence.
    [[nodiscard]] auto nextAgentInSequence(std::string_view chatId, std::string_view currentAgent) const
        -> Result<std::optional<std::string>>;

    /// @brief The agent that receives the terminal response of a sequential or phased chat.
    [[nodiscard]] auto routeResponseTo(std::string_view chatId) const -> Result<std::optional<std::string>>;
    [[nodiscard]] auto setRouteResponseTo(std::string_view chatId, std::string_view agentName) -> VoidResult;

    [[nodiscard]] auto agentPhaseAssignments(std::string_view chatId) const
        -> Result<std::vector<std::vector<std::string>>>;
    [[nodiscard]] auto setAgentPhaseAssignments(std::string_view chatId,
                                                const std::vector<std::vector<std::string>>& phases)
        -> VoidResult;

    /// @brief The zero-based current phase, or std::nullopt if no phase has been set.
    [[nodiscard]] auto currentPhase(std::string_view chatId) const -> Result<std::optional<int>>;

    /// @brief Sets the current phase and snapshots its agents as the required agents.
    ///
    /// Both values are written in one atomic commit. Fails with InvalidArgument if the phase
    /// does not exist or is lower than the current phase.
    [[nodiscard]] auto setCurrentPhase(std::string_view chatId, int phase) -> VoidResult;

    /// @brief Advances to the next phase and returns its agents.
    ///
    /// An unset current phase advances to phase 0. The caller must only advance once the
    /// required agents of the current phase have all completed; this is not checked here.
    /// @return The agents of the new phase, or std::nullopt if the current phase is the last one.
    [[nodiscard]] auto agentsForNextPhase(std::string_view chatId) -> Result<std::optional<std::vector<std::string>>>;

    [[nodiscard]] auto requiredAgentsForCurrentPhase(std::string_view chatId) const
        -> Result<std::vector<std::string>>;

    /// @brief Marks an agent of the current phase as done. Emptying the set deletes the entry.
    [[nodiscard]] auto removeRequiredAgentForCurrentPhase(std::string_view chatId, std::string_view agentName)
        -> VoidResult;

    [[nodiscard]] auto queries(std::string_view chatId) const -> Result<std::vector<std::string>>;

    /// @brief The most recently added query, or std::nullopt if there is none.
    [[nodiscard]] auto currentQuery(std::string_view chatId) const -> Result<std::optional<std::string>>;
    [[nodiscard]] auto addQuery(std::string_view chatId, std::string_view query) -> VoidResult;

    /// @brief The chat's collaboration type; INDEPENDENT when unset or when @p chatId is empty.
    [[nodiscard]] auto collaborationType(std::string_view chatId) const -> Result<CollaborationType>;
    [[nodiscard]] auto setCollaborationType(std::string_view chatId, CollaborationType type) -> VoidResult;

    /// @brief Returns every persisted data field of this context as one JSON document.
    [[nodiscard]] auto snapshot() const -> Result<nlohmann::json>;

    /// @brief Deletes every key belonging to this context.
    [[nodiscard]] auto clear() -> VoidResult;

  private:
    std::string _name;
    std::shared_ptr<SharedStore> _store;
    std::string _keyPrefix;

    [[nodiscard]] auto key(std::string_view field) const -> std::string;

    [[nodiscard]] auto readDocument(std::string_view field, std::string_view chatId) const
        -> Result<std::optional<nlohmann::json>>;
    [[nodiscard]] auto readStringList(std::string_view field, std::string_view chatId) const
        -> Result<std::vector<std::string>>;
    [[nodiscard]] auto writeDocument(std::string_view field, std::string_view chatId, const nlohmann::json& value)
        -> VoidResult;
    [[nodiscard]] auto appendToList(std::string_view field,
                                    std::string_view chatId,
                                    nlohmann::json item,
                                    bool unique) -> VoidResult;
    [[nodiscard]] auto removeFromList(std::string_view field, std::string_view chatId, const nlohmann::json& item)
        -> VoidResult;
};

} // namespace agentmesh
