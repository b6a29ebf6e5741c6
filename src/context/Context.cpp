// SPDX-License-Identifier: Apache-2.0
#include "Context.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/MessageCodec.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <iterator>

namespace agentmesh
{

namespace
{

    constexpr auto ParticipantsField = std::string_view { "participants" };
    constexpr auto MessageTraceField = std::string_view { "message_trace" };
    constexpr auto ChatHistoryField = std::string_view { "chat_history" };
    constexpr auto RequiredToolCallsField = std::string_view { "required_tool_calls" };
    constexpr auto AvailableToolsField = std::string_view { "available_tools" };
    constexpr auto AgentSequenceField = std::string_view { "agent_sequence" };
    constexpr auto RouteResponseToField = std::string_view { "route_response_to" };
    constexpr auto PhaseAssignmentsField = std::string_view { "agent_phase_assignments" };
    constexpr auto CurrentPhaseField = std::string_view { "current_phase" };
    constexpr auto RequiredAgentsField = std::string_view { "required_agents_for_phase" };
    constexpr auto QueriesField = std::string_view { "queries" };
    constexpr auto CollaborationTypeField = std::string_view { "collaboration_type" };

    /// Fields stored as hashes keyed by chat id.
    constexpr auto ChatScopedFields = std::array {
        ChatHistoryField,     RequiredToolCallsField, AvailableToolsField, AgentSequenceField,
        RouteResponseToField, PhaseAssignmentsField,  CurrentPhaseField,   RequiredAgentsField,
        QueriesField,         CollaborationTypeField,
    };

    using FieldWrite = std::optional<std::optional<std::string>>;

    auto writeField(std::string value) -> FieldWrite
    {
        return FieldWrite { std::in_place, std::move(value) };
    }

    auto deleteField() -> FieldWrite
    {
        return FieldWrite { std::in_place, std::nullopt };
    }

    /// @brief Parses a stored document inside a transaction updater, where exceptions must not escape.
    auto parseStored(const std::optional<std::string>& raw) -> std::optional<nlohmann::json>
    {
        if (!raw)
            return std::nullopt;
        auto value = nlohmann::json::parse(*raw, nullptr, false);
        if (value.is_discarded())
            return std::nullopt;
        return value;
    }

    auto storedPhase(const std::optional<std::string>& raw) -> Result<std::optional<int>>
    {
        if (!raw)
            return std::optional<int> {};
        auto const value = parseStored(raw);
        if (!value || !value->is_number_integer())
            return makeError(ErrorCode::StoreError, std::format("Malformed current phase: {}", *raw));
        return std::optional<int> { value->get<int>() };
    }

    auto decodeChatHistory(const nlohmann::json& value) -> Result<std::vector<ChatMessage>>
    {
        if (!value.is_array())
            return makeError(ErrorCode::StoreError, "Chat history is not a JSON array");

        auto history = std::vector<ChatMessage> {};
        history.reserve(value.size());
        for (const auto& item: value)
        {
            auto message = codec::chatMessageFromJson(item);
            if (!message)
                return std::unexpected(message.error());
            history.push_back(std::move(*message));
        }
        return history;
    }

} // namespace

Context::Context(std::string name, std::shared_ptr<SharedStore> store, std::string keyPrefix):
    _name(std::move(name)), _store(std::move(store)), _keyPrefix(std::move(keyPrefix))
{
}

auto Context::key(std::string_view field) const -> std::string
{
    return std::format("{}:context:{}:{}", _keyPrefix, _name, field);
}

auto Context::readDocument(std::string_view field, std::string_view chatId) const
    -> Result<std::optional<nlohmann::json>>
{
    auto raw = _store->mapGet(key(field), chatId);
    if (!raw)
        return std::unexpected(raw.error());
    if (!*raw)
        return std::optional<nlohmann::json> {};

    return json::parse(**raw, ErrorCode::StoreError).transform([](nlohmann::json value) {
        return std::optional<nlohmann::json> { std::move(value) };
    });
}

auto Context::readStringList(std::string_view field, std::string_view chatId) const
    -> Result<std::vector<std::string>>
{
    auto document = readDocument(field, chatId);
    if (!document)
        return std::unexpected(document.error());
    if (!*document)
        return std::vector<std::string> {};
    return json::toStringList(**document);
}

auto Context::writeDocument(std::string_view field, std::string_view chatId, const nlohmann::json& value)
    -> VoidResult
{
    return _store->mapSet(key(field), chatId, value.dump());
}

auto Context::appendToList(std::string_view field, std::string_view chatId, nlohmann::json item, bool unique)
    -> VoidResult
{
    auto failure = std::optional<Error> {};
    auto const storeKey = key(field);

    auto result = _store->mapUpdate(storeKey, chatId, [&](const std::optional<std::string>& current) -> FieldWrite {
        failure.reset();
        auto list = current ? parseStored(current) : std::optional<nlohmann::json> { nlohmann::json::array() };
        if (!list || !list->is_array())
        {
            failure = Error { ErrorCode::StoreError, std::format("{}[{}] is not a JSON array", storeKey, chatId) };
            return std::nullopt;
        }
        if (unique && std::find(list->begin(), list->end(), item) != list->end())
            return std::nullopt;
        list->push_back(item);
        return writeField(list->dump());
    });

    if (!result)
        return result;
    if (failure)
        return std::unexpected(*failure);
    return {};
}

auto Context::removeFromList(std::string_view field, std::string_view chatId, const nlohmann::json& item)
    -> VoidResult
{
    auto failure = std::optional<Error> {};
    auto const storeKey = key(field);

    auto result = _store->mapUpdate(storeKey, chatId, [&](const std::optional<std::string>& current) -> FieldWrite {
        failure.reset();
        if (!current)
            return std::nullopt;
        auto list = parseStored(current);
        if (!list || !list->is_array())
        {
            failure = Error { ErrorCode::StoreError, std::format("{}[{}] is not a JSON array", storeKey, chatId) };
            return std::nullopt;
        }
        auto const it = std::find(list->begin(), list->end(), item);
        if (it == list->end())
            return std::nullopt;
        list->erase(it);
        if (list->empty())
            return deleteField();
        return writeField(list->dump());
    });

    if (!result)
        return result;
    if (failure)
        return std::unexpected(*failure);
    return {};
}

auto Context::participants() const -> Result<std::vector<std::string>>
{
    return _store->listRange(key(ParticipantsField));
}

auto Context::addParticipant(std::string_view agentName) -> VoidResult
{
    auto appended = _store->listAppendUnique(key(ParticipantsField), agentName);
    if (!appended)
        return std::unexpected(appended.error());
    if (*appended)
        log::debug("Context {}: {} joined", _name, agentName);
    return {};
}

auto Context::messageTrace() const -> Result<std::vector<Message>>
{
    auto encoded = _store->listRange(key(MessageTraceField));
    if (!encoded)
        return std::unexpected(encoded.error());

    auto messages = std::vector<Message> {};
    messages.reserve(encoded->size());
    for (const auto& wire: *encoded)
    {
        auto message = codec::decodeMessage(wire);
        if (!message)
            return std::unexpected(message.error());
        messages.push_back(std::move(*message));
    }
    return messages;
}

auto Context::trace(const Message& message) -> VoidResult
{
    return _store->listAppend(key(MessageTraceField), codec::encodeMessage(message));
}

auto Context::chatHistory(std::string_view chatId) const -> Result<std::vector<ChatMessage>>
{
    auto document = readDocument(ChatHistoryField, chatId);
    if (!document)
        return std::unexpected(document.error());
    if (!*document)
        return std::vector<ChatMessage> {};
    return decodeChatHistory(**document);
}

auto Context::chatHistories() const -> Result<std::map<std::string, std::vector<ChatMessage>>>
{
    auto entries = _store->mapGetAll(key(ChatHistoryField));
    if (!entries)
        return std::unexpected(entries.error());

    auto histories = std::map<std::string, std::vector<ChatMessage>> {};
    for (const auto& [chatId, raw]: *entries)
    {
        auto history = json::parse(raw, ErrorCode::StoreError).and_then(decodeChatHistory);
        if (!history)
            return std::unexpected(history.error());
        histories.emplace(chatId, std::move(*history));
    }
    return histories;
}

auto Context::appendChatHistory(std::string_view chatId, const ChatMessage& message) -> VoidResult
{
    return appendToList(ChatHistoryField, chatId, codec::chatMessageToJson(message), false);
}

auto Context::requiredToolCalls(std::string_view chatId) const -> Result<std::vector<std::string>>
{
    return readStringList(RequiredToolCallsField, chatId);
}

auto Context::appendRequiredToolCall(std::string_view chatId, std::string_view toolName) -> VoidResult
{
    return appendToList(RequiredToolCallsField, chatId, std::string(toolName), true);
}

auto Context::removeRequiredToolCall(std::string_view chatId, std::string_view toolName) -> VoidResult
{
    return removeFromList(RequiredToolCallsField, chatId, std::string(toolName));
}

auto Context::availableTools(std::string_view chatId) const -> Result<std::vector<ToolDefinition>>
{
    auto document = readDocument(AvailableToolsField, chatId);
    if (!document)
        return std::unexpected(document.error());
    if (!*document)
        return std::vector<ToolDefinition> {};
    if (!(*document)->is_array())
        return makeError(ErrorCode::StoreError, "Available tools are not a JSON array");

    auto tools = std::vector<ToolDefinition> {};
    for (const auto& item: **document)
    {
        auto tool = codec::toolDefinitionFromJson(item);
        if (!tool)
            return std::unexpected(tool.error());
        tools.push_back(std::move(*tool));
    }
    return tools;
}

auto Context::appendAvailableTool(std::string_view chatId, const ToolDefinition& tool) -> VoidResult
{
    return appendToList(AvailableToolsField, chatId, codec::toolDefinitionToJson(tool), false);
}

auto Context::agentSequence(std::string_view chatId) const -> Result<std::vector<std::string>>
{
    return readStringList(AgentSequenceField, chatId);
}

auto Context::setAgentSequence(std::string_view chatId, const std::vector<std::string>& agents) -> VoidResult
{
    return writeDocument(AgentSequenceField, chatId, agents);
}

auto Context::nextAgentInSequence(std::string_view chatId, std::string_view currentAgent) const
    -> Result<std::optional<std::string>>
{
    auto sequence = agentSequence(chatId);
    if (!sequence)
        return std::unexpected(sequence.error());

    auto const it = std::ranges::find(*sequence, currentAgent);
    if (it == sequence->end() || std::next(it) == sequence->end())
        return std::optional<std::string> {};
    return std::optional<std::string> { *std::next(it) };
}

auto Context::routeResponseTo(std::string_view chatId) const -> Result<std::optional<std::string>>
{
    auto document = readDocument(RouteResponseToField, chatId);
    if (!document)
        return std::unexpected(document.error());
    if (!*document)
        return std::optional<std::string> {};
    if (!(*document)->is_string())
        return makeError(ErrorCode::StoreError, "route_response_to is not a string");
    return std::optional<std::string> { (*document)->get<std::string>() };
}

auto Context::setRouteResponseTo(std::string_view chatId, std::string_view agentName) -> VoidResult
{
    return writeDocument(RouteResponseToField, chatId, std::string(agentName));
}

auto Context::agentPhaseAssignments(std::string_view chatId) const -> Result<std::vector<std::vector<std::string>>>
{
    auto document = readDocument(PhaseAssignmentsField, chatId);
    if (!document)
        return std::unexpected(document.error());

    auto phases = std::vector<std::vector<std::string>> {};
    if (!*document)
        return phases;
    if (!(*document)->is_array())
        return makeError(ErrorCode::StoreError, "Phase assignments are not a JSON array");

    for (const auto& phase: **document)
    {
        auto agents = json::toStringList(phase);
        if (!agents)
            return std::unexpected(agents.error());
        phases.push_back(std::move(*agents));
    }
    return phases;
}

auto Context::setAgentPhaseAssignments(std::string_view chatId, const std::vector<std::vector<std::string>>& phases)
    -> VoidResult
{
    return writeDocument(PhaseAssignmentsField, chatId, phases);
}

auto Context::currentPhase(std::string_view chatId) const -> Result<std::optional<int>>
{
    auto raw = _store->mapGet(key(CurrentPhaseField), chatId);
    if (!raw)
        return std::unexpected(raw.error());
    return storedPhase(*raw);
}

auto Context::setCurrentPhase(std::string_view chatId, int phase) -> VoidResult
{
    auto const id = std::string(chatId);
    auto const fields = std::array {
        FieldRef { key(PhaseAssignmentsField), id },
        FieldRef { key(CurrentPhaseField), id },
        FieldRef { key(RequiredAgentsField), id },
    };

    auto failure = std::optional<Error> {};
    auto result = _store->transact(fields, [&](const FieldValues& current) -> std::optional<FieldValues> {
        failure.reset();
        auto const phases = parseStored(current[0]);
        if (!phases || !phases->is_array() || phase < 0 || static_cast<size_t>(phase) >= phases->size())
        {
            failure = Error { ErrorCode::InvalidArgument,
                              std::format("Chat {} has no phase {} in context {}", chatId, phase, _name) };
            return std::nullopt;
        }

        auto const stored = storedPhase(current[1]);
        if (!stored)
        {
            failure = stored.error();
            return std::nullopt;
        }
        if (*stored && **stored > phase)
        {
            failure = Error { ErrorCode::InvalidArgument,
                              std::format("Chat {} is at phase {}, cannot go back to phase {}", chatId, **stored, phase) };
            return std::nullopt;
        }

        return FieldValues { current[0], nlohmann::json(phase).dump(), (*phases)[static_cast<size_t>(phase)].dump() };
    });

    if (!result)
        return result;
    if (failure)
        return std::unexpected(*failure);
    return {};
}

auto Context::agentsForNextPhase(std::string_view chatId) -> Result<std::optional<std::vector<std::string>>>
{
    auto const id = std::string(chatId);
    auto const fields = std::array {
        FieldRef { key(PhaseAssignmentsField), id },
        FieldRef { key(CurrentPhaseField), id },
        FieldRef { key(RequiredAgentsField), id },
    };

    auto failure = std::optional<Error> {};
    auto agents = std::optional<std::vector<std::string>> {};
    auto result = _store->transact(fields, [&](const FieldValues& current) -> std::optional<FieldValues> {
        failure.reset();
        agents.reset();

        auto const phases = parseStored(current[0]);
        if (!phases || !phases->is_array())
            return std::nullopt;

        auto const stored = storedPhase(current[1]);
        if (!stored)
        {
            failure = stored.error();
            return std::nullopt;
        }

        auto const next = *stored ? **stored + 1 : 0;
        if (static_cast<size_t>(next) >= phases->size())
            return std::nullopt;

        auto list = json::toStringList((*phases)[static_cast<size_t>(next)]);
        if (!list)
        {
            failure = list.error();
            return std::nullopt;
        }
        agents = std::move(*list);
        return FieldValues { current[0], nlohmann::json(next).dump(), (*phases)[static_cast<size_t>(next)].dump() };
    });

    if (!result)
        return std::unexpected(result.error());
    if (failure)
        return std::unexpected(*failure);
    if (agents)
        log::debug("Context {}: chat {} advanced to the next phase", _name, chatId);
    return agents;
}

auto Context::requiredAgentsForCurrentPhase(std::string_view chatId) const -> Result<std::vector<std::string>>
{
    return readStringList(RequiredAgentsField, chatId);
}

auto Context::removeRequiredAgentForCurrentPhase(std::string_view chatId, std::string_view agentName) -> VoidResult
{
    return removeFromList(RequiredAgentsField, chatId, std::string(agentName));
}

auto Context::queries(std::string_view chatId) const -> Result<std::vector<std::string>>
{
    return readStringList(QueriesField, chatId);
}

auto Context::currentQuery(std::string_view chatId) const -> Result<std::optional<std::string>>
{
    return queries(chatId).transform([](std::vector<std::string> all) {
        if (all.empty())
            return std::optional<std::string> {};
        return std::optional<std::string> { std::move(all.back()) };
    });
}

auto Context::addQuery(std::string_view chatId, std::string_view query) -> VoidResult
{
    return appendToList(QueriesField, chatId, std::string(query), false);
}

auto Context::collaborationType(std::string_view chatId) const -> Result<CollaborationType>
{
    if (chatId.empty())
        return CollaborationType::Independent;

    auto document = readDocument(CollaborationTypeField, chatId);
    if (!document)
        return std::unexpected(document.error());
    if (!*document)
        return CollaborationType::Independent;

    if ((*document)->is_string())
    {
        if (auto type = collaborationTypeFromString((*document)->get<std::string>()))
            return *type;
    }

    log::warning("Context {}: unknown collaboration type {} for chat {}, using INDEPENDENT",
                 _name,
                 (*document)->dump(),
                 chatId);
    return CollaborationType::Independent;
}

auto Context::setCollaborationType(std::string_view chatId, CollaborationType type) -> VoidResult
{
    return writeDocument(CollaborationTypeField, chatId, std::string(collaborationTypeToString(type)));
}

auto Context::snapshot() const -> Result<nlohmann::json>
{
    auto document = nlohmann::json::object();
    document["name"] = _name;

    auto members = participants();
    if (!members)
        return std::unexpected(members.error());
    document[std::string(ParticipantsField)] = *members;

    auto messages = messageTrace();
    if (!messages)
        return std::unexpected(messages.error());
    auto traceDocument = nlohmann::json::array();
    for (const auto& message: *messages)
        traceDocument.push_back(codec::messageToJson(message));
    document[std::string(MessageTraceField)] = std::move(traceDocument);

    for (auto const field: ChatScopedFields)
    {
        auto entries = _store->mapGetAll(key(field));
        if (!entries)
            return std::unexpected(entries.error());

        auto perChat = nlohmann::json::object();
        for (const auto& [chatId, raw]: *entries)
        {
            auto value = json::parse(raw, ErrorCode::StoreError);
            if (!value)
                return std::unexpected(value.error());
            perChat[chatId] = std::move(*value);
        }
        document[std::string(field)] = std::move(perChat);
    }

    return document;
}

auto Context::clear() -> VoidResult
{
    for (auto const field: { ParticipantsField, MessageTraceField })
    {
        if (auto removed = _store->remove(key(field)); !removed)
            return removed;
    }
    for (auto const field: ChatScopedFields)
    {
        if (auto removed = _store->remove(key(field)); !removed)
            return removed;
    }
    return {};
}

} // namespace agentmesh
