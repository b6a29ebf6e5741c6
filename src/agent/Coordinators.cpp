// SPDX-License-Identifier: Apache-2.0
#include "Coordinators.hpp"

#include <agent/AgentRuntime.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <ranges>

namespace agentmesh
{

namespace
{

    auto chatIdOf(const Message& request) -> std::string
    {
        if (!request.chatId.empty())
            return request.chatId;
        auto chatId = generateChatId();
        log::debug("Request from {} carries no chat id, using {}", request.sender, chatId);
        return chatId;
    }

} // namespace

SequentialCoordinator::SequentialCoordinator(std::vector<std::string> agents): _agents(std::move(agents))
{
}

auto SequentialCoordinator::processRequest(AgentRuntime& agent,
                                           const Message& request,
                                           std::span<const ChatMessage> /*history*/)
    -> Result<std::optional<std::string>>
{
    if (_agents.empty())
        return makeError(ErrorCode::InvalidArgument, "Sequential coordinator has no agents");

    auto context = agent.registry().getOrCreateContext(request.contextName);
    if (!context)
        return std::unexpected(context.error());

    auto const chatId = chatIdOf(request);
    auto& ctx = **context;

    auto setup = ctx.setCollaborationType(chatId, CollaborationType::Sequential)
                     .and_then([&] { return ctx.setAgentSequence(chatId, _agents); })
                     .and_then([&] { return ctx.setRouteResponseTo(chatId, request.sender); })
                     .and_then([&] { return ctx.addQuery(chatId, request.content); });
    if (!setup)
        return std::unexpected(setup.error());

    log::info("Starting sequence of {} agents for chat {}", _agents.size(), chatId);
    auto sent = agent.sendRequest(
        Message {
            .sender = {},
            .contextName = request.contextName,
            .chatId = chatId,
            .type = MessageType::Request,
            .content = request.content,
        },
        _agents.front());
    if (!sent)
        return std::unexpected(sent.error());

    return std::optional<std::string> {};
}

auto SequentialCoordinator::processResponse(AgentRuntime& agent, const Message& response) -> VoidResult
{
    log::debug("{} ignores {} from {}", agent.name(), messageTypeToString(response.type), response.sender);
    return {};
}

PhasedCoordinator::PhasedCoordinator(std::vector<std::vector<std::string>> phases): _phases(std::move(phases))
{
}

auto PhasedCoordinator::processRequest(AgentRuntime& agent,
                                       const Message& request,
                                       std::span<const ChatMessage> /*history*/)
    -> Result<std::optional<std::string>>
{
    if (_phases.empty() || std::ranges::any_of(_phases, [](const auto& phase) { return phase.empty(); }))
        return makeError(ErrorCode::InvalidArgument, "Phased coordinator needs at least one agent in every phase");

    auto context = agent.registry().getOrCreateContext(request.contextName);
    if (!context)
        return std::unexpected(context.error());

    auto const chatId = chatIdOf(request);
    auto& ctx = **context;

    auto const userMessage = ChatMessage {
        .role = Role::User,
        .content = request.content,
        .toolCalls = {},
        .toolCallId = {},
    };
    auto setup = ctx.setCollaborationType(chatId, CollaborationType::Phased)
                     .and_then([&] { return ctx.setAgentPhaseAssignments(chatId, _phases); })
                     .and_then([&] { return ctx.setRouteResponseTo(chatId, request.sender); })
                     .and_then([&] { return ctx.addQuery(chatId, request.content); })
                     .and_then([&] { return ctx.appendChatHistory(chatId, userMessage); })
                     .and_then([&] { return ctx.setCurrentPhase(chatId, 0); });
    if (!setup)
        return std::unexpected(setup.error());

    log::info("Starting {} phases for chat {}", _phases.size(), chatId);
    if (auto dispatched = dispatchPhase(agent, ctx, chatId, _phases.front()); !dispatched)
        return std::unexpected(dispatched.error());

    return std::optional<std::string> {};
}

auto PhasedCoordinator::processResponse(AgentRuntime& agent, const Message& response) -> VoidResult
{
    if (response.type != MessageType::Ack)
    {
        log::debug("{} ignores {} from {}", agent.name(), messageTypeToString(response.type), response.sender);
        return {};
    }

    auto context = agent.registry().getOrCreateContext(response.contextName);
    if (!context)
        return std::unexpected(context.error());
    auto& ctx = **context;

    if (auto removed = ctx.removeRequiredAgentForCurrentPhase(response.chatId, response.sender); !removed)
        return removed;

    auto remaining = ctx.requiredAgentsForCurrentPhase(response.chatId);
    if (!remaining)
        return std::unexpected(remaining.error());
    if (!remaining->empty())
    {
        log::debug("Chat {} still waits for {} agent(s)", response.chatId, remaining->size());
        return {};
    }

    auto next = ctx.agentsForNextPhase(response.chatId);
    if (!next)
        return std::unexpected(next.error());
    if (*next)
        return dispatchPhase(agent, ctx, response.chatId, **next);

    return finish(agent, ctx, response.chatId);
}

auto PhasedCoordinator::dispatchPhase(AgentRuntime& agent,
                                      Context& context,
                                      const std::string& chatId,
                                      const std::vector<std::string>& agents) -> VoidResult
{
    auto query = context.currentQuery(chatId);
    if (!query)
        return std::unexpected(query.error());

    for (const auto& target: agents)
    {
        auto sent = agent.sendRequest(
            Message {
                .sender = {},
                .contextName = context.name(),
                .chatId = chatId,
                .type = MessageType::Request,
                .content = query->value_or(""),
            },
            target);
        if (!sent)
            return sent;
    }
    return {};
}

auto PhasedCoordinator::finish(AgentRuntime& agent, Context& context, const std::string& chatId) -> VoidResult
{
    auto history = context.chatHistory(chatId);
    if (!history)
        return std::unexpected(history.error());
    auto route = context.routeResponseTo(chatId);
    if (!route)
        return std::unexpected(route.error());
    if (!*route)
        return makeError(ErrorCode::ProtocolError, std::format("Chat {} finished with no route_response_to", chatId));

    auto reversed = *history | std::views::reverse;
    auto const last =
        std::ranges::find_if(reversed, [](const ChatMessage& entry) { return entry.role == Role::Assistant; });
    auto content = last != reversed.end() ? last->content : std::string {};

    log::info("Chat {} completed all phases, answering {}", chatId, **route);
    return agent.sendResponse(
        Message {
            .sender = {},
            .contextName = context.name(),
            .chatId = chatId,
            .type = MessageType::Response,
            .content = std::move(content),
        },
        **route);
}

} // namespace agentmesh
