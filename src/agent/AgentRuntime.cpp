// SPDX-License-Identifier: Apache-2.0
#include "AgentRuntime.hpp"

#include <agent/Collaboration.hpp>
#include <core/Log.hpp>

#include <format>

namespace agentmesh
{

auto AgentHandler::processEvent(AgentRuntime& agent, const Event& event) -> VoidResult
{
    log::debug("{} ignored event {} from {}", agent.name(), event.name, event.source);
    return {};
}

void AgentHandler::processError(AgentRuntime& agent, const Error& error)
{
    log::error("{}: {}", agent.name(), error);
}

AgentRuntime::AgentRuntime(AgentInfo info,
                           Registry& registry,
                           std::unique_ptr<Transport> transport,
                           AgentHandler& handler):
    _info(std::move(info)), _registry(registry), _transport(std::move(transport)), _handler(handler)
{
}

AgentRuntime::~AgentRuntime()
{
    stop();
}

auto AgentRuntime::start() -> VoidResult
{
    if (_running)
        return {};

    if (auto registered = _registry.registerAgent(_info.name, _info.description); !registered)
        return registered;

    _transport->setCallbacks(TransportCallbacks {
        .onRequest =
            [this](const Message& request) {
                auto const scope = log::AgentScope(_info.name);
                if (auto handled = handleRequest(request); !handled)
                    fail(handled.error());
            },
        .onResponse =
            [this](const Message& response) {
                auto const scope = log::AgentScope(_info.name);
                if (auto handled = _handler.processResponse(*this, response); !handled)
                    fail(handled.error());
            },
        .onEvent =
            [this](const Event& event) {
                auto const scope = log::AgentScope(_info.name);
                if (auto handled = _handler.processEvent(*this, event); !handled)
                    fail(handled.error());
            },
        .onError =
            [this](const Error& error) {
                auto const scope = log::AgentScope(_info.name);
                fail(error);
            },
    });

    if (auto started = _transport->start(); !started)
    {
        if (auto unregistered = _registry.unregisterAgent(_info.name); !unregistered)
            log::error("Failed to unregister {}: {}", _info.name, unregistered.error());
        return started;
    }

    _running = true;
    log::info("Agent {} started", _info.name);
    return {};
}

void AgentRuntime::stop()
{
    if (!_running)
        return;
    _running = false;

    _transport->stop();
    if (auto unregistered = _registry.unregisterAgent(_info.name); !unregistered)
        log::error("Failed to unregister {}: {}", _info.name, unregistered.error());
    log::info("Agent {} stopped", _info.name);
}

auto AgentRuntime::prepareSend(Message& message) -> Result<std::shared_ptr<Context>>
{
    message.sender = _info.name;

    auto context = _registry.getOrCreateContext(message.contextName);
    if (!context)
        return std::unexpected(context.error());
    if (auto joined = (*context)->addParticipant(_info.name); !joined)
        return std::unexpected(joined.error());
    return context;
}

auto AgentRuntime::sendRequest(Message message, std::string_view destination) -> VoidResult
{
    auto context = prepareSend(message);
    if (!context)
        return std::unexpected(context.error());
    if (auto sent = _transport->sendRequest(message, destination); !sent)
        return sent;
    return (*context)->trace(message);
}

auto AgentRuntime::sendResponse(Message message, std::string_view destination) -> VoidResult
{
    auto context = prepareSend(message);
    if (!context)
        return std::unexpected(context.error());
    if (auto sent = _transport->sendResponse(message, destination); !sent)
        return sent;
    return (*context)->trace(message);
}

auto AgentRuntime::handleRequest(const Message& request) -> VoidResult
{
    auto context = _registry.getOrCreateContext(request.contextName);
    if (!context)
        return std::unexpected(context.error());

    auto mode = (*context)->collaborationType(request.chatId);
    if (!mode)
        return std::unexpected(mode.error());

    auto history = collaboration::conversationHistory(**context, request.chatId, *mode);
    if (!history)
        return std::unexpected(history.error());

    auto answer = _handler.processRequest(*this, request, *history);
    if (!answer)
        return std::unexpected(answer.error());
    if (!*answer || (*answer)->empty())
    {
        log::debug("{} has no answer yet for chat {}", _info.name, request.chatId);
        return {};
    }

    auto route = collaboration::decideRoute(**context, request, _info.name, *mode);
    if (!route)
        return std::unexpected(route.error());

    if (route->recordHistory)
    {
        auto recorded = (*context)->appendChatHistory(request.chatId,
                                                      ChatMessage {
                                                          .role = Role::Assistant,
                                                          .content = **answer,
                                                          .toolCalls = {},
                                                          .toolCallId = {},
                                                      });
        if (!recorded)
            return recorded;
    }

    auto outbound = Message {
        .sender = _info.name,
        .contextName = request.contextName,
        .chatId = request.chatId,
        .type = route->type,
        .content = std::move(**answer),
    };

    log::debug("{} routes {} to {}", _info.name, messageTypeToString(outbound.type), route->destination);
    if (route->kind == collaboration::RouteKind::Request)
        return sendRequest(std::move(outbound), route->destination);
    return sendResponse(std::move(outbound), route->destination);
}

void AgentRuntime::fail(const Error& error)
{
    log::warning("Agent {} failed to handle a message: {}", _info.name, error);
    _handler.processError(*this, error);
}

} // namespace agentmesh
