// SPDX-License-Identifier: Apache-2.0
#include "Collaboration.hpp"

#include <format>

namespace agentmesh::collaboration
{

auto conversationHistory(const Context& context, std::string_view chatId, CollaborationType mode)
    -> Result<std::vector<ChatMessage>>
{
    if (chatId.empty())
        return std::vector<ChatMessage> {};

    switch (mode)
    {
        case CollaborationType::Phased:
        case CollaborationType::Chat: return context.chatHistory(chatId);
        case CollaborationType::Sequential:
        case CollaborationType::Independent: break;
    }
    return std::vector<ChatMessage> {};
}

auto decideRoute(const Context& context, const Message& request, std::string_view self, CollaborationType mode)
    -> Result<RouteDecision>
{
    switch (mode)
    {
        case CollaborationType::Phased:
        case CollaborationType::Chat:
            return RouteDecision {
                .kind = RouteKind::Response,
                .type = MessageType::Ack,
                .destination = request.sender,
                .recordHistory = true,
            };

        case CollaborationType::Sequential: {
            auto next = context.nextAgentInSequence(request.chatId, self);
            if (!next)
                return std::unexpected(next.error());
            if (*next)
                return RouteDecision {
                    .kind = RouteKind::Request,
                    .type = MessageType::Request,
                    .destination = std::move(**next),
                    .recordHistory = false,
                };

            auto route = context.routeResponseTo(request.chatId);
            if (!route)
                return std::unexpected(route.error());
            if (!*route)
                return makeError(ErrorCode::ProtocolError,
                                 std::format("Sequence of chat {} in context {} ended at {} with no route_response_to",
                                             request.chatId,
                                             context.name(),
                                             self));
            return RouteDecision {
                .kind = RouteKind::Response,
                .type = MessageType::Response,
                .destination = std::move(**route),
                .recordHistory = false,
            };
        }

        case CollaborationType::Independent: break;
    }

    return RouteDecision {
        .kind = RouteKind::Response,
        .type = MessageType::Response,
        .destination = request.sender,
        .recordHistory = false,
    };
}

} // namespace agentmesh::collaboration
