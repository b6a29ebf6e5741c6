// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <context/Context.hpp>
#include <core/Error.hpp>
#include <core/Message.hpp>
#include <core/Types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace agentmesh::collaboration
{

/// @brief Whether an answer travels onwards as a new request or back as a response.
enum class RouteKind
{
    Request,
    Response,
};

/// @brief Where and how an agent's answer to a request is sent.
struct RouteDecision
{
    RouteKind kind = RouteKind::Response;
    MessageType type = MessageType::Response;
    std::string destination;

    /// @brief True if the answer must first be appended to the shared chat history.
    bool recordHistory = false;
};

/// @brief Returns the history an agent receives along with a request.
///
/// PHASED and CHAT collaborations share the chat history; every other mode, and a request
/// without a chat id, gets an empty history.
[[nodiscard]] auto conversationHistory(const Context& context, std::string_view chatId, CollaborationType mode)
    -> Result<std::vector<ChatMessage>>;

/// @brief Decides how the answer of @p self to @p request is routed.
///
/// - PHASED, CHAT: record the answer in the history and acknowledge it to the sender.
/// - SEQUENTIAL: forward it as a request to the next agent in the sequence, or as the final
///   response to route_response_to after the last agent.
/// - INDEPENDENT: respond to the sender.
///
/// @return The decision, or a ProtocolError if a sequence ends with no route_response_to.
[[nodiscard]] auto decideRoute(const Context& context,
                               const Message& request,
                               std::string_view self,
                               CollaborationType mode) -> Result<RouteDecision>;

} // namespace agentmesh::collaboration
