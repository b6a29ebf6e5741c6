// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Message.hpp>

#include <functional>
#include <string_view>

namespace agentmesh
{

/// @brief Callbacks through which a transport delivers inbound traffic to its agent.
struct TransportCallbacks
{
    std::function<void(const Message&)> onRequest;
    std::function<void(const Message&)> onResponse;
    std::function<void(const Event&)> onEvent;
    std::function<void(const Error&)> onError;
};

/// @brief Abstract interface for delivering messages between agents.
///
/// Sending is fire-and-forget: a successful send only means the message was accepted
/// for delivery. Delivery failures are reported later through TransportCallbacks::onError.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Installs the inbound callbacks. Must be called before start().
    virtual void setCallbacks(TransportCallbacks callbacks) = 0;

    /// @brief Starts receiving messages.
    /// @return Success or an error.
    [[nodiscard]] virtual auto start() -> VoidResult = 0;

    /// @brief Stops receiving messages. Stopping a stopped transport is a no-op.
    virtual void stop() = 0;

    /// @brief Sends a request to the named agent.
    [[nodiscard]] virtual auto sendRequest(const Message& message, std::string_view destination) -> VoidResult = 0;

    /// @brief Sends a response (or acknowledgement) to the named agent.
    [[nodiscard]] virtual auto sendResponse(const Message& message, std::string_view destination) -> VoidResult = 0;

    /// @brief Returns true between a successful start() and stop().
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace agentmesh
