// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <transport/Transport.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace agentmesh
{

class InProcessTransport;

/// @brief Routes messages between agents living in the same process.
///
/// Every send is encoded to its wire form and queued. Queued envelopes are delivered either
/// synchronously by dispatchPending() or by a single background worker started with start().
/// Either way only one envelope is delivered at a time, so all agent callbacks in the process
/// run serialized.
class InProcessBroker
{
  public:
    InProcessBroker();
    ~InProcessBroker();

    InProcessBroker(const InProcessBroker&) = delete;
    InProcessBroker& operator=(const InProcessBroker&) = delete;

    /// @brief Creates a transport that sends and receives as the given agent.
    [[nodiscard]] auto createTransport(std::string agentName) -> std::unique_ptr<InProcessTransport>;

    /// @brief Queues an event for every started transport.
    void publishEvent(const Event& event);

    /// @brief Delivers queued envelopes on the calling thread until the queue is empty.
    ///
    /// Envelopes queued by the callbacks themselves are delivered too. Must not be used
    /// while the background worker runs.
    /// @return The number of envelopes delivered.
    auto dispatchPending() -> std::size_t;

    /// @brief Starts the background delivery worker.
    void start();

    /// @brief Stops the background worker. Undelivered envelopes stay queued.
    void stop();

    /// @brief Blocks until the queue is empty and no envelope is being delivered.
    void waitIdle();

    /// @brief Returns the number of envelopes waiting for delivery.
    [[nodiscard]] auto pendingCount() const -> std::size_t;

    struct Impl;

  private:
    std::shared_ptr<Impl> _impl;
};

/// @brief Transport endpoint of one agent on an InProcessBroker.
class InProcessTransport: public Transport
{
  public:
    InProcessTransport(std::shared_ptr<InProcessBroker::Impl> broker, std::string agentName);
    ~InProcessTransport() override;

    InProcessTransport(const InProcessTransport&) = delete;
    InProcessTransport& operator=(const InProcessTransport&) = delete;

    void setCallbacks(TransportCallbacks callbacks) override;
    [[nodiscard]] auto start() -> VoidResult override;
    void stop() override;
    [[nodiscard]] auto sendRequest(const Message& message, std::string_view destination) -> VoidResult override;
    [[nodiscard]] auto sendResponse(const Message& message, std::string_view destination) -> VoidResult override;
    [[nodiscard]] auto isConnected() const -> bool override;

    [[nodiscard]] auto agentName() const -> const std::string& { return _agentName; }

  private:
    std::shared_ptr<InProcessBroker::Impl> _broker;
    std::string _agentName;
    TransportCallbacks _callbacks;
    std::atomic<bool> _connected = false;
};

} // namespace agentmesh
