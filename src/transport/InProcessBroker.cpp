// SPDX-License-Identifier: Apache-2.0
#include "InProcessBroker.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/MessageCodec.hpp>

#include <condition_variable>
#include <deque>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace agentmesh
{

namespace
{

    enum class EnvelopeKind
    {
        Request,
        Response,
        Event,
    };

    /// @brief A queued message in its wire form.
    struct Envelope
    {
        EnvelopeKind kind = EnvelopeKind::Request;
        std::string from;
        std::string to;
        std::string payload;
    };

} // namespace

struct InProcessBroker::Impl
{
    mutable std::mutex mutex;
    std::condition_variable_any workAvailable;
    std::condition_variable idle;
    std::deque<Envelope> queue;
    std::map<std::string, TransportCallbacks, std::less<>> endpoints;
    bool busy = false;
    std::jthread worker;

    void enqueue(Envelope envelope)
    {
        {
            auto lock = std::lock_guard(mutex);
            queue.push_back(std::move(envelope));
        }
        workAvailable.notify_one();
    }

    auto take() -> std::optional<Envelope>
    {
        auto lock = std::lock_guard(mutex);
        if (queue.empty())
            return std::nullopt;
        auto envelope = std::move(queue.front());
        queue.pop_front();
        busy = true;
        return envelope;
    }

    void finishDelivery()
    {
        {
            auto lock = std::lock_guard(mutex);
            busy = false;
        }
        idle.notify_all();
    }

    auto callbacksOf(std::string_view agentName) const -> std::optional<TransportCallbacks>
    {
        auto lock = std::lock_guard(mutex);
        if (auto it = endpoints.find(agentName); it != endpoints.end())
            return it->second;
        return std::nullopt;
    }

    void reportError(std::string_view agentName, Error error) const
    {
        if (auto callbacks = callbacksOf(agentName); callbacks && callbacks->onError)
            callbacks->onError(error);
        else
            log::error("Undeliverable error for {}: {}", agentName, error);
    }

    /// @brief Decodes one envelope and invokes the receiving agent's callback.
    void deliver(const Envelope& envelope) const
    {
        auto callbacks = callbacksOf(envelope.to);
        if (!callbacks)
        {
            log::warning("No agent named {} is connected, dropping message from {}", envelope.to, envelope.from);
            reportError(envelope.from,
                        Error { ErrorCode::TransportError, std::format("Unknown destination agent: {}", envelope.to) });
            return;
        }

        if (envelope.kind == EnvelopeKind::Event)
        {
            auto event = json::parse(envelope.payload).and_then(codec::eventFromJson);
            if (!event)
                reportError(envelope.to, event.error());
            else if (callbacks->onEvent)
                callbacks->onEvent(*event);
            return;
        }

        auto message = codec::decodeMessage(envelope.payload);
        if (!message)
        {
            reportError(envelope.to, message.error());
            return;
        }

        log::trace("{} -> {}: {}", envelope.from, envelope.to, envelope.payload);
        auto const& handler = envelope.kind == EnvelopeKind::Request ? callbacks->onRequest : callbacks->onResponse;
        if (handler)
            handler(*message);
    }

    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto envelope = Envelope {};
            {
                auto lock = std::unique_lock(mutex);
                if (!workAvailable.wait(lock, stopToken, [this] { return !queue.empty(); }))
                    break;
                envelope = std::move(queue.front());
                queue.pop_front();
                busy = true;
            }

            deliver(envelope);
            finishDelivery();
        }
    }
};

InProcessBroker::InProcessBroker(): _impl(std::make_shared<Impl>())
{
}

InProcessBroker::~InProcessBroker()
{
    stop();
}

auto InProcessBroker::createTransport(std::string agentName) -> std::unique_ptr<InProcessTransport>
{
    return std::make_unique<InProcessTransport>(_impl, std::move(agentName));
}

void InProcessBroker::publishEvent(const Event& event)
{
    auto recipients = std::vector<std::string> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        for (const auto& [name, _]: _impl->endpoints)
            recipients.push_back(name);
    }

    auto const payload = codec::eventToJson(event).dump();
    for (auto& name: recipients)
        _impl->enqueue(Envelope { EnvelopeKind::Event, event.source, std::move(name), payload });
}

auto InProcessBroker::dispatchPending() -> std::size_t
{
    auto delivered = std::size_t { 0 };
    while (auto envelope = _impl->take())
    {
        _impl->deliver(*envelope);
        _impl->finishDelivery();
        ++delivered;
    }
    return delivered;
}

void InProcessBroker::start()
{
    if (_impl->worker.joinable())
        return;
    _impl->worker = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->run(token); });
    log::debug("In-process broker started");
}

void InProcessBroker::stop()
{
    if (!_impl->worker.joinable())
        return;
    _impl->worker.request_stop();
    _impl->worker.join();
    log::debug("In-process broker stopped");
}

void InProcessBroker::waitIdle()
{
    if (!_impl->worker.joinable())
    {
        dispatchPending();
        return;
    }

    auto lock = std::unique_lock(_impl->mutex);
    _impl->idle.wait(lock, [this] { return _impl->queue.empty() && !_impl->busy; });
}

auto InProcessBroker::pendingCount() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->queue.size();
}

InProcessTransport::InProcessTransport(std::shared_ptr<InProcessBroker::Impl> broker, std::string agentName):
    _broker(std::move(broker)), _agentName(std::move(agentName))
{
}

InProcessTransport::~InProcessTransport()
{
    stop();
}

void InProcessTransport::setCallbacks(TransportCallbacks callbacks)
{
    _callbacks = std::move(callbacks);
}

auto InProcessTransport::start() -> VoidResult
{
    {
        auto lock = std::lock_guard(_broker->mutex);
        if (_broker->endpoints.contains(_agentName))
            return makeError(ErrorCode::TransportError,
                             std::format("Another transport is already connected as {}", _agentName));
        _broker->endpoints.emplace(_agentName, _callbacks);
    }
    _connected = true;
    log::debug("Transport {} connected", _agentName);
    return {};
}

void InProcessTransport::stop()
{
    if (!_connected.exchange(false))
        return;
    auto lock = std::lock_guard(_broker->mutex);
    _broker->endpoints.erase(_agentName);
}

auto InProcessTransport::sendRequest(const Message& message, std::string_view destination) -> VoidResult
{
    if (!_connected)
        return makeError(ErrorCode::TransportError, std::format("Transport {} is not started", _agentName));
    _broker->enqueue(
        Envelope { EnvelopeKind::Request, _agentName, std::string(destination), codec::encodeMessage(message) });
    return {};
}

auto InProcessTransport::sendResponse(const Message& message, std::string_view destination) -> VoidResult
{
    if (!_connected)
        return makeError(ErrorCode::TransportError, std::format("Transport {} is not started", _agentName));
    _broker->enqueue(
        Envelope { EnvelopeKind::Response, _agentName, std::string(destination), codec::encodeMessage(message) });
    return {};
}

auto InProcessTransport::isConnected() const -> bool
{
    return _connected;
}

} // namespace agentmesh
