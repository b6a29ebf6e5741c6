// SPDX-License-Identifier: Apache-2.0
#include <transport/InProcessBroker.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace agentmesh;

namespace
{

/// @brief Collects everything delivered to one endpoint.
struct Inbox
{
    std::vector<Message> requests;
    std::vector<Message> responses;
    std::vector<Event> events;
    std::vector<Error> errors;

    auto callbacks() -> TransportCallbacks
    {
        return TransportCallbacks {
            .onRequest = [this](const Message& m) { requests.push_back(m); },
            .onResponse = [this](const Message& m) { responses.push_back(m); },
            .onEvent = [this](const Event& e) { events.push_back(e); },
            .onError = [this](const Error& e) { errors.push_back(e); },
        };
    }
};

auto makeMessage(std::string content) -> Message
{
    return Message {
        .sender = "alice",
        .contextName = "ctx",
        .chatId = "chat",
        .type = MessageType::Request,
        .content = std::move(content),
    };
}

} // namespace

TEST_CASE("InProcessBroker delivers requests and responses", "[broker]")
{
    auto broker = InProcessBroker {};
    auto aliceInbox = Inbox {};
    auto bobInbox = Inbox {};

    auto alice = broker.createTransport("alice");
    auto bob = broker.createTransport("bob");
    alice->setCallbacks(aliceInbox.callbacks());
    bob->setCallbacks(bobInbox.callbacks());
    REQUIRE(alice->start().has_value());
    REQUIRE(bob->start().has_value());

    REQUIRE(alice->sendRequest(makeMessage("first"), "bob").has_value());
    REQUIRE(alice->sendRequest(makeMessage("second"), "bob").has_value());
    CHECK(broker.pendingCount() == 2);
    CHECK(bobInbox.requests.empty());

    CHECK(broker.dispatchPending() == 2);
    REQUIRE(bobInbox.requests.size() == 2);
    CHECK(bobInbox.requests[0].content == "first");
    CHECK(bobInbox.requests[1].content == "second");
    CHECK(bobInbox.requests[0].contextName == "ctx");

    auto reply = makeMessage("answer");
    reply.sender = "bob";
    reply.type = MessageType::Response;
    REQUIRE(bob->sendResponse(reply, "alice").has_value());
    broker.waitIdle();

    REQUIRE(aliceInbox.responses.size() == 1);
    CHECK(aliceInbox.responses[0].type == MessageType::Response);
    CHECK(aliceInbox.responses[0].content == "answer");
}

TEST_CASE("InProcessBroker reports unknown destinations to the sender", "[broker]")
{
    auto broker = InProcessBroker {};
    auto inbox = Inbox {};
    auto alice = broker.createTransport("alice");
    alice->setCallbacks(inbox.callbacks());
    REQUIRE(alice->start().has_value());

    REQUIRE(alice->sendRequest(makeMessage("hello"), "nobody").has_value());
    broker.dispatchPending();

    REQUIRE(inbox.errors.size() == 1);
    CHECK(inbox.errors[0].code == ErrorCode::TransportError);
    CHECK(inbox.errors[0].message.find("nobody") != std::string::npos);
}

TEST_CASE("InProcessBroker transports", "[broker]")
{
    auto broker = InProcessBroker {};
    auto inbox = Inbox {};
    auto first = broker.createTransport("alice");
    first->setCallbacks(inbox.callbacks());

    SECTION("sending before start fails")
    {
        CHECK(!first->isConnected());
        CHECK(first->sendRequest(makeMessage("x"), "bob").error().code == ErrorCode::TransportError);
    }

    SECTION("a second transport with the same name cannot connect")
    {
        REQUIRE(first->start().has_value());
        auto second = broker.createTransport("alice");
        CHECK(second->start().error().code == ErrorCode::TransportError);
    }

    SECTION("a stopped transport frees its name")
    {
        REQUIRE(first->start().has_value());
        first->stop();
        CHECK(!first->isConnected());
        auto second = broker.createTransport("alice");
        CHECK(second->start().has_value());
    }
}

TEST_CASE("InProcessBroker publishes events to every endpoint", "[broker]")
{
    auto broker = InProcessBroker {};
    auto aliceInbox = Inbox {};
    auto bobInbox = Inbox {};
    auto alice = broker.createTransport("alice");
    auto bob = broker.createTransport("bob");
    alice->setCallbacks(aliceInbox.callbacks());
    bob->setCallbacks(bobInbox.callbacks());
    REQUIRE(alice->start().has_value());
    REQUIRE(bob->start().has_value());

    broker.publishEvent(Event { .name = "context-cleared", .source = "alice", .payload = "ctx" });
    CHECK(broker.dispatchPending() == 2);

    REQUIRE(aliceInbox.events.size() == 1);
    REQUIRE(bobInbox.events.size() == 1);
    CHECK(bobInbox.events[0].name == "context-cleared");
    CHECK(bobInbox.events[0].payload == "ctx");
}

TEST_CASE("InProcessBroker worker thread delivers until idle", "[broker]")
{
    auto broker = InProcessBroker {};
    auto inbox = Inbox {};
    auto bob = broker.createTransport("bob");
    bob->setCallbacks(inbox.callbacks());
    REQUIRE(bob->start().has_value());
    auto alice = broker.createTransport("alice");
    REQUIRE(alice->start().has_value());

    broker.start();
    for (auto i = 0; i < 10; ++i)
        REQUIRE(alice->sendRequest(makeMessage(std::to_string(i)), "bob").has_value());
    broker.waitIdle();
    broker.stop();

    REQUIRE(inbox.requests.size() == 10);
    CHECK(inbox.requests.front().content == "0");
    CHECK(inbox.requests.back().content == "9");
}
