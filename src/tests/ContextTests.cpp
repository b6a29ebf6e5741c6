// SPDX-License-Identifier: Apache-2.0
#include <context/Context.hpp>
#include <core/MessageCodec.hpp>
#include <store/LocalStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>

using namespace agentmesh;

namespace
{

auto makeContext(std::shared_ptr<LocalStore> store = std::make_shared<LocalStore>()) -> Context
{
    return Context("ctx", std::move(store), "test");
}

auto userMessage(std::string content) -> ChatMessage
{
    return ChatMessage { .role = Role::User, .content = std::move(content), .toolCalls = {}, .toolCallId = {} };
}

} // namespace

TEST_CASE("Context getters return empty defaults for an unknown chat", "[context]")
{
    auto context = makeContext();
    auto const chat = std::string { "never-seen" };

    CHECK(context.participants().value().empty());
    CHECK(context.messageTrace().value().empty());
    CHECK(context.chatHistory(chat).value().empty());
    CHECK(context.chatHistories().value().empty());
    CHECK(context.requiredToolCalls(chat).value().empty());
    CHECK(context.availableTools(chat).value().empty());
    CHECK(context.agentSequence(chat).value().empty());
    CHECK(context.nextAgentInSequence(chat, "a").value() == std::nullopt);
    CHECK(context.routeResponseTo(chat).value() == std::nullopt);
    CHECK(context.agentPhaseAssignments(chat).value().empty());
    CHECK(context.currentPhase(chat).value() == std::nullopt);
    CHECK(context.requiredAgentsForCurrentPhase(chat).value().empty());
    CHECK(context.queries(chat).value().empty());
    CHECK(context.currentQuery(chat).value() == std::nullopt);
    CHECK(context.collaborationType(chat).value() == CollaborationType::Independent);
    CHECK(context.agentsForNextPhase(chat).value() == std::nullopt);
}

TEST_CASE("Context addParticipant is idempotent", "[context]")
{
    auto context = makeContext();

    REQUIRE(context.addParticipant("alice").has_value());
    REQUIRE(context.addParticipant("bob").has_value());
    REQUIRE(context.addParticipant("alice").has_value());

    CHECK(context.participants().value() == std::vector<std::string> { "alice", "bob" });
}

TEST_CASE("Context chat history keeps append order", "[context]")
{
    auto context = makeContext();

    for (auto i = 0; i < 5; ++i)
        REQUIRE(context.appendChatHistory("chat", userMessage(std::to_string(i))).has_value());
    REQUIRE(context
                .appendChatHistory("chat",
                                   ChatMessage {
                                       .role = Role::Assistant,
                                       .content = "calling",
                                       .toolCalls = { ToolCall { .id = "c1", .name = "t", .arguments = { { "x", 1 } } } },
                                       .toolCallId = {},
                                   })
                .has_value());

    auto const history = context.chatHistory("chat").value();
    REQUIRE(history.size() == 6);
    for (auto i = 0; i < 5; ++i)
    {
        CHECK(history[i].role == Role::User);
        CHECK(history[i].content == std::to_string(i));
    }
    CHECK(history[5].role == Role::Assistant);
    REQUIRE(history[5].toolCalls.size() == 1);
    CHECK(history[5].toolCalls[0].arguments["x"] == 1);

    SECTION("histories are scoped by chat id")
    {
        REQUIRE(context.appendChatHistory("other", userMessage("elsewhere")).has_value());
        CHECK(context.chatHistory("chat").value().size() == 6);
        CHECK(context.chatHistory("other").value().size() == 1);

        auto const all = context.chatHistories().value();
        CHECK(all.size() == 2);
        CHECK(all.at("other").front().content == "elsewhere");
    }
}

TEST_CASE("Context contexts with different names do not share state", "[context]")
{
    auto store = std::make_shared<LocalStore>();
    auto first = Context("first", store, "test");
    auto second = Context("second", store, "test");

    REQUIRE(first.addParticipant("alice").has_value());
    REQUIRE(first.addQuery("chat", "q").has_value());

    CHECK(second.participants().value().empty());
    CHECK(second.queries("chat").value().empty());
}

TEST_CASE("Context required tool call bookkeeping", "[context]")
{
    auto store = std::make_shared<LocalStore>();
    auto context = makeContext(store);

    REQUIRE(context.appendRequiredToolCall("chat", "toolX").has_value());
    REQUIRE(context.appendRequiredToolCall("chat", "toolX").has_value());
    CHECK(context.requiredToolCalls("chat").value() == std::vector<std::string> { "toolX" });

    REQUIRE(context.removeRequiredToolCall("chat", "toolX").has_value());
    CHECK(context.requiredToolCalls("chat").value().empty());
    CHECK(!store->mapExists("test:context:ctx:required_tool_calls", "chat").value());

    SECTION("removing an absent tool call is a no-op")
    {
        REQUIRE(context.removeRequiredToolCall("chat", "toolY").has_value());
        CHECK(!store->mapExists("test:context:ctx:required_tool_calls", "chat").value());
    }
}

TEST_CASE("Context available tools", "[context]")
{
    auto context = makeContext();
    auto const tool = ToolDefinition {
        .name = "search",
        .description = "Searches",
        .inputSchema = { { "type", "object" } },
    };

    REQUIRE(context.appendAvailableTool("chat", tool).has_value());
    auto const tools = context.availableTools("chat").value();
    REQUIRE(tools.size() == 1);
    CHECK(tools[0].name == "search");
    CHECK(tools[0].inputSchema["type"] == "object");
}

TEST_CASE("Context sequential routing state", "[context]")
{
    auto context = makeContext();
    REQUIRE(context.setAgentSequence("chat", { "A", "B", "C" }).has_value());
    REQUIRE(context.setRouteResponseTo("chat", "R").has_value());

    CHECK(context.nextAgentInSequence("chat", "A").value() == "B");
    CHECK(context.nextAgentInSequence("chat", "B").value() == "C");
    CHECK(context.nextAgentInSequence("chat", "C").value() == std::nullopt);
    CHECK(context.nextAgentInSequence("chat", "Z").value() == std::nullopt);
    CHECK(context.routeResponseTo("chat").value() == "R");
}

TEST_CASE("Context phased protocol", "[context]")
{
    auto store = std::make_shared<LocalStore>();
    auto context = makeContext(store);
    auto const phases = std::vector<std::vector<std::string>> { { "A", "B" }, { "C" } };
    REQUIRE(context.setAgentPhaseAssignments("chat", phases).has_value());
    CHECK(context.agentPhaseAssignments("chat").value() == phases);

    REQUIRE(context.setCurrentPhase("chat", 0).has_value());
    CHECK(context.currentPhase("chat").value() == 0);
    CHECK(context.requiredAgentsForCurrentPhase("chat").value() == std::vector<std::string> { "A", "B" });

    REQUIRE(context.removeRequiredAgentForCurrentPhase("chat", "A").has_value());
    CHECK(context.requiredAgentsForCurrentPhase("chat").value() == std::vector<std::string> { "B" });
    CHECK(context.agentPhaseAssignments("chat").value() == phases);

    REQUIRE(context.removeRequiredAgentForCurrentPhase("chat", "B").has_value());
    CHECK(context.requiredAgentsForCurrentPhase("chat").value().empty());
    CHECK(!store->mapExists("test:context:ctx:required_agents_for_phase", "chat").value());

    auto const next = context.agentsForNextPhase("chat").value();
    REQUIRE(next.has_value());
    CHECK(*next == std::vector<std::string> { "C" });
    CHECK(context.currentPhase("chat").value() == 1);
    CHECK(context.requiredAgentsForCurrentPhase("chat").value() == std::vector<std::string> { "C" });

    CHECK(context.agentsForNextPhase("chat").value() == std::nullopt);
    CHECK(context.currentPhase("chat").value() == 1);
}

TEST_CASE("Context setCurrentPhase validates the phase", "[context]")
{
    auto context = makeContext();

    SECTION("no phases assigned")
    {
        auto const result = context.setCurrentPhase("chat", 0);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }

    REQUIRE(context.setAgentPhaseAssignments("chat", { { "A" }, { "B" } }).has_value());

    SECTION("out of range")
    {
        CHECK(context.setCurrentPhase("chat", 2).error().code == ErrorCode::InvalidArgument);
        CHECK(context.setCurrentPhase("chat", -1).error().code == ErrorCode::InvalidArgument);
        CHECK(context.currentPhase("chat").value() == std::nullopt);
    }

    SECTION("phases never go back")
    {
        REQUIRE(context.setCurrentPhase("chat", 1).has_value());
        auto const result = context.setCurrentPhase("chat", 0);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
        CHECK(context.currentPhase("chat").value() == 1);
        CHECK(context.requiredAgentsForCurrentPhase("chat").value() == std::vector<std::string> { "B" });
    }
}

TEST_CASE("Context agentsForNextPhase starts at phase 0 when unset", "[context]")
{
    auto context = makeContext();
    REQUIRE(context.setAgentPhaseAssignments("chat", { { "A" }, { "B" } }).has_value());

    CHECK(context.agentsForNextPhase("chat").value() == std::vector<std::string> { "A" });
    CHECK(context.currentPhase("chat").value() == 0);
}

TEST_CASE("Context queries", "[context]")
{
    auto context = makeContext();
    REQUIRE(context.addQuery("chat", "first").has_value());
    REQUIRE(context.addQuery("chat", "second").has_value());

    CHECK(context.queries("chat").value() == std::vector<std::string> { "first", "second" });
    CHECK(context.currentQuery("chat").value() == "second");
}

TEST_CASE("Context collaboration type", "[context]")
{
    auto store = std::make_shared<LocalStore>();
    auto context = makeContext(store);

    REQUIRE(context.setCollaborationType("chat", CollaborationType::Phased).has_value());
    CHECK(context.collaborationType("chat").value() == CollaborationType::Phased);
    CHECK(context.collaborationType("").value() == CollaborationType::Independent);

    SECTION("an unknown stored name falls back to INDEPENDENT")
    {
        REQUIRE(store->mapSet("test:context:ctx:collaboration_type", "odd", R"("SWARM")").has_value());
        CHECK(context.collaborationType("odd").value() == CollaborationType::Independent);
    }
}

TEST_CASE("Context message trace decodes every field", "[context]")
{
    auto context = makeContext();
    auto const message = Message {
        .sender = "A",
        .contextName = "ctx",
        .chatId = "chat",
        .type = MessageType::Ack,
        .content = "done",
    };
    REQUIRE(context.trace(message).has_value());

    auto const trace = context.messageTrace().value();
    REQUIRE(trace.size() == 1);
    CHECK(trace[0].sender == "A");
    CHECK(trace[0].type == MessageType::Ack);
    CHECK(trace[0].content == "done");
}

TEST_CASE("Context snapshot and clear", "[context]")
{
    auto store = std::make_shared<LocalStore>();
    auto context = makeContext(store);
    REQUIRE(context.addParticipant("A").has_value());
    REQUIRE(context.addQuery("chat", "q").has_value());
    REQUIRE(context.setCollaborationType("chat", CollaborationType::Chat).has_value());

    auto const snapshot = context.snapshot().value();
    CHECK(snapshot["name"] == "ctx");
    CHECK(snapshot["participants"] == nlohmann::json { "A" });
    CHECK(snapshot["queries"]["chat"] == nlohmann::json { "q" });
    CHECK(snapshot["collaboration_type"]["chat"] == "CHAT");
    CHECK(snapshot["chat_history"].empty());

    REQUIRE(context.clear().has_value());
    CHECK(context.participants().value().empty());
    CHECK(context.queries("chat").value().empty());
    CHECK(context.collaborationType("chat").value() == CollaborationType::Independent);
}

TEST_CASE("Context reports malformed stored data", "[context]")
{
    auto store = std::make_shared<LocalStore>();
    auto context = makeContext(store);
    REQUIRE(store->mapSet("test:context:ctx:queries", "chat", "{not json").has_value());

    auto const queries = context.queries("chat");
    REQUIRE(!queries.has_value());
    CHECK(queries.error().code == ErrorCode::StoreError);

    auto const appended = context.addQuery("chat", "q");
    REQUIRE(!appended.has_value());
    CHECK(appended.error().code == ErrorCode::StoreError);
}
