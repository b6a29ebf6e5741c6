// SPDX-License-Identifier: Apache-2.0
#include <agent/AgentRuntime.hpp>
#include <agent/Coordinators.hpp>
#include <agent/LlmAgent.hpp>
#include <llm/EchoLlm.hpp>
#include <store/LocalStore.hpp>
#include <transport/InProcessBroker.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace agentmesh;

namespace
{

/// @brief Stands in for the user: sends the first request and keeps whatever comes back.
class Requester: public AgentHandler
{
  public:
    std::vector<Message> replies;
    std::vector<Error> errors;

    auto processRequest(AgentRuntime&, const Message&, std::span<const ChatMessage>)
        -> Result<std::optional<std::string>> override
    {
        return std::optional<std::string> {};
    }

    auto processResponse(AgentRuntime&, const Message& response) -> VoidResult override
    {
        replies.push_back(response);
        return {};
    }

    void processError(AgentRuntime&, const Error& error) override { errors.push_back(error); }
};

/// @brief A registry, a broker and echo agents A, B and C wired together.
struct Mesh
{
    std::shared_ptr<LocalStore> store = std::make_shared<LocalStore>();
    Registry registry { store, "test" };
    InProcessBroker broker;
    EchoLlm llmA { "A" };
    EchoLlm llmB { "B" };
    EchoLlm llmC { "C" };
    LlmAgent workerA { llmA };
    LlmAgent workerB { llmB };
    LlmAgent workerC { llmC };
    Requester user;
    std::vector<std::unique_ptr<AgentRuntime>> runtimes;

    auto add(std::string name, AgentHandler& handler) -> AgentRuntime&
    {
        runtimes.push_back(std::make_unique<AgentRuntime>(
            AgentInfo { .name = name, .description = name }, registry, broker.createTransport(name), handler));
        REQUIRE(runtimes.back()->start().has_value());
        return *runtimes.back();
    }

    void addWorkers()
    {
        add("A", workerA);
        add("B", workerB);
        add("C", workerC);
    }

    auto context() -> Context& { return *registry.getOrCreateContext("ctx").value(); }

    ~Mesh()
    {
        for (auto& runtime: runtimes)
            runtime->stop();
    }
};

auto question(std::string chatId = "chat") -> Message
{
    return Message {
        .sender = {},
        .contextName = "ctx",
        .chatId = std::move(chatId),
        .type = MessageType::Request,
        .content = "question",
    };
}

} // namespace

TEST_CASE("SequentialCoordinator passes the work from agent to agent", "[coordinator]")
{
    auto mesh = Mesh {};
    auto coordinator = SequentialCoordinator({ "A", "B", "C" });
    auto& user = mesh.add("user", mesh.user);
    mesh.add("coordinator", coordinator);
    mesh.addWorkers();

    REQUIRE(user.sendRequest(question(), "coordinator").has_value());
    mesh.broker.waitIdle();

    CHECK(mesh.user.errors.empty());
    REQUIRE(mesh.user.replies.size() == 1);
    CHECK(mesh.user.replies[0].sender == "C");
    CHECK(mesh.user.replies[0].type == MessageType::Response);
    CHECK(mesh.user.replies[0].content == "[C] [B] [A] question");

    auto& context = mesh.context();
    CHECK(context.collaborationType("chat").value() == CollaborationType::Sequential);
    CHECK(context.routeResponseTo("chat").value() == "user");
    CHECK(context.queries("chat").value() == std::vector<std::string> { "question" });
    CHECK(context.participants().value()
          == std::vector<std::string> { "user", "coordinator", "A", "B", "C" });
    CHECK(context.messageTrace().value().size() == 5);
}

TEST_CASE("PhasedCoordinator waits for every agent of a phase", "[coordinator]")
{
    auto mesh = Mesh {};
    auto coordinator = PhasedCoordinator({ { "A", "B" }, { "C" } });
    auto& user = mesh.add("user", mesh.user);
    mesh.add("coordinator", coordinator);
    mesh.addWorkers();

    REQUIRE(user.sendRequest(question(), "coordinator").has_value());
    mesh.broker.waitIdle();

    CHECK(mesh.user.errors.empty());
    REQUIRE(mesh.user.replies.size() == 1);
    CHECK(mesh.user.replies[0].sender == "coordinator");
    CHECK(mesh.user.replies[0].content == "[C] question (4 messages seen)");

    auto& context = mesh.context();
    auto const history = context.chatHistory("chat").value();
    REQUIRE(history.size() == 4);
    CHECK(history[0].role == Role::User);
    CHECK(history[1].content == "[A] question (1 messages seen)");
    CHECK(history[2].content == "[B] question (3 messages seen)");
    CHECK(history[3].content == "[C] question (4 messages seen)");
    CHECK(context.currentPhase("chat").value() == 1);
    CHECK(context.requiredAgentsForCurrentPhase("chat").value().empty());
}

TEST_CASE("Coordinators assign a chat id when the request has none", "[coordinator]")
{
    auto mesh = Mesh {};
    auto coordinator = SequentialCoordinator({ "A" });
    auto& user = mesh.add("user", mesh.user);
    mesh.add("coordinator", coordinator);
    mesh.addWorkers();

    REQUIRE(user.sendRequest(question(""), "coordinator").has_value());
    mesh.broker.waitIdle();

    REQUIRE(mesh.user.replies.size() == 1);
    CHECK(!mesh.user.replies[0].chatId.empty());
    CHECK(mesh.user.replies[0].content == "[A] question");
}

TEST_CASE("Coordinators reject empty plans", "[coordinator]")
{
    auto mesh = Mesh {};
    auto emptySequence = SequentialCoordinator(std::vector<std::string> {});
    auto emptyPhase = PhasedCoordinator({ { "A" }, {} });
    auto& sequential = mesh.add("sequential", emptySequence);
    auto& phased = mesh.add("phased", emptyPhase);

    auto request = question();
    request.sender = "user";
    CHECK(emptySequence.processRequest(sequential, request, {}).error().code == ErrorCode::InvalidArgument);
    CHECK(emptyPhase.processRequest(phased, request, {}).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Chat collaboration acknowledges and records history", "[coordinator]")
{
    auto mesh = Mesh {};
    auto& user = mesh.add("user", mesh.user);
    mesh.addWorkers();

    auto& context = mesh.context();
    REQUIRE(context.setCollaborationType("chat", CollaborationType::Chat).has_value());
    REQUIRE(context
                .appendChatHistory("chat",
                                   ChatMessage { .role = Role::User, .content = "question", .toolCalls = {}, .toolCallId = {} })
                .has_value());

    REQUIRE(user.sendRequest(question(), "A").has_value());
    mesh.broker.waitIdle();

    REQUIRE(mesh.user.replies.size() == 1);
    CHECK(mesh.user.replies[0].type == MessageType::Ack);
    CHECK(mesh.user.replies[0].content == "[A] question (1 messages seen)");
    CHECK(context.chatHistory("chat").value().size() == 2);
}

TEST_CASE("Independent requests are answered directly", "[coordinator]")
{
    auto mesh = Mesh {};
    auto& user = mesh.add("user", mesh.user);
    mesh.addWorkers();

    REQUIRE(user.sendRequest(question(), "B").has_value());
    REQUIRE(user.sendRequest(question(), "nobody").has_value());
    mesh.broker.waitIdle();

    REQUIRE(mesh.user.replies.size() == 1);
    CHECK(mesh.user.replies[0].content == "[B] question");
    REQUIRE(mesh.user.errors.size() == 1);
    CHECK(mesh.user.errors[0].code == ErrorCode::TransportError);
}
