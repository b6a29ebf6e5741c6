// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/AgentRuntime.hpp>
#include <agent/Coordinators.hpp>
#include <agent/LlmAgent.hpp>
#include <core/Log.hpp>
#include <llm/EchoLlm.hpp>
#include <store/StoreConfig.hpp>
#include <transport/InProcessBroker.hpp>

#include <format>
#include <mutex>
#include <print>
#include <vector>

namespace agentmesh
{

namespace
{

    /// @brief The agent on whose behalf the demo asks its question.
    class DemoClient: public AgentHandler
    {
      public:
        explicit DemoClient(MessageType finalType): _finalType(finalType) {}

        [[nodiscard]] auto processRequest(AgentRuntime& /*agent*/,
                                          const Message& /*request*/,
                                          std::span<const ChatMessage> /*history*/)
            -> Result<std::optional<std::string>> override
        {
            return std::optional<std::string> {};
        }

        [[nodiscard]] auto processResponse(AgentRuntime& /*agent*/, const Message& response) -> VoidResult override
        {
            if (response.type != _finalType)
                return {};
            auto lock = std::lock_guard(_mutex);
            _answer = response.content;
            return {};
        }

        void processError(AgentRuntime& agent, const Error& error) override
        {
            AgentHandler::processError(agent, error);
            auto lock = std::lock_guard(_mutex);
            if (!_error)
                _error = error;
        }

        [[nodiscard]] auto outcome() const -> Result<std::string>
        {
            auto lock = std::lock_guard(_mutex);
            if (_error)
                return std::unexpected(*_error);
            if (!_answer)
                return makeError(ErrorCode::ProtocolError, "The demo finished without an answer");
            return *_answer;
        }

      private:
        MessageType _finalType;
        mutable std::mutex _mutex;
        std::optional<std::string> _answer;
        std::optional<Error> _error;
    };

} // namespace

auto demoModeFromString(std::string_view name) -> std::optional<DemoMode>
{
    if (name == "sequential")
        return DemoMode::Sequential;
    if (name == "phased")
        return DemoMode::Phased;
    if (name == "chat")
        return DemoMode::Chat;
    if (name == "independent")
        return DemoMode::Independent;
    return std::nullopt;
}

struct App::Impl
{
    AppConfig config;
    std::shared_ptr<SharedStore> store;
    std::unique_ptr<Registry> registry;

    [[nodiscard]] auto requireContext(std::string_view name) -> Result<std::shared_ptr<Context>>
    {
        auto exists = registry->doesContextExist(name);
        if (!exists)
            return std::unexpected(exists.error());
        if (!*exists)
            return makeError(ErrorCode::NotFound, std::format("No context named {}", name));
        return registry->getOrCreateContext(name);
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

App::App(AppConfig config, std::shared_ptr<SharedStore> store): App(std::move(config))
{
    _impl->store = std::move(store);
}

App::~App()
{
    if (_impl->registry)
        _impl->registry->shutdown();
}

auto App::initialize() -> VoidResult
{
    if (!_impl->store)
    {
        auto store = makeSharedStore(_impl->config.store);
        if (!store)
            return std::unexpected(store.error());
        _impl->store = std::move(*store);
    }

    _impl->registry = std::make_unique<Registry>(_impl->store, _impl->config.store.keyPrefix);
    return {};
}

auto App::registry() -> Registry&
{
    return *_impl->registry;
}

auto App::listAgents(std::ostream& out) -> VoidResult
{
    auto lines = _impl->registry->agentNamesAndDescriptions();
    if (!lines)
        return std::unexpected(lines.error());
    for (const auto& line: *lines)
        std::println(out, "{}", line);
    return {};
}

auto App::listContexts(std::ostream& out) -> VoidResult
{
    auto names = _impl->registry->contextNames();
    if (!names)
        return std::unexpected(names.error());
    for (const auto& name: *names)
        std::println(out, "{}", name);
    return {};
}

auto App::listTools(std::ostream& out) -> VoidResult
{
    auto tools = _impl->registry->tools();
    if (!tools)
        return std::unexpected(tools.error());
    for (const auto& tool: *tools)
        std::println(out, "{}{}: {}", tool.name, tool.isAgentTool ? " (agent)" : "", tool.description);
    return {};
}

auto App::inspectContext(std::string_view name, std::ostream& out) -> VoidResult
{
    auto context = _impl->requireContext(name);
    if (!context)
        return std::unexpected(context.error());

    auto snapshot = (*context)->snapshot();
    if (!snapshot)
        return std::unexpected(snapshot.error());
    std::println(out, "{}", snapshot->dump(2));
    return {};
}

auto App::removeContext(std::string_view name, std::ostream& out) -> VoidResult
{
    if (auto context = _impl->requireContext(name); !context)
        return std::unexpected(context.error());
    if (auto removed = _impl->registry->removeContext(name); !removed)
        return removed;
    std::println(out, "Removed context {}", name);
    return {};
}

auto App::runDemo(const DemoOptions& options) -> Result<std::string>
{
    auto& registry = *_impl->registry;
    auto const tag = generateChatId().substr(0, 8);
    auto const agentName = [&](std::string_view role) { return std::format("demo-{}-{}", role, tag); };
    auto const contextName = std::format("demo-{}", tag);
    auto const chatId = generateChatId();

    auto llmA = EchoLlm("A");
    auto llmB = EchoLlm("B");
    auto llmC = EchoLlm("C");
    auto workerA = LlmAgent(llmA);
    auto workerB = LlmAgent(llmB);
    auto workerC = LlmAgent(llmC);

    auto const finalType = options.mode == DemoMode::Chat ? MessageType::Ack : MessageType::Response;
    auto client = DemoClient(finalType);

    auto sequential = SequentialCoordinator({ agentName("a"), agentName("b"), agentName("c") });
    auto phased = PhasedCoordinator({ { agentName("a"), agentName("b") }, { agentName("c") } });

    auto broker = InProcessBroker {};
    auto runtimes = std::vector<std::unique_ptr<AgentRuntime>> {};
    auto const addAgent = [&](std::string name, std::string description, AgentHandler& handler) -> AgentRuntime& {
        runtimes.push_back(std::make_unique<AgentRuntime>(
            AgentInfo { .name = name, .description = std::move(description) },
            registry,
            broker.createTransport(name),
            handler));
        return *runtimes.back();
    };

    auto& clientAgent = addAgent(agentName("client"), "Asks the demo question", client);
    addAgent(agentName("a"), "Echo agent A", workerA);
    addAgent(agentName("b"), "Echo agent B", workerB);
    addAgent(agentName("c"), "Echo agent C", workerC);

    auto destination = agentName("a");
    if (options.mode == DemoMode::Sequential)
    {
        addAgent(agentName("coordinator"), "Runs agents A, B and C in sequence", sequential);
        destination = agentName("coordinator");
    }
    else if (options.mode == DemoMode::Phased)
    {
        addAgent(agentName("coordinator"), "Runs A and B, then C", phased);
        destination = agentName("coordinator");
    }

    for (auto& runtime: runtimes)
    {
        if (auto started = runtime->start(); !started)
            return std::unexpected(started.error());
    }

    if (options.mode == DemoMode::Chat)
    {
        auto context = registry.getOrCreateContext(contextName);
        if (!context)
            return std::unexpected(context.error());
        auto setup = (*context)->setCollaborationType(chatId, CollaborationType::Chat).and_then([&] {
            return (*context)->appendChatHistory(
                chatId, ChatMessage { .role = Role::User, .content = options.query, .toolCalls = {}, .toolCallId = {} });
        });
        if (!setup)
            return std::unexpected(setup.error());
    }

    log::info("Running demo in context {} (chat {})", contextName, chatId);
    // Delivery stays on this thread: the local store is not synchronized.
    auto sent = clientAgent.sendRequest(
        Message {
            .sender = {},
            .contextName = contextName,
            .chatId = chatId,
            .type = MessageType::Request,
            .content = options.query,
        },
        destination);
    if (sent)
        broker.dispatchPending();

    for (auto& runtime: runtimes)
        runtime->stop();

    if (!sent)
        return std::unexpected(sent.error());
    return client.outcome();
}

} // namespace agentmesh
