// SPDX-License-Identifier: Apache-2.0
#include "LlmAgent.hpp"

#include <agent/AgentRuntime.hpp>
#include <core/Log.hpp>
#include <registry/Registry.hpp>

#include <format>

namespace agentmesh
{

LlmAgent::LlmAgent(Llm& llm, LlmAgentConfig config): _llm(llm), _config(config)
{
}

auto LlmAgent::processRequest(AgentRuntime& agent, const Message& request, std::span<const ChatMessage> history)
    -> Result<std::optional<std::string>>
{
    auto& registry = agent.registry();
    auto context = registry.getOrCreateContext(request.contextName);
    if (!context)
        return std::unexpected(context.error());

    auto tools = std::vector<ToolDefinition> {};
    if (!request.chatId.empty())
    {
        auto offered = (*context)->availableTools(request.chatId);
        if (!offered)
            return std::unexpected(offered.error());
        tools = std::move(*offered);
    }
    if (tools.empty())
    {
        auto registered = registry.toolDefinitions();
        if (!registered)
            return std::unexpected(registered.error());
        tools = std::move(*registered);
    }

    if (history.empty() && tools.empty())
    {
        log::debug("{} answers with a single prompt", agent.name());
        auto answer = _llm.processSinglePrompt(request.content);
        if (!answer)
            return std::unexpected(answer.error());
        return std::optional<std::string> { std::move(*answer) };
    }

    auto messages = std::vector<ChatMessage> {};
    if (auto system = _llm.systemMessage(); !system.empty())
        messages.push_back(ChatMessage { .role = Role::System, .content = std::move(system) });
    messages.insert(messages.end(), history.begin(), history.end());

    // The phased coordinator already put the query into the history.
    if (history.empty() || history.back().role != Role::User || history.back().content != request.content)
        messages.push_back(ChatMessage { .role = Role::User, .content = request.content });

    for (auto step = 0; step < _config.maxToolSteps; ++step)
    {
        log::debug("{} step {}/{}", agent.name(), step + 1, _config.maxToolSteps);

        auto result = _llm.processChatCompletion(messages, tools);
        if (!result)
            return std::unexpected(result.error());

        if (!result->hasToolCalls())
            return std::optional<std::string> { std::move(result->text) };

        log::info("{}: LLM requested {} tool call(s)", agent.name(), result->toolCalls.size());
        messages.push_back(ChatMessage {
            .role = Role::Assistant,
            .content = result->text,
            .toolCalls = result->toolCalls,
        });

        auto toolResults = executeToolCalls(registry, **context, request.chatId, result->toolCalls);
        if (!toolResults)
            return std::unexpected(toolResults.error());
        for (auto& toolResult: *toolResults)
            messages.push_back(ChatMessage {
                .role = Role::Tool,
                .content = std::move(toolResult.content),
                .toolCalls = {},
                .toolCallId = std::move(toolResult.callId),
            });
    }

    log::warning("{} reached max tool steps ({}), forcing final response", agent.name(), _config.maxToolSteps);

    auto const noTools = std::span<const ToolDefinition> {};
    auto finalResult = _llm.processChatCompletion(messages, noTools);
    if (!finalResult)
        return std::unexpected(finalResult.error());
    return std::optional<std::string> { std::move(finalResult->text) };
}

auto LlmAgent::processResponse(AgentRuntime& agent, const Message& response) -> VoidResult
{
    log::info("{} received {} from {}: {}",
              agent.name(),
              messageTypeToString(response.type),
              response.sender,
              response.content);
    return {};
}

auto LlmAgent::executeToolCalls(Registry& registry,
                                Context& context,
                                const std::string& chatId,
                                const std::vector<ToolCall>& calls) -> Result<std::vector<ToolResult>>
{
    auto results = std::vector<ToolResult> {};
    results.reserve(calls.size());

    for (const auto& call: calls)
    {
        log::info("Executing tool: {} (id: {})", call.name, call.id);

        if (!chatId.empty())
        {
            if (auto pending = context.appendRequiredToolCall(chatId, call.name); !pending)
                return std::unexpected(pending.error());
        }

        auto tool = registry.tool(call.name);
        if (!tool)
            return std::unexpected(tool.error());

        auto output = *tool ? (*tool)->invoke(call.arguments)
                            : Result<std::string>(makeError(ErrorCode::ToolCallError,
                                                            std::format("Unknown tool: {}", call.name)));
        if (output)
        {
            results.push_back(ToolResult { .callId = call.id, .content = std::move(*output), .isError = false });
        }
        else
        {
            log::error("Tool call failed: {}", output.error().message);
            results.push_back(ToolResult {
                .callId = call.id,
                .content = std::format("Error: {}", output.error().message),
                .isError = true,
            });
        }

        if (!chatId.empty())
        {
            if (auto satisfied = context.removeRequiredToolCall(chatId, call.name); !satisfied)
                return std::unexpected(satisfied.error());
        }
    }

    return results;
}

} // namespace agentmesh
