// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <print>
#include <utility>

namespace agentmesh::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};

    thread_local auto threadAgent = std::string {};
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto levelFromString(std::string_view name) -> Level
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return Level::Info;
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "info";
}

AgentScope::AgentScope(std::string agent): _previous(std::exchange(threadAgent, std::move(agent)))
{
}

AgentScope::~AgentScope()
{
    threadAgent = std::move(_previous);
}

auto currentAgent() -> std::string_view
{
    return threadAgent;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto const record = Record { .level = level, .agent = threadAgent, .message = message };
    auto lock = std::lock_guard(globalMutex);

    if (globalCallback)
    {
        globalCallback(record);
        return;
    }

    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    if (record.agent.empty())
        std::println(stderr, "{:%T} {:<7} {}", now, levelName(level), message);
    else
        std::println(stderr, "{:%T} {:<7} [{}] {}", now, levelName(level), record.agent, message);
}

} // namespace agentmesh::log
