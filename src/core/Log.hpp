// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace agentmesh::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief One log line as handed to a sink.
struct Record
{
    Level level = Level::Info;

    /// Name of the agent on whose behalf the calling thread works, or empty.
    std::string_view agent;

    std::string_view message;
};

using LogCallback = std::function<void(const Record& record)>;

/// @brief Routes all log records to @p callback instead of stderr.
///
/// Pass an empty callback to revert to stderr output.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Parses a level name ("error", "warning", "info", "debug", "trace").
/// @return The parsed level, or Level::Info for unknown names.
[[nodiscard]] auto levelFromString(std::string_view name) -> Level;

[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Tags every record written by the current thread with an agent name.
///
/// Several agents share one process and the broker's delivery thread, so records are
/// attributed to whichever agent is handling a message at the time. Scopes nest; the
/// previous tag is restored on destruction.
class AgentScope
{
  public:
    explicit AgentScope(std::string agent);
    ~AgentScope();

    AgentScope(const AgentScope&) = delete;
    AgentScope& operator=(const AgentScope&) = delete;

  private:
    std::string _previous;
};

/// @brief The agent tag of the calling thread, empty outside any AgentScope.
[[nodiscard]] auto currentAgent() -> std::string_view;

/// @brief Writes a log record at the given level. Records are never interleaved.
void write(Level level, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Info)
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Trace)
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace agentmesh::log
