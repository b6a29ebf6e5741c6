// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agentmesh/Config.hpp>
#include <core/Error.hpp>
#include <registry/Registry.hpp>
#include <store/SharedStore.hpp>

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace agentmesh
{

/// @brief Collaboration pattern run by the demo command.
enum class DemoMode
{
    Sequential,
    Phased,
    Chat,
    Independent,
};

/// @brief Parses "sequential", "phased", "chat" or "independent".
[[nodiscard]] auto demoModeFromString(std::string_view name) -> std::optional<DemoMode>;

struct DemoOptions
{
    DemoMode mode = DemoMode::Sequential;
    std::string query = "What is a shared context?";
};

/// @brief Implements the agentmesh commands on top of one registry.
class App
{
  public:
    /// @brief Constructs the application; the store is created by initialize().
    explicit App(AppConfig config);

    /// @brief Constructs the application over an existing store.
    App(AppConfig config, std::shared_ptr<SharedStore> store);

    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Connects the configured store and creates the registry.
    /// @return Success or the store's error.
    [[nodiscard]] auto initialize() -> VoidResult;

    [[nodiscard]] auto registry() -> Registry&;

    /// @brief Prints one "name: description" line per registered agent.
    [[nodiscard]] auto listAgents(std::ostream& out) -> VoidResult;

    [[nodiscard]] auto listContexts(std::ostream& out) -> VoidResult;
    [[nodiscard]] auto listTools(std::ostream& out) -> VoidResult;

    /// @brief Prints the snapshot of a context as indented JSON.
    /// @return Success, or NotFound if no such context is registered.
    [[nodiscard]] auto inspectContext(std::string_view name, std::ostream& out) -> VoidResult;

    [[nodiscard]] auto removeContext(std::string_view name, std::ostream& out) -> VoidResult;

    /// @brief Runs echo agents on an in-process broker and returns the final answer.
    [[nodiscard]] auto runDemo(const DemoOptions& options) -> Result<std::string>;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace agentmesh
