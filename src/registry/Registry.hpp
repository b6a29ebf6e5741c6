// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <context/Context.hpp>
#include <core/Error.hpp>
#include <registry/Tool.hpp>
#include <store/SharedStore.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentmesh
{

/// @brief Directory of agents, contexts and tools shared by every process using one store.
///
/// The directories themselves live in the store. The registry object only caches Context
/// handles and keeps the callbacks of tools registered by this process.
/// The handle cache is locked. The directories are only as thread-safe as the store: a
/// RedisStore may be shared across threads, while callers of a LocalStore must serialize all
/// access to it onto one logical thread.
class Registry
{
  public:
    /// @brief Constructs a registry over a shared store.
    /// @param store The store holding the directories.
    /// @param keyPrefix Prefix of every store key.
    Registry(std::shared_ptr<SharedStore> store, std::string keyPrefix);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// @brief Registers an agent name.
    /// @return Success, or NamingConflict if the name is taken. The existing entry is left unchanged.
    [[nodiscard]] auto registerAgent(std::string_view name, std::string_view description) -> VoidResult;

    /// @brief Removes an agent; removing an unknown agent is a no-op.
    [[nodiscard]] auto unregisterAgent(std::string_view name) -> VoidResult;

    [[nodiscard]] auto agentDescription(std::string_view name) const -> Result<std::optional<std::string>>;

    /// @brief All registered agents, mapping name to description.
    [[nodiscard]] auto agents() const -> Result<std::map<std::string, std::string>>;

    /// @brief Formats every registered agent as "name: description", in name order.
    ///
    /// The lines are formatted eagerly when called, not as a lazy view.
    [[nodiscard]] auto agentNamesAndDescriptions() const -> Result<std::vector<std::string>>;

    /// @brief Returns the context with the given name, creating and registering it if needed.
    ///
    /// This is the only way contexts come into existence.
    [[nodiscard]] auto getOrCreateContext(std::string_view name) -> Result<std::shared_ptr<Context>>;

    [[nodiscard]] auto doesContextExist(std::string_view name) const -> Result<bool>;
    [[nodiscard]] auto contextNames() const -> Result<std::vector<std::string>>;

    /// @brief Deletes a context's registry entry and all of its data.
    [[nodiscard]] auto removeContext(std::string_view name) -> VoidResult;

    /// @brief Registers a tool, replacing any tool of the same name.
    [[nodiscard]] auto registerTool(Tool tool) -> VoidResult;

    /// @brief Looks up a tool, re-attaching the callback if this process registered one.
    [[nodiscard]] auto tool(std::string_view name) const -> Result<std::optional<Tool>>;

    [[nodiscard]] auto tools() const -> Result<std::vector<Tool>>;

    /// @brief Descriptors of every registered tool, as offered to an LLM.
    [[nodiscard]] auto toolDefinitions() const -> Result<std::vector<ToolDefinition>>;

    /// @brief Drops cached context handles and local tool callbacks. Stored data is kept.
    void shutdown();

    [[nodiscard]] auto store() const -> const std::shared_ptr<SharedStore>& { return _store; }
    [[nodiscard]] auto keyPrefix() const -> const std::string& { return _keyPrefix; }

  private:
    std::shared_ptr<SharedStore> _store;
    std::string _keyPrefix;
    std::string _agentsKey;
    std::string _contextsKey;
    std::string _toolsKey;

    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<Context>, std::less<>> _contexts;
    std::map<std::string, ToolCallback, std::less<>> _callbacks;

    [[nodiscard]] auto attachCallback(Tool tool) const -> Tool;
};

} // namespace agentmesh
