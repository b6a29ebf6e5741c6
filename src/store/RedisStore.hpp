// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <store/SharedStore.hpp>
#include <store/StoreConfig.hpp>

#include <memory>

namespace agentmesh
{

/// @brief SharedStore backed by a Redis server, shared by independent processes.
///
/// Read-modify-write operations run as WATCH/MULTI/EXEC transactions and are retried when
/// another client touches a watched key before the commit. StoreConfig::maxCommitRetries
/// bounds the retries; the default of 0 retries until the commit goes through.
class RedisStore: public SharedStore
{
  public:
    /// @brief Connects to the server described by the configuration.
    /// @param config A validated store configuration with useRedis set.
    /// @return The store, or a StoreError if the connection cannot be set up.
    [[nodiscard]] static auto connect(const StoreConfig& config) -> Result<std::unique_ptr<RedisStore>>;

    ~RedisStore() override;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    [[nodiscard]] auto get(std::string_view key) -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto set(std::string_view key, std::string_view value) -> VoidResult override;
    [[nodiscard]] auto exists(std::string_view key) -> Result<bool> override;
    [[nodiscard]] auto remove(std::string_view key) -> VoidResult override;

    [[nodiscard]] auto listAppend(std::string_view key, std::string_view value) -> VoidResult override;
    [[nodiscard]] auto listRemove(std::string_view key, std::string_view value) -> VoidResult override;
    [[nodiscard]] auto listRange(std::string_view key) -> Result<std::vector<std::string>> override;
    [[nodiscard]] auto listAppendUnique(std::string_view key, std::string_view value) -> Result<bool> override;

    [[nodiscard]] auto mapGet(std::string_view key, std::string_view field)
        -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto mapSet(std::string_view key, std::string_view field, std::string_view value)
        -> VoidResult override;
    [[nodiscard]] auto mapDelete(std::string_view key, std::string_view field) -> VoidResult override;
    [[nodiscard]] auto mapExists(std::string_view key, std::string_view field) -> Result<bool> override;
    [[nodiscard]] auto mapGetAll(std::string_view key) -> Result<std::map<std::string, std::string>> override;

    [[nodiscard]] auto transact(std::span<const FieldRef> fields, const FieldUpdater& updater)
        -> VoidResult override;

    struct Impl;

  private:
    explicit RedisStore(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> _impl;
};

} // namespace agentmesh
