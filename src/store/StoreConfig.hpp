// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <store/SharedStore.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace agentmesh
{

/// @brief Selects and parameterizes the shared store backend.
struct StoreConfig
{
    bool useRedis = false;
    std::string redisHost = "localhost";
    int redisPort = 6379;
    std::string redisUsername;
    std::string redisPassword;
    bool redisSsl = false;
    std::string redisSslCertfile;
    std::string redisSslKeyfile;
    std::string redisSslCaCerts;
    int redisPoolSize = 4;

    /// @brief Upper bound on optimistic commit retries; 0 retries until the commit succeeds.
    int maxCommitRetries = 0;

    /// @brief Prefix of every key written to the store.
    std::string keyPrefix = "agentmesh";
};

/// @brief Checks a store configuration without touching any backend.
/// @param config The configuration to check.
/// @return Success, or a ConfigError naming the first problem found.
[[nodiscard]] auto validateStoreConfig(const StoreConfig& config) -> VoidResult;

/// @brief Reads the store options from a configuration document.
///
/// Recognized keys: use_redis, redis_host, redis_port, redis_username, redis_password,
/// redis_ssl, redis_ssl_certfile, redis_ssl_keyfile, redis_ssl_ca_certs, redis_pool_size,
/// max_commit_retries, key_prefix. Missing keys keep their defaults.
[[nodiscard]] auto storeConfigFromJson(const nlohmann::json& root) -> StoreConfig;

/// @brief Writes the store options into a configuration document.
void storeConfigToJson(const StoreConfig& config, nlohmann::json& root);

/// @brief Validates the configuration and constructs the selected backend.
/// @param config The store configuration.
/// @return The store, or an error if the configuration is invalid or the backend cannot be reached.
[[nodiscard]] auto makeSharedStore(const StoreConfig& config) -> Result<std::shared_ptr<SharedStore>>;

} // namespace agentmesh
