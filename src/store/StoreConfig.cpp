// SPDX-License-Identifier: Apache-2.0
#include "StoreConfig.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <store/LocalStore.hpp>
#include <store/RedisStore.hpp>

#include <format>

namespace agentmesh
{

auto validateStoreConfig(const StoreConfig& config) -> VoidResult
{
    if (config.keyPrefix.empty())
        return makeError(ErrorCode::ConfigError, "key_prefix must not be empty");
    if (config.maxCommitRetries < 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("max_commit_retries must be >= 0, got {}", config.maxCommitRetries));

    if (!config.useRedis)
        return {};

    if (config.redisHost.empty())
        return makeError(ErrorCode::ConfigError, "redis_host is required when use_redis is set");
    if (config.redisPort < 1 || config.redisPort > 65535)
        return makeError(ErrorCode::ConfigError, std::format("redis_port out of range: {}", config.redisPort));
    if (config.redisPoolSize < 1)
        return makeError(ErrorCode::ConfigError,
                         std::format("redis_pool_size must be >= 1, got {}", config.redisPoolSize));

    if (config.redisSsl)
    {
        if (config.redisSslCertfile.empty())
            return makeError(ErrorCode::ConfigError, "redis_ssl_certfile is required when redis_ssl is set");
        if (config.redisSslKeyfile.empty())
            return makeError(ErrorCode::ConfigError, "redis_ssl_keyfile is required when redis_ssl is set");
        if (config.redisSslCaCerts.empty())
            return makeError(ErrorCode::ConfigError, "redis_ssl_ca_certs is required when redis_ssl is set");
    }

    return {};
}

auto storeConfigFromJson(const nlohmann::json& root) -> StoreConfig
{
    auto const defaults = StoreConfig {};
    return StoreConfig {
        .useRedis = json::getBoolOr(root, "use_redis", defaults.useRedis),
        .redisHost = json::getStringOr(root, "redis_host", defaults.redisHost),
        .redisPort = json::getIntOr(root, "redis_port", defaults.redisPort),
        .redisUsername = json::getStringOr(root, "redis_username", ""),
        .redisPassword = json::getStringOr(root, "redis_password", ""),
        .redisSsl = json::getBoolOr(root, "redis_ssl", defaults.redisSsl),
        .redisSslCertfile = json::getStringOr(root, "redis_ssl_certfile", ""),
        .redisSslKeyfile = json::getStringOr(root, "redis_ssl_keyfile", ""),
        .redisSslCaCerts = json::getStringOr(root, "redis_ssl_ca_certs", ""),
        .redisPoolSize = json::getIntOr(root, "redis_pool_size", defaults.redisPoolSize),
        .maxCommitRetries = json::getIntOr(root, "max_commit_retries", defaults.maxCommitRetries),
        .keyPrefix = json::getStringOr(root, "key_prefix", defaults.keyPrefix),
    };
}

void storeConfigToJson(const StoreConfig& config, nlohmann::json& root)
{
    root["use_redis"] = config.useRedis;
    root["redis_host"] = config.redisHost;
    root["redis_port"] = config.redisPort;
    if (!config.redisUsername.empty())
        root["redis_username"] = config.redisUsername;
    if (!config.redisPassword.empty())
        root["redis_password"] = config.redisPassword;
    root["redis_ssl"] = config.redisSsl;
    if (!config.redisSslCertfile.empty())
        root["redis_ssl_certfile"] = config.redisSslCertfile;
    if (!config.redisSslKeyfile.empty())
        root["redis_ssl_keyfile"] = config.redisSslKeyfile;
    if (!config.redisSslCaCerts.empty())
        root["redis_ssl_ca_certs"] = config.redisSslCaCerts;
    root["redis_pool_size"] = config.redisPoolSize;
    root["max_commit_retries"] = config.maxCommitRetries;
    root["key_prefix"] = config.keyPrefix;
}

auto makeSharedStore(const StoreConfig& config) -> Result<std::shared_ptr<SharedStore>>
{
    if (auto valid = validateStoreConfig(config); !valid)
        return std::unexpected(valid.error());

    if (!config.useRedis)
    {
        log::debug("Using the in-process store");
        return std::make_shared<LocalStore>();
    }

    return RedisStore::connect(config).transform(
        [](std::unique_ptr<RedisStore> store) -> std::shared_ptr<SharedStore> { return std::move(store); });
}

} // namespace agentmesh
