// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Message.hpp>
#include <store/RedisStore.hpp>
#include <store/StoreConfig.hpp>

#include <cstdlib>
#include <format>
#include <memory>
#include <optional>
#include <string>

namespace agentmesh::test
{

/// @brief Store settings for the Redis-backed tests, or std::nullopt if no server is configured.
///
/// Set AGENTMESH_TEST_REDIS_HOST (and optionally AGENTMESH_TEST_REDIS_PORT) to enable them.
inline auto redisTestConfig() -> std::optional<StoreConfig>
{
    auto const* const host = std::getenv("AGENTMESH_TEST_REDIS_HOST");
    if (!host || !*host)
        return std::nullopt;

    auto config = StoreConfig {};
    config.useRedis = true;
    config.redisHost = host;
    if (auto const* const port = std::getenv("AGENTMESH_TEST_REDIS_PORT"); port && *port)
        config.redisPort = std::atoi(port);
    config.keyPrefix = std::format("agentmesh-test-{}", generateChatId().substr(0, 12));
    return config;
}

} // namespace agentmesh::test
