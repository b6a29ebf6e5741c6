// SPDX-License-Identifier: Apache-2.0
#include <agentmesh/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace agentmesh;

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with registry_config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("registry_config.json"));
}

TEST_CASE("configSearchPaths starts in the working directory", "[config]")
{
    auto const paths = configSearchPaths();
    REQUIRE(paths.size() >= 2);
    CHECK(paths.front() == "./.agentmesh/registry_config.json");
    CHECK(paths.back() == defaultConfigPath());
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.logLevel == "info");
    CHECK(config.store.useRedis == false);
    CHECK(config.store.redisHost == "localhost");
    CHECK(config.store.redisPort == 6379);
    CHECK(config.store.maxCommitRetries == 0);
    CHECK(config.store.keyPrefix == "agentmesh");
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "agentmesh_test_config.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({
            "use_redis": true,
            "redis_host": "redis.internal",
            "redis_port": 6380,
            "redis_username": "agent",
            "redis_password": "secret",
            "redis_pool_size": 8,
            "max_commit_retries": 5,
            "key_prefix": "team",
            "log_level": "debug"
        })";
    }

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;
    CHECK(config.store.useRedis);
    CHECK(config.store.redisHost == "redis.internal");
    CHECK(config.store.redisPort == 6380);
    CHECK(config.store.redisUsername == "agent");
    CHECK(config.store.redisPassword == "secret");
    CHECK(config.store.redisSsl == false);
    CHECK(config.store.redisPoolSize == 8);
    CHECK(config.store.maxCommitRetries == 5);
    CHECK(config.store.keyPrefix == "team");
    CHECK(config.logLevel == "debug");

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile uses defaults for missing keys", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "agentmesh_test_config_empty.json";
    {
        auto file = std::ofstream(tempPath);
        file << "{}";
    }

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(!result->store.useRedis);
    CHECK(result->store.keyPrefix == "agentmesh");
    CHECK(result->logLevel == "info");

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects invalid settings", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "agentmesh_test_config_invalid.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({ "use_redis": true, "redis_ssl": true })";
    }

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    CHECK(result.error().message.find("redis_ssl_certfile") != std::string::npos);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile returns error for missing file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/registry_config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "agentmesh_test_invalid.json";
    {
        auto file = std::ofstream(tempPath);
        file << "{ invalid json }";
    }

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("saveConfigToFile writes a file that loads back", "[config]")
{
    auto const dir = std::filesystem::temp_directory_path() / "agentmesh_test_save";
    auto const path = dir / "nested" / "registry_config.json";
    std::filesystem::remove_all(dir);

    auto config = AppConfig {};
    config.store.keyPrefix = "saved";
    config.store.maxCommitRetries = 3;
    config.logLevel = "warning";

    REQUIRE(saveConfigToFile(path.string(), config).has_value());
    REQUIRE(std::filesystem::exists(path));

    auto loaded = loadConfigFromFile(path.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->store.keyPrefix == "saved");
    CHECK(loaded->store.maxCommitRetries == 3);
    CHECK(loaded->logLevel == "warning");
    CHECK(!loaded->store.useRedis);

    std::filesystem::remove_all(dir);
}
