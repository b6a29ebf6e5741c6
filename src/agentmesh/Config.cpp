// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace agentmesh
{

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/agentmesh";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/agentmesh";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return std::format("{}/{}", defaultConfigDir(), ConfigFileName);
}

auto configSearchPaths() -> std::vector<std::string>
{
    auto paths = std::vector<std::string> {};
    paths.push_back(std::format("./.agentmesh/{}", ConfigFileName));
    if (auto const* const home = std::getenv("HOME"); home)
        paths.push_back(std::format("{}/.agentmesh/{}", home, ConfigFileName));
    paths.push_back(defaultConfigPath());
    return paths;
}

auto configFromJson(const nlohmann::json& root) -> AppConfig
{
    return AppConfig {
        .store = storeConfigFromJson(root),
        .logLevel = json::getStringOr(root, "log_level", "info"),
    };
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str(), ErrorCode::ConfigError);
    if (!parseResult)
        return std::unexpected(parseResult.error());
    if (!parseResult->is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto config = configFromJson(*parseResult);
    if (auto valid = validateStoreConfig(config.store); !valid)
        return std::unexpected(valid.error());

    log::debug("Loaded config from {}", path);
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    storeConfigToJson(config.store, root);
    root["log_level"] = config.logLevel;

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const candidates = configSearchPaths();
    for (const auto& path: candidates)
    {
        auto ec = std::error_code {};
        if (std::filesystem::exists(path, ec))
            return loadConfigFromFile(path);
    }

    return makeError(ErrorCode::ConfigError,
                     std::format("No {} found in ./.agentmesh, ~/.agentmesh or {}", ConfigFileName, defaultConfigDir()));
}

} // namespace agentmesh
