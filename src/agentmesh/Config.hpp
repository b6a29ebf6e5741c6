// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <store/StoreConfig.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace agentmesh
{

/// @brief Name of the configuration file looked up in each search directory.
constexpr auto ConfigFileName = std::string_view { "registry_config.json" };

/// @brief Top-level application configuration.
struct AppConfig
{
    StoreConfig store;

    /// @brief Log verbosity: "error", "warning", "info", "debug" or "trace".
    std::string logLevel = "info";
};

/// @brief Builds the configuration from a parsed configuration document.
///
/// All options live at the top level of the document; missing keys keep their defaults.
[[nodiscard]] auto configFromJson(const nlohmann::json& root) -> AppConfig;

/// @brief Loads the configuration from the first file found in configSearchPaths().
/// @return The loaded configuration, or a ConfigError if no file exists or it is invalid.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating parent directories.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the platform config directory ($XDG_CONFIG_HOME/agentmesh or ~/.config/agentmesh).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the config file path inside defaultConfigDir().
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Candidate configuration files in lookup order.
///
/// ./.agentmesh first, then ~/.agentmesh, then the platform config directory.
[[nodiscard]] auto configSearchPaths() -> std::vector<std::string>;

} // namespace agentmesh
