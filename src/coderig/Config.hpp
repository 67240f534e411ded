// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/ServerManager.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace coderig
{

/// @brief MCP timeouts section (`mcp`).
struct McpSettings
{
    int listToolsTimeoutMs = 10000;
    int callTimeoutMs = 30000;
    int connectTimeoutMs = 10000;
};

/// @brief Logging section (`log`).
struct LogSettings
{
    log::Level level = log::Level::Info;
};

/// @brief Top-level application configuration.
///
/// The config file is shared with the rest of the application; sections this
/// module does not know are kept in `extra` and written back unchanged.
struct AppConfig
{
    McpServerMap mcpServers;
    McpSettings mcp;
    LogSettings log;
    nlohmann::json extra = nlohmann::json::object();
};

/// @brief Converts the `mcp` section to manager options.
[[nodiscard]] auto toManagerOptions(const McpSettings& settings) -> ManagerOptions;

/// @brief Loads the configuration from the default path, or defaults if there is no file.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the configuration to a file, creating its directory if needed.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or a ConfigError.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns `$XDG_CONFIG_HOME/coderig`, `~/.config/coderig`, or `.`.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief ConfigStore backed by the `mcpServers` section of a config file.
///
/// save() rewrites only that section; everything else in the file is kept.
class FileConfigStore: public ConfigStore
{
  public:
    explicit FileConfigStore(std::string path);

    [[nodiscard]] auto load() -> Result<McpServerMap> override;
    [[nodiscard]] auto save(const McpServerMap& servers) -> VoidResult override;

    [[nodiscard]] auto path() const -> const std::string& { return _path; }

  private:
    std::string _path;
};

} // namespace coderig
