// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace coderig
{

/// @brief Configuration for a single MCP server.
///
/// Exactly one of `command` (stdio) or `url` (WebSocket) is set.
struct McpServerConfig
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string url;
    bool enabled = true;

    [[nodiscard]] auto isStdio() const -> bool { return !command.empty(); }
    [[nodiscard]] auto isWebSocket() const -> bool { return !url.empty(); }

    auto operator==(const McpServerConfig&) const -> bool = default;
};

using McpServerMap = std::map<std::string, McpServerConfig>;

/// @brief Checks that a server config is usable.
///
/// Rejects an empty name, both or neither of command/url, and a url whose
/// scheme is not ws:// or wss://.
[[nodiscard]] auto validateServerConfig(const McpServerConfig& config) -> VoidResult;

/// @brief Reads one entry of the `mcpServers` config section.
[[nodiscard]] auto serverConfigFromJson(const std::string& name, const nlohmann::json& value) -> McpServerConfig;

/// @brief Writes one entry of the `mcpServers` config section; the name is the key, not a member.
[[nodiscard]] auto serverConfigToJson(const McpServerConfig& config) -> nlohmann::json;

/// @brief Reads a whole `mcpServers` section; a non-object yields an empty map.
[[nodiscard]] auto serverMapFromJson(const nlohmann::json& section) -> McpServerMap;

[[nodiscard]] auto serverMapToJson(const McpServerMap& servers) -> nlohmann::json;

/// @brief Persistence of the server configuration map.
class ConfigStore
{
  public:
    virtual ~ConfigStore() = default;

    [[nodiscard]] virtual auto load() -> Result<McpServerMap> = 0;
    [[nodiscard]] virtual auto save(const McpServerMap& servers) -> VoidResult = 0;
};

/// @brief ConfigStore that keeps the map in memory, for tests and ephemeral sessions.
class MemoryConfigStore: public ConfigStore
{
  public:
    explicit MemoryConfigStore(McpServerMap servers = {});

    [[nodiscard]] auto load() -> Result<McpServerMap> override;
    [[nodiscard]] auto save(const McpServerMap& servers) -> VoidResult override;

    /// @brief Number of save() calls so far.
    [[nodiscard]] auto saveCount() const -> size_t;

  private:
    mutable std::mutex _mutex;
    McpServerMap _servers;
    size_t _saveCount = 0;
};

} // namespace coderig
