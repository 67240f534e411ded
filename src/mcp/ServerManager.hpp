// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/McpConnection.hpp>
#include <mcp/ServerConfig.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace coderig
{

/// @brief Timeouts applied by the manager and the connections it creates.
struct ManagerOptions
{
    ConnectionOptions connection;

    /// @brief Per-server bound used by connectAllEnabled().
    std::chrono::milliseconds connectTimeout { 10000 };
};

/// @brief One row of listServers().
struct ServerStatus
{
    std::string name;
    McpServerConfig config;
    bool connected = false;
    size_t toolCount = 0;
};

/// @brief Outcome of connectAllEnabled().
struct ConnectSummary
{
    std::vector<std::string> succeeded;
    std::vector<std::pair<std::string, Error>> failed;
    std::vector<std::string> skipped; ///< Disabled servers.
};

/// @brief A tool together with the server that provides it.
struct ServerTool
{
    std::string server;
    McpTool tool;
};

/// @brief Creates and connects a connection for a server config.
///
/// The default factory picks stdio or WebSocket by which field is set.
using ConnectionFactory =
    std::function<Result<std::shared_ptr<McpConnection>>(const McpServerConfig& config, Deadline deadline)>;

/// @brief Owns the persisted MCP server configs and the live connections.
///
/// Configs survive disconnects; a connection exists only while connected.
/// There is at most one live connection per server name, and replacing it
/// always tears the previous one down first. Connections are looked up by
/// name for every operation.
class ServerManager
{
  public:
    explicit ServerManager(std::shared_ptr<ConfigStore> store, ManagerOptions options = {});
    ServerManager(std::shared_ptr<ConfigStore> store, ManagerOptions options, ConnectionFactory factory);
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief (Re)reads the server configs from the store.
    [[nodiscard]] auto loadConfigs() -> VoidResult;

    /// @name Configuration
    /// Every change is persisted through the ConfigStore immediately.
    /// @{

    /// @brief Adds a new server; fails if the name is taken.
    [[nodiscard]] auto addServer(const McpServerConfig& config) -> VoidResult;

    /// @brief Disconnects and forgets a server.
    [[nodiscard]] auto removeServer(const std::string& name) -> VoidResult;

    /// @brief Inserts or replaces a server, then reconnects it if enabled.
    ///
    /// The config is stored even if the reconnect fails; that error is returned.
    [[nodiscard]] auto upsertServer(const McpServerConfig& config) -> VoidResult;

    /// @brief Upserts the server with only its `enabled` flag changed.
    [[nodiscard]] auto setServerEnabled(const std::string& name, bool enabled) -> VoidResult;

    [[nodiscard]] auto getServer(const std::string& name) const -> std::optional<McpServerConfig>;
    [[nodiscard]] auto listServers() const -> std::vector<ServerStatus>;

    /// @}

    /// @name Connections
    /// @{

    /// @brief Connects a configured, enabled server, replacing any live connection.
    [[nodiscard]] auto connectServer(const std::string& name, Deadline deadline = {}) -> VoidResult;

    /// @brief Drops the live connection.
    ///
    /// Succeeds for a configured server that is not connected; fails with
    /// NotConnected for a name that is neither connected nor configured.
    [[nodiscard]] auto disconnectServer(const std::string& name) -> VoidResult;

    [[nodiscard]] auto reconnectServer(const std::string& name) -> VoidResult;

    void disconnectAll();

    /// @brief Connects every enabled server, each bounded by the connect timeout.
    ///
    /// Failures are independent and logged with a hint; the summary is logged too.
    auto connectAllEnabled() -> ConnectSummary;

    [[nodiscard]] auto isConnected(const std::string& name) const -> bool;
    [[nodiscard]] auto connectedServers() const -> std::vector<std::string>;

    /// @}

    /// @name Agent interface
    /// @{

    /// @brief Tools of all live connections.
    [[nodiscard]] auto allTools() const -> std::vector<ServerTool>;

    /// @brief Changes whenever the aggregated tool set may have changed.
    [[nodiscard]] auto toolsVersion() const -> uint64_t;

    /// @brief Calls a tool on a live connection; NotConnected if there is none.
    [[nodiscard]] auto callTool(const std::string& server, std::string_view tool, const nlohmann::json& arguments)
        -> Result<nlohmann::json>;

    /// @}

    [[nodiscard]] auto listResources(const std::string& server) -> Result<std::vector<McpResource>>;
    [[nodiscard]] auto readResource(const std::string& server, std::string_view uri) -> Result<nlohmann::json>;
    [[nodiscard]] auto listPrompts(const std::string& server) -> Result<std::vector<McpPrompt>>;
    [[nodiscard]] auto getPrompt(const std::string& server, std::string_view name, const nlohmann::json& arguments)
        -> Result<nlohmann::json>;
    [[nodiscard]] auto ping(const std::string& server) -> VoidResult;

  private:
    [[nodiscard]] auto connection(const std::string& name) const -> Result<std::shared_ptr<McpConnection>>;

    // The following require _lifecycleMutex.
    [[nodiscard]] auto connectLocked(const std::string& name, Deadline deadline) -> VoidResult;
    auto disconnectLocked(const std::string& name) -> bool;
    [[nodiscard]] auto storeLocked(const McpServerConfig& config) -> VoidResult;

    std::shared_ptr<ConfigStore> _store;
    ManagerOptions _options;
    ConnectionFactory _factory;

    std::mutex _lifecycleMutex;

    mutable std::shared_mutex _configMutex;
    McpServerMap _configs;

    mutable std::shared_mutex _connectionsMutex;
    std::map<std::string, std::shared_ptr<McpConnection>> _connections;
    uint64_t _generation = 0; ///< Bumped on every connect and disconnect.
};

} // namespace coderig
