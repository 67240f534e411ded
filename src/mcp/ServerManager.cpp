// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Log.hpp>

#include <format>

namespace coderig
{

namespace
{
    auto makeDefaultFactory(ConnectionOptions options) -> ConnectionFactory
    {
        return [options](const McpServerConfig& config,
                         Deadline deadline) -> Result<std::shared_ptr<McpConnection>> {
            auto connection = std::make_shared<McpConnection>(config.name, options);

            auto connected = config.isStdio()
                                 ? connection->connectStdio(
                                       StdioTransportConfig {
                                           .command = config.command,
                                           .args = config.args,
                                           .env = config.env,
                                       },
                                       deadline)
                                 : connection->connectWebSocket(WebSocketTransportConfig { .url = config.url }, deadline);
            if (!connected)
                return std::unexpected(connected.error());

            return connection;
        };
    }

    auto remediationHint(const McpServerConfig& config, const Error& error) -> std::string
    {
        switch (error.code)
        {
            case ErrorCode::TransportError:
                if (config.isStdio() && error.message.starts_with("Failed to spawn"))
                    return std::format("check that '{}' is installed and on PATH", config.command);
                if (config.isWebSocket())
                    return std::format("check that a server is listening at {}", config.url);
                return "the server exited during startup; run its command by hand to see why";
            case ErrorCode::TimeoutError:
                return "the server did not respond in time; check that it speaks MCP on this transport";
            case ErrorCode::ProtocolError:
                return "the server sent an invalid handshake or tool schema";
            case ErrorCode::RemoteError:
                return "the server rejected the initialize request";
            default:
                return {};
        }
    }
} // namespace

ServerManager::ServerManager(std::shared_ptr<ConfigStore> store, ManagerOptions options):
    ServerManager(std::move(store), options, makeDefaultFactory(options.connection))
{
}

ServerManager::ServerManager(std::shared_ptr<ConfigStore> store, ManagerOptions options, ConnectionFactory factory):
    _store(std::move(store)), _options(options), _factory(std::move(factory))
{
}

ServerManager::~ServerManager()
{
    disconnectAll();
}

auto ServerManager::loadConfigs() -> VoidResult
{
    auto loaded = _store->load();
    if (!loaded)
        return std::unexpected(loaded.error());

    std::erase_if(*loaded, [](const auto& entry) {
        auto valid = validateServerConfig(entry.second);
        if (!valid)
            log::warning("Ignoring invalid MCP server config: {}", valid.error().message);
        return !valid;
    });

    auto const lock = std::unique_lock { _configMutex };
    _configs = std::move(*loaded);
    log::debug("Loaded {} MCP server config(s)", _configs.size());
    return {};
}

auto ServerManager::addServer(const McpServerConfig& config) -> VoidResult
{
    if (auto valid = validateServerConfig(config); !valid)
        return valid;

    auto const lock = std::lock_guard { _lifecycleMutex };
    if (getServer(config.name))
        return makeError(ErrorCode::InvalidArgument, std::format("MCP server '{}' already exists", config.name));

    return storeLocked(config).transform([&] { log::info("Added MCP server '{}'", config.name); });
}

auto ServerManager::removeServer(const std::string& name) -> VoidResult
{
    auto const lock = std::lock_guard { _lifecycleMutex };
    if (!getServer(name))
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown MCP server '{}'", name));

    disconnectLocked(name);

    auto const configLock = std::unique_lock { _configMutex };
    auto updated = _configs;
    updated.erase(name);
    if (auto saved = _store->save(updated); !saved)
        return saved;
    _configs = std::move(updated);

    log::info("Removed MCP server '{}'", name);
    return {};
}

auto ServerManager::upsertServer(const McpServerConfig& config) -> VoidResult
{
    if (auto valid = validateServerConfig(config); !valid)
        return valid;

    auto const lock = std::lock_guard { _lifecycleMutex };
    disconnectLocked(config.name);

    if (auto stored = storeLocked(config); !stored)
        return stored;

    if (!config.enabled)
    {
        log::info("MCP server '{}' saved (disabled)", config.name);
        return {};
    }

    return connectLocked(config.name, {});
}

auto ServerManager::setServerEnabled(const std::string& name, bool enabled) -> VoidResult
{
    auto config = getServer(name);
    if (!config)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown MCP server '{}'", name));

    config->enabled = enabled;
    return upsertServer(*config);
}

auto ServerManager::getServer(const std::string& name) const -> std::optional<McpServerConfig>
{
    auto const lock = std::shared_lock { _configMutex };
    if (auto const it = _configs.find(name); it != _configs.end())
        return it->second;
    return std::nullopt;
}

auto ServerManager::listServers() const -> std::vector<ServerStatus>
{
    auto rows = std::vector<ServerStatus> {};
    {
        auto const lock = std::shared_lock { _configMutex };
        for (const auto& [name, config]: _configs)
            rows.push_back(ServerStatus { .name = name, .config = config });
    }

    auto const lock = std::shared_lock { _connectionsMutex };
    for (auto& row: rows)
    {
        if (auto const it = _connections.find(row.name); it != _connections.end())
        {
            row.connected = true;
            row.toolCount = it->second->toolCount();
        }
    }
    return rows;
}

auto ServerManager::connectServer(const std::string& name, Deadline deadline) -> VoidResult
{
    auto const lock = std::lock_guard { _lifecycleMutex };
    return connectLocked(name, deadline);
}

auto ServerManager::disconnectServer(const std::string& name) -> VoidResult
{
    auto const lock = std::lock_guard { _lifecycleMutex };
    if (disconnectLocked(name))
        return {};

    if (getServer(name))
    {
        log::debug("MCP server '{}' was not connected", name);
        return {};
    }

    return makeError(ErrorCode::NotConnected, std::format("MCP server '{}' is not connected", name));
}

auto ServerManager::reconnectServer(const std::string& name) -> VoidResult
{
    auto const lock = std::lock_guard { _lifecycleMutex };
    disconnectLocked(name);
    return connectLocked(name, {});
}

void ServerManager::disconnectAll()
{
    auto const lock = std::lock_guard { _lifecycleMutex };
    for (auto const& name: connectedServers())
        disconnectLocked(name);
}

auto ServerManager::connectAllEnabled() -> ConnectSummary
{
    auto configs = McpServerMap {};
    {
        auto const lock = std::shared_lock { _configMutex };
        configs = _configs;
    }

    auto summary = ConnectSummary {};
    for (const auto& [name, config]: configs)
    {
        if (!config.enabled)
        {
            summary.skipped.push_back(name);
            continue;
        }

        auto const deadline = std::chrono::steady_clock::now() + _options.connectTimeout;
        auto connected = connectServer(name, deadline);
        if (connected)
        {
            summary.succeeded.push_back(name);
            continue;
        }

        auto const hint = remediationHint(config, connected.error());
        if (hint.empty())
            log::error("Failed to connect MCP server '{}': {}", name, connected.error());
        else
            log::error("Failed to connect MCP server '{}': {} ({})", name, connected.error(), hint);
        summary.failed.emplace_back(name, connected.error());
    }

    log::info("MCP servers: {} connected, {} failed, {} disabled",
              summary.succeeded.size(),
              summary.failed.size(),
              summary.skipped.size());
    return summary;
}

auto ServerManager::isConnected(const std::string& name) const -> bool
{
    auto const lock = std::shared_lock { _connectionsMutex };
    return _connections.contains(name);
}

auto ServerManager::connectedServers() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    auto const lock = std::shared_lock { _connectionsMutex };
    for (const auto& [name, connection]: _connections)
        names.push_back(name);
    return names;
}

auto ServerManager::allTools() const -> std::vector<ServerTool>
{
    auto connections = std::vector<std::shared_ptr<McpConnection>> {};
    {
        auto const lock = std::shared_lock { _connectionsMutex };
        for (const auto& [name, connection]: _connections)
            connections.push_back(connection);
    }

    auto result = std::vector<ServerTool> {};
    for (const auto& connection: connections)
    {
        for (auto& tool: connection->tools())
            result.push_back(ServerTool { .server = connection->name(), .tool = std::move(tool) });
    }
    return result;
}

auto ServerManager::toolsVersion() const -> uint64_t
{
    auto const lock = std::shared_lock { _connectionsMutex };
    // Generation in the high half so a dropped connection cannot cancel out a bump.
    auto version = _generation << 32;
    for (const auto& [name, connection]: _connections)
        version += connection->toolsVersion(); // unsigned, wraps
    return version;
}

auto ServerManager::callTool(const std::string& server, std::string_view tool, const nlohmann::json& arguments)
    -> Result<nlohmann::json>
{
    return connection(server).and_then(
        [&](const std::shared_ptr<McpConnection>& live) { return live->callTool(tool, arguments); });
}

auto ServerManager::listResources(const std::string& server) -> Result<std::vector<McpResource>>
{
    return connection(server).and_then(
        [](const std::shared_ptr<McpConnection>& live) { return live->listResources(); });
}

auto ServerManager::readResource(const std::string& server, std::string_view uri) -> Result<nlohmann::json>
{
    return connection(server).and_then(
        [&](const std::shared_ptr<McpConnection>& live) { return live->readResource(uri); });
}

auto ServerManager::listPrompts(const std::string& server) -> Result<std::vector<McpPrompt>>
{
    return connection(server).and_then(
        [](const std::shared_ptr<McpConnection>& live) { return live->listPrompts(); });
}

auto ServerManager::getPrompt(const std::string& server, std::string_view name, const nlohmann::json& arguments)
    -> Result<nlohmann::json>
{
    return connection(server).and_then(
        [&](const std::shared_ptr<McpConnection>& live) { return live->getPrompt(name, arguments); });
}

auto ServerManager::ping(const std::string& server) -> VoidResult
{
    return connection(server).and_then([](const std::shared_ptr<McpConnection>& live) { return live->ping(); });
}

auto ServerManager::connection(const std::string& name) const -> Result<std::shared_ptr<McpConnection>>
{
    auto const lock = std::shared_lock { _connectionsMutex };
    auto const it = _connections.find(name);
    if (it == _connections.end())
        return makeError(ErrorCode::NotConnected, std::format("MCP server '{}' is not connected", name));
    return it->second;
}

auto ServerManager::connectLocked(const std::string& name, Deadline deadline) -> VoidResult
{
    auto const config = getServer(name);
    if (!config)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown MCP server '{}'", name));
    if (!config->enabled)
        return makeError(ErrorCode::InvalidArgument, std::format("MCP server '{}' is disabled", name));

    disconnectLocked(name);

    log::info("Connecting to MCP server '{}'", name);
    auto connected = _factory(*config, deadline);
    if (!connected)
        return std::unexpected(connected.error());

    auto const lock = std::unique_lock { _connectionsMutex };
    _connections[name] = std::move(*connected);
    ++_generation;
    return {};
}

auto ServerManager::disconnectLocked(const std::string& name) -> bool
{
    auto connection = std::shared_ptr<McpConnection> {};
    {
        auto const lock = std::unique_lock { _connectionsMutex };
        auto const it = _connections.find(name);
        if (it == _connections.end())
            return false;
        connection = std::move(it->second);
        _connections.erase(it);
        ++_generation;
    }

    // Callers still holding the connection see it fail fast from here on.
    connection->disconnect();
    return true;
}

auto ServerManager::storeLocked(const McpServerConfig& config) -> VoidResult
{
    auto const lock = std::unique_lock { _configMutex };
    auto updated = _configs;
    updated[config.name] = config;
    if (auto saved = _store->save(updated); !saved)
        return saved;
    _configs = std::move(updated);
    return {};
}

} // namespace coderig
