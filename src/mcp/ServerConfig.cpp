// SPDX-License-Identifier: Apache-2.0
#include "ServerConfig.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace coderig
{

auto validateServerConfig(const McpServerConfig& config) -> VoidResult
{
    if (config.name.empty())
        return makeError(ErrorCode::InvalidArgument, "MCP server name must not be empty");

    if (config.isStdio() && config.isWebSocket())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("MCP server '{}' sets both a command and a url", config.name));

    if (!config.isStdio() && !config.isWebSocket())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("MCP server '{}' needs either a command or a url", config.name));

    if (config.isWebSocket() && !config.url.starts_with("ws://") && !config.url.starts_with("wss://"))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("MCP server '{}' url must use ws:// or wss://: {}", config.name, config.url));

    return {};
}

auto serverConfigFromJson(const std::string& name, const nlohmann::json& value) -> McpServerConfig
{
    return McpServerConfig {
        .name = name,
        .command = json::getStringOr(value, "command", ""),
        .args = json::getStringArray(value, "args"),
        .env = json::getStringMap(value, "env"),
        .url = json::getStringOr(value, "url", ""),
        .enabled = json::getBoolOr(value, "enabled", true),
    };
}

auto serverConfigToJson(const McpServerConfig& config) -> nlohmann::json
{
    auto server = nlohmann::json::object();
    if (!config.command.empty())
        server["command"] = config.command;
    if (!config.args.empty())
        server["args"] = config.args;
    if (!config.env.empty())
        server["env"] = config.env;
    if (!config.url.empty())
        server["url"] = config.url;
    server["enabled"] = config.enabled;
    return server;
}

auto serverMapFromJson(const nlohmann::json& section) -> McpServerMap
{
    auto servers = McpServerMap {};
    if (!section.is_object())
        return servers;
    for (const auto& [name, value]: section.items())
        servers[name] = serverConfigFromJson(name, value);
    return servers;
}

auto serverMapToJson(const McpServerMap& servers) -> nlohmann::json
{
    auto section = nlohmann::json::object();
    for (const auto& [name, config]: servers)
        section[name] = serverConfigToJson(config);
    return section;
}

MemoryConfigStore::MemoryConfigStore(McpServerMap servers): _servers(std::move(servers))
{
}

auto MemoryConfigStore::load() -> Result<McpServerMap>
{
    auto const lock = std::lock_guard { _mutex };
    return _servers;
}

auto MemoryConfigStore::save(const McpServerMap& servers) -> VoidResult
{
    auto const lock = std::lock_guard { _mutex };
    _servers = servers;
    ++_saveCount;
    return {};
}

auto MemoryConfigStore::saveCount() const -> size_t
{
    auto const lock = std::lock_guard { _mutex };
    return _saveCount;
}

} // namespace coderig
