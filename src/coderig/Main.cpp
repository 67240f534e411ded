// SPDX-License-Identifier: Apache-2.0
#include <agent/McpToolBridge.hpp>
#include <coderig/Config.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ServerManager.hpp>

#include <CLI/CLI.hpp>

#include <chrono>
#include <filesystem>
#include <format>
#include <map>
#include <memory>
#include <print>
#include <string>
#include <vector>

using namespace coderig;

namespace
{
    auto parseEnvAssignments(const std::vector<std::string>& assignments) -> Result<std::map<std::string, std::string>>
    {
        auto env = std::map<std::string, std::string> {};
        for (const auto& assignment: assignments)
        {
            auto const eq = assignment.find('=');
            if (eq == std::string::npos || eq == 0)
                return makeError(ErrorCode::InvalidArgument, std::format("Expected KEY=VALUE, got '{}'", assignment));
            env[assignment.substr(0, eq)] = assignment.substr(eq + 1);
        }
        return env;
    }

    auto describeTransport(const McpServerConfig& config) -> std::string
    {
        if (config.isWebSocket())
            return config.url;

        auto line = config.command;
        for (const auto& arg: config.args)
            line += " " + arg;
        return line;
    }

    // Connects either one server or every enabled one; returns false if nothing usable is connected.
    auto connectRequested(ServerManager& manager, const std::string& server, std::chrono::milliseconds timeout) -> bool
    {
        if (server.empty())
        {
            auto const summary = manager.connectAllEnabled();
            return !summary.succeeded.empty();
        }

        auto connected = manager.connectServer(server, std::chrono::steady_clock::now() + timeout);
        if (!connected)
        {
            log::error("Failed to connect MCP server '{}': {}", server, connected.error());
            return false;
        }
        return true;
    }

    auto report(const VoidResult& result) -> int
    {
        if (result)
            return 0;
        log::error("{}", result.error());
        return 1;
    }
} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "coderig-mcp - manage and exercise MCP servers" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    auto trace = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_flag("--trace", trace, "Log every JSON-RPC message");

    auto* list = app.add_subcommand("list", "List configured MCP servers");

    auto serverName = std::string {};
    auto url = std::string {};
    auto commandLine = std::vector<std::string> {};
    auto envAssignments = std::vector<std::string> {};
    auto disabled = false;
    auto* add = app.add_subcommand("add", "Add an MCP server");
    add->add_option("name", serverName, "Server name")->required();
    add->add_option("--url", url, "WebSocket URL (ws:// or wss://)");
    add->add_option("-e,--env", envAssignments, "Environment variable KEY=VALUE for the server process");
    add->add_flag("--disabled", disabled, "Store the server without enabling it");
    add->add_option("command", commandLine, "Command and arguments (after --)");

    auto* remove = app.add_subcommand("remove", "Remove an MCP server");
    remove->add_option("name", serverName, "Server name")->required();

    auto* enable = app.add_subcommand("enable", "Enable an MCP server");
    enable->add_option("name", serverName, "Server name")->required();

    auto* disable = app.add_subcommand("disable", "Disable an MCP server");
    disable->add_option("name", serverName, "Server name")->required();

    auto* connect = app.add_subcommand("connect", "Connect to one server, or to every enabled server");
    connect->add_option("name", serverName, "Server name");

    auto* tools = app.add_subcommand("tools", "List the tools offered to the agent");
    tools->add_option("name", serverName, "Only connect this server");

    auto toolName = std::string {};
    auto toolArgs = std::string { "{}" };
    auto* call = app.add_subcommand("call", "Call a tool by its agent-facing name (mcp_<server>_<tool>)");
    call->add_option("tool", toolName, "Tool name")->required();
    call->add_option("arguments", toolArgs, "Arguments as a JSON object");

    auto* resources = app.add_subcommand("resources", "List the resources of a server");
    resources->add_option("name", serverName, "Server name")->required();

    auto* prompts = app.add_subcommand("prompts", "List the prompts of a server");
    prompts->add_option("name", serverName, "Server name")->required();

    CLI11_PARSE(app, argc, argv);

    if (configPath.empty())
        configPath = defaultConfigPath();

    auto configResult = std::filesystem::exists(configPath) ? loadConfigFromFile(configPath) : Result<AppConfig> {};
    if (!configResult)
    {
        log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    log::setLevel(configResult->log.level);
    if (verbose)
        log::setLevel(log::Level::Debug);
    if (trace)
        log::setLevel(log::Level::Trace);

    auto const options = toManagerOptions(configResult->mcp);
    auto manager = ServerManager(std::make_shared<FileConfigStore>(configPath), options);
    if (auto loaded = manager.loadConfigs(); !loaded)
    {
        log::error("Failed to load MCP servers: {}", loaded.error().message);
        return 1;
    }

    if (*list)
    {
        auto const servers = manager.listServers();
        if (servers.empty())
            std::println("No MCP servers configured in {}", configPath);
        for (const auto& server: servers)
        {
            std::println("{:<20} {:<9} {}",
                         server.name,
                         server.config.enabled ? "enabled" : "disabled",
                         describeTransport(server.config));
        }
        return 0;
    }

    if (*add)
    {
        auto env = parseEnvAssignments(envAssignments);
        if (!env)
            return report(std::unexpected(env.error()));

        auto config = McpServerConfig { .name = serverName, .env = std::move(*env), .url = url, .enabled = !disabled };
        if (!commandLine.empty())
        {
            config.command = commandLine.front();
            config.args.assign(commandLine.begin() + 1, commandLine.end());
        }
        return report(manager.addServer(config));
    }

    if (*remove)
        return report(manager.removeServer(serverName));

    if (*enable)
        return report(manager.setServerEnabled(serverName, true));

    if (*disable)
        return report(manager.setServerEnabled(serverName, false));

    if (*connect)
    {
        if (!connectRequested(manager, serverName, options.connectTimeout))
            return 1;
        for (const auto& server: manager.listServers())
        {
            if (server.connected)
                std::println("{:<20} {} tool(s)", server.name, server.toolCount);
        }
        return 0;
    }

    if (*tools)
    {
        if (!connectRequested(manager, serverName, options.connectTimeout))
            return 1;
        auto bridge = McpToolBridge(manager);
        bridge.refresh();
        for (const auto& definition: bridge.definitions())
            std::println("{}\n    {}", definition.name, definition.description);
        return 0;
    }

    if (*call)
    {
        auto arguments = json::parse(toolArgs);
        if (!arguments || !arguments->is_object())
        {
            log::error("Tool arguments must be a JSON object: {}", toolArgs);
            return 1;
        }

        auto bridge = McpToolBridge(manager);
        if (!bridge.handles(toolName))
        {
            log::error("'{}' is not an MCP tool name; expected mcp_<server>_<tool>", toolName);
            return 1;
        }
        if (!connectRequested(manager, {}, options.connectTimeout))
            return 1;

        bridge.refresh();
        auto const result = bridge.execute(ToolCall { .id = "cli", .name = toolName, .arguments = *arguments });
        std::println("{}", result.content);
        return result.isError ? 1 : 0;
    }

    if (*resources)
    {
        if (!connectRequested(manager, serverName, options.connectTimeout))
            return 1;
        auto const listed = manager.listResources(serverName);
        if (!listed)
            return report(std::unexpected(listed.error()));
        for (const auto& resource: *listed)
            std::println("{:<40} {}", resource.uri, resource.name.value_or(""));
        return 0;
    }

    if (*prompts)
    {
        if (!connectRequested(manager, serverName, options.connectTimeout))
            return 1;
        auto const listed = manager.listPrompts(serverName);
        if (!listed)
            return report(std::unexpected(listed.error()));
        for (const auto& prompt: *listed)
            std::println("{:<30} {}", prompt.name, prompt.description.value_or(""));
        return 0;
    }

    return 0;
}
