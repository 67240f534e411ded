// SPDX-License-Identifier: Apache-2.0
#include "McpToolBridge.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ToolNames.hpp>

#include <format>

namespace coderig
{

namespace
{
    auto describeFailure(const std::string& server, const Error& error) -> std::string
    {
        switch (error.code)
        {
            case ErrorCode::NotConnected:
                return std::format("Error: {}. The MCP server '{}' must be reconnected before its tools can be used.",
                                   error.message,
                                   server);
            case ErrorCode::TimeoutError:
                return std::format("Error: {}. The server may be busy; try again or use a different tool.",
                                   error.message);
            case ErrorCode::RemoteError:
                return std::format("Error: {}. Check the arguments against the tool's input schema.", error.message);
            case ErrorCode::TransportError:
                return std::format("Error: {}. The MCP server '{}' is no longer reachable.", error.message, server);
            default:
                return std::format("Error: {}", error.message);
        }
    }
} // namespace

McpToolBridge::McpToolBridge(ServerManager& servers): _servers(servers)
{
}

auto McpToolBridge::refresh() -> bool
{
    auto const version = _servers.toolsVersion();
    if (_seenVersion == version)
        return false;

    auto definitions = std::vector<ToolDefinition> {};
    for (auto& [server, tool]: _servers.allTools())
    {
        auto const description = tool.description.value_or(std::format("MCP tool from server: {}", server));
        definitions.push_back(ToolDefinition {
            .name = makeExternalToolName(server, tool.name),
            .description = std::format("{} (MCP: {})", description, server),
            .inputSchema = std::move(tool.inputSchema),
        });
    }

    log::debug("MCP tool definitions rebuilt: {} tool(s), version {}", definitions.size(), version);
    _definitions = std::move(definitions);
    _seenVersion = version;
    return true;
}

void McpToolBridge::forceRefresh()
{
    _seenVersion.reset();
    refresh();
}

auto McpToolBridge::definitions() const -> const std::vector<ToolDefinition>&
{
    return _definitions;
}

auto McpToolBridge::handles(std::string_view toolName) const -> bool
{
    return isExternalToolName(toolName);
}

auto McpToolBridge::execute(const ToolCall& call) -> ToolResult
{
    log::info("Executing tool: {} (id: {})", call.name, call.id);

    auto const target = splitExternalToolName(call.name, _servers.connectedServers());
    if (!target)
    {
        log::warning("No connected MCP server provides tool '{}'", call.name);
        return ToolResult {
            .callId = call.id,
            .content = std::format("Error: Unknown MCP tool '{}'. Its server may have been disconnected.", call.name),
            .isError = true,
        };
    }

    auto const& [server, tool] = *target;
    auto const arguments = call.arguments.is_null() ? nlohmann::json::object() : call.arguments;

    auto result = _servers.callTool(server, tool, arguments);
    if (!result)
    {
        log::error("Tool call failed: {}", result.error());
        return ToolResult {
            .callId = call.id,
            .content = describeFailure(server, result.error()),
            .isError = true,
        };
    }

    return ToolResult {
        .callId = call.id,
        .content = json::dumpSafe(*result, 2),
        .isError = json::getBoolOr(*result, "isError", false),
    };
}

auto McpToolBridge::executeAll(const std::vector<ToolCall>& calls) -> std::vector<ToolResult>
{
    auto results = std::vector<ToolResult> {};
    results.reserve(calls.size());
    for (const auto& call: calls)
        results.push_back(execute(call));
    return results;
}

} // namespace coderig
