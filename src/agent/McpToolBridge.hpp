// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <mcp/ServerManager.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace coderig
{

/// @brief Exposes the tools of all connected MCP servers to the agent.
///
/// Tools are published as `mcp_{server}_{tool}`. The definitions are rebuilt
/// only when the manager's tools version changes, so polling refresh() before
/// every model turn is cheap.
class McpToolBridge
{
  public:
    explicit McpToolBridge(ServerManager& servers);

    /// @brief Rebuilds the tool definitions if the tools version changed.
    /// @return true if the definitions were rebuilt.
    auto refresh() -> bool;

    /// @brief Forgets the seen version and rebuilds.
    void forceRefresh();

    /// @brief Returns the definitions built by the last refresh.
    [[nodiscard]] auto definitions() const -> const std::vector<ToolDefinition>&;

    /// @brief Returns true if the name belongs to an MCP tool.
    [[nodiscard]] auto handles(std::string_view toolName) const -> bool;

    /// @brief Executes one tool call.
    ///
    /// Never fails: errors are returned as a ToolResult with isError set and
    /// a hint the model can act on.
    [[nodiscard]] auto execute(const ToolCall& call) -> ToolResult;

    /// @brief Executes tool calls in order.
    [[nodiscard]] auto executeAll(const std::vector<ToolCall>& calls) -> std::vector<ToolResult>;

  private:
    ServerManager& _servers;
    std::optional<uint64_t> _seenVersion;
    std::vector<ToolDefinition> _definitions;
};

} // namespace coderig
