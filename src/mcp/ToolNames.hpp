// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace coderig
{

/// @brief Prefix of every tool name exposed to the agent for an MCP tool.
constexpr auto ExternalToolPrefix = std::string_view { "mcp_" };

/// @brief Builds the agent-facing name `mcp_{server}_{tool}`.
[[nodiscard]] auto makeExternalToolName(std::string_view server, std::string_view tool) -> std::string;

/// @brief Returns true if the name carries the `mcp_` prefix.
[[nodiscard]] auto isExternalToolName(std::string_view name) -> bool;

/// @brief Splits `mcp_{server}_{tool}` back into server and tool.
///
/// Server and tool names may both contain underscores, so the split picks the
/// longest known server name whose `mcp_{server}_` prefix matches.
/// @param composite The agent-facing tool name.
/// @param servers The known server names.
/// @return (server, tool), or std::nullopt if no known server matches or the tool part is empty.
[[nodiscard]] auto splitExternalToolName(std::string_view composite, const std::vector<std::string>& servers)
    -> std::optional<std::pair<std::string, std::string>>;

} // namespace coderig
