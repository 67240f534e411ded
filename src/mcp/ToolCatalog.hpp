// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace coderig
{

/// @brief A tool advertised by an MCP server.
struct McpTool
{
    std::string name;
    std::optional<std::string> description;

    /// @brief JSON Schema of the arguments. Never null once in a catalog.
    nlohmann::json inputSchema;
};

/// @brief The schema used when a server sends none or an unusable one.
[[nodiscard]] auto defaultInputSchema() -> nlohmann::json;

/// @brief Strictly parses one entry of a `tools/list` result.
///
/// Requires a string `name` and an object `inputSchema` (or `input_schema`).
/// @return The tool or a ProtocolError describing the first problem found.
[[nodiscard]] auto parseTool(const nlohmann::json& entry) -> Result<McpTool>;

/// @brief Parses one entry, falling back to name/description plus the default schema.
/// @return The tool, or std::nullopt if the entry has no usable name.
[[nodiscard]] auto parseToolEntry(const nlohmann::json& entry) -> std::optional<McpTool>;

/// @brief Parses the `tools` array of a `tools/list` result.
///
/// Malformed entries are repaired or dropped; only a non-array fails.
[[nodiscard]] auto parseToolList(const nlohmann::json& tools) -> Result<std::vector<McpTool>>;

/// @brief Tool list of one connection plus a version counter.
///
/// Written by the connection's reader thread and by load_tools(); read by
/// any thread. The version starts at 0 and changes on every replace().
class ToolCatalog
{
  public:
    /// @brief Replaces the tool list and bumps the version (wrapping).
    void replace(std::vector<McpTool> tools);

    /// @brief Returns a snapshot of the current tool list.
    [[nodiscard]] auto tools() const -> std::vector<McpTool>;

    [[nodiscard]] auto version() const -> uint64_t;
    [[nodiscard]] auto size() const -> size_t;

  private:
    mutable std::shared_mutex _mutex;
    std::vector<McpTool> _tools;
    uint64_t _version = 0;
};

} // namespace coderig
