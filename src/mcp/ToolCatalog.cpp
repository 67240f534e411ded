// SPDX-License-Identifier: Apache-2.0
#include "ToolCatalog.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <mutex>

namespace coderig
{

namespace
{
    auto findSchema(const nlohmann::json& entry) -> const nlohmann::json*
    {
        for (auto const* key: { "inputSchema", "input_schema" })
        {
            if (auto const it = entry.find(key); it != entry.end())
                return &*it;
        }
        return nullptr;
    }

    auto optionalDescription(const nlohmann::json& entry) -> std::optional<std::string>
    {
        if (auto const it = entry.find("description"); it != entry.end() && it->is_string())
            return it->get<std::string>();
        return std::nullopt;
    }
} // namespace

auto defaultInputSchema() -> nlohmann::json
{
    return nlohmann::json {
        { "type", "object" },
        { "properties", nlohmann::json::object() },
        { "required", nlohmann::json::array() },
    };
}

auto parseTool(const nlohmann::json& entry) -> Result<McpTool>
{
    if (!entry.is_object())
        return makeError(ErrorCode::ProtocolError, "Tool entry is not an object");

    auto name = json::getString(entry, "name");
    if (!name)
        return std::unexpected(name.error());

    auto const* schema = findSchema(entry);
    if (!schema)
        return makeError(ErrorCode::ProtocolError, std::format("Tool '{}' has no input schema", *name));
    if (!schema->is_object())
        return makeError(ErrorCode::ProtocolError,
                         std::format("Tool '{}' has a {} input schema", *name, schema->type_name()));

    return McpTool {
        .name = std::move(*name),
        .description = optionalDescription(entry),
        .inputSchema = *schema,
    };
}

auto parseToolEntry(const nlohmann::json& entry) -> std::optional<McpTool>
{
    auto strict = parseTool(entry);
    if (strict)
        return std::move(*strict);

    auto name = json::getStringOr(entry, "name", "");
    if (name.empty())
    {
        log::warning("Dropping MCP tool without a name: {}", json::dumpSafe(entry));
        return std::nullopt;
    }

    log::debug("Using default input schema for MCP tool '{}': {}", name, strict.error().message);
    return McpTool {
        .name = std::move(name),
        .description = optionalDescription(entry),
        .inputSchema = defaultInputSchema(),
    };
}

auto parseToolList(const nlohmann::json& tools) -> Result<std::vector<McpTool>>
{
    if (!tools.is_array())
        return makeError(ErrorCode::ProtocolError,
                         std::format("Expected 'tools' to be an array, got {}", tools.type_name()));

    auto parsed = std::vector<McpTool> {};
    parsed.reserve(tools.size());
    for (const auto& entry: tools)
    {
        if (auto tool = parseToolEntry(entry))
            parsed.push_back(std::move(*tool));
    }
    return parsed;
}

void ToolCatalog::replace(std::vector<McpTool> tools)
{
    auto const lock = std::unique_lock { _mutex };
    _tools = std::move(tools);
    ++_version; // unsigned, wraps
}

auto ToolCatalog::tools() const -> std::vector<McpTool>
{
    auto const lock = std::shared_lock { _mutex };
    return _tools;
}

auto ToolCatalog::version() const -> uint64_t
{
    auto const lock = std::shared_lock { _mutex };
    return _version;
}

auto ToolCatalog::size() const -> size_t
{
    auto const lock = std::shared_lock { _mutex };
    return _tools.size();
}

} // namespace coderig
