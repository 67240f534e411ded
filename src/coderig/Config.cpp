// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace coderig
{

namespace
{
    constexpr auto KnownSections = std::array<std::string_view, 3> { "mcpServers", "mcp", "log" };

    auto readJsonFile(std::string_view path) -> Result<nlohmann::json>
    {
        auto file = std::ifstream(std::string(path));
        if (!file.is_open())
            return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

        auto ss = std::stringstream {};
        ss << file.rdbuf();

        auto parsed = json::parse(ss.str());
        if (!parsed)
            return makeError(ErrorCode::ConfigError, std::format("Invalid config file {}: {}", path, parsed.error().message));
        if (!parsed->is_object())
            return makeError(ErrorCode::ConfigError, std::format("Config file {} must contain a JSON object", path));
        return parsed;
    }

    // Timeouts must be a positive number of milliseconds that fits an int.
    auto readTimeoutMs(const nlohmann::json& section, const char* key, int defaultValue, std::string_view path) -> int
    {
        auto const it = section.find(key);
        if (it == section.end())
            return defaultValue;

        constexpr auto Max = std::numeric_limits<int>::max();
        if (it->is_number_unsigned())
        {
            if (auto const value = it->get<uint64_t>(); value >= 1 && value <= static_cast<uint64_t>(Max))
                return static_cast<int>(value);
        }
        else if (it->is_number_integer())
        {
            if (auto const value = it->get<int64_t>(); value >= 1 && value <= Max)
                return static_cast<int>(value);
        }

        log::warning("Ignoring mcp.{} = {} in {}, using {} ms", key, json::dumpSafe(*it), path, defaultValue);
        return defaultValue;
    }

    auto writeJsonFile(std::string_view path, const nlohmann::json& root) -> VoidResult
    {
        auto const dir = std::filesystem::path(path).parent_path();
        if (!dir.empty())
        {
            auto ec = std::error_code {};
            std::filesystem::create_directories(dir, ec);
            if (ec)
                return makeError(
                    ErrorCode::ConfigError,
                    std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
        }

        auto file = std::ofstream(std::string(path));
        if (!file.is_open())
            return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

        file << json::dumpSafe(root, 4) << '\n';
        if (!file)
            return makeError(ErrorCode::ConfigError, std::format("Failed to write config file: {}", path));
        return {};
    }
} // namespace

auto toManagerOptions(const McpSettings& settings) -> ManagerOptions
{
    return ManagerOptions {
        .connection = {
            .listToolsTimeout = std::chrono::milliseconds(settings.listToolsTimeoutMs),
            .callTimeout = std::chrono::milliseconds(settings.callTimeoutMs),
        },
        .connectTimeout = std::chrono::milliseconds(settings.connectTimeoutMs),
    };
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/coderig";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/coderig";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto parseResult = readJsonFile(path);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    auto config = AppConfig {};

    // MCP servers section
    if (root.contains("mcpServers"))
        config.mcpServers = serverMapFromJson(root["mcpServers"]);

    // MCP timeouts section
    if (root.contains("mcp"))
    {
        auto const& mcp = root["mcp"];
        auto const defaults = McpSettings {};
        config.mcp.listToolsTimeoutMs = readTimeoutMs(mcp, "listToolsTimeoutMs", defaults.listToolsTimeoutMs, path);
        config.mcp.callTimeoutMs = readTimeoutMs(mcp, "callTimeoutMs", defaults.callTimeoutMs, path);
        config.mcp.connectTimeoutMs = readTimeoutMs(mcp, "connectTimeoutMs", defaults.connectTimeoutMs, path);
    }

    // Log section
    if (root.contains("log"))
    {
        auto const levelName = json::getStringOr(root["log"], "level", "info");
        if (auto const level = log::levelFromString(levelName))
            config.log.level = *level;
        else
            log::warning("Unknown log level '{}' in {}, using info", levelName, path);
    }

    for (const auto& [key, value]: root.items())
    {
        if (std::ranges::find(KnownSections, key) == KnownSections.end())
            config.extra[key] = value;
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = config.extra.is_object() ? config.extra : nlohmann::json::object();

    root["mcpServers"] = serverMapToJson(config.mcpServers);

    root["mcp"] = nlohmann::json {
        { "listToolsTimeoutMs", config.mcp.listToolsTimeoutMs },
        { "callTimeoutMs", config.mcp.callTimeoutMs },
        { "connectTimeoutMs", config.mcp.connectTimeoutMs },
    };

    root["log"] = nlohmann::json { { "level", std::string(log::levelToString(config.log.level)) } };

    return writeJsonFile(path, root);
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

FileConfigStore::FileConfigStore(std::string path): _path(std::move(path))
{
}

auto FileConfigStore::load() -> Result<McpServerMap>
{
    if (!std::filesystem::exists(_path))
        return McpServerMap {};

    return readJsonFile(_path).transform(
        [](const nlohmann::json& root) { return serverMapFromJson(root.value("mcpServers", nlohmann::json {})); });
}

auto FileConfigStore::save(const McpServerMap& servers) -> VoidResult
{
    auto root = nlohmann::json::object();
    if (std::filesystem::exists(_path))
    {
        // An unparsable file is left untouched.
        auto existing = readJsonFile(_path);
        if (!existing)
            return std::unexpected(existing.error());
        root = std::move(*existing);
    }

    root["mcpServers"] = serverMapToJson(servers);
    return writeJsonFile(_path, root);
}

} // namespace coderig
