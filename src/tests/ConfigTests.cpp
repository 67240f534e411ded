// SPDX-License-Identifier: Apache-2.0
#include <coderig/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace coderig;

namespace
{
    /// Removes the file on scope exit.
    struct TempFile
    {
        std::filesystem::path path;

        explicit TempFile(std::string_view name): path(std::filesystem::temp_directory_path() / name)
        {
            std::filesystem::remove(path);
        }

        ~TempFile() { std::filesystem::remove(path); }

        void write(std::string_view text) const
        {
            auto file = std::ofstream(path);
            file << text;
        }

        [[nodiscard]] auto read() const -> nlohmann::json
        {
            auto file = std::ifstream(path);
            auto ss = std::stringstream {};
            ss << file.rdbuf();
            return nlohmann::json::parse(ss.str());
        }
    };
} // namespace

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    REQUIRE(!defaultConfigDir().empty());
    REQUIRE(defaultConfigPath().ends_with("config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.mcpServers.empty());
    CHECK(config.mcp.listToolsTimeoutMs == 10000);
    CHECK(config.mcp.callTimeoutMs == 30000);
    CHECK(config.mcp.connectTimeoutMs == 10000);
    CHECK(config.log.level == log::Level::Info);

    auto const options = toManagerOptions(config.mcp);
    CHECK(options.connection.listToolsTimeout == std::chrono::milliseconds(10000));
    CHECK(options.connection.callTimeout == std::chrono::milliseconds(30000));
    CHECK(options.connectTimeout == std::chrono::milliseconds(10000));
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const temp = TempFile("coderig_test_config.json");
    temp.write(R"({
        "mcpServers": {
            "fs": {
                "command": "npx",
                "args": ["-y", "@modelcontextprotocol/server-filesystem", "/tmp"],
                "env": {"KEY": "value"}
            },
            "remote": {
                "url": "wss://example.com/mcp",
                "enabled": false
            }
        },
        "mcp": {
            "callTimeoutMs": 5000
        },
        "log": { "level": "debug" }
    })");

    auto result = loadConfigFromFile(temp.path.string());
    REQUIRE(result.has_value());
    auto const& config = *result;

    SECTION("stdio server")
    {
        REQUIRE(config.mcpServers.contains("fs"));
        auto const& server = config.mcpServers.at("fs");
        CHECK(server.name == "fs");
        CHECK(server.command == "npx");
        CHECK(server.args.size() == 3);
        CHECK(server.env.at("KEY") == "value");
        CHECK(server.enabled);
        CHECK(server.isStdio());
    }

    SECTION("WebSocket server")
    {
        auto const& server = config.mcpServers.at("remote");
        CHECK(server.isWebSocket());
        CHECK(server.url == "wss://example.com/mcp");
        CHECK(!server.enabled);
    }

    SECTION("timeouts and log level")
    {
        CHECK(config.mcp.callTimeoutMs == 5000);
        CHECK(config.mcp.listToolsTimeoutMs == 10000);
        CHECK(config.log.level == log::Level::Debug);
    }
}

TEST_CASE("loadConfigFromFile keeps an unknown log level at info", "[config]")
{
    auto const temp = TempFile("coderig_test_log_level.json");
    temp.write(R"({ "log": { "level": "chatty" } })");

    auto result = loadConfigFromFile(temp.path.string());
    REQUIRE(result.has_value());
    CHECK(result->log.level == log::Level::Info);
}

TEST_CASE("loadConfigFromFile falls back to defaults for out-of-range timeouts", "[config]")
{
    auto const temp = TempFile("coderig_test_timeouts.json");
    temp.write(R"({
        "mcp": {
            "listToolsTimeoutMs": 5000000000,
            "callTimeoutMs": 0,
            "connectTimeoutMs": -1
        }
    })");

    auto result = loadConfigFromFile(temp.path.string());
    REQUIRE(result.has_value());
    CHECK(result->mcp.listToolsTimeoutMs == 10000);
    CHECK(result->mcp.callTimeoutMs == 30000);
    CHECK(result->mcp.connectTimeoutMs == 10000);

    temp.write(R"({ "mcp": { "callTimeoutMs": 2147483647, "connectTimeoutMs": "fast" } })");
    result = loadConfigFromFile(temp.path.string());
    REQUIRE(result.has_value());
    CHECK(result->mcp.callTimeoutMs == 2147483647);
    CHECK(result->mcp.connectTimeoutMs == 10000);
}

TEST_CASE("loadConfigFromFile returns error for non-existent file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const temp = TempFile("coderig_test_invalid.json");
    temp.write("{ invalid json }}}");

    auto result = loadConfigFromFile(temp.path.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    temp.write("[1, 2, 3]");
    CHECK(!loadConfigFromFile(temp.path.string()).has_value());
}

TEST_CASE("saveConfigToFile round-trips and keeps foreign sections", "[config]")
{
    auto const temp = TempFile("coderig_test_save_config.json");
    temp.write(R"({ "theme": "dark", "mcpServers": {} })");

    auto config = loadConfigFromFile(temp.path.string());
    REQUIRE(config.has_value());
    CHECK(config->extra["theme"] == "dark");

    config->mcpServers["git"] = McpServerConfig { .name = "git", .command = "git-mcp", .args = { "--repo", "." } };
    config->mcp.connectTimeoutMs = 2500;
    config->log.level = log::Level::Trace;
    REQUIRE(saveConfigToFile(temp.path.string(), *config).has_value());

    auto const root = temp.read();
    CHECK(root["theme"] == "dark");
    CHECK(root["log"]["level"] == "trace");

    auto loaded = loadConfigFromFile(temp.path.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->mcpServers == config->mcpServers);
    CHECK(loaded->mcp.connectTimeoutMs == 2500);
    CHECK(loaded->log.level == log::Level::Trace);
}

TEST_CASE("saveConfigToFile creates missing directories", "[config]")
{
    auto const dir = std::filesystem::temp_directory_path() / "coderig_test_nested_dir";
    std::filesystem::remove_all(dir);
    auto const path = dir / "sub" / "config.json";

    REQUIRE(saveConfigToFile(path.string(), AppConfig {}).has_value());
    CHECK(std::filesystem::exists(path));

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileConfigStore treats a missing file as empty", "[config]")
{
    auto const temp = TempFile("coderig_test_store_missing.json");
    auto store = FileConfigStore(temp.path.string());

    auto servers = store.load();
    REQUIRE(servers.has_value());
    CHECK(servers->empty());
}

TEST_CASE("FileConfigStore rewrites only the mcpServers section", "[config]")
{
    auto const temp = TempFile("coderig_test_store.json");
    temp.write(R"({
        "theme": "dark",
        "log": { "level": "warning" },
        "mcpServers": { "old": { "command": "old-server" } }
    })");

    auto store = FileConfigStore(temp.path.string());
    auto servers = store.load();
    REQUIRE(servers.has_value());
    REQUIRE(servers->contains("old"));

    servers->erase("old");
    (*servers)["ws"] = McpServerConfig { .name = "ws", .url = "ws://localhost:9000/mcp" };
    REQUIRE(store.save(*servers).has_value());

    auto const root = temp.read();
    CHECK(root["theme"] == "dark");
    CHECK(root["log"]["level"] == "warning");
    CHECK(!root["mcpServers"].contains("old"));
    CHECK(root["mcpServers"]["ws"]["url"] == "ws://localhost:9000/mcp");
    CHECK(!root["mcpServers"]["ws"].contains("name"));

    auto reloaded = store.load();
    REQUIRE(reloaded.has_value());
    CHECK(*reloaded == *servers);
}

TEST_CASE("FileConfigStore refuses to overwrite an unparsable file", "[config]")
{
    auto const temp = TempFile("coderig_test_store_broken.json");
    temp.write("{ broken");

    auto store = FileConfigStore(temp.path.string());
    auto const saved = store.save(McpServerMap {});
    REQUIRE(!saved.has_value());
    CHECK(saved.error().code == ErrorCode::ConfigError);

    auto file = std::ifstream(temp.path);
    auto ss = std::stringstream {};
    ss << file.rdbuf();
    CHECK(ss.str() == "{ broken");
}
