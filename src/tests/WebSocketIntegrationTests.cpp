// SPDX-License-Identifier: Apache-2.0
#include <mcp/McpConnection.hpp>
#include <mcp/ServerManager.hpp>

#include <catch2/catch_test_macros.hpp>

#include "LoopbackWebSocketServer.hpp"

#include <atomic>
#include <thread>

using namespace coderig;
using namespace std::chrono_literals;
using coderig::test::LoopbackWebSocketServer;
using coderig::test::mcpServerResponder;
using coderig::test::SilentListener;

namespace
{
    auto remoteTools() -> nlohmann::json
    {
        return nlohmann::json::array({
            { { "name", "search" },
              { "description", "Search the index" },
              { "inputSchema", { { "type", "object" }, { "properties", { { "query", { { "type", "string" } } } } } } } },
            { { "name", "fetch" } },
        });
    }

    auto makeManager(std::string url, ManagerOptions options = {}) -> std::unique_ptr<ServerManager>
    {
        auto store = std::make_shared<MemoryConfigStore>(McpServerMap {
            { "remote", McpServerConfig { .name = "remote", .url = std::move(url) } },
        });
        auto manager = std::make_unique<ServerManager>(store, options);
        REQUIRE(manager->loadConfigs().has_value());
        return manager;
    }
} // namespace

TEST_CASE("A WebSocket MCP server can be connected through the server manager", "[integration][websocket]")
{
    auto server = LoopbackWebSocketServer(mcpServerResponder(remoteTools(), "remote-index"));
    auto manager = makeManager(server.url());

    REQUIRE(manager->connectServer("remote").has_value());
    CHECK(manager->isConnected("remote"));

    auto const tools = manager->allTools();
    REQUIRE(tools.size() == 2);
    for (const auto& entry: tools)
        CHECK(entry.server == "remote");

    auto const result = manager->callTool("remote", "search", { { "query", "mcp" } });
    REQUIRE(result.has_value());
    CHECK((*result)["content"][0]["text"] == "search");
    CHECK((*result)["arguments"]["query"] == "mcp");
    CHECK(manager->ping("remote").has_value());

    REQUIRE(manager->disconnectServer("remote").has_value());
    CHECK(manager->callTool("remote", "search", {}).error().code == ErrorCode::NotConnected);
    server.join();
}

TEST_CASE("connectWebSocket turns the deadline into a connect timeout", "[integration][websocket]")
{
    auto const listener = SilentListener {};
    auto connection = McpConnection("silent");

    auto const started = std::chrono::steady_clock::now();
    auto const connected =
        connection.connectWebSocket(WebSocketTransportConfig { .url = listener.url() }, started + 300ms);
    auto const elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(!connected.has_value());
    CHECK(connected.error().code == ErrorCode::TimeoutError);
    CHECK(elapsed < 2s);
    CHECK(connection.state() == ConnectionState::Disconnected);
}

TEST_CASE("connectAllEnabled bounds an unresponsive WebSocket server", "[integration][websocket]")
{
    auto const listener = SilentListener {};
    auto options = ManagerOptions {};
    options.connectTimeout = 300ms;
    auto manager = makeManager(listener.url(), options);

    auto const started = std::chrono::steady_clock::now();
    auto const summary = manager->connectAllEnabled();

    CHECK(std::chrono::steady_clock::now() - started < 2s);
    CHECK(summary.succeeded.empty());
    REQUIRE(summary.failed.size() == 1);
    CHECK(summary.failed[0].first == "remote");
    CHECK(summary.failed[0].second.code == ErrorCode::TimeoutError);
}

TEST_CASE("Disconnecting a WebSocket server while calls are in flight", "[integration][websocket][concurrency]")
{
    auto server = LoopbackWebSocketServer(mcpServerResponder(remoteTools()));
    auto manager = makeManager(server.url());
    REQUIRE(manager->connectServer("remote").has_value());

    auto succeeded = std::atomic<int> { 0 };
    auto lastCode = std::atomic<ErrorCode> { ErrorCode::Unknown };
    auto caller = std::thread([&] {
        while (true)
        {
            auto const result = manager->callTool("remote", "fetch", {});
            if (!result)
            {
                lastCode = result.error().code;
                return;
            }
            ++succeeded;
        }
    });

    std::this_thread::sleep_for(100ms);
    REQUIRE(manager->disconnectServer("remote").has_value());
    caller.join();

    CHECK(succeeded > 0);
    CHECK((lastCode == ErrorCode::NotConnected || lastCode == ErrorCode::TransportError));
    server.join();
}
