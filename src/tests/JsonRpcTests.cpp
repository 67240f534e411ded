// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace coderig;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest from a method variant carries its params", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(7,
                                        jsonrpc::CallTool {
                                            .name = "read",
                                            .arguments = { { "path", "/tmp/x" } },
                                        });

    CHECK(request["id"] == 7);
    CHECK(request["method"] == "tools/call");
    CHECK(request["params"]["name"] == "read");
    CHECK(request["params"]["arguments"]["path"] == "/tmp/x");
}

TEST_CASE("initialize params advertise list-changed capabilities", "[jsonrpc]")
{
    auto const params = jsonrpc::methodParams(jsonrpc::Initialize {
        .protocolVersion = "2024-11-05",
        .listChanged = true,
        .clientInfo = { .name = "coderig", .version = "0.1.0" },
    });

    CHECK(params["protocolVersion"] == "2024-11-05");
    CHECK(params["capabilities"]["tools"]["listChanged"] == true);
    CHECK(params["capabilities"]["resources"]["listChanged"] == true);
    CHECK(params["capabilities"]["prompts"]["listChanged"] == true);
    CHECK(params["clientInfo"]["name"] == "coderig");
}

TEST_CASE("methods without params produce no params member", "[jsonrpc]")
{
    CHECK(!jsonrpc::makeRequest(1, jsonrpc::ListTools {}).contains("params"));
    CHECK(!jsonrpc::makeRequest(2, jsonrpc::Ping {}).contains("params"));

    auto const initialized = jsonrpc::makeNotification(jsonrpc::Initialized {});
    CHECK(initialized["method"] == "notifications/initialized");
    CHECK(!initialized.contains("id"));
    CHECK(!initialized.contains("params"));
}

TEST_CASE("list methods send the cursor only when set", "[jsonrpc]")
{
    CHECK(jsonrpc::methodParams(jsonrpc::ListResources {}) == nlohmann::json::object());
    CHECK(jsonrpc::methodParams(jsonrpc::ListPrompts { .cursor = "page-2" })["cursor"] == "page-2");
    CHECK(jsonrpc::methodName(jsonrpc::ReadResource { .uri = "file:///a" }) == "resources/read");
    CHECK(jsonrpc::methodName(jsonrpc::GetPrompt {}) == "prompts/get");
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    REQUIRE(result->result.has_value());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error",
          {
              { "code", -32600 },
              { "message", "Invalid Request" },
          } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->result.has_value());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
    CHECK(jsonrpc::describe(*result->error) == "RPC error -32600: Invalid Request");
}

TEST_CASE("parseResponse rejects malformed messages", "[jsonrpc]")
{
    SECTION("wrong protocol version")
    {
        auto result = jsonrpc::parseResponse(nlohmann::json { { "version", "1.0" } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }

    SECTION("neither result nor error")
    {
        auto result = jsonrpc::parseResponse(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }

    SECTION("error member that is not an object")
    {
        auto result = jsonrpc::parseResponse(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 }, { "error", "boom" } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }

    SECTION("not an object")
    {
        CHECK(!jsonrpc::parseResponse(nlohmann::json::array()).has_value());
    }
}

TEST_CASE("parseIncoming classifies messages by shape", "[jsonrpc]")
{
    using Kind = jsonrpc::IncomingMessage::Kind;

    auto const response = jsonrpc::parseIncoming(jsonrpc::makeResult(3, { { "ok", true } }));
    REQUIRE(response.has_value());
    CHECK(response->kind == Kind::Response);
    CHECK(response->id == 3);

    auto const notification = jsonrpc::parseIncoming(
        jsonrpc::makeNotification("notifications/tools/list_changed", nlohmann::json::object()));
    REQUIRE(notification.has_value());
    CHECK(notification->kind == Kind::Notification);
    CHECK(notification->method == "notifications/tools/list_changed");

    auto const request = jsonrpc::parseIncoming(jsonrpc::makeRequest(9, "ping"));
    REQUIRE(request.has_value());
    CHECK(request->kind == Kind::Request);
    CHECK(request->method == "ping");
    CHECK(request->id == 9);
}

TEST_CASE("parseIncoming treats an id-less result as a notification", "[jsonrpc]")
{
    auto const pushed = jsonrpc::parseIncoming(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "result", { { "tools", nlohmann::json::array() } } },
    });

    REQUIRE(pushed.has_value());
    CHECK(pushed->kind == jsonrpc::IncomingMessage::Kind::Notification);
    REQUIRE(pushed->response.result.has_value());
    CHECK(pushed->response.result->contains("tools"));
}

TEST_CASE("idKey matches numeric ids with their string form", "[jsonrpc]")
{
    CHECK(jsonrpc::idKey(nlohmann::json(42)) == jsonrpc::idKey(nlohmann::json("42")));
    CHECK(jsonrpc::idKey(nlohmann::json(42)) != jsonrpc::idKey(nlohmann::json(43)));
    CHECK(!jsonrpc::idKey(nlohmann::json {}).has_value());
    CHECK(!jsonrpc::idKey(nlohmann::json(1.5)).has_value());
}

TEST_CASE("makeErrorResponse builds a JSON-RPC error", "[jsonrpc]")
{
    auto const reply = jsonrpc::makeErrorResponse(5, jsonrpc::errc::MethodNotFound, "Method not found: sampling");

    auto const parsed = jsonrpc::parseResponse(reply);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->error.has_value());
    CHECK(parsed->error->code == -32601);
    CHECK(parsed->id == 5);
}
