// SPDX-License-Identifier: Apache-2.0
#include <mcp/ToolCatalog.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace coderig;

TEST_CASE("parseTool accepts a well-formed entry", "[catalog]")
{
    auto const tool = parseTool(nlohmann::json {
        { "name", "read" },
        { "description", "Read a file" },
        { "inputSchema", { { "type", "object" } } },
    });

    REQUIRE(tool.has_value());
    CHECK(tool->name == "read");
    CHECK(tool->description == "Read a file");
    CHECK(tool->inputSchema["type"] == "object");
}

TEST_CASE("parseTool rejects entries it cannot use as-is", "[catalog]")
{
    CHECK(!parseTool(nlohmann::json { { "name", "x" }, { "inputSchema", nullptr } }).has_value());
    CHECK(!parseTool(nlohmann::json { { "name", "x" }, { "inputSchema", "object" } }).has_value());
    CHECK(!parseTool(nlohmann::json { { "name", "x" } }).has_value());
    CHECK(!parseTool(nlohmann::json { { "name", 5 }, { "inputSchema", nlohmann::json::object() } }).has_value());
    CHECK(!parseTool(nlohmann::json::array()).has_value());
}

TEST_CASE("parseToolEntry falls back to the default schema", "[catalog]")
{
    auto const tool = parseToolEntry(nlohmann::json {
        { "name", "write" },
        { "description", "Write a file" },
        { "inputSchema", nullptr },
    });

    REQUIRE(tool.has_value());
    CHECK(tool->name == "write");
    CHECK(tool->description == "Write a file");
    CHECK(tool->inputSchema == defaultInputSchema());
}

TEST_CASE("parseToolEntry drops entries without a name", "[catalog]")
{
    CHECK(!parseToolEntry(nlohmann::json { { "description", "anonymous" } }).has_value());
    CHECK(!parseToolEntry(nlohmann::json { { "name", "" } }).has_value());
    CHECK(!parseToolEntry(nlohmann::json("read")).has_value());
}

TEST_CASE("defaultInputSchema is an empty object schema", "[catalog]")
{
    auto const schema = defaultInputSchema();
    CHECK(schema["type"] == "object");
    CHECK(schema["properties"] == nlohmann::json::object());
    CHECK(schema["required"] == nlohmann::json::array());
}

TEST_CASE("parseToolList requires an array", "[catalog]")
{
    auto const result = parseToolList(nlohmann::json { { "name", "read" } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);

    auto const empty = parseToolList(nlohmann::json::array());
    REQUIRE(empty.has_value());
    CHECK(empty->empty());
}

TEST_CASE("ToolCatalog bumps its version on every replace", "[catalog]")
{
    auto catalog = ToolCatalog {};
    CHECK(catalog.version() == 0);
    CHECK(catalog.size() == 0);

    catalog.replace({ McpTool { .name = "a", .inputSchema = defaultInputSchema() } });
    CHECK(catalog.version() == 1);
    CHECK(catalog.size() == 1);

    // Identical content still counts as a reload.
    catalog.replace(catalog.tools());
    CHECK(catalog.version() == 2);

    catalog.replace({});
    CHECK(catalog.version() == 3);
    CHECK(catalog.tools().empty());
}
