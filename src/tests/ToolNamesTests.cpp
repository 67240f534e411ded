// SPDX-License-Identifier: Apache-2.0
#include <mcp/ToolNames.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace coderig;

TEST_CASE("Composite tool names keep underscores on both sides", "[toolnames]")
{
    auto const composite = makeExternalToolName("srv", "a_b_c");
    CHECK(composite == "mcp_srv_a_b_c");

    auto const split = splitExternalToolName(composite, { "srv" });
    REQUIRE(split.has_value());
    CHECK(split->first == "srv");
    CHECK(split->second == "a_b_c");
}

TEST_CASE("splitExternalToolName prefers the longest matching server", "[toolnames]")
{
    auto const servers = std::vector<std::string> { "git", "git_hub" };

    auto const split = splitExternalToolName("mcp_git_hub_create_issue", servers);
    REQUIRE(split.has_value());
    CHECK(split->first == "git_hub");
    CHECK(split->second == "create_issue");

    auto const shorter = splitExternalToolName("mcp_git_log", servers);
    REQUIRE(shorter.has_value());
    CHECK(shorter->first == "git");
    CHECK(shorter->second == "log");
}

TEST_CASE("splitExternalToolName rejects names it cannot resolve", "[toolnames]")
{
    auto const servers = std::vector<std::string> { "fs" };

    CHECK(!splitExternalToolName("read", servers).has_value());
    CHECK(!splitExternalToolName("mcp_other_read", servers).has_value());
    CHECK(!splitExternalToolName("mcp_fs_", servers).has_value());
    CHECK(!splitExternalToolName("mcp_fsread", servers).has_value());
    CHECK(!splitExternalToolName("mcp_fs_read", {}).has_value());
}

TEST_CASE("isExternalToolName checks the prefix", "[toolnames]")
{
    CHECK(isExternalToolName("mcp_fs_read"));
    CHECK(!isExternalToolName("bash"));
}
