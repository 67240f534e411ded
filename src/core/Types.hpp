// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace coderig
{

/// @brief Represents a tool call request from the LLM.
struct ToolCall
{
    std::string id;
    std::string name;
    nlohmann::json arguments;
};

/// @brief Represents the result of executing a tool call.
struct ToolResult
{
    std::string callId;
    std::string content;
    bool isError = false;
};

/// @brief Defines a tool that the LLM can invoke.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

} // namespace coderig
