// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace coderig::jsonrpc
{

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Standard JSON-RPC 2.0 error codes used by the client.
namespace errc
{
    constexpr auto MethodNotFound = -32601;
} // namespace errc

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;
};

/// @brief A message received from the peer, classified by shape.
struct IncomingMessage
{
    enum class Kind
    {
        Response,     ///< Has an id and a result or error.
        Notification, ///< Has no id.
        Request,      ///< Has an id and a method (server-initiated request).
    };

    Kind kind = Kind::Notification;
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
    Response response;
};

/// @name MCP methods
/// One struct per method; toJson() turns each into its wire form.
/// @{

struct ClientInfo
{
    std::string name;
    std::string version;
};

struct Initialize
{
    std::string protocolVersion;
    bool listChanged = true;
    ClientInfo clientInfo;
};

struct Initialized
{
};

struct ListTools
{
};

struct CallTool
{
    std::string name;
    nlohmann::json arguments;
};

struct ListResources
{
    std::optional<std::string> cursor;
};

struct ReadResource
{
    std::string uri;
};

struct ListPrompts
{
    std::optional<std::string> cursor;
};

struct GetPrompt
{
    std::string name;
    nlohmann::json arguments;
};

struct Ping
{
};

/// @}

/// @brief All MCP methods the client can send.
using Method = std::variant<Initialize,
                            Initialized,
                            ListTools,
                            CallTool,
                            ListResources,
                            ReadResource,
                            ListPrompts,
                            GetPrompt,
                            Ping>;

/// @brief Returns the wire method name of a method variant.
[[nodiscard]] auto methodName(const Method& method) -> std::string_view;

/// @brief Returns the wire params of a method variant, or null if it carries none.
[[nodiscard]] auto methodParams(const Method& method) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 request message from a method variant.
[[nodiscard]] auto makeRequest(int64_t id, const Method& method) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message from a method variant.
[[nodiscard]] auto makeNotification(const Method& method) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 success response.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Classifies an incoming message as response, notification or request.
/// @param message The JSON message to classify.
/// @return The classified message or a ProtocolError if it fits no shape.
[[nodiscard]] auto parseIncoming(const nlohmann::json& message) -> Result<IncomingMessage>;

/// @brief Normalizes a request id to a map key.
///
/// Numeric ids and their decimal string form map to the same key, so a server
/// that echoes `"7"` for request 7 is still matched.
/// @return The key, or std::nullopt if the id is neither a string nor an integer.
[[nodiscard]] auto idKey(const nlohmann::json& id) -> std::optional<std::string>;

/// @brief Formats an RpcError for messages ("RPC error -32601: Method not found").
[[nodiscard]] auto describe(const RpcError& error) -> std::string;

} // namespace coderig::jsonrpc
