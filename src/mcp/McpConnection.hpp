// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/StdioTransport.hpp>
#include <mcp/ToolCatalog.hpp>
#include <mcp/Transport.hpp>
#include <mcp/WebSocketTransport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace coderig
{

/// @brief MCP protocol revision sent in `initialize`.
constexpr auto McpProtocolVersion = std::string_view { "2024-11-05" };

/// @brief Client identity sent in `initialize`.
constexpr auto McpClientName = std::string_view { "coderig" };
constexpr auto McpClientVersion = std::string_view { "0.1.0" };

/// @brief Lifecycle of a connection. There is no reconnecting state; a lost
/// connection goes back to Disconnected and must be replaced.
enum class ConnectionState
{
    Disconnected,
    Connecting,
    Initializing,
    Ready,
};

[[nodiscard]] auto connectionStateName(ConnectionState state) -> std::string_view;

/// @brief Absolute time by which an operation must finish; empty means unbounded.
using Deadline = std::optional<std::chrono::steady_clock::time_point>;

/// @brief Timeouts applied by a connection.
struct ConnectionOptions
{
    std::chrono::milliseconds listToolsTimeout { 10000 };
    std::chrono::milliseconds callTimeout { 30000 };
};

/// @brief Name and version reported by the server in its `initialize` result.
struct ServerInfo
{
    std::string name = "unknown";
    std::string version = "unknown";
};

/// @brief A resource listed by `resources/list`.
struct McpResource
{
    std::string uri;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

/// @brief A prompt listed by `prompts/list`.
struct McpPrompt
{
    std::string name;
    std::optional<std::string> description;
    nlohmann::json arguments; ///< Argument descriptors as sent by the server, or null.
};

/// @brief One live session with an MCP server.
///
/// Owns its transport, a background reader thread, the table of pending
/// requests and the tool catalog. Requests may be issued concurrently from any
/// number of threads; replies are routed by id and may arrive in any order.
/// A connection is single-use: once disconnected it cannot be connected again.
class McpConnection
{
  public:
    explicit McpConnection(std::string name, ConnectionOptions options = {});
    ~McpConnection();

    McpConnection(const McpConnection&) = delete;
    McpConnection& operator=(const McpConnection&) = delete;

    /// @brief Spawns the server process, then initializes the session.
    [[nodiscard]] auto connectStdio(const StdioTransportConfig& config, Deadline deadline = {}) -> VoidResult;

    /// @brief Opens a WebSocket to the server, then initializes the session.
    [[nodiscard]] auto connectWebSocket(const WebSocketTransportConfig& config, Deadline deadline = {})
        -> VoidResult;

    /// @brief Attaches an already open transport, starts the reader and initializes.
    ///
    /// On failure the transport is closed and the connection is Disconnected.
    [[nodiscard]] auto connect(std::unique_ptr<Transport> transport, Deadline deadline = {}) -> VoidResult;

    /// @brief Runs the `initialize` handshake, sends `notifications/initialized`
    /// and loads the tool list.
    [[nodiscard]] auto initialize(Deadline deadline = {}) -> VoidResult;

    /// @brief Fetches `tools/list` and replaces the catalog.
    ///
    /// A result without a `tools` member is logged and leaves the catalog as is.
    [[nodiscard]] auto loadTools(Deadline deadline = {}) -> VoidResult;

    /// @brief Invokes a tool and returns the raw `tools/call` result.
    ///
    /// A JSON-RPC error reply is reported as ErrorCode::RemoteError; no reply
    /// within the call timeout as ErrorCode::TimeoutError.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>;

    /// @brief Lists all resources, following `nextCursor` pagination.
    [[nodiscard]] auto listResources() -> Result<std::vector<McpResource>>;

    [[nodiscard]] auto readResource(std::string_view uri) -> Result<nlohmann::json>;

    /// @brief Lists all prompts, following `nextCursor` pagination.
    [[nodiscard]] auto listPrompts() -> Result<std::vector<McpPrompt>>;

    [[nodiscard]] auto getPrompt(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>;

    [[nodiscard]] auto ping() -> VoidResult;

    /// @brief Closes the transport, stops the reader and fails outstanding requests.
    ///
    /// Idempotent; also called by the destructor.
    void disconnect();

    [[nodiscard]] auto tools() const -> std::vector<McpTool>;
    [[nodiscard]] auto toolsVersion() const -> uint64_t;
    [[nodiscard]] auto toolCount() const -> size_t;
    [[nodiscard]] auto state() const -> ConnectionState;
    [[nodiscard]] auto serverInfo() const -> ServerInfo;
    [[nodiscard]] auto name() const -> const std::string&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace coderig
