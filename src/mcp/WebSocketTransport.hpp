// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace coderig
{

/// @brief Components of a ws:// or wss:// URL.
struct WebSocketUrl
{
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";
};

/// @brief Splits a WebSocket URL into its components.
///
/// Accepts `ws://host[:port][/path][?query]` and `wss://...`; the port defaults
/// to 80 and 443 respectively.
/// @param url The URL to parse.
/// @return The parsed URL or an InvalidArgument error.
[[nodiscard]] auto parseWebSocketUrl(std::string_view url) -> Result<WebSocketUrl>;

/// @brief Configuration for opening a WebSocket transport.
struct WebSocketTransportConfig
{
    std::string url;

    /// @brief Extra HTTP headers for the upgrade request (e.g. Authorization).
    std::map<std::string, std::string> headers;

    /// @brief Upper bound for resolve + connect + handshake; zero means no bound.
    std::chrono::milliseconds connectTimeout { 0 };
};

/// @brief Transport that communicates with an MCP server over a WebSocket.
///
/// Each JSON-RPC message travels in one text frame. The socket is driven by a
/// private I/O thread; send() and receive() hand work to it and block.
class WebSocketTransport: public Transport
{
  public:
    WebSocketTransport();
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    /// @brief Connects and performs the WebSocket upgrade handshake.
    /// @param config The connection configuration.
    /// @return Success or an error.
    [[nodiscard]] auto open(const WebSocketTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace coderig
