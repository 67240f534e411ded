// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "ScriptedTransport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <format>
#include <string>
#include <string_view>
#include <thread>

namespace coderig::test
{

/// @brief Accepts a single WebSocket client on a loopback port and answers
/// every text frame through a responder, one frame per reply.
///
/// With mcpServerResponder() this is a minimal MCP server; with echoResponder()
/// it sends each message straight back.
class LoopbackWebSocketServer
{
  public:
    explicit LoopbackWebSocketServer(ScriptedTransport::Responder responder):
        _responder(std::move(responder)),
        _acceptor(_ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)),
        _url(std::format("ws://127.0.0.1:{}/mcp", _acceptor.local_endpoint().port()))
    {
        _thread = std::thread([this] { serve(); });
    }

    ~LoopbackWebSocketServer() { join(); }

    LoopbackWebSocketServer(const LoopbackWebSocketServer&) = delete;
    LoopbackWebSocketServer& operator=(const LoopbackWebSocketServer&) = delete;

    /// Waits until the client has gone away.
    void join()
    {
        if (_thread.joinable())
            _thread.join();
    }

    [[nodiscard]] auto url() const -> const std::string& { return _url; }

    /// Value of the Authorization header seen during the upgrade; valid after join().
    [[nodiscard]] auto authorization() const -> std::string { return _authorization; }

  private:
    using tcp = boost::asio::ip::tcp;

    void serve()
    {
        namespace beast = boost::beast;

        auto ec = beast::error_code {};
        auto socket = tcp::socket(_ioc);
        _acceptor.accept(socket, ec);
        if (ec)
            return;

        auto request = beast::http::request<beast::http::string_body> {};
        auto buffer = beast::flat_buffer {};
        beast::http::read(socket, buffer, request, ec);
        if (ec)
            return;
        _authorization = std::string(request[beast::http::field::authorization]);

        auto ws = beast::websocket::stream<tcp::socket>(std::move(socket));
        ws.accept(request, ec);
        if (ec)
            return;
        ws.text(true);

        while (true)
        {
            auto frame = beast::flat_buffer {};
            ws.read(frame, ec);
            if (ec)
                return;

            auto const message = nlohmann::json::parse(beast::buffers_to_string(frame.data()), nullptr, false);
            if (message.is_discarded())
                continue;

            for (const auto& reply: _responder(message))
            {
                auto const text = reply.dump();
                ws.write(boost::asio::buffer(text), ec);
                if (ec)
                    return;
            }
        }
    }

    ScriptedTransport::Responder _responder;
    boost::asio::io_context _ioc;
    tcp::acceptor _acceptor;
    std::string _url;
    std::string _authorization;
    std::thread _thread;
};

/// @brief Replies to every message with the message itself.
inline auto echoResponder() -> ScriptedTransport::Responder
{
    return [](const nlohmann::json& message) -> std::vector<nlohmann::json> { return { message }; };
}

/// @brief A loopback port that completes TCP connects but never speaks.
///
/// Clients hang in the HTTP upgrade or the TLS handshake, as they would
/// against an unresponsive server.
class SilentListener
{
  public:
    SilentListener():
        _acceptor(_ioc, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0))
    {
    }

    [[nodiscard]] auto url(std::string_view scheme = "ws") const -> std::string
    {
        return std::format("{}://127.0.0.1:{}/mcp", scheme, _acceptor.local_endpoint().port());
    }

  private:
    boost::asio::io_context _ioc;
    boost::asio::ip::tcp::acceptor _acceptor;
};

} // namespace coderig::test
