// SPDX-License-Identifier: Apache-2.0
#include "WebSocketTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>

#include <openssl/ssl.h>

namespace coderig
{

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

auto parseWebSocketUrl(std::string_view url) -> Result<WebSocketUrl>
{
    auto parsed = WebSocketUrl {};
    auto rest = std::string_view {};

    if (url.starts_with("wss://"))
    {
        parsed.secure = true;
        parsed.port = "443";
        rest = url.substr(6);
    }
    else if (url.starts_with("ws://"))
    {
        parsed.port = "80";
        rest = url.substr(5);
    }
    else
    {
        return makeError(ErrorCode::InvalidArgument,
                         std::format("WebSocket URL must start with ws:// or wss://: {}", url));
    }

    auto const authorityEnd = rest.find_first_of("/?");
    auto const authority = rest.substr(0, authorityEnd);
    if (authorityEnd != std::string_view::npos)
    {
        parsed.target = std::string(rest.substr(authorityEnd));
        if (parsed.target.front() == '?')
            parsed.target.insert(0, "/");
    }

    auto portText = std::string_view {};
    if (authority.starts_with('['))
    {
        auto const close = authority.find(']');
        if (close == std::string_view::npos)
            return makeError(ErrorCode::InvalidArgument, std::format("Malformed IPv6 host in URL: {}", url));
        parsed.host = std::string(authority.substr(1, close - 1));
        auto const after = authority.substr(close + 1);
        if (after.starts_with(':'))
            portText = after.substr(1);
        else if (!after.empty())
            return makeError(ErrorCode::InvalidArgument, std::format("Malformed host in URL: {}", url));
    }
    else
    {
        auto const colon = authority.rfind(':');
        parsed.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos)
            portText = authority.substr(colon + 1);
    }

    if (parsed.host.empty())
        return makeError(ErrorCode::InvalidArgument, std::format("Missing host in URL: {}", url));

    if (!portText.empty())
    {
        if (!std::ranges::all_of(portText, [](char c) { return c >= '0' && c <= '9'; }))
            return makeError(ErrorCode::InvalidArgument, std::format("Invalid port in URL: {}", url));
        parsed.port = std::string(portText);
    }

    return parsed;
}

namespace
{
    using Headers = std::map<std::string, std::string>;

    /// Type-erased WebSocket session so plain and TLS streams share one transport.
    /// All member functions must run on the io_context's thread (or while it is not running).
    class WsSession
    {
      public:
        using OpenHandler = std::function<void(beast::error_code ec, std::string_view stage)>;
        using MessageSink = std::function<void(beast::error_code ec, std::string text)>;

        virtual ~WsSession() = default;

        virtual void asyncOpen(const WebSocketUrl& url, const Headers& headers, OpenHandler handler) = 0;
        virtual void startReading(MessageSink sink) = 0;
        virtual void asyncWrite(std::shared_ptr<std::string> text,
                                std::function<void(beast::error_code)> handler) = 0;
        virtual void asyncClose(std::function<void()> handler) = 0;
        virtual void shutdownSocket() = 0;
    };

    template <typename NextLayer>
    class BasicWsSession final: public WsSession
    {
      public:
        static constexpr bool Secure = std::is_same_v<NextLayer, beast::ssl_stream<beast::tcp_stream>>;

        template <typename... Args>
        explicit BasicWsSession(net::io_context& ioc, Args&&... args):
            _resolver(ioc), _ws(ioc, std::forward<Args>(args)...)
        {
        }

        void asyncOpen(const WebSocketUrl& url, const Headers& headers, OpenHandler handler) override
        {
            _url = url;
            _headers = headers;
            _openHandler = std::move(handler);

            _resolver.async_resolve(
                _url.host, _url.port, [this](beast::error_code ec, tcp::resolver::results_type results) {
                    if (ec || _cancelled)
                        return finishOpen(ec ? ec : net::error::operation_aborted, "resolve");

                    beast::get_lowest_layer(_ws).async_connect(
                        results, [this](beast::error_code ec, const tcp::endpoint&) {
                            if (ec || _cancelled)
                                return finishOpen(ec ? ec : net::error::operation_aborted, "connect");
                            onConnected();
                        });
                });
        }

        void startReading(MessageSink sink) override
        {
            _sink = std::move(sink);
            doRead();
        }

        void asyncWrite(std::shared_ptr<std::string> text, std::function<void(beast::error_code)> handler) override
        {
            auto const buffer = net::buffer(*text);
            _ws.async_write(buffer,
                            [text = std::move(text), handler = std::move(handler)](beast::error_code ec,
                                                                                     std::size_t) { handler(ec); });
        }

        void asyncClose(std::function<void()> handler) override
        {
            if (!_ws.is_open())
            {
                handler();
                return;
            }
            _ws.async_close(websocket::close_code::normal,
                            [handler = std::move(handler)](beast::error_code) { handler(); });
        }

        void shutdownSocket() override
        {
            // Stops an open in progress: no further stage starts after this.
            _cancelled = true;
            _resolver.cancel();

            auto ec = beast::error_code {};
            auto& socket = beast::get_lowest_layer(_ws).socket();
            if (socket.is_open())
            {
                socket.shutdown(tcp::socket::shutdown_both, ec);
                socket.close(ec);
            }
        }

      private:
        void onConnected()
        {
            if constexpr (Secure)
            {
                if (!::SSL_set_tlsext_host_name(_ws.next_layer().native_handle(), _url.host.c_str()))
                {
                    return finishOpen(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                        net::error::get_ssl_category()),
                                      "TLS SNI setup");
                }
                _ws.next_layer().set_verify_callback(ssl::host_name_verification(_url.host));
                _ws.next_layer().async_handshake(ssl::stream_base::client, [this](beast::error_code ec) {
                    if (ec || _cancelled)
                        return finishOpen(ec ? ec : net::error::operation_aborted, "TLS handshake");
                    upgrade();
                });
            }
            else
            {
                upgrade();
            }
        }

        void upgrade()
        {
            beast::get_lowest_layer(_ws).expires_never();
            _ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
            _ws.set_option(
                websocket::stream_base::decorator([headers = _headers](websocket::request_type& req) {
                    req.set(beast::http::field::user_agent, "coderig");
                    for (const auto& [name, value]: headers)
                        req.set(name, value);
                }));
            _ws.text(true);

            auto const defaultPort = Secure ? "443" : "80";
            auto const hostHeader = _url.port == defaultPort ? _url.host : _url.host + ":" + _url.port;
            _ws.async_handshake(hostHeader, _url.target, [this](beast::error_code ec) {
                finishOpen(ec, "WebSocket handshake");
            });
        }

        void finishOpen(beast::error_code ec, std::string_view stage)
        {
            if (_openHandler)
                std::exchange(_openHandler, {})(ec, stage);
        }

        void doRead()
        {
            _ws.async_read(_buffer, [this](beast::error_code ec, std::size_t) {
                if (ec)
                {
                    _sink(ec, {});
                    return;
                }
                auto text = beast::buffers_to_string(_buffer.data());
                _buffer.consume(_buffer.size());
                _sink({}, std::move(text));
                doRead();
            });
        }

        tcp::resolver _resolver;
        websocket::stream<NextLayer> _ws;
        bool _cancelled = false;
        beast::flat_buffer _buffer;
        WebSocketUrl _url;
        Headers _headers;
        OpenHandler _openHandler;
        MessageSink _sink;
    };

    using PlainSession = BasicWsSession<beast::tcp_stream>;
    using SecureSession = BasicWsSession<beast::ssl_stream<beast::tcp_stream>>;

    constexpr auto CloseHandshakeTimeout = std::chrono::milliseconds(2000);

    // How long a timed-out open may take to unwind before its I/O context is
    // handed to a background thread.
    constexpr auto CancelGracePeriod = std::chrono::milliseconds(200);

    struct QueuedWrite
    {
        std::shared_ptr<std::string> text;
        std::shared_ptr<std::promise<beast::error_code>> done;
    };
} // namespace

struct WebSocketTransport::Impl
{
    std::shared_ptr<net::io_context> ioc = std::make_shared<net::io_context>();
    std::shared_ptr<ssl::context> sslContext = std::make_shared<ssl::context>(ssl::context::tls_client);
    std::shared_ptr<WsSession> session;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::thread ioThread;
    std::string url;

    std::atomic<bool> connected = false;
    std::atomic<bool> closing = false;
    std::mutex closeMutex;

    std::mutex inboxMutex;
    std::condition_variable inboxReady;
    std::deque<Result<nlohmann::json>> inbox;
    bool inboxClosed = false;

    // Owned by the I/O thread. Beast allows one write at a time and the close
    // frame counts as a write, so writes are queued and close waits for them.
    std::deque<QueuedWrite> writeQueue;
    std::function<void()> closeWhenIdle;
    bool closeRequested = false;

    void enqueueWrite(QueuedWrite write)
    {
        if (closeRequested)
        {
            write.done->set_value(net::error::operation_aborted);
            return;
        }
        writeQueue.push_back(std::move(write));
        if (writeQueue.size() == 1)
            writeNext();
    }

    void writeNext()
    {
        session->asyncWrite(writeQueue.front().text, [this](beast::error_code ec) {
            writeQueue.front().done->set_value(ec);
            writeQueue.pop_front();
            if (!writeQueue.empty())
                writeNext();
            else if (closeWhenIdle)
                std::exchange(closeWhenIdle, {})();
        });
    }

    void requestClose(std::function<void()> handler)
    {
        closeRequested = true;
        if (writeQueue.empty())
            session->asyncClose(std::move(handler));
        else
            closeWhenIdle = [this, handler = std::move(handler)]() mutable { session->asyncClose(std::move(handler)); };
    }

    // Requires the I/O thread to be stopped.
    void abortQueuedWrites()
    {
        for (auto& write: writeQueue)
            write.done->set_value(net::error::operation_aborted);
        writeQueue.clear();
        closeWhenIdle = {};
    }

    void push(Result<nlohmann::json> item, bool last)
    {
        {
            auto const lock = std::lock_guard { inboxMutex };
            inbox.push_back(std::move(item));
            if (last)
                inboxClosed = true;
        }
        inboxReady.notify_all();
    }

    void stopIoThread()
    {
        work.reset();
        ioc->stop();
        if (ioThread.joinable())
            ioThread.join();
    }

    // Unwinds an open that timed out. A name lookup blocked in getaddrinfo()
    // cannot be interrupted, so whatever is still pending finishes on a
    // background thread and this transport continues with a fresh context.
    void abandonOpen()
    {
        session->shutdownSocket();
        ioc->restart();
        ioc->run_for(CancelGracePeriod);

        if (!ioc->stopped())
        {
            log::debug("WebSocket open to {} still unwinding, finishing in the background", url);
            std::thread([ioc = std::move(ioc), session = std::move(session), sslContext = sslContext]() mutable {
                ioc->run();
                session.reset();
            }).detach();
            ioc = std::make_shared<net::io_context>();
        }
        session.reset();
    }
};

WebSocketTransport::WebSocketTransport(): _impl(std::make_unique<Impl>())
{
}

WebSocketTransport::~WebSocketTransport()
{
    close();
    _impl->stopIoThread();
    _impl->session.reset();
}

auto WebSocketTransport::open(const WebSocketTransportConfig& config) -> VoidResult
{
    if (_impl->connected || _impl->session)
        return makeError(ErrorCode::TransportError, "Transport already connected");
    if (_impl->closing)
        return makeError(ErrorCode::TransportError, "Transport closed");

    auto url = parseWebSocketUrl(config.url);
    if (!url)
        return std::unexpected(url.error());

    if (url->secure)
    {
        auto ec = boost::system::error_code {};
        _impl->sslContext->set_default_verify_paths(ec);
        if (ec)
            log::warning("Could not load default CA certificates: {}", ec.message());
        _impl->sslContext->set_verify_mode(ssl::verify_peer);
        _impl->session = std::make_shared<SecureSession>(*_impl->ioc, *_impl->sslContext);
    }
    else
    {
        _impl->session = std::make_shared<PlainSession>(*_impl->ioc);
    }

    // Shared with the open handler, which may outlive this call after a timeout.
    struct OpenOutcome
    {
        bool done = false;
        beast::error_code error;
        std::string stage;
    };
    auto outcome = std::make_shared<OpenOutcome>();
    _impl->url = config.url;
    _impl->session->asyncOpen(*url, config.headers, [outcome](beast::error_code ec, std::string_view stage) {
        outcome->done = true;
        outcome->error = ec;
        outcome->stage = std::string(stage);
    });

    if (config.connectTimeout.count() > 0)
        _impl->ioc->run_for(config.connectTimeout);
    else
        _impl->ioc->run();

    if (!outcome->done)
    {
        _impl->abandonOpen();
        return makeError(ErrorCode::TimeoutError,
                         std::format("Connecting to {} timed out after {} ms", config.url, config.connectTimeout.count()));
    }

    if (outcome->error)
    {
        _impl->session.reset();
        return makeError(ErrorCode::TransportError,
                         std::format("WebSocket {} failed for {}: {}", outcome->stage, config.url, outcome->error.message()));
    }

    _impl->ioc->restart();
    _impl->work.emplace(net::make_work_guard(*_impl->ioc));
    _impl->connected = true;

    _impl->session->startReading([impl = _impl.get()](beast::error_code ec, std::string text) {
        if (ec)
        {
            impl->connected = false;
            if (ec == websocket::error::closed)
                impl->push(makeError(ErrorCode::TransportError, "WebSocket closed by peer"), true);
            else
                impl->push(makeError(ErrorCode::TransportError, std::format("WebSocket read failed: {}", ec.message())),
                           true);
            return;
        }
        log::trace("MCP <- {}", text);
        impl->push(json::parse(text), false);
    });

    _impl->ioThread = std::thread([impl = _impl.get()] { impl->ioc->run(); });

    log::debug("WebSocket connected: {}", config.url);
    return {};
}

auto WebSocketTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto write = QueuedWrite {
        .text = std::make_shared<std::string>(json::dumpSafe(message)),
        .done = std::make_shared<std::promise<beast::error_code>>(),
    };
    auto result = write.done->get_future();

    net::post(*_impl->ioc, [impl = _impl.get(), write = std::move(write)]() mutable {
        impl->enqueueWrite(std::move(write));
    });

    while (result.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready)
    {
        if (_impl->closing)
            return makeError(ErrorCode::TransportError, "Transport closed while sending");
    }

    if (auto const ec = result.get(); ec)
        return makeError(ErrorCode::TransportError, std::format("WebSocket write failed: {}", ec.message()));

    return {};
}

auto WebSocketTransport::receive() -> Result<nlohmann::json>
{
    auto lock = std::unique_lock { _impl->inboxMutex };

    if (_impl->inbox.empty() && !_impl->connected && !_impl->inboxClosed)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    _impl->inboxReady.wait(lock, [this] { return !_impl->inbox.empty() || _impl->inboxClosed || _impl->closing; });

    if (_impl->inbox.empty())
        return makeError(ErrorCode::TransportError, "Transport closed");

    auto item = std::move(_impl->inbox.front());
    _impl->inbox.pop_front();
    return item;
}

void WebSocketTransport::close()
{
    auto const lock = std::lock_guard { _impl->closeMutex };

    if (_impl->closing)
        return;

    _impl->closing = true;
    _impl->connected = false;

    if (_impl->ioThread.joinable())
    {
        auto closed = std::make_shared<std::promise<void>>();
        auto closedFuture = closed->get_future();
        net::post(*_impl->ioc, [impl = _impl.get(), closed] {
            impl->requestClose([closed] { closed->set_value(); });
        });
        if (closedFuture.wait_for(CloseHandshakeTimeout) != std::future_status::ready)
            log::debug("WebSocket close handshake with {} timed out", _impl->url);

        _impl->stopIoThread();
        _impl->session->shutdownSocket();
        _impl->abortQueuedWrites();
    }

    {
        auto const inboxLock = std::lock_guard { _impl->inboxMutex };
        _impl->inboxClosed = true;
    }
    _impl->inboxReady.notify_all();

    log::debug("WebSocket transport closed");
}

auto WebSocketTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace coderig
