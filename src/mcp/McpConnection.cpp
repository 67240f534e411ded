// SPDX-License-Identifier: Apache-2.0
#include "McpConnection.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/PendingRequests.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <thread>

namespace coderig
{

namespace
{
    using Timeout = std::optional<std::chrono::milliseconds>;

    auto optionalString(const nlohmann::json& obj, const char* key) -> std::optional<std::string>
    {
        if (auto const it = obj.find(key); it != obj.end() && it->is_string())
            return it->get<std::string>();
        return std::nullopt;
    }

    auto parseResource(const nlohmann::json& entry) -> std::optional<McpResource>
    {
        if (!entry.is_object())
            return std::nullopt;
        auto uri = optionalString(entry, "uri");
        if (!uri)
            return std::nullopt;
        return McpResource {
            .uri = std::move(*uri),
            .name = optionalString(entry, "name"),
            .description = optionalString(entry, "description"),
            .mimeType = optionalString(entry, "mimeType"),
        };
    }

    auto parsePrompt(const nlohmann::json& entry) -> std::optional<McpPrompt>
    {
        if (!entry.is_object())
            return std::nullopt;
        auto name = optionalString(entry, "name");
        if (!name)
            return std::nullopt;
        return McpPrompt {
            .name = std::move(*name),
            .description = optionalString(entry, "description"),
            .arguments = entry.value("arguments", nlohmann::json {}),
        };
    }

    // Tools may be pushed either as a response-shaped `result` or in `params`.
    auto findPushedTools(const jsonrpc::IncomingMessage& message) -> const nlohmann::json*
    {
        if (message.response.result && message.response.result->is_object())
        {
            if (auto const it = message.response.result->find("tools"); it != message.response.result->end())
                return &*it;
        }
        if (message.params.is_object())
        {
            if (auto const it = message.params.find("tools"); it != message.params.end())
                return &*it;
        }
        return nullptr;
    }

    void logToolDetails(std::string_view server, const std::vector<McpTool>& tools)
    {
        if (log::getLevel() < log::Level::Debug)
            return;
        for (const auto& tool: tools)
        {
            log::debug("  [{}] {}: {}", server, tool.name, tool.description.value_or("(no description)"));
            log::trace("  [{}] {} schema: {}", server, tool.name, json::dumpSafe(tool.inputSchema));
        }
    }
} // namespace

auto connectionStateName(ConnectionState state) -> std::string_view
{
    switch (state)
    {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Initializing: return "initializing";
        case ConnectionState::Ready: return "ready";
    }
    return "unknown";
}

struct McpConnection::Impl
{
    std::string name;
    ConnectionOptions options;

    // Set once in connect() and destroyed with the connection, so callers that
    // race a disconnect() never see a dangling transport.
    std::unique_ptr<Transport> transport;
    std::thread reader;

    std::mutex writeMutex;
    std::mutex lifecycleMutex;
    PendingRequests pending;
    ToolCatalog catalog;

    std::atomic<ConnectionState> state = ConnectionState::Disconnected;
    std::atomic<bool> readerClosed = false;
    std::atomic<bool> stopping = false;

    mutable std::mutex infoMutex;
    ServerInfo serverInfo;

    auto send(const nlohmann::json& message) -> VoidResult
    {
        auto const lock = std::lock_guard { writeMutex };
        if (!transport || readerClosed)
            return makeError(ErrorCode::TransportError, std::format("Connection to MCP server '{}' is closed", name));
        log::trace("MCP -> [{}] {}", name, json::dumpSafe(message));
        return transport->send(message);
    }

    auto request(const jsonrpc::Method& method, Timeout timeout, Deadline deadline) -> Result<nlohmann::json>
    {
        auto const label = jsonrpc::methodName(method);
        auto const id = pending.nextId();
        auto reply = pending.registerRequest(id);

        // The reader sets readerClosed before failing all waiters, so a waiter
        // registered after that sweep is caught here.
        if (readerClosed)
        {
            pending.remove(id);
            return makeError(ErrorCode::TransportError, std::format("Connection to MCP server '{}' is closed", name));
        }

        if (auto sent = send(jsonrpc::makeRequest(id, method)); !sent)
        {
            pending.remove(id);
            return std::unexpected(sent.error());
        }

        if (deadline)
        {
            auto const remaining = std::max(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                *deadline - std::chrono::steady_clock::now()),
                                            std::chrono::milliseconds(0));
            timeout = timeout ? std::min(*timeout, remaining) : remaining;
        }

        if (timeout)
        {
            if (reply.wait_for(*timeout) != std::future_status::ready)
            {
                pending.remove(id);
                return makeError(ErrorCode::TimeoutError,
                                 std::format("MCP server '{}' did not answer {} within {} ms",
                                             name,
                                             label,
                                             timeout->count()));
            }
        }

        auto response = reply.get();
        if (!response)
            return std::unexpected(response.error());

        if (response->error)
            return makeError(ErrorCode::RemoteError,
                             std::format("{} on MCP server '{}' failed: {}",
                                         label,
                                         name,
                                         jsonrpc::describe(*response->error)));

        return response->result.value_or(nlohmann::json::object());
    }

    // Fails fast when the connection cannot carry a request.
    auto ensureReady() -> VoidResult
    {
        if (readerClosed && !stopping)
            return makeError(ErrorCode::TransportError, std::format("Connection to MCP server '{}' was lost", name));
        if (state != ConnectionState::Ready)
            return makeError(ErrorCode::NotConnected,
                             std::format("MCP server '{}' is {}", name, connectionStateName(state)));
        return transport->checkAlive();
    }

    void readLoop()
    {
        log::debug("MCP reader for '{}' started", name);
        while (true)
        {
            auto message = transport->receive();
            if (!message)
            {
                if (message.error().code == ErrorCode::ProtocolError)
                {
                    log::warning("Skipping malformed message from MCP server '{}': {}", name, message.error().message);
                    continue;
                }

                if (stopping)
                    log::debug("MCP reader for '{}' stopped: {}", name, message.error().message);
                else
                    log::warning("Lost connection to MCP server '{}': {}", name, message.error().message);

                readerClosed = true;
                state = ConnectionState::Disconnected;
                pending.failAll(Error {
                    .code = ErrorCode::TransportError,
                    .message = std::format("Connection to MCP server '{}' closed: {}", name, message.error().message),
                });
                return;
            }

            dispatch(*message);
        }
    }

    void dispatch(const nlohmann::json& message)
    {
        auto incoming = jsonrpc::parseIncoming(message);
        if (!incoming)
        {
            log::warning("Skipping invalid JSON-RPC message from MCP server '{}': {}",
                         name,
                         incoming.error().message);
            return;
        }

        switch (incoming->kind)
        {
            case jsonrpc::IncomingMessage::Kind::Response:
                if (!pending.complete(std::move(incoming->response)))
                    log::debug("Ignoring response with unknown id {} from MCP server '{}'",
                               json::dumpSafe(incoming->id),
                               name);
                return;
            case jsonrpc::IncomingMessage::Kind::Request: answerServerRequest(*incoming); return;
            case jsonrpc::IncomingMessage::Kind::Notification: handleNotification(*incoming); return;
        }
    }

    void answerServerRequest(const jsonrpc::IncomingMessage& request)
    {
        auto const reply = request.method == "ping"
                               ? jsonrpc::makeResult(request.id, nlohmann::json::object())
                               : jsonrpc::makeErrorResponse(request.id,
                                                            jsonrpc::errc::MethodNotFound,
                                                            std::format("Method not found: {}", request.method));
        if (request.method != "ping")
            log::debug("MCP server '{}' sent unsupported request '{}'", name, request.method);

        if (auto sent = send(reply); !sent)
            log::warning("Failed to answer request from MCP server '{}': {}", name, sent.error().message);
    }

    void handleNotification(const jsonrpc::IncomingMessage& notification)
    {
        if (auto const* pushed = findPushedTools(notification))
        {
            auto tools = parseToolList(*pushed);
            if (!tools)
            {
                log::warning("Ignoring tool update from MCP server '{}': {}", name, tools.error().message);
                return;
            }
            log::info("MCP server '{}' updated its tools ({} available)", name, tools->size());
            logToolDetails(name, *tools);
            catalog.replace(std::move(*tools));
            return;
        }

        if (notification.method == "notifications/tools/list_changed")
        {
            log::debug("MCP server '{}' reported a changed tool list", name);
            return;
        }

        log::debug("Ignoring notification '{}' from MCP server '{}'", notification.method, name);
    }

    // Requires lifecycleMutex.
    void teardown()
    {
        if (!transport)
            return;

        // New sends are refused from here on. A send already inside the
        // transport is woken by close(), which serializes against it.
        stopping = true;
        readerClosed = true;
        transport->close();
        if (reader.joinable())
            reader.join();

        pending.failAll(Error {
            .code = ErrorCode::TransportError,
            .message = std::format("Disconnected from MCP server '{}'", name),
        });
        state = ConnectionState::Disconnected;
    }
};

McpConnection::McpConnection(std::string name, ConnectionOptions options): _impl(std::make_unique<Impl>())
{
    _impl->name = std::move(name);
    _impl->options = options;
}

McpConnection::~McpConnection()
{
    disconnect();
}

auto McpConnection::connectStdio(const StdioTransportConfig& config, Deadline deadline) -> VoidResult
{
    if (_impl->transport)
        return makeError(ErrorCode::InvalidArgument, std::format("Connection '{}' was already used", _impl->name));

    _impl->state = ConnectionState::Connecting;

    auto transport = std::make_unique<StdioTransport>();
    if (auto started = transport->start(config); !started)
    {
        _impl->state = ConnectionState::Disconnected;
        return std::unexpected(started.error());
    }

    return connect(std::move(transport), deadline);
}

auto McpConnection::connectWebSocket(const WebSocketTransportConfig& config, Deadline deadline) -> VoidResult
{
    if (_impl->transport)
        return makeError(ErrorCode::InvalidArgument, std::format("Connection '{}' was already used", _impl->name));

    _impl->state = ConnectionState::Connecting;

    auto bounded = config;
    if (deadline && bounded.connectTimeout.count() == 0)
    {
        bounded.connectTimeout = std::max(std::chrono::duration_cast<std::chrono::milliseconds>(
                                              *deadline - std::chrono::steady_clock::now()),
                                          std::chrono::milliseconds(1));
    }

    auto transport = std::make_unique<WebSocketTransport>();
    if (auto opened = transport->open(bounded); !opened)
    {
        _impl->state = ConnectionState::Disconnected;
        return std::unexpected(opened.error());
    }

    return connect(std::move(transport), deadline);
}

auto McpConnection::connect(std::unique_ptr<Transport> transport, Deadline deadline) -> VoidResult
{
    {
        auto const lock = std::lock_guard { _impl->lifecycleMutex };
        if (_impl->transport)
            return makeError(ErrorCode::InvalidArgument, std::format("Connection '{}' was already used", _impl->name));
        if (!transport)
            return makeError(ErrorCode::InvalidArgument, "No transport given");

        _impl->state = ConnectionState::Connecting;
        _impl->transport = std::move(transport);
        _impl->reader = std::thread([impl = _impl.get()] { impl->readLoop(); });
    }

    _impl->state = ConnectionState::Initializing;
    if (auto initialized = initialize(deadline); !initialized)
    {
        auto const lock = std::lock_guard { _impl->lifecycleMutex };
        _impl->teardown();
        return std::unexpected(initialized.error());
    }

    // A concurrent disconnect() or a dead reader wins over a late handshake.
    auto expected = ConnectionState::Initializing;
    if (!_impl->state.compare_exchange_strong(expected, ConnectionState::Ready))
        return makeError(ErrorCode::TransportError,
                         std::format("Connection to MCP server '{}' closed during initialization", _impl->name));

    auto const info = serverInfo();
    log::info("Connected to MCP server '{}' ({} v{}, {} tools)",
              _impl->name,
              info.name,
              info.version,
              _impl->catalog.size());
    return {};
}

auto McpConnection::initialize(Deadline deadline) -> VoidResult
{
    auto const method = jsonrpc::Initialize {
        .protocolVersion = std::string(McpProtocolVersion),
        .listChanged = true,
        .clientInfo = { .name = std::string(McpClientName), .version = std::string(McpClientVersion) },
    };

    auto result = _impl->request(method, std::nullopt, deadline);
    if (!result)
        return std::unexpected(result.error());

    {
        auto const info = result->is_object() ? result->value("serverInfo", nlohmann::json {}) : nlohmann::json {};
        auto const lock = std::lock_guard { _impl->infoMutex };
        _impl->serverInfo = ServerInfo {
            .name = json::getStringOr(info, "name", "unknown"),
            .version = json::getStringOr(info, "version", "unknown"),
        };
    }

    if (auto sent = _impl->send(jsonrpc::makeNotification(jsonrpc::Initialized {})); !sent)
        log::warning("Failed to send initialized notification to '{}': {}", _impl->name, sent.error().message);

    return loadTools(deadline);
}

auto McpConnection::loadTools(Deadline deadline) -> VoidResult
{
    auto result = _impl->request(jsonrpc::ListTools {}, _impl->options.listToolsTimeout, deadline);
    if (!result)
        return std::unexpected(result.error());

    if (!result->contains("tools"))
    {
        log::warning("MCP server '{}' returned no 'tools' in its tools/list result", _impl->name);
        return {};
    }

    auto tools = parseToolList((*result)["tools"]);
    if (!tools)
        return makeError(ErrorCode::ProtocolError,
                         std::format("Invalid tools/list result from '{}': {}", _impl->name, tools.error().message));

    log::debug("MCP server '{}' provides {} tool(s)", _impl->name, tools->size());
    logToolDetails(_impl->name, *tools);
    _impl->catalog.replace(std::move(*tools));
    return {};
}

auto McpConnection::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    if (auto ready = _impl->ensureReady(); !ready)
        return std::unexpected(ready.error());

    log::debug("Calling MCP tool '{}' on '{}'", name, _impl->name);
    return _impl->request(jsonrpc::CallTool { .name = std::string(name), .arguments = arguments },
                          _impl->options.callTimeout,
                          std::nullopt);
}

auto McpConnection::listResources() -> Result<std::vector<McpResource>>
{
    if (auto ready = _impl->ensureReady(); !ready)
        return std::unexpected(ready.error());

    auto resources = std::vector<McpResource> {};
    auto cursor = std::optional<std::string> {};
    while (true)
    {
        auto page = _impl->request(jsonrpc::ListResources { .cursor = cursor }, _impl->options.callTimeout, {});
        if (!page)
            return std::unexpected(page.error());

        if (page->is_object() && page->contains("resources") && (*page)["resources"].is_array())
        {
            for (const auto& entry: (*page)["resources"])
            {
                if (auto resource = parseResource(entry))
                    resources.push_back(std::move(*resource));
                else
                    log::debug("Skipping resource without uri from '{}'", _impl->name);
            }
        }

        auto next = json::getStringOr(*page, "nextCursor", "");
        if (next.empty() || next == cursor)
            break;
        cursor = std::move(next);
    }
    return resources;
}

auto McpConnection::readResource(std::string_view uri) -> Result<nlohmann::json>
{
    if (auto ready = _impl->ensureReady(); !ready)
        return std::unexpected(ready.error());

    return _impl->request(jsonrpc::ReadResource { .uri = std::string(uri) }, _impl->options.callTimeout, {});
}

auto McpConnection::listPrompts() -> Result<std::vector<McpPrompt>>
{
    if (auto ready = _impl->ensureReady(); !ready)
        return std::unexpected(ready.error());

    auto prompts = std::vector<McpPrompt> {};
    auto cursor = std::optional<std::string> {};
    while (true)
    {
        auto page = _impl->request(jsonrpc::ListPrompts { .cursor = cursor }, _impl->options.callTimeout, {});
        if (!page)
            return std::unexpected(page.error());

        if (page->is_object() && page->contains("prompts") && (*page)["prompts"].is_array())
        {
            for (const auto& entry: (*page)["prompts"])
            {
                if (auto prompt = parsePrompt(entry))
                    prompts.push_back(std::move(*prompt));
            }
        }

        auto next = json::getStringOr(*page, "nextCursor", "");
        if (next.empty() || next == cursor)
            break;
        cursor = std::move(next);
    }
    return prompts;
}

auto McpConnection::getPrompt(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    if (auto ready = _impl->ensureReady(); !ready)
        return std::unexpected(ready.error());

    auto method = jsonrpc::GetPrompt {
        .name = std::string(name),
        .arguments = arguments.is_null() ? nlohmann::json::object() : arguments,
    };
    return _impl->request(method, _impl->options.callTimeout, {});
}

auto McpConnection::ping() -> VoidResult
{
    if (auto ready = _impl->ensureReady(); !ready)
        return std::unexpected(ready.error());

    return _impl->request(jsonrpc::Ping {}, _impl->options.callTimeout, {}).transform([](auto&&) {});
}

void McpConnection::disconnect()
{
    auto const lock = std::lock_guard { _impl->lifecycleMutex };
    auto const wasOpen = _impl->transport && !_impl->stopping;
    _impl->teardown();
    if (wasOpen)
        log::info("Disconnected from MCP server '{}'", _impl->name);
}

auto McpConnection::tools() const -> std::vector<McpTool>
{
    return _impl->catalog.tools();
}

auto McpConnection::toolsVersion() const -> uint64_t
{
    return _impl->catalog.version();
}

auto McpConnection::toolCount() const -> size_t
{
    return _impl->catalog.size();
}

auto McpConnection::state() const -> ConnectionState
{
    return _impl->state;
}

auto McpConnection::serverInfo() const -> ServerInfo
{
    auto const lock = std::lock_guard { _impl->infoMutex };
    return _impl->serverInfo;
}

auto McpConnection::name() const -> const std::string&
{
    return _impl->name;
}

} // namespace coderig
