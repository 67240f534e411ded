// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace coderig::jsonrpc
{

namespace
{
    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };

    auto capability(bool listChanged) -> nlohmann::json
    {
        return nlohmann::json { { "listChanged", listChanged } };
    }

    auto cursorParams(const std::optional<std::string>& cursor) -> nlohmann::json
    {
        auto params = nlohmann::json::object();
        if (cursor)
            params["cursor"] = *cursor;
        return params;
    }
} // namespace

auto methodName(const Method& method) -> std::string_view
{
    return std::visit(Overloaded {
                          [](const Initialize&) -> std::string_view { return "initialize"; },
                          [](const Initialized&) -> std::string_view { return "notifications/initialized"; },
                          [](const ListTools&) -> std::string_view { return "tools/list"; },
                          [](const CallTool&) -> std::string_view { return "tools/call"; },
                          [](const ListResources&) -> std::string_view { return "resources/list"; },
                          [](const ReadResource&) -> std::string_view { return "resources/read"; },
                          [](const ListPrompts&) -> std::string_view { return "prompts/list"; },
                          [](const GetPrompt&) -> std::string_view { return "prompts/get"; },
                          [](const Ping&) -> std::string_view { return "ping"; },
                      },
                      method);
}

auto methodParams(const Method& method) -> nlohmann::json
{
    return std::visit(Overloaded {
                          [](const Initialize& m) -> nlohmann::json {
                              return nlohmann::json {
                                  { "protocolVersion", m.protocolVersion },
                                  { "capabilities",
                                    {
                                        { "tools", capability(m.listChanged) },
                                        { "resources", capability(m.listChanged) },
                                        { "prompts", capability(m.listChanged) },
                                    } },
                                  { "clientInfo",
                                    {
                                        { "name", m.clientInfo.name },
                                        { "version", m.clientInfo.version },
                                    } },
                              };
                          },
                          [](const Initialized&) -> nlohmann::json { return nullptr; },
                          [](const ListTools&) -> nlohmann::json { return nullptr; },
                          [](const CallTool& m) -> nlohmann::json {
                              return nlohmann::json {
                                  { "name", m.name },
                                  { "arguments", m.arguments },
                              };
                          },
                          [](const ListResources& m) -> nlohmann::json { return cursorParams(m.cursor); },
                          [](const ReadResource& m) -> nlohmann::json {
                              return nlohmann::json { { "uri", m.uri } };
                          },
                          [](const ListPrompts& m) -> nlohmann::json { return cursorParams(m.cursor); },
                          [](const GetPrompt& m) -> nlohmann::json {
                              return nlohmann::json {
                                  { "name", m.name },
                                  { "arguments", m.arguments },
                              };
                          },
                          [](const Ping&) -> nlohmann::json { return nullptr; },
                      },
                      method);
}

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeRequest(int64_t id, const Method& method) -> nlohmann::json
{
    return makeRequest(id, methodName(method), methodParams(method));
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(const Method& method) -> nlohmann::json
{
    return makeNotification(methodName(method), methodParams(method));
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error member is not an object");

        auto const code = err.contains("code") && err["code"].is_number_integer() ? err["code"].get<int>() : 0;
        auto const text = err.contains("message") && err["message"].is_string()
                              ? err["message"].get<std::string>()
                              : std::string("Unknown error");
        response.error = RpcError {
            .code = code,
            .message = text,
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else if (!message.contains("method"))
    {
        // It's neither a valid response nor a notification
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto parseIncoming(const nlohmann::json& message) -> Result<IncomingMessage>
{
    auto parsed = parseResponse(message);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto incoming = IncomingMessage {};
    auto const hasId = message.contains("id") && !message["id"].is_null();
    auto const hasMethod = message.contains("method") && message["method"].is_string();

    if (hasMethod)
    {
        incoming.method = message["method"].get<std::string>();
        incoming.params = message.value("params", nlohmann::json {});
    }

    if (hasId && !hasMethod)
        incoming.kind = IncomingMessage::Kind::Response;
    else if (hasId)
        incoming.kind = IncomingMessage::Kind::Request;
    else
        incoming.kind = IncomingMessage::Kind::Notification;

    if (hasId)
        incoming.id = message["id"];
    incoming.response = std::move(*parsed);
    return incoming;
}

auto idKey(const nlohmann::json& id) -> std::optional<std::string>
{
    if (id.is_string())
        return id.get<std::string>();
    if (id.is_number_integer())
        return std::to_string(id.get<int64_t>());
    return std::nullopt;
}

auto describe(const RpcError& error) -> std::string
{
    if (error.data.is_null())
        return std::format("RPC error {}: {}", error.code, error.message);
    return std::format("RPC error {}: {} ({})", error.code, error.message, error.data.dump());
}

} // namespace coderig::jsonrpc
