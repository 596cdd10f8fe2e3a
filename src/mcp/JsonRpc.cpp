// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace toolbridge::jsonrpc
{

namespace
{
    template <class... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };

    auto isValidId(const nlohmann::json& id) -> bool
    {
        return id.is_number_integer() || id.is_string();
    }
} // namespace

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
        { "error",
          nlohmann::json {
              { "code", code },
              { "message", message },
          } },
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
        if (err.is_object())
        {
            response.error = RpcError {
                .code = json::getIntOr(err, "code", 0),
                .message = json::getStringOr(err, "message", "Unknown error"),
                .data = err.value("data", nlohmann::json {}),
            };
        }
        else
        {
            response.error = RpcError { .code = 0, .message = json::serialize(err), .data = err };
        }
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result nor error");
    }

    return response;
}

auto parseMessage(const nlohmann::json& message) -> Result<Message>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    if (message.contains("method"))
    {
        if (!message["method"].is_string())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC method must be a string");

        auto method = message["method"].get<std::string>();
        auto params = message.value("params", nlohmann::json {});

        if (!message.contains("id"))
            return Notification { .method = std::move(method), .params = std::move(params) };

        if (!isValidId(message["id"]))
            return makeError(ErrorCode::ProtocolError,
                             std::format("Invalid JSON-RPC request id: {}", json::serialize(message["id"])));

        return Request { .id = message["id"], .method = std::move(method), .params = std::move(params) };
    }

    return parseResponse(message).transform([](Response response) -> Message { return response; });
}

auto toJson(const Message& message) -> nlohmann::json
{
    return std::visit(
        Overloaded {
            [](const Request& request) {
                auto msg = nlohmann::json {
                    { "jsonrpc", "2.0" },
                    { "id", request.id },
                    { "method", request.method },
                };
                if (!request.params.is_null())
                    msg["params"] = request.params;
                return msg;
            },
            [](const Notification& notification) {
                return makeNotification(notification.method, notification.params);
            },
            [](const Response& response) {
                if (response.error)
                {
                    auto msg = makeErrorResponse(response.id, response.error->code, response.error->message);
                    if (!response.error->data.is_null())
                        msg["error"]["data"] = response.error->data;
                    return msg;
                }
                return makeResult(response.id, response.result.value_or(nlohmann::json::object()));
            },
        },
        message);
}

} // namespace toolbridge::jsonrpc
