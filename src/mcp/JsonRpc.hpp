// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace toolbridge::jsonrpc
{

/// @brief Request ids used per call site.
///
/// Ids are not unique per request. Correlation is only sound because every
/// server handles one request at a time.
namespace ids
{
    constexpr int64_t Initialize = 1;
    constexpr int64_t ListTools = 2;
    constexpr int64_t CallTool = 3;
} // namespace ids

/// @brief Standard JSON-RPC 2.0 error codes.
namespace codes
{
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
} // namespace codes

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief A JSON-RPC 2.0 request (carries an id and expects a response).
struct Request
{
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
};

/// @brief A JSON-RPC 2.0 notification (no id, no response).
struct Notification
{
    std::string method;
    nlohmann::json params;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief Returns true if the response id equals the given numeric id.
    [[nodiscard]] auto hasId(int64_t expected) const -> bool
    {
        return id.is_number_integer() && id.get<int64_t>() == expected;
    }
};

/// @brief Any inbound or outbound JSON-RPC 2.0 message.
using Message = std::variant<Request, Response, Notification>;

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful JSON-RPC 2.0 response to a peer request.
/// @param id The id of the request being answered, echoed verbatim.
/// @param result The result payload.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response to a peer request.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Classifies and parses any JSON-RPC 2.0 message.
///
/// A message with a method and an id is a Request, with a method but no id a
/// Notification, and with a result or error a Response.
/// @param message The JSON message to parse.
/// @return The parsed message or a ProtocolError.
[[nodiscard]] auto parseMessage(const nlohmann::json& message) -> Result<Message>;

/// @brief Serializes a message back to its JSON form.
[[nodiscard]] auto toJson(const Message& message) -> nlohmann::json;

} // namespace toolbridge::jsonrpc
