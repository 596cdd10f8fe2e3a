// SPDX-License-Identifier: Apache-2.0
#include "Handshake.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <format>

namespace toolbridge
{

namespace
{
    using Clock = std::chrono::steady_clock;

    constexpr auto InitializedNotification = std::string_view { "notifications/initialized" };
    constexpr auto RootsChangedNotification = std::string_view { "notifications/roots/list_changed" };

    auto parseCapabilities(const nlohmann::json& result) -> ServerCapabilities
    {
        auto capabilities = ServerCapabilities {};
        auto const serverInfo =
            result.is_object() ? result.value("serverInfo", nlohmann::json::object()) : nlohmann::json::object();
        capabilities.serverName = json::getStringOr(serverInfo, "name", "unknown");
        capabilities.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
        capabilities.protocolVersion = json::getStringOr(result, "protocolVersion", "");

        if (result.contains("capabilities") && result["capabilities"].is_object())
        {
            auto const& caps = result["capabilities"];
            capabilities.hasTools = caps.contains("tools");
            capabilities.hasResources = caps.contains("resources");
            capabilities.hasPrompts = caps.contains("prompts");
        }
        return capabilities;
    }
} // namespace

auto answerPeerRequest(Transport& transport, const nlohmann::json& message, const std::vector<Root>& roots)
    -> std::optional<std::string>
{
    auto parsed = jsonrpc::parseMessage(message);
    if (!parsed || !std::holds_alternative<jsonrpc::Request>(*parsed))
        return std::nullopt;

    auto const& request = std::get<jsonrpc::Request>(*parsed);

    auto reply = nlohmann::json {};
    if (request.method == RootsListMethod)
        reply = jsonrpc::makeResult(request.id, rootsToJson(roots));
    else if (request.method == "ping")
        reply = jsonrpc::makeResult(request.id, nlohmann::json::object());
    else
        reply = jsonrpc::makeErrorResponse(
            request.id, jsonrpc::codes::MethodNotFound, std::format("Method not supported: {}", request.method));

    if (auto sent = transport.send(reply); !sent)
        log::warning("Failed replying to {}: {}", request.method, sent.error().message);
    else if (request.method == RootsListMethod)
        log::info("Replied to roots/list with {}", json::serialize(rootsToJson(roots)["roots"]));
    else
        log::debug("Replied to server request {}", request.method);

    return request.method;
}

HandshakeCoordinator::HandshakeCoordinator(Transport& transport,
                                           std::vector<Root> roots,
                                           HandshakeConfig config,
                                           ExitProbe exitProbe):
    _transport(transport), _roots(std::move(roots)), _config(std::move(config)), _exitProbe(std::move(exitProbe))
{
}

auto HandshakeCoordinator::run() -> Result<ServerCapabilities>
{
    if (_state != State::NotStarted)
        return makeError(ErrorCode::ProtocolError,
                         std::format("Handshake already run (state {})", stateName(_state)));

    auto params = nlohmann::json {
        { "protocolVersion", McpProtocolVersion },
        { "clientInfo",
          nlohmann::json {
              { "name", _config.clientName },
              { "version", _config.clientVersion },
          } },
        { "capabilities",
          nlohmann::json {
              { "tools", nlohmann::json::object() },
              { "roots", nlohmann::json::object() },
          } },
    };

    log::debug("Sending initialize request");
    if (auto sent = _transport.send(jsonrpc::makeRequest(jsonrpc::ids::Initialize, "initialize", std::move(params)));
        !sent)
        return fail(Error {
            ErrorCode::TransportClosed,
            withExitDetail(sent.error().message, _config.exitWait),
            nullptr,
        });

    _state = State::AwaitingInitResponse;

    auto const deadline = Clock::now() + _config.deadline;
    auto settleUntil = std::optional<Clock::time_point> {};
    auto initResponse = std::optional<jsonrpc::Response> {};

    while (true)
    {
        auto const now = Clock::now();
        auto const limit = settleUntil ? std::min(deadline, *settleUntil) : deadline;
        if (now >= limit)
            break;

        auto received =
            _transport.tryReceive(std::chrono::duration_cast<std::chrono::milliseconds>(limit - now));
        if (!received)
        {
            if (initResponse)
                break;
            return fail(Error {
                ErrorCode::TransportClosed,
                withExitDetail("Server closed its output before answering initialize", _config.exitWait),
                nullptr,
            });
        }
        if (!*received)
            continue;

        auto const& message = **received;

        if (auto const method = answerPeerRequest(_transport, message, _roots); method)
        {
            if (*method == RootsListMethod)
            {
                ++_rootsServed;
                // A roots request may be followed by more traffic; keep listening a little longer.
                if (initResponse)
                    settleUntil = Clock::now() + _config.settleWindow;
            }
            continue;
        }

        auto parsed = jsonrpc::parseMessage(message);
        if (!parsed)
        {
            log::debug("Ignoring unexpected message during handshake: {}", json::serialize(message));
            continue;
        }

        if (auto const* notification = std::get_if<jsonrpc::Notification>(&*parsed); notification)
        {
            log::debug("Server notification during handshake: {}", notification->method);
            continue;
        }

        auto const& response = std::get<jsonrpc::Response>(*parsed);
        if (initResponse || !response.hasId(jsonrpc::ids::Initialize))
        {
            log::debug("Ignoring uncorrelated response during handshake: {}", json::serialize(message));
            continue;
        }

        initResponse = response;
        settleUntil = Clock::now() + _config.settleWindow;

        if (!response.isSuccess())
            break;

        log::info("MCP server initialized: {}", json::serialize(*response.result));

        if (auto sent = _transport.send(jsonrpc::makeNotification(InitializedNotification)); !sent)
            log::debug("Unable to send {}: {}", InitializedNotification, sent.error().message);

        // Nudge providers that only request roots lazily.
        if (auto sent = _transport.send(jsonrpc::makeNotification(RootsChangedNotification, nlohmann::json::object()));
            !sent)
            log::debug("Unable to send {}: {}", RootsChangedNotification, sent.error().message);
        else
            log::debug("Sent {} notification", RootsChangedNotification);
    }

    if (!initResponse)
        return fail(Error {
            ErrorCode::HandshakeTimeout,
            withExitDetail(std::format("No initialize response within {} ms", _config.deadline.count()),
                           std::chrono::milliseconds { 0 }),
            nullptr,
        });

    if (initResponse->error)
    {
        auto const& rpcError = *initResponse->error;
        return fail(Error {
            ErrorCode::ApplicationError,
            std::format("Server rejected initialize: RPC error {}: {}", rpcError.code, rpcError.message),
            nlohmann::json { { "code", rpcError.code }, { "message", rpcError.message }, { "data", rpcError.data } },
        });
    }

    if (_exitProbe)
    {
        if (auto const stderrText = _exitProbe(std::chrono::milliseconds { 0 }); stderrText)
            return fail(Error {
                ErrorCode::TransportClosed,
                std::format("Server terminated after initialize: {}", *stderrText),
                nullptr,
            });
    }

    if (!_transport.isConnected())
        return fail(Error {
            ErrorCode::TransportClosed,
            withExitDetail("Server closed its output after initialize", _config.exitWait),
            nullptr,
        });

    _state = State::Ready;
    return parseCapabilities(*initResponse->result);
}

auto HandshakeCoordinator::fail(Error error) -> std::unexpected<Error>
{
    _state = State::Failed;
    log::error("MCP handshake failed: {}", error.message);
    return std::unexpected<Error>(std::move(error));
}

auto HandshakeCoordinator::withExitDetail(std::string message, std::chrono::milliseconds exitWait) const
    -> std::string
{
    if (!_exitProbe)
        return message;

    auto const stderrText = _exitProbe(exitWait);
    if (!stderrText)
        return message;

    return std::format("{}; server exited: {}", message, *stderrText);
}

} // namespace toolbridge
