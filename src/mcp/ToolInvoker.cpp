// SPDX-License-Identifier: Apache-2.0
#include "ToolInvoker.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/Handshake.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>

namespace toolbridge
{

namespace
{
    using Clock = std::chrono::steady_clock;
}

auto parseToolList(const nlohmann::json& result) -> std::vector<ToolDescriptor>
{
    auto tools = std::vector<ToolDescriptor> {};

    if (!result.contains("tools") || !result["tools"].is_array())
        return tools;

    for (const auto& toolJson: result["tools"])
    {
        if (!toolJson.is_object() || !toolJson.contains("name") || !toolJson["name"].is_string())
            continue;

        tools.push_back(ToolDescriptor {
            .name = toolJson["name"].get<std::string>(),
            .description = json::getStringOr(toolJson, "description", ""),
            .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
        });
    }

    return tools;
}

auto parseToolCallResult(const nlohmann::json& result) -> ToolCallResult
{
    auto toolResult = ToolCallResult {};
    toolResult.raw = result;
    toolResult.isError = json::getBoolOr(result, "isError", false);

    if (result.contains("content") && result["content"].is_array())
    {
        toolResult.content = result["content"];
        for (const auto& item: result["content"])
        {
            if (json::getStringOr(item, "type", "") != "text")
                continue;
            if (!toolResult.text.empty())
                toolResult.text += "\n";
            toolResult.text += json::getStringOr(item, "text", "");
        }
    }

    return toolResult;
}

ToolInvoker::ToolInvoker(ServerRegistry& registry, InvokerConfig config):
    _registry(registry), _config(config)
{
}

auto ToolInvoker::listTools() -> Result<std::vector<ToolDescriptor>>
{
    return request(jsonrpc::ids::ListTools, "tools/list", nlohmann::json::object(), _config.listTimeout)
        .transform([](const nlohmann::json& result) {
            auto tools = parseToolList(result);
            log::debug("Server listed {} tools", tools.size());
            return tools;
        });
}

auto ToolInvoker::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolCallResult>
{
    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    return request(jsonrpc::ids::CallTool, "tools/call", std::move(params), _config.callTimeout)
        .transform([&name](const nlohmann::json& result) {
            auto toolResult = parseToolCallResult(result);
            log::debug("Tool '{}' returned: {} (isError: {})", name, toolResult.text, toolResult.isError);
            return toolResult;
        });
}

auto ToolInvoker::request(int64_t id,
                          std::string_view method,
                          nlohmann::json params,
                          std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    auto server = _registry.activeProcess();
    if (!server)
        return makeError(ErrorCode::NoActiveServer, "No active MCP server");

    auto const serverName = server->definition.name;

    auto result = [&]() -> Result<nlohmann::json> {
        auto const lock = std::lock_guard { server->callMutex };

        if (!server->transport->isConnected())
            return makeError(ErrorCode::TransportClosed, std::format("Connection to {} is closed", serverName));

        if (auto sent = server->transport->send(jsonrpc::makeRequest(id, method, std::move(params))); !sent)
            return makeError(ErrorCode::TransportClosed,
                             std::format("Failed sending {} to {}: {}", method, serverName, sent.error().message));

        auto const deadline = Clock::now() + timeout;
        while (true)
        {
            auto const now = Clock::now();
            if (now >= deadline)
                break;

            auto received =
                server->transport->tryReceive(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
            if (!received)
                return makeError(ErrorCode::TransportClosed,
                                 std::format("{} closed the connection during {}", serverName, method));
            if (!*received)
                continue;

            auto const& message = **received;

            if (answerPeerRequest(*server->transport, message, server->roots))
                continue;

            auto parsed = jsonrpc::parseMessage(message);
            if (!parsed || !std::holds_alternative<jsonrpc::Response>(*parsed))
            {
                log::debug("Ignoring message while waiting for {}: {}", method, json::serialize(message));
                continue;
            }

            auto const& response = std::get<jsonrpc::Response>(*parsed);
            if (!response.hasId(id))
            {
                log::debug("Ignoring uncorrelated response while waiting for {}: {}", method, json::serialize(message));
                continue;
            }

            if (response.error)
            {
                auto const& rpcError = *response.error;
                return makeError(
                    ErrorCode::ApplicationError,
                    std::format("RPC error {}: {}", rpcError.code, rpcError.message),
                    nlohmann::json { { "code", rpcError.code }, { "message", rpcError.message }, { "data", rpcError.data } });
            }

            return response.result.value_or(nlohmann::json::object());
        }

        if (!server->child->isAlive())
            return makeError(ErrorCode::TransportClosed,
                             std::format("{} exited during {}: {}", serverName, method, server->child->stderrOutput()));

        return makeError(ErrorCode::TimeoutError,
                         std::format("{} did not answer {} within {} ms", serverName, method, timeout.count()));
    }();

    if (!result && result.error().code == ErrorCode::TransportClosed)
        _registry.discard(server, result.error().message);

    return result;
}

} // namespace toolbridge
