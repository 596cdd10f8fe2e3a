// SPDX-License-Identifier: Apache-2.0
#include "Router.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace toolbridge
{

namespace
{
    auto optionalSessionId(const nlohmann::json& payload) -> std::optional<std::string>
    {
        auto const sessionId = json::getStringOr(payload, "session_id", "");
        if (sessionId.empty())
            return std::nullopt;
        return sessionId;
    }

    auto objectOrEmpty(const nlohmann::json& payload, std::string_view key) -> nlohmann::json
    {
        auto const keyStr = std::string(key);
        if (payload.contains(keyStr) && payload[keyStr].is_object())
            return payload[keyStr];
        return nlohmann::json::object();
    }
} // namespace

auto successEnvelope(nlohmann::json data) -> nlohmann::json
{
    return nlohmann::json { { "success", true }, { "data", std::move(data) } };
}

auto failureEnvelope(const Error& error) -> nlohmann::json
{
    auto envelope = nlohmann::json {
        { "success", false },
        { "error", error.message },
        { "code", errorCodeName(error.code) },
    };
    if (!error.data.is_null())
        envelope["details"] = error.data;
    return envelope;
}

Router::Router(RouterServices services): _services(services)
{
    auto bind = [this](auto method) {
        return [this, method](const nlohmann::json& payload) { return (this->*method)(payload); };
    };

    _handlers.emplace("get_mcp_servers", bind(&Router::getServers));
    _handlers.emplace("activate_mcp_server", bind(&Router::activateServer));
    _handlers.emplace("deactivate_mcp_server", bind(&Router::deactivateServer));
    _handlers.emplace("list_mcp_tools", bind(&Router::listTools));
    _handlers.emplace("execute_mcp_tool", bind(&Router::executeTool));
    _handlers.emplace("mcp_tool_call", bind(&Router::localToolCall));
    _handlers.emplace("run_intelligent_task", bind(&Router::runIntelligentTask));
    _handlers.emplace("prepare_session", bind(&Router::prepareSession));
    _handlers.emplace("health", bind(&Router::health));
}

auto Router::handle(const nlohmann::json& message) -> nlohmann::json
{
    auto const action = json::getStringOr(message, "action", "");
    auto reply = nlohmann::json {
        { "id", message.is_object() && message.contains("id") ? message["id"] : nlohmann::json() },
        { "type", "response" },
        { "action", action },
    };

    log::info("Received message: {}", action.empty() ? "<none>" : action);

    auto const it = _handlers.find(action);
    if (it == _handlers.end())
    {
        reply["payload"] = failureEnvelope(
            Error { ErrorCode::InvalidArgument, std::format("Unknown action: {}", action), nullptr });
        log::warning("Unknown action: {}", action);
        return reply;
    }

    auto result = it->second(objectOrEmpty(message, "payload"));
    if (result)
        reply["payload"] = successEnvelope(std::move(*result));
    else
    {
        log::error("Action {} failed: {}", action, result.error());
        reply["payload"] = failureEnvelope(result.error());
    }
    return reply;
}

auto Router::handleLine(std::string_view line) -> std::string
{
    auto parsed = json::parse(line);
    if (!parsed || !parsed->is_object())
    {
        auto const error = parsed ? Error { ErrorCode::ProtocolError, "Message must be a JSON object", nullptr }
                                  : parsed.error();
        return json::serialize(nlohmann::json {
            { "id", nullptr },
            { "type", "response" },
            { "action", "" },
            { "payload", failureEnvelope(error) },
        });
    }
    return json::serialize(handle(*parsed));
}

auto Router::actions() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    for (auto const& [name, handler]: _handlers)
        names.push_back(name);
    return names;
}

auto Router::getServers(const nlohmann::json&) -> Result<nlohmann::json>
{
    auto list = nlohmann::json::array();
    for (auto const& info: _services.registry.servers())
        list.push_back(toJson(info));
    return list;
}

auto Router::activateServer(const nlohmann::json& payload) -> Result<nlohmann::json>
{
    return json::getString(payload, "server_name")
        .transform_error([](Error error) {
            error.code = ErrorCode::InvalidArgument;
            return error;
        })
        .and_then([&](const std::string& name) -> Result<nlohmann::json> {
            return _services.registry.activateServer(name, optionalSessionId(payload)).transform([&name]() {
                return nlohmann::json { { "active", name } };
            });
        });
}

auto Router::deactivateServer(const nlohmann::json&) -> Result<nlohmann::json>
{
    _services.registry.deactivate();
    return nlohmann::json { { "active", nullptr } };
}

auto Router::listTools(const nlohmann::json&) -> Result<nlohmann::json>
{
    return _services.invoker.listTools().transform([](const std::vector<ToolDescriptor>& tools) {
        auto list = nlohmann::json::array();
        for (auto const& tool: tools)
            list.push_back(toJson(tool));
        return list;
    });
}

auto Router::executeTool(const nlohmann::json& payload) -> Result<nlohmann::json>
{
    auto const toolName = json::getStringOr(payload, "tool_name", "");
    if (toolName.empty())
        return makeError(ErrorCode::InvalidArgument, "Missing required parameter: tool_name");

    return _services.invoker.callTool(toolName, objectOrEmpty(payload, "params"))
        .transform([](const ToolCallResult& result) {
            return nlohmann::json {
                { "content", result.content },
                { "text", result.text },
                { "isError", result.isError },
            };
        });
}

auto Router::localToolCall(const nlohmann::json& payload) -> Result<nlohmann::json>
{
    auto const tool = json::getStringOr(payload, "tool", "");
    if (tool.empty())
        return makeError(ErrorCode::InvalidArgument, "Missing required parameter: tool");

    return _services.localTools.execute(tool, objectOrEmpty(payload, "params"));
}

auto Router::runIntelligentTask(const nlohmann::json& payload) -> Result<nlohmann::json>
{
    auto const task = json::getStringOr(payload, "task", "");
    if (task.empty())
        return makeError(ErrorCode::InvalidArgument, "Missing required parameter: task");

    return _services.agent.runIntelligentTask(task, objectOrEmpty(payload, "context"));
}

auto Router::prepareSession(const nlohmann::json& payload) -> Result<nlohmann::json>
{
    auto const sessionId = optionalSessionId(payload);
    return _services.agent.prepareForSession(sessionId).transform([this]() {
        return nlohmann::json { { "agent_available", _services.agent.isAgentAvailable() } };
    });
}

auto Router::health(const nlohmann::json&) -> Result<nlohmann::json>
{
    auto const active = _services.registry.activeServer();
    return nlohmann::json {
        { "status", "healthy" },
        { "services",
          nlohmann::json {
              { "local_tools", !_services.localTools.list().empty() },
              { "agent", _services.agent.isAgentAvailable() },
          } },
        { "active_server", active ? nlohmann::json(*active) : nlohmann::json() },
    };
}

} // namespace toolbridge
