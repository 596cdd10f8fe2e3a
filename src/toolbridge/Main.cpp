// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ServerRegistry.hpp>
#include <mcp/ServerStore.hpp>
#include <mcp/SessionRoots.hpp>
#include <mcp/ToolInvoker.hpp>
#include <toolbridge/App.hpp>
#include <toolbridge/Config.hpp>

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <print>

namespace
{

auto optionalSession(const std::string& sessionId) -> std::optional<std::string>
{
    if (sessionId.empty())
        return std::nullopt;
    return sessionId;
}

auto printServers(toolbridge::App& app) -> int
{
    for (auto const& info: app.registry().servers())
        std::println("{} {:<12} {:<8} {}", info.icon, info.name, info.enabled ? "enabled" : "disabled", info.description);
    return 0;
}

auto printTools(toolbridge::App& app, const std::string& server, const std::string& sessionId) -> int
{
    auto tools = app.registry()
                     .activateServer(server, optionalSession(sessionId))
                     .and_then([&]() { return app.invoker().listTools(); });
    if (!tools)
    {
        std::println(stderr, "{}", tools.error());
        return 1;
    }

    for (auto const& tool: *tools)
        std::println("{}: {}", tool.name, tool.description);
    return 0;
}

auto callTool(toolbridge::App& app,
              const std::string& server,
              const std::string& tool,
              const std::string& arguments,
              const std::string& sessionId) -> int
{
    auto parsedArguments = nlohmann::json::object();
    if (!arguments.empty())
    {
        auto parsed = toolbridge::json::parse(arguments);
        if (!parsed || !parsed->is_object())
        {
            std::println(stderr, "Tool arguments must be a JSON object");
            return 2;
        }
        parsedArguments = std::move(*parsed);
    }

    auto result = app.registry()
                      .activateServer(server, optionalSession(sessionId))
                      .and_then([&]() { return app.invoker().callTool(tool, parsedArguments); });
    if (!result)
    {
        std::println(stderr, "{}", result.error());
        if (!result.error().data.is_null())
            std::println(stderr, "{}", json::serialize(result.error().data, 2));
        return 1;
    }

    std::println("{}", result->text.empty() ? json::serialize(result->content, 2) : result->text);
    return result->isError ? 1 : 0;
}

auto printResolved(toolbridge::App& app, const std::string& sessionId) -> int
{
    auto const sessionView =
        sessionId.empty() ? std::optional<std::string_view> {} : std::optional<std::string_view> { sessionId };
    auto directory = app.binder().resolve(sessionView);
    if (!directory)
    {
        std::println(stderr, "{}", directory.error());
        return 1;
    }

    std::println("{}", directory->string());
    std::println("{}", toolbridge::fileUri(*directory));
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto cli = CLI::App { "toolbridge: runs MCP tool-provider processes and calls their tools" };
    cli.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    cli.add_option("-c,--config", configPath, "Path to config file");
    cli.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto server = std::string {};
    auto tool = std::string {};
    auto arguments = std::string {};
    auto sessionId = std::string {};

    auto* serversCmd = cli.add_subcommand("servers", "List configured MCP servers");

    auto* toolsCmd = cli.add_subcommand("tools", "Activate a server and list its tools");
    toolsCmd->add_option("server", server, "Server name")->required();
    toolsCmd->add_option("--session", sessionId, "Recording session id");

    auto* callCmd = cli.add_subcommand("call", "Activate a server and call one of its tools");
    callCmd->add_option("server", server, "Server name")->required();
    callCmd->add_option("tool", tool, "Tool name")->required();
    callCmd->add_option("arguments", arguments, "Tool arguments as a JSON object");
    callCmd->add_option("--session", sessionId, "Recording session id");

    auto* resolveCmd = cli.add_subcommand("resolve", "Print the directory a session resolves to");
    resolveCmd->add_option("--session", sessionId, "Recording session id");

    auto* serveCmd = cli.add_subcommand("serve", "Handle JSON request lines on stdin");

    CLI11_PARSE(cli, argc, argv);

    if (auto const* const envLevel = std::getenv("TOOLBRIDGE_LOG_LEVEL"); envLevel)
    {
        if (auto const level = toolbridge::log::levelFromString(envLevel); level)
            toolbridge::log::setLevel(*level);
        else
            toolbridge::log::warning("Ignoring unknown TOOLBRIDGE_LOG_LEVEL: {}", envLevel);
    }
    if (verbose)
        toolbridge::log::setLevel(toolbridge::log::Level::Debug);

    auto configResult = toolbridge::loadConfig(configPath);
    if (!configResult)
    {
        toolbridge::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto application = toolbridge::App(std::move(*configResult));
    if (auto initResult = application.initialize(); !initResult)
    {
        toolbridge::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    if (*serversCmd)
        return printServers(application);
    if (*toolsCmd)
        return printTools(application, server, sessionId);
    if (*callCmd)
        return callTool(application, server, tool, arguments, sessionId);
    if (*resolveCmd)
        return printResolved(application, sessionId);
    if (*serveCmd)
        return application.serve(std::cin, std::cout);

    return 0;
}
