// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/AgentHost.hpp>
#include <core/Log.hpp>
#include <mcp/ServerRegistry.hpp>
#include <mcp/ServerStore.hpp>
#include <mcp/SessionRoots.hpp>
#include <mcp/ToolInvoker.hpp>
#include <tools/LocalTools.hpp>
#include <toolbridge/Router.hpp>

#include <istream>
#include <ostream>
#include <string>

namespace toolbridge
{

namespace
{
    using std::chrono::milliseconds;

    auto registryConfig(const TimeoutsConfig& timeouts) -> RegistryConfig
    {
        auto config = RegistryConfig {};
        config.handshake.deadline = milliseconds { timeouts.handshakeMs };
        config.handshake.settleWindow = milliseconds { timeouts.handshakeSettleMs };
        config.terminateGrace = milliseconds { timeouts.terminateGraceMs };
        return config;
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    ServerStore store;
    SessionRootsBinder binder;
    ServerRegistry registry;
    ToolInvoker invoker;
    LocalToolRegistry localTools;
    AgentHost agent;
    Router router;

    explicit Impl(AppConfig appConfig):
        config(std::move(appConfig)),
        store(serversFilePath(config)),
        binder(config.paths.recordingsDir),
        registry(store,
                 binder,
                 ProcessLauncher(LaunchConfig { .spawnGrace = milliseconds { config.timeouts.spawnGraceMs } }),
                 registryConfig(config.timeouts)),
        invoker(registry,
                InvokerConfig {
                    .listTimeout = milliseconds { config.timeouts.listToolsMs },
                    .callTimeout = milliseconds { config.timeouts.callToolMs },
                }),
        agent(store,
              binder,
              scopedProviderConfigPath(config),
              makeExternalAgentFactory(config.agent.command, milliseconds { config.agent.timeoutMs })),
        router(RouterServices { registry, invoker, localTools, agent })
    {
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    _impl->registry.deactivate();
    log::closeFile();
}

auto App::initialize() -> VoidResult
{
    auto const logPath = logFilePath(_impl->config);
    if (!log::openFile(logPath.string()))
        log::warning("Cannot open log file {}", logPath.string());

    log::info("Recordings directory: {}", _impl->config.paths.recordingsDir);
    log::info("Config directory: {}", _impl->config.paths.configDir);

    if (auto loaded = _impl->store.load(); !loaded)
        log::warning("Using default MCP servers: {}", loaded.error().message);

    if (auto prepared = _impl->agent.prepareForSession(std::nullopt); !prepared)
        log::warning("Agent not prepared: {}", prepared.error().message);

    log::info("Application initialized successfully");
    return {};
}

auto App::serve(std::istream& in, std::ostream& out) -> int
{
    auto line = std::string {};
    while (std::getline(in, line))
    {
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;
        out << _impl->router.handleLine(line) << '\n';
        out.flush();
    }

    log::info("Input closed, shutting down");
    _impl->registry.deactivate();
    return 0;
}

auto App::config() const -> const AppConfig&
{
    return _impl->config;
}

auto App::store() -> ServerStore&
{
    return _impl->store;
}

auto App::binder() -> SessionRootsBinder&
{
    return _impl->binder;
}

auto App::registry() -> ServerRegistry&
{
    return _impl->registry;
}

auto App::invoker() -> ToolInvoker&
{
    return _impl->invoker;
}

auto App::localTools() -> LocalToolRegistry&
{
    return _impl->localTools;
}

auto App::agent() -> AgentHost&
{
    return _impl->agent;
}

auto App::router() -> Router&
{
    return _impl->router;
}

} // namespace toolbridge
