// SPDX-License-Identifier: Apache-2.0
#include "ServerRegistry.hpp"

#include <core/Log.hpp>

#include <format>

namespace toolbridge
{

namespace
{
    constexpr auto ExitedStderrWait = std::chrono::milliseconds { 200 };
}

auto toJson(const ServerInfo& info) -> nlohmann::json
{
    return nlohmann::json {
        { "name", info.name },
        { "description", info.description },
        { "icon", info.icon },
        { "enabled", info.enabled },
        { "active", info.active },
    };
}

ServerRegistry::ServerRegistry(const ServerStore& store,
                               const SessionRootsBinder& binder,
                               ProcessLauncher launcher,
                               RegistryConfig config):
    _store(store), _binder(binder), _launcher(std::move(launcher)), _config(std::move(config))
{
}

ServerRegistry::~ServerRegistry()
{
    deactivate();
}

auto ServerRegistry::activateServer(std::string_view name, std::optional<std::string> sessionId) -> VoidResult
{
    auto const transition = std::lock_guard { _transitionMutex };

    auto const definition = _store.find(name);
    if (!definition)
        return makeError(ErrorCode::InvalidArgument, std::format("Server {} not found", name));
    if (!definition->enabled)
        return makeError(ErrorCode::InvalidArgument, std::format("Server {} is not enabled", name));

    deactivateLocked();

    auto directory = _binder.resolve(sessionId ? std::optional<std::string_view>(*sessionId) : std::nullopt);
    if (!directory)
        return std::unexpected(directory.error());

    auto extraArgs = std::vector<std::string> {};
    if (definition->sessionScoped)
    {
        if (sessionId)
            log::info("Starting {} server with session path: {}", name, directory->string());
        else if (*directory != _binder.recordingsRoot())
            log::info("Starting {} server with latest session path: {}", name, directory->string());
        else
            log::info("Starting {} server with base path: {}", name, directory->string());
        extraArgs.push_back(directory->string());
    }

    auto launched = _launcher.launch(*definition, extraArgs);
    if (!launched)
        return std::unexpected(launched.error());

    auto server = std::shared_ptr<ServerProcess>(std::move(*launched));
    server->boundDirectory = *directory;
    server->roots = buildRoots(*directory);

    auto* child = server->child.get();
    auto handshake = HandshakeCoordinator(
        *server->transport, server->roots, _config.handshake, [child](std::chrono::milliseconds exitWait) {
            if (!child->waitForExit(exitWait))
                return std::optional<std::string> {};
            return std::optional<std::string>(child->stderrOutput(ExitedStderrWait));
        });

    auto capabilities = [&] {
        auto const lock = std::lock_guard { server->callMutex };
        return handshake.run();
    }();

    if (!capabilities)
    {
        server->shutdown(_config.terminateGrace);
        auto error = capabilities.error();
        error.message = std::format("Failed to activate server {}: {}", name, error.message);
        return std::unexpected(std::move(error));
    }

    {
        auto const lock = std::lock_guard { _slotMutex };
        _active = std::move(server);
    }

    log::info("Activated MCP server: {} ({} v{})", name, capabilities->serverName, capabilities->serverVersion);
    return {};
}

auto ServerRegistry::activate(std::string_view name, std::optional<std::string> sessionId) -> bool
{
    auto result = activateServer(name, std::move(sessionId));
    if (!result)
        log::error("{}", result.error().message);
    return result.has_value();
}

void ServerRegistry::deactivate()
{
    auto const transition = std::lock_guard { _transitionMutex };
    deactivateLocked();
}

void ServerRegistry::deactivateLocked()
{
    auto server = std::shared_ptr<ServerProcess> {};
    {
        auto const lock = std::lock_guard { _slotMutex };
        server = std::move(_active);
        _active.reset();
    }

    if (!server)
        return;

    server->shutdown(_config.terminateGrace);
    log::info("Deactivated MCP server: {}", server->definition.name);
}

auto ServerRegistry::activeServer() const -> std::optional<std::string>
{
    auto const lock = std::lock_guard { _slotMutex };
    if (!_active)
        return std::nullopt;
    return _active->definition.name;
}

auto ServerRegistry::activeProcess() const -> std::shared_ptr<ServerProcess>
{
    auto const lock = std::lock_guard { _slotMutex };
    return _active;
}

void ServerRegistry::discard(const std::shared_ptr<ServerProcess>& server, std::string_view reason)
{
    if (!server)
        return;

    {
        auto const lock = std::lock_guard { _slotMutex };
        if (_active == server)
            _active.reset();
    }

    log::error("MCP server {} is no longer usable: {}", server->definition.name, reason);
    server->shutdown(_config.terminateGrace);
}

auto ServerRegistry::servers() const -> std::vector<ServerInfo>
{
    auto const active = activeServer();
    auto result = std::vector<ServerInfo> {};
    for (const auto& definition: _store.all())
    {
        result.push_back(ServerInfo {
            .name = definition.name,
            .description = definition.description,
            .icon = definition.icon,
            .enabled = definition.enabled,
            .active = active && *active == definition.name,
        });
    }
    return result;
}

} // namespace toolbridge
