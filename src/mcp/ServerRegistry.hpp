// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Handshake.hpp>
#include <mcp/ProcessLauncher.hpp>
#include <mcp/ServerStore.hpp>
#include <mcp/SessionRoots.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Timing configuration of the registry.
struct RegistryConfig
{
    HandshakeConfig handshake;

    /// How long a provider may take to exit after SIGTERM before it is killed.
    std::chrono::milliseconds terminateGrace { 100 };
};

/// @brief Summary of a configured server as shown to the router.
struct ServerInfo
{
    std::string name;
    std::string description;
    std::string icon;
    bool enabled = false;
    bool active = false;
};

[[nodiscard]] auto toJson(const ServerInfo& info) -> nlohmann::json;

/// @brief Owns the single active tool-provider process.
///
/// At most one provider is active at any time. Activating a server fully shuts
/// down the previous one first. After any failed activation or transport failure
/// the active slot is empty.
class ServerRegistry
{
  public:
    /// @param store The server definitions; must outlive the registry.
    /// @param binder Resolves session directories; must outlive the registry.
    /// @param launcher Starts provider processes.
    /// @param config Handshake and termination timing.
    ServerRegistry(const ServerStore& store,
                   const SessionRootsBinder& binder,
                   ProcessLauncher launcher,
                   RegistryConfig config);
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    /// @brief Starts and initializes a server, making it the active one.
    /// @param name The configured server name.
    /// @param sessionId The session whose directory the server may access, or the latest one.
    /// @return Success, or the reason the activation failed.
    [[nodiscard]] auto activateServer(std::string_view name, std::optional<std::string> sessionId = std::nullopt)
        -> VoidResult;

    /// @brief Boolean form of activateServer(); failures are logged.
    [[nodiscard]] auto activate(std::string_view name, std::optional<std::string> sessionId = std::nullopt) -> bool;

    /// @brief Shuts down the active server, if any. Never fails.
    void deactivate();

    /// @brief Returns the name of the active server.
    [[nodiscard]] auto activeServer() const -> std::optional<std::string>;

    /// @brief Returns the active server process, or nullptr.
    [[nodiscard]] auto activeProcess() const -> std::shared_ptr<ServerProcess>;

    /// @brief Drops @p server from the active slot after it died, and shuts it down.
    ///
    /// Must not be called while holding the server's callMutex.
    void discard(const std::shared_ptr<ServerProcess>& server, std::string_view reason);

    /// @brief Lists all configured servers with their active flag.
    [[nodiscard]] auto servers() const -> std::vector<ServerInfo>;

  private:
    void deactivateLocked();

    const ServerStore& _store;
    const SessionRootsBinder& _binder;
    ProcessLauncher _launcher;
    RegistryConfig _config;

    std::mutex _transitionMutex;
    mutable std::mutex _slotMutex;
    std::shared_ptr<ServerProcess> _active;
};

} // namespace toolbridge
