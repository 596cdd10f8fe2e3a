// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Protocol revision announced in the initialize request.
constexpr auto McpProtocolVersion = std::string_view { "2025-06-18" };

/// @brief Timing and identity parameters of the initialize handshake.
struct HandshakeConfig
{
    /// Hard upper bound for the whole handshake.
    std::chrono::milliseconds deadline { 5000 };

    /// How long to keep listening for a late roots/list request after the initialize response.
    std::chrono::milliseconds settleWindow { 250 };

    /// How long a provider that closed its output gets to finish exiting before its stderr is collected.
    std::chrono::milliseconds exitWait { 500 };

    std::string clientName = "toolbridge";
    std::string clientVersion = "1.0.0";
};

/// @brief Server capabilities reported by a successful initialize.
struct ServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
};

/// @brief Method of the provider-initiated roots request.
constexpr auto RootsListMethod = std::string_view { "roots/list" };

/// @brief Answers a provider-initiated request arriving on @p transport.
///
/// roots/list is answered with @p roots, ping with an empty result, anything
/// else with a method-not-found error. Used during and after the handshake,
/// since providers may ask for roots at any time.
/// @return The method of the answered request, or std::nullopt if @p message
///         is not a request.
[[nodiscard]] auto answerPeerRequest(Transport& transport,
                                     const nlohmann::json& message,
                                     const std::vector<Root>& roots) -> std::optional<std::string>;

/// @brief Drives the MCP initialize exchange with a freshly started provider.
///
/// The provider may ask for roots before or after it acknowledges initialize;
/// every roots/list request seen before the deadline is answered with the bound
/// directory.
class HandshakeCoordinator
{
  public:
    enum class State
    {
        NotStarted,
        AwaitingInitResponse,
        Ready,
        Failed,
    };

    /// @brief Returns stderr text of the child if it exits within the given wait, std::nullopt while it runs.
    using ExitProbe = std::function<std::optional<std::string>(std::chrono::milliseconds)>;

    /// @param transport The channel to the provider; must outlive the coordinator.
    /// @param roots The roots to advertise.
    /// @param config Timing and client identity.
    /// @param exitProbe Optional probe used to attach the child's stderr to failures.
    HandshakeCoordinator(Transport& transport, std::vector<Root> roots, HandshakeConfig config, ExitProbe exitProbe = {});

    /// @brief Runs the handshake to completion.
    /// @return The server's capabilities, HandshakeTimeout if no initialize response
    ///         arrived in time, ApplicationError if the provider rejected initialize,
    ///         or TransportClosed if the channel broke.
    [[nodiscard]] auto run() -> Result<ServerCapabilities>;

    [[nodiscard]] auto state() const -> State { return _state; }

    /// @brief Number of roots/list requests answered during the handshake.
    [[nodiscard]] auto rootsRequestsServed() const -> int { return _rootsServed; }

  private:
    [[nodiscard]] auto fail(Error error) -> std::unexpected<Error>;
    [[nodiscard]] auto withExitDetail(std::string message, std::chrono::milliseconds exitWait) const -> std::string;

    Transport& _transport;
    std::vector<Root> _roots;
    HandshakeConfig _config;
    ExitProbe _exitProbe;
    State _state = State::NotStarted;
    int _rootsServed = 0;
};

[[nodiscard]] constexpr auto stateName(HandshakeCoordinator::State state) -> std::string_view
{
    switch (state)
    {
        case HandshakeCoordinator::State::NotStarted: return "NotStarted";
        case HandshakeCoordinator::State::AwaitingInitResponse: return "AwaitingInitResponse";
        case HandshakeCoordinator::State::Ready: return "Ready";
        case HandshakeCoordinator::State::Failed: return "Failed";
    }
    return "Unknown";
}

} // namespace toolbridge
