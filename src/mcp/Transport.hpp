// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>

namespace toolbridge
{

/// @brief Abstract interface for a bidirectional JSON message channel to a provider.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the server and flushes it.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Waits up to @p timeout for the next JSON message.
    /// @return The message, std::nullopt if nothing arrived in time, or a
    ///         TransportClosed error once the stream ended or was interrupted.
    [[nodiscard]] virtual auto tryReceive(std::chrono::milliseconds timeout)
        -> Result<std::optional<nlohmann::json>> = 0;

    /// @brief Wakes up any pending tryReceive() and makes all later ones fail.
    ///
    /// Safe to call from another thread.
    virtual void interrupt() = 0;

    /// @brief Closes the transport connection.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace toolbridge
