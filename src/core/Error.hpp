// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace toolbridge
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ProtocolError,
    TimeoutError,
    ToolCallError,

    /// The child could not be started or exited right after spawning.
    SpawnFailed,
    /// No initialize response arrived within the handshake window.
    HandshakeTimeout,
    /// An operation needs an active server but none is active.
    NoActiveServer,
    /// The pipe to the child closed or broke during a call.
    TransportClosed,
    /// The provider answered with a JSON-RPC error object.
    ApplicationError,

    AgentUnavailable,
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::ToolCallError: return "ToolCallError";
        case ErrorCode::SpawnFailed: return "SpawnFailed";
        case ErrorCode::HandshakeTimeout: return "HandshakeTimeout";
        case ErrorCode::NoActiveServer: return "NoActiveServer";
        case ErrorCode::TransportClosed: return "TransportClosed";
        case ErrorCode::ApplicationError: return "ApplicationError";
        case ErrorCode::AgentUnavailable: return "AgentUnavailable";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    /// Provider supplied payload, e.g. the JSON-RPC error object of an ApplicationError.
    nlohmann::json data;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message), nullptr });
}

/// @brief Creates an unexpected Error value that carries a JSON payload.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message, nlohmann::json data)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message), std::move(data) });
}

} // namespace toolbridge

template <>
struct std::formatter<toolbridge::Error>: std::formatter<std::string>
{
    auto format(const toolbridge::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", toolbridge::errorCodeName(error.code), error.message), ctx);
    }
};
