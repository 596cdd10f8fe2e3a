// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Directory configuration section.
///
/// Empty values are resolved by resolvePaths().
struct PathsConfig
{
    std::string recordingsDir;
    std::string logsDir;
    std::string configDir;
};

/// @brief Timing configuration section, all values in milliseconds.
struct TimeoutsConfig
{
    int handshakeMs = 5000;
    int handshakeSettleMs = 250;
    int spawnGraceMs = 500;
    int listToolsMs = 2000;
    int callToolMs = 30000;
    int terminateGraceMs = 100;
};

/// @brief Task agent configuration section.
struct AgentConfig
{
    /// Program and leading arguments of the external agent; empty disables the agent.
    std::vector<std::string> command;
    int timeoutMs = 120000;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    PathsConfig paths;
    TimeoutsConfig timeouts;
    AgentConfig agent;
};

/// @brief Returns the default config directory ($XDG_CONFIG_HOME/toolbridge or ~/.config/toolbridge).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default logs directory ($XDG_STATE_HOME/toolbridge/logs or ~/.local/state/toolbridge/logs).
[[nodiscard]] auto defaultLogsDir() -> std::string;

/// @brief Returns the default recordings directory (~/Documents/toolbridge/recordings).
[[nodiscard]] auto defaultRecordingsDir() -> std::string;

/// @brief Returns the config file path inside the config directory.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Replaces a leading `~` with the home directory.
[[nodiscard]] auto expandHome(std::string_view path) -> std::string;

/// @brief Loads the configuration from a specific file.
/// @param path The config file.
/// @return The configuration with unresolved paths, or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the configuration to a file, creating its directory.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Loads the configuration from @p path, or the default path when empty.
///
/// A missing file yields the defaults. Paths are resolved afterwards.
[[nodiscard]] auto loadConfig(std::string_view path = {}) -> Result<AppConfig>;

/// @brief Resolves every directory of @p config and creates it.
///
/// Each directory is taken from its environment variable
/// (TOOLBRIDGE_RECORDINGS_DIR, TOOLBRIDGE_LOGS_DIR, TOOLBRIDGE_CONFIG_DIR), then
/// from the configuration, then from the platform default.
[[nodiscard]] auto resolvePaths(AppConfig& config) -> VoidResult;

/// @brief Persisted server definitions file.
[[nodiscard]] auto serversFilePath(const AppConfig& config) -> std::filesystem::path;

/// @brief Scoped provider document handed to the agent.
[[nodiscard]] auto scopedProviderConfigPath(const AppConfig& config) -> std::filesystem::path;

/// @brief Application log file.
[[nodiscard]] auto logFilePath(const AppConfig& config) -> std::filesystem::path;

} // namespace toolbridge
