// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>

namespace toolbridge
{

namespace
{
    constexpr auto AppName = std::string_view { "toolbridge" };
    constexpr auto ConfigFilename = std::string_view { "app.json" };

    auto homeDir() -> std::string
    {
        auto const* const home = std::getenv("HOME");
        if (home && *home)
            return home;
        return ".";
    }

    auto envOr(char const* name, std::string_view fallback) -> std::string
    {
        auto const* const value = std::getenv(name);
        if (value && *value)
            return value;
        return std::string(fallback);
    }

    auto resolveDir(char const* envName, std::string& configured, std::string_view fallback) -> VoidResult
    {
        auto const* const fromEnv = std::getenv(envName);
        if (fromEnv && *fromEnv)
            configured = fromEnv;
        else if (configured.empty())
            configured = std::string(fallback);

        configured = expandHome(configured);

        auto ec = std::error_code {};
        auto const absolute = std::filesystem::absolute(configured, ec);
        if (!ec)
            configured = absolute.lexically_normal().string();

        std::filesystem::create_directories(configured, ec);
        if (ec)
            return makeError(ErrorCode::ConfigError,
                             std::format("Failed to create directory '{}': {}", configured, ec.message()));
        return {};
    }
} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::format("{}/{}", xdgConfig, AppName);
    return std::format("{}/.config/{}", homeDir(), AppName);
}

auto defaultLogsDir() -> std::string
{
    auto const* const xdgState = std::getenv("XDG_STATE_HOME");
    if (xdgState && *xdgState)
        return std::format("{}/{}/logs", xdgState, AppName);
    return std::format("{}/.local/state/{}/logs", homeDir(), AppName);
}

auto defaultRecordingsDir() -> std::string
{
    return std::format("{}/Documents/{}/recordings", homeDir(), AppName);
}

auto defaultConfigPath() -> std::string
{
    return std::format("{}/{}", expandHome(envOr("TOOLBRIDGE_CONFIG_DIR", defaultConfigDir())), ConfigFilename);
}

auto expandHome(std::string_view path) -> std::string
{
    if (path == "~")
        return homeDir();
    if (path.starts_with("~/"))
        return homeDir() + std::string(path.substr(1));
    return std::string(path);
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto parseResult = json::readFile(std::filesystem::path(path));
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Cannot load config file {}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    auto config = AppConfig {};

    // Paths; the flat form of older config files is accepted as well.
    auto const& paths = root.contains("paths") ? root["paths"] : root;
    config.paths.recordingsDir = json::getStringOr(paths, "recordingsDir", "");
    config.paths.logsDir = json::getStringOr(paths, "logsDir", "");
    config.paths.configDir = json::getStringOr(paths, "configDir", "");

    if (root.contains("timeouts"))
    {
        auto const& timeouts = root["timeouts"];
        auto const defaults = TimeoutsConfig {};
        config.timeouts.handshakeMs = json::getIntOr(timeouts, "handshakeMs", defaults.handshakeMs);
        config.timeouts.handshakeSettleMs = json::getIntOr(timeouts, "handshakeSettleMs", defaults.handshakeSettleMs);
        config.timeouts.spawnGraceMs = json::getIntOr(timeouts, "spawnGraceMs", defaults.spawnGraceMs);
        config.timeouts.listToolsMs = json::getIntOr(timeouts, "listToolsMs", defaults.listToolsMs);
        config.timeouts.callToolMs = json::getIntOr(timeouts, "callToolMs", defaults.callToolMs);
        config.timeouts.terminateGraceMs = json::getIntOr(timeouts, "terminateGraceMs", defaults.terminateGraceMs);
    }

    if (root.contains("agent"))
    {
        auto const& agent = root["agent"];
        config.agent.command = json::getStringArray(agent, "command");
        config.agent.timeoutMs = json::getIntOr(agent, "timeoutMs", AgentConfig {}.timeoutMs);
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto paths = nlohmann::json::object();
    if (!config.paths.recordingsDir.empty())
        paths["recordingsDir"] = config.paths.recordingsDir;
    if (!config.paths.logsDir.empty())
        paths["logsDir"] = config.paths.logsDir;
    if (!config.paths.configDir.empty())
        paths["configDir"] = config.paths.configDir;
    root["paths"] = std::move(paths);

    root["timeouts"] = nlohmann::json {
        { "handshakeMs", config.timeouts.handshakeMs },
        { "handshakeSettleMs", config.timeouts.handshakeSettleMs },
        { "spawnGraceMs", config.timeouts.spawnGraceMs },
        { "listToolsMs", config.timeouts.listToolsMs },
        { "callToolMs", config.timeouts.callToolMs },
        { "terminateGraceMs", config.timeouts.terminateGraceMs },
    };

    root["agent"] = nlohmann::json {
        { "command", config.agent.command },
        { "timeoutMs", config.agent.timeoutMs },
    };

    auto written = json::writeFileAtomically(std::filesystem::path(path), root);
    if (!written)
        return makeError(ErrorCode::ConfigError, written.error().message);
    return {};
}

auto loadConfig(std::string_view path) -> Result<AppConfig>
{
    auto const configPath = path.empty() ? defaultConfigPath() : expandHome(path);

    auto config = AppConfig {};
    if (std::filesystem::exists(configPath))
    {
        auto loaded = loadConfigFromFile(configPath);
        if (!loaded)
            return std::unexpected(loaded.error());
        config = std::move(*loaded);
    }
    else
        log::debug("No config file found at {}, using defaults", configPath);

    if (config.paths.configDir.empty())
        config.paths.configDir = std::filesystem::path(configPath).parent_path().string();

    return resolvePaths(config).transform([&]() { return std::move(config); });
}

auto resolvePaths(AppConfig& config) -> VoidResult
{
    return resolveDir("TOOLBRIDGE_CONFIG_DIR", config.paths.configDir, defaultConfigDir())
        .and_then([&]() { return resolveDir("TOOLBRIDGE_LOGS_DIR", config.paths.logsDir, defaultLogsDir()); })
        .and_then([&]() {
            return resolveDir("TOOLBRIDGE_RECORDINGS_DIR", config.paths.recordingsDir, defaultRecordingsDir());
        });
}

auto serversFilePath(const AppConfig& config) -> std::filesystem::path
{
    return std::filesystem::path(config.paths.configDir) / "mcp_servers.json";
}

auto scopedProviderConfigPath(const AppConfig& config) -> std::filesystem::path
{
    return std::filesystem::path(config.paths.configDir) / "mcp_config.json";
}

auto logFilePath(const AppConfig& config) -> std::filesystem::path
{
    return std::filesystem::path(config.paths.logsDir) / "toolbridge.log";
}

} // namespace toolbridge
