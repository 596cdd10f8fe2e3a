// SPDX-License-Identifier: Apache-2.0
#include "ServerStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace toolbridge
{

namespace
{
    constexpr auto StdioToken = std::string_view { "stdio" };

    auto isAbsoluteArg(std::string_view arg) -> bool
    {
        return !arg.empty() && arg.front() == '/';
    }
} // namespace

auto toJson(const ServerDefinition& definition) -> nlohmann::json
{
    auto object = nlohmann::json {
        { "command", definition.command },
        { "args", definition.args },
        { "enabled", definition.enabled },
        { "description", definition.description },
        { "icon", definition.icon },
    };

    if (!definition.env.empty())
        object["env"] = definition.env;
    else
        object["env"] = nullptr;

    if (definition.sessionScoped != (definition.name == FilesystemServerName))
        object["sessionScoped"] = definition.sessionScoped;

    return object;
}

auto definitionFromJson(std::string_view name, const nlohmann::json& object) -> ServerDefinition
{
    return ServerDefinition {
        .name = std::string(name),
        .command = json::getStringOr(object, "command", ""),
        .args = json::getStringArray(object, "args"),
        .env = json::getStringMap(object, "env"),
        .enabled = json::getBoolOr(object, "enabled", true),
        .description = json::getStringOr(object, "description", ""),
        .icon = json::getStringOr(object, "icon", "🔧"),
        .sessionScoped = json::getBoolOr(object, "sessionScoped", name == FilesystemServerName),
    };
}

ServerStore::ServerStore(std::filesystem::path path): _path(std::move(path))
{
}

auto ServerStore::defaultServers() -> std::vector<ServerDefinition>
{
    return {
        ServerDefinition {
            .name = "filesystem",
            .command = "npx",
            .args = { "-y", "@modelcontextprotocol/server-filesystem" },
            .env = {},
            .enabled = true,
            .description = "File system operations (read, write, list)",
            .icon = "📁",
            .sessionScoped = true,
        },
        ServerDefinition {
            .name = "web-search",
            .command = "npx",
            .args = { "-y", "@modelcontextprotocol/server-brave-search", "stdio" },
            .env = { { "BRAVE_API_KEY", "" } },
            .enabled = false,
            .description = "Web search using Brave Search API",
            .icon = "🔍",
            .sessionScoped = false,
        },
        ServerDefinition {
            .name = "github",
            .command = "npx",
            .args = { "-y", "@modelcontextprotocol/server-github", "stdio" },
            .env = { { "GITHUB_TOKEN", "" } },
            .enabled = false,
            .description = "GitHub repository operations",
            .icon = "🐙",
            .sessionScoped = false,
        },
        ServerDefinition {
            .name = "postgres",
            .command = "npx",
            .args = { "-y", "@modelcontextprotocol/server-postgres", "stdio" },
            .env = { { "DATABASE_URL", "" } },
            .enabled = false,
            .description = "PostgreSQL database operations",
            .icon = "🐘",
            .sessionScoped = false,
        },
        ServerDefinition {
            .name = "puppeteer",
            .command = "npx",
            .args = { "-y", "@modelcontextprotocol/server-puppeteer", "stdio" },
            .env = {},
            .enabled = true,
            .description = "Web browser automation",
            .icon = "🎭",
            .sessionScoped = false,
        },
        ServerDefinition {
            .name = "memory",
            .command = "npx",
            .args = { "-y", "@modelcontextprotocol/server-memory", "stdio" },
            .env = {},
            .enabled = true,
            .description = "In-memory knowledge graph",
            .icon = "🧠",
            .sessionScoped = false,
        },
    };
}

auto ServerStore::load() -> VoidResult
{
    auto const lock = std::lock_guard { _mutex };

    _servers.clear();
    for (auto& server: defaultServers())
        _servers[server.name] = std::move(server);

    if (!std::filesystem::exists(_path))
    {
        log::info("No server config at {}, using built-in defaults", _path.string());
        return {};
    }

    auto document = json::readFile(_path);
    if (!document)
        return makeError(ErrorCode::ConfigError,
                         std::format("Failed to load server config {}: {}", _path.string(), document.error().message));

    if (!document->is_object() || !document->contains("servers") || !(*document)["servers"].is_object())
        return makeError(ErrorCode::ConfigError,
                         std::format("Server config {} has no \"servers\" object", _path.string()));

    for (const auto& [name, object]: (*document)["servers"].items())
    {
        if (!object.is_object())
        {
            log::warning("Ignoring malformed server entry '{}'", name);
            continue;
        }
        _servers[name] = definitionFromJson(name, object);
        log::debug("Loaded server config: {}", name);
    }

    return {};
}

auto ServerStore::save() const -> VoidResult
{
    auto const lock = std::lock_guard { _mutex };
    return saveLocked();
}

auto ServerStore::saveLocked() const -> VoidResult
{
    auto servers = nlohmann::json::object();
    for (const auto& [name, definition]: _servers)
        servers[name] = toJson(definition);

    return json::writeFileAtomically(_path, nlohmann::json { { "servers", std::move(servers) } })
        .transform([this]() { log::info("Saved MCP server configurations to {}", _path.string()); });
}

auto ServerStore::find(std::string_view name) const -> std::optional<ServerDefinition>
{
    auto const lock = std::lock_guard { _mutex };
    auto const it = _servers.find(name);
    if (it == _servers.end())
        return std::nullopt;
    return it->second;
}

auto ServerStore::all() const -> std::vector<ServerDefinition>
{
    auto const lock = std::lock_guard { _mutex };
    auto result = std::vector<ServerDefinition> {};
    result.reserve(_servers.size());
    for (const auto& [name, definition]: _servers)
        result.push_back(definition);
    return result;
}

auto ServerStore::names() const -> std::vector<std::string>
{
    auto const lock = std::lock_guard { _mutex };
    auto result = std::vector<std::string> {};
    for (const auto& [name, definition]: _servers)
        result.push_back(name);
    return result;
}

auto ServerStore::enabledServers() const -> std::vector<ServerDefinition>
{
    auto result = all();
    std::erase_if(result, [](const ServerDefinition& definition) { return !definition.enabled; });
    return result;
}

auto ServerStore::isEnabled() const -> bool
{
    return !enabledServers().empty();
}

auto ServerStore::add(ServerDefinition definition) -> VoidResult
{
    if (definition.name.empty())
        return makeError(ErrorCode::InvalidArgument, "Server name must not be empty");
    if (definition.command.empty())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Server '{}' has no command", definition.name));

    auto const lock = std::lock_guard { _mutex };
    auto const name = definition.name;
    _servers[name] = std::move(definition);
    log::info("Added MCP server '{}'", name);
    return saveLocked();
}

auto ServerStore::update(std::string_view name, const ServerUpdate& changes) -> VoidResult
{
    auto const lock = std::lock_guard { _mutex };
    auto const it = _servers.find(name);
    if (it == _servers.end())
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown server: {}", name));

    auto& definition = it->second;
    if (changes.command)
        definition.command = *changes.command;
    if (changes.args)
        definition.args = *changes.args;
    if (changes.env)
        definition.env = *changes.env;
    if (changes.enabled)
        definition.enabled = *changes.enabled;
    if (changes.description)
        definition.description = *changes.description;
    if (changes.icon)
        definition.icon = *changes.icon;

    return saveLocked();
}

auto ServerStore::remove(std::string_view name) -> VoidResult
{
    auto const lock = std::lock_guard { _mutex };
    auto const it = _servers.find(name);
    if (it == _servers.end())
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown server: {}", name));

    _servers.erase(it);
    log::info("Removed MCP server '{}'", name);
    return saveLocked();
}

auto scopedProviderArgs(const std::vector<std::string>& args) -> std::vector<std::string>
{
    auto result = args;
    std::erase_if(result, [](const std::string& arg) { return arg == StdioToken || isAbsoluteArg(arg); });
    return result;
}

auto writeScopedProviderConfig(const std::filesystem::path& path,
                               const ServerDefinition& definition,
                               const std::filesystem::path& directory) -> VoidResult
{
    auto document = nlohmann::json::object();
    if (std::filesystem::exists(path))
    {
        auto existing = json::readFile(path);
        if (existing && existing->is_object())
            document = std::move(*existing);
        else
            log::warning("Replacing unreadable provider config {}", path.string());
    }

    if (!document.contains("mcpServers") || !document["mcpServers"].is_object())
        document["mcpServers"] = nlohmann::json::object();

    auto args = scopedProviderArgs(definition.args);
    args.push_back(directory.string());

    auto entry = nlohmann::json {
        { "command", definition.command },
        { "args", std::move(args) },
    };
    if (!definition.env.empty())
        entry["env"] = definition.env;
    document["mcpServers"][definition.name] = std::move(entry);

    return json::writeFileAtomically(path, document).transform([&]() {
        log::info("Updated provider config {} with allowed directory {}", path.string(), directory.string());
    });
}

} // namespace toolbridge
