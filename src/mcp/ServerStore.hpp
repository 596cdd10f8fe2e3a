// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Configuration for a single MCP server.
struct ServerDefinition
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled = true;
    std::string description;
    std::string icon = "🔧";

    /// The provider gets the bound session directory appended to its arguments.
    bool sessionScoped = false;
};

/// @brief Partial update of a server definition; unset fields are left unchanged.
struct ServerUpdate
{
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> args;
    std::optional<std::map<std::string, std::string>> env;
    std::optional<bool> enabled;
    std::optional<std::string> description;
    std::optional<std::string> icon;
};

/// @brief Name of the built-in filesystem provider.
constexpr auto FilesystemServerName = std::string_view { "filesystem" };

/// @brief Serializes a definition to its config-file object (without the name key).
[[nodiscard]] auto toJson(const ServerDefinition& definition) -> nlohmann::json;

/// @brief Builds a definition from its config-file object.
/// @param name The server name (the object's key in the config file).
/// @param object The server object.
[[nodiscard]] auto definitionFromJson(std::string_view name, const nlohmann::json& object) -> ServerDefinition;

/// @brief Persistent registry of named server definitions.
///
/// Built-in defaults are merged with the persisted file, persisted entries
/// winning by name. Every mutation rewrites the whole file atomically.
class ServerStore
{
  public:
    /// @brief Constructs a store backed by the given file; call load() to populate it.
    explicit ServerStore(std::filesystem::path path);

    /// @brief Returns the built-in server definitions.
    [[nodiscard]] static auto defaultServers() -> std::vector<ServerDefinition>;

    /// @brief Loads the defaults, then overlays the persisted file if it exists.
    ///
    /// On a malformed file the defaults remain loaded and the error is returned.
    [[nodiscard]] auto load() -> VoidResult;

    /// @brief Writes all definitions to the backing file.
    [[nodiscard]] auto save() const -> VoidResult;

    [[nodiscard]] auto find(std::string_view name) const -> std::optional<ServerDefinition>;
    [[nodiscard]] auto all() const -> std::vector<ServerDefinition>;
    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto enabledServers() const -> std::vector<ServerDefinition>;

    /// @brief Returns true if at least one server is enabled.
    [[nodiscard]] auto isEnabled() const -> bool;

    /// @brief Adds or replaces a definition and persists the registry.
    [[nodiscard]] auto add(ServerDefinition definition) -> VoidResult;

    /// @brief Applies a partial update to an existing definition and persists the registry.
    [[nodiscard]] auto update(std::string_view name, const ServerUpdate& changes) -> VoidResult;

    /// @brief Removes a definition and persists the registry.
    [[nodiscard]] auto remove(std::string_view name) -> VoidResult;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

  private:
    [[nodiscard]] auto saveLocked() const -> VoidResult;

    std::filesystem::path _path;
    mutable std::mutex _mutex;
    std::map<std::string, ServerDefinition, std::less<>> _servers;
};

/// @brief Rewrites the document that points a session-scoped provider at a directory.
///
/// Produces `{"mcpServers": {name: {command, args}}}`, keeping other entries of an
/// existing document. The `stdio` token and previously appended absolute paths are
/// removed from the arguments before @p directory is appended.
/// @param path The document to write.
/// @param definition The session-scoped provider.
/// @param directory The directory the provider may access.
[[nodiscard]] auto writeScopedProviderConfig(const std::filesystem::path& path,
                                             const ServerDefinition& definition,
                                             const std::filesystem::path& directory) -> VoidResult;

/// @brief Returns @p args without the implicit transport token and stale directory arguments.
[[nodiscard]] auto scopedProviderArgs(const std::vector<std::string>& args) -> std::vector<std::string>;

} // namespace toolbridge
