// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Configuration of the built-in local tools.
struct LocalToolsConfig
{
    /// Programs execute_command may run.
    std::vector<std::string> allowedCommands { "ls", "pwd", "echo", "date", "whoami" };
    std::chrono::milliseconds commandTimeout { 10000 };
};

/// @brief Tools executed in-process, without an MCP server.
///
/// Built-in tools are file_read, file_write, file_list, json_parse,
/// text_extract and execute_command.
class LocalToolRegistry
{
  public:
    using Handler = std::function<Result<nlohmann::json>(const nlohmann::json& params)>;

    explicit LocalToolRegistry(LocalToolsConfig config = {});

    LocalToolRegistry(const LocalToolRegistry&) = delete;
    LocalToolRegistry& operator=(const LocalToolRegistry&) = delete;

    /// @brief Registers (or replaces) a tool.
    void add(std::string name, std::string description, Handler handler);

    /// @brief Runs a tool.
    /// @param name The tool name.
    /// @param params The tool parameters object.
    /// @return The tool output, InvalidArgument for unknown tools or bad parameters, or the tool's own error.
    [[nodiscard]] auto execute(std::string_view name, const nlohmann::json& params) const
        -> Result<nlohmann::json>;

    /// @brief Returns tool name to description.
    [[nodiscard]] auto list() const -> std::map<std::string, std::string>;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

  private:
    struct Entry
    {
        std::string description;
        Handler handler;
    };

    void registerBuiltins();

    LocalToolsConfig _config;
    std::map<std::string, Entry, std::less<>> _tools;
};

/// @brief Matches @p name against a shell-style pattern with `*` and `?`.
[[nodiscard]] auto matchesGlob(std::string_view pattern, std::string_view name) -> bool;

} // namespace toolbridge
