// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerStore.hpp>
#include <mcp/SessionRoots.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief A task-solving agent that uses the providers listed in a scoped config document.
class TaskAgent
{
  public:
    virtual ~TaskAgent() = default;

    /// @brief Runs a task to completion.
    /// @param task The task text, including any context lines.
    /// @return The agent's final answer or an error.
    [[nodiscard]] virtual auto run(std::string_view task) -> Result<std::string> = 0;
};

/// @brief Creates an agent bound to the given scoped provider config document.
using AgentFactory = std::function<Result<std::unique_ptr<TaskAgent>>(const std::filesystem::path& scopedConfig)>;

/// @brief Agent backed by an external program.
///
/// The program is invoked as `argv... <scopedConfig> <task>` and its standard
/// output is the answer. A non-zero exit status is a failure.
class ExternalCommandAgent: public TaskAgent
{
  public:
    ExternalCommandAgent(std::vector<std::string> argv,
                         std::filesystem::path scopedConfig,
                         std::chrono::milliseconds timeout);

    [[nodiscard]] auto run(std::string_view task) -> Result<std::string> override;

  private:
    std::vector<std::string> _argv;
    std::filesystem::path _scopedConfig;
    std::chrono::milliseconds _timeout;
};

/// @brief Returns a factory producing ExternalCommandAgent instances, or an empty factory if @p argv is empty.
[[nodiscard]] auto makeExternalAgentFactory(std::vector<std::string> argv, std::chrono::milliseconds timeout)
    -> AgentFactory;

/// @brief Appends a `Context:` block to a task description.
///
/// Each member of @p context becomes a `- key: value` line. String values longer
/// than 200 characters are cut and marked with `...`.
[[nodiscard]] auto formatTask(std::string_view description, const nlohmann::json& context) -> std::string;

/// @brief Owns the optional task agent and keeps it pointed at the current session.
class AgentHost
{
  public:
    /// @param store Server definitions; the session-scoped filesystem provider is taken from here.
    /// @param binder Resolves session directories.
    /// @param scopedConfigPath Where the scoped provider document is written.
    /// @param factory Creates agents; an empty factory means no agent is available.
    AgentHost(const ServerStore& store,
              const SessionRootsBinder& binder,
              std::filesystem::path scopedConfigPath,
              AgentFactory factory = {});

    /// @brief Points the agent at a session directory and recreates it.
    ///
    /// Without a factory this does nothing.
    /// @param sessionId The session, or std::nullopt for the latest one.
    [[nodiscard]] auto prepareForSession(std::optional<std::string> sessionId) -> VoidResult;

    /// @brief Runs a task on the agent.
    /// @return `{success, result, agent_used}` on success, `{error, agent_used}` on
    ///         agent failure, or `{error, fallback}` when no agent is available.
    [[nodiscard]] auto runIntelligentTask(std::string_view description, const nlohmann::json& context = nullptr)
        -> nlohmann::json;

    [[nodiscard]] auto isAgentAvailable() const -> bool;

    [[nodiscard]] auto scopedConfigPath() const -> const std::filesystem::path& { return _scopedConfigPath; }

  private:
    [[nodiscard]] auto createAgent() -> VoidResult;

    const ServerStore& _store;
    const SessionRootsBinder& _binder;
    std::filesystem::path _scopedConfigPath;
    AgentFactory _factory;

    mutable std::mutex _mutex;
    std::shared_ptr<TaskAgent> _agent;
};

} // namespace toolbridge
