// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ServerStore.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace toolbridge
{

/// @brief Handle to a spawned child process and its captured stderr.
///
/// The child runs in its own process group so that terminate() also reaches
/// helper processes it started (e.g. the node process behind npx).
class ChildProcess
{
  public:
    /// @brief Takes ownership of the child and the read end of its stderr pipe.
    /// @param pid The child process id.
    /// @param stderrRead Read end of the stderr pipe, or -1 if not captured.
    /// @param label Name used to prefix forwarded stderr log lines.
    ChildProcess(pid_t pid, int stderrRead, std::string label);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] auto pid() const -> pid_t;

    /// @brief Non-blocking liveness check; reaps the child once it exited.
    [[nodiscard]] auto isAlive() -> bool;

    /// @brief Waits up to @p timeout for the child to exit.
    /// @return true once the child has exited, false if it is still running.
    [[nodiscard]] auto waitForExit(std::chrono::milliseconds timeout) -> bool;

    /// @brief Exit code of the reaped child; negative values are terminating signals.
    [[nodiscard]] auto exitCode() const -> std::optional<int>;

    /// @brief Returns the stderr text captured so far.
    /// @param waitForEof How long to wait for the stream to end, for a child that already exited.
    [[nodiscard]] auto stderrOutput(std::chrono::milliseconds waitForEof = std::chrono::milliseconds { 0 })
        -> std::string;

    /// @brief Sends SIGTERM, waits up to @p grace, then SIGKILLs and reaps the child.
    ///
    /// Idempotent; safe to call for a child that already exited.
    void terminate(std::chrono::milliseconds grace);

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief A running tool-provider: its definition, process handle and channel.
///
/// All requests on one server are serialized through callMutex.
struct ServerProcess
{
    ServerDefinition definition;
    std::vector<std::string> argv;

    /// The directory advertised through roots/list.
    std::filesystem::path boundDirectory;
    std::vector<Root> roots;

    std::unique_ptr<ChildProcess> child;
    std::unique_ptr<Transport> transport;
    std::mutex callMutex;

    /// @brief Interrupts pending reads, closes the pipes and terminates the child.
    ///
    /// Waits for an in-flight request to give up before closing the pipes.
    void shutdown(std::chrono::milliseconds grace);
};

/// @brief Configuration for the process launcher.
struct LaunchConfig
{
    /// How long a freshly spawned child must survive to count as started.
    std::chrono::milliseconds spawnGrace { 500 };
};

/// @brief Captured output of a short-lived command.
struct CommandOutput
{
    std::string stdoutText;
    std::string stderrText;
    int exitCode = 0;
};

/// @brief Starts tool-provider processes with piped stdin, stdout and stderr.
class ProcessLauncher
{
  public:
    explicit ProcessLauncher(LaunchConfig config = {});

    /// @brief Spawns the provider and waits for the startup grace period.
    /// @param definition The server to start.
    /// @param extraArgs Arguments appended after the definition's own.
    /// @return The running server, or SpawnFailed with the child's stderr.
    [[nodiscard]] auto launch(const ServerDefinition& definition,
                              const std::vector<std::string>& extraArgs = {}) const
        -> Result<std::unique_ptr<ServerProcess>>;

    /// @brief Returns the argv a launch() of @p definition would use.
    [[nodiscard]] static auto buildArgv(const ServerDefinition& definition,
                                        const std::vector<std::string>& extraArgs)
        -> std::vector<std::string>;

    /// @brief Returns the current environment with @p overrides applied, as KEY=VALUE strings.
    [[nodiscard]] static auto buildEnvironment(const std::map<std::string, std::string>& overrides)
        -> std::vector<std::string>;

    [[nodiscard]] auto config() const -> const LaunchConfig& { return _config; }

  private:
    LaunchConfig _config;
};

/// @brief Runs a command without a shell and collects its output.
///
/// The command is killed if it does not finish within @p timeout.
/// @param argv Program and arguments; the program is looked up in PATH.
/// @param timeout Upper bound for the run.
/// @return The output, SpawnFailed if it could not be started, or TimeoutError.
[[nodiscard]] auto runCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout)
    -> Result<CommandOutput>;

} // namespace toolbridge
