// SPDX-License-Identifier: Apache-2.0
#include "ProcessLauncher.hpp"

#include <core/Log.hpp>
#include <mcp/StdioTransport.hpp>

#include <array>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <format>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace toolbridge
{

namespace
{
    using Clock = std::chrono::steady_clock;

    constexpr auto MaxCapturedStderr = size_t { 64 } * 1024;
    constexpr auto LivenessPollInterval = std::chrono::milliseconds { 10 };
    constexpr auto StartupStderrWait = std::chrono::milliseconds { 200 };

    struct SpawnedChild
    {
        pid_t pid = -1;
        int stdinWrite = -1;
        int stdoutRead = -1;
        int stderrRead = -1;
    };

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    void closePipe(std::array<int, 2>& fds)
    {
        closeFd(fds[0]);
        closeFd(fds[1]);
    }

    /// Writes to a pipe whose reader went away must surface as EPIPE, not kill us.
    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
    }

    auto decodeStatus(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return -WTERMSIG(status);
        return status;
    }

    auto joinArgs(const std::vector<std::string>& argv) -> std::string
    {
        auto text = std::string {};
        for (const auto& arg: argv)
        {
            if (!text.empty())
                text += ' ';
            text += arg;
        }
        return text;
    }

    auto spawnWithPipes(const std::vector<std::string>& argv, const std::vector<std::string>& environment)
        -> Result<SpawnedChild>
    {
        if (argv.empty() || argv.front().empty())
            return makeError(ErrorCode::SpawnFailed, "No command given");

        ignoreSigpipe();

        auto stdinPipe = std::array<int, 2> { -1, -1 };
        auto stdoutPipe = std::array<int, 2> { -1, -1 };
        auto stderrPipe = std::array<int, 2> { -1, -1 };

        if (::pipe2(stdinPipe.data(), O_CLOEXEC) != 0 || ::pipe2(stdoutPipe.data(), O_CLOEXEC) != 0
            || ::pipe2(stderrPipe.data(), O_CLOEXEC) != 0)
        {
            auto const reason = std::strerror(errno);
            closePipe(stdinPipe);
            closePipe(stdoutPipe);
            closePipe(stderrPipe);
            return makeError(ErrorCode::SpawnFailed, std::format("Failed to create pipes: {}", reason));
        }

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
        posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

        // Own process group, default signal dispositions (we ignore SIGPIPE ourselves).
        posix_spawnattr_t attributes;
        posix_spawnattr_init(&attributes);
        posix_spawnattr_setflags(&attributes,
                                 POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);
        posix_spawnattr_setpgroup(&attributes, 0);
        sigset_t defaultSignals;
        sigemptyset(&defaultSignals);
        sigaddset(&defaultSignals, SIGPIPE);
        posix_spawnattr_setsigdefault(&attributes, &defaultSignals);
        sigset_t emptyMask;
        sigemptyset(&emptyMask);
        posix_spawnattr_setsigmask(&attributes, &emptyMask);

        auto argCopies = argv;
        auto argvPtrs = std::vector<char*> {};
        for (auto& arg: argCopies)
            argvPtrs.push_back(arg.data());
        argvPtrs.push_back(nullptr);

        auto envCopies = environment;
        auto envp = std::vector<char*> {};
        for (auto& entry: envCopies)
            envp.push_back(entry.data());
        envp.push_back(nullptr);

        pid_t pid = -1;
        auto const status =
            posix_spawnp(&pid, argCopies.front().c_str(), &actions, &attributes, argvPtrs.data(), envp.data());
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attributes);

        closeFd(stdinPipe[0]);
        closeFd(stdoutPipe[1]);
        closeFd(stderrPipe[1]);

        if (status != 0)
        {
            closeFd(stdinPipe[1]);
            closeFd(stdoutPipe[0]);
            closeFd(stderrPipe[0]);
            return makeError(ErrorCode::SpawnFailed,
                             std::format("Failed to spawn process '{}': {}", argv.front(), std::strerror(status)));
        }

        return SpawnedChild {
            .pid = pid,
            .stdinWrite = stdinPipe[1],
            .stdoutRead = stdoutPipe[0],
            .stderrRead = stderrPipe[0],
        };
    }
} // namespace

// {{{ ChildProcess

struct ChildProcess::Impl
{
    pid_t pid = -1;
    int stderrRead = -1;
    std::string label;
    std::array<int, 2> wakePipe { -1, -1 };
    std::thread reader;

    mutable std::mutex mutex;
    std::condition_variable eofChanged;
    std::string stderrBuffer;
    bool stderrEof = false;
    bool reaped = false;
    bool terminated = false;
    std::optional<int> exitCode;

    void readerLoop()
    {
        auto partialLine = std::string {};
        while (true)
        {
            auto fds = std::array<pollfd, 2> {
                pollfd { .fd = stderrRead, .events = POLLIN, .revents = 0 },
                pollfd { .fd = wakePipe[0], .events = POLLIN, .revents = 0 },
            };
            auto const ready = ::poll(fds.data(), fds.size(), -1);
            if (ready < 0 && errno == EINTR)
                continue;
            if (ready < 0 || fds[1].revents != 0)
                break;

            auto buf = std::array<char, 4096> {};
            auto const bytesRead = ::read(stderrRead, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                break;

            auto const chunk = std::string_view(buf.data(), static_cast<size_t>(bytesRead));
            {
                auto const lock = std::lock_guard { mutex };
                stderrBuffer.append(chunk);
                if (stderrBuffer.size() > MaxCapturedStderr)
                    stderrBuffer.erase(0, stderrBuffer.size() - MaxCapturedStderr);
            }

            partialLine.append(chunk);
            for (auto pos = partialLine.find('\n'); pos != std::string::npos; pos = partialLine.find('\n'))
            {
                log::debug("[{} stderr] {}", label, std::string_view(partialLine).substr(0, pos));
                partialLine.erase(0, pos + 1);
            }
        }

        auto const lock = std::lock_guard { mutex };
        stderrEof = true;
        eofChanged.notify_all();
    }

    /// Must be called with mutex held, right after waitpid() returned the leader.
    void recordStatus(int status)
    {
        reaped = true;
        exitCode = decodeStatus(status);

        // Helpers left behind in the group must not outlive the provider. The group
        // id stays reserved while any member lives, so it cannot name a foreign group yet.
        ::kill(-pid, SIGKILL);
    }

    void stopReader()
    {
        if (wakePipe[1] >= 0)
        {
            auto const byte = char { 1 };
            [[maybe_unused]] auto const n = ::write(wakePipe[1], &byte, 1);
        }
        if (reader.joinable())
            reader.join();
    }
};

ChildProcess::ChildProcess(pid_t pid, int stderrRead, std::string label): _impl(std::make_unique<Impl>())
{
    _impl->pid = pid;
    _impl->stderrRead = stderrRead;
    _impl->label = std::move(label);

    if (stderrRead >= 0 && ::pipe2(_impl->wakePipe.data(), O_CLOEXEC) == 0)
        _impl->reader = std::thread([impl = _impl.get()] { impl->readerLoop(); });
    else
        _impl->stderrEof = true;
}

ChildProcess::~ChildProcess()
{
    terminate(std::chrono::milliseconds { 100 });
    closeFd(_impl->stderrRead);
    closePipe(_impl->wakePipe);
}

auto ChildProcess::pid() const -> pid_t
{
    return _impl->pid;
}

auto ChildProcess::isAlive() -> bool
{
    auto const lock = std::lock_guard { _impl->mutex };
    if (_impl->reaped || _impl->pid <= 0)
        return false;

    int status = 0;
    auto const result = ::waitpid(_impl->pid, &status, WNOHANG);
    if (result == 0)
        return true;
    if (result == _impl->pid)
        _impl->recordStatus(status);
    else
        _impl->reaped = true;
    return false;
}

auto ChildProcess::waitForExit(std::chrono::milliseconds timeout) -> bool
{
    auto const deadline = Clock::now() + timeout;
    while (isAlive())
    {
        if (Clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(LivenessPollInterval);
    }
    return true;
}

auto ChildProcess::exitCode() const -> std::optional<int>
{
    auto const lock = std::lock_guard { _impl->mutex };
    return _impl->exitCode;
}

auto ChildProcess::stderrOutput(std::chrono::milliseconds waitForEof) -> std::string
{
    auto lock = std::unique_lock { _impl->mutex };
    if (waitForEof.count() > 0)
        _impl->eofChanged.wait_for(lock, waitForEof, [this] { return _impl->stderrEof; });
    return _impl->stderrBuffer;
}

void ChildProcess::terminate(std::chrono::milliseconds grace)
{
    auto const pid = _impl->pid;
    if (_impl->terminated)
        return;

    if (isAlive())
    {
        if (::kill(-pid, SIGTERM) != 0)
            ::kill(pid, SIGTERM);

        if (!waitForExit(grace))
        {
            log::debug("Process {} ignored SIGTERM, killing it", pid);
            if (::kill(-pid, SIGKILL) != 0)
                ::kill(pid, SIGKILL);

            auto const lock = std::lock_guard { _impl->mutex };
            int status = 0;
            if (!_impl->reaped && ::waitpid(pid, &status, 0) == pid)
                _impl->recordStatus(status);
            _impl->reaped = true;
        }
    }

    _impl->stopReader();
    _impl->terminated = true;
}

// }}}

void ServerProcess::shutdown(std::chrono::milliseconds grace)
{
    if (transport)
        transport->interrupt();

    auto const lock = std::lock_guard { callMutex };
    if (transport)
        transport->close();
    if (child)
        child->terminate(grace);
}

// {{{ ProcessLauncher

ProcessLauncher::ProcessLauncher(LaunchConfig config): _config(config)
{
}

auto ProcessLauncher::buildArgv(const ServerDefinition& definition, const std::vector<std::string>& extraArgs)
    -> std::vector<std::string>
{
    auto argv = std::vector<std::string> { definition.command };

    auto const args = definition.sessionScoped ? scopedProviderArgs(definition.args) : definition.args;
    argv.insert(argv.end(), args.begin(), args.end());

    for (const auto& arg: extraArgs)
    {
        if (arg != "stdio")
            argv.push_back(arg);
    }

    return argv;
}

auto ProcessLauncher::buildEnvironment(const std::map<std::string, std::string>& overrides)
    -> std::vector<std::string>
{
    auto merged = std::map<std::string, std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const eq = entry.find('=');
            if (eq == std::string_view::npos)
                continue;
            merged[std::string(entry.substr(0, eq))] = std::string(entry.substr(eq + 1));
        }
    }

    for (const auto& [key, value]: overrides)
        merged[key] = value;

    auto envStrings = std::vector<std::string> {};
    envStrings.reserve(merged.size());
    for (const auto& [key, value]: merged)
        envStrings.push_back(std::format("{}={}", key, value));
    return envStrings;
}

auto ProcessLauncher::launch(const ServerDefinition& definition, const std::vector<std::string>& extraArgs) const
    -> Result<std::unique_ptr<ServerProcess>>
{
    if (definition.command.empty())
        return makeError(ErrorCode::SpawnFailed, std::format("Server '{}' has no command", definition.name));

    auto argv = buildArgv(definition, extraArgs);
    log::info("Starting MCP server '{}' with command: {}", definition.name, joinArgs(argv));

    auto spawned = spawnWithPipes(argv, buildEnvironment(definition.env));
    if (!spawned)
        return std::unexpected(spawned.error());

    auto server = std::make_unique<ServerProcess>();
    server->definition = definition;
    server->argv = std::move(argv);
    server->child = std::make_unique<ChildProcess>(spawned->pid, spawned->stderrRead, definition.name);
    server->transport = std::make_unique<StdioTransport>(spawned->stdinWrite, spawned->stdoutRead);

    if (server->child->waitForExit(_config.spawnGrace))
    {
        auto const stderrText = server->child->stderrOutput(StartupStderrWait);
        auto const exitCode = server->child->exitCode().value_or(-1);
        server->shutdown(std::chrono::milliseconds { 0 });
        log::error("MCP server '{}' failed to start (exit code {}): {}", definition.name, exitCode, stderrText);
        return makeError(ErrorCode::SpawnFailed,
                         std::format("MCP server '{}' exited during startup (exit code {}): {}",
                                     definition.name,
                                     exitCode,
                                     stderrText));
    }

    log::debug("MCP server '{}' running as pid {}", definition.name, server->child->pid());
    return server;
}

// }}}

auto runCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) -> Result<CommandOutput>
{
    auto spawned = spawnWithPipes(argv, ProcessLauncher::buildEnvironment({}));
    if (!spawned)
        return std::unexpected(spawned.error());

    closeFd(spawned->stdinWrite);

    auto output = CommandOutput {};
    auto const deadline = Clock::now() + timeout;
    auto timedOut = false;

    while (spawned->stdoutRead >= 0 || spawned->stderrRead >= 0)
    {
        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0)
        {
            timedOut = true;
            break;
        }

        auto fds = std::array<pollfd, 2> {
            pollfd { .fd = spawned->stdoutRead, .events = POLLIN, .revents = 0 },
            pollfd { .fd = spawned->stderrRead, .events = POLLIN, .revents = 0 },
        };
        auto const ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (ready < 0 && errno == EINTR)
            continue;
        if (ready < 0)
            break;

        auto drain = [](int& fd, std::string& sink) {
            auto buf = std::array<char, 4096> {};
            auto const bytesRead = ::read(fd, buf.data(), buf.size());
            if (bytesRead > 0)
                sink.append(buf.data(), static_cast<size_t>(bytesRead));
            else if (bytesRead == 0 || errno != EINTR)
                closeFd(fd);
        };

        if (fds[0].revents != 0)
            drain(spawned->stdoutRead, output.stdoutText);
        if (fds[1].revents != 0)
            drain(spawned->stderrRead, output.stderrText);
    }

    closeFd(spawned->stdoutRead);
    closeFd(spawned->stderrRead);

    if (timedOut)
        ::kill(-spawned->pid, SIGKILL);

    int status = 0;
    while (::waitpid(spawned->pid, &status, 0) < 0 && errno == EINTR)
        ;

    if (timedOut)
        return makeError(ErrorCode::TimeoutError,
                         std::format("Command '{}' timed out after {} ms", joinArgs(argv), timeout.count()));

    output.exitCode = decodeStatus(status);
    return output;
}

} // namespace toolbridge
