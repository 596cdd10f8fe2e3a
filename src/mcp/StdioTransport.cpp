// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace toolbridge
{

namespace
{
    constexpr auto MaxLineLength = size_t { 16 } * 1024 * 1024;

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto trimmed(std::string_view line) -> std::string_view
    {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t'))
            line.remove_suffix(1);
        while (!line.empty() && (line.front() == ' ' || line.front() == '\t'))
            line.remove_prefix(1);
        return line;
    }
} // namespace

struct StdioTransport::Impl
{
    int stdinWrite = -1;
    int stdoutRead = -1;
    std::array<int, 2> wakePipe { -1, -1 };
    std::atomic<bool> connected = false;
    std::atomic<bool> interrupted = false;
    std::string readBuffer;

    /// Extracts the next complete, non-empty line from the read buffer.
    auto takeLine() -> std::optional<std::string>
    {
        while (true)
        {
            auto const newlinePos = readBuffer.find('\n');
            if (newlinePos == std::string::npos)
                return std::nullopt;

            auto line = std::string(trimmed(std::string_view(readBuffer).substr(0, newlinePos)));
            readBuffer.erase(0, newlinePos + 1);
            if (!line.empty())
                return line;
        }
    }
};

StdioTransport::StdioTransport(int stdinWrite, int stdoutRead): _impl(std::make_unique<Impl>())
{
    _impl->stdinWrite = stdinWrite;
    _impl->stdoutRead = stdoutRead;

    if (::pipe2(_impl->wakePipe.data(), O_CLOEXEC | O_NONBLOCK) != 0)
        log::warning("Failed to create wake pipe: {}", std::strerror(errno));

    _impl->connected = stdinWrite >= 0 && stdoutRead >= 0;
}

StdioTransport::~StdioTransport()
{
    close();
    closeFd(_impl->wakePipe[0]);
    closeFd(_impl->wakePipe[1]);
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected || _impl->interrupted)
        return makeError(ErrorCode::TransportClosed, "Transport not connected");

    auto const data = json::serialize(message) + "\n";
    log::trace("-> {}", data.substr(0, data.size() - 1));

    auto const* ptr = data.data();
    auto remaining = data.size();
    while (remaining > 0)
    {
        auto const written = ::write(_impl->stdinWrite, ptr, remaining);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportClosed,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));
        }
        ptr += written;
        remaining -= static_cast<size_t>(written);
    }

    return {};
}

auto StdioTransport::tryReceive(std::chrono::milliseconds timeout) -> Result<std::optional<nlohmann::json>>
{
    using Clock = std::chrono::steady_clock;

    if (!_impl->connected)
        return makeError(ErrorCode::TransportClosed, "Transport not connected");

    auto const deadline = Clock::now() + timeout;

    while (true)
    {
        if (_impl->interrupted)
            return makeError(ErrorCode::TransportClosed, "Transport interrupted");

        if (auto line = _impl->takeLine(); line)
        {
            log::trace("<- {}", *line);
            auto parsed = json::parse(*line);
            if (parsed)
                return std::optional<nlohmann::json> { std::move(*parsed) };

            log::warning("Skipping non-protocol output from server: {}", *line);
            continue;
        }

        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0)
            return std::optional<nlohmann::json> {};

        auto fds = std::array<pollfd, 2> {
            pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 },
            pollfd { .fd = _impl->wakePipe[0], .events = POLLIN, .revents = 0 },
        };
        auto const ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportClosed,
                             std::format("Failed to poll process stdout: {}", std::strerror(errno)));
        }
        if (ready == 0)
            return std::optional<nlohmann::json> {};

        if (fds[1].revents != 0)
        {
            _impl->interrupted = true;
            continue;
        }

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportClosed, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));

        if (_impl->readBuffer.size() > MaxLineLength && _impl->readBuffer.find('\n') == std::string::npos)
        {
            log::warning("Discarding {} bytes of unterminated server output", _impl->readBuffer.size());
            _impl->readBuffer.clear();
        }
    }
}

void StdioTransport::interrupt()
{
    _impl->interrupted = true;
    if (_impl->wakePipe[1] >= 0)
    {
        auto const byte = char { 1 };
        [[maybe_unused]] auto const n = ::write(_impl->wakePipe[1], &byte, 1);
    }
}

void StdioTransport::close()
{
    if (!_impl->connected && _impl->stdinWrite < 0 && _impl->stdoutRead < 0)
        return;

    _impl->connected = false;
    closeFd(_impl->stdinWrite);
    closeFd(_impl->stdoutRead);

    log::debug("MCP transport closed");
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected && !_impl->interrupted;
}

} // namespace toolbridge
