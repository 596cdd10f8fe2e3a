// SPDX-License-Identifier: Apache-2.0
#include "SessionRoots.hpp"

#include <core/Log.hpp>

#include <format>
#include <tuple>

namespace toolbridge
{

namespace
{
    auto isValidSessionId(std::string_view id) -> bool
    {
        if (id.empty() || id == "." || id == "..")
            return false;
        return id.find('/') == std::string_view::npos && id.find('\0') == std::string_view::npos;
    }

    auto ensureDirectory(const std::filesystem::path& dir) -> VoidResult
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create directory '{}': {}", dir.string(), ec.message()));
        return {};
    }
} // namespace

SessionRootsBinder::SessionRootsBinder(std::filesystem::path recordingsRoot):
    _recordingsRoot(std::filesystem::absolute(recordingsRoot).lexically_normal())
{
}

auto SessionRootsBinder::resolve(std::optional<std::string_view> sessionId) const -> Result<std::filesystem::path>
{
    auto target = _recordingsRoot;

    if (sessionId)
    {
        if (!isValidSessionId(*sessionId))
            return makeError(ErrorCode::InvalidArgument, std::format("Invalid session id: '{}'", *sessionId));
        target /= std::string(*sessionId);
    }
    else if (auto latest = latestSessionId(); latest)
    {
        log::info("No session id provided; defaulting to latest session: {}", *latest);
        target /= *latest;
    }

    return ensureDirectory(target).transform([&]() { return target; });
}

auto SessionRootsBinder::latestSessionId() const -> std::optional<std::string>
{
    auto ec = std::error_code {};
    auto it = std::filesystem::directory_iterator(_recordingsRoot, ec);
    if (ec)
    {
        log::debug("Cannot list recordings root {}: {}", _recordingsRoot.string(), ec.message());
        return std::nullopt;
    }

    auto best = std::optional<std::tuple<std::filesystem::file_time_type, std::string>> {};
    for (const auto& entry: it)
    {
        if (!entry.is_directory(ec))
            continue;

        auto const mtime = entry.last_write_time(ec);
        if (ec)
            continue;

        auto name = entry.path().filename().string();
        if (!best || mtime > std::get<0>(*best) || (mtime == std::get<0>(*best) && name < std::get<1>(*best)))
            best.emplace(mtime, std::move(name));
    }

    if (!best)
        return std::nullopt;
    return std::get<1>(*best);
}

auto fileUri(const std::filesystem::path& path) -> std::string
{
    constexpr auto hex = std::string_view { "0123456789ABCDEF" };

    auto uri = std::string { "file://" };
    for (auto const c: std::filesystem::absolute(path).lexically_normal().string())
    {
        auto const byte = static_cast<unsigned char>(c);
        auto const unreserved = (byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z')
                                || (byte >= '0' && byte <= '9') || c == '-' || c == '.' || c == '_' || c == '~'
                                || c == '/';
        if (unreserved)
        {
            uri += c;
        }
        else
        {
            uri += '%';
            uri += hex[byte >> 4];
            uri += hex[byte & 0x0F];
        }
    }
    return uri;
}

auto buildRoots(const std::filesystem::path& directory) -> std::vector<Root>
{
    auto normalized = std::filesystem::absolute(directory).lexically_normal();
    auto name = normalized.filename().string();
    if (name.empty())
        name = normalized.parent_path().filename().string();
    if (name.empty())
        name = "root";

    return { Root { .uri = fileUri(normalized), .name = std::move(name) } };
}

} // namespace toolbridge
