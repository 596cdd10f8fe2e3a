// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Maps recording session ids to the directory a provider may access.
///
/// The recordings root holds one subdirectory per session. A resolved directory
/// always exists on disk when resolve() returns it.
class SessionRootsBinder
{
  public:
    explicit SessionRootsBinder(std::filesystem::path recordingsRoot);

    /// @brief Resolves the directory for a session.
    ///
    /// With a session id the result is `recordingsRoot/sessionId`. Without one it is
    /// the most recently modified session directory, or the recordings root itself
    /// if there are no sessions yet. The directory is created if missing.
    /// @param sessionId The session, or std::nullopt for the latest one.
    /// @return The absolute directory, or InvalidArgument / IoError.
    [[nodiscard]] auto resolve(std::optional<std::string_view> sessionId = std::nullopt) const
        -> Result<std::filesystem::path>;

    /// @brief Returns the name of the most recently modified session directory.
    ///
    /// Ties on modification time are broken by ascending name.
    [[nodiscard]] auto latestSessionId() const -> std::optional<std::string>;

    [[nodiscard]] auto recordingsRoot() const -> const std::filesystem::path& { return _recordingsRoot; }

  private:
    std::filesystem::path _recordingsRoot;
};

/// @brief Returns the `file://` URI for an absolute path, percent-encoding reserved bytes.
[[nodiscard]] auto fileUri(const std::filesystem::path& path) -> std::string;

/// @brief Builds the single-entry roots list advertising @p directory.
[[nodiscard]] auto buildRoots(const std::filesystem::path& directory) -> std::vector<Root>;

} // namespace toolbridge
