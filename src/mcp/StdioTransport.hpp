// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <memory>

namespace toolbridge
{

/// @brief Newline-delimited JSON-RPC channel over a child's stdin/stdout pipes.
///
/// Each outgoing message is written as a single line and flushed before send()
/// returns. Incoming lines that are not valid JSON are logged and skipped.
/// Closing the transport closes both pipes; it never signals the process.
class StdioTransport: public Transport
{
  public:
    /// @brief Takes ownership of the given pipe ends.
    /// @param stdinWrite Write end of the child's stdin pipe.
    /// @param stdoutRead Read end of the child's stdout pipe.
    StdioTransport(int stdinWrite, int stdoutRead);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto tryReceive(std::chrono::milliseconds timeout)
        -> Result<std::optional<nlohmann::json>> override;
    void interrupt() override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
