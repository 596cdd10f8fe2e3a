// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ServerRegistry.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Per-request timeouts of the tool invoker.
struct InvokerConfig
{
    std::chrono::milliseconds listTimeout { 2000 };
    std::chrono::milliseconds callTimeout { 30000 };
};

/// @brief Issues tools/list and tools/call requests to the active server.
///
/// Requests on one server are serialized. Requests the provider sends while a
/// call is pending (e.g. roots/list) are answered in between.
class ToolInvoker
{
  public:
    /// @param registry The registry owning the active server; must outlive the invoker.
    ToolInvoker(ServerRegistry& registry, InvokerConfig config = {});

    /// @brief Lists the tools of the active server.
    /// @return The tools, or NoActiveServer, TimeoutError, TransportClosed, ApplicationError.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDescriptor>>;

    /// @brief Invokes a tool on the active server.
    /// @param name The tool name.
    /// @param arguments The tool arguments object.
    /// @return The tool result, or NoActiveServer, TimeoutError, TransportClosed, ApplicationError.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments)
        -> Result<ToolCallResult>;

    [[nodiscard]] auto config() const -> const InvokerConfig& { return _config; }

  private:
    [[nodiscard]] auto request(int64_t id,
                               std::string_view method,
                               nlohmann::json params,
                               std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    ServerRegistry& _registry;
    InvokerConfig _config;
};

/// @brief Converts a tools/call result object.
///
/// Text items of the content array are joined by newlines.
[[nodiscard]] auto parseToolCallResult(const nlohmann::json& result) -> ToolCallResult;

/// @brief Converts a tools/list result object; entries without a name are skipped.
[[nodiscard]] auto parseToolList(const nlohmann::json& result) -> std::vector<ToolDescriptor>;

} // namespace toolbridge
