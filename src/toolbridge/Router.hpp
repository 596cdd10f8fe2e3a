// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentHost.hpp>
#include <core/Error.hpp>
#include <mcp/ServerRegistry.hpp>
#include <mcp/ToolInvoker.hpp>
#include <tools/LocalTools.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace toolbridge
{

/// @brief The services the router dispatches to; all must outlive the router.
struct RouterServices
{
    ServerRegistry& registry;
    ToolInvoker& invoker;
    LocalToolRegistry& localTools;
    AgentHost& agent;
};

/// @brief Dispatches action messages to the tool services.
///
/// A request is `{"id": ..., "action": "...", "payload": {...}}`. The reply is
/// `{"id": ..., "type": "response", "action": "...", "payload": envelope}` where
/// the envelope is `{"success": true, "data": ...}` or
/// `{"success": false, "error": "...", "code": "..."}`.
class Router
{
  public:
    explicit Router(RouterServices services);

    /// @brief Handles one request message.
    [[nodiscard]] auto handle(const nlohmann::json& message) -> nlohmann::json;

    /// @brief Handles one request line and returns the serialized reply.
    [[nodiscard]] auto handleLine(std::string_view line) -> std::string;

    /// @brief Names of all supported actions, sorted.
    [[nodiscard]] auto actions() const -> std::vector<std::string>;

  private:
    using Handler = std::function<Result<nlohmann::json>(const nlohmann::json& payload)>;

    [[nodiscard]] auto getServers(const nlohmann::json& payload) -> Result<nlohmann::json>;
    [[nodiscard]] auto activateServer(const nlohmann::json& payload) -> Result<nlohmann::json>;
    [[nodiscard]] auto deactivateServer(const nlohmann::json& payload) -> Result<nlohmann::json>;
    [[nodiscard]] auto listTools(const nlohmann::json& payload) -> Result<nlohmann::json>;
    [[nodiscard]] auto executeTool(const nlohmann::json& payload) -> Result<nlohmann::json>;
    [[nodiscard]] auto localToolCall(const nlohmann::json& payload) -> Result<nlohmann::json>;
    [[nodiscard]] auto runIntelligentTask(const nlohmann::json& payload) -> Result<nlohmann::json>;
    [[nodiscard]] auto prepareSession(const nlohmann::json& payload) -> Result<nlohmann::json>;
    [[nodiscard]] auto health(const nlohmann::json& payload) -> Result<nlohmann::json>;

    RouterServices _services;
    std::map<std::string, Handler, std::less<>> _handlers;
};

/// @brief Builds a success envelope.
[[nodiscard]] auto successEnvelope(nlohmann::json data) -> nlohmann::json;

/// @brief Builds a failure envelope from an error.
[[nodiscard]] auto failureEnvelope(const Error& error) -> nlohmann::json;

} // namespace toolbridge
