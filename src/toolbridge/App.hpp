// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <toolbridge/Config.hpp>

#include <iosfwd>
#include <memory>

namespace toolbridge
{

class AgentHost;
class LocalToolRegistry;
class Router;
class ServerRegistry;
class ServerStore;
class SessionRootsBinder;
class ToolInvoker;

/// @brief Wires the server store, registry, invoker, local tools, agent host and router together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The configuration, with resolved paths.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the log file and loads the server definitions.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Reads request lines from @p in and writes one reply line per request to @p out.
    /// @return Exit code (0 on end of input).
    [[nodiscard]] auto serve(std::istream& in, std::ostream& out) -> int;

    [[nodiscard]] auto config() const -> const AppConfig&;
    [[nodiscard]] auto store() -> ServerStore&;
    [[nodiscard]] auto binder() -> SessionRootsBinder&;
    [[nodiscard]] auto registry() -> ServerRegistry&;
    [[nodiscard]] auto invoker() -> ToolInvoker&;
    [[nodiscard]] auto localTools() -> LocalToolRegistry&;
    [[nodiscard]] auto agent() -> AgentHost&;
    [[nodiscard]] auto router() -> Router&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
