// SPDX-License-Identifier: Apache-2.0
#include "AgentHost.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ProcessLauncher.hpp>

#include <format>

namespace toolbridge
{

namespace
{
    constexpr auto MaxContextValueLength = size_t { 200 };

    auto trimTrailingNewlines(std::string text) -> std::string
    {
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
            text.pop_back();
        return text;
    }
} // namespace

// {{{ ExternalCommandAgent

ExternalCommandAgent::ExternalCommandAgent(std::vector<std::string> argv,
                                           std::filesystem::path scopedConfig,
                                           std::chrono::milliseconds timeout):
    _argv(std::move(argv)), _scopedConfig(std::move(scopedConfig)), _timeout(timeout)
{
}

auto ExternalCommandAgent::run(std::string_view task) -> Result<std::string>
{
    auto argv = _argv;
    argv.push_back(_scopedConfig.string());
    argv.emplace_back(task);

    log::debug("Running agent command: {}", _argv.front());

    return runCommand(argv, _timeout).and_then([this](const CommandOutput& output) -> Result<std::string> {
        if (output.exitCode != 0)
            return makeError(ErrorCode::ToolCallError,
                             std::format("Agent '{}' failed with exit code {}: {}",
                                         _argv.front(),
                                         output.exitCode,
                                         trimTrailingNewlines(output.stderrText)));
        return trimTrailingNewlines(output.stdoutText);
    });
}

auto makeExternalAgentFactory(std::vector<std::string> argv, std::chrono::milliseconds timeout) -> AgentFactory
{
    if (argv.empty())
        return {};

    return [argv = std::move(argv), timeout](const std::filesystem::path& scopedConfig)
               -> Result<std::unique_ptr<TaskAgent>> {
        return std::make_unique<ExternalCommandAgent>(argv, scopedConfig, timeout);
    };
}

// }}}

auto formatTask(std::string_view description, const nlohmann::json& context) -> std::string
{
    if (!context.is_object() || context.empty())
        return std::string(description);

    auto task = std::format("{}\n\nContext:\n", description);
    for (auto const& [key, value]: context.items())
    {
        if (value.is_string())
        {
            auto const& text = value.get_ref<const std::string&>();
            if (text.size() > MaxContextValueLength)
                task += std::format("- {}: {}...\n", key, text.substr(0, MaxContextValueLength));
            else
                task += std::format("- {}: {}\n", key, text);
        }
        else
            task += std::format("- {}: {}\n", key, json::serialize(value));
    }
    return task;
}

AgentHost::AgentHost(const ServerStore& store,
                     const SessionRootsBinder& binder,
                     std::filesystem::path scopedConfigPath,
                     AgentFactory factory):
    _store(store), _binder(binder), _scopedConfigPath(std::move(scopedConfigPath)), _factory(std::move(factory))
{
}

auto AgentHost::prepareForSession(std::optional<std::string> sessionId) -> VoidResult
{
    if (!_factory)
    {
        log::debug("No agent configured; skipping session preparation");
        return {};
    }

    auto const provider = _store.find(FilesystemServerName);
    if (!provider)
        return makeError(ErrorCode::ConfigError, std::format("No '{}' server configured", FilesystemServerName));

    return _binder.resolve(sessionId ? std::optional<std::string_view>(*sessionId) : std::nullopt)
        .and_then([&](const std::filesystem::path& directory) -> VoidResult {
            return writeScopedProviderConfig(_scopedConfigPath, *provider, directory)
                .and_then([&]() { return createAgent(); })
                .transform([&]() { log::info("Reinitialized agent for dir: {}", directory.string()); });
        });
}

auto AgentHost::createAgent() -> VoidResult
{
    auto agent = _factory(_scopedConfigPath);
    if (!agent)
        return std::unexpected(agent.error());

    auto const lock = std::lock_guard { _mutex };
    _agent = std::shared_ptr<TaskAgent>(std::move(*agent));
    return {};
}

auto AgentHost::runIntelligentTask(std::string_view description, const nlohmann::json& context) -> nlohmann::json
{
    auto agent = [this] {
        auto const lock = std::lock_guard { _mutex };
        return _agent;
    }();

    if (!agent)
        return nlohmann::json { { "error", "MCP agent not available" }, { "fallback", true } };

    auto result = agent->run(formatTask(description, context));
    if (!result)
    {
        log::error("Agent task failed: {}", result.error().message);
        return nlohmann::json { { "error", result.error().message }, { "agent_used", true } };
    }

    return nlohmann::json { { "success", true }, { "result", *result }, { "agent_used", true } };
}

auto AgentHost::isAgentAvailable() const -> bool
{
    auto const lock = std::lock_guard { _mutex };
    return _agent != nullptr;
}

} // namespace toolbridge
