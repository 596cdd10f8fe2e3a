// SPDX-License-Identifier: Apache-2.0
#include "LocalTools.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ProcessLauncher.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <regex>
#include <sstream>

namespace toolbridge
{

namespace fs = std::filesystem;

namespace
{
    auto requireString(const nlohmann::json& params, std::string_view key) -> Result<std::string>
    {
        auto value = json::getStringOr(params, key, "");
        if (value.empty())
            return makeError(ErrorCode::InvalidArgument, std::format("Missing required parameter: {}", key));
        return value;
    }

    auto splitWords(std::string_view text) -> std::vector<std::string>
    {
        auto words = std::vector<std::string> {};
        auto current = std::string {};
        for (auto const ch: text)
        {
            if (ch == ' ' || ch == '\t' || ch == '\n')
            {
                if (!current.empty())
                    words.push_back(std::move(current));
                current.clear();
            }
            else
                current += ch;
        }
        if (!current.empty())
            words.push_back(std::move(current));
        return words;
    }

    auto fileRead(const nlohmann::json& params) -> Result<nlohmann::json>
    {
        return requireString(params, "path").and_then([](const std::string& path) -> Result<nlohmann::json> {
            if (!fs::exists(path))
                return makeError(ErrorCode::IoError, std::format("File not found: {}", path));

            auto file = std::ifstream(path, std::ios::binary);
            if (!file.is_open())
                return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path));

            auto ss = std::stringstream {};
            ss << file.rdbuf();
            return nlohmann::json(ss.str());
        });
    }

    auto fileWrite(const nlohmann::json& params) -> Result<nlohmann::json>
    {
        auto const path = json::getStringOr(params, "path", "");
        if (path.empty() || !params.contains("content") || !params["content"].is_string())
            return makeError(ErrorCode::InvalidArgument, "Missing required parameters: path, content");

        auto ec = std::error_code {};
        if (auto const dir = fs::path(path).parent_path(); !dir.empty())
            fs::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError, std::format("Failed to create directory for {}: {}", path, ec.message()));

        auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot write file: {}", path));
        file << params["content"].get<std::string>();
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Failed writing file: {}", path));

        return nlohmann::json { { "success", true }, { "path", path } };
    }

    auto fileList(const nlohmann::json& params) -> Result<nlohmann::json>
    {
        auto const dir = json::getStringOr(params, "path", ".");
        auto const pattern = json::getStringOr(params, "pattern", "*");

        auto ec = std::error_code {};
        if (!fs::is_directory(dir, ec))
            return makeError(ErrorCode::InvalidArgument, std::format("Not a directory: {}", dir));

        auto entries = std::vector<std::string> {};
        for (auto const& entry: fs::directory_iterator(dir, ec))
        {
            if (matchesGlob(pattern, entry.path().filename().string()))
                entries.push_back((fs::path(dir) / entry.path().filename()).string());
        }
        if (ec)
            return makeError(ErrorCode::IoError, std::format("Failed listing {}: {}", dir, ec.message()));

        std::ranges::sort(entries);
        return nlohmann::json(entries);
    }

    auto jsonParse(const nlohmann::json& params) -> Result<nlohmann::json>
    {
        return requireString(params, "data").and_then([](const std::string& data) -> Result<nlohmann::json> {
            auto parsed = json::parse(data);
            if (!parsed)
                return makeError(ErrorCode::InvalidArgument, parsed.error().message);
            return parsed;
        });
    }

    auto textExtract(const nlohmann::json& params) -> Result<nlohmann::json>
    {
        auto const text = json::getStringOr(params, "text", "");
        auto const pattern = json::getStringOr(params, "pattern", "");
        if (pattern.empty())
            return nlohmann::json(text);

        auto regex = std::regex {};
        try
        {
            regex = std::regex(pattern, std::regex::ECMAScript);
        }
        catch (const std::regex_error& e)
        {
            return makeError(ErrorCode::InvalidArgument, std::format("Invalid pattern '{}': {}", pattern, e.what()));
        }

        auto matches = std::vector<std::string> {};
        for (auto it = std::sregex_iterator(text.begin(), text.end(), regex); it != std::sregex_iterator(); ++it)
        {
            // With exactly one capture group the group is reported, otherwise the whole match.
            auto const& match = *it;
            matches.push_back(match.size() == 2 ? match[1].str() : match[0].str());
        }

        auto joined = std::string {};
        for (size_t i = 0; i < matches.size(); ++i)
        {
            if (i > 0)
                joined += '\n';
            joined += matches[i];
        }
        return nlohmann::json(joined);
    }
} // namespace

auto matchesGlob(std::string_view pattern, std::string_view name) -> bool
{
    // Iterative wildcard match with single-star backtracking.
    auto p = size_t { 0 };
    auto n = size_t { 0 };
    auto starPos = std::string_view::npos;
    auto starMatch = size_t { 0 };

    while (n < name.size())
    {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n]))
        {
            ++p;
            ++n;
        }
        else if (p < pattern.size() && pattern[p] == '*')
        {
            starPos = p++;
            starMatch = n;
        }
        else if (starPos != std::string_view::npos)
        {
            p = starPos + 1;
            n = ++starMatch;
        }
        else
            return false;
    }

    while (p < pattern.size() && pattern[p] == '*')
        ++p;
    return p == pattern.size();
}

LocalToolRegistry::LocalToolRegistry(LocalToolsConfig config): _config(std::move(config))
{
    registerBuiltins();
}

void LocalToolRegistry::add(std::string name, std::string description, Handler handler)
{
    log::debug("Registered local tool: {}", name);
    _tools.insert_or_assign(std::move(name), Entry { std::move(description), std::move(handler) });
}

auto LocalToolRegistry::execute(std::string_view name, const nlohmann::json& params) const
    -> Result<nlohmann::json>
{
    auto const it = _tools.find(name);
    if (it == _tools.end())
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown MCP tool: {}", name));

    auto const& input = params.is_object() ? params : nlohmann::json::object();
    auto result = it->second.handler(input);
    if (result)
        log::info("Executed local tool: {}", name);
    else
        log::error("Failed to execute local tool {}: {}", name, result.error().message);
    return result;
}

auto LocalToolRegistry::list() const -> std::map<std::string, std::string>
{
    auto result = std::map<std::string, std::string> {};
    for (auto const& [name, entry]: _tools)
        result[name] = entry.description;
    return result;
}

auto LocalToolRegistry::contains(std::string_view name) const -> bool
{
    return _tools.contains(name);
}

void LocalToolRegistry::registerBuiltins()
{
    add("file_read", "Read contents of a file", fileRead);
    add("file_write", "Write contents to a file", fileWrite);
    add("file_list", "List files in a directory", fileList);
    add("json_parse", "Parse JSON string", jsonParse);
    add("text_extract", "Extract text based on pattern", textExtract);

    add("execute_command",
        "Execute an allow-listed system command",
        [this](const nlohmann::json& params) -> Result<nlohmann::json> {
            auto const command = json::getStringOr(params, "command", "");
            auto argv = splitWords(command);
            if (argv.empty())
                return makeError(ErrorCode::InvalidArgument, "Missing required parameter: command");

            if (std::ranges::find(_config.allowedCommands, argv.front()) == _config.allowedCommands.end())
                return makeError(ErrorCode::InvalidArgument, std::format("Command not allowed: {}", argv.front()));

            auto output = runCommand(argv, _config.commandTimeout);
            if (!output)
            {
                if (output.error().code == ErrorCode::TimeoutError)
                    return nlohmann::json { { "error", "Command timed out" } };
                return nlohmann::json { { "error", output.error().message } };
            }

            return nlohmann::json {
                { "stdout", output->stdoutText },
                { "stderr", output->stderrText },
                { "returncode", output->exitCode },
            };
        });

    log::info("Registered {} built-in local tools", _tools.size());
}

} // namespace toolbridge
