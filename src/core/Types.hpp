// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace toolbridge
{

/// @brief A tool exposed by a provider, as reported by tools/list.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief The result of a successful tools/call.
struct ToolCallResult
{
    /// The raw content array as returned by the provider.
    nlohmann::json content = nlohmann::json::array();

    /// All text content items joined by newlines.
    std::string text;

    /// Set when the provider reports a tool-level failure inside a successful response.
    bool isError = false;

    /// The complete result object.
    nlohmann::json raw;
};

/// @brief A filesystem root advertised to a provider via roots/list.
struct Root
{
    std::string uri;
    std::string name;
};

/// @brief Converts roots to the `{"roots": [...]}` result payload.
[[nodiscard]] inline auto rootsToJson(const std::vector<Root>& roots) -> nlohmann::json
{
    auto list = nlohmann::json::array();
    for (const auto& root: roots)
        list.push_back(nlohmann::json { { "uri", root.uri }, { "name", root.name } });
    return nlohmann::json { { "roots", std::move(list) } };
}

/// @brief Converts a tool descriptor to its wire representation.
[[nodiscard]] inline auto toJson(const ToolDescriptor& tool) -> nlohmann::json
{
    return nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "inputSchema", tool.inputSchema },
    };
}

} // namespace toolbridge
