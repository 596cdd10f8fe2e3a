// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace toolbridge::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Serializes a JSON value.
///
/// Invalid UTF-8 in strings is replaced by U+FFFD instead of throwing, so
/// binary file contents or raw process output never abort serialization.
/// @param document The value to serialize.
/// @param indent Pretty-print indentation, or -1 for a single line.
/// @return The serialized text.
[[nodiscard]] inline auto serialize(const nlohmann::json& document, int indent = -1) -> std::string
{
    return document.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value or the default.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int>();
    return defaultValue;
}

/// @brief Extracts the string elements of an optional array field.
///
/// Non-string elements are skipped.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The strings in order, empty if the field is missing.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto keyStr = std::string(key);
    auto values = std::vector<std::string> {};
    if (!obj.contains(keyStr) || !obj[keyStr].is_array())
        return values;
    for (const auto& item: obj[keyStr])
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

/// @brief Extracts the string members of an optional object field.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto keyStr = std::string(key);
    auto values = std::map<std::string, std::string> {};
    if (!obj.contains(keyStr) || !obj[keyStr].is_object())
        return values;
    for (const auto& [name, value]: obj[keyStr].items())
    {
        if (value.is_string())
            values[name] = value.get<std::string>();
    }
    return values;
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Reads and parses a JSON file.
/// @param path The file to read.
/// @return The parsed document, an IoError if the file cannot be read, or a
///         ProtocolError if it is not valid JSON.
[[nodiscard]] inline auto readFile(const std::filesystem::path& path) -> Result<nlohmann::json>
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return parse(ss.str());
}

/// @brief Writes a JSON document atomically.
///
/// The document is written to a sibling temporary file which then replaces
/// @p path, so readers never observe a partially written file. Missing parent
/// directories are created.
/// @param path The destination file.
/// @param document The document to write.
/// @return Success or an IoError.
[[nodiscard]] inline auto writeFileAtomically(const std::filesystem::path& path, const nlohmann::json& document)
    -> VoidResult
{
    auto ec = std::error_code {};
    if (auto const dir = path.parent_path(); !dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create directory '{}': {}", dir.string(), ec.message()));
    }

    auto tempPath = path;
    tempPath += ".tmp";
    {
        auto file = std::ofstream(tempPath, std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot write file: {}", tempPath.string()));
        file << serialize(document, 2) << '\n';
        file.flush();
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Failed writing file: {}", tempPath.string()));
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec)
    {
        std::filesystem::remove(tempPath, ec);
        return makeError(ErrorCode::IoError, std::format("Failed to replace '{}'", path.string()));
    }
    return {};
}

} // namespace toolbridge::json
