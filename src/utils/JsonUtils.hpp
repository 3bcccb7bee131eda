// Heal Downloader - JSON Utilities
// JSON parsing and tolerant field access

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace heal::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 *
 * Accessors never throw: a missing key or a value of the wrong type yields
 * the default.
 */
class JsonUtils {
public:
    // Parsing
    static std::optional<json> parse(const std::string& str);
    static std::optional<json> parseFile(const std::filesystem::path& path);

    // Serialization
    static std::string stringify(const json& j, int indent = -1);
    static bool writeFile(const std::filesystem::path& path, const json& j, int indent = 2);

    // Safe accessors
    static std::string getString(const json& j, const std::string& key, const std::string& defaultValue = "");
    static int getInt(const json& j, const std::string& key, int defaultValue = 0);
    static int64_t getLong(const json& j, const std::string& key, int64_t defaultValue = 0);
    static double getDouble(const json& j, const std::string& key, double defaultValue = 0.0);
    static bool getBool(const json& j, const std::string& key, bool defaultValue = false);
    static json getObject(const json& j, const std::string& key, const json& defaultValue = json::object());

    // Nullable accessors (absent or null -> nullopt)
    static std::optional<std::string> getOptionalString(const json& j, const std::string& key);
    static std::optional<double> getOptionalDouble(const json& j, const std::string& key);
};

} // namespace heal::utils
