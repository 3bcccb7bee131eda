/**
 * JsonUtils.cpp
 * 
 * JSON parsing and field access helpers.
 */

#include "JsonUtils.hpp"
#include "FileUtils.hpp"

namespace heal::utils {

// -- Parsing --

std::optional<json> JsonUtils::parse(const std::string& str) {
    try { return json::parse(str); }
    catch (const json::exception&) { return std::nullopt; }
}

std::optional<json> JsonUtils::parseFile(const std::filesystem::path& path) {
    auto content = FileUtils::readFile(path);
    if (!content) return std::nullopt;
    return parse(*content);
}

// -- Serialization --

std::string JsonUtils::stringify(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

bool JsonUtils::writeFile(const std::filesystem::path& path, const json& j, int indent) {
    return FileUtils::writeFileAtomic(path, stringify(j, indent));
}

// -- Safe accessors --

std::string JsonUtils::getString(const json& j, const std::string& key, const std::string& defaultValue) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return defaultValue;
}

int JsonUtils::getInt(const json& j, const std::string& key, int defaultValue) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<int>();
    return defaultValue;
}

int64_t JsonUtils::getLong(const json& j, const std::string& key, int64_t defaultValue) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
    return defaultValue;
}

double JsonUtils::getDouble(const json& j, const std::string& key, double defaultValue) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return defaultValue;
}

bool JsonUtils::getBool(const json& j, const std::string& key, bool defaultValue) {
    if (j.contains(key) && j[key].is_boolean()) return j[key].get<bool>();
    return defaultValue;
}

json JsonUtils::getObject(const json& j, const std::string& key, const json& defaultValue) {
    if (j.contains(key) && j[key].is_object()) return j[key];
    return defaultValue;
}

// -- Nullable accessors --

std::optional<std::string> JsonUtils::getOptionalString(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

std::optional<double> JsonUtils::getOptionalDouble(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return std::nullopt;
}

} // namespace heal::utils
