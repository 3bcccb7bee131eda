/**
 * Config.cpp
 * 
 * Defaults and persistence of the configuration document.
 */

#include "Config.hpp"
#include "Logger.hpp"
#include "../utils/JsonUtils.hpp"

namespace heal::core {

json Config::defaults() {
    return {
        {"version", "1.0.0"},
        {"downloads", {
            {"directory", "./downloads"},
            {"maxConcurrent", 3},
            {"retrySweepIntervalSeconds", 5},
            {"maxRetries", 3},
            {"chunkSize", 8192},
            {"bufferChunks", 10},
            {"progressIntervalMs", 500},
            {"timeoutSeconds", 30},
            {"connectTimeoutSeconds", 10},
            {"userAgent", "Heal-Downloader/1.0"},
            {"stateFile", ""}
        }},
        {"logging", {
            {"level", "info"},
            {"directory", ""},
            {"file", true}
        }}
    };
}

void Config::setDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = defaults();
}

bool Config::load(const std::string& path) {
    auto parsed = utils::JsonUtils::parseFile(path);
    if (!parsed || !parsed->is_object()) {
        HEAL_LOG_WARN("Configuration file {} is missing or invalid", path);
        return false;
    }
    
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = defaults();
    m_config.merge_patch(*parsed);
    m_configPath = path;
    return true;
}

bool Config::loadOrCreate(const std::string& path) {
    if (std::filesystem::exists(path)) {
        return load(path);
    }
    
    setDefaults();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configPath = path;
    }
    return save(path);
}

bool Config::save(const std::string& path) {
    std::string savePath;
    json snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        savePath = path.empty() ? m_configPath : path;
        snapshot = m_config;
    }
    
    if (savePath.empty()) {
        return false;
    }
    
    if (!utils::JsonUtils::writeFile(savePath, snapshot, 4)) {
        HEAL_LOG_ERROR("Failed to write configuration to {}", savePath);
        return false;
    }
    return true;
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    try {
        return m_config.contains(toJsonPointer(key));
    } catch (const json::exception&) {
        return false;
    }
}

} // namespace heal::core
