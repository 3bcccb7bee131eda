#pragma once

/**
 * Config.hpp
 * 
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <string>

namespace heal::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 * 
 * Holds the downloader settings document:
 * - Type-safe getters with defaults
 * - JSON persistence
 * - Overrides merged over the defaults, so a partial file is valid
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }
    
    /**
     * Load configuration from file, merged over the defaults
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path);
    
    /**
     * Load the file if it exists, otherwise write the defaults there
     * @param path Path to config file
     * @return true if the configuration is usable afterwards
     */
    bool loadOrCreate(const std::string& path);
    
    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "");
    
    /**
     * Reset to the built-in defaults
     */
    void setDefaults();
    
    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.maxConcurrent")
     * @param defaultValue Default value if key not found or mistyped
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Mistyped value, fall through to default
        }
        
        return defaultValue;
    }
    
    /**
     * Set configuration value with dot notation
     * @param key Key path (e.g., "downloads.directory")
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }
    
    /**
     * Check if key exists
     * @param key Key path
     * @return true if key exists
     */
    bool has(const std::string& key) const;
    
    /**
     * The built-in defaults
     */
    static json defaults();

private:
    Config() {
        setDefaults();
    }
    
    ~Config() = default;
    
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    
    /**
     * Convert dot notation to JSON pointer
     * @param key Dot-notation key
     * @return JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace heal::core
