#pragma once

/**
 * DownloadSettings.hpp
 * 
 * Engine-wide settings, read from the "downloads" section of Config.
 */

#include "../Config.hpp"
#include "../../utils/PathUtils.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace heal::core::downloader {

struct DownloadSettings {
    std::filesystem::path downloadDirectory{"./downloads"};
    
    // Empty = <downloadDirectory>/download_state.json
    std::filesystem::path stateFile;
    
    size_t maxConcurrentDownloads{3};
    std::chrono::milliseconds retrySweepInterval{std::chrono::seconds(5)};
    
    // Per-transfer defaults
    int maxRetries{3};
    size_t chunkSize{8192};
    int timeoutSeconds{30};
    
    // Worker tuning
    size_t bufferChunks{10};
    std::chrono::milliseconds progressInterval{500};
    int connectTimeoutSeconds{10};
    std::string userAgent{"Heal-Downloader/1.0"};
    
    std::filesystem::path resolvedStateFile() const {
        return stateFile.empty() ? utils::PathUtils::getStateFilePath(downloadDirectory) : stateFile;
    }
    
    /**
     * Reject settings the engine can't run with
     * @throws std::invalid_argument
     */
    void validate() const {
        if (maxConcurrentDownloads == 0) {
            throw std::invalid_argument("downloads.maxConcurrent must be at least 1");
        }
        if (chunkSize == 0) {
            throw std::invalid_argument("downloads.chunkSize must be at least 1");
        }
        if (bufferChunks == 0) {
            throw std::invalid_argument("downloads.bufferChunks must be at least 1");
        }
        if (maxRetries < 0) {
            throw std::invalid_argument("downloads.maxRetries must not be negative");
        }
        if (timeoutSeconds <= 0) {
            throw std::invalid_argument("downloads.timeoutSeconds must be positive");
        }
        if (retrySweepInterval.count() <= 0) {
            throw std::invalid_argument("downloads.retrySweepIntervalSeconds must be positive");
        }
        if (downloadDirectory.empty()) {
            throw std::invalid_argument("downloads.directory must not be empty");
        }
    }
    
    /**
     * Build and validate settings from the configuration document
     * @throws std::invalid_argument on malformed values
     */
    static DownloadSettings fromConfig(const Config& config) {
        DownloadSettings settings;
        settings.downloadDirectory = config.get<std::string>("downloads.directory", "./downloads");
        settings.stateFile = config.get<std::string>("downloads.stateFile", "");
        
        int maxConcurrent = config.get<int>("downloads.maxConcurrent", 3);
        int chunkSize = config.get<int>("downloads.chunkSize", 8192);
        int bufferChunks = config.get<int>("downloads.bufferChunks", 10);
        if (maxConcurrent < 0 || chunkSize < 0 || bufferChunks < 0) {
            throw std::invalid_argument("downloads.* sizes must not be negative");
        }
        settings.maxConcurrentDownloads = static_cast<size_t>(maxConcurrent);
        settings.chunkSize = static_cast<size_t>(chunkSize);
        settings.bufferChunks = static_cast<size_t>(bufferChunks);
        
        settings.retrySweepInterval = std::chrono::seconds(
            config.get<int>("downloads.retrySweepIntervalSeconds", 5));
        settings.maxRetries = config.get<int>("downloads.maxRetries", 3);
        settings.timeoutSeconds = config.get<int>("downloads.timeoutSeconds", 30);
        settings.progressInterval = std::chrono::milliseconds(
            config.get<int>("downloads.progressIntervalMs", 500));
        settings.connectTimeoutSeconds = config.get<int>("downloads.connectTimeoutSeconds", 10);
        settings.userAgent = config.get<std::string>("downloads.userAgent", "Heal-Downloader/1.0");
        
        settings.validate();
        return settings;
    }
};

} // namespace heal::core::downloader
