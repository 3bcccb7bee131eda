// Heal Downloader - File Utilities
// File system operations used by the transfer engine

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace heal::utils {

/**
 * @brief File and directory utilities
 *
 * None of these throw; failures are reported through the return value.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);
    static bool ensureParentDirectory(const fs::path& filePath);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool deleteFile(const fs::path& path);
    static int64_t getFileSize(const fs::path& path);

    // Read/Write operations
    static std::optional<std::string> readFile(const fs::path& path);

    /**
     * Write content to <path>.tmp, sync it and rename it over path,
     * so readers only ever observe the old or the new content.
     */
    static bool writeFileAtomic(const fs::path& path, const std::string& content);
};

} // namespace heal::utils
