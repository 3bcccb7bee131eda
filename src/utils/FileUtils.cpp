/**
 * FileUtils.cpp
 * 
 * File system operations.
 */

#include "FileUtils.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace heal::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    if (path.empty()) return true;
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool FileUtils::ensureParentDirectory(const fs::path& filePath) {
    return createDirectories(filePath.parent_path());
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<int64_t>(size);
}

// -- Read/Write --

std::optional<std::string> FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool FileUtils::writeFileAtomic(const fs::path& path, const std::string& content) {
    if (!ensureParentDirectory(path)) return false;

    fs::path tempPath = path;
    tempPath += ".tmp";

    std::FILE* file = std::fopen(tempPath.string().c_str(), "wb");
    if (!file) return false;

    bool ok = std::fwrite(content.data(), 1, content.size(), file) == content.size();
    ok = ok && std::fflush(file) == 0;
#ifndef _WIN32
    ok = ok && ::fsync(::fileno(file)) == 0;
#endif
    ok = (std::fclose(file) == 0) && ok;

    if (!ok) {
        deleteFile(tempPath);
        return false;
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        deleteFile(tempPath);
        return false;
    }
    return true;
}

} // namespace heal::utils
