#pragma once

/**
 * StateStore.hpp
 * 
 * Durable snapshot of all transfer records:
 *   {"downloads": {"<id>": {...record...}}}
 * written atomically (temp file + rename).
 */

#include "TransferRecord.hpp"

#include <filesystem>
#include <vector>

namespace heal::core::downloader {

class StateStore {
public:
    explicit StateStore(std::filesystem::path path);
    
    /**
     * Replace the file with the given records
     * @return false if the file could not be written (logged)
     */
    bool save(const std::vector<TransferRecord>& records) const;
    
    /**
     * Read all records, oldest first. A missing or corrupt file yields an
     * empty list. Records that were Downloading come back Paused, since
     * nothing vouches for the partial file any more.
     */
    std::vector<TransferRecord> load() const;
    
    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace heal::core::downloader
