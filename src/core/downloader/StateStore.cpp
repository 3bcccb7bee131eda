/**
 * StateStore.cpp
 */

#include "StateStore.hpp"
#include "../Logger.hpp"
#include "../../utils/JsonUtils.hpp"

#include <algorithm>

namespace heal::core::downloader {

using utils::JsonUtils;

StateStore::StateStore(std::filesystem::path path)
    : m_path(std::move(path)) {
}

bool StateStore::save(const std::vector<TransferRecord>& records) const {
    json downloads = json::object();
    for (const auto& record : records) {
        downloads[record.id] = record;
    }
    
    json state = {{"downloads", downloads}};
    
    if (!JsonUtils::writeFile(m_path, state, 2)) {
        Logger::instance().error("Failed to save download state to {}", m_path.string());
        return false;
    }
    
    Logger::instance().debug("Download state saved ({} records)", records.size());
    return true;
}

std::vector<TransferRecord> StateStore::load() const {
    std::vector<TransferRecord> records;
    
    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) {
        return records;
    }
    
    auto state = JsonUtils::parseFile(m_path);
    if (!state || !state->is_object()) {
        Logger::instance().error("Download state {} is unreadable, starting empty", m_path.string());
        return records;
    }
    
    json downloads = JsonUtils::getObject(*state, "downloads");
    for (const auto& item : downloads.items()) {
        if (!item.value().is_object()) {
            Logger::instance().warn("Skipping malformed entry {} in download state", item.key());
            continue;
        }
        
        TransferRecord record = item.value().get<TransferRecord>();
        if (record.id.empty()) {
            record.id = item.key();
        }
        if (record.url.empty() || record.destination.empty()) {
            Logger::instance().warn("Skipping entry {} without url or destination", record.id);
            continue;
        }
        
        std::string statusName = JsonUtils::getString(item.value(), "status");
        if (!transferStatusFromString(statusName)) {
            Logger::instance().warn("Invalid status '{}' for {}, marking as failed", statusName, record.id);
        }
        
        if (record.status == TransferStatus::Downloading) {
            record.status = TransferStatus::Paused;
            record.speedBytesPerSec = 0.0;
            record.etaSeconds = 0;
            Logger::instance().info("Download {} was interrupted, set to paused", record.id);
        }
        
        records.push_back(std::move(record));
    }
    
    std::stable_sort(records.begin(), records.end(), [](const TransferRecord& a, const TransferRecord& b) {
        if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
        return a.id < b.id;
    });
    
    if (!records.empty()) {
        Logger::instance().info("Loaded {} downloads from {}", records.size(), m_path.string());
    }
    return records;
}

} // namespace heal::core::downloader
