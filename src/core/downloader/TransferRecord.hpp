#pragma once

/**
 * TransferRecord.hpp
 * 
 * Identity, options and live progress of one download.
 */

#include "../../utils/HashUtils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace heal::core::downloader {

using json = nlohmann::json;
using Timestamp = std::chrono::system_clock::time_point;

/**
 * Transfer status
 * 
 * Completed and Cancelled are terminal. Failed is terminal once the retry
 * budget is spent, otherwise the retry sweep moves it back to Pending.
 */
enum class TransferStatus {
    Pending,
    Downloading,
    Paused,
    Completed,
    Failed,
    Cancelled
};

/**
 * Lower-case status name used in the state file and in events
 */
std::string toString(TransferStatus status);

/**
 * Inverse of toString(); nullopt for unknown names
 */
std::optional<TransferStatus> transferStatusFromString(const std::string& name);

/**
 * Expected digest of the finished file
 */
struct Checksum {
    std::string value;
    utils::HashAlgorithm algorithm{utils::HashAlgorithm::Md5};
};

/**
 * TransferRecord - one managed download
 * 
 * Plain value type. The manager keeps the authoritative copy under its lock
 * and hands out copies; workers receive a copy for the duration of an
 * attempt and report back through events.
 */
struct TransferRecord {
    // Stable identifier derived from URL and creation time
    std::string id;
    
    std::string url;
    std::string destination;
    
    // 0 = unknown until the first response
    int64_t totalBytes{0};
    int64_t downloadedBytes{0};
    
    TransferStatus status{TransferStatus::Pending};
    double speedBytesPerSec{0.0};
    int64_t etaSeconds{0};
    
    int retryCount{0};
    int maxRetries{3};
    size_t chunkSize{8192};
    int timeoutSeconds{30};
    
    std::map<std::string, std::string> extraHeaders;
    std::optional<Checksum> checksum;
    
    Timestamp createdAt{};
    std::optional<Timestamp> startedAt;
    std::optional<Timestamp> endedAt;
    
    std::optional<std::string> lastError;
    
    // Cleared when the partial file can't be trusted (checksum mismatch)
    bool resumable{true};
    
    /**
     * Progress in percent, 0 while the size is unknown
     */
    double progressPercent() const {
        if (totalBytes <= 0) return 0.0;
        return static_cast<double>(downloadedBytes) * 100.0 / static_cast<double>(totalBytes);
    }
    
    bool isCompleted() const { return status == TransferStatus::Completed; }
    
    bool isTerminal() const {
        return status == TransferStatus::Completed || status == TransferStatus::Cancelled;
    }
    
    /**
     * Whether a new attempt would continue from the partial data
     */
    bool canResume() const {
        return resumable && downloadedBytes > 0 &&
               (totalBytes == 0 || downloadedBytes < totalBytes);
    }
};

void to_json(json& j, const TransferRecord& record);
void from_json(const json& j, TransferRecord& record);

/**
 * Seconds since the epoch, the representation used in the state file
 */
double toEpochSeconds(Timestamp time);
Timestamp fromEpochSeconds(double seconds);

} // namespace heal::core::downloader
