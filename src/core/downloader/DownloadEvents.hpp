#pragma once

/**
 * DownloadEvents.hpp
 * 
 * Names and payloads of the events the download manager publishes on the
 * EventBus. Subscribers never see TransferRecords, only these payloads.
 */

#include "TransferRecord.hpp"

#include <cstdint>
#include <string>

namespace heal::core::downloader::events {

// {id}
inline constexpr const char* Added = "download.added";
// {id}
inline constexpr const char* Started = "download.started";
// {id, downloaded, total, speed}
inline constexpr const char* Progress = "download.progress";
// {id, status}
inline constexpr const char* StatusChanged = "download.status";
// {id}
inline constexpr const char* Completed = "download.completed";
// {id, message}
inline constexpr const char* Failed = "download.failed";
// {id}
inline constexpr const char* Removed = "download.removed";

inline json idPayload(const std::string& id) {
    return {{"id", id}};
}

inline json progressPayload(const std::string& id, int64_t downloaded, int64_t total, double speed) {
    return {{"id", id}, {"downloaded", downloaded}, {"total", total}, {"speed", speed}};
}

inline json statusPayload(const std::string& id, TransferStatus status) {
    return {{"id", id}, {"status", toString(status)}};
}

inline json failedPayload(const std::string& id, const std::string& message) {
    return {{"id", id}, {"message", message}};
}

} // namespace heal::core::downloader::events
