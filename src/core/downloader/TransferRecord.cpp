/**
 * TransferRecord.cpp
 * 
 * Status names and JSON mapping of transfer records.
 */

#include "TransferRecord.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace heal::core::downloader {

using utils::JsonUtils;

std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:     return "pending";
        case TransferStatus::Downloading: return "downloading";
        case TransferStatus::Paused:      return "paused";
        case TransferStatus::Completed:   return "completed";
        case TransferStatus::Failed:      return "failed";
        case TransferStatus::Cancelled:   return "cancelled";
    }
    return "failed";
}

std::optional<TransferStatus> transferStatusFromString(const std::string& name) {
    std::string lower = utils::StringUtils::toLower(name);
    if (lower == "pending")     return TransferStatus::Pending;
    if (lower == "downloading") return TransferStatus::Downloading;
    if (lower == "paused")      return TransferStatus::Paused;
    if (lower == "completed")   return TransferStatus::Completed;
    if (lower == "failed")      return TransferStatus::Failed;
    if (lower == "cancelled")   return TransferStatus::Cancelled;
    return std::nullopt;
}

double toEpochSeconds(Timestamp time) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch());
    return static_cast<double>(micros.count()) / 1e6;
}

Timestamp fromEpochSeconds(double seconds) {
    auto micros = std::chrono::microseconds(static_cast<int64_t>(seconds * 1e6));
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(micros));
}

namespace {

json optionalTime(const std::optional<Timestamp>& time) {
    return time ? json(toEpochSeconds(*time)) : json(nullptr);
}

} // namespace

void to_json(json& j, const TransferRecord& record) {
    j = json{
        {"id", record.id},
        {"url", record.url},
        {"destination", record.destination},
        {"totalBytes", record.totalBytes},
        {"downloadedBytes", record.downloadedBytes},
        {"status", toString(record.status)},
        {"speedBytesPerSec", record.speedBytesPerSec},
        {"etaSeconds", record.etaSeconds},
        {"retryCount", record.retryCount},
        {"maxRetries", record.maxRetries},
        {"chunkSize", record.chunkSize},
        {"timeoutSeconds", record.timeoutSeconds},
        {"extraHeaders", record.extraHeaders},
        {"checksum", record.checksum ? json(record.checksum->value) : json(nullptr)},
        {"checksumAlgorithm", utils::HashUtils::algorithmName(
            record.checksum ? record.checksum->algorithm : utils::HashAlgorithm::Md5)},
        {"createdAt", toEpochSeconds(record.createdAt)},
        {"startedAt", optionalTime(record.startedAt)},
        {"endedAt", optionalTime(record.endedAt)},
        {"lastError", record.lastError ? json(*record.lastError) : json(nullptr)},
        {"resumable", record.resumable}
    };
}

void from_json(const json& j, TransferRecord& record) {
    record.id = JsonUtils::getString(j, "id");
    record.url = JsonUtils::getString(j, "url");
    record.destination = JsonUtils::getString(j, "destination");
    record.totalBytes = JsonUtils::getLong(j, "totalBytes");
    record.downloadedBytes = JsonUtils::getLong(j, "downloadedBytes");
    record.status = transferStatusFromString(JsonUtils::getString(j, "status"))
        .value_or(TransferStatus::Failed);
    record.speedBytesPerSec = JsonUtils::getDouble(j, "speedBytesPerSec");
    record.etaSeconds = JsonUtils::getLong(j, "etaSeconds");
    record.retryCount = JsonUtils::getInt(j, "retryCount");
    record.maxRetries = JsonUtils::getInt(j, "maxRetries", 3);
    record.chunkSize = static_cast<size_t>(JsonUtils::getLong(j, "chunkSize", 8192));
    record.timeoutSeconds = JsonUtils::getInt(j, "timeoutSeconds", 30);
    
    record.extraHeaders.clear();
    json headers = JsonUtils::getObject(j, "extraHeaders");
    for (const auto& item : headers.items()) {
        if (item.value().is_string()) {
            record.extraHeaders[item.key()] = item.value().get<std::string>();
        }
    }
    
    record.checksum.reset();
    if (auto value = JsonUtils::getOptionalString(j, "checksum"); value && !value->empty()) {
        auto algorithm = utils::HashUtils::algorithmFromName(JsonUtils::getString(j, "checksumAlgorithm", "md5"));
        record.checksum = Checksum{*value, algorithm.value_or(utils::HashAlgorithm::Md5)};
    }
    
    record.createdAt = fromEpochSeconds(JsonUtils::getDouble(j, "createdAt"));
    
    auto started = JsonUtils::getOptionalDouble(j, "startedAt");
    record.startedAt = started ? std::optional<Timestamp>(fromEpochSeconds(*started)) : std::nullopt;
    auto ended = JsonUtils::getOptionalDouble(j, "endedAt");
    record.endedAt = ended ? std::optional<Timestamp>(fromEpochSeconds(*ended)) : std::nullopt;
    
    record.lastError = JsonUtils::getOptionalString(j, "lastError");
    record.resumable = JsonUtils::getBool(j, "resumable", true);
}

} // namespace heal::core::downloader
