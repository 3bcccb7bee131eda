#pragma once

/**
 * FetchWorker.hpp
 * 
 * Executes exactly one attempt of one transfer: HTTP GET (ranged when a
 * partial file exists), streaming to disk, throughput/ETA, checksum
 * verification. Reports through WorkerEvents, never by throwing.
 */

#include "TransferRecord.hpp"
#include "../../utils/HttpClient.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <functional>
#include <memory>
#include <string>

namespace heal::core::downloader {

/**
 * Message from a worker to its owner
 */
struct WorkerEvent {
    enum class Type {
        Progress,
        Finished
    };
    
    Type type{Type::Progress};
    std::string id;
    
    // Attempt number assigned by the manager, used to drop stale reports
    uint64_t attempt{0};
    
    int64_t downloadedBytes{0};
    int64_t totalBytes{0};
    double speedBytesPerSec{0.0};
    int64_t etaSeconds{0};
    
    // Finished only: Completed, Failed or Cancelled
    TransferStatus outcome{TransferStatus::Failed};
    std::string error;
    
    // Finished only: the partial file must not be resumed from
    bool discardPartial{false};
    
    Timestamp timestamp{};
};

using WorkerEventSink = std::function<void(WorkerEvent)>;
using CancelToken = std::shared_ptr<std::atomic<bool>>;

/**
 * Tuning shared by all workers of a manager
 */
struct WorkerOptions {
    // Chunks buffered in memory between two writes
    size_t bufferChunks{10};
    
    // Minimum time between two progress events
    std::chrono::milliseconds progressInterval{500};
    
    int connectTimeoutSeconds{10};
    std::string userAgent{"Heal-Downloader/1.0"};
};

/**
 * FetchWorker - one attempt of one transfer
 * 
 * Construct, call run() on the thread that should block on the network,
 * drop. Cancellation is cooperative: the token is checked at every chunk
 * boundary, so a stalled read delays it until data or the timeout arrives.
 */
class FetchWorker {
public:
    FetchWorker(TransferRecord record,
                uint64_t attempt,
                utils::HttpClient& http,
                WorkerOptions options,
                CancelToken cancelToken,
                WorkerEventSink sink);
    
    FetchWorker(const FetchWorker&) = delete;
    FetchWorker& operator=(const FetchWorker&) = delete;
    
    /**
     * Perform the attempt. Posts progress events while streaming and
     * exactly one Finished event at the end, which is also returned.
     */
    WorkerEvent run();

private:
    // Throws DownloadError subclasses
    void performAttempt();
    
    bool handleResponse(int statusCode, const utils::HttpHeaders& headers);
    bool handleData(const char* data, size_t size);
    
    void resolveTotalSize(int statusCode, const utils::HttpHeaders& headers);
    void verifyChecksum();
    
    void flushBuffer();
    bool flushBufferNoThrow();
    void closeFile();
    
    bool isCancelRequested() const { return m_cancelToken->load(); }
    
    void updateThroughput();
    void postProgress();
    WorkerEvent makeEvent(WorkerEvent::Type type) const;

private:
    TransferRecord m_record;
    uint64_t m_attempt;
    utils::HttpClient& m_http;
    WorkerOptions m_options;
    CancelToken m_cancelToken;
    WorkerEventSink m_sink;
    
    // Per-attempt state
    std::chrono::steady_clock::time_point m_attemptStart;
    std::chrono::steady_clock::time_point m_lastReport;
    int64_t m_resumeOffset{0};
    bool m_cancelled{false};
    bool m_alreadyComplete{false};
    bool m_discardPartial{false};
    bool m_overrun{false};
    
    std::ofstream m_file;
    std::string m_buffer;
    size_t m_bufferLimit{0};
    
    // Error raised inside an HTTP callback, rethrown after the request
    std::exception_ptr m_callbackError;
};

} // namespace heal::core::downloader
