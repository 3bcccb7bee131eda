#pragma once

/**
 * DownloadManager.hpp
 * 
 * Owns the transfer records, bounds concurrency, schedules pending and
 * retrying transfers onto fetch workers, persists every state change and
 * publishes progress and lifecycle events on the EventBus.
 */

#include "DownloadSettings.hpp"
#include "FetchWorker.hpp"
#include "StateStore.hpp"
#include "TransferRecord.hpp"
#include "../EventBus.hpp"
#include "../../utils/HttpClient.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace heal::core::downloader {

/**
 * Per-transfer overrides for add(); unset fields take the settings default
 */
struct AddOptions {
    std::optional<int> maxRetries;
    std::optional<size_t> chunkSize;
    std::optional<int> timeoutSeconds;
    std::map<std::string, std::string> headers;
    std::optional<Checksum> checksum;
};

/**
 * Aggregate view over all records
 */
struct DownloadStatistics {
    size_t total{0};
    size_t pending{0};
    size_t downloading{0};
    size_t paused{0};
    size_t completed{0};
    size_t failed{0};
    size_t cancelled{0};
    
    // Sum over records with a known size
    int64_t totalBytes{0};
    int64_t downloadedBytes{0};
    
    // Sum over Downloading records
    double totalSpeed{0.0};
    
    // downloadedBytes / totalBytes in percent, 0 when nothing is sized
    double progress{0.0};
};

/**
 * Delay before the retry sweep may requeue a failed record, keyed by its
 * retryCount. The default is no delay beyond the sweep interval.
 */
using RetryBackoff = std::function<std::chrono::milliseconds(int retryCount)>;

/**
 * DownloadManager - transfer scheduling and control
 * 
 * Every mutation runs under one mutex. Workers never touch the records;
 * they post WorkerEvents to an inbox drained by a single dispatcher thread,
 * which also runs the retry sweep and emits all bus events in the order the
 * mutations happened. Control operations return false for unknown ids and
 * invalid transitions and never throw for them.
 */
class DownloadManager {
public:
    DownloadManager(DownloadSettings settings, utils::HttpClient& http, EventBus& events);
    
    /**
     * Destructor - shuts down if still running
     */
    ~DownloadManager();
    
    // Disable copy
    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;
    
    /**
     * Restore persisted records and start the dispatcher.
     * Records that were Downloading come back Paused; Pending ones are
     * scheduled immediately.
     */
    void initialize();
    
    /**
     * Stop the retry sweep, pause running transfers, wait for their workers
     * and persist the final state
     */
    void shutdown();
    
    /**
     * Add a transfer
     * @param url Source URL
     * @param destination Target path; empty = URL basename under the download directory
     * @param options Per-transfer overrides
     * @return Transfer ID
     * @throws std::invalid_argument for an empty URL or malformed options
     * @throws std::logic_error before initialize()
     */
    std::string add(const std::string& url,
                    const std::string& destination = "",
                    const AddOptions& options = {});
    
    /**
     * Run the transfer now if a slot is free, otherwise queue it.
     * True without effect when already Downloading or Completed.
     */
    bool start(const std::string& id);
    
    /**
     * Stop a Downloading transfer, keeping the partial file
     */
    bool pause(const std::string& id);
    
    /**
     * Continue a Paused or Failed transfer; a Failed one gets a fresh retry
     * budget
     */
    bool resume(const std::string& id);
    
    /**
     * Stop a transfer for good. A Completed file is never deleted.
     * @param deleteFile Remove the partial file
     */
    bool cancel(const std::string& id, bool deleteFile = true);
    
    /**
     * Cancel if active and forget the record
     * @param deleteFile Also remove the file, whatever its state
     */
    bool remove(const std::string& id, bool deleteFile = false);
    
    /**
     * Snapshot of one record
     */
    std::optional<TransferRecord> getInfo(const std::string& id) const;
    
    /**
     * Snapshots of all records in insertion order
     */
    std::vector<TransferRecord> list() const;
    
    DownloadStatistics getStatistics() const;
    
    /**
     * IDs of Downloading records
     */
    std::vector<std::string> activeDownloads() const;
    
    /**
     * Forget all Completed records, keeping their files
     * @return Number of records removed
     */
    size_t clearCompleted();
    
    /**
     * Pause every Downloading record and hold every Pending one
     * @return Number of records paused
     */
    size_t pauseAll();
    
    /**
     * Resume every Paused record in insertion order
     * @return Number of records resumed
     */
    size_t resumeAll();
    
    /**
     * Change the concurrency cap; extra capacity is filled immediately
     * @throws std::invalid_argument for 0
     */
    void setMaxConcurrent(size_t max);
    size_t getMaxConcurrent() const;
    
    void setRetryBackoff(RetryBackoff backoff);
    
    /**
     * Run the retry sweep now instead of waiting for the next interval
     */
    void retryFailedNow();
    
    /**
     * Block until no worker is running, nothing is queued or awaiting an
     * automatic retry, and every event has been delivered
     * @return false on timeout
     */
    bool waitForAll(std::chrono::milliseconds timeout);

private:
    struct Entry {
        TransferRecord record;
        
        // Incremented per spawned attempt
        uint64_t attempt{0};
    };
    
    struct ActiveWorker {
        uint64_t attempt{0};
        std::string destination;
        CancelToken token;
        std::thread thread;
        bool deleteFileOnExit{false};
    };
    
    struct Notification {
        std::string event;
        json payload;
    };
    
    // Everything below expects m_mutex to be held
    Entry* findLocked(const std::string& id);
    const Entry* findLocked(const std::string& id) const;
    size_t countLocked(TransferStatus status) const;
    bool hasFreeSlotLocked() const;
    bool hasLiveWriterLocked(const Entry& entry) const;
    
    bool startLocked(Entry& entry);
    void spawnWorkerLocked(Entry& entry);
    bool scheduleNextLocked();
    void fillCapacityLocked();
    bool pauseLocked(Entry& entry);
    
    void setStatusLocked(Entry& entry, TransferStatus status);
    void notifyLocked(const char* event, json payload);
    void persistLocked();
    
    void handleWorkerEventLocked(const WorkerEvent& event, std::vector<std::thread>& finishedThreads);
    void applyOutcomeLocked(Entry& entry, const WorkerEvent& event);
    void sweepRetriesLocked();
    
    std::string generateIdLocked(const std::string& url, Timestamp createdAt);
    std::filesystem::path deriveDestination(const std::string& url) const;
    
    bool isIdleLocked() const;
    
    // Worker thread side
    void postWorkerEvent(WorkerEvent event);
    
    // Dispatcher thread
    void dispatchLoop();

private:
    DownloadSettings m_settings;
    utils::HttpClient& m_http;
    EventBus& m_events;
    StateStore m_store;
    WorkerOptions m_workerOptions;
    RetryBackoff m_retryBackoff;
    
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;
    
    std::unordered_map<std::string, Entry> m_entries;
    std::vector<std::string> m_order;
    std::unordered_map<std::string, ActiveWorker> m_workers;
    
    std::deque<WorkerEvent> m_inbox;
    std::vector<Notification> m_outbox;
    bool m_emitting{false};
    
    std::thread m_dispatcher;
    bool m_initialized{false};
    bool m_shuttingDown{false};
    bool m_stopDispatcher{false};
    
    uint64_t m_idSequence{0};
};

} // namespace heal::core::downloader
