/**
 * DownloadManager.cpp
 * 
 * Implementation of transfer scheduling, control and persistence.
 */

#include "DownloadManager.hpp"
#include "DownloadEvents.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/HashUtils.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace heal::core::downloader {

using utils::FileUtils;
using utils::HashUtils;
using utils::HttpClient;

DownloadManager::DownloadManager(DownloadSettings settings, utils::HttpClient& http, EventBus& events)
    : m_settings(std::move(settings))
    , m_http(http)
    , m_events(events)
    , m_store(m_settings.resolvedStateFile())
    , m_retryBackoff([](int) { return std::chrono::milliseconds(0); }) {
    
    m_settings.validate();
    
    m_workerOptions.bufferChunks = m_settings.bufferChunks;
    m_workerOptions.progressInterval = m_settings.progressInterval;
    m_workerOptions.connectTimeoutSeconds = m_settings.connectTimeoutSeconds;
    m_workerOptions.userAgent = m_settings.userAgent;
}

DownloadManager::~DownloadManager() {
    shutdown();
}

void DownloadManager::initialize() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized) return;
    
    if (!FileUtils::createDirectories(m_settings.downloadDirectory)) {
        Logger::instance().warn("Could not create download directory {}", m_settings.downloadDirectory.string());
    }
    
    for (auto& record : m_store.load()) {
        std::string id = record.id;
        if (m_entries.count(id)) {
            Logger::instance().warn("Duplicate transfer {} in state file, keeping the first", id);
            continue;
        }
        Entry entry;
        entry.record = std::move(record);
        m_entries.emplace(id, std::move(entry));
        m_order.push_back(id);
    }
    
    m_initialized = true;
    m_shuttingDown = false;
    m_stopDispatcher = false;
    m_dispatcher = std::thread(&DownloadManager::dispatchLoop, this);
    
    Logger::instance().info("DownloadManager initialized: {} transfers restored, {} concurrent, state in {}",
                            m_order.size(), m_settings.maxConcurrentDownloads, m_store.path().string());
    
    fillCapacityLocked();
}

void DownloadManager::shutdown() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_initialized || m_shuttingDown) return;
    
    m_shuttingDown = true;
    Logger::instance().info("Shutting down DownloadManager...");
    
    for (const auto& id : m_order) {
        Entry& entry = m_entries.at(id);
        if (entry.record.status == TransferStatus::Downloading) {
            pauseLocked(entry);
        }
    }
    for (auto& [id, worker] : m_workers) {
        worker.token->store(true);
    }
    persistLocked();
    
    // The dispatcher keeps draining worker reports until the last one is in
    m_idleCondition.wait(lock, [this]() { return isIdleLocked(); });
    
    m_stopDispatcher = true;
    m_condition.notify_all();
    lock.unlock();
    
    if (m_dispatcher.joinable()) {
        m_dispatcher.join();
    }
    
    lock.lock();
    persistLocked();
    m_initialized = false;
    
    Logger::instance().info("DownloadManager shutdown complete");
}

std::string DownloadManager::add(const std::string& url,
                                 const std::string& destination,
                                 const AddOptions& options) {
    if (url.empty()) {
        throw std::invalid_argument("URL must not be empty");
    }
    if (options.maxRetries && *options.maxRetries < 0) {
        throw std::invalid_argument("maxRetries must not be negative");
    }
    if (options.chunkSize && *options.chunkSize == 0) {
        throw std::invalid_argument("chunkSize must be at least 1");
    }
    if (options.timeoutSeconds && *options.timeoutSeconds <= 0) {
        throw std::invalid_argument("timeoutSeconds must be positive");
    }
    if (options.checksum && options.checksum->value.empty()) {
        throw std::invalid_argument("checksum value must not be empty");
    }
    
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized || m_shuttingDown) {
        throw std::logic_error("DownloadManager is not running");
    }
    
    Entry entry;
    TransferRecord& record = entry.record;
    record.url = url;
    record.createdAt = std::chrono::system_clock::now();
    record.id = generateIdLocked(url, record.createdAt);
    record.destination = destination.empty() ? deriveDestination(url).string() : destination;
    record.maxRetries = options.maxRetries.value_or(m_settings.maxRetries);
    record.chunkSize = options.chunkSize.value_or(m_settings.chunkSize);
    record.timeoutSeconds = options.timeoutSeconds.value_or(m_settings.timeoutSeconds);
    record.extraHeaders = options.headers;
    record.checksum = options.checksum;
    
    std::string id = record.id;
    Logger::instance().info("Added transfer {}: {} -> {}", id, url, record.destination);
    
    m_order.push_back(id);
    Entry& stored = m_entries.emplace(id, std::move(entry)).first->second;
    
    notifyLocked(events::Added, events::idPayload(id));
    persistLocked();
    
    if (hasFreeSlotLocked() && !hasLiveWriterLocked(stored)) {
        spawnWorkerLocked(stored);
    }
    
    return id;
}

bool DownloadManager::start(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Entry* entry = findLocked(id);
    if (!entry) {
        Logger::instance().warn("start: unknown transfer {}", id);
        return false;
    }
    
    switch (entry->record.status) {
        case TransferStatus::Downloading:
        case TransferStatus::Completed:
            return true;
        case TransferStatus::Cancelled:
            // Restarts through the queue and resumes from any kept partial file
            setStatusLocked(*entry, TransferStatus::Pending);
            persistLocked();
            break;
        case TransferStatus::Paused:
        case TransferStatus::Failed:
        case TransferStatus::Pending:
            break;
    }
    
    return startLocked(*entry);
}

bool DownloadManager::pause(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Entry* entry = findLocked(id);
    if (!entry) {
        Logger::instance().warn("pause: unknown transfer {}", id);
        return false;
    }
    if (entry->record.status != TransferStatus::Downloading) {
        Logger::instance().warn("pause: transfer {} is {}", id, toString(entry->record.status));
        return false;
    }
    
    pauseLocked(*entry);
    persistLocked();
    return true;
}

bool DownloadManager::resume(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Entry* entry = findLocked(id);
    if (!entry) {
        Logger::instance().warn("resume: unknown transfer {}", id);
        return false;
    }
    
    TransferRecord& record = entry->record;
    if (record.status != TransferStatus::Paused && record.status != TransferStatus::Failed) {
        Logger::instance().warn("resume: transfer {} is {}", id, toString(record.status));
        return false;
    }
    
    if (record.status == TransferStatus::Failed) {
        record.retryCount = 0;
        record.lastError.reset();
    }
    
    return startLocked(*entry);
}

bool DownloadManager::cancel(const std::string& id, bool deleteFile) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Entry* entry = findLocked(id);
    if (!entry) {
        Logger::instance().warn("cancel: unknown transfer {}", id);
        return false;
    }
    
    TransferRecord& record = entry->record;
    // A completed file is never deleted
    if (record.status == TransferStatus::Completed) {
        deleteFile = false;
    }
    
    auto worker = m_workers.find(id);
    if (worker != m_workers.end()) {
        worker->second.token->store(true);
        worker->second.deleteFileOnExit = worker->second.deleteFileOnExit || deleteFile;
    } else if (deleteFile) {
        FileUtils::deleteFile(record.destination);
    }
    
    if (deleteFile) {
        record.downloadedBytes = 0;
    }
    if (record.status != TransferStatus::Completed) {
        record.endedAt = std::chrono::system_clock::now();
    }
    record.speedBytesPerSec = 0.0;
    record.etaSeconds = 0;
    setStatusLocked(*entry, TransferStatus::Cancelled);
    persistLocked();
    
    Logger::instance().info("Cancelled transfer {}", id);
    return true;
}

bool DownloadManager::remove(const std::string& id, bool deleteFile) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Entry* entry = findLocked(id);
    if (!entry) {
        Logger::instance().warn("remove: unknown transfer {}", id);
        return false;
    }
    
    auto worker = m_workers.find(id);
    if (worker != m_workers.end()) {
        worker->second.token->store(true);
        worker->second.deleteFileOnExit = worker->second.deleteFileOnExit || deleteFile;
    } else if (deleteFile) {
        FileUtils::deleteFile(entry->record.destination);
    }
    
    if (!entry->record.isTerminal() && entry->record.status != TransferStatus::Failed) {
        notifyLocked(events::StatusChanged, events::statusPayload(id, TransferStatus::Cancelled));
    }
    
    m_entries.erase(id);
    m_order.erase(std::remove(m_order.begin(), m_order.end(), id), m_order.end());
    
    notifyLocked(events::Removed, events::idPayload(id));
    persistLocked();
    scheduleNextLocked();
    
    Logger::instance().info("Removed transfer {}", id);
    return true;
}

std::optional<TransferRecord> DownloadManager::getInfo(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Entry* entry = findLocked(id);
    if (!entry) return std::nullopt;
    return entry->record;
}

std::vector<TransferRecord> DownloadManager::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<TransferRecord> records;
    records.reserve(m_order.size());
    for (const auto& id : m_order) {
        records.push_back(m_entries.at(id).record);
    }
    return records;
}

DownloadStatistics DownloadManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    DownloadStatistics stats;
    stats.total = m_order.size();
    
    for (const auto& id : m_order) {
        const TransferRecord& record = m_entries.at(id).record;
        switch (record.status) {
            case TransferStatus::Pending:     ++stats.pending; break;
            case TransferStatus::Downloading:
                ++stats.downloading;
                stats.totalSpeed += record.speedBytesPerSec;
                break;
            case TransferStatus::Paused:      ++stats.paused; break;
            case TransferStatus::Completed:   ++stats.completed; break;
            case TransferStatus::Failed:      ++stats.failed; break;
            case TransferStatus::Cancelled:   ++stats.cancelled; break;
        }
        if (record.totalBytes > 0) {
            stats.totalBytes += record.totalBytes;
            stats.downloadedBytes += record.downloadedBytes;
        }
    }
    
    if (stats.totalBytes > 0) {
        stats.progress = static_cast<double>(stats.downloadedBytes) * 100.0 /
                         static_cast<double>(stats.totalBytes);
    }
    return stats;
}

std::vector<std::string> DownloadManager::activeDownloads() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    for (const auto& id : m_order) {
        if (m_entries.at(id).record.status == TransferStatus::Downloading) {
            ids.push_back(id);
        }
    }
    return ids;
}

size_t DownloadManager::clearCompleted() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> completed;
    for (const auto& id : m_order) {
        if (m_entries.at(id).record.status == TransferStatus::Completed) {
            completed.push_back(id);
        }
    }
    if (completed.empty()) return 0;
    
    for (const auto& id : completed) {
        m_entries.erase(id);
        notifyLocked(events::Removed, events::idPayload(id));
    }
    m_order.erase(std::remove_if(m_order.begin(), m_order.end(),
                                 [this](const std::string& id) { return m_entries.count(id) == 0; }),
                  m_order.end());
    persistLocked();
    
    Logger::instance().info("Cleared {} completed transfers", completed.size());
    return completed.size();
}

size_t DownloadManager::pauseAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& id : m_order) {
        Entry& entry = m_entries.at(id);
        if (entry.record.status == TransferStatus::Downloading) {
            pauseLocked(entry);
            ++count;
        } else if (entry.record.status == TransferStatus::Pending) {
            setStatusLocked(entry, TransferStatus::Paused);
            ++count;
        }
    }
    if (count > 0) persistLocked();
    return count;
}

size_t DownloadManager::resumeAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& id : m_order) {
        Entry& entry = m_entries.at(id);
        if (entry.record.status == TransferStatus::Paused) {
            if (startLocked(entry)) ++count;
        }
    }
    return count;
}

void DownloadManager::setMaxConcurrent(size_t max) {
    if (max == 0) {
        throw std::invalid_argument("maxConcurrent must be at least 1");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.maxConcurrentDownloads = max;
    Logger::instance().info("Max concurrent transfers set to {}", max);
    fillCapacityLocked();
}

size_t DownloadManager::getMaxConcurrent() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settings.maxConcurrentDownloads;
}

void DownloadManager::setRetryBackoff(RetryBackoff backoff) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (backoff) {
        m_retryBackoff = std::move(backoff);
    } else {
        m_retryBackoff = [](int) { return std::chrono::milliseconds(0); };
    }
}

void DownloadManager::retryFailedNow() {
    std::lock_guard<std::mutex> lock(m_mutex);
    sweepRetriesLocked();
}

bool DownloadManager::waitForAll(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCondition.wait_for(lock, timeout, [this]() {
        if (!isIdleLocked()) return false;
        // Queued work and failures the sweep will still retry count as busy
        return std::none_of(m_order.begin(), m_order.end(), [this](const std::string& id) {
            const TransferRecord& record = m_entries.at(id).record;
            switch (record.status) {
                case TransferStatus::Pending:
                case TransferStatus::Downloading:
                    return true;
                case TransferStatus::Failed:
                    return !m_shuttingDown && record.retryCount < record.maxRetries;
                default:
                    return false;
            }
        });
    });
}

// ============================================================================
// Locked helpers
// ============================================================================

DownloadManager::Entry* DownloadManager::findLocked(const std::string& id) {
    auto it = m_entries.find(id);
    return it != m_entries.end() ? &it->second : nullptr;
}

const DownloadManager::Entry* DownloadManager::findLocked(const std::string& id) const {
    auto it = m_entries.find(id);
    return it != m_entries.end() ? &it->second : nullptr;
}

size_t DownloadManager::countLocked(TransferStatus status) const {
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [status](const auto& item) { return item.second.record.status == status; }));
}

bool DownloadManager::hasFreeSlotLocked() const {
    return !m_shuttingDown && countLocked(TransferStatus::Downloading) < m_settings.maxConcurrentDownloads;
}

bool DownloadManager::hasLiveWriterLocked(const Entry& entry) const {
    if (m_workers.count(entry.record.id)) return true;
    return std::any_of(m_workers.begin(), m_workers.end(), [&entry](const auto& item) {
        return item.second.destination == entry.record.destination;
    });
}

bool DownloadManager::startLocked(Entry& entry) {
    if (hasFreeSlotLocked() && !hasLiveWriterLocked(entry)) {
        spawnWorkerLocked(entry);
    } else if (entry.record.status != TransferStatus::Pending) {
        setStatusLocked(entry, TransferStatus::Pending);
        persistLocked();
        Logger::instance().debug("Transfer {} queued", entry.record.id);
    }
    return true;
}

void DownloadManager::spawnWorkerLocked(Entry& entry) {
    TransferRecord& record = entry.record;
    const std::string id = record.id;
    
    record.startedAt = std::chrono::system_clock::now();
    record.endedAt.reset();
    record.lastError.reset();
    record.speedBytesPerSec = 0.0;
    record.etaSeconds = 0;
    
    uint64_t attempt = ++entry.attempt;
    TransferRecord snapshot = record;
    
    // A distrusted partial file is truncated by this attempt
    if (!record.resumable) {
        record.resumable = true;
        record.downloadedBytes = 0;
    }
    
    auto token = std::make_shared<std::atomic<bool>>(false);
    
    ActiveWorker worker;
    worker.attempt = attempt;
    worker.destination = record.destination;
    worker.token = token;
    
    try {
        worker.thread = std::thread([this, snapshot, attempt, token]() {
            FetchWorker fetch(snapshot, attempt, m_http, m_workerOptions, token,
                              [this](WorkerEvent event) { postWorkerEvent(std::move(event)); });
            fetch.run();
        });
    } catch (const std::system_error& e) {
        Logger::instance().error("Could not start worker for {}: {}", id, e.what());
        record.lastError = std::string("State error: could not start worker: ") + e.what();
        record.endedAt = std::chrono::system_clock::now();
        setStatusLocked(entry, TransferStatus::Failed);
        notifyLocked(events::Failed, events::failedPayload(id, *record.lastError));
        persistLocked();
        return;
    }
    
    m_workers.emplace(id, std::move(worker));
    
    setStatusLocked(entry, TransferStatus::Downloading);
    notifyLocked(events::Started, events::idPayload(id));
    persistLocked();
    
    Logger::instance().info("Started transfer {} (attempt {}, {} retries used)", id, attempt,
                            record.retryCount);
}

bool DownloadManager::scheduleNextLocked() {
    if (!hasFreeSlotLocked()) return false;
    
    for (const auto& id : m_order) {
        Entry& entry = m_entries.at(id);
        if (entry.record.status == TransferStatus::Pending && !hasLiveWriterLocked(entry)) {
            spawnWorkerLocked(entry);
            return true;
        }
    }
    return false;
}

void DownloadManager::fillCapacityLocked() {
    while (scheduleNextLocked()) {
    }
}

bool DownloadManager::pauseLocked(Entry& entry) {
    auto worker = m_workers.find(entry.record.id);
    if (worker != m_workers.end()) {
        worker->second.token->store(true);
    }
    entry.record.speedBytesPerSec = 0.0;
    entry.record.etaSeconds = 0;
    setStatusLocked(entry, TransferStatus::Paused);
    Logger::instance().info("Paused transfer {} at {} bytes", entry.record.id, entry.record.downloadedBytes);
    return true;
}

void DownloadManager::setStatusLocked(Entry& entry, TransferStatus status) {
    if (entry.record.status == status) return;
    entry.record.status = status;
    notifyLocked(events::StatusChanged, events::statusPayload(entry.record.id, status));
}

void DownloadManager::notifyLocked(const char* event, json payload) {
    m_outbox.push_back(Notification{event, std::move(payload)});
    m_condition.notify_all();
}

void DownloadManager::persistLocked() {
    std::vector<TransferRecord> records;
    records.reserve(m_order.size());
    for (const auto& id : m_order) {
        records.push_back(m_entries.at(id).record);
    }
    if (!m_store.save(records)) {
        Logger::instance().error("Failed to persist download state to {}", m_store.path().string());
    }
}

void DownloadManager::handleWorkerEventLocked(const WorkerEvent& event,
                                              std::vector<std::thread>& finishedThreads) {
    if (event.type == WorkerEvent::Type::Progress) {
        Entry* entry = findLocked(event.id);
        if (!entry || entry->attempt != event.attempt ||
            entry->record.status != TransferStatus::Downloading) {
            return;
        }
        TransferRecord& record = entry->record;
        record.downloadedBytes = event.downloadedBytes;
        if (event.totalBytes > 0) {
            record.totalBytes = event.totalBytes;
        }
        record.speedBytesPerSec = event.speedBytesPerSec;
        record.etaSeconds = event.etaSeconds;
        notifyLocked(events::Progress, events::progressPayload(
            record.id, record.downloadedBytes, record.totalBytes, record.speedBytesPerSec));
        return;
    }
    
    // Finished: release the worker slot first
    bool deleteFile = false;
    std::string destination;
    auto worker = m_workers.find(event.id);
    if (worker != m_workers.end() && worker->second.attempt == event.attempt) {
        deleteFile = worker->second.deleteFileOnExit;
        destination = worker->second.destination;
        finishedThreads.push_back(std::move(worker->second.thread));
        m_workers.erase(worker);
    }
    
    if (deleteFile && !FileUtils::deleteFile(destination)) {
        Logger::instance().warn("Could not delete {}", destination);
    }
    
    Entry* entry = findLocked(event.id);
    if (entry && entry->attempt == event.attempt) {
        applyOutcomeLocked(*entry, event);
        if (deleteFile) {
            entry->record.downloadedBytes = 0;
        }
        persistLocked();
    }
    
    scheduleNextLocked();
}

void DownloadManager::applyOutcomeLocked(Entry& entry, const WorkerEvent& event) {
    TransferRecord& record = entry.record;
    record.downloadedBytes = event.downloadedBytes;
    if (event.totalBytes > 0) {
        record.totalBytes = event.totalBytes;
    }
    if (event.discardPartial) {
        record.resumable = false;
    }
    
    // Paused, cancelled or removed while the worker wound down
    if (record.status != TransferStatus::Downloading) {
        return;
    }
    
    record.speedBytesPerSec = 0.0;
    record.etaSeconds = 0;
    
    switch (event.outcome) {
        case TransferStatus::Completed:
            record.endedAt = event.timestamp;
            record.lastError.reset();
            setStatusLocked(entry, TransferStatus::Completed);
            notifyLocked(events::Completed, events::idPayload(record.id));
            break;
            
        case TransferStatus::Failed:
            record.endedAt = event.timestamp;
            record.lastError = event.error;
            ++record.retryCount;
            setStatusLocked(entry, TransferStatus::Failed);
            notifyLocked(events::Failed, events::failedPayload(record.id, event.error));
            Logger::instance().warn("Transfer {} failed ({}/{} retries): {}",
                                    record.id, record.retryCount, record.maxRetries, event.error);
            break;
            
        default:
            // Stopped without a pause request, e.g. during shutdown
            setStatusLocked(entry, TransferStatus::Paused);
            break;
    }
}

void DownloadManager::sweepRetriesLocked() {
    if (m_shuttingDown) return;
    
    auto now = std::chrono::system_clock::now();
    bool requeued = false;
    
    for (const auto& id : m_order) {
        Entry& entry = m_entries.at(id);
        TransferRecord& record = entry.record;
        if (record.status != TransferStatus::Failed || record.retryCount >= record.maxRetries) {
            continue;
        }
        if (record.endedAt && now - *record.endedAt < m_retryBackoff(record.retryCount)) {
            continue;
        }
        
        Logger::instance().info("Retrying transfer {} after {} of {} failed attempts",
                                id, record.retryCount, record.maxRetries);
        record.lastError.reset();
        setStatusLocked(entry, TransferStatus::Pending);
        requeued = true;
    }
    
    if (requeued) {
        persistLocked();
        fillCapacityLocked();
    }
}

std::string DownloadManager::generateIdLocked(const std::string& url, Timestamp createdAt) {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(createdAt.time_since_epoch()).count();
    while (true) {
        std::string seed = url + "|" + std::to_string(nanos) + "|" + std::to_string(++m_idSequence);
        std::string id = HashUtils::md5String(seed).substr(0, 12);
        if (m_entries.count(id) == 0) {
            return id;
        }
    }
}

std::filesystem::path DownloadManager::deriveDestination(const std::string& url) const {
    std::string name = HttpClient::urlBasename(url);
    if (name.empty()) {
        name = "download_" + HashUtils::md5String(url).substr(0, 8);
    }
    return m_settings.downloadDirectory / name;
}

bool DownloadManager::isIdleLocked() const {
    return m_workers.empty() && m_inbox.empty() && m_outbox.empty() && !m_emitting;
}

// ============================================================================
// Threads
// ============================================================================

void DownloadManager::postWorkerEvent(WorkerEvent event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_inbox.push_back(std::move(event));
    m_condition.notify_all();
}

void DownloadManager::dispatchLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto nextSweep = std::chrono::steady_clock::now() + m_settings.retrySweepInterval;
    
    while (true) {
        m_condition.wait_until(lock, nextSweep, [this]() {
            return m_stopDispatcher || !m_inbox.empty() || !m_outbox.empty();
        });
        
        if (!m_outbox.empty()) {
            std::vector<Notification> batch;
            batch.swap(m_outbox);
            m_emitting = true;
            lock.unlock();
            
            for (const auto& notification : batch) {
                m_events.emit(notification.event, notification.payload);
            }
            
            lock.lock();
            m_emitting = false;
            m_idleCondition.notify_all();
            continue;
        }
        
        if (!m_inbox.empty()) {
            WorkerEvent event = std::move(m_inbox.front());
            m_inbox.pop_front();
            
            std::vector<std::thread> finished;
            handleWorkerEventLocked(event, finished);
            
            if (!finished.empty()) {
                lock.unlock();
                for (auto& thread : finished) {
                    if (thread.joinable()) thread.join();
                }
                lock.lock();
            }
            m_idleCondition.notify_all();
            continue;
        }
        
        if (m_stopDispatcher) {
            break;
        }
        
        if (std::chrono::steady_clock::now() >= nextSweep) {
            sweepRetriesLocked();
            nextSweep = std::chrono::steady_clock::now() + m_settings.retrySweepInterval;
        }
    }
}

} // namespace heal::core::downloader
