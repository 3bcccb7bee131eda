/**
 * FetchWorker.cpp
 * 
 * Implementation of a single transfer attempt.
 */

#include "FetchWorker.hpp"
#include "DownloadErrors.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>

namespace heal::core::downloader {

using utils::FileUtils;
using utils::HttpClient;
using utils::StringUtils;

FetchWorker::FetchWorker(TransferRecord record,
                         uint64_t attempt,
                         utils::HttpClient& http,
                         WorkerOptions options,
                         CancelToken cancelToken,
                         WorkerEventSink sink)
    : m_record(std::move(record))
    , m_attempt(attempt)
    , m_http(http)
    , m_options(std::move(options))
    , m_cancelToken(cancelToken ? std::move(cancelToken) : std::make_shared<std::atomic<bool>>(false))
    , m_sink(std::move(sink)) {
    
    if (m_record.chunkSize == 0) {
        m_record.chunkSize = 8192;
    }
    m_bufferLimit = m_record.chunkSize * std::max<size_t>(m_options.bufferChunks, 1);
}

WorkerEvent FetchWorker::run() {
    m_attemptStart = std::chrono::steady_clock::now();
    m_lastReport = m_attemptStart;
    
    WorkerEvent finished = makeEvent(WorkerEvent::Type::Finished);
    
    try {
        performAttempt();
        finished.outcome = m_cancelled ? TransferStatus::Cancelled : TransferStatus::Completed;
        
        if (m_cancelled) {
            Logger::instance().info("Transfer {} stopped at {} bytes", m_record.id, m_record.downloadedBytes);
        } else {
            Logger::instance().info("Transfer {} completed ({})", m_record.id,
                                    StringUtils::formatBytes(m_record.downloadedBytes));
        }
        
    } catch (const DownloadError& e) {
        finished.outcome = TransferStatus::Failed;
        finished.error = e.describe();
        Logger::instance().error("Transfer {} failed: {}", m_record.id, finished.error);
        
    } catch (const std::exception& e) {
        finished.outcome = TransferStatus::Failed;
        finished.error = std::string("Unexpected error: ") + e.what();
        Logger::instance().error("Transfer {} failed: {}", m_record.id, finished.error);
    }
    
    closeFile();
    
    finished.downloadedBytes = m_record.downloadedBytes;
    finished.totalBytes = m_record.totalBytes;
    finished.speedBytesPerSec = m_record.speedBytesPerSec;
    finished.etaSeconds = m_record.etaSeconds;
    finished.discardPartial = m_discardPartial;
    finished.timestamp = std::chrono::system_clock::now();
    
    if (m_sink) {
        m_sink(finished);
    }
    return finished;
}

void FetchWorker::performAttempt() {
    const std::filesystem::path destination(m_record.destination);
    
    // 1. Resume from the bytes already on disk unless they are known bad
    m_resumeOffset = 0;
    if (m_record.resumable && FileUtils::fileExists(destination)) {
        m_resumeOffset = FileUtils::getFileSize(destination);
    }
    m_record.downloadedBytes = m_resumeOffset;
    
    if (!FileUtils::ensureParentDirectory(destination)) {
        throw IoError("cannot create directory " + destination.parent_path().string());
    }
    
    utils::HttpOptions options;
    options.headers = m_record.extraHeaders;
    options.timeoutSeconds = m_record.timeoutSeconds;
    options.connectTimeoutSeconds = m_options.connectTimeoutSeconds;
    options.userAgent = m_options.userAgent;
    if (m_resumeOffset > 0) {
        options.headers["Range"] = "bytes=" + std::to_string(m_resumeOffset) + "-";
        Logger::instance().debug("Resuming {} from byte {}", m_record.id, m_resumeOffset);
    }
    
    utils::HttpStreamHandlers handlers;
    handlers.onResponse = [this](int statusCode, const utils::HttpHeaders& headers) {
        try {
            return handleResponse(statusCode, headers);
        } catch (const std::exception&) {
            m_callbackError = std::current_exception();
            return false;
        }
    };
    handlers.onData = [this](const char* data, size_t size) {
        try {
            return handleData(data, size);
        } catch (const std::exception&) {
            m_callbackError = std::current_exception();
            return false;
        }
    };
    
    // 2. Issue the request
    utils::HttpResponse response = m_http.streamGet(m_record.url, options, handlers);
    
    // Whatever arrived stays on disk for the next attempt
    bool flushed = flushBufferNoThrow();
    closeFile();
    
    if (m_callbackError) {
        std::rethrow_exception(m_callbackError);
    }
    if (!flushed) {
        throw IoError("failed writing " + m_record.destination);
    }
    
    // 6. Cancellation is an outcome, not an error
    if (m_cancelled) {
        return;
    }
    
    if (!m_alreadyComplete) {
        if (!response.error.empty()) {
            throw NetworkError(response.error);
        }
        if (response.statusCode == 0) {
            throw NetworkError("no response from server");
        }
        if (!response.isSuccess()) {
            throw NetworkError("HTTP " + std::to_string(response.statusCode));
        }
        
        if (m_record.totalBytes > 0 && m_record.downloadedBytes < m_record.totalBytes) {
            throw NetworkError("connection closed after " + std::to_string(m_record.downloadedBytes) +
                               " of " + std::to_string(m_record.totalBytes) + " bytes");
        }
        // Unknown size: the body length is the size
        if (m_record.totalBytes <= 0) {
            m_record.totalBytes = m_record.downloadedBytes;
        }
    }
    
    // 7. Integrity
    verifyChecksum();
    
    updateThroughput();
    m_record.etaSeconds = 0;
    postProgress();
}

bool FetchWorker::handleResponse(int statusCode, const utils::HttpHeaders& headers) {
    utils::HttpResponse view;
    view.statusCode = statusCode;
    view.headers = headers;
    
    if (view.isRangeNotSatisfiable() && m_resumeOffset > 0) {
        // "bytes */N" with N equal to what we hold: nothing left to fetch
        auto rangeHeader = view.header("content-range");
        auto range = rangeHeader ? HttpClient::parseContentRange(*rangeHeader) : std::nullopt;
        if (range && range->total && *range->total == m_resumeOffset) {
            Logger::instance().debug("Transfer {} already complete on disk", m_record.id);
            m_alreadyComplete = true;
            m_record.totalBytes = m_resumeOffset;
            m_record.downloadedBytes = m_resumeOffset;
            return false;
        }
        m_discardPartial = true;
        throw NetworkError("HTTP 416: partial file does not match the remote resource");
    }
    
    if (!view.isSuccess()) {
        throw NetworkError("HTTP " + std::to_string(statusCode));
    }
    
    if (m_resumeOffset > 0 && !view.isPartialContent()) {
        Logger::instance().warn("Server ignored Range for {}, restarting from zero", m_record.id);
        m_resumeOffset = 0;
        m_record.downloadedBytes = 0;
    }
    
    // 3. Total size
    resolveTotalSize(statusCode, headers);
    
    // 4. Append when resuming, truncate otherwise
    const bool resuming = m_resumeOffset > 0;
    auto mode = std::ios::binary | (resuming ? std::ios::app : std::ios::trunc);
    m_file.open(m_record.destination, std::ios::out | mode);
    if (!m_file.is_open()) {
        throw IoError("cannot open " + m_record.destination + " for writing");
    }
    
    m_buffer.clear();
    m_buffer.reserve(m_bufferLimit);
    
    postProgress();
    return true;
}

void FetchWorker::resolveTotalSize(int statusCode, const utils::HttpHeaders& headers) {
    utils::HttpResponse view;
    view.statusCode = statusCode;
    view.headers = headers;
    
    const bool resuming = m_resumeOffset > 0;
    
    if (auto value = view.header("content-range")) {
        auto range = HttpClient::parseContentRange(*value);
        if (!range) {
            Logger::instance().warn("Could not parse Content-Range '{}' for {}", *value, m_record.id);
        } else {
            if (resuming && range->start && *range->start != m_resumeOffset) {
                m_discardPartial = true;
                throw NetworkError("server resumed at byte " + std::to_string(*range->start) +
                                   ", expected " + std::to_string(m_resumeOffset));
            }
            if (range->total) {
                m_record.totalBytes = *range->total;
                return;
            }
        }
    }
    
    if (auto value = view.header("content-length")) {
        if (auto length = HttpClient::parseContentLength(*value)) {
            m_record.totalBytes = resuming ? m_resumeOffset + *length : *length;
            return;
        }
        Logger::instance().warn("Could not parse Content-Length '{}' for {}", *value, m_record.id);
    }
    
    if (!resuming) {
        m_record.totalBytes = 0;
    }
    Logger::instance().debug("Size of {} is unknown, progress will be indeterminate", m_record.id);
}

bool FetchWorker::handleData(const char* data, size_t size) {
    // 5./6. Slice into chunks so cancellation and progress are checked at
    // chunk boundaries regardless of how the transport delivers data
    size_t offset = 0;
    while (offset < size) {
        if (isCancelRequested()) {
            m_cancelled = true;
            return false;
        }
        
        size_t length = std::min(m_record.chunkSize, size - offset);
        m_buffer.append(data + offset, length);
        m_record.downloadedBytes += static_cast<int64_t>(length);
        offset += length;
        
        // Progress never reports more than the total
        if (m_record.totalBytes > 0 && m_record.downloadedBytes > m_record.totalBytes) {
            if (!m_overrun) {
                Logger::instance().warn("Transfer {} received more than the announced {} bytes",
                                        m_record.id, m_record.totalBytes);
                m_overrun = true;
            }
            m_record.totalBytes = m_record.downloadedBytes;
        }
        
        if (m_buffer.size() >= m_bufferLimit) {
            flushBuffer();
        }
        
        auto now = std::chrono::steady_clock::now();
        if (now - m_lastReport >= m_options.progressInterval) {
            flushBuffer();
            updateThroughput();
            postProgress();
            m_lastReport = now;
        }
    }
    return true;
}

void FetchWorker::verifyChecksum() {
    if (!m_record.checksum || m_record.checksum->value.empty()) {
        return;
    }
    
    const auto& expected = *m_record.checksum;
    auto actual = utils::HashUtils::hashFile(m_record.destination, expected.algorithm);
    if (!actual) {
        throw IoError("cannot read " + m_record.destination + " for verification");
    }
    
    if (!StringUtils::equalsIgnoreCase(*actual, StringUtils::trim(expected.value))) {
        // The file stays on disk but must not be resumed from
        m_discardPartial = true;
        throw ChecksumError(utils::HashUtils::algorithmName(expected.algorithm) +
                            " mismatch: expected " + StringUtils::toLower(expected.value) +
                            ", got " + *actual);
    }
    
    Logger::instance().debug("Checksum verified for {}", m_record.id);
}

void FetchWorker::flushBuffer() {
    if (m_buffer.empty() || !m_file.is_open()) {
        return;
    }
    
    m_file.write(m_buffer.data(), static_cast<std::streamsize>(m_buffer.size()));
    m_file.flush();
    if (!m_file) {
        m_buffer.clear();
        throw IoError("failed writing " + m_record.destination);
    }
    m_buffer.clear();
}

bool FetchWorker::flushBufferNoThrow() {
    try {
        flushBuffer();
        return true;
    } catch (const IoError& e) {
        Logger::instance().error("Transfer {}: {}", m_record.id, e.what());
        return false;
    }
}

void FetchWorker::closeFile() {
    if (m_file.is_open()) {
        m_file.close();
    }
}

void FetchWorker::updateThroughput() {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_attemptStart).count();
    
    m_record.speedBytesPerSec = elapsed > 1e-6
        ? static_cast<double>(m_record.downloadedBytes) / elapsed
        : 0.0;
    
    if (m_record.speedBytesPerSec > 0.0 && m_record.totalBytes > 0) {
        int64_t remaining = std::max<int64_t>(m_record.totalBytes - m_record.downloadedBytes, 0);
        m_record.etaSeconds = static_cast<int64_t>(static_cast<double>(remaining) / m_record.speedBytesPerSec);
    } else {
        m_record.etaSeconds = 0;
    }
}

void FetchWorker::postProgress() {
    if (m_sink) {
        m_sink(makeEvent(WorkerEvent::Type::Progress));
    }
    Logger::instance().trace("Transfer {}: {}/{} bytes", m_record.id,
                             m_record.downloadedBytes, m_record.totalBytes);
}

WorkerEvent FetchWorker::makeEvent(WorkerEvent::Type type) const {
    WorkerEvent event;
    event.type = type;
    event.id = m_record.id;
    event.attempt = m_attempt;
    event.downloadedBytes = m_record.downloadedBytes;
    event.totalBytes = m_record.totalBytes;
    event.speedBytesPerSec = m_record.speedBytesPerSec;
    event.etaSeconds = m_record.etaSeconds;
    event.timestamp = std::chrono::system_clock::now();
    return event;
}

} // namespace heal::core::downloader
