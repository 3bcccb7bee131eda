#pragma once

/**
 * DownloadErrors.hpp
 * 
 * Failure taxonomy of a transfer attempt. These exceptions are thrown and
 * caught inside the fetch worker only; callers see the resulting message in
 * TransferRecord::lastError.
 */

#include <stdexcept>
#include <string>

namespace heal::core::downloader {

enum class ErrorKind {
    Network,   // connect, timeout, HTTP error status
    Io,        // file create, write, permission
    Checksum,  // integrity mismatch
    State      // operation not valid for the current status
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network:  return "Network error";
        case ErrorKind::Io:       return "I/O error";
        case ErrorKind::Checksum: return "Checksum error";
        case ErrorKind::State:    return "State error";
    }
    return "Error";
}

class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}
    
    ErrorKind kind() const { return m_kind; }
    
    /**
     * "<Kind> error: <message>", the form stored in lastError
     */
    std::string describe() const {
        return std::string(errorKindName(m_kind)) + ": " + what();
    }

private:
    ErrorKind m_kind;
};

class NetworkError : public DownloadError {
public:
    explicit NetworkError(const std::string& message)
        : DownloadError(ErrorKind::Network, message) {}
};

class IoError : public DownloadError {
public:
    explicit IoError(const std::string& message)
        : DownloadError(ErrorKind::Io, message) {}
};

class ChecksumError : public DownloadError {
public:
    explicit ChecksumError(const std::string& message)
        : DownloadError(ErrorKind::Checksum, message) {}
};

} // namespace heal::core::downloader
