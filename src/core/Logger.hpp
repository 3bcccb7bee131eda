#pragma once

/**
 * Logger.hpp
 * 
 * Centralized logging for the download engine and its front ends.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/fmt/ostr.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace heal::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logger setup
 */
struct LoggerOptions {
    LogLevel level{LogLevel::Info};
    
    // Empty = <cwd>/logs
    std::string logDir;
    
    bool fileLogging{true};
    
    std::string fileName{"heal-downloader.log"};
};

/**
 * Logger class - Thread-safe singleton logger
 * 
 * Provides formatted logging with two output sinks:
 * - Console output with colors
 * - Rotating file output
 * 
 * Until initialize() runs every call is a no-op, which keeps library code
 * silent inside unit tests.
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }
    
    /**
     * Initialize the logger
     * @param options Level and sink configuration
     */
    void initialize(const LoggerOptions& options = {}) {
        try {
            std::vector<spdlog::sink_ptr> sinks;
            
            // Console sink with colors
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(options.level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);
            
            if (options.fileLogging) {
                std::filesystem::path logPath = options.logDir.empty()
                    ? std::filesystem::current_path() / "logs" / options.fileName
                    : std::filesystem::path(options.logDir) / options.fileName;
                
                std::filesystem::create_directories(logPath.parent_path());
                
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    1024 * 1024 * 10, // 10 MB
                    5,                // 5 rotated files
                    false
                );
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }
            
            m_logger = std::make_shared<spdlog::logger>("heal", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(options.level));
            m_logger->flush_on(spdlog::level::warn);
            
            spdlog::set_default_logger(m_logger);
            spdlog::flush_every(std::chrono::seconds(3));
            
        } catch (const std::exception& ex) {
            // spdlog_ex or a filesystem error while preparing the log dir
            m_logger = spdlog::stdout_color_mt("heal_fallback");
            m_logger->error("Logger initialization failed: {}", ex.what());
        }
    }
    
    /**
     * Flush all log sinks
     */
    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }
    
    /**
     * Parse a level name ("debug", "WARN", ...); unknown names map to Info
     */
    static LogLevel parseLevel(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "trace") return LogLevel::Trace;
        if (lower == "debug") return LogLevel::Debug;
        if (lower == "warn" || lower == "warning") return LogLevel::Warn;
        if (lower == "error") return LogLevel::Error;
        if (lower == "critical") return LogLevel::Critical;
        if (lower == "off") return LogLevel::Off;
        return LogLevel::Info;
    }
    
    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->trace(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->debug(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->info(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->warn(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->error(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace heal::core

// Convenience macros
#define HEAL_LOG_TRACE(...)    ::heal::core::Logger::instance().trace(__VA_ARGS__)
#define HEAL_LOG_DEBUG(...)    ::heal::core::Logger::instance().debug(__VA_ARGS__)
#define HEAL_LOG_INFO(...)     ::heal::core::Logger::instance().info(__VA_ARGS__)
#define HEAL_LOG_WARN(...)     ::heal::core::Logger::instance().warn(__VA_ARGS__)
#define HEAL_LOG_ERROR(...)    ::heal::core::Logger::instance().error(__VA_ARGS__)
#define HEAL_LOG_CRITICAL(...) ::heal::core::Logger::instance().critical(__VA_ARGS__)
