/**
 * Heal Downloader - command-line front end
 * 
 * Queues the given URLs on the download engine, prints progress from the
 * event bus and waits until every transfer has settled.
 * 
 * @version 1.0.0
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Logger.hpp"
#include "core/EventBus.hpp"
#include "core/downloader/DownloadEvents.hpp"
#include "core/downloader/DownloadManager.hpp"
#include "core/downloader/StateStore.hpp"
#include "utils/HashUtils.hpp"
#include "utils/StringUtils.hpp"

using heal::core::Application;
using heal::core::ApplicationOptions;
using heal::core::downloader::AddOptions;
using heal::core::downloader::Checksum;
using heal::core::downloader::TransferRecord;
using heal::core::downloader::TransferStatus;
using heal::utils::StringUtils;

namespace events = heal::core::downloader::events;

namespace {

std::atomic<bool> g_interrupted{false};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int) {
    g_interrupted = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

struct UrlRequest {
    std::string url;
    AddOptions options;
};

struct CommandLine {
    ApplicationOptions app;
    std::vector<UrlRequest> urls;
    bool list{false};
    bool resume{false};
};

void printUsage(const char* program) {
    std::cout << "Heal Downloader - resumable HTTP(S) downloads\n"
              << "\nUsage: " << program << " [options] [--checksum algo:hex] <url>...\n"
              << "\nOptions:\n"
              << "  --dir <path>            Download directory\n"
              << "  --max <n>               Maximum concurrent transfers\n"
              << "  --config <file>         Configuration file\n"
              << "  --checksum <algo:hex>   Expected md5/sha1/sha256 of the next URL\n"
              << "  --header \"Name: value\"  Extra request header for the following URLs\n"
              << "  --list                  Print the persisted transfers and exit\n"
              << "  --resume                Resume paused transfers from the state file\n"
              << "  --no-log-file           Log to the console only\n"
              << "  -d, --debug             Enable debug logging\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --version           Show version information\n"
              << std::endl;
}

/**
 * Parse argv. Returns false with a message on stderr for malformed input.
 */
bool parseCommandLine(int argc, char* argv[], CommandLine& cmd, bool& exitNow) {
    std::optional<Checksum> nextChecksum;
    std::map<std::string, std::string> headers;
    
    auto needValue = [&](int& i, const std::string& flag) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << flag << " requires a value" << std::endl;
            return nullptr;
        }
        return argv[++i];
    };
    
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            exitNow = true;
            return true;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << Application::getName() << " v" << Application::getVersion() << std::endl;
            exitNow = true;
            return true;
        } else if (arg == "--debug" || arg == "-d") {
            cmd.app.debug = true;
        } else if (arg == "--no-log-file") {
            cmd.app.fileLogging = false;
        } else if (arg == "--list") {
            cmd.list = true;
        } else if (arg == "--resume") {
            cmd.resume = true;
        } else if (arg == "--dir") {
            const char* value = needValue(i, arg);
            if (!value) return false;
            cmd.app.downloadDirectory = value;
        } else if (arg == "--config") {
            const char* value = needValue(i, arg);
            if (!value) return false;
            cmd.app.configPath = value;
        } else if (arg == "--max") {
            const char* value = needValue(i, arg);
            if (!value) return false;
            auto max = StringUtils::parseInt64(value);
            if (!max || *max <= 0) {
                std::cerr << "--max expects a positive number, got " << value << std::endl;
                return false;
            }
            cmd.app.maxConcurrent = static_cast<size_t>(*max);
        } else if (arg == "--checksum") {
            const char* value = needValue(i, arg);
            if (!value) return false;
            std::string checksumArg(value);
            auto colon = checksumArg.find(':');
            auto algorithm = colon == std::string::npos
                ? std::nullopt
                : heal::utils::HashUtils::algorithmFromName(checksumArg.substr(0, colon));
            if (!algorithm || colon + 1 >= checksumArg.size()) {
                std::cerr << "--checksum expects <md5|sha1|sha256>:<hex>, got " << checksumArg << std::endl;
                return false;
            }
            nextChecksum = Checksum{checksumArg.substr(colon + 1), *algorithm};
        } else if (arg == "--header") {
            const char* value = needValue(i, arg);
            if (!value) return false;
            std::string header(value);
            auto colon = header.find(':');
            if (colon == std::string::npos || colon == 0) {
                std::cerr << "--header expects \"Name: value\", got " << header << std::endl;
                return false;
            }
            headers[StringUtils::trim(header.substr(0, colon))] = StringUtils::trim(header.substr(colon + 1));
        } else if (StringUtils::startsWith(arg, "-")) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else {
            UrlRequest request;
            request.url = arg;
            request.options.headers = headers;
            request.options.checksum = nextChecksum;
            nextChecksum.reset();
            cmd.urls.push_back(std::move(request));
        }
    }
    
    if (nextChecksum) {
        std::cerr << "--checksum must be followed by a URL" << std::endl;
        return false;
    }
    return true;
}

void printRecords(const std::vector<TransferRecord>& records) {
    if (records.empty()) {
        std::cout << "No transfers." << std::endl;
        return;
    }
    for (const auto& record : records) {
        std::cout << std::left << std::setw(14) << record.id
                  << std::setw(12) << heal::core::downloader::toString(record.status)
                  << std::right << std::setw(7) << std::fixed << std::setprecision(1)
                  << record.progressPercent() << "%  "
                  << StringUtils::formatBytes(record.downloadedBytes);
        if (record.totalBytes > 0) {
            std::cout << " / " << StringUtils::formatBytes(record.totalBytes);
        }
        std::cout << "  " << record.url;
        if (record.lastError) {
            std::cout << "  (" << *record.lastError << ")";
        }
        std::cout << std::endl;
    }
}

/**
 * Progress lines on stdout. All callbacks arrive on the manager's
 * dispatcher thread, one at a time.
 */
void subscribeToEvents(heal::core::EventBus& bus) {
    bus.subscribe(events::Started, [](const auto& data) {
        std::cout << "[" << data.value("id", "") << "] started" << std::endl;
    });
    bus.subscribe(events::Progress, [](const auto& data) {
        int64_t downloaded = data.value("downloaded", int64_t{0});
        int64_t total = data.value("total", int64_t{0});
        double speed = data.value("speed", 0.0);
        
        std::cout << "[" << data.value("id", "") << "] "
                  << StringUtils::formatBytes(downloaded);
        if (total > 0) {
            std::cout << " / " << StringUtils::formatBytes(total)
                      << " (" << std::fixed << std::setprecision(1)
                      << static_cast<double>(downloaded) * 100.0 / static_cast<double>(total) << "%)";
        }
        std::cout << " at " << StringUtils::formatBytes(static_cast<int64_t>(speed)) << "/s" << std::endl;
    });
    bus.subscribe(events::Completed, [](const auto& data) {
        std::cout << "[" << data.value("id", "") << "] completed" << std::endl;
    });
    bus.subscribe(events::Failed, [](const auto& data) {
        std::cout << "[" << data.value("id", "") << "] failed: " << data.value("message", "") << std::endl;
    });
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    CommandLine cmd;
    bool exitNow = false;
    if (!parseCommandLine(argc, argv, cmd, exitNow)) {
        return 2;
    }
    if (exitNow) {
        return 0;
    }
    
    if (!cmd.list && !cmd.resume && cmd.urls.empty()) {
        printUsage(argv[0]);
        return 2;
    }
    
    cmd.app.startDownloader = !cmd.list;
    
    setupSignalHandlers();
    
    Application app;
    if (!app.initialize(cmd.app)) {
        std::cerr << "Failed to initialize, see the log for details" << std::endl;
        return 1;
    }
    
    auto& logger = heal::core::Logger::instance();
    
    if (cmd.list) {
        heal::core::downloader::StateStore store(app.getSettings().resolvedStateFile());
        printRecords(store.load());
        app.shutdown();
        return 0;
    }
    
    auto manager = app.getDownloadManager();
    subscribeToEvents(app.getEventBus());
    
    std::set<std::string> watched;
    auto startTime = std::chrono::steady_clock::now();
    
    try {
        if (cmd.resume) {
            for (const auto& record : manager->list()) {
                if (record.status == TransferStatus::Paused) {
                    watched.insert(record.id);
                }
            }
            size_t resumed = manager->resumeAll();
            logger.info("Resumed {} paused transfers", resumed);
        }
        
        for (const auto& request : cmd.urls) {
            std::string id = manager->add(request.url, "", request.options);
            std::cout << "[" << id << "] queued " << request.url << std::endl;
            watched.insert(id);
        }
    } catch (const std::exception& e) {
        logger.critical("Could not queue transfers: {}", e.what());
        app.shutdown();
        return 1;
    }
    
    while (!g_interrupted && !manager->waitForAll(std::chrono::milliseconds(200))) {
    }
    
    if (g_interrupted) {
        logger.info("Interrupted, pausing transfers...");
    }
    
    int exitCode = 0;
    size_t completed = 0;
    for (const auto& record : manager->list()) {
        if (!watched.count(record.id)) continue;
        if (record.status == TransferStatus::Completed) {
            ++completed;
        } else if (record.status == TransferStatus::Failed || !g_interrupted) {
            exitCode = 1;
        }
    }
    
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime);
    std::cout << completed << " of " << watched.size() << " transfers completed in "
              << StringUtils::formatDuration(elapsed) << std::endl;
    
    app.shutdown();
    
    if (g_interrupted) {
        std::cout << "Interrupted; run with --resume to continue." << std::endl;
        return 130;
    }
    return exitCode;
}
