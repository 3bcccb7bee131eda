#pragma once

/**
 * Application.hpp
 * 
 * Composition root of the downloader: loads configuration, sets up logging
 * and owns the event bus, the HTTP backend and the download manager.
 */

#include "EventBus.hpp"
#include "downloader/DownloadSettings.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace heal::utils { class HttpClient; }
namespace heal::core::downloader { class DownloadManager; }

namespace heal::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

/**
 * Startup options, usually from the command line. Set fields override the
 * configuration file for this run only.
 */
struct ApplicationOptions {
    // Empty = PathUtils::getConfigPath()
    std::string configPath;
    
    bool debug{false};
    bool fileLogging{true};
    
    std::optional<std::string> downloadDirectory;
    std::optional<size_t> maxConcurrent;
    
    // Load configuration and logging only, without the download engine
    bool startDownloader{true};
};

/**
 * Main application class
 * 
 * Created once by the entry point. Subsystems are constructed in
 * initialize() and torn down in reverse order by shutdown().
 */
class Application {
public:
    Application();
    ~Application();
    
    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;
    
    /**
     * Initialize all application subsystems
     * @param options Startup options
     * @return true if initialization successful
     */
    bool initialize(const ApplicationOptions& options = {});
    
    /**
     * Shutdown the application gracefully
     */
    void shutdown();
    
    EventBus& getEventBus() { return m_eventBus; }
    
    /**
     * Get download manager instance
     * @return Shared pointer to DownloadManager, null without the engine
     */
    std::shared_ptr<downloader::DownloadManager> getDownloadManager() const { return m_downloadManager; }
    
    const downloader::DownloadSettings& getSettings() const { return m_settings; }
    
    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "Heal Downloader"; }

private:
    void setState(AppState state);
    
    bool loadConfiguration(const ApplicationOptions& options);
    void initializeLogging(const ApplicationOptions& options);
    bool initializeDownloader();

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};
    
    std::string m_configPath;
    bool m_configLoaded{false};
    downloader::DownloadSettings m_settings;
    
    EventBus m_eventBus;
    std::unique_ptr<utils::HttpClient> m_httpClient;
    std::shared_ptr<downloader::DownloadManager> m_downloadManager;
};

} // namespace heal::core
