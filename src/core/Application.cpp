/**
 * Application.cpp
 * 
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "Config.hpp"
#include "downloader/DownloadManager.hpp"
#include "../utils/CprHttpClient.hpp"
#include "../utils/PathUtils.hpp"

#include <chrono>
#include <stdexcept>

namespace heal::core {

Application::Application() = default;

Application::~Application() {
    shutdown();
}

bool Application::initialize(const ApplicationOptions& options) {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }
    
    setState(AppState::Initializing);
    auto startTime = std::chrono::steady_clock::now();
    
    m_configLoaded = loadConfiguration(options);
    initializeLogging(options);
    
    Logger::instance().info("{} v{} starting...", getName(), getVersion());
    if (m_configLoaded) {
        Logger::instance().info("Configuration loaded from {}", m_configPath);
    } else {
        Logger::instance().warn("Using default configuration, {} could not be read or created", m_configPath);
    }
    
    try {
        m_settings = downloader::DownloadSettings::fromConfig(Config::instance());
    } catch (const std::invalid_argument& e) {
        Logger::instance().critical("Invalid configuration: {}", e.what());
        setState(AppState::Error);
        return false;
    }
    
    if (options.startDownloader && !initializeDownloader()) {
        Logger::instance().error("Failed to initialize downloader");
        setState(AppState::Error);
        return false;
    }
    
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());
    
    setState(AppState::Ready);
    m_eventBus.emit("app.initialized", {});
    return true;
}

void Application::shutdown() {
    AppState state = m_state.load();
    if (state == AppState::ShuttingDown || state == AppState::Uninitialized) {
        return;
    }
    
    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");
    
    // The manager joins its workers before the HTTP backend goes away
    if (m_downloadManager) {
        m_downloadManager->shutdown();
        m_downloadManager.reset();
    }
    m_httpClient.reset();
    
    m_eventBus.emit("app.shutdown", {});
    Logger::instance().info("Application shutdown complete");
    Logger::instance().flush();
    
    setState(AppState::Uninitialized);
}

void Application::setState(AppState state) {
    m_state = state;
}

bool Application::loadConfiguration(const ApplicationOptions& options) {
    auto& config = Config::instance();
    
    m_configPath = options.configPath.empty()
        ? utils::PathUtils::getConfigPath().string()
        : options.configPath;
    
    bool loaded = config.loadOrCreate(m_configPath);
    if (!loaded) {
        config.setDefaults();
    }
    
    // Command-line overrides are not written back
    if (options.downloadDirectory) {
        config.set("downloads.directory", *options.downloadDirectory);
    }
    if (options.maxConcurrent) {
        config.set("downloads.maxConcurrent", static_cast<int>(*options.maxConcurrent));
    }
    if (options.debug) {
        config.set("logging.level", std::string("debug"));
    }
    if (!options.fileLogging) {
        config.set("logging.file", false);
    }
    
    return loaded;
}

void Application::initializeLogging(const ApplicationOptions& options) {
    const auto& config = Config::instance();
    
    LoggerOptions loggerOptions;
    loggerOptions.level = Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    loggerOptions.fileLogging = options.fileLogging && config.get<bool>("logging.file", true);
    
    std::string logDir = config.get<std::string>("logging.directory", "");
    loggerOptions.logDir = logDir.empty() ? utils::PathUtils::getLogsPath().string() : logDir;
    
    Logger::instance().initialize(loggerOptions);
}

bool Application::initializeDownloader() {
    Logger::instance().debug("Initializing downloader: directory {}, state file {}",
                             m_settings.downloadDirectory.string(),
                             m_settings.resolvedStateFile().string());
    
    try {
        m_httpClient = std::make_unique<utils::CprHttpClient>();
        m_downloadManager = std::make_shared<downloader::DownloadManager>(
            m_settings, *m_httpClient, m_eventBus);
        m_downloadManager->initialize();
    } catch (const std::exception& e) {
        Logger::instance().error("Downloader initialization failed: {}", e.what());
        m_downloadManager.reset();
        m_httpClient.reset();
        return false;
    }
    
    return true;
}

} // namespace heal::core
