/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "Config.hpp"
#include "ThreadPool.hpp"
#include "downloader/DownloadManager.hpp"
#include "downloader/OpenListDownloader.hpp"
#include "openlist/OpenListClient.hpp"

#include <chrono>
#include <stdexcept>

namespace aniflow::core {

Application::Application() {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
    // Workers must be gone before the manager they run on
    if (m_downloadManager) m_downloadManager->waitForAll();
    m_threadPool.reset();
    Logger::instance().debug("Application instance destroyed");
}

bool Application::initialize() {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    Logger::instance().info("Initializing application...");

    auto startTime = std::chrono::steady_clock::now();

    auto problems = Config::instance().validateLimits();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            Logger::instance().error("Configuration: {}", problem);
        }
        setState(AppState::Error);
        return false;
    }

    if (!initializeDownloader()) {
        Logger::instance().error("Failed to initialize downloader");
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());

    setState(AppState::Ready);
    return true;
}

bool Application::initializeDownloader() {
    auto& config = Config::instance();

    try {
        openlist::OpenListClientOptions clientOptions;
        clientOptions.baseUrl = config.get<std::string>("openlist.url");
        clientOptions.token = config.get<std::string>("openlist.token");
        clientOptions.maxConcurrentRequests = static_cast<size_t>(
            config.get<int>("openlist.maxConcurrentRequests", 4));
        clientOptions.requestTimeout = std::chrono::seconds(config.get<int>("openlist.requestTimeout", 30));
        clientOptions.connectTimeout = std::chrono::seconds(config.get<int>("openlist.connectTimeout", 30));
        clientOptions.readTimeout = std::chrono::seconds(config.get<int>("openlist.readTimeout", 30));
        clientOptions.maxRetries = config.get<int>("openlist.maxRetries", 3);
        clientOptions.retryBackoff = std::chrono::milliseconds(config.get<int>("openlist.retryBackoffMs", 800));
        clientOptions.httpProxy = config.get<std::string>("proxy.http");
        clientOptions.httpsProxy = config.get<std::string>("proxy.https");
        m_client = std::make_shared<openlist::OpenListClient>(clientOptions);

        downloader::OpenListDownloaderOptions downloaderOptions;
        downloaderOptions.tool = config.get<std::string>("openlist.offlineDownloadTool", "qBittorrent");
        downloaderOptions.renameFormat = config.get<std::string>("openlist.renameFormat");
        downloaderOptions.pollInterval = std::chrono::seconds(config.get<int>("downloads.pollInterval", 5));
        downloaderOptions.transferCheckDelay =
            std::chrono::seconds(config.get<int>("downloads.transferCheckDelay", 5));
        downloaderOptions.renameSettleDelay =
            std::chrono::seconds(config.get<int>("downloads.renameSettleDelay", 5));
        downloaderOptions.maxDetectAttempts = config.get<int>("downloads.maxDetectAttempts", 10);
        m_downloader = std::make_shared<downloader::OpenListDownloader>(m_client, downloaderOptions);

        downloader::DownloadManagerOptions managerOptions;
        managerOptions.stateFile = config.get<std::string>("downloads.stateFile", "data/pending_downloads.json");
        managerOptions.maxConcurrent = static_cast<size_t>(config.get<int>("downloads.maxConcurrent", 3));
        managerOptions.maxRetries = config.get<int>("downloads.maxRetries", 3);

        // Enough workers for every permit plus the ones queueing for one
        m_threadPool = std::make_unique<ThreadPool>(managerOptions.maxConcurrent * 2);
        m_downloadManager = std::make_shared<downloader::DownloadManager>(m_downloader, managerOptions);

    } catch (const std::invalid_argument& e) {
        Logger::instance().error("Invalid download configuration: {}", e.what());
        return false;
    }

    m_savePath = config.get<std::string>("openlist.downloadPath", "/");

    m_downloadManager->onComplete([](const downloader::DownloadTask& task) {
        Logger::instance().info("Completed: {} -> {}", task.resourceInfo.title,
                                task.finalPath.value_or("?"));
    });
    m_downloadManager->onError([](const downloader::DownloadTask& task, const std::string& message) {
        Logger::instance().error("Failed: {} ({})", task.resourceInfo.title, message);
    });

    return true;
}

bool Application::check() {
    bool ok = true;

    for (const auto& problem : Config::instance().validate()) {
        Logger::instance().error("Configuration: {}", problem);
        ok = false;
    }

    if (!m_downloader) {
        Logger::instance().error("Downloader is not initialized");
        return false;
    }

    return m_downloader->verifyServer() && ok;
}

size_t Application::enqueue(const std::vector<ResourceInfo>& resources) {
    if (!m_downloadManager || !m_threadPool) return 0;

    setState(AppState::Running);

    size_t submitted = 0;
    for (const auto& resource : resources) {
        if (resource.downloadUrl.empty()) {
            Logger::instance().warn("Skipping resource without download URL: {}", resource.title);
            continue;
        }
        if (m_downloadManager->submit(resource, m_savePath, *m_threadPool)) {
            ++submitted;
        }
    }

    Logger::instance().info("Submitted {} of {} resource(s)", submitted, resources.size());
    return submitted;
}

size_t Application::resume() {
    if (!m_downloadManager || !m_threadPool) return 0;

    setState(AppState::Running);
    size_t resumed = m_downloadManager->resumeRecovered(*m_threadPool);
    if (resumed > 0) {
        Logger::instance().info("Resumed {} download(s)", resumed);
    }
    return resumed;
}

void Application::waitForAll() {
    if (m_threadPool) m_threadPool->waitAll();
    if (m_downloadManager) m_downloadManager->waitForAll();
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    if (m_downloadManager) {
        m_downloadManager->shutdown();
    }

    Logger::instance().flush();
}

void Application::setState(AppState state) {
    m_state = state;
}

} // namespace aniflow::core
