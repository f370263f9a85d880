#pragma once

/**
 * Application.hpp
 *
 * Wires the configured subsystems together: the OpenList client, the
 * downloader, the worker pool and the download manager.
 */

#include "models/Models.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

// Forward declarations in correct namespaces
namespace aniflow::core::openlist { class OpenListClient; }
namespace aniflow::core::downloader { class DownloadManager; class OpenListDownloader; }

namespace aniflow::core {

class ThreadPool;

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    Running,
    ShuttingDown,
    Error
};

/**
 * Main application class
 *
 * Builds every subsystem from Config and drives the download manager
 * for the command line front end.
 */
class Application {
public:
    /**
     * Constructor
     */
    Application();

    /**
     * Destructor
     */
    ~Application();

    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Initialize all application subsystems from Config
     * @return true if initialization successful
     */
    bool initialize();

    /**
     * Validate the configuration and the remote server
     * @return true if the configuration is usable and the server offers
     *         the configured offline download tool
     */
    bool check();

    /**
     * Submit resources to the worker pool. Resources already being
     * downloaded are skipped.
     * @param resources Resource descriptors
     * @return Number of resources submitted
     */
    size_t enqueue(const std::vector<ResourceInfo>& resources);

    /**
     * Dispatch the tasks recovered from the snapshot
     * @return Number of tasks resumed
     */
    size_t resume();

    /**
     * Block until every dispatched task finished or was suspended
     */
    void waitForAll();

    /**
     * Shutdown the application gracefully
     */
    void shutdown();

    /**
     * Get current application state
     * @return Current AppState
     */
    AppState getState() const { return m_state.load(); }

    /**
     * Get download manager instance
     */
    std::shared_ptr<downloader::DownloadManager> getDownloadManager() const { return m_downloadManager; }

    /**
     * Get application version string
     */
    static std::string getVersion() { return "1.0.0"; }

    /**
     * Get application name
     */
    static std::string getName() { return "aniflow"; }

private:
    void setState(AppState state);
    bool initializeDownloader();

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};

    std::shared_ptr<openlist::OpenListClient> m_client;
    std::shared_ptr<downloader::OpenListDownloader> m_downloader;
    std::unique_ptr<ThreadPool> m_threadPool;
    std::shared_ptr<downloader::DownloadManager> m_downloadManager;
    std::string m_savePath;
};

} // namespace aniflow::core
