#pragma once

/**
 * DownloadManager.hpp
 *
 * Persistent download orchestration.
 * Drives every task through its Downloader under a concurrency limit,
 * persists the task table and resumes it after a restart.
 */

#include "DownloadTask.hpp"
#include "Downloader.hpp"
#include "../PermitPool.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace aniflow::core::downloader {

/**
 * Called once when a task reaches Completed
 */
using CompleteCallback = std::function<void(const DownloadTask& task)>;

/**
 * Called once when a task fails for good or is cancelled
 */
using ErrorCallback = std::function<void(const DownloadTask& task, const std::string& message)>;

/**
 * Called after every forward transition
 */
using StateChangeCallback = std::function<void(const DownloadTask& task, DownloadState state)>;

/**
 * Manager settings
 */
struct DownloadManagerOptions {
    std::filesystem::path stateFile{"data/pending_downloads.json"};
    size_t maxConcurrent{3};
    int maxRetries{3};
};

/**
 * DownloadManager - task orchestration
 *
 * Features:
 * - Synchronous download() capped by a permit pool
 * - Snapshot of non-terminal tasks rewritten after every transition
 * - Crash recovery from the snapshot, on a ThreadPool
 * - Retry with the Downloader's failure hook between attempts
 * - Cancellation and graceful shutdown
 *
 * A task is only touched by the thread dispatching it. That thread
 * publishes a JSON copy of the task after each step; the snapshot file,
 * getTask() and isDownloading() read those copies.
 */
class DownloadManager {
public:
    /**
     * Constructor
     * @param downloader Workflow adapter
     * @param options Manager settings
     * @param pool Where recovered tasks are dispatched. When null they
     *             wait for resumeRecovered().
     */
    DownloadManager(std::shared_ptr<Downloader> downloader,
                    DownloadManagerOptions options,
                    ThreadPool* pool = nullptr);

    /**
     * Destructor - shuts down and waits for running dispatches
     */
    ~DownloadManager();

    // Disable copy
    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * Create a task for `resource` and drive it to a terminal state
     * @param resource Resource to download
     * @param savePath Remote base directory
     * @return true if the task completed
     */
    bool download(const ResourceInfo& resource, const std::string& savePath);

    /**
     * Register a task for `resource` on the calling thread and drive it on
     * `pool`. The duplicate check and the registration happen under one
     * lock, so a URL submitted twice in a row only runs once.
     * @return Id of the new task, std::nullopt when the URL is already
     *         tracked, the manager is shut down or the pool refused the job
     */
    std::optional<std::string> submit(const ResourceInfo& resource, const std::string& savePath,
                                      ThreadPool& pool);

    /**
     * Whether a tracked task already downloads the same URL
     */
    bool isDownloading(const ResourceInfo& resource) const;

    // Callbacks run in registration order on the dispatching thread
    void onComplete(CompleteCallback callback);
    void onError(ErrorCallback callback);
    void onStateChange(StateChangeCallback callback);

    /**
     * Copy of a tracked task as last published
     */
    std::optional<DownloadTask> getTask(const std::string& id) const;

    /**
     * Number of tracked tasks
     */
    size_t taskCount() const;

    /**
     * Dispatch the recovered tasks that are still waiting
     * @return Number of tasks dispatched
     */
    size_t resumeRecovered(ThreadPool& pool);

    /**
     * Request cancellation. The task moves to Cancelled at its next step
     * when that transition is legal.
     * @return true if the task is tracked
     */
    bool cancel(const std::string& id);

    /**
     * Stop dispatching. Tasks waiting at a poll point are persisted and
     * left for the next start.
     */
    void shutdown();

    bool isShutdown() const { return m_shutdown.load(); }

    /**
     * Block until no dispatch is running
     */
    void waitForAll();

    const std::filesystem::path& stateFile() const { return m_options.stateFile; }

private:
    enum class Outcome {
        Completed,
        Failed,
        Suspended
    };

    void loadState();
    void saveStateLocked();
    bool isTrackedLocked(const std::string& downloadUrl) const;

    // Publish the task's current JSON and rewrite the snapshot
    void publish(const DownloadTask& task);

    bool dispatch(ThreadPool& pool, std::shared_ptr<DownloadTask> task);
    bool process(const std::shared_ptr<DownloadTask>& task);
    Outcome run(DownloadTask& task);
    HandlerResult invoke(DownloadTask& task);
    Outcome handleCancellation(DownloadTask& task);
    void notifyFailed(DownloadTask& task);

    // Wait out a poll delay; false when shutdown interrupted it
    bool waitPoll(const std::string& id, std::chrono::milliseconds delay);
    bool takeCancelRequest(const std::string& id);

    void finalize(DownloadTask& task, bool success);
    void emitStateChange(const DownloadTask& task, DownloadState state);

    void beginDispatch();
    void endDispatch();

private:
    std::shared_ptr<Downloader> m_downloader;
    DownloadManagerOptions m_options;
    PermitPool m_permits;

    std::unordered_map<std::string, std::shared_ptr<DownloadTask>> m_tasks;
    std::unordered_map<std::string, nlohmann::json> m_snapshots;
    std::unordered_set<std::string> m_cancelRequests;
    std::vector<std::string> m_recovered;

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    std::condition_variable m_idle;
    size_t m_inFlight{0};
    std::atomic<bool> m_shutdown{false};

    std::mutex m_callbackMutex;
    std::vector<CompleteCallback> m_completeCallbacks;
    std::vector<ErrorCallback> m_errorCallbacks;
    std::vector<StateChangeCallback> m_stateChangeCallbacks;
};

} // namespace aniflow::core::downloader
