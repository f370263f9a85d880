/**
 * DownloadManager.cpp
 *
 * Implementation of the persistent download orchestrator.
 */

#include "DownloadManager.hpp"
#include "../Logger.hpp"
#include "../../utils/JsonUtils.hpp"

#include <stdexcept>
#include <system_error>

namespace aniflow::core::downloader {

using utils::JsonUtils;

namespace {

DownloadState nextState(DownloadState state) {
    switch (state) {
        case DownloadState::Pending:      return DownloadState::Downloading;
        case DownloadState::Downloading:  return DownloadState::Transferring;
        case DownloadState::Transferring: return DownloadState::CleaningUp;
        case DownloadState::CleaningUp:   return DownloadState::Completed;
        default: break;
    }
    throw InvalidStateTransitionError("No forward transition from " + stateToString(state));
}

bool isTerminalSnapshot(const nlohmann::json& snapshot) {
    auto state = stateFromString(JsonUtils::getString(snapshot, "state", "pending"));
    return state == DownloadState::Completed ||
           state == DownloadState::Failed ||
           state == DownloadState::Cancelled;
}

// Runs the given action when leaving scope
class ScopeExit {
public:
    explicit ScopeExit(std::function<void()> action) : m_action(std::move(action)) {}
    ~ScopeExit() { m_action(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    std::function<void()> m_action;
};

} // namespace

DownloadManager::DownloadManager(std::shared_ptr<Downloader> downloader,
                                 DownloadManagerOptions options,
                                 ThreadPool* pool)
    : m_downloader(std::move(downloader))
    , m_options(std::move(options))
    , m_permits(m_options.maxConcurrent) {

    if (!m_downloader) {
        throw std::invalid_argument("DownloadManager requires a downloader");
    }

    loadState();
    Logger::instance().info("DownloadManager initialized with {} downloader (max concurrent: {})",
                            m_downloader->type(), m_options.maxConcurrent);

    if (pool) {
        resumeRecovered(*pool);
    }
}

DownloadManager::~DownloadManager() {
    shutdown();
    waitForAll();
}

// -- Persistence --

void DownloadManager::loadState() {
    std::error_code ec;
    if (!std::filesystem::exists(m_options.stateFile, ec)) {
        return;
    }

    auto data = JsonUtils::parseFile(m_options.stateFile);
    if (!data || !data->is_object()) {
        Logger::instance().error("Failed to load state from {}: unreadable or corrupt snapshot",
                                 m_options.stateFile.string());
        return;
    }

    for (const auto& item : data->items()) {
        if (!item.value().is_object()) {
            Logger::instance().warn("Skipping malformed task record: {}", item.key());
            continue;
        }

        DownloadTask task = DownloadTask::fromJson(item.value());
        task.id = item.key();
        if (task.isTerminal()) continue;

        auto shared = std::make_shared<DownloadTask>(std::move(task));
        m_snapshots[shared->id] = shared->toJson();
        m_recovered.push_back(shared->id);
        m_tasks[shared->id] = std::move(shared);
    }

    if (!m_tasks.empty()) {
        Logger::instance().info("Resuming {} pending download(s)", m_tasks.size());
    }
}

void DownloadManager::saveStateLocked() {
    nlohmann::json data = nlohmann::json::object();
    for (const auto& [id, snapshot] : m_snapshots) {
        if (!isTerminalSnapshot(snapshot)) data[id] = snapshot;
    }

    if (!JsonUtils::writeFileAtomic(m_options.stateFile, data)) {
        Logger::instance().error("Failed to save state to {}", m_options.stateFile.string());
    }
}

void DownloadManager::publish(const DownloadTask& task) {
    nlohmann::json snapshot = task.toJson();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshots[task.id] = std::move(snapshot);
    saveStateLocked();
}

// -- Public API --

bool DownloadManager::download(const ResourceInfo& resource, const std::string& savePath) {
    if (m_shutdown) {
        Logger::instance().warn("DownloadManager is shut down, not starting: {}", resource.title);
        return false;
    }

    auto task = std::make_shared<DownloadTask>(
        DownloadTask::create(resource, savePath, m_options.maxRetries));

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks[task->id] = task;
        m_snapshots[task->id] = task->toJson();
        saveStateLocked();
    }

    beginDispatch();
    return process(task);
}

std::optional<std::string> DownloadManager::submit(const ResourceInfo& resource,
                                                   const std::string& savePath,
                                                   ThreadPool& pool) {
    if (m_shutdown) {
        Logger::instance().warn("DownloadManager is shut down, not submitting: {}", resource.title);
        return std::nullopt;
    }

    auto task = std::make_shared<DownloadTask>(
        DownloadTask::create(resource, savePath, m_options.maxRetries));

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (isTrackedLocked(resource.downloadUrl)) {
            Logger::instance().info("Already downloading: {}", resource.title);
            return std::nullopt;
        }
        m_tasks[task->id] = task;
        m_snapshots[task->id] = task->toJson();
        saveStateLocked();
    }

    if (!dispatch(pool, task)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.erase(task->id);
        m_snapshots.erase(task->id);
        saveStateLocked();
        return std::nullopt;
    }
    return task->id;
}

bool DownloadManager::isDownloading(const ResourceInfo& resource) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return isTrackedLocked(resource.downloadUrl);
}

bool DownloadManager::isTrackedLocked(const std::string& downloadUrl) const {
    for (const auto& [id, snapshot] : m_snapshots) {
        auto info = JsonUtils::getObject(snapshot, "resource_info");
        if (JsonUtils::getString(info, "download_url") == downloadUrl) {
            return true;
        }
    }
    return false;
}

void DownloadManager::onComplete(CompleteCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_completeCallbacks.push_back(std::move(callback));
}

void DownloadManager::onError(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_errorCallbacks.push_back(std::move(callback));
}

void DownloadManager::onStateChange(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateChangeCallbacks.push_back(std::move(callback));
}

std::optional<DownloadTask> DownloadManager::getTask(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_snapshots.find(id);
    if (it == m_snapshots.end()) return std::nullopt;
    return DownloadTask::fromJson(it->second);
}

size_t DownloadManager::taskCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

size_t DownloadManager::resumeRecovered(ThreadPool& pool) {
    std::vector<std::shared_ptr<DownloadTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& id : m_recovered) {
            auto it = m_tasks.find(id);
            if (it != m_tasks.end()) tasks.push_back(it->second);
        }
        m_recovered.clear();
    }

    for (auto& task : tasks) {
        dispatch(pool, task);
    }
    return tasks.size();
}

bool DownloadManager::cancel(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_tasks.find(id) == m_tasks.end()) return false;
        m_cancelRequests.insert(id);
    }
    m_wakeup.notify_all();

    Logger::instance().info("Cancellation requested: {}", id);
    return true;
}

void DownloadManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) return;
        m_shutdown = true;
    }
    m_wakeup.notify_all();
    m_downloader->interrupt();

    Logger::instance().info("Shutting down DownloadManager");
}

void DownloadManager::waitForAll() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle.wait(lock, [this] { return m_inFlight == 0; });
}

// -- Dispatch --

void DownloadManager::beginDispatch() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_inFlight;
}

void DownloadManager::endDispatch() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_inFlight;
    }
    m_idle.notify_all();
}

bool DownloadManager::dispatch(ThreadPool& pool, std::shared_ptr<DownloadTask> task) {
    beginDispatch();
    try {
        pool.submit([this, task] {
            try {
                process(task);
            } catch (const std::exception& e) {
                Logger::instance().error("Dispatch of task {} aborted: {}", task->id, e.what());
            }
        });
    } catch (const std::runtime_error& e) {
        endDispatch();
        Logger::instance().error("Could not schedule task {}: {}", task->id, e.what());
        return false;
    }
    return true;
}

bool DownloadManager::process(const std::shared_ptr<DownloadTask>& task) {
    ScopeExit done([this] { endDispatch(); });
    PermitPool::Guard permit(m_permits);
    return run(*task) == Outcome::Completed;
}

DownloadManager::Outcome DownloadManager::run(DownloadTask& task) {
    while (true) {
        switch (task.state) {
            case DownloadState::Completed:
                Logger::instance().info("Download completed: {}", task.finalPath.value_or(task.resourceInfo.title));
                finalize(task, true);
                return Outcome::Completed;

            case DownloadState::Failed:
                if (task.canRetry()) {
                    Logger::instance().warn("Task failed (attempt {}/{}), retrying: {}",
                                            task.retryCount, task.maxRetries, task.resourceInfo.title);
                    notifyFailed(task);
                    task.retry();
                    publish(task);
                    continue;
                }
                Logger::instance().error("Task failed after {} retries: {}",
                                         task.retryCount, task.resourceInfo.title);
                notifyFailed(task);
                finalize(task, false);
                return Outcome::Failed;

            case DownloadState::Cancelled:
                return handleCancellation(task);

            default:
                break;
        }

        if (m_shutdown) {
            publish(task);
            Logger::instance().debug("Task suspended for shutdown: {}", task.id);
            return Outcome::Suspended;
        }

        if (takeCancelRequest(task.id)) {
            if (isTransitionAllowed(task.state, DownloadState::Cancelled)) {
                return handleCancellation(task);
            }
            Logger::instance().warn("Task {} cannot be cancelled in state {}", task.id, stateToString(task.state));
        }

        if (task.state == DownloadState::Pending) {
            Logger::instance().info("Starting download: {}", task.resourceInfo.title);
        }

        HandlerResult result = invoke(task);

        switch (result.status) {
            case HandlerResult::Status::Done: {
                DownloadState next = nextState(task.state);
                task.updateState(next);
                publish(task);
                emitStateChange(task, next);
                break;
            }

            case HandlerResult::Status::Poll:
                if (!waitPoll(task.id, result.pollDelay)) {
                    publish(task);
                    Logger::instance().debug("Task suspended for shutdown: {}", task.id);
                    return Outcome::Suspended;
                }
                break;

            case HandlerResult::Status::Failed:
                task.markFailed(result.errorMessage.empty() ? "Handler failed" : result.errorMessage);
                publish(task);
                break;
        }
    }
}

HandlerResult DownloadManager::invoke(DownloadTask& task) {
    try {
        switch (task.state) {
            case DownloadState::Pending:      return m_downloader->onPending(task);
            case DownloadState::Downloading:  return m_downloader->onDownloading(task);
            case DownloadState::Transferring: return m_downloader->onTransferring(task);
            case DownloadState::CleaningUp:   return m_downloader->onCleaningUp(task);
            default: break;
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Handler error [{}]: {}", stateToString(task.state), e.what());
        return HandlerResult::failed(e.what());
    } catch (...) {
        Logger::instance().error("Handler error [{}]: unknown exception", stateToString(task.state));
        return HandlerResult::failed("Unknown handler error");
    }
    return HandlerResult::failed("No handler for state: " + stateToString(task.state));
}

DownloadManager::Outcome DownloadManager::handleCancellation(DownloadTask& task) {
    if (task.state != DownloadState::Cancelled) {
        task.updateState(DownloadState::Cancelled);
        publish(task);
    }

    try {
        m_downloader->onCancelled(task);
    } catch (const std::exception& e) {
        Logger::instance().error("Cancellation hook error for {}: {}", task.id, e.what());
    }

    task.errorMessage = "Cancelled";
    finalize(task, false);
    return Outcome::Failed;
}

void DownloadManager::notifyFailed(DownloadTask& task) {
    try {
        m_downloader->onFailed(task);
    } catch (const std::exception& e) {
        Logger::instance().error("Failure hook error for {}: {}", task.id, e.what());
    }
}

bool DownloadManager::waitPoll(const std::string& id, std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_wakeup.wait_for(lock, delay, [this, &id] {
        return m_shutdown.load() || m_cancelRequests.count(id) > 0;
    });
    return !m_shutdown;
}

bool DownloadManager::takeCancelRequest(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelRequests.erase(id) > 0;
}

// -- Completion --

void DownloadManager::finalize(DownloadTask& task, bool success) {
    publish(task);

    const std::string message = task.errorMessage.value_or("Unknown error");

    if (success) {
        std::vector<CompleteCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callbacks = m_completeCallbacks;
        }
        for (const auto& callback : callbacks) {
            try {
                callback(task);
            } catch (const std::exception& e) {
                Logger::instance().error("Callback error: {}", e.what());
            }
        }
    } else {
        std::vector<ErrorCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callbacks = m_errorCallbacks;
        }
        for (const auto& callback : callbacks) {
            try {
                callback(task, message);
            } catch (const std::exception& e) {
                Logger::instance().error("Callback error: {}", e.what());
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.erase(task.id);
        m_snapshots.erase(task.id);
        m_cancelRequests.erase(task.id);
        saveStateLocked();
    }
    Logger::instance().debug("Task finalized and removed: {} (success={})", task.id, success);
}

void DownloadManager::emitStateChange(const DownloadTask& task, DownloadState state) {
    std::vector<StateChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callbacks = m_stateChangeCallbacks;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(task, state);
        } catch (const std::exception& e) {
            Logger::instance().error("State change callback error: {}", e.what());
        }
    }
}

} // namespace aniflow::core::downloader
