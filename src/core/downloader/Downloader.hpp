#pragma once

/**
 * Downloader.hpp
 *
 * Per-state workflow handlers driven by the DownloadManager.
 */

#include "DownloadTask.hpp"

#include <chrono>
#include <string>

namespace aniflow::core::downloader {

/**
 * Outcome of one handler invocation
 *
 * Done advances the task to the next state, Poll asks the manager to
 * call the same handler again after `pollDelay`, Failed marks the task
 * failed with `errorMessage`.
 */
struct HandlerResult {
    enum class Status {
        Done,
        Poll,
        Failed
    };

    Status status{Status::Done};
    std::string errorMessage;
    std::chrono::milliseconds pollDelay{0};

    static HandlerResult done() {
        return HandlerResult{};
    }

    static HandlerResult poll(std::chrono::milliseconds delay = std::chrono::seconds(5)) {
        HandlerResult result;
        result.status = Status::Poll;
        result.pollDelay = delay;
        return result;
    }

    static HandlerResult failed(const std::string& message) {
        HandlerResult result;
        result.status = Status::Failed;
        result.errorMessage = message;
        return result;
    }

    bool isDone() const { return status == Status::Done; }
    bool isPoll() const { return status == Status::Poll; }
    bool isFailed() const { return status == Status::Failed; }
};

/**
 * Outcome of a best-effort sub-operation (cleanup, rename)
 *
 * Logged by the caller, never turned into a handler failure.
 */
struct BestEffort {
    bool ok{true};
    std::string detail;

    static BestEffort success() { return BestEffort{}; }
    static BestEffort failure(const std::string& detail) { return BestEffort{false, detail}; }
};

/**
 * Downloader - abstract workflow adapter
 *
 * One handler per non-terminal state. Handlers may block; they run on
 * the thread dispatching the task and may mutate that task freely.
 */
class Downloader {
public:
    virtual ~Downloader() = default;

    /**
     * Short identifier used in log lines
     */
    virtual std::string type() const = 0;

    // Prepare the remote workspace and start the download
    virtual HandlerResult onPending(DownloadTask& task) = 0;

    // Watch the remote job and detect the resulting file
    virtual HandlerResult onDownloading(DownloadTask& task) = 0;

    // Rename and move the file to its final destination
    virtual HandlerResult onTransferring(DownloadTask& task) = 0;

    // Remove temporary storage
    virtual HandlerResult onCleaningUp(DownloadTask& task) = 0;

    /**
     * Called after a failure, before a retry or the final failure
     */
    virtual void onFailed(DownloadTask& task) = 0;

    /**
     * Called once a task has been cancelled
     */
    virtual void onCancelled(DownloadTask& task) = 0;

    /**
     * Wake handlers blocked in an internal pause. Called once on shutdown;
     * later pauses return immediately.
     */
    virtual void interrupt() {}
};

} // namespace aniflow::core::downloader
