#pragma once

/**
 * DownloadTask.hpp
 *
 * One in-flight acquisition and its state machine.
 */

#include "../models/Models.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace aniflow::core::downloader {

/**
 * Download task state
 *
 * Pending -> Downloading -> Transferring -> CleaningUp -> Completed.
 * Failed is reachable from every non-terminal state, Cancelled from
 * Pending, Downloading and Transferring. Both lead back to Pending only.
 */
enum class DownloadState {
    Pending,
    Downloading,
    Transferring,
    CleaningUp,
    Completed,
    Failed,
    Cancelled
};

/**
 * Textual label of a state ("pending", "cleaning_up", ...)
 */
std::string stateToString(DownloadState state);

/**
 * Parse a state label, translating the labels older snapshots used.
 * Anything unrecognised restarts the task from Pending.
 */
DownloadState stateFromString(const std::string& label);

/**
 * Whether `to` is a legal successor of `from`
 */
bool isTransitionAllowed(DownloadState from, DownloadState to);

/**
 * Raised on an illegal state change. The task keeps its previous state.
 */
class InvalidStateTransitionError : public std::logic_error {
public:
    explicit InvalidStateTransitionError(const std::string& message)
        : std::logic_error(message) {}
};

/**
 * DownloadTask - Single acquisition record
 *
 * Plain data plus the transition rules. Not synchronized: a task is
 * mutated only by the thread currently dispatching it.
 */
struct DownloadTask {
    // UUIDv4, also the name of the remote working directory
    std::string id;

    DownloadState state{DownloadState::Pending};
    std::optional<std::string> errorMessage;
    int retryCount{0};
    int maxRetries{3};

    // Paths on the remote storage
    std::string savePath;
    std::optional<std::string> tempPath;
    std::optional<std::string> finalPath;

    // Relative path of the detected file inside tempPath
    std::optional<std::string> downloadedFilename;
    // Relative paths present in tempPath before the transfer
    std::vector<std::string> initialFiles;

    std::string createdAt;
    std::string updatedAt;
    std::optional<std::string> startedAt;
    std::optional<std::string> completedAt;

    ResourceInfo resourceInfo;

    // Adapter bookkeeping (remote job id, attempt counters)
    nlohmann::json extraData = nlohmann::json::object();

    /**
     * Create a fresh Pending task with a new id and timestamps
     */
    static DownloadTask create(const ResourceInfo& resource, const std::string& savePath,
                               int maxRetries = 3);

    /**
     * Move to `next`
     * @throws InvalidStateTransitionError if the edge does not exist
     */
    void updateState(DownloadState next);

    /**
     * Record the error and move to Failed
     */
    void markFailed(const std::string& message);

    bool canRetry() const {
        return state == DownloadState::Failed && retryCount < maxRetries;
    }

    /**
     * Back to Pending for another attempt
     * @throws InvalidStateTransitionError if canRetry() is false
     */
    void retry();

    bool isTerminal() const {
        return state == DownloadState::Completed ||
               state == DownloadState::Failed ||
               state == DownloadState::Cancelled;
    }

    // Snapshot serialization
    nlohmann::json toJson() const;
    static DownloadTask fromJson(const nlohmann::json& j);
};

} // namespace aniflow::core::downloader
