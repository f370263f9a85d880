/**
 * DownloadTask.cpp
 *
 * State transition table and snapshot serialization.
 */

#include "DownloadTask.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <unordered_map>

namespace aniflow::core::downloader {

using utils::JsonUtils;
using utils::StringUtils;

namespace {

nlohmann::json optionalToJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

// -- Labels --

std::string stateToString(DownloadState state) {
    switch (state) {
        case DownloadState::Pending:      return "pending";
        case DownloadState::Downloading:  return "downloading";
        case DownloadState::Transferring: return "transferring";
        case DownloadState::CleaningUp:   return "cleaning_up";
        case DownloadState::Completed:    return "completed";
        case DownloadState::Failed:       return "failed";
        case DownloadState::Cancelled:    return "cancelled";
    }
    return "pending";
}

DownloadState stateFromString(const std::string& label) {
    static const std::unordered_map<std::string, DownloadState> labels = {
        {"pending", DownloadState::Pending},
        {"downloading", DownloadState::Downloading},
        {"transferring", DownloadState::Transferring},
        {"cleaning_up", DownloadState::CleaningUp},
        {"completed", DownloadState::Completed},
        {"failed", DownloadState::Failed},
        {"cancelled", DownloadState::Cancelled},
        // Older snapshots
        {"downloaded", DownloadState::Transferring},
        {"transfering", DownloadState::Transferring},
        {"processing", DownloadState::CleaningUp},
        {"post_processing", DownloadState::CleaningUp},
        {"cleaning", DownloadState::CleaningUp},
        {"cleanup", DownloadState::CleaningUp},
        {"canceled", DownloadState::Cancelled},
        {"error", DownloadState::Failed},
        {"errored", DownloadState::Failed},
    };

    auto it = labels.find(label);
    return it != labels.end() ? it->second : DownloadState::Pending;
}

bool isTransitionAllowed(DownloadState from, DownloadState to) {
    switch (from) {
        case DownloadState::Pending:
            return to == DownloadState::Downloading || to == DownloadState::Failed ||
                   to == DownloadState::Cancelled;
        case DownloadState::Downloading:
            return to == DownloadState::Transferring || to == DownloadState::Failed ||
                   to == DownloadState::Cancelled;
        case DownloadState::Transferring:
            return to == DownloadState::CleaningUp || to == DownloadState::Failed ||
                   to == DownloadState::Cancelled;
        case DownloadState::CleaningUp:
            return to == DownloadState::Completed || to == DownloadState::Failed;
        case DownloadState::Completed:
            return false;
        case DownloadState::Failed:
        case DownloadState::Cancelled:
            return to == DownloadState::Pending;
    }
    return false;
}

// -- DownloadTask --

DownloadTask DownloadTask::create(const ResourceInfo& resource, const std::string& savePath,
                                  int maxRetries) {
    DownloadTask task;
    task.id = StringUtils::generateUUID();
    task.resourceInfo = resource;
    task.savePath = savePath;
    task.maxRetries = maxRetries;
    task.createdAt = StringUtils::nowIso();
    task.updatedAt = task.createdAt;
    return task;
}

void DownloadTask::updateState(DownloadState next) {
    if (!isTransitionAllowed(state, next)) {
        throw InvalidStateTransitionError(
            "Invalid state transition from " + stateToString(state) + " to " + stateToString(next));
    }

    state = next;
    updatedAt = StringUtils::nowIso();

    if (next == DownloadState::Downloading && !startedAt) {
        startedAt = updatedAt;
    } else if (next == DownloadState::Completed) {
        completedAt = updatedAt;
    }
}

void DownloadTask::markFailed(const std::string& message) {
    errorMessage = message;
    updateState(DownloadState::Failed);
}

void DownloadTask::retry() {
    if (!canRetry()) {
        throw InvalidStateTransitionError(
            "Cannot retry: state=" + stateToString(state) + ", retries=" +
            std::to_string(retryCount) + "/" + std::to_string(maxRetries));
    }

    ++retryCount;
    errorMessage.reset();
    state = DownloadState::Pending;
    updatedAt = StringUtils::nowIso();
}

nlohmann::json DownloadTask::toJson() const {
    return {
        {"id", id},
        {"state", stateToString(state)},
        {"error_message", optionalToJson(errorMessage)},
        {"retry_count", retryCount},
        {"max_retries", maxRetries},
        {"save_path", savePath},
        {"temp_path", optionalToJson(tempPath)},
        {"final_path", optionalToJson(finalPath)},
        {"downloaded_filename", optionalToJson(downloadedFilename)},
        {"initial_files", initialFiles},
        {"created_at", createdAt},
        {"updated_at", updatedAt},
        {"started_at", optionalToJson(startedAt)},
        {"completed_at", optionalToJson(completedAt)},
        {"resource_info", resourceInfo.toJson()},
        {"extra_data", extraData}
    };
}

DownloadTask DownloadTask::fromJson(const nlohmann::json& j) {
    DownloadTask task;
    task.id = JsonUtils::getString(j, "id");
    if (task.id.empty()) task.id = StringUtils::generateUUID();

    task.state = stateFromString(JsonUtils::getString(j, "state", "pending"));
    task.errorMessage = JsonUtils::getOptionalString(j, "error_message");
    task.retryCount = JsonUtils::getInt(j, "retry_count", 0);
    task.maxRetries = JsonUtils::getInt(j, "max_retries", 3);

    task.savePath = JsonUtils::getString(j, "save_path");
    task.tempPath = JsonUtils::getOptionalString(j, "temp_path");
    task.finalPath = JsonUtils::getOptionalString(j, "final_path");
    task.downloadedFilename = JsonUtils::getOptionalString(j, "downloaded_filename");

    for (const auto& name : JsonUtils::getArray(j, "initial_files")) {
        if (name.is_string()) task.initialFiles.push_back(name.get<std::string>());
    }

    auto now = StringUtils::nowIso();
    task.createdAt = JsonUtils::getString(j, "created_at", now);
    task.updatedAt = JsonUtils::getString(j, "updated_at", task.createdAt);
    task.startedAt = JsonUtils::getOptionalString(j, "started_at");
    task.completedAt = JsonUtils::getOptionalString(j, "completed_at");

    task.resourceInfo = ResourceInfo::fromJson(JsonUtils::getObject(j, "resource_info"));
    task.extraData = JsonUtils::getObject(j, "extra_data");
    return task;
}

} // namespace aniflow::core::downloader
