#pragma once

/**
 * OpenListModels.hpp
 *
 * Data returned by the OpenList offline-download service.
 */

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace aniflow::core::openlist {

/**
 * Remote job state, as the integer the server reports
 */
enum class TaskState {
    Pending = 0,
    Running = 1,
    Succeeded = 2,
    Canceling = 3,
    Canceled = 4,
    Errored = 5,
    Failing = 6,
    Failed = 7,
    WaitingRetry = 8,
    BeforeRetry = 9
};

/**
 * Map a wire value to TaskState, std::nullopt when out of range
 */
std::optional<TaskState> taskStateFromInt(int value);

std::string taskStateToString(TaskState state);

/**
 * Offline download backends the server may offer
 */
enum class OfflineDownloadTool {
    Aria2,
    QBittorrent,
    PikPak
};

std::string toolToString(OfflineDownloadTool tool);
std::optional<OfflineDownloadTool> toolFromString(const std::string& name);

/**
 * One offline-download or transfer job
 */
struct OpenListTask {
    std::string id;
    std::string name;
    std::optional<std::string> creator;
    std::optional<TaskState> state;
    std::optional<std::string> status;
    std::optional<double> progress;
    std::optional<std::string> startTime;
    std::optional<std::string> endTime;
    std::optional<int64_t> totalBytes;
    std::optional<std::string> error;

    bool isSucceeded() const {
        return state && *state == TaskState::Succeeded;
    }

    static OpenListTask fromJson(const nlohmann::json& j);
};

/**
 * One entry of a directory listing
 */
struct FileEntry {
    std::string name;
    std::optional<std::string> path;
    std::optional<int64_t> size;
    std::optional<bool> isDir;
    std::optional<std::string> modified;
    std::optional<std::string> sign;

    bool isDirectory() const { return isDir.value_or(false); }

    static FileEntry fromJson(const nlohmann::json& j);
};

} // namespace aniflow::core::openlist
