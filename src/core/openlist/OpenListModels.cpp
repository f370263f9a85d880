/**
 * OpenListModels.cpp
 */

#include "OpenListModels.hpp"
#include "../../utils/JsonUtils.hpp"

namespace aniflow::core::openlist {

using utils::JsonUtils;

namespace {

// First key holding a positive number; zero counts as absent
std::optional<int64_t> firstPositive(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto value = JsonUtils::getOptionalLong(j, key);
        if (value && *value != 0) return value;
    }
    return std::nullopt;
}

} // namespace

std::optional<TaskState> taskStateFromInt(int value) {
    if (value < static_cast<int>(TaskState::Pending) || value > static_cast<int>(TaskState::BeforeRetry)) {
        return std::nullopt;
    }
    return static_cast<TaskState>(value);
}

std::string taskStateToString(TaskState state) {
    switch (state) {
        case TaskState::Pending:      return "Pending";
        case TaskState::Running:      return "Running";
        case TaskState::Succeeded:    return "Succeeded";
        case TaskState::Canceling:    return "Canceling";
        case TaskState::Canceled:     return "Canceled";
        case TaskState::Errored:      return "Errored";
        case TaskState::Failing:      return "Failing";
        case TaskState::Failed:       return "Failed";
        case TaskState::WaitingRetry: return "WaitingRetry";
        case TaskState::BeforeRetry:  return "BeforeRetry";
    }
    return "Unknown";
}

std::string toolToString(OfflineDownloadTool tool) {
    switch (tool) {
        case OfflineDownloadTool::Aria2:       return "aria2";
        case OfflineDownloadTool::QBittorrent: return "qBittorrent";
        case OfflineDownloadTool::PikPak:      return "PikPak";
    }
    return "";
}

std::optional<OfflineDownloadTool> toolFromString(const std::string& name) {
    if (name == "aria2") return OfflineDownloadTool::Aria2;
    if (name == "qBittorrent") return OfflineDownloadTool::QBittorrent;
    if (name == "PikPak") return OfflineDownloadTool::PikPak;
    return std::nullopt;
}

// -- OpenListTask --

OpenListTask OpenListTask::fromJson(const nlohmann::json& j) {
    OpenListTask task;
    task.id = JsonUtils::getString(j, "id");
    task.name = JsonUtils::getString(j, "name");
    task.creator = JsonUtils::getOptionalString(j, "creator");

    if (auto raw = JsonUtils::getOptionalInt(j, "state")) {
        task.state = taskStateFromInt(*raw);
    }

    task.status = JsonUtils::getOptionalString(j, "status");
    if (j.is_object() && j.contains("progress") && j["progress"].is_number()) {
        task.progress = j["progress"].get<double>();
    }
    task.startTime = JsonUtils::getOptionalString(j, "start_time");
    task.endTime = JsonUtils::getOptionalString(j, "end_time");
    task.totalBytes = JsonUtils::getOptionalLong(j, "total_bytes");
    task.error = JsonUtils::getOptionalString(j, "error");
    return task;
}

// -- FileEntry --

FileEntry FileEntry::fromJson(const nlohmann::json& j) {
    FileEntry entry;
    entry.name = JsonUtils::getString(j, "name");

    entry.path = JsonUtils::getOptionalString(j, "path");
    if (!entry.path || entry.path->empty()) entry.path = JsonUtils::getOptionalString(j, "full_path");

    entry.size = firstPositive(j, {"size", "bytes", "total_bytes"});
    if (j.is_object() && j.contains("is_dir") && j["is_dir"].is_boolean()) {
        entry.isDir = j["is_dir"].get<bool>();
    }
    entry.modified = JsonUtils::getOptionalString(j, "modified");
    entry.sign = JsonUtils::getOptionalString(j, "sign");
    return entry;
}

} // namespace aniflow::core::openlist
