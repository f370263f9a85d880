/**
 * OpenListDownloader.cpp
 *
 * OpenList offline download workflow handlers.
 */

#include "OpenListDownloader.hpp"
#include "../Logger.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include <fmt/args.h>
#include <fmt/format.h>

namespace aniflow::core::downloader {

using openlist::FileEntry;
using openlist::OpenListTask;
using utils::JsonUtils;
using utils::StringUtils;

namespace {

const std::vector<std::string> kPartialMarkers = {".aria2", ".downloading", ".!qB", ".part", ".tmp"};

const std::unordered_set<std::string> kVideoExtensions = {
    ".mkv", ".mp4", ".avi", ".mov", ".wmv", ".flv", ".webm", ".m4v", ".ts", ".rmvb"
};

const char* kTaskIdKey = "task_id";
const char* kDownloadFinishedKey = "download_finished";
const char* kTransferCheckedKey = "transfer_checked";
const char* kDetectAttemptsKey = "detect_attempts";

std::string episodeLabel(const DownloadTask& task) {
    const auto& info = task.resourceInfo;
    return formatAnimeEpisode(info.animeName, info.season, info.episode);
}

const OpenListTask* findById(const std::vector<OpenListTask>& jobs, const std::string& id) {
    auto it = std::find_if(jobs.begin(), jobs.end(), [&](const OpenListTask& job) { return job.id == id; });
    return it != jobs.end() ? &*it : nullptr;
}

const OpenListTask* findByName(const std::vector<OpenListTask>& jobs, const std::string& fragment) {
    auto it = std::find_if(jobs.begin(), jobs.end(), [&](const OpenListTask& job) {
        return StringUtils::contains(job.name, fragment);
    });
    return it != jobs.end() ? &*it : nullptr;
}

std::string describeState(const OpenListTask& job) {
    if (job.state) return openlist::taskStateToString(*job.state);
    return job.status.value_or("unknown");
}

} // namespace

// -- Helpers --

std::string sanitizeFilename(const std::string& name) {
    return StringUtils::sanitizeFileName(name);
}

std::string formatAnimeEpisode(const std::optional<std::string>& animeName,
                               const std::optional<int>& season,
                               const std::optional<int>& episode) {
    std::string name = animeName && !animeName->empty() ? *animeName : "Unknown";
    std::string seasonPart = season ? fmt::format("S{:02d}", *season) : "S??";
    std::string episodePart = episode ? fmt::format("E{:02d}", *episode) : "E??";
    return name + " " + seasonPart + episodePart;
}

bool isVideoFile(const std::string& name) {
    return kVideoExtensions.count(StringUtils::toLower(StringUtils::fileExtension(name))) > 0;
}

bool isPartialFile(const std::string& name) {
    return std::any_of(kPartialMarkers.begin(), kPartialMarkers.end(),
                       [&](const std::string& marker) { return StringUtils::endsWith(name, marker); });
}

// -- OpenListDownloader --

OpenListDownloader::OpenListDownloader(std::shared_ptr<openlist::OpenListClient> client,
                                       OpenListDownloaderOptions options)
    : m_client(std::move(client))
    , m_options(std::move(options)) {
    if (!m_client) {
        throw std::invalid_argument("OpenList client is required");
    }
    if (m_client->baseUrl().empty()) {
        throw std::invalid_argument("OpenList base URL is required");
    }
    if (m_options.tool.empty()) {
        throw std::invalid_argument("Offline download tool is required");
    }
    if (m_options.renameFormat.empty()) {
        throw std::invalid_argument("Rename format is required");
    }
}

void OpenListDownloader::pause(std::chrono::milliseconds delay) {
    if (delay.count() <= 0) return;
    std::unique_lock<std::mutex> lock(m_pauseMutex);
    m_pauseWakeup.wait_for(lock, delay, [this] { return m_interrupted.load(); });
}

void OpenListDownloader::interrupt() {
    {
        std::lock_guard<std::mutex> lock(m_pauseMutex);
        m_interrupted = true;
    }
    m_pauseWakeup.notify_all();
}

bool OpenListDownloader::verifyServer() {
    if (!m_client->checkHealth()) {
        return false;
    }

    auto tools = m_client->getOfflineDownloadTools();
    if (!tools) {
        Logger::instance().error("Could not fetch the offline download tools from {}", m_client->baseUrl());
        return false;
    }

    if (std::find(tools->begin(), tools->end(), m_options.tool) == tools->end()) {
        Logger::instance().error("Offline download tool '{}' is not available on the server (available: {})",
                                 m_options.tool, StringUtils::join(*tools, ", "));
        return false;
    }

    Logger::instance().info("OpenList server at {} is ready (tool: {})", m_client->baseUrl(), m_options.tool);
    return true;
}

// -- Pending --

HandlerResult OpenListDownloader::onPending(DownloadTask& task) {
    Logger::instance().debug("Preparing: {}", task.resourceInfo.title);

    const std::string tempPath = StringUtils::joinRemotePath(task.savePath, task.id);
    Logger::instance().debug("Creating temporary directory: {}", tempPath);
    if (!m_client->mkdir(tempPath)) {
        return HandlerResult::failed("Failed to create temporary directory: " + tempPath);
    }

    task.initialFiles.clear();
    if (auto files = listRecursive(tempPath)) {
        for (const auto& file : *files) task.initialFiles.push_back(file.name);
    }
    task.tempPath = tempPath;

    // Counters of a previous attempt do not carry over
    task.extraData.erase(kDownloadFinishedKey);
    task.extraData.erase(kTransferCheckedKey);
    task.extraData.erase(kDetectAttemptsKey);
    forgetProgress(task.id);

    Logger::instance().info("Starting download: {}", episodeLabel(task));
    Logger::instance().debug("  Title: {}", task.resourceInfo.title);
    Logger::instance().debug("  URL: {}", task.resourceInfo.downloadUrl);
    Logger::instance().debug("  Temp path: {}", tempPath);

    auto jobs = m_client->addOfflineDownload({task.resourceInfo.downloadUrl}, tempPath, m_options.tool);
    if (!jobs || jobs->empty()) {
        return HandlerResult::failed("Failed to create offline download task");
    }

    task.extraData[kTaskIdKey] = jobs->front().id;
    Logger::instance().debug("Download task created with ID: {}", jobs->front().id);
    return HandlerResult::done();
}

// -- Downloading --

HandlerResult OpenListDownloader::onDownloading(DownloadTask& task) {
    const std::string jobId = JsonUtils::getString(task.extraData, kTaskIdKey);
    if (jobId.empty()) {
        return HandlerResult::failed("No task ID available");
    }

    if (!JsonUtils::getBool(task.extraData, kDownloadFinishedKey)) {
        auto undone = m_client->getOfflineDownloadUndone();
        if (!undone) {
            return HandlerResult::poll(m_options.pollInterval);
        }

        if (const auto* job = findById(*undone, jobId)) {
            if (job->progress) logProgress(task, "download", *job->progress);
            return HandlerResult::poll(m_options.pollInterval);
        }

        auto done = m_client->getOfflineDownloadDone();
        if (!done) {
            return HandlerResult::poll(m_options.pollInterval);
        }

        const auto* job = findById(*done, jobId);
        if (!job) {
            return HandlerResult::failed("Task " + jobId + " not found");
        }
        if (!job->isSucceeded()) {
            Logger::instance().error("Download failed with state: {}", describeState(*job));
            std::string message = "Task failed with state: " + describeState(*job);
            if (job->error && !job->error->empty()) message += " (" + *job->error + ")";
            return HandlerResult::failed(message);
        }

        task.extraData[kDownloadFinishedKey] = true;
        Logger::instance().debug("Download finished, waiting for storage transfer: {}", task.resourceInfo.title);
    }

    if (!JsonUtils::getBool(task.extraData, kTransferCheckedKey)) {
        std::string error;
        switch (checkTransfer(task, error)) {
            case TransferStatus::Running:
                return HandlerResult::poll(m_options.pollInterval);
            case TransferStatus::Failed:
                return HandlerResult::failed(error);
            case TransferStatus::Finished:
            case TransferStatus::Missing:
                task.extraData[kTransferCheckedKey] = true;
                break;
        }
    }

    return detect(task);
}

OpenListDownloader::TransferStatus OpenListDownloader::checkTransfer(const DownloadTask& task,
                                                                     std::string& error) {
    const int attempts = std::max(1, m_options.transferCheckAttempts);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (auto undone = m_client->getTransferUndone()) {
            if (const auto* job = findByName(*undone, task.id)) {
                if (job->progress) logProgress(task, "transfer", *job->progress);
                return TransferStatus::Running;
            }
        }

        if (auto done = m_client->getTransferDone()) {
            if (const auto* job = findByName(*done, task.id)) {
                if (job->isSucceeded()) {
                    return TransferStatus::Finished;
                }
                error = "Transfer failed with state: " + describeState(*job);
                if (job->error && !job->error->empty()) error += " (" + *job->error + ")";
                return TransferStatus::Failed;
            }
        }

        if (attempt < attempts) {
            pause(m_options.transferCheckDelay);
            // Look again after the restart
            if (interrupted()) return TransferStatus::Running;
        }
    }

    Logger::instance().debug("No transfer job found for {}, continuing", task.id);
    return TransferStatus::Missing;
}

HandlerResult OpenListDownloader::detect(DownloadTask& task) {
    if (auto filename = detectDownloadedFile(task)) {
        task.downloadedFilename = *filename;
        forgetProgress(task.id);
        Logger::instance().info("Downloaded {}: {}", episodeLabel(task), *filename);
        return HandlerResult::done();
    }

    int attempts = JsonUtils::getInt(task.extraData, kDetectAttemptsKey, 0) + 1;
    task.extraData[kDetectAttemptsKey] = attempts;

    if (attempts > m_options.maxDetectAttempts) {
        return HandlerResult::failed("Download completed but no file found");
    }

    Logger::instance().debug("No downloaded file yet for {} (attempt {}/{})",
                             task.id, attempts, m_options.maxDetectAttempts);
    return HandlerResult::poll(m_options.pollInterval);
}

std::optional<std::string> OpenListDownloader::detectDownloadedFile(const DownloadTask& task) {
    if (!task.tempPath) return std::nullopt;

    auto files = listRecursive(*task.tempPath);
    if (!files) return std::nullopt;

    std::unordered_set<std::string> initial(task.initialFiles.begin(), task.initialFiles.end());

    const FileEntry* best = nullptr;
    for (const auto& file : *files) {
        if (isPartialFile(file.name)) continue;
        if (initial.count(file.name)) continue;
        if (!isVideoFile(file.name)) continue;

        if (!best || file.size.value_or(0) > best->size.value_or(0)) {
            best = &file;
        }
    }

    if (!best) return std::nullopt;
    return best->name;
}

std::optional<std::vector<FileEntry>> OpenListDownloader::listRecursive(const std::string& root) {
    std::vector<FileEntry> files;
    if (!walk(root, "", files)) return std::nullopt;
    return files;
}

bool OpenListDownloader::walk(const std::string& root, const std::string& prefix,
                              std::vector<FileEntry>& out) {
    auto entries = m_client->listFiles(root);
    if (!entries) return false;

    for (auto& entry : *entries) {
        std::string relative = prefix.empty() ? entry.name : prefix + "/" + entry.name;
        if (entry.isDirectory()) {
            if (!walk(StringUtils::joinRemotePath(root, entry.name), relative, out)) return false;
            continue;
        }
        entry.name = relative;
        out.push_back(std::move(entry));
    }
    return true;
}

bool OpenListDownloader::logProgress(const DownloadTask& task, const std::string& phase, double progress) {
    const int bucket = std::clamp(static_cast<int>(progress) / 25, 0, 3);
    const std::string key = task.id + ":" + phase;

    bool milestone = false;
    {
        std::lock_guard<std::mutex> lock(m_progressMutex);
        auto it = m_progressBuckets.find(key);
        int last = it != m_progressBuckets.end() ? it->second : -1;
        if (bucket > last) {
            m_progressBuckets[key] = bucket;
            milestone = true;
        }
    }

    if (milestone) {
        Logger::instance().info("{} [{}]: {:.0f}%", phase == "transfer" ? "Transferring" : "Downloading",
                                episodeLabel(task), progress);
    } else {
        Logger::instance().debug("Progress ({}) {}: {:.1f}%", phase, task.id, progress);
    }
    return milestone;
}

void OpenListDownloader::forgetProgress(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_progressMutex);
    const std::string prefix = taskId + ":";
    for (auto it = m_progressBuckets.begin(); it != m_progressBuckets.end();) {
        if (StringUtils::startsWith(it->first, prefix)) {
            it = m_progressBuckets.erase(it);
        } else {
            ++it;
        }
    }
}

// -- Transferring --

std::string OpenListDownloader::buildFinalFilename(const ResourceInfo& resource,
                                                   const std::string& extension) const {
    std::string animeName = sanitizeFilename(resource.animeName.value_or("Unknown"));
    if (animeName.empty()) animeName = "Unknown";

    std::vector<std::string> languageLabels;
    for (auto language : resource.languages) languageLabels.push_back(languageToString(language));

    fmt::dynamic_format_arg_store<fmt::format_context> args;
    args.push_back(fmt::arg("anime_name", animeName));
    args.push_back(fmt::arg("download_url", resource.downloadUrl));
    args.push_back(fmt::arg("quality", qualityToString(resource.quality)));
    args.push_back(fmt::arg("languages", StringUtils::join(languageLabels, "")));
    if (resource.season) args.push_back(fmt::arg("season", *resource.season));
    if (resource.episode) args.push_back(fmt::arg("episode", *resource.episode));
    if (resource.fansub) args.push_back(fmt::arg("fansub", *resource.fansub));

    std::string stem;
    try {
        stem = StringUtils::trim(fmt::vformat(m_options.renameFormat, args));
    } catch (const fmt::format_error& e) {
        Logger::instance().warn("Failed to format filename using format string: '{}'. Error: {}. "
                                "Falling back to default.", m_options.renameFormat, e.what());
    }

    if (stem.empty()) {
        stem = fmt::format("{} S{:02d}E{:02d}", animeName, resource.season.value_or(1),
                           resource.episode.value_or(1));
    }

    if (resource.version > 1) {
        stem += " v" + std::to_string(resource.version);
    }

    return StringUtils::trim(stem + extension);
}

HandlerResult OpenListDownloader::onTransferring(DownloadTask& task) {
    Logger::instance().debug("Transferring: {}", task.resourceInfo.title);

    if (!task.downloadedFilename) {
        return HandlerResult::failed("No downloaded filename available");
    }
    if (!task.tempPath) {
        return HandlerResult::failed("No temp_path available");
    }

    const auto& info = task.resourceInfo;
    std::string showDir = sanitizeFilename(info.animeName.value_or("Unknown"));
    if (showDir.empty()) showDir = "Unknown";

    const std::string finalDir = StringUtils::joinRemotePath(
        StringUtils::joinRemotePath(task.savePath, showDir),
        "Season " + std::to_string(info.season.value_or(1)));

    std::string extension = StringUtils::fileExtension(*task.downloadedFilename);
    if (extension.empty()) extension = ".mp4";

    const std::string finalName = buildFinalFilename(info, extension);

    if (!m_client->mkdir(finalDir)) {
        return HandlerResult::failed("Failed to create directory: " + finalDir);
    }

    // The detected file may sit in a sub directory of the temp dir
    std::string sourceDir = *task.tempPath;
    const std::string nested = StringUtils::remoteParent(*task.downloadedFilename);
    if (!nested.empty()) sourceDir = StringUtils::joinRemotePath(sourceDir, nested);
    const std::string originalName = StringUtils::remoteBaseName(*task.downloadedFilename);

    std::string fileToMove = originalName;
    if (finalName != originalName) {
        Logger::instance().debug("Renaming file to: {}", finalName);
        BestEffort renamed = m_client->renameFile(StringUtils::joinRemotePath(sourceDir, originalName), finalName)
            ? BestEffort::success()
            : BestEffort::failure("rename of " + originalName + " failed");

        if (renamed.ok) {
            fileToMove = finalName;
            Logger::instance().debug("Waiting for remote listing to refresh before moving");
            pause(m_options.renameSettleDelay);
        } else {
            Logger::instance().warn("Rename failed ({}), will move with original name: {}",
                                    renamed.detail, originalName);
        }
    }

    Logger::instance().debug("Moving file to final destination: {}/{}", finalDir, fileToMove);
    if (!m_client->moveFile(sourceDir, finalDir, {fileToMove})) {
        return HandlerResult::failed("Failed to move file to: " + finalDir);
    }

    task.finalPath = StringUtils::joinRemotePath(finalDir, fileToMove);
    return HandlerResult::done();
}

// -- Cleaning up --

BestEffort OpenListDownloader::cleanup(const DownloadTask& task) {
    if (!task.tempPath) return BestEffort::success();

    std::string parent = StringUtils::remoteParent(*task.tempPath);
    if (parent.empty()) parent = "/";
    const std::string name = StringUtils::remoteBaseName(*task.tempPath);

    Logger::instance().debug("Cleaning up temporary directory: {}", *task.tempPath);
    if (!m_client->removePath(parent, {name})) {
        return BestEffort::failure("Failed to remove temporary directory: " + *task.tempPath);
    }
    return BestEffort::success();
}

HandlerResult OpenListDownloader::onCleaningUp(DownloadTask& task) {
    BestEffort removed = cleanup(task);
    if (!removed.ok) {
        Logger::instance().warn("{}", removed.detail);
    }

    Logger::instance().info("Download completed: {}", episodeLabel(task));
    return HandlerResult::done();
}

void OpenListDownloader::onFailed(DownloadTask& task) {
    forgetProgress(task.id);
    BestEffort removed = cleanup(task);
    if (!removed.ok) {
        Logger::instance().warn("{}", removed.detail);
    }
}

void OpenListDownloader::onCancelled(DownloadTask& task) {
    forgetProgress(task.id);
    Logger::instance().info("Download cancelled: {}", episodeLabel(task));
    BestEffort removed = cleanup(task);
    if (!removed.ok) {
        Logger::instance().warn("{}", removed.detail);
    }
}

} // namespace aniflow::core::downloader
