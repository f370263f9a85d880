#pragma once

/**
 * OpenListDownloader.hpp
 *
 * Downloader that drives OpenList offline downloads.
 */

#include "Downloader.hpp"
#include "../openlist/OpenListClient.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace aniflow::core::downloader {

/**
 * Replace characters invalid in file names (< > : " / \ | ? *) with
 * spaces and trim the result
 */
std::string sanitizeFilename(const std::string& name);

/**
 * "Name S01E03" for log lines. Absent values render as Unknown, S?? and E??.
 */
std::string formatAnimeEpisode(const std::optional<std::string>& animeName,
                               const std::optional<int>& season,
                               const std::optional<int>& episode);

/**
 * Whether `name` carries one of the recognised video extensions
 */
bool isVideoFile(const std::string& name);

/**
 * Whether `name` is an in-progress marker left by a download backend
 */
bool isPartialFile(const std::string& name);

/**
 * Adapter settings
 */
struct OpenListDownloaderOptions {
    // Offline download backend (aria2, qBittorrent, PikPak)
    std::string tool{"qBittorrent"};

    // fmt named-argument template for the final file name
    std::string renameFormat{"{anime_name} S{season:02d}E{episode:02d}"};

    std::chrono::milliseconds pollInterval{std::chrono::seconds(5)};

    // Pause between looks for the storage transfer job
    std::chrono::milliseconds transferCheckDelay{std::chrono::seconds(5)};
    int transferCheckAttempts{3};

    // Pause between a rename and the move, for backends with cached listings
    std::chrono::milliseconds renameSettleDelay{std::chrono::seconds(5)};

    // Polls allowed for the downloaded file to show up
    int maxDetectAttempts{10};
};

/**
 * OpenListDownloader - OpenList offline download workflow
 *
 * Pending:      mkdir <savePath>/<task id>, snapshot it, start the job.
 * Downloading:  watch the job and its storage transfer, detect the file.
 * Transferring: rename to the template and move under
 *               <savePath>/<show>/Season <n>.
 * CleaningUp:   remove the temporary directory.
 *
 * One instance serves every task of a DownloadManager; handlers may run
 * concurrently for different tasks.
 */
class OpenListDownloader : public Downloader {
public:
    /**
     * Constructor
     * @param client API client, shared with other users
     * @param options Adapter settings
     * @throws std::invalid_argument on a missing client, base URL, tool or rename format
     */
    OpenListDownloader(std::shared_ptr<openlist::OpenListClient> client,
                       OpenListDownloaderOptions options);

    std::string type() const override { return "openlist"; }

    HandlerResult onPending(DownloadTask& task) override;
    HandlerResult onDownloading(DownloadTask& task) override;
    HandlerResult onTransferring(DownloadTask& task) override;
    HandlerResult onCleaningUp(DownloadTask& task) override;
    void onFailed(DownloadTask& task) override;
    void onCancelled(DownloadTask& task) override;
    void interrupt() override;

    /**
     * Health check plus a check that the configured tool is offered
     */
    bool verifyServer();

    /**
     * Final file name (template rendering, fallback, version suffix)
     * @param resource Resource metadata
     * @param extension Extension including the dot
     */
    std::string buildFinalFilename(const ResourceInfo& resource, const std::string& extension) const;

    /**
     * Largest new video file under the task's temp directory, as a path
     * relative to it. std::nullopt when none is there yet.
     */
    std::optional<std::string> detectDownloadedFile(const DownloadTask& task);

    /**
     * Log a progress sample at info once per 25% bucket of a phase,
     * at debug otherwise.
     * @return true when the sample was logged at info level
     */
    bool logProgress(const DownloadTask& task, const std::string& phase, double progress);

    /**
     * Remove the task's temporary directory
     */
    BestEffort cleanup(const DownloadTask& task);

    const OpenListDownloaderOptions& options() const { return m_options; }

protected:
    // Blocking pause inside a handler, cut short by interrupt()
    virtual void pause(std::chrono::milliseconds delay);

    bool interrupted() const { return m_interrupted.load(); }

private:
    enum class TransferStatus {
        Finished,
        Running,
        Failed,
        Missing
    };

    // Relative paths of every file below `root`, depth first in listing order
    std::optional<std::vector<openlist::FileEntry>> listRecursive(const std::string& root);
    bool walk(const std::string& root, const std::string& prefix,
              std::vector<openlist::FileEntry>& out);

    TransferStatus checkTransfer(const DownloadTask& task, std::string& error);
    HandlerResult detect(DownloadTask& task);
    void forgetProgress(const std::string& taskId);

    std::shared_ptr<openlist::OpenListClient> m_client;
    OpenListDownloaderOptions m_options;

    // Highest progress bucket logged, keyed by "<task id>:<phase>"
    std::unordered_map<std::string, int> m_progressBuckets;
    std::mutex m_progressMutex;

    std::atomic<bool> m_interrupted{false};
    std::mutex m_pauseMutex;
    std::condition_variable m_pauseWakeup;
};

} // namespace aniflow::core::downloader
