#pragma once

/**
 * OpenListClient.hpp
 *
 * HTTP client for the OpenList offline-download and file-system API.
 */

#include "OpenListModels.hpp"
#include "../PermitPool.hpp"
#include "../../utils/HttpClient.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace aniflow::core::openlist {

/**
 * Client settings
 */
struct OpenListClientOptions {
    std::string baseUrl;
    std::string token;
    size_t maxConcurrentRequests{4};
    std::chrono::seconds requestTimeout{30};
    std::chrono::seconds connectTimeout{30};
    std::chrono::seconds readTimeout{30};
    // Total attempts per call, including the first one
    int maxRetries{3};
    std::chrono::milliseconds retryBackoff{800};
    std::string httpProxy;
    std::string httpsProxy;
};

/**
 * OpenListClient - OpenList REST API wrapper
 *
 * Every call goes through a PermitPool owned by the instance. Transport
 * errors, HTTP 429 and HTTP 5xx are retried with exponential backoff;
 * other failures are not. Operations never throw: they return
 * std::nullopt or false and log the reason.
 *
 * Calls that need a token return the failure value immediately when no
 * token is configured.
 */
class OpenListClient {
public:
    /**
     * Constructor
     * @param options Client settings
     * @param http Transport, a default cpr client when null
     */
    explicit OpenListClient(OpenListClientOptions options,
                            std::shared_ptr<utils::HttpClient> http = nullptr);
    virtual ~OpenListClient() = default;

    OpenListClient(const OpenListClient&) = delete;
    OpenListClient& operator=(const OpenListClient&) = delete;

    const std::string& baseUrl() const { return m_options.baseUrl; }
    bool hasToken() const { return !m_options.token.empty(); }

    /**
     * Reachability check against the public settings endpoint
     */
    virtual bool checkHealth();

    /**
     * Names of the offline download tools the server offers
     */
    virtual std::optional<std::vector<std::string>> getOfflineDownloadTools();

    /**
     * Start offline downloads of `urls` into the remote directory `path`
     * @return The created remote jobs
     */
    virtual std::optional<std::vector<OpenListTask>> addOfflineDownload(
        const std::vector<std::string>& urls, const std::string& path, const std::string& tool);

    // Offline download jobs
    virtual std::optional<std::vector<OpenListTask>> getOfflineDownloadUndone();
    virtual std::optional<std::vector<OpenListTask>> getOfflineDownloadDone();

    // Storage transfer jobs that follow a finished offline download
    virtual std::optional<std::vector<OpenListTask>> getTransferUndone();
    virtual std::optional<std::vector<OpenListTask>> getTransferDone();

    // File system
    virtual std::optional<std::vector<FileEntry>> listFiles(const std::string& path);
    virtual bool renameFile(const std::string& fullPath, const std::string& newName);
    virtual bool mkdir(const std::string& path);
    virtual bool moveFile(const std::string& srcDir, const std::string& dstDir,
                          const std::vector<std::string>& names);
    virtual bool removePath(const std::string& dir, const std::vector<std::string>& names);

protected:
    /**
     * One API call with the retry policy applied
     * @return Decoded response body, std::nullopt on any failure
     */
    std::optional<nlohmann::json> request(const std::string& method, const std::string& endpoint,
                                          const nlohmann::json& body = nullptr);

    // Pause between attempts
    virtual void backoff(std::chrono::milliseconds delay);

private:
    std::optional<std::vector<OpenListTask>> fetchTaskList(const std::string& endpoint,
                                                           const std::string& what);
    // `data` of a successful envelope, std::nullopt otherwise
    std::optional<nlohmann::json> call(const std::string& method, const std::string& endpoint,
                                       const nlohmann::json& body, const std::string& what);

    OpenListClientOptions m_options;
    std::shared_ptr<utils::HttpClient> m_http;
    PermitPool m_permits;
};

} // namespace aniflow::core::openlist
