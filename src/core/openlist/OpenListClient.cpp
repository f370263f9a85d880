/**
 * OpenListClient.cpp
 *
 * OpenList REST API calls with bounded concurrency and retries.
 */

#include "OpenListClient.hpp"
#include "../Logger.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <thread>

namespace aniflow::core::openlist {

using utils::HttpClient;
using utils::HttpOptions;
using utils::HttpResponse;
using utils::JsonUtils;
using utils::StringUtils;

namespace {

constexpr const char* kUnknownError = "Unknown error";
constexpr const char* kUserAgent = "aniflow/1.0";

bool isTransient(const HttpResponse& response) {
    return response.transportError || response.statusCode == 0 ||
           response.isTooManyRequests() || response.isServerError();
}

} // namespace

OpenListClient::OpenListClient(OpenListClientOptions options, std::shared_ptr<HttpClient> http)
    : m_options(std::move(options))
    , m_http(std::move(http))
    , m_permits(m_options.maxConcurrentRequests) {

    m_options.baseUrl = StringUtils::trimRight(m_options.baseUrl, '/');
    if (m_options.maxRetries < 1) m_options.maxRetries = 1;

    HttpOptions defaults;
    defaults.userAgent = kUserAgent;
    defaults.timeoutSeconds = static_cast<int>(m_options.requestTimeout.count());
    defaults.connectTimeoutSeconds = static_cast<int>(m_options.connectTimeout.count());
    defaults.readTimeoutSeconds = static_cast<int>(m_options.readTimeout.count());
    defaults.httpProxy = m_options.httpProxy;
    defaults.httpsProxy = m_options.httpsProxy;
    if (!m_options.token.empty()) defaults.headers["Authorization"] = m_options.token;

    if (!m_http) m_http = std::make_shared<HttpClient>();
    m_http->setDefaultOptions(defaults);

    Logger::instance().info("OpenListClient initialized with max {} concurrent requests",
                            m_options.maxConcurrentRequests);
}

// -- Transport --

void OpenListClient::backoff(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

std::optional<nlohmann::json> OpenListClient::request(const std::string& method,
                                                      const std::string& endpoint,
                                                      const nlohmann::json& body) {
    PermitPool::Guard permit(m_permits);

    const std::string url = m_options.baseUrl + endpoint;
    std::string lastError;

    for (int attempt = 1; attempt <= m_options.maxRetries; ++attempt) {
        HttpResponse response = method == "GET"
            ? m_http->get(url)
            : m_http->postJson(url, body.is_null() ? "{}" : body.dump());

        if (response.isSuccess()) {
            auto parsed = JsonUtils::parse(response.body);
            if (!parsed) {
                lastError = "malformed JSON body";
                break;
            }
            return parsed;
        }

        lastError = response.transportError || response.statusCode == 0
            ? response.error
            : "HTTP " + std::to_string(response.statusCode);

        if (!isTransient(response)) break;

        if (attempt < m_options.maxRetries) {
            auto delay = m_options.retryBackoff * (1 << (attempt - 1));
            Logger::instance().warn("Request {} {} failed ({}); retrying in {}ms ({}/{})",
                                    method, url, lastError, delay.count(), attempt, m_options.maxRetries);
            backoff(delay);
        }
    }

    Logger::instance().error("Request error to {}: {}", url, lastError);
    return std::nullopt;
}

std::optional<nlohmann::json> OpenListClient::call(const std::string& method,
                                                   const std::string& endpoint,
                                                   const nlohmann::json& body,
                                                   const std::string& what) {
    auto response = request(method, endpoint, body);
    if (response && JsonUtils::getInt(*response, "code", 0) == 200) {
        return response->contains("data") ? (*response)["data"] : nlohmann::json(nullptr);
    }

    auto message = response ? JsonUtils::getString(*response, "message", kUnknownError) : kUnknownError;
    Logger::instance().error("Failed to {}: {}", what, message);
    return std::nullopt;
}

// -- Server --

bool OpenListClient::checkHealth() {
    auto response = request("GET", "/api/public/settings");
    if (response && JsonUtils::getInt(*response, "code", 0) == 200) {
        Logger::instance().debug("OpenList server health check passed");
        return true;
    }
    Logger::instance().error("OpenList server health check failed (url: {})", m_options.baseUrl);
    return false;
}

std::optional<std::vector<std::string>> OpenListClient::getOfflineDownloadTools() {
    auto data = call("GET", "/api/public/offline_download_tools", nullptr, "get offline download tools");
    if (!data) return std::nullopt;

    std::vector<std::string> tools;
    if (data->is_array()) {
        for (const auto& item : *data) {
            if (item.is_string()) {
                tools.push_back(item.get<std::string>());
            } else if (auto name = JsonUtils::getOptionalString(item, "name")) {
                tools.push_back(*name);
            }
        }
    }
    return tools;
}

// -- Offline download --

std::optional<std::vector<OpenListTask>> OpenListClient::addOfflineDownload(
    const std::vector<std::string>& urls, const std::string& path, const std::string& tool) {
    if (!hasToken()) return std::nullopt;

    nlohmann::json payload = {{"urls", urls}, {"path", path}, {"tool", tool}};
    auto data = call("POST", "/api/fs/add_offline_download", payload, "add offline download");
    if (!data) return std::nullopt;

    std::vector<OpenListTask> tasks;
    for (const auto& item : JsonUtils::getArray(*data, "tasks")) {
        tasks.push_back(OpenListTask::fromJson(item));
    }
    Logger::instance().debug("Added offline download tasks for {} url(s) to {}", urls.size(), path);
    return tasks;
}

std::optional<std::vector<OpenListTask>> OpenListClient::fetchTaskList(const std::string& endpoint,
                                                                       const std::string& what) {
    auto data = call("GET", endpoint, nullptr, "fetch " + what);
    if (!data) return std::nullopt;

    std::vector<OpenListTask> tasks;
    if (data->is_array()) {
        for (const auto& item : *data) tasks.push_back(OpenListTask::fromJson(item));
    }
    return tasks;
}

std::optional<std::vector<OpenListTask>> OpenListClient::getOfflineDownloadUndone() {
    return fetchTaskList("/api/task/offline_download/undone", "undone offline download tasks");
}

std::optional<std::vector<OpenListTask>> OpenListClient::getOfflineDownloadDone() {
    return fetchTaskList("/api/task/offline_download/done", "done offline download tasks");
}

std::optional<std::vector<OpenListTask>> OpenListClient::getTransferUndone() {
    return fetchTaskList("/api/task/offline_download_transfer/undone", "undone transfer tasks");
}

std::optional<std::vector<OpenListTask>> OpenListClient::getTransferDone() {
    return fetchTaskList("/api/task/offline_download_transfer/done", "done transfer tasks");
}

// -- File system --

std::optional<std::vector<FileEntry>> OpenListClient::listFiles(const std::string& path) {
    if (!hasToken()) return std::nullopt;

    nlohmann::json payload = {
        {"path", path},
        {"password", ""},
        {"page", 1},
        {"per_page", 0},
        {"refresh", true}
    };

    auto data = call("POST", "/api/fs/list", payload, "list " + path);
    if (!data) return std::nullopt;

    std::vector<FileEntry> entries;
    for (const auto& item : JsonUtils::getArray(*data, "content")) {
        entries.push_back(FileEntry::fromJson(item));
    }
    return entries;
}

bool OpenListClient::renameFile(const std::string& fullPath, const std::string& newName) {
    if (!hasToken()) return false;

    if (!call("POST", "/api/fs/rename", {{"path", fullPath}, {"name", newName}}, "rename file")) {
        return false;
    }
    Logger::instance().debug("Renamed {} to {}", fullPath, newName);
    return true;
}

bool OpenListClient::mkdir(const std::string& path) {
    if (!hasToken()) return false;

    if (!call("POST", "/api/fs/mkdir", {{"path", path}}, "create directory")) {
        return false;
    }
    Logger::instance().debug("Created directory: {}", path);
    return true;
}

bool OpenListClient::moveFile(const std::string& srcDir, const std::string& dstDir,
                              const std::vector<std::string>& names) {
    if (!hasToken()) return false;

    nlohmann::json payload = {{"src_dir", srcDir}, {"dst_dir", dstDir}, {"names", names}};
    if (!call("POST", "/api/fs/move", payload, "move files")) {
        return false;
    }
    Logger::instance().debug("Moved {} from {} to {}", StringUtils::join(names, ", "), srcDir, dstDir);
    return true;
}

bool OpenListClient::removePath(const std::string& dir, const std::vector<std::string>& names) {
    if (!hasToken()) return false;

    nlohmann::json payload = {{"dir", dir}, {"names", names}};
    if (!call("POST", "/api/fs/remove", payload, "remove path")) {
        return false;
    }
    Logger::instance().debug("Removed {} from {}", StringUtils::join(names, ", "), dir);
    return true;
}

} // namespace aniflow::core::openlist
