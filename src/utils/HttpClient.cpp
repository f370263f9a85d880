/**
 * HttpClient.cpp
 *
 * HTTP client implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"

#include <cpr/cpr.h>
#include <mutex>

namespace aniflow::utils {

namespace {
constexpr int kDefaultTimeoutSeconds = 30;
constexpr const char* kDefaultUserAgent = "aniflow/1.0";
}

// -- CurlGlobalInit --

void CurlGlobalInit::init() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

// -- HttpClient::Impl --

struct HttpClient::Impl {
    HttpOptions defaultOptions;
};

// -- HttpClient --

HttpClient::HttpClient() : m_impl(std::make_unique<Impl>()) {
    CurlGlobalInit::init();
}

HttpClient::HttpClient(const HttpOptions& defaults) : HttpClient() {
    m_impl->defaultOptions = defaults;
}

HttpClient::~HttpClient() = default;

void HttpClient::setDefaultOptions(const HttpOptions& options) {
    m_impl->defaultOptions = options;
}

HttpResponse HttpClient::get(const std::string& url, const HttpOptions& options) {
    return performRequest("GET", url, "", mergeOptions(options));
}

HttpResponse HttpClient::postJson(const std::string& url, const std::string& json, const HttpOptions& options) {
    HttpOptions opts = mergeOptions(options);
    opts.headers["Content-Type"] = "application/json";
    return performRequest("POST", url, json, opts);
}

HttpOptions HttpClient::mergeOptions(const HttpOptions& options) const {
    const HttpOptions& defaults = m_impl->defaultOptions;
    HttpOptions merged = options;

    merged.headers = defaults.headers;
    for (const auto& [key, value] : options.headers) merged.headers[key] = value;

    if (merged.timeoutSeconds <= 0) merged.timeoutSeconds = defaults.timeoutSeconds;
    if (merged.timeoutSeconds <= 0) merged.timeoutSeconds = kDefaultTimeoutSeconds;
    if (merged.connectTimeoutSeconds <= 0) merged.connectTimeoutSeconds = defaults.connectTimeoutSeconds;
    if (merged.readTimeoutSeconds <= 0) merged.readTimeoutSeconds = defaults.readTimeoutSeconds;
    if (merged.userAgent.empty()) merged.userAgent = defaults.userAgent;
    if (merged.userAgent.empty()) merged.userAgent = kDefaultUserAgent;
    if (merged.httpProxy.empty()) merged.httpProxy = defaults.httpProxy;
    if (merged.httpsProxy.empty()) merged.httpsProxy = defaults.httpsProxy;
    merged.verifySSL = options.verifySSL && defaults.verifySSL;
    return merged;
}

HttpResponse HttpClient::performRequest(const std::string& method, const std::string& url,
                                         const std::string& body, const HttpOptions& options) {
    HttpResponse result;

    try {
        cpr::Session session;
        session.SetUrl(cpr::Url{url});

        cpr::Header headers;
        for (const auto& [key, value] : options.headers) headers[key] = value;
        session.SetHeader(headers);
        session.SetUserAgent(cpr::UserAgent{options.userAgent});
        session.SetTimeout(cpr::Timeout{options.timeoutSeconds * 1000});
        if (options.connectTimeoutSeconds > 0) {
            session.SetConnectTimeout(cpr::ConnectTimeout{options.connectTimeoutSeconds * 1000});
        }
        if (options.readTimeoutSeconds > 0) {
            // Abort when the transfer stalls below 1 byte/s for the read window
            session.SetLowSpeed(cpr::LowSpeed{1, options.readTimeoutSeconds});
        }
        session.SetVerifySsl(cpr::VerifySsl{options.verifySSL});

        std::map<std::string, std::string> proxies;
        if (!options.httpProxy.empty()) proxies["http"] = options.httpProxy;
        if (!options.httpsProxy.empty()) proxies["https"] = options.httpsProxy;
        if (!proxies.empty()) session.SetProxies(cpr::Proxies{proxies});

        cpr::Response response;
        if (method == "GET") {
            response = session.Get();
        } else if (method == "POST") {
            session.SetBody(cpr::Body{body});
            response = session.Post();
        } else {
            result.error = "Unsupported HTTP method: " + method;
            result.transportError = true;
            return result;
        }

        result.statusCode = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [key, value] : response.header) result.headers[key] = value;

        if (response.error.code != cpr::ErrorCode::OK) {
            result.transportError = true;
            result.error = response.error.message;
            result.statusCode = 0;
        }
    } catch (const std::exception& e) {
        result.statusCode = 0;
        result.transportError = true;
        result.error = e.what();
    }

    return result;
}

} // namespace aniflow::utils
