// aniflow - HTTP Client
// Blocking HTTP client on top of cpr (libcurl)

#pragma once

#include <string>
#include <map>
#include <memory>
#include <curl/curl.h>

namespace aniflow::utils {

/**
 * @brief HTTP response structure
 *
 * statusCode is 0 when the request never produced an HTTP status
 * (connection refused, DNS failure, timeout). transportError is set in
 * that case and error carries the transport message.
 */
struct HttpResponse {
    int statusCode{0};
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error;
    bool transportError{false};

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    bool isTooManyRequests() const { return statusCode == 429; }
    bool isServerError() const { return statusCode >= 500; }
};

/**
 * @brief HTTP request options
 *
 * A zero timeout means "use the client default".
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    int timeoutSeconds{0};
    int connectTimeoutSeconds{0};
    int readTimeoutSeconds{0};
    bool verifySSL{true};
    std::string userAgent;
    std::string httpProxy;
    std::string httpsProxy;
};

/**
 * @brief Blocking HTTP client
 *
 * Instances are independent and safe to share between threads: every
 * request builds its own cpr session. performRequest() is the single
 * transport seam; tests override it to script responses.
 */
class HttpClient {
public:
    HttpClient();
    explicit HttpClient(const HttpOptions& defaults);
    virtual ~HttpClient();

    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Set default options
    void setDefaultOptions(const HttpOptions& options);

    // Synchronous requests
    HttpResponse get(const std::string& url, const HttpOptions& options = {});
    HttpResponse postJson(const std::string& url, const std::string& json,
                          const HttpOptions& options = {});

protected:
    virtual HttpResponse performRequest(const std::string& method, const std::string& url,
                                        const std::string& body, const HttpOptions& options);

    // Request options layered over the client defaults
    HttpOptions mergeOptions(const HttpOptions& options) const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Global CURL initialization
 */
class CurlGlobalInit {
public:
    static void init();
};

} // namespace aniflow::utils
