#pragma once

/**
 * @file http_client.h
 * @brief Transport collaborator for tile fetches
 *
 * A synchronous "fetch bytes at URL with timeout" operation whose result
 * carries a status classification the fetch pipeline can act on, plus a
 * libcurl implementation.
 */

#include <web_tiles/constants.h>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace web_tiles {

/**
 * @brief Classification of a transport result
 */
enum class HttpStatus {
    SUCCESS,       ///< 2xx with a body
    NO_CONTENT,    ///< 204: the tile intentionally has no data
    NOT_FOUND,     ///< 404: terminal, never retried
    CLIENT_ERROR,  ///< Other 4xx: the request itself is wrong
    TRANSIENT      ///< 5xx, 408, 429, timeouts, connection failures
};

/**
 * @brief Get a printable name for a status
 */
const char* ToString(HttpStatus status);

/**
 * @brief Classify an HTTP response code
 *
 * @param status_code HTTP status code (0 when no response was received)
 * @return HttpStatus Classification
 */
HttpStatus ClassifyHttpStatus(long status_code);

/**
 * @brief One transport request
 */
struct HttpRequest {
    /** Absolute URL */
    std::string url;

    /** Hard timeout for this single attempt in seconds */
    double timeout_seconds = constants::fetch::DEFAULT_REQUEST_TIMEOUT_SECONDS;

    /** Ask every cache between us and the origin to revalidate */
    bool bypass_cache = true;
};

/**
 * @brief Transport result
 */
struct HttpResponse {
    /** Classification */
    HttpStatus status = HttpStatus::TRANSIENT;

    /** HTTP status code (0 if no response arrived) */
    std::uint32_t status_code = 0;

    /** Response body */
    std::vector<std::uint8_t> body;

    /** Error message (if failed) */
    std::string error_message;
};

/**
 * @brief HTTP client configuration
 */
struct HttpClientConfig {
    /** User agent string */
    std::string user_agent = constants::fetch::DEFAULT_USER_AGENT;

    /** Follow redirects */
    bool follow_redirects = true;

    /** Verify SSL certificates */
    bool verify_ssl = true;

    /** Proxy URL (empty for none) */
    std::string proxy_url;

    /** Extra headers sent with every request */
    std::vector<std::pair<std::string, std::string>> custom_headers;
};

/**
 * @brief Transport interface
 *
 * Fetch() is called concurrently from many worker threads and must be
 * thread-safe. It must not throw for network conditions; those are
 * reported through HttpResponse.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Fetch bytes at a URL
     *
     * @param request URL, timeout and cache policy
     * @return HttpResponse Classified result
     */
    virtual HttpResponse Fetch(const HttpRequest& request) = 0;
};

/**
 * @brief libcurl-backed HTTP client (one easy handle per request)
 */
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const HttpClientConfig& config = {});
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse Fetch(const HttpRequest& request) override;

    HttpClientConfig GetConfiguration() const { return config_; }

private:
    HttpClientConfig config_;
};

/**
 * @brief Factory for the libcurl client
 */
std::shared_ptr<HttpClient> CreateCurlHttpClient(const HttpClientConfig& config = {});

} // namespace web_tiles
