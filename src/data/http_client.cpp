/**
 * @file http_client.cpp
 * @brief libcurl transport implementation
 */

#include <web_tiles/data/http_client.h>
#include <web_tiles/constants.h>
#include <algorithm>
#include <cmath>
#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace web_tiles {

namespace {

/**
 * @brief libcurl write callback
 */
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::vector<uint8_t>* userp) {
    size_t total_size = size * nmemb;
    userp->insert(userp->end(), static_cast<uint8_t*>(contents),
                  static_cast<uint8_t*>(contents) + total_size);
    return total_size;
}

struct CurlEasyDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

HttpStatus ClassifyCurlError(CURLcode code) {
    switch (code) {
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return HttpStatus::NOT_FOUND;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return HttpStatus::CLIENT_ERROR;
        default:
            return HttpStatus::TRANSIENT;
    }
}

} // anonymous namespace

const char* ToString(HttpStatus status) {
    switch (status) {
        case HttpStatus::SUCCESS: return "success";
        case HttpStatus::NO_CONTENT: return "no-content";
        case HttpStatus::NOT_FOUND: return "not-found";
        case HttpStatus::CLIENT_ERROR: return "client-error";
        case HttpStatus::TRANSIENT: return "transient";
    }
    return "unknown";
}

HttpStatus ClassifyHttpStatus(long status_code) {
    if (status_code == constants::http::STATUS_NO_CONTENT) {
        return HttpStatus::NO_CONTENT;
    }
    if (status_code >= 200 && status_code < 300) {
        return HttpStatus::SUCCESS;
    }
    if (status_code == constants::http::STATUS_NOT_FOUND) {
        return HttpStatus::NOT_FOUND;
    }
    if (status_code == constants::http::STATUS_REQUEST_TIMEOUT ||
        status_code == constants::http::STATUS_TOO_MANY_REQUESTS) {
        return HttpStatus::TRANSIENT;
    }
    if (status_code >= constants::http::STATUS_BAD_REQUEST &&
        status_code < constants::http::STATUS_SERVER_ERROR) {
        return HttpStatus::CLIENT_ERROR;
    }
    return HttpStatus::TRANSIENT;
}

CurlHttpClient::CurlHttpClient(const HttpClientConfig& config) : config_(config) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::Fetch(const HttpRequest& request) {
    HttpResponse response;

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        spdlog::error("Failed to initialize curl handle");
        response.error_message = "curl_easy_init failed";
        return response;
    }

    double timeout_seconds = request.timeout_seconds;
    if (!std::isfinite(timeout_seconds) ||
        timeout_seconds > constants::fetch::MAX_REQUEST_TIMEOUT_SECONDS) {
        timeout_seconds = constants::fetch::MAX_REQUEST_TIMEOUT_SECONDS;
    }
    const long timeout_ms = std::max(1L, std::lround(timeout_seconds * 1000.0));

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, config_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // Prevent signals for thread safety
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");

    CurlHeaders headers;
    curl_slist* header_list = nullptr;
    if (request.bypass_cache) {
        header_list = curl_slist_append(header_list, "Cache-Control: no-cache");
        header_list = curl_slist_append(header_list, "Pragma: no-cache");
    }
    for (const auto& [name, value] : config_.custom_headers) {
        const std::string header_str = name + ": " + value;
        header_list = curl_slist_append(header_list, header_str.c_str());
    }
    headers.reset(header_list);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    if (!config_.proxy_url.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_PROXY, config_.proxy_url.c_str());
    }

    const CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        response.status = ClassifyCurlError(res);
        response.error_message = curl_easy_strerror(res);
        response.body.clear();
        spdlog::debug("Curl error: {} for URL: {}", response.error_message, request.url);
        return response;
    }

    long response_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = static_cast<std::uint32_t>(response_code);
    response.status = ClassifyHttpStatus(response_code);

    if (response.status != HttpStatus::SUCCESS) {
        response.error_message = "HTTP " + std::to_string(response_code);
        spdlog::debug("HTTP error {} for URL: {}", response_code, request.url);
    }

    return response;
}

std::shared_ptr<HttpClient> CreateCurlHttpClient(const HttpClientConfig& config) {
    return std::make_shared<CurlHttpClient>(config);
}

} // namespace web_tiles
