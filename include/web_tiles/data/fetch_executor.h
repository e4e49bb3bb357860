#pragma once

/**
 * @file fetch_executor.h
 * @brief Bounded-retry fetch of a single source location
 */

#include <web_tiles/constants.h>
#include <web_tiles/data/http_client.h>
#include <web_tiles/image/image_decoder.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace web_tiles {

/**
 * @brief Retry configuration for one tile
 *
 * Each attempt gets total_timeout_seconds / retry_count.
 */
struct RetryBudget {
    /** Attempts per location, at least 1 */
    std::uint32_t retry_count = constants::fetch::DEFAULT_RETRY_COUNT;

    /** Whole-tile budget in seconds, greater than 0 */
    double total_timeout_seconds = constants::fetch::DEFAULT_REQUEST_TIMEOUT_SECONDS;

    /**
     * @brief Get the timeout slice for a single attempt
     */
    double GetAttemptTimeout() const {
        return total_timeout_seconds / static_cast<double>(retry_count == 0 ? 1 : retry_count);
    }
};

/**
 * @brief Kind of per-location fetch outcome
 */
enum class FetchOutcomeKind {
    SUCCESS,    ///< Bytes fetched and decoded
    EMPTY,      ///< Explicit no-content signal (204)
    NOT_FOUND,  ///< 404, terminal
    FAILURE     ///< Attempts exhausted, or a non-retryable client error
};

const char* ToString(FetchOutcomeKind kind);

/**
 * @brief Result of fetching one location
 */
struct FetchOutcome {
    /** Outcome kind */
    FetchOutcomeKind kind = FetchOutcomeKind::FAILURE;

    /** Raw bytes of the successful response */
    std::vector<std::uint8_t> data;

    /** Decoded image (set only on SUCCESS) */
    std::optional<TileImage> image;

    /** HTTP status code of the last attempt */
    std::uint32_t status_code = 0;

    /** Attempts performed */
    std::uint32_t attempts = 0;

    /** Last observed error (if not SUCCESS) */
    std::string error_message;

    bool IsSuccess() const {
        return kind == FetchOutcomeKind::SUCCESS && image.has_value();
    }
};

/**
 * @brief Runs the retry loop for a single URL
 *
 * Retries only transient failures and responses without usable data.
 * NOT_FOUND, NO_CONTENT and other client errors end the loop at once.
 * Every attempt bypasses HTTP-layer caches.
 *
 * Thread Safety: Fetch() is const and safe to call concurrently as long as
 * the HttpClient and ImageDecoder are.
 */
class FetchExecutor {
public:
    /**
     * @brief Constructor
     *
     * @param client Transport (must not be null)
     * @param decoder Image codec (must not be null)
     * @throws std::invalid_argument on null collaborators
     */
    FetchExecutor(std::shared_ptr<HttpClient> client,
                  std::shared_ptr<ImageDecoder> decoder);

    /**
     * @brief Fetch and decode one location
     *
     * @param url Source location
     * @param attempt_timeout_seconds Hard timeout of each attempt
     * @param max_attempts Attempt limit (0 is treated as 1)
     * @return FetchOutcome Typed result, never throws for network errors
     */
    FetchOutcome Fetch(const std::string& url,
                       double attempt_timeout_seconds,
                       std::uint32_t max_attempts) const;

    /**
     * @brief Fetch using a retry budget
     */
    FetchOutcome Fetch(const std::string& url, const RetryBudget& budget) const {
        return Fetch(url, budget.GetAttemptTimeout(), budget.retry_count);
    }

private:
    std::shared_ptr<HttpClient> client_;
    std::shared_ptr<ImageDecoder> decoder_;
};

} // namespace web_tiles
