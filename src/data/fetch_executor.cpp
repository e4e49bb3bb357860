/**
 * @file fetch_executor.cpp
 * @brief Bounded-retry fetch implementation
 */

#include <web_tiles/data/fetch_executor.h>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace web_tiles {

const char* ToString(FetchOutcomeKind kind) {
    switch (kind) {
        case FetchOutcomeKind::SUCCESS: return "success";
        case FetchOutcomeKind::EMPTY: return "empty";
        case FetchOutcomeKind::NOT_FOUND: return "not-found";
        case FetchOutcomeKind::FAILURE: return "failure";
    }
    return "unknown";
}

FetchExecutor::FetchExecutor(std::shared_ptr<HttpClient> client,
                             std::shared_ptr<ImageDecoder> decoder)
    : client_(std::move(client))
    , decoder_(std::move(decoder)) {

    if (!client_) {
        spdlog::error("FetchExecutor: null http client provided");
        throw std::invalid_argument("HttpClient cannot be null");
    }
    if (!decoder_) {
        spdlog::error("FetchExecutor: null image decoder provided");
        throw std::invalid_argument("ImageDecoder cannot be null");
    }
}

FetchOutcome FetchExecutor::Fetch(const std::string& url,
                                  double attempt_timeout_seconds,
                                  std::uint32_t max_attempts) const {
    if (max_attempts == 0) {
        max_attempts = 1;
    }

    FetchOutcome outcome;

    HttpRequest request;
    request.url = url;
    request.timeout_seconds = attempt_timeout_seconds;
    request.bypass_cache = true;

    for (std::uint32_t attempt = 0; attempt < max_attempts; ++attempt) {
        outcome.attempts = attempt + 1;

        HttpResponse response = client_->Fetch(request);
        outcome.status_code = response.status_code;

        switch (response.status) {
            case HttpStatus::NOT_FOUND:
                outcome.kind = FetchOutcomeKind::NOT_FOUND;
                outcome.error_message = response.error_message;
                spdlog::debug("Not found, giving up: {}", url);
                return outcome;

            case HttpStatus::NO_CONTENT:
                outcome.kind = FetchOutcomeKind::EMPTY;
                outcome.error_message.clear();
                spdlog::debug("No content: {}", url);
                return outcome;

            case HttpStatus::CLIENT_ERROR:
                outcome.kind = FetchOutcomeKind::FAILURE;
                outcome.error_message = response.error_message;
                spdlog::warn("Client error {} for {}, not retrying", response.status_code, url);
                return outcome;

            case HttpStatus::SUCCESS: {
                if (response.body.empty()) {
                    outcome.error_message = "Empty response body";
                    break;
                }
                std::optional<TileImage> image = decoder_->Decode(response.body);
                if (!image || !image->IsValid()) {
                    outcome.error_message = "Failed to decode response body";
                    break;
                }
                outcome.kind = FetchOutcomeKind::SUCCESS;
                outcome.image = std::move(image);
                outcome.data = std::move(response.body);
                outcome.error_message.clear();
                return outcome;
            }

            case HttpStatus::TRANSIENT:
                outcome.error_message = response.error_message.empty()
                    ? "Transient transport failure" : response.error_message;
                break;
        }

        if (attempt + 1 < max_attempts) {
            spdlog::warn("Tile fetch failed, retrying ({}/{}): {} ({})",
                         attempt + 1, max_attempts, url, outcome.error_message);
        }
    }

    outcome.kind = FetchOutcomeKind::FAILURE;
    spdlog::warn("Failed to fetch {} after {} attempts: {}",
                 url, outcome.attempts, outcome.error_message);
    return outcome;
}

} // namespace web_tiles
