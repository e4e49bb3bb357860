/**
 * @file fan_out_coordinator.cpp
 * @brief Fan-out coordinator implementation
 */

#include <web_tiles/data/fan_out_coordinator.h>
#include <web_tiles/constants.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace web_tiles {

namespace {

// Larger waits would overflow the steady_clock duration
double ClampWaitSeconds(double seconds) {
    if (!std::isfinite(seconds)) {
        return seconds > 0.0 ? constants::fetch::MAX_REQUEST_TIMEOUT_SECONDS : 0.0;
    }
    return std::clamp(seconds, 0.0, constants::fetch::MAX_REQUEST_TIMEOUT_SECONDS);
}

} // anonymous namespace

/**
 * @brief Slot array shared between the waiting pipeline and its tasks
 *
 * Owned jointly through shared_ptr so a task finishing after the deadline
 * still writes into live memory; the write is ignored once abandoned is set.
 */
struct FanOutCoordinator::FanOutState {
    explicit FanOutState(std::size_t count) : slots(count), pending(count) {}

    std::mutex mutex;
    std::condition_variable done_cv;
    std::vector<std::optional<TileImage>> slots;
    std::size_t pending;
    bool abandoned = false;

    void Complete(std::size_t index, std::optional<TileImage> image) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --pending;
            if (abandoned) {
                return;
            }
            slots[index] = std::move(image);
        }
        done_cv.notify_all();
    }
};

FanOutCoordinator::FanOutCoordinator(std::shared_ptr<const FetchExecutor> executor,
                                     std::size_t max_concurrent_fetches)
    : executor_(std::move(executor))
    , pool_(max_concurrent_fetches) {

    if (!executor_) {
        spdlog::error("FanOutCoordinator: null executor provided");
        throw std::invalid_argument("FetchExecutor cannot be null");
    }
}

FanOutCoordinator::~FanOutCoordinator() = default;

std::vector<std::optional<TileImage>> FanOutCoordinator::FetchAll(
    const std::vector<std::string>& urls,
    const RetryBudget& budget,
    FanOutReport* report) {

    auto state = std::make_shared<FanOutState>(urls.size());
    const double attempt_timeout = budget.GetAttemptTimeout();
    const std::uint32_t attempts = budget.retry_count;

    for (std::size_t index = 0; index < urls.size(); ++index) {
        pool_.Enqueue([state, executor = executor_, url = urls[index],
                       index, attempt_timeout, attempts]() {
            std::optional<TileImage> image;
            try {
                FetchOutcome outcome = executor->Fetch(url, attempt_timeout, attempts);
                if (outcome.IsSuccess()) {
                    image = std::move(outcome.image);
                } else {
                    spdlog::debug("Layer {} ({}) yielded {}", index, url, ToString(outcome.kind));
                }
            } catch (const std::exception& e) {
                spdlog::error("Layer {} ({}) fetch threw: {}", index, url, e.what());
            }
            state->Complete(index, std::move(image));
        });
    }

    const auto deadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(ClampWaitSeconds(budget.total_timeout_seconds)));

    std::vector<std::optional<TileImage>> results;
    std::size_t abandoned_tasks = 0;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->done_cv.wait_until(lock, deadline, [&state] {
            return state->pending == 0;
        });

        abandoned_tasks = state->pending;
        state->abandoned = true;
        results = std::move(state->slots);
    }

    if (abandoned_tasks > 0) {
        spdlog::warn("Fan-out deadline of {}s passed with {} of {} fetches still running",
                     budget.total_timeout_seconds, abandoned_tasks, urls.size());
    }

    if (report) {
        report->location_count = urls.size();
        report->abandoned_tasks = abandoned_tasks;
        report->filled_slots = 0;
        for (const auto& slot : results) {
            if (slot) {
                ++report->filled_slots;
            }
        }
    }

    return results;
}

} // namespace web_tiles
