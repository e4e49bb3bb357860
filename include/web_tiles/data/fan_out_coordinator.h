#pragma once

/**
 * @file fan_out_coordinator.h
 * @brief Concurrent fetch of every layer of a multi-location tile
 *
 * One task per location runs its own FetchExecutor retry loop. Results land
 * in an index-addressed slot array so the output order is the resolver's
 * order, whatever order the fetches finish in. The coordinator waits for
 * all tasks or for the tile's whole timeout, whichever comes first; tasks
 * still running at the deadline are abandoned and their late results are
 * dropped.
 */

#include <web_tiles/data/fetch_executor.h>
#include <web_tiles/util/thread_pool.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace web_tiles {

/**
 * @brief Per-call statistics of a fan-out
 */
struct FanOutReport {
    /** Locations requested */
    std::size_t location_count = 0;

    /** Slots holding a decoded image */
    std::size_t filled_slots = 0;

    /** Tasks still running when the deadline passed */
    std::size_t abandoned_tasks = 0;
};

/**
 * @brief Coordinates concurrent per-location fetches for one tile
 *
 * Thread Safety: FetchAll() may be called from many tile pipelines at once;
 * each call gets its own slot array.
 */
class FanOutCoordinator {
public:
    /**
     * @brief Constructor
     *
     * @param executor Shared fetch executor (must not be null)
     * @param max_concurrent_fetches Worker threads available to fan-out tasks
     * @throws std::invalid_argument on null executor
     */
    FanOutCoordinator(std::shared_ptr<const FetchExecutor> executor,
                      std::size_t max_concurrent_fetches);

    ~FanOutCoordinator();

    // Non-copyable
    FanOutCoordinator(const FanOutCoordinator&) = delete;
    FanOutCoordinator& operator=(const FanOutCoordinator&) = delete;

    /**
     * @brief Fetch all locations concurrently
     *
     * @param urls Locations in resolver order
     * @param budget Retry count and whole-tile timeout; the wait deadline is
     *        budget.total_timeout_seconds
     * @param report Optional statistics output
     * @return One slot per URL, std::nullopt where the fetch did not produce
     *         an image in time
     */
    std::vector<std::optional<TileImage>> FetchAll(const std::vector<std::string>& urls,
                                                   const RetryBudget& budget,
                                                   FanOutReport* report = nullptr);

private:
    struct FanOutState;

    std::shared_ptr<const FetchExecutor> executor_;
    ThreadPool pool_;
};

} // namespace web_tiles
