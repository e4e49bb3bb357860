#pragma once

/**
 * @file web_tile_source.h
 * @brief Web tile source: resolve, fetch, composite and cache map tiles
 *
 * A WebTileSource turns a tile address into a decoded image. Specializations
 * only decide which URLs make up a tile; the base class owns the pipeline:
 * projection check, cache lookup, lifecycle notifications, bounded-retry
 * fetching, concurrent multi-layer fetching, compositing and cache store.
 */

#include <web_tiles/constants.h>
#include <web_tiles/data/fetch_executor.h>
#include <web_tiles/data/http_client.h>
#include <web_tiles/data/tile_cache.h>
#include <web_tiles/events/notification_bus.h>
#include <web_tiles/image/image_decoder.h>
#include <web_tiles/image/tile_image.h>
#include <web_tiles/math/tile_mathematics.h>
#include <web_tiles/source/default_image_registry.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace web_tiles {

class FanOutCoordinator;
class ThreadPool;

/**
 * @brief Raised when a source that never specialized URL resolution is used
 */
class AbstractMethodError : public std::logic_error {
public:
    explicit AbstractMethodError(const std::string& method)
        : std::logic_error(method + " must be overridden by a concrete tile source") {}
};

/**
 * @brief Tile source configuration
 */
struct TileSourceConfig {
    /** Human-readable source name */
    std::string name;

    /** Cache namespace for this source (falls back to name when empty) */
    std::string cache_key;

    /** Attribution text required by the tile server */
    std::string attribution;

    /** Attempts per location, must be >= 1 */
    std::uint32_t retry_count = constants::fetch::DEFAULT_RETRY_COUNT;

    /** Whole-tile timeout; each attempt gets request_timeout_seconds / retry_count */
    double request_timeout_seconds = constants::fetch::DEFAULT_REQUEST_TIMEOUT_SECONDS;

    /** Read and write the tile cache */
    bool cacheable = true;

    /** Hidden sources produce no images */
    bool hidden = false;

    std::int32_t min_zoom = constants::tiles::DEFAULT_MIN_ZOOM;
    std::int32_t max_zoom = constants::tiles::DEFAULT_MAX_ZOOM;

    /** Threads serving FetchImageAsync() */
    std::size_t worker_threads = constants::fetch::DEFAULT_WORKER_THREADS;

    /** Threads serving multi-location fetches */
    std::size_t max_concurrent_fetches = constants::fetch::DEFAULT_MAX_CONCURRENT_FETCHES;
};

/**
 * @brief Outcome of one FetchImage() call
 */
enum class TileFetchStatus {
    LOADED,         ///< Fetched (and composited) from the network
    CACHED,         ///< Served from the tile cache
    DEFAULT_IMAGE,  ///< Server reported no content, zoom default substituted
    NOT_AVAILABLE,  ///< No image could be produced
    NO_SUCH_TILE,   ///< Tile is outside the projection
    HIDDEN          ///< Source is hidden
};

const char* ToString(TileFetchStatus status);

/**
 * @brief Tile fetch result
 */
struct TileFetchResult {
    TileFetchStatus status = TileFetchStatus::NOT_AVAILABLE;

    /** Image, present for LOADED, CACHED and DEFAULT_IMAGE */
    std::optional<TileImage> image;

    /** Normalized tile coordinates */
    TileCoordinates coordinates;

    /** Number of locations the resolver returned */
    std::uint32_t location_count = 0;

    /** Wall time spent in the pipeline */
    std::uint64_t load_time_ms = 0;

    bool HasImage() const { return image.has_value(); }
};

/**
 * @brief Tile source statistics
 */
struct TileSourceStats {
    std::uint64_t total_requests = 0;
    std::uint64_t cache_hits = 0;
    std::uint64_t network_fetches = 0;
    std::uint64_t loaded = 0;
    std::uint64_t default_images = 0;
    std::uint64_t failures = 0;
    std::uint64_t fan_outs = 0;
};

/**
 * @brief Completion callback for asynchronous fetches
 */
using TileFetchCallback = std::function<void(const TileFetchResult&)>;

/**
 * @brief Base web tile source
 *
 * Subclasses override GetURLForTile() for single-location tiles, or
 * GetURLsForTile() for layered tiles (index 0 is the bottom layer).
 *
 * Thread Safety: FetchImage() may run concurrently for any tiles. Settings
 * may change while fetches are in flight; each fetch reads them once.
 */
class WebTileSource {
public:
    /**
     * @brief Constructor
     *
     * @param config Source configuration
     * @param http_client Transport (must not be null)
     * @param decoder Image codec (must not be null)
     * @param notification_bus Lifecycle event sink (null drops events)
     * @param projection Tile projection (null selects Mercator over the
     *        configured zoom range)
     * @throws std::invalid_argument on null transport or decoder, or invalid
     *         retry/timeout settings
     */
    WebTileSource(TileSourceConfig config,
                  std::shared_ptr<HttpClient> http_client,
                  std::shared_ptr<ImageDecoder> decoder,
                  std::shared_ptr<NotificationBus> notification_bus = nullptr,
                  std::shared_ptr<TileProjection> projection = nullptr);

    virtual ~WebTileSource();

    // Non-copyable
    WebTileSource(const WebTileSource&) = delete;
    WebTileSource& operator=(const WebTileSource&) = delete;

    /**
     * @brief Fetch the image of a tile
     *
     * Never reports transport errors; every failure maps to a status.
     *
     * @param tile Tile to fetch (normalized internally)
     * @param cache Cache to read and write, may be null
     * @return TileFetchResult Outcome and image
     * @throws AbstractMethodError if URL resolution was never specialized
     */
    TileFetchResult FetchImage(const TileCoordinates& tile, TileCache* cache);

    /**
     * @brief Fetch the image of a tile on the source's worker pool
     *
     * The callback, if any, runs on the worker thread before the future
     * becomes ready.
     */
    std::future<TileFetchResult> FetchImageAsync(const TileCoordinates& tile,
                                                 TileCache* cache,
                                                 TileFetchCallback callback = nullptr);

    /**
     * @brief Look up a tile in the cache without any network activity
     *
     * @return std::nullopt if hidden, not cacheable, nonexistent or missing
     */
    std::optional<TileImage> GetCachedImage(const TileCoordinates& tile, TileCache& cache) const;

    /**
     * @brief Locations making up a tile, bottom layer first
     *
     * Default implementation returns the single GetURLForTile() location.
     */
    virtual std::vector<std::string> GetURLsForTile(const TileCoordinates& tile) const;

    /**
     * @brief Single location of a tile
     *
     * @throws AbstractMethodError unless overridden
     */
    virtual std::string GetURLForTile(const TileCoordinates& tile) const;

    virtual std::string GetName() const { return config_.name; }
    virtual std::string GetAttribution() const { return config_.attribution; }

    const std::string& GetCacheKey() const { return config_.cache_key; }

    // Default images
    bool AddDefaultImage(std::uint32_t zoom, TileImage image);
    std::optional<TileImage> GetDefaultImage(std::uint32_t zoom) const;

    // Settings
    void SetRetryCount(std::uint32_t retry_count);
    std::uint32_t GetRetryCount() const { return retry_count_.load(); }

    void SetRequestTimeoutSeconds(double seconds);
    double GetRequestTimeoutSeconds() const { return request_timeout_seconds_.load(); }

    void SetCacheable(bool cacheable) { cacheable_.store(cacheable); }
    bool IsCacheable() const { return cacheable_.load(); }

    void SetHidden(bool hidden) { hidden_.store(hidden); }
    bool IsHidden() const { return hidden_.load(); }

    std::int32_t GetMinZoom() const { return config_.min_zoom; }
    std::int32_t GetMaxZoom() const { return config_.max_zoom; }

    TileSourceStats GetStatistics() const;

    TileSourceConfig GetConfiguration() const;

protected:
    /**
     * @brief Finish queued asynchronous fetches and stop the worker pool
     *
     * Subclass destructors call this so no queued fetch reaches a
     * partially destroyed object through a virtual call.
     */
    void StopWorkers();

private:
    void Publish(TileEvent event, std::uint64_t tile_key) const;
    std::optional<TileImage> FetchSingle(const std::string& url,
                                         const TileCoordinates& tile,
                                         const RetryBudget& budget,
                                         TileFetchStatus& status);
    std::optional<TileImage> FetchLayers(const std::vector<std::string>& urls,
                                         const TileCoordinates& tile,
                                         const RetryBudget& budget);

    TileSourceConfig config_;

    std::atomic<std::uint32_t> retry_count_;
    std::atomic<double> request_timeout_seconds_;
    std::atomic<bool> cacheable_;
    std::atomic<bool> hidden_;

    std::shared_ptr<NotificationBus> notification_bus_;
    std::shared_ptr<TileProjection> projection_;
    std::shared_ptr<const FetchExecutor> executor_;

    DefaultImageRegistry default_images_;

    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> network_fetches_{0};
    std::atomic<std::uint64_t> loaded_{0};
    std::atomic<std::uint64_t> default_images_served_{0};
    std::atomic<std::uint64_t> failures_{0};
    std::atomic<std::uint64_t> fan_outs_{0};

    std::unique_ptr<FanOutCoordinator> fan_out_;

    // Destroyed first: queued tasks reference this object
    std::mutex workers_mutex_;
    std::unique_ptr<ThreadPool> worker_pool_;
};

} // namespace web_tiles
