/**
 * @file web_tile_source.cpp
 * @brief Web tile source pipeline implementation
 */

#include <web_tiles/source/web_tile_source.h>
#include <web_tiles/data/fan_out_coordinator.h>
#include <web_tiles/image/image_compositor.h>
#include <web_tiles/util/thread_pool.h>
#include <chrono>
#include <cmath>
#include <spdlog/spdlog.h>

namespace web_tiles {

namespace {

void ValidateRetryCount(std::uint32_t retry_count) {
    if (retry_count == 0) {
        throw std::invalid_argument("retry count must be at least 1");
    }
}

void ValidateRequestTimeout(double seconds) {
    if (!(seconds > 0.0)) {
        throw std::invalid_argument("request timeout must be positive");
    }
    if (!std::isfinite(seconds) || seconds > constants::fetch::MAX_REQUEST_TIMEOUT_SECONDS) {
        throw std::invalid_argument("request timeout must not exceed " +
                                    std::to_string(constants::fetch::MAX_REQUEST_TIMEOUT_SECONDS) +
                                    " seconds");
    }
}

std::shared_ptr<const FetchExecutor> MakeExecutor(std::shared_ptr<HttpClient> http_client,
                                                  std::shared_ptr<ImageDecoder> decoder) {
    if (!http_client) {
        spdlog::error("WebTileSource: null http client provided");
        throw std::invalid_argument("http_client must not be null");
    }
    if (!decoder) {
        spdlog::error("WebTileSource: null image decoder provided");
        throw std::invalid_argument("decoder must not be null");
    }
    return std::make_shared<const FetchExecutor>(std::move(http_client), std::move(decoder));
}

std::uint64_t ElapsedMilliseconds(std::chrono::steady_clock::time_point start_time) {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count());
}

} // anonymous namespace

const char* ToString(TileFetchStatus status) {
    switch (status) {
        case TileFetchStatus::LOADED:
            return "Loaded";
        case TileFetchStatus::CACHED:
            return "Cached";
        case TileFetchStatus::DEFAULT_IMAGE:
            return "DefaultImage";
        case TileFetchStatus::NOT_AVAILABLE:
            return "NotAvailable";
        case TileFetchStatus::NO_SUCH_TILE:
            return "NoSuchTile";
        case TileFetchStatus::HIDDEN:
            return "Hidden";
    }
    return "Unknown";
}

WebTileSource::WebTileSource(TileSourceConfig config,
                             std::shared_ptr<HttpClient> http_client,
                             std::shared_ptr<ImageDecoder> decoder,
                             std::shared_ptr<NotificationBus> notification_bus,
                             std::shared_ptr<TileProjection> projection)
    : config_(std::move(config)),
      retry_count_(config_.retry_count),
      request_timeout_seconds_(config_.request_timeout_seconds),
      cacheable_(config_.cacheable),
      hidden_(config_.hidden),
      notification_bus_(std::move(notification_bus)),
      projection_(std::move(projection)),
      executor_(MakeExecutor(std::move(http_client), std::move(decoder))) {
    ValidateRetryCount(config_.retry_count);
    ValidateRequestTimeout(config_.request_timeout_seconds);

    if (config_.cache_key.empty()) {
        config_.cache_key = config_.name;
    }
    if (!projection_) {
        projection_ = CreateMercatorProjection(config_.min_zoom, config_.max_zoom);
    }

    fan_out_ = std::make_unique<FanOutCoordinator>(executor_, config_.max_concurrent_fetches);
    worker_pool_ = std::make_unique<ThreadPool>(config_.worker_threads);

    spdlog::info("Tile source '{}' created (zoom {}-{}, {} retries, {}s timeout)",
                 config_.name, config_.min_zoom, config_.max_zoom,
                 config_.retry_count, config_.request_timeout_seconds);
}

WebTileSource::~WebTileSource() {
    StopWorkers();
}

void WebTileSource::StopWorkers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    worker_pool_.reset();
}

TileFetchResult WebTileSource::FetchImage(const TileCoordinates& tile, TileCache* cache) {
    const auto start_time = std::chrono::steady_clock::now();
    ++total_requests_;

    TileFetchResult result;
    result.coordinates = tile;

    if (hidden_.load()) {
        result.status = TileFetchStatus::HIDDEN;
        return result;
    }

    const TileCoordinates normalized = projection_->Normalize(tile);
    result.coordinates = normalized;

    if (!projection_->TileExists(normalized)) {
        spdlog::trace("Tile {} does not exist in source '{}'", normalized.GetKey(), config_.name);
        result.status = TileFetchStatus::NO_SUCH_TILE;
        return result;
    }

    // Read every setting once so a concurrent change cannot split this fetch
    const bool cacheable = cacheable_.load();
    const RetryBudget budget{retry_count_.load(), request_timeout_seconds_.load()};

    if (cacheable && cache != nullptr) {
        if (auto cached = cache->Get(normalized, config_.cache_key)) {
            ++cache_hits_;
            result.status = TileFetchStatus::CACHED;
            result.image = std::move(cached);
            return result;
        }
    }

    const std::uint64_t tile_key = GetTileKey(normalized);
    Publish(TileEvent::REQUESTED, tile_key);

    const std::vector<std::string> urls = GetURLsForTile(normalized);
    result.location_count = static_cast<std::uint32_t>(urls.size());

    if (urls.empty()) {
        spdlog::debug("No locations for tile {} in source '{}'", normalized.GetKey(), config_.name);
        result.status = TileFetchStatus::NOT_AVAILABLE;
        result.load_time_ms = ElapsedMilliseconds(start_time);
        return result;
    }

    TileFetchStatus status = TileFetchStatus::NOT_AVAILABLE;
    std::optional<TileImage> image;

    if (urls.size() == 1) {
        image = FetchSingle(urls.front(), normalized, budget, status);
    } else {
        image = FetchLayers(urls, normalized, budget);
        if (image) {
            status = TileFetchStatus::LOADED;
        }
    }

    if (image && cacheable && cache != nullptr) {
        cache->Put(normalized, config_.cache_key, *image);
    }

    switch (status) {
        case TileFetchStatus::LOADED:
            ++loaded_;
            break;
        case TileFetchStatus::DEFAULT_IMAGE:
            ++default_images_served_;
            break;
        default:
            ++failures_;
            spdlog::warn("No image for tile {} from source '{}'", normalized.GetKey(), config_.name);
            break;
    }

    result.status = status;
    result.image = std::move(image);

    Publish(TileEvent::RETRIEVED, tile_key);

    result.load_time_ms = ElapsedMilliseconds(start_time);
    return result;
}

std::optional<TileImage> WebTileSource::FetchSingle(const std::string& url,
                                                    const TileCoordinates& tile,
                                                    const RetryBudget& budget,
                                                    TileFetchStatus& status) {
    ++network_fetches_;

    FetchOutcome outcome;
    try {
        outcome = executor_->Fetch(url, budget);
    } catch (const std::exception& e) {
        spdlog::error("Fetch of tile {} from {} raised: {}", tile.GetKey(), url, e.what());
        status = TileFetchStatus::NOT_AVAILABLE;
        return std::nullopt;
    }

    switch (outcome.kind) {
        case FetchOutcomeKind::SUCCESS:
            status = TileFetchStatus::LOADED;
            return std::move(outcome.image);
        case FetchOutcomeKind::EMPTY: {
            auto fallback = default_images_.Lookup(static_cast<std::uint32_t>(tile.zoom));
            if (fallback) {
                spdlog::debug("Using default image for empty tile {}", tile.GetKey());
                status = TileFetchStatus::DEFAULT_IMAGE;
            } else {
                status = TileFetchStatus::NOT_AVAILABLE;
            }
            return fallback;
        }
        case FetchOutcomeKind::NOT_FOUND:
        case FetchOutcomeKind::FAILURE:
            break;
    }

    status = TileFetchStatus::NOT_AVAILABLE;
    return std::nullopt;
}

std::optional<TileImage> WebTileSource::FetchLayers(const std::vector<std::string>& urls,
                                                    const TileCoordinates& tile,
                                                    const RetryBudget& budget) {
    ++fan_outs_;
    network_fetches_ += urls.size();

    FanOutReport report;
    const auto layers = fan_out_->FetchAll(urls, budget, &report);

    spdlog::debug("Tile {}: {}/{} layers fetched", tile.GetKey(),
                  report.filled_slots, report.location_count);
    return ImageCompositor::Composite(layers);
}

std::future<TileFetchResult> WebTileSource::FetchImageAsync(const TileCoordinates& tile,
                                                            TileCache* cache,
                                                            TileFetchCallback callback) {
    auto promise = std::make_shared<std::promise<TileFetchResult>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> lock(workers_mutex_);
    if (!worker_pool_) {
        spdlog::warn("Tile source '{}' is stopping, rejecting tile {}", config_.name, tile.GetKey());
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("tile source is stopping")));
        return future;
    }

    worker_pool_->Enqueue([this, tile, cache, promise, callback = std::move(callback)]() {
        try {
            TileFetchResult result = FetchImage(tile, cache);
            if (callback) {
                callback(result);
            }
            promise->set_value(std::move(result));
        } catch (const std::exception& e) {
            spdlog::error("Async fetch of tile {} failed: {}", tile.GetKey(), e.what());
            promise->set_exception(std::current_exception());
        }
    });
    return future;
}

std::optional<TileImage> WebTileSource::GetCachedImage(const TileCoordinates& tile,
                                                       TileCache& cache) const {
    if (hidden_.load() || !cacheable_.load()) {
        return std::nullopt;
    }

    const TileCoordinates normalized = projection_->Normalize(tile);
    if (!projection_->TileExists(normalized)) {
        return std::nullopt;
    }
    return cache.Get(normalized, config_.cache_key);
}

std::vector<std::string> WebTileSource::GetURLsForTile(const TileCoordinates& tile) const {
    return {GetURLForTile(tile)};
}

std::string WebTileSource::GetURLForTile(const TileCoordinates& /*tile*/) const {
    throw AbstractMethodError("WebTileSource::GetURLForTile");
}

bool WebTileSource::AddDefaultImage(std::uint32_t zoom, TileImage image) {
    return default_images_.Register(zoom, std::move(image));
}

std::optional<TileImage> WebTileSource::GetDefaultImage(std::uint32_t zoom) const {
    return default_images_.Lookup(zoom);
}

void WebTileSource::SetRetryCount(std::uint32_t retry_count) {
    ValidateRetryCount(retry_count);
    retry_count_.store(retry_count);
}

void WebTileSource::SetRequestTimeoutSeconds(double seconds) {
    ValidateRequestTimeout(seconds);
    request_timeout_seconds_.store(seconds);
}

TileSourceStats WebTileSource::GetStatistics() const {
    TileSourceStats stats;
    stats.total_requests = total_requests_.load();
    stats.cache_hits = cache_hits_.load();
    stats.network_fetches = network_fetches_.load();
    stats.loaded = loaded_.load();
    stats.default_images = default_images_served_.load();
    stats.failures = failures_.load();
    stats.fan_outs = fan_outs_.load();
    return stats;
}

TileSourceConfig WebTileSource::GetConfiguration() const {
    TileSourceConfig config = config_;
    config.retry_count = retry_count_.load();
    config.request_timeout_seconds = request_timeout_seconds_.load();
    config.cacheable = cacheable_.load();
    config.hidden = hidden_.load();
    return config;
}

void WebTileSource::Publish(TileEvent event, std::uint64_t tile_key) const {
    if (notification_bus_) {
        notification_bus_->Publish(event, tile_key);
    }
}

} // namespace web_tiles
