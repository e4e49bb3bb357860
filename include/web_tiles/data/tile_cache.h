#pragma once

/**
 * @file tile_cache.h
 * @brief Cache collaborator for decoded tile images
 *
 * Entries are keyed by (tile, cache key string) so several tile sources can
 * share one cache instance without colliding.
 */

#include <web_tiles/math/tile_mathematics.h>
#include <web_tiles/image/tile_image.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace web_tiles {

/**
 * @brief Composite cache key
 */
struct TileCacheKey {
    /** Normalized tile */
    TileCoordinates coordinates;

    /** Source-unique identifier */
    std::string source_key;

    bool operator==(const TileCacheKey& other) const {
        return coordinates == other.coordinates && source_key == other.source_key;
    }
};

/**
 * @brief Hash function for TileCacheKey
 */
struct TileCacheKeyHash {
    std::size_t operator()(const TileCacheKey& key) const {
        const std::size_t tile_hash = TileCoordinatesHash{}(key.coordinates);
        const std::size_t source_hash = std::hash<std::string>{}(key.source_key);
        return tile_hash ^ (source_hash + 0x9e3779b97f4a7c15ULL + (tile_hash << 6) + (tile_hash >> 2));
    }
};

/**
 * @brief Tile cache configuration
 */
struct TileCacheConfig {
    /** Maximum memory cache size in bytes */
    std::size_t max_memory_cache_size = 100 * 1024 * 1024;  // 100MB

    /** Maximum number of tiles to cache */
    std::size_t max_tile_count = 10000;
};

/**
 * @brief Tile cache statistics
 */
struct TileCacheStats {
    std::size_t memory_cache_size = 0;
    std::size_t memory_cache_count = 0;
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t evictions = 0;

    /** Cache hit ratio */
    float GetHitRatio() const {
        const std::size_t total = hits + misses;
        return total > 0 ? static_cast<float>(hits) / total : 0.0f;
    }
};

/**
 * @brief Tile cache interface
 *
 * Implementations are shared by all concurrent tile pipelines: reads may
 * happen concurrently and writes must be serialized per key at minimum.
 */
class TileCache {
public:
    virtual ~TileCache() = default;

    /**
     * @brief Get an image from cache
     *
     * @param coordinates Normalized tile
     * @param cache_key Source-unique key
     * @return std::optional<TileImage> Cached image, std::nullopt on miss
     */
    virtual std::optional<TileImage> Get(const TileCoordinates& coordinates,
                                         const std::string& cache_key) = 0;

    /**
     * @brief Put an image into cache (replaces an existing entry)
     *
     * @return true if stored, false if the image was rejected
     */
    virtual bool Put(const TileCoordinates& coordinates,
                     const std::string& cache_key,
                     const TileImage& image) = 0;

    /**
     * @brief Check if an entry exists
     */
    virtual bool Contains(const TileCoordinates& coordinates,
                          const std::string& cache_key) const = 0;

    /**
     * @brief Remove an entry
     *
     * @return true if an entry was removed
     */
    virtual bool Remove(const TileCoordinates& coordinates,
                        const std::string& cache_key) = 0;

    /**
     * @brief Remove every entry belonging to one source
     *
     * @return std::size_t Entries removed
     */
    virtual std::size_t RemoveSource(const std::string& cache_key) = 0;

    /**
     * @brief Clear all cached tiles
     */
    virtual void Clear() = 0;

    virtual TileCacheStats GetStatistics() const = 0;

    virtual TileCacheConfig GetConfiguration() const = 0;

protected:
    TileCache() = default;
};

/**
 * @brief Factory for the in-memory LRU cache
 *
 * @param config Size limits
 * @return std::unique_ptr<TileCache> New cache instance
 */
std::unique_ptr<TileCache> CreateMemoryTileCache(const TileCacheConfig& config = {});

} // namespace web_tiles
