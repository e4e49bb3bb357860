/**
 * @file tile_cache.cpp
 * @brief In-memory LRU tile cache implementation
 */

#include <web_tiles/data/tile_cache.h>
#include <list>
#include <mutex>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace web_tiles {

namespace {

/// LRU cache entry
struct CacheEntry {
    TileCacheKey key;
    TileImage image;
};

} // anonymous namespace

/**
 * @brief Memory tile cache with LRU eviction
 */
class MemoryTileCache : public TileCache {
public:
    explicit MemoryTileCache(const TileCacheConfig& config) : config_(config) {
        spdlog::info("Tile cache initialized. Memory: {}MB, max tiles: {}",
                     config_.max_memory_cache_size / (1024 * 1024),
                     config_.max_tile_count);
    }

    std::optional<TileImage> Get(const TileCoordinates& coordinates,
                                 const std::string& cache_key) override {
        std::lock_guard<std::mutex> lock(cache_mutex_);

        auto it = index_.find(TileCacheKey{coordinates, cache_key});
        if (it == index_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }

        // Move to front of LRU list
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        ++stats_.hits;
        return it->second->image;
    }

    bool Put(const TileCoordinates& coordinates,
             const std::string& cache_key,
             const TileImage& image) override {
        if (!image.IsValid()) {
            spdlog::warn("Attempted to cache invalid image for tile {}", coordinates.GetKey());
            return false;
        }
        if (image.GetDataSize() > config_.max_memory_cache_size) {
            spdlog::warn("Image for tile {} ({} bytes) exceeds cache capacity",
                         coordinates.GetKey(), image.GetDataSize());
            return false;
        }

        std::lock_guard<std::mutex> lock(cache_mutex_);

        TileCacheKey key{coordinates, cache_key};
        RemoveLocked(key);

        while (!lru_list_.empty() &&
               (stats_.memory_cache_size + image.GetDataSize() > config_.max_memory_cache_size ||
                stats_.memory_cache_count + 1 > config_.max_tile_count)) {
            EvictLRU();
        }

        lru_list_.push_front(CacheEntry{key, image});
        index_[key] = lru_list_.begin();

        stats_.memory_cache_size += image.GetDataSize();
        stats_.memory_cache_count = index_.size();
        return true;
    }

    bool Contains(const TileCoordinates& coordinates,
                  const std::string& cache_key) const override {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        return index_.find(TileCacheKey{coordinates, cache_key}) != index_.end();
    }

    bool Remove(const TileCoordinates& coordinates,
                const std::string& cache_key) override {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        return RemoveLocked(TileCacheKey{coordinates, cache_key});
    }

    std::size_t RemoveSource(const std::string& cache_key) override {
        std::lock_guard<std::mutex> lock(cache_mutex_);

        std::size_t removed = 0;
        for (auto it = lru_list_.begin(); it != lru_list_.end();) {
            if (it->key.source_key == cache_key) {
                stats_.memory_cache_size -= it->image.GetDataSize();
                index_.erase(it->key);
                it = lru_list_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        stats_.memory_cache_count = index_.size();
        return removed;
    }

    void Clear() override {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        lru_list_.clear();
        index_.clear();
        stats_.memory_cache_size = 0;
        stats_.memory_cache_count = 0;
    }

    TileCacheStats GetStatistics() const override {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        return stats_;
    }

    TileCacheConfig GetConfiguration() const override { return config_; }

private:
    using EntryList = std::list<CacheEntry>;

    bool RemoveLocked(const TileCacheKey& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        stats_.memory_cache_size -= it->second->image.GetDataSize();
        lru_list_.erase(it->second);
        index_.erase(it);
        stats_.memory_cache_count = index_.size();
        return true;
    }

    void EvictLRU() {
        const CacheEntry& victim = lru_list_.back();
        spdlog::trace("Evicting tile {} ({})", victim.key.coordinates.GetKey(), victim.key.source_key);
        stats_.memory_cache_size -= victim.image.GetDataSize();
        index_.erase(victim.key);
        lru_list_.pop_back();
        stats_.memory_cache_count = index_.size();
        ++stats_.evictions;
    }

    TileCacheConfig config_;
    TileCacheStats stats_;
    EntryList lru_list_;
    std::unordered_map<TileCacheKey, EntryList::iterator, TileCacheKeyHash> index_;
    mutable std::mutex cache_mutex_;
};

std::unique_ptr<TileCache> CreateMemoryTileCache(const TileCacheConfig& config) {
    return std::make_unique<MemoryTileCache>(config);
}

} // namespace web_tiles
