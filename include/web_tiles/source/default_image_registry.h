#pragma once

/**
 * @file default_image_registry.h
 * @brief Per-zoom fallback images for tiles the server reports as empty
 */

#include <web_tiles/image/tile_image.h>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>

namespace web_tiles {

/**
 * @brief Zoom level to default image table
 *
 * Entries can be added or replaced, never removed. Lookups take a shared
 * lock and run concurrently; registration is exclusive.
 */
class DefaultImageRegistry {
public:
    DefaultImageRegistry() = default;

    // Non-copyable
    DefaultImageRegistry(const DefaultImageRegistry&) = delete;
    DefaultImageRegistry& operator=(const DefaultImageRegistry&) = delete;

    /**
     * @brief Register (or replace) the default image of a zoom level
     *
     * @return false if the image is invalid and was not registered
     */
    bool Register(std::uint32_t zoom, TileImage image);

    /**
     * @brief Get the default image of a zoom level
     */
    std::optional<TileImage> Lookup(std::uint32_t zoom) const;

    bool Contains(std::uint32_t zoom) const;

    std::size_t Size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::uint32_t, TileImage> images_;
};

} // namespace web_tiles
