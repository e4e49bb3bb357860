#pragma once

/**
 * @file tile_mathematics.h
 * @brief Tile coordinate system and projection collaborator
 *
 * Defines tile coordinates, the deterministic 64-bit tile key used in
 * notifications, quadkey conversion, and the projection interface that
 * normalizes tiles before they reach the fetch pipeline.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace web_tiles {

/**
 * @brief Tile coordinates (X, Y, Zoom)
 */
struct TileCoordinates {
    int32_t x;      ///< Tile X coordinate
    int32_t y;      ///< Tile Y coordinate
    int32_t zoom;   ///< Zoom level

    /**
     * @brief Default constructor
     */
    constexpr TileCoordinates() : x(0), y(0), zoom(0) {}

    /**
     * @brief Construct from coordinates and zoom
     *
     * @param tile_x Tile X coordinate
     * @param tile_y Tile Y coordinate
     * @param tile_zoom Zoom level
     */
    constexpr TileCoordinates(int32_t tile_x, int32_t tile_y, int32_t tile_zoom)
        : x(tile_x), y(tile_y), zoom(tile_zoom) {}

    /**
     * @brief Check if tile coordinates lie inside the pyramid
     */
    bool IsValid() const {
        if (zoom < 0 || zoom > 30) return false;
        const int32_t max_coord = 1 << zoom;
        return x >= 0 && x < max_coord && y >= 0 && y < max_coord;
    }

    /**
     * @brief Get tile key as string
     *
     * @return std::string Tile key in format "zoom/x/y"
     */
    std::string GetKey() const {
        return std::to_string(zoom) + "/" + std::to_string(x) + "/" + std::to_string(y);
    }

    bool operator==(const TileCoordinates& other) const {
        return x == other.x && y == other.y && zoom == other.zoom;
    }

    bool operator!=(const TileCoordinates& other) const {
        return !(*this == other);
    }

    /**
     * @brief Less than operator (for sorting)
     */
    bool operator<(const TileCoordinates& other) const {
        if (zoom != other.zoom) return zoom < other.zoom;
        if (x != other.x) return x < other.x;
        return y < other.y;
    }
};

/**
 * @brief Hash function for TileCoordinates
 */
struct TileCoordinatesHash {
    std::size_t operator()(const TileCoordinates& coords) const {
        std::hash<std::uint64_t> hasher;
        std::uint64_t combined = (static_cast<std::uint64_t>(coords.x) << 42) |
                                (static_cast<std::uint64_t>(coords.y) << 21) |
                                static_cast<std::uint64_t>(coords.zoom);
        return hasher(combined);
    }
};

/**
 * @brief Encode a tile into a single 64-bit key
 *
 * Layout: 8 bits zoom | 28 bits x | 28 bits y. The key is the payload of
 * tile lifecycle notifications.
 *
 * @param tile Tile coordinates
 * @return std::uint64_t Tile key
 */
std::uint64_t GetTileKey(const TileCoordinates& tile);

/**
 * @brief Decode a key produced by GetTileKey
 */
TileCoordinates TileFromKey(std::uint64_t key);

/**
 * @brief Build the Bing-style quadkey for a tile ("" at zoom 0)
 */
std::string GetQuadKey(const TileCoordinates& tile);

/**
 * @brief Projection collaborator
 *
 * Normalizes tiles (wrap/clamp) and answers whether a tile exists in the
 * source's pyramid. Every tile is normalized before cache lookup, fetch and
 * cache store.
 */
class TileProjection {
public:
    virtual ~TileProjection() = default;

    /**
     * @brief Normalize tile coordinates (e.g. wrap X around the antimeridian)
     */
    virtual TileCoordinates Normalize(const TileCoordinates& tile) const = 0;

    /**
     * @brief Check if a normalized tile exists in the pyramid
     */
    virtual bool TileExists(const TileCoordinates& tile) const = 0;
};

/**
 * @brief Spherical mercator tile pyramid with a zoom range
 *
 * X wraps modulo 2^zoom; Y is left untouched and a Y outside the pyramid
 * makes the tile non-existent.
 */
class MercatorTileProjection : public TileProjection {
public:
    MercatorTileProjection(std::int32_t min_zoom, std::int32_t max_zoom);

    TileCoordinates Normalize(const TileCoordinates& tile) const override;
    bool TileExists(const TileCoordinates& tile) const override;

    std::int32_t GetMinZoom() const { return min_zoom_; }
    std::int32_t GetMaxZoom() const { return max_zoom_; }

private:
    std::int32_t min_zoom_;
    std::int32_t max_zoom_;
};

/**
 * @brief Factory for the default projection
 */
std::shared_ptr<TileProjection> CreateMercatorProjection(std::int32_t min_zoom,
                                                         std::int32_t max_zoom);

} // namespace web_tiles
