/**
 * @file tile_mathematics.cpp
 * @brief Tile key encoding and mercator projection implementation
 */

#include <web_tiles/math/tile_mathematics.h>
#include <web_tiles/constants.h>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace web_tiles {

namespace {

constexpr std::uint64_t kZoomMask = 0xFFULL;
constexpr std::uint64_t kCoordMask = 0x0FFFFFFFULL;
constexpr int kZoomShift = 56;
constexpr int kXShift = 28;

} // anonymous namespace

std::uint64_t GetTileKey(const TileCoordinates& tile) {
    const std::uint64_t zoom = static_cast<std::uint64_t>(tile.zoom) & kZoomMask;
    const std::uint64_t x = static_cast<std::uint64_t>(tile.x) & kCoordMask;
    const std::uint64_t y = static_cast<std::uint64_t>(tile.y) & kCoordMask;
    return (zoom << kZoomShift) | (x << kXShift) | y;
}

TileCoordinates TileFromKey(std::uint64_t key) {
    return TileCoordinates(static_cast<int32_t>((key >> kXShift) & kCoordMask),
                           static_cast<int32_t>(key & kCoordMask),
                           static_cast<int32_t>((key >> kZoomShift) & kZoomMask));
}

std::string GetQuadKey(const TileCoordinates& tile) {
    if (!tile.IsValid()) {
        return "";
    }

    std::string key;
    key.reserve(static_cast<std::size_t>(tile.zoom));

    for (int32_t i = tile.zoom - 1; i >= 0; --i) {
        char digit = '0';
        const int32_t mask = 1 << i;

        if ((tile.x & mask) != 0) digit += 1;
        if ((tile.y & mask) != 0) digit += 2;

        key.push_back(digit);
    }

    return key;
}

MercatorTileProjection::MercatorTileProjection(std::int32_t min_zoom, std::int32_t max_zoom)
    : min_zoom_(std::max<std::int32_t>(0, min_zoom))
    , max_zoom_(std::min<std::int32_t>(constants::tiles::MAX_SUPPORTED_ZOOM, max_zoom)) {
    if (min_zoom_ > max_zoom_) {
        spdlog::warn("MercatorTileProjection: min zoom {} above max zoom {}, swapping",
                     min_zoom_, max_zoom_);
        std::swap(min_zoom_, max_zoom_);
    }
}

TileCoordinates MercatorTileProjection::Normalize(const TileCoordinates& tile) const {
    if (tile.zoom < 0 || tile.zoom > constants::tiles::MAX_SUPPORTED_ZOOM) {
        return tile;
    }

    const int32_t span = 1 << tile.zoom;
    int32_t x = tile.x % span;
    if (x < 0) {
        x += span;
    }

    return TileCoordinates(x, tile.y, tile.zoom);
}

bool MercatorTileProjection::TileExists(const TileCoordinates& tile) const {
    if (tile.zoom < min_zoom_ || tile.zoom > max_zoom_) {
        return false;
    }
    return tile.IsValid();
}

std::shared_ptr<TileProjection> CreateMercatorProjection(std::int32_t min_zoom,
                                                         std::int32_t max_zoom) {
    return std::make_shared<MercatorTileProjection>(min_zoom, max_zoom);
}

} // namespace web_tiles
