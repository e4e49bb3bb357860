#pragma once

/**
 * @file constants.h
 * @brief Central repository for web_tiles constants
 *
 * Defaults for retry budgets, HTTP status codes used for classification,
 * and notification names. No magic numbers in implementation files.
 */

#include <cstddef>
#include <cstdint>

namespace web_tiles {
namespace constants {

//==============================================================================
// Fetch Defaults
//==============================================================================

namespace fetch {
    /// Number of attempts per source location
    constexpr std::uint32_t DEFAULT_RETRY_COUNT = 3;

    /// Total wall-clock budget per tile in seconds
    constexpr double DEFAULT_REQUEST_TIMEOUT_SECONDS = 60.0;

    /// Upper bound for any timeout, keeps clock arithmetic in range
    constexpr double MAX_REQUEST_TIMEOUT_SECONDS = 86400.0;

    /// Worker threads serving FetchImageAsync
    constexpr std::size_t DEFAULT_WORKER_THREADS = 4;

    /// Threads available to a single tile's fan-out
    constexpr std::size_t DEFAULT_MAX_CONCURRENT_FETCHES = 8;

    /// User agent sent with every tile request
    constexpr const char* DEFAULT_USER_AGENT = "WebTiles/0.1";
} // namespace fetch

//==============================================================================
// HTTP Status Codes
//==============================================================================

namespace http {
    constexpr long STATUS_OK = 200;
    constexpr long STATUS_NO_CONTENT = 204;
    constexpr long STATUS_BAD_REQUEST = 400;
    constexpr long STATUS_NOT_FOUND = 404;
    constexpr long STATUS_REQUEST_TIMEOUT = 408;
    constexpr long STATUS_TOO_MANY_REQUESTS = 429;
    constexpr long STATUS_SERVER_ERROR = 500;
} // namespace http

//==============================================================================
// Tile Pyramid
//==============================================================================

namespace tiles {
    /// Highest zoom level representable in a tile key (8 bits)
    constexpr std::int32_t MAX_SUPPORTED_ZOOM = 28;

    /// Default zoom range of a web tile source
    constexpr std::int32_t DEFAULT_MIN_ZOOM = 0;
    constexpr std::int32_t DEFAULT_MAX_ZOOM = 18;

    /// Channels of every decoded tile image (RGBA8)
    constexpr std::uint8_t IMAGE_CHANNELS = 4;
} // namespace tiles

//==============================================================================
// Notifications
//==============================================================================

namespace notifications {
    constexpr const char* TILE_REQUESTED = "TileRequested";
    constexpr const char* TILE_RETRIEVED = "TileRetrieved";
} // namespace notifications

} // namespace constants
} // namespace web_tiles
