#pragma once

/**
 * @file image_decoder.h
 * @brief Codec collaborator turning fetched bytes into tile images
 */

#include <web_tiles/image/tile_image.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace web_tiles {

/**
 * @brief Image decoder interface
 *
 * Implementations must be safe to call from several fetch threads at once.
 */
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;

    /**
     * @brief Decode encoded image bytes into RGBA8
     *
     * @param data Encoded bytes (PNG, JPEG, ...)
     * @return std::optional<TileImage> Decoded image, std::nullopt if the
     *         bytes are empty or not a supported image
     */
    virtual std::optional<TileImage> Decode(const std::vector<std::uint8_t>& data) const = 0;
};

/**
 * @brief Factory for the stb_image based decoder
 */
std::shared_ptr<ImageDecoder> CreateStbImageDecoder();

} // namespace web_tiles
