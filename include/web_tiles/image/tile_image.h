#pragma once

/**
 * @file tile_image.h
 * @brief Decoded tile raster
 */

#include <web_tiles/constants.h>
#include <array>
#include <cstdint>
#include <vector>

namespace web_tiles {

/**
 * @brief Decoded RGBA8 tile image
 *
 * Pixels are stored row-major, top row first, with straight (not
 * premultiplied) alpha.
 */
struct TileImage {
    /** Image width in pixels */
    std::uint32_t width = 0;

    /** Image height in pixels */
    std::uint32_t height = 0;

    /** Number of channels (always 4 for decoded tiles) */
    std::uint8_t channels = constants::tiles::IMAGE_CHANNELS;

    /** Pixel data, width * height * channels bytes */
    std::vector<std::uint8_t> pixels;

    TileImage() = default;

    TileImage(std::uint32_t image_width, std::uint32_t image_height)
        : width(image_width)
        , height(image_height)
        , pixels(static_cast<std::size_t>(image_width) * image_height *
                 constants::tiles::IMAGE_CHANNELS, 0) {}

    /**
     * @brief Check the image is RGBA8 and dimensions and pixel buffer agree
     */
    bool IsValid() const {
        return width > 0 && height > 0 && channels == constants::tiles::IMAGE_CHANNELS &&
               pixels.size() == static_cast<std::size_t>(width) * height * channels;
    }

    /**
     * @brief Get pixel buffer size in bytes
     */
    std::size_t GetDataSize() const {
        return pixels.size();
    }

    /**
     * @brief Read one RGBA pixel (no bounds checking)
     */
    std::array<std::uint8_t, 4> PixelAt(std::uint32_t x, std::uint32_t y) const {
        const std::size_t offset = (static_cast<std::size_t>(y) * width + x) * channels;
        return {pixels[offset], pixels[offset + 1], pixels[offset + 2], pixels[offset + 3]};
    }

    /**
     * @brief Write one RGBA pixel (no bounds checking)
     */
    void SetPixel(std::uint32_t x, std::uint32_t y, const std::array<std::uint8_t, 4>& rgba) {
        const std::size_t offset = (static_cast<std::size_t>(y) * width + x) * channels;
        for (std::size_t c = 0; c < 4; ++c) {
            pixels[offset + c] = rgba[c];
        }
    }

    bool operator==(const TileImage& other) const {
        return width == other.width && height == other.height &&
               channels == other.channels && pixels == other.pixels;
    }

    bool operator!=(const TileImage& other) const {
        return !(*this == other);
    }
};

} // namespace web_tiles
