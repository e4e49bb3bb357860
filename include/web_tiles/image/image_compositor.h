#pragma once

/**
 * @file image_compositor.h
 * @brief Layered alpha compositing of tile images
 *
 * The only place raster compositing happens. Layers are drawn in the order
 * given (index 0 is the base layer), each at the same origin, with
 * straight-alpha "source over" blending.
 */

#include <web_tiles/image/tile_image.h>
#include <optional>
#include <vector>

namespace web_tiles {

/**
 * @brief Stateless compositor for ordered tile layers
 */
class ImageCompositor {
public:
    /**
     * @brief Composite ordered layers into one image
     *
     * Missing or invalid layers are skipped. With no usable layer the result
     * is empty; with exactly one it is that layer, untouched. Otherwise the
     * canvas takes the size of the first usable layer and later layers are
     * blended on top, clipped to the canvas.
     *
     * @param layers Layers in bottom-to-top order
     * @return std::optional<TileImage> Composited image
     */
    static std::optional<TileImage> Composite(const std::vector<std::optional<TileImage>>& layers);

    /**
     * @brief Blend one layer over a canvas in place
     *
     * @param canvas Destination image (modified)
     * @param layer Source image drawn at the canvas origin
     */
    static void DrawOver(TileImage& canvas, const TileImage& layer);
};

} // namespace web_tiles
