/**
 * @file image_compositor.cpp
 * @brief Straight-alpha "source over" compositing
 */

#include <web_tiles/image/image_compositor.h>
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace web_tiles {

namespace {

constexpr double kMaxChannel = 255.0;

std::uint8_t ToChannel(double value) {
    return static_cast<std::uint8_t>(std::clamp(std::lround(value), 0L, 255L));
}

} // anonymous namespace

std::optional<TileImage> ImageCompositor::Composite(
    const std::vector<std::optional<TileImage>>& layers) {

    std::vector<const TileImage*> usable;
    usable.reserve(layers.size());
    for (const auto& layer : layers) {
        if (layer && layer->IsValid()) {
            usable.push_back(&*layer);
        }
    }

    if (usable.empty()) {
        return std::nullopt;
    }

    if (usable.size() == 1) {
        return *usable.front();
    }

    TileImage canvas = *usable.front();
    for (std::size_t i = 1; i < usable.size(); ++i) {
        DrawOver(canvas, *usable[i]);
    }

    spdlog::trace("Composited {} of {} layers into {}x{} image",
                  usable.size(), layers.size(), canvas.width, canvas.height);

    return canvas;
}

void ImageCompositor::DrawOver(TileImage& canvas, const TileImage& layer) {
    if (layer.width != canvas.width || layer.height != canvas.height) {
        spdlog::debug("Compositing {}x{} layer onto {}x{} canvas, clipping",
                      layer.width, layer.height, canvas.width, canvas.height);
    }

    const std::uint32_t width = std::min(canvas.width, layer.width);
    const std::uint32_t height = std::min(canvas.height, layer.height);

    for (std::uint32_t y = 0; y < height; ++y) {
        for (std::uint32_t x = 0; x < width; ++x) {
            const auto src = layer.PixelAt(x, y);
            const std::uint8_t src_alpha = src[3];

            if (src_alpha == 0) {
                continue;
            }
            if (src_alpha == 255) {
                canvas.SetPixel(x, y, src);
                continue;
            }

            const auto dst = canvas.PixelAt(x, y);
            const double sa = src_alpha / kMaxChannel;
            const double da = dst[3] / kMaxChannel;
            const double out_alpha = sa + da * (1.0 - sa);

            std::array<std::uint8_t, 4> out{};
            for (std::size_t c = 0; c < 3; ++c) {
                const double blended = (src[c] * sa + dst[c] * da * (1.0 - sa)) / out_alpha;
                out[c] = ToChannel(blended);
            }
            out[3] = ToChannel(out_alpha * kMaxChannel);

            canvas.SetPixel(x, y, out);
        }
    }
}

} // namespace web_tiles
