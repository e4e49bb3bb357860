/**
 * @file image_decoder.cpp
 * @brief stb_image decoder implementation
 */

#include <web_tiles/image/image_decoder.h>
#include <spdlog/spdlog.h>
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace web_tiles {

/**
 * @brief Decoder backed by stbi_load_from_memory
 */
class StbImageDecoder : public ImageDecoder {
public:
    std::optional<TileImage> Decode(const std::vector<std::uint8_t>& data) const override;
};

std::optional<TileImage> StbImageDecoder::Decode(const std::vector<std::uint8_t>& data) const {
    if (data.empty()) {
        spdlog::warn("Cannot decode image: no data");
        return std::nullopt;
    }

    int width = 0;
    int height = 0;
    int channels = 0;

    // Force RGBA so every layer can be composited the same way
    constexpr int kDesiredChannels = constants::tiles::IMAGE_CHANNELS;
    unsigned char* decoded_data = stbi_load_from_memory(
        data.data(),
        static_cast<int>(data.size()),
        &width,
        &height,
        &channels,
        kDesiredChannels
    );

    if (!decoded_data) {
        const char* error = stbi_failure_reason();
        spdlog::warn("stb_image decode failed: {}", error ? error : "unknown error");
        return std::nullopt;
    }

    TileImage image;
    image.width = static_cast<std::uint32_t>(width);
    image.height = static_cast<std::uint32_t>(height);
    image.channels = static_cast<std::uint8_t>(kDesiredChannels);

    const std::size_t decoded_size =
        static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * kDesiredChannels;
    image.pixels.assign(decoded_data, decoded_data + decoded_size);

    stbi_image_free(decoded_data);

    spdlog::trace("Decoded image: {}x{}, {} source channels, {} bytes",
                  width, height, channels, decoded_size);

    return image;
}

std::shared_ptr<ImageDecoder> CreateStbImageDecoder() {
    return std::make_shared<StbImageDecoder>();
}

} // namespace web_tiles
