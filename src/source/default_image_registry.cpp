/**
 * @file default_image_registry.cpp
 * @brief Default image registry implementation
 */

#include <web_tiles/source/default_image_registry.h>
#include <mutex>
#include <spdlog/spdlog.h>

namespace web_tiles {

bool DefaultImageRegistry::Register(std::uint32_t zoom, TileImage image) {
    if (!image.IsValid()) {
        spdlog::warn("Ignoring invalid default image for zoom {}", zoom);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    images_[zoom] = std::move(image);
    spdlog::debug("Registered default image for zoom {}", zoom);
    return true;
}

std::optional<TileImage> DefaultImageRegistry::Lookup(std::uint32_t zoom) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = images_.find(zoom);
    if (it == images_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DefaultImageRegistry::Contains(std::uint32_t zoom) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return images_.find(zoom) != images_.end();
}

std::size_t DefaultImageRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return images_.size();
}

} // namespace web_tiles
