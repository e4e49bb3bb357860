/**
 * @file template_tile_source.cpp
 * @brief URL template tile sources
 */

#include <web_tiles/source/template_tile_source.h>
#include <regex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace web_tiles {

namespace {

bool HasPlaceholder(const std::string& url_template, const char* placeholder) {
    return url_template.find(placeholder) != std::string::npos;
}

void RequireValidTemplate(const TileUrlTemplate& url_template) {
    if (!url_template.IsValid()) {
        spdlog::error("Invalid tile URL template: '{}'", url_template.url_template);
        throw std::invalid_argument("tile URL template must contain {q} or {x}, {y} and {z}: " +
                                    url_template.url_template);
    }
}

} // anonymous namespace

std::string TileUrlTemplate::BuildTileURL(const TileCoordinates& tile) const {
    std::string url = url_template;

    url = std::regex_replace(url, std::regex("\\{x\\}"), std::to_string(tile.x));
    url = std::regex_replace(url, std::regex("\\{y\\}"), std::to_string(tile.y));
    url = std::regex_replace(url, std::regex("\\{z\\}"), std::to_string(tile.zoom));

    if (HasPlaceholder(url, "{q}")) {
        url = std::regex_replace(url, std::regex("\\{q\\}"), GetQuadKey(tile));
    }

    if (!subdomains.empty()) {
        const std::size_t index =
            static_cast<std::size_t>(static_cast<std::int64_t>(tile.x) + tile.y) % subdomains.size();
        url = std::regex_replace(url, std::regex("\\{s\\}"), std::string(1, subdomains[index]));
    }

    if (!api_key.empty()) {
        url += (url.find('?') == std::string::npos) ? '?' : '&';
        url += api_key_parameter + "=" + api_key;
    }

    return url;
}

bool TileUrlTemplate::IsValid() const {
    if (HasPlaceholder(url_template, "{q}")) {
        return true;
    }
    return HasPlaceholder(url_template, "{x}") &&
           HasPlaceholder(url_template, "{y}") &&
           HasPlaceholder(url_template, "{z}");
}

TemplateTileSource::TemplateTileSource(TileSourceConfig config,
                                       TileUrlTemplate url_template,
                                       std::shared_ptr<HttpClient> http_client,
                                       std::shared_ptr<ImageDecoder> decoder,
                                       std::shared_ptr<NotificationBus> notification_bus,
                                       std::shared_ptr<TileProjection> projection)
    : WebTileSource(std::move(config), std::move(http_client), std::move(decoder),
                    std::move(notification_bus), std::move(projection)),
      template_(std::move(url_template)) {
    RequireValidTemplate(template_);
}

TemplateTileSource::~TemplateTileSource() {
    StopWorkers();
}

std::string TemplateTileSource::GetURLForTile(const TileCoordinates& tile) const {
    return template_.BuildTileURL(tile);
}

CompositeTileSource::CompositeTileSource(TileSourceConfig config,
                                         std::vector<TileUrlTemplate> layers,
                                         std::shared_ptr<HttpClient> http_client,
                                         std::shared_ptr<ImageDecoder> decoder,
                                         std::shared_ptr<NotificationBus> notification_bus,
                                         std::shared_ptr<TileProjection> projection)
    : WebTileSource(std::move(config), std::move(http_client), std::move(decoder),
                    std::move(notification_bus), std::move(projection)),
      layers_(std::move(layers)) {
    for (const auto& layer : layers_) {
        RequireValidTemplate(layer);
    }
    spdlog::debug("Composite source '{}' has {} layers", GetName(), layers_.size());
}

CompositeTileSource::~CompositeTileSource() {
    StopWorkers();
}

std::vector<std::string> CompositeTileSource::GetURLsForTile(const TileCoordinates& tile) const {
    std::vector<std::string> urls;
    urls.reserve(layers_.size());
    for (const auto& layer : layers_) {
        urls.push_back(layer.BuildTileURL(tile));
    }
    return urls;
}

std::unique_ptr<TemplateTileSource> CreateOpenStreetMapSource(
    std::shared_ptr<HttpClient> http_client,
    std::shared_ptr<ImageDecoder> decoder,
    std::shared_ptr<NotificationBus> notification_bus) {
    TileSourceConfig config;
    config.name = "OpenStreetMap";
    config.cache_key = "osm";
    config.attribution = "© OpenStreetMap contributors";
    config.min_zoom = 0;
    config.max_zoom = 19;

    TileUrlTemplate url_template;
    url_template.url_template = "https://tile.openstreetmap.org/{z}/{x}/{y}.png";

    return std::make_unique<TemplateTileSource>(std::move(config), std::move(url_template),
                                                std::move(http_client), std::move(decoder),
                                                std::move(notification_bus));
}

} // namespace web_tiles
