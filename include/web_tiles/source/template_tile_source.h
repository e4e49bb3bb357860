#pragma once

/**
 * @file template_tile_source.h
 * @brief Tile sources whose locations come from URL templates
 *
 * Supported placeholders:
 * - {x}, {y}, {z}: tile column, row and zoom
 * - {s}: subdomain, chosen as subdomains[(x + y) % subdomains.size()]
 * - {q}: quadkey
 */

#include <web_tiles/source/web_tile_source.h>
#include <string>
#include <vector>

namespace web_tiles {

/**
 * @brief One URL template
 */
struct TileUrlTemplate {
    /** Template, e.g. "https://{s}.tile.openstreetmap.org/{z}/{x}/{y}.png" */
    std::string url_template;

    /** Subdomain characters for {s} */
    std::string subdomains;

    /** API key appended as a query parameter when non-empty */
    std::string api_key;

    /** Query parameter name for api_key */
    std::string api_key_parameter = "api_key";

    /**
     * @brief Expand the template for a tile
     */
    std::string BuildTileURL(const TileCoordinates& tile) const;

    /**
     * @brief Check the template has the placeholders needed to address tiles
     *
     * @return true if it contains {q}, or all of {x}, {y} and {z}
     */
    bool IsValid() const;
};

/**
 * @brief Single-location tile source
 */
class TemplateTileSource : public WebTileSource {
public:
    /**
     * @brief Constructor
     *
     * @throws std::invalid_argument if the template cannot address tiles, or
     *         for the reasons listed on WebTileSource
     */
    TemplateTileSource(TileSourceConfig config,
                       TileUrlTemplate url_template,
                       std::shared_ptr<HttpClient> http_client,
                       std::shared_ptr<ImageDecoder> decoder,
                       std::shared_ptr<NotificationBus> notification_bus = nullptr,
                       std::shared_ptr<TileProjection> projection = nullptr);

    ~TemplateTileSource() override;

    std::string GetURLForTile(const TileCoordinates& tile) const override;

    const TileUrlTemplate& GetTemplate() const { return template_; }

private:
    TileUrlTemplate template_;
};

/**
 * @brief Layered tile source, one location per layer
 *
 * The first template is the base layer; later ones are drawn over it.
 */
class CompositeTileSource : public WebTileSource {
public:
    /**
     * @brief Constructor
     *
     * @throws std::invalid_argument if any template cannot address tiles
     */
    CompositeTileSource(TileSourceConfig config,
                        std::vector<TileUrlTemplate> layers,
                        std::shared_ptr<HttpClient> http_client,
                        std::shared_ptr<ImageDecoder> decoder,
                        std::shared_ptr<NotificationBus> notification_bus = nullptr,
                        std::shared_ptr<TileProjection> projection = nullptr);

    ~CompositeTileSource() override;

    std::vector<std::string> GetURLsForTile(const TileCoordinates& tile) const override;

    std::size_t GetLayerCount() const { return layers_.size(); }

private:
    std::vector<TileUrlTemplate> layers_;
};

/**
 * @brief Factory for an OpenStreetMap standard-layer source
 */
std::unique_ptr<TemplateTileSource> CreateOpenStreetMapSource(
    std::shared_ptr<HttpClient> http_client,
    std::shared_ptr<ImageDecoder> decoder,
    std::shared_ptr<NotificationBus> notification_bus = nullptr);

} // namespace web_tiles
