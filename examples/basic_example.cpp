#include <web_tiles/web_tiles.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " <zoom> <x> <y> [--debug] [--layer <url template>]...\n\n";
    std::cout << "Fetches one tile. Without --layer the OpenStreetMap standard layer is used;\n";
    std::cout << "each --layer adds a URL template ({x} {y} {z} {s} {q}), bottom layer first.\n";
}

std::int32_t ParseInt(const std::string& value, const char* name) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("invalid ") + name + ": " + value);
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        std::cout << "Web Tiles Basic Example\n";
        std::cout << "=======================\n\n";

        std::cout << "Library Version: " << web_tiles::LibraryInfo::GetVersion() << "\n";
        std::cout << "Build Info: " << web_tiles::LibraryInfo::GetBuildInfo() << "\n\n";

        if (argc < 4) {
            PrintUsage(argv[0]);
            return 1;
        }

        const web_tiles::TileCoordinates tile(ParseInt(argv[2], "x"),
                                              ParseInt(argv[3], "y"),
                                              ParseInt(argv[1], "zoom"));

        std::vector<web_tiles::TileUrlTemplate> layers;
        for (int i = 4; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--debug") {
                spdlog::set_level(spdlog::level::debug);
            } else if (arg == "--layer" && i + 1 < argc) {
                web_tiles::TileUrlTemplate layer;
                layer.url_template = argv[++i];
                layer.subdomains = "abc";
                layers.push_back(std::move(layer));
            } else {
                PrintUsage(argv[0]);
                return 1;
            }
        }

        if (!web_tiles::LibraryInfo::CheckSystemRequirements()) {
            std::cerr << "HTTP transport is not usable\n";
            return 1;
        }

        auto http_client = web_tiles::CreateCurlHttpClient();
        auto decoder = web_tiles::CreateStbImageDecoder();
        auto bus = std::make_shared<web_tiles::AsyncNotificationBus>();
        bus->Subscribe([](web_tiles::TileEvent event, std::uint64_t key) {
            const auto coords = web_tiles::TileFromKey(key);
            std::cout << "  [" << web_tiles::ToString(event) << "] " << coords.GetKey() << "\n";
        });

        std::unique_ptr<web_tiles::WebTileSource> source;
        if (layers.empty()) {
            source = web_tiles::CreateOpenStreetMapSource(http_client, decoder, bus);
        } else if (layers.size() == 1) {
            web_tiles::TileSourceConfig config;
            config.name = "custom";
            source = std::make_unique<web_tiles::TemplateTileSource>(
                config, layers.front(), http_client, decoder, bus);
        } else {
            web_tiles::TileSourceConfig config;
            config.name = "custom-layers";
            source = std::make_unique<web_tiles::CompositeTileSource>(
                config, layers, http_client, decoder, bus);
        }

        auto cache = web_tiles::CreateMemoryTileCache();

        std::cout << "Fetching tile " << tile.GetKey() << " from " << source->GetName() << "\n";
        auto first = source->FetchImageAsync(tile, cache.get()).get();
        std::cout << "  Status: " << web_tiles::ToString(first.status)
                  << " (" << first.load_time_ms << " ms, "
                  << first.location_count << " location(s))\n";
        if (first.image) {
            std::cout << "  Image: " << first.image->width << "x" << first.image->height << "\n";
        }

        // Second fetch is served from cache
        auto second = source->FetchImage(tile, cache.get());
        std::cout << "  Refetch status: " << web_tiles::ToString(second.status) << "\n";

        bus->Flush();

        const auto stats = source->GetStatistics();
        std::cout << "\nSource statistics:\n";
        std::cout << "  Requests: " << stats.total_requests << "\n";
        std::cout << "  Cache hits: " << stats.cache_hits << "\n";
        std::cout << "  Network fetches: " << stats.network_fetches << "\n";
        std::cout << "  Failures: " << stats.failures << "\n";

        if (!source->GetAttribution().empty()) {
            std::cout << "\n" << source->GetAttribution() << "\n";
        }

        return first.HasImage() ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return -1;
    }
}
