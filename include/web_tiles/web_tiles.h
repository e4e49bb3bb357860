#pragma once

/**
 * @file web_tiles.h
 * @brief Main public interface for the Web Tiles library
 *
 * Pulls in the tile source entry point together with the collaborators a
 * caller needs to build one: transport, codec, cache and notification bus.
 *
 * @author Web Tiles Team
 * @version 0.1.0
 */

#include <web_tiles/constants.h>
#include <web_tiles/data/http_client.h>
#include <web_tiles/data/tile_cache.h>
#include <web_tiles/events/notification_bus.h>
#include <web_tiles/image/image_decoder.h>
#include <web_tiles/image/tile_image.h>
#include <web_tiles/math/tile_mathematics.h>
#include <web_tiles/platform/library_info.h>
#include <web_tiles/source/template_tile_source.h>
#include <web_tiles/source/web_tile_source.h>
