#include "plan_mode.hpp"

#include "../tile_manifest.hpp"
#include "../utils/file_io.hpp"
#include "../utils/logger.hpp"
#include "../utils/tiling.hpp"

#include <iostream>
#include <utility>

int run_plan_mode(const Options& opts) {
    logger::info("Running plan mode");

    tiling::PlanRequest request;
    request.image_width = opts.image_width;
    request.image_height = opts.image_height;
    request.tile_width = opts.tile_width;
    request.tile_height = opts.tile_height;
    request.min_overlap = opts.overlap;

    std::vector<tiling::Tile> tiles;
    tiling::TileError error;
    if (!tiling::plan_tiles(request, tiles, error)) {
        logger::error(std::string(tiling::error_kind_name(error.kind)) + ": " + error.message);
        return 1;
    }

    for (size_t i = 0; i < tiles.size(); ++i) {
        std::cout << i << ' ' << tiling::describe(tiles[i]) << "\n";
    }
    std::cout.flush();

    if (!opts.manifest_path.empty()) {
        tile_manifest::Manifest manifest;
        manifest.image_width = request.image_width;
        manifest.image_height = request.image_height;
        manifest.tiles = std::move(tiles);
        if (!file_io::write_entire_file(opts.manifest_path, tile_manifest::encode_manifest(manifest))) {
            logger::error("Failed to write manifest: " + opts.manifest_path);
            return 1;
        }
        logger::info("Plan mode wrote manifest: " + opts.manifest_path);
    }

    return 0;
}
