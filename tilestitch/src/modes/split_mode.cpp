#include "split_mode.hpp"

#include "../tile_manifest.hpp"
#include "../utils/file_io.hpp"
#include "../utils/image_io.hpp"
#include "../utils/logger.hpp"
#include "../utils/tiling.hpp"

#include <filesystem>

int run_split_mode(const Options& opts) {
    logger::info("Running split mode");

    if (opts.input_path.empty() || opts.tile_dir.empty()) {
        logger::error("Split mode requires --input and --tile-dir");
        return 1;
    }
    if (!image_io::is_supported_format(opts.output_format)) {
        logger::error("Unsupported tile format: " + opts.output_format);
        return 1;
    }
    const std::string extension = image_io::normalize_format(opts.output_format);

    const auto input_data = file_io::read_entire_file(opts.input_path);
    if (input_data.empty()) {
        logger::error("Failed to read input file: " + opts.input_path);
        return 1;
    }

    tiling::PixelBuffer source;
    if (!image_io::decode_image(input_data.data(), input_data.size(), source)) {
        logger::error("Failed to decode input image: " + opts.input_path);
        return 1;
    }

    tiling::PlanRequest request;
    request.image_width = source.width;
    request.image_height = source.height;
    request.tile_width = opts.tile_width;
    request.tile_height = opts.tile_height;
    request.min_overlap = opts.overlap;

    tile_manifest::Manifest manifest;
    manifest.image_width = source.width;
    manifest.image_height = source.height;

    tiling::TileError error;
    if (!tiling::plan_tiles(request, manifest.tiles, error)) {
        logger::error(std::string(tiling::error_kind_name(error.kind)) + ": " + error.message);
        return 1;
    }

    const std::filesystem::path tile_dir(opts.tile_dir);
    for (size_t i = 0; i < manifest.tiles.size(); ++i) {
        tiling::PixelBuffer tile_pixels;
        if (!tiling::extract_tile(source, manifest.tiles[i], tile_pixels)) {
            logger::error("Failed to extract tile " + std::to_string(i));
            return 1;
        }

        std::vector<uint8_t> encoded;
        if (!image_io::encode_image(tile_pixels, extension, encoded)) {
            logger::error("Failed to encode tile " + std::to_string(i));
            return 1;
        }

        const std::string path = (tile_dir / tile_manifest::tile_file_name(i, extension)).string();
        if (!file_io::write_entire_file(path, encoded)) {
            logger::error("Failed to write tile file: " + path);
            return 1;
        }
        logger::debug("Split: wrote " + path);
    }

    const std::string manifest_path = resolve_manifest_path(opts);
    if (!file_io::write_entire_file(manifest_path, tile_manifest::encode_manifest(manifest))) {
        logger::error("Failed to write manifest: " + manifest_path);
        return 1;
    }

    logger::info("Split mode completed: " + std::to_string(manifest.tiles.size()) + " tiles in " +
                 opts.tile_dir);
    return 0;
}
