#include "merge_mode.hpp"

#include "../tile_manifest.hpp"
#include "../utils/file_io.hpp"
#include "../utils/image_io.hpp"
#include "../utils/logger.hpp"
#include "../utils/tile_compositor.hpp"

#include <filesystem>
#include <utility>

namespace {
bool load_manifest(const std::string& path, tile_manifest::Manifest& manifest) {
    const auto bytes = file_io::read_entire_file(path);
    if (bytes.empty()) {
        logger::error("Failed to read manifest: " + path);
        return false;
    }
    std::string error;
    if (!tile_manifest::parse_manifest(bytes.data(), bytes.size(), manifest, error)) {
        logger::error("Invalid manifest " + path + ": " + error);
        return false;
    }
    return true;
}
} // namespace

int run_merge_mode(const Options& opts) {
    logger::info("Running merge mode");

    if (opts.tile_dir.empty() || opts.output_path.empty()) {
        logger::error("Merge mode requires --tile-dir and --output");
        return 1;
    }
    if (!image_io::is_supported_format(opts.output_format)) {
        logger::error("Unsupported format: " + opts.output_format);
        return 1;
    }
    const std::string extension = image_io::normalize_format(opts.output_format);

    tile_manifest::Manifest manifest;
    if (!load_manifest(resolve_manifest_path(opts), manifest)) {
        return 1;
    }

    const std::filesystem::path tile_dir(opts.tile_dir);
    std::vector<tiling::TileWithImage> tiles_with_images;
    tiles_with_images.reserve(manifest.tiles.size());
    for (size_t i = 0; i < manifest.tiles.size(); ++i) {
        const std::string path = (tile_dir / tile_manifest::tile_file_name(i, extension)).string();
        const auto encoded = file_io::read_entire_file(path);
        if (encoded.empty()) {
            logger::error("Failed to read tile file: " + path);
            return 1;
        }

        tiling::TileWithImage entry;
        entry.tile = manifest.tiles[i];
        if (!image_io::decode_image(encoded.data(), encoded.size(), entry.image)) {
            logger::error("Failed to decode tile file: " + path);
            return 1;
        }
        tiles_with_images.push_back(std::move(entry));
    }

    tiling::MergeConfig config;
    config.blend_amount = opts.blend;
    config.anchor = opts.blend_anchor == "center" ? tiling::BlendAnchor::Center : tiling::BlendAnchor::Edge;

    tiling::PixelBuffer canvas = tiling::make_canvas(
        manifest.image_width, manifest.image_height, tiles_with_images.front().image);

    tiling::TileError error;
    if (!tiling::merge_tiles(canvas, tiles_with_images, config, error)) {
        logger::error(std::string(tiling::error_kind_name(error.kind)) + ": " + error.message);
        return 1;
    }

    std::vector<uint8_t> output_data;
    if (!image_io::encode_image(canvas, extension, output_data)) {
        logger::error("Failed to encode merged image");
        return 1;
    }

    if (!file_io::write_entire_file(opts.output_path, output_data)) {
        logger::error("Failed to write output file: " + opts.output_path);
        return 1;
    }

    logger::info("Merge mode completed: " + opts.output_path + " (" +
                 std::to_string(output_data.size()) + " bytes)");
    return 0;
}
