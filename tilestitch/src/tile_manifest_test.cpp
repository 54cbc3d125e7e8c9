#include "tile_manifest.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

bool expect_rejected(const std::vector<uint8_t>& payload, const std::string& needle, const char* what) {
    tile_manifest::Manifest manifest;
    std::string error;
    if (tile_manifest::parse_manifest(payload.data(), payload.size(), manifest, error)) {
        std::cerr << what << " accepted\n";
        return false;
    }
    if (error.find(needle) == std::string::npos) {
        std::cerr << what << ": error text missing '" << needle << "', got: " << error << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    using namespace tile_manifest;

    Manifest planned;
    planned.image_width = 1000;
    planned.image_height = 600;
    tiling::TileError plan_error;
    if (!tiling::plan_tiles(1000, 600, 512, 512, 64, planned.tiles, plan_error)) {
        std::cerr << "plan_tiles failed: " << plan_error.message << "\n";
        return 1;
    }

    const auto payload = encode_manifest(planned);
    if (payload.size() != kManifestHeaderSize + planned.tiles.size() * kTileRecordSize) {
        std::cerr << "Unexpected manifest size " << payload.size() << "\n";
        return 1;
    }
    if (decode_u32_le(payload.data()) != kManifestMagic || payload[4] != kManifestVersion) {
        std::cerr << "Manifest header mismatch\n";
        return 1;
    }

    Manifest parsed;
    std::string error;
    if (!parse_manifest(payload.data(), payload.size(), parsed, error)) {
        std::cerr << "Valid manifest rejected: " << error << "\n";
        return 1;
    }
    if (parsed.image_width != 1000 || parsed.image_height != 600 || parsed.tiles != planned.tiles) {
        std::cerr << "Parsed manifest differs from the planned tiles\n";
        return 1;
    }

    bool ok = true;

    auto truncated = payload;
    truncated.resize(truncated.size() - 3);
    ok &= expect_rejected(truncated, "truncated", "Truncated manifest");

    auto trailing = payload;
    trailing.push_back(0);
    ok &= expect_rejected(trailing, "trailing", "Manifest with trailing bytes");

    auto bad_magic = payload;
    bad_magic[0] ^= 0xFF;
    ok &= expect_rejected(bad_magic, "magic", "Manifest with bad magic");

    auto bad_version = payload;
    bad_version[4] = 9;
    ok &= expect_rejected(bad_version, "version", "Manifest with unknown version");

    ok &= expect_rejected(std::vector<uint8_t>(payload.begin(), payload.begin() + 6), "header",
                          "Manifest shorter than its header");

    Manifest empty = planned;
    empty.tiles.clear();
    ok &= expect_rejected(encode_manifest(empty), "tile_count", "Manifest without tiles");

    Manifest outside = planned;
    outside.tiles[0].coords.right = 1001;
    ok &= expect_rejected(encode_manifest(outside), "outside", "Tile outside the image");

    if (tile_file_name(7, "png") != "tile_0007.png") {
        std::cerr << "Unexpected tile file name " << tile_file_name(7, "png") << "\n";
        ok = false;
    }

    if (!ok) {
        return 1;
    }
    std::cout << "tile_manifest_test passed\n";
    return 0;
}
