#pragma once

#include "utils/tiling.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

/**
 * Binary tile manifest, little-endian:
 *
 *   u32 magic 'TILE' | u8 version | u32 image_width | u32 image_height | u32 tile_count
 *   tile_count x { u32 top, left, bottom, right, overlap_top, overlap_bottom, overlap_left, overlap_right }
 */
namespace tile_manifest {

constexpr uint32_t kManifestMagic = 0x454C4954; // 'TILE'
constexpr uint8_t kManifestVersion = 1;
constexpr size_t kManifestHeaderSize = 4 + 1 + 4 + 4 + 4;
constexpr size_t kTileRecordSize = 8 * 4;
constexpr uint32_t kMaxTiles = 1u << 20;
constexpr uint32_t kMaxImageDimension = 1u << 20;

struct Manifest {
    int image_width = 0;
    int image_height = 0;
    std::vector<tiling::Tile> tiles;
};

constexpr uint32_t decode_u32_le(const uint8_t* ptr) {
    return static_cast<uint32_t>(ptr[0]) |
           (static_cast<uint32_t>(ptr[1]) << 8) |
           (static_cast<uint32_t>(ptr[2]) << 16) |
           (static_cast<uint32_t>(ptr[3]) << 24);
}

inline void append_u32_le(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

inline bool read_le_u32(const uint8_t*& ptr, size_t& remaining, uint32_t& value) {
    if (remaining < 4) {
        return false;
    }
    value = decode_u32_le(ptr);
    ptr += 4;
    remaining -= 4;
    return true;
}

inline std::vector<uint8_t> encode_manifest(const Manifest& manifest) {
    std::vector<uint8_t> buffer;
    buffer.reserve(kManifestHeaderSize + manifest.tiles.size() * kTileRecordSize);

    append_u32_le(buffer, kManifestMagic);
    buffer.push_back(kManifestVersion);
    append_u32_le(buffer, static_cast<uint32_t>(manifest.image_width));
    append_u32_le(buffer, static_cast<uint32_t>(manifest.image_height));
    append_u32_le(buffer, static_cast<uint32_t>(manifest.tiles.size()));

    for (const auto& tile : manifest.tiles) {
        append_u32_le(buffer, static_cast<uint32_t>(tile.coords.top));
        append_u32_le(buffer, static_cast<uint32_t>(tile.coords.left));
        append_u32_le(buffer, static_cast<uint32_t>(tile.coords.bottom));
        append_u32_le(buffer, static_cast<uint32_t>(tile.coords.right));
        append_u32_le(buffer, static_cast<uint32_t>(tile.overlap.top));
        append_u32_le(buffer, static_cast<uint32_t>(tile.overlap.bottom));
        append_u32_le(buffer, static_cast<uint32_t>(tile.overlap.left));
        append_u32_le(buffer, static_cast<uint32_t>(tile.overlap.right));
    }

    return buffer;
}

inline bool parse_manifest(const uint8_t* data,
                           size_t size,
                           Manifest& manifest,
                           std::string& error) {
    const uint8_t* ptr = data;
    size_t remaining = size;

    if (!data || remaining < kManifestHeaderSize) {
        error = "payload too small for manifest header";
        return false;
    }

    uint32_t magic = 0;
    read_le_u32(ptr, remaining, magic);
    if (magic != kManifestMagic) {
        error = "invalid magic, expected TILE";
        return false;
    }

    const uint8_t version = *ptr++;
    remaining -= 1;
    if (version != kManifestVersion) {
        error = "unsupported manifest version " + std::to_string(version);
        return false;
    }

    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t tile_count = 0;
    read_le_u32(ptr, remaining, width);
    read_le_u32(ptr, remaining, height);
    read_le_u32(ptr, remaining, tile_count);

    if (width == 0 || height == 0 || width > kMaxImageDimension || height > kMaxImageDimension) {
        error = "image size out of range: " + std::to_string(width) + "x" + std::to_string(height);
        return false;
    }
    if (tile_count == 0) {
        error = "tile_count must be positive";
        return false;
    }
    if (tile_count > kMaxTiles) {
        error = "tile_count exceeds limit: " + std::to_string(tile_count);
        return false;
    }
    if (remaining < static_cast<size_t>(tile_count) * kTileRecordSize) {
        error = "tile records truncated";
        return false;
    }

    manifest.image_width = static_cast<int>(width);
    manifest.image_height = static_cast<int>(height);
    manifest.tiles.clear();
    manifest.tiles.reserve(tile_count);

    for (uint32_t i = 0; i < tile_count; ++i) {
        uint32_t fields[8];
        for (uint32_t& field : fields) {
            read_le_u32(ptr, remaining, field);
            if (field > kMaxImageDimension) {
                error = "tile field out of range for entry " + std::to_string(i);
                return false;
            }
        }

        tiling::Tile tile;
        tile.coords.top = static_cast<int>(fields[0]);
        tile.coords.left = static_cast<int>(fields[1]);
        tile.coords.bottom = static_cast<int>(fields[2]);
        tile.coords.right = static_cast<int>(fields[3]);
        tile.overlap.top = static_cast<int>(fields[4]);
        tile.overlap.bottom = static_cast<int>(fields[5]);
        tile.overlap.left = static_cast<int>(fields[6]);
        tile.overlap.right = static_cast<int>(fields[7]);

        const tiling::Rect& r = tile.coords;
        if (r.top >= r.bottom || r.left >= r.right ||
            r.bottom > manifest.image_height || r.right > manifest.image_width) {
            error = "tile " + std::to_string(i) + " outside image bounds";
            return false;
        }

        manifest.tiles.push_back(tile);
    }

    if (remaining > 0) {
        error = "trailing bytes after tiles";
        return false;
    }

    return true;
}

/// File name of tile `index` inside a tile directory, e.g. "tile_0007.png".
inline std::string tile_file_name(size_t index, const std::string& extension) {
    char name[32];
    std::snprintf(name, sizeof(name), "tile_%04zu.", index);
    return std::string(name) + extension;
}

} // namespace tile_manifest
