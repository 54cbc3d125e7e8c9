#pragma once

#include "pixel_buffer.hpp"

#include <string>
#include <vector>

/**
 * Tile geometry for processing large images in independent chunks.
 *
 * An image is covered by a row-major grid of equally sized tiles. Consecutive
 * tiles are spaced by (tile - min_overlap); the last tile of a row/column is
 * pushed back flush with the image edge, so its overlap with the previous tile
 * can be larger than requested. Every tile records the overlap it actually has
 * with each neighbour, which is what the compositor blends across.
 */

namespace tiling {

/// Pixel rectangle, right/bottom exclusive.
struct Rect {
    int top = 0;
    int left = 0;
    int bottom = 0;
    int right = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
};

/// Overlap in pixels with the neighbour on each side (0 = no neighbour).
struct EdgeOverlap {
    int top = 0;
    int bottom = 0;
    int left = 0;
    int right = 0;
};

struct Tile {
    Rect coords;
    EdgeOverlap overlap;
};

bool operator==(const Rect& a, const Rect& b);
bool operator!=(const Rect& a, const Rect& b);
bool operator==(const EdgeOverlap& a, const EdgeOverlap& b);
bool operator!=(const EdgeOverlap& a, const EdgeOverlap& b);
bool operator==(const Tile& a, const Tile& b);
bool operator!=(const Tile& a, const Tile& b);

enum class TileErrorKind {
    None = 0,
    InvalidGeometry,
    ChannelMismatch,
    InsufficientOverlap,
};

struct TileError {
    TileErrorKind kind = TileErrorKind::None;
    std::string message;
};

const char* error_kind_name(TileErrorKind kind);

/// Grid request. Defaults match a 1024px image cut into 576px tiles.
struct PlanRequest {
    int image_width = 1024;
    int image_height = 1024;
    int tile_width = 576;
    int tile_height = 576;
    int min_overlap = 128;
};

/// Compute the tiles covering the requested image, row-major.
/// On failure `tiles` is left empty and `error` describes the problem.
bool plan_tiles(const PlanRequest& request, std::vector<Tile>& tiles, TileError& error);

bool plan_tiles(int image_width,
                int image_height,
                int tile_width,
                int tile_height,
                int min_overlap,
                std::vector<Tile>& tiles,
                TileError& error);

/// Index of the adjacent tile on each side, or -1.
struct TileNeighbors {
    int top = -1;
    int bottom = -1;
    int left = -1;
    int right = -1;
};

/// Match tiles by coordinate adjacency. Two tiles are neighbours across an edge
/// when they span the same rows (or columns) and the overlap recorded on that
/// edge is exactly the intersection of their rectangles. List order is ignored.
std::vector<TileNeighbors> find_neighbors(const std::vector<Tile>& tiles);

/// Copy the tile's rectangle out of `source`.
bool extract_tile(const PixelBuffer& source, const Tile& tile, PixelBuffer& tile_data);

std::string describe(const Tile& tile);

} // namespace tiling
