#pragma once

#include "pixel_buffer.hpp"
#include "tiling.hpp"

#include <vector>

namespace tiling {

/// A planned tile together with the processed pixels for its rectangle.
struct TileWithImage {
    Tile tile;
    PixelBuffer image;
};

/// Where the blend ramp sits inside an overlap.
enum class BlendAnchor {
    Edge,    // ramp starts at the tile edge
    Center,  // ramp centred in the overlap, earlier tile kept before it
};

struct MergeConfig {
    int blend_amount = 0;
    BlendAnchor anchor = BlendAnchor::Edge;
};

/// Canvas for `merge_tiles`: zero-filled, shaped like the first tile image.
PixelBuffer make_canvas(int width, int height, const PixelBuffer& like);

/**
 * Composite tile images into `canvas` (in place).
 *
 * Tiles spanning the same rows form a band. Each band is assembled left to
 * right, then the bands are blended onto the canvas top to bottom, so a corner
 * where four tiles meet is the bilinear mix of the four. At every seam between
 * coordinate neighbours the tile supplied later fades in over the earlier one
 * across `blend_amount` pixels with a linear alpha ramp, starting at its own
 * edge; between bands, the band whose first tile was supplied later fades in.
 * Input order changes which side of a seam ramps, never the continuity of the
 * result. Results are rounded and clamped to the sample range.
 *
 * All inputs are validated before the canvas is touched, so a failed call
 * leaves it unchanged. Failures:
 *   InvalidGeometry     - empty input, negative blend, bad buffer shape,
 *                         tile outside the canvas
 *   ChannelMismatch     - channel count / sample type differs from the first
 *                         tile (or from the canvas)
 *   InsufficientOverlap - blend_amount wider than an overlap shared by two
 *                         tiles of the input
 */
bool merge_tiles(PixelBuffer& canvas,
                 const std::vector<TileWithImage>& tiles_with_images,
                 const MergeConfig& config,
                 TileError& error);

bool merge_tiles(PixelBuffer& canvas,
                 const std::vector<TileWithImage>& tiles_with_images,
                 int blend_amount,
                 TileError& error);

/// Alpha of the incoming tile `distance` pixels inside a blended edge.
double edge_alpha(int distance, int blend_amount, int ramp_offset);

} // namespace tiling
