#include "tiling.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cstring>

namespace tiling {

namespace {

bool fail(TileError& error, TileErrorKind kind, const std::string& message) {
    error.kind = kind;
    error.message = message;
    return false;
}

// Start offsets of the tiles along one axis.
bool plan_axis(const char* axis,
               int image_dim,
               int tile_dim,
               int min_overlap,
               std::vector<int>& starts,
               TileError& error) {
    starts.clear();

    if (image_dim == tile_dim) {
        starts.push_back(0);
        return true;
    }

    const int stride = tile_dim - min_overlap;
    if (stride < 1) {
        return fail(error, TileErrorKind::InvalidGeometry,
                    std::string("overlap ") + std::to_string(min_overlap) +
                    " must be smaller than tile " + axis + " " + std::to_string(tile_dim));
    }

    const int span = image_dim - tile_dim;
    const int count = (span + stride - 1) / stride + 1;
    starts.reserve(count);
    for (int i = 0; i < count; ++i) {
        const long long nominal = static_cast<long long>(i) * stride;
        starts.push_back(static_cast<int>(std::min<long long>(nominal, span)));
    }
    return true;
}

bool same_rows(const Rect& a, const Rect& b) {
    return a.top == b.top && a.bottom == b.bottom;
}

bool same_columns(const Rect& a, const Rect& b) {
    return a.left == b.left && a.right == b.right;
}

// `first` lies before `second` on the axis and overlaps it by exactly `overlap`.
bool abuts(int first_start, int first_end, int second_start, int overlap) {
    return overlap > 0 && first_start < second_start && first_end - second_start == overlap;
}

} // namespace

bool operator==(const Rect& a, const Rect& b) {
    return a.top == b.top && a.left == b.left && a.bottom == b.bottom && a.right == b.right;
}

bool operator!=(const Rect& a, const Rect& b) {
    return !(a == b);
}

bool operator==(const EdgeOverlap& a, const EdgeOverlap& b) {
    return a.top == b.top && a.bottom == b.bottom && a.left == b.left && a.right == b.right;
}

bool operator!=(const EdgeOverlap& a, const EdgeOverlap& b) {
    return !(a == b);
}

bool operator==(const Tile& a, const Tile& b) {
    return a.coords == b.coords && a.overlap == b.overlap;
}

bool operator!=(const Tile& a, const Tile& b) {
    return !(a == b);
}

const char* error_kind_name(TileErrorKind kind) {
    switch (kind) {
        case TileErrorKind::None:
            return "None";
        case TileErrorKind::InvalidGeometry:
            return "InvalidGeometry";
        case TileErrorKind::ChannelMismatch:
            return "ChannelMismatch";
        case TileErrorKind::InsufficientOverlap:
            return "InsufficientOverlap";
    }
    return "Unknown";
}

bool plan_tiles(const PlanRequest& request, std::vector<Tile>& tiles, TileError& error) {
    tiles.clear();
    error = TileError{};

    if (request.image_width <= 0 || request.image_height <= 0) {
        return fail(error, TileErrorKind::InvalidGeometry,
                    "image size must be positive, got " + std::to_string(request.image_width) +
                    "x" + std::to_string(request.image_height));
    }
    if (request.tile_width <= 0 || request.tile_height <= 0) {
        return fail(error, TileErrorKind::InvalidGeometry,
                    "tile size must be positive, got " + std::to_string(request.tile_width) +
                    "x" + std::to_string(request.tile_height));
    }
    if (request.min_overlap < 0) {
        return fail(error, TileErrorKind::InvalidGeometry,
                    "overlap must not be negative, got " + std::to_string(request.min_overlap));
    }
    if (request.tile_width > request.image_width || request.tile_height > request.image_height) {
        return fail(error, TileErrorKind::InvalidGeometry,
                    "tile " + std::to_string(request.tile_width) + "x" +
                    std::to_string(request.tile_height) + " does not fit image " +
                    std::to_string(request.image_width) + "x" + std::to_string(request.image_height));
    }

    std::vector<int> starts_x;
    std::vector<int> starts_y;
    if (!plan_axis("width", request.image_width, request.tile_width, request.min_overlap, starts_x, error) ||
        !plan_axis("height", request.image_height, request.tile_height, request.min_overlap, starts_y, error)) {
        return false;
    }

    const int tiles_x = static_cast<int>(starts_x.size());
    const int tiles_y = static_cast<int>(starts_y.size());

    logger::info("Tiling: image " + std::to_string(request.image_width) + "x" +
                 std::to_string(request.image_height) + " → " + std::to_string(tiles_x) + "x" +
                 std::to_string(tiles_y) + " tiles (size=" + std::to_string(request.tile_width) +
                 "x" + std::to_string(request.tile_height) +
                 ", overlap=" + std::to_string(request.min_overlap) + ")");

    tiles.reserve(static_cast<size_t>(tiles_x) * tiles_y);
    for (int ty = 0; ty < tiles_y; ++ty) {
        for (int tx = 0; tx < tiles_x; ++tx) {
            Tile tile;
            tile.coords.top = starts_y[ty];
            tile.coords.bottom = starts_y[ty] + request.tile_height;
            tile.coords.left = starts_x[tx];
            tile.coords.right = starts_x[tx] + request.tile_width;

            // Overlaps are measured on the clamped rectangles, not the nominal stride.
            if (ty > 0) {
                tile.overlap.top = starts_y[ty - 1] + request.tile_height - tile.coords.top;
            }
            if (ty + 1 < tiles_y) {
                tile.overlap.bottom = tile.coords.bottom - starts_y[ty + 1];
            }
            if (tx > 0) {
                tile.overlap.left = starts_x[tx - 1] + request.tile_width - tile.coords.left;
            }
            if (tx + 1 < tiles_x) {
                tile.overlap.right = tile.coords.right - starts_x[tx + 1];
            }

            tiles.push_back(tile);
        }
    }

    if (logger::enabled(logger::Level::Debug)) {
        for (size_t i = 0; i < tiles.size(); ++i) {
            logger::debug("Tiling: tile " + std::to_string(i) + " " + describe(tiles[i]));
        }
    }

    logger::info("Tiling: generated " + std::to_string(tiles.size()) + " tiles");
    return true;
}

bool plan_tiles(int image_width,
                int image_height,
                int tile_width,
                int tile_height,
                int min_overlap,
                std::vector<Tile>& tiles,
                TileError& error) {
    PlanRequest request;
    request.image_width = image_width;
    request.image_height = image_height;
    request.tile_width = tile_width;
    request.tile_height = tile_height;
    request.min_overlap = min_overlap;
    return plan_tiles(request, tiles, error);
}

std::vector<TileNeighbors> find_neighbors(const std::vector<Tile>& tiles) {
    std::vector<TileNeighbors> neighbors(tiles.size());

    for (size_t i = 0; i < tiles.size(); ++i) {
        const Rect& a = tiles[i].coords;
        for (size_t j = 0; j < tiles.size(); ++j) {
            if (i == j) {
                continue;
            }
            const Rect& b = tiles[j].coords;
            const int index = static_cast<int>(j);

            if (same_rows(a, b)) {
                // b on the left of a
                if (neighbors[i].left < 0 &&
                    abuts(b.left, b.right, a.left, tiles[i].overlap.left) &&
                    tiles[j].overlap.right == tiles[i].overlap.left) {
                    neighbors[i].left = index;
                }
                // b on the right of a
                if (neighbors[i].right < 0 &&
                    abuts(a.left, a.right, b.left, tiles[i].overlap.right) &&
                    tiles[j].overlap.left == tiles[i].overlap.right) {
                    neighbors[i].right = index;
                }
            }

            if (same_columns(a, b)) {
                if (neighbors[i].top < 0 &&
                    abuts(b.top, b.bottom, a.top, tiles[i].overlap.top) &&
                    tiles[j].overlap.bottom == tiles[i].overlap.top) {
                    neighbors[i].top = index;
                }
                if (neighbors[i].bottom < 0 &&
                    abuts(a.top, a.bottom, b.top, tiles[i].overlap.bottom) &&
                    tiles[j].overlap.top == tiles[i].overlap.bottom) {
                    neighbors[i].bottom = index;
                }
            }
        }
    }

    return neighbors;
}

bool extract_tile(const PixelBuffer& source, const Tile& tile, PixelBuffer& tile_data) {
    if (!source.is_consistent()) {
        logger::error("Tiling: extract_tile() inconsistent source buffer " + describe(source));
        return false;
    }

    const Rect& r = tile.coords;
    if (r.top < 0 || r.left < 0 || r.bottom > source.height || r.right > source.width ||
        r.width() <= 0 || r.height() <= 0) {
        logger::error("Tiling: extract_tile() tile " + describe(tile) + " outside source " +
                      describe(source));
        return false;
    }

    tile_data = make_buffer(r.width(), r.height(), source.channels, source.sample_type);

    const size_t pixel_stride = source.pixel_stride();
    const size_t copy_bytes = tile_data.row_stride();
    for (int y = 0; y < r.height(); ++y) {
        const uint8_t* source_row = source.data.data() +
                                    static_cast<size_t>(r.top + y) * source.row_stride() +
                                    static_cast<size_t>(r.left) * pixel_stride;
        uint8_t* tile_row = tile_data.data.data() + static_cast<size_t>(y) * copy_bytes;
        std::memcpy(tile_row, source_row, copy_bytes);
    }

    return true;
}

std::string describe(const Tile& tile) {
    const Rect& c = tile.coords;
    const EdgeOverlap& o = tile.overlap;
    return "[top=" + std::to_string(c.top) + " left=" + std::to_string(c.left) +
           " bottom=" + std::to_string(c.bottom) + " right=" + std::to_string(c.right) +
           " | overlap t/b/l/r=" + std::to_string(o.top) + "/" + std::to_string(o.bottom) + "/" +
           std::to_string(o.left) + "/" + std::to_string(o.right) + "]";
}

} // namespace tiling
