#include "utils/tiling.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace {

using tiling::Tile;
using tiling::TileError;
using tiling::TileErrorKind;

bool check(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << "\n";
    }
    return condition;
}

bool plan(int iw, int ih, int tw, int th, int overlap, std::vector<Tile>& tiles) {
    TileError error;
    if (!tiling::plan_tiles(iw, ih, tw, th, overlap, tiles, error)) {
        std::cerr << "plan_tiles rejected valid input: " << error.message << "\n";
        return false;
    }
    return true;
}

bool test_reference_grid() {
    std::vector<Tile> tiles;
    if (!plan(1024, 1024, 576, 576, 128, tiles)) {
        return false;
    }
    if (!check(tiles.size() == 4, "1024/576/128 must give a 2x2 grid")) {
        return false;
    }

    Tile expected[4];
    expected[0].coords = {0, 0, 576, 576};
    expected[0].overlap = {0, 128, 0, 128};
    expected[1].coords = {0, 448, 576, 1024};
    expected[1].overlap = {0, 128, 128, 0};
    expected[2].coords = {448, 0, 1024, 576};
    expected[2].overlap = {128, 0, 0, 128};
    expected[3].coords = {448, 448, 1024, 1024};
    expected[3].overlap = {128, 0, 128, 0};

    bool ok = true;
    for (int i = 0; i < 4; ++i) {
        ok &= check(tiles[i] == expected[i],
                    "tile " + std::to_string(i) + " is " + tiling::describe(tiles[i]) +
                    ", expected " + tiling::describe(expected[i]));
    }
    return ok;
}

bool test_last_tile_clamped() {
    std::vector<Tile> tiles;
    if (!plan(1000, 600, 512, 512, 64, tiles)) {
        return false;
    }
    // Columns start at 0, 448, 488 (clamped); rows at 0, 88 (clamped).
    if (!check(tiles.size() == 6, "1000x600 with 512 tiles must give 3x2 tiles")) {
        return false;
    }

    bool ok = true;
    ok &= check(tiles[1].coords.left == 448 && tiles[1].coords.right == 960, "second column");
    ok &= check(tiles[2].coords.left == 488 && tiles[2].coords.right == 1000, "last column flush right");
    ok &= check(tiles[0].overlap.right == 64 && tiles[1].overlap.left == 64, "nominal overlap kept");
    ok &= check(tiles[1].overlap.right == 472 && tiles[2].overlap.left == 472,
                "clamped column records its actual overlap");
    ok &= check(tiles[3].coords.top == 88 && tiles[3].coords.bottom == 600, "last row flush bottom");
    ok &= check(tiles[0].overlap.bottom == 424 && tiles[3].overlap.top == 424,
                "clamped row records its actual overlap");
    ok &= check(tiles[2].overlap.right == 0 && tiles[5].overlap.bottom == 0, "boundary edges have no overlap");
    return ok;
}

bool test_single_tile() {
    std::vector<Tile> tiles;
    if (!plan(300, 200, 300, 200, 50, tiles)) {
        return false;
    }
    Tile expected;
    expected.coords = {0, 0, 200, 300};
    return check(tiles.size() == 1 && tiles[0] == expected, "image-sized tile must be the only tile");
}

bool test_single_column() {
    std::vector<Tile> tiles;
    if (!plan(512, 1000, 512, 512, 64, tiles)) {
        return false;
    }
    bool ok = check(tiles.size() == 3, "512x1000 must give one column of 3 tiles");
    for (const auto& tile : tiles) {
        ok &= check(tile.coords.left == 0 && tile.coords.right == 512 &&
                    tile.overlap.left == 0 && tile.overlap.right == 0,
                    "single column tile " + tiling::describe(tile));
    }
    return ok;
}

bool test_coverage_and_overlap_bounds() {
    bool ok = true;
    for (int iw = 1; iw <= 23 && ok; iw += 2) {
        for (int ih = 1; ih <= 19 && ok; ih += 3) {
            for (int tw = 1; tw <= iw && ok; ++tw) {
                for (int th = 1; th <= ih && ok; th += 2) {
                    for (int overlap = 0; overlap < std::min(tw, th); ++overlap) {
                        std::vector<Tile> tiles;
                        if (!plan(iw, ih, tw, th, overlap, tiles)) {
                            return false;
                        }

                        std::vector<int> hits(static_cast<size_t>(iw) * ih, 0);
                        for (const auto& tile : tiles) {
                            const auto& c = tile.coords;
                            ok &= check(c.top >= 0 && c.left >= 0 && c.bottom <= ih && c.right <= iw &&
                                        c.width() == tw && c.height() == th,
                                        "tile inside image with requested size");
                            for (int y = c.top; y < c.bottom; ++y) {
                                for (int x = c.left; x < c.right; ++x) {
                                    ++hits[static_cast<size_t>(y) * iw + x];
                                }
                            }
                        }
                        ok &= check(std::find(hits.begin(), hits.end(), 0) == hits.end(),
                                    "grid " + std::to_string(iw) + "x" + std::to_string(ih) +
                                    " tile " + std::to_string(tw) + "x" + std::to_string(th) +
                                    " overlap " + std::to_string(overlap) + " leaves a gap");

                        const auto neighbors = tiling::find_neighbors(tiles);
                        for (size_t i = 0; i < tiles.size(); ++i) {
                            const auto& o = tiles[i].overlap;
                            // Only the clamped last column/row may overlap more than requested.
                            if (neighbors[i].right >= 0) {
                                const bool last_column = tiles[neighbors[i].right].coords.right == iw;
                                ok &= check(last_column ? o.right >= overlap : o.right == overlap,
                                            "right overlap " + std::to_string(o.right) + " for minimum " +
                                            std::to_string(overlap));
                            }
                            if (neighbors[i].bottom >= 0) {
                                const bool last_row = tiles[neighbors[i].bottom].coords.bottom == ih;
                                ok &= check(last_row ? o.bottom >= overlap : o.bottom == overlap,
                                            "bottom overlap " + std::to_string(o.bottom) + " for minimum " +
                                            std::to_string(overlap));
                            }
                            ok &= check((o.left > 0) == (neighbors[i].left >= 0),
                                        "left overlap recorded iff a left neighbour exists");
                            ok &= check((o.top > 0) == (neighbors[i].top >= 0),
                                        "top overlap recorded iff a top neighbour exists");
                        }
                        if (!ok) {
                            return false;
                        }
                    }
                }
            }
        }
    }
    return ok;
}

bool test_row_major_order() {
    std::vector<Tile> tiles;
    if (!plan(1000, 1000, 400, 300, 50, tiles)) {
        return false;
    }
    bool ok = true;
    for (size_t i = 1; i < tiles.size(); ++i) {
        const auto& prev = tiles[i - 1].coords;
        const auto& cur = tiles[i].coords;
        ok &= check(cur.top > prev.top || (cur.top == prev.top && cur.left > prev.left),
                    "tiles must be emitted row-major");
    }
    return ok;
}

bool expect_failure(const tiling::PlanRequest& request, const std::string& what) {
    std::vector<Tile> tiles;
    TileError error;
    const bool planned = tiling::plan_tiles(request, tiles, error);
    return check(!planned && error.kind == TileErrorKind::InvalidGeometry && tiles.empty() &&
                 !error.message.empty(),
                 what + " must fail with InvalidGeometry");
}

bool test_invalid_geometry() {
    bool ok = true;

    tiling::PlanRequest request;
    request.tile_width = 2048;
    ok &= expect_failure(request, "tile wider than image");

    request = tiling::PlanRequest{};
    request.min_overlap = 576;
    ok &= expect_failure(request, "overlap equal to tile size");

    request = tiling::PlanRequest{};
    request.min_overlap = -1;
    ok &= expect_failure(request, "negative overlap");

    request = tiling::PlanRequest{};
    request.tile_height = 0;
    ok &= expect_failure(request, "zero tile height");

    request = tiling::PlanRequest{};
    request.image_width = 0;
    ok &= expect_failure(request, "zero image width");

    return ok;
}

bool test_neighbors_ignore_order() {
    std::vector<Tile> tiles;
    if (!plan(1024, 1024, 576, 576, 128, tiles)) {
        return false;
    }
    std::vector<Tile> shuffled = {tiles[3], tiles[0], tiles[2], tiles[1]};
    const auto neighbors = tiling::find_neighbors(shuffled);

    bool ok = true;
    // shuffled[0] is the bottom-right tile
    ok &= check(neighbors[0].top == 3 && neighbors[0].left == 2 &&
                neighbors[0].bottom < 0 && neighbors[0].right < 0, "bottom-right neighbours");
    // shuffled[1] is the top-left tile
    ok &= check(neighbors[1].right == 3 && neighbors[1].bottom == 2 &&
                neighbors[1].top < 0 && neighbors[1].left < 0, "top-left neighbours");
    return ok;
}

bool test_extract_tile() {
    tiling::PixelBuffer source = tiling::make_buffer(8, 6, 3);
    for (size_t i = 0; i < source.data.size(); ++i) {
        source.data[i] = static_cast<uint8_t>(i);
    }

    Tile tile;
    tile.coords = {2, 3, 5, 7};
    tiling::PixelBuffer out;
    if (!check(tiling::extract_tile(source, tile, out), "extract_tile inside bounds")) {
        return false;
    }

    bool ok = check(out.width == 4 && out.height == 3 && out.channels == 3, "extracted shape");
    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 4; ++x) {
            for (int c = 0; c < 3; ++c) {
                const size_t src = (static_cast<size_t>(2 + y) * 8 + (3 + x)) * 3 + c;
                const size_t dst = (static_cast<size_t>(y) * 4 + x) * 3 + c;
                ok &= check(out.data[dst] == source.data[src], "extracted sample");
            }
        }
    }

    tile.coords = {2, 3, 7, 7};
    ok &= check(!tiling::extract_tile(source, tile, out), "tile past the bottom edge is rejected");
    return ok;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_reference_grid();
    ok &= test_last_tile_clamped();
    ok &= test_single_tile();
    ok &= test_single_column();
    ok &= test_coverage_and_overlap_bounds();
    ok &= test_row_major_order();
    ok &= test_invalid_geometry();
    ok &= test_neighbors_ignore_order();
    ok &= test_extract_tile();

    if (!ok) {
        return 1;
    }
    std::cout << "tiling_test passed\n";
    return 0;
}
