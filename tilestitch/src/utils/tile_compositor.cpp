#include "tile_compositor.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cstring>

namespace tiling {

namespace {

bool fail(TileError& error, TileErrorKind kind, const std::string& message) {
    error.kind = kind;
    error.message = message;
    logger::error("Compositor: " + message);
    return false;
}

// One seam between the tile already in a buffer (resident) and the tile
// pasted next to its right or below it (incoming). The one supplied later fades
// in over `ramp` pixels; a zero ramp is a hard edge at the later tile's border.
struct Seam {
    bool incoming_later = true;
    int overlap = 0;
    int ramp = 0;
    int offset = 0;
};

Seam make_seam(bool incoming_later, int overlap, bool neighbors, const MergeConfig& config) {
    Seam seam;
    seam.incoming_later = incoming_later;
    seam.overlap = std::max(overlap, 0);
    if (neighbors && seam.overlap > 0 && config.blend_amount > 0) {
        seam.ramp = config.blend_amount;
        if (config.anchor == BlendAnchor::Center) {
            seam.offset = seam.overlap / 2 - config.blend_amount / 2;
        }
    }
    return seam;
}

// Alpha of the incoming tile `k` pixels past its leading edge.
double seam_alpha(const Seam& seam, int k) {
    if (seam.incoming_later) {
        return edge_alpha(k, seam.ramp, seam.offset);
    }
    return 1.0 - edge_alpha(seam.overlap - 1 - k, seam.ramp, seam.offset);
}

bool opaque(const Seam& seam) {
    return seam.incoming_later && seam.ramp == 0;
}

bool validate(const PixelBuffer& canvas,
              const std::vector<TileWithImage>& tiles_with_images,
              const MergeConfig& config,
              const std::vector<TileNeighbors>& neighbors,
              TileError& error) {
    if (tiles_with_images.empty()) {
        return fail(error, TileErrorKind::InvalidGeometry, "no tiles to merge");
    }
    if (config.blend_amount < 0) {
        return fail(error, TileErrorKind::InvalidGeometry,
                    "blend amount must not be negative, got " + std::to_string(config.blend_amount));
    }
    if (!canvas.is_consistent()) {
        return fail(error, TileErrorKind::InvalidGeometry,
                    "canvas buffer is inconsistent: " + describe(canvas) + " with " +
                    std::to_string(canvas.data.size()) + " bytes");
    }

    const PixelBuffer& first = tiles_with_images.front().image;
    if (canvas.channels != first.channels || canvas.sample_type != first.sample_type) {
        return fail(error, TileErrorKind::ChannelMismatch,
                    "canvas " + describe(canvas) + " does not match first tile " + describe(first));
    }

    for (size_t i = 0; i < tiles_with_images.size(); ++i) {
        const Tile& tile = tiles_with_images[i].tile;
        const PixelBuffer& image = tiles_with_images[i].image;
        const std::string label = "tile " + std::to_string(i) + " " + describe(tile);

        if (image.channels != first.channels || image.sample_type != first.sample_type) {
            return fail(error, TileErrorKind::ChannelMismatch,
                        label + " image " + describe(image) + " does not match first tile " +
                        describe(first));
        }

        const Rect& r = tile.coords;
        if (r.top < 0 || r.left < 0 || r.width() <= 0 || r.height() <= 0 ||
            r.bottom > canvas.height || r.right > canvas.width) {
            return fail(error, TileErrorKind::InvalidGeometry,
                        label + " lies outside canvas " + describe(canvas));
        }
        if (!image.is_consistent() || image.width != r.width() || image.height != r.height()) {
            return fail(error, TileErrorKind::InvalidGeometry,
                        label + " has image " + describe(image) + " with " +
                        std::to_string(image.data.size()) + " bytes");
        }

        const EdgeOverlap& o = tile.overlap;
        const int b = config.blend_amount;
        const struct {
            const char* name;
            int neighbor;
            int overlap;
        } edges[] = {
            {"top", neighbors[i].top, o.top},
            {"bottom", neighbors[i].bottom, o.bottom},
            {"left", neighbors[i].left, o.left},
            {"right", neighbors[i].right, o.right},
        };
        for (const auto& edge : edges) {
            if (edge.neighbor >= 0 && b > edge.overlap) {
                return fail(error, TileErrorKind::InsufficientOverlap,
                            "blend amount " + std::to_string(b) + " exceeds " + edge.name +
                            " overlap " + std::to_string(edge.overlap) + " between tile " +
                            std::to_string(i) + " and tile " + std::to_string(edge.neighbor));
            }
        }
    }

    return true;
}

void blend_pixel(uint8_t* dst, const uint8_t* src, double alpha, int channels, SampleType type) {
    const size_t sample_bytes = bytes_per_sample(type);
    if (alpha >= 1.0) {
        std::memcpy(dst, src, static_cast<size_t>(channels) * sample_bytes);
        return;
    }
    if (alpha <= 0.0) {
        return;
    }
    for (int c = 0; c < channels; ++c) {
        uint8_t* dst_sample = dst + c * sample_bytes;
        const double existing = load_sample(dst_sample, type);
        const double incoming = load_sample(src + c * sample_bytes, type);
        store_sample(dst_sample, type, saturate_sample(existing * (1.0 - alpha) + incoming * alpha, type));
    }
}

// Tiles spanning the same rows. `first` is the earliest input index among them.
struct Band {
    int top = 0;
    int bottom = 0;
    size_t first = 0;
    std::vector<size_t> members;
};

// Bands top to bottom, members left to right.
std::vector<Band> group_bands(const std::vector<TileWithImage>& tiles_with_images) {
    std::vector<Band> bands;
    for (size_t i = 0; i < tiles_with_images.size(); ++i) {
        const Rect& r = tiles_with_images[i].tile.coords;
        auto it = std::find_if(bands.begin(), bands.end(), [&](const Band& band) {
            return band.top == r.top && band.bottom == r.bottom;
        });
        if (it == bands.end()) {
            Band band;
            band.top = r.top;
            band.bottom = r.bottom;
            band.first = i;
            bands.push_back(band);
            it = bands.end() - 1;
        }
        it->members.push_back(i);
    }

    for (auto& band : bands) {
        std::sort(band.members.begin(), band.members.end(), [&](size_t a, size_t b) {
            const int la = tiles_with_images[a].tile.coords.left;
            const int lb = tiles_with_images[b].tile.coords.left;
            return la != lb ? la < lb : a < b;
        });
    }
    std::sort(bands.begin(), bands.end(), [](const Band& a, const Band& b) {
        return a.top != b.top ? a.top < b.top : a.first < b.first;
    });
    return bands;
}

void compose_into_band(PixelBuffer& band, const TileWithImage& entry, const Seam& seam) {
    const Rect& r = entry.tile.coords;
    const PixelBuffer& image = entry.image;
    const size_t pixel_stride = band.pixel_stride();
    const int width = r.width();

    if (opaque(seam)) {
        for (int y = 0; y < r.height(); ++y) {
            std::memcpy(band.data.data() + static_cast<size_t>(y) * band.row_stride() +
                            static_cast<size_t>(r.left) * pixel_stride,
                        image.data.data() + static_cast<size_t>(y) * image.row_stride(),
                        image.row_stride());
        }
        return;
    }

    std::vector<double> alpha(width);
    for (int x = 0; x < width; ++x) {
        alpha[x] = seam_alpha(seam, x);
    }

    for (int y = 0; y < r.height(); ++y) {
        uint8_t* dst = band.data.data() + static_cast<size_t>(y) * band.row_stride() +
                       static_cast<size_t>(r.left) * pixel_stride;
        const uint8_t* src = image.data.data() + static_cast<size_t>(y) * image.row_stride();
        for (int x = 0; x < width; ++x, dst += pixel_stride, src += pixel_stride) {
            blend_pixel(dst, src, alpha[x], band.channels, band.sample_type);
        }
    }
}

void paste_band(PixelBuffer& canvas, const PixelBuffer& band_pixels, int top, const std::vector<int>& owner,
                const std::vector<Seam>& column_seams) {
    const size_t pixel_stride = canvas.pixel_stride();
    for (int y = 0; y < band_pixels.height; ++y) {
        uint8_t* dst = canvas.data.data() + static_cast<size_t>(top + y) * canvas.row_stride();
        const uint8_t* src = band_pixels.data.data() + static_cast<size_t>(y) * band_pixels.row_stride();
        for (int x = 0; x < canvas.width; ++x) {
            if (owner[x] < 0) {
                continue;
            }
            blend_pixel(dst + x * pixel_stride, src + x * pixel_stride, seam_alpha(column_seams[x], y),
                        canvas.channels, canvas.sample_type);
        }
    }
}

} // namespace

double edge_alpha(int distance, int blend_amount, int ramp_offset) {
    const int k = distance - ramp_offset;
    if (k < 0) {
        return 0.0;
    }
    if (k >= blend_amount) {
        return 1.0;
    }
    if (blend_amount == 1) {
        return 0.0;
    }
    return static_cast<double>(k) / static_cast<double>(blend_amount - 1);
}

PixelBuffer make_canvas(int width, int height, const PixelBuffer& like) {
    return make_buffer(width, height, like.channels, like.sample_type);
}

bool merge_tiles(PixelBuffer& canvas,
                 const std::vector<TileWithImage>& tiles_with_images,
                 const MergeConfig& config,
                 TileError& error) {
    error = TileError{};

    std::vector<Tile> tiles;
    tiles.reserve(tiles_with_images.size());
    for (const auto& entry : tiles_with_images) {
        tiles.push_back(entry.tile);
    }
    const std::vector<TileNeighbors> neighbors = find_neighbors(tiles);

    if (!validate(canvas, tiles_with_images, config, neighbors, error)) {
        return false;
    }

    logger::info("Compositor: merging " + std::to_string(tiles_with_images.size()) +
                 " tiles into " + describe(canvas) + " (blend=" + std::to_string(config.blend_amount) +
                 (config.anchor == BlendAnchor::Center ? ", centered" : ", edge") + ")");

    // Each band is assembled left to right with the horizontal seams, then the
    // bands are laid onto the canvas top to bottom with the vertical seams.
    // Input order only decides which side of a seam fades in.
    const std::vector<Band> bands = group_bands(tiles_with_images);
    const Band* above = nullptr;
    std::vector<int> above_owner;
    size_t merged = 0;

    for (const Band& band : bands) {
        PixelBuffer band_pixels =
            make_buffer(canvas.width, band.bottom - band.top, canvas.channels, canvas.sample_type);
        std::vector<int> owner(canvas.width, -1);

        for (size_t n = 0; n < band.members.size(); ++n) {
            const size_t i = band.members[n];
            const TileWithImage& entry = tiles_with_images[i];

            Seam seam;
            if (n > 0) {
                const size_t prev = band.members[n - 1];
                seam = make_seam(i > prev, tiles_with_images[prev].tile.coords.right - entry.tile.coords.left,
                                 neighbors[i].left == static_cast<int>(prev), config);
            }
            if (logger::enabled(logger::Level::Debug)) {
                logger::debug("Compositor: tile " + std::to_string(i) + " " + describe(entry.tile) +
                              (n == 0 ? std::string(" starts its band")
                                      : " ramp " + std::to_string(seam.ramp) +
                                        (seam.incoming_later ? " over" : " under") + " tile " +
                                        std::to_string(band.members[n - 1])));
            }

            compose_into_band(band_pixels, entry, seam);
            std::fill(owner.begin() + entry.tile.coords.left, owner.begin() + entry.tile.coords.right,
                      static_cast<int>(i));

            ++merged;
            if (merged % 10 == 0 || merged == tiles_with_images.size()) {
                logger::info("Compositor: merged " + std::to_string(merged) + "/" +
                             std::to_string(tiles_with_images.size()) + " tiles");
            }
        }

        std::vector<Seam> column_seams(canvas.width);
        if (above) {
            for (int x = 0; x < canvas.width; ++x) {
                if (owner[x] < 0 || above_owner[x] < 0) {
                    continue;
                }
                const int up = neighbors[owner[x]].top;
                const bool adjacent = up >= 0 && tiles_with_images[up].tile.coords.top == above->top &&
                                      tiles_with_images[up].tile.coords.bottom == above->bottom;
                column_seams[x] = make_seam(band.first > above->first, above->bottom - band.top, adjacent, config);
            }
        }

        paste_band(canvas, band_pixels, band.top, owner, column_seams);
        above = &band;
        above_owner.swap(owner);
    }

    return true;
}

bool merge_tiles(PixelBuffer& canvas,
                 const std::vector<TileWithImage>& tiles_with_images,
                 int blend_amount,
                 TileError& error) {
    MergeConfig config;
    config.blend_amount = blend_amount;
    return merge_tiles(canvas, tiles_with_images, config, error);
}

} // namespace tiling
