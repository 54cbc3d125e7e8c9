#pragma once

#include <string>

struct Options {
    enum class Mode { Plan, Split, Merge };

    Mode mode = Mode::Plan;
    int image_width = 1024;
    int image_height = 1024;
    int tile_width = 576;
    int tile_height = 576;
    int overlap = 128;
    int blend = 64;
    std::string blend_anchor = "edge";
    std::string input_path;
    std::string output_path;
    std::string manifest_path;  // Empty: <tile-dir>/tiles.manifest
    std::string tile_dir;
    std::string output_format = "png";
    bool verbose = false;
    bool debug = false;
};

bool parse_options(int argc, char** argv, Options& opts);

/// Manifest location for split/merge.
std::string resolve_manifest_path(const Options& opts);
