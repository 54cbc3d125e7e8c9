#include "options.hpp"

#include <cxxopts.hpp>
#include <filesystem>
#include <iostream>
#include <string>

namespace {
bool parse_mode(const std::string& value, Options::Mode& mode) {
    if (value == "plan") {
        mode = Options::Mode::Plan;
        return true;
    }
    if (value == "split") {
        mode = Options::Mode::Split;
        return true;
    }
    if (value == "merge") {
        mode = Options::Mode::Merge;
        return true;
    }
    return false;
}
} // namespace

bool parse_options(int argc, char** argv, Options& opts) {
    try {
        cxxopts::Options parser("tilestitch", "Split images into overlapping tiles and blend them back");
        parser.add_options()
            ("mode", "Mode (plan|split|merge)", cxxopts::value<std::string>()->default_value("plan"))
            ("input", "Input image (split)", cxxopts::value<std::string>()->default_value(""))
            ("output", "Output image (merge)", cxxopts::value<std::string>()->default_value(""))
            ("manifest", "Tile manifest path", cxxopts::value<std::string>()->default_value(""))
            ("tile-dir", "Directory holding tile images", cxxopts::value<std::string>()->default_value(""))
            ("image-width", "Image width (plan)", cxxopts::value<int>()->default_value("1024"))
            ("image-height", "Image height (plan)", cxxopts::value<int>()->default_value("1024"))
            ("tile-width", "Tile width", cxxopts::value<int>()->default_value("576"))
            ("tile-height", "Tile height", cxxopts::value<int>()->default_value("576"))
            ("overlap", "Minimum overlap between adjacent tiles", cxxopts::value<int>()->default_value("128"))
            ("blend", "Blend ramp width in pixels (merge)", cxxopts::value<int>()->default_value("64"))
            ("blend-anchor", "Ramp placement (edge|center)", cxxopts::value<std::string>()->default_value("edge"))
            ("format", "Image format for tiles and output (png|jpg|webp)", cxxopts::value<std::string>()->default_value("png"))
            ("verbose", "Verbose logging",
                cxxopts::value<bool>()->default_value("false")->implicit_value("true"))
            ("debug", "Per-tile debug logging",
                cxxopts::value<bool>()->default_value("false")->implicit_value("true"))
            ("help", "Print help");

        auto result = parser.parse(argc, argv);
        if (result.count("help")) {
            std::cout << parser.help() << "\n";
            return false;
        }

        const std::string mode = result["mode"].as<std::string>();
        if (!parse_mode(mode, opts.mode)) {
            std::cerr << "Invalid arguments: unknown mode '" << mode << "'\n";
            return false;
        }

        opts.blend_anchor = result["blend-anchor"].as<std::string>();
        if (opts.blend_anchor != "edge" && opts.blend_anchor != "center") {
            std::cerr << "Invalid arguments: --blend-anchor must be edge or center\n";
            return false;
        }

        opts.input_path = result["input"].as<std::string>();
        opts.output_path = result["output"].as<std::string>();
        opts.manifest_path = result["manifest"].as<std::string>();
        opts.tile_dir = result["tile-dir"].as<std::string>();
        opts.image_width = result["image-width"].as<int>();
        opts.image_height = result["image-height"].as<int>();
        opts.tile_width = result["tile-width"].as<int>();
        opts.tile_height = result["tile-height"].as<int>();
        opts.overlap = result["overlap"].as<int>();
        opts.blend = result["blend"].as<int>();
        opts.output_format = result["format"].as<std::string>();
        opts.verbose = result["verbose"].as<bool>();
        opts.debug = result["debug"].as<bool>();

        return true;
    } catch (const cxxopts::exceptions::exception& ex) {
        std::cerr << "Invalid arguments: " << ex.what() << "\n";
        return false;
    }
}

std::string resolve_manifest_path(const Options& opts) {
    if (!opts.manifest_path.empty()) {
        return opts.manifest_path;
    }
    if (opts.tile_dir.empty()) {
        return {};
    }
    return (std::filesystem::path(opts.tile_dir) / "tiles.manifest").string();
}
