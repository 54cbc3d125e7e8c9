#include "utils/file_io.hpp"

#include "utils/logger.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace file_io {

std::vector<uint8_t> read_entire_file(const std::string& path) {
    logger::debug("Reading file from: " + path);
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        logger::warn("Cannot open file: " + path);
        return {};
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>());
}

bool write_entire_file(const std::string& path, const std::vector<uint8_t>& data) {
    if (path.empty()) {
        return false;
    }
    std::filesystem::path output(path);
    if (auto dir = output.parent_path(); !dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            logger::warn("Cannot create directory " + dir.string() + ": " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return file.good();
}

} // namespace file_io
