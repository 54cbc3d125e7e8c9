#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace file_io {

/// Whole file contents, empty on failure.
std::vector<uint8_t> read_entire_file(const std::string& path);

/// Creates missing parent directories.
bool write_entire_file(const std::string& path, const std::vector<uint8_t>& data);

} // namespace file_io
