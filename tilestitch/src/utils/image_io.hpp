#pragma once

#include "pixel_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace image_io {

/// Decode PNG/JPEG/WebP/... bytes into an 8-bit RGB buffer.
bool decode_image(const uint8_t* data, size_t size, tiling::PixelBuffer& out);

/// Encode an 8-bit RGB or RGBA buffer. `format` is "webp", "png" or "jpg".
bool encode_image(const tiling::PixelBuffer& img, const std::string& format, std::vector<uint8_t>& out);

/// Lower-cased format name, "png" when empty.
std::string normalize_format(const std::string& format);
bool is_supported_format(const std::string& format);

} // namespace image_io
