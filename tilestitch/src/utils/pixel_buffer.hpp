#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace tiling {

enum class SampleType {
    UInt8,
    UInt16,
};

constexpr size_t bytes_per_sample(SampleType type) {
    return type == SampleType::UInt16 ? 2 : 1;
}

constexpr double max_sample_value(SampleType type) {
    return type == SampleType::UInt16 ? 65535.0 : 255.0;
}

inline const char* sample_type_name(SampleType type) {
    return type == SampleType::UInt16 ? "u16" : "u8";
}

/// Interleaved, row-major pixel storage.
/// Samples wider than one byte are stored in native byte order.
struct PixelBuffer {
    int width = 0;
    int height = 0;
    int channels = 0;
    SampleType sample_type = SampleType::UInt8;
    std::vector<uint8_t> data;

    size_t pixel_stride() const {
        return static_cast<size_t>(channels) * bytes_per_sample(sample_type);
    }

    size_t row_stride() const {
        return static_cast<size_t>(width) * pixel_stride();
    }

    size_t expected_size() const {
        if (width <= 0 || height <= 0 || channels <= 0) {
            return 0;
        }
        return static_cast<size_t>(height) * row_stride();
    }

    bool is_consistent() const {
        return width > 0 && height > 0 && channels > 0 && data.size() == expected_size();
    }
};

/// Zero-filled buffer of the given shape.
inline PixelBuffer make_buffer(int width, int height, int channels,
                               SampleType sample_type = SampleType::UInt8) {
    PixelBuffer buffer;
    buffer.width = width;
    buffer.height = height;
    buffer.channels = channels;
    buffer.sample_type = sample_type;
    buffer.data.assign(buffer.expected_size(), 0);
    return buffer;
}

inline double load_sample(const uint8_t* ptr, SampleType type) {
    if (type == SampleType::UInt16) {
        uint16_t value;
        std::memcpy(&value, ptr, sizeof(value));
        return value;
    }
    return *ptr;
}

inline void store_sample(uint8_t* ptr, SampleType type, unsigned value) {
    if (type == SampleType::UInt16) {
        const auto narrow = static_cast<uint16_t>(value);
        std::memcpy(ptr, &narrow, sizeof(narrow));
        return;
    }
    *ptr = static_cast<uint8_t>(value);
}

/// Round to nearest and clamp into the representable range of `type`.
inline unsigned saturate_sample(double value, SampleType type) {
    const double max_value = max_sample_value(type);
    if (!(value > 0.0)) {
        return 0;
    }
    if (value >= max_value) {
        return static_cast<unsigned>(max_value);
    }
    return static_cast<unsigned>(value + 0.5);
}

inline std::string describe(const PixelBuffer& buffer) {
    return std::to_string(buffer.width) + "x" + std::to_string(buffer.height) + "x" +
           std::to_string(buffer.channels) + " " + sample_type_name(buffer.sample_type);
}

} // namespace tiling
