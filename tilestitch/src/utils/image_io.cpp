#include <algorithm>
#include <cctype>
#include <webp/encode.h>
#include <webp/types.h>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_FAILURE_USERMSG
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#include "utils/image_io.hpp"
#include "utils/logger.hpp"

namespace {
constexpr int kEncodeQuality = 90;

void write_callback(void* user, void* data, int size) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(user);
    const auto* src = static_cast<const uint8_t*>(data);
    buffer->insert(buffer->end(), src, src + size);
}

// RAII wrapper for STB image data
struct STBImageRAII {
    stbi_uc* pixels = nullptr;

    STBImageRAII() = default;
    explicit STBImageRAII(stbi_uc* p) : pixels(p) {}

    ~STBImageRAII() {
        if (pixels) {
            stbi_image_free(pixels);
        }
    }

    STBImageRAII(const STBImageRAII&) = delete;
    STBImageRAII& operator=(const STBImageRAII&) = delete;

    stbi_uc* get() { return pixels; }
};

// RAII wrapper for WebPMemoryWriter
struct WebPMemoryWriterRAII {
    WebPMemoryWriter writer;

    WebPMemoryWriterRAII() {
        WebPMemoryWriterInit(&writer);
    }

    ~WebPMemoryWriterRAII() {
        WebPMemoryWriterClear(&writer);
    }

    WebPMemoryWriterRAII(const WebPMemoryWriterRAII&) = delete;
    WebPMemoryWriterRAII& operator=(const WebPMemoryWriterRAII&) = delete;

    WebPMemoryWriter* get() { return &writer; }
};

// RAII wrapper for WebPPicture
struct WebPPictureRAII {
    WebPPicture pic;
    bool initialized = false;

    WebPPictureRAII() {
        initialized = WebPPictureInit(&pic) != 0;
    }

    ~WebPPictureRAII() {
        if (initialized) {
            WebPPictureFree(&pic);
        }
    }

    // Non-copyable, non-movable (WebPPicture contains pointers)
    WebPPictureRAII(const WebPPictureRAII&) = delete;
    WebPPictureRAII& operator=(const WebPPictureRAII&) = delete;

    WebPPicture* get() { return initialized ? &pic : nullptr; }
};

bool encode_webp(const tiling::PixelBuffer& img, std::vector<uint8_t>& out) {
    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        return false;
    }
    config.quality = kEncodeQuality;

    WebPPictureRAII pic_raii;
    WebPPicture* pic = pic_raii.get();
    if (!pic) {
        return false;
    }
    pic->width = img.width;
    pic->height = img.height;

    WebPMemoryWriterRAII writer_raii;
    pic->writer = WebPMemoryWrite;
    pic->custom_ptr = writer_raii.get();

    const int stride = img.width * img.channels;
    const int imported = img.channels == 4
        ? WebPPictureImportRGBA(pic, img.data.data(), stride)
        : WebPPictureImportRGB(pic, img.data.data(), stride);
    if (!imported) {
        return false;
    }

    if (!WebPEncode(&config, pic)) {
        logger::warn("WebP encode failed with error code " + std::to_string(pic->error_code));
        return false;
    }

    WebPMemoryWriter* writer = writer_raii.get();
    out.assign(writer->mem, writer->mem + writer->size);
    return true;
}
} // namespace

namespace image_io {

std::string normalize_format(const std::string& format) {
    std::string fmt = format.empty() ? "png" : format;
    std::transform(fmt.begin(), fmt.end(), fmt.begin(), [](unsigned char c) { return std::tolower(c); });
    if (fmt == "jpeg") {
        fmt = "jpg";
    }
    return fmt;
}

bool is_supported_format(const std::string& format) {
    const std::string fmt = normalize_format(format);
    return fmt == "png" || fmt == "jpg" || fmt == "webp";
}

bool decode_image(const uint8_t* data, size_t size, tiling::PixelBuffer& out) {
    if (!data || size == 0) {
        return false;
    }
    int width, height, channels;

    // Tiles are merged as RGB regardless of the stored layout.
    STBImageRAII pixels_raii(stbi_load_from_memory(
        data,
        static_cast<int>(size),
        &width,
        &height,
        &channels,
        3
    ));

    if (!pixels_raii.get()) {
        logger::warn(std::string("Image decode failed: ") + stbi_failure_reason());
        return false;
    }

    out = tiling::make_buffer(width, height, 3, tiling::SampleType::UInt8);
    std::copy(pixels_raii.get(), pixels_raii.get() + out.data.size(), out.data.begin());
    return true;
}

bool encode_image(const tiling::PixelBuffer& img, const std::string& format, std::vector<uint8_t>& out) {
    out.clear();
    if (!img.is_consistent() || img.sample_type != tiling::SampleType::UInt8) {
        logger::warn("Image encode needs an 8-bit buffer, got " + tiling::describe(img));
        return false;
    }
    if (img.channels != 3 && img.channels != 4) {
        logger::warn("Image encode needs RGB or RGBA, got " + std::to_string(img.channels) + " channels");
        return false;
    }

    const std::string fmt = normalize_format(format);

    if (fmt == "webp") {
        return encode_webp(img, out);
    }

    if (fmt == "png") {
        return stbi_write_png_to_func(write_callback, &out, img.width, img.height, img.channels,
                                      img.data.data(), img.width * img.channels) != 0;
    }

    if (fmt == "jpg") {
        return stbi_write_jpg_to_func(write_callback, &out, img.width, img.height, img.channels,
                                      img.data.data(), kEncodeQuality) != 0;
    }

    logger::warn("Unsupported output format: " + format);
    return false;
}

} // namespace image_io
