#include "image_io.h"
#include <libyuv.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <string>

// stb_image for loading JPG/PNG images (header-only library)
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

namespace rollcall {

namespace {

// stb works in RGB, the pipeline in BGR
Image swapRedBlue(const Image& src) {
    Image out(src.width(), src.height(), 3);
    for (int y = 0; y < src.height(); y++) {
        const uint8_t* s = src.data() + y * src.stride();
        uint8_t* d = out.data() + y * out.stride();
        for (int x = 0; x < src.width(); x++) {
            d[x * 3 + 0] = s[x * 3 + 2];
            d[x * 3 + 1] = s[x * 3 + 1];
            d[x * 3 + 2] = s[x * 3 + 0];
        }
    }
    return out;
}

void appendToVector(void* context, void* data, int size) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    buffer->insert(buffer->end(), bytes, bytes + size);
}

} // namespace

bool readFileBytes(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

bool decodeImage(const std::vector<uint8_t>& bytes, Image& out, std::string& error) {
    return decodeImage(bytes.data(), bytes.size(), out, error);
}

bool decodeImage(const uint8_t* bytes, size_t size, Image& out, std::string& error) {
    if (bytes == nullptr || size == 0) {
        error = "empty image data";
        return false;
    }

    // stb takes the buffer length as int
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        error = "image data too large (" + std::to_string(size) + " bytes)";
        return false;
    }

    int width = 0, height = 0, channels = 0;
    unsigned char* data = stbi_load_from_memory(bytes, static_cast<int>(size),
                                                &width, &height, &channels, 3);  // Force RGB
    if (!data) {
        const char* reason = stbi_failure_reason();
        error = reason ? reason : "unknown decode error";
        return false;
    }

    std::unique_ptr<unsigned char, void (*)(void*)> pixels(data, stbi_image_free);

    Image rgb(width, height, 3);
    for (int y = 0; y < height; y++) {
        std::memcpy(rgb.data() + y * rgb.stride(), pixels.get() + static_cast<size_t>(y) * width * 3,
                    static_cast<size_t>(width) * 3);
    }
    pixels.reset();

    out = swapRedBlue(rgb);
    return true;
}

Image resizeImage(const ImageView& src, int dst_width, int dst_height) {
    if (src.width() == dst_width && src.height() == dst_height) {
        return src.clone();
    }

    Image src_argb(src.width(), src.height(), 4);
    libyuv::RGB24ToARGB(src.data(), src.stride(), src_argb.data(), src_argb.stride(),
                        src.width(), src.height());

    Image dst_argb(dst_width, dst_height, 4);
    libyuv::ARGBScale(
        src_argb.data(), src_argb.stride(),
        src_argb.width(), src_argb.height(),
        dst_argb.data(), dst_argb.stride(),
        dst_argb.width(), dst_argb.height(),
        libyuv::kFilterBilinear
    );

    Image result(dst_width, dst_height, 3);
    libyuv::ARGBToRGB24(dst_argb.data(), dst_argb.stride(), result.data(), result.stride(),
                        dst_width, dst_height);
    return result;
}

bool writeJpeg(const std::string& path, const Image& image, int quality) {
    if (image.empty() || image.channels() != 3) {
        return false;
    }
    Image rgb = swapRedBlue(image);
    return stbi_write_jpg(path.c_str(), rgb.width(), rgb.height(), 3, rgb.data(), quality) != 0;
}

std::vector<uint8_t> encodePng(const Image& image) {
    std::vector<uint8_t> buffer;
    if (image.empty() || image.channels() != 3) {
        return buffer;
    }
    Image rgb = swapRedBlue(image);
    if (!stbi_write_png_to_func(appendToVector, &buffer, rgb.width(), rgb.height(), 3,
                                rgb.data(), rgb.stride())) {
        buffer.clear();
    }
    return buffer;
}

bool isSupportedImageFile(const std::string& filename) {
    size_t dot = filename.rfind('.');
    if (dot == std::string::npos) {
        return false;
    }
    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == "jpg" || ext == "jpeg" || ext == "png";
}

} // namespace rollcall
