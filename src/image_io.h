#ifndef ROLLCALL_IMAGE_IO_H
#define ROLLCALL_IMAGE_IO_H

#include "image.h"
#include <cstdint>
#include <string>
#include <vector>

namespace rollcall {

// Read a whole file into memory
bool readFileBytes(const std::string& path, std::vector<uint8_t>& out);

// Decode JPEG/PNG bytes into a 3-channel BGR image.
// On failure returns false and sets `error` to the decoder's reason.
bool decodeImage(const std::vector<uint8_t>& bytes, Image& out, std::string& error);
bool decodeImage(const uint8_t* bytes, size_t size, Image& out, std::string& error);

// Bilinear resize of a BGR image (libyuv)
Image resizeImage(const ImageView& src, int dst_width, int dst_height);

// Write a BGR image as JPEG. Parent directories must exist.
bool writeJpeg(const std::string& path, const Image& image, int quality = 95);

// Encode a BGR image as PNG in memory
std::vector<uint8_t> encodePng(const Image& image);

// True for .jpg / .jpeg / .png, case-insensitive
bool isSupportedImageFile(const std::string& filename);

} // namespace rollcall

#endif // ROLLCALL_IMAGE_IO_H
