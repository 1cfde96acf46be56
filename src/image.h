/*
 * Image containers for rollcall
 *
 * - Rect:      face bounding region (optionally with 5 landmarks)
 * - ImageView: non-owning window into pixel data (move-only)
 * - Image:     owning, move-only BGR buffer; copies go through clone()
 *
 * Pixel layout is interleaved BGR (3 channels) everywhere in the pipeline.
 */

#ifndef ROLLCALL_IMAGE_H
#define ROLLCALL_IMAGE_H

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <algorithm>
#include <vector>
#include <new>

namespace rollcall {

class Image;

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() noexcept = default;
    constexpr Point(float x_, float y_) noexcept : x(x_), y(y_) {}
};

// ========== Rect: face region ==========

struct Rect {
    int x = 0, y = 0, width = 0, height = 0;
    std::vector<Point> landmarks;  // left eye, right eye, nose, mouth left, mouth right

    Rect() = default;
    Rect(int x_, int y_, int w, int h) : x(x_), y(y_), width(w), height(h) {}

    bool empty() const noexcept { return width <= 0 || height <= 0; }

    // 64-bit so that large group photos cannot overflow
    long long area() const noexcept {
        return empty() ? 0 : static_cast<long long>(width) * height;
    }

    bool hasLandmarks() const noexcept { return landmarks.size() >= 5; }

    // Intersection with an image of the given size
    Rect clipped(int image_width, int image_height) const {
        int x0 = std::max(0, x);
        int y0 = std::max(0, y);
        int x1 = std::min(image_width, x + width);
        int y1 = std::min(image_height, y + height);
        Rect r(x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0));
        r.landmarks = landmarks;
        return r;
    }
};

// ========== ImageView: non-owning ==========

class ImageView {
public:
    ImageView(const uint8_t* data, int width, int height, int channels, int stride = 0) noexcept
        : data_(data), width_(width), height_(height),
          channels_(channels), stride_(stride > 0 ? stride : width * channels) {}

    ImageView(const ImageView&) = delete;
    ImageView& operator=(const ImageView&) = delete;
    ImageView(ImageView&&) noexcept = default;
    ImageView& operator=(ImageView&&) noexcept = default;

    const uint8_t* data() const noexcept { return data_; }
    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    int stride() const noexcept { return stride_; }
    int channels() const noexcept { return channels_; }
    bool empty() const noexcept { return data_ == nullptr || width_ <= 0 || height_ <= 0; }

    // Caller guarantees the rect lies inside the view (see Rect::clipped)
    ImageView roi(const Rect& r) const noexcept {
        return ImageView(data_ + r.y * stride_ + r.x * channels_, r.width, r.height, channels_, stride_);
    }

    Image clone() const;

private:
    const uint8_t* data_;
    int width_;
    int height_;
    int channels_;
    int stride_;
};

// ========== Image: owning, move-only ==========

class Image {
public:
    Image() noexcept = default;

    Image(int width, int height, int channels)
        : width_(width), height_(height), channels_(channels), stride_(width * channels) {
        if (width <= 0 || height <= 0 || channels <= 0) {
            throw std::invalid_argument("Image dimensions must be positive");
        }

        // 64-byte aligned rows for SIMD resize paths
        size_t aligned_size = (static_cast<size_t>(stride_) * height_ + 63) & ~static_cast<size_t>(63);
        if (posix_memalign(reinterpret_cast<void**>(&data_), 64, aligned_size) != 0) {
            throw std::bad_alloc();
        }
        std::memset(data_, 0, aligned_size);
    }

    ~Image() noexcept { free(data_); }

    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    Image(Image&& other) noexcept
        : data_(other.data_), width_(other.width_), height_(other.height_),
          channels_(other.channels_), stride_(other.stride_) {
        other.data_ = nullptr;
        other.width_ = other.height_ = other.channels_ = other.stride_ = 0;
    }

    Image& operator=(Image&& other) noexcept {
        if (this != &other) {
            free(data_);
            data_ = other.data_;
            width_ = other.width_;
            height_ = other.height_;
            channels_ = other.channels_;
            stride_ = other.stride_;
            other.data_ = nullptr;
            other.width_ = other.height_ = other.channels_ = other.stride_ = 0;
        }
        return *this;
    }

    uint8_t* data() noexcept { return data_; }
    const uint8_t* data() const noexcept { return data_; }
    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    int stride() const noexcept { return stride_; }
    int channels() const noexcept { return channels_; }
    bool empty() const noexcept { return data_ == nullptr || width_ == 0 || height_ == 0; }

    ImageView view() const noexcept {
        return ImageView(data_, width_, height_, channels_, stride_);
    }

    Image clone() const { return view().clone(); }

    // Deep copy of a region, clipped to the image bounds. Empty if nothing is left.
    Image crop(const Rect& region) const {
        Rect r = region.clipped(width_, height_);
        if (r.empty() || empty()) {
            return Image();
        }
        return view().roi(r).clone();
    }

private:
    uint8_t* data_ = nullptr;
    int width_ = 0;
    int height_ = 0;
    int channels_ = 0;
    int stride_ = 0;
};

inline Image ImageView::clone() const {
    if (empty()) {
        return Image();
    }

    Image copy(width_, height_, channels_);
    for (int y = 0; y < height_; y++) {
        std::memcpy(copy.data() + y * copy.stride(), data_ + y * stride_,
                    static_cast<size_t>(width_) * channels_);
    }
    return copy;
}

} // namespace rollcall

#endif // ROLLCALL_IMAGE_H
