#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace hexprep::core {

constexpr size_t NUM_CHANNELS = 4;
constexpr size_t CHANNEL_R = 0;
constexpr size_t CHANNEL_G = 1;
constexpr size_t CHANNEL_B = 2;
constexpr size_t CHANNEL_A = 3;
constexpr int MAX_CHANNEL_VALUE = 255;

struct Rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0;

    bool operator==(const Rgba& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Rgba& other) const {
        return !(*this == other);
    }

    [[nodiscard]] bool is_transparent() const {
        return a == 0;
    }
};

// Half-open rectangle [x_min, x_max) x [y_min, y_max).
struct BoundingBox {
    int x_min = 0;
    int y_min = 0;
    int x_max = 0;
    int y_max = 0;

    [[nodiscard]] int width() const { return x_max - x_min; }
    [[nodiscard]] int height() const { return y_max - y_min; }
    [[nodiscard]] bool empty() const { return x_max <= x_min || y_max <= y_min; }

    bool operator==(const BoundingBox& other) const {
        return x_min == other.x_min && y_min == other.y_min
            && x_max == other.x_max && y_max == other.y_max;
    }
};

// Interleaved row-major 8-bit RGBA pixels.
class RasterBuffer {
public:
    RasterBuffer() = default;
    RasterBuffer(int width, int height);
    RasterBuffer(int width, int height, std::vector<std::uint8_t> pixels);

    [[nodiscard]] int width() const { return width_; }
    [[nodiscard]] int height() const { return height_; }
    [[nodiscard]] bool empty() const { return width_ <= 0 || height_ <= 0; }
    [[nodiscard]] size_t pixel_count() const {
        return static_cast<size_t>(width_) * static_cast<size_t>(height_);
    }

    [[nodiscard]] const std::vector<std::uint8_t>& data() const { return pixels_; }
    [[nodiscard]] std::vector<std::uint8_t>& data() { return pixels_; }

    [[nodiscard]] size_t offset(int x, int y) const {
        return ((static_cast<size_t>(y) * static_cast<size_t>(width_)) + static_cast<size_t>(x)) * NUM_CHANNELS;
    }

    [[nodiscard]] Rgba at(int x, int y) const;
    void set(int x, int y, const Rgba& value);

    [[nodiscard]] std::uint8_t alpha(int x, int y) const {
        return pixels_[offset(x, y) + CHANNEL_A];
    }

    void fill(const Rgba& value);

    bool operator==(const RasterBuffer& other) const {
        return width_ == other.width_ && height_ == other.height_ && pixels_ == other.pixels_;
    }

    bool operator!=(const RasterBuffer& other) const {
        return !(*this == other);
    }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<std::uint8_t> pixels_;
};

using PixelPredicate = std::function<bool(const RasterBuffer&, int, int)>;

// Minimal box enclosing every pixel of `region` for which `is_content` holds.
// Coordinates are relative to the buffer, not the region. Empty when nothing matches.
BoundingBox find_content_bounds(const RasterBuffer& buffer, const BoundingBox& region, const PixelPredicate& is_content);
BoundingBox find_content_bounds(const RasterBuffer& buffer, const PixelPredicate& is_content);

// Bounds of pixels whose alpha is strictly above `threshold`.
BoundingBox find_alpha_bounds(const RasterBuffer& buffer, const BoundingBox& region, int threshold);
BoundingBox find_alpha_bounds(const RasterBuffer& buffer, int threshold);

bool has_alpha_above(const RasterBuffer& buffer, const BoundingBox& region, int threshold);

BoundingBox full_bounds(const RasterBuffer& buffer);
BoundingBox clip_to(const BoundingBox& box, const RasterBuffer& buffer);

RasterBuffer crop(const RasterBuffer& buffer, const BoundingBox& box);

// New canvas `padding` pixels larger on every side, fully transparent, with `buffer` pasted at (padding, padding).
RasterBuffer pad(const RasterBuffer& buffer, int padding);

std::uint8_t quantize_channel(double value);

} // namespace hexprep::core
