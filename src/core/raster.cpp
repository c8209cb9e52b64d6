#include "raster.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <utility>

namespace hexprep::core {

RasterBuffer::RasterBuffer(int width, int height)
    : width_(std::max(0, width)), height_(std::max(0, height)) {
    pixels_.assign(pixel_count() * NUM_CHANNELS, 0);
}

RasterBuffer::RasterBuffer(int width, int height, std::vector<std::uint8_t> pixels)
    : width_(std::max(0, width)), height_(std::max(0, height)), pixels_(std::move(pixels)) {
    pixels_.resize(pixel_count() * NUM_CHANNELS, 0);
}

Rgba RasterBuffer::at(int x, int y) const {
    const size_t idx = offset(x, y);
    return Rgba{
        .r = pixels_[idx + CHANNEL_R],
        .g = pixels_[idx + CHANNEL_G],
        .b = pixels_[idx + CHANNEL_B],
        .a = pixels_[idx + CHANNEL_A],
    };
}

void RasterBuffer::set(int x, int y, const Rgba& value) {
    const size_t idx = offset(x, y);
    pixels_[idx + CHANNEL_R] = value.r;
    pixels_[idx + CHANNEL_G] = value.g;
    pixels_[idx + CHANNEL_B] = value.b;
    pixels_[idx + CHANNEL_A] = value.a;
}

void RasterBuffer::fill(const Rgba& value) {
    for (size_t i = 0; i < pixel_count(); ++i) {
        const size_t idx = i * NUM_CHANNELS;
        pixels_[idx + CHANNEL_R] = value.r;
        pixels_[idx + CHANNEL_G] = value.g;
        pixels_[idx + CHANNEL_B] = value.b;
        pixels_[idx + CHANNEL_A] = value.a;
    }
}

BoundingBox full_bounds(const RasterBuffer& buffer) {
    return BoundingBox{.x_min = 0, .y_min = 0, .x_max = buffer.width(), .y_max = buffer.height()};
}

BoundingBox clip_to(const BoundingBox& box, const RasterBuffer& buffer) {
    BoundingBox clipped{
        .x_min = std::clamp(box.x_min, 0, buffer.width()),
        .y_min = std::clamp(box.y_min, 0, buffer.height()),
        .x_max = std::clamp(box.x_max, 0, buffer.width()),
        .y_max = std::clamp(box.y_max, 0, buffer.height()),
    };
    if (clipped.empty()) {
        return BoundingBox{};
    }
    return clipped;
}

BoundingBox find_content_bounds(const RasterBuffer& buffer, const BoundingBox& region, const PixelPredicate& is_content) {
    const BoundingBox area = clip_to(region, buffer);
    if (area.empty()) {
        return BoundingBox{};
    }

    // A row (column) has content if any of its pixels does; the box spans
    // first..last content row and first..last content column.
    std::vector<std::uint8_t> rows_with_content(static_cast<size_t>(area.height()), 0);
    std::vector<std::uint8_t> cols_with_content(static_cast<size_t>(area.width()), 0);
    bool any = false;
    for (int y = area.y_min; y < area.y_max; ++y) {
        for (int x = area.x_min; x < area.x_max; ++x) {
            if (is_content(buffer, x, y)) {
                rows_with_content[static_cast<size_t>(y - area.y_min)] = 1;
                cols_with_content[static_cast<size_t>(x - area.x_min)] = 1;
                any = true;
            }
        }
    }
    if (!any) {
        return BoundingBox{};
    }

    auto first_set = [](const std::vector<std::uint8_t>& flags) {
        return static_cast<int>(std::ranges::find(flags, 1) - flags.begin());
    };
    auto last_set_exclusive = [](const std::vector<std::uint8_t>& flags) {
        auto rit = std::find(flags.rbegin(), flags.rend(), 1);
        return static_cast<int>(flags.rend() - rit);
    };

    return BoundingBox{
        .x_min = area.x_min + first_set(cols_with_content),
        .y_min = area.y_min + first_set(rows_with_content),
        .x_max = area.x_min + last_set_exclusive(cols_with_content),
        .y_max = area.y_min + last_set_exclusive(rows_with_content),
    };
}

BoundingBox find_content_bounds(const RasterBuffer& buffer, const PixelPredicate& is_content) {
    return find_content_bounds(buffer, full_bounds(buffer), is_content);
}

BoundingBox find_alpha_bounds(const RasterBuffer& buffer, const BoundingBox& region, int threshold) {
    return find_content_bounds(buffer, region, [threshold](const RasterBuffer& b, int x, int y) {
        return static_cast<int>(b.alpha(x, y)) > threshold;
    });
}

BoundingBox find_alpha_bounds(const RasterBuffer& buffer, int threshold) {
    return find_alpha_bounds(buffer, full_bounds(buffer), threshold);
}

bool has_alpha_above(const RasterBuffer& buffer, const BoundingBox& region, int threshold) {
    const BoundingBox area = clip_to(region, buffer);
    for (int y = area.y_min; y < area.y_max; ++y) {
        for (int x = area.x_min; x < area.x_max; ++x) {
            if (static_cast<int>(buffer.alpha(x, y)) > threshold) {
                return true;
            }
        }
    }
    return false;
}

RasterBuffer crop(const RasterBuffer& buffer, const BoundingBox& box) {
    const BoundingBox area = clip_to(box, buffer);
    if (area.empty()) {
        return RasterBuffer{};
    }

    RasterBuffer out(area.width(), area.height());
    const size_t row_bytes = static_cast<size_t>(area.width()) * NUM_CHANNELS;
    for (int row = 0; row < area.height(); ++row) {
        std::memcpy(out.data().data() + out.offset(0, row),
                    buffer.data().data() + buffer.offset(area.x_min, area.y_min + row),
                    row_bytes);
    }
    return out;
}

RasterBuffer pad(const RasterBuffer& buffer, int padding) {
    padding = std::max(0, padding);
    RasterBuffer out(buffer.width() + (padding * 2), buffer.height() + (padding * 2));
    if (buffer.empty()) {
        return out;
    }
    const size_t row_bytes = static_cast<size_t>(buffer.width()) * NUM_CHANNELS;
    for (int row = 0; row < buffer.height(); ++row) {
        std::memcpy(out.data().data() + out.offset(padding, padding + row),
                    buffer.data().data() + buffer.offset(0, row),
                    row_bytes);
    }
    return out;
}

std::uint8_t quantize_channel(double value) {
    if (!std::isfinite(value)) {
        return 0;
    }
    const double rounded = std::round(value);
    return static_cast<std::uint8_t>(std::clamp(rounded, 0.0, static_cast<double>(MAX_CHANNEL_VALUE)));
}

} // namespace hexprep::core
