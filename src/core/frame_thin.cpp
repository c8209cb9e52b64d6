#include "frame_thin.h"
#include "distance_field.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <vector>

namespace hexprep::core {

namespace {

constexpr double k_center_epsilon = 1e-6;

} // namespace

bool sample_bilinear(const RasterBuffer& buffer, double x, double y, Rgba& out) {
    if (buffer.empty() || !std::isfinite(x) || !std::isfinite(y)) {
        return false;
    }
    const double max_x = static_cast<double>(buffer.width() - 1);
    const double max_y = static_cast<double>(buffer.height() - 1);
    if (x < 0.0 || y < 0.0 || x > max_x || y > max_y) {
        return false;
    }

    const int x0 = static_cast<int>(std::floor(x));
    const int y0 = static_cast<int>(std::floor(y));
    const int x1 = std::min(x0 + 1, buffer.width() - 1);
    const int y1 = std::min(y0 + 1, buffer.height() - 1);
    const double fx = x - x0;
    const double fy = y - y0;

    const auto& px = buffer.data();
    const size_t i00 = buffer.offset(x0, y0);
    const size_t i10 = buffer.offset(x1, y0);
    const size_t i01 = buffer.offset(x0, y1);
    const size_t i11 = buffer.offset(x1, y1);

    std::array<std::uint8_t, NUM_CHANNELS> result{};
    for (size_t c = 0; c < NUM_CHANNELS; ++c) {
        const double value = (px[i00 + c] * (1.0 - fy) * (1.0 - fx))
            + (px[i10 + c] * (1.0 - fy) * fx)
            + (px[i01 + c] * fy * (1.0 - fx))
            + (px[i11 + c] * fy * fx);
        result[c] = quantize_channel(value);
    }

    out = Rgba{
        .r = result[CHANNEL_R],
        .g = result[CHANNEL_G],
        .b = result[CHANNEL_B],
        .a = result[CHANNEL_A],
    };
    return true;
}

RasterBuffer thin_frame(const RasterBuffer& buffer, int shrink_pixels) {
    RasterBuffer out(buffer.width(), buffer.height());
    if (buffer.empty()) {
        return out;
    }

    const size_t count = buffer.pixel_count();
    const auto& src = buffer.data();
    std::vector<std::uint8_t> mask(count, 0);
    for (size_t i = 0; i < count; ++i) {
        mask[i] = src[(i * NUM_CHANNELS) + CHANNEL_A] > 0 ? 1 : 0;
    }

    const std::vector<double> depth = euclidean_depth(mask, buffer.width(), buffer.height());

    const double band = static_cast<double>(std::max(0, shrink_pixels));
    const double center_x = static_cast<double>(buffer.width()) / 2.0;
    const double center_y = static_cast<double>(buffer.height()) / 2.0;
    auto& dst = out.data();

    for (size_t i = 0; i < count; ++i) {
        if (mask[i] == 0) {
            continue;
        }
        const size_t idx = i * NUM_CHANNELS;
        const double d = depth[i];
        const int x = static_cast<int>(i % static_cast<size_t>(buffer.width()));
        const int y = static_cast<int>(i / static_cast<size_t>(buffer.width()));

        const double dx = static_cast<double>(x) - center_x;
        const double dy = static_cast<double>(y) - center_y;
        const double to_center = std::sqrt((dx * dx) + (dy * dy));

        if (d > band || to_center < k_center_epsilon) {
            std::copy_n(src.begin() + static_cast<std::ptrdiff_t>(idx), NUM_CHANNELS,
                        dst.begin() + static_cast<std::ptrdiff_t>(idx));
            continue;
        }

        const double shrink_factor = d / band;
        const double displacement = band * (1.0 - shrink_factor);
        const double scale = 1.0 - (displacement / to_center);
        const double source_x = center_x + (dx * scale);
        const double source_y = center_y + (dy * scale);

        Rgba sampled;
        if (sample_bilinear(buffer, source_x, source_y, sampled)) {
            out.set(x, y, sampled);
        }
    }

    return out;
}

} // namespace hexprep::core
