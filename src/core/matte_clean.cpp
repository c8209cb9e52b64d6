#include "matte_clean.h"
#include "cli_parse.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

namespace hexprep::core {

namespace {

constexpr int k_matte_min_alpha = 200;
constexpr int k_strict_min_alpha = 250;
constexpr int k_halo_neighbor_alpha = 50;
constexpr double k_halo_min_brightness = 200.0;
constexpr std::uint8_t k_halo_alpha_cap = 100;
constexpr int k_halo_passes = 2;

struct AlphaPlane {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> values;

    // Outside the canvas reads as fully transparent.
    [[nodiscard]] int get(int x, int y) const {
        if (x < 0 || y < 0 || x >= width || y >= height) {
            return 0;
        }
        return values[(static_cast<size_t>(y) * static_cast<size_t>(width)) + static_cast<size_t>(x)];
    }
};

double average_brightness(const RasterBuffer& buffer, size_t offset) {
    const auto& px = buffer.data();
    return (static_cast<double>(px[offset + CHANNEL_R])
            + static_cast<double>(px[offset + CHANNEL_G])
            + static_cast<double>(px[offset + CHANNEL_B])) / 3.0;
}

AlphaPlane remove_standard_matte(const RasterBuffer& buffer, const MatteOptions& options) {
    AlphaPlane plane{.width = buffer.width(), .height = buffer.height(), .values = {}};
    plane.values.resize(buffer.pixel_count());

    const int white_floor = options.white_threshold - options.tolerance;
    const auto& px = buffer.data();
    for (size_t i = 0; i < buffer.pixel_count(); ++i) {
        const size_t idx = i * NUM_CHANNELS;
        const int r = px[idx + CHANNEL_R];
        const int g = px[idx + CHANNEL_G];
        const int b = px[idx + CHANNEL_B];
        const int a = px[idx + CHANNEL_A];

        const bool is_white = r >= white_floor && g >= white_floor && b >= white_floor;
        const bool is_very_light = average_brightness(buffer, idx) >= static_cast<double>(options.white_threshold);
        plane.values[i] = ((is_white || is_very_light) && a > k_matte_min_alpha) ? 0 : static_cast<std::uint8_t>(a);
    }
    return plane;
}

AlphaPlane remove_strict_matte(const RasterBuffer& buffer, const MatteOptions& options) {
    AlphaPlane plane{.width = buffer.width(), .height = buffer.height(), .values = {}};
    plane.values.resize(buffer.pixel_count());

    const int white_floor = options.strict_white_threshold;
    const auto& px = buffer.data();
    for (size_t i = 0; i < buffer.pixel_count(); ++i) {
        const size_t idx = i * NUM_CHANNELS;
        const bool is_pure_white = px[idx + CHANNEL_R] >= white_floor
            && px[idx + CHANNEL_G] >= white_floor
            && px[idx + CHANNEL_B] >= white_floor
            && px[idx + CHANNEL_A] >= k_strict_min_alpha;
        plane.values[i] = is_pure_white ? 0 : px[idx + CHANNEL_A];
    }
    return plane;
}

// One damping stage. Reads and writes the same plane, so a later stage sees
// what an earlier one produced.
void damp_halo(const RasterBuffer& buffer, AlphaPlane& plane) {
    const std::array<int, 4> dx = {0, 0, -1, 1};
    const std::array<int, 4> dy = {-1, 1, 0, 0};

    for (int y = 0; y < plane.height; ++y) {
        for (int x = 0; x < plane.width; ++x) {
            const size_t i = (static_cast<size_t>(y) * static_cast<size_t>(plane.width)) + static_cast<size_t>(x);
            if (plane.values[i] == 0) {
                continue;
            }

            int transparent_neighbors = 0;
            for (size_t n = 0; n < dx.size(); ++n) {
                if (plane.get(x + dx[n], y + dy[n]) < k_halo_neighbor_alpha) {
                    ++transparent_neighbors;
                }
            }
            if (transparent_neighbors == 0) {
                continue;
            }

            if (average_brightness(buffer, i * NUM_CHANNELS) > k_halo_min_brightness) {
                plane.values[i] = std::min(plane.values[i], k_halo_alpha_cap);
            }
        }
    }
}

} // namespace

MatteResult clean_matte(const RasterBuffer& buffer, const MatteOptions& options) {
    if (buffer.empty()) {
        return MatteResult{.raster = buffer, .empty = true};
    }

    AlphaPlane plane;
    if (options.mode == MatteMode::Strict) {
        plane = remove_strict_matte(buffer, options);
    } else {
        plane = remove_standard_matte(buffer, options);
        for (int pass = 0; pass < k_halo_passes; ++pass) {
            damp_halo(buffer, plane);
        }
    }

    RasterBuffer cleaned = buffer;
    auto& px = cleaned.data();
    for (size_t i = 0; i < cleaned.pixel_count(); ++i) {
        px[(i * NUM_CHANNELS) + CHANNEL_A] = plane.values[i];
    }

    const BoundingBox content = find_alpha_bounds(cleaned, 0);
    if (content.empty()) {
        return MatteResult{.raster = buffer, .empty = true};
    }

    return MatteResult{.raster = pad(crop(cleaned, content), k_matte_padding), .empty = false};
}

bool parse_matte_mode(const std::string& value, MatteMode& out, std::string& error) {
    const std::string lower = to_lower_copy(trim_copy(value));
    if (lower == "standard") {
        out = MatteMode::Standard;
        return true;
    }
    if (lower == "strict") {
        out = MatteMode::Strict;
        return true;
    }
    error = "invalid matte mode '" + value + "'";
    return false;
}

const char* matte_mode_name(MatteMode mode) {
    return mode == MatteMode::Strict ? "strict" : "standard";
}

} // namespace hexprep::core
