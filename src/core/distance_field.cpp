#include "distance_field.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace hexprep::core {

namespace {

// 1D squared distance transform of a sampled function (Felzenszwalb & Huttenlocher).
void squared_distance_1d(const std::vector<double>& f, int n, std::vector<double>& d,
                         std::vector<int>& v, std::vector<double>& z) {
    int k = 0;
    v[0] = 0;
    z[0] = -std::numeric_limits<double>::infinity();
    z[1] = std::numeric_limits<double>::infinity();

    for (int q = 1; q < n; ++q) {
        auto intersect = [&](int p) {
            return ((f[q] + static_cast<double>(q) * q) - (f[p] + static_cast<double>(p) * p))
                / (2.0 * static_cast<double>(q - p));
        };
        double s = intersect(v[k]);
        // z[0] is -inf, so k never drops below zero.
        while (s <= z[k]) {
            --k;
            s = intersect(v[k]);
        }
        ++k;
        v[k] = q;
        z[k] = s;
        z[k + 1] = std::numeric_limits<double>::infinity();
    }

    k = 0;
    for (int q = 0; q < n; ++q) {
        while (z[k + 1] < q) {
            ++k;
        }
        const double diff = static_cast<double>(q - v[k]);
        d[q] = (diff * diff) + f[v[k]];
    }
}

} // namespace

std::vector<double> euclidean_depth(const std::vector<std::uint8_t>& mask, int width, int height) {
    std::vector<double> depth;
    if (width <= 0 || height <= 0) {
        return depth;
    }
    const size_t count = static_cast<size_t>(width) * static_cast<size_t>(height);
    depth.assign(count, 0.0);
    if (std::ranges::none_of(mask, [](std::uint8_t m) { return m != 0; })) {
        return depth;
    }

    // Work on a canvas with a one-cell background ring so the outside of the
    // mask is always background and every row/column has a finite seed.
    const int pw = width + 2;
    const int ph = height + 2;
    const double far = static_cast<double>(pw) * pw + static_cast<double>(ph) * ph;
    std::vector<double> grid(static_cast<size_t>(pw) * static_cast<size_t>(ph), 0.0);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (mask[(static_cast<size_t>(y) * width) + x] != 0) {
                grid[(static_cast<size_t>(y + 1) * pw) + (x + 1)] = far;
            }
        }
    }

    const int longest = std::max(pw, ph);
    std::vector<double> f(static_cast<size_t>(longest));
    std::vector<double> d(static_cast<size_t>(longest));
    std::vector<int> v(static_cast<size_t>(longest));
    std::vector<double> z(static_cast<size_t>(longest) + 1);

    for (int x = 0; x < pw; ++x) {
        for (int y = 0; y < ph; ++y) {
            f[y] = grid[(static_cast<size_t>(y) * pw) + x];
        }
        squared_distance_1d(f, ph, d, v, z);
        for (int y = 0; y < ph; ++y) {
            grid[(static_cast<size_t>(y) * pw) + x] = d[y];
        }
    }

    for (int y = 0; y < ph; ++y) {
        for (int x = 0; x < pw; ++x) {
            f[x] = grid[(static_cast<size_t>(y) * pw) + x];
        }
        squared_distance_1d(f, pw, d, v, z);
        for (int x = 0; x < pw; ++x) {
            grid[(static_cast<size_t>(y) * pw) + x] = d[x];
        }
    }

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const size_t i = (static_cast<size_t>(y) * width) + x;
            if (mask[i] != 0) {
                depth[i] = std::sqrt(grid[(static_cast<size_t>(y + 1) * pw) + (x + 1)]);
            }
        }
    }
    return depth;
}

} // namespace hexprep::core
