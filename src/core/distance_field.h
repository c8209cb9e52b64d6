#pragma once

#include <cstdint>
#include <vector>

namespace hexprep::core {

// Exact Euclidean distance transform of a binary mask (nonzero = foreground).
// Each foreground cell gets the distance to the nearest background cell; cells
// beyond the mask edges count as background, so an edge cell has depth 1.
// Background cells get 0. An all-background mask is returned as zeros without
// running the transform.
std::vector<double> euclidean_depth(const std::vector<std::uint8_t>& mask, int width, int height);

} // namespace hexprep::core
