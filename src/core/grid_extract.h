#pragma once

#include "raster.h"

#include <vector>

namespace hexprep::core {

constexpr int k_default_grid_cols = 2;
constexpr int k_default_grid_rows = 2;
constexpr int k_default_content_alpha_threshold = 20;

struct GridOptions {
    int cols = k_default_grid_cols;
    int rows = k_default_grid_rows;
    int content_alpha_threshold = k_default_content_alpha_threshold;
};

struct GridTile {
    int index = 0;          // 1-based, counts only emitted tiles
    int row = 0;
    int col = 0;
    BoundingBox source;     // cropped region in source coordinates
    RasterBuffer raster;
};

// Splits `buffer` into cols x rows equal cells (integer division, remainder
// discarded) and returns the non-empty cells in row-major order, each cropped
// to its content. Returns an empty vector when nothing in the source exceeds
// the content threshold.
std::vector<GridTile> extract_grid_tiles(const RasterBuffer& buffer, const GridOptions& options);

} // namespace hexprep::core
