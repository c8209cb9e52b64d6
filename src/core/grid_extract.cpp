#include "grid_extract.h"

#include <utility>

namespace hexprep::core {

std::vector<GridTile> extract_grid_tiles(const RasterBuffer& buffer, const GridOptions& options) {
    std::vector<GridTile> tiles;
    if (buffer.empty() || options.cols <= 0 || options.rows <= 0) {
        return tiles;
    }

    const int threshold = options.content_alpha_threshold;
    if (!has_alpha_above(buffer, full_bounds(buffer), threshold)) {
        return tiles;
    }

    const int cell_width = buffer.width() / options.cols;
    const int cell_height = buffer.height() / options.rows;
    if (cell_width <= 0 || cell_height <= 0) {
        return tiles;
    }

    tiles.reserve(static_cast<size_t>(options.cols) * static_cast<size_t>(options.rows));
    int next_index = 1;
    for (int row = 0; row < options.rows; ++row) {
        for (int col = 0; col < options.cols; ++col) {
            const BoundingBox cell{
                .x_min = col * cell_width,
                .y_min = row * cell_height,
                .x_max = (col + 1) * cell_width,
                .y_max = (row + 1) * cell_height,
            };

            const BoundingBox content = find_alpha_bounds(buffer, cell, threshold);
            if (content.empty()) {
                continue;
            }

            GridTile tile;
            tile.index = next_index++;
            tile.row = row;
            tile.col = col;
            tile.source = content;
            tile.raster = crop(buffer, content);
            tiles.push_back(std::move(tile));
        }
    }

    return tiles;
}

} // namespace hexprep::core
