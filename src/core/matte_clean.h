#pragma once

#include "raster.h"

#include <string>

namespace hexprep::core {

enum class MatteMode { Standard, Strict };

constexpr int k_default_white_threshold = 250;
constexpr int k_default_white_tolerance = 10;
constexpr int k_default_strict_white_threshold = 245;
constexpr int k_matte_padding = 2;

struct MatteOptions {
    MatteMode mode = MatteMode::Standard;
    int white_threshold = k_default_white_threshold;
    int tolerance = k_default_white_tolerance;
    int strict_white_threshold = k_default_strict_white_threshold;
};

struct MatteResult {
    RasterBuffer raster;
    bool empty = false;   // nothing left after matte removal; raster is the unmodified input
};

// Removes white matte, damps light halos along the new boundary, crops to the
// remaining content and pads it by k_matte_padding transparent pixels.
MatteResult clean_matte(const RasterBuffer& buffer, const MatteOptions& options);

bool parse_matte_mode(const std::string& value, MatteMode& out, std::string& error);
const char* matte_mode_name(MatteMode mode);

} // namespace hexprep::core
