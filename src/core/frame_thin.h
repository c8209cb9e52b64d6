#pragma once

#include "raster.h"

namespace hexprep::core {

constexpr int k_default_shrink_pixels = 3;

// Redraws the frame band (pixels within `shrink_pixels` of the transparent
// outside) by sampling the source radially toward the canvas center, pulling
// up to `shrink_pixels` at the outer edge and nothing at the band's inner edge.
// Interior pixels are copied; transparent pixels stay transparent. Output has
// the input's dimensions.
RasterBuffer thin_frame(const RasterBuffer& buffer, int shrink_pixels);

// Bilinear sample of all four channels at a fractional position inside
// [0, width-1] x [0, height-1]. Returns false (and leaves `out` untouched)
// when the position lies outside that range.
bool sample_bilinear(const RasterBuffer& buffer, double x, double y, Rgba& out);

} // namespace hexprep::core
