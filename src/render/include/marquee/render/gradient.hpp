#pragma once

#include "marquee/image/raster.hpp"
#include "marquee/style/text_style.hpp"

namespace marquee::render {

// ============================================================================
// Gradient Compositor
//
// A black band along the top or bottom edge whose alpha ramps linearly
// between 0 and round(255 * peak_opacity), constant along each row:
//   bottom  row y of the band: round(255 * p * y / band)
//   top     row y of the band: round(255 * p * (1 - y / band))
// ============================================================================

struct GradientBand {
    style::GradientDirection direction{style::GradientDirection::Bottom};
    i32 height{0};         // Rows covered, round(canvas_height * ratio)
    f64 peak_opacity{0};   // Clamped to [0, 1]
    i32 first_row{0};      // Canvas row of band row 0
};

[[nodiscard]] GradientBand make_band(i32 canvas_height, const style::GradientConfig& config);

// Alpha of band row `y` (0 <= y < band.height)
[[nodiscard]] u8 band_alpha(const GradientBand& band, i32 y);

// Transparent Rgba8 overlay carrying only the band
[[nodiscard]] image::RasterImage build_gradient_overlay(SizeI canvas, const GradientBand& band);

// Composites the band over `base`; returns an opaque Rgb8 image.
[[nodiscard]] image::RasterImage apply_gradient(const image::RasterImage& base,
                                                const style::GradientConfig& config);

} // namespace marquee::render
