#pragma once

#include "marquee/image/raster.hpp"
#include "marquee/style/presets.hpp"
#include "marquee/text/layout.hpp"
#include <vector>

namespace marquee::render {

// ============================================================================
// Glyph Compositor
//
// Draws a laid-out text block in three passes onto a transparent overlay:
//   shadow  mask offset by (s, s), shadow color at half alpha
//   stroke  mask stamped at every integer offset within radius w
//   fill    mask at the origin, opaque fill color
// then composites the overlay "over" the base and drops alpha.
// ============================================================================

constexpr i32 EDGE_MARGIN = 10;
constexpr u8 SHADOW_ALPHA = 128;

struct GlyphPasses {
    style::ColorScheme colors;
    i32 stroke_width{4};
    i32 shadow_offset{5};
};

// Top-left corner for a block centered on `anchor` (ratios of the canvas),
// floored, then clamped to [EDGE_MARGIN, dim - block - EDGE_MARGIN]. A block
// too large for the margins is pinned at EDGE_MARGIN.
[[nodiscard]] PointI place_block(SizeI canvas, SizeI block, style::AnchorRatio anchor);

// Integer offsets with dx^2 + dy^2 <= radius^2, row by row from the top.
// Empty for radius <= 0.
[[nodiscard]] std::vector<PointI> disc_offsets(i32 radius);

// Paint all passes of `mask` (positioned at `origin`) onto an Rgba8 overlay
void paint_passes(image::RasterImage& overlay, const image::AlphaMask& mask, PointI origin,
                  const GlyphPasses& passes);

// Full text pass over `base`; returns an opaque Rgb8 image of the same size.
[[nodiscard]] image::RasterImage draw_text_block(const image::RasterImage& base,
                                                 const text::TextBlock& block,
                                                 const text::FontFace& face,
                                                 const GlyphPasses& passes,
                                                 style::AnchorRatio anchor);

} // namespace marquee::render
