#pragma once

#include "marquee/text/font.hpp"
#include "marquee/image/raster.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace marquee::text {

// ============================================================================
// Layout constants
// ============================================================================

constexpr i32 LINE_SPACING = 4;        // Extra pixels between wrapped lines
constexpr i32 MIN_FONT_SIZE = 24;
constexpr f64 FONT_SIZE_RATIO = 0.12;  // Of canvas height

// ============================================================================
// Text Block
// ============================================================================

struct TextLine {
    std::string text;
    i32 width{0};
};

struct TextBlock {
    std::vector<TextLine> lines;
    i32 width{0};           // Widest line
    i32 height{0};          // (n - 1) * line_advance + line_height
    i32 line_height{0};     // ascender - descender
    i32 line_advance{0};    // line_height + LINE_SPACING
    i32 ascender{0};

    [[nodiscard]] bool is_empty() const { return lines.empty(); }
    [[nodiscard]] SizeI size() const { return {width, height}; }
};

// ============================================================================
// Sizing and wrapping
// ============================================================================

// Pixel size scaled to the canvas and shrunk for long captions:
//   base = round(h * 0.12); > 20 code points: round(base * 0.8);
//   > 30 code points: round(base * 0.7); never below MIN_FONT_SIZE.
// Rounding is half-to-even.
[[nodiscard]] i32 compute_font_size(std::string_view text, i32 canvas_height);

// Greedy word wrap against measured widths. A paragraph that already fits is
// returned untouched; otherwise words are joined by single spaces while the
// line still fits and a word wider than the limit gets a line to itself.
// Explicit '\n' breaks are kept.
[[nodiscard]] std::string wrap_text(std::string_view text, const FontFace& face, i32 max_width_px);

[[nodiscard]] TextBlock layout(std::string_view text, const FontFace& face, i32 max_width_px);

// ============================================================================
// Rasterization
// ============================================================================

// Coverage of the whole block, lines centered horizontally. Mask offsets are
// relative to the block's top-left corner; glyph overhang outside the block
// box is kept.
[[nodiscard]] image::AlphaMask rasterize_block(const TextBlock& block, const FontFace& face);

} // namespace marquee::text
