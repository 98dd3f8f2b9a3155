/**
 * Text sizing, greedy wrapping and block rasterization
 */

#include "marquee/text/layout.hpp"
#include "marquee/core/numeric.hpp"
#include "marquee/core/string.hpp"
#include <algorithm>
#include <limits>

namespace marquee::text {

// ============================================================================
// Sizing
// ============================================================================

i32 compute_font_size(std::string_view text, i32 canvas_height) {
    const usize length = code_point_count(text);

    i64 base = round_half_even(static_cast<f64>(canvas_height) * FONT_SIZE_RATIO);
    if (length > 20) {
        base = round_half_even(static_cast<f64>(base) * 0.8);
    }
    if (length > 30) {
        base = round_half_even(static_cast<f64>(base) * 0.7);
    }

    return static_cast<i32>(std::max<i64>(base, MIN_FONT_SIZE));
}

// ============================================================================
// Wrapping
// ============================================================================

namespace {

void wrap_paragraph(const std::string& paragraph, const FontFace& face, i32 max_width_px,
                    std::vector<std::string>& out) {
    if (face.measure(paragraph) <= max_width_px) {
        out.push_back(paragraph);
        return;
    }

    std::string current;
    for (auto& word : split_whitespace(paragraph)) {
        if (current.empty()) {
            current = std::move(word);
            continue;
        }

        std::string candidate = current + " " + word;
        if (face.measure(candidate) <= max_width_px) {
            current = std::move(candidate);
        } else {
            out.push_back(std::move(current));
            current = std::move(word);
        }
    }

    // Whitespace-only paragraphs keep their line
    out.push_back(std::move(current));
}

} // anonymous namespace

std::string wrap_text(std::string_view text, const FontFace& face, i32 max_width_px) {
    if (text.empty()) {
        return {};
    }

    std::vector<std::string> lines;
    for (const auto& paragraph : split_lines(text)) {
        wrap_paragraph(paragraph, face, max_width_px, lines);
    }
    return join(lines, "\n");
}

TextBlock layout(std::string_view text, const FontFace& face, i32 max_width_px) {
    TextBlock block;
    const FaceMetrics metrics = face.metrics();
    block.ascender = metrics.ascender;
    block.line_height = metrics.line_height();
    block.line_advance = block.line_height + LINE_SPACING;

    if (text.empty()) {
        return block;
    }

    for (auto& line : split_lines(wrap_text(text, face, max_width_px))) {
        const i32 width = face.measure(line);
        block.width = std::max(block.width, width);
        block.lines.push_back({std::move(line), width});
    }

    const i32 count = static_cast<i32>(block.lines.size());
    block.height = (count - 1) * block.line_advance + block.line_height;
    return block;
}

// ============================================================================
// Rasterization
// ============================================================================

namespace {

struct PlacedGlyph {
    PointI position;    // Top-left of the bitmap within the block
    GlyphBitmap bitmap;
};

} // anonymous namespace

image::AlphaMask rasterize_block(const TextBlock& block, const FontFace& face) {
    std::vector<PlacedGlyph> placed;

    i32 min_x = std::numeric_limits<i32>::max();
    i32 min_y = std::numeric_limits<i32>::max();
    i32 max_x = std::numeric_limits<i32>::min();
    i32 max_y = std::numeric_limits<i32>::min();

    for (usize i = 0; i < block.lines.size(); ++i) {
        const TextLine& line = block.lines[i];
        const i32 baseline = static_cast<i32>(i) * block.line_advance + block.ascender;

        i32 pen = (block.width - line.width) / 2;
        unicode::CodePoint prev = 0;
        bool has_prev = false;

        for (unicode::CodePoint cp : decode_utf8(line.text)) {
            if (has_prev) {
                pen += face.kerning(prev, cp);
            }

            GlyphBitmap bitmap = face.rasterize_glyph(cp);
            const i32 advance = bitmap.advance;

            if (!bitmap.is_empty()) {
                PointI position{pen + bitmap.bearing_x, baseline - bitmap.bearing_y};
                min_x = std::min(min_x, position.x);
                min_y = std::min(min_y, position.y);
                max_x = std::max(max_x, position.x + bitmap.width);
                max_y = std::max(max_y, position.y + bitmap.height);
                placed.push_back({position, std::move(bitmap)});
            }

            pen += advance;
            prev = cp;
            has_prev = true;
        }
    }

    image::AlphaMask mask;
    if (placed.empty()) {
        return mask;
    }

    mask.width = max_x - min_x;
    mask.height = max_y - min_y;
    mask.offset_x = min_x;
    mask.offset_y = min_y;
    mask.coverage.assign(static_cast<usize>(mask.width) * static_cast<usize>(mask.height), 0);

    // Overlapping glyphs keep the stronger coverage
    for (const auto& glyph : placed) {
        const i32 left = glyph.position.x - min_x;
        const i32 top = glyph.position.y - min_y;
        for (i32 y = 0; y < glyph.bitmap.height; ++y) {
            const u8* src = glyph.bitmap.pixels.data() +
                static_cast<usize>(y) * static_cast<usize>(glyph.bitmap.width);
            u8* dst = mask.coverage.data() +
                static_cast<usize>(top + y) * static_cast<usize>(mask.width) +
                static_cast<usize>(left);
            for (i32 x = 0; x < glyph.bitmap.width; ++x) {
                dst[x] = std::max(dst[x], src[x]);
            }
        }
    }

    return mask;
}

} // namespace marquee::text
