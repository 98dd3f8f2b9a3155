#include "marquee/render/glyph_compositor.hpp"
#include "marquee/core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace marquee::render {

namespace {

i32 place_axis(i32 canvas, i32 block, f64 ratio) {
    const f64 anchor = ratio * static_cast<f64>(canvas);
    const i32 start = static_cast<i32>(std::floor(anchor - static_cast<f64>(block) / 2.0));

    const i32 upper = canvas - block - EDGE_MARGIN;
    if (upper < EDGE_MARGIN) {
        return EDGE_MARGIN;
    }
    return std::clamp(start, EDGE_MARGIN, upper);
}

} // anonymous namespace

PointI place_block(SizeI canvas, SizeI block, style::AnchorRatio anchor) {
    return {place_axis(canvas.width, block.width, anchor.x),
            place_axis(canvas.height, block.height, anchor.y)};
}

std::vector<PointI> disc_offsets(i32 radius) {
    std::vector<PointI> offsets;
    if (radius <= 0) {
        return offsets;
    }

    const i32 limit = radius * radius;
    for (i32 dy = -radius; dy <= radius; ++dy) {
        for (i32 dx = -radius; dx <= radius; ++dx) {
            if (dx * dx + dy * dy <= limit) {
                offsets.emplace_back(dx, dy);
            }
        }
    }
    return offsets;
}

void paint_passes(image::RasterImage& overlay, const image::AlphaMask& mask, PointI origin,
                  const GlyphPasses& passes) {
    if (mask.is_empty()) {
        return;
    }

    if (passes.shadow_offset > 0) {
        const PointI shadow_origin = origin + PointI(passes.shadow_offset, passes.shadow_offset);
        image::paint_mask(overlay, mask, shadow_origin,
                          passes.colors.shadow.with_alpha(SHADOW_ALPHA));
    }

    for (const PointI& offset : disc_offsets(passes.stroke_width)) {
        image::paint_mask(overlay, mask, origin + offset, passes.colors.stroke.with_alpha(255));
    }

    image::paint_mask(overlay, mask, origin, passes.colors.fill.with_alpha(255));
}

image::RasterImage draw_text_block(const image::RasterImage& base,
                                   const text::TextBlock& block,
                                   const text::FontFace& face,
                                   const GlyphPasses& passes,
                                   style::AnchorRatio anchor) {
    image::RasterImage canvas = base.to_rgba();
    if (block.is_empty()) {
        return image::flatten(canvas);
    }

    const PointI origin = place_block(canvas.size(), block.size(), anchor);
    logging::get("render").debug_fmt("Text block {}x{} ({} lines) at ({}, {})", block.width,
                                     block.height, block.lines.size(), origin.x, origin.y);

    const image::AlphaMask mask = text::rasterize_block(block, face);

    image::RasterImage overlay(canvas.width(), canvas.height(), image::PixelFormat::Rgba8);
    paint_passes(overlay, mask, origin, passes);

    image::composite_over(canvas, overlay);
    return image::flatten(canvas);
}

} // namespace marquee::render
