#include "marquee/image/raster.hpp"
#include "marquee/core/numeric.hpp"
#include <algorithm>

namespace marquee::image {

// ============================================================================
// RasterImage
// ============================================================================

RasterImage::RasterImage(i32 width, i32 height, PixelFormat format, Color fill_color)
    : m_format(format)
{
    if (width <= 0 || height <= 0) {
        return;
    }
    m_width = width;
    m_height = height;
    m_pixels.resize(stride() * static_cast<usize>(height));
    fill(fill_color);
}

Color RasterImage::pixel(i32 x, i32 y) const {
    if (!contains(x, y)) {
        return Color::transparent();
    }
    const u8* p = row(y) + static_cast<usize>(x) * static_cast<usize>(channels());
    if (m_format == PixelFormat::Rgb8) {
        return {p[0], p[1], p[2], 255};
    }
    return {p[0], p[1], p[2], p[3]};
}

void RasterImage::set_pixel(i32 x, i32 y, const Color& color) {
    if (!contains(x, y)) {
        return;
    }
    u8* p = row(y) + static_cast<usize>(x) * static_cast<usize>(channels());
    p[0] = color.r;
    p[1] = color.g;
    p[2] = color.b;
    if (m_format == PixelFormat::Rgba8) {
        p[3] = color.a;
    }
}

void RasterImage::fill(const Color& color) {
    const usize ch = static_cast<usize>(channels());
    for (usize i = 0; i < m_pixels.size(); i += ch) {
        m_pixels[i] = color.r;
        m_pixels[i + 1] = color.g;
        m_pixels[i + 2] = color.b;
        if (ch == 4) {
            m_pixels[i + 3] = color.a;
        }
    }
}

RasterImage RasterImage::to_rgba() const {
    if (m_format == PixelFormat::Rgba8) {
        return *this;
    }

    RasterImage out(m_width, m_height, PixelFormat::Rgba8);
    const usize count = static_cast<usize>(m_width) * static_cast<usize>(m_height);
    const u8* src = m_pixels.data();
    u8* dst = out.data();
    for (usize i = 0; i < count; ++i) {
        dst[i * 4] = src[i * 3];
        dst[i * 4 + 1] = src[i * 3 + 1];
        dst[i * 4 + 2] = src[i * 3 + 2];
        dst[i * 4 + 3] = 255;
    }
    return out;
}

bool RasterImage::operator==(const RasterImage& other) const {
    return m_width == other.m_width && m_height == other.m_height &&
           m_format == other.m_format && m_pixels == other.m_pixels;
}

// ============================================================================
// Pixel operations
// ============================================================================

namespace {

// Straight-alpha "over" of color `s` with alpha `sa` onto the Rgba8 pixel `d`.
// Everything is scaled by 255 to stay in integers:
//   out_a * 255 = sa * 255 + da * (255 - sa)
//   out_c = (sc * sa * 255 + dc * da * (255 - sa)) / (out_a * 255)
void blend_over(u8* d, const u8* s, u32 sa) {
    if (sa == 0) {
        return;
    }
    if (sa == 255) {
        std::copy(s, s + 3, d);
        d[3] = 255;
        return;
    }

    const u32 da = d[3];
    const u32 dst_weight = da * (255 - sa);
    const u32 out_a255 = sa * 255 + dst_weight;

    for (int c = 0; c < 3; ++c) {
        const u32 numerator = s[c] * sa * 255 + d[c] * dst_weight;
        d[c] = static_cast<u8>((numerator + out_a255 / 2) / out_a255);
    }
    d[3] = static_cast<u8>(div255(out_a255));
}

} // anonymous namespace

void paint_mask(RasterImage& target, const AlphaMask& mask, PointI origin, const Color& ink) {
    if (mask.is_empty() || target.format() != PixelFormat::Rgba8) {
        return;
    }

    const i32 left = origin.x + mask.offset_x;
    const i32 top = origin.y + mask.offset_y;

    // Clip the mask rectangle against the target
    RectI bounds = RectI(left, top, mask.width, mask.height)
        .intersection(RectI(0, 0, target.width(), target.height()));
    if (bounds.is_empty()) {
        return;
    }

    const u8 ink_rgb[3] = {ink.r, ink.g, ink.b};

    for (i32 y = bounds.top(); y < bounds.bottom(); ++y) {
        u8* row = target.row(y);
        for (i32 x = bounds.left(); x < bounds.right(); ++x) {
            const u32 m = mask.at(x - left, y - top);
            if (m == 0) continue;

            blend_over(row + static_cast<usize>(x) * 4, ink_rgb, div255(m * ink.a));
        }
    }
}

void composite_over(RasterImage& base, const RasterImage& overlay) {
    if (base.format() != PixelFormat::Rgba8) {
        base = base.to_rgba();
    }
    if (overlay.format() != PixelFormat::Rgba8 || overlay.size() != base.size()) {
        return;
    }

    const usize count = static_cast<usize>(base.width()) * static_cast<usize>(base.height());
    u8* dst = base.data();
    const u8* src = overlay.data();

    for (usize i = 0; i < count; ++i) {
        const u8* s = src + i * 4;
        blend_over(dst + i * 4, s, s[3]);
    }
}

RasterImage flatten(const RasterImage& image) {
    if (image.format() == PixelFormat::Rgb8) {
        return image;
    }

    RasterImage out(image.width(), image.height(), PixelFormat::Rgb8);
    const usize count = static_cast<usize>(image.width()) * static_cast<usize>(image.height());
    const u8* src = image.data();
    u8* dst = out.data();
    for (usize i = 0; i < count; ++i) {
        dst[i * 3] = src[i * 4];
        dst[i * 3 + 1] = src[i * 4 + 1];
        dst[i * 3 + 2] = src[i * 4 + 2];
    }
    return out;
}

} // namespace marquee::image
