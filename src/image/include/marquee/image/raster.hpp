#pragma once

#include "marquee/core/types.hpp"
#include <vector>

namespace marquee::image {

// ============================================================================
// Pixel formats
// ============================================================================

enum class PixelFormat : u8 {
    Rgba8,
    Rgb8,
};

[[nodiscard]] constexpr i32 channel_count(PixelFormat format) {
    return format == PixelFormat::Rgba8 ? 4 : 3;
}

// ============================================================================
// RasterImage - owned, tightly packed 8-bit pixels
// ============================================================================

class RasterImage {
public:
    RasterImage() = default;

    // Non-positive dimensions produce an invalid (empty) image.
    RasterImage(i32 width, i32 height, PixelFormat format,
                Color fill = Color::transparent());

    [[nodiscard]] bool is_valid() const noexcept { return m_width > 0 && m_height > 0; }

    [[nodiscard]] i32 width() const noexcept { return m_width; }
    [[nodiscard]] i32 height() const noexcept { return m_height; }
    [[nodiscard]] SizeI size() const noexcept { return {m_width, m_height}; }
    [[nodiscard]] PixelFormat format() const noexcept { return m_format; }
    [[nodiscard]] i32 channels() const noexcept { return channel_count(m_format); }
    [[nodiscard]] usize stride() const noexcept {
        return static_cast<usize>(m_width) * static_cast<usize>(channels());
    }

    [[nodiscard]] u8* data() noexcept { return m_pixels.data(); }
    [[nodiscard]] const u8* data() const noexcept { return m_pixels.data(); }
    [[nodiscard]] usize byte_size() const noexcept { return m_pixels.size(); }

    [[nodiscard]] u8* row(i32 y) noexcept { return m_pixels.data() + stride() * static_cast<usize>(y); }
    [[nodiscard]] const u8* row(i32 y) const noexcept {
        return m_pixels.data() + stride() * static_cast<usize>(y);
    }

    [[nodiscard]] bool contains(i32 x, i32 y) const noexcept {
        return x >= 0 && y >= 0 && x < m_width && y < m_height;
    }

    // Rgb8 pixels read back with alpha 255. Out-of-bounds reads are transparent.
    [[nodiscard]] Color pixel(i32 x, i32 y) const;
    void set_pixel(i32 x, i32 y, const Color& color);

    void fill(const Color& color);

    [[nodiscard]] RasterImage to_rgba() const;

    [[nodiscard]] bool operator==(const RasterImage& other) const;
    [[nodiscard]] bool operator!=(const RasterImage& other) const { return !(*this == other); }

private:
    i32 m_width{0};
    i32 m_height{0};
    PixelFormat m_format{PixelFormat::Rgba8};
    std::vector<u8> m_pixels;
};

// ============================================================================
// AlphaMask - 8-bit coverage positioned relative to an owner-defined origin
// ============================================================================

struct AlphaMask {
    i32 width{0};
    i32 height{0};
    i32 offset_x{0};     // Position of column 0 relative to the origin
    i32 offset_y{0};     // Position of row 0 relative to the origin
    std::vector<u8> coverage;

    [[nodiscard]] bool is_empty() const { return width <= 0 || height <= 0; }

    [[nodiscard]] u8 at(i32 x, i32 y) const {
        return coverage[static_cast<usize>(y) * static_cast<usize>(width) + static_cast<usize>(x)];
    }
};

// ============================================================================
// Pixel operations
// ============================================================================

// Composites `ink` over the covered pixels with alpha coverage * ink.a / 255,
// so partially covered edges keep the ink color instead of darkening toward
// a transparent target. `target` must be Rgba8. Pixels outside the target are
// clipped.
void paint_mask(RasterImage& target, const AlphaMask& mask, PointI origin, const Color& ink);

// Standard "over" compositing of an Rgba8 overlay onto a same-sized base.
// The base is promoted to Rgba8 if it was Rgb8.
void composite_over(RasterImage& base, const RasterImage& overlay);

// Drops the alpha channel. Rgb8 input is returned as a copy.
[[nodiscard]] RasterImage flatten(const RasterImage& image);

} // namespace marquee::image
