#pragma once

#include "marquee/core/types.hpp"
#include "marquee/core/string.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace marquee::text {

// ============================================================================
// Face Metrics
// ============================================================================

struct FaceMetrics {
    i32 ascender{0};     // Pixels from baseline to top
    i32 descender{0};    // Pixels from baseline to bottom (negative)

    [[nodiscard]] i32 line_height() const { return ascender - descender; }
};

// ============================================================================
// Glyph Bitmap
// ============================================================================

struct GlyphBitmap {
    std::vector<u8> pixels;  // Coverage only, row-major, width * height
    i32 width{0};
    i32 height{0};
    i32 bearing_x{0};        // Offset from pen position to left edge
    i32 bearing_y{0};        // Offset from baseline up to top edge
    i32 advance{0};          // Horizontal advance in pixels

    [[nodiscard]] bool is_empty() const { return width <= 0 || height <= 0; }
};

// ============================================================================
// FontFace - a typeface loaded at one pixel size
//
// Implementations are immutable from the caller's point of view and safe to
// share between threads.
// ============================================================================

class FontFace {
public:
    virtual ~FontFace() = default;

    [[nodiscard]] virtual const std::string& family() const = 0;
    [[nodiscard]] virtual i32 pixel_size() const = 0;
    [[nodiscard]] virtual bool is_builtin() const { return false; }

    [[nodiscard]] virtual FaceMetrics metrics() const = 0;

    [[nodiscard]] virtual i32 advance(unicode::CodePoint cp) const = 0;
    [[nodiscard]] virtual i32 kerning(unicode::CodePoint left, unicode::CodePoint right) const = 0;
    [[nodiscard]] virtual GlyphBitmap rasterize_glyph(unicode::CodePoint cp) const = 0;

    // Sum of advances plus pair kerning for a single line, in pixels
    [[nodiscard]] i32 measure(std::string_view text) const;
};

// ============================================================================
// BuiltinFace - compiled-in 5x7 bitmap font
//
// Last resort when no font file can be loaded. Covers printable ASCII;
// everything else draws as a hollow box. Glyphs are scaled by an integer
// factor derived from the requested pixel size.
// ============================================================================

class BuiltinFace final : public FontFace {
public:
    explicit BuiltinFace(i32 pixel_size);

    [[nodiscard]] const std::string& family() const override { return m_family; }
    [[nodiscard]] i32 pixel_size() const override { return m_pixel_size; }
    [[nodiscard]] bool is_builtin() const override { return true; }

    [[nodiscard]] FaceMetrics metrics() const override;

    [[nodiscard]] i32 advance(unicode::CodePoint cp) const override;
    [[nodiscard]] i32 kerning(unicode::CodePoint, unicode::CodePoint) const override { return 0; }
    [[nodiscard]] GlyphBitmap rasterize_glyph(unicode::CodePoint cp) const override;

    [[nodiscard]] i32 scale() const { return m_scale; }

private:
    std::string m_family{"builtin"};
    i32 m_pixel_size;
    i32 m_scale;
};

// ============================================================================
// FreeTypeLibrary - owns the FT_Library handle
//
// Face creation and destruction touch library-wide state and are serialized
// here; each loaded face serializes its own glyph access.
// ============================================================================

class FreeTypeLibrary {
public:
    [[nodiscard]] static Result<std::shared_ptr<FreeTypeLibrary>, std::string> create();

    ~FreeTypeLibrary();

    FreeTypeLibrary(const FreeTypeLibrary&) = delete;
    FreeTypeLibrary& operator=(const FreeTypeLibrary&) = delete;

    // Load the first face of a font file at the given pixel size
    [[nodiscard]] Result<std::shared_ptr<const FontFace>, std::string>
    load_face(const std::string& path, i32 pixel_size);

    struct Impl;

private:
    FreeTypeLibrary();

    std::shared_ptr<Impl> m_impl;
};

} // namespace marquee::text
