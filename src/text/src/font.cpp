/**
 * FontFace measurement and the FreeType-backed face
 */

#include "marquee/text/font.hpp"
#include "marquee/core/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <mutex>
#include <unordered_map>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace marquee::text {

// ============================================================================
// FontFace
// ============================================================================

i32 FontFace::measure(std::string_view text) const {
    i32 width = 0;
    unicode::CodePoint prev = 0;
    bool has_prev = false;

    for (unicode::CodePoint cp : decode_utf8(text)) {
        width += advance(cp);
        if (has_prev) {
            width += kerning(prev, cp);
        }
        prev = cp;
        has_prev = true;
    }
    return width;
}

// ============================================================================
// FreeType library
// ============================================================================

struct FreeTypeLibrary::Impl {
    FT_Library library{nullptr};
    std::mutex mutex;

    ~Impl() {
        if (library) {
            FT_Done_FreeType(library);
        }
    }
};

namespace {

// 26.6 fixed point to whole pixels
i32 ceil_pixels(FT_Pos value) { return static_cast<i32>((value + 63) >> 6); }
i32 round_pixels(FT_Pos value) { return static_cast<i32>((value + 32) >> 6); }

class FreeTypeFace final : public FontFace {
public:
    FreeTypeFace(std::shared_ptr<FreeTypeLibrary::Impl> library, FT_Face face,
                 i32 pixel_size, std::string family)
        : m_library(std::move(library))
        , m_face(face)
        , m_family(std::move(family))
        , m_pixel_size(pixel_size)
    {
        // Ascender rounds up, descender rounds down
        m_metrics.ascender = ceil_pixels(m_face->size->metrics.ascender);
        m_metrics.descender = -ceil_pixels(-m_face->size->metrics.descender);
    }

    ~FreeTypeFace() override {
        std::lock_guard<std::mutex> lock(m_library->mutex);
        FT_Done_Face(m_face);
    }

    FreeTypeFace(const FreeTypeFace&) = delete;
    FreeTypeFace& operator=(const FreeTypeFace&) = delete;

    const std::string& family() const override { return m_family; }
    i32 pixel_size() const override { return m_pixel_size; }
    FaceMetrics metrics() const override { return m_metrics; }

    i32 advance(unicode::CodePoint cp) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return glyph_locked(cp).advance;
    }

    i32 kerning(unicode::CodePoint left, unicode::CodePoint right) const override {
        if (!FT_HAS_KERNING(m_face)) return 0;

        std::lock_guard<std::mutex> lock(m_mutex);
        FT_UInt left_index = FT_Get_Char_Index(m_face, left);
        FT_UInt right_index = FT_Get_Char_Index(m_face, right);
        if (left_index == 0 || right_index == 0) return 0;

        FT_Vector delta{};
        if (FT_Get_Kerning(m_face, left_index, right_index, FT_KERNING_DEFAULT, &delta)) {
            return 0;
        }
        return round_pixels(delta.x);
    }

    GlyphBitmap rasterize_glyph(unicode::CodePoint cp) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return glyph_locked(cp);
    }

private:
    // Caller holds m_mutex. Missing glyphs render as the face's .notdef.
    const GlyphBitmap& glyph_locked(unicode::CodePoint cp) const {
        auto it = m_glyphs.find(cp);
        if (it != m_glyphs.end()) {
            return it->second;
        }

        GlyphBitmap result;
        FT_UInt glyph_index = FT_Get_Char_Index(m_face, cp);

        if (FT_Load_Glyph(m_face, glyph_index, FT_LOAD_DEFAULT) ||
            FT_Render_Glyph(m_face->glyph, FT_RENDER_MODE_NORMAL)) {
            logging::get("text").debug_fmt("{}: cannot render U+{:04X}", m_family,
                                           static_cast<u32>(cp));
            return m_glyphs.emplace(cp, std::move(result)).first->second;
        }

        FT_GlyphSlot slot = m_face->glyph;
        const FT_Bitmap& bitmap = slot->bitmap;

        result.width = static_cast<i32>(bitmap.width);
        result.height = static_cast<i32>(bitmap.rows);
        result.bearing_x = slot->bitmap_left;
        result.bearing_y = slot->bitmap_top;
        result.advance = round_pixels(slot->advance.x);
        result.pixels.assign(static_cast<usize>(result.width) * static_cast<usize>(result.height), 0);

        for (i32 y = 0; y < result.height; ++y) {
            const u8* src = bitmap.buffer + static_cast<isize>(y) * bitmap.pitch;
            u8* dst = result.pixels.data() + static_cast<usize>(y) * static_cast<usize>(result.width);

            if (bitmap.pixel_mode == FT_PIXEL_MODE_GRAY) {
                std::copy(src, src + result.width, dst);
            } else if (bitmap.pixel_mode == FT_PIXEL_MODE_MONO) {
                for (i32 x = 0; x < result.width; ++x) {
                    dst[x] = (src[x >> 3] & (0x80 >> (x & 7))) ? 255 : 0;
                }
            }
        }

        return m_glyphs.emplace(cp, std::move(result)).first->second;
    }

    std::shared_ptr<FreeTypeLibrary::Impl> m_library;
    FT_Face m_face;
    std::string m_family;
    i32 m_pixel_size;
    FaceMetrics m_metrics;

    mutable std::mutex m_mutex;
    mutable std::unordered_map<unicode::CodePoint, GlyphBitmap> m_glyphs;
};

} // anonymous namespace

FreeTypeLibrary::FreeTypeLibrary() : m_impl(std::make_shared<Impl>()) {}

FreeTypeLibrary::~FreeTypeLibrary() = default;

Result<std::shared_ptr<FreeTypeLibrary>, std::string> FreeTypeLibrary::create() {
    std::shared_ptr<FreeTypeLibrary> library(new FreeTypeLibrary());
    FT_Error error = FT_Init_FreeType(&library->m_impl->library);
    if (error) {
        library->m_impl->library = nullptr;
        return make_error(format_message("FT_Init_FreeType failed (error {})", error));
    }
    return library;
}

Result<std::shared_ptr<const FontFace>, std::string>
FreeTypeLibrary::load_face(const std::string& path, i32 pixel_size) {
    if (pixel_size <= 0) {
        return make_error(format_message("invalid pixel size {}", pixel_size));
    }

    FT_Face face = nullptr;
    std::string family;
    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);

        FT_Error error = FT_New_Face(m_impl->library, path.c_str(), 0, &face);
        if (error) {
            return make_error(format_message("cannot open {} (FreeType error {})", path, error));
        }

        if (FT_Select_Charmap(face, FT_ENCODING_UNICODE)) {
            logging::get("text").debug_fmt("{}: no Unicode charmap, using the default", path);
        }

        error = FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(pixel_size));
        if (error) {
            FT_Done_Face(face);
            return make_error(format_message("cannot size {} to {}px (FreeType error {})",
                                             path, pixel_size, error));
        }

        family = face->family_name
            ? std::string(face->family_name)
            : std::filesystem::path(path).stem().string();
    }

    return std::shared_ptr<const FontFace>(
        std::make_shared<FreeTypeFace>(m_impl, face, pixel_size, std::move(family)));
}

} // namespace marquee::text
