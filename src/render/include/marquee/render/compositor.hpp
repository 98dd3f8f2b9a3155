#pragma once

#include "marquee/render/engine_config.hpp"
#include "marquee/render/glyph_compositor.hpp"
#include "marquee/render/gradient.hpp"
#include "marquee/style/text_style.hpp"
#include "marquee/text/font_resolver.hpp"
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace marquee::render {

// ============================================================================
// Errors
// ============================================================================

enum class ErrorCode : u8 {
    DecodeError,     // Input bytes are not a readable PNG/JPEG
    EncodeError,     // Output could not be serialized
    InvalidConfig,   // Rejected before any rendering
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code);

struct ComposeError {
    ErrorCode code;
    std::string message;
};

template<typename T>
using ComposeResult = Result<T, ComposeError>;

// ============================================================================
// TextCompositor - public entry points
//
// Every call is independent: decode, optional gradient, text passes, encode.
// The only state shared between calls is the font cache, which may be shared
// with other compositors and used from several threads.
// ============================================================================

class TextCompositor {
public:
    explicit TextCompositor(EngineConfig config = {});
    TextCompositor(EngineConfig config, std::shared_ptr<text::FontCache> cache);

    TextCompositor(const TextCompositor&) = delete;
    TextCompositor& operator=(const TextCompositor&) = delete;

    // Byte-level API: PNG or JPEG in, configured output format out
    [[nodiscard]] ComposeResult<std::vector<u8>> compose_text_overlay(
        std::span<const u8> image_bytes, const style::TextStyleConfig& config);

    [[nodiscard]] ComposeResult<std::vector<u8>> apply_gradient(
        std::span<const u8> image_bytes, const style::GradientConfig& config);

    // Applies each config in order to the previous result; encodes once.
    // All configs are validated before anything is drawn.
    [[nodiscard]] ComposeResult<std::vector<u8>> compose_batch(
        std::span<const u8> image_bytes, const std::vector<style::TextStyleConfig>& configs);

    // Standard thumbnail look: bottom gradient, then uppercase caption
    [[nodiscard]] ComposeResult<std::vector<u8>> compose_thumbnail(
        std::span<const u8> image_bytes, std::string_view text);

    // Raster-level API, returns opaque Rgb8 images of the input size
    [[nodiscard]] ComposeResult<image::RasterImage> render_text(
        const image::RasterImage& base, const style::TextStyleConfig& config);

    [[nodiscard]] ComposeResult<image::RasterImage> render_gradient(
        const image::RasterImage& base, const style::GradientConfig& config);

    [[nodiscard]] static style::TextStyleConfig thumbnail_style(std::string_view text);

    [[nodiscard]] const EngineConfig& config() const { return m_config; }
    [[nodiscard]] text::FontResolver& fonts() { return m_resolver; }

private:
    [[nodiscard]] ComposeResult<image::RasterImage> decode(std::span<const u8> bytes) const;
    [[nodiscard]] ComposeResult<std::vector<u8>> encode(const image::RasterImage& image) const;

    // Text passes for an already validated config
    [[nodiscard]] image::RasterImage draw(const image::RasterImage& base,
                                          const style::TextStyleConfig& config);

    EngineConfig m_config;
    std::shared_ptr<text::FontCache> m_cache;
    text::FontResolver m_resolver;
};

} // namespace marquee::render
