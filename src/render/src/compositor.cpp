/**
 * Compositing facade
 */

#include "marquee/render/compositor.hpp"
#include "marquee/core/logger.hpp"
#include "marquee/core/string.hpp"
#include <cmath>

namespace marquee::render {

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::DecodeError:   return "decode_error";
        case ErrorCode::EncodeError:   return "encode_error";
        case ErrorCode::InvalidConfig: return "invalid_config";
    }
    return "unknown";
}

namespace {

text::FontResolverOptions resolver_options(const EngineConfig& config) {
    text::FontResolverOptions options;
    options.fonts_dir = config.fonts_dir;
    if (config.use_system_fonts) {
        options.system_dirs = text::FontResolver::system_font_dirs();
    }
    options.use_fontconfig = config.use_fontconfig;
    return options;
}

Error<ComposeError> invalid_config(std::string message) {
    logging::get("render").warn_fmt("Rejected configuration: {}", message);
    return make_error(ComposeError{ErrorCode::InvalidConfig, std::move(message)});
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TextCompositor::TextCompositor(EngineConfig config)
    : TextCompositor(std::move(config), nullptr)
{
}

TextCompositor::TextCompositor(EngineConfig config, std::shared_ptr<text::FontCache> cache)
    : m_config(std::move(config))
    , m_cache(cache ? std::move(cache) : std::make_shared<text::FontCache>())
    , m_resolver(*m_cache, resolver_options(m_config))
{
}

style::TextStyleConfig TextCompositor::thumbnail_style(std::string_view text) {
    style::TextStyleConfig config;
    config.text = std::string(text);
    config.position = style::PositionPreset::BottomCenter;
    config.font_preset = style::FontPreset::Impact;
    config.color_scheme = style::ColorSchemeId::WhiteShadow;
    config.stroke_width = 5;
    config.shadow_offset = 4;
    config.uppercase = true;
    config.gradient = style::GradientConfig{style::GradientDirection::Bottom, 0.5, 0.35};
    return config;
}

// ============================================================================
// Byte-level API
// ============================================================================

ComposeResult<std::vector<u8>> TextCompositor::compose_text_overlay(
    std::span<const u8> image_bytes, const style::TextStyleConfig& config) {
    if (auto problem = style::validate(config)) {
        return invalid_config(std::move(*problem));
    }

    auto decoded = decode(image_bytes);
    if (!decoded) {
        return make_error(std::move(decoded).error());
    }
    return encode(draw(decoded.value(), config));
}

ComposeResult<std::vector<u8>> TextCompositor::apply_gradient(
    std::span<const u8> image_bytes, const style::GradientConfig& config) {
    if (auto problem = style::validate(config)) {
        return invalid_config(std::move(*problem));
    }

    auto decoded = decode(image_bytes);
    if (!decoded) {
        return make_error(std::move(decoded).error());
    }
    return encode(render::apply_gradient(decoded.value(), config));
}

ComposeResult<std::vector<u8>> TextCompositor::compose_batch(
    std::span<const u8> image_bytes, const std::vector<style::TextStyleConfig>& configs) {
    for (usize i = 0; i < configs.size(); ++i) {
        if (auto problem = style::validate(configs[i])) {
            return invalid_config(format_message("overlay {}: {}", i, *problem));
        }
    }

    auto decoded = decode(image_bytes);
    if (!decoded) {
        return make_error(std::move(decoded).error());
    }

    image::RasterImage current = std::move(decoded).value();
    for (const auto& config : configs) {
        current = draw(current, config);
    }

    logging::get("render").debug_fmt("Batch of {} overlays composed", configs.size());
    return encode(configs.empty() ? image::flatten(current) : current);
}

ComposeResult<std::vector<u8>> TextCompositor::compose_thumbnail(
    std::span<const u8> image_bytes, std::string_view text) {
    return compose_text_overlay(image_bytes, thumbnail_style(text));
}

// ============================================================================
// Raster-level API
// ============================================================================

ComposeResult<image::RasterImage> TextCompositor::render_text(
    const image::RasterImage& base, const style::TextStyleConfig& config) {
    if (auto problem = style::validate(config)) {
        return invalid_config(std::move(*problem));
    }
    if (!base.is_valid()) {
        return make_error(ComposeError{ErrorCode::DecodeError, "empty input image"});
    }
    return draw(base, config);
}

ComposeResult<image::RasterImage> TextCompositor::render_gradient(
    const image::RasterImage& base, const style::GradientConfig& config) {
    if (auto problem = style::validate(config)) {
        return invalid_config(std::move(*problem));
    }
    if (!base.is_valid()) {
        return make_error(ComposeError{ErrorCode::DecodeError, "empty input image"});
    }
    return render::apply_gradient(base, config);
}

// ============================================================================
// Internals
// ============================================================================

image::RasterImage TextCompositor::draw(const image::RasterImage& base,
                                        const style::TextStyleConfig& config) {
    auto& log = logging::get("render");

    const std::string caption = config.display_text();
    if (split_whitespace(caption).empty()) {
        log.debug("Empty caption; image passes through unchanged");
        return image::flatten(base);
    }

    image::RasterImage canvas = config.gradient
        ? render::apply_gradient(base, *config.gradient)
        : base;

    const i32 size = config.font_size.value_or(text::compute_font_size(caption, canvas.height()));
    auto face = m_resolver.resolve(config.font_preset, size);

    const i32 max_width = static_cast<i32>(
        std::floor(static_cast<f64>(canvas.width()) * config.max_width_ratio));
    const text::TextBlock block = text::layout(caption, *face, max_width);

    log.debug_fmt("Caption at {}px with '{}': {} line(s), max width {}px", size, face->family(),
                  block.lines.size(), max_width);

    const GlyphPasses passes{config.resolved_colors(), config.stroke_width, config.shadow_offset};
    return draw_text_block(canvas, block, *face, passes, config.position.resolve());
}

ComposeResult<image::RasterImage> TextCompositor::decode(std::span<const u8> bytes) const {
    auto decoded = image::decode_image(bytes);
    if (!decoded) {
        logging::get("render").error_fmt("Decode failed: {}", decoded.error());
        return make_error(ComposeError{ErrorCode::DecodeError, std::move(decoded).error()});
    }
    return std::move(decoded).value();
}

ComposeResult<std::vector<u8>> TextCompositor::encode(const image::RasterImage& image) const {
    auto encoded = image::encode_image(image, m_config.encode);
    if (!encoded) {
        logging::get("render").error_fmt("Encode failed: {}", encoded.error());
        return make_error(ComposeError{ErrorCode::EncodeError, std::move(encoded).error()});
    }
    return std::move(encoded).value();
}

} // namespace marquee::render
