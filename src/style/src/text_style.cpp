#include "marquee/style/text_style.hpp"
#include "marquee/core/logger.hpp"
#include "marquee/core/numeric.hpp"
#include "marquee/core/string.hpp"
#include <cmath>

namespace marquee::style {

AnchorRatio PositionSpec::resolve() const {
    if (auto* custom = std::get_if<AnchorRatio>(&m_value)) {
        return {clamp_unit(custom->x), clamp_unit(custom->y)};
    }
    return lookup_position(std::get<PositionPreset>(m_value));
}

std::optional<AnchorRatio> PositionSpec::custom() const {
    if (auto* custom = std::get_if<AnchorRatio>(&m_value)) {
        return *custom;
    }
    return std::nullopt;
}

std::string_view gradient_direction_name(GradientDirection direction) {
    return direction == GradientDirection::Top ? "top" : "bottom";
}

GradientDirection parse_gradient_direction(std::string_view name) {
    if (equals_ignore_case(trim(name), "top")) {
        return GradientDirection::Top;
    }
    if (!equals_ignore_case(trim(name), "bottom")) {
        logging::get("style").warn_fmt("Unknown gradient direction '{}', using 'bottom'", name);
    }
    return GradientDirection::Bottom;
}

ColorScheme TextStyleConfig::resolved_colors() const {
    if (custom_colors) {
        return *custom_colors;
    }
    return lookup_color(color_scheme);
}

std::string TextStyleConfig::display_text() const {
    return uppercase ? to_upper(text) : text;
}

std::optional<std::string> validate(const TextStyleConfig& config) {
    if (config.font_size && *config.font_size <= 0) {
        return format_message("font_size must be positive, got {}", *config.font_size);
    }
    if (config.font_size && *config.font_size > MAX_FONT_SIZE) {
        return format_message("font_size must be at most {}, got {}", MAX_FONT_SIZE,
                              *config.font_size);
    }
    if (config.stroke_width > MAX_STROKE_WIDTH) {
        return format_message("stroke_width must be at most {}, got {}", MAX_STROKE_WIDTH,
                              config.stroke_width);
    }
    if (config.shadow_offset > MAX_SHADOW_OFFSET) {
        return format_message("shadow_offset must be at most {}, got {}", MAX_SHADOW_OFFSET,
                              config.shadow_offset);
    }
    if (!(config.max_width_ratio > 0.0 && config.max_width_ratio <= 1.0)) {
        return format_message("max_width_ratio must be in (0, 1], got {}", config.max_width_ratio);
    }
    if (auto custom = config.position.custom()) {
        // resolve() clamps the range; NaN or infinity has no sensible clamp
        if (!std::isfinite(custom->x) || !std::isfinite(custom->y)) {
            return format_message("custom position must be finite, got ({}, {})",
                                  custom->x, custom->y);
        }
    }
    if (config.gradient) {
        return validate(*config.gradient);
    }
    return std::nullopt;
}

std::optional<std::string> validate(const GradientConfig& config) {
    if (!std::isfinite(config.peak_opacity)) {
        return format_message("peak_opacity must be finite, got {}", config.peak_opacity);
    }
    if (!(config.band_height_ratio > 0.0 && config.band_height_ratio <= 1.0)) {
        return format_message("band_height_ratio must be in (0, 1], got {}",
                              config.band_height_ratio);
    }
    return std::nullopt;
}

} // namespace marquee::style
