#pragma once

#include "marquee/style/presets.hpp"
#include <optional>
#include <string>
#include <variant>

namespace marquee::style {

// ============================================================================
// Position
// ============================================================================

// Either a named preset or caller-supplied ratios. Custom ratios outside
// [0, 1] are clamped when resolved.
class PositionSpec {
public:
    PositionSpec() : m_value(PositionPreset::BottomCenter) {}
    PositionSpec(PositionPreset preset) : m_value(preset) {}
    PositionSpec(AnchorRatio custom) : m_value(custom) {}

    [[nodiscard]] bool is_custom() const { return std::holds_alternative<AnchorRatio>(m_value); }

    // Raw caller ratios, unclamped
    [[nodiscard]] std::optional<AnchorRatio> custom() const;

    [[nodiscard]] AnchorRatio resolve() const;

private:
    std::variant<PositionPreset, AnchorRatio> m_value;
};

// ============================================================================
// Gradient
// ============================================================================

enum class GradientDirection : u8 {
    Top,
    Bottom,
};

[[nodiscard]] std::string_view gradient_direction_name(GradientDirection direction);
[[nodiscard]] GradientDirection parse_gradient_direction(std::string_view name);

struct GradientConfig {
    GradientDirection direction{GradientDirection::Bottom};
    f64 peak_opacity{0.6};
    f64 band_height_ratio{0.3};
};

// ============================================================================
// Text style
// ============================================================================

struct TextStyleConfig {
    std::string text;
    PositionSpec position{PositionPreset::BottomCenter};
    FontPreset font_preset{FontPreset::Impact};
    ColorSchemeId color_scheme{ColorSchemeId::WhiteShadow};

    // Replaces the preset scheme entirely when set
    std::optional<ColorScheme> custom_colors;

    // Pixel size; computed from text length and canvas height when unset
    std::optional<i32> font_size;

    i32 stroke_width{4};
    i32 shadow_offset{5};
    f64 max_width_ratio{0.9};

    bool uppercase{false};

    // Applied to the base image before the text passes
    std::optional<GradientConfig> gradient;

    [[nodiscard]] ColorScheme resolved_colors() const;

    // Caption text with the uppercase option applied
    [[nodiscard]] std::string display_text() const;
};

// ============================================================================
// Validation
// ============================================================================

// Upper bounds on the pixel-sized fields. Rendering cost grows with the square
// of each, so larger values are rejected rather than attempted.
constexpr i32 MAX_FONT_SIZE = 4096;
constexpr i32 MAX_STROKE_WIDTH = 256;
constexpr i32 MAX_SHADOW_OFFSET = 256;

// Describes the first rejected field, or nullopt when the config is usable.
// Only values that would produce surprising or unbounded output are rejected;
// unknown or out-of-range presentational values are clamped at render time.
[[nodiscard]] std::optional<std::string> validate(const TextStyleConfig& config);
[[nodiscard]] std::optional<std::string> validate(const GradientConfig& config);

} // namespace marquee::style
