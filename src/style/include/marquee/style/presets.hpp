#pragma once

#include "marquee/core/types.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marquee::style {

// ============================================================================
// Font style presets
// ============================================================================

enum class FontPreset : u8 {
    Impact,
    Modern,
    Dramatic,
    Clean,
};

enum class FontWeight : u8 {
    Regular,
    Bold,
};

struct FontStyle {
    std::string_view family;
    std::vector<std::string_view> fallbacks;
    FontWeight weight{FontWeight::Bold};

    // [family] + fallbacks, in resolution order
    [[nodiscard]] std::vector<std::string_view> candidates() const;
};

[[nodiscard]] FontStyle lookup_font_style(FontPreset preset);

// ============================================================================
// Color schemes
// ============================================================================

enum class ColorSchemeId : u8 {
    WhiteShadow,
    YellowPop,
    RedAlert,
    BlueTrust,
    GreenSuccess,
};

struct ColorScheme {
    Color fill;
    Color stroke;
    Color shadow;

    constexpr bool operator==(const ColorScheme& other) const {
        return fill == other.fill && stroke == other.stroke && shadow == other.shadow;
    }
};

// Registry entries as authored ("#RRGGBB")
struct ColorSchemeHex {
    std::string_view fill;
    std::string_view stroke;
    std::string_view shadow;
};

[[nodiscard]] ColorSchemeHex color_scheme_hex(ColorSchemeId id);
[[nodiscard]] ColorScheme lookup_color(ColorSchemeId id);

// "#RRGGBB" or "RRGGBB", either case. Alpha is always opaque.
[[nodiscard]] std::optional<Color> parse_hex_color(std::string_view hex);

// "#RRGGBB", uppercase; alpha is ignored
[[nodiscard]] std::string to_hex(const Color& color);

// ============================================================================
// Position presets
// ============================================================================

enum class PositionPreset : u8 {
    TopLeft,
    TopCenter,
    TopRight,
    Center,
    BottomLeft,
    BottomCenter,
    BottomRight,
};

struct AnchorRatio {
    f64 x{0.5};
    f64 y{0.5};
};

[[nodiscard]] AnchorRatio lookup_position(PositionPreset preset);

// ============================================================================
// Enumeration and name parsing
//
// Unknown names fall back to Impact / WhiteShadow / BottomCenter and log a
// warning; presets are a convenience, not a validation boundary.
// ============================================================================

inline constexpr std::array ALL_FONT_PRESETS{
    FontPreset::Impact, FontPreset::Modern, FontPreset::Dramatic, FontPreset::Clean,
};

inline constexpr std::array ALL_COLOR_SCHEMES{
    ColorSchemeId::WhiteShadow, ColorSchemeId::YellowPop, ColorSchemeId::RedAlert,
    ColorSchemeId::BlueTrust, ColorSchemeId::GreenSuccess,
};

inline constexpr std::array ALL_POSITIONS{
    PositionPreset::TopLeft, PositionPreset::TopCenter, PositionPreset::TopRight,
    PositionPreset::Center, PositionPreset::BottomLeft, PositionPreset::BottomCenter,
    PositionPreset::BottomRight,
};

[[nodiscard]] std::string_view font_preset_name(FontPreset preset);
[[nodiscard]] std::string_view color_scheme_name(ColorSchemeId id);
[[nodiscard]] std::string_view position_name(PositionPreset preset);

[[nodiscard]] FontPreset parse_font_preset(std::string_view name);
[[nodiscard]] ColorSchemeId parse_color_scheme(std::string_view name);
[[nodiscard]] PositionPreset parse_position(std::string_view name);

} // namespace marquee::style
