#include "marquee/style/presets.hpp"
#include "marquee/core/logger.hpp"
#include "marquee/core/string.hpp"

namespace marquee::style {

// ============================================================================
// Font styles
// ============================================================================

std::vector<std::string_view> FontStyle::candidates() const {
    std::vector<std::string_view> names;
    names.reserve(fallbacks.size() + 1);
    names.push_back(family);
    names.insert(names.end(), fallbacks.begin(), fallbacks.end());
    return names;
}

FontStyle lookup_font_style(FontPreset preset) {
    switch (preset) {
        case FontPreset::Modern:
            return {"Montserrat", {"Arial", "Helvetica", "DejaVuSans"}, FontWeight::Bold};
        case FontPreset::Dramatic:
            return {"Bebas Neue", {"Impact", "Arial Black", "DejaVuSans-Bold"}, FontWeight::Regular};
        case FontPreset::Clean:
            return {"Roboto", {"Arial", "Helvetica", "DejaVuSans"}, FontWeight::Bold};
        case FontPreset::Impact:
        default:
            return {"Impact", {"Arial Black", "Helvetica Bold", "DejaVuSans-Bold"}, FontWeight::Bold};
    }
}

// ============================================================================
// Colors
// ============================================================================

ColorSchemeHex color_scheme_hex(ColorSchemeId id) {
    switch (id) {
        case ColorSchemeId::YellowPop:    return {"#FFFF00", "#000000", "#000000"};
        case ColorSchemeId::RedAlert:     return {"#FF0000", "#FFFFFF", "#000000"};
        case ColorSchemeId::BlueTrust:    return {"#00BFFF", "#000000", "#000000"};
        case ColorSchemeId::GreenSuccess: return {"#00FF00", "#000000", "#000000"};
        case ColorSchemeId::WhiteShadow:
        default:                          return {"#FFFFFF", "#000000", "#000000"};
    }
}

ColorScheme lookup_color(ColorSchemeId id) {
    auto hex = color_scheme_hex(id);
    // Registry literals are well-formed; value_or keeps the compiler honest.
    return {
        parse_hex_color(hex.fill).value_or(Color::white()),
        parse_hex_color(hex.stroke).value_or(Color::black()),
        parse_hex_color(hex.shadow).value_or(Color::black()),
    };
}

namespace {

std::optional<u8> hex_digit_value(char c) {
    if (c >= '0' && c <= '9') return static_cast<u8>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<u8>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<u8>(c - 'A' + 10);
    return std::nullopt;
}

} // anonymous namespace

std::optional<Color> parse_hex_color(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') {
        hex.remove_prefix(1);
    }
    if (hex.size() != 6) {
        return std::nullopt;
    }

    u8 channels[3];
    for (usize i = 0; i < 3; ++i) {
        auto high = hex_digit_value(hex[i * 2]);
        auto low = hex_digit_value(hex[i * 2 + 1]);
        if (!high || !low) {
            return std::nullopt;
        }
        channels[i] = static_cast<u8>((*high << 4) | *low);
    }
    return Color(channels[0], channels[1], channels[2]);
}

std::string to_hex(const Color& color) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string out = "#";
    for (u8 channel : {color.r, color.g, color.b}) {
        out.push_back(digits[channel >> 4]);
        out.push_back(digits[channel & 0x0F]);
    }
    return out;
}

// ============================================================================
// Positions
// ============================================================================

AnchorRatio lookup_position(PositionPreset preset) {
    switch (preset) {
        case PositionPreset::TopLeft:      return {0.05, 0.1};
        case PositionPreset::TopCenter:    return {0.5, 0.1};
        case PositionPreset::TopRight:     return {0.95, 0.1};
        case PositionPreset::Center:       return {0.5, 0.5};
        case PositionPreset::BottomLeft:   return {0.05, 0.85};
        case PositionPreset::BottomRight:  return {0.95, 0.85};
        case PositionPreset::BottomCenter:
        default:                           return {0.5, 0.85};
    }
}

// ============================================================================
// Names
// ============================================================================

std::string_view font_preset_name(FontPreset preset) {
    switch (preset) {
        case FontPreset::Impact:   return "impact";
        case FontPreset::Modern:   return "modern";
        case FontPreset::Dramatic: return "dramatic";
        case FontPreset::Clean:    return "clean";
    }
    return "impact";
}

std::string_view color_scheme_name(ColorSchemeId id) {
    switch (id) {
        case ColorSchemeId::WhiteShadow:  return "white_shadow";
        case ColorSchemeId::YellowPop:    return "yellow_pop";
        case ColorSchemeId::RedAlert:     return "red_alert";
        case ColorSchemeId::BlueTrust:    return "blue_trust";
        case ColorSchemeId::GreenSuccess: return "green_success";
    }
    return "white_shadow";
}

std::string_view position_name(PositionPreset preset) {
    switch (preset) {
        case PositionPreset::TopLeft:      return "top_left";
        case PositionPreset::TopCenter:    return "top_center";
        case PositionPreset::TopRight:     return "top_right";
        case PositionPreset::Center:       return "center";
        case PositionPreset::BottomLeft:   return "bottom_left";
        case PositionPreset::BottomCenter: return "bottom_center";
        case PositionPreset::BottomRight:  return "bottom_right";
    }
    return "bottom_center";
}

namespace {

template<typename Enum, typename Presets, typename NameFn>
Enum parse_preset(std::string_view kind, std::string_view name, const Presets& presets,
                  NameFn name_of, Enum fallback) {
    auto trimmed = trim(name);
    for (auto preset : presets) {
        if (equals_ignore_case(trimmed, name_of(preset))) {
            return preset;
        }
    }
    logging::get("style").warn_fmt("Unknown {} preset '{}', using '{}'",
                                   kind, name, name_of(fallback));
    return fallback;
}

} // anonymous namespace

FontPreset parse_font_preset(std::string_view name) {
    return parse_preset(std::string_view("font"), name, ALL_FONT_PRESETS,
                        font_preset_name, FontPreset::Impact);
}

ColorSchemeId parse_color_scheme(std::string_view name) {
    return parse_preset(std::string_view("color"), name, ALL_COLOR_SCHEMES,
                        color_scheme_name, ColorSchemeId::WhiteShadow);
}

PositionPreset parse_position(std::string_view name) {
    return parse_preset(std::string_view("position"), name, ALL_POSITIONS,
                        position_name, PositionPreset::BottomCenter);
}

} // namespace marquee::style
