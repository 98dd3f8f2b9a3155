#include <gtest/gtest.h>
#include "marquee/style/presets.hpp"
#include <set>

using namespace marquee;
using namespace marquee::style;

// ============================================================================
// Color Registry Tests
// ============================================================================

TEST(ColorRegistryTest, EveryEntryMatchesItsHex) {
    for (auto id : ALL_COLOR_SCHEMES) {
        auto hex = color_scheme_hex(id);
        auto colors = lookup_color(id);

        EXPECT_EQ(to_hex(colors.fill), hex.fill) << color_scheme_name(id);
        EXPECT_EQ(to_hex(colors.stroke), hex.stroke) << color_scheme_name(id);
        EXPECT_EQ(to_hex(colors.shadow), hex.shadow) << color_scheme_name(id);
        EXPECT_EQ(colors.fill.a, 255);
    }
}

TEST(ColorRegistryTest, KnownSchemes) {
    EXPECT_EQ(lookup_color(ColorSchemeId::WhiteShadow).fill, Color::white());
    EXPECT_EQ(lookup_color(ColorSchemeId::YellowPop).fill, Color(255, 255, 0));
    EXPECT_EQ(lookup_color(ColorSchemeId::RedAlert).stroke, Color::white());
    EXPECT_EQ(lookup_color(ColorSchemeId::BlueTrust).fill, Color(0, 191, 255));
    EXPECT_EQ(lookup_color(ColorSchemeId::GreenSuccess).fill, Color(0, 255, 0));
}

TEST(HexColorTest, Parse) {
    EXPECT_EQ(parse_hex_color("#FF8000"), Color(255, 128, 0));
    EXPECT_EQ(parse_hex_color("ff8000"), Color(255, 128, 0));
    EXPECT_EQ(parse_hex_color("#00bfff"), Color(0, 191, 255));
}

TEST(HexColorTest, Rejects) {
    EXPECT_FALSE(parse_hex_color("").has_value());
    EXPECT_FALSE(parse_hex_color("#FFF").has_value());
    EXPECT_FALSE(parse_hex_color("#GG0000").has_value());
    EXPECT_FALSE(parse_hex_color("#FF000000").has_value());
}

TEST(HexColorTest, ToHexIgnoresAlpha) {
    EXPECT_EQ(to_hex(Color(0x12, 0xAB, 0xEF, 0)), "#12ABEF");
}

// ============================================================================
// Position Tests
// ============================================================================

TEST(PositionTest, AnchorsInsideUnitSquare) {
    for (auto preset : ALL_POSITIONS) {
        auto anchor = lookup_position(preset);
        EXPECT_GE(anchor.x, 0.0);
        EXPECT_LE(anchor.x, 1.0);
        EXPECT_GE(anchor.y, 0.0);
        EXPECT_LE(anchor.y, 1.0);
    }
}

TEST(PositionTest, KnownAnchors) {
    auto bottom = lookup_position(PositionPreset::BottomCenter);
    EXPECT_DOUBLE_EQ(bottom.x, 0.5);
    EXPECT_DOUBLE_EQ(bottom.y, 0.85);

    auto top_left = lookup_position(PositionPreset::TopLeft);
    EXPECT_DOUBLE_EQ(top_left.x, 0.05);
    EXPECT_DOUBLE_EQ(top_left.y, 0.1);

    auto center = lookup_position(PositionPreset::Center);
    EXPECT_DOUBLE_EQ(center.x, 0.5);
    EXPECT_DOUBLE_EQ(center.y, 0.5);
}

// ============================================================================
// Font Style Tests
// ============================================================================

TEST(FontStyleTest, CandidatesStartWithFamily) {
    for (auto preset : ALL_FONT_PRESETS) {
        auto style = lookup_font_style(preset);
        auto names = style.candidates();
        ASSERT_FALSE(names.empty());
        EXPECT_EQ(names.front(), style.family);
        EXPECT_EQ(names.size(), style.fallbacks.size() + 1);
    }
}

TEST(FontStyleTest, ImpactChain) {
    auto style = lookup_font_style(FontPreset::Impact);
    EXPECT_EQ(style.family, "Impact");
    EXPECT_EQ(style.weight, FontWeight::Bold);
    EXPECT_EQ(style.fallbacks.back(), "DejaVuSans-Bold");
}

// ============================================================================
// Name Parsing Tests
// ============================================================================

TEST(PresetNameTest, NamesAreUnique) {
    std::set<std::string_view> names;
    for (auto id : ALL_COLOR_SCHEMES) names.insert(color_scheme_name(id));
    EXPECT_EQ(names.size(), ALL_COLOR_SCHEMES.size());

    names.clear();
    for (auto p : ALL_POSITIONS) names.insert(position_name(p));
    EXPECT_EQ(names.size(), ALL_POSITIONS.size());
}

TEST(PresetNameTest, ParseRoundTrip) {
    for (auto p : ALL_FONT_PRESETS) EXPECT_EQ(parse_font_preset(font_preset_name(p)), p);
    for (auto id : ALL_COLOR_SCHEMES) EXPECT_EQ(parse_color_scheme(color_scheme_name(id)), id);
    for (auto p : ALL_POSITIONS) EXPECT_EQ(parse_position(position_name(p)), p);
}

TEST(PresetNameTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parse_font_preset(" Dramatic "), FontPreset::Dramatic);
    EXPECT_EQ(parse_color_scheme("YELLOW_POP"), ColorSchemeId::YellowPop);
    EXPECT_EQ(parse_position("Top_Right"), PositionPreset::TopRight);
}

TEST(PresetNameTest, UnknownNamesFallBack) {
    EXPECT_EQ(parse_font_preset("comic"), FontPreset::Impact);
    EXPECT_EQ(parse_color_scheme("purple_haze"), ColorSchemeId::WhiteShadow);
    EXPECT_EQ(parse_position("middle"), PositionPreset::BottomCenter);
}
