#include <gtest/gtest.h>
#include "marquee/render/compositor.hpp"
#include "marquee/image/codec.hpp"
#include "marquee/text/layout.hpp"
#include <limits>

using namespace marquee;
using namespace marquee::render;

namespace {

// Font lookup disabled so every caption uses the built-in face
EngineConfig offline_config() {
    EngineConfig config;
    config.fonts_dir.clear();
    config.use_system_fonts = false;
    config.use_fontconfig = false;
    return config;
}

const Color BACKGROUND(50, 100, 150);

std::vector<u8> png_of(const image::RasterImage& image) {
    auto encoded = image::encode_png(image, 6);
    EXPECT_TRUE(encoded.is_ok());
    return encoded.is_ok() ? encoded.value() : std::vector<u8>{};
}

std::vector<u8> solid_png(i32 width, i32 height, Color color = BACKGROUND) {
    return png_of(image::RasterImage(width, height, image::PixelFormat::Rgb8, color));
}

image::RasterImage decode(const std::vector<u8>& bytes) {
    auto decoded = image::decode_image(bytes);
    EXPECT_TRUE(decoded.is_ok());
    return decoded.is_ok() ? decoded.value() : image::RasterImage();
}

struct ChangedRegion {
    i32 count{0};
    i32 min_x{std::numeric_limits<i32>::max()};
    i32 min_y{std::numeric_limits<i32>::max()};
    i32 max_x{-1};
    i32 max_y{-1};
};

ChangedRegion changed_pixels(const image::RasterImage& image, Color background) {
    ChangedRegion region;
    for (i32 y = 0; y < image.height(); ++y) {
        for (i32 x = 0; x < image.width(); ++x) {
            if (!image.pixel(x, y).same_rgb(background)) {
                ++region.count;
                region.min_x = std::min(region.min_x, x);
                region.min_y = std::min(region.min_y, y);
                region.max_x = std::max(region.max_x, x);
                region.max_y = std::max(region.max_y, y);
            }
        }
    }
    return region;
}

bool contains_color(const image::RasterImage& image, Color color) {
    for (i32 y = 0; y < image.height(); ++y) {
        for (i32 x = 0; x < image.width(); ++x) {
            if (image.pixel(x, y) == color) return true;
        }
    }
    return false;
}

class TextCompositorTest : public ::testing::Test {
protected:
    TextCompositor compositor{offline_config()};
};

} // anonymous namespace

// ============================================================================
// compose_text_overlay Tests
// ============================================================================

TEST_F(TextCompositorTest, DrawsCaptionNearBottomCenter) {
    style::TextStyleConfig config;
    config.text = "Hello World";

    auto result = compositor.compose_text_overlay(solid_png(1280, 720), config);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(image::sniff_format(result.value()), image::ImageFormat::Png);

    auto out = decode(result.value());
    ASSERT_EQ(out.size(), SizeI(1280, 720));

    auto region = changed_pixels(out, BACKGROUND);
    ASSERT_GT(region.count, 0);
    // Size 86 -> 660x80 block placed at (310, 572); stroke 4 and shadow 5 around it
    EXPECT_GE(region.min_y, 568);
    EXPECT_LE(region.max_y, 572 + 80 + 5);
    EXPECT_GE(region.min_x, 306);
    EXPECT_LE(region.max_x, 310 + 660 + 5);

    EXPECT_TRUE(contains_color(out, Color::white()));
    EXPECT_TRUE(contains_color(out, Color::black()));
}

TEST_F(TextCompositorTest, LongCaptionStaysInsideMargins) {
    style::TextStyleConfig config;
    config.text = "YOU WON'T BELIEVE THIS";
    config.font_preset = style::FontPreset::Impact;
    config.color_scheme = style::ColorSchemeId::WhiteShadow;
    config.position = style::PositionPreset::BottomCenter;

    // 22 code points: 86 * 0.8 = 68.8
    EXPECT_EQ(text::compute_font_size(config.text, 720), 69);

    auto result = compositor.compose_text_overlay(solid_png(1280, 720), config);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    auto out = decode(result.value());
    ASSERT_EQ(out.size(), SizeI(1280, 720));

    auto region = changed_pixels(out, BACKGROUND);
    ASSERT_GT(region.count, 0);
    EXPECT_GE(region.min_x, EDGE_MARGIN);
    EXPECT_GE(region.min_y, EDGE_MARGIN);
    EXPECT_LT(region.max_x, 1280 - EDGE_MARGIN);
    EXPECT_LT(region.max_y, 720 - EDGE_MARGIN);
    // Bottom-center anchor keeps the caption in the lower half
    EXPECT_GT(region.min_y, 360);
    EXPECT_TRUE(contains_color(out, Color::white()));
}

TEST_F(TextCompositorTest, EmptyCaptionPassesThrough) {
    image::RasterImage source(64, 48, image::PixelFormat::Rgb8, Color(1, 2, 3));
    source.set_pixel(10, 10, Color(200, 0, 0));

    for (const char* text : {"", "   ", "\n\t"}) {
        style::TextStyleConfig config;
        config.text = text;
        config.gradient = style::GradientConfig{};

        auto result = compositor.compose_text_overlay(png_of(source), config);
        ASSERT_TRUE(result.is_ok()) << result.error().message;
        EXPECT_EQ(decode(result.value()), source.to_rgba());
    }
}

TEST_F(TextCompositorTest, PreservesDimensions) {
    for (auto size : {SizeI(320, 180), SizeI(100, 400), SizeI(50, 50)}) {
        style::TextStyleConfig config;
        config.text = "A caption long enough to need wrapping on small canvases";
        config.gradient = style::GradientConfig{};

        auto result = compositor.compose_text_overlay(solid_png(size.width, size.height), config);
        ASSERT_TRUE(result.is_ok()) << result.error().message;
        EXPECT_EQ(decode(result.value()).size(), size);
    }
}

TEST_F(TextCompositorTest, OutputIsDeterministic) {
    style::TextStyleConfig config;
    config.text = "Same every time";
    config.gradient = style::GradientConfig{style::GradientDirection::Top, 0.7, 0.4};

    auto input = solid_png(400, 300);
    auto first = compositor.compose_text_overlay(input, config);
    auto second = compositor.compose_text_overlay(input, config);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
}

TEST_F(TextCompositorTest, CustomAnchorAtCorner) {
    style::TextStyleConfig config;
    config.text = "X";
    config.font_size = 24;
    config.position = style::AnchorRatio{0.0, 0.0};
    config.stroke_width = 0;
    config.shadow_offset = 0;

    auto result = compositor.compose_text_overlay(solid_png(200, 200), config);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    auto region = changed_pixels(decode(result.value()), BACKGROUND);
    ASSERT_GT(region.count, 0);
    EXPECT_GE(region.min_x, EDGE_MARGIN);
    EXPECT_GE(region.min_y, EDGE_MARGIN);
    EXPECT_LT(region.max_x, EDGE_MARGIN + 18);
    EXPECT_LT(region.max_y, EDGE_MARGIN + 24);
}

TEST_F(TextCompositorTest, CustomColorsAreUsed) {
    style::TextStyleConfig config;
    config.text = "COLOR";
    config.custom_colors = style::ColorScheme{Color(255, 0, 255), Color(0, 255, 0), Color::black()};

    auto result = compositor.compose_text_overlay(solid_png(400, 200), config);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    auto out = decode(result.value());
    EXPECT_TRUE(contains_color(out, Color(255, 0, 255)));
    EXPECT_TRUE(contains_color(out, Color(0, 255, 0)));
    EXPECT_FALSE(contains_color(out, Color::white()));
}

TEST_F(TextCompositorTest, JpegInputAndOutput) {
    TextCompositor jpeg_compositor([] {
        EngineConfig config = offline_config();
        config.encode.format = image::ImageFormat::Jpeg;
        return config;
    }());

    auto input = image::encode_jpeg(
        image::RasterImage(160, 90, image::PixelFormat::Rgb8, BACKGROUND), 90);
    ASSERT_TRUE(input.is_ok()) << input.error();

    style::TextStyleConfig config;
    config.text = "JPEG";
    auto result = jpeg_compositor.compose_text_overlay(input.value(), config);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(image::sniff_format(result.value()), image::ImageFormat::Jpeg);
    EXPECT_EQ(decode(result.value()).size(), SizeI(160, 90));
}

// ============================================================================
// Error Tests
// ============================================================================

TEST_F(TextCompositorTest, GarbageInputIsDecodeError) {
    const std::vector<u8> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    style::TextStyleConfig config;
    config.text = "Hello";

    auto result = compositor.compose_text_overlay(garbage, config);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, ErrorCode::DecodeError);
    EXPECT_EQ(error_code_name(result.error().code), "decode_error");

    auto empty = compositor.compose_text_overlay({}, config);
    ASSERT_TRUE(empty.is_err());
    EXPECT_EQ(empty.error().code, ErrorCode::DecodeError);
}

TEST_F(TextCompositorTest, InvalidConfigIsRejected) {
    auto input = solid_png(100, 100);

    style::TextStyleConfig bad_size;
    bad_size.text = "x";
    bad_size.font_size = 0;

    style::TextStyleConfig bad_ratio;
    bad_ratio.text = "x";
    bad_ratio.max_width_ratio = 1.5;

    style::TextStyleConfig bad_anchor;
    bad_anchor.text = "x";
    bad_anchor.position = style::AnchorRatio{std::numeric_limits<f64>::quiet_NaN(), 0.5};

    style::TextStyleConfig bad_gradient;
    bad_gradient.text = "x";
    bad_gradient.gradient = style::GradientConfig{style::GradientDirection::Bottom, 0.5, 0.0};

    style::TextStyleConfig huge_size;
    huge_size.text = "x";
    huge_size.font_size = 200000;

    style::TextStyleConfig huge_stroke;
    huge_stroke.text = "x";
    huge_stroke.stroke_width = 60000;

    style::TextStyleConfig huge_shadow;
    huge_shadow.text = "x";
    huge_shadow.shadow_offset = 1 << 30;

    for (const auto& config : {bad_size, bad_ratio, bad_anchor, bad_gradient, huge_size,
                               huge_stroke, huge_shadow}) {
        auto result = compositor.compose_text_overlay(input, config);
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
        EXPECT_FALSE(result.error().message.empty());
    }
}

TEST_F(TextCompositorTest, ConfigIsValidatedBeforeDecoding) {
    const std::vector<u8> garbage = {1, 2, 3};
    style::TextStyleConfig config;
    config.font_size = -1;

    auto result = compositor.compose_text_overlay(garbage, config);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
}

// ============================================================================
// Gradient Tests
// ============================================================================

TEST_F(TextCompositorTest, ApplyGradientScenario) {
    auto result = compositor.apply_gradient(
        solid_png(64, 720, Color::white()),
        style::GradientConfig{style::GradientDirection::Bottom, 0.5, 0.35});
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    auto out = decode(result.value());
    EXPECT_EQ(out.pixel(0, 467), Color::white());
    EXPECT_EQ(out.pixel(0, 468), Color::white());
    EXPECT_EQ(out.pixel(0, 719), Color(128, 128, 128));
}

TEST_F(TextCompositorTest, ApplyGradientRejectsBadBand) {
    auto result = compositor.apply_gradient(
        solid_png(10, 10), style::GradientConfig{style::GradientDirection::Top, 0.5, 1.5});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
}

TEST_F(TextCompositorTest, GradientIsDrawnUnderText) {
    style::TextStyleConfig config;
    config.text = "Hi";
    config.position = style::PositionPreset::TopCenter;
    config.gradient = style::GradientConfig{style::GradientDirection::Bottom, 1.0, 0.5};

    auto result = compositor.compose_text_overlay(solid_png(300, 200, Color::white()), config);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    auto out = decode(result.value());
    // Bottom edge fully darkened by the band
    EXPECT_LT(out.pixel(0, 199).r, 10);
    // Text at the top is still white on white in its fill
    EXPECT_EQ(out.pixel(0, 0), Color::white());
}

// ============================================================================
// Batch and Thumbnail Tests
// ============================================================================

TEST_F(TextCompositorTest, BatchAppliesEveryOverlay) {
    style::TextStyleConfig headline;
    headline.text = "TOP";
    headline.position = style::PositionPreset::TopCenter;

    style::TextStyleConfig footer;
    footer.text = "BOTTOM";
    footer.position = style::PositionPreset::BottomCenter;

    auto result = compositor.compose_batch(solid_png(400, 400), {headline, footer});
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    auto out = decode(result.value());
    auto region = changed_pixels(out, BACKGROUND);
    EXPECT_LT(region.min_y, 100);
    EXPECT_GT(region.max_y, 300);

    // Same as applying the overlays one after another
    auto first = compositor.compose_text_overlay(solid_png(400, 400), headline);
    ASSERT_TRUE(first.is_ok());
    auto second = compositor.compose_text_overlay(first.value(), footer);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(decode(second.value()), out);
}

TEST_F(TextCompositorTest, BatchValidatesEverythingFirst) {
    style::TextStyleConfig good;
    good.text = "fine";
    style::TextStyleConfig bad;
    bad.text = "broken";
    bad.max_width_ratio = 0.0;

    auto result = compositor.compose_batch(solid_png(50, 50), {good, bad});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(result.error().message.rfind("overlay 1:", 0), 0u);
}

TEST_F(TextCompositorTest, EmptyBatchReencodesInput) {
    image::RasterImage source(20, 20, image::PixelFormat::Rgb8, Color(7, 7, 7));
    auto result = compositor.compose_batch(png_of(source), {});
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(decode(result.value()), source.to_rgba());
}

TEST_F(TextCompositorTest, ThumbnailStyle) {
    auto config = TextCompositor::thumbnail_style("big news");
    EXPECT_EQ(config.display_text(), "BIG NEWS");
    EXPECT_EQ(config.font_preset, style::FontPreset::Impact);
    EXPECT_EQ(config.color_scheme, style::ColorSchemeId::WhiteShadow);
    EXPECT_EQ(config.stroke_width, 5);
    EXPECT_EQ(config.shadow_offset, 4);
    ASSERT_TRUE(config.gradient.has_value());
    EXPECT_EQ(config.gradient->direction, style::GradientDirection::Bottom);
    EXPECT_DOUBLE_EQ(config.gradient->peak_opacity, 0.5);
    EXPECT_DOUBLE_EQ(config.gradient->band_height_ratio, 0.35);
}

TEST_F(TextCompositorTest, ComposeThumbnail) {
    const Color gray(200, 200, 200);
    auto result = compositor.compose_thumbnail(solid_png(1280, 720, gray), "big news");
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    auto out = decode(result.value());
    EXPECT_EQ(out.pixel(0, 0), gray);
    EXPECT_LT(out.pixel(0, 719).r, gray.r);
    EXPECT_TRUE(contains_color(out, Color::white()));
}

// ============================================================================
// Raster API Tests
// ============================================================================

TEST_F(TextCompositorTest, RenderTextReturnsOpaqueImage) {
    image::RasterImage base(120, 80, image::PixelFormat::Rgba8, Color(0, 0, 0, 255));
    style::TextStyleConfig config;
    config.text = "ok";

    auto result = compositor.render_text(base, config);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value().format(), image::PixelFormat::Rgb8);
    EXPECT_EQ(result.value().size(), base.size());
}

TEST_F(TextCompositorTest, RenderRejectsEmptyImage) {
    style::TextStyleConfig config;
    config.text = "ok";

    auto drawn = compositor.render_text(image::RasterImage(), config);
    ASSERT_TRUE(drawn.is_err());
    EXPECT_EQ(drawn.error().code, ErrorCode::DecodeError);

    auto gradient = compositor.render_gradient(image::RasterImage(), style::GradientConfig{});
    ASSERT_TRUE(gradient.is_err());
    EXPECT_EQ(gradient.error().code, ErrorCode::DecodeError);
}

TEST(TextCompositorSharingTest, SharedCacheServesBothCompositors) {
    auto cache = std::make_shared<text::FontCache>();
    EngineConfig config;
    config.fonts_dir.clear();
    config.use_system_fonts = false;
    config.use_fontconfig = false;

    TextCompositor a(config, cache);
    TextCompositor b(config, cache);

    style::TextStyleConfig style_config;
    style_config.text = "shared";
    style_config.font_size = 40;

    const image::RasterImage base(200, 100, image::PixelFormat::Rgb8);
    ASSERT_TRUE(a.render_text(base, style_config).is_ok());
    ASSERT_TRUE(b.render_text(base, style_config).is_ok());

    EXPECT_EQ(cache->size(), 1u);
    EXPECT_EQ(a.fonts().resolve(style::FontPreset::Impact, 40),
              b.fonts().resolve(style::FontPreset::Impact, 40));
}
