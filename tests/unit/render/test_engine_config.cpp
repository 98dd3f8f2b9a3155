#include <gtest/gtest.h>
#include "marquee/render/engine_config.hpp"
#include <map>
#include <string>

using namespace marquee;
using namespace marquee::render;

namespace {

EngineConfig::EnvLookup lookup_from(const std::map<std::string, std::string>& env) {
    return [env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };
}

} // anonymous namespace

TEST(EngineConfigTest, Defaults) {
    EngineConfig config;
    EXPECT_EQ(config.fonts_dir, std::filesystem::path("fonts"));
    EXPECT_EQ(config.encode.format, image::ImageFormat::Png);
    EXPECT_EQ(config.encode.png_compression_level, 6);
    EXPECT_EQ(config.encode.jpeg_quality, 95);
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_TRUE(config.use_system_fonts);
    EXPECT_TRUE(config.use_fontconfig);
    EXPECT_FALSE(config.validate().has_value());
}

TEST(EngineConfigTest, EmptyEnvironmentKeepsDefaults) {
    auto config = EngineConfig::from_environment(lookup_from({}));
    EXPECT_EQ(config.fonts_dir, std::filesystem::path("fonts"));
    EXPECT_EQ(config.encode.format, image::ImageFormat::Png);
}

TEST(EngineConfigTest, ReadsEveryVariable) {
    auto config = EngineConfig::from_environment(lookup_from({
        {"MARQUEE_FONTS_DIR", "/opt/fonts"},
        {"MARQUEE_OUTPUT_FORMAT", "JPG"},
        {"MARQUEE_JPEG_QUALITY", "80"},
        {"MARQUEE_PNG_COMPRESSION", " 9 "},
        {"MARQUEE_LOG_LEVEL", "debug"},
    }));

    EXPECT_EQ(config.fonts_dir, std::filesystem::path("/opt/fonts"));
    EXPECT_EQ(config.encode.format, image::ImageFormat::Jpeg);
    EXPECT_EQ(config.encode.jpeg_quality, 80);
    EXPECT_EQ(config.encode.png_compression_level, 9);
    EXPECT_EQ(config.log_level, LogLevel::Debug);
}

TEST(EngineConfigTest, InvalidValuesAreIgnored) {
    auto config = EngineConfig::from_environment(lookup_from({
        {"MARQUEE_FONTS_DIR", ""},
        {"MARQUEE_OUTPUT_FORMAT", "webp"},
        {"MARQUEE_JPEG_QUALITY", "0"},
        {"MARQUEE_PNG_COMPRESSION", "fast"},
        {"MARQUEE_LOG_LEVEL", "loud"},
    }));

    EXPECT_EQ(config.fonts_dir, std::filesystem::path("fonts"));
    EXPECT_EQ(config.encode.format, image::ImageFormat::Png);
    EXPECT_EQ(config.encode.jpeg_quality, 95);
    EXPECT_EQ(config.encode.png_compression_level, 6);
    EXPECT_EQ(config.log_level, LogLevel::Info);
}

TEST(EngineConfigTest, OutOfRangeQualityIsIgnored) {
    auto config = EngineConfig::from_environment(lookup_from({{"MARQUEE_JPEG_QUALITY", "101"}}));
    EXPECT_EQ(config.encode.jpeg_quality, 95);
}

TEST(EngineConfigTest, ValidateRanges) {
    EngineConfig config;
    config.encode.jpeg_quality = 0;
    EXPECT_TRUE(config.validate().has_value());

    config.encode.jpeg_quality = 100;
    config.encode.png_compression_level = 10;
    EXPECT_TRUE(config.validate().has_value());

    config.encode.png_compression_level = 0;
    EXPECT_FALSE(config.validate().has_value());
}
