#include "marquee/render/engine_config.hpp"
#include "marquee/core/string.hpp"
#include <charconv>
#include <cstdlib>

namespace marquee::render {

namespace {

std::optional<i32> parse_int(std::string_view text) {
    const std::string trimmed = trim(text);
    i32 value = 0;
    auto [end, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (ec != std::errc() || end != trimmed.data() + trimmed.size() || trimmed.empty()) {
        return std::nullopt;
    }
    return value;
}

void apply_int(const char* name, const char* raw, i32 min, i32 max, i32& target) {
    auto value = parse_int(raw);
    if (!value || *value < min || *value > max) {
        logging::get("config").warn_fmt("Ignoring {}='{}' (expected {}-{})", name, raw, min, max);
        return;
    }
    target = *value;
}

} // anonymous namespace

EngineConfig EngineConfig::from_environment() {
    return from_environment([](const char* name) -> const char* { return std::getenv(name); });
}

EngineConfig EngineConfig::from_environment(const EnvLookup& lookup) {
    EngineConfig config;
    auto& log = logging::get("config");

    if (const char* dir = lookup("MARQUEE_FONTS_DIR"); dir && *dir) {
        config.fonts_dir = dir;
    }

    if (const char* format = lookup("MARQUEE_OUTPUT_FORMAT"); format && *format) {
        if (auto parsed = image::parse_image_format(format)) {
            config.encode.format = *parsed;
        } else {
            log.warn_fmt("Ignoring MARQUEE_OUTPUT_FORMAT='{}' (expected png or jpeg)", format);
        }
    }

    if (const char* quality = lookup("MARQUEE_JPEG_QUALITY"); quality && *quality) {
        apply_int("MARQUEE_JPEG_QUALITY", quality, 1, 100, config.encode.jpeg_quality);
    }

    if (const char* level = lookup("MARQUEE_PNG_COMPRESSION"); level && *level) {
        apply_int("MARQUEE_PNG_COMPRESSION", level, 0, 9, config.encode.png_compression_level);
    }

    if (const char* level = lookup("MARQUEE_LOG_LEVEL"); level && *level) {
        if (auto parsed = parse_log_level(level)) {
            config.log_level = *parsed;
        } else {
            log.warn_fmt("Ignoring MARQUEE_LOG_LEVEL='{}'", level);
        }
    }

    return config;
}

std::optional<std::string> EngineConfig::validate() const {
    if (encode.jpeg_quality < 1 || encode.jpeg_quality > 100) {
        return format_message("jpeg quality must be in 1-100, got {}", encode.jpeg_quality);
    }
    if (encode.png_compression_level < 0 || encode.png_compression_level > 9) {
        return format_message("png compression level must be in 0-9, got {}",
                              encode.png_compression_level);
    }
    return std::nullopt;
}

} // namespace marquee::render
