#pragma once

#include "marquee/core/logger.hpp"
#include "marquee/image/codec.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace marquee::render {

// ============================================================================
// Engine Configuration
//
// Compiled-in defaults, optionally overlaid from the environment:
//   MARQUEE_FONTS_DIR        custom fonts directory
//   MARQUEE_OUTPUT_FORMAT    png | jpeg
//   MARQUEE_JPEG_QUALITY     1-100
//   MARQUEE_PNG_COMPRESSION  0-9
//   MARQUEE_LOG_LEVEL        trace | debug | info | warn | error | fatal | off
// Unparseable values are logged and ignored.
// ============================================================================

struct EngineConfig {
    std::filesystem::path fonts_dir{"fonts"};
    image::EncodeOptions encode;
    LogLevel log_level{LogLevel::Info};

    // Search the system font directories and ask fontconfig. With both off
    // only fonts_dir is consulted before the built-in face.
    bool use_system_fonts{true};
    bool use_fontconfig{true};

    using EnvLookup = std::function<const char*(const char*)>;

    [[nodiscard]] static EngineConfig from_environment();
    [[nodiscard]] static EngineConfig from_environment(const EnvLookup& lookup);

    // Describes the first out-of-range field, or nullopt
    [[nodiscard]] std::optional<std::string> validate() const;
};

} // namespace marquee::render
