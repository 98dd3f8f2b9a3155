/**
 * Marquee compose CLI
 * Usage: marquee-compose INPUT OUTPUT [options]   (see --help)
 */

#include "marquee/render/compositor.hpp"
#include "marquee/core/logger.hpp"
#include "marquee/core/string.hpp"
#include <algorithm>
#include <charconv>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>

using namespace marquee;

namespace {

constexpr const char* USAGE = R"(Usage: marquee-compose INPUT OUTPUT [options]

Text:
  --text TEXT                caption to draw (empty: image passes through)
  --position NAME            top_left | top_center | top_right | center |
                             bottom_left | bottom_center | bottom_right
  --anchor X,Y               custom block center as ratios of the image
  --font NAME                impact | modern | dramatic | clean
  --colors NAME              white_shadow | yellow_pop | red_alert |
                             blue_trust | green_success
  --fill HEX                 override fill color (#RRGGBB)
  --stroke-color HEX         override stroke color
  --shadow-color HEX         override shadow color
  --size PX                  font size (default: scaled to the image)
  --stroke PX                stroke width (default 4)
  --shadow PX                shadow offset (default 5)
  --max-width RATIO          wrap width as a fraction of the image (default 0.9)
  --uppercase                uppercase the caption

Gradient:
  --gradient top|bottom      darken a band along that edge
  --gradient-opacity P       peak opacity (default 0.6)
  --gradient-height R        band height as a fraction of the image (default 0.3)

Other:
  --thumbnail                standard thumbnail look for --text
  --fonts-dir DIR            custom fonts directory (default ./fonts)
  --format png|jpeg          output format (default: from OUTPUT extension)
  --log-level LEVEL          trace | debug | info | warn | error | off
  --log-file PATH            also append log records to PATH
  --help                     show this message
)";

struct CliOptions {
    std::string input;
    std::string output;
    style::TextStyleConfig style;
    bool thumbnail{false};

    std::optional<style::GradientDirection> gradient;
    f64 gradient_opacity{0.6};
    f64 gradient_height{0.3};

    std::optional<Color> fill;
    std::optional<Color> stroke_color;
    std::optional<Color> shadow_color;

    std::optional<std::string> fonts_dir;
    std::optional<image::ImageFormat> format;
    std::optional<LogLevel> log_level;
    std::optional<std::string> log_file;
};

template<typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<style::AnchorRatio> parse_anchor(std::string_view text) {
    auto comma = text.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }
    auto x = parse_number<f64>(trim(text.substr(0, comma)));
    auto y = parse_number<f64>(trim(text.substr(comma + 1)));
    if (!x || !y) {
        return std::nullopt;
    }
    return style::AnchorRatio{*x, *y};
}

std::optional<image::ImageFormat> format_from_extension(const std::string& path) {
    auto dot = path.rfind('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    return image::parse_image_format(std::string_view(path).substr(dot + 1));
}

constexpr std::string_view VALUE_FLAGS[] = {
    "--text", "--position", "--anchor", "--font", "--colors", "--fill", "--stroke-color",
    "--shadow-color", "--size", "--stroke", "--shadow", "--max-width", "--gradient",
    "--gradient-opacity", "--gradient-height", "--fonts-dir", "--format", "--log-level",
    "--log-file",
};

bool takes_value(std::string_view flag) {
    return std::find(std::begin(VALUE_FLAGS), std::end(VALUE_FLAGS), flag) != std::end(VALUE_FLAGS);
}

// Returns an error message, or nullopt when every argument was understood
std::optional<std::string> parse_args(int argc, char* argv[], CliOptions& options) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        std::string_view value;
        if (takes_value(arg)) {
            if (i + 1 >= argc) {
                return format_message("{} needs a value", arg);
            }
            value = argv[++i];
        }

        if (arg == "--text") {
            options.style.text = std::string(value);
        } else if (arg == "--position") {
            options.style.position = style::parse_position(value);
        } else if (arg == "--anchor") {
            auto anchor = parse_anchor(value);
            if (!anchor) return format_message("--anchor expects X,Y, got '{}'", value);
            options.style.position = *anchor;
        } else if (arg == "--font") {
            options.style.font_preset = style::parse_font_preset(value);
        } else if (arg == "--colors") {
            options.style.color_scheme = style::parse_color_scheme(value);
        } else if (arg == "--fill" || arg == "--stroke-color" || arg == "--shadow-color") {
            auto color = style::parse_hex_color(value);
            if (!color) return format_message("{} expects #RRGGBB, got '{}'", arg, value);
            if (arg == "--fill") options.fill = color;
            else if (arg == "--stroke-color") options.stroke_color = color;
            else options.shadow_color = color;
        } else if (arg == "--size" || arg == "--stroke" || arg == "--shadow") {
            auto number = parse_number<i32>(value);
            if (!number) return format_message("{} expects an integer, got '{}'", arg, value);
            if (arg == "--size") options.style.font_size = *number;
            else if (arg == "--stroke") options.style.stroke_width = *number;
            else options.style.shadow_offset = *number;
        } else if (arg == "--max-width" || arg == "--gradient-opacity" ||
                   arg == "--gradient-height") {
            auto number = parse_number<f64>(value);
            if (!number) return format_message("{} expects a number, got '{}'", arg, value);
            if (arg == "--max-width") options.style.max_width_ratio = *number;
            else if (arg == "--gradient-opacity") options.gradient_opacity = *number;
            else options.gradient_height = *number;
        } else if (arg == "--uppercase") {
            options.style.uppercase = true;
        } else if (arg == "--gradient") {
            options.gradient = style::parse_gradient_direction(value);
        } else if (arg == "--thumbnail") {
            options.thumbnail = true;
        } else if (arg == "--fonts-dir") {
            options.fonts_dir = std::string(value);
        } else if (arg == "--format") {
            options.format = image::parse_image_format(value);
            if (!options.format) return format_message("unknown output format '{}'", value);
        } else if (arg == "--log-level") {
            options.log_level = parse_log_level(value);
            if (!options.log_level) return format_message("unknown log level '{}'", value);
        } else if (arg == "--log-file") {
            options.log_file = std::string(value);
        } else if (arg.size() > 2 && arg.substr(0, 2) == "--") {
            return format_message("unknown option '{}'", arg);
        } else {
            positional.emplace_back(arg);
        }
    }

    if (positional.size() != 2) {
        return std::string("expected INPUT and OUTPUT paths");
    }
    options.input = positional[0];
    options.output = positional[1];
    return std::nullopt;
}

std::optional<std::vector<u8>> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return std::vector<u8>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool write_file(const std::string& path, const std::vector<u8>& bytes) {
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--help" || std::string_view(argv[i]) == "-h") {
            std::cout << USAGE;
            return 0;
        }
    }

    logging::init();

    CliOptions options;
    if (auto problem = parse_args(argc, argv, options)) {
        std::cerr << "Error: " << *problem << "\n\n" << USAGE;
        logging::shutdown();
        return 2;
    }

    // Environment first, then flags
    render::EngineConfig config = render::EngineConfig::from_environment();
    if (options.fonts_dir) config.fonts_dir = *options.fonts_dir;
    if (options.log_level) config.log_level = *options.log_level;
    if (options.format) {
        config.encode.format = *options.format;
    } else if (auto inferred = format_from_extension(options.output)) {
        config.encode.format = *inferred;
    }
    logging::set_level(config.log_level);
    if (options.log_file) {
        auto sink = std::make_unique<FileSink>(*options.log_file);
        if (sink->is_open()) {
            logging::add_sink(std::move(sink));
        } else {
            logging::get("cli").warn_fmt("Cannot open log file {}", *options.log_file);
        }
    }
    if (auto problem = config.validate()) {
        std::cerr << "Error: " << *problem << "\n";
        logging::shutdown();
        return 2;
    }

    if (options.fill || options.stroke_color || options.shadow_color) {
        style::ColorScheme colors = style::lookup_color(options.style.color_scheme);
        if (options.fill) colors.fill = *options.fill;
        if (options.stroke_color) colors.stroke = *options.stroke_color;
        if (options.shadow_color) colors.shadow = *options.shadow_color;
        options.style.custom_colors = colors;
    }
    if (options.gradient) {
        options.style.gradient = style::GradientConfig{
            *options.gradient, options.gradient_opacity, options.gradient_height};
    }

    auto input = read_file(options.input);
    if (!input) {
        std::cerr << "Error: Cannot open file: " << options.input << "\n";
        logging::shutdown();
        return 1;
    }

    render::TextCompositor compositor(config);

    render::ComposeResult<std::vector<u8>> result = [&]() -> render::ComposeResult<std::vector<u8>> {
        if (options.thumbnail) {
            return compositor.compose_thumbnail(*input, options.style.text);
        }
        if (split_whitespace(options.style.text).empty() && options.style.gradient) {
            return compositor.apply_gradient(*input, *options.style.gradient);
        }
        return compositor.compose_text_overlay(*input, options.style);
    }();

    if (!result) {
        std::cerr << "Error (" << render::error_code_name(result.error().code) << "): "
                  << result.error().message << "\n";
        logging::shutdown();
        return 1;
    }

    if (!write_file(options.output, result.value())) {
        std::cerr << "Error: Cannot write file: " << options.output << "\n";
        logging::shutdown();
        return 1;
    }

    logging::shutdown();
    return 0;
}
