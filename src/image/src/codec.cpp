#include "marquee/image/codec.hpp"
#include "marquee/core/logger.hpp"
#include "marquee/core/string.hpp"
#include <cstring>

namespace marquee::image {

std::string_view image_format_name(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png:  return "png";
        case ImageFormat::Jpeg: return "jpeg";
    }
    return "png";
}

std::optional<ImageFormat> parse_image_format(std::string_view name) {
    auto lowered = to_ascii_lower(trim(name));
    if (lowered == "png") return ImageFormat::Png;
    if (lowered == "jpeg" || lowered == "jpg") return ImageFormat::Jpeg;
    return std::nullopt;
}

std::optional<ImageFormat> sniff_format(std::span<const u8> bytes) {
    static constexpr u8 png_magic[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    if (bytes.size() >= sizeof(png_magic) &&
        std::memcmp(bytes.data(), png_magic, sizeof(png_magic)) == 0) {
        return ImageFormat::Png;
    }
    if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
        return ImageFormat::Jpeg;
    }
    return std::nullopt;
}

Result<RasterImage, std::string> decode_image(std::span<const u8> bytes) {
    if (bytes.empty()) {
        return make_error(std::string("empty image data"));
    }

    auto format = sniff_format(bytes);
    if (!format) {
        return make_error(std::string("unrecognized image format (expected PNG or JPEG)"));
    }

    logging::get("image").debug_fmt("Decoding {} ({} bytes)", image_format_name(*format), bytes.size());

    switch (*format) {
        case ImageFormat::Png:  return decode_png(bytes);
        case ImageFormat::Jpeg: return decode_jpeg(bytes);
    }
    return make_error(std::string("unsupported image format"));
}

Result<std::vector<u8>, std::string> encode_image(const RasterImage& image,
                                                  const EncodeOptions& options) {
    if (!image.is_valid()) {
        return make_error(std::string("cannot encode an empty image"));
    }

    switch (options.format) {
        case ImageFormat::Png:  return encode_png(image, options.png_compression_level);
        case ImageFormat::Jpeg: return encode_jpeg(image, options.jpeg_quality);
    }
    return make_error(std::string("unsupported output format"));
}

} // namespace marquee::image
