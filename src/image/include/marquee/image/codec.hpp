#pragma once

#include "marquee/image/raster.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace marquee::image {

// ============================================================================
// Encoded formats
// ============================================================================

enum class ImageFormat : u8 {
    Png,
    Jpeg,
};

[[nodiscard]] std::string_view image_format_name(ImageFormat format);
[[nodiscard]] std::optional<ImageFormat> parse_image_format(std::string_view name);

// Identify the container from its magic bytes.
[[nodiscard]] std::optional<ImageFormat> sniff_format(std::span<const u8> bytes);

// Encoder settings are pinned so identical pixels give identical bytes.
struct EncodeOptions {
    ImageFormat format{ImageFormat::Png};
    i32 png_compression_level{6};   // zlib level 0-9
    i32 jpeg_quality{95};           // 1-100
};

// ============================================================================
// Decoding - always yields Rgba8
// ============================================================================

[[nodiscard]] Result<RasterImage, std::string> decode_image(std::span<const u8> bytes);
[[nodiscard]] Result<RasterImage, std::string> decode_png(std::span<const u8> bytes);
[[nodiscard]] Result<RasterImage, std::string> decode_jpeg(std::span<const u8> bytes);

// ============================================================================
// Encoding - Rgba8 or Rgb8 input; JPEG drops alpha
// ============================================================================

[[nodiscard]] Result<std::vector<u8>, std::string> encode_image(const RasterImage& image,
                                                                const EncodeOptions& options);
[[nodiscard]] Result<std::vector<u8>, std::string> encode_png(const RasterImage& image,
                                                              i32 compression_level);
[[nodiscard]] Result<std::vector<u8>, std::string> encode_jpeg(const RasterImage& image,
                                                               i32 quality);

} // namespace marquee::image
