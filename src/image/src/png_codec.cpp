/**
 * PNG decoding/encoding through libpng
 *
 * libpng reports errors by longjmp. Every setjmp lives in a small helper
 * whose frame owns no objects with destructors; buffers and the libpng
 * structs are owned by the calling function.
 */

#include "marquee/image/codec.hpp"
#include "marquee/core/logger.hpp"
#include <png.h>
#include <algorithm>
#include <cstdio>
#include <cstring>

namespace marquee::image {

namespace {

constexpr png_uint_32 MAX_DIMENSION = 32768;

struct PngErrorContext {
    char message[256] = "unknown libpng error";
};

void on_png_error(png_structp png, png_const_charp message) {
    auto* context = static_cast<PngErrorContext*>(png_get_error_ptr(png));
    if (context) {
        std::snprintf(context->message, sizeof(context->message), "%s", message);
    }
    png_longjmp(png, 1);
}

void on_png_warning(png_structp, png_const_charp message) {
    logging::get("image").debug_fmt("libpng: {}", message);
}

struct PngMemoryReader {
    const u8* data;
    usize size;
    usize offset;
};

void read_from_memory(png_structp png, png_bytep out, png_size_t length) {
    auto* reader = static_cast<PngMemoryReader*>(png_get_io_ptr(png));
    if (length > reader->size - reader->offset) {
        png_error(png, "truncated PNG data");
    }
    std::memcpy(out, reader->data + reader->offset, length);
    reader->offset += length;
}

void write_to_memory(png_structp png, png_bytep data, png_size_t length) {
    auto* out = static_cast<std::vector<u8>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + length);
}

void flush_memory(png_structp) {}

struct PngReadGuard {
    png_structp png{nullptr};
    png_infop info{nullptr};

    ~PngReadGuard() {
        if (png) {
            png_destroy_read_struct(&png, info ? &info : nullptr, nullptr);
        }
    }
};

struct PngWriteGuard {
    png_structp png{nullptr};
    png_infop info{nullptr};

    ~PngWriteGuard() {
        if (png) {
            png_destroy_write_struct(&png, info ? &info : nullptr);
        }
    }
};

// Reads the header and configures transforms so every row comes out RGBA8.
bool read_header(png_structp png, png_infop info, png_uint_32* width, png_uint_32* height,
                 png_size_t* row_bytes) {
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }

    png_read_info(png, info);

    const int bit_depth = png_get_bit_depth(png, info);
    const int color_type = png_get_color_type(png, info);
    const bool has_trns = png_get_valid(png, info, PNG_INFO_tRNS) != 0;

    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(png);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
        png_set_expand_gray_1_2_4_to_8(png);
    }
    if (has_trns) {
        png_set_tRNS_to_alpha(png);
    }
    if (bit_depth == 16) {
        png_set_strip_16(png);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
        png_set_gray_to_rgb(png);
    }
    if ((color_type & PNG_COLOR_MASK_ALPHA) == 0 && !has_trns) {
        png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
    }
    png_set_interlace_handling(png);
    png_read_update_info(png, info);

    *width = png_get_image_width(png, info);
    *height = png_get_image_height(png, info);
    *row_bytes = png_get_rowbytes(png, info);
    return true;
}

bool read_pixels(png_structp png, png_bytepp rows) {
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }

    png_read_image(png, rows);
    png_read_end(png, nullptr);
    return true;
}

bool write_pixels(png_structp png, png_infop info, png_uint_32 width, png_uint_32 height,
                  int color_type, int compression_level, png_bytepp rows) {
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }

    png_set_IHDR(png, info, width, height, 8, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_set_compression_level(png, compression_level);
    png_write_info(png, info);
    png_write_image(png, rows);
    png_write_end(png, nullptr);
    return true;
}

} // anonymous namespace

Result<RasterImage, std::string> decode_png(std::span<const u8> bytes) {
    if (png_sig_cmp(bytes.data(), 0, std::min<usize>(bytes.size(), 8)) != 0) {
        return make_error(std::string("not a PNG stream"));
    }

    PngErrorContext error_context;
    PngReadGuard guard;
    guard.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, &error_context,
                                       on_png_error, on_png_warning);
    if (!guard.png) {
        return make_error(std::string("png_create_read_struct failed"));
    }
    guard.info = png_create_info_struct(guard.png);
    if (!guard.info) {
        return make_error(std::string("png_create_info_struct failed"));
    }

    PngMemoryReader reader{bytes.data(), bytes.size(), 0};
    png_set_read_fn(guard.png, &reader, read_from_memory);

    png_uint_32 width = 0;
    png_uint_32 height = 0;
    png_size_t row_bytes = 0;
    if (!read_header(guard.png, guard.info, &width, &height, &row_bytes)) {
        return make_error(std::string("PNG header: ") + error_context.message);
    }

    if (width == 0 || height == 0 || width > MAX_DIMENSION || height > MAX_DIMENSION) {
        return make_error(format_message("PNG dimensions {}x{} out of range", width, height));
    }

    RasterImage image(static_cast<i32>(width), static_cast<i32>(height), PixelFormat::Rgba8);
    if (row_bytes != image.stride()) {
        return make_error(format_message("unexpected PNG row size {} (expected {})",
                                         row_bytes, image.stride()));
    }

    std::vector<png_bytep> rows(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = image.row(static_cast<i32>(y));
    }

    if (!read_pixels(guard.png, rows.data())) {
        return make_error(std::string("PNG data: ") + error_context.message);
    }

    return image;
}

Result<std::vector<u8>, std::string> encode_png(const RasterImage& image, i32 compression_level) {
    if (!image.is_valid()) {
        return make_error(std::string("cannot encode an empty image"));
    }

    PngErrorContext error_context;
    PngWriteGuard guard;
    guard.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, &error_context,
                                        on_png_error, on_png_warning);
    if (!guard.png) {
        return make_error(std::string("png_create_write_struct failed"));
    }
    guard.info = png_create_info_struct(guard.png);
    if (!guard.info) {
        return make_error(std::string("png_create_info_struct failed"));
    }

    std::vector<u8> out;
    out.reserve(image.byte_size() / 2);
    png_set_write_fn(guard.png, &out, write_to_memory, flush_memory);

    std::vector<png_bytep> rows(static_cast<usize>(image.height()));
    for (i32 y = 0; y < image.height(); ++y) {
        rows[static_cast<usize>(y)] = const_cast<png_bytep>(image.row(y));
    }

    const int color_type = image.format() == PixelFormat::Rgba8
        ? PNG_COLOR_TYPE_RGB_ALPHA
        : PNG_COLOR_TYPE_RGB;
    const int level = std::clamp(compression_level, 0, 9);

    if (!write_pixels(guard.png, guard.info,
                      static_cast<png_uint_32>(image.width()),
                      static_cast<png_uint_32>(image.height()),
                      color_type, level, rows.data())) {
        return make_error(std::string("PNG encode: ") + error_context.message);
    }

    return out;
}

} // namespace marquee::image
