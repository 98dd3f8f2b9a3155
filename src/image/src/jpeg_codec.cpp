/**
 * JPEG decoding/encoding through libjpeg
 */

#include "marquee/image/codec.hpp"
#include "marquee/core/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <algorithm>
#include <csetjmp>
#include <jpeglib.h>

namespace marquee::image {

namespace {

constexpr JDIMENSION MAX_DIMENSION = 32768;

struct JpegErrorManager {
    jpeg_error_mgr base;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void on_jpeg_error(j_common_ptr cinfo) {
    auto* manager = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, manager->message);
    std::longjmp(manager->jump, 1);
}

// Routes libjpeg's warnings to the log instead of stderr
void on_jpeg_message(j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    logging::get("image").debug_fmt("libjpeg: {}", static_cast<const char*>(buffer));
}

void install_error_manager(JpegErrorManager& manager) {
    jpeg_std_error(&manager.base);
    manager.base.error_exit = on_jpeg_error;
    manager.base.output_message = on_jpeg_message;
    std::snprintf(manager.message, sizeof(manager.message), "unknown libjpeg error");
}

bool read_header(jpeg_decompress_struct* cinfo, JpegErrorManager* manager,
                 const u8* data, usize size) {
    if (setjmp(manager->jump)) {
        return false;
    }

    jpeg_create_decompress(cinfo);
    jpeg_mem_src(cinfo, data, static_cast<unsigned long>(size));
    jpeg_read_header(cinfo, TRUE);
    cinfo->out_color_space = JCS_RGB;
    jpeg_start_decompress(cinfo);
    return true;
}

bool read_scanlines(jpeg_decompress_struct* cinfo, JpegErrorManager* manager,
                    u8* pixels, usize stride) {
    if (setjmp(manager->jump)) {
        return false;
    }

    while (cinfo->output_scanline < cinfo->output_height) {
        JSAMPROW row = pixels + static_cast<usize>(cinfo->output_scanline) * stride;
        jpeg_read_scanlines(cinfo, &row, 1);
    }
    jpeg_finish_decompress(cinfo);
    return true;
}

bool write_scanlines(jpeg_compress_struct* cinfo, JpegErrorManager* manager,
                     const RasterImage* rgb, int quality,
                     unsigned char** buffer, unsigned long* size) {
    if (setjmp(manager->jump)) {
        return false;
    }

    jpeg_create_compress(cinfo);
    jpeg_mem_dest(cinfo, buffer, size);

    cinfo->image_width = static_cast<JDIMENSION>(rgb->width());
    cinfo->image_height = static_cast<JDIMENSION>(rgb->height());
    cinfo->input_components = 3;
    cinfo->in_color_space = JCS_RGB;

    jpeg_set_defaults(cinfo);
    jpeg_set_quality(cinfo, quality, TRUE);
    jpeg_start_compress(cinfo, TRUE);

    while (cinfo->next_scanline < cinfo->image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(rgb->row(static_cast<i32>(cinfo->next_scanline)));
        jpeg_write_scanlines(cinfo, &row, 1);
    }
    jpeg_finish_compress(cinfo);
    return true;
}

} // anonymous namespace

Result<RasterImage, std::string> decode_jpeg(std::span<const u8> bytes) {
    JpegErrorManager manager;
    install_error_manager(manager);

    jpeg_decompress_struct cinfo{};
    cinfo.err = &manager.base;

    if (!read_header(&cinfo, &manager, bytes.data(), bytes.size())) {
        jpeg_destroy_decompress(&cinfo);
        return make_error(std::string("JPEG header: ") + manager.message);
    }

    const JDIMENSION width = cinfo.output_width;
    const JDIMENSION height = cinfo.output_height;
    if (width == 0 || height == 0 || width > MAX_DIMENSION || height > MAX_DIMENSION ||
        cinfo.output_components != 3) {
        jpeg_destroy_decompress(&cinfo);
        return make_error(format_message("JPEG dimensions {}x{} out of range", width, height));
    }

    RasterImage rgb(static_cast<i32>(width), static_cast<i32>(height), PixelFormat::Rgb8);
    const bool ok = read_scanlines(&cinfo, &manager, rgb.data(), rgb.stride());
    jpeg_destroy_decompress(&cinfo);

    if (!ok) {
        return make_error(std::string("JPEG data: ") + manager.message);
    }
    return rgb.to_rgba();
}

Result<std::vector<u8>, std::string> encode_jpeg(const RasterImage& image, i32 quality) {
    if (!image.is_valid()) {
        return make_error(std::string("cannot encode an empty image"));
    }

    const RasterImage rgb = flatten(image);

    JpegErrorManager manager;
    install_error_manager(manager);

    jpeg_compress_struct cinfo{};
    cinfo.err = &manager.base;

    unsigned char* buffer = nullptr;
    unsigned long size = 0;
    const bool ok = write_scanlines(&cinfo, &manager, &rgb, std::clamp(quality, 1, 100),
                                    &buffer, &size);
    jpeg_destroy_compress(&cinfo);

    std::vector<u8> out;
    if (ok && buffer) {
        out.assign(buffer, buffer + size);
    }
    std::free(buffer);

    if (!ok) {
        return make_error(std::string("JPEG encode: ") + manager.message);
    }
    return out;
}

} // namespace marquee::image
