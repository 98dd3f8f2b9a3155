#include "marquee/render/gradient.hpp"
#include "marquee/core/logger.hpp"
#include "marquee/core/numeric.hpp"
#include <algorithm>

namespace marquee::render {

GradientBand make_band(i32 canvas_height, const style::GradientConfig& config) {
    GradientBand band;
    band.direction = config.direction;
    band.peak_opacity = clamp_unit(config.peak_opacity);

    const i64 rows = round_half_even(static_cast<f64>(canvas_height) * config.band_height_ratio);
    band.height = static_cast<i32>(std::clamp<i64>(rows, 0, std::max(canvas_height, 0)));
    band.first_row = config.direction == style::GradientDirection::Bottom
        ? canvas_height - band.height
        : 0;
    return band;
}

u8 band_alpha(const GradientBand& band, i32 y) {
    if (band.height <= 0 || y < 0 || y >= band.height) {
        return 0;
    }

    const f64 t = static_cast<f64>(y) / static_cast<f64>(band.height);
    const f64 strength = band.direction == style::GradientDirection::Bottom ? t : 1.0 - t;
    return clamp_u8(static_cast<i32>(round_half_even(255.0 * band.peak_opacity * strength)));
}

image::RasterImage build_gradient_overlay(SizeI canvas, const GradientBand& band) {
    image::RasterImage overlay(canvas.width, canvas.height, image::PixelFormat::Rgba8);
    if (!overlay.is_valid()) {
        return overlay;
    }

    for (i32 y = 0; y < band.height; ++y) {
        const i32 row = band.first_row + y;
        if (row < 0 || row >= canvas.height) {
            continue;
        }

        const u8 alpha = band_alpha(band, y);
        u8* pixels = overlay.row(row);
        for (i32 x = 0; x < canvas.width; ++x) {
            pixels[x * 4 + 3] = alpha;
        }
    }
    return overlay;
}

image::RasterImage apply_gradient(const image::RasterImage& base,
                                  const style::GradientConfig& config) {
    image::RasterImage canvas = base.to_rgba();
    const GradientBand band = make_band(canvas.height(), config);

    logging::get("render").debug_fmt("Gradient {} band: {} rows from y={}, peak opacity {}",
                                     style::gradient_direction_name(band.direction), band.height,
                                     band.first_row, band.peak_opacity);

    if (band.height > 0) {
        image::composite_over(canvas, build_gradient_overlay(canvas.size(), band));
    }
    return image::flatten(canvas);
}

} // namespace marquee::render
