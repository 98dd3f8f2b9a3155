#pragma once

#include "types.hpp"
#include <algorithm>
#include <cmath>

namespace marquee {

// ============================================================================
// Pinned rounding
//
// Size and alpha math must be bit-reproducible across platforms, so nothing
// in the engine relies on the current floating-point rounding mode.
// ============================================================================

// Round to nearest, ties to even (0.5 -> 0, 1.5 -> 2, 2.5 -> 2).
[[nodiscard]] inline i64 round_half_even(f64 value) {
    f64 floor_value = std::floor(value);
    f64 diff = value - floor_value;
    if (diff > 0.5) {
        return static_cast<i64>(floor_value) + 1;
    }
    if (diff < 0.5) {
        return static_cast<i64>(floor_value);
    }
    return std::fmod(floor_value, 2.0) == 0.0
        ? static_cast<i64>(floor_value)
        : static_cast<i64>(floor_value) + 1;
}

// x / 255 rounded to nearest, exact for x in [0, 255 * 255].
[[nodiscard]] constexpr u32 div255(u32 x) {
    x += 128;
    return (x + (x >> 8)) >> 8;
}

[[nodiscard]] inline f64 clamp_unit(f64 value) {
    if (std::isnan(value)) return 0.0;
    return std::clamp(value, 0.0, 1.0);
}

[[nodiscard]] constexpr u8 clamp_u8(i32 value) {
    return static_cast<u8>(std::clamp(value, 0, 255));
}

} // namespace marquee
