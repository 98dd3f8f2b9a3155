#include <gtest/gtest.h>
#include "marquee/core/numeric.hpp"
#include <limits>

using namespace marquee;

// ============================================================================
// Rounding Tests
// ============================================================================

TEST(RoundHalfEvenTest, TiesGoToEven) {
    EXPECT_EQ(round_half_even(0.5), 0);
    EXPECT_EQ(round_half_even(1.5), 2);
    EXPECT_EQ(round_half_even(2.5), 2);
    EXPECT_EQ(round_half_even(3.5), 4);
    EXPECT_EQ(round_half_even(-0.5), 0);
    EXPECT_EQ(round_half_even(-1.5), -2);
}

TEST(RoundHalfEvenTest, NonTies) {
    EXPECT_EQ(round_half_even(86.4), 86);
    EXPECT_EQ(round_half_even(86.6), 87);
    EXPECT_EQ(round_half_even(-2.4), -2);
    EXPECT_EQ(round_half_even(127.0), 127);
}

TEST(RoundHalfEvenTest, FontSizeArithmetic) {
    // 720 * 0.12 = 86.4, 86 * 0.8 = 68.8, 69 * 0.7 = 48.3
    EXPECT_EQ(round_half_even(720 * 0.12), 86);
    EXPECT_EQ(round_half_even(86 * 0.8), 69);
    EXPECT_EQ(round_half_even(69 * 0.7), 48);
}

// ============================================================================
// Fixed-point Tests
// ============================================================================

TEST(Div255Test, MatchesRoundedDivision) {
    for (u32 x = 0; x <= 255u * 255u; x += 7) {
        u32 expected = (x + 127) / 255;
        // Exact ties do not occur for integer x since 255 is odd
        EXPECT_EQ(div255(x), expected) << "x=" << x;
    }
}

TEST(Div255Test, Endpoints) {
    EXPECT_EQ(div255(0), 0u);
    EXPECT_EQ(div255(255u * 255u), 255u);
    EXPECT_EQ(div255(255u * 128u), 128u);
}

TEST(ClampTest, Unit) {
    EXPECT_DOUBLE_EQ(clamp_unit(-0.3), 0.0);
    EXPECT_DOUBLE_EQ(clamp_unit(0.4), 0.4);
    EXPECT_DOUBLE_EQ(clamp_unit(1.7), 1.0);
    EXPECT_DOUBLE_EQ(clamp_unit(std::numeric_limits<f64>::quiet_NaN()), 0.0);
}

TEST(ClampTest, Byte) {
    EXPECT_EQ(clamp_u8(-5), 0);
    EXPECT_EQ(clamp_u8(100), 100);
    EXPECT_EQ(clamp_u8(300), 255);
}
