// Copyright © 2025 Cadell Richard Anderson

/**
 * @file test_temperature_math.cpp
 * @brief Validity range, OS raw-reading conversion and rounding
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "CpuTempTypes.h"
#include "TemperatureMath.h"

namespace omnimon {
namespace test {

TEST(TemperatureMathTest, ValidRangeIsInclusive) {
    EXPECT_TRUE(isValidTemperature(0.0f));
    EXPECT_TRUE(isValidTemperature(120.0f));
    EXPECT_TRUE(isValidTemperature(45.5f));
    EXPECT_FALSE(isValidTemperature(-0.1f));
    EXPECT_FALSE(isValidTemperature(120.1f));
    EXPECT_FALSE(isValidTemperature(std::numeric_limits<float>::quiet_NaN()));
    EXPECT_FALSE(isValidTemperature(std::numeric_limits<float>::infinity()));
}

TEST(TemperatureMathTest, OutOfRangeIsAbsentNotClamped) {
    EXPECT_FALSE(validTemperature(150.0f).has_value());
    EXPECT_FALSE(validTemperature(-5.0f).has_value());
    EXPECT_FALSE(validTemperature(std::nullopt).has_value());
    ASSERT_TRUE(validTemperature(64.0f).has_value());
    EXPECT_FLOAT_EQ(*validTemperature(64.0f), 64.0f);
}

TEST(TemperatureMathTest, TjMaxRange) {
    EXPECT_TRUE(isValidTjMax(100.0f));
    EXPECT_TRUE(isValidTjMax(60.0f));
    EXPECT_TRUE(isValidTjMax(130.0f));
    EXPECT_FALSE(isValidTjMax(59.9f));
    EXPECT_FALSE(isValidTjMax(131.0f));
}

TEST(TemperatureMathTest, TenthsOfKelvinConversion) {
    auto c = convertRawTemperature(2732.0);
    ASSERT_TRUE(c.has_value());
    EXPECT_NEAR(*c, 0.05f, 1e-3f);
    const float rounded = roundToTenth(*c);
    EXPECT_TRUE(std::fabs(rounded - 0.0f) < 1e-4f || std::fabs(rounded - 0.1f) < 1e-4f);

    auto warm = convertRawTemperature(3132.0);
    ASSERT_TRUE(warm.has_value());
    EXPECT_NEAR(*warm, 40.05f, 1e-3f);
}

TEST(TemperatureMathTest, KelvinConversion) {
    auto c = convertRawTemperature(300.0);
    ASSERT_TRUE(c.has_value());
    EXPECT_NEAR(*c, 26.85f, 1e-3f);
}

TEST(TemperatureMathTest, CelsiusPassThrough) {
    auto c = convertRawTemperature(55.0);
    ASSERT_TRUE(c.has_value());
    EXPECT_FLOAT_EQ(*c, 55.0f);
}

TEST(TemperatureMathTest, ConvertedValuesOutsideRangeAreRejected) {
    // 5000 tenths of Kelvin is 226.85 C
    EXPECT_FALSE(convertRawTemperature(5000.0).has_value());
    // 171 Kelvin is below zero Celsius
    EXPECT_FALSE(convertRawTemperature(171.0).has_value());
    EXPECT_FALSE(convertRawTemperature(-3.0).has_value());
    EXPECT_FALSE(convertRawTemperature(std::numeric_limits<double>::quiet_NaN()).has_value());
}

TEST(TemperatureMathTest, RoundToTenth) {
    EXPECT_FLOAT_EQ(roundToTenth(63.46f), 63.5f);
    EXPECT_FLOAT_EQ(roundToTenth(63.44f), 63.4f);
}

TEST(TemperatureMathTest, FiniteOrNullKeepsOutOfRangeValues) {
    EXPECT_FALSE(finiteOrNull(std::numeric_limits<float>::quiet_NaN()).has_value());
    ASSERT_TRUE(finiteOrNull(250.0f).has_value());
    EXPECT_FLOAT_EQ(*finiteOrNull(250.0f), 250.0f);
}

TEST(TemperatureMathTest, RawValueFormatting) {
    EXPECT_EQ(formatRawSensorValue(std::numeric_limits<float>::quiet_NaN()), "NaN");
    EXPECT_EQ(formatRawSensorValue(std::numeric_limits<float>::infinity()), "+Infinity");
    EXPECT_EQ(formatRawSensorValue(-std::numeric_limits<float>::infinity()), "-Infinity");
    EXPECT_EQ(formatRawSensorValue(42.0f), "42");
    EXPECT_EQ(formatRawSensorValue(42.5f), "42.5");
    EXPECT_EQ(formatRawSensorValue(0.125f), "0.125");
}

} // namespace test
} // namespace omnimon
