// Copyright © 2025 Cadell Richard Anderson

// TemperatureMath.h

#pragma once

#include <optional>

namespace omnimon {

    constexpr float kMinValidTempC = 0.0f;
    constexpr float kMaxValidTempC = 120.0f;
    constexpr float kMinValidTjMaxC = 60.0f;
    constexpr float kMaxValidTjMaxC = 130.0f;

    // Finite and within [0, 120] C. Out-of-range readings are absent, never clamped.
    bool isValidTemperature(float celsius);

    std::optional<float> validTemperature(std::optional<float> raw);

    // Finite and within [60, 130] C
    bool isValidTjMax(float celsius);

    /**
     * @brief Converts an OS thermal reading to Celsius.
     *
     * raw > 1000 is tenths of Kelvin, raw > 170 is Kelvin, anything else is
     * already Celsius. The converted value must pass isValidTemperature.
     */
    std::optional<float> convertRawTemperature(double raw);

    float roundToTenth(float value);

    // Drops NaN and infinities, keeps everything else as reported
    std::optional<float> finiteOrNull(std::optional<float> raw);

} // namespace omnimon
