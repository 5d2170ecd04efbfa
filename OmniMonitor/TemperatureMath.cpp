// Copyright © 2025 Cadell Richard Anderson

// TemperatureMath.cpp

#include "TemperatureMath.h"
#include <cmath>

namespace omnimon {

    bool isValidTemperature(float celsius) {
        if (!std::isfinite(celsius)) return false;
        return celsius >= kMinValidTempC && celsius <= kMaxValidTempC;
    }

    std::optional<float> validTemperature(std::optional<float> raw) {
        if (!raw || !isValidTemperature(*raw)) return std::nullopt;
        return raw;
    }

    bool isValidTjMax(float celsius) {
        if (!std::isfinite(celsius)) return false;
        return celsius >= kMinValidTjMaxC && celsius <= kMaxValidTjMaxC;
    }

    std::optional<float> convertRawTemperature(double raw) {
        if (!std::isfinite(raw)) return std::nullopt;

        double celsius = raw;
        if (raw > 1000.0) {
            celsius = (raw / 10.0) - 273.15;
        }
        else if (raw > 170.0) {
            celsius = raw - 273.15;
        }

        const float value = static_cast<float>(celsius);
        if (!isValidTemperature(value)) return std::nullopt;
        return value;
    }

    float roundToTenth(float value) {
        return std::round(value * 10.0f) / 10.0f;
    }

    std::optional<float> finiteOrNull(std::optional<float> raw) {
        if (!raw || !std::isfinite(*raw)) return std::nullopt;
        return raw;
    }

} // namespace omnimon
