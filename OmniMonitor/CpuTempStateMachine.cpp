// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// CpuTempStateMachine.cpp
// =================================================================
#include "CpuTempStateMachine.h"
#include "TemperatureMath.h"
#include <limits>

namespace omnimon {

    void CpuTempStateMachine::reset(const CpuTempSelection& selection) {
        selection_ = selection;
        sensorsFound_ = selection.sensorsFound;
        sensorsWithValue_ = selection.sensorsWithValue;
        sensorsPresent_ = selection.sensorsFound > 0;
        invalidTicks_ = 0;
        warmupTicksRemaining_ = kWarmupTicks;
        ticksSinceValid_ = 0;
        lastPrimaryValue_.reset();
        lastDistanceValue_.reset();
    }

    CpuTempTick CpuTempStateMachine::advance(std::optional<float> primaryRaw, std::optional<float> distanceRaw) {
        lastPrimaryValue_ = selection_.primary ? finiteOrNull(primaryRaw) : std::nullopt;
        lastDistanceValue_ = selection_.distance ? finiteOrNull(distanceRaw) : std::nullopt;

        CpuTempTick tick;
        tick.reading = read();
        updateInvalidTicks(tick.reading.sensorValid);
        updateHistory(tick.reading);
        tick.status = classify(tick.reading, tick.hint);
        return tick;
    }

    CpuTempReading CpuTempStateMachine::read() {
        if (selection_.primary) {
            if (auto value = validTemperature(lastPrimaryValue_)) {
                if (sensorsFound_ == 0) sensorsFound_ = 1;
                if (sensorsWithValue_ == 0) sensorsWithValue_ = 1;
                return { roundToTenth(*value), selection_.sourceLabel, true };
            }
        }

        if (selection_.distance && selection_.distanceTjMax && lastDistanceValue_) {
            const float derived = *selection_.distanceTjMax - *lastDistanceValue_;
            if (isValidTemperature(derived)) {
                if (sensorsFound_ == 0) sensorsFound_ = 1;
                if (sensorsWithValue_ == 0) sensorsWithValue_ = 1;
                auto source = selection_.distanceLabel ? selection_.distanceLabel : selection_.sourceLabel;
                return { roundToTenth(derived), source, true };
            }
        }

        if (sensorsPresent_) {
            std::optional<std::string> source = selection_.sourceLabel;
            if (!source) source = selection_.distanceLabel;
            if (!source) source = std::string("CPU sensors present but no values");
            return { std::nullopt, source, false };
        }
        return {};
    }

    void CpuTempStateMachine::updateInvalidTicks(bool sensorValid) {
        if (!selection_.primary && !selection_.distance) {
            invalidTicks_ = 0;
            return;
        }
        if (sensorValid) {
            invalidTicks_ = 0;
            return;
        }
        // Only count once warm-up is over and this selection has produced a value before
        if (warmupTicksRemaining_ > 0) return;
        if (!lastValidTempC_) return;
        ++invalidTicks_;
    }

    void CpuTempStateMachine::updateHistory(const CpuTempReading& reading) {
        if (reading.sensorValid && reading.value) {
            lastValidTempC_ = reading.value;
            ticksSinceValid_ = 0;
            warmupTicksRemaining_ = 0;
            return;
        }
        if (warmupTicksRemaining_ > 0) {
            --warmupTicksRemaining_;
            return;
        }
        if (ticksSinceValid_ < std::numeric_limits<int>::max()) {
            ++ticksSinceValid_;
        }
    }

    CpuTempStatus CpuTempStateMachine::classify(const CpuTempReading& reading,
        std::optional<std::string>& hint) const
    {
        hint.reset();
        if (reading.sensorValid && reading.value) return CpuTempStatus::Ok;
        if (sensorsFound_ <= 0) return CpuTempStatus::NoSensors;
        if (warmupTicksRemaining_ > 0) {
            hint = kWarmupHint;
            return CpuTempStatus::WarmingUp;
        }
        if (ticksSinceValid_ >= kNoValueThreshold) {
            hint = kNoValueHint;
            return CpuTempStatus::NoValues;
        }
        hint = kWarmupHint;
        return CpuTempStatus::WarmingUp;
    }

    CpuTempDiagnostics CpuTempStateMachine::diagnostics(bool isAdmin, const std::optional<std::string>& hint) const {
        CpuTempDiagnostics d;
        d.isAdmin = isAdmin;
        d.sensorsFound = sensorsFound_;
        d.sensorsWithValue = sensorsWithValue_;
        d.lastValidTempC = lastValidTempC_;
        d.ticksSinceValid = ticksSinceValid_;
        d.warmupTicksRemaining = warmupTicksRemaining_;
        if (selection_.primary) {
            d.selectedSensorName = selection_.primary->name;
            d.selectedSensorIdentifier = selection_.primary->identifier;
        }
        d.selectedSensorValue = lastPrimaryValue_;
        if (selection_.distance) {
            d.derivedSensorName = selection_.distance->name;
        }
        d.derivedSensorValue = lastDistanceValue_;
        d.derivedSensorTjMax = selection_.distanceTjMax;
        d.hint = hint;
        return d;
    }

} // namespace omnimon
