// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// CpuTempStateMachine.h
// Turns a possibly-absent sensor value into a status-qualified reading.
// =================================================================
#pragma once
#include <optional>
#include <string>
#include "CpuTempSensorScanner.h"
#include "CpuTempTypes.h"

namespace omnimon {

    struct CpuTempReading {
        std::optional<float> value;          // rounded to 0.1 C
        std::optional<std::string> source;
        bool sensorValid = false;
    };

    struct CpuTempTick {
        CpuTempReading reading;
        CpuTempStatus status = CpuTempStatus::NoSensors;
        std::optional<std::string> hint;
    };

    /**
     * Per-selection counters:
     *   ok          the primary or derived reading is valid this tick
     *   no_sensors  the scan found zero temperature sensors
     *   warming_up  warm-up budget left, or fewer than 10 ticks since the last valid value
     *   no_values   warm-up exhausted and 10+ ticks without a valid value
     * reset() is called on every scan and restores the warm-up budget.
     */
    class CpuTempStateMachine {
    public:
        static constexpr int kWarmupTicks = 5;
        static constexpr int kNoValueThreshold = 10;
        static constexpr int kInvalidRescanThreshold = 5;

        static constexpr const char* kWarmupHint = "Sensor value not available yet.";
        static constexpr const char* kNoValueHint = "Sensor value not available yet. Try running as administrator.";

        void reset(const CpuTempSelection& selection);

        // One tick. Raw values are whatever the backend reported for the selected sensors.
        CpuTempTick advance(std::optional<float> primaryRaw, std::optional<float> distanceRaw);

        // Five consecutive invalid ticks after a valid value was seen
        bool needsRescan() const { return invalidTicks_ >= kInvalidRescanThreshold; }

        CpuTempDiagnostics diagnostics(bool isAdmin, const std::optional<std::string>& hint) const;

        const CpuTempSelection& selection() const { return selection_; }
        int invalidTicks() const { return invalidTicks_; }
        int ticksSinceValid() const { return ticksSinceValid_; }
        int warmupTicksRemaining() const { return warmupTicksRemaining_; }
        std::optional<float> lastValidTempC() const { return lastValidTempC_; }

    private:
        CpuTempReading read();
        void updateInvalidTicks(bool sensorValid);
        void updateHistory(const CpuTempReading& reading);
        CpuTempStatus classify(const CpuTempReading& reading, std::optional<std::string>& hint) const;

        CpuTempSelection selection_;
        bool sensorsPresent_ = false;
        int sensorsFound_ = 0;
        int sensorsWithValue_ = 0;
        int invalidTicks_ = 0;
        int warmupTicksRemaining_ = 0;
        int ticksSinceValid_ = 0;
        std::optional<float> lastValidTempC_;
        std::optional<float> lastPrimaryValue_;
        std::optional<float> lastDistanceValue_;
    };

} // namespace omnimon
