// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// CpuTempSensorScanner.h
// Picks the sensor that best represents CPU package temperature.
// =================================================================
#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "SensorBackend.h"

namespace omnimon {

    // Result of one scan pass. Replaced wholesale on rescan.
    struct CpuTempSelection {
        std::optional<SensorHandle> primary;
        std::optional<std::string> sourceLabel;

        // "Distance to TJMax" style sensor; derived = tjMax - distance
        std::optional<SensorHandle> distance;
        std::optional<float> distanceTjMax;
        std::optional<std::string> distanceLabel;

        int sensorsFound = 0;
        int sensorsWithValue = 0;
    };

    struct GpuSelection {
        std::optional<SensorHandle> temperature;
        std::optional<SensorHandle> load;
    };

    class CpuTempSensorScanner {
    public:
        /**
         * @brief Selects the primary CPU temperature sensor among CPU and Motherboard
         *        temperature sensors.
         *
         * Tiers, first match wins (case-insensitive substring):
         *   1. "Package"  2. "Tctl"/"Tdie"  3. "Core Max"/"CCD"
         *   4. "Core", hottest valid reading, else first found
         *   5. hottest valid reading overall, else first found
         * Tier order ranks names, not value availability: a "CPU Package" without a
         * value still beats a "Core #1" that has one.
         */
        static CpuTempSelection scan(const std::vector<SensorHandle>& sensors);

        // First GPU device (in enumeration order) that yields a temperature or load sensor
        static GpuSelection selectGpu(const std::vector<SensorHandle>& sensors);

        static bool nameContains(std::string_view name, std::string_view token);
        static bool isDistanceToTjMax(const SensorHandle& sensor);

        // TJMax parameter of a distance sensor, accepted only within 60-130 C
        static std::optional<float> tjMaxOf(const SensorHandle& sensor);

        /**
         * @brief Gives distance sensors without a TJMax parameter one learned from
         *        their paired absolute sensor.
         *
         * "CPU Core #1 Distance to TjMax" pairs with "CPU Core #1" on the same device;
         * TJMax = reading + distance, rounded to whole degrees and kept only within
         * 60-130 C. `learned` maps hardware identifier to TJMax and survives rescans,
         * so the derived reading keeps working after the absolute sensor goes quiet.
         */
        static void attachLearnedTjMax(std::vector<SensorHandle>& sensors, std::map<std::string, float>& learned);

        // "{name} (TJMax {tjMax:0.#}C)"
        static std::string distanceLabel(const SensorHandle& sensor, float tjMax);

    private:
        static const SensorHandle* pickPrimary(const std::vector<const SensorHandle*>& candidates);
        static const SensorHandle* pickHottestValid(const std::vector<const SensorHandle*>& candidates);
        static void selectDistance(const std::vector<const SensorHandle*>& temperatures, CpuTempSelection& out);
    };

} // namespace omnimon
