// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// CpuTempProvider.cpp
// =================================================================
#include "CpuTempProvider.h"
#include "HardwareMonitorService.h"
#include "TemperatureMath.h"

namespace omnimon {

    // -------- Native --------

    NativeCpuTempProvider::NativeCpuTempProvider(const HardwareMonitorService& hardware)
        : hardware_(hardware) {}

    CpuTempResult NativeCpuTempProvider::getTemperature() noexcept {
        try {
            return hardware_.latestCpuTemp();
        }
        catch (const std::exception& e) {
            CpuTempResult result;
            result.status = CpuTempStatus::NoValues;
            result.provider = to_string(CpuTempProviderKind::Native);
            result.error = e.what();
            return result;
        }
    }

    // -------- Thermal zone --------

    ThermalZoneCpuTempProvider::ThermalZoneCpuTempProvider(IThermalZoneReader& reader,
        std::chrono::milliseconds pollInterval, ClockFn clock)
        : reader_(reader), pollInterval_(pollInterval), clock_(std::move(clock))
    {
        if (!clock_) clock_ = [] { return Clock::now(); };
    }

    CpuTempResult ThermalZoneCpuTempProvider::getTemperature() noexcept {
        CpuTempResult result;
        result.status = CpuTempStatus::WmiApprox;
        result.hint = kHint;
        result.provider = to_string(CpuTempProviderKind::ThermalZone);

        try {
            std::lock_guard<std::mutex> lock(mtx);
            const auto now = clock_();
            if (lastRead_ && now - *lastRead_ < pollInterval_) {
                result.tempC = cachedTempC_;
                return result;
            }

            lastRead_ = now;
            cachedTempC_.reset();

            auto zones = reader_.readZones(false);
            if (!zones) {
                result.error = describe(zones.error());
                return result;
            }

            std::optional<float> best;
            for (const auto& zone : *zones) {
                if (!zone.primary) continue;
                auto celsius = sampleCelsius(zone);
                if (celsius && (!best || *celsius > *best)) best = celsius;
            }
            if (best) cachedTempC_ = roundToTenth(*best);
            result.tempC = cachedTempC_;
        }
        catch (const std::exception& e) {
            result.tempC.reset();
            result.error = e.what();
        }
        return result;
    }

    // -------- External --------

    CpuTempResult ExternalCpuTempProvider::getTemperature() noexcept {
        CpuTempResult result;
        result.status = CpuTempStatus::ExternalNotConfigured;
        result.hint = kHint;
        result.provider = to_string(CpuTempProviderKind::External);
        return result;
    }

    std::unique_ptr<ICpuTempProvider> createCpuTempProvider(CpuTempProviderKind kind,
        const HardwareMonitorService& hardware, IThermalZoneReader& thermalZones,
        std::chrono::milliseconds pollInterval)
    {
        switch (kind) {
        case CpuTempProviderKind::ThermalZone:
            return std::make_unique<ThermalZoneCpuTempProvider>(thermalZones, pollInterval);
        case CpuTempProviderKind::External:
            return std::make_unique<ExternalCpuTempProvider>();
        case CpuTempProviderKind::Native:
        default:
            return std::make_unique<NativeCpuTempProvider>(hardware);
        }
    }

} // namespace omnimon
