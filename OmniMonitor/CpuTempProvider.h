// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// CpuTempProvider.h
// Interchangeable CPU temperature sources, chosen once at startup.
// =================================================================
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include "CpuTempTypes.h"
#include "MonitorConfig.h"
#include "ThermalZoneReader.h"

namespace omnimon {

    class HardwareMonitorService;

    class ICpuTempProvider {
    public:
        virtual ~ICpuTempProvider() = default;

        // Never throws; failures resolve to an absent value with this provider's status
        virtual CpuTempResult getTemperature() noexcept = 0;

        virtual CpuTempProviderKind kind() const = 0;
    };

    // Latest result of the hardware loop's scanner and state machine
    class NativeCpuTempProvider : public ICpuTempProvider {
    public:
        explicit NativeCpuTempProvider(const HardwareMonitorService& hardware);

        CpuTempResult getTemperature() noexcept override;
        CpuTempProviderKind kind() const override { return CpuTempProviderKind::Native; }

    private:
        const HardwareMonitorService& hardware_;
    };

    /**
     * Maximum over the ACPI thermal zones, cached for one poll interval.
     * Always reported as wmi_approx.
     */
    class ThermalZoneCpuTempProvider : public ICpuTempProvider {
    public:
        using Clock = std::chrono::steady_clock;
        using ClockFn = std::function<Clock::time_point()>;

        static constexpr const char* kHint = "WMI ThermalZone is often inaccurate; use only as last resort.";

        ThermalZoneCpuTempProvider(IThermalZoneReader& reader, std::chrono::milliseconds pollInterval,
            ClockFn clock = {});

        CpuTempResult getTemperature() noexcept override;
        CpuTempProviderKind kind() const override { return CpuTempProviderKind::ThermalZone; }

    private:
        IThermalZoneReader& reader_;
        const std::chrono::milliseconds pollInterval_;
        ClockFn clock_;

        std::mutex mtx;
        std::optional<Clock::time_point> lastRead_;
        std::optional<float> cachedTempC_;
    };

    // Placeholder for a shared-memory feed; resolves immediately
    class ExternalCpuTempProvider : public ICpuTempProvider {
    public:
        static constexpr const char* kHint = "Configure external provider (e.g., HWiNFO shared memory) in a later phase.";

        CpuTempResult getTemperature() noexcept override;
        CpuTempProviderKind kind() const override { return CpuTempProviderKind::External; }
    };

    std::unique_ptr<ICpuTempProvider> createCpuTempProvider(CpuTempProviderKind kind,
        const HardwareMonitorService& hardware, IThermalZoneReader& thermalZones,
        std::chrono::milliseconds pollInterval);

} // namespace omnimon
