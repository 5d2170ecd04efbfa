// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// MonitorConfig.h
// =================================================================
#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace omnimon {

    enum class CpuTempProviderKind {
        Native,
        ThermalZone,
        External
    };

    // Holds all settings loaded from OmniMonitor.xml and the environment
    struct MonitorSettings {
        int  port = 8787;
        int  metricsIntervalMs = 1000;
        int  metricsIntervalNoClientsMs = 2000;
        int  hardwareIntervalMs = 2000;
        bool allowLocalNetworkCors = false;
        bool adaptiveUpdateNoClients = false;
        CpuTempProviderKind cpuTempProvider = CpuTempProviderKind::Native;

        bool topProcessesEnabled = false;
        int  topProcessesIntervalMs = 5000;

        // Empty means "wwwroot" beside the executable
        std::string webRoot;
    };

    // Wire name of a provider ("native", "thermal_zone", "external")
    const char* to_string(CpuTempProviderKind kind);

    // Accepts the canonical names plus "lhm" and "wmi"; anything else is Native.
    CpuTempProviderKind parse_provider_kind(std::string_view raw);

    namespace config {

        using EnvLookup = std::function<std::string(const char*)>;

        // Load config file into provided MonitorSettings
        bool load(const std::string& configFilePath, MonitorSettings& outSettings);

        // Tries an explicit path first, then OMNIMON_CONFIG, exe-relative, working dir
        bool load_with_fallback(MonitorSettings& outSettings,
            const std::string& explicitPath = "");

        // MONITOR_* and CPU_TEMP_PROVIDER overrides. Unparsable integers keep the old value.
        void apply_environment_overrides(MonitorSettings& settings,
            const EnvLookup& lookup = {});

        // Non-positive port or intervals fall back to their defaults
        void normalize(MonitorSettings& settings);

        std::string get_env_str(const char* var);

        std::string exe_dir();

    } // namespace config

} // namespace omnimon
