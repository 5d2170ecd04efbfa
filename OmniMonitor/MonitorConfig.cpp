// Copyright © 2025 Cadell Richard Anderson

//MonitorConfig.cpp

#include "MonitorConfig.h"
#include <tinyxml2.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <vector>

#if defined(_WIN32)
#include <windows.h>
#elif defined(__linux__)
#include <unistd.h>
#include <climits>
#endif

namespace omnimon {

    namespace {
        constexpr int kDefaultPort = 8787;
        constexpr int kDefaultMetricsIntervalMs = 1000;
        constexpr int kDefaultNoClientIntervalMs = 2000;
        constexpr int kDefaultHardwareIntervalMs = 2000;
        constexpr int kDefaultTopProcessesIntervalMs = 5000;

        std::string trim_lower(std::string_view raw) {
            size_t begin = 0;
            size_t end = raw.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin]))) ++begin;
            while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;
            std::string out(raw.substr(begin, end - begin));
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        void read_int(const config::EnvLookup& lookup, const char* name, int& value) {
            const std::string raw = trim_lower(lookup(name));
            if (raw.empty()) return;
            int parsed = 0;
            auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
            if (ec == std::errc() && ptr == raw.data() + raw.size()) {
                value = parsed;
            }
        }

        // Empty keeps the current value; any other text is true only for 1/true/yes/on
        void read_bool(const config::EnvLookup& lookup, const char* name, bool& value) {
            const std::string raw = trim_lower(lookup(name));
            if (raw.empty()) return;
            value = raw == "1" || raw == "true" || raw == "yes" || raw == "on";
        }
    }

    const char* to_string(CpuTempProviderKind kind) {
        switch (kind) {
        case CpuTempProviderKind::ThermalZone: return "thermal_zone";
        case CpuTempProviderKind::External:    return "external";
        case CpuTempProviderKind::Native:      break;
        }
        return "native";
    }

    CpuTempProviderKind parse_provider_kind(std::string_view raw) {
        const std::string name = trim_lower(raw);
        if (name == "thermal_zone" || name == "wmi") return CpuTempProviderKind::ThermalZone;
        if (name == "external") return CpuTempProviderKind::External;
        return CpuTempProviderKind::Native;
    }

    namespace config {

        bool load(const std::string& configFilePath, MonitorSettings& settings) {
            tinyxml2::XMLDocument doc;

            if (doc.LoadFile(configFilePath.c_str()) != tinyxml2::XML_SUCCESS) {
                std::cerr << "[Config] Could not load " << configFilePath
                    << ". Using default settings." << std::endl;
                return false;
            }

            tinyxml2::XMLElement* root = doc.FirstChildElement("OmniMonitor");
            if (!root) {
                std::cerr << "[Config] Malformed " << configFilePath
                    << " (missing <OmniMonitor>). Using default settings." << std::endl;
                return false;
            }

            if (tinyxml2::XMLElement* elem = root->FirstChildElement("Port")) {
                elem->QueryIntText(&settings.port);
            }
            if (tinyxml2::XMLElement* elem = root->FirstChildElement("MetricsIntervalMs")) {
                elem->QueryIntText(&settings.metricsIntervalMs);
            }
            if (tinyxml2::XMLElement* elem = root->FirstChildElement("MetricsIntervalNoClientsMs")) {
                elem->QueryIntText(&settings.metricsIntervalNoClientsMs);
            }
            if (tinyxml2::XMLElement* elem = root->FirstChildElement("HardwareIntervalMs")) {
                elem->QueryIntText(&settings.hardwareIntervalMs);
            }
            if (tinyxml2::XMLElement* elem = root->FirstChildElement("AllowLocalNetworkCors")) {
                elem->QueryBoolText(&settings.allowLocalNetworkCors);
            }
            if (tinyxml2::XMLElement* elem = root->FirstChildElement("AdaptiveUpdateNoClients")) {
                elem->QueryBoolText(&settings.adaptiveUpdateNoClients);
            }
            if (tinyxml2::XMLElement* elem = root->FirstChildElement("CpuTempProvider")) {
                if (const char* text = elem->GetText()) {
                    settings.cpuTempProvider = parse_provider_kind(text);
                }
            }
            if (tinyxml2::XMLElement* elem = root->FirstChildElement("TopProcesses")) {
                elem->QueryBoolAttribute("enabled", &settings.topProcessesEnabled);
                elem->QueryIntAttribute("intervalMs", &settings.topProcessesIntervalMs);
            }
            if (tinyxml2::XMLElement* elem = root->FirstChildElement("WebRoot")) {
                if (const char* text = elem->GetText()) {
                    settings.webRoot = text;
                }
            }

            std::cout << "[Config] Loaded from: " << configFilePath << std::endl;
            return true;
        }

        std::string exe_dir() {
#if defined(_WIN32)
            wchar_t buf[MAX_PATH]{ 0 };
            DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH);
            if (len > 0) {
                return std::filesystem::path(buf).parent_path().string();
            }
#elif defined(__linux__)
            char buf[PATH_MAX]{ 0 };
            ssize_t len = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
            if (len > 0) {
                return std::filesystem::path(std::string(buf, static_cast<size_t>(len))).parent_path().string();
            }
#endif
            return std::filesystem::current_path().string();
        }

        std::string get_env_str(const char* var) {
#if defined(_WIN32)
            char* buf = nullptr;
            size_t len = 0;
            if (_dupenv_s(&buf, &len, var) == 0 && buf) {
                std::string val(buf);
                free(buf);
                return val;
            }
            return {};
#else
            const char* v = std::getenv(var);
            return v ? std::string(v) : std::string{};
#endif
        }

        bool load_with_fallback(MonitorSettings& outSettings, const std::string& explicitPath) {
            std::vector<std::filesystem::path> candidates;

            if (!explicitPath.empty())
                candidates.emplace_back(explicitPath);

            if (auto envPath = get_env_str("OMNIMON_CONFIG"); !envPath.empty()) {
                candidates.emplace_back(envPath);
            }

            const std::filesystem::path exeDir = exe_dir();
            candidates.emplace_back(exeDir / "OmniMonitor.xml");
            candidates.emplace_back(exeDir / "config" / "OmniMonitor.xml");

            candidates.emplace_back(std::filesystem::current_path() / "OmniMonitor.xml");

            for (const auto& p : candidates) {
                std::error_code ec;
                if (std::filesystem::exists(p, ec)) {
                    return load(p.string(), outSettings);
                }
            }

            std::cout << "[Config] No OmniMonitor.xml found. Using defaults." << std::endl;
            return false;
        }

        void apply_environment_overrides(MonitorSettings& settings, const EnvLookup& lookup) {
            const EnvLookup env = lookup ? lookup : EnvLookup(&get_env_str);

            read_int(env, "MONITOR_PORT", settings.port);
            read_int(env, "MONITOR_METRICS_INTERVAL_MS", settings.metricsIntervalMs);
            read_int(env, "MONITOR_METRICS_INTERVAL_NOCLIENT_MS", settings.metricsIntervalNoClientsMs);
            read_int(env, "MONITOR_HW_INTERVAL_MS", settings.hardwareIntervalMs);
            read_bool(env, "MONITOR_ALLOW_LOCAL_NETWORK_CORS", settings.allowLocalNetworkCors);
            read_bool(env, "MONITOR_ADAPTIVE_NOCLIENTS", settings.adaptiveUpdateNoClients);
            read_bool(env, "MONITOR_TOP_PROCESSES", settings.topProcessesEnabled);
            read_int(env, "MONITOR_TOP_PROCESSES_INTERVAL_MS", settings.topProcessesIntervalMs);

            if (auto provider = env("CPU_TEMP_PROVIDER"); !trim_lower(provider).empty()) {
                settings.cpuTempProvider = parse_provider_kind(provider);
            }
            if (auto webRoot = env("MONITOR_WEB_ROOT"); !webRoot.empty()) {
                settings.webRoot = webRoot;
            }
        }

        void normalize(MonitorSettings& settings) {
            if (settings.port <= 0 || settings.port > 65535) settings.port = kDefaultPort;
            if (settings.metricsIntervalMs <= 0) settings.metricsIntervalMs = kDefaultMetricsIntervalMs;
            if (settings.metricsIntervalNoClientsMs <= 0) settings.metricsIntervalNoClientsMs = kDefaultNoClientIntervalMs;
            if (settings.hardwareIntervalMs <= 0) settings.hardwareIntervalMs = kDefaultHardwareIntervalMs;
            if (settings.topProcessesIntervalMs <= 0) settings.topProcessesIntervalMs = kDefaultTopProcessesIntervalMs;
            if (settings.webRoot.empty()) {
                settings.webRoot = (std::filesystem::path(exe_dir()) / "wwwroot").string();
            }
        }

    } // namespace config

} // namespace omnimon
