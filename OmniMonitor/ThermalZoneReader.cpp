// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// ThermalZoneReader.cpp
// =================================================================
#include "ThermalZoneReader.h"
#include "TemperatureMath.h"
#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>

#ifdef _WIN32
#include "WmiQuery.h"
#endif

namespace omnimon {

    namespace fs = std::filesystem;

    std::optional<float> sampleCelsius(const ThermalZoneSample& sample) {
        if (sample.alreadyCelsius) {
            const float c = static_cast<float>(sample.raw);
            if (!isValidTemperature(c)) return std::nullopt;
            return c;
        }
        return convertRawTemperature(sample.raw);
    }

    std::expected<std::vector<ThermalZoneSample>, MonitorError> collectZoneSources(
        const std::vector<ThermalZoneSource>& sources)
    {
        std::vector<ThermalZoneSample> zones;
        std::optional<MonitorError> firstError;
        bool anyAnswered = false;
        for (const auto& source : sources) {
            auto rows = source();
            if (!rows) {
                if (!firstError) firstError = rows.error();
                continue;
            }
            anyAnswered = true;
            zones.insert(zones.end(), std::make_move_iterator(rows->begin()), std::make_move_iterator(rows->end()));
        }
        if (!anyAnswered && firstError) return std::unexpected(*firstError);
        return zones;
    }

    ThermalZoneReader::ThermalZoneReader(fs::path sysfsRoot) : sysfsRoot_(std::move(sysfsRoot)) {}

#ifdef _WIN32
    namespace {
        using ZoneRows = std::expected<std::vector<ThermalZoneSample>, MonitorError>;

        ZoneRows queryRows(const WmiSession& session, const std::wstring& wql,
            const std::vector<std::wstring>& props, const std::wstring& valueField,
            const std::vector<std::wstring>& nameFields, const std::string& group,
            const std::string& fallbackName, bool primary)
        {
            auto rows = session.query(wql, props);
            if (!rows) return std::unexpected(rows.error());

            std::vector<ThermalZoneSample> out;
            for (const auto& row : *rows) {
                auto raw = row.number(valueField);
                if (!raw) continue;
                ThermalZoneSample s;
                s.group = group;
                s.name = fallbackName;
                for (const auto& field : nameFields) {
                    if (auto n = row.text(field); n && !n->empty()) { s.name = *n; break; }
                }
                s.identifier = row.path;
                s.raw = *raw;
                s.primary = primary;
                out.push_back(std::move(s));
            }
            return out;
        }
    }

    std::expected<std::vector<ThermalZoneSample>, MonitorError> ThermalZoneReader::readZones(bool includeSecondary) {
        std::vector<ThermalZoneSource> sources;
        sources.push_back([]() -> ZoneRows {
            auto wmi = WmiSession::connect(L"ROOT\\WMI");
            if (!wmi) return std::unexpected(wmi.error());
            return queryRows(**wmi, L"SELECT CurrentTemperature, InstanceName FROM MSAcpi_ThermalZoneTemperature",
                { L"CurrentTemperature", L"InstanceName" }, L"CurrentTemperature", { L"InstanceName" },
                "WMI Thermal Zone", "Thermal Zone", true);
        });

        // Both CIMV2 sources share one connection, opened on first use
        std::optional<std::expected<std::unique_ptr<WmiSession>, MonitorError>> cim;
        auto cimSession = [&cim]() -> std::expected<const WmiSession*, MonitorError> {
            if (!cim) cim = WmiSession::connect(L"ROOT\\CIMV2");
            if (!*cim) return std::unexpected(cim->error());
            return cim->value().get();
        };

        if (includeSecondary) {
            sources.push_back([&cimSession]() -> ZoneRows {
                auto session = cimSession();
                if (!session) return std::unexpected(session.error());
                return queryRows(**session,
                    L"SELECT Temperature, Name FROM Win32_PerfFormattedData_Counters_ThermalZoneInformation",
                    { L"Temperature", L"Name" }, L"Temperature", { L"Name" },
                    "WMI Thermal Zone Info", "Thermal Zone Info", false);
            });
            sources.push_back([&cimSession]() -> ZoneRows {
                auto session = cimSession();
                if (!session) return std::unexpected(session.error());
                return queryRows(**session, L"SELECT CurrentReading, Name, Description FROM Win32_TemperatureProbe",
                    { L"CurrentReading", L"Name", L"Description" }, L"CurrentReading",
                    { L"Name", L"Description" }, "WMI Temperature Probe", "Temperature Probe", false);
            });
        }
        return collectZoneSources(sources);
    }
#else
    static std::string readLine(const fs::path& p) {
        std::ifstream f(p);
        std::string s;
        if (f.is_open()) std::getline(f, s);
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
        return s;
    }

    std::expected<std::vector<ThermalZoneSample>, MonitorError> ThermalZoneReader::readZones(bool) {
        std::error_code ec;
        if (!fs::is_directory(sysfsRoot_, ec)) {
            return std::unexpected(MonitorError::NotFound);
        }

        std::vector<fs::path> zoneDirs;
        for (fs::directory_iterator it(sysfsRoot_, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->path().filename().string().rfind("thermal_zone", 0) == 0) {
                zoneDirs.push_back(it->path());
            }
        }
        if (ec) {
            return std::unexpected(MonitorError::IOError);
        }
        std::sort(zoneDirs.begin(), zoneDirs.end());

        std::vector<ThermalZoneSample> zones;
        for (const auto& dir : zoneDirs) {
            const std::string rawText = readLine(dir / "temp");
            long long milli = 0;
            auto [ptr, perr] = std::from_chars(rawText.data(), rawText.data() + rawText.size(), milli);
            if (rawText.empty() || perr != std::errc()) continue;

            ThermalZoneSample s;
            s.group = "Linux Thermal Zone";
            const std::string type = readLine(dir / "type");
            s.name = type.empty() ? dir.filename().string() : type;
            s.identifier = dir.string();
            s.raw = static_cast<double>(milli) / 1000.0;
            s.alreadyCelsius = true;
            zones.push_back(std::move(s));
        }
        return zones;
    }
#endif

} // namespace omnimon
