// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// CpuTempSensorScanner.cpp
// =================================================================
#include "CpuTempSensorScanner.h"
#include "TemperatureMath.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace omnimon {

    bool CpuTempSensorScanner::nameContains(std::string_view name, std::string_view token) {
        if (token.empty()) return true;
        auto it = std::search(name.begin(), name.end(), token.begin(), token.end(),
            [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
            });
        return it != name.end();
    }

    bool CpuTempSensorScanner::isDistanceToTjMax(const SensorHandle& sensor) {
        return sensor.kind == SensorKind::Temperature
            && nameContains(sensor.name, "Distance")
            && nameContains(sensor.name, "TJMax");
    }

    std::optional<float> CpuTempSensorScanner::tjMaxOf(const SensorHandle& sensor) {
        for (const auto& parameter : sensor.parameters) {
            if (parameter.name.empty() || !nameContains(parameter.name, "TJMax")) continue;
            if (!isValidTjMax(parameter.value)) return std::nullopt;
            return parameter.value;
        }
        return std::nullopt;
    }

    void CpuTempSensorScanner::attachLearnedTjMax(std::vector<SensorHandle>& sensors,
        std::map<std::string, float>& learned)
    {
        auto hasTjMaxParameter = [](const SensorHandle& s) {
            for (const auto& p : s.parameters) {
                if (nameContains(p.name, "TJMax")) return true;
            }
            return false;
        };

        constexpr std::string_view kDistance = "distance";
        for (const auto& d : sensors) {
            if (!isDistanceToTjMax(d) || hasTjMaxParameter(d) || !d.value || !std::isfinite(*d.value)) continue;

            auto cut = std::search(d.name.begin(), d.name.end(), kDistance.begin(), kDistance.end(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
                });
            std::string base(d.name.begin(), cut);
            while (!base.empty() && base.back() == ' ') base.pop_back();
            if (base.empty()) continue;

            for (const auto& s : sensors) {
                if (s.kind != SensorKind::Temperature || s.hardwareIdentifier != d.hardwareIdentifier) continue;
                if (isDistanceToTjMax(s) || s.name != base) continue;
                auto absolute = validTemperature(s.value);
                if (!absolute) break;
                const float tjMax = std::round(*absolute + *d.value);
                if (isValidTjMax(tjMax)) learned[d.hardwareIdentifier] = tjMax;
                break;
            }
        }

        for (auto& d : sensors) {
            if (!isDistanceToTjMax(d) || hasTjMaxParameter(d)) continue;
            auto it = learned.find(d.hardwareIdentifier);
            if (it != learned.end()) d.parameters.push_back({ "TJMax", it->second });
        }
    }

    std::string CpuTempSensorScanner::distanceLabel(const SensorHandle& sensor, float tjMax) {
        char buf[32] = { 0 };
        std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(tjMax));
        std::string value(buf);
        if (value.size() > 2 && value.compare(value.size() - 2, 2, ".0") == 0) {
            value.resize(value.size() - 2);
        }
        return sensor.name + " (TJMax " + value + "C)";
    }

    const SensorHandle* CpuTempSensorScanner::pickHottestValid(const std::vector<const SensorHandle*>& candidates) {
        const SensorHandle* best = nullptr;
        float bestValue = 0.0f;
        for (const SensorHandle* s : candidates) {
            auto v = validTemperature(s->value);
            if (!v) continue;
            if (!best || *v > bestValue) {
                best = s;
                bestValue = *v;
            }
        }
        return best;
    }

    const SensorHandle* CpuTempSensorScanner::pickPrimary(const std::vector<const SensorHandle*>& candidates) {
        if (candidates.empty()) return nullptr;

        for (const SensorHandle* s : candidates) {
            if (nameContains(s->name, "Package")) return s;
        }
        for (const SensorHandle* s : candidates) {
            if (nameContains(s->name, "Tctl") || nameContains(s->name, "Tdie")) return s;
        }
        for (const SensorHandle* s : candidates) {
            if (nameContains(s->name, "Core Max") || nameContains(s->name, "CCD")) return s;
        }

        std::vector<const SensorHandle*> cores;
        for (const SensorHandle* s : candidates) {
            if (nameContains(s->name, "Core")) cores.push_back(s);
        }
        if (!cores.empty()) {
            const SensorHandle* hottest = pickHottestValid(cores);
            return hottest ? hottest : cores.front();
        }

        const SensorHandle* hottest = pickHottestValid(candidates);
        return hottest ? hottest : candidates.front();
    }

    void CpuTempSensorScanner::selectDistance(const std::vector<const SensorHandle*>& temperatures,
        CpuTempSelection& out)
    {
        const SensorHandle* preferred = nullptr;
        for (const SensorHandle* s : temperatures) {
            if (isDistanceToTjMax(*s) && nameContains(s->name, "Core Max")) {
                preferred = s;
                break;
            }
        }

        auto accept = [&out](const SensorHandle& s, float tjMax) {
            out.distance = s;
            out.distanceTjMax = tjMax;
            out.distanceLabel = distanceLabel(s, tjMax);
        };

        if (preferred) {
            if (auto tjMax = tjMaxOf(*preferred)) {
                accept(*preferred, *tjMax);
                return;
            }
        }
        for (const SensorHandle* s : temperatures) {
            if (!isDistanceToTjMax(*s)) continue;
            if (auto tjMax = tjMaxOf(*s)) {
                accept(*s, *tjMax);
                return;
            }
        }
    }

    CpuTempSelection CpuTempSensorScanner::scan(const std::vector<SensorHandle>& sensors) {
        CpuTempSelection out;

        std::vector<const SensorHandle*> temperatures;
        for (const auto& s : sensors) {
            if (s.kind != SensorKind::Temperature) continue;
            if (s.hardwareKind != HardwareKind::Cpu && s.hardwareKind != HardwareKind::Motherboard) continue;
            temperatures.push_back(&s);
            ++out.sensorsFound;
            if (validTemperature(s.value)) ++out.sensorsWithValue;
        }

        selectDistance(temperatures, out);
        if (temperatures.empty()) return out;

        // Distance readings are relative, never an absolute primary
        std::vector<const SensorHandle*> candidates;
        for (const SensorHandle* s : temperatures) {
            if (!isDistanceToTjMax(*s)) candidates.push_back(s);
        }

        if (const SensorHandle* primary = pickPrimary(candidates)) {
            out.primary = *primary;
            out.sourceLabel = primary->name;
        }
        return out;
    }

    GpuSelection CpuTempSensorScanner::selectGpu(const std::vector<SensorHandle>& sensors) {
        std::vector<std::string> devices;
        for (const auto& s : sensors) {
            if (!isGpu(s.hardwareKind)) continue;
            if (std::find(devices.begin(), devices.end(), s.hardwareIdentifier) == devices.end()) {
                devices.push_back(s.hardwareIdentifier);
            }
        }

        for (const auto& device : devices) {
            std::vector<const SensorHandle*> temps;
            std::vector<const SensorHandle*> loads;
            for (const auto& s : sensors) {
                if (!isGpu(s.hardwareKind) || s.hardwareIdentifier != device) continue;
                if (s.kind == SensorKind::Temperature) temps.push_back(&s);
                else if (s.kind == SensorKind::Load) loads.push_back(&s);
            }

            auto firstWith = [](const std::vector<const SensorHandle*>& list, std::string_view token)
                -> const SensorHandle* {
                for (const SensorHandle* s : list) {
                    if (nameContains(s->name, token)) return s;
                }
                return nullptr;
            };

            GpuSelection selection;
            if (!temps.empty()) {
                const SensorHandle* t = firstWith(temps, "GPU");
                selection.temperature = t ? *t : *temps.front();
            }
            if (!loads.empty()) {
                const SensorHandle* l = firstWith(loads, "GPU Core");
                if (!l) l = firstWith(loads, "Core");
                if (!l) l = firstWith(loads, "GPU");
                selection.load = l ? *l : *loads.front();
            }
            if (selection.temperature || selection.load) return selection;
        }
        return {};
    }

} // namespace omnimon
