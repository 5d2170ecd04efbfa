// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// MetricsSnapshot.cpp
// =================================================================
#include "MetricsSnapshot.h"
#include "JsonWriter.h"

namespace omnimon {

    void writeJson(JsonWriter& w, const CpuTempDiagnostics& d) {
        w.beginObject();
        w.field("isAdmin", d.isAdmin);
        w.field("cpuTempSensorsFound", d.sensorsFound);
        w.field("cpuTempSensorsWithValue", d.sensorsWithValue);
        w.field("lastValidCpuTempC", d.lastValidTempC);
        w.field("ticksSinceValid", d.ticksSinceValid);
        w.field("warmupTicksRemaining", d.warmupTicksRemaining);
        w.field("selectedSensorName", d.selectedSensorName);
        w.field("selectedSensorIdentifier", d.selectedSensorIdentifier);
        w.field("selectedSensorValue", d.selectedSensorValue);
        w.field("derivedSensorName", d.derivedSensorName);
        w.field("derivedSensorValue", d.derivedSensorValue);
        w.field("derivedSensorTjMax", d.derivedSensorTjMax);
        w.field("hint", d.hint);
        w.endObject();
    }

    namespace {
        void writeIntArray(JsonWriter& w, const std::vector<int>& values) {
            w.beginArray();
            for (int v : values) w.value(v);
            w.endArray();
        }

        void writeProcess(JsonWriter& w, const ProcessInfo& p) {
            w.beginObject();
            w.field("name", p.name);
            w.field("pid", p.pid);
            w.field("cpuPercent", p.cpuPercent);
            w.field("ramPercent", p.ramPercent);
            w.field("gpuPercent", p.gpuPercent);
            w.endObject();
        }
    }

    void writeJson(JsonWriter& w, const MetricsSnapshot& s) {
        w.beginObject();
        w.field("cpuPercent", s.cpuPercent);
        w.field("cpuTempC", s.cpuTempC);
        w.field("cpuTempSource", s.cpuTempSource);
        w.field("cpuTempStatus", to_string(s.cpuTempStatus));
        w.field("cpuTempProvider", s.cpuTempProvider);
        w.field("cpuTempHint", s.cpuTempHint);
        if (s.cpuTempDetails) {
            w.key("cpuTempDetails");
            writeJson(w, *s.cpuTempDetails);
        }
        w.field("gpuUsagePercent", s.gpuUsagePercent);
        w.field("gpuTempC", s.gpuTempC);
        w.field("ramUsagePercent", s.ramUsagePercent);
        w.field("ramUsedMb", s.ramUsedMb);
        w.field("ramTotalMb", s.ramTotalMb);
        w.field("netSendKbps", s.netSendKbps);
        w.field("netReceiveKbps", s.netReceiveKbps);
        if (s.series) {
            w.key("series");
            w.beginObject();
            w.key("netSend60");
            writeIntArray(w, s.series->netSend60);
            w.key("netRecv60");
            writeIntArray(w, s.series->netRecv60);
            w.endObject();
        }
        if (s.topProcesses) {
            w.key("topProcesses");
            w.beginArray();
            for (const auto& p : *s.topProcesses) writeProcess(w, p);
            w.endArray();
        }
        w.key("errors");
        w.beginArray();
        for (const auto& e : s.errors) w.value(e);
        w.endArray();
        w.endObject();
    }

    std::string toJson(const MetricsSnapshot& s) {
        JsonWriter w;
        writeJson(w, s);
        return w.str();
    }

    std::string envelope(const std::string& type, const MetricsSnapshot& s) {
        JsonWriter w;
        w.beginObject();
        w.field("type", type);
        w.key("data");
        writeJson(w, s);
        w.endObject();
        return w.str();
    }

} // namespace omnimon
