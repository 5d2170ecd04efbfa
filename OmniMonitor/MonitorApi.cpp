// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// MonitorApi.cpp
// =================================================================
#include "MonitorApi.h"
#include "CorsPolicy.h"
#include "JsonWriter.h"
#include "SystemInfo.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace omnimon {

    namespace {
        HttpResponse jsonResponse(int status, std::string body) {
            HttpResponse r;
            r.status = status;
            r.body = std::move(body);
            return r;
        }

        HttpResponse notFound() {
            JsonWriter w;
            w.beginObject();
            w.field("ok", false);
            w.field("error", "Not found");
            w.endObject();
            return jsonResponse(404, w.str());
        }

        void writeSensor(JsonWriter& w, const SensorSnapshot& s) {
            w.beginObject();
            w.field("hardwareName", s.hardwareName);
            w.field("hardwareType", s.hardwareType);
            w.field("sensorName", s.sensorName);
            w.field("sensorType", s.sensorType);
            w.field("value", s.value);
            w.field("hasValue", s.hasValue);
            w.field("rawValue", s.rawValue);
            w.field("identifier", s.identifier);
            w.endObject();
        }
    }

    MonitorApi::MonitorApi(const MetricsCollector& collector, HardwareMonitorService& hardware,
        RuntimeStats& stats, const MonitorSettings& settings)
        : collector_(collector), hardware_(hardware), stats_(stats), settings_(settings) {}

    HttpResponse MonitorApi::handle(const HttpRequest& request) {
        HttpResponse response;

        if (request.method == "OPTIONS") {
            if (!corsAllowOrigin(request.header("origin"), settings_.allowLocalNetworkCors)) {
                response = jsonResponse(405, "");
                response.headers.emplace_back("Allow", "GET");
                return response;
            }
            response.status = 204;
            response.headers.emplace_back("Access-Control-Allow-Methods", "GET, OPTIONS");
            response.headers.emplace_back("Access-Control-Allow-Headers",
                request.header("access-control-request-headers").value_or("*"));
            applyCors(request, response);
            return response;
        }

        if (request.method != "GET") {
            response = jsonResponse(405, "");
            response.headers.emplace_back("Allow", "GET, OPTIONS");
            return response;
        }

        if (request.path == "/api/health") response = health();
        else if (request.path == "/api/metrics") response = metrics();
        else if (request.path == "/api/sensors") response = sensors();
        else if (request.path == "/api/cpu-temp-debug") response = cpuTempDebug();
        else if (request.path == "/api/stats") response = stats();
        else if (request.path.rfind("/api/", 0) == 0) response = notFound();
        else response = staticFile(request.path);

        applyCors(request, response);
        return response;
    }

    void MonitorApi::applyCors(const HttpRequest& request, HttpResponse& response) const {
        if (auto allowed = corsAllowOrigin(request.header("origin"), settings_.allowLocalNetworkCors)) {
            response.headers.emplace_back("Access-Control-Allow-Origin", *allowed);
            response.headers.emplace_back("Vary", "Origin");
        }
    }

    // ---------------- REST ----------------

    HttpResponse MonitorApi::health() const {
        JsonWriter w;
        w.beginObject();
        w.field("ok", true);
        w.field("time", utcNowIso8601());
        w.endObject();
        return jsonResponse(200, w.str());
    }

    HttpResponse MonitorApi::metrics() const {
        return jsonResponse(200, toJson(collector_.latestSnapshot()));
    }

    HttpResponse MonitorApi::sensors() {
        auto rows = hardware_.sensorSnapshots();
        JsonWriter w;
        w.beginObject();
        if (!rows) {
            w.field("ok", false);
            w.field("error", describe(rows.error()));
        }
        else {
            w.field("ok", true);
            w.key("sensors");
            w.beginArray();
            for (const auto& row : *rows) writeSensor(w, row);
            w.endArray();
        }
        w.endObject();
        return jsonResponse(200, w.str());
    }

    HttpResponse MonitorApi::cpuTempDebug() const {
        const CpuTempDebugSnapshot snap = hardware_.cpuTempDebugSnapshot();
        JsonWriter w;
        w.beginObject();
        w.field("ok", true);
        w.key("cpuTemp");
        w.beginObject();
        w.field("tempC", snap.tempC);
        w.field("source", snap.source);
        w.field("status", to_string(snap.status));
        w.field("provider", snap.provider);
        w.field("hint", snap.hint);
        if (snap.details) {
            w.key("details");
            writeJson(w, *snap.details);
        }
        w.endObject();
        w.endObject();
        return jsonResponse(200, w.str());
    }

    HttpResponse MonitorApi::stats() const {
        return jsonResponse(200, stats_.toJson());
    }

    // ---------------- Static files ----------------

    std::string MonitorApi::contentTypeFor(const std::filesystem::path& file) {
        const std::string ext = file.extension().string();
        if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
        if (ext == ".js") return "text/javascript; charset=utf-8";
        if (ext == ".css") return "text/css; charset=utf-8";
        if (ext == ".json") return "application/json; charset=utf-8";
        if (ext == ".svg") return "image/svg+xml";
        if (ext == ".png") return "image/png";
        if (ext == ".ico") return "image/x-icon";
        return "application/octet-stream";
    }

    HttpResponse MonitorApi::staticFile(const std::string& path) const {
        if (settings_.webRoot.empty() || path.find("..") != std::string::npos
            || path.find('\\') != std::string::npos) {
            return notFound();
        }

        std::string relative = path == "/" ? "index.html" : path.substr(1);
        if (!relative.empty() && relative.back() == '/') relative += "index.html";

        const std::filesystem::path file = std::filesystem::path(settings_.webRoot) / relative;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec)) return notFound();

        std::ifstream in(file, std::ios::binary);
        if (!in.is_open()) return notFound();
        std::ostringstream content;
        content << in.rdbuf();

        HttpResponse r;
        r.contentType = contentTypeFor(file);
        r.body = content.str();
        return r;
    }

    // ---------------- WebSocket stream ----------------

    void MonitorApi::runWebSocket(const HttpRequest&, WebSocketSession& session) {
        // Inbound frames only matter for close detection and ping
        std::thread receiver([&session] {
            while (true) {
                auto frame = session.readFrame();
                if (!frame || frame->opcode == WsOpcode::Close) break;
                if (frame->opcode == WsOpcode::Ping) session.sendPong(frame->payload);
            }
            session.cancel();
        });

        stats_.clientConnected();
        std::cout << "[WS] Client connected (" << stats_.webSocketClients() << " active)." << std::endl;

        try {
            const auto interval = std::chrono::milliseconds(settings_.metricsIntervalMs);
            auto lastPing = std::chrono::steady_clock::now();

            if (session.sendText(envelope("init", collector_.latestSnapshot(true)))) {
                int tick = 0;
                while (!session.waitCancelled(interval)) {
                    const bool sendSeries = tick > 0 && tick % kSeriesEvery == 0;
                    const MetricsSnapshot snap = collector_.latestSnapshot(sendSeries);
                    if (!session.sendText(envelope(sendSeries ? "series" : "metrics", snap))) break;
                    ++tick;

                    const auto now = std::chrono::steady_clock::now();
                    if (now - lastPing >= kKeepAliveInterval) {
                        if (!session.sendPing()) break;
                        lastPing = now;
                    }
                }
            }
        }
        catch (const std::exception& e) {
            std::cerr << "[WS] Send loop failed: " << e.what() << std::endl;
        }

        stats_.clientDisconnected();
        session.cancel();
        receiver.join();
        std::cout << "[WS] Client disconnected (" << stats_.webSocketClients() << " active)." << std::endl;
    }

} // namespace omnimon
