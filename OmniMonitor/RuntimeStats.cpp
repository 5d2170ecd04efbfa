// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// RuntimeStats.cpp
// =================================================================
#include "RuntimeStats.h"
#include "JsonWriter.h"
#include "SystemInfo.h"
#include <algorithm>

namespace omnimon {

    RollingAverage::RollingAverage(std::size_t size) : buffer_(std::max<std::size_t>(1, size), 0.0) {}

    void RollingAverage::add(double value) {
        std::lock_guard<std::mutex> lock(mtx);
        if (count_ < buffer_.size()) {
            ++count_;
        }
        else {
            sum_ -= buffer_[index_];
        }
        buffer_[index_] = value;
        sum_ += value;
        index_ = (index_ + 1) % buffer_.size();
    }

    std::optional<double> RollingAverage::average() const {
        std::lock_guard<std::mutex> lock(mtx);
        if (count_ == 0) return std::nullopt;
        return sum_ / static_cast<double>(count_);
    }

    RuntimeStats::RuntimeStats() : clients_(0), lastTickUnixMs_(0), collectionMs_(kAverageWindow) {}

    void RuntimeStats::clientConnected() {
        clients_.fetch_add(1);
    }

    void RuntimeStats::clientDisconnected() {
        clients_.fetch_sub(1);
    }

    int RuntimeStats::webSocketClients() const {
        return clients_.load();
    }

    void RuntimeStats::recordTick(std::chrono::system_clock::time_point timestamp, double collectionMs) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
        lastTickUnixMs_.store(ms);
        collectionMs_.add(collectionMs);
    }

    RuntimeStatsSnapshot RuntimeStats::snapshot() const {
        RuntimeStatsSnapshot snap;
        snap.webSocketClients = clients_.load();
        const long long ms = lastTickUnixMs_.load();
        if (ms != 0) {
            snap.lastTickTime = std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
        }
        snap.averageCollectionMs = collectionMs_.average();
        return snap;
    }

    std::string RuntimeStats::toJson() const {
        const RuntimeStatsSnapshot snap = snapshot();
        JsonWriter w;
        w.beginObject();
        w.field("webSocketClients", snap.webSocketClients);
        if (snap.lastTickTime) w.field("lastTickTime", formatIso8601(*snap.lastTickTime));
        if (snap.averageCollectionMs) w.field("averageCollectionMs", *snap.averageCollectionMs);
        w.endObject();
        return w.str();
    }

} // namespace omnimon
