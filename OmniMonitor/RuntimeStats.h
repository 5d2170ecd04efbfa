// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// RuntimeStats.h
// Agent self-statistics served by /api/stats.
// =================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace omnimon {

    // Average of the most recent N samples
    class RollingAverage {
    public:
        explicit RollingAverage(std::size_t size);

        void add(double value);
        std::optional<double> average() const;

    private:
        mutable std::mutex mtx;
        std::vector<double> buffer_;
        std::size_t index_ = 0;
        std::size_t count_ = 0;
        double sum_ = 0.0;
    };

    struct RuntimeStatsSnapshot {
        int webSocketClients = 0;
        std::optional<std::chrono::system_clock::time_point> lastTickTime;
        std::optional<double> averageCollectionMs;
    };

    class RuntimeStats {
    public:
        static constexpr std::size_t kAverageWindow = 60;

        RuntimeStats();

        void clientConnected();
        void clientDisconnected();
        int webSocketClients() const;

        void recordTick(std::chrono::system_clock::time_point timestamp, double collectionMs);

        RuntimeStatsSnapshot snapshot() const;

        // {"webSocketClients":..,"lastTickTime":..,"averageCollectionMs":..}
        std::string toJson() const;

    private:
        std::atomic<int> clients_;
        std::atomic<long long> lastTickUnixMs_;    // 0 until the first tick
        RollingAverage collectionMs_;
    };

} // namespace omnimon
