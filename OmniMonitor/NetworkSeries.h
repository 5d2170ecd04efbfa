// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// NetworkSeries.h
// Fixed 60-sample ring buffer of per-tick send/receive kbps.
// =================================================================
#pragma once
#include <array>
#include <cstddef>
#include <mutex>
#include <vector>

namespace omnimon {

    struct SeriesSnapshot {
        std::vector<int> netSend60;
        std::vector<int> netRecv60;
    };

    class NetworkSeries {
    public:
        static constexpr std::size_t kLength = 60;

        void append(int sendKbps, int receiveKbps);

        // Oldest first, always kLength entries; zero-padded at the front until full
        SeriesSnapshot snapshot() const;

    private:
        mutable std::mutex mtx;
        std::array<int, kLength> send_{};
        std::array<int, kLength> recv_{};
        std::size_t index_ = 0;
        bool filled_ = false;
    };

} // namespace omnimon
