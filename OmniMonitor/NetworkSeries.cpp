// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// NetworkSeries.cpp
// =================================================================
#include "NetworkSeries.h"

namespace omnimon {

    void NetworkSeries::append(int sendKbps, int receiveKbps) {
        std::lock_guard<std::mutex> lock(mtx);
        send_[index_] = sendKbps;
        recv_[index_] = receiveKbps;
        if (++index_ >= kLength) {
            index_ = 0;
            filled_ = true;
        }
    }

    SeriesSnapshot NetworkSeries::snapshot() const {
        SeriesSnapshot out;
        out.netSend60.assign(kLength, 0);
        out.netRecv60.assign(kLength, 0);

        std::lock_guard<std::mutex> lock(mtx);
        if (!filled_) {
            const std::size_t padding = kLength - index_;
            for (std::size_t i = 0; i < index_; ++i) {
                out.netSend60[padding + i] = send_[i];
                out.netRecv60[padding + i] = recv_[i];
            }
        }
        else {
            // index_ is the oldest slot once the buffer has wrapped
            for (std::size_t i = 0; i < kLength; ++i) {
                const std::size_t slot = (index_ + i) % kLength;
                out.netSend60[i] = send_[slot];
                out.netRecv60[i] = recv_[slot];
            }
        }
        return out;
    }

} // namespace omnimon
