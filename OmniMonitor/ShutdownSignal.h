// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// ShutdownSignal.h
// One-shot process shutdown flag that loops can sleep on.
// =================================================================
#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace omnimon {

    class ShutdownSignal {
    public:
        void request();
        bool requested() const;

        // Sleeps up to `timeout`; returns true as soon as shutdown is requested
        bool waitFor(std::chrono::milliseconds timeout) const;

        void wait() const;

    private:
        mutable std::mutex mtx;
        mutable std::condition_variable cv;
        bool stop = false;
    };

} // namespace omnimon
