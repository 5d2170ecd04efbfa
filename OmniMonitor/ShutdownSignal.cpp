// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// ShutdownSignal.cpp
// =================================================================
#include "ShutdownSignal.h"

namespace omnimon {

    void ShutdownSignal::request() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stop = true;
        }
        cv.notify_all();
    }

    bool ShutdownSignal::requested() const {
        std::lock_guard<std::mutex> lock(mtx);
        return stop;
    }

    bool ShutdownSignal::waitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mtx);
        return cv.wait_for(lock, timeout, [this] { return stop; });
    }

    void ShutdownSignal::wait() const {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this] { return stop; });
    }

} // namespace omnimon
