#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

// Cancellation flag for a background loop. Sleeps taken through waitFor()
// wake up as soon as a stop is requested.
class StopSignal {
public:
    void reset() {
        std::lock_guard<std::mutex> lock(stopMutex);
        stopped = false;
    }

    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(stopMutex);
            stopped = true;
        }
        stopCond.notify_all();
    }

    bool stopRequested() const {
        std::lock_guard<std::mutex> lock(stopMutex);
        return stopped;
    }

    // Sleep for up to the given time. Returns true if a stop was requested.
    template <class Rep, class Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(stopMutex);
        return stopCond.wait_for(lock, timeout, [this] { return stopped; });
    }

private:
    mutable std::mutex stopMutex;
    std::condition_variable stopCond;
    bool stopped = false;
};
