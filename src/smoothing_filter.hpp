#pragma once

#include <mutex>
#include <optional>

// Exponential moving average over successive face x-coordinates.
// Reads and writes may come from different threads.
class SmoothingFilter {
public:
    explicit SmoothingFilter(double factor = 0.7);

    // First call returns newX. Later calls return
    // round(factor * previous + (1 - factor) * newX) and remember it.
    int smooth(int newX);

    double factor() const;

    // Throws std::invalid_argument if factor is outside [0, 1]
    void setFactor(double factor);

    static bool isValidFactor(double factor);

private:
    mutable std::mutex stateMutex;
    double smoothingFactor;
    std::optional<int> lastX;
};
