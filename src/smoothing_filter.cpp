#include "smoothing_filter.hpp"
#include <cmath>
#include <stdexcept>

using namespace std;

SmoothingFilter::SmoothingFilter(double factor) : smoothingFactor(0.7) {
    setFactor(factor);
}

int SmoothingFilter::smooth(int newX) {
    lock_guard<mutex> lock(stateMutex);
    if (!lastX) {
        lastX = newX;
        return newX;
    }
    double blended = smoothingFactor * *lastX + (1.0 - smoothingFactor) * newX;
    int smoothed = static_cast<int>(lround(blended));
    lastX = smoothed;
    return smoothed;
}

double SmoothingFilter::factor() const {
    lock_guard<mutex> lock(stateMutex);
    return smoothingFactor;
}

void SmoothingFilter::setFactor(double factor) {
    if (!isValidFactor(factor)) {
        throw invalid_argument("Smoothing factor must be between 0.0 and 1.0");
    }
    lock_guard<mutex> lock(stateMutex);
    smoothingFactor = factor;
}

bool SmoothingFilter::isValidFactor(double factor) {
    // NaN fails both comparisons
    return factor >= 0.0 && factor <= 1.0;
}
