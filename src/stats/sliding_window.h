#pragma once
#ifndef MOBILITYKIT_SLIDING_WINDOW_H
#define MOBILITYKIT_SLIDING_WINDOW_H

#include <deque>
#include <cstddef>

namespace mobilitykit {

// Fixed-capacity moving aggregate over a numeric stream.
// Not thread-safe.
class SlidingWindow {
public:
    // Throws InvalidArgument if window_size <= 0.
    explicit SlidingWindow(long long window_size);

    // Appends value, evicting the oldest sample once full. Returns the new average.
    double add(double value);

    // All three return 0.0 for an empty window.
    double average() const;
    double min() const;
    double max() const;

    double sum() const { return sum_; }
    size_t size() const { return window_.size(); }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::deque<double> window_;
    double sum_ = 0.0;
};

}  // namespace mobilitykit

#endif  // MOBILITYKIT_SLIDING_WINDOW_H
