#include "stats/sliding_window.h"
#include "core/error.h"
#include <string>

namespace mobilitykit {

SlidingWindow::SlidingWindow(long long window_size)
    : capacity_(0) {
    if (window_size <= 0) {
        throw InvalidArgument("Window size must be positive, got " + std::to_string(window_size));
    }
    capacity_ = static_cast<size_t>(window_size);
}

double SlidingWindow::add(double value) {
    window_.push_back(value);
    sum_ += value;

    if (window_.size() > capacity_) {
        sum_ -= window_.front();
        window_.pop_front();
    }
    return average();
}

double SlidingWindow::average() const {
    if (window_.empty()) return 0.0;
    return sum_ / static_cast<double>(window_.size());
}

double SlidingWindow::min() const {
    if (window_.empty()) return 0.0;
    double lowest = window_.front();
    for (double v : window_) {
        if (v < lowest) lowest = v;
    }
    return lowest;
}

double SlidingWindow::max() const {
    if (window_.empty()) return 0.0;
    double highest = window_.front();
    for (double v : window_) {
        if (v > highest) highest = v;
    }
    return highest;
}

}  // namespace mobilitykit
