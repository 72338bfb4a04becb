#pragma once
#ifndef MOBILITYKIT_ORDER_STATISTICS_H
#define MOBILITYKIT_ORDER_STATISTICS_H

#include <vector>
#include <cstddef>

namespace mobilitykit {

struct Outlier {
    size_t index;
    double value;
};

struct Quartiles {
    double q1;
    double q3;
    double iqr;
    double lower_fence;  // q1 - 1.5 * iqr
    double upper_fence;  // q3 + 1.5 * iqr
};

// k-th smallest element (0-based) by quickselect with a middle-index pivot.
// Takes its own copy of the input; the caller's data is never reordered.
// Deterministic, but O(n^2) on adversarial orderings.
// Throws InvalidArgument if values is empty or k >= values.size().
double select_kth(std::vector<double> values, size_t k);

// p in [0, 100]; index round(p / 100 * (n - 1)).
// Throws InvalidArgument on empty input or p outside [0, 100].
double percentile(const std::vector<double>& values, double p);

// Throws InvalidArgument on empty input.
double median(const std::vector<double>& values);

// Q1 at index n/4, Q3 at index 3n/4. Throws InvalidArgument for fewer than 4 values.
Quartiles quartiles(const std::vector<double>& values);

// Values outside the Tukey fences, in input order. Empty for fewer than 4 values.
std::vector<Outlier> detect_outliers_iqr(const std::vector<double>& values);

}  // namespace mobilitykit

#endif  // MOBILITYKIT_ORDER_STATISTICS_H
