#pragma once
#ifndef MOBILITYKIT_ANOMALY_H
#define MOBILITYKIT_ANOMALY_H

#include <functional>
#include <unordered_map>
#include <vector>
#include <cstddef>

namespace mobilitykit {

struct Anomaly {
    size_t index;
    double value;
    double zscore;  // absolute
};

// Both return 0.0 for empty input.
double compute_mean(const std::vector<double>& values);
double compute_stddev(const std::vector<double>& values, double mean);  // population

// Every element with |z| >= threshold, highest |z| first.
// A constant series (sigma == 0) or empty input has nothing to report.
std::vector<Anomaly> detect_anomalies_zscore(const std::vector<double>& values,
                                             double threshold = 3.0);

template <typename T, typename Hash = std::hash<T>>
std::unordered_map<T, size_t, Hash> frequency_map(const std::vector<T>& items) {
    std::unordered_map<T, size_t, Hash> freq;
    for (const auto& item : items) {
        ++freq[item];
    }
    return freq;
}

}  // namespace mobilitykit

#endif  // MOBILITYKIT_ANOMALY_H
