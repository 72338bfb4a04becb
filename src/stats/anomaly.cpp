#include "stats/anomaly.h"
#include "sort/merge_sort.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace mobilitykit {

double compute_mean(const std::vector<double>& values) {
    double total = 0.0;
    size_t count = 0;
    for (double v : values) {
        total += v;
        ++count;
    }
    return count > 0 ? total / static_cast<double>(count) : 0.0;
}

double compute_stddev(const std::vector<double>& values, double mean) {
    double total = 0.0;
    size_t count = 0;
    for (double v : values) {
        double diff = v - mean;
        total += diff * diff;
        ++count;
    }
    return count > 0 ? std::sqrt(total / static_cast<double>(count)) : 0.0;
}

std::vector<Anomaly> detect_anomalies_zscore(const std::vector<double>& values,
                                             double threshold) {
    if (values.empty()) return {};

    const double mu = compute_mean(values);
    const double sigma = compute_stddev(values, mu);
    if (sigma == 0.0) {
        spdlog::debug("z-score detection skipped: {} values with zero variance", values.size());
        return {};
    }

    std::vector<Anomaly> anomalies;
    for (size_t i = 0; i < values.size(); ++i) {
        double z = std::fabs((values[i] - mu) / sigma);
        if (z >= threshold) {
            anomalies.push_back({i, values[i], z});
        }
    }

    auto sorted = merge_sort(anomalies, [](const Anomaly& a) { return a.zscore; });
    std::reverse(sorted.begin(), sorted.end());
    return sorted;
}

}  // namespace mobilitykit
