#include "stats/order_statistics.h"
#include "core/error.h"
#include <cmath>
#include <string>
#include <utility>

namespace mobilitykit {

namespace {

constexpr size_t kMinIqrSamples = 4;

// Lomuto partition of [left, right] around the value at pivot_idx.
// Returns the pivot's final position.
size_t partition_around(std::vector<double>& arr, size_t left, size_t right, size_t pivot_idx) {
    const double pivot_value = arr[pivot_idx];
    std::swap(arr[pivot_idx], arr[right]);

    size_t store_idx = left;
    for (size_t i = left; i < right; ++i) {
        if (arr[i] < pivot_value) {
            std::swap(arr[store_idx], arr[i]);
            ++store_idx;
        }
    }
    std::swap(arr[right], arr[store_idx]);
    return store_idx;
}

}  // namespace

double select_kth(std::vector<double> values, size_t k) {
    if (values.empty()) {
        throw InvalidArgument("select_kth: empty sequence");
    }
    if (k >= values.size()) {
        throw InvalidArgument("select_kth: k=" + std::to_string(k) +
                              " out of range for size " + std::to_string(values.size()));
    }

    size_t left = 0;
    size_t right = values.size() - 1;
    while (left < right) {
        size_t pivot = partition_around(values, left, right, left + (right - left) / 2);
        if (k == pivot) {
            return values[k];
        }
        if (k < pivot) {
            right = pivot - 1;
        } else {
            left = pivot + 1;
        }
    }
    return values[left];
}

double percentile(const std::vector<double>& values, double p) {
    if (!(p >= 0.0 && p <= 100.0)) {
        throw InvalidArgument("percentile: p must be within [0, 100], got " + std::to_string(p));
    }
    if (values.empty()) {
        throw InvalidArgument("percentile: empty sequence");
    }
    auto k = static_cast<size_t>(std::round((p / 100.0) * static_cast<double>(values.size() - 1)));
    return select_kth(values, k);
}

double median(const std::vector<double>& values) {
    if (values.empty()) {
        throw InvalidArgument("median: empty sequence");
    }
    const size_t n = values.size();
    if (n % 2 == 1) {
        return select_kth(values, n / 2);
    }
    double lower = select_kth(values, n / 2 - 1);
    double upper = select_kth(values, n / 2);
    return (lower + upper) / 2.0;
}

Quartiles quartiles(const std::vector<double>& values) {
    if (values.size() < kMinIqrSamples) {
        throw InvalidArgument("quartiles: need at least 4 values, got " +
                              std::to_string(values.size()));
    }
    const size_t n = values.size();
    Quartiles q{};
    q.q1 = select_kth(values, n / 4);
    q.q3 = select_kth(values, 3 * n / 4);
    q.iqr = q.q3 - q.q1;
    q.lower_fence = q.q1 - 1.5 * q.iqr;
    q.upper_fence = q.q3 + 1.5 * q.iqr;
    return q;
}

std::vector<Outlier> detect_outliers_iqr(const std::vector<double>& values) {
    std::vector<Outlier> outliers;
    if (values.size() < kMinIqrSamples) return outliers;

    Quartiles q = quartiles(values);
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] < q.lower_fence || values[i] > q.upper_fence) {
            outliers.push_back({i, values[i]});
        }
    }
    return outliers;
}

}  // namespace mobilitykit
