#include "core/session.h"
#include "stats/order_statistics.h"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace mobilitykit {

Session::Session(const Config& config)
    : lookup_(config.hash_buckets),
      results_(static_cast<long long>(config.cache_capacity)),
      zscore_threshold_(config.zscore_threshold),
      window_size_(config.window_size) {
    spdlog::debug("Session created: {} lookup buckets, result cache capacity {}",
                  config.hash_buckets, config.cache_capacity);
}

double Session::cached_percentile(const std::string& series, const std::vector<double>& values,
                                  double p) {
    // Shortest round-trip form, so distinct p values never share an entry.
    std::string key = fmt::format("{}:{}", series, p);
    if (auto hit = results_.get(key)) {
        ++cache_hits_;
        return *hit;
    }

    ++cache_misses_;
    double value = percentile(values, p);
    results_.put(key, value);
    return value;
}

}  // namespace mobilitykit
