#pragma once
#ifndef MOBILITYKIT_SESSION_H
#define MOBILITYKIT_SESSION_H

#include <string>
#include <vector>
#include "config/config.h"
#include "graph/disjoint_set.h"
#include "graph/graph.h"
#include "storage/hashtable.h"
#include "storage/lru_cache.h"

namespace mobilitykit {

// The long-lived structures a caller keeps between queries, sized from Config.
// Not synchronized: use one Session per caller thread or guard it externally.
class Session {
public:
    explicit Session(const Config& config = get_config());

    // Percentile memoised under "<series>:<p>". The caller is responsible for
    // using a fresh series name whenever the underlying values change.
    double cached_percentile(const std::string& series, const std::vector<double>& values,
                             double p);

    ChainedHashTable<std::string, std::string>& lookup() { return lookup_; }
    LRUCache<std::string, double>& results() { return results_; }
    DisjointSet<std::string>& zones() { return zones_; }
    Graph<std::string>& routes() { return routes_; }

    double zscore_threshold() const { return zscore_threshold_; }
    size_t window_size() const { return window_size_; }

    size_t cache_hits() const { return cache_hits_; }
    size_t cache_misses() const { return cache_misses_; }

private:
    ChainedHashTable<std::string, std::string> lookup_;
    LRUCache<std::string, double> results_;
    DisjointSet<std::string> zones_;
    Graph<std::string> routes_;
    double zscore_threshold_;
    size_t window_size_;
    size_t cache_hits_ = 0;
    size_t cache_misses_ = 0;
};

}  // namespace mobilitykit

#endif  // MOBILITYKIT_SESSION_H
