#pragma once
#ifndef MOBILITYKIT_CONFIG_H
#define MOBILITYKIT_CONFIG_H

#include <string>
#include <cstddef>

namespace mobilitykit {

struct Config {
    std::string log_level = "info";
    size_t hash_buckets = 100;
    size_t cache_capacity = 128;
    size_t window_size = 5;
    double zscore_threshold = 3.0;

    // Values that fail to parse, or are not positive, keep their default.
    static Config from_env();
};

Config& get_config();

}  // namespace mobilitykit

#endif  // MOBILITYKIT_CONFIG_H
