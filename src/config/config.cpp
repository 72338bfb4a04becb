#include "config/config.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace mobilitykit {

namespace {

void read_size(const char* name, size_t& target) {
    const char* raw = std::getenv(name);
    if (!raw) return;

    try {
        size_t consumed = 0;
        long long parsed = std::stoll(raw, &consumed);
        if (consumed != std::string(raw).size() || parsed <= 0) {
            spdlog::warn("Ignoring {}={}: expected a positive integer", name, raw);
            return;
        }
        target = static_cast<size_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("Ignoring {}={}: not a number", name, raw);
    }
}

void read_double(const char* name, double& target) {
    const char* raw = std::getenv(name);
    if (!raw) return;

    try {
        size_t consumed = 0;
        double parsed = std::stod(raw, &consumed);
        if (consumed != std::string(raw).size() || !(parsed > 0.0)) {
            spdlog::warn("Ignoring {}={}: expected a positive number", name, raw);
            return;
        }
        target = parsed;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring {}={}: not a number", name, raw);
    }
}

}  // namespace

Config& get_config() {
    static Config cfg = Config::from_env();
    return cfg;
}

Config Config::from_env() {
    Config cfg;

    if (const char* level = std::getenv("MOBILITYKIT_LOG_LEVEL")) {
        cfg.log_level = level;
    }

    read_size("MOBILITYKIT_HASH_BUCKETS", cfg.hash_buckets);
    read_size("MOBILITYKIT_CACHE_CAPACITY", cfg.cache_capacity);
    read_size("MOBILITYKIT_WINDOW_SIZE", cfg.window_size);
    read_double("MOBILITYKIT_ZSCORE_THRESHOLD", cfg.zscore_threshold);

    return cfg;
}

}  // namespace mobilitykit
