#pragma once
#ifndef MOBILITYKIT_BUCKET_HASH_H
#define MOBILITYKIT_BUCKET_HASH_H

#include <cmath>
#include <functional>
#include <string>
#include <type_traits>
#include <cstddef>
#include <cstdint>
#include "core/error.h"

namespace mobilitykit {

// Maps a key to a bucket in [0, bucket_count). Specialise for custom key types;
// the fallback uses std::hash<Key>. Keys also need operator== for chain lookup.
template <typename Key, typename Enable = void>
struct BucketHash {
    size_t operator()(const Key& key, size_t bucket_count) const {
        return std::hash<Key>{}(key) % bucket_count;
    }
};

// Positional polynomial: sum(code(i) * 31^i) mod bucket_count.
template <>
struct BucketHash<std::string> {
    size_t operator()(const std::string& key, size_t bucket_count) const {
        uint64_t hash = 0;
        uint64_t power = 1 % bucket_count;
        for (unsigned char c : key) {
            hash = (hash + (c % bucket_count) * power) % bucket_count;
            power = (power * 31) % bucket_count;
        }
        return static_cast<size_t>(hash);
    }
};

// key mod bucket_count, normalised to a non-negative index.
template <typename Key>
struct BucketHash<Key, std::enable_if_t<std::is_integral_v<Key>>> {
    size_t operator()(Key key, size_t bucket_count) const {
        if constexpr (std::is_signed_v<Key>) {
            auto n = static_cast<long long>(bucket_count);
            long long r = static_cast<long long>(key) % n;
            return static_cast<size_t>(r < 0 ? r + n : r);
        } else {
            return static_cast<size_t>(key % bucket_count);
        }
    }
};

// Truncated towards zero, then key mod bucket_count, normalised to a
// non-negative index. fmod is exact, so keys beyond the range of any integer
// type still land in a valid bucket. Throws InvalidArgument for NaN and +-inf.
template <typename Key>
struct BucketHash<Key, std::enable_if_t<std::is_floating_point_v<Key>>> {
    size_t operator()(Key key, size_t bucket_count) const {
        if (!std::isfinite(key)) {
            throw InvalidArgument("Hash table keys must be finite numbers");
        }
        const auto n = static_cast<long double>(bucket_count);
        long double r = std::fmod(std::trunc(static_cast<long double>(key)), n);
        if (r < 0) r += n;
        return static_cast<size_t>(r);
    }
};

}  // namespace mobilitykit

#endif  // MOBILITYKIT_BUCKET_HASH_H
