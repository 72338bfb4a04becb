#pragma once
#ifndef MOBILITYKIT_HASHTABLE_H
#define MOBILITYKIT_HASHTABLE_H

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <cstddef>
#include "core/error.h"
#include "storage/bucket_hash.h"

namespace mobilitykit {

// Separate-chaining hash table with a fixed bucket count (no rehashing).
// Each chain holds at most one entry per distinct key.
// Not thread-safe: callers serialise access to a shared instance.
template <typename Key, typename Value, typename Hash = BucketHash<Key>>
class ChainedHashTable {
public:
    using Entry = std::pair<Key, Value>;

    // Throws InvalidArgument if bucket_count is zero.
    explicit ChainedHashTable(size_t bucket_count = 100)
        : buckets_(checked_bucket_count(bucket_count)) {}

    // Overwrites the value in place when the key already exists.
    void insert(const Key& key, Value value) {
        auto& bucket = bucket_for(key);
        for (auto& entry : bucket) {
            if (entry.first == key) {
                entry.second = std::move(value);
                return;
            }
        }
        bucket.emplace_back(key, std::move(value));
        ++size_;
    }

    std::optional<Value> get(const Key& key) const {
        const auto& bucket = bucket_for(key);
        for (const auto& entry : bucket) {
            if (entry.first == key) return entry.second;
        }
        return std::nullopt;
    }

    bool contains(const Key& key) const {
        const auto& bucket = bucket_for(key);
        for (const auto& entry : bucket) {
            if (entry.first == key) return true;
        }
        return false;
    }

    // Returns true if the key was present.
    bool remove(const Key& key) {
        auto& bucket = bucket_for(key);
        for (auto it = bucket.begin(); it != bucket.end(); ++it) {
            if (it->first == key) {
                bucket.erase(it);
                --size_;
                return true;
            }
        }
        return false;
    }

    std::vector<Key> keys() const {
        std::vector<Key> result;
        result.reserve(size_);
        for (const auto& bucket : buckets_) {
            for (const auto& entry : bucket) {
                result.push_back(entry.first);
            }
        }
        return result;
    }

    void clear() {
        for (auto& bucket : buckets_) bucket.clear();
        size_ = 0;
    }

    size_t size() const { return size_; }
    size_t bucket_count() const { return buckets_.size(); }

    // Diagnostics only.
    double load_factor() const {
        return static_cast<double>(size_) / static_cast<double>(buckets_.size());
    }

    size_t longest_chain() const {
        size_t longest = 0;
        for (const auto& bucket : buckets_) {
            if (bucket.size() > longest) longest = bucket.size();
        }
        return longest;
    }

    size_t bucket_index(const Key& key) const {
        return hash_(key, buckets_.size());
    }

private:
    using Bucket = std::vector<Entry>;

    static size_t checked_bucket_count(size_t bucket_count) {
        if (bucket_count == 0) {
            throw InvalidArgument("Hash table needs at least one bucket");
        }
        return bucket_count;
    }

    Bucket& bucket_for(const Key& key) { return buckets_[bucket_index(key)]; }
    const Bucket& bucket_for(const Key& key) const { return buckets_[bucket_index(key)]; }

    std::vector<Bucket> buckets_;
    size_t size_ = 0;
    Hash hash_;
};

}  // namespace mobilitykit

#endif  // MOBILITYKIT_HASHTABLE_H
