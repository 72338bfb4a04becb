#pragma once
#ifndef MOBILITYKIT_LRU_CACHE_H
#define MOBILITYKIT_LRU_CACHE_H

#include <functional>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <cstddef>
#include <spdlog/spdlog.h>
#include "core/error.h"

namespace mobilitykit {

// Capacity-bounded LRU cache with O(1) amortised get/put.
// Not thread-safe: guard a shared instance with an external mutex.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LRUCache {
public:
    using EvictionCallback = std::function<void(const Key&, const Value&)>;

    // Throws InvalidArgument if capacity <= 0.
    explicit LRUCache(long long capacity)
        : capacity_(checked_capacity(capacity)) {}

    // Marks the key most recently used on a hit.
    std::optional<Value> get(const Key& key) {
        auto it = lookup_.find(key);
        if (it == lookup_.end()) return std::nullopt;
        touch(it->second);
        return it->second->second;
    }

    void put(const Key& key, Value value) {
        auto it = lookup_.find(key);
        if (it != lookup_.end()) {
            it->second->second = std::move(value);
            touch(it->second);
            return;
        }

        lru_list_.emplace_front(key, std::move(value));
        lookup_.emplace(key, lru_list_.begin());

        if (lru_list_.size() > capacity_) {
            evict_one();
        }
    }

    // Does not change recency.
    bool contains(const Key& key) const { return lookup_.count(key) > 0; }

    void clear() {
        lookup_.clear();
        lru_list_.clear();
    }

    void set_eviction_callback(EvictionCallback cb) { eviction_callback_ = std::move(cb); }

    size_t size() const { return lru_list_.size(); }
    size_t capacity() const { return capacity_; }

private:
    // front = most recently used, back = least recently used
    using Entry = std::pair<Key, Value>;
    using ListIter = typename std::list<Entry>::iterator;

    static size_t checked_capacity(long long capacity) {
        if (capacity <= 0) {
            throw InvalidArgument("LRU cache capacity must be positive, got " +
                                  std::to_string(capacity));
        }
        return static_cast<size_t>(capacity);
    }

    // splice keeps the iterator stored in lookup_ valid.
    void touch(ListIter it) { lru_list_.splice(lru_list_.begin(), lru_list_, it); }

    void evict_one() {
        Entry victim = std::move(lru_list_.back());
        lookup_.erase(victim.first);
        lru_list_.pop_back();
        spdlog::debug("LRU cache evicted least recently used entry (capacity {})", capacity_);
        if (eviction_callback_) {
            eviction_callback_(victim.first, victim.second);
        }
    }

    size_t capacity_;
    std::list<Entry> lru_list_;
    std::unordered_map<Key, ListIter, Hash> lookup_;
    EvictionCallback eviction_callback_;
};

}  // namespace mobilitykit

#endif  // MOBILITYKIT_LRU_CACHE_H
