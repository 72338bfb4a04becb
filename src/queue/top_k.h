#pragma once
#ifndef MOBILITYKIT_TOP_K_H
#define MOBILITYKIT_TOP_K_H

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>
#include <cstddef>
#include "queue/min_heap.h"
#include "sort/merge_sort.h"

namespace mobilitykit {

// The k items with the largest value, descending.
// k <= 0 yields nothing; k >= n returns every item, stably sorted descending.
// Otherwise a min-heap bounded to k entries keeps memory at O(k).
template <typename Payload>
std::vector<std::pair<double, Payload>> find_top_k(
        const std::vector<std::pair<double, Payload>>& items, long long k) {
    using Item = std::pair<double, Payload>;

    if (k <= 0) return {};

    if (static_cast<unsigned long long>(k) >= items.size()) {
        return merge_sort(items, [](const Item& item) { return item.first; },
                          std::greater<>());
    }

    MinHeap<double, Payload> heap;
    const auto limit = static_cast<size_t>(k);
    for (const auto& [value, payload] : items) {
        if (heap.size() < limit) {
            heap.push(value, payload);
        } else if (value > heap.top().first) {
            heap.pop();
            heap.push(value, payload);
        }
    }

    std::vector<Item> result;
    result.reserve(heap.size());
    while (!heap.empty()) {
        result.push_back(heap.pop());
    }
    std::reverse(result.begin(), result.end());
    return result;
}

}  // namespace mobilitykit

#endif  // MOBILITYKIT_TOP_K_H
