#pragma once
#ifndef MOBILITYKIT_MERGE_SORT_H
#define MOBILITYKIT_MERGE_SORT_H

#include <functional>
#include <utility>
#include <vector>
#include <cstddef>

namespace mobilitykit {

namespace detail {

template <typename T, typename KeyFn, typename Compare>
std::vector<T> merge_runs(std::vector<T> left, std::vector<T> right,
                          const KeyFn& key, const Compare& comp) {
    std::vector<T> merged;
    merged.reserve(left.size() + right.size());

    size_t i = 0;
    size_t j = 0;
    while (i < left.size() && j < right.size()) {
        // Ties take the left element, which keeps the sort stable.
        if (!comp(key(right[j]), key(left[i]))) {
            merged.push_back(std::move(left[i++]));
        } else {
            merged.push_back(std::move(right[j++]));
        }
    }
    while (i < left.size()) merged.push_back(std::move(left[i++]));
    while (j < right.size()) merged.push_back(std::move(right[j++]));
    return merged;
}

template <typename T, typename KeyFn, typename Compare>
std::vector<T> merge_sort_range(const std::vector<T>& items, size_t begin, size_t end,
                                const KeyFn& key, const Compare& comp) {
    if (end - begin <= 1) {
        return std::vector<T>(items.begin() + begin, items.begin() + end);
    }
    size_t mid = begin + (end - begin) / 2;
    return merge_runs(merge_sort_range(items, begin, mid, key, comp),
                      merge_sort_range(items, mid, end, key, comp), key, comp);
}

}  // namespace detail

// Stable top-down merge sort. Returns a new vector ordered by key(item) under
// comp (ascending with the default std::less). Recursion depth is log2(n).
template <typename T, typename KeyFn, typename Compare = std::less<>>
std::vector<T> merge_sort(const std::vector<T>& items, KeyFn key, Compare comp = Compare{}) {
    return detail::merge_sort_range(items, 0, items.size(), key, comp);
}

}  // namespace mobilitykit

#endif  // MOBILITYKIT_MERGE_SORT_H
