#pragma once
#ifndef MOBILITYKIT_MIN_HEAP_H
#define MOBILITYKIT_MIN_HEAP_H

#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>
#include <cstddef>

namespace mobilitykit {

// Array-backed binary min-heap of (priority, item) pairs.
// Every parent's priority is <= both children's. No decrease-key.
template <typename Priority, typename Item, typename Compare = std::less<Priority>>
class MinHeap {
public:
    using Entry = std::pair<Priority, Item>;

    MinHeap() = default;
    explicit MinHeap(Compare comp) : comp_(std::move(comp)) {}

    void push(Priority priority, Item item) {
        heap_.emplace_back(std::move(priority), std::move(item));
        sift_up(heap_.size() - 1);
    }

    // Throws std::out_of_range when empty.
    Entry pop() {
        if (heap_.empty()) {
            throw std::out_of_range("Heap is empty");
        }
        std::swap(heap_.front(), heap_.back());
        Entry min_entry = std::move(heap_.back());
        heap_.pop_back();
        if (!heap_.empty()) {
            sift_down(0);
        }
        return min_entry;
    }

    // Throws std::out_of_range when empty.
    const Entry& top() const {
        if (heap_.empty()) {
            throw std::out_of_range("Heap is empty");
        }
        return heap_.front();
    }

    std::optional<Entry> peek() const {
        if (heap_.empty()) return std::nullopt;
        return heap_.front();
    }

    size_t size() const { return heap_.size(); }
    bool empty() const { return heap_.empty(); }

private:
    void sift_up(size_t idx) {
        while (idx > 0) {
            size_t parent = (idx - 1) / 2;
            if (!comp_(heap_[idx].first, heap_[parent].first)) break;
            std::swap(heap_[idx], heap_[parent]);
            idx = parent;
        }
    }

    void sift_down(size_t idx) {
        const size_t n = heap_.size();
        while (true) {
            size_t smallest = idx;
            size_t left = 2 * idx + 1;
            size_t right = 2 * idx + 2;

            if (left < n && comp_(heap_[left].first, heap_[smallest].first)) smallest = left;
            if (right < n && comp_(heap_[right].first, heap_[smallest].first)) smallest = right;
            if (smallest == idx) break;

            std::swap(heap_[idx], heap_[smallest]);
            idx = smallest;
        }
    }

    std::vector<Entry> heap_;
    Compare comp_;
};

}  // namespace mobilitykit

#endif  // MOBILITYKIT_MIN_HEAP_H
