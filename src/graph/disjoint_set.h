#pragma once
#ifndef MOBILITYKIT_DISJOINT_SET_H
#define MOBILITYKIT_DISJOINT_SET_H

#include <functional>
#include <unordered_map>
#include <vector>
#include <cstddef>

namespace mobilitykit {

// Union-find with path compression and union by rank.
// Elements are registered on first use; find() and unite() never fail.
// Not thread-safe.
template <typename Element, typename Hash = std::hash<Element>>
class DisjointSet {
public:
    // No-op if x is already tracked.
    void make_set(const Element& x) {
        if (records_.count(x) == 0) {
            records_.emplace(x, Record{x, 0});
            ++set_count_;
        }
    }

    // Root of x's set. Every node on the path is re-pointed directly at the root.
    Element find(const Element& x) {
        make_set(x);

        Element root = x;
        while (!(records_.at(root).parent == root)) {
            root = records_.at(root).parent;
        }

        Element current = x;
        while (!(current == root)) {
            Record& record = records_.at(current);
            Element next = record.parent;
            record.parent = root;
            current = next;
        }
        return root;
    }

    // Named unite because union is a keyword.
    void unite(const Element& x, const Element& y) {
        Element rx = find(x);
        Element ry = find(y);
        if (rx == ry) return;

        Record& a = records_.at(rx);
        Record& b = records_.at(ry);
        if (a.rank < b.rank) {
            a.parent = ry;
        } else if (a.rank > b.rank) {
            b.parent = rx;
        } else {
            b.parent = rx;
            ++a.rank;
        }
        --set_count_;
    }

    bool connected(const Element& x, const Element& y) { return find(x) == find(y); }

    bool contains(const Element& x) const { return records_.count(x) > 0; }

    size_t rank(const Element& x) const {
        auto it = records_.find(x);
        return it == records_.end() ? 0 : it->second.rank;
    }

    size_t size() const { return records_.size(); }
    size_t set_count() const { return set_count_; }

private:
    struct Record {
        Element parent;
        size_t rank;
    };

    std::unordered_map<Element, Record, Hash> records_;
    size_t set_count_ = 0;
};

}  // namespace mobilitykit

#endif  // MOBILITYKIT_DISJOINT_SET_H
