#pragma once
#ifndef MOBILITYKIT_GRAPH_H
#define MOBILITYKIT_GRAPH_H

#include <functional>
#include <limits>
#include <unordered_map>
#include <utility>
#include <vector>
#include <cstddef>
#include <spdlog/spdlog.h>
#include "queue/min_heap.h"

namespace mobilitykit {

constexpr double kUnreachable = std::numeric_limits<double>::infinity();

// Weighted directed graph stored as adjacency lists.
//
// Edge weights must be non-negative for dijkstra() to be correct. This is a
// precondition of the caller and is not checked.
// Not thread-safe once shared between threads for mutation.
template <typename Node, typename Hash = std::hash<Node>>
class Graph {
public:
    using Edge = std::pair<Node, double>;
    using DistanceMap = std::unordered_map<Node, double, Hash>;

    // Appends (v, w) to u's list; v is registered as a node if new.
    void add_edge(const Node& u, const Node& v, double weight) {
        adjacency_[u].emplace_back(v, weight);
        adjacency_.try_emplace(v);
        ++edge_count_;
    }

    void add_node(const Node& u) { adjacency_.try_emplace(u); }

    bool has_node(const Node& u) const { return adjacency_.count(u) > 0; }

    // Empty for unknown nodes.
    const std::vector<Edge>& neighbors(const Node& u) const {
        static const std::vector<Edge> kNone;
        auto it = adjacency_.find(u);
        return it == adjacency_.end() ? kNone : it->second;
    }

    // Shortest distance from source to every node; kUnreachable where no path
    // exists. An unknown source is reported with distance 0 and nothing else
    // reachable.
    DistanceMap dijkstra(const Node& source) const {
        DistanceMap dist;
        dist.reserve(adjacency_.size() + 1);
        for (const auto& [node, _] : adjacency_) {
            dist.emplace(node, kUnreachable);
        }
        dist[source] = 0.0;

        // Superseded entries stay queued and are skipped when popped.
        MinHeap<double, Node> pq;
        pq.push(0.0, source);
        size_t stale = 0;

        while (!pq.empty()) {
            auto [d, u] = pq.pop();
            if (d > dist[u]) {
                ++stale;
                continue;
            }
            for (const auto& [v, w] : neighbors(u)) {
                double candidate = d + w;
                if (candidate < dist[v]) {
                    dist[v] = candidate;
                    pq.push(candidate, v);
                }
            }
        }

        spdlog::debug("dijkstra settled {} nodes, skipped {} stale queue entries",
                      dist.size(), stale);
        return dist;
    }

    size_t node_count() const { return adjacency_.size(); }
    size_t edge_count() const { return edge_count_; }

private:
    std::unordered_map<Node, std::vector<Edge>, Hash> adjacency_;
    size_t edge_count_ = 0;
};

}  // namespace mobilitykit

#endif  // MOBILITYKIT_GRAPH_H
