#pragma once
#ifndef MOBILITYKIT_SEARCH_TREE_H
#define MOBILITYKIT_SEARCH_TREE_H

#include <functional>
#include <memory>
#include <utility>
#include <vector>
#include <cstddef>

namespace mobilitykit {

// Unbalanced binary search tree for inclusive range queries.
// Left subtree keys < node key <= right subtree keys (ties go right).
//
// All traversals use an explicit stack, so a degenerate insertion order
// costs O(n) time per operation but never exhausts the call stack.
// Not thread-safe.
template <typename Key, typename Value, typename Compare = std::less<Key>>
class BinarySearchTree {
public:
    using Entry = std::pair<Key, Value>;

    BinarySearchTree() = default;
    explicit BinarySearchTree(Compare comp) : comp_(std::move(comp)) {}
    ~BinarySearchTree() { clear(); }

    BinarySearchTree(const BinarySearchTree&) = delete;
    BinarySearchTree& operator=(const BinarySearchTree&) = delete;
    BinarySearchTree(BinarySearchTree&& other) noexcept
        : root_(std::move(other.root_)), size_(other.size_), comp_(std::move(other.comp_)) {
        other.size_ = 0;
    }
    BinarySearchTree& operator=(BinarySearchTree&& other) noexcept {
        if (this != &other) {
            clear();
            root_ = std::move(other.root_);
            size_ = other.size_;
            comp_ = std::move(other.comp_);
            other.size_ = 0;
        }
        return *this;
    }

    void insert(Key key, Value value) {
        std::unique_ptr<Node>* slot = &root_;
        while (*slot) {
            slot = comp_(key, (*slot)->key) ? &(*slot)->left : &(*slot)->right;
        }
        *slot = std::make_unique<Node>(std::move(key), std::move(value));
        ++size_;
    }

    // All entries with min_key <= key <= max_key, in pre-order of the visited
    // nodes. A subtree is only entered when it can still hold keys in range.
    std::vector<Entry> range_query(const Key& min_key, const Key& max_key) const {
        std::vector<Entry> results;
        std::vector<const Node*> pending;
        if (root_) pending.push_back(root_.get());

        while (!pending.empty()) {
            const Node* node = pending.back();
            pending.pop_back();

            if (!comp_(node->key, min_key) && !comp_(max_key, node->key)) {
                results.emplace_back(node->key, node->value);
            }
            // Right is pushed first so the left subtree is visited first.
            if (comp_(node->key, max_key) && node->right) {
                pending.push_back(node->right.get());
            }
            if (comp_(min_key, node->key) && node->left) {
                pending.push_back(node->left.get());
            }
        }
        return results;
    }

    size_t height() const {
        size_t best = 0;
        std::vector<std::pair<const Node*, size_t>> pending;
        if (root_) pending.emplace_back(root_.get(), 1);
        while (!pending.empty()) {
            auto [node, depth] = pending.back();
            pending.pop_back();
            if (depth > best) best = depth;
            if (node->left) pending.emplace_back(node->left.get(), depth + 1);
            if (node->right) pending.emplace_back(node->right.get(), depth + 1);
        }
        return best;
    }

    // Detaches children before each node dies so destruction is not recursive.
    void clear() {
        std::vector<std::unique_ptr<Node>> pending;
        if (root_) pending.push_back(std::move(root_));
        while (!pending.empty()) {
            std::unique_ptr<Node> node = std::move(pending.back());
            pending.pop_back();
            if (node->left) pending.push_back(std::move(node->left));
            if (node->right) pending.push_back(std::move(node->right));
        }
        size_ = 0;
    }

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

private:
    struct Node {
        Node(Key k, Value v) : key(std::move(k)), value(std::move(v)) {}
        Key key;
        Value value;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
    };

    std::unique_ptr<Node> root_;
    size_t size_ = 0;
    Compare comp_;
};

}  // namespace mobilitykit

#endif  // MOBILITYKIT_SEARCH_TREE_H
