#pragma once

#include "storage/map_storage.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace labelmap {

// ── BstStorage ────────────────────────────────────────────────────────────────
//
// Unbalanced binary search tree keyed by spatial_key(x, y) = x² + y².
//
// Each node carries the list of entries that share its key (the key is not
// injective).  The tree is never rebalanced, so sequential keys degrade it to
// a linked list; the engine exists to measure exactly that.
//
// Origin-radius queries walk the tree in key order and stop at the first key
// >= r².  Region and center-radius queries are not monotonic in the key and
// fall back to a full traversal.
//
// Descent, traversal and teardown are iterative: a degenerate tree of a few
// hundred thousand nodes must not exhaust the call stack.

class BstStorage final : public MapStorage {
public:
    struct Statistics {
        std::size_t node_count       = 0;
        std::size_t height           = 0;  // 0 for an empty tree
        std::size_t max_collisions   = 0;  // largest list size among colliding nodes
        std::size_t total_collisions = 0;  // sum of (list size - 1) over colliding nodes
    };

    explicit BstStorage(int max_coordinate = kDefaultMaxCoordinate);
    ~BstStorage() override;

    BstStorage(BstStorage&& other) noexcept;
    BstStorage& operator=(BstStorage&& other) noexcept;

    bool add(Entry entry) override;
    [[nodiscard]] std::optional<Entry> get(int x, int y) const override;
    bool remove(int x, int y) override;
    [[nodiscard]] bool contains(int x, int y) const override;
    [[nodiscard]] std::vector<Entry> list_all() const override;
    [[nodiscard]] std::vector<Entry> get_in_region(
        int min_x, int min_y, int max_x, int max_y) const override;
    [[nodiscard]] std::vector<Entry> get_within_radius(int radius) const override;
    [[nodiscard]] std::vector<Entry> get_within_radius(
        int center_x, int center_y, int radius) const override;
    void clear() override;
    [[nodiscard]] std::size_t size() const override { return count_; }
    [[nodiscard]] std::string_view name() const noexcept override { return "bst"; }

    [[nodiscard]] Statistics statistics() const;

private:
    struct Node {
        explicit Node(std::int64_t k) : key(k) {}

        std::int64_t          key;
        std::vector<Entry>    entries;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
    };

    // Owning slot (root_ or a child pointer) where `key` lives or would be
    // inserted.
    [[nodiscard]] std::unique_ptr<Node>* find_slot(std::int64_t key) noexcept;
    [[nodiscard]] const Node* find_node(std::int64_t key) const noexcept;
    [[nodiscard]] const Entry* find_entry(int x, int y) const noexcept;

    // Unlinks the (now empty) node owned by `slot`.
    static void excise(std::unique_ptr<Node>& slot) noexcept;

    // Frees a subtree without recursion.
    static void destroy(std::unique_ptr<Node> root) noexcept;

    // In-order (ascending key) traversal; stops when `visit` returns false.
    template <typename Visit>
    void in_order(Visit&& visit) const;

    std::unique_ptr<Node> root_;
    std::size_t           count_ = 0;
};

} // namespace labelmap
