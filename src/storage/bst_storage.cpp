#include "storage/bst_storage.hpp"

#include "storage/query_shape.hpp"

#include <algorithm>
#include <utility>

namespace labelmap {

BstStorage::BstStorage(int max_coordinate)
    : MapStorage(max_coordinate)
{
}

BstStorage::~BstStorage() {
    destroy(std::move(root_));
}

BstStorage::BstStorage(BstStorage&& other) noexcept
    : MapStorage(std::move(other))
    , root_(std::move(other.root_))
    , count_(std::exchange(other.count_, 0))
{
}

BstStorage& BstStorage::operator=(BstStorage&& other) noexcept {
    if (this != &other) {
        destroy(std::move(root_));
        MapStorage::operator=(std::move(other));
        root_  = std::move(other.root_);
        count_ = std::exchange(other.count_, 0);
    }
    return *this;
}

// ── Tree helpers ──────────────────────────────────────────────────────────────

std::unique_ptr<BstStorage::Node>* BstStorage::find_slot(std::int64_t key) noexcept {
    std::unique_ptr<Node>* slot = &root_;
    while (*slot && (*slot)->key != key) {
        slot = key < (*slot)->key ? &(*slot)->left : &(*slot)->right;
    }
    return slot;
}

const BstStorage::Node* BstStorage::find_node(std::int64_t key) const noexcept {
    const Node* node = root_.get();
    while (node && node->key != key) {
        node = key < node->key ? node->left.get() : node->right.get();
    }
    return node;
}

const Entry* BstStorage::find_entry(int x, int y) const noexcept {
    const Node* node = find_node(spatial_key(x, y));
    if (!node) {
        return nullptr;
    }
    for (const auto& entry : node->entries) {
        if (entry.x == x && entry.y == y) {
            return &entry;
        }
    }
    return nullptr;
}

void BstStorage::excise(std::unique_ptr<Node>& slot) noexcept {
    Node& node = *slot;

    // Zero or one child: splice the child (possibly null) into the slot.
    if (!node.left) {
        slot = std::move(node.right);
        return;
    }
    if (!node.right) {
        slot = std::move(node.left);
        return;
    }

    // Two children: take over the in-order successor, i.e. the minimum of the
    // right subtree, then unlink that minimum (it has no left child).
    std::unique_ptr<Node>* succ_slot = &node.right;
    while ((*succ_slot)->left) {
        succ_slot = &(*succ_slot)->left;
    }
    Node& successor = **succ_slot;
    node.key     = successor.key;
    node.entries = std::move(successor.entries);
    *succ_slot   = std::move(successor.right);
}

void BstStorage::destroy(std::unique_ptr<Node> root) noexcept {
    // Rotate left children up until the root has none, then drop the root.
    // Every deleted node has both children detached, so no destructor recurses.
    while (root) {
        if (root->left) {
            std::unique_ptr<Node> left = std::move(root->left);
            root->left  = std::move(left->right);
            left->right = std::move(root);
            root        = std::move(left);
        } else {
            root = std::move(root->right);
        }
    }
}

template <typename Visit>
void BstStorage::in_order(Visit&& visit) const {
    std::vector<const Node*> stack;
    const Node* node = root_.get();
    while (node || !stack.empty()) {
        while (node) {
            stack.push_back(node);
            node = node->left.get();
        }
        node = stack.back();
        stack.pop_back();
        if (!visit(*node)) {
            return;
        }
        node = node->right.get();
    }
}

// ── Point operations ──────────────────────────────────────────────────────────

bool BstStorage::add(Entry entry) {
    validate_coordinates(entry.x, entry.y);

    const std::int64_t key = spatial_key(entry.x, entry.y);
    std::unique_ptr<Node>& slot = *find_slot(key);

    if (!slot) {
        slot = std::make_unique<Node>(key);
        slot->entries.push_back(std::move(entry));
        ++count_;
        return true;
    }

    // Same key: either an update of (x, y) or a collision with other coordinates.
    for (auto& existing : slot->entries) {
        if (existing.x == entry.x && existing.y == entry.y) {
            existing.label = std::move(entry.label);
            return false;
        }
    }
    slot->entries.push_back(std::move(entry));
    ++count_;
    return true;
}

std::optional<Entry> BstStorage::get(int x, int y) const {
    validate_coordinates(x, y);
    if (const Entry* entry = find_entry(x, y)) {
        return *entry;
    }
    return std::nullopt;
}

bool BstStorage::remove(int x, int y) {
    validate_coordinates(x, y);

    std::unique_ptr<Node>& slot = *find_slot(spatial_key(x, y));
    if (!slot) {
        return false;
    }

    auto& entries = slot->entries;
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Entry& e) { return e.x == x && e.y == y; });
    if (it == entries.end()) {
        return false;
    }
    entries.erase(it);
    --count_;

    if (entries.empty()) {
        excise(slot);
    }
    return true;
}

bool BstStorage::contains(int x, int y) const {
    validate_coordinates(x, y);
    return find_entry(x, y) != nullptr;
}

// ── Bulk queries ──────────────────────────────────────────────────────────────

std::vector<Entry> BstStorage::list_all() const {
    std::vector<Entry> result;
    result.reserve(count_);
    in_order([&](const Node& node) {
        result.insert(result.end(), node.entries.begin(), node.entries.end());
        return true;
    });
    return result;
}

std::vector<Entry> BstStorage::get_in_region(
    int min_x, int min_y, int max_x, int max_y) const
{
    validate_region(min_x, min_y, max_x, max_y);

    const Rect rect{min_x, min_y, max_x, max_y};
    std::vector<Entry> result;
    in_order([&](const Node& node) {
        for (const auto& entry : node.entries) {
            if (rect.contains(entry.x, entry.y)) {
                result.push_back(entry);
            }
        }
        return true;
    });
    return result;
}

std::vector<Entry> BstStorage::get_within_radius(int radius) const {
    validate_radius(radius);

    const std::int64_t radius_sq = static_cast<std::int64_t>(radius) * radius;
    std::vector<Entry> result;

    // Keys arrive in ascending order: the first key >= r² ends the walk, which
    // skips that node's right subtree and every node after it.
    in_order([&](const Node& node) {
        if (node.key >= radius_sq) {
            return false;
        }
        result.insert(result.end(), node.entries.begin(), node.entries.end());
        return true;
    });
    return result;
}

std::vector<Entry> BstStorage::get_within_radius(
    int center_x, int center_y, int radius) const
{
    validate_coordinates(center_x, center_y);
    validate_radius(radius);

    const CenterRadiusQuery query{center_x, center_y, radius};
    std::vector<Entry> result;
    in_order([&](const Node& node) {
        for (const auto& entry : node.entries) {
            if (query.accepts(entry.x, entry.y)) {
                result.push_back(entry);
            }
        }
        return true;
    });
    return result;
}

void BstStorage::clear() {
    destroy(std::move(root_));
    count_ = 0;
}

// ── Diagnostics ───────────────────────────────────────────────────────────────

BstStorage::Statistics BstStorage::statistics() const {
    Statistics stats;
    if (!root_) {
        return stats;
    }

    std::vector<std::pair<const Node*, std::size_t>> stack{{root_.get(), 1}};
    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();

        ++stats.node_count;
        stats.height = std::max(stats.height, depth);

        const std::size_t list_size = node->entries.size();
        if (list_size > 1) {
            stats.total_collisions += list_size - 1;
            stats.max_collisions = std::max(stats.max_collisions, list_size);
        }

        if (node->left) {
            stack.emplace_back(node->left.get(), depth + 1);
        }
        if (node->right) {
            stack.emplace_back(node->right.get(), depth + 1);
        }
    }
    return stats;
}

} // namespace labelmap
