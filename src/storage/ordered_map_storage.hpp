#pragma once

#include "storage/map_storage.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <map>
#include <optional>
#include <vector>

namespace labelmap {

// ── OrderedMapStorage ─────────────────────────────────────────────────────────
//
// std::map (red-black tree) from spatial_key(x, y) to the list of entries
// sharing that key.  Key operations stay O(log n) whatever the insertion
// order, unlike BstStorage.
//
// Queries use the key order:
//   - origin radius iterates from the smallest key and stops at r².
//   - region iterates only keys in [min_key, max_key], the squared distances
//     from the origin to the nearest and farthest points of the rectangle.
// Center-radius queries have no usable key range and scan everything.

class OrderedMapStorage final : public MapStorage {
public:
    struct Statistics {
        std::size_t bucket_count     = 0;  // distinct keys
        std::size_t max_collisions   = 0;
        std::size_t total_collisions = 0;
    };

    explicit OrderedMapStorage(int max_coordinate = kDefaultMaxCoordinate);

    OrderedMapStorage(OrderedMapStorage&&)            = default;
    OrderedMapStorage& operator=(OrderedMapStorage&&) = default;

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
    [[nodiscard]] std::string_view name() const noexcept override { return "orderedmap"; }

    [[nodiscard]] Statistics statistics() const;

private:
    [[nodiscard]] const Entry* find_entry(int x, int y) const;

    std::map<std::int64_t, std::list<Entry>> buckets_;
    std::size_t count_ = 0;
};

} // namespace labelmap
