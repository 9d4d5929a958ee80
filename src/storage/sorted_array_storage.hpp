#pragma once

#include "storage/map_storage.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace labelmap {

// ── SortedArrayStorage ────────────────────────────────────────────────────────
//
// One contiguous vector of records kept sorted by spatial_key(x, y).  Records
// with equal keys form a contiguous run in insertion order.
//
// Lookups are binary searches; inserts and removes shift the tail (O(n)).
// The payoff is the origin-radius query: every qualifying record sits in the
// prefix [0, lower_index(r²)), returned in one bulk copy.

class SortedArrayStorage final : public MapStorage {
public:
    struct Record {
        std::int64_t key;
        Entry        entry;
    };

    struct Statistics {
        std::size_t total_entries  = 0;
        std::size_t unique_keys    = 0;
        std::size_t max_collisions = 0;  // longest run of equal keys
    };

    explicit SortedArrayStorage(int max_coordinate = kDefaultMaxCoordinate);

    SortedArrayStorage(SortedArrayStorage&&)            = default;
    SortedArrayStorage& operator=(SortedArrayStorage&&) = default;

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
    [[nodiscard]] std::size_t size() const override { return records_.size(); }
    [[nodiscard]] std::string_view name() const noexcept override { return "sortedarray"; }

    // ── Binary searches ──────────────────────────────────────────────────────

    // Index of some record with `key`, or ~insertion_point (always negative)
    // when no record has that key.
    [[nodiscard]] std::ptrdiff_t search_any(std::int64_t key) const noexcept;

    // Index of the leftmost record with `key`, or -1.
    [[nodiscard]] std::ptrdiff_t search_first(std::int64_t key) const noexcept;

    // First index whose key is >= target; size() if there is none.
    [[nodiscard]] std::size_t lower_index(std::int64_t target) const noexcept;

    // ── Diagnostics ──────────────────────────────────────────────────────────

    // Internal key sequence, front to back.
    [[nodiscard]] std::vector<std::int64_t> keys() const;

    [[nodiscard]] Statistics statistics() const;

private:
    // Index of the record holding (x, y), or -1.
    [[nodiscard]] std::ptrdiff_t find_index(int x, int y) const noexcept;

    std::vector<Record> records_;
};

} // namespace labelmap
