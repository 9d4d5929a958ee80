#pragma once

#include "storage/entry.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace labelmap {

inline constexpr int kDefaultMaxCoordinate = 1'000'000;

// ── MapStorage ────────────────────────────────────────────────────────────────
//
// Abstract interface for a spatial label store over the square
// [0, max_coordinate) × [0, max_coordinate).
//
// Every engine (hash map, BST, sorted array, tiles, ...) implements the same
// contract so that callers and tests can swap them freely.  The engine is
// selected at construction time through make_storage().
//
// Errors:
//   - std::out_of_range     a coordinate (point, region bound or circle
//                           center) lies outside [0, max_coordinate).
//   - std::invalid_argument negative radius, or a region with min > max.
// Validation always happens before the structure is touched.
//
// NOT thread-safe.  Callers that share an instance across threads must
// serialise access themselves.

class MapStorage {
public:
    virtual ~MapStorage() = default;

    MapStorage(const MapStorage&)            = delete;
    MapStorage& operator=(const MapStorage&) = delete;

    // Inserts `entry`, or replaces the label of the entry already stored at
    // (entry.x, entry.y).  Returns true if the coordinate was not present.
    virtual bool add(Entry entry) = 0;

    // Returns a copy of the entry at (x, y), or std::nullopt.
    [[nodiscard]] virtual std::optional<Entry> get(int x, int y) const = 0;

    // Non-throwing lookup.  Returns false (leaving `out` untouched) when the
    // coordinate is invalid or nothing is stored there.
    [[nodiscard]] bool try_get(int x, int y, Entry& out) const;

    // Removes the entry at (x, y).  Returns true if one existed.
    virtual bool remove(int x, int y) = 0;

    [[nodiscard]] virtual bool contains(int x, int y) const = 0;

    // All entries.  Ordering is engine specific.
    [[nodiscard]] virtual std::vector<Entry> list_all() const = 0;

    // Entries with min_x <= x <= max_x and min_y <= y <= max_y.
    [[nodiscard]] virtual std::vector<Entry> get_in_region(
        int min_x, int min_y, int max_x, int max_y) const = 0;

    // Entries strictly inside the circle around the origin: x² + y² < r².
    [[nodiscard]] virtual std::vector<Entry> get_within_radius(int radius) const = 0;

    // Entries inside or on the circle around (center_x, center_y):
    // (x - cx)² + (y - cy)² <= r².  Note the inclusive boundary, unlike the
    // origin-based overload.
    [[nodiscard]] virtual std::vector<Entry> get_within_radius(
        int center_x, int center_y, int radius) const = 0;

    // Removes all entries.
    virtual void clear() = 0;

    // Number of distinct coordinates stored.
    [[nodiscard]] virtual std::size_t size() const = 0;

    // Short engine name ("hashmap", "bst", ...).
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] int max_coordinate() const noexcept { return max_coordinate_; }

protected:
    // Throws std::invalid_argument if max_coordinate <= 0.
    explicit MapStorage(int max_coordinate);

    MapStorage(MapStorage&&)            = default;
    MapStorage& operator=(MapStorage&&) = default;

    [[nodiscard]] bool in_bounds(int x, int y) const noexcept {
        return x >= 0 && x < max_coordinate_ && y >= 0 && y < max_coordinate_;
    }

    // Throws std::out_of_range naming the offending axis.
    void validate_coordinates(int x, int y) const;

    // Bounds first (std::out_of_range), then ordering (std::invalid_argument).
    void validate_region(int min_x, int min_y, int max_x, int max_y) const;

    // Throws std::invalid_argument if radius < 0.
    static void validate_radius(int radius);

private:
    int max_coordinate_;
};

} // namespace labelmap
