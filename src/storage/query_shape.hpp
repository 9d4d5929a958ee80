#pragma once

#include "storage/entry.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

namespace labelmap {

// ── Rect ──────────────────────────────────────────────────────────────────────
// Axis-aligned rectangle with inclusive bounds.

struct Rect {
    int min_x = 0;
    int min_y = 0;
    int max_x = 0;
    int max_y = 0;

    [[nodiscard]] bool contains(int x, int y) const noexcept {
        return x >= min_x && x <= max_x && y >= min_y && y <= max_y;
    }

    [[nodiscard]] bool intersects(const Rect& o) const noexcept {
        return !(o.max_x < min_x || o.min_x > max_x || o.max_y < min_y || o.min_y > max_y);
    }

    friend bool operator==(const Rect&, const Rect&) = default;
};

// ── Query shapes ──────────────────────────────────────────────────────────────
//
// Predicates shared by the tiled engines.  Each shape exposes:
//   accepts(x, y)          exact per-entry test
//   bounds(max_coordinate) bounding box clamped to the map
//   covers(tile)           true if all four tile corners are accepted, so the
//                          whole tile can be taken without per-entry tests

namespace detail {

[[nodiscard]] inline int clamp_to_map(std::int64_t v, int max_coordinate) noexcept {
    return static_cast<int>(std::clamp<std::int64_t>(v, 0, max_coordinate - 1));
}

template <typename Shape>
[[nodiscard]] bool all_corners_accepted(const Shape& shape, const Rect& tile) noexcept {
    const std::array<Coord, 4> corners{{
        {tile.min_x, tile.min_y},
        {tile.max_x, tile.min_y},
        {tile.min_x, tile.max_y},
        {tile.max_x, tile.max_y},
    }};
    return std::all_of(corners.begin(), corners.end(),
                       [&](const Coord& c) { return shape.accepts(c.x, c.y); });
}

} // namespace detail

struct RegionQuery {
    Rect rect;

    [[nodiscard]] bool accepts(int x, int y) const noexcept { return rect.contains(x, y); }
    [[nodiscard]] Rect bounds(int /*max_coordinate*/) const noexcept { return rect; }
    [[nodiscard]] bool covers(const Rect& tile) const noexcept {
        return detail::all_corners_accepted(*this, tile);
    }
};

// Origin circle, strict: x² + y² < r².
struct OriginRadiusQuery {
    int          radius = 0;
    std::int64_t radius_sq = 0;

    explicit OriginRadiusQuery(int r) noexcept
        : radius(r), radius_sq(static_cast<std::int64_t>(r) * r) {}

    [[nodiscard]] bool accepts(int x, int y) const noexcept {
        return spatial_key(x, y) < radius_sq;
    }
    [[nodiscard]] Rect bounds(int max_coordinate) const noexcept {
        const int hi = detail::clamp_to_map(radius, max_coordinate);
        return {0, 0, hi, hi};
    }
    [[nodiscard]] bool covers(const Rect& tile) const noexcept {
        return detail::all_corners_accepted(*this, tile);
    }
};

// Arbitrary center, inclusive: (x - cx)² + (y - cy)² <= r².
struct CenterRadiusQuery {
    int          center_x = 0;
    int          center_y = 0;
    int          radius = 0;
    std::int64_t radius_sq = 0;

    CenterRadiusQuery(int cx, int cy, int r) noexcept
        : center_x(cx), center_y(cy), radius(r),
          radius_sq(static_cast<std::int64_t>(r) * r) {}

    [[nodiscard]] bool accepts(int x, int y) const noexcept {
        return squared_distance(x, y, center_x, center_y) <= radius_sq;
    }
    [[nodiscard]] Rect bounds(int max_coordinate) const noexcept {
        return {
            detail::clamp_to_map(static_cast<std::int64_t>(center_x) - radius, max_coordinate),
            detail::clamp_to_map(static_cast<std::int64_t>(center_y) - radius, max_coordinate),
            detail::clamp_to_map(static_cast<std::int64_t>(center_x) + radius, max_coordinate),
            detail::clamp_to_map(static_cast<std::int64_t>(center_y) + radius, max_coordinate),
        };
    }
    [[nodiscard]] bool covers(const Rect& tile) const noexcept {
        return detail::all_corners_accepted(*this, tile);
    }
};

// Appends the entries of one candidate tile to `out`: the whole tile when the
// shape covers it, otherwise only the entries the shape accepts.
// `entries` is any map whose mapped_type is Entry.
template <typename Shape, typename EntryMap>
void collect_tile(const Shape& shape, const Rect& tile, const EntryMap& entries,
                  std::vector<Entry>& out) {
    if (shape.covers(tile)) {
        for (const auto& [_, entry] : entries) {
            out.push_back(entry);
        }
        return;
    }
    for (const auto& [_, entry] : entries) {
        if (shape.accepts(entry.x, entry.y)) {
            out.push_back(entry);
        }
    }
}

} // namespace labelmap
