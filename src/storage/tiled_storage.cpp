#include "storage/tiled_storage.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace labelmap {

TiledStorage::TiledStorage(int max_coordinate, int tile_shift)
    : MapStorage(max_coordinate)
    , tile_shift_(tile_shift)
{
    if (tile_shift < 0 || tile_shift > kMaxTileShift) {
        throw std::invalid_argument(
            fmt::format("tile_shift must be in [0, {}], got {}", kMaxTileShift, tile_shift));
    }
}

Rect TiledStorage::tile_bounds(const Coord& tile) const noexcept {
    const std::int64_t size  = std::int64_t{1} << tile_shift_;
    const std::int64_t limit = max_coordinate() - 1;
    const std::int64_t min_x = static_cast<std::int64_t>(tile.x) << tile_shift_;
    const std::int64_t min_y = static_cast<std::int64_t>(tile.y) << tile_shift_;
    return {
        static_cast<int>(min_x),
        static_cast<int>(min_y),
        static_cast<int>(std::min(min_x + size - 1, limit)),
        static_cast<int>(std::min(min_y + size - 1, limit)),
    };
}

template <typename Shape>
std::vector<Entry> TiledStorage::query(const Shape& shape) const {
    const Rect bounds = shape.bounds(max_coordinate());
    const Rect tile_range{
        bounds.min_x >> tile_shift_, bounds.min_y >> tile_shift_,
        bounds.max_x >> tile_shift_, bounds.max_y >> tile_shift_,
    };

    std::vector<Entry> result;
    for (const auto& [tile, entries] : tiles_) {
        if (!tile_range.contains(tile.x, tile.y)) {
            continue;
        }
        collect_tile(shape, tile_bounds(tile), entries, result);
    }
    return result;
}

// ── Point operations ──────────────────────────────────────────────────────────

bool TiledStorage::add(Entry entry) {
    validate_coordinates(entry.x, entry.y);

    auto& tile = tiles_[tile_of(entry.x, entry.y)];
    const Coord key{entry.x, entry.y};
    auto [it, inserted] = tile.insert_or_assign(key, std::move(entry));
    if (inserted) {
        ++count_;
    }
    return inserted;
}

std::optional<Entry> TiledStorage::get(int x, int y) const {
    validate_coordinates(x, y);

    auto tile = tiles_.find(tile_of(x, y));
    if (tile == tiles_.end()) {
        return std::nullopt;
    }
    auto it = tile->second.find(Coord{x, y});
    if (it == tile->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TiledStorage::remove(int x, int y) {
    validate_coordinates(x, y);

    auto tile = tiles_.find(tile_of(x, y));
    if (tile == tiles_.end() || tile->second.erase(Coord{x, y}) == 0) {
        return false;
    }
    --count_;
    if (tile->second.empty()) {
        tiles_.erase(tile);
    }
    return true;
}

bool TiledStorage::contains(int x, int y) const {
    validate_coordinates(x, y);

    auto tile = tiles_.find(tile_of(x, y));
    return tile != tiles_.end() && tile->second.contains(Coord{x, y});
}

// ── Bulk queries ──────────────────────────────────────────────────────────────

std::vector<Entry> TiledStorage::list_all() const {
    std::vector<Entry> result;
    result.reserve(count_);
    for (const auto& [_, entries] : tiles_) {
        for (const auto& [coord, entry] : entries) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<Entry> TiledStorage::get_in_region(
    int min_x, int min_y, int max_x, int max_y) const
{
    validate_region(min_x, min_y, max_x, max_y);
    return query(RegionQuery{Rect{min_x, min_y, max_x, max_y}});
}

std::vector<Entry> TiledStorage::get_within_radius(int radius) const {
    validate_radius(radius);
    return query(OriginRadiusQuery{radius});
}

std::vector<Entry> TiledStorage::get_within_radius(
    int center_x, int center_y, int radius) const
{
    validate_coordinates(center_x, center_y);
    validate_radius(radius);
    return query(CenterRadiusQuery{center_x, center_y, radius});
}

void TiledStorage::clear() {
    tiles_.clear();
    count_ = 0;
}

} // namespace labelmap
