#include "storage/dynamic_tiled_storage.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace labelmap {

DynamicTiledStorage::DynamicTiledStorage(int max_coordinate,
                                         std::size_t tile_capacity,
                                         std::shared_ptr<spdlog::logger> logger)
    : MapStorage(max_coordinate)
    , tile_capacity_(tile_capacity)
    , logger_(std::move(logger))
{
    if (tile_capacity == 0) {
        throw std::invalid_argument("tile_capacity must be >= 1");
    }
    reset_root();
}

void DynamicTiledStorage::reset_root() {
    tiles_.clear();
    tiles_.push_back(Tile{Rect{0, 0, max_coordinate() - 1, max_coordinate() - 1}, {}});
}

std::optional<std::size_t> DynamicTiledStorage::find_tile(int x, int y) const noexcept {
    for (std::size_t i = 0; i < tiles_.size(); ++i) {
        if (tiles_[i].bounds.contains(x, y)) {
            return i;
        }
    }
    return std::nullopt;
}

// ── Splitting ─────────────────────────────────────────────────────────────────

void DynamicTiledStorage::split(std::size_t index) {
    Tile tile = std::move(tiles_[index]);
    if (index + 1 != tiles_.size()) {
        tiles_[index] = std::move(tiles_.back());
    }
    tiles_.pop_back();

    if (logger_) {
        logger_->debug("splitting tile [{},{}]-[{},{}] holding {} entries",
                       tile.bounds.min_x, tile.bounds.min_y,
                       tile.bounds.max_x, tile.bounds.max_y, tile.entries.size());
    }
    split_into_children(std::move(tile));
}

void DynamicTiledStorage::split_into_children(Tile tile) {
    const int w = tile.width();
    const int h = tile.height();
    if (w == 1 && h == 1) {
        tiles_.push_back(std::move(tile));
        return;
    }

    const Rect& b = tile.bounds;
    std::array<Tile, 2> children;
    if (w >= h) {
        const int mid = b.min_x + w / 2;
        children[0].bounds = Rect{b.min_x, b.min_y, mid - 1, b.max_y};
        children[1].bounds = Rect{mid, b.min_y, b.max_x, b.max_y};
    } else {
        const int mid = b.min_y + h / 2;
        children[0].bounds = Rect{b.min_x, b.min_y, b.max_x, mid - 1};
        children[1].bounds = Rect{b.min_x, mid, b.max_x, b.max_y};
    }

    for (auto& [coord, entry] : tile.entries) {
        auto& child = children[0].bounds.contains(coord.x, coord.y) ? children[0] : children[1];
        child.entries.emplace(coord, std::move(entry));
    }

    for (auto& child : children) {
        if (child.entries.size() > tile_capacity_) {
            split_into_children(std::move(child));
        } else {
            tiles_.push_back(std::move(child));
        }
    }
}

// ── Point operations ──────────────────────────────────────────────────────────

bool DynamicTiledStorage::add(Entry entry) {
    validate_coordinates(entry.x, entry.y);

    const auto index = find_tile(entry.x, entry.y);
    if (!index) {
        throw std::logic_error(
            fmt::format("no tile covers ({}, {})", entry.x, entry.y));
    }

    auto& tile = tiles_[*index];
    const Coord key{entry.x, entry.y};
    auto [it, inserted] = tile.entries.insert_or_assign(key, std::move(entry));
    if (!inserted) {
        return false;
    }

    ++count_;
    if (tile.entries.size() > tile_capacity_ && (tile.width() > 1 || tile.height() > 1)) {
        split(*index);
    }
    return true;
}

std::optional<Entry> DynamicTiledStorage::get(int x, int y) const {
    validate_coordinates(x, y);

    const auto index = find_tile(x, y);
    if (!index) {
        return std::nullopt;
    }
    const auto& entries = tiles_[*index].entries;
    auto it = entries.find(Coord{x, y});
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DynamicTiledStorage::remove(int x, int y) {
    validate_coordinates(x, y);

    const auto index = find_tile(x, y);
    if (!index || tiles_[*index].entries.erase(Coord{x, y}) == 0) {
        return false;
    }
    --count_;
    return true;
}

bool DynamicTiledStorage::contains(int x, int y) const {
    validate_coordinates(x, y);

    const auto index = find_tile(x, y);
    return index && tiles_[*index].entries.contains(Coord{x, y});
}

// ── Bulk queries ──────────────────────────────────────────────────────────────

template <typename Shape>
std::vector<Entry> DynamicTiledStorage::query(const Shape& shape) const {
    const Rect bounds = shape.bounds(max_coordinate());

    std::vector<Entry> result;
    for (const auto& tile : tiles_) {
        if (tile.entries.empty() || !bounds.intersects(tile.bounds)) {
            continue;
        }
        collect_tile(shape, tile.bounds, tile.entries, result);
    }
    return result;
}

std::vector<Entry> DynamicTiledStorage::list_all() const {
    std::vector<Entry> result;
    result.reserve(count_);
    for (const auto& tile : tiles_) {
        for (const auto& [coord, entry] : tile.entries) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<Entry> DynamicTiledStorage::get_in_region(
    int min_x, int min_y, int max_x, int max_y) const
{
    validate_region(min_x, min_y, max_x, max_y);
    return query(RegionQuery{Rect{min_x, min_y, max_x, max_y}});
}

std::vector<Entry> DynamicTiledStorage::get_within_radius(int radius) const {
    validate_radius(radius);
    return query(OriginRadiusQuery{radius});
}

std::vector<Entry> DynamicTiledStorage::get_within_radius(
    int center_x, int center_y, int radius) const
{
    validate_coordinates(center_x, center_y);
    validate_radius(radius);
    return query(CenterRadiusQuery{center_x, center_y, radius});
}

void DynamicTiledStorage::clear() {
    reset_root();
    count_ = 0;
}

} // namespace labelmap
