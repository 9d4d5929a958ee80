#include "storage/hash_map_storage.hpp"

#include "storage/query_shape.hpp"

#include <utility>

namespace labelmap {

HashMapStorage::HashMapStorage(int max_coordinate)
    : MapStorage(max_coordinate)
{
}

bool HashMapStorage::add(Entry entry) {
    validate_coordinates(entry.x, entry.y);
    const Coord key{entry.x, entry.y};
    auto [it, inserted] = map_.insert_or_assign(key, std::move(entry));
    return inserted;
}

std::optional<Entry> HashMapStorage::get(int x, int y) const {
    validate_coordinates(x, y);
    auto it = map_.find(Coord{x, y});
    if (it == map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool HashMapStorage::remove(int x, int y) {
    validate_coordinates(x, y);
    return map_.erase(Coord{x, y}) > 0;
}

bool HashMapStorage::contains(int x, int y) const {
    validate_coordinates(x, y);
    return map_.contains(Coord{x, y});
}

std::vector<Entry> HashMapStorage::list_all() const {
    std::vector<Entry> result;
    result.reserve(map_.size());
    for (const auto& [_, entry] : map_) {
        result.push_back(entry);
    }
    return result;
}

std::vector<Entry> HashMapStorage::get_in_region(
    int min_x, int min_y, int max_x, int max_y) const
{
    validate_region(min_x, min_y, max_x, max_y);

    const Rect rect{min_x, min_y, max_x, max_y};
    std::vector<Entry> result;
    for (const auto& [_, entry] : map_) {
        if (rect.contains(entry.x, entry.y)) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<Entry> HashMapStorage::get_within_radius(int radius) const {
    validate_radius(radius);

    const OriginRadiusQuery query{radius};
    std::vector<Entry> result;
    for (const auto& [_, entry] : map_) {
        if (query.accepts(entry.x, entry.y)) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<Entry> HashMapStorage::get_within_radius(
    int center_x, int center_y, int radius) const
{
    validate_coordinates(center_x, center_y);
    validate_radius(radius);

    const CenterRadiusQuery query{center_x, center_y, radius};
    std::vector<Entry> result;
    for (const auto& [_, entry] : map_) {
        if (query.accepts(entry.x, entry.y)) {
            result.push_back(entry);
        }
    }
    return result;
}

void HashMapStorage::clear() {
    map_.clear();
}

std::size_t HashMapStorage::size() const {
    return map_.size();
}

} // namespace labelmap
