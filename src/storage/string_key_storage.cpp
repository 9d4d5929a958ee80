#include "storage/string_key_storage.hpp"

#include "storage/query_shape.hpp"

#include <utility>

#include <fmt/format.h>

namespace labelmap {

StringKeyStorage::StringKeyStorage(int max_coordinate)
    : MapStorage(max_coordinate)
{
}

std::string StringKeyStorage::make_key(int x, int y) {
    return fmt::format("{},{}", x, y);
}

template <typename Predicate>
std::vector<Entry> StringKeyStorage::scan(const Predicate& accepts) const {
    std::vector<Entry> result;
    for (const auto& [_, entry] : map_) {
        if (accepts(entry.x, entry.y)) {
            result.push_back(entry);
        }
    }
    return result;
}

bool StringKeyStorage::add(Entry entry) {
    validate_coordinates(entry.x, entry.y);
    auto key = make_key(entry.x, entry.y);
    auto [it, inserted] = map_.insert_or_assign(std::move(key), std::move(entry));
    return inserted;
}

std::optional<Entry> StringKeyStorage::get(int x, int y) const {
    validate_coordinates(x, y);
    auto it = map_.find(make_key(x, y));
    if (it == map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool StringKeyStorage::remove(int x, int y) {
    validate_coordinates(x, y);
    return map_.erase(make_key(x, y)) > 0;
}

bool StringKeyStorage::contains(int x, int y) const {
    validate_coordinates(x, y);
    return map_.contains(make_key(x, y));
}

std::vector<Entry> StringKeyStorage::list_all() const {
    std::vector<Entry> result;
    result.reserve(map_.size());
    for (const auto& [_, entry] : map_) {
        result.push_back(entry);
    }
    return result;
}

std::vector<Entry> StringKeyStorage::get_in_region(
    int min_x, int min_y, int max_x, int max_y) const
{
    validate_region(min_x, min_y, max_x, max_y);
    const Rect rect{min_x, min_y, max_x, max_y};
    return scan([&](int x, int y) { return rect.contains(x, y); });
}

std::vector<Entry> StringKeyStorage::get_within_radius(int radius) const {
    validate_radius(radius);
    const OriginRadiusQuery query{radius};
    return scan([&](int x, int y) { return query.accepts(x, y); });
}

std::vector<Entry> StringKeyStorage::get_within_radius(
    int center_x, int center_y, int radius) const
{
    validate_coordinates(center_x, center_y);
    validate_radius(radius);
    const CenterRadiusQuery query{center_x, center_y, radius};
    return scan([&](int x, int y) { return query.accepts(x, y); });
}

void StringKeyStorage::clear() {
    map_.clear();
}

std::size_t StringKeyStorage::size() const {
    return map_.size();
}

} // namespace labelmap
