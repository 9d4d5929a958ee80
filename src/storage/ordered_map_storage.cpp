#include "storage/ordered_map_storage.hpp"

#include "storage/query_shape.hpp"

#include <algorithm>
#include <utility>

namespace labelmap {

namespace {

[[nodiscard]] bool same_coord(const Entry& e, int x, int y) noexcept {
    return e.x == x && e.y == y;
}

} // namespace

OrderedMapStorage::OrderedMapStorage(int max_coordinate)
    : MapStorage(max_coordinate)
{
}

const Entry* OrderedMapStorage::find_entry(int x, int y) const {
    auto bucket = buckets_.find(spatial_key(x, y));
    if (bucket == buckets_.end()) {
        return nullptr;
    }
    for (const auto& entry : bucket->second) {
        if (same_coord(entry, x, y)) {
            return &entry;
        }
    }
    return nullptr;
}

bool OrderedMapStorage::add(Entry entry) {
    validate_coordinates(entry.x, entry.y);

    auto& bucket = buckets_[spatial_key(entry.x, entry.y)];
    for (auto& existing : bucket) {
        if (same_coord(existing, entry.x, entry.y)) {
            existing.label = std::move(entry.label);
            return false;
        }
    }
    bucket.push_back(std::move(entry));
    ++count_;
    return true;
}

std::optional<Entry> OrderedMapStorage::get(int x, int y) const {
    validate_coordinates(x, y);
    if (const Entry* entry = find_entry(x, y)) {
        return *entry;
    }
    return std::nullopt;
}

bool OrderedMapStorage::remove(int x, int y) {
    validate_coordinates(x, y);

    auto bucket = buckets_.find(spatial_key(x, y));
    if (bucket == buckets_.end()) {
        return false;
    }

    auto& entries = bucket->second;
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Entry& e) { return same_coord(e, x, y); });
    if (it == entries.end()) {
        return false;
    }

    entries.erase(it);
    --count_;
    if (entries.empty()) {
        buckets_.erase(bucket);
    }
    return true;
}

bool OrderedMapStorage::contains(int x, int y) const {
    validate_coordinates(x, y);
    return find_entry(x, y) != nullptr;
}

std::vector<Entry> OrderedMapStorage::list_all() const {
    std::vector<Entry> result;
    result.reserve(count_);
    for (const auto& [_, entries] : buckets_) {
        result.insert(result.end(), entries.begin(), entries.end());
    }
    return result;
}

std::vector<Entry> OrderedMapStorage::get_in_region(
    int min_x, int min_y, int max_x, int max_y) const
{
    validate_region(min_x, min_y, max_x, max_y);

    // Nearest rectangle point to the origin: clamp 0 into each interval.
    const int near_x = std::clamp(0, min_x, max_x);
    const int near_y = std::clamp(0, min_y, max_y);
    const std::int64_t min_key = spatial_key(near_x, near_y);

    // Farthest corner.
    const std::int64_t max_key =
        std::max(spatial_key(min_x, 0), spatial_key(max_x, 0)) +
        std::max(spatial_key(0, min_y), spatial_key(0, max_y));

    const Rect rect{min_x, min_y, max_x, max_y};
    std::vector<Entry> result;

    const auto last = buckets_.upper_bound(max_key);
    for (auto it = buckets_.lower_bound(min_key); it != last; ++it) {
        for (const auto& entry : it->second) {
            if (rect.contains(entry.x, entry.y)) {
                result.push_back(entry);
            }
        }
    }
    return result;
}

std::vector<Entry> OrderedMapStorage::get_within_radius(int radius) const {
    validate_radius(radius);

    const std::int64_t radius_sq = static_cast<std::int64_t>(radius) * radius;
    std::vector<Entry> result;
    for (const auto& [key, entries] : buckets_) {
        if (key >= radius_sq) {
            break;
        }
        result.insert(result.end(), entries.begin(), entries.end());
    }
    return result;
}

std::vector<Entry> OrderedMapStorage::get_within_radius(
    int center_x, int center_y, int radius) const
{
    validate_coordinates(center_x, center_y);
    validate_radius(radius);

    const CenterRadiusQuery query{center_x, center_y, radius};
    std::vector<Entry> result;
    for (const auto& [_, entries] : buckets_) {
        for (const auto& entry : entries) {
            if (query.accepts(entry.x, entry.y)) {
                result.push_back(entry);
            }
        }
    }
    return result;
}

void OrderedMapStorage::clear() {
    buckets_.clear();
    count_ = 0;
}

OrderedMapStorage::Statistics OrderedMapStorage::statistics() const {
    Statistics stats;
    stats.bucket_count = buckets_.size();
    for (const auto& [_, entries] : buckets_) {
        const std::size_t n = entries.size();
        if (n > 1) {
            stats.total_collisions += n - 1;
            stats.max_collisions = std::max(stats.max_collisions, n);
        }
    }
    return stats;
}

} // namespace labelmap
