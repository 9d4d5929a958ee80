#include "storage/sorted_array_storage.hpp"

#include "storage/query_shape.hpp"

#include <algorithm>
#include <utility>

namespace labelmap {

SortedArrayStorage::SortedArrayStorage(int max_coordinate)
    : MapStorage(max_coordinate)
{
}

// ── Binary searches ───────────────────────────────────────────────────────────

std::ptrdiff_t SortedArrayStorage::search_any(std::int64_t key) const noexcept {
    std::ptrdiff_t left  = 0;
    std::ptrdiff_t right = static_cast<std::ptrdiff_t>(records_.size()) - 1;

    while (left <= right) {
        const std::ptrdiff_t mid = left + (right - left) / 2;
        const std::int64_t mid_key = records_[static_cast<std::size_t>(mid)].key;

        if (mid_key == key) {
            return mid;
        }
        if (mid_key < key) {
            left = mid + 1;
        } else {
            right = mid - 1;
        }
    }
    return ~left;
}

std::ptrdiff_t SortedArrayStorage::search_first(std::int64_t key) const noexcept {
    std::ptrdiff_t left   = 0;
    std::ptrdiff_t right  = static_cast<std::ptrdiff_t>(records_.size()) - 1;
    std::ptrdiff_t result = -1;

    while (left <= right) {
        const std::ptrdiff_t mid = left + (right - left) / 2;
        const std::int64_t mid_key = records_[static_cast<std::size_t>(mid)].key;

        if (mid_key == key) {
            result = mid;
            right  = mid - 1;  // keep looking left for the first one
        } else if (mid_key < key) {
            left = mid + 1;
        } else {
            right = mid - 1;
        }
    }
    return result;
}

std::size_t SortedArrayStorage::lower_index(std::int64_t target) const noexcept {
    std::size_t left  = 0;
    std::size_t right = records_.size();

    while (left < right) {
        const std::size_t mid = left + (right - left) / 2;
        if (records_[mid].key < target) {
            left = mid + 1;
        } else {
            right = mid;
        }
    }
    return left;
}

std::ptrdiff_t SortedArrayStorage::find_index(int x, int y) const noexcept {
    const std::int64_t key = spatial_key(x, y);
    const std::ptrdiff_t first = search_first(key);
    if (first < 0) {
        return -1;
    }
    for (auto i = static_cast<std::size_t>(first);
         i < records_.size() && records_[i].key == key; ++i) {
        if (records_[i].entry.x == x && records_[i].entry.y == y) {
            return static_cast<std::ptrdiff_t>(i);
        }
    }
    return -1;
}

// ── Point operations ──────────────────────────────────────────────────────────

bool SortedArrayStorage::add(Entry entry) {
    validate_coordinates(entry.x, entry.y);

    const std::int64_t key = spatial_key(entry.x, entry.y);
    const std::ptrdiff_t first = search_first(key);

    if (first >= 0) {
        // Key present: update in place, or append at the end of the run.
        auto i = static_cast<std::size_t>(first);
        for (; i < records_.size() && records_[i].key == key; ++i) {
            if (records_[i].entry.x == entry.x && records_[i].entry.y == entry.y) {
                records_[i].entry.label = std::move(entry.label);
                return false;
            }
        }
        records_.insert(records_.begin() + static_cast<std::ptrdiff_t>(i),
                        Record{key, std::move(entry)});
        return true;
    }

    const std::ptrdiff_t insert_at = ~search_any(key);
    records_.insert(records_.begin() + insert_at, Record{key, std::move(entry)});
    return true;
}

std::optional<Entry> SortedArrayStorage::get(int x, int y) const {
    validate_coordinates(x, y);
    const std::ptrdiff_t index = find_index(x, y);
    if (index < 0) {
        return std::nullopt;
    }
    return records_[static_cast<std::size_t>(index)].entry;
}

bool SortedArrayStorage::remove(int x, int y) {
    validate_coordinates(x, y);
    const std::ptrdiff_t index = find_index(x, y);
    if (index < 0) {
        return false;
    }
    records_.erase(records_.begin() + index);
    return true;
}

bool SortedArrayStorage::contains(int x, int y) const {
    validate_coordinates(x, y);
    return find_index(x, y) >= 0;
}

// ── Bulk queries ──────────────────────────────────────────────────────────────

std::vector<Entry> SortedArrayStorage::list_all() const {
    std::vector<Entry> result;
    result.reserve(records_.size());
    for (const auto& record : records_) {
        result.push_back(record.entry);
    }
    return result;
}

std::vector<Entry> SortedArrayStorage::get_in_region(
    int min_x, int min_y, int max_x, int max_y) const
{
    validate_region(min_x, min_y, max_x, max_y);

    const Rect rect{min_x, min_y, max_x, max_y};
    std::vector<Entry> result;
    for (const auto& record : records_) {
        if (rect.contains(record.entry.x, record.entry.y)) {
            result.push_back(record.entry);
        }
    }
    return result;
}

std::vector<Entry> SortedArrayStorage::get_within_radius(int radius) const {
    validate_radius(radius);

    const std::size_t end = lower_index(static_cast<std::int64_t>(radius) * radius);
    std::vector<Entry> result;
    result.reserve(end);
    for (std::size_t i = 0; i < end; ++i) {
        result.push_back(records_[i].entry);
    }
    return result;
}

std::vector<Entry> SortedArrayStorage::get_within_radius(
    int center_x, int center_y, int radius) const
{
    validate_coordinates(center_x, center_y);
    validate_radius(radius);

    const CenterRadiusQuery query{center_x, center_y, radius};
    std::vector<Entry> result;
    for (const auto& record : records_) {
        if (query.accepts(record.entry.x, record.entry.y)) {
            result.push_back(record.entry);
        }
    }
    return result;
}

void SortedArrayStorage::clear() {
    records_.clear();
}

// ── Diagnostics ───────────────────────────────────────────────────────────────

std::vector<std::int64_t> SortedArrayStorage::keys() const {
    std::vector<std::int64_t> result;
    result.reserve(records_.size());
    for (const auto& record : records_) {
        result.push_back(record.key);
    }
    return result;
}

SortedArrayStorage::Statistics SortedArrayStorage::statistics() const {
    Statistics stats;
    stats.total_entries = records_.size();

    std::size_t run = 0;
    for (std::size_t i = 0; i < records_.size(); ++i) {
        if (i == 0 || records_[i].key != records_[i - 1].key) {
            ++stats.unique_keys;
            run = 1;
        } else {
            ++run;
        }
        stats.max_collisions = std::max(stats.max_collisions, run);
    }
    return stats;
}

} // namespace labelmap
