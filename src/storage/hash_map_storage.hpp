#pragma once

#include "storage/map_storage.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace labelmap {

// Label store backed by std::unordered_map keyed by the (x, y) pair.
//
// Point operations are O(1) average.  Region and radius queries are plain
// linear scans; no index exploits spatial locality.  This engine is the
// reference every other engine is checked against.
class HashMapStorage final : public MapStorage {
public:
    explicit HashMapStorage(int max_coordinate = kDefaultMaxCoordinate);

    HashMapStorage(HashMapStorage&&)            = default;
    HashMapStorage& operator=(HashMapStorage&&) = default;

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
    [[nodiscard]] std::size_t size() const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "hashmap"; }

private:
    std::unordered_map<Coord, Entry, CoordHash> map_;
};

} // namespace labelmap
