#pragma once

#include "storage/map_storage.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace labelmap {

// Same algorithm as HashMapStorage, but keyed by the string "x,y".
// Exists to measure the cost of string keys against the (x, y) pair key.
class StringKeyStorage final : public MapStorage {
public:
    explicit StringKeyStorage(int max_coordinate = kDefaultMaxCoordinate);

    StringKeyStorage(StringKeyStorage&&)            = default;
    StringKeyStorage& operator=(StringKeyStorage&&) = default;

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
    [[nodiscard]] std::string_view name() const noexcept override { return "stringkey"; }

    // "x,y"
    [[nodiscard]] static std::string make_key(int x, int y);

private:
    template <typename Predicate>
    [[nodiscard]] std::vector<Entry> scan(const Predicate& accepts) const;

    std::unordered_map<std::string, Entry> map_;
};

} // namespace labelmap
