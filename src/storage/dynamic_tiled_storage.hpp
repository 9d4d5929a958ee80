#pragma once

#include "storage/map_storage.hpp"
#include "storage/query_shape.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace labelmap {

// ── DynamicTiledStorage ───────────────────────────────────────────────────────
//
// Adaptive tiling.  Starts with a single tile covering the whole map.  When an
// insert pushes a tile above `tile_capacity` entries, the tile is split at the
// midpoint of its longer side and its entries are redistributed; children
// still above capacity are split again.  A 1×1 tile is never split, so it may
// hold more than `tile_capacity` entries.
//
// Dense areas end up covered by many small tiles, sparse areas by a few large
// ones.  Tiles are never merged back on removal: the tile count only grows
// until clear().
//
// Tiles live in a flat vector that point operations search linearly; the tile
// count stays in the tens to hundreds for typical workloads.

class DynamicTiledStorage final : public MapStorage {
public:
    static constexpr std::size_t kDefaultTileCapacity = 64;

    struct Tile {
        Rect bounds;
        std::unordered_map<Coord, Entry, CoordHash> entries;

        [[nodiscard]] int width() const noexcept { return bounds.max_x - bounds.min_x + 1; }
        [[nodiscard]] int height() const noexcept { return bounds.max_y - bounds.min_y + 1; }
    };

    // Throws std::invalid_argument if tile_capacity == 0.
    explicit DynamicTiledStorage(int max_coordinate        = kDefaultMaxCoordinate,
                                 std::size_t tile_capacity = kDefaultTileCapacity,
                                 std::shared_ptr<spdlog::logger> logger = {});

    DynamicTiledStorage(DynamicTiledStorage&&)            = default;
    DynamicTiledStorage& operator=(DynamicTiledStorage&&) = default;

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
    [[nodiscard]] std::size_t size() const override { return count_; }
    [[nodiscard]] std::string_view name() const noexcept override { return "dynamictiled"; }

    [[nodiscard]] std::size_t tile_count() const noexcept { return tiles_.size(); }
    [[nodiscard]] std::size_t tile_capacity() const noexcept { return tile_capacity_; }

    // Current tiles, in no particular order.
    [[nodiscard]] const std::vector<Tile>& tiles() const noexcept { return tiles_; }

private:
    // Index into tiles_ of the tile containing (x, y), or nullopt.
    [[nodiscard]] std::optional<std::size_t> find_tile(int x, int y) const noexcept;

    // Replaces tiles_[index] by its split children (recursively).
    void split(std::size_t index);

    // Splits `tile` in two and appends the results (or their own splits) to
    // tiles_.  A 1×1 tile is appended unchanged.
    void split_into_children(Tile tile);

    void reset_root();

    template <typename Shape>
    [[nodiscard]] std::vector<Entry> query(const Shape& shape) const;

    std::vector<Tile>               tiles_;
    std::size_t                     tile_capacity_;
    std::size_t                     count_ = 0;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace labelmap
