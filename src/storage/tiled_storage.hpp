#pragma once

#include "storage/map_storage.hpp"
#include "storage/query_shape.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace labelmap {

// ── TiledStorage ──────────────────────────────────────────────────────────────
//
// Fixed power-of-two grid.  The map is cut into square tiles of side
// 2^tile_shift; tile coordinates are (x >> tile_shift, y >> tile_shift).
// Only tiles holding at least one entry exist: they are created on add and
// erased when their last entry is removed.
//
// Spatial queries walk the existing tiles only (never the full cross product
// of the query's tile range, which can be huge on sparse data), skip tiles
// outside the query's bounding tile range, take fully covered tiles wholesale
// and filter the entries of boundary tiles.

class TiledStorage final : public MapStorage {
public:
    static constexpr int kDefaultTileShift = 15;  // 32768-unit tiles
    static constexpr int kMaxTileShift     = 30;

    // Throws std::invalid_argument if tile_shift is outside [0, kMaxTileShift].
    explicit TiledStorage(int max_coordinate = kDefaultMaxCoordinate,
                          int tile_shift     = kDefaultTileShift);

    TiledStorage(TiledStorage&&)            = default;
    TiledStorage& operator=(TiledStorage&&) = default;

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
    [[nodiscard]] std::string_view name() const noexcept override { return "tiled"; }

    // Number of non-empty tiles.
    [[nodiscard]] std::size_t tile_count() const noexcept { return tiles_.size(); }
    [[nodiscard]] int tile_shift() const noexcept { return tile_shift_; }
    [[nodiscard]] int tile_size() const noexcept { return 1 << tile_shift_; }

private:
    using TileEntries = std::unordered_map<Coord, Entry, CoordHash>;

    [[nodiscard]] Coord tile_of(int x, int y) const noexcept {
        return {x >> tile_shift_, y >> tile_shift_};
    }

    // Map-space rectangle of a tile, clipped to the map.
    [[nodiscard]] Rect tile_bounds(const Coord& tile) const noexcept;

    template <typename Shape>
    [[nodiscard]] std::vector<Entry> query(const Shape& shape) const;

    std::unordered_map<Coord, TileEntries, CoordHash> tiles_;
    int         tile_shift_;
    std::size_t count_ = 0;
};

} // namespace labelmap
