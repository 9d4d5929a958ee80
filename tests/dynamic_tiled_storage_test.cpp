#include "storage/dynamic_tiled_storage.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <utility>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace labelmap {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Sum of tile areas; must always equal the map area.
static std::int64_t covered_area(const DynamicTiledStorage& s) {
    std::int64_t area = 0;
    for (const auto& tile : s.tiles()) {
        area += static_cast<std::int64_t>(tile.width()) * tile.height();
    }
    return area;
}

// ── Fixture ───────────────────────────────────────────────────────────────────

class DynamicTiledStorageTest : public ::testing::Test {
protected:
    // 100×100 map, split above 4 entries per tile.
    DynamicTiledStorage storage_{100, 4};
};

// ── Construction ──────────────────────────────────────────────────────────────

TEST(DynamicTiledStorageConstruction, StartsWithOneRootTile) {
    DynamicTiledStorage storage;
    EXPECT_EQ(storage.tile_count(), 1u);
    EXPECT_EQ(storage.tile_capacity(), DynamicTiledStorage::kDefaultTileCapacity);
    EXPECT_EQ(storage.tiles()[0].bounds, (Rect{0, 0, 999'999, 999'999}));
}

TEST(DynamicTiledStorageConstruction, ZeroCapacityThrows) {
    EXPECT_THROW(DynamicTiledStorage(100, 0), std::invalid_argument);
}

// ── Splitting ─────────────────────────────────────────────────────────────────

TEST_F(DynamicTiledStorageTest, NoSplitAtCapacity) {
    for (int i = 0; i < 4; ++i) {
        storage_.add({i * 20, i * 20, "e"});
    }
    EXPECT_EQ(storage_.tile_count(), 1u);
}

TEST_F(DynamicTiledStorageTest, OneSplitAddsOneTile) {
    // Two entries on each side of x = 50: the split is not recursive.
    storage_.add({10, 10, "a"});
    storage_.add({20, 80, "b"});
    storage_.add({60, 10, "c"});
    storage_.add({90, 90, "d"});
    storage_.add({30, 30, "e"});

    EXPECT_EQ(storage_.tile_count(), 2u);
    EXPECT_EQ(storage_.size(), 5u);
    const std::vector<std::pair<int, int>> points{{10, 10}, {20, 80}, {60, 10}, {90, 90}, {30, 30}};
    for (const auto& [x, y] : points) {
        EXPECT_TRUE(storage_.contains(x, y)) << x << "," << y;
    }
    EXPECT_EQ(covered_area(storage_), 100 * 100);
}

TEST_F(DynamicTiledStorageTest, SplitIsAlongLongerSide) {
    for (int i = 0; i < 5; ++i) {
        storage_.add({i, 0, "row"});   // all land in the x < 50 half
    }
    // Root 100×100 splits on x into [0,49] and [50,99]; the left half is
    // taller than wide, so its own split is on y.  Splitting recurses until
    // no tile holds more than four entries.
    EXPECT_GT(storage_.tile_count(), 2u);
    EXPECT_EQ(covered_area(storage_), 100 * 100);
    for (const auto& tile : storage_.tiles()) {
        EXPECT_LE(tile.entries.size(), 4u);
    }
}

TEST_F(DynamicTiledStorageTest, SplitHalvesAreMidpointBased) {
    for (int i = 0; i < 5; ++i) {
        storage_.add({i * 10, 0, "e"});   // x in {0,10,20,30,40}
    }
    bool found_right_half = false;
    for (const auto& tile : storage_.tiles()) {
        if (tile.bounds == Rect{50, 0, 99, 99}) {
            found_right_half = true;
            EXPECT_TRUE(tile.entries.empty());
        }
    }
    EXPECT_TRUE(found_right_half);
}

TEST_F(DynamicTiledStorageTest, SplitsDownToSinglePointTiles) {
    DynamicTiledStorage tiny{2, 1};
    tiny.add({0, 0, "a"});
    tiny.add({1, 1, "b"});
    tiny.add({0, 1, "c"});
    tiny.add({1, 0, "d"});
    EXPECT_EQ(tiny.tile_count(), 4u);
    for (const auto& tile : tiny.tiles()) {
        EXPECT_EQ(tile.width(), 1);
        EXPECT_EQ(tile.height(), 1);
    }
    EXPECT_EQ(covered_area(tiny), 4);
}

TEST_F(DynamicTiledStorageTest, UpdatesDoNotSplit) {
    for (int i = 0; i < 4; ++i) {
        storage_.add({i, i, "v1"});
    }
    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(storage_.add({i, i, "v2"}));
    }
    EXPECT_EQ(storage_.tile_count(), 1u);
}

// ── No merge ──────────────────────────────────────────────────────────────────

TEST_F(DynamicTiledStorageTest, RemoveDoesNotMergeTiles) {
    for (int i = 0; i < 20; ++i) {
        storage_.add({i * 5, i * 5, "e"});
    }
    const auto tiles_before = storage_.tile_count();
    ASSERT_GT(tiles_before, 1u);

    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(storage_.remove(i * 5, i * 5));
    }
    EXPECT_EQ(storage_.size(), 0u);
    EXPECT_EQ(storage_.tile_count(), tiles_before);
}

TEST_F(DynamicTiledStorageTest, ClearRestoresRootTile) {
    for (int i = 0; i < 20; ++i) {
        storage_.add({i * 5, 99 - i * 5, "e"});
    }
    storage_.clear();
    EXPECT_EQ(storage_.tile_count(), 1u);
    EXPECT_EQ(storage_.tiles()[0].bounds, (Rect{0, 0, 99, 99}));
}

// ── Queries across tiles ──────────────────────────────────────────────────────

TEST_F(DynamicTiledStorageTest, QueriesSpanSplitTiles) {
    for (int x = 0; x < 100; x += 10) {
        for (int y = 0; y < 100; y += 10) {
            storage_.add({x, y, "g"});
        }
    }
    EXPECT_EQ(storage_.get_in_region(0, 0, 99, 99).size(), 100u);
    EXPECT_EQ(storage_.get_in_region(15, 15, 45, 45).size(), 9u);
    // x² + y² < 20²: (0,0) (0,10) (10,0) (10,10)
    EXPECT_EQ(storage_.get_within_radius(20).size(), 4u);
    // Center (50,50), r = 10 inclusive: itself and four neighbours.
    EXPECT_EQ(storage_.get_within_radius(50, 50, 10).size(), 5u);
}

// ── Logging ───────────────────────────────────────────────────────────────────

TEST(DynamicTiledStorageLogging, SplitIsLoggedAtDebug) {
    std::ostringstream out;
    auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("dynamictiled-test", sink);
    logger->set_level(spdlog::level::debug);

    DynamicTiledStorage storage{100, 1, logger};
    storage.add({10, 10, "a"});
    storage.add({90, 90, "b"});
    logger->flush();

    EXPECT_NE(out.str().find("splitting tile [0,0]-[99,99]"), std::string::npos);
}

} // namespace labelmap
