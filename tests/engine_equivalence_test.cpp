#include "storage/hash_map_storage.hpp"
#include "storage/storage_factory.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

namespace labelmap {

namespace {

std::vector<Entry> sorted(std::vector<Entry> entries) {
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return std::tie(a.x, a.y) < std::tie(b.x, b.y);
    });
    return entries;
}

} // namespace

// ── Fixture ───────────────────────────────────────────────────────────────────
//
// Drives one engine and a HashMapStorage through the same seeded sequence of
// operations and compares every observable result.

class EngineEquivalenceTest : public ::testing::TestWithParam<StorageKind> {
protected:
    // Small map so that random coordinates collide, updates happen and the
    // tiled engines use many tiles.
    static constexpr int kMax = 512;

    StorageOptions options() const {
        StorageOptions o;
        o.max_coordinate = kMax;
        o.tile_shift     = 5;
        o.tile_capacity  = 4;
        return o;
    }

    void run(uint32_t seed, int steps) {
        HashMapStorage reference{kMax};
        auto engine = make_storage(GetParam(), options());

        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> coord(0, kMax - 1);
        std::uniform_int_distribution<int> op(0, 9);
        std::uniform_int_distribution<int> radius(0, kMax);

        for (int i = 0; i < steps; ++i) {
            SCOPED_TRACE("step " + std::to_string(i));
            const int x = coord(rng);
            const int y = coord(rng);

            switch (op(rng)) {
                case 0: case 1: case 2: case 3: {
                    Entry e{x, y, "v" + std::to_string(i)};
                    ASSERT_EQ(engine->add(e), reference.add(e));
                    break;
                }
                case 4: case 5:
                    ASSERT_EQ(engine->remove(x, y), reference.remove(x, y));
                    break;
                case 6:
                    ASSERT_EQ(engine->get(x, y), reference.get(x, y));
                    ASSERT_EQ(engine->contains(x, y), reference.contains(x, y));
                    break;
                case 7: {
                    const int x2 = coord(rng);
                    const int y2 = coord(rng);
                    const int min_x = std::min(x, x2), max_x = std::max(x, x2);
                    const int min_y = std::min(y, y2), max_y = std::max(y, y2);
                    ASSERT_EQ(sorted(engine->get_in_region(min_x, min_y, max_x, max_y)),
                              sorted(reference.get_in_region(min_x, min_y, max_x, max_y)));
                    break;
                }
                case 8: {
                    const int r = radius(rng);
                    ASSERT_EQ(sorted(engine->get_within_radius(r)),
                              sorted(reference.get_within_radius(r)));
                    break;
                }
                case 9: {
                    const int r = radius(rng) / 4;
                    ASSERT_EQ(sorted(engine->get_within_radius(x, y, r)),
                              sorted(reference.get_within_radius(x, y, r)));
                    break;
                }
            }
            ASSERT_EQ(engine->size(), reference.size());
        }

        EXPECT_EQ(sorted(engine->list_all()), sorted(reference.list_all()));
    }
};

TEST_P(EngineEquivalenceTest, MatchesHashMapOnRandomOperations) {
    run(1, 3000);
}

TEST_P(EngineEquivalenceTest, MatchesHashMapWithAnotherSeed) {
    run(20240611, 3000);
}

TEST_P(EngineEquivalenceTest, MatchesHashMapOnDenseCorner) {
    // All operations inside an 8×8 corner: heavy updates and removals.
    HashMapStorage reference{kMax};
    auto engine = make_storage(GetParam(), options());

    std::mt19937 rng(99);
    std::uniform_int_distribution<int> coord(0, 7);
    for (int i = 0; i < 2000; ++i) {
        const int x = coord(rng);
        const int y = coord(rng);
        if (i % 3 == 2) {
            ASSERT_EQ(engine->remove(x, y), reference.remove(x, y));
        } else {
            Entry e{x, y, std::to_string(i)};
            ASSERT_EQ(engine->add(e), reference.add(e));
        }
    }
    EXPECT_EQ(sorted(engine->list_all()), sorted(reference.list_all()));
    EXPECT_EQ(sorted(engine->get_within_radius(6)), sorted(reference.get_within_radius(6)));
    EXPECT_EQ(sorted(engine->get_within_radius(4, 4, 3)),
              sorted(reference.get_within_radius(4, 4, 3)));
}

INSTANTIATE_TEST_SUITE_P(
    AllEngines, EngineEquivalenceTest,
    ::testing::ValuesIn(all_storage_kinds()),
    [](const ::testing::TestParamInfo<StorageKind>& info) {
        return std::string(to_string(info.param));
    });

} // namespace labelmap
