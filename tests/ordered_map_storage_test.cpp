#include "storage/ordered_map_storage.hpp"

#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace labelmap {

// ── Fixture ───────────────────────────────────────────────────────────────────

class OrderedMapStorageTest : public ::testing::Test {
protected:
    OrderedMapStorage storage_;
};

TEST_F(OrderedMapStorageTest, CollisionsShareOneBucket) {
    storage_.add({3, 4, "a"});
    storage_.add({4, 3, "b"});
    storage_.add({5, 0, "c"});
    storage_.add({1, 1, "d"});

    const auto stats = storage_.statistics();
    EXPECT_EQ(stats.bucket_count, 2u);
    EXPECT_EQ(stats.max_collisions, 3u);
    EXPECT_EQ(stats.total_collisions, 2u);
}

TEST_F(OrderedMapStorageTest, EmptyBucketIsErased) {
    storage_.add({3, 4, "a"});
    storage_.add({4, 3, "b"});
    storage_.remove(3, 4);
    EXPECT_EQ(storage_.statistics().bucket_count, 1u);
    storage_.remove(4, 3);
    EXPECT_EQ(storage_.statistics().bucket_count, 0u);
}

TEST_F(OrderedMapStorageTest, ListAllIsInKeyOrder) {
    storage_.add({100, 0, "far"});
    storage_.add({0, 1, "near"});
    storage_.add({7, 7, "mid"});

    const auto all = storage_.list_all();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].label, "near");
    EXPECT_EQ(all[1].label, "mid");
    EXPECT_EQ(all[2].label, "far");
}

TEST_F(OrderedMapStorageTest, RegionAwayFromOriginUsesKeyRange) {
    // Same spatial key 25 inside and outside the region.
    storage_.add({3, 4, "inside"});
    storage_.add({4, 3, "outside"});
    storage_.add({0, 0, "origin"});
    storage_.add({900, 900, "far"});

    std::set<std::string> labels;
    for (const auto& e : storage_.get_in_region(2, 4, 3, 10)) {
        labels.insert(e.label);
    }
    EXPECT_EQ(labels, (std::set<std::string>{"inside"}));
}

TEST_F(OrderedMapStorageTest, RegionContainingOriginStartsAtKeyZero) {
    storage_.add({0, 0, "origin"});
    storage_.add({2, 2, "near"});
    EXPECT_EQ(storage_.get_in_region(0, 0, 2, 2).size(), 2u);
}

TEST_F(OrderedMapStorageTest, UpdateDoesNotGrowBucket) {
    storage_.add({3, 4, "a"});
    EXPECT_FALSE(storage_.add({3, 4, "a2"}));
    EXPECT_EQ(storage_.statistics().max_collisions, 0u);
    EXPECT_EQ(storage_.get(3, 4)->label, "a2");
}

} // namespace labelmap
