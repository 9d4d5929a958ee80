#include "testdata/data_generator.hpp"

#include <cmath>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace labelmap::testdata {

// ── Helpers ───────────────────────────────────────────────────────────────────

static void expect_in_map(const std::vector<Entry>& entries, int max_coordinate) {
    for (const auto& e : entries) {
        EXPECT_GE(e.x, 0);
        EXPECT_LT(e.x, max_coordinate);
        EXPECT_GE(e.y, 0);
        EXPECT_LT(e.y, max_coordinate);
    }
}

// ── Fixed data sets ───────────────────────────────────────────────────────────

TEST(DataGeneratorTest, BasicEntries) {
    const auto entries = basic_entries();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0], (Entry{1, 1, "label1"}));
    EXPECT_EQ(entries[1], (Entry{200, 3400, "label2"}));
    EXPECT_EQ(entries[2], (Entry{999'999, 999'999, "corner"}));
    EXPECT_EQ(entries[3], (Entry{500'000, 500'000, "center"}));
}

TEST(DataGeneratorTest, EdgeCases) {
    const auto entries = edge_case_entries(1001);
    ASSERT_EQ(entries.size(), 9u);
    EXPECT_EQ(entries.front(), (Entry{0, 0, "corner_bottom_left"}));
    EXPECT_EQ(entries[3], (Entry{1000, 1000, "corner_top_right"}));
    EXPECT_EQ(entries.back(), (Entry{500, 500, "center"}));
    expect_in_map(entries, 1001);
}

TEST(DataGeneratorTest, GridSpacing) {
    const auto entries = grid_entries(3, 100);   // step 25
    ASSERT_EQ(entries.size(), 9u);
    EXPECT_EQ(entries.front(), (Entry{25, 25, "grid_1_1"}));
    EXPECT_EQ(entries[1], (Entry{25, 50, "grid_1_2"}));
    EXPECT_EQ(entries.back(), (Entry{75, 75, "grid_3_3"}));
}

TEST(DataGeneratorTest, EmptyGrid) {
    EXPECT_TRUE(grid_entries(0).empty());
}

// ── Seeded generators ─────────────────────────────────────────────────────────

TEST(DataGeneratorTest, RandomIsReproduciblePerSeed) {
    EXPECT_EQ(random_entries(100, 5000, 1), random_entries(100, 5000, 1));
    EXPECT_NE(random_entries(100, 5000, 1), random_entries(100, 5000, 2));
}

TEST(DataGeneratorTest, RandomLabelsAndBounds) {
    const auto entries = random_entries(500, 50, 3);
    ASSERT_EQ(entries.size(), 500u);
    EXPECT_EQ(entries[0].label, "random_label_0");
    EXPECT_EQ(entries[499].label, "random_label_499");
    expect_in_map(entries, 50);
}

TEST(DataGeneratorTest, ClusteredStaysNearCenterAndInMap) {
    const auto entries = clustered_entries(1000, 500, 500, 100, 11, 1000);
    ASSERT_EQ(entries.size(), 1000u);
    for (const auto& e : entries) {
        const double d = std::hypot(e.x - 500.0, e.y - 500.0);
        EXPECT_LE(d, 100.0 + 2.0);
    }
    EXPECT_EQ(entries[7].label, "cluster_7");

    // A cluster hanging off the corner is clamped into the map.
    expect_in_map(clustered_entries(1000, 0, 0, 300, 11, 1000), 1000);
}

TEST(DataGeneratorTest, MixedComposition) {
    const auto entries = mixed_entries(100, 5);
    ASSERT_EQ(entries.size(), 100u);
    EXPECT_EQ(entries[0].label, "corner_bottom_left");
    EXPECT_EQ(entries[9].label, "grid_1_1");
    EXPECT_EQ(entries[25].label, "random_label_0");
}

TEST(DataGeneratorTest, MixedSmallerThanFixedPartKeepsFixedPart) {
    EXPECT_EQ(mixed_entries(10, 5).size(), 25u);
}

// ── Patterns ──────────────────────────────────────────────────────────────────

TEST(DataGeneratorTest, PatternNames) {
    for (auto pattern : {Pattern::Random, Pattern::Grid, Pattern::Clustered, Pattern::Mixed}) {
        EXPECT_EQ(parse_pattern(to_string(pattern)), pattern);
    }
    EXPECT_FALSE(parse_pattern("spiral").has_value());
}

TEST(DataGeneratorTest, GenerateSizes) {
    EXPECT_EQ(generate(Pattern::Random, 300, 1).size(), 300u);
    EXPECT_EQ(generate(Pattern::Grid, 300, 1).size(), 17u * 17u);
    EXPECT_EQ(generate(Pattern::Clustered, 300, 1).size(), 300u);
    EXPECT_EQ(generate(Pattern::Mixed, 300, 1).size(), 300u);
    expect_in_map(generate(Pattern::Clustered, 300, 1, 64), 64);
}

} // namespace labelmap::testdata
