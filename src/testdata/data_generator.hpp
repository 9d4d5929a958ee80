#pragma once

#include "storage/entry.hpp"
#include "storage/map_storage.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace labelmap::testdata {

// ── Entry generators ──────────────────────────────────────────────────────────
//
// Deterministic data sets for tests, the benchmark and the CLI --preload flag.
// All seeded generators use std::mt19937: the same seed yields the same
// entries.  Generated coordinates always lie in [0, max_coordinate).
// Random generators may produce duplicate coordinates; callers that need an
// exact distinct count must de-duplicate.

// (1,1,"label1"), (200,3400,"label2"), (999999,999999,"corner"),
// (500000,500000,"center").  Requires max_coordinate >= 1'000'000.
[[nodiscard]] std::vector<Entry> basic_entries();

// `count` uniform points, labelled random_label_<i>.
[[nodiscard]] std::vector<Entry> random_entries(
    std::size_t count, int max_coordinate = kDefaultMaxCoordinate, uint32_t seed = 42);

// grid_size² points at multiples of max_coordinate / (grid_size + 1),
// labelled grid_<i>_<j> with i, j starting at 1.
[[nodiscard]] std::vector<Entry> grid_entries(
    int grid_size, int max_coordinate = kDefaultMaxCoordinate);

// Four corners, four edge midpoints and the center (9 entries).
[[nodiscard]] std::vector<Entry> edge_case_entries(int max_coordinate = kDefaultMaxCoordinate);

// `count` points sampled in polar coordinates around (center_x, center_y)
// within `radius`, clamped into the map.  Labelled cluster_<i>.
[[nodiscard]] std::vector<Entry> clustered_entries(
    std::size_t count, int center_x, int center_y, int radius,
    uint32_t seed = 42, int max_coordinate = kDefaultMaxCoordinate);

// Edge cases + a 4×4 grid, topped up with random entries to `total`.
[[nodiscard]] std::vector<Entry> mixed_entries(
    std::size_t total, uint32_t seed = 42, int max_coordinate = kDefaultMaxCoordinate);

// ── Named patterns (for tools) ────────────────────────────────────────────────

enum class Pattern : uint8_t {
    Random    = 0,
    Grid      = 1,
    Clustered = 2,
    Mixed     = 3,
};

// "random" | "grid" | "clustered" | "mixed", else std::nullopt.
[[nodiscard]] std::optional<Pattern> parse_pattern(std::string_view name) noexcept;

[[nodiscard]] std::string_view to_string(Pattern pattern) noexcept;

// About `count` entries following `pattern`.  Grid uses the largest square
// not above `count`; clustered centers on the map with radius max/10.
[[nodiscard]] std::vector<Entry> generate(
    Pattern pattern, std::size_t count, uint32_t seed,
    int max_coordinate = kDefaultMaxCoordinate);

} // namespace labelmap::testdata
