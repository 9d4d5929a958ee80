#include "testdata/data_generator.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <random>

#include <fmt/format.h>

namespace labelmap::testdata {

std::vector<Entry> basic_entries() {
    return {
        {1, 1, "label1"},
        {200, 3400, "label2"},
        {999'999, 999'999, "corner"},
        {500'000, 500'000, "center"},
    };
}

std::vector<Entry> random_entries(std::size_t count, int max_coordinate, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> coord(0, max_coordinate - 1);

    std::vector<Entry> result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const int x = coord(rng);
        const int y = coord(rng);
        result.push_back({x, y, fmt::format("random_label_{}", i)});
    }
    return result;
}

std::vector<Entry> grid_entries(int grid_size, int max_coordinate) {
    std::vector<Entry> result;
    if (grid_size <= 0) {
        return result;
    }

    const int step = max_coordinate / (grid_size + 1);
    result.reserve(static_cast<std::size_t>(grid_size) * grid_size);
    for (int i = 1; i <= grid_size; ++i) {
        for (int j = 1; j <= grid_size; ++j) {
            result.push_back({i * step, j * step, fmt::format("grid_{}_{}", i, j)});
        }
    }
    return result;
}

std::vector<Entry> edge_case_entries(int max_coordinate) {
    const int max = max_coordinate - 1;
    const int mid = max / 2;
    return {
        {0,   0,   "corner_bottom_left"},
        {max, 0,   "corner_bottom_right"},
        {0,   max, "corner_top_left"},
        {max, max, "corner_top_right"},
        {mid, 0,   "edge_bottom"},
        {mid, max, "edge_top"},
        {0,   mid, "edge_left"},
        {max, mid, "edge_right"},
        {mid, mid, "center"},
    };
}

std::vector<Entry> clustered_entries(std::size_t count, int center_x, int center_y,
                                     int radius, uint32_t seed, int max_coordinate)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    std::vector<Entry> result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const double angle    = unit(rng) * 2.0 * std::numbers::pi;
        const double distance = unit(rng) * radius;

        const auto x = static_cast<std::int64_t>(center_x) + static_cast<int>(std::cos(angle) * distance);
        const auto y = static_cast<std::int64_t>(center_y) + static_cast<int>(std::sin(angle) * distance);

        result.push_back({
            static_cast<int>(std::clamp<std::int64_t>(x, 0, max_coordinate - 1)),
            static_cast<int>(std::clamp<std::int64_t>(y, 0, max_coordinate - 1)),
            fmt::format("cluster_{}", i),
        });
    }
    return result;
}

std::vector<Entry> mixed_entries(std::size_t total, uint32_t seed, int max_coordinate) {
    std::vector<Entry> result = edge_case_entries(max_coordinate);

    auto grid = grid_entries(4, max_coordinate);
    result.insert(result.end(), grid.begin(), grid.end());

    if (total > result.size()) {
        auto random = random_entries(total - result.size(), max_coordinate, seed);
        result.insert(result.end(), random.begin(), random.end());
    }
    return result;
}

// ── Named patterns ────────────────────────────────────────────────────────────

std::optional<Pattern> parse_pattern(std::string_view name) noexcept {
    if (name == "random")    return Pattern::Random;
    if (name == "grid")      return Pattern::Grid;
    if (name == "clustered") return Pattern::Clustered;
    if (name == "mixed")     return Pattern::Mixed;
    return std::nullopt;
}

std::string_view to_string(Pattern pattern) noexcept {
    switch (pattern) {
        case Pattern::Random:    return "random";
        case Pattern::Grid:      return "grid";
        case Pattern::Clustered: return "clustered";
        case Pattern::Mixed:     return "mixed";
    }
    return "unknown";
}

std::vector<Entry> generate(Pattern pattern, std::size_t count, uint32_t seed,
                            int max_coordinate)
{
    switch (pattern) {
        case Pattern::Random:
            return random_entries(count, max_coordinate, seed);
        case Pattern::Grid: {
            const auto side = static_cast<int>(std::sqrt(static_cast<double>(count)));
            return grid_entries(side, max_coordinate);
        }
        case Pattern::Clustered:
            return clustered_entries(count, max_coordinate / 2, max_coordinate / 2,
                                     std::max(1, max_coordinate / 10), seed, max_coordinate);
        case Pattern::Mixed:
            return mixed_entries(count, seed, max_coordinate);
    }
    return {};
}

} // namespace labelmap::testdata
