#include "storage/map_storage.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace labelmap {

MapStorage::MapStorage(int max_coordinate)
    : max_coordinate_(max_coordinate)
{
    if (max_coordinate <= 0) {
        throw std::invalid_argument(
            fmt::format("max_coordinate must be > 0, got {}", max_coordinate));
    }
}

bool MapStorage::try_get(int x, int y, Entry& out) const {
    if (!in_bounds(x, y)) {
        return false;
    }
    auto found = get(x, y);
    if (!found) {
        return false;
    }
    out = std::move(*found);
    return true;
}

void MapStorage::validate_coordinates(int x, int y) const {
    if (x < 0 || x >= max_coordinate_) {
        throw std::out_of_range(
            fmt::format("x must be in [0, {}], got {}", max_coordinate_ - 1, x));
    }
    if (y < 0 || y >= max_coordinate_) {
        throw std::out_of_range(
            fmt::format("y must be in [0, {}], got {}", max_coordinate_ - 1, y));
    }
}

void MapStorage::validate_region(int min_x, int min_y, int max_x, int max_y) const {
    validate_coordinates(min_x, min_y);
    validate_coordinates(max_x, max_y);

    if (min_x > max_x) {
        throw std::invalid_argument(
            fmt::format("invalid region: min_x {} > max_x {}", min_x, max_x));
    }
    if (min_y > max_y) {
        throw std::invalid_argument(
            fmt::format("invalid region: min_y {} > max_y {}", min_y, max_y));
    }
}

void MapStorage::validate_radius(int radius) {
    if (radius < 0) {
        throw std::invalid_argument(
            fmt::format("radius must be non-negative, got {}", radius));
    }
}

} // namespace labelmap
