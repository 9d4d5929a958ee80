#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace labelmap {

// ── Entry ─────────────────────────────────────────────────────────────────────
//
// A label placed at integer map coordinates.  Two entries describe the same
// logical record iff their (x, y) match; the label is the payload.

struct Entry {
    int         x = 0;
    int         y = 0;
    std::string label;

    friend bool operator==(const Entry&, const Entry&) = default;
};

// ── Coord ─────────────────────────────────────────────────────────────────────
// Composite (x, y) key for hash maps.  Also used for tile coordinates.

struct Coord {
    int x = 0;
    int y = 0;

    friend bool operator==(const Coord&, const Coord&) = default;
};

struct CoordHash {
    std::size_t operator()(const Coord& c) const noexcept {
        // 64-bit finalizer over both 32-bit halves (murmur3 fmix64).
        std::uint64_t k = (static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.x)) << 32)
                        ^ static_cast<std::uint32_t>(c.y);
        k ^= (k >> 33);
        k *= 0xff51afd7ed558ccdULL;
        k ^= (k >> 33);
        k *= 0xc4ceb9fe1a85ec53ULL;
        k ^= (k >> 33);
        return static_cast<std::size_t>(k);
    }
};

// ── Spatial key ───────────────────────────────────────────────────────────────
//
// x² + y², the squared distance from the origin.  Not injective: (3,4), (4,3)
// and (5,0) all map to 25, so key-ordered engines keep a collision list per key.

[[nodiscard]] constexpr std::int64_t spatial_key(int x, int y) noexcept {
    return static_cast<std::int64_t>(x) * x + static_cast<std::int64_t>(y) * y;
}

// Squared distance between (x, y) and (cx, cy) in 64-bit arithmetic.
[[nodiscard]] constexpr std::int64_t squared_distance(int x, int y, int cx, int cy) noexcept {
    const std::int64_t dx = static_cast<std::int64_t>(x) - cx;
    const std::int64_t dy = static_cast<std::int64_t>(y) - cy;
    return dx * dx + dy * dy;
}

} // namespace labelmap
