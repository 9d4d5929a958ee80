#pragma once

#include "storage/dynamic_tiled_storage.hpp"
#include "storage/map_storage.hpp"
#include "storage/tiled_storage.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace labelmap {

// ── StorageKind ───────────────────────────────────────────────────────────────

enum class StorageKind : uint8_t {
    HashMap      = 0,
    StringKey    = 1,
    Bst          = 2,
    SortedArray  = 3,
    OrderedMap   = 4,
    Tiled        = 5,
    DynamicTiled = 6,
};

inline constexpr std::array<StorageKind, 7> kAllStorageKinds{
    StorageKind::HashMap,
    StorageKind::StringKey,
    StorageKind::Bst,
    StorageKind::SortedArray,
    StorageKind::OrderedMap,
    StorageKind::Tiled,
    StorageKind::DynamicTiled,
};

[[nodiscard]] constexpr const std::array<StorageKind, 7>& all_storage_kinds() noexcept {
    return kAllStorageKinds;
}

// Engine name as returned by MapStorage::name() ("hashmap", "bst", ...).
[[nodiscard]] std::string_view to_string(StorageKind kind) noexcept;

// Inverse of to_string().  Case-sensitive; std::nullopt on unknown names.
[[nodiscard]] std::optional<StorageKind> parse_storage_kind(std::string_view name) noexcept;

// ── StorageOptions ────────────────────────────────────────────────────────────
// Construction parameters.  Engines ignore the fields that don't apply to them.

struct StorageOptions {
    int         max_coordinate = kDefaultMaxCoordinate;
    int         tile_shift     = TiledStorage::kDefaultTileShift;
    std::size_t tile_capacity  = DynamicTiledStorage::kDefaultTileCapacity;

    // Passed to engines that log (DynamicTiledStorage).  May be null.
    std::shared_ptr<spdlog::logger> logger;
};

// Builds an empty engine of the requested kind.
// Throws std::invalid_argument on invalid options.
[[nodiscard]] std::unique_ptr<MapStorage> make_storage(
    StorageKind kind, const StorageOptions& options = {});

// ── StorageFactory ────────────────────────────────────────────────────────────
// A (kind, options) pair that can stamp out fresh instances.  Tools and tests
// hold one per engine under test.

class StorageFactory {
public:
    explicit StorageFactory(StorageKind kind, StorageOptions options = {})
        : kind_(kind), options_(std::move(options)) {}

    [[nodiscard]] StorageKind kind() const noexcept { return kind_; }
    [[nodiscard]] std::string_view name() const noexcept { return to_string(kind_); }
    [[nodiscard]] const StorageOptions& options() const noexcept { return options_; }

    [[nodiscard]] std::unique_ptr<MapStorage> create() const {
        return make_storage(kind_, options_);
    }

private:
    StorageKind    kind_;
    StorageOptions options_;
};

} // namespace labelmap
