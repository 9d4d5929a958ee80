#include "storage/storage_factory.hpp"

#include "storage/bst_storage.hpp"
#include "storage/dynamic_tiled_storage.hpp"
#include "storage/hash_map_storage.hpp"
#include "storage/ordered_map_storage.hpp"
#include "storage/sorted_array_storage.hpp"
#include "storage/string_key_storage.hpp"
#include "storage/tiled_storage.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace labelmap {

std::string_view to_string(StorageKind kind) noexcept {
    switch (kind) {
        case StorageKind::HashMap:      return "hashmap";
        case StorageKind::StringKey:    return "stringkey";
        case StorageKind::Bst:          return "bst";
        case StorageKind::SortedArray:  return "sortedarray";
        case StorageKind::OrderedMap:   return "orderedmap";
        case StorageKind::Tiled:        return "tiled";
        case StorageKind::DynamicTiled: return "dynamictiled";
    }
    return "unknown";
}

std::optional<StorageKind> parse_storage_kind(std::string_view name) noexcept {
    for (StorageKind kind : kAllStorageKinds) {
        if (to_string(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

std::unique_ptr<MapStorage> make_storage(StorageKind kind, const StorageOptions& options) {
    std::unique_ptr<MapStorage> storage;
    switch (kind) {
        case StorageKind::HashMap:
            storage = std::make_unique<HashMapStorage>(options.max_coordinate);
            break;
        case StorageKind::StringKey:
            storage = std::make_unique<StringKeyStorage>(options.max_coordinate);
            break;
        case StorageKind::Bst:
            storage = std::make_unique<BstStorage>(options.max_coordinate);
            break;
        case StorageKind::SortedArray:
            storage = std::make_unique<SortedArrayStorage>(options.max_coordinate);
            break;
        case StorageKind::OrderedMap:
            storage = std::make_unique<OrderedMapStorage>(options.max_coordinate);
            break;
        case StorageKind::Tiled:
            storage = std::make_unique<TiledStorage>(options.max_coordinate, options.tile_shift);
            break;
        case StorageKind::DynamicTiled:
            storage = std::make_unique<DynamicTiledStorage>(
                options.max_coordinate, options.tile_capacity, options.logger);
            break;
    }
    if (!storage) {
        throw std::invalid_argument(
            fmt::format("unknown storage kind {}", static_cast<int>(kind)));
    }

    if (options.logger) {
        options.logger->debug("created {} storage (max_coordinate={})",
                              storage->name(), storage->max_coordinate());
    }
    return storage;
}

} // namespace labelmap
