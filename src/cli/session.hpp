#pragma once

#include "cli/command.hpp"
#include "storage/map_storage.hpp"

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace labelmap::cli {

// Executes labelmap-cli commands against one storage instance.
//
// Contract errors raised by the storage (std::out_of_range,
// std::invalid_argument) become ErrorResp; the storage is left unchanged
// because engines validate before mutating.
//
// Entry lists are returned sorted by (x, y) so that output does not depend on
// the engine's internal order.
class Session {
public:
    explicit Session(MapStorage& storage, std::shared_ptr<spdlog::logger> logger = {});

    // Execute a parsed Command and return the appropriate Response.
    [[nodiscard]] Response dispatch(const Command& cmd);

    // Parse + dispatch + serialize one input line.
    [[nodiscard]] std::string handle_line(std::string_view line);

    [[nodiscard]] const MapStorage& storage() const noexcept { return storage_; }

private:
    MapStorage&                     storage_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace labelmap::cli
