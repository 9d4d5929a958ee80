#include "cli/session.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

namespace labelmap::cli {

namespace {

EntriesResp sorted(std::vector<Entry> entries) {
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return std::tie(a.x, a.y) < std::tie(b.x, b.y);
    });
    return EntriesResp{std::move(entries)};
}

} // namespace

Session::Session(MapStorage& storage, std::shared_ptr<spdlog::logger> logger)
    : storage_(storage)
    , logger_(std::move(logger))
{
}

Response Session::dispatch(const Command& cmd) {
    try {
        return std::visit(
            [this](const auto& c) -> Response {
                using T = std::decay_t<decltype(c)>;

                if constexpr (std::is_same_v<T, AddCmd>) {
                    if (storage_.add(Entry{c.x, c.y, c.label})) {
                        return CreatedResp{};
                    }
                    return UpdatedResp{};
                } else if constexpr (std::is_same_v<T, GetCmd>) {
                    auto entry = storage_.get(c.x, c.y);
                    if (!entry) {
                        return NotFoundResp{};
                    }
                    return EntryResp{std::move(*entry)};
                } else if constexpr (std::is_same_v<T, HasCmd>) {
                    return BoolResp{storage_.contains(c.x, c.y)};
                } else if constexpr (std::is_same_v<T, DelCmd>) {
                    if (!storage_.remove(c.x, c.y)) {
                        return NotFoundResp{};
                    }
                    return DeletedResp{};
                } else if constexpr (std::is_same_v<T, ListCmd>) {
                    return sorted(storage_.list_all());
                } else if constexpr (std::is_same_v<T, RegionCmd>) {
                    return sorted(storage_.get_in_region(c.min_x, c.min_y, c.max_x, c.max_y));
                } else if constexpr (std::is_same_v<T, RadiusCmd>) {
                    return sorted(storage_.get_within_radius(c.radius));
                } else if constexpr (std::is_same_v<T, CenterRadiusCmd>) {
                    return sorted(storage_.get_within_radius(c.center_x, c.center_y, c.radius));
                } else if constexpr (std::is_same_v<T, CountCmd>) {
                    return CountResp{storage_.size()};
                } else if constexpr (std::is_same_v<T, ClearCmd>) {
                    storage_.clear();
                    return OkResp{};
                }
            },
            cmd);
    } catch (const std::out_of_range& e) {
        if (logger_) {
            logger_->debug("rejected command: {}", e.what());
        }
        return ErrorResp{e.what()};
    } catch (const std::invalid_argument& e) {
        if (logger_) {
            logger_->debug("rejected command: {}", e.what());
        }
        return ErrorResp{e.what()};
    }
}

std::string Session::handle_line(std::string_view line) {
    auto parse_result = parse_command(line);
    if (auto* err = std::get_if<ErrorResp>(&parse_result)) {
        return serialize_response(std::move(*err));
    }
    return serialize_response(dispatch(std::get<Command>(parse_result)));
}

} // namespace labelmap::cli
