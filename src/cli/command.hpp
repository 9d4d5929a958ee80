#pragma once

#include "storage/entry.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace labelmap::cli {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of one labelmap-cli input line.  Each command type is
// a plain struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

struct AddCmd {
    int         x = 0;
    int         y = 0;
    std::string label;
};

struct GetCmd {
    int x = 0;
    int y = 0;
};

struct HasCmd {
    int x = 0;
    int y = 0;
};

struct DelCmd {
    int x = 0;
    int y = 0;
};

struct ListCmd {};

struct RegionCmd {
    int min_x = 0;
    int min_y = 0;
    int max_x = 0;
    int max_y = 0;
};

// RADIUS r: origin circle, strict.
struct RadiusCmd {
    int radius = 0;
};

// RADIUS cx cy r: circle around (cx, cy), inclusive.
struct CenterRadiusCmd {
    int center_x = 0;
    int center_y = 0;
    int radius   = 0;
};

struct CountCmd {};

struct ClearCmd {};

using Command = std::variant<AddCmd, GetCmd, HasCmd, DelCmd, ListCmd, RegionCmd,
                             RadiusCmd, CenterRadiusCmd, CountCmd, ClearCmd>;

// ── Responses ─────────────────────────────────────────────────────────────────

struct OkResp {};
struct CreatedResp {};
struct UpdatedResp {};
struct NotFoundResp {};
struct DeletedResp {};

struct EntryResp {
    Entry entry;
};

struct BoolResp {
    bool value = false;
};

struct EntriesResp {
    std::vector<Entry> entries;
};

struct CountResp {
    std::size_t count = 0;
};

struct ErrorResp {
    std::string message;
};

using Response = std::variant<OkResp, CreatedResp, UpdatedResp, NotFoundResp, DeletedResp,
                              EntryResp, BoolResp, EntriesResp, CountResp, ErrorResp>;

// ── Text protocol ─────────────────────────────────────────────────────────────

// Stateless helper: parse one line (without the trailing '\n') into a Command.
// Verbs are upper case.  Arguments are separated by one or more spaces; the
// ADD label is everything after the y coordinate and may contain spaces.
// A single trailing space after y ("ADD 1 2 ") gives an empty label.
// Coordinates are parsed as signed integers; range checks are left to the
// storage so that its error messages reach the user.
[[nodiscard]] std::variant<Command, ErrorResp> parse_command(std::string_view line);

// Serialize a Response into output text (always ends with '\n').
// EntriesResp becomes "ENTRIES n" followed by one "x y label" line per entry.
[[nodiscard]] std::string serialize_response(const Response& response);

} // namespace labelmap::cli
