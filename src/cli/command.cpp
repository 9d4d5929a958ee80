#include "cli/command.hpp"

#include <array>
#include <charconv>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace labelmap::cli {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

std::string_view skip_spaces(std::string_view s) {
    const auto pos = s.find_first_not_of(' ');
    return pos == std::string_view::npos ? std::string_view{} : s.substr(pos);
}

// Split `line` on the first run of spaces, returning {head, rest}.
// If there is no space, rest is empty.
std::pair<std::string_view, std::string_view> split_once(std::string_view line) {
    line = skip_spaces(line);
    const auto pos = line.find(' ');
    if (pos == std::string_view::npos) {
        return {line, {}};
    }
    return {line.substr(0, pos), skip_spaces(line.substr(pos + 1))};
}

std::optional<int> parse_int(std::string_view token) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return value;
}

// Parse exactly N integer arguments from `rest`.  On failure `error` is set.
template <std::size_t N>
std::optional<std::array<int, N>> parse_ints(std::string_view verb, std::string_view rest,
                                             std::string& error) {
    std::array<int, N> values{};
    for (std::size_t i = 0; i < N; ++i) {
        auto [token, tail] = split_once(rest);
        if (token.empty()) {
            error = fmt::format("{} takes {} integer argument{}", verb, N, N == 1 ? "" : "s");
            return std::nullopt;
        }
        auto value = parse_int(token);
        if (!value) {
            error = fmt::format("{}: invalid integer '{}'", verb, token);
            return std::nullopt;
        }
        values[i] = *value;
        rest = tail;
    }
    if (!skip_spaces(rest).empty()) {
        error = fmt::format("{} takes exactly {} argument{}", verb, N, N == 1 ? "" : "s");
        return std::nullopt;
    }
    return values;
}

std::size_t count_tokens(std::string_view rest) {
    std::size_t n = 0;
    while (true) {
        auto [token, tail] = split_once(rest);
        if (token.empty()) {
            return n;
        }
        ++n;
        rest = tail;
    }
}

} // namespace

// ── parse_command ─────────────────────────────────────────────────────────────

std::variant<Command, ErrorResp> parse_command(std::string_view line) {
    // Strip trailing '\r' so the parser is CRLF-tolerant.
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    auto [verb, rest] = split_once(line);
    if (verb.empty()) {
        return ErrorResp{"empty command"};
    }

    std::string error;

    // ── Argument-less commands ────────────────────────────────────────────────
    if (verb == "LIST" || verb == "COUNT" || verb == "CLEAR") {
        if (!rest.empty()) {
            return ErrorResp{fmt::format("{} takes no arguments", verb)};
        }
        if (verb == "LIST") {
            return ListCmd{};
        }
        if (verb == "COUNT") {
            return CountCmd{};
        }
        return ClearCmd{};
    }

    // ── ADD x y label ─────────────────────────────────────────────────────────
    //
    // The label is everything after "ADD <x> <y> "; it may contain spaces.
    // "ADD <x> <y> " with nothing after the separator stores an empty label.
    if (verb == "ADD") {
        auto [x_tok, after_x] = split_once(rest);
        auto [y_tok, label]   = split_once(after_x);
        const bool has_label  = !label.empty() || skip_spaces(after_x).size() > y_tok.size();
        if (x_tok.empty() || y_tok.empty() || !has_label) {
            return ErrorResp{"ADD requires x y label"};
        }
        auto x = parse_int(x_tok);
        auto y = parse_int(y_tok);
        if (!x || !y) {
            return ErrorResp{fmt::format("ADD: invalid integer '{}'", x ? y_tok : x_tok)};
        }
        return AddCmd{*x, *y, std::string(label)};
    }

    // ── GET / HAS / DEL x y ───────────────────────────────────────────────────
    if (verb == "GET" || verb == "HAS" || verb == "DEL") {
        auto args = parse_ints<2>(verb, rest, error);
        if (!args) {
            return ErrorResp{std::move(error)};
        }
        const auto [x, y] = *args;
        if (verb == "GET") {
            return GetCmd{x, y};
        }
        if (verb == "HAS") {
            return HasCmd{x, y};
        }
        return DelCmd{x, y};
    }

    // ── REGION min_x min_y max_x max_y ────────────────────────────────────────
    if (verb == "REGION") {
        auto args = parse_ints<4>(verb, rest, error);
        if (!args) {
            return ErrorResp{std::move(error)};
        }
        return RegionCmd{(*args)[0], (*args)[1], (*args)[2], (*args)[3]};
    }

    // ── RADIUS r | RADIUS cx cy r ─────────────────────────────────────────────
    if (verb == "RADIUS") {
        const std::size_t n = count_tokens(rest);
        if (n == 1) {
            auto args = parse_ints<1>(verb, rest, error);
            if (!args) {
                return ErrorResp{std::move(error)};
            }
            return RadiusCmd{(*args)[0]};
        }
        if (n == 3) {
            auto args = parse_ints<3>(verb, rest, error);
            if (!args) {
                return ErrorResp{std::move(error)};
            }
            return CenterRadiusCmd{(*args)[0], (*args)[1], (*args)[2]};
        }
        return ErrorResp{"RADIUS takes r or cx cy r"};
    }

    return ErrorResp{"unknown command: " + std::string(verb)};
}

// ── serialize_response ────────────────────────────────────────────────────────

std::string serialize_response(const Response& response) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, OkResp>) {
                return "OK\n";
            } else if constexpr (std::is_same_v<T, CreatedResp>) {
                return "CREATED\n";
            } else if constexpr (std::is_same_v<T, UpdatedResp>) {
                return "UPDATED\n";
            } else if constexpr (std::is_same_v<T, NotFoundResp>) {
                return "NOT_FOUND\n";
            } else if constexpr (std::is_same_v<T, DeletedResp>) {
                return "DELETED\n";
            } else if constexpr (std::is_same_v<T, EntryResp>) {
                return fmt::format("ENTRY {} {} {}\n", r.entry.x, r.entry.y, r.entry.label);
            } else if constexpr (std::is_same_v<T, BoolResp>) {
                return r.value ? "TRUE\n" : "FALSE\n";
            } else if constexpr (std::is_same_v<T, EntriesResp>) {
                std::string out = fmt::format("ENTRIES {}\n", r.entries.size());
                for (const auto& e : r.entries) {
                    out += fmt::format("{} {} {}\n", e.x, e.y, e.label);
                }
                return out;
            } else if constexpr (std::is_same_v<T, CountResp>) {
                return fmt::format("COUNT {}\n", r.count);
            } else if constexpr (std::is_same_v<T, ErrorResp>) {
                return "ERROR " + r.message + "\n";
            }
        },
        response);
}

} // namespace labelmap::cli
