#include "common/tool_config.hpp"

#include "common/logger.hpp"
#include "storage/tiled_storage.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace labelmap {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Store and notify `argv` against `desc`.  --help is reported before notify()
// so that option errors don't hide it.
[[nodiscard]] po::variables_map parse_args(const po::options_description& desc,
                                           int argc, char* argv[]) {
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }
    return vm;
}

[[nodiscard]] StorageOptions read_storage_options(const po::variables_map& vm) {
    const int max_coordinate = vm["max-coordinate"].as<int>();
    const int tile_shift     = vm["tile-shift"].as<int>();
    const int tile_capacity  = vm["tile-capacity"].as<int>();

    if (max_coordinate <= 0) {
        throw std::runtime_error(
            fmt::format("--max-coordinate must be > 0, got {}", max_coordinate));
    }
    if (tile_shift < 0 || tile_shift > TiledStorage::kMaxTileShift) {
        throw std::runtime_error(
            fmt::format("--tile-shift must be in [0, {}], got {}",
                        TiledStorage::kMaxTileShift, tile_shift));
    }
    if (tile_capacity < 1) {
        throw std::runtime_error(
            fmt::format("--tile-capacity must be >= 1, got {}", tile_capacity));
    }

    StorageOptions options;
    options.max_coordinate = max_coordinate;
    options.tile_shift     = tile_shift;
    options.tile_capacity  = static_cast<std::size_t>(tile_capacity);
    return options;
}

[[nodiscard]] std::string read_log_level(const po::variables_map& vm) {
    auto level = vm["log-level"].as<std::string>();
    if (!is_log_level(level)) {
        throw std::runtime_error(
            fmt::format("--log-level must be one of trace|debug|info|warn|error|critical|off, "
                        "got '{}'", level));
    }
    return level;
}

[[nodiscard]] uint32_t read_seed(const po::variables_map& vm) {
    const long long seed = vm["seed"].as<long long>();
    if (seed < 0 || seed > 0xFFFFFFFFLL) {
        throw std::runtime_error(
            fmt::format("--seed must be in [0, 4294967295], got {}", seed));
    }
    return static_cast<uint32_t>(seed);
}

[[nodiscard]] std::size_t read_positive(const po::variables_map& vm, const char* name) {
    const long long value = vm[name].as<long long>();
    if (value <= 0) {
        throw std::runtime_error(fmt::format("--{} must be > 0, got {}", name, value));
    }
    return static_cast<std::size_t>(value);
}

[[nodiscard]] Preload parse_preload(const std::string& s) {
    if (s == "none")  return Preload::None;
    if (s == "basic") return Preload::Basic;
    if (s == "edge")  return Preload::Edge;
    if (s == "mixed") return Preload::Mixed;
    throw std::runtime_error(
        fmt::format("--preload must be none|basic|edge|mixed, got '{}'", s));
}

} // anonymous namespace

// ── parse_engine_list ─────────────────────────────────────────────────────────

std::vector<StorageKind> parse_engine_list(const std::string& list) {
    if (list == "all") {
        return {kAllStorageKinds.begin(), kAllStorageKinds.end()};
    }

    std::vector<StorageKind> result;
    std::string_view remaining{list};
    while (true) {
        auto comma_pos = remaining.find(',');
        std::string_view name = (comma_pos == std::string_view::npos)
            ? remaining
            : remaining.substr(0, comma_pos);

        if (name.empty()) {
            throw std::runtime_error(
                fmt::format("Empty engine name in --engines '{}'", list));
        }
        auto kind = parse_storage_kind(name);
        if (!kind) {
            throw std::runtime_error(fmt::format("Unknown engine '{}'", name));
        }
        result.push_back(*kind);

        if (comma_pos == std::string_view::npos) {
            break;
        }
        remaining = remaining.substr(comma_pos + 1);
    }
    return result;
}

// ── add_*_options ─────────────────────────────────────────────────────────────

void add_storage_options(po::options_description& desc) {
    desc.add_options()
        ("max-coordinate",
            po::value<int>()->default_value(kDefaultMaxCoordinate),
            "Map side length; valid coordinates are [0, max-coordinate)")
        ("tile-shift",
            po::value<int>()->default_value(TiledStorage::kDefaultTileShift),
            "Fixed-grid tile side as a power of two (tiled engine)")
        ("tile-capacity",
            po::value<int>()->default_value(64),
            "Entries per tile before a split (dynamictiled engine)")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical|off");
}

void add_bench_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("engines",
            po::value<std::string>()->default_value("all"),
            "Engines to benchmark: all | name[,name,...]")
        ("count",
            po::value<long long>()->default_value(10'000),
            "Entries inserted per engine")
        ("seed",
            po::value<long long>()->default_value(42),
            "Data generator seed")
        ("pattern",
            po::value<std::string>()->default_value("random"),
            "Data pattern: random|grid|clustered|mixed")
        ("queries",
            po::value<long long>()->default_value(100),
            "Queries per spatial query kind");
    add_storage_options(desc);
}

void add_cli_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("engine",
            po::value<std::string>()->default_value("hashmap"),
            "Storage engine: hashmap|stringkey|bst|sortedarray|orderedmap|tiled|dynamictiled")
        ("preload",
            po::value<std::string>()->default_value("none"),
            "Entries loaded at startup: none|basic|edge|mixed")
        ("seed",
            po::value<long long>()->default_value(42),
            "Seed for --preload mixed");
    add_storage_options(desc);
}

// ── parse_bench_config ────────────────────────────────────────────────────────

BenchConfig parse_bench_config(int argc, char* argv[]) {
    po::options_description desc("labelmap-bench options");
    add_bench_options(desc);
    const auto vm = parse_args(desc, argc, argv);

    BenchConfig cfg;
    cfg.engines   = parse_engine_list(vm["engines"].as<std::string>());
    cfg.count     = read_positive(vm, "count");
    cfg.queries   = read_positive(vm, "queries");
    cfg.seed      = read_seed(vm);
    cfg.storage   = read_storage_options(vm);
    cfg.log_level = read_log_level(vm);

    const auto pattern = vm["pattern"].as<std::string>();
    auto parsed = testdata::parse_pattern(pattern);
    if (!parsed) {
        throw std::runtime_error(
            fmt::format("--pattern must be random|grid|clustered|mixed, got '{}'", pattern));
    }
    cfg.pattern = *parsed;

    return cfg;
}

// ── parse_cli_config ──────────────────────────────────────────────────────────

CliConfig parse_cli_config(int argc, char* argv[]) {
    po::options_description desc("labelmap-cli options");
    add_cli_options(desc);
    const auto vm = parse_args(desc, argc, argv);

    CliConfig cfg;
    const auto engine = vm["engine"].as<std::string>();
    auto kind = parse_storage_kind(engine);
    if (!kind) {
        throw std::runtime_error(fmt::format("Unknown engine '{}'", engine));
    }
    cfg.engine    = *kind;
    cfg.storage   = read_storage_options(vm);
    cfg.preload   = parse_preload(vm["preload"].as<std::string>());
    cfg.seed      = read_seed(vm);
    cfg.log_level = read_log_level(vm);

    if (cfg.preload == Preload::Basic && cfg.storage.max_coordinate < kDefaultMaxCoordinate) {
        throw std::runtime_error(
            fmt::format("--preload basic requires --max-coordinate >= {}, got {}",
                        kDefaultMaxCoordinate, cfg.storage.max_coordinate));
    }
    return cfg;
}

} // namespace labelmap
