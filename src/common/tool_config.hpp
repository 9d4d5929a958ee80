#pragma once

#include "storage/storage_factory.hpp"
#include "testdata/data_generator.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace labelmap {

// ── BenchConfig ───────────────────────────────────────────────────────────────
// Configuration for labelmap-bench.  Populated by parse_bench_config().

struct BenchConfig {
    std::vector<StorageKind> engines;   // Engines to run, in command-line order
    std::size_t       count;            // Entries inserted per engine
    uint32_t          seed;             // Data generator seed
    testdata::Pattern pattern;          // Data distribution
    std::size_t       queries;          // Queries per spatial query kind
    StorageOptions    storage;          // Engine construction parameters
    std::string       log_level;        // spdlog level string
};

// ── CliConfig ─────────────────────────────────────────────────────────────────
// Configuration for labelmap-cli.  Populated by parse_cli_config().

enum class Preload : uint8_t {
    None  = 0,
    Basic = 1,   // testdata::basic_entries()
    Edge  = 2,   // testdata::edge_case_entries()
    Mixed = 3,   // testdata::mixed_entries(kMixedPreloadCount)
};

inline constexpr std::size_t kMixedPreloadCount = 1000;

struct CliConfig {
    StorageKind    engine;
    StorageOptions storage;
    Preload        preload;
    uint32_t       seed;
    std::string    log_level;
};

// ── parse_bench_config / parse_cli_config ─────────────────────────────────────
// Parse CLI arguments into a validated config.
//
// On success: returns a fully validated config.
// On error  : throws std::runtime_error with a human-readable message.
//             For --help the message is the options description.
//
// Validates:
//   - engine / pattern / preload / log-level names
//   - max-coordinate > 0, tile-shift in [0, 30], tile-capacity >= 1
//   - count and queries > 0 (bench)
//   - --preload basic requires max-coordinate >= 1000000 (cli)
//
// Engines format: --engines all | name[,name,...]
//   Example: --engines hashmap,bst,tiled

[[nodiscard]] BenchConfig parse_bench_config(int argc, char* argv[]);
[[nodiscard]] CliConfig   parse_cli_config(int argc, char* argv[]);

// ── add_*_options ─────────────────────────────────────────────────────────────
// Populate an options_description.  Exposed for testing and help-text
// generation.

// --max-coordinate, --tile-shift, --tile-capacity, --log-level
void add_storage_options(boost::program_options::options_description& desc);
void add_bench_options(boost::program_options::options_description& desc);
void add_cli_options(boost::program_options::options_description& desc);

// Splits a comma-separated engine list ("all" expands to every engine).
// Throws std::runtime_error on an unknown or empty name.
[[nodiscard]] std::vector<StorageKind> parse_engine_list(const std::string& list);

} // namespace labelmap
