// Engine benchmark: compares the MapStorage engines on the same data set.
//
// Generates one deterministic data set, then for each selected engine times
// add, get, list_all, region, origin-radius, center-radius and remove.
// Every query result count is cross-checked against a HashMapStorage run on
// the same inputs; any mismatch is logged and makes the tool exit with 1.
//
// Prints: total ops, elapsed time, ops/sec and latency percentiles (p50,
// p90, p99) for each operation of each engine.

#include "common/logger.hpp"
#include "common/tool_config.hpp"
#include "storage/hash_map_storage.hpp"
#include "storage/query_shape.hpp"
#include "storage/storage_factory.hpp"
#include "testdata/data_generator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

constexpr std::size_t kListAllRuns = 10;

// ── Query set ────────────────────────────────────────────────────────────────

struct Circle {
    int center_x;
    int center_y;
    int radius;
};

struct QuerySet {
    std::vector<labelmap::Rect> regions;
    std::vector<int>            origin_radii;
    std::vector<Circle>         circles;
};

QuerySet make_queries(std::size_t n, uint32_t seed, int max_coordinate) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> coord(0, max_coordinate - 1);
    const int span = std::max(1, max_coordinate / 20);
    std::uniform_int_distribution<int> extent(0, span);

    QuerySet q;
    q.regions.reserve(n);
    q.origin_radii.reserve(n);
    q.circles.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const int x0 = coord(rng);
        const int y0 = coord(rng);
        q.regions.push_back({x0, y0,
                             std::min(max_coordinate - 1, x0 + extent(rng)),
                             std::min(max_coordinate - 1, y0 + extent(rng))});
        q.origin_radii.push_back(coord(rng));
        q.circles.push_back({coord(rng), coord(rng), extent(rng)});
    }
    return q;
}

// Result counts of every query, in order.  Used for the cross-check.
struct QueryCounts {
    std::size_t              size_after_add{};
    std::size_t              list_all{};
    std::vector<std::size_t> regions;
    std::vector<std::size_t> origin;
    std::vector<std::size_t> circles;

    friend bool operator==(const QueryCounts&, const QueryCounts&) = default;
};

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = r.elapsed_sec > 0 ? static_cast<double>(r.total_ops) / r.elapsed_sec : 0.0;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us = percentile(0.50);
    r.p90_us = percentile(0.90);
    r.p99_us = percentile(0.99);

    return r;
}

void print_header(std::string_view engine) {
    fprintf(stdout,
        "\n── %.*s ──\n"
        "  %-14s %10s %10s %14s %10s %10s %10s %10s\n",
        static_cast<int>(engine.size()), engine.data(),
        "operation", "ops", "total s", "ops/sec", "avg µs", "p50 µs", "p90 µs", "p99 µs");
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "  %-14s %10zu %10.3f %14.0f %10.1f %10.1f %10.1f %10.1f\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us);
}

// Times fn() once and appends the latency.
template <typename Fn>
auto timed(std::vector<int64_t>& latencies, Fn&& fn) {
    auto t0 = clock::now();
    auto result = fn();
    auto t1 = clock::now();
    latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    return result;
}

// ── Benchmark runner ─────────────────────────────────────────────────────────

// Runs the whole operation sequence on `storage`.  Prints timings when
// `report` is set; always returns the observed result counts.
QueryCounts run_engine(labelmap::MapStorage& storage,
                       const std::vector<labelmap::Entry>& data,
                       const QuerySet& queries,
                       bool report)
{
    QueryCounts counts;
    std::vector<int64_t> latencies;

    if (report) {
        print_header(storage.name());
    }
    auto finish = [&](const char* label) {
        auto stats = compute_stats(latencies);
        if (report) {
            print_result(label, stats);
        }
        latencies.clear();
    };

    latencies.reserve(data.size());
    for (const auto& entry : data) {
        timed(latencies, [&] { return storage.add(entry); });
    }
    counts.size_after_add = storage.size();
    finish("add");

    for (const auto& entry : data) {
        timed(latencies, [&] { return storage.get(entry.x, entry.y); });
    }
    finish("get");

    for (std::size_t i = 0; i < kListAllRuns; ++i) {
        counts.list_all = timed(latencies, [&] { return storage.list_all(); }).size();
    }
    finish("list_all");

    for (const auto& r : queries.regions) {
        counts.regions.push_back(timed(latencies, [&] {
            return storage.get_in_region(r.min_x, r.min_y, r.max_x, r.max_y);
        }).size());
    }
    finish("region");

    for (int radius : queries.origin_radii) {
        counts.origin.push_back(timed(latencies, [&] {
            return storage.get_within_radius(radius);
        }).size());
    }
    finish("origin radius");

    for (const auto& c : queries.circles) {
        counts.circles.push_back(timed(latencies, [&] {
            return storage.get_within_radius(c.center_x, c.center_y, c.radius);
        }).size());
    }
    finish("center radius");

    for (const auto& entry : data) {
        timed(latencies, [&] { return storage.remove(entry.x, entry.y); });
    }
    finish("remove");

    return counts;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    labelmap::BenchConfig cfg;
    try {
        cfg = labelmap::parse_bench_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    const auto level = labelmap::parse_log_level(cfg.log_level);
    labelmap::init_default_logger(level);
    auto logger = labelmap::make_logger("bench", level);

    logger->info("labelmap-bench: {} engines, count={} pattern={} seed={} queries={}",
                 cfg.engines.size(), cfg.count, labelmap::testdata::to_string(cfg.pattern),
                 cfg.seed, cfg.queries);

    int exit_code = 0;
    try {
        const auto data = labelmap::testdata::generate(
            cfg.pattern, cfg.count, cfg.seed, cfg.storage.max_coordinate);
        const auto queries = make_queries(cfg.queries, cfg.seed + 1, cfg.storage.max_coordinate);

        fprintf(stdout,
            "Label Map Engine Benchmark\n"
            "==========================\n"
            "Entries:  %zu (%.*s)\n"
            "Queries:  %zu per spatial query kind\n",
            data.size(),
            static_cast<int>(labelmap::testdata::to_string(cfg.pattern).size()),
            labelmap::testdata::to_string(cfg.pattern).data(),
            cfg.queries);

        // Reference counts from the hash-map engine.
        labelmap::HashMapStorage reference{cfg.storage.max_coordinate};
        const auto expected = run_engine(reference, data, queries, false);
        logger->debug("reference: {} distinct entries", expected.size_after_add);

        for (auto kind : cfg.engines) {
            labelmap::StorageFactory factory{kind, cfg.storage};
            auto storage = factory.create();

            const auto counts = run_engine(*storage, data, queries, true);
            if (counts != expected) {
                logger->error("{}: query results differ from hashmap", factory.name());
                exit_code = 1;
            } else {
                logger->debug("{}: results match hashmap", factory.name());
            }
        }

    } catch (const std::exception& ex) {
        logger->error("labelmap-bench: {}", ex.what());
        return 1;
    }

    fprintf(stdout, "\n");
    return exit_code;
}
