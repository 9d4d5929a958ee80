#include "cli/session.hpp"
#include "common/logger.hpp"
#include "common/tool_config.hpp"
#include "storage/storage_factory.hpp"
#include "testdata/data_generator.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

std::vector<labelmap::Entry> preload_entries(const labelmap::CliConfig& cfg) {
    using labelmap::Preload;
    namespace testdata = labelmap::testdata;

    switch (cfg.preload) {
        case Preload::None:
            return {};
        case Preload::Basic:
            return testdata::basic_entries();
        case Preload::Edge:
            return testdata::edge_case_entries(cfg.storage.max_coordinate);
        case Preload::Mixed:
            return testdata::mixed_entries(labelmap::kMixedPreloadCount, cfg.seed,
                                           cfg.storage.max_coordinate);
    }
    return {};
}

// ── REPL ──────────────────────────────────────────────────────────────────────

void repl(labelmap::cli::Session& session, bool interactive) {
    std::string line;
    while (true) {
        if (interactive) {
            fprintf(stdout, "> ");
            fflush(stdout);
        }

        if (!std::getline(std::cin, line)) {
            if (interactive) {
                fprintf(stdout, "\n");
            }
            break;
        }

        if (line.empty() || line == "\r") {
            continue;
        }

        const auto response = session.handle_line(line);
        fwrite(response.data(), 1, response.size(), stdout);
        fflush(stdout);
    }
}

} // namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    labelmap::CliConfig cfg;
    try {
        cfg = labelmap::parse_cli_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = labelmap::parse_log_level(cfg.log_level);
    labelmap::init_default_logger(level);
    auto logger = labelmap::make_logger("cli", level);
    cfg.storage.logger = labelmap::make_logger("storage", level);

    logger->info("labelmap-cli starting: engine={} max_coordinate={} tile_shift={} tile_capacity={}",
                 labelmap::to_string(cfg.engine), cfg.storage.max_coordinate,
                 cfg.storage.tile_shift, cfg.storage.tile_capacity);

    try {
        auto storage = labelmap::make_storage(cfg.engine, cfg.storage);

        for (auto& entry : preload_entries(cfg)) {
            storage->add(std::move(entry));
        }
        logger->info("{} entries loaded", storage->size());

        const bool interactive = isatty(STDIN_FILENO) != 0;
        if (interactive) {
            fprintf(stdout, "labelmap (%s engine). Type commands "
                    "(ADD x y label, GET x y, HAS x y, DEL x y, LIST, REGION x0 y0 x1 y1, "
                    "RADIUS r, RADIUS cx cy r, COUNT, CLEAR). Ctrl+D to quit.\n",
                    std::string(storage->name()).c_str());
        }

        labelmap::cli::Session session{*storage, logger};
        repl(session, interactive);

    } catch (const std::exception& ex) {
        logger->error("labelmap-cli: {}", ex.what());
        return 1;
    }

    return 0;
}
