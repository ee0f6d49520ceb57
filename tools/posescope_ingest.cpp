// posescope_ingest.cpp — CLI tool for loading flat-file trials into the relational store
//
// Pipeline: metadata files -> TrialCatalog -> CsvTrackSource -> SQLiteStore.
//
// Usage: ./posescope_ingest --database <db> --root <track dir> --metadata <csv> [--metadata <csv>]...
//            [--frame-rate <fps>] [--log-level <level>]

#include "posescope/CoreContract.h"
#include "posescope/CsvTrackSource.h"
#include "posescope/Errors.h"
#include "posescope/Logging.h"
#include "posescope/SQLiteStore.h"
#include "posescope/TrialCatalog.h"
#include "posescope/Utility.h"

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --database <db> --root <track dir> --metadata <csv> [--metadata <csv>]...\n"
              << "         [--frame-rate <fps>] [--log-level <level>]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string database;
    std::string root;
    std::vector<std::string> metadata;
    double frame_rate = posescope::contract::DEFAULT_FRAME_RATE_HZ;
    std::string log_level = "info";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--database" && i + 1 < argc) {
            database = argv[++i];
        } else if (arg == "--root" && i + 1 < argc) {
            root = argv[++i];
        } else if (arg == "--metadata" && i + 1 < argc) {
            metadata.push_back(argv[++i]);
        } else if (arg == "--frame-rate" && i + 1 < argc) {
            try {
                frame_rate = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --frame-rate expects a number\n";
                return 1;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (database.empty() || root.empty() || metadata.empty() || !(frame_rate > 0.0)) {
        print_usage(argv[0]);
        return 1;
    }

    posescope::configure_logging(log_level);

    try {
        auto catalog = std::make_shared<const posescope::TrialCatalog>(posescope::TrialCatalog::load_from_csv(metadata));
        posescope::CsvTrackSource source(root, catalog, frame_rate);

        posescope::SQLiteStore store(database);
        store.initialize();

        std::size_t saved = 0;
        std::size_t skipped = 0;
        for (const auto& trial : catalog->trials()) {
            try {
                store.save_trial(trial, source.fetch(trial.id));
                spdlog::debug("[Ingest] Stored {} (task {}, treatment {})", trial.id, trial.task,
                              posescope::treatment_to_string(trial.treatment));
                ++saved;
            } catch (const posescope::TrialNotFound& e) {
                spdlog::warn("[Ingest] Skipping {}: {}", trial.id, e.what());
                ++skipped;
            } catch (const posescope::MalformedSchema& e) {
                spdlog::warn("[Ingest] Skipping {}: {}", trial.id, e.what());
                ++skipped;
            }
        }
        spdlog::info("[Ingest] Stored {} trial(s) in {}, skipped {}", saved, database, skipped);
    } catch (const posescope::ConfigurationError& e) {
        spdlog::error("[Ingest] Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("[Ingest] {}", e.what());
        return 1;
    }
    return 0;
}
