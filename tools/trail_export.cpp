// trail_export — dump the labeled trail dataset (and the suggestions of the
// latest completed mining run) to Parquet for offline analysis.

#include "config_io.hpp"
#include "engine_config.hpp"
#include "export/trail_parquet.hpp"
#include "mining/labeled_dataset.hpp"
#include "store/trade_store.hpp"
#include "time_utils.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --output <dataset.parquet> [--suggestions <suggestions.parquet>]"
              << " [--db-path <sqlite file>] [--analysis-window-hours <h>]"
              << " [--good-trade-threshold-pct <pct>]\n"
              << "\n"
              << "  --output       Labeled trail dataset, one row per candidate x minute\n"
              << "  --suggestions  Ranked suggestions of the latest completed mining run\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    EngineConfig cfg;
    std::vector<std::string> rest;
    try {
        rest = config_io::apply_cli(cfg, argc, argv);
        cfg.validate();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    std::string output_path;
    std::string suggestions_path;
    for (size_t i = 0; i < rest.size(); ++i) {
        if (rest[i] == "--output" && i + 1 < rest.size()) {
            output_path = rest[++i];
        } else if (rest[i] == "--suggestions" && i + 1 < rest.size()) {
            suggestions_path = rest[++i];
        } else {
            std::cerr << "Unknown argument: " << rest[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (output_path.empty()) {
        std::cerr << "Missing required argument: --output\n";
        print_usage(argv[0]);
        return 1;
    }
    if (std::filesystem::path(output_path).extension() != ".parquet") {
        std::cerr << "Unsupported output format. Use .parquet extension.\n";
        return 1;
    }

    try {
        TradeStore store(cfg.db_path);
        uint64_t now = time_utils::now_ns();
        uint64_t from = time_utils::minus_ns(
            now, static_cast<uint64_t>(cfg.mining.analysis_window_hours) *
                     time_utils::NS_PER_HOUR);

        auto candidates = store.resolved_candidates(from, now);
        auto trail = store.resolved_trail(from, now);
        LabeledDataset ds = build_labeled_dataset(candidates, trail,
                                                  cfg.mining.good_trade_threshold_pct,
                                                  cfg.trail.tracking_window_minutes - 1);
        int64_t rows = trail_parquet::write_dataset(output_path, ds);
        std::cout << "Wrote " << rows << " rows (" << ds.candidate_count << " candidates, "
                  << ds.good_count << " good / " << ds.bad_count << " bad) to "
                  << output_path << "\n";

        if (!suggestions_path.empty()) {
            auto runs = store.recent_completed_runs(1);
            if (runs.empty()) {
                std::cerr << "No completed mining run; suggestions not written\n";
            } else {
                auto suggestions = store.suggestions(runs.front().id);
                trail_parquet::write_suggestions(suggestions_path, suggestions);
                std::cout << "Wrote " << suggestions.size() << " suggestions of run "
                          << runs.front().id << " to " << suggestions_path << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Export failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
