// mine_filters — run the filter miner against a tradegate database.
//
// Runs one mining cycle and prints its summary, or keeps mining every
// --interval-minutes until --max-cycles is reached (0 = forever).
//
// Any config key can be overridden as --key value (see config_io.hpp).

#include "config_io.hpp"
#include "engine_config.hpp"
#include "mining/filter_miner.hpp"
#include "store/trade_store.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--config <file>] [--db-path <sqlite file>]"
              << " [--interval-minutes <n>] [--max-cycles <n>] [--<config-key> <value> ...]\n"
              << "\n"
              << "  --config            key = value file applied before other flags\n"
              << "  --db-path           SQLite database (default tradegate.db)\n"
              << "  --interval-minutes  Repeat every n minutes (default: run once)\n"
              << "  --max-cycles        Stop after n cycles when repeating (0 = no limit)\n";
}

// ===========================================================================
// Summary
// ===========================================================================
void print_run(TradeStore& store, const MiningRun& run) {
    std::cout << "\n=== Mining run " << run.id << " ===\n"
              << "  status:              " << run_status_str(run.status) << "\n"
              << "  candidates analyzed: " << run.candidates_analyzed << "\n"
              << "  columns analyzed:    " << run.total_filters_analyzed << "\n"
              << "  suggestions:         " << run.suggestions_count << "\n"
              << "  combinations:        " << run.combinations_count << "\n"
              << "  duration_ms:         " << run.duration_ms << "\n";
    if (!run.error.empty()) {
        std::cout << "  error:               " << run.error << "\n";
        return;
    }
    if (run.best_combination_id == 0) {
        std::cout << "  best combination:    none (rule sets unchanged)\n";
        return;
    }

    auto combo = store.combination(run.best_combination_id);
    if (combo) {
        std::cout << std::fixed << std::setprecision(2)
                  << "  best combination:    minute " << combo->minute_offset << ", "
                  << combo->bad_removed_pct << "% bad removed, "
                  << combo->good_kept_pct << "% good kept\n";
        for (const auto& f : combo->filters) {
            std::cout << "    " << std::left << std::setw(34) << f.column_name << std::right
                      << " [" << std::setprecision(6) << f.from_value << ", " << f.to_value
                      << "]\n" << std::setprecision(2);
        }
    }

    auto consistency = store.consistency(run.id);
    if (!consistency.empty()) {
        std::cout << "  consistency (last " << consistency.front().runs_considered << " runs):\n";
        for (const auto& c : consistency) {
            std::cout << "    " << std::left << std::setw(34) << c.column_name << std::right
                      << std::setw(7) << c.consistency_pct << "%  avg bad removed "
                      << c.avg_bad_removed_pct << "%  " << trend_str(c.trend) << "\n";
        }
    }
    std::cout.unsetf(std::ios::fixed);
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

    int interval_minutes = 0;
    int max_cycles = 0;
    for (size_t i = 0; i < rest.size(); ++i) {
        if (rest[i] == "--interval-minutes" && i + 1 < rest.size()) {
            interval_minutes = std::atoi(rest[++i].c_str());
        } else if (rest[i] == "--max-cycles" && i + 1 < rest.size()) {
            max_cycles = std::atoi(rest[++i].c_str());
        } else if (rest[i] == "--help" || rest[i] == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << rest[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    if (interval_minutes < 0 || max_cycles < 0) {
        std::cerr << "--interval-minutes and --max-cycles must be non-negative\n";
        return 1;
    }

    std::shared_ptr<TradeStore> store;
    try {
        store = std::make_shared<TradeStore>(cfg.db_path);
    } catch (const StoreError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    FilterMiner miner(cfg.mining, store);
    int cycles = 0;
    bool last_ok = true;
    while (true) {
        MiningRun run;
        try {
            run = miner.run_mining_cycle();
        } catch (const StoreError& e) {
            std::cerr << "Mining run could not be recorded: " << e.what() << "\n";
            return 1;
        }
        print_run(*store, run);
        last_ok = run.status == RunStatus::COMPLETED;
        ++cycles;

        if (interval_minutes == 0) break;
        if (max_cycles > 0 && cycles >= max_cycles) break;
        std::this_thread::sleep_for(std::chrono::minutes(interval_minutes));
    }
    return last_ok ? 0 : 2;
}
