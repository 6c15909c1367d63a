#pragma once

#include "engine_config.hpp"
#include "mining/combination_search.hpp"
#include "mining/consistency.hpp"
#include "mining/filter_types.hpp"
#include "mining/labeled_dataset.hpp"
#include "mining/threshold_search.hpp"
#include "store/trade_store.hpp"
#include "time_utils.hpp"
#include "validator/rule_set.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// MiningResult — output of the pure mining core
// ---------------------------------------------------------------------------
struct MiningResult {
    std::vector<FilterSuggestion> suggestions;     // ranked
    std::vector<FilterCombination> best_chain;     // valid chain at the best offset
    std::optional<FilterCombination> best;
    int best_offset = -1;
    int columns_analyzed = 0;
};

// Pure: no store, no clock. Same dataset and config give the same result.
inline MiningResult mine_filters(const LabeledDataset& ds, const MiningConfig& cfg) {
    MiningResult r;
    r.suggestions = threshold_search::find_suggestions(ds, cfg, &r.columns_analyzed);
    auto search = combination_search::search_all_offsets(ds, r.suggestions, cfg);
    r.best = search.best;
    r.best_offset = search.best_offset;
    r.best_chain = search.best_chain();
    return r;
}

inline std::vector<RuleFilter> to_rule_filters(const FilterCombination& combo) {
    std::vector<RuleFilter> out;
    for (const auto& f : combo.filters) {
        RuleFilter rf;
        rf.column_name = f.column_name;
        rf.section = f.section;
        rf.minute_offset = f.minute_offset;
        rf.from_value = f.from_value;
        rf.to_value = f.to_value;
        out.push_back(rf);
    }
    return out;
}

// ---------------------------------------------------------------------------
// FilterMiner — one mining cycle against the store.
//
// running -> completed | failed. A failed run, or one without a valid
// combination, leaves every rule set untouched. On success the best
// combination replaces the auto rule set's filters and bumps its version.
// ---------------------------------------------------------------------------
class FilterMiner {
public:
    FilterMiner(MiningConfig config, std::shared_ptr<TradeStore> store)
        : config_(std::move(config)), store_(std::move(store)) {}

    const MiningConfig& config() const { return config_; }

    MiningRun run_mining_cycle(uint64_t now = time_utils::now_ns()) {
        return run_mining_cycle(config_.analysis_window_hours, config_.good_trade_threshold_pct,
                                config_.min_filters_in_combo, now);
    }

    MiningRun run_mining_cycle(int analysis_window_hours, double good_trade_threshold_pct,
                               int min_filters_in_combo, uint64_t now = time_utils::now_ns()) {
        auto t0 = std::chrono::steady_clock::now();
        MiningRun run;
        run.started_at = now;
        run.window_end = now;
        run.window_start = time_utils::minus_ns(
            now, static_cast<uint64_t>(std::max(analysis_window_hours, 0)) *
                     time_utils::NS_PER_HOUR);
        store_->begin_mining_run(run);

        try {
            MiningConfig cfg = config_;
            cfg.analysis_window_hours = analysis_window_hours;
            cfg.good_trade_threshold_pct = good_trade_threshold_pct;
            cfg.min_filters_in_combo = min_filters_in_combo;
            cfg.validate();

            auto candidates = store_->resolved_candidates(run.window_start, run.window_end);
            auto trail = store_->resolved_trail(run.window_start, run.window_end);
            run.candidates_analyzed = static_cast<int>(candidates.size());

            LabeledDataset ds = build_labeled_dataset(candidates, trail,
                                                      cfg.good_trade_threshold_pct,
                                                      cfg.max_combination_offset);
            std::cout << "[miner] run=" << run.id << " candidates=" << ds.candidate_count
                      << " good=" << ds.good_count << " bad=" << ds.bad_count
                      << " offsets=" << ds.offsets.size() << "\n";

            MiningResult result = mine_filters(ds, cfg);
            run.total_filters_analyzed = result.columns_analyzed;

            for (auto& s : result.suggestions) s.discovered_at = now;
            store_->save_suggestions(run.id, result.suggestions);
            run.suggestions_count = static_cast<int>(result.suggestions.size());

            std::map<std::pair<std::string, int>, int64_t> suggestion_ids;
            for (const auto& s : result.suggestions) {
                suggestion_ids[{s.column_name, s.minute_offset}] = s.id;
            }
            for (auto& combo : result.best_chain) {
                combo.run_id = run.id;
                for (auto& f : combo.filters) {
                    f.id = suggestion_ids[{f.column_name, f.minute_offset}];
                    f.run_id = run.id;
                }
                store_->save_combination(combo);
                run.combinations_count++;
            }

            std::optional<FilterCombination> best;
            if (!result.best_chain.empty()) {
                best = result.best_chain.back();
                run.best_combination_id = best->id;
                run.best_minute_offset = result.best_offset;
            }

            update_consistency(run.id, best, cfg);

            if (best) {
                RuleSet rs = store_->replace_rule_set(cfg.auto_rule_set_name,
                                                      to_rule_filters(*best), best->id);
                run.rule_set_updated = true;
                std::cout << "[miner] run=" << run.id << " synced " << rs.version_tag()
                          << " filters=" << rs.filters.size() << " offset="
                          << result.best_offset << " bad_removed=" << best->bad_removed_pct
                          << " good_kept=" << best->good_kept_pct << "\n";
            } else {
                std::cout << "[miner] run=" << run.id
                          << " no valid combination, rule sets unchanged\n";
            }
            run.status = RunStatus::COMPLETED;
        } catch (const std::exception& e) {
            run.status = RunStatus::FAILED;
            run.error = e.what();
            run.rule_set_updated = false;
            std::cerr << "[miner] run=" << run.id << " FAILED: " << e.what() << "\n";
        }

        run.completed_at = time_utils::now_ns();
        if (run.completed_at < run.started_at) run.completed_at = run.started_at;
        run.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        try {
            store_->finish_mining_run(run);
        } catch (const StoreError& e) {
            std::cerr << "[miner] run=" << run.id << " could not be closed: " << e.what() << "\n";
            throw;
        }
        std::cout << "[miner] run=" << run.id << " " << run_status_str(run.status)
                  << " suggestions=" << run.suggestions_count
                  << " combinations=" << run.combinations_count
                  << " duration_ms=" << run.duration_ms << "\n";
        return run;
    }

private:
    // Consistency over this run plus the previous completed runs.
    void update_consistency(int64_t run_id, const std::optional<FilterCombination>& best,
                            const MiningConfig& cfg) {
        std::vector<consistency::RunBest> history;
        consistency::RunBest current;
        current.run_id = run_id;
        if (best) current = consistency::from_combination(run_id, *best);
        history.push_back(current);

        for (const auto& prev : store_->recent_completed_runs(cfg.consistency_runs - 1)) {
            consistency::RunBest rb;
            rb.run_id = prev.id;
            if (prev.best_combination_id > 0) {
                auto combo = store_->combination(prev.best_combination_id);
                if (combo) rb = consistency::from_combination(prev.id, *combo);
            }
            history.push_back(rb);
        }
        auto rows = consistency::compute(history, cfg.consistency_runs, cfg.trend_band_pct);
        store_->save_consistency(run_id, rows);
    }

    MiningConfig config_;
    std::shared_ptr<TradeStore> store_;
};
