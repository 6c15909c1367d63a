#pragma once

#include "engine_config.hpp"
#include "mining/filter_types.hpp"
#include "mining/labeled_dataset.hpp"
#include "mining/threshold_search.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace combination_search {

inline FilterCombination make_combination(const std::vector<FilterSuggestion>& filters,
                                          const OutcomeCounts& counts, int minute_offset) {
    FilterCombination c;
    c.filters = filters;
    c.minute_offset = minute_offset;
    c.counts = counts;
    c.good_kept_pct = counts.good_kept_pct();
    c.bad_removed_pct = counts.bad_removed_pct();
    c.bad_trades_after = counts.bad_after;
    return c;
}

// ---------------------------------------------------------------------------
// greedy_chain — grow an AND-combination one filter at a time on one offset.
//
// Element k of the result has k+1 filters. Each step adds the unused filter
// with the largest bad_removed improvement, provided it is at least
// combo_min_improvement and good_kept stays at or above the floor. Adding a
// filter can only shrink the pass set, so bad_removed never decreases and
// good_kept never increases along the chain.
// ---------------------------------------------------------------------------
inline std::vector<FilterCombination> greedy_chain(const OffsetSlice& slice,
                                                   const std::vector<FilterSuggestion>& pool,
                                                   double threshold, const MiningConfig& cfg) {
    std::vector<FilterCombination> chain;
    if (pool.empty()) return chain;

    std::vector<std::vector<bool>> masks;
    masks.reserve(pool.size());
    for (const auto& s : pool) {
        auto col = slice.columns.find(s.column_name);
        if (col == slice.columns.end()) {
            masks.emplace_back(slice.size(), false);
        } else {
            masks.push_back(threshold_search::pass_mask(col->second, s.from_value, s.to_value));
        }
    }

    // Seed: highest bad_removed among singles that keep enough good trades.
    int seed = -1;
    OutcomeCounts seed_counts;
    for (size_t i = 0; i < pool.size(); ++i) {
        OutcomeCounts c = threshold_search::count_outcomes(slice.gains, masks[i], threshold);
        if (c.good_kept_pct() < cfg.combo_min_good_kept_pct) continue;
        if (seed < 0 || c.bad_removed_pct() > seed_counts.bad_removed_pct()) {
            seed = static_cast<int>(i);
            seed_counts = c;
        }
    }
    if (seed < 0) return chain;

    std::vector<bool> current = masks[seed];
    std::set<std::string> used = {pool[seed].column_name};
    std::vector<FilterSuggestion> filters = {pool[seed]};
    chain.push_back(make_combination(filters, seed_counts, slice.minute_offset));
    const double single_removed = seed_counts.bad_removed_pct();

    while (static_cast<int>(filters.size()) < cfg.max_filters_in_combo) {
        int best = -1;
        double best_improvement = 0.0;
        OutcomeCounts best_counts;
        std::vector<bool> best_mask;
        double current_removed = chain.back().bad_removed_pct;

        for (size_t i = 0; i < pool.size(); ++i) {
            if (used.count(pool[i].column_name)) continue;
            std::vector<bool> combined(current.size());
            for (size_t r = 0; r < current.size(); ++r) combined[r] = current[r] && masks[i][r];
            OutcomeCounts c = threshold_search::count_outcomes(slice.gains, combined, threshold);
            if (c.good_kept_pct() < cfg.combo_min_good_kept_pct) continue;
            double improvement = c.bad_removed_pct() - current_removed;
            if (improvement >= cfg.combo_min_improvement && improvement > best_improvement) {
                best = static_cast<int>(i);
                best_improvement = improvement;
                best_counts = c;
                best_mask = std::move(combined);
            }
        }
        if (best < 0) break;

        current = std::move(best_mask);
        used.insert(pool[best].column_name);
        filters.push_back(pool[best]);
        auto combo = make_combination(filters, best_counts, slice.minute_offset);
        combo.improvement_over_single = combo.bad_removed_pct - single_removed;
        chain.push_back(std::move(combo));
    }
    return chain;
}

// ---------------------------------------------------------------------------
// SearchResult — per-offset chains and the overall winner
// ---------------------------------------------------------------------------
struct SearchResult {
    std::map<int, std::vector<FilterCombination>> valid_chains;  // offset -> size >= min
    std::optional<FilterCombination> best;
    int best_offset = -1;

    std::vector<FilterCombination> best_chain() const {
        auto it = valid_chains.find(best_offset);
        return it == valid_chains.end() ? std::vector<FilterCombination>{} : it->second;
    }
};

// Run the greedy search on every offset over its top-K ranked suggestions
// and pick the offset whose final valid combination scores highest.
inline SearchResult search_all_offsets(const LabeledDataset& ds,
                                       const std::vector<FilterSuggestion>& ranked,
                                       const MiningConfig& cfg) {
    std::map<int, std::vector<FilterSuggestion>> by_offset;
    for (const auto& s : ranked) {
        auto& pool = by_offset[s.minute_offset];
        if (static_cast<int>(pool.size()) < cfg.top_k_filters) pool.push_back(s);
    }

    SearchResult result;
    for (const auto& [offset, pool] : by_offset) {
        auto slice = ds.offsets.find(offset);
        if (slice == ds.offsets.end()) continue;
        if (static_cast<int>(slice->second.size()) < cfg.min_values) continue;

        auto chain = greedy_chain(slice->second, pool, ds.threshold, cfg);
        std::vector<FilterCombination> valid;
        for (auto& c : chain) {
            if (static_cast<int>(c.filters.size()) >= cfg.min_filters_in_combo) valid.push_back(c);
        }
        if (valid.empty()) continue;

        const FilterCombination& final_combo = valid.back();
        bool better = !result.best ||
                      final_combo.score() > result.best->score() ||
                      (final_combo.score() == result.best->score() &&
                       final_combo.bad_removed_pct > result.best->bad_removed_pct);
        // Offsets are visited ascending, so equal results keep the lower offset.
        if (better) {
            result.best = final_combo;
            result.best_offset = offset;
        }
        result.valid_chains[offset] = std::move(valid);
    }
    return result;
}

}  // namespace combination_search
