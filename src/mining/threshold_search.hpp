#pragma once

#include "engine_config.hpp"
#include "mining/filter_types.hpp"
#include "mining/labeled_dataset.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace threshold_search {

// Linear-interpolated percentile of an ascending-sorted sample, p in [0, 100].
inline double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return std::numeric_limits<double>::quiet_NaN();
    if (sorted.size() == 1) return sorted.front();
    double rank = p / 100.0 * static_cast<double>(sorted.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(rank));
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = rank - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

inline bool in_range(double v, double from, double to) {
    return v >= from && v <= to;  // false for NaN
}

// Tally outcomes for an arbitrary pass mask over the slice's rows.
inline OutcomeCounts count_outcomes(const std::vector<double>& gains,
                                    const std::vector<bool>& passes, double threshold) {
    OutcomeCounts c;
    c.total_trades = static_cast<int>(gains.size());
    for (size_t i = 0; i < gains.size(); ++i) {
        double g = gains[i];
        bool good = g >= threshold;
        if (good) ++c.good_before;
        else ++c.bad_before;
        if (!passes[i]) continue;
        if (good) {
            ++c.good_after;
            continue;
        }
        ++c.bad_after;
        if (g < 0.0) ++c.bad_negative_after;
        else if (g < 0.1) ++c.bad_0_to_01_after;
        else if (g < 0.2) ++c.bad_01_to_02_after;
        else ++c.bad_02_to_thr_after;
    }
    return c;
}

inline std::vector<bool> pass_mask(const std::vector<double>& values, double from, double to) {
    std::vector<bool> out(values.size());
    for (size_t i = 0; i < values.size(); ++i) out[i] = in_range(values[i], from, to);
    return out;
}

inline OutcomeCounts evaluate_range(const std::vector<double>& values,
                                    const std::vector<double>& gains, double threshold,
                                    double from, double to) {
    return count_outcomes(gains, pass_mask(values, from, to), threshold);
}

// ---------------------------------------------------------------------------
// find_optimal_range — best percentile-pair range of the good values for
// one (column, offset). nullopt when the column is not eligible or no pair
// clears both floors.
// ---------------------------------------------------------------------------
inline std::optional<FilterSuggestion> find_optimal_range(const std::string& column,
                                                          const OffsetSlice& slice,
                                                          double threshold,
                                                          const MiningConfig& cfg) {
    auto col = slice.columns.find(column);
    if (col == slice.columns.end()) return std::nullopt;
    const auto& values = col->second;

    std::vector<double> non_null, good_values;
    int bad_non_null = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i])) continue;
        non_null.push_back(values[i]);
        if (slice.gains[i] >= threshold) good_values.push_back(values[i]);
        else ++bad_non_null;
    }
    if (values.empty()) return std::nullopt;
    double null_pct = 100.0 * static_cast<double>(values.size() - non_null.size()) /
                      static_cast<double>(values.size());
    if (null_pct > cfg.max_null_pct) return std::nullopt;
    if (static_cast<int>(good_values.size()) < cfg.min_good_values) return std::nullopt;
    if (static_cast<int>(non_null.size()) < cfg.min_values) return std::nullopt;
    if (bad_non_null == 0) return std::nullopt;
    auto [mn, mx] = std::minmax_element(non_null.begin(), non_null.end());
    if (*mn == *mx) return std::nullopt;

    std::sort(good_values.begin(), good_values.end());

    std::optional<FilterSuggestion> best;
    double best_score = -1.0;
    for (const auto& [p_lo, p_hi] : cfg.percentile_pairs) {
        double from = percentile(good_values, p_lo);
        double to = percentile(good_values, p_hi);
        if (!(from < to)) continue;

        OutcomeCounts counts = evaluate_range(values, slice.gains, threshold, from, to);
        double kept = counts.good_kept_pct();
        double removed = counts.bad_removed_pct();
        if (kept < cfg.min_good_kept_pct || removed < cfg.min_bad_removed_pct) continue;

        // Equal scores go to the range that removes more bad trades.
        double score = filter_score(removed, kept);
        if (score > best_score ||
            (best && score == best_score && removed > best->bad_removed_pct)) {
            best_score = score;
            FilterSuggestion s;
            s.column_name = column;
            auto sec = slice.sections.find(column);
            s.section = sec == slice.sections.end() ? "" : sec->second;
            s.minute_offset = slice.minute_offset;
            s.from_value = from;
            s.to_value = to;
            s.good_kept_pct = kept;
            s.bad_removed_pct = removed;
            s.score = score;
            s.counts = counts;
            best = s;
        }
    }
    return best;
}

// Higher score first; ties by higher bad_removed, then lower offset, then name.
inline bool ranks_before(const FilterSuggestion& a, const FilterSuggestion& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.bad_removed_pct != b.bad_removed_pct) return a.bad_removed_pct > b.bad_removed_pct;
    if (a.minute_offset != b.minute_offset) return a.minute_offset < b.minute_offset;
    return a.column_name < b.column_name;
}

// All eligible suggestions across every (column, offset), ranked.
inline std::vector<FilterSuggestion> find_suggestions(const LabeledDataset& ds,
                                                      const MiningConfig& cfg,
                                                      int* columns_analyzed = nullptr) {
    std::vector<FilterSuggestion> out;
    int analyzed = 0;
    for (const auto& [offset, slice] : ds.offsets) {
        if (static_cast<int>(slice.size()) < cfg.min_values) continue;
        for (const auto& [column, values] : slice.columns) {
            (void)values;
            ++analyzed;
            auto s = find_optimal_range(column, slice, ds.threshold, cfg);
            if (s) out.push_back(*s);
        }
    }
    std::sort(out.begin(), out.end(), ranks_before);
    if (columns_analyzed) *columns_analyzed = analyzed;
    return out;
}

}  // namespace threshold_search
