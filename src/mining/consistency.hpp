#pragma once

#include "mining/filter_types.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace consistency {

// Best combination of one completed run, reduced to what consistency needs.
struct RunBest {
    int64_t run_id = 0;
    std::map<std::string, double> bad_removed;  // column -> its filter's bad_removed_pct
    std::map<std::string, double> good_kept;
};

inline RunBest from_combination(int64_t run_id, const FilterCombination& combo) {
    RunBest rb;
    rb.run_id = run_id;
    for (const auto& f : combo.filters) {
        rb.bad_removed[f.column_name] = f.bad_removed_pct;
        rb.good_kept[f.column_name] = f.good_kept_pct;
    }
    return rb;
}

inline FilterTrend classify(double latest, double average, double band_pct) {
    if (latest > average + band_pct) return FilterTrend::IMPROVING;
    if (latest < average - band_pct) return FilterTrend::DECLINING;
    return FilterTrend::STABLE;
}

// ---------------------------------------------------------------------------
// compute — recurrence of every column over the most recent runs.
// `runs` is newest first; only the first `window` entries are used. Runs
// without a best combination still count in the denominator.
// ---------------------------------------------------------------------------
inline std::vector<ColumnConsistency> compute(const std::vector<RunBest>& runs, int window,
                                              double band_pct) {
    size_t n = std::min(runs.size(), static_cast<size_t>(std::max(window, 0)));
    std::map<std::string, ColumnConsistency> by_column;
    std::map<std::string, double> bad_sum, good_sum;

    for (size_t i = 0; i < n; ++i) {
        for (const auto& [column, removed] : runs[i].bad_removed) {
            auto& cc = by_column[column];
            if (cc.times_in_best_combo == 0) {
                cc.column_name = column;
                cc.latest_bad_removed_pct = removed;  // newest run containing it
            }
            ++cc.times_in_best_combo;
            bad_sum[column] += removed;
            auto g = runs[i].good_kept.find(column);
            good_sum[column] += g == runs[i].good_kept.end() ? 0.0 : g->second;
        }
    }

    std::vector<ColumnConsistency> out;
    for (auto& [column, cc] : by_column) {
        cc.runs_considered = static_cast<int>(n);
        cc.consistency_pct = 100.0 * cc.times_in_best_combo / static_cast<double>(n);
        cc.avg_bad_removed_pct = bad_sum[column] / cc.times_in_best_combo;
        cc.avg_good_kept_pct = good_sum[column] / cc.times_in_best_combo;
        cc.trend = classify(cc.latest_bad_removed_pct, cc.avg_bad_removed_pct, band_pct);
        out.push_back(cc);
    }
    std::sort(out.begin(), out.end(), [](const ColumnConsistency& a, const ColumnConsistency& b) {
        if (a.consistency_pct != b.consistency_pct) return a.consistency_pct > b.consistency_pct;
        return a.column_name < b.column_name;
    });
    return out;
}

}  // namespace consistency
