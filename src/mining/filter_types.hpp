#pragma once

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// OutcomeCounts — good/bad tallies before and after a filter is applied,
// with the bad-trade breakdown by realized gain bucket.
// ---------------------------------------------------------------------------
struct OutcomeCounts {
    int total_trades = 0;
    int good_before = 0;
    int bad_before = 0;
    int good_after = 0;
    int bad_after = 0;

    int bad_negative_after = 0;     // gain < 0
    int bad_0_to_01_after = 0;      // 0 <= gain < 0.1
    int bad_01_to_02_after = 0;     // 0.1 <= gain < 0.2
    int bad_02_to_thr_after = 0;    // 0.2 <= gain < threshold

    double good_kept_pct() const {
        return good_before > 0 ? 100.0 * good_after / good_before : 0.0;
    }
    double bad_removed_pct() const {
        return bad_before > 0 ? 100.0 * (bad_before - bad_after) / bad_before : 0.0;
    }
};

// Effectiveness score: bad removal weighted by good retention.
inline double filter_score(double bad_removed_pct, double good_kept_pct) {
    return bad_removed_pct * (good_kept_pct / 100.0);
}

// ---------------------------------------------------------------------------
// FilterSuggestion — one discovered threshold rule on (column, offset)
// ---------------------------------------------------------------------------
struct FilterSuggestion {
    int64_t id = 0;
    int64_t run_id = 0;
    std::string column_name;
    std::string section;
    int minute_offset = 0;
    double from_value = 0.0;
    double to_value = 0.0;
    double good_kept_pct = 0.0;
    double bad_removed_pct = 0.0;
    double score = 0.0;
    uint64_t discovered_at = 0;
    OutcomeCounts counts;

    // Inclusive range check; NaN (null) never passes.
    bool passes(double v) const { return v >= from_value && v <= to_value; }
};

// ---------------------------------------------------------------------------
// FilterCombination — logical AND of suggestions on one minute offset
// ---------------------------------------------------------------------------
struct FilterCombination {
    int64_t id = 0;
    int64_t run_id = 0;
    std::vector<FilterSuggestion> filters;
    int minute_offset = 0;
    double good_kept_pct = 0.0;
    double bad_removed_pct = 0.0;
    int bad_trades_after = 0;
    double improvement_over_single = 0.0;
    OutcomeCounts counts;

    double score() const { return filter_score(bad_removed_pct, good_kept_pct); }

    std::vector<std::string> columns() const {
        std::vector<std::string> out;
        out.reserve(filters.size());
        for (const auto& f : filters) out.push_back(f.column_name);
        return out;
    }
};

// ---------------------------------------------------------------------------
// MiningRun — one execution of the miner (append-only)
// ---------------------------------------------------------------------------
enum class RunStatus { RUNNING, COMPLETED, FAILED };

inline const char* run_status_str(RunStatus s) {
    switch (s) {
        case RunStatus::RUNNING:   return "running";
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::FAILED:    return "failed";
    }
    return "running";
}

inline RunStatus run_status_from_str(const std::string& s) {
    if (s == "completed") return RunStatus::COMPLETED;
    if (s == "failed") return RunStatus::FAILED;
    return RunStatus::RUNNING;
}

struct MiningRun {
    int64_t id = 0;
    uint64_t started_at = 0;
    uint64_t completed_at = 0;
    RunStatus status = RunStatus::RUNNING;
    int total_filters_analyzed = 0;
    int suggestions_count = 0;
    int combinations_count = 0;
    int64_t best_combination_id = 0;   // 0 = none
    int best_minute_offset = -1;
    int64_t duration_ms = 0;
    uint64_t window_start = 0;
    uint64_t window_end = 0;
    int candidates_analyzed = 0;
    bool rule_set_updated = false;
    std::string error;
};

// ---------------------------------------------------------------------------
// ColumnConsistency — recurrence of a column in recent winning combinations
// ---------------------------------------------------------------------------
enum class FilterTrend { IMPROVING, DECLINING, STABLE };

inline const char* trend_str(FilterTrend t) {
    switch (t) {
        case FilterTrend::IMPROVING: return "improving";
        case FilterTrend::DECLINING: return "declining";
        case FilterTrend::STABLE:    return "stable";
    }
    return "stable";
}

struct ColumnConsistency {
    std::string column_name;
    int runs_considered = 0;
    int times_in_best_combo = 0;
    double consistency_pct = 0.0;
    double avg_bad_removed_pct = 0.0;
    double avg_good_kept_pct = 0.0;
    double latest_bad_removed_pct = 0.0;
    FilterTrend trend = FilterTrend::STABLE;
};
