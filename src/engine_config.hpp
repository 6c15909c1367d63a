#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Range check helper — throws std::invalid_argument naming the offending key
// ---------------------------------------------------------------------------
namespace config_check {

template <typename T>
inline void in_range(const char* key, T value, T lo, T hi) {
    if (value < lo || value > hi) {
        throw std::invalid_argument(std::string(key) + " = " + std::to_string(value) +
                                    " outside [" + std::to_string(lo) + ", " +
                                    std::to_string(hi) + "]");
    }
}

}  // namespace config_check

// ---------------------------------------------------------------------------
// GateConfig — pre-entry momentum gate
// ---------------------------------------------------------------------------
struct GateConfig {
    enum class NoDataPolicy { ALLOW, REJECT };

    int lookback_minutes = 3;
    double min_change_pct = 0.20;
    NoDataPolicy no_data_policy = NoDataPolicy::ALLOW;
    int timeout_ms = 500;
    int price_match_window_s = 30;  // ±half around each lookback point

    void validate() const {
        config_check::in_range("lookback_minutes", lookback_minutes, 1, 60);
        config_check::in_range("min_change_pct", min_change_pct, -10.0, 10.0);
        config_check::in_range("gate_timeout_ms", timeout_ms, 1, 10000);
        config_check::in_range("price_match_window_s", price_match_window_s, 1, 600);
    }
};

// ---------------------------------------------------------------------------
// TrailConfig — post-entry feature capture
// ---------------------------------------------------------------------------
struct TrailConfig {
    int tracking_window_minutes = 15;
    int section_timeout_ms = 1000;
    bool persist_gate_metrics = false;

    void validate() const {
        config_check::in_range("tracking_window_minutes", tracking_window_minutes, 1, 120);
        config_check::in_range("section_timeout_ms", section_timeout_ms, 1, 30000);
    }
};

// ---------------------------------------------------------------------------
// MiningConfig — filter discovery and combination search
// ---------------------------------------------------------------------------
struct MiningConfig {
    double good_trade_threshold_pct = 0.3;
    int analysis_window_hours = 24;
    int min_filters_in_combo = 1;
    int max_filters_in_combo = 6;
    double min_good_kept_pct = 50.0;
    double min_bad_removed_pct = 10.0;
    double combo_min_good_kept_pct = 25.0;
    double combo_min_improvement = 1.0;
    int top_k_filters = 30;
    int consistency_runs = 10;
    double trend_band_pct = 5.0;
    int max_combination_offset = 14;

    int min_good_values = 10;
    int min_values = 20;
    double max_null_pct = 90.0;

    std::vector<std::pair<double, double>> percentile_pairs = {
        {10.0, 90.0},
        {5.0, 95.0},
        {15.0, 85.0},
        {20.0, 80.0},
        {25.0, 75.0},
    };

    std::string auto_rule_set_name = "AutoFilters";

    void validate() const {
        config_check::in_range("good_trade_threshold_pct", good_trade_threshold_pct, 0.1, 5.0);
        config_check::in_range("analysis_window_hours", analysis_window_hours, 1, 168);
        config_check::in_range("min_filters_in_combo", min_filters_in_combo, 1, 10);
        config_check::in_range("max_filters_in_combo", max_filters_in_combo, 2, 15);
        config_check::in_range("min_good_kept_pct", min_good_kept_pct, 10.0, 100.0);
        config_check::in_range("min_bad_removed_pct", min_bad_removed_pct, 5.0, 100.0);
        config_check::in_range("combo_min_good_kept_pct", combo_min_good_kept_pct, 5.0, 100.0);
        config_check::in_range("combo_min_improvement", combo_min_improvement, 0.1, 10.0);
        config_check::in_range("top_k_filters", top_k_filters, 1, 500);
        config_check::in_range("consistency_runs", consistency_runs, 1, 1000);
        config_check::in_range("trend_band_pct", trend_band_pct, 0.0, 100.0);
        config_check::in_range("max_combination_offset", max_combination_offset, 0, 119);
        if (min_filters_in_combo > max_filters_in_combo) {
            throw std::invalid_argument("min_filters_in_combo exceeds max_filters_in_combo");
        }
        if (percentile_pairs.empty()) {
            throw std::invalid_argument("percentile_pairs must not be empty");
        }
        for (const auto& [lo, hi] : percentile_pairs) {
            if (lo < 0.0 || hi > 100.0 || lo >= hi) {
                throw std::invalid_argument("percentile pair out of order or range");
            }
        }
    }
};

// ---------------------------------------------------------------------------
// ValidatorConfig — combined gate + rule-set decision
// ---------------------------------------------------------------------------
struct ValidatorConfig {
    enum class NoRuleSetPolicy { ALLOW, REJECT };

    int timeout_ms = 2000;
    int decision_offset = 0;
    NoRuleSetPolicy no_rule_set_policy = NoRuleSetPolicy::REJECT;

    void validate() const {
        config_check::in_range("validator_timeout_ms", timeout_ms, 1, 30000);
        config_check::in_range("decision_offset", decision_offset, 0, 119);
    }
};

// ---------------------------------------------------------------------------
// EngineConfig — everything a process loads once at startup / per run
// ---------------------------------------------------------------------------
struct EngineConfig {
    GateConfig gate;
    TrailConfig trail;
    MiningConfig mining;
    ValidatorConfig validator;
    std::string db_path = "tradegate.db";

    void validate() const {
        gate.validate();
        trail.validate();
        mining.validate();
        validator.validate();
        if (mining.max_combination_offset >= trail.tracking_window_minutes) {
            throw std::invalid_argument(
                "max_combination_offset must be inside the tracking window");
        }
        if (validator.decision_offset >= trail.tracking_window_minutes) {
            throw std::invalid_argument("decision_offset must be inside the tracking window");
        }
    }
};
