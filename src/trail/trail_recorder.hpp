#pragma once

#include "candidate/trade_candidate.hpp"
#include "engine_config.hpp"
#include "gate/pre_entry_gate.hpp"
#include "run_with_timeout.hpp"
#include "store/trade_store.hpp"
#include "time_utils.hpp"
#include "trail/feature_section.hpp"
#include "trail/trail_types.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Pre-entry metrics as trail columns (section pre_entry, offset 0)
// ---------------------------------------------------------------------------
inline std::vector<TrailValue> gate_metric_values(int64_t candidate_id, const GateMetrics& m) {
    std::vector<TrailValue> out;
    for (int minutes : GATE_METRIC_MINUTES) {
        TrailValue v;
        v.candidate_id = candidate_id;
        v.minute_offset = 0;
        v.column_name = "pre_change_" + std::to_string(minutes) + "m";
        v.value = m.change(minutes);
        v.section = trail_section::PRE_ENTRY;
        out.push_back(std::move(v));
    }
    TrailValue trend;
    trend.candidate_id = candidate_id;
    trend.minute_offset = 0;
    trend.column_name = "pre_trend_code";
    trend.section = trail_section::PRE_ENTRY;
    if (m.trend == gate_trend::RISING) trend.value = 1.0;
    else if (m.trend == gate_trend::FALLING) trend.value = -1.0;
    else if (m.trend == gate_trend::FLAT) trend.value = 0.0;
    out.push_back(std::move(trend));
    return out;
}

// ---------------------------------------------------------------------------
// DueSample — a (candidate, offset) whose sampling instant has passed
// ---------------------------------------------------------------------------
struct DueSample {
    int64_t candidate_id = 0;
    int minute_offset = 0;
    uint64_t sample_ts = 0;
};

// ---------------------------------------------------------------------------
// TrailRecorder — per-minute feature capture for GO-gated candidates.
//
// Offsets run 0..tracking_window_minutes-1, due at signal_ts + offset min.
// Sections are sampled independently, each under section_timeout_ms; a
// failing section contributes nulls and never aborts the others. Every write
// is keyed by (candidate, offset, column), so re-sampling is harmless.
// ---------------------------------------------------------------------------
class TrailRecorder {
public:
    TrailRecorder(TrailConfig config, double good_trade_threshold_pct,
                  std::shared_ptr<TradeStore> store,
                  std::vector<std::shared_ptr<const FeatureSection>> sections)
        : config_(std::move(config)),
          good_trade_threshold_pct_(good_trade_threshold_pct),
          store_(std::move(store)),
          sections_(std::move(sections)) {
        config_.validate();
    }

    const TrailConfig& config() const { return config_; }

    // Re-register candidates left open by a previous process.
    int resume() {
        auto open = store_->open_tracked_candidates();
        std::lock_guard<std::mutex> lock(mu_);
        for (auto& c : open) tracked_[c.id] = c;
        return static_cast<int>(open.size());
    }

    // Only gate-approved candidates are tracked. Anything else is a no-op.
    bool begin_tracking(const TradeCandidate& candidate) {
        if (candidate.decision != Decision::GO) {
            std::cout << "[trail] candidate=" << candidate.id << " not tracked (decision "
                      << decision_str(candidate.decision) << ")\n";
            return false;
        }
        if (candidate.is_resolved()) {
            std::cout << "[trail] candidate=" << candidate.id << " not tracked (already "
                      << status_str(candidate.status) << ")\n";
            return false;
        }
        store_->mark_tracking(candidate.id);
        std::lock_guard<std::mutex> lock(mu_);
        tracked_[candidate.id] = candidate;
        return true;
    }

    bool is_tracking(int64_t candidate_id) const {
        std::lock_guard<std::mutex> lock(mu_);
        return tracked_.count(candidate_id) > 0;
    }

    size_t tracked_count() const {
        std::lock_guard<std::mutex> lock(mu_);
        return tracked_.size();
    }

    uint64_t sample_ts(const TradeCandidate& c, int minute_offset) const {
        return c.signal_ts + time_utils::minutes_ns(minute_offset);
    }

    // Capture every section not yet stored at this offset. Returns the number
    // of rows written; 0 when the offset was already complete.
    //
    // With a deadline, each section waits at most the budget left on it, and
    // sections reached after it expires are not sampled (nor written), so the
    // tracking loop picks them up later.
    int sample(const TradeCandidate& candidate, int minute_offset,
               const Deadline* deadline = nullptr) {
        if (minute_offset < 0 || minute_offset >= config_.tracking_window_minutes) {
            throw std::out_of_range("minute_offset " + std::to_string(minute_offset) +
                                    " outside tracking window");
        }
        uint64_t ts = sample_ts(candidate, minute_offset);
        auto existing = store_->trail_at(candidate.id, minute_offset);

        std::vector<TrailValue> rows;
        for (const auto& section : sections_) {
            auto cols = section->columns();
            bool complete = std::all_of(cols.begin(), cols.end(), [&](const std::string& c) {
                return existing.count(c) > 0;
            });
            if (complete) continue;

            int timeout_ms = config_.section_timeout_ms;
            if (deadline) {
                timeout_ms = std::min(timeout_ms, deadline->remaining_ms());
                if (timeout_ms <= 0) {
                    std::cerr << "[trail] candidate=" << candidate.id << " offset="
                              << minute_offset << " budget exhausted before section "
                              << section->name() << "\n";
                    break;
                }
            }

            SectionValues values;
            try {
                auto sec = section;
                TradeCandidate cand = candidate;
                values = run_with_timeout<SectionValues>(
                    [sec, cand, minute_offset, ts]() {
                        return sec->sample(cand, minute_offset, ts);
                    },
                    timeout_ms, section->name());
            } catch (const std::exception& e) {
                std::cerr << "[trail] candidate=" << candidate.id << " offset=" << minute_offset
                          << " section " << section->name() << " unavailable: " << e.what()
                          << "\n";
                values.clear();
            } catch (...) {
                std::cerr << "[trail] candidate=" << candidate.id << " offset=" << minute_offset
                          << " section " << section->name()
                          << " unavailable: unknown exception\n";
                values.clear();
            }

            for (const auto& col : cols) {
                TrailValue v;
                v.candidate_id = candidate.id;
                v.minute_offset = minute_offset;
                v.column_name = col;
                v.section = section->name();
                auto found = values.find(col);
                if (found != values.end() && found->second && std::isfinite(*found->second)) {
                    v.value = found->second;
                }
                rows.push_back(std::move(v));
            }
        }
        return store_->write_trail(rows);
    }

    // Optional: persist the gate's pre-entry metrics so the miner can use them.
    int record_gate_metrics(const TradeCandidate& candidate, const GateMetrics& metrics) {
        if (!config_.persist_gate_metrics) return 0;
        return store_->write_trail(gate_metric_values(candidate.id, metrics));
    }

    // Offsets of tracked candidates that are due at `now` and not yet written.
    std::vector<DueSample> due_samples(uint64_t now) const {
        std::vector<TradeCandidate> tracked = snapshot();
        std::vector<DueSample> out;
        for (const auto& c : tracked) {
            auto written = store_->trail_offsets(c.id);
            for (int off = 0; off < config_.tracking_window_minutes; ++off) {
                uint64_t ts = sample_ts(c, off);
                if (ts > now) break;
                // Offset 0 may already hold the pre-entry columns only.
                if (std::binary_search(written.begin(), written.end(), off) &&
                    (off != 0 || offset_complete(c.id, off))) {
                    continue;
                }
                out.push_back(DueSample{c.id, off, ts});
            }
        }
        return out;
    }

    // Sample everything due, then expire candidates whose window has elapsed.
    // Returns the number of offsets sampled. A failed write skips that one
    // sample; it stays due and is retried on the next tick.
    int tick(uint64_t now) {
        int sampled = 0;
        for (const auto& due : due_samples(now)) {
            auto c = tracked_candidate(due.candidate_id);
            if (!c) continue;
            try {
                sample(*c, due.minute_offset);
                ++sampled;
            } catch (const std::exception& e) {
                std::cerr << "[trail] candidate=" << due.candidate_id << " offset="
                          << due.minute_offset << " sample failed: " << e.what() << "\n";
            }
        }
        for (const auto& c : snapshot()) {
            if (now < sample_ts(c, config_.tracking_window_minutes)) continue;
            try {
                finalize(c, std::nullopt, CandidateStatus::MISSED, now);
            } catch (const std::exception& e) {
                std::cerr << "[trail] candidate=" << c.id << " expiry failed: " << e.what()
                          << "\n";
            }
        }
        return sampled;
    }

    // Stop tracking and resolve the candidate. A missed candidate without an
    // explicit outcome gets one derived from its own trail.
    bool finalize(const TradeCandidate& candidate, std::optional<TradeOutcome> outcome,
                  CandidateStatus status, uint64_t closed_at) {
        if (!outcome && status == CandidateStatus::MISSED) {
            outcome = derive_outcome(candidate);
        }
        bool resolved = store_->resolve_candidate(candidate.id, status, outcome, closed_at,
                                                  good_trade_threshold_pct_);
        {
            std::lock_guard<std::mutex> lock(mu_);
            tracked_.erase(candidate.id);
        }
        std::cout << "[trail] candidate=" << candidate.id << " finalized status="
                  << status_str(status);
        if (outcome) {
            std::cout << " gain=" << outcome->final_gain_pct
                      << " max_favorable=" << outcome->max_favorable_pct;
        }
        if (!resolved) std::cout << " (already resolved)";
        std::cout << "\n";
        return resolved;
    }

    // Final gain from the last recorded close; max favorable from the highest
    // recorded high. nullopt when no price samples exist.
    std::optional<TradeOutcome> derive_outcome(const TradeCandidate& candidate) const {
        if (candidate.entry_price <= 0.0) return std::nullopt;
        std::optional<double> last_close;
        std::optional<double> max_high;
        int last_close_offset = -1;
        for (const auto& v : store_->trail(candidate.id)) {
            if (!v.value) continue;
            if (v.column_name == "pm_close_price" && v.minute_offset > last_close_offset) {
                last_close = v.value;
                last_close_offset = v.minute_offset;
            } else if (v.column_name == "pm_high_price") {
                max_high = max_high ? std::max(*max_high, *v.value) : *v.value;
            }
        }
        if (!last_close) return std::nullopt;
        TradeOutcome o;
        o.final_gain_pct = (*last_close - candidate.entry_price) / candidate.entry_price * 100.0;
        double peak = max_high ? std::max(*max_high, *last_close) : *last_close;
        o.max_favorable_pct = (peak - candidate.entry_price) / candidate.entry_price * 100.0;
        return o;
    }

private:
    bool offset_complete(int64_t candidate_id, int minute_offset) const {
        auto existing = store_->trail_at(candidate_id, minute_offset);
        for (const auto& section : sections_) {
            for (const auto& col : section->columns()) {
                if (!existing.count(col)) return false;
            }
        }
        return true;
    }

    std::vector<TradeCandidate> snapshot() const {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<TradeCandidate> out;
        out.reserve(tracked_.size());
        for (const auto& [id, c] : tracked_) out.push_back(c);
        return out;
    }

    std::optional<TradeCandidate> tracked_candidate(int64_t id) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = tracked_.find(id);
        if (it == tracked_.end()) return std::nullopt;
        return it->second;
    }

    TrailConfig config_;
    double good_trade_threshold_pct_;
    std::shared_ptr<TradeStore> store_;
    std::vector<std::shared_ptr<const FeatureSection>> sections_;

    mutable std::mutex mu_;
    std::map<int64_t, TradeCandidate> tracked_;
};
