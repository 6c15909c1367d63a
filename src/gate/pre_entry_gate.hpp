#pragma once

#include "candidate/trade_candidate.hpp"
#include "engine_config.hpp"
#include "market/price_source.hpp"
#include "run_with_timeout.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GateMetrics — pre-entry price context, always emitted with a decision
// ---------------------------------------------------------------------------
constexpr std::array<int, 5> GATE_METRIC_MINUTES = {1, 2, 3, 5, 10};

namespace gate_trend {
    constexpr const char* RISING  = "rising";
    constexpr const char* FALLING = "falling";
    constexpr const char* FLAT    = "flat";
    constexpr const char* UNKNOWN = "unknown";
}  // namespace gate_trend

struct GateMetrics {
    double entry_price = 0.0;
    std::map<int, std::optional<double>> price_at;    // minutes back -> price
    std::map<int, std::optional<double>> change_pct;  // minutes back -> % change to entry
    std::string trend = gate_trend::UNKNOWN;

    std::optional<double> change(int minutes) const {
        auto it = change_pct.find(minutes);
        return it == change_pct.end() ? std::nullopt : it->second;
    }
};

// ---------------------------------------------------------------------------
// GateResult
// ---------------------------------------------------------------------------
struct GateResult {
    Decision decision = Decision::NO_GO;
    std::string reason = decision_reason::GATE_ERROR;
    GateMetrics metrics;
    int lookback_minutes = 0;
    std::optional<double> lookback_change_pct;
    std::string error;

    bool go() const { return decision == Decision::GO; }
};

// Rising when both short and medium momentum are clearly positive,
// falling when both are clearly negative.
inline std::string classify_trend(const std::optional<double>& change_1m,
                                  const std::optional<double>& change_5m) {
    if (!change_1m || !change_5m) return gate_trend::UNKNOWN;
    if (*change_1m > 0.05 && *change_5m > 0.1) return gate_trend::RISING;
    if (*change_1m < -0.05 && *change_5m < -0.1) return gate_trend::FALLING;
    return gate_trend::FLAT;
}

// ---------------------------------------------------------------------------
// PreEntryGate — fast momentum check run before any other validation.
//
// evaluate_series() is pure: identical inputs give identical results.
// evaluate() fetches prices from the source and bounds fetch + computation
// by timeout_ms. Neither variant lets an exception reach the caller of
// evaluate(); failures become NO_GO / GATE_ERROR.
// ---------------------------------------------------------------------------
class PreEntryGate {
public:
    PreEntryGate(GateConfig config, std::shared_ptr<const PriceSource> source)
        : config_(std::move(config)), source_(std::move(source)) {
        config_.validate();
    }

    const GateConfig& config() const { return config_; }

    // Throws std::invalid_argument on a non-positive / non-finite entry price
    // or a corrupt quote in the lookback window.
    static GateResult evaluate_series(const GateConfig& cfg, uint64_t signal_ts,
                                      double entry_price,
                                      const std::vector<PricePoint>& series) {
        if (!std::isfinite(entry_price) || entry_price <= 0.0) {
            throw std::invalid_argument("entry price must be positive and finite");
        }
        const uint64_t half_window = static_cast<uint64_t>(cfg.price_match_window_s) *
                                     time_utils::NS_PER_SEC / 2;

        auto price_back = [&](int minutes) -> std::optional<double> {
            uint64_t target = time_utils::minus_ns(signal_ts, time_utils::minutes_ns(minutes));
            auto p = price_series::first_in_window(series, target, half_window);
            if (p && (!std::isfinite(*p) || *p <= 0.0)) {
                throw std::invalid_argument("corrupt quote " + std::to_string(minutes) +
                                            "m before signal");
            }
            return p;
        };

        GateResult r;
        r.lookback_minutes = cfg.lookback_minutes;
        r.metrics.entry_price = entry_price;
        for (int m : GATE_METRIC_MINUTES) {
            auto p = price_back(m);
            r.metrics.price_at[m] = p;
            r.metrics.change_pct[m] = p ? std::optional<double>(
                                              price_series::pct_change(*p, entry_price))
                                        : std::nullopt;
        }
        r.metrics.trend = classify_trend(r.metrics.change(1), r.metrics.change(5));

        std::optional<double> lookback_price = r.metrics.price_at.count(cfg.lookback_minutes)
                                                   ? r.metrics.price_at[cfg.lookback_minutes]
                                                   : price_back(cfg.lookback_minutes);
        if (!lookback_price) {
            r.reason = decision_reason::NO_PRICE_DATA;
            r.decision = cfg.no_data_policy == GateConfig::NoDataPolicy::ALLOW
                             ? Decision::GO
                             : Decision::NO_GO;
            return r;
        }
        double change = price_series::pct_change(*lookback_price, entry_price);
        r.lookback_change_pct = change;
        if (change < cfg.min_change_pct) {
            r.decision = Decision::NO_GO;
            r.reason = decision_reason::FALLING_OR_WEAK_MOMENTUM;
        } else {
            r.decision = Decision::GO;
            r.reason = decision_reason::PASS;
        }
        return r;
    }

    GateResult evaluate(const TradeCandidate& candidate) const {
        GateResult result;
        try {
            auto source = source_;
            GateConfig cfg = config_;
            std::string symbol = candidate.symbol;
            uint64_t signal_ts = candidate.signal_ts;
            double entry = candidate.entry_price;
            result = run_with_timeout<GateResult>(
                [source, cfg, symbol, signal_ts, entry]() {
                    int span = std::max(cfg.lookback_minutes, GATE_METRIC_MINUTES.back());
                    uint64_t from = time_utils::minus_ns(
                        signal_ts, time_utils::minutes_ns(span) +
                                       static_cast<uint64_t>(cfg.price_match_window_s) *
                                           time_utils::NS_PER_SEC);
                    auto series = source->prices(symbol, from, signal_ts);
                    return evaluate_series(cfg, signal_ts, entry, series);
                },
                config_.timeout_ms, "pre-entry gate");
        } catch (const std::exception& e) {
            result = GateResult{};
            result.lookback_minutes = config_.lookback_minutes;
            result.metrics.entry_price = candidate.entry_price;
            result.error = e.what();
        } catch (...) {
            result = GateResult{};
            result.lookback_minutes = config_.lookback_minutes;
            result.metrics.entry_price = candidate.entry_price;
            result.error = "unknown exception";
        }
        log(candidate, result);
        return result;
    }

private:
    static void log(const TradeCandidate& c, const GateResult& r) {
        if (r.reason == decision_reason::NO_PRICE_DATA) {
            std::cerr << "[gate] WARNING candidate=" << c.id << " no price "
                      << r.lookback_minutes << "m before signal, policy -> "
                      << decision_str(r.decision) << "\n";
        }
        if (!r.error.empty()) {
            std::cerr << "[gate] ERROR candidate=" << c.id << " " << r.error
                      << " -> NO_GO " << r.reason << "\n";
            return;
        }
        std::cout << "[gate] candidate=" << c.id << " decision=" << decision_str(r.decision)
                  << " reason=" << r.reason;
        if (r.lookback_change_pct) {
            std::cout << " change_" << r.lookback_minutes << "m=" << *r.lookback_change_pct;
        }
        std::cout << " trend=" << r.metrics.trend << "\n";
    }

    GateConfig config_;
    std::shared_ptr<const PriceSource> source_;
};
