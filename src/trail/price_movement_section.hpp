#pragma once

#include "market/price_source.hpp"
#include "time_utils.hpp"
#include "trail/feature_section.hpp"
#include "trail/trail_types.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PriceMovementSection — one-minute candle and momentum for a symbol.
//
// Used for the traded asset (pm_) and, with another symbol and prefix, for
// the BTC / ETH cross-asset sections (btc_, eth_). The candle covers quotes
// in (sample_ts - 60 s, sample_ts].
// ---------------------------------------------------------------------------
class PriceMovementSection : public FeatureSection {
public:
    PriceMovementSection(std::string name, std::string prefix, std::string symbol,
                         std::shared_ptr<const PriceSource> source)
        : name_(std::move(name)), prefix_(std::move(prefix)),
          symbol_(std::move(symbol)), source_(std::move(source)) {}

    std::string name() const override { return name_; }
    std::string prefix() const override { return prefix_; }

    std::vector<std::string> columns() const override {
        std::vector<std::string> out;
        for (const char* c : COLUMN_SUFFIXES) out.push_back(prefix_ + c);
        return out;
    }

    SectionValues sample(const TradeCandidate& candidate, int /*minute_offset*/,
                         uint64_t sample_ts) const override {
        const std::string& symbol = symbol_.empty() ? candidate.symbol : symbol_;
        uint64_t from = time_utils::minus_ns(sample_ts, time_utils::minutes_ns(HISTORY_MINUTES));
        auto series = source_->prices(symbol, from, sample_ts);

        uint64_t candle_start = time_utils::minus_ns(sample_ts, time_utils::NS_PER_MIN);
        std::vector<double> candle;
        for (const auto& p : series) {
            if (p.ts > candle_start && p.ts <= sample_ts) candle.push_back(p.price);
        }
        if (candle.empty()) {
            throw DataUnavailable(symbol + ": no quotes in the minute before sample");
        }

        double open = candle.front();
        double close = candle.back();
        double high = *std::max_element(candle.begin(), candle.end());
        double low = *std::min_element(candle.begin(), candle.end());

        double mean = 0.0;
        for (double p : candle) mean += p;
        mean /= static_cast<double>(candle.size());
        double var = 0.0;
        for (double p : candle) var += (p - mean) * (p - mean);
        double stddev = std::sqrt(var / static_cast<double>(candle.size()));

        SectionValues v;
        v[prefix_ + "open_price"] = open;
        v[prefix_ + "high_price"] = high;
        v[prefix_ + "low_price"] = low;
        v[prefix_ + "close_price"] = close;
        v[prefix_ + "volatility_pct"] = (high - low) / open * 100.0;
        v[prefix_ + "price_stddev_pct"] = mean > 0.0 ? stddev / mean * 100.0 : 0.0;
        v[prefix_ + "candle_body_pct"] = (close - open) / open * 100.0;
        v[prefix_ + "upper_wick_pct"] = (high - std::max(open, close)) / open * 100.0;
        v[prefix_ + "lower_wick_pct"] = (std::min(open, close) - low) / open * 100.0;

        for (int m : {1, 5, 10}) {
            auto then = price_series::last_at_or_before(
                series, time_utils::minus_ns(sample_ts, time_utils::minutes_ns(m)));
            v[prefix_ + "price_change_" + std::to_string(m) + "m"] =
                then ? std::optional<double>(price_series::pct_change(*then, close))
                     : std::nullopt;
        }

        // Moving average of the last close of each of the five most recent minutes.
        double ma_sum = 0.0;
        int ma_n = 0;
        for (int k = 0; k < 5; ++k) {
            auto p = price_series::last_at_or_before(
                series, time_utils::minus_ns(sample_ts, time_utils::minutes_ns(k)));
            if (p) {
                ma_sum += *p;
                ++ma_n;
            }
        }
        v[prefix_ + "price_vs_ma5_pct"] =
            ma_n > 0 ? std::optional<double>((close - ma_sum / ma_n) / (ma_sum / ma_n) * 100.0)
                     : std::nullopt;
        return v;
    }

private:
    static constexpr int HISTORY_MINUTES = 11;
    static constexpr const char* COLUMN_SUFFIXES[] = {
        "price_change_1m", "price_change_5m", "price_change_10m",
        "volatility_pct",  "open_price",      "high_price",
        "low_price",       "close_price",     "price_stddev_pct",
        "candle_body_pct", "upper_wick_pct",  "lower_wick_pct",
        "price_vs_ma5_pct",
    };

    std::string name_;
    std::string prefix_;
    std::string symbol_;  // empty = candidate's own symbol
    std::shared_ptr<const PriceSource> source_;
};

inline std::shared_ptr<FeatureSection> make_price_movement_section(
    std::shared_ptr<const PriceSource> source) {
    return std::make_shared<PriceMovementSection>(trail_section::PRICE_MOVEMENTS, "pm_", "",
                                                  std::move(source));
}

inline std::shared_ptr<FeatureSection> make_btc_section(std::shared_ptr<const PriceSource> source) {
    return std::make_shared<PriceMovementSection>(trail_section::BTC_CORRELATION, "btc_", "BTC",
                                                  std::move(source));
}

inline std::shared_ptr<FeatureSection> make_eth_section(std::shared_ptr<const PriceSource> source) {
    return std::make_shared<PriceMovementSection>(trail_section::ETH_CORRELATION, "eth_", "ETH",
                                                  std::move(source));
}
