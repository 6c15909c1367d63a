#pragma once

#include "market/order_book_source.hpp"
#include "trail/feature_section.hpp"
#include "trail/trail_types.hpp"

#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// OrderBookSection — depth and imbalance signals from the latest book (ob_)
// ---------------------------------------------------------------------------
class OrderBookSection : public FeatureSection {
public:
    explicit OrderBookSection(std::shared_ptr<const OrderBookSource> source)
        : source_(std::move(source)) {}

    std::string name() const override { return trail_section::ORDER_BOOK; }
    std::string prefix() const override { return "ob_"; }

    std::vector<std::string> columns() const override {
        return {"ob_mid_price",          "ob_spread_bps",
                "ob_volume_imbalance",   "ob_depth_imbalance_ratio",
                "ob_bid_liquidity_share_pct", "ob_total_liquidity",
                "ob_microprice_deviation"};
    }

    SectionValues sample(const TradeCandidate& candidate, int /*minute_offset*/,
                         uint64_t sample_ts) const override {
        auto book = source_->latest(candidate.symbol, sample_ts);
        if (!book || book->bid_levels == 0 || book->ask_levels == 0) {
            throw DataUnavailable("order book unavailable for " + candidate.symbol);
        }

        double bid_vol = 0.0, ask_vol = 0.0, bid_usd = 0.0, ask_usd = 0.0;
        for (int i = 0; i < book->bid_levels && i < BOOK_DEPTH; ++i) {
            bid_vol += book->bids[i][1];
            bid_usd += book->bids[i][0] * book->bids[i][1];
        }
        for (int i = 0; i < book->ask_levels && i < BOOK_DEPTH; ++i) {
            ask_vol += book->asks[i][1];
            ask_usd += book->asks[i][0] * book->asks[i][1];
        }

        double bid = book->best_bid();
        double ask = book->best_ask();
        double mid = book->mid_price();

        SectionValues v;
        v["ob_mid_price"] = mid;
        v["ob_spread_bps"] = mid > 0.0 ? std::optional<double>((ask - bid) / mid * 10000.0)
                                       : std::nullopt;
        double vol = bid_vol + ask_vol;
        if (vol > 0.0) {
            v["ob_volume_imbalance"] = (bid_vol - ask_vol) / vol;
        }
        if (ask_vol > 0.0) {
            v["ob_depth_imbalance_ratio"] = bid_vol / ask_vol;
        }
        double usd = bid_usd + ask_usd;
        if (usd > 0.0) {
            v["ob_bid_liquidity_share_pct"] = bid_usd / usd * 100.0;
        }
        v["ob_total_liquidity"] = usd;

        double top_bid_size = book->bids[0][1];
        double top_ask_size = book->asks[0][1];
        if (top_bid_size + top_ask_size > 0.0 && mid > 0.0) {
            double micro = (bid * top_ask_size + ask * top_bid_size) /
                           (top_bid_size + top_ask_size);
            v["ob_microprice_deviation"] = (micro - mid) / mid * 100.0;
        }
        return v;
    }

private:
    std::shared_ptr<const OrderBookSource> source_;
};
