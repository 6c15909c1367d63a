#pragma once

#include "store/trade_store.hpp"
#include "time_utils.hpp"
#include "trail/feature_section.hpp"
#include "trail/trail_types.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// WhaleActivitySection — aggregated whale flow over the trailing window (wh_).
// A quiet window is a valid reading: counts and volumes are zero and the
// ratios are null.
// ---------------------------------------------------------------------------
class WhaleActivitySection : public FeatureSection {
public:
    WhaleActivitySection(std::shared_ptr<TradeStore> store, int window_minutes = 5)
        : store_(std::move(store)), window_minutes_(window_minutes) {}

    std::string name() const override { return trail_section::WHALE_ACTIVITY; }
    std::string prefix() const override { return "wh_"; }

    std::vector<std::string> columns() const override {
        return {"wh_inflow_sol",      "wh_outflow_sol",       "wh_net_flow_sol",
                "wh_inflow_count",    "wh_outflow_count",     "wh_net_flow_ratio",
                "wh_accumulation_ratio", "wh_max_wallet_pct_moved"};
    }

    SectionValues sample(const TradeCandidate& /*candidate*/, int /*minute_offset*/,
                         uint64_t sample_ts) const override {
        uint64_t from = time_utils::minus_ns(sample_ts, time_utils::minutes_ns(window_minutes_));
        auto events = store_->whale_events(from, sample_ts);

        double inflow = 0.0, outflow = 0.0, max_pct = 0.0;
        int in_n = 0, out_n = 0;
        for (const auto& e : events) {
            if (e.direction > 0) {
                inflow += e.sol_amount;
                ++in_n;
            } else {
                outflow += e.sol_amount;
                ++out_n;
            }
            max_pct = std::max(max_pct, e.wallet_pct_moved);
        }

        SectionValues v;
        v["wh_inflow_sol"] = inflow;
        v["wh_outflow_sol"] = outflow;
        v["wh_net_flow_sol"] = inflow - outflow;
        v["wh_inflow_count"] = static_cast<double>(in_n);
        v["wh_outflow_count"] = static_cast<double>(out_n);
        if (inflow + outflow > 0.0) {
            v["wh_net_flow_ratio"] = (inflow - outflow) / (inflow + outflow);
        }
        if (in_n + out_n > 0) {
            v["wh_accumulation_ratio"] = static_cast<double>(in_n) / (in_n + out_n);
            v["wh_max_wallet_pct_moved"] = max_pct;
        }
        return v;
    }

private:
    std::shared_ptr<TradeStore> store_;
    int window_minutes_;
};
