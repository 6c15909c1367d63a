#pragma once

#include "time_utils.hpp"
#include "trail/feature_section.hpp"
#include "trail/trail_types.hpp"

#include <cmath>
#include <numbers>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SessionSection — time-of-day encoding and age of the trade (ss_)
// ---------------------------------------------------------------------------
class SessionSection : public FeatureSection {
public:
    std::string name() const override { return trail_section::SESSION; }
    std::string prefix() const override { return "ss_"; }

    std::vector<std::string> columns() const override {
        return {"ss_hour_sin", "ss_hour_cos", "ss_minutes_since_signal"};
    }

    SectionValues sample(const TradeCandidate& candidate, int /*minute_offset*/,
                         uint64_t sample_ts) const override {
        double hour = time_utils::compute_hour_of_day(sample_ts);
        double angle = 2.0 * std::numbers::pi * hour / 24.0;
        SectionValues v;
        v["ss_hour_sin"] = std::sin(angle);
        v["ss_hour_cos"] = std::cos(angle);
        v["ss_minutes_since_signal"] = time_utils::elapsed_minutes(candidate.signal_ts, sample_ts);
        return v;
    }
};
