#pragma once

#include "candidate/trade_candidate.hpp"
#include "trail/trail_types.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// OffsetSlice — all candidates observed at one minute offset.
// Column vectors are aligned with `gains`; NaN marks a null or absent value.
// ---------------------------------------------------------------------------
struct OffsetSlice {
    int minute_offset = 0;
    std::vector<int64_t> candidate_ids;
    std::vector<double> gains;
    std::map<std::string, std::vector<double>> columns;
    std::map<std::string, std::string> sections;  // column -> section

    size_t size() const { return gains.size(); }
};

// ---------------------------------------------------------------------------
// LabeledDataset — resolved candidates x trail, relabeled at `threshold`
// ---------------------------------------------------------------------------
struct LabeledDataset {
    double threshold = 0.0;
    int candidate_count = 0;
    int good_count = 0;
    int bad_count = 0;
    std::map<int, OffsetSlice> offsets;

    bool is_good(double gain) const { return gain >= threshold; }
};

// Pivot long trail rows into per-offset columns. Candidates without a
// realized gain are skipped; a missing offset only drops that offset.
inline LabeledDataset build_labeled_dataset(const std::vector<TradeCandidate>& candidates,
                                            const std::vector<TrailValue>& trail,
                                            double good_trade_threshold_pct,
                                            int max_offset) {
    LabeledDataset ds;
    ds.threshold = good_trade_threshold_pct;

    std::map<int64_t, double> gain_by_id;
    for (const auto& c : candidates) {
        if (!c.realized_gain_pct || std::isnan(*c.realized_gain_pct)) continue;
        gain_by_id[c.id] = *c.realized_gain_pct;
        ++ds.candidate_count;
        if (ds.is_good(*c.realized_gain_pct)) ++ds.good_count;
        else ++ds.bad_count;
    }

    // offset -> candidate -> column -> value
    std::map<int, std::map<int64_t, std::map<std::string, double>>> grid;
    std::map<std::string, std::string> sections;
    for (const auto& v : trail) {
        if (v.minute_offset < 0 || v.minute_offset > max_offset) continue;
        if (!gain_by_id.count(v.candidate_id)) continue;
        grid[v.minute_offset][v.candidate_id][v.column_name] =
            v.value ? *v.value : std::numeric_limits<double>::quiet_NaN();
        sections[v.column_name] = v.section;
    }

    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
    for (auto& [offset, by_candidate] : grid) {
        OffsetSlice slice;
        slice.minute_offset = offset;
        for (const auto& [id, cols] : by_candidate) {
            for (const auto& [name, value] : cols) {
                (void)value;
                if (!slice.columns.count(name)) {
                    slice.columns[name] = {};
                    slice.sections[name] = sections[name];
                }
            }
        }
        for (auto& [name, vec] : slice.columns) vec.reserve(by_candidate.size());
        for (const auto& [id, cols] : by_candidate) {
            slice.candidate_ids.push_back(id);
            slice.gains.push_back(gain_by_id[id]);
            for (auto& [name, vec] : slice.columns) {
                auto it = cols.find(name);
                vec.push_back(it == cols.end() ? NaN : it->second);
            }
        }
        ds.offsets[offset] = std::move(slice);
    }
    return ds;
}
