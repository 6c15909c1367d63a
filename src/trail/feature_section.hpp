#pragma once

#include "candidate/trade_candidate.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DataUnavailable — a provider had nothing for the requested instant.
// The recorder nulls the section; it never aborts the trail.
// ---------------------------------------------------------------------------
class DataUnavailable : public std::runtime_error {
public:
    explicit DataUnavailable(const std::string& what) : std::runtime_error(what) {}
};

using SectionValues = std::map<std::string, std::optional<double>>;

// ---------------------------------------------------------------------------
// FeatureSection — one named group of trail columns sharing a prefix.
//
// sample() runs on a worker thread under the recorder's per-section timeout,
// so implementations hold their providers by shared_ptr and keep no mutable
// state. Columns absent from the returned map are stored as null.
// ---------------------------------------------------------------------------
class FeatureSection {
public:
    virtual ~FeatureSection() = default;

    virtual std::string name() const = 0;
    virtual std::string prefix() const = 0;

    // Fully prefixed column names, stable across calls.
    virtual std::vector<std::string> columns() const = 0;

    virtual SectionValues sample(const TradeCandidate& candidate, int minute_offset,
                                 uint64_t sample_ts) const = 0;
};
