#pragma once

#include <algorithm>
#include <cstdint>
#include <deque>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PricePoint — one spot quote from the aggregator
// ---------------------------------------------------------------------------
struct PricePoint {
    uint64_t ts = 0;
    double price = 0.0;
};

// ---------------------------------------------------------------------------
// PriceSource — quote lookup consumed by the gate and the price sections.
// Implementations may block; callers wrap them in run_with_timeout.
// ---------------------------------------------------------------------------
class PriceSource {
public:
    virtual ~PriceSource() = default;

    // Quotes with from_ts <= ts <= to_ts, ascending by ts.
    virtual std::vector<PricePoint> prices(const std::string& symbol,
                                           uint64_t from_ts, uint64_t to_ts) const = 0;
};

// ---------------------------------------------------------------------------
// price_series — helpers over an ascending PricePoint series
// ---------------------------------------------------------------------------
namespace price_series {

// First quote inside [target - half_window, target + half_window].
inline std::optional<double> first_in_window(const std::vector<PricePoint>& series,
                                             uint64_t target_ts, uint64_t half_window_ns) {
    uint64_t lo = target_ts > half_window_ns ? target_ts - half_window_ns : 0;
    uint64_t hi = target_ts + half_window_ns;
    auto it = std::lower_bound(series.begin(), series.end(), lo,
                               [](const PricePoint& p, uint64_t ts) { return p.ts < ts; });
    if (it != series.end() && it->ts <= hi) return it->price;
    return std::nullopt;
}

// Last quote at or before ts.
inline std::optional<double> last_at_or_before(const std::vector<PricePoint>& series, uint64_t ts) {
    auto it = std::upper_bound(series.begin(), series.end(), ts,
                               [](uint64_t t, const PricePoint& p) { return t < p.ts; });
    if (it == series.begin()) return std::nullopt;
    return std::prev(it)->price;
}

inline std::vector<PricePoint> slice(const std::vector<PricePoint>& series,
                                     uint64_t from_ts, uint64_t to_ts) {
    std::vector<PricePoint> out;
    for (const auto& p : series) {
        if (p.ts >= from_ts && p.ts <= to_ts) out.push_back(p);
    }
    return out;
}

inline double pct_change(double from, double to) {
    return (to - from) / from * 100.0;
}

}  // namespace price_series

// ---------------------------------------------------------------------------
// PriceTape — thread-safe in-process tape fed by the ingestion connector.
// Keeps at most retention_ns of history per symbol.
// ---------------------------------------------------------------------------
class PriceTape : public PriceSource {
public:
    explicit PriceTape(uint64_t retention_ns) : retention_ns_(retention_ns) {}

    void push(const std::string& symbol, uint64_t ts, double price) {
        std::lock_guard<std::mutex> lock(mu_);
        auto& tape = tapes_[symbol];
        if (!tape.empty() && ts < tape.back().ts) {
            // Late quote: insert in order so lookups stay sorted.
            auto it = std::upper_bound(tape.begin(), tape.end(), ts,
                                       [](uint64_t t, const PricePoint& p) { return t < p.ts; });
            tape.insert(it, PricePoint{ts, price});
        } else {
            tape.push_back(PricePoint{ts, price});
        }
        uint64_t newest = tape.back().ts;
        while (!tape.empty() && newest - tape.front().ts > retention_ns_) {
            tape.pop_front();
        }
    }

    std::vector<PricePoint> prices(const std::string& symbol,
                                   uint64_t from_ts, uint64_t to_ts) const override {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<PricePoint> out;
        auto found = tapes_.find(symbol);
        if (found == tapes_.end()) return out;
        for (const auto& p : found->second) {
            if (p.ts >= from_ts && p.ts <= to_ts) out.push_back(p);
        }
        return out;
    }

    size_t size(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto found = tapes_.find(symbol);
        return found == tapes_.end() ? 0 : found->second.size();
    }

private:
    uint64_t retention_ns_;
    mutable std::mutex mu_;
    std::map<std::string, std::deque<PricePoint>> tapes_;
};
