#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// OrderBookSnapshot — top levels of the external depth stream
// ---------------------------------------------------------------------------
constexpr int BOOK_DEPTH = 10;

struct OrderBookSnapshot {
    uint64_t ts = 0;
    std::array<std::array<double, 2>, BOOK_DEPTH> bids{};  // [price, size], best first
    std::array<std::array<double, 2>, BOOK_DEPTH> asks{};
    int bid_levels = 0;
    int ask_levels = 0;

    double best_bid() const { return bid_levels > 0 ? bids[0][0] : 0.0; }
    double best_ask() const { return ask_levels > 0 ? asks[0][0] : 0.0; }
    double mid_price() const { return (best_bid() + best_ask()) / 2.0; }
};

// ---------------------------------------------------------------------------
// OrderBookSource — latest book for a symbol; nullopt when the stream is stale
// ---------------------------------------------------------------------------
class OrderBookSource {
public:
    virtual ~OrderBookSource() = default;
    virtual std::optional<OrderBookSnapshot> latest(const std::string& symbol,
                                                    uint64_t at_ts) const = 0;
};
