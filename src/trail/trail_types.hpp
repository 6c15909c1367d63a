#pragma once

#include <cstdint>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// TrailValue — one (candidate, minute offset, column) reading.
// value is empty when the owning section was unavailable at capture time.
// ---------------------------------------------------------------------------
struct TrailValue {
    int64_t candidate_id = 0;
    int minute_offset = 0;
    std::string column_name;
    std::optional<double> value;
    std::string section;
};

// Section names and their column prefixes.
namespace trail_section {
    constexpr const char* PRICE_MOVEMENTS = "price_movements";
    constexpr const char* ORDER_BOOK      = "order_book";
    constexpr const char* WHALE_ACTIVITY  = "whale_activity";
    constexpr const char* SESSION         = "session";
    constexpr const char* BTC_CORRELATION = "btc_correlation";
    constexpr const char* ETH_CORRELATION = "eth_correlation";
    constexpr const char* PRE_ENTRY       = "pre_entry";
}  // namespace trail_section
