#pragma once

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// WhaleEvent — confirmed on-chain movement delivered by the webhook.
// signature is the transaction signature and identifies the event.
// ---------------------------------------------------------------------------
struct WhaleEvent {
    std::string signature;
    std::string wallet;
    uint64_t ts = 0;
    int direction = 0;           // +1 = inflow (accumulation), -1 = outflow
    double sol_amount = 0.0;
    double wallet_pct_moved = 0.0;
};
