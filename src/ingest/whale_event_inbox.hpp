#pragma once

#include "ingest/whale_event.hpp"
#include "store/trade_store.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

// ---------------------------------------------------------------------------
// WhaleEventInbox — receiving end of the on-chain webhook.
// The provider retries deliveries; a repeated signature is accepted silently.
// ---------------------------------------------------------------------------
class WhaleEventInbox {
public:
    explicit WhaleEventInbox(std::shared_ptr<TradeStore> store) : store_(std::move(store)) {}

    // True when the event was new, false for a duplicate delivery.
    bool accept(const WhaleEvent& event) {
        if (event.signature.empty()) {
            throw std::invalid_argument("whale event without signature");
        }
        if (event.direction != 1 && event.direction != -1) {
            throw std::invalid_argument("whale event direction must be +1 or -1");
        }
        bool inserted = store_->insert_whale_event(event);
        if (!inserted) {
            std::cout << "[ingest] duplicate whale event " << event.signature << " ignored\n";
        }
        return inserted;
    }

private:
    std::shared_ptr<TradeStore> store_;
};
