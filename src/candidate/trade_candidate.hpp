#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Decision / status vocabularies
// ---------------------------------------------------------------------------
enum class Decision { PENDING, GO, NO_GO };

enum class CandidateStatus { OPEN, CLOSED, CANCELLED, MISSED };

enum class OutcomeLabel { UNLABELED, GOOD, BAD };

namespace decision_reason {
    constexpr const char* PASS                      = "PASS";
    constexpr const char* FALLING_OR_WEAK_MOMENTUM  = "FALLING_OR_WEAK_MOMENTUM";
    constexpr const char* NO_PRICE_DATA             = "NO_PRICE_DATA";
    constexpr const char* GATE_ERROR                = "GATE_ERROR";
    constexpr const char* RULE_SET_PASSED           = "RULE_SET_PASSED";
    constexpr const char* ALL_RULE_SETS_FAILED      = "ALL_RULE_SETS_FAILED";
    constexpr const char* NO_ACTIVE_RULE_SET        = "NO_ACTIVE_RULE_SET";
    constexpr const char* VALIDATOR_ERROR           = "VALIDATOR_ERROR";
    constexpr const char* ALREADY_DECIDED           = "ALREADY_DECIDED";
}  // namespace decision_reason

// ---------------------------------------------------------------------------
// TradeOutcome — realized result attached at resolution
// ---------------------------------------------------------------------------
struct TradeOutcome {
    double final_gain_pct = 0.0;
    double max_favorable_pct = 0.0;
};

// ---------------------------------------------------------------------------
// TradeCandidate — one evaluated entry opportunity, signal to resolution
// ---------------------------------------------------------------------------
struct TradeCandidate {
    int64_t id = 0;
    uint64_t signal_ts = 0;
    double entry_price = 0.0;
    std::string wallet_id;
    std::string symbol = "SOL";

    Decision decision = Decision::PENDING;
    std::string decision_reason;      // structured JSON rationale
    std::string rule_set_version;
    CandidateStatus status = CandidateStatus::OPEN;

    std::optional<double> realized_gain_pct;
    std::optional<double> max_favorable_pct;
    uint64_t closed_at = 0;
    OutcomeLabel label = OutcomeLabel::UNLABELED;

    bool is_resolved() const { return status != CandidateStatus::OPEN; }
};

// ---------------------------------------------------------------------------
// Labeling: good iff the realized gain reaches the threshold.
// ---------------------------------------------------------------------------
inline OutcomeLabel label_outcome(double realized_gain_pct, double good_trade_threshold_pct) {
    if (std::isnan(realized_gain_pct)) return OutcomeLabel::UNLABELED;
    return realized_gain_pct >= good_trade_threshold_pct ? OutcomeLabel::GOOD : OutcomeLabel::BAD;
}

inline const char* decision_str(Decision d) {
    switch (d) {
        case Decision::GO:      return "GO";
        case Decision::NO_GO:   return "NO_GO";
        case Decision::PENDING: return "PENDING";
    }
    return "PENDING";
}

inline Decision decision_from_str(const std::string& s) {
    if (s == "GO") return Decision::GO;
    if (s == "NO_GO") return Decision::NO_GO;
    return Decision::PENDING;
}

inline const char* status_str(CandidateStatus s) {
    switch (s) {
        case CandidateStatus::OPEN:      return "open";
        case CandidateStatus::CLOSED:    return "closed";
        case CandidateStatus::CANCELLED: return "cancelled";
        case CandidateStatus::MISSED:    return "missed";
    }
    return "open";
}

inline CandidateStatus status_from_str(const std::string& s) {
    if (s == "closed") return CandidateStatus::CLOSED;
    if (s == "cancelled") return CandidateStatus::CANCELLED;
    if (s == "missed") return CandidateStatus::MISSED;
    return CandidateStatus::OPEN;
}

inline const char* label_str(OutcomeLabel l) {
    switch (l) {
        case OutcomeLabel::GOOD:      return "good";
        case OutcomeLabel::BAD:       return "bad";
        case OutcomeLabel::UNLABELED: return "";
    }
    return "";
}

inline OutcomeLabel label_from_str(const std::string& s) {
    if (s == "good") return OutcomeLabel::GOOD;
    if (s == "bad") return OutcomeLabel::BAD;
    return OutcomeLabel::UNLABELED;
}
