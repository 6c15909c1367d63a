#pragma once

#include "candidate/trade_candidate.hpp"
#include "gate/pre_entry_gate.hpp"
#include "validator/rule_set.hpp"

#include <cmath>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace decision_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            default:   result += c;
        }
    }
    return result;
}

inline std::string json_number(const std::optional<double>& v) {
    if (!v || !std::isfinite(*v)) return "null";
    std::ostringstream ss;
    ss.precision(10);
    ss << *v;
    return ss.str();
}

inline std::string gate_to_json(const GateResult& g) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"decision\":\"" << decision_str(g.decision) << "\"";
    ss << ",\"reason\":\"" << json_escape(g.reason) << "\"";
    ss << ",\"lookback_minutes\":" << g.lookback_minutes;
    ss << ",\"lookback_change_pct\":" << json_number(g.lookback_change_pct);
    ss << ",\"entry_price\":" << json_number(g.metrics.entry_price);
    ss << ",\"trend\":\"" << json_escape(g.metrics.trend) << "\"";
    for (int m : GATE_METRIC_MINUTES) {
        ss << ",\"change_" << m << "m\":" << json_number(g.metrics.change(m));
        auto p = g.metrics.price_at.find(m);
        ss << ",\"price_" << m << "m_ago\":"
           << json_number(p == g.metrics.price_at.end() ? std::nullopt : p->second);
    }
    if (!g.error.empty()) ss << ",\"error\":\"" << json_escape(g.error) << "\"";
    ss << "}";
    return ss.str();
}

inline std::string check_to_json(const FilterCheck& c) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"filter_id\":" << c.filter_id;
    ss << ",\"column\":\"" << json_escape(c.column_name) << "\"";
    ss << ",\"minute\":" << c.minute_offset;
    ss << ",\"from\":" << json_number(c.from_value);
    ss << ",\"to\":" << json_number(c.to_value);
    ss << ",\"actual\":" << json_number(c.actual_value);
    ss << ",\"passed\":" << (c.passed ? "true" : "false");
    if (!c.error.empty()) ss << ",\"error\":\"" << json_escape(c.error) << "\"";
    ss << "}";
    return ss.str();
}

inline std::string verdict_to_json(const RuleSetVerdict& v) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"rule_set_id\":" << v.rule_set_id;
    ss << ",\"version\":\"" << json_escape(v.version_tag) << "\"";
    ss << ",\"passed\":" << (v.passed ? "true" : "false");
    ss << ",\"filters_passed\":" << v.filters_passed;
    ss << ",\"filters_failed\":" << v.filters_failed;
    ss << ",\"filters\":[";
    for (size_t i = 0; i < v.checks.size(); ++i) {
        if (i > 0) ss << ",";
        ss << check_to_json(v.checks[i]);
    }
    ss << "]}";
    return ss.str();
}

// Full rationale persisted as the candidate's decision_reason.
inline std::string rationale_json(Decision decision, const std::string& reason,
                                  const std::string& rule_set_version, const GateResult& gate,
                                  const std::vector<RuleSetVerdict>& verdicts,
                                  const std::string& error) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"decision\":\"" << decision_str(decision) << "\"";
    ss << ",\"reason\":\"" << json_escape(reason) << "\"";
    ss << ",\"rule_set_version\":\"" << json_escape(rule_set_version) << "\"";
    ss << ",\"gate\":" << gate_to_json(gate);
    ss << ",\"rule_sets\":[";
    for (size_t i = 0; i < verdicts.size(); ++i) {
        if (i > 0) ss << ",";
        ss << verdict_to_json(verdicts[i]);
    }
    ss << "]";
    if (!error.empty()) ss << ",\"error\":\"" << json_escape(error) << "\"";
    ss << "}";
    return ss.str();
}

}  // namespace decision_io
