#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RuleFilter — one active threshold rule of a rule set
// ---------------------------------------------------------------------------
struct RuleFilter {
    int64_t id = 0;
    std::string column_name;
    std::string section;
    int minute_offset = 0;
    double from_value = 0.0;
    double to_value = 0.0;
};

// ---------------------------------------------------------------------------
// RuleSet — a named, versioned conjunction of filters ("project")
// ---------------------------------------------------------------------------
struct RuleSet {
    int64_t id = 0;
    std::string name;
    int version = 0;
    bool active = true;
    int64_t source_combination_id = 0;
    std::vector<RuleFilter> filters;

    std::string version_tag() const { return name + "@v" + std::to_string(version); }
};

// ---------------------------------------------------------------------------
// FilterCheck — audit of a single filter against a candidate's snapshot
// ---------------------------------------------------------------------------
struct FilterCheck {
    int64_t rule_set_id = 0;
    int64_t filter_id = 0;
    std::string column_name;
    int minute_offset = 0;
    double from_value = 0.0;
    double to_value = 0.0;
    std::optional<double> actual_value;
    bool passed = false;
    std::string error;   // "no_minute_data", "null_value", ...
};

// ---------------------------------------------------------------------------
// RuleSetVerdict — outcome of one rule set for one candidate
// ---------------------------------------------------------------------------
struct RuleSetVerdict {
    int64_t rule_set_id = 0;
    std::string version_tag;
    bool passed = false;
    int filters_passed = 0;
    int filters_failed = 0;
    std::vector<FilterCheck> checks;
};
