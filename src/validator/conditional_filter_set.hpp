#pragma once

#include "validator/rule_set.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// offset -> column -> value (nullopt = recorded as null)
using TrailView = std::map<int, std::map<std::string, std::optional<double>>>;

namespace filter_error {
    constexpr const char* NO_MINUTE_DATA = "no_minute_data";
    constexpr const char* NO_COLUMN      = "no_column";
    constexpr const char* NULL_VALUE     = "null_value";
}  // namespace filter_error

// ---------------------------------------------------------------------------
// ConditionalFilterSet — a rule set evaluated against a candidate's trail
// ---------------------------------------------------------------------------
class ConditionalFilterSet {
public:
    virtual ~ConditionalFilterSet() = default;

    virtual std::string version_tag() const = 0;

    // Minute offsets the evaluation reads.
    virtual std::set<int> required_offsets() const = 0;

    virtual RuleSetVerdict evaluate(const TrailView& trail) const = 0;
};

// ---------------------------------------------------------------------------
// ThresholdCombinationSet — AND of inclusive range filters.
// A missing or null value fails its filter; an empty set never passes.
// ---------------------------------------------------------------------------
class ThresholdCombinationSet : public ConditionalFilterSet {
public:
    explicit ThresholdCombinationSet(RuleSet rule_set) : rule_set_(std::move(rule_set)) {}

    std::string version_tag() const override { return rule_set_.version_tag(); }

    std::set<int> required_offsets() const override {
        std::set<int> out;
        for (const auto& f : rule_set_.filters) out.insert(f.minute_offset);
        return out;
    }

    RuleSetVerdict evaluate(const TrailView& trail) const override {
        RuleSetVerdict v;
        v.rule_set_id = rule_set_.id;
        v.version_tag = version_tag();
        for (const auto& f : rule_set_.filters) {
            FilterCheck check;
            check.rule_set_id = rule_set_.id;
            check.filter_id = f.id;
            check.column_name = f.column_name;
            check.minute_offset = f.minute_offset;
            check.from_value = f.from_value;
            check.to_value = f.to_value;

            auto minute = trail.find(f.minute_offset);
            if (minute == trail.end() || minute->second.empty()) {
                check.error = filter_error::NO_MINUTE_DATA;
            } else {
                auto col = minute->second.find(f.column_name);
                if (col == minute->second.end()) {
                    check.error = filter_error::NO_COLUMN;
                } else if (!col->second) {
                    check.error = filter_error::NULL_VALUE;
                } else {
                    check.actual_value = col->second;
                    check.passed = *col->second >= f.from_value && *col->second <= f.to_value;
                }
            }
            if (check.passed) ++v.filters_passed;
            else ++v.filters_failed;
            v.checks.push_back(std::move(check));
        }
        v.passed = !rule_set_.filters.empty() && v.filters_failed == 0;
        return v;
    }

    const RuleSet& rule_set() const { return rule_set_; }

private:
    RuleSet rule_set_;
};
