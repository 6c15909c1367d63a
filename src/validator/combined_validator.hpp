#pragma once

#include "candidate/trade_candidate.hpp"
#include "engine_config.hpp"
#include "gate/pre_entry_gate.hpp"
#include "run_with_timeout.hpp"
#include "store/trade_store.hpp"
#include "trail/trail_recorder.hpp"
#include "validator/conditional_filter_set.hpp"
#include "validator/decision_io.hpp"
#include "validator/rule_set.hpp"

#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ValidationDecision — final word on one candidate
// ---------------------------------------------------------------------------
struct ValidationDecision {
    Decision decision = Decision::NO_GO;
    std::string reason;
    std::string rule_set_version;
    GateResult gate;
    std::vector<RuleSetVerdict> verdicts;
    std::string rationale_json;
    std::string error;

    bool go() const { return decision == Decision::GO; }
};

// ---------------------------------------------------------------------------
// CombinedValidator — gate first, then the active rule sets.
//
// Rule sets are OR-ed: the candidate is GO when any active set passes, and
// the winning set's version is reported. Every decision is persisted with
// its rationale. Errors and timeouts after the gate fail closed.
// ---------------------------------------------------------------------------
class CombinedValidator {
public:
    CombinedValidator(ValidatorConfig config, std::shared_ptr<TradeStore> store,
                      std::shared_ptr<PreEntryGate> gate,
                      std::shared_ptr<TrailRecorder> recorder)
        : config_(std::move(config)), store_(std::move(store)),
          gate_(std::move(gate)), recorder_(std::move(recorder)) {
        config_.validate();
    }

    ValidationDecision decide(TradeCandidate& candidate) {
        ValidationDecision d;

        if (!store_->claim_decision(candidate.id)) {
            auto stored = store_->candidate(candidate.id);
            d.decision = stored ? stored->decision : Decision::NO_GO;
            d.reason = decision_reason::ALREADY_DECIDED;
            d.rule_set_version = stored ? stored->rule_set_version : "";
            d.rationale_json = stored ? stored->decision_reason : "";
            std::cout << "[validator] candidate=" << candidate.id << " already decided ("
                      << decision_str(d.decision) << "), gate not re-run\n";
            return d;
        }

        // Step 1: pre-entry gate.
        d.gate = gate_->evaluate(candidate);
        if (!d.gate.go()) {
            d.decision = Decision::NO_GO;
            d.reason = d.gate.reason;
            return finish(candidate, d);
        }
        candidate.decision = Decision::GO;

        // Step 2: rule sets against the snapshot. The stored decision stays
        // PENDING until finish(); only the in-memory candidate is GO here.
        try {
            Deadline deadline(config_.timeout_ms);
            if (recorder_->begin_tracking(candidate)) {
                recorder_->record_gate_metrics(candidate, d.gate.metrics);
            }
            recorder_->sample(candidate, config_.decision_offset, &deadline);
            deadline.check("decision snapshot");

            auto rule_sets = store_->active_rule_sets();
            if (rule_sets.empty()) {
                bool allow = config_.no_rule_set_policy == ValidatorConfig::NoRuleSetPolicy::ALLOW;
                d.decision = allow ? Decision::GO : Decision::NO_GO;
                d.reason = decision_reason::NO_ACTIVE_RULE_SET;
                return finish(candidate, d);
            }

            std::vector<ThresholdCombinationSet> sets;
            std::set<int> offsets;
            for (auto& rs : rule_sets) {
                sets.emplace_back(std::move(rs));
                auto req = sets.back().required_offsets();
                offsets.insert(req.begin(), req.end());
            }
            TrailView view;
            for (int off : offsets) view[off] = store_->trail_at(candidate.id, off);
            deadline.check("trail lookup");

            const ConditionalFilterSet* winner = nullptr;
            std::string tags;
            for (const auto& set : sets) {
                d.verdicts.push_back(set.evaluate(view));
                if (!tags.empty()) tags += ",";
                tags += set.version_tag();
                if (d.verdicts.back().passed && !winner) winner = &set;
            }
            deadline.check("rule evaluation");

            if (winner) {
                d.decision = Decision::GO;
                d.reason = decision_reason::RULE_SET_PASSED;
                d.rule_set_version = winner->version_tag();
            } else {
                d.decision = Decision::NO_GO;
                d.reason = decision_reason::ALL_RULE_SETS_FAILED;
                d.rule_set_version = tags;
            }
        } catch (const std::exception& e) {
            d.decision = Decision::NO_GO;
            d.reason = decision_reason::VALIDATOR_ERROR;
            d.error = e.what();
        } catch (...) {
            d.decision = Decision::NO_GO;
            d.reason = decision_reason::VALIDATOR_ERROR;
            d.error = "unknown exception";
        }
        return finish(candidate, d);
    }

private:
    ValidationDecision& finish(TradeCandidate& candidate, ValidationDecision& d) {
        d.rationale_json = decision_io::rationale_json(d.decision, d.reason, d.rule_set_version,
                                                       d.gate, d.verdicts, d.error);
        candidate.decision = d.decision;
        candidate.decision_reason = d.rationale_json;
        candidate.rule_set_version = d.rule_set_version;

        // Decision last: a failed audit write leaves the candidate PENDING.
        try {
            for (const auto& v : d.verdicts) store_->save_filter_results(candidate.id, v.checks);
            store_->record_decision(candidate.id, d.decision, d.rationale_json,
                                    d.rule_set_version);
        } catch (const StoreError& e) {
            // An unrecorded GO must not trade.
            d.decision = Decision::NO_GO;
            d.reason = decision_reason::VALIDATOR_ERROR;
            d.error = std::string("decision not persisted: ") + e.what();
            candidate.decision = d.decision;
        }

        auto& log = d.error.empty() ? std::cout : std::cerr;
        log << "[validator] candidate=" << candidate.id << " decision="
            << decision_str(d.decision) << " reason=" << d.reason;
        if (!d.rule_set_version.empty()) log << " rule_sets=" << d.rule_set_version;
        if (!d.error.empty()) log << " error=\"" << d.error << "\"";
        log << " gate=" << d.gate.reason << " trend=" << d.gate.metrics.trend << "\n";
        return d;
    }

    ValidatorConfig config_;
    std::shared_ptr<TradeStore> store_;
    std::shared_ptr<PreEntryGate> gate_;
    std::shared_ptr<TrailRecorder> recorder_;
};
