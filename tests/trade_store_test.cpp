// trade_store_test.cpp — SQLite-backed TradeStore: candidate lifecycle,
// idempotent trail and whale writes, mining rows and versioned rule sets.

#include <gtest/gtest.h>

#include "store/trade_store.hpp"
#include "test_helpers.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using test_helpers::T0;
using test_helpers::make_candidate;
using test_helpers::minutes;

namespace {

TrailValue trail_value(int64_t id, int offset, const std::string& col,
                       std::optional<double> value) {
    TrailValue v;
    v.candidate_id = id;
    v.minute_offset = offset;
    v.column_name = col;
    v.value = value;
    v.section = trail_section::PRICE_MOVEMENTS;
    return v;
}

RuleFilter rule(const std::string& col, double from, double to, int offset = 0) {
    RuleFilter f;
    f.column_name = col;
    f.section = trail_section::PRICE_MOVEMENTS;
    f.minute_offset = offset;
    f.from_value = from;
    f.to_value = to;
    return f;
}

}  // anonymous namespace

// ===========================================================================
// Fixture
// ===========================================================================
class TradeStoreTest : public ::testing::Test {
protected:
    TradeStore store{":memory:"};

    int64_t insert(uint64_t signal_ts = T0) {
        TradeCandidate c = make_candidate(signal_ts);
        return store.insert_candidate(c);
    }
};

// ===========================================================================
// 1. Candidates
// ===========================================================================

TEST_F(TradeStoreTest, InsertAssignsIdAndRoundTripsFields) {
    TradeCandidate c = make_candidate(T0, 42.5);
    c.wallet_id = "wallet-Z";
    int64_t id = store.insert_candidate(c);
    EXPECT_GT(id, 0);
    EXPECT_EQ(c.id, id);

    auto loaded = store.candidate(id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->signal_ts, T0);
    EXPECT_DOUBLE_EQ(loaded->entry_price, 42.5);
    EXPECT_EQ(loaded->wallet_id, "wallet-Z");
    EXPECT_EQ(loaded->status, CandidateStatus::OPEN);
    EXPECT_EQ(loaded->decision, Decision::PENDING);
    EXPECT_FALSE(loaded->realized_gain_pct.has_value());
}

TEST_F(TradeStoreTest, UnknownCandidateIsNullopt) {
    EXPECT_FALSE(store.candidate(999).has_value());
}

TEST_F(TradeStoreTest, DecisionCanBeClaimedOnlyOnce) {
    int64_t id = insert();
    EXPECT_TRUE(store.claim_decision(id));
    EXPECT_FALSE(store.claim_decision(id));
}

TEST_F(TradeStoreTest, RecordDecisionPersistsRationale) {
    int64_t id = insert();
    store.record_decision(id, Decision::GO, "{\"reason\":\"PASS\"}", "AutoFilters@v2");
    auto c = store.candidate(id);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->decision, Decision::GO);
    EXPECT_EQ(c->decision_reason, "{\"reason\":\"PASS\"}");
    EXPECT_EQ(c->rule_set_version, "AutoFilters@v2");
}

TEST_F(TradeStoreTest, ResolveLabelsFromRealizedGain) {
    int64_t good = insert();
    int64_t bad = insert();
    store.resolve_candidate(good, CandidateStatus::CLOSED, TradeOutcome{0.3, 0.8}, T0 + 1, 0.3);
    store.resolve_candidate(bad, CandidateStatus::CLOSED, TradeOutcome{0.29, 0.5}, T0 + 1, 0.3);

    EXPECT_EQ(store.candidate(good)->label, OutcomeLabel::GOOD);
    EXPECT_EQ(store.candidate(bad)->label, OutcomeLabel::BAD);
    EXPECT_DOUBLE_EQ(*store.candidate(good)->realized_gain_pct, 0.3);
    EXPECT_DOUBLE_EQ(*store.candidate(good)->max_favorable_pct, 0.8);
}

TEST_F(TradeStoreTest, ResolveIsOneWay) {
    int64_t id = insert();
    EXPECT_TRUE(store.resolve_candidate(id, CandidateStatus::CLOSED, TradeOutcome{1.0, 1.0},
                                        T0 + 1, 0.3));
    EXPECT_FALSE(store.resolve_candidate(id, CandidateStatus::MISSED, TradeOutcome{-1.0, 0.0},
                                         T0 + 2, 0.3));
    auto c = store.candidate(id);
    EXPECT_EQ(c->status, CandidateStatus::CLOSED);
    EXPECT_DOUBLE_EQ(*c->realized_gain_pct, 1.0);
}

TEST_F(TradeStoreTest, ResolveToOpenThrows) {
    int64_t id = insert();
    EXPECT_THROW(store.resolve_candidate(id, CandidateStatus::OPEN, std::nullopt, T0, 0.3),
                 std::invalid_argument);
}

TEST_F(TradeStoreTest, CancelledWithoutOutcomeStaysUnlabeled) {
    int64_t id = insert();
    store.resolve_candidate(id, CandidateStatus::CANCELLED, std::nullopt, T0 + 1, 0.3);
    auto c = store.candidate(id);
    EXPECT_EQ(c->status, CandidateStatus::CANCELLED);
    EXPECT_EQ(c->label, OutcomeLabel::UNLABELED);
    EXPECT_TRUE(store.resolved_candidates(0, T0 + minutes(60)).empty());
}

TEST_F(TradeStoreTest, ResolvedCandidatesHonourWindow) {
    int64_t early = insert(T0);
    int64_t late = insert(T0 + minutes(120));
    store.resolve_candidate(early, CandidateStatus::CLOSED, TradeOutcome{0.5, 0.5}, T0, 0.3);
    store.resolve_candidate(late, CandidateStatus::CLOSED, TradeOutcome{0.5, 0.5}, T0, 0.3);

    auto in_window = store.resolved_candidates(T0 + minutes(60), T0 + minutes(180));
    ASSERT_EQ(in_window.size(), 1u);
    EXPECT_EQ(in_window[0].id, late);
}

TEST_F(TradeStoreTest, OpenTrackedCandidatesRequireTrackingFlag) {
    int64_t tracked = insert();
    insert();
    store.mark_tracking(tracked);
    auto open = store.open_tracked_candidates();
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0].id, tracked);
}

// ===========================================================================
// 2. Trail snapshots
// ===========================================================================

TEST_F(TradeStoreTest, DuplicateTrailWriteIsIgnored) {
    int64_t id = insert();
    EXPECT_EQ(store.write_trail({trail_value(id, 0, "pm_close_price", 100.0)}), 1);
    EXPECT_EQ(store.write_trail({trail_value(id, 0, "pm_close_price", 999.0)}), 0);

    auto at0 = store.trail_at(id, 0);
    ASSERT_EQ(at0.size(), 1u);
    EXPECT_DOUBLE_EQ(*at0["pm_close_price"], 100.0);
}

TEST_F(TradeStoreTest, NullTrailValueRoundTrips) {
    int64_t id = insert();
    store.write_trail({trail_value(id, 2, "ob_spread_bps", std::nullopt)});
    auto at2 = store.trail_at(id, 2);
    ASSERT_EQ(at2.count("ob_spread_bps"), 1u);
    EXPECT_FALSE(at2["ob_spread_bps"].has_value());
}

TEST_F(TradeStoreTest, TrailOffsetsAscending) {
    int64_t id = insert();
    store.write_trail({trail_value(id, 3, "a", 1.0), trail_value(id, 0, "a", 1.0),
                       trail_value(id, 1, "a", 1.0)});
    EXPECT_EQ(store.trail_offsets(id), (std::vector<int>{0, 1, 3}));
    EXPECT_TRUE(store.has_trail(id, 1));
    EXPECT_FALSE(store.has_trail(id, 2));
}

TEST_F(TradeStoreTest, ResolvedTrailExcludesOpenCandidates) {
    int64_t open = insert();
    int64_t closed = insert();
    store.write_trail({trail_value(open, 0, "a", 1.0), trail_value(closed, 0, "a", 2.0)});
    store.resolve_candidate(closed, CandidateStatus::CLOSED, TradeOutcome{0.5, 0.5}, T0, 0.3);

    auto rows = store.resolved_trail(0, T0 + minutes(1));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].candidate_id, closed);
}

// ===========================================================================
// 3. Whale events
// ===========================================================================

TEST_F(TradeStoreTest, WhaleEventKeyedBySignature) {
    WhaleEvent e{"sig-1", "whale-1", T0, 1, 500.0, 12.5};
    EXPECT_TRUE(store.insert_whale_event(e));
    e.sol_amount = 1.0;
    EXPECT_FALSE(store.insert_whale_event(e));

    auto events = store.whale_events(T0, T0);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_DOUBLE_EQ(events[0].sol_amount, 500.0);
    EXPECT_EQ(events[0].direction, 1);
}

// ===========================================================================
// 4. Mining runs
// ===========================================================================

TEST_F(TradeStoreTest, MiningRunLifecycle) {
    MiningRun run;
    run.started_at = T0;
    run.window_start = T0 - minutes(60);
    run.window_end = T0;
    int64_t id = store.begin_mining_run(run);
    EXPECT_EQ(store.mining_run(id)->status, RunStatus::RUNNING);

    run.status = RunStatus::FAILED;
    run.error = "threshold out of range";
    run.completed_at = T0 + 5;
    store.finish_mining_run(run);

    auto loaded = store.mining_run(id);
    EXPECT_EQ(loaded->status, RunStatus::FAILED);
    EXPECT_EQ(loaded->error, "threshold out of range");
    EXPECT_EQ(loaded->best_combination_id, 0);
    EXPECT_EQ(loaded->window_start, T0 - minutes(60));
    EXPECT_TRUE(store.recent_completed_runs(10).empty());
}

TEST_F(TradeStoreTest, CombinationLoadsItsFilters) {
    MiningRun run;
    run.started_at = T0;
    store.begin_mining_run(run);

    FilterSuggestion a;
    a.column_name = "pm_volatility_pct";
    a.section = trail_section::PRICE_MOVEMENTS;
    a.from_value = 1.0;
    a.to_value = 2.0;
    a.score = 50.0;
    FilterSuggestion b = a;
    b.column_name = "ob_spread_bps";
    b.score = 40.0;
    std::vector<FilterSuggestion> suggestions = {a, b};
    store.save_suggestions(run.id, suggestions);
    ASSERT_GT(suggestions[0].id, 0);

    FilterCombination combo;
    combo.run_id = run.id;
    combo.filters = suggestions;
    combo.good_kept_pct = 80.0;
    combo.bad_removed_pct = 60.0;
    store.save_combination(combo);

    auto loaded = store.combination(combo.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->columns(), (std::vector<std::string>{"pm_volatility_pct", "ob_spread_bps"}));
    EXPECT_DOUBLE_EQ(loaded->bad_removed_pct, 60.0);
    EXPECT_EQ(store.count_combinations(run.id), 1);

    auto ranked = store.suggestions(run.id);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].column_name, "pm_volatility_pct");
}

// ===========================================================================
// 5. Rule sets and audit
// ===========================================================================

TEST_F(TradeStoreTest, ReplaceRuleSetBumpsVersion) {
    RuleSet v1 = store.replace_rule_set("AutoFilters", {rule("pm_volatility_pct", 1.0, 2.0)});
    EXPECT_EQ(v1.version, 1);
    EXPECT_EQ(v1.version_tag(), "AutoFilters@v1");

    RuleSet v2 = store.replace_rule_set("AutoFilters", {rule("ob_spread_bps", 0.0, 5.0),
                                                        rule("wh_net_flow_sol", -10.0, 50.0)});
    EXPECT_EQ(v2.id, v1.id);
    EXPECT_EQ(v2.version, 2);

    auto loaded = store.rule_set("AutoFilters");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->version, 2);
    ASSERT_EQ(loaded->filters.size(), 2u);
    EXPECT_EQ(loaded->filters[0].column_name, "ob_spread_bps");
}

TEST_F(TradeStoreTest, InactiveRuleSetsAreNotServed) {
    RuleSet a = store.replace_rule_set("A", {rule("x", 0.0, 1.0)});
    store.replace_rule_set("B", {rule("y", 0.0, 1.0)});
    store.set_rule_set_active(a.id, false);

    auto active = store.active_rule_sets();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].name, "B");
    ASSERT_EQ(active[0].filters.size(), 1u);
}

TEST_F(TradeStoreTest, FilterResultsRoundTrip) {
    int64_t id = insert();
    FilterCheck pass;
    pass.rule_set_id = 1;
    pass.filter_id = 7;
    pass.column_name = "pm_volatility_pct";
    pass.from_value = 1.0;
    pass.to_value = 2.0;
    pass.actual_value = 1.5;
    pass.passed = true;
    FilterCheck missing = pass;
    missing.filter_id = 8;
    missing.actual_value.reset();
    missing.passed = false;
    missing.error = "null_value";

    store.save_filter_results(id, {pass, missing});
    auto loaded = store.filter_results(id);
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_TRUE(loaded[0].passed);
    EXPECT_DOUBLE_EQ(*loaded[0].actual_value, 1.5);
    EXPECT_FALSE(loaded[1].passed);
    EXPECT_FALSE(loaded[1].actual_value.has_value());
    EXPECT_EQ(loaded[1].error, "null_value");
}
