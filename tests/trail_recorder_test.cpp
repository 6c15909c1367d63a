// trail_recorder_test.cpp — per-minute trail capture: section isolation,
// idempotent writes, scheduling, and finalisation of missed candidates.

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "trail/trail_recorder.hpp"

#include <chrono>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using test_helpers::FixedSection;
using test_helpers::T0;
using test_helpers::ThrowingSection;
using test_helpers::UnavailableSection;
using test_helpers::make_candidate;
using test_helpers::make_volatility_section;
using test_helpers::minutes;
using test_helpers::seconds;

// ===========================================================================
// Fixture
// ===========================================================================
class TrailRecorderTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<TradeStore>(":memory:");
        volatility = make_volatility_section(1.5);
    }

    std::unique_ptr<TrailRecorder> recorder(
        std::vector<std::shared_ptr<const FeatureSection>> sections, TrailConfig cfg = {}) {
        return std::make_unique<TrailRecorder>(cfg, 0.3, store, std::move(sections));
    }

    TradeCandidate go_candidate(uint64_t signal_ts = T0, double entry = 100.0) {
        TradeCandidate c = make_candidate(signal_ts, entry);
        c.decision = Decision::GO;
        store->insert_candidate(c);
        return c;
    }

    void write(int64_t id, int offset, const std::string& col, double value) {
        TrailValue v;
        v.candidate_id = id;
        v.minute_offset = offset;
        v.column_name = col;
        v.value = value;
        v.section = trail_section::PRICE_MOVEMENTS;
        store->write_trail({v});
    }

    std::shared_ptr<TradeStore> store;
    std::shared_ptr<FixedSection> volatility;
};

// ===========================================================================
// 1. Tracking eligibility
// ===========================================================================

TEST_F(TrailRecorderTest, GoCandidateIsTracked) {
    auto rec = recorder({volatility});
    auto c = go_candidate();
    EXPECT_TRUE(rec->begin_tracking(c));
    EXPECT_TRUE(rec->is_tracking(c.id));
    EXPECT_EQ(store->open_tracked_candidates().size(), 1u);
}

TEST_F(TrailRecorderTest, NoGoCandidateIsNeverTracked) {
    auto rec = recorder({volatility});
    TradeCandidate c = make_candidate();
    c.decision = Decision::NO_GO;
    store->insert_candidate(c);
    EXPECT_FALSE(rec->begin_tracking(c));
    EXPECT_FALSE(rec->is_tracking(c.id));
    EXPECT_EQ(rec->tracked_count(), 0u);
}

TEST_F(TrailRecorderTest, ResolvedCandidateIsNotTracked) {
    auto rec = recorder({volatility});
    auto c = go_candidate();
    c.status = CandidateStatus::CLOSED;
    EXPECT_FALSE(rec->begin_tracking(c));
}

TEST_F(TrailRecorderTest, ResumeReloadsOpenTrackedCandidates) {
    auto first = recorder({volatility});
    auto c = go_candidate();
    first->begin_tracking(c);

    auto second = recorder({volatility});
    EXPECT_EQ(second->resume(), 1);
    EXPECT_TRUE(second->is_tracking(c.id));
}

// ===========================================================================
// 2. Sampling
// ===========================================================================

TEST_F(TrailRecorderTest, SampleWritesEveryColumn) {
    auto rec = recorder({volatility});
    auto c = go_candidate();
    EXPECT_EQ(rec->sample(c, 0), 2);
    auto at0 = store->trail_at(c.id, 0);
    EXPECT_DOUBLE_EQ(*at0["pm_volatility_pct"], 1.5);
}

TEST_F(TrailRecorderTest, FailingSectionIsNulledOthersSurvive) {
    auto rec = recorder({volatility, std::make_shared<UnavailableSection>()});
    auto c = go_candidate();
    EXPECT_EQ(rec->sample(c, 0), 4);

    auto at0 = store->trail_at(c.id, 0);
    ASSERT_EQ(at0.size(), 4u);
    EXPECT_DOUBLE_EQ(*at0["pm_volatility_pct"], 1.5);
    EXPECT_FALSE(at0["ob_mid_price"].has_value());
    EXPECT_FALSE(at0["ob_spread_bps"].has_value());
}

TEST_F(TrailRecorderTest, SlowSectionTimesOutToNulls) {
    auto slow = std::make_shared<FixedSection>(trail_section::SESSION, "ss_",
                                               SectionValues{{"ss_hour_sin", 0.5}});
    slow->delay_ms = 300;
    TrailConfig cfg;
    cfg.section_timeout_ms = 20;
    auto rec = recorder({volatility, slow}, cfg);
    auto c = go_candidate();
    rec->sample(c, 0);

    auto at0 = store->trail_at(c.id, 0);
    EXPECT_DOUBLE_EQ(*at0["pm_volatility_pct"], 1.5);
    ASSERT_EQ(at0.count("ss_hour_sin"), 1u);
    EXPECT_FALSE(at0["ss_hour_sin"].has_value());
}

TEST_F(TrailRecorderTest, NonStandardThrowIsNulledOthersSurvive) {
    auto rec = recorder({std::make_shared<ThrowingSection>(), volatility});
    auto c = go_candidate();
    EXPECT_NO_THROW(rec->sample(c, 0));

    auto at0 = store->trail_at(c.id, 0);
    EXPECT_DOUBLE_EQ(*at0["pm_volatility_pct"], 1.5);
    ASSERT_EQ(at0.count("ss_hour_sin"), 1u);
    EXPECT_FALSE(at0["ss_hour_sin"].has_value());
}

TEST_F(TrailRecorderTest, DeadlineCapsEverySection) {
    std::vector<std::shared_ptr<const FeatureSection>> sections;
    for (const char* col : {"ss_hour_sin", "ss_hour_cos", "ss_day_sin"}) {
        auto slow = std::make_shared<FixedSection>(trail_section::SESSION, "ss_",
                                                   SectionValues{{col, 0.5}});
        slow->delay_ms = 2000;
        sections.push_back(slow);
    }
    auto rec = recorder(sections);
    auto c = go_candidate();

    Deadline deadline(100);
    auto start = std::chrono::steady_clock::now();
    rec->sample(c, 0, &deadline);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    EXPECT_LT(elapsed, 1000);
    // Only the section that ran out the budget is written, as nulls.
    auto at0 = store->trail_at(c.id, 0);
    ASSERT_EQ(at0.size(), 1u);
    EXPECT_FALSE(at0.begin()->second.has_value());
}

TEST_F(TrailRecorderTest, NonFiniteValueStoredAsNull) {
    auto nan_section = std::make_shared<FixedSection>(
        trail_section::SESSION, "ss_",
        SectionValues{{"ss_hour_sin", std::numeric_limits<double>::infinity()}});
    auto rec = recorder({nan_section});
    auto c = go_candidate();
    rec->sample(c, 0);
    EXPECT_FALSE(store->trail_at(c.id, 0)["ss_hour_sin"].has_value());
}

TEST_F(TrailRecorderTest, DuplicateSampleIsANoOp) {
    auto rec = recorder({volatility});
    auto c = go_candidate();
    EXPECT_EQ(rec->sample(c, 1), 2);
    EXPECT_EQ(rec->sample(c, 1), 0);
    EXPECT_EQ(store->trail_at(c.id, 1).size(), 2u);
}

TEST_F(TrailRecorderTest, OffsetOutsideWindowThrows) {
    auto rec = recorder({volatility});
    auto c = go_candidate();
    EXPECT_THROW(rec->sample(c, 15), std::out_of_range);
    EXPECT_THROW(rec->sample(c, -1), std::out_of_range);
}

TEST_F(TrailRecorderTest, GateMetricsPersistedOnlyWhenEnabled) {
    GateMetrics m;
    m.entry_price = 100.25;
    m.change_pct[1] = 0.25;
    m.change_pct[3] = 0.25;
    m.trend = gate_trend::RISING;
    auto c = go_candidate();

    auto off = recorder({volatility});
    EXPECT_EQ(off->record_gate_metrics(c, m), 0);

    TrailConfig cfg;
    cfg.persist_gate_metrics = true;
    auto on = recorder({volatility}, cfg);
    EXPECT_EQ(on->record_gate_metrics(c, m), 6);
    auto at0 = store->trail_at(c.id, 0);
    EXPECT_NEAR(*at0["pre_change_3m"], 0.25, 1e-12);
    EXPECT_FALSE(at0["pre_change_5m"].has_value());
    EXPECT_DOUBLE_EQ(*at0["pre_trend_code"], 1.0);
}

// ===========================================================================
// 3. Scheduling
// ===========================================================================

TEST_F(TrailRecorderTest, DueSamplesFollowTheClock) {
    auto rec = recorder({volatility});
    auto c = go_candidate();
    rec->begin_tracking(c);

    auto due = rec->due_samples(T0 + minutes(2) + seconds(1));
    ASSERT_EQ(due.size(), 3u);
    EXPECT_EQ(due[0].minute_offset, 0);
    EXPECT_EQ(due[2].minute_offset, 2);
    EXPECT_EQ(due[2].sample_ts, T0 + minutes(2));

    rec->sample(c, 0);
    EXPECT_EQ(rec->due_samples(T0 + minutes(2) + seconds(1)).size(), 2u);
}

TEST_F(TrailRecorderTest, GateMetricsAloneDoNotCompleteOffsetZero) {
    TrailConfig cfg;
    cfg.persist_gate_metrics = true;
    auto rec = recorder({volatility}, cfg);
    auto c = go_candidate();
    rec->begin_tracking(c);
    GateMetrics m;
    rec->record_gate_metrics(c, m);

    auto due = rec->due_samples(T0);
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0].minute_offset, 0);
}

TEST_F(TrailRecorderTest, TickSamplesDueOffsets) {
    auto rec = recorder({volatility});
    auto c = go_candidate();
    rec->begin_tracking(c);
    EXPECT_EQ(rec->tick(T0 + minutes(4)), 5);
    EXPECT_EQ(store->trail_offsets(c.id), (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(rec->tick(T0 + minutes(4)), 0);
}

TEST_F(TrailRecorderTest, TickExpiresCandidateAfterWindow) {
    TrailConfig cfg;
    cfg.tracking_window_minutes = 3;
    auto rec = recorder({volatility}, cfg);
    auto c = go_candidate();
    rec->begin_tracking(c);

    rec->tick(T0 + minutes(3));
    EXPECT_FALSE(rec->is_tracking(c.id));
    auto stored = store->candidate(c.id);
    EXPECT_EQ(stored->status, CandidateStatus::MISSED);
    EXPECT_EQ(store->trail_offsets(c.id), (std::vector<int>{0, 1, 2}));
}

TEST_F(TrailRecorderTest, FailedWriteDoesNotStallOtherCandidates) {
    auto path = (std::filesystem::temp_directory_path() / "trail_recorder_tick.db").string();
    auto remove_db = [&] {
        for (const char* ext : {"", "-wal", "-shm"}) std::filesystem::remove(path + ext);
    };
    remove_db();
    store = std::make_shared<TradeStore>(path);

    TrailConfig cfg;
    cfg.tracking_window_minutes = 3;
    auto rec = recorder({volatility}, cfg);
    auto broken = go_candidate();
    auto healthy = go_candidate(T0 + seconds(1));
    rec->begin_tracking(broken);
    rec->begin_tracking(healthy);
    {
        SqliteDb admin(path);
        admin.exec("CREATE TRIGGER reject_trail BEFORE INSERT ON trail_snapshots "
                   "WHEN NEW.candidate_id = " + std::to_string(broken.id) +
                   " BEGIN SELECT RAISE(ABORT, 'disk full'); END");
    }

    EXPECT_EQ(rec->tick(T0 + minutes(3) + seconds(1)), 3);
    EXPECT_TRUE(store->trail_offsets(broken.id).empty());
    EXPECT_EQ(store->trail_offsets(healthy.id), (std::vector<int>{0, 1, 2}));
    EXPECT_FALSE(rec->is_tracking(broken.id));
    EXPECT_FALSE(rec->is_tracking(healthy.id));
    EXPECT_EQ(store->candidate(broken.id)->status, CandidateStatus::MISSED);
    EXPECT_EQ(store->candidate(healthy.id)->status, CandidateStatus::MISSED);

    store.reset();
    remove_db();
}

// ===========================================================================
// 4. Finalisation
// ===========================================================================

TEST_F(TrailRecorderTest, MissedOutcomeDerivedFromTrail) {
    auto rec = recorder({volatility});
    auto c = go_candidate(T0, 100.0);
    rec->begin_tracking(c);
    write(c.id, 0, "pm_close_price", 101.0);
    write(c.id, 0, "pm_high_price", 103.0);
    write(c.id, 1, "pm_close_price", 102.0);
    write(c.id, 1, "pm_high_price", 102.5);

    EXPECT_TRUE(rec->finalize(c, std::nullopt, CandidateStatus::MISSED, T0 + minutes(15)));
    auto stored = store->candidate(c.id);
    EXPECT_EQ(stored->status, CandidateStatus::MISSED);
    EXPECT_NEAR(*stored->realized_gain_pct, 2.0, 1e-9);
    EXPECT_NEAR(*stored->max_favorable_pct, 3.0, 1e-9);
    EXPECT_EQ(stored->label, OutcomeLabel::GOOD);
    EXPECT_FALSE(rec->is_tracking(c.id));
}

TEST_F(TrailRecorderTest, MissedWithoutPricesHasNoOutcome) {
    auto rec = recorder({volatility});
    auto c = go_candidate();
    EXPECT_FALSE(rec->derive_outcome(c).has_value());
}

TEST_F(TrailRecorderTest, ExplicitOutcomeWinsForClosedTrade) {
    auto rec = recorder({volatility});
    auto c = go_candidate();
    rec->begin_tracking(c);
    TradeOutcome o;
    o.final_gain_pct = -0.4;
    o.max_favorable_pct = 0.1;
    rec->finalize(c, o, CandidateStatus::CLOSED, T0 + minutes(5));

    auto stored = store->candidate(c.id);
    EXPECT_EQ(stored->status, CandidateStatus::CLOSED);
    EXPECT_DOUBLE_EQ(*stored->realized_gain_pct, -0.4);
    EXPECT_EQ(stored->label, OutcomeLabel::BAD);
}

TEST_F(TrailRecorderTest, SecondFinalizeReportsAlreadyResolved) {
    auto rec = recorder({volatility});
    auto c = go_candidate();
    rec->begin_tracking(c);
    EXPECT_TRUE(rec->finalize(c, TradeOutcome{0.5, 0.5}, CandidateStatus::CLOSED, T0));
    EXPECT_FALSE(rec->finalize(c, TradeOutcome{-1.0, 0.0}, CandidateStatus::CANCELLED, T0));
    EXPECT_DOUBLE_EQ(*store->candidate(c.id)->realized_gain_pct, 0.5);
}
