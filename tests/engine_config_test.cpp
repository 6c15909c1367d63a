// engine_config_test.cpp — EngineConfig defaults, range validation and the
// key = value / --key value loaders in config_io.

#include <gtest/gtest.h>

#include "config_io.hpp"
#include "engine_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ===========================================================================
// Fixture
// ===========================================================================
class EngineConfigTest : public ::testing::Test {
protected:
    EngineConfig cfg;  // default-constructed
};

// ===========================================================================
// 1. Defaults
// ===========================================================================

TEST_F(EngineConfigTest, DefaultsValidate) {
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(EngineConfigTest, DefaultGateSettings) {
    EXPECT_EQ(cfg.gate.lookback_minutes, 3);
    EXPECT_DOUBLE_EQ(cfg.gate.min_change_pct, 0.20);
    EXPECT_EQ(cfg.gate.no_data_policy, GateConfig::NoDataPolicy::ALLOW);
}

TEST_F(EngineConfigTest, DefaultMiningSettings) {
    EXPECT_DOUBLE_EQ(cfg.mining.good_trade_threshold_pct, 0.3);
    EXPECT_EQ(cfg.mining.analysis_window_hours, 24);
    EXPECT_EQ(cfg.mining.min_filters_in_combo, 1);
    EXPECT_DOUBLE_EQ(cfg.mining.min_good_kept_pct, 50.0);
    EXPECT_DOUBLE_EQ(cfg.mining.min_bad_removed_pct, 10.0);
    EXPECT_EQ(cfg.mining.auto_rule_set_name, "AutoFilters");
}

TEST_F(EngineConfigTest, DefaultTrackingWindowIsFifteenMinutes) {
    EXPECT_EQ(cfg.trail.tracking_window_minutes, 15);
    EXPECT_FALSE(cfg.trail.persist_gate_metrics);
}

TEST_F(EngineConfigTest, DefaultNoRuleSetPolicyRejects) {
    EXPECT_EQ(cfg.validator.no_rule_set_policy, ValidatorConfig::NoRuleSetPolicy::REJECT);
}

// ===========================================================================
// 2. Range validation
// ===========================================================================

TEST_F(EngineConfigTest, ThresholdAboveFiveRejected) {
    cfg.mining.good_trade_threshold_pct = 10.0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(EngineConfigTest, ThresholdBelowPointOneRejected) {
    cfg.mining.good_trade_threshold_pct = 0.05;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(EngineConfigTest, AnalysisWindowAboveOneWeekRejected) {
    cfg.mining.analysis_window_hours = 169;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(EngineConfigTest, MinFiltersAboveMaxRejected) {
    cfg.mining.min_filters_in_combo = 8;
    cfg.mining.max_filters_in_combo = 4;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(EngineConfigTest, InvertedPercentilePairRejected) {
    cfg.mining.percentile_pairs = {{90.0, 10.0}};
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(EngineConfigTest, CombinationOffsetOutsideWindowRejected) {
    cfg.trail.tracking_window_minutes = 10;
    cfg.mining.max_combination_offset = 10;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(EngineConfigTest, DecisionOffsetOutsideWindowRejected) {
    cfg.validator.decision_offset = 15;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(EngineConfigTest, ErrorMessageNamesTheKey) {
    cfg.gate.lookback_minutes = 0;
    try {
        cfg.validate();
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("lookback_minutes"), std::string::npos);
    }
}

// ===========================================================================
// 3. key = value files
// ===========================================================================

TEST_F(EngineConfigTest, ParseKeyValuesSkipsCommentsAndBlankLines) {
    std::istringstream in(
        "# gate\n"
        "\n"
        "lookback_minutes = 5   # trailing comment\n"
        "no_data_policy=reject\n");
    auto kv = config_io::parse_key_values(in);
    ASSERT_EQ(kv.size(), 2u);
    EXPECT_EQ(kv["lookback_minutes"], "5");
    EXPECT_EQ(kv["no_data_policy"], "reject");
}

TEST_F(EngineConfigTest, ParseKeyValuesRejectsLineWithoutEquals) {
    std::istringstream in("lookback_minutes 5\n");
    EXPECT_THROW(config_io::parse_key_values(in), std::invalid_argument);
}

TEST_F(EngineConfigTest, ApplySettingUpdatesEachSubConfig) {
    config_io::apply_setting(cfg, "min_change_pct", "0.35");
    config_io::apply_setting(cfg, "persist_gate_metrics", "true");
    config_io::apply_setting(cfg, "good_trade_threshold_pct", "0.5");
    config_io::apply_setting(cfg, "no_rule_set_policy", "allow");
    config_io::apply_setting(cfg, "db_path", "/tmp/gate.db");

    EXPECT_DOUBLE_EQ(cfg.gate.min_change_pct, 0.35);
    EXPECT_TRUE(cfg.trail.persist_gate_metrics);
    EXPECT_DOUBLE_EQ(cfg.mining.good_trade_threshold_pct, 0.5);
    EXPECT_EQ(cfg.validator.no_rule_set_policy, ValidatorConfig::NoRuleSetPolicy::ALLOW);
    EXPECT_EQ(cfg.db_path, "/tmp/gate.db");
}

TEST_F(EngineConfigTest, ApplySettingRejectsUnknownKey) {
    EXPECT_THROW(config_io::apply_setting(cfg, "lookback", "3"), std::invalid_argument);
}

TEST_F(EngineConfigTest, ApplySettingRejectsMalformedNumber) {
    EXPECT_THROW(config_io::apply_setting(cfg, "lookback_minutes", "3m"), std::invalid_argument);
    EXPECT_THROW(config_io::apply_setting(cfg, "min_change_pct", "abc"), std::invalid_argument);
}

TEST_F(EngineConfigTest, ApplySettingRejectsBadPolicy) {
    EXPECT_THROW(config_io::apply_setting(cfg, "no_data_policy", "maybe"),
                 std::invalid_argument);
}

TEST_F(EngineConfigTest, LoadFileMissingThrows) {
    EXPECT_THROW(config_io::load_file(cfg, "/nonexistent/tradegate.conf"), std::runtime_error);
}

// ===========================================================================
// 4. --key value command line
// ===========================================================================

TEST_F(EngineConfigTest, ApplyCliConsumesKnownFlags) {
    std::vector<std::string> args = {"prog", "--lookback-minutes", "5",
                                     "--good-trade-threshold-pct", "0.4"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());

    auto rest = config_io::apply_cli(cfg, static_cast<int>(argv.size()), argv.data());
    EXPECT_TRUE(rest.empty());
    EXPECT_EQ(cfg.gate.lookback_minutes, 5);
    EXPECT_DOUBLE_EQ(cfg.mining.good_trade_threshold_pct, 0.4);
}

TEST_F(EngineConfigTest, ApplyCliReturnsToolFlags) {
    std::vector<std::string> args = {"prog", "--interval-minutes", "10", "--min-change-pct",
                                     "0.1"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());

    auto rest = config_io::apply_cli(cfg, static_cast<int>(argv.size()), argv.data());
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0], "--interval-minutes");
    EXPECT_EQ(rest[1], "10");
    EXPECT_DOUBLE_EQ(cfg.gate.min_change_pct, 0.1);
}

TEST_F(EngineConfigTest, ApplyCliPropagatesBadValue) {
    std::vector<std::string> args = {"prog", "--lookback-minutes", "three"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());

    EXPECT_THROW(config_io::apply_cli(cfg, static_cast<int>(argv.size()), argv.data()),
                 std::invalid_argument);
}
