#pragma once

#include "candidate/trade_candidate.hpp"
#include "ingest/whale_event.hpp"
#include "mining/filter_types.hpp"
#include "store/sqlite_db.hpp"
#include "trail/trail_types.hpp"
#include "validator/rule_set.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TradeStore — the shared relational store.
//
// Gate, recorder, miner and validator coordinate only through this class.
// A single connection is serialised behind mu_; per-candidate transitions
// run inside BEGIN IMMEDIATE with a conditional UPDATE on status = 'open'.
// Trail and whale writes are INSERT OR IGNORE on their natural keys.
// ---------------------------------------------------------------------------
class TradeStore {
public:
    explicit TradeStore(const std::string& path) : db_(path) {
        db_.exec("PRAGMA foreign_keys = ON");
        if (path != ":memory:") db_.exec("PRAGMA journal_mode = WAL");
        create_schema();
    }

    // =======================================================================
    // Trade candidates
    // =======================================================================

    int64_t insert_candidate(TradeCandidate& c) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "INSERT INTO trade_candidates (signal_ts, entry_price, wallet_id, symbol, "
            "decision, decision_reason, rule_set_version, status) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
        st.bind(1, c.signal_ts).bind(2, c.entry_price).bind(3, c.wallet_id).bind(4, c.symbol)
          .bind(5, decision_str(c.decision)).bind(6, c.decision_reason)
          .bind(7, c.rule_set_version).bind(8, status_str(c.status));
        st.run();
        c.id = db_.last_insert_id();
        return c.id;
    }

    std::optional<TradeCandidate> candidate(int64_t id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(std::string(CANDIDATE_SELECT) + " WHERE id = ?");
        st.bind(1, id);
        if (!st.step()) return std::nullopt;
        return read_candidate(st);
    }

    // Marks the candidate as decided. Returns false if it already was, so the
    // gate runs at most once per candidate.
    bool claim_decision(int64_t id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "UPDATE trade_candidates SET decision_claimed = 1 "
            "WHERE id = ? AND decision_claimed = 0");
        st.bind(1, id);
        st.run();
        return db_.changes() == 1;
    }

    void record_decision(int64_t id, Decision d, const std::string& reason_json,
                         const std::string& rule_set_version) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "UPDATE trade_candidates SET decision = ?, decision_reason = ?, "
            "rule_set_version = ? WHERE id = ?");
        st.bind(1, decision_str(d)).bind(2, reason_json).bind(3, rule_set_version).bind(4, id);
        st.run();
    }

    // open -> closed | cancelled | missed. The label is derived here, once,
    // from the realized gain. Returns false when the candidate was not open.
    bool resolve_candidate(int64_t id, CandidateStatus status,
                           const std::optional<TradeOutcome>& outcome,
                           uint64_t closed_at, double good_trade_threshold_pct) {
        if (status == CandidateStatus::OPEN) {
            throw std::invalid_argument("resolve_candidate: target status must not be open");
        }
        std::lock_guard<std::mutex> lock(mu_);
        Transaction tx(db_);
        auto st = db_.prepare(
            "UPDATE trade_candidates SET status = ?, realized_gain_pct = ?, "
            "max_favorable_pct = ?, closed_at = ?, label = ? "
            "WHERE id = ? AND status = 'open'");
        std::optional<double> gain, fav;
        OutcomeLabel label = OutcomeLabel::UNLABELED;
        if (outcome) {
            gain = outcome->final_gain_pct;
            fav = outcome->max_favorable_pct;
            label = label_outcome(outcome->final_gain_pct, good_trade_threshold_pct);
        }
        st.bind(1, status_str(status)).bind(2, gain).bind(3, fav).bind(4, closed_at)
          .bind(5, label_str(label)).bind(6, id);
        st.run();
        bool changed = db_.changes() == 1;
        tx.commit();
        return changed;
    }

    void mark_tracking(int64_t id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare("UPDATE trade_candidates SET tracking_started = 1 WHERE id = ?");
        st.bind(1, id);
        st.run();
    }

    // Candidates whose trail is still being recorded.
    std::vector<TradeCandidate> open_tracked_candidates() {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(std::string(CANDIDATE_SELECT) +
                              " WHERE status = 'open' AND tracking_started = 1 ORDER BY signal_ts");
        std::vector<TradeCandidate> out;
        while (st.step()) out.push_back(read_candidate(st));
        return out;
    }

    // Resolved candidates with a realized outcome and signal_ts in [from, to].
    std::vector<TradeCandidate> resolved_candidates(uint64_t from_ts, uint64_t to_ts) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(std::string(CANDIDATE_SELECT) +
                              " WHERE status != 'open' AND realized_gain_pct IS NOT NULL "
                              "AND signal_ts >= ? AND signal_ts <= ? ORDER BY signal_ts, id");
        st.bind(1, from_ts).bind(2, to_ts);
        std::vector<TradeCandidate> out;
        while (st.step()) out.push_back(read_candidate(st));
        return out;
    }

    // =======================================================================
    // Trail snapshots
    // =======================================================================

    // Returns the number of rows actually inserted; duplicates are skipped.
    int write_trail(const std::vector<TrailValue>& values) {
        if (values.empty()) return 0;
        std::lock_guard<std::mutex> lock(mu_);
        Transaction tx(db_);
        auto st = db_.prepare(
            "INSERT OR IGNORE INTO trail_snapshots "
            "(candidate_id, minute_offset, column_name, value, section) VALUES (?, ?, ?, ?, ?)");
        int inserted = 0;
        for (const auto& v : values) {
            st.bind(1, v.candidate_id).bind(2, v.minute_offset).bind(3, v.column_name)
              .bind(4, v.value).bind(5, v.section);
            st.run();
            inserted += db_.changes();
            st.reset();
        }
        tx.commit();
        return inserted;
    }

    bool has_trail(int64_t candidate_id, int minute_offset) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "SELECT 1 FROM trail_snapshots WHERE candidate_id = ? AND minute_offset = ? LIMIT 1");
        st.bind(1, candidate_id).bind(2, minute_offset);
        return st.step();
    }

    // Offsets already written for a candidate, ascending.
    std::vector<int> trail_offsets(int64_t candidate_id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "SELECT DISTINCT minute_offset FROM trail_snapshots WHERE candidate_id = ? "
            "ORDER BY minute_offset");
        st.bind(1, candidate_id);
        std::vector<int> out;
        while (st.step()) out.push_back(st.col_int(0));
        return out;
    }

    std::map<std::string, std::optional<double>> trail_at(int64_t candidate_id, int minute_offset) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "SELECT column_name, value FROM trail_snapshots "
            "WHERE candidate_id = ? AND minute_offset = ?");
        st.bind(1, candidate_id).bind(2, minute_offset);
        std::map<std::string, std::optional<double>> out;
        while (st.step()) out[st.col_text(0)] = st.col_opt_double(1);
        return out;
    }

    std::vector<TrailValue> trail(int64_t candidate_id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(std::string(TRAIL_SELECT) +
                              " WHERE candidate_id = ? ORDER BY minute_offset, column_name");
        st.bind(1, candidate_id);
        std::vector<TrailValue> out;
        while (st.step()) out.push_back(read_trail(st));
        return out;
    }

    // Trail rows of resolved candidates whose signal_ts lies in [from, to].
    std::vector<TrailValue> resolved_trail(uint64_t from_ts, uint64_t to_ts) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "SELECT t.candidate_id, t.minute_offset, t.column_name, t.value, t.section "
            "FROM trail_snapshots t JOIN trade_candidates c ON c.id = t.candidate_id "
            "WHERE c.status != 'open' AND c.realized_gain_pct IS NOT NULL "
            "AND c.signal_ts >= ? AND c.signal_ts <= ? "
            "ORDER BY t.candidate_id, t.minute_offset, t.column_name");
        st.bind(1, from_ts).bind(2, to_ts);
        std::vector<TrailValue> out;
        while (st.step()) out.push_back(read_trail(st));
        return out;
    }

    // =======================================================================
    // Whale events
    // =======================================================================

    // False for a duplicate signature.
    bool insert_whale_event(const WhaleEvent& e) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "INSERT OR IGNORE INTO whale_events "
            "(signature, wallet, ts, direction, sol_amount, wallet_pct_moved) "
            "VALUES (?, ?, ?, ?, ?, ?)");
        st.bind(1, e.signature).bind(2, e.wallet).bind(3, e.ts).bind(4, e.direction)
          .bind(5, e.sol_amount).bind(6, e.wallet_pct_moved);
        st.run();
        return db_.changes() == 1;
    }

    std::vector<WhaleEvent> whale_events(uint64_t from_ts, uint64_t to_ts) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "SELECT signature, wallet, ts, direction, sol_amount, wallet_pct_moved "
            "FROM whale_events WHERE ts >= ? AND ts <= ? ORDER BY ts");
        st.bind(1, from_ts).bind(2, to_ts);
        std::vector<WhaleEvent> out;
        while (st.step()) {
            WhaleEvent e;
            e.signature = st.col_text(0);
            e.wallet = st.col_text(1);
            e.ts = static_cast<uint64_t>(st.col_int64(2));
            e.direction = st.col_int(3);
            e.sol_amount = st.col_double(4);
            e.wallet_pct_moved = st.col_double(5);
            out.push_back(std::move(e));
        }
        return out;
    }

    // =======================================================================
    // Mining runs, suggestions, combinations, consistency
    // =======================================================================

    int64_t begin_mining_run(MiningRun& run) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "INSERT INTO mining_runs (started_at, status, window_start, window_end) "
            "VALUES (?, 'running', ?, ?)");
        st.bind(1, run.started_at).bind(2, run.window_start).bind(3, run.window_end);
        st.run();
        run.id = db_.last_insert_id();
        run.status = RunStatus::RUNNING;
        return run.id;
    }

    void finish_mining_run(const MiningRun& run) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "UPDATE mining_runs SET completed_at = ?, status = ?, total_filters_analyzed = ?, "
            "suggestions_count = ?, combinations_count = ?, best_combination_id = ?, "
            "best_minute_offset = ?, duration_ms = ?, candidates_analyzed = ?, "
            "rule_set_updated = ?, error = ? WHERE id = ?");
        st.bind(1, run.completed_at).bind(2, run_status_str(run.status))
          .bind(3, run.total_filters_analyzed).bind(4, run.suggestions_count)
          .bind(5, run.combinations_count);
        if (run.best_combination_id > 0) st.bind(6, run.best_combination_id);
        else st.bind_null(6);
        st.bind(7, run.best_minute_offset).bind(8, run.duration_ms)
          .bind(9, run.candidates_analyzed).bind(10, run.rule_set_updated)
          .bind(11, run.error).bind(12, run.id);
        st.run();
    }

    std::optional<MiningRun> mining_run(int64_t id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(std::string(RUN_SELECT) + " WHERE id = ?");
        st.bind(1, id);
        if (!st.step()) return std::nullopt;
        return read_run(st);
    }

    // Newest first.
    std::vector<MiningRun> recent_completed_runs(int limit) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(std::string(RUN_SELECT) +
                              " WHERE status = 'completed' ORDER BY id DESC LIMIT ?");
        st.bind(1, limit);
        std::vector<MiningRun> out;
        while (st.step()) out.push_back(read_run(st));
        return out;
    }

    std::vector<MiningRun> mining_runs() {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(std::string(RUN_SELECT) + " ORDER BY id");
        std::vector<MiningRun> out;
        while (st.step()) out.push_back(read_run(st));
        return out;
    }

    // Assigns ids in place.
    void save_suggestions(int64_t run_id, std::vector<FilterSuggestion>& suggestions) {
        std::lock_guard<std::mutex> lock(mu_);
        Transaction tx(db_);
        auto st = db_.prepare(
            "INSERT INTO filter_suggestions (run_id, column_name, section, minute_offset, "
            "from_value, to_value, good_kept_pct, bad_removed_pct, score, discovered_at, "
            "total_trades, good_before, bad_before, good_after, bad_after, "
            "bad_negative_after, bad_0_to_01_after, bad_01_to_02_after, bad_02_to_thr_after) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        for (auto& s : suggestions) {
            s.run_id = run_id;
            st.bind(1, run_id).bind(2, s.column_name).bind(3, s.section).bind(4, s.minute_offset)
              .bind(5, s.from_value).bind(6, s.to_value).bind(7, s.good_kept_pct)
              .bind(8, s.bad_removed_pct).bind(9, s.score).bind(10, s.discovered_at);
            bind_counts(st, 11, s.counts);
            st.run();
            s.id = db_.last_insert_id();
            st.reset();
        }
        tx.commit();
    }

    std::vector<FilterSuggestion> suggestions(int64_t run_id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(std::string(SUGGESTION_SELECT) +
                              " WHERE run_id = ? ORDER BY score DESC, id");
        st.bind(1, run_id);
        std::vector<FilterSuggestion> out;
        while (st.step()) out.push_back(read_suggestion(st));
        return out;
    }

    int64_t save_combination(FilterCombination& combo) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "INSERT INTO filter_combinations (run_id, filter_ids, minute_offset, good_kept_pct, "
            "bad_removed_pct, bad_trades_after, improvement_over_single, "
            "total_trades, good_before, bad_before, good_after, bad_after, "
            "bad_negative_after, bad_0_to_01_after, bad_01_to_02_after, bad_02_to_thr_after) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        std::ostringstream ids;
        for (size_t i = 0; i < combo.filters.size(); ++i) {
            if (i > 0) ids << ",";
            ids << combo.filters[i].id;
        }
        st.bind(1, combo.run_id).bind(2, ids.str()).bind(3, combo.minute_offset)
          .bind(4, combo.good_kept_pct).bind(5, combo.bad_removed_pct)
          .bind(6, combo.bad_trades_after).bind(7, combo.improvement_over_single);
        bind_counts(st, 8, combo.counts);
        st.run();
        combo.id = db_.last_insert_id();
        return combo.id;
    }

    std::optional<FilterCombination> combination(int64_t id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "SELECT id, run_id, filter_ids, minute_offset, good_kept_pct, bad_removed_pct, "
            "bad_trades_after, improvement_over_single, "
            "total_trades, good_before, bad_before, good_after, bad_after, "
            "bad_negative_after, bad_0_to_01_after, bad_01_to_02_after, bad_02_to_thr_after "
            "FROM filter_combinations WHERE id = ?");
        st.bind(1, id);
        if (!st.step()) return std::nullopt;
        FilterCombination c;
        c.id = st.col_int64(0);
        c.run_id = st.col_int64(1);
        std::string ids = st.col_text(2);
        c.minute_offset = st.col_int(3);
        c.good_kept_pct = st.col_double(4);
        c.bad_removed_pct = st.col_double(5);
        c.bad_trades_after = st.col_int(6);
        c.improvement_over_single = st.col_double(7);
        c.counts = read_counts(st, 8);

        std::istringstream in(ids);
        std::string tok;
        auto fs = db_.prepare(std::string(SUGGESTION_SELECT) + " WHERE id = ?");
        while (std::getline(in, tok, ',')) {
            if (tok.empty()) continue;
            fs.bind(1, static_cast<int64_t>(std::stoll(tok)));
            if (fs.step()) c.filters.push_back(read_suggestion(fs));
            fs.reset();
        }
        return c;
    }

    int count_combinations(int64_t run_id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare("SELECT COUNT(*) FROM filter_combinations WHERE run_id = ?");
        st.bind(1, run_id);
        st.step();
        return st.col_int(0);
    }

    void save_consistency(int64_t run_id, const std::vector<ColumnConsistency>& rows) {
        std::lock_guard<std::mutex> lock(mu_);
        Transaction tx(db_);
        auto st = db_.prepare(
            "INSERT OR REPLACE INTO filter_consistency (run_id, column_name, runs_considered, "
            "times_in_best_combo, consistency_pct, avg_bad_removed_pct, avg_good_kept_pct, "
            "latest_bad_removed_pct, trend) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        for (const auto& r : rows) {
            st.bind(1, run_id).bind(2, r.column_name).bind(3, r.runs_considered)
              .bind(4, r.times_in_best_combo).bind(5, r.consistency_pct)
              .bind(6, r.avg_bad_removed_pct).bind(7, r.avg_good_kept_pct)
              .bind(8, r.latest_bad_removed_pct).bind(9, trend_str(r.trend));
            st.run();
            st.reset();
        }
        tx.commit();
    }

    std::vector<ColumnConsistency> consistency(int64_t run_id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "SELECT column_name, runs_considered, times_in_best_combo, consistency_pct, "
            "avg_bad_removed_pct, avg_good_kept_pct, latest_bad_removed_pct, trend "
            "FROM filter_consistency WHERE run_id = ? ORDER BY consistency_pct DESC, column_name");
        st.bind(1, run_id);
        std::vector<ColumnConsistency> out;
        while (st.step()) {
            ColumnConsistency r;
            r.column_name = st.col_text(0);
            r.runs_considered = st.col_int(1);
            r.times_in_best_combo = st.col_int(2);
            r.consistency_pct = st.col_double(3);
            r.avg_bad_removed_pct = st.col_double(4);
            r.avg_good_kept_pct = st.col_double(5);
            r.latest_bad_removed_pct = st.col_double(6);
            std::string t = st.col_text(7);
            r.trend = t == "improving" ? FilterTrend::IMPROVING
                    : t == "declining" ? FilterTrend::DECLINING
                                       : FilterTrend::STABLE;
            out.push_back(std::move(r));
        }
        return out;
    }

    // =======================================================================
    // Rule sets
    // =======================================================================

    // Replace the filters of rule set `name` (creating it at version 1) and
    // bump its version. Readers see either the old or the new set, never a mix.
    RuleSet replace_rule_set(const std::string& name, const std::vector<RuleFilter>& filters,
                             int64_t source_combination_id = 0) {
        std::lock_guard<std::mutex> lock(mu_);
        Transaction tx(db_);
        RuleSet rs;
        rs.name = name;
        rs.source_combination_id = source_combination_id;
        {
            auto st = db_.prepare("SELECT id, version FROM rule_sets WHERE name = ?");
            st.bind(1, name);
            if (st.step()) {
                rs.id = st.col_int64(0);
                rs.version = st.col_int(1) + 1;
            }
        }
        if (rs.id == 0) {
            auto ins = db_.prepare(
                "INSERT INTO rule_sets (name, version, active, source_combination_id) "
                "VALUES (?, 1, 1, ?)");
            ins.bind(1, name).bind(2, source_combination_id);
            ins.run();
            rs.id = db_.last_insert_id();
            rs.version = 1;
        } else {
            auto up = db_.prepare(
                "UPDATE rule_sets SET version = ?, source_combination_id = ? WHERE id = ?");
            up.bind(1, rs.version).bind(2, source_combination_id).bind(3, rs.id);
            up.run();
            auto del = db_.prepare("DELETE FROM rule_set_filters WHERE rule_set_id = ?");
            del.bind(1, rs.id);
            del.run();
        }
        auto fi = db_.prepare(
            "INSERT INTO rule_set_filters (rule_set_id, column_name, section, minute_offset, "
            "from_value, to_value) VALUES (?, ?, ?, ?, ?, ?)");
        for (const auto& f : filters) {
            fi.bind(1, rs.id).bind(2, f.column_name).bind(3, f.section).bind(4, f.minute_offset)
              .bind(5, f.from_value).bind(6, f.to_value);
            fi.run();
            RuleFilter stored = f;
            stored.id = db_.last_insert_id();
            rs.filters.push_back(stored);
            fi.reset();
        }
        tx.commit();
        return rs;
    }

    void set_rule_set_active(int64_t rule_set_id, bool active) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare("UPDATE rule_sets SET active = ? WHERE id = ?");
        st.bind(1, active).bind(2, rule_set_id);
        st.run();
    }

    std::optional<RuleSet> rule_set(const std::string& name) {
        std::lock_guard<std::mutex> lock(mu_);
        Transaction tx(db_);
        auto st = db_.prepare(std::string(RULE_SET_SELECT) + " WHERE name = ?");
        st.bind(1, name);
        if (!st.step()) return std::nullopt;
        RuleSet rs = read_rule_set(st);
        load_rule_filters(rs);
        tx.commit();
        return rs;
    }

    // Active rule sets with their filters, read in one transaction.
    std::vector<RuleSet> active_rule_sets() {
        std::lock_guard<std::mutex> lock(mu_);
        Transaction tx(db_);
        auto st = db_.prepare(std::string(RULE_SET_SELECT) + " WHERE active = 1 ORDER BY id");
        std::vector<RuleSet> out;
        while (st.step()) out.push_back(read_rule_set(st));
        for (auto& rs : out) load_rule_filters(rs);
        tx.commit();
        return out;
    }

    // =======================================================================
    // Validation audit
    // =======================================================================

    void save_filter_results(int64_t candidate_id, const std::vector<FilterCheck>& checks) {
        if (checks.empty()) return;
        std::lock_guard<std::mutex> lock(mu_);
        Transaction tx(db_);
        auto st = db_.prepare(
            "INSERT INTO candidate_filter_results (candidate_id, rule_set_id, filter_id, "
            "column_name, minute_offset, from_value, to_value, actual_value, passed, error) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        for (const auto& c : checks) {
            st.bind(1, candidate_id).bind(2, c.rule_set_id).bind(3, c.filter_id)
              .bind(4, c.column_name).bind(5, c.minute_offset).bind(6, c.from_value)
              .bind(7, c.to_value).bind(8, c.actual_value).bind(9, c.passed).bind(10, c.error);
            st.run();
            st.reset();
        }
        tx.commit();
    }

    std::vector<FilterCheck> filter_results(int64_t candidate_id) {
        std::lock_guard<std::mutex> lock(mu_);
        auto st = db_.prepare(
            "SELECT rule_set_id, filter_id, column_name, minute_offset, from_value, to_value, "
            "actual_value, passed, error FROM candidate_filter_results "
            "WHERE candidate_id = ? ORDER BY id");
        st.bind(1, candidate_id);
        std::vector<FilterCheck> out;
        while (st.step()) {
            FilterCheck c;
            c.rule_set_id = st.col_int64(0);
            c.filter_id = st.col_int64(1);
            c.column_name = st.col_text(2);
            c.minute_offset = st.col_int(3);
            c.from_value = st.col_double(4);
            c.to_value = st.col_double(5);
            c.actual_value = st.col_opt_double(6);
            c.passed = st.col_int(7) != 0;
            c.error = st.col_text(8);
            out.push_back(std::move(c));
        }
        return out;
    }

private:
    static constexpr const char* CANDIDATE_SELECT =
        "SELECT id, signal_ts, entry_price, wallet_id, symbol, decision, decision_reason, "
        "rule_set_version, status, realized_gain_pct, max_favorable_pct, closed_at, label "
        "FROM trade_candidates";

    static constexpr const char* TRAIL_SELECT =
        "SELECT candidate_id, minute_offset, column_name, value, section FROM trail_snapshots";

    static constexpr const char* RUN_SELECT =
        "SELECT id, started_at, completed_at, status, total_filters_analyzed, suggestions_count, "
        "combinations_count, best_combination_id, best_minute_offset, duration_ms, "
        "window_start, window_end, candidates_analyzed, rule_set_updated, error "
        "FROM mining_runs";

    static constexpr const char* SUGGESTION_SELECT =
        "SELECT id, run_id, column_name, section, minute_offset, from_value, to_value, "
        "good_kept_pct, bad_removed_pct, score, discovered_at, "
        "total_trades, good_before, bad_before, good_after, bad_after, "
        "bad_negative_after, bad_0_to_01_after, bad_01_to_02_after, bad_02_to_thr_after "
        "FROM filter_suggestions";

    static constexpr const char* RULE_SET_SELECT =
        "SELECT id, name, version, active, source_combination_id FROM rule_sets";

    void create_schema() {
        db_.exec(R"SQL(
            CREATE TABLE IF NOT EXISTS trade_candidates (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                signal_ts INTEGER NOT NULL,
                entry_price REAL NOT NULL,
                wallet_id TEXT NOT NULL DEFAULT '',
                symbol TEXT NOT NULL DEFAULT 'SOL',
                decision TEXT NOT NULL DEFAULT 'PENDING',
                decision_reason TEXT NOT NULL DEFAULT '',
                rule_set_version TEXT NOT NULL DEFAULT '',
                decision_claimed INTEGER NOT NULL DEFAULT 0,
                tracking_started INTEGER NOT NULL DEFAULT 0,
                status TEXT NOT NULL DEFAULT 'open',
                realized_gain_pct REAL,
                max_favorable_pct REAL,
                closed_at INTEGER NOT NULL DEFAULT 0,
                label TEXT NOT NULL DEFAULT ''
            );
            CREATE INDEX IF NOT EXISTS idx_candidates_signal ON trade_candidates(signal_ts);
            CREATE INDEX IF NOT EXISTS idx_candidates_status ON trade_candidates(status);

            CREATE TABLE IF NOT EXISTS trail_snapshots (
                candidate_id INTEGER NOT NULL REFERENCES trade_candidates(id),
                minute_offset INTEGER NOT NULL,
                column_name TEXT NOT NULL,
                value REAL,
                section TEXT NOT NULL,
                PRIMARY KEY (candidate_id, minute_offset, column_name)
            );

            CREATE TABLE IF NOT EXISTS whale_events (
                signature TEXT PRIMARY KEY,
                wallet TEXT NOT NULL,
                ts INTEGER NOT NULL,
                direction INTEGER NOT NULL,
                sol_amount REAL NOT NULL,
                wallet_pct_moved REAL NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_whale_ts ON whale_events(ts);

            CREATE TABLE IF NOT EXISTS mining_runs (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                started_at INTEGER NOT NULL,
                completed_at INTEGER NOT NULL DEFAULT 0,
                status TEXT NOT NULL,
                total_filters_analyzed INTEGER NOT NULL DEFAULT 0,
                suggestions_count INTEGER NOT NULL DEFAULT 0,
                combinations_count INTEGER NOT NULL DEFAULT 0,
                best_combination_id INTEGER,
                best_minute_offset INTEGER NOT NULL DEFAULT -1,
                duration_ms INTEGER NOT NULL DEFAULT 0,
                window_start INTEGER NOT NULL,
                window_end INTEGER NOT NULL,
                candidates_analyzed INTEGER NOT NULL DEFAULT 0,
                rule_set_updated INTEGER NOT NULL DEFAULT 0,
                error TEXT NOT NULL DEFAULT ''
            );

            CREATE TABLE IF NOT EXISTS filter_suggestions (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                run_id INTEGER NOT NULL REFERENCES mining_runs(id),
                column_name TEXT NOT NULL,
                section TEXT NOT NULL,
                minute_offset INTEGER NOT NULL,
                from_value REAL NOT NULL,
                to_value REAL NOT NULL,
                good_kept_pct REAL NOT NULL,
                bad_removed_pct REAL NOT NULL,
                score REAL NOT NULL,
                discovered_at INTEGER NOT NULL,
                total_trades INTEGER NOT NULL DEFAULT 0,
                good_before INTEGER NOT NULL DEFAULT 0,
                bad_before INTEGER NOT NULL DEFAULT 0,
                good_after INTEGER NOT NULL DEFAULT 0,
                bad_after INTEGER NOT NULL DEFAULT 0,
                bad_negative_after INTEGER NOT NULL DEFAULT 0,
                bad_0_to_01_after INTEGER NOT NULL DEFAULT 0,
                bad_01_to_02_after INTEGER NOT NULL DEFAULT 0,
                bad_02_to_thr_after INTEGER NOT NULL DEFAULT 0
            );
            CREATE INDEX IF NOT EXISTS idx_suggestions_run ON filter_suggestions(run_id);

            CREATE TABLE IF NOT EXISTS filter_combinations (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                run_id INTEGER NOT NULL REFERENCES mining_runs(id),
                filter_ids TEXT NOT NULL,
                minute_offset INTEGER NOT NULL,
                good_kept_pct REAL NOT NULL,
                bad_removed_pct REAL NOT NULL,
                bad_trades_after INTEGER NOT NULL,
                improvement_over_single REAL NOT NULL DEFAULT 0,
                total_trades INTEGER NOT NULL DEFAULT 0,
                good_before INTEGER NOT NULL DEFAULT 0,
                bad_before INTEGER NOT NULL DEFAULT 0,
                good_after INTEGER NOT NULL DEFAULT 0,
                bad_after INTEGER NOT NULL DEFAULT 0,
                bad_negative_after INTEGER NOT NULL DEFAULT 0,
                bad_0_to_01_after INTEGER NOT NULL DEFAULT 0,
                bad_01_to_02_after INTEGER NOT NULL DEFAULT 0,
                bad_02_to_thr_after INTEGER NOT NULL DEFAULT 0
            );

            CREATE TABLE IF NOT EXISTS filter_consistency (
                run_id INTEGER NOT NULL REFERENCES mining_runs(id),
                column_name TEXT NOT NULL,
                runs_considered INTEGER NOT NULL,
                times_in_best_combo INTEGER NOT NULL,
                consistency_pct REAL NOT NULL,
                avg_bad_removed_pct REAL NOT NULL,
                avg_good_kept_pct REAL NOT NULL,
                latest_bad_removed_pct REAL NOT NULL,
                trend TEXT NOT NULL,
                PRIMARY KEY (run_id, column_name)
            );

            CREATE TABLE IF NOT EXISTS rule_sets (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL UNIQUE,
                version INTEGER NOT NULL,
                active INTEGER NOT NULL DEFAULT 1,
                source_combination_id INTEGER NOT NULL DEFAULT 0
            );

            CREATE TABLE IF NOT EXISTS rule_set_filters (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                rule_set_id INTEGER NOT NULL REFERENCES rule_sets(id),
                column_name TEXT NOT NULL,
                section TEXT NOT NULL,
                minute_offset INTEGER NOT NULL,
                from_value REAL NOT NULL,
                to_value REAL NOT NULL
            );

            CREATE TABLE IF NOT EXISTS candidate_filter_results (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                candidate_id INTEGER NOT NULL REFERENCES trade_candidates(id),
                rule_set_id INTEGER NOT NULL,
                filter_id INTEGER NOT NULL,
                column_name TEXT NOT NULL,
                minute_offset INTEGER NOT NULL,
                from_value REAL NOT NULL,
                to_value REAL NOT NULL,
                actual_value REAL,
                passed INTEGER NOT NULL,
                error TEXT NOT NULL DEFAULT ''
            );
        )SQL");
    }

    static TradeCandidate read_candidate(const Statement& st) {
        TradeCandidate c;
        c.id = st.col_int64(0);
        c.signal_ts = static_cast<uint64_t>(st.col_int64(1));
        c.entry_price = st.col_double(2);
        c.wallet_id = st.col_text(3);
        c.symbol = st.col_text(4);
        c.decision = decision_from_str(st.col_text(5));
        c.decision_reason = st.col_text(6);
        c.rule_set_version = st.col_text(7);
        c.status = status_from_str(st.col_text(8));
        c.realized_gain_pct = st.col_opt_double(9);
        c.max_favorable_pct = st.col_opt_double(10);
        c.closed_at = static_cast<uint64_t>(st.col_int64(11));
        c.label = label_from_str(st.col_text(12));
        return c;
    }

    static TrailValue read_trail(const Statement& st) {
        TrailValue v;
        v.candidate_id = st.col_int64(0);
        v.minute_offset = st.col_int(1);
        v.column_name = st.col_text(2);
        v.value = st.col_opt_double(3);
        v.section = st.col_text(4);
        return v;
    }

    static MiningRun read_run(const Statement& st) {
        MiningRun r;
        r.id = st.col_int64(0);
        r.started_at = static_cast<uint64_t>(st.col_int64(1));
        r.completed_at = static_cast<uint64_t>(st.col_int64(2));
        r.status = run_status_from_str(st.col_text(3));
        r.total_filters_analyzed = st.col_int(4);
        r.suggestions_count = st.col_int(5);
        r.combinations_count = st.col_int(6);
        r.best_combination_id = st.col_is_null(7) ? 0 : st.col_int64(7);
        r.best_minute_offset = st.col_int(8);
        r.duration_ms = st.col_int64(9);
        r.window_start = static_cast<uint64_t>(st.col_int64(10));
        r.window_end = static_cast<uint64_t>(st.col_int64(11));
        r.candidates_analyzed = st.col_int(12);
        r.rule_set_updated = st.col_int(13) != 0;
        r.error = st.col_text(14);
        return r;
    }

    static FilterSuggestion read_suggestion(const Statement& st) {
        FilterSuggestion s;
        s.id = st.col_int64(0);
        s.run_id = st.col_int64(1);
        s.column_name = st.col_text(2);
        s.section = st.col_text(3);
        s.minute_offset = st.col_int(4);
        s.from_value = st.col_double(5);
        s.to_value = st.col_double(6);
        s.good_kept_pct = st.col_double(7);
        s.bad_removed_pct = st.col_double(8);
        s.score = st.col_double(9);
        s.discovered_at = static_cast<uint64_t>(st.col_int64(10));
        s.counts = read_counts(st, 11);
        return s;
    }

    static void bind_counts(Statement& st, int first, const OutcomeCounts& c) {
        st.bind(first, c.total_trades).bind(first + 1, c.good_before)
          .bind(first + 2, c.bad_before).bind(first + 3, c.good_after)
          .bind(first + 4, c.bad_after).bind(first + 5, c.bad_negative_after)
          .bind(first + 6, c.bad_0_to_01_after).bind(first + 7, c.bad_01_to_02_after)
          .bind(first + 8, c.bad_02_to_thr_after);
    }

    static OutcomeCounts read_counts(const Statement& st, int first) {
        OutcomeCounts c;
        c.total_trades = st.col_int(first);
        c.good_before = st.col_int(first + 1);
        c.bad_before = st.col_int(first + 2);
        c.good_after = st.col_int(first + 3);
        c.bad_after = st.col_int(first + 4);
        c.bad_negative_after = st.col_int(first + 5);
        c.bad_0_to_01_after = st.col_int(first + 6);
        c.bad_01_to_02_after = st.col_int(first + 7);
        c.bad_02_to_thr_after = st.col_int(first + 8);
        return c;
    }

    static RuleSet read_rule_set(const Statement& st) {
        RuleSet rs;
        rs.id = st.col_int64(0);
        rs.name = st.col_text(1);
        rs.version = st.col_int(2);
        rs.active = st.col_int(3) != 0;
        rs.source_combination_id = st.col_int64(4);
        return rs;
    }

    // Caller holds mu_.
    void load_rule_filters(RuleSet& rs) {
        auto st = db_.prepare(
            "SELECT id, column_name, section, minute_offset, from_value, to_value "
            "FROM rule_set_filters WHERE rule_set_id = ? ORDER BY id");
        st.bind(1, rs.id);
        while (st.step()) {
            RuleFilter f;
            f.id = st.col_int64(0);
            f.column_name = st.col_text(1);
            f.section = st.col_text(2);
            f.minute_offset = st.col_int(3);
            f.from_value = st.col_double(4);
            f.to_value = st.col_double(5);
            rs.filters.push_back(std::move(f));
        }
    }

    SqliteDb db_;
    std::mutex mu_;
};
