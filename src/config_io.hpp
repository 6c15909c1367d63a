#pragma once

#include "engine_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// config_io — flat "key = value" files plus "--key value" CLI overrides
//
// Both sources go through apply_setting(), so a file and the command line
// accept exactly the same keys. Unknown keys are rejected.
// ---------------------------------------------------------------------------
namespace config_io {

inline std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

inline bool parse_bool(const std::string& key, const std::string& v) {
    if (v == "true" || v == "1" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "no") return false;
    throw std::invalid_argument(key + ": expected boolean, got '" + v + "'");
}

inline int parse_int(const std::string& key, const std::string& v) {
    try {
        size_t pos = 0;
        int out = std::stoi(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return out;
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": expected integer, got '" + v + "'");
    }
}

inline double parse_double(const std::string& key, const std::string& v) {
    try {
        size_t pos = 0;
        double out = std::stod(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return out;
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": expected number, got '" + v + "'");
    }
}

// Apply one setting; throws std::invalid_argument for unknown keys or bad values.
inline void apply_setting(EngineConfig& cfg, const std::string& key, const std::string& value) {
    // Gate
    if (key == "lookback_minutes") { cfg.gate.lookback_minutes = parse_int(key, value); return; }
    if (key == "min_change_pct") { cfg.gate.min_change_pct = parse_double(key, value); return; }
    if (key == "gate_timeout_ms") { cfg.gate.timeout_ms = parse_int(key, value); return; }
    if (key == "price_match_window_s") { cfg.gate.price_match_window_s = parse_int(key, value); return; }
    if (key == "no_data_policy") {
        if (value == "allow") cfg.gate.no_data_policy = GateConfig::NoDataPolicy::ALLOW;
        else if (value == "reject") cfg.gate.no_data_policy = GateConfig::NoDataPolicy::REJECT;
        else throw std::invalid_argument("no_data_policy: expected allow|reject, got '" + value + "'");
        return;
    }

    // Trail
    if (key == "tracking_window_minutes") { cfg.trail.tracking_window_minutes = parse_int(key, value); return; }
    if (key == "section_timeout_ms") { cfg.trail.section_timeout_ms = parse_int(key, value); return; }
    if (key == "persist_gate_metrics") { cfg.trail.persist_gate_metrics = parse_bool(key, value); return; }

    // Mining
    if (key == "good_trade_threshold_pct") { cfg.mining.good_trade_threshold_pct = parse_double(key, value); return; }
    if (key == "analysis_window_hours") { cfg.mining.analysis_window_hours = parse_int(key, value); return; }
    if (key == "min_filters_in_combo") { cfg.mining.min_filters_in_combo = parse_int(key, value); return; }
    if (key == "max_filters_in_combo") { cfg.mining.max_filters_in_combo = parse_int(key, value); return; }
    if (key == "min_good_kept_pct") { cfg.mining.min_good_kept_pct = parse_double(key, value); return; }
    if (key == "min_bad_removed_pct") { cfg.mining.min_bad_removed_pct = parse_double(key, value); return; }
    if (key == "combo_min_good_kept_pct") { cfg.mining.combo_min_good_kept_pct = parse_double(key, value); return; }
    if (key == "combo_min_improvement") { cfg.mining.combo_min_improvement = parse_double(key, value); return; }
    if (key == "top_k_filters") { cfg.mining.top_k_filters = parse_int(key, value); return; }
    if (key == "consistency_runs") { cfg.mining.consistency_runs = parse_int(key, value); return; }
    if (key == "trend_band_pct") { cfg.mining.trend_band_pct = parse_double(key, value); return; }
    if (key == "max_combination_offset") { cfg.mining.max_combination_offset = parse_int(key, value); return; }
    if (key == "auto_rule_set_name") { cfg.mining.auto_rule_set_name = value; return; }

    // Validator
    if (key == "validator_timeout_ms") { cfg.validator.timeout_ms = parse_int(key, value); return; }
    if (key == "decision_offset") { cfg.validator.decision_offset = parse_int(key, value); return; }
    if (key == "no_rule_set_policy") {
        if (value == "allow") cfg.validator.no_rule_set_policy = ValidatorConfig::NoRuleSetPolicy::ALLOW;
        else if (value == "reject") cfg.validator.no_rule_set_policy = ValidatorConfig::NoRuleSetPolicy::REJECT;
        else throw std::invalid_argument("no_rule_set_policy: expected allow|reject, got '" + value + "'");
        return;
    }

    if (key == "db_path") { cfg.db_path = value; return; }

    throw std::invalid_argument("unknown config key: " + key);
}

// Parse "key = value" lines; '#' starts a comment.
inline std::map<std::string, std::string> parse_key_values(std::istream& in) {
    std::map<std::string, std::string> out;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("config line " + std::to_string(line_no) +
                                        ": expected key = value");
        }
        out[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }
    return out;
}

inline void load_file(EngineConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    for (const auto& [key, value] : parse_key_values(in)) {
        apply_setting(cfg, key, value);
    }
}

// Apply "--key value" pairs; returns the arguments it did not consume.
// "--config <path>" loads a file first so later flags override it.
inline std::vector<std::string> apply_cli(EngineConfig& cfg, int argc, char* argv[]) {
    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
            rest.push_back(arg);
            continue;
        }
        std::string key = arg.substr(2);
        std::replace(key.begin(), key.end(), '-', '_');
        if (key == "config") {
            load_file(cfg, argv[++i]);
            continue;
        }
        try {
            apply_setting(cfg, key, argv[i + 1]);
            ++i;
        } catch (const std::invalid_argument& e) {
            if (std::string(e.what()).rfind("unknown config key", 0) == 0) {
                rest.push_back(arg);
                continue;
            }
            throw;
        }
    }
    return rest;
}

}  // namespace config_io
