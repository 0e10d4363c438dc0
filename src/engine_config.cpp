#include "config/engine_config.hpp"
#include "config/json_value.hpp"
#include "execution/order.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace ramm {

namespace {

void read_size(const JsonValue& obj, const char* key, size_t& out) {
    int64_t v = obj.get_int(key, static_cast<int64_t>(out));
    if (v < 0) {
        throw ConfigError(std::string("config: '") + key + "' must not be negative");
    }
    out = static_cast<size_t>(v);
}

void read_int(const JsonValue& obj, const char* key, int64_t& out) {
    out = obj.get_int(key, out);
}

void read_int(const JsonValue& obj, const char* key, int& out) {
    out = static_cast<int>(obj.get_int(key, out));
}

void read_double(const JsonValue& obj, const char* key, double& out) {
    out = obj.get_number(key, out);
}

void load_metrics(const JsonValue& m, MetricsParams& p) {
    read_size(m, "window", p.window);
    read_size(m, "calibration_steps", p.calibration_steps);
    read_size(m, "churn_window", p.churn_window);
    read_double(m, "epsilon", p.epsilon);
}

void load_regime(const JsonValue& r, RegimeThresholds& t) {
    std::string preset = r.get_string("preset", "compound");
    if (preset == "simple") {
        t = RegimeThresholds::simple_preset();
    } else if (preset == "compound") {
        t = RegimeThresholds::compound_preset();
    } else {
        throw ConfigError("config: unknown regime preset '" + preset + "'");
    }

    read_double(r, "crash_spread_ratio", t.crash_spread_ratio);
    read_double(r, "crash_velocity", t.crash_velocity);
    read_double(r, "crash_imbalance", t.crash_imbalance);
    t.compound_enabled = r.get_bool("compound_enabled", t.compound_enabled);
    read_double(r, "compound_spread_ratio", t.compound_spread_ratio);
    read_double(r, "compound_velocity", t.compound_velocity);
    read_double(r, "compound_imbalance", t.compound_imbalance);
    read_double(r, "compound_velocity_with_imb", t.compound_velocity_with_imb);
    read_double(r, "compound_imbalance_with_vel", t.compound_imbalance_with_vel);
    read_double(r, "recovery_enter_spread_ratio", t.recovery_enter_spread_ratio);
    read_double(r, "recovery_exit_spread_ratio", t.recovery_exit_spread_ratio);
    read_int(r, "recovery_cooldown_steps", t.recovery_cooldown_steps);
    read_double(r, "stressed_enter_spread_ratio", t.stressed_enter_spread_ratio);
    read_double(r, "stressed_enter_imbalance", t.stressed_enter_imbalance);
    read_double(r, "stressed_enter_depth_ratio", t.stressed_enter_depth_ratio);
    read_double(r, "stressed_exit_spread_ratio", t.stressed_exit_spread_ratio);
    read_double(r, "stressed_exit_imbalance", t.stressed_exit_imbalance);
    read_double(r, "stressed_exit_depth_ratio", t.stressed_exit_depth_ratio);
    read_double(r, "hft_enter_churn", t.hft_enter_churn);
    read_double(r, "hft_exit_churn", t.hft_exit_churn);
    read_double(r, "hft_max_spread_ratio", t.hft_max_spread_ratio);
    read_double(r, "hft_min_depth_ratio", t.hft_min_depth_ratio);
    read_double(r, "hft_max_velocity", t.hft_max_velocity);
}

void load_passive(const JsonValue* p, PassiveMmParams& out) {
    if (!p) return;
    read_double(*p, "skew_factor", out.skew_factor);
    read_int(*p, "max_inventory", out.max_inventory);
    read_int(*p, "qty", out.qty);
    read_int(*p, "trade_freq", out.trade_freq);
}

void load_strategies(const JsonValue& s, StrategyParams& p) {
    load_passive(s.get_object("passive_normal"), p.passive_normal);
    load_passive(s.get_object("passive_hft"), p.passive_hft);

    if (auto* a = s.get_object("aggressive")) {
        read_int(*a, "max_inventory", p.aggressive.max_inventory);
        read_int(*a, "qty", p.aggressive.qty);
        read_int(*a, "trade_freq", p.aggressive.trade_freq);
        read_double(*a, "skew_factor", p.aggressive.skew_factor);
        read_int(*a, "flatten_inventory", p.aggressive.flatten_inventory);
        read_int(*a, "unwind_qty", p.aggressive.unwind_qty);
    }
    if (auto* m = s.get_object("mean_reversion")) {
        read_double(*m, "entry_z", p.mean_reversion.entry_z);
        read_double(*m, "exit_z", p.mean_reversion.exit_z);
        read_int(*m, "max_inventory", p.mean_reversion.max_inventory);
        read_int(*m, "qty", p.mean_reversion.qty);
        read_int(*m, "exit_inventory", p.mean_reversion.exit_inventory);
    }
    if (auto* m = s.get_object("momentum")) {
        read_double(*m, "entry_velocity", p.momentum.entry_velocity);
        read_int(*m, "max_inventory", p.momentum.max_inventory);
        read_int(*m, "qty", p.momentum.qty);
        read_int(*m, "trade_freq", p.momentum.trade_freq);
    }
    if (auto* c = s.get_object("crash_survival")) {
        read_int(*c, "flatten_threshold", p.crash_survival.flatten_threshold);
        read_int(*c, "qty", p.crash_survival.qty);
    }
    read_double(s, "strong_signal_z", p.strong_signal_z);
    p.normal_fallback = s.get_string("normal_fallback", p.normal_fallback);
    p.experiment = s.get_string("experiment", p.experiment);
}

void load_risk(const JsonValue& r, RiskParams& p) {
    read_int(r, "hard_limit", p.hard_limit);
    read_int(r, "safety_buffer", p.safety_buffer);
    read_int(r, "emergency_qty", p.emergency_qty);
    read_double(r, "emergency_offset", p.emergency_offset);
}

void load_orders(const JsonValue& o, OrderManagerParams& p) {
    read_size(o, "max_open_orders", p.max_open_orders);
    read_size(o, "cancel_batch", p.cancel_batch);
    read_int(o, "stale_check_interval", p.stale_check_interval);
    read_int(o, "stale_after_steps", p.stale_after_steps);
    read_int(o, "stale_after_steps_hft", p.stale_after_steps_hft);
}

} // anonymous namespace

RegimeThresholds RegimeThresholds::compound_preset() {
    return RegimeThresholds{};
}

RegimeThresholds RegimeThresholds::simple_preset() {
    RegimeThresholds t;
    t.crash_spread_ratio = 2.5;
    t.crash_velocity     = 0.15;
    t.crash_imbalance    = 0.6;
    t.compound_enabled   = false;
    return t;
}

void EngineConfig::validate() const {
    if (metrics.window < 10) {
        throw ConfigError("config: metrics.window must be at least 10");
    }
    if (metrics.calibration_steps == 0 || metrics.calibration_steps > metrics.window) {
        throw ConfigError("config: metrics.calibration_steps must be in [1, window]");
    }
    if (metrics.churn_window == 0) {
        throw ConfigError("config: metrics.churn_window must be positive");
    }
    if (metrics.epsilon <= 0.0) {
        throw ConfigError("config: metrics.epsilon must be positive");
    }
    if (regime.stressed_exit_spread_ratio > regime.stressed_enter_spread_ratio ||
        regime.hft_exit_churn > regime.hft_enter_churn) {
        throw ConfigError("config: exit thresholds must not be stricter than enter thresholds");
    }
    for (const auto* p : {&strategies.passive_normal, &strategies.passive_hft}) {
        if (p->trade_freq <= 0) {
            throw ConfigError("config: passive trade_freq must be positive");
        }
    }
    if (strategies.aggressive.trade_freq <= 0 || strategies.momentum.trade_freq <= 0) {
        throw ConfigError("config: trade_freq must be positive");
    }
    if (strategies.normal_fallback != "aggressive_mm" && strategies.normal_fallback != "momentum") {
        throw ConfigError("config: strategies.normal_fallback must be 'aggressive_mm' or 'momentum'");
    }
    if (strategies.experiment.empty()) {
        throw ConfigError("config: strategies.experiment must not be empty");
    }
    if (risk.hard_limit <= risk.safety_buffer || risk.safety_buffer < 0) {
        throw ConfigError("config: risk.hard_limit must exceed risk.safety_buffer");
    }
    if (risk.emergency_qty < kMinOrderQty || risk.emergency_qty > kMaxOrderQty ||
        risk.emergency_qty % kLotSize != 0) {
        throw ConfigError("config: risk.emergency_qty must be a multiple of 100 in [100, 500]");
    }
    if (risk.emergency_offset < 0.0) {
        throw ConfigError("config: risk.emergency_offset must not be negative");
    }
    if (orders.max_open_orders == 0 || orders.cancel_batch == 0) {
        throw ConfigError("config: orders.max_open_orders and orders.cancel_batch must be positive");
    }
    if (orders.stale_check_interval <= 0) {
        throw ConfigError("config: orders.stale_check_interval must be positive");
    }
}

EngineConfig parse_engine_config(const std::string& json_text) {
    JsonValue root;
    try {
        root = parse_json(json_text);
    } catch (const ParseError& e) {
        throw ConfigError(std::string("config: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config: top-level value must be an object");
    }

    EngineConfig config;
    if (auto* m = root.get_object("metrics"))    load_metrics(*m, config.metrics);
    if (auto* r = root.get_object("regime"))     load_regime(*r, config.regime);
    if (auto* s = root.get_object("strategies")) load_strategies(*s, config.strategies);
    if (auto* r = root.get_object("risk"))       load_risk(*r, config.risk);
    if (auto* o = root.get_object("orders"))     load_orders(*o, config.orders);
    if (auto* l = root.get_object("logging")) {
        config.logging.level = l->get_string("level", config.logging.level);
        config.logging.step_log_dir = l->get_string("step_log_dir", config.logging.step_log_dir);
    }

    config.validate();
    return config;
}

EngineConfig load_engine_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("config file '{}' not found, using defaults", path);
        EngineConfig config;
        config.validate();
        return config;
    }

    std::string content((std::istreambuf_iterator<char>(f)),
                         std::istreambuf_iterator<char>());
    if (f.bad()) {
        throw ConfigError("config: failed to read " + path);
    }
    return parse_engine_config(content);
}

} // namespace ramm
