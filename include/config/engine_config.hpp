#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ramm {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct MetricsParams {
    size_t window            = 100;    // rolling window capacity W
    size_t calibration_steps = 100;    // samples before the baseline is captured
    size_t churn_window      = 20;     // tumbling window for churn rate
    double epsilon           = 0.001;  // min volatility / mid move considered non-zero
};

struct RegimeThresholds {
    // CRASH: any single signal
    double crash_spread_ratio = 2.0;
    double crash_velocity     = 0.10;
    double crash_imbalance    = 0.5;

    // CRASH: pairwise compound signals
    bool   compound_enabled            = true;
    double compound_spread_ratio       = 1.8;
    double compound_velocity           = 0.06;
    double compound_imbalance          = 0.4;
    double compound_velocity_with_imb  = 0.08;
    double compound_imbalance_with_vel = 0.45;

    // RECOVERY
    double recovery_enter_spread_ratio = 1.8;
    double recovery_exit_spread_ratio  = 1.5;
    int    recovery_cooldown_steps     = 100;

    // STRESSED (enter / exit hysteresis)
    double stressed_enter_spread_ratio = 1.5;
    double stressed_enter_imbalance    = 0.4;
    double stressed_enter_depth_ratio  = 0.5;
    double stressed_exit_spread_ratio  = 1.2;
    double stressed_exit_imbalance     = 0.3;
    double stressed_exit_depth_ratio   = 0.6;

    // HFT (enter / exit hysteresis on churn, gated by a stable market)
    double hft_enter_churn       = 0.20;
    double hft_exit_churn        = 0.12;
    double hft_max_spread_ratio  = 1.6;
    double hft_min_depth_ratio   = 0.4;
    double hft_max_velocity      = 0.08;

    // Lower single-signal crash thresholds with compound checks.
    static RegimeThresholds compound_preset();
    // Higher single-signal crash thresholds, no compound checks.
    static RegimeThresholds simple_preset();
};

struct PassiveMmParams {
    double  skew_factor   = 0.0002;
    int64_t max_inventory = 3000;
    int64_t qty           = 200;
    int64_t trade_freq    = 15;
};

struct AggressiveMmParams {
    int64_t max_inventory     = 3500;
    int64_t qty               = 200;
    int64_t trade_freq        = 10;
    double  skew_factor       = 0.0002;
    int64_t flatten_inventory = 1000;   // above this, only quote the reducing side
    int64_t unwind_qty        = 300;    // forced unwind size at max_inventory
};

struct MeanReversionParams {
    double  entry_z        = 1.5;
    double  exit_z         = 0.5;
    int64_t max_inventory  = 2500;
    int64_t qty            = 200;
    int64_t exit_inventory = 300;   // only reduce when |inventory| exceeds this
};

struct MomentumParams {
    double  entry_velocity = 0.02;
    int64_t max_inventory  = 2500;
    int64_t qty            = 200;
    int64_t trade_freq     = 5;
};

struct CrashSurvivalParams {
    int64_t flatten_threshold = 200;
    int64_t qty               = 500;
};

struct StrategyParams {
    PassiveMmParams     passive_normal{.skew_factor = 0.0002, .max_inventory = 3000, .qty = 200, .trade_freq = 5};
    PassiveMmParams     passive_hft{.skew_factor = 0.0001, .max_inventory = 3000, .qty = 100, .trade_freq = 1};
    AggressiveMmParams  aggressive{.max_inventory = 3500, .qty = 200, .trade_freq = 2};
    MeanReversionParams mean_reversion;
    MomentumParams      momentum;
    CrashSurvivalParams crash_survival;
    double              strong_signal_z = 1.5;   // NORMAL: mean reversion above this |z|
    std::string         normal_fallback = "aggressive_mm";   // or "momentum"
    std::string         experiment      = "regime_adaptive"; // or a fixed-rule experiment
};

struct RiskParams {
    int64_t hard_limit       = 4500;
    int64_t safety_buffer    = 3000;
    int64_t emergency_qty    = 500;
    double  emergency_offset = 0.05;
};

struct OrderManagerParams {
    size_t  max_open_orders       = 10;
    size_t  cancel_batch          = 3;
    int64_t stale_check_interval  = 5;
    int64_t stale_after_steps     = 50;
    int64_t stale_after_steps_hft = 10;
};

struct LoggingParams {
    std::string level        = "info";
    std::string step_log_dir = "data/raw";
};

struct EngineConfig {
    MetricsParams      metrics;
    RegimeThresholds   regime;
    StrategyParams     strategies;
    RiskParams         risk;
    OrderManagerParams orders;
    LoggingParams      logging;

    // Throws ConfigError on inconsistent values.
    void validate() const;
};

// Missing file: defaults with a warning. Unreadable or malformed: ConfigError.
EngineConfig load_engine_config(const std::string& path);

// Parse from an in-memory JSON document.
EngineConfig parse_engine_config(const std::string& json_text);

} // namespace ramm
