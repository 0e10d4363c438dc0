#include "strategy/regime_classifier.hpp"

#include <algorithm>
#include <cmath>

namespace ramm {

namespace {

double finite_or(double v, double fallback) {
    return std::isfinite(v) ? v : fallback;
}

} // anonymous namespace

MetricsSignals sanitize(const MetricsSignals& in) {
    MetricsSignals s = in;
    s.spread_ratio = finite_or(in.spread_ratio, 1.0);
    s.depth_ratio  = finite_or(in.depth_ratio, 1.0);
    s.momentum     = finite_or(in.momentum, 0.0);
    s.z_score      = finite_or(in.z_score, 0.0);
    s.volatility   = std::max(0.0, finite_or(in.volatility, 0.0));
    s.imbalance    = std::clamp(finite_or(in.imbalance, 0.0), -1.0, 1.0);
    s.churn        = std::clamp(finite_or(in.churn, 0.0), 0.0, 1.0);
    return s;
}

RegimeClassifier::RegimeClassifier(const RegimeThresholds& thresholds)
    : t_(thresholds) {}

bool RegimeClassifier::is_crash(double spread, double vel, double imb) const {
    if (spread > t_.crash_spread_ratio || vel > t_.crash_velocity || imb > t_.crash_imbalance) {
        return true;
    }
    if (!t_.compound_enabled) return false;

    return (spread > t_.compound_spread_ratio && vel > t_.compound_velocity) ||
           (spread > t_.compound_spread_ratio && imb > t_.compound_imbalance) ||
           (vel > t_.compound_velocity_with_imb && imb > t_.compound_imbalance_with_vel);
}

Regime RegimeClassifier::classify(const MetricsSignals& raw, RegimeState& state) const {
    state.previous = state.current;

    if (!raw.calibrated) {
        state.current = Regime::Calibrating;
        return state.current;
    }

    const MetricsSignals s = sanitize(raw);
    const double spread = s.spread_ratio;
    const double depth  = s.depth_ratio;
    const double vel    = std::abs(s.momentum);
    const double imb    = std::abs(s.imbalance);
    const Regime prev   = state.previous;

    if (is_crash(spread, vel, imb)) {
        state.current = Regime::Crash;
        state.crash_cooldown = 0;
    } else if (prev == Regime::Crash && spread < t_.recovery_enter_spread_ratio) {
        state.current = Regime::Recovery;
        state.crash_cooldown = t_.recovery_cooldown_steps;
    } else if (prev == Regime::Recovery) {
        if (state.crash_cooldown > 0) --state.crash_cooldown;
        if (state.crash_cooldown <= 0 && spread < t_.recovery_exit_spread_ratio) {
            state.current = Regime::Normal;
        }
    } else if (prev == Regime::Stressed) {
        bool still_stressed = spread > t_.stressed_exit_spread_ratio ||
                              imb > t_.stressed_exit_imbalance ||
                              depth < t_.stressed_exit_depth_ratio;
        state.current = still_stressed ? Regime::Stressed : Regime::Normal;
    } else if (spread > t_.stressed_enter_spread_ratio ||
               imb > t_.stressed_enter_imbalance ||
               depth < t_.stressed_enter_depth_ratio) {
        state.current = Regime::Stressed;
    } else {
        bool stable = spread < t_.hft_max_spread_ratio &&
                      depth > t_.hft_min_depth_ratio &&
                      vel < t_.hft_max_velocity;
        double churn_needed = (prev == Regime::Hft) ? t_.hft_exit_churn : t_.hft_enter_churn;
        state.current = (stable && s.churn >= churn_needed) ? Regime::Hft : Regime::Normal;
    }

    if (state.current == prev) {
        ++state.regime_duration;
    } else {
        state.regime_duration = 0;
    }
    return state.current;
}

} // namespace ramm
