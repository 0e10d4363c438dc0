#pragma once

#include "config/engine_config.hpp"
#include "market/metrics_engine.hpp"
#include "strategy/regime.hpp"

namespace ramm {

class RegimeClassifier {
public:
    explicit RegimeClassifier(const RegimeThresholds& thresholds = {});

    // One label per step. Never fails: non-finite signals are replaced by
    // neutral values before any threshold is evaluated.
    Regime classify(const MetricsSignals& signals, RegimeState& state) const;

    const RegimeThresholds& thresholds() const { return t_; }

private:
    bool is_crash(double spread_ratio, double abs_velocity, double abs_imbalance) const;

    RegimeThresholds t_;
};

// Replaces NaN/inf with neutral values and clamps bounded signals.
MetricsSignals sanitize(const MetricsSignals& signals);

} // namespace ramm
