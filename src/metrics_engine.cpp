#include "market/metrics_engine.hpp"

#include <algorithm>
#include <cmath>

namespace ramm {

MetricsEngine::MetricsEngine(const MetricsParams& params)
    : params_(params),
      mids_(params.window),
      spreads_(params.window),
      depths_(params.window) {}

void MetricsEngine::update(double mid, double spread, int64_t bid_depth, int64_t ask_depth) {
    const double total_depth = static_cast<double>(bid_depth + ask_depth);

    mids_.push(mid);
    spreads_.push(spread);
    depths_.push(total_depth);
    ++samples_seen_;

    auto& s = signals_;
    s.mid    = mid;
    s.spread = spread;

    // Var(X) = E[X^2] - E[X]^2, clamped against rounding below zero
    s.volatility = std::sqrt(std::max(0.0, mids_.variance()));
    s.z_score = (s.volatility > params_.epsilon)
        ? (mid - mids_.mean()) / s.volatility
        : 0.0;

    s.momentum = (mids_.size() >= kMomentumSpan)
        ? (mid - mids_.back(kMomentumSpan - 1)) / static_cast<double>(kMomentumSpan)
        : 0.0;

    s.imbalance = (total_depth > 0.0)
        ? static_cast<double>(bid_depth - ask_depth) / total_depth
        : 0.0;

    update_churn(mid);

    if (!baseline_ && samples_seen_ >= params_.calibration_steps) {
        baseline_ = Baseline{
            .spread = spreads_.mean(),
            .depth  = depths_.mean(),
            .mid    = mids_.mean(),
        };
    }

    s.calibrated = baseline_.has_value();
    if (baseline_) {
        s.spread_ratio = baseline_->spread > 0.0 ? spread / baseline_->spread : 1.0;
        s.depth_ratio  = baseline_->depth > 0.0 ? total_depth / baseline_->depth : 1.0;
    } else {
        s.spread_ratio = 1.0;
        s.depth_ratio  = 1.0;
    }
}

void MetricsEngine::update_churn(double mid) {
    if (last_mid_ && std::abs(mid - *last_mid_) > params_.epsilon) {
        ++churn_changes_;
    }
    last_mid_ = mid;

    // Tumbling window: publish and reset when full, hold the value in between
    if (++churn_steps_ >= params_.churn_window) {
        signals_.churn = std::min(1.0, static_cast<double>(churn_changes_) /
                                       static_cast<double>(params_.churn_window));
        churn_steps_   = 0;
        churn_changes_ = 0;
    }
}

} // namespace ramm
