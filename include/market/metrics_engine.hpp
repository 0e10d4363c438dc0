#pragma once

#include "config/engine_config.hpp"
#include "market/rolling_window.hpp"

#include <cstdint>
#include <optional>

namespace ramm {

struct Baseline {
    double spread = 0.0;
    double depth  = 0.0;
    double mid    = 0.0;
};

// Signals derived from the rolling windows, recomputed on every update.
struct MetricsSignals {
    bool   calibrated   = false;
    double mid          = 0.0;
    double spread       = 0.0;
    double volatility   = 0.0;   // stddev of mid over the window
    double z_score      = 0.0;   // (mid - mean) / volatility
    double momentum     = 0.0;   // 10-sample mid velocity
    double imbalance    = 0.0;   // (bid - ask) / total depth, in [-1, 1]
    double churn        = 0.0;   // fraction of steps with a mid move
    double spread_ratio = 1.0;   // spread / baseline spread
    double depth_ratio  = 1.0;   // depth / baseline depth
};

class MetricsEngine {
public:
    static constexpr size_t kMomentumSpan = 10;

    explicit MetricsEngine(const MetricsParams& params = {});

    void update(double mid, double spread, int64_t bid_depth, int64_t ask_depth);

    const MetricsSignals& signals() const { return signals_; }
    bool calibrated() const { return baseline_.has_value(); }
    const std::optional<Baseline>& baseline() const { return baseline_; }

    double mean_mid()    const { return mids_.mean(); }
    double mean_spread() const { return spreads_.mean(); }
    double mean_depth()  const { return depths_.mean(); }
    size_t size()        const { return mids_.size(); }
    uint64_t samples_seen() const { return samples_seen_; }

private:
    void update_churn(double mid);

    MetricsParams params_;
    RollingWindow mids_;
    RollingWindow spreads_;
    RollingWindow depths_;
    uint64_t samples_seen_ = 0;

    std::optional<Baseline> baseline_;

    std::optional<double> last_mid_;
    size_t churn_steps_   = 0;
    size_t churn_changes_ = 0;

    MetricsSignals signals_;
};

} // namespace ramm
