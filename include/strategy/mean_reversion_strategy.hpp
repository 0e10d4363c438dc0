#pragma once

#include "config/engine_config.hpp"
#include "strategy/strategy.hpp"

namespace ramm {

// Fades large z-score deviations and trims inventory once price is back
// near its mean.
class MeanReversionStrategy : public IStrategy {
public:
    explicit MeanReversionStrategy(const MeanReversionParams& params = {});

    const std::string& name() const override { return name_; }

    std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                      int64_t inventory, int64_t step,
                                      const MetricsSignals& signals) const override;

private:
    MeanReversionParams params_;
    std::string         name_ = "mean_reversion";
};

} // namespace ramm
