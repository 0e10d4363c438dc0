#pragma once

#include "config/engine_config.hpp"
#include "strategy/strategy.hpp"

namespace ramm {

// Joins the touch in the direction of recent mid velocity.
class MomentumStrategy : public IStrategy {
public:
    explicit MomentumStrategy(const MomentumParams& params = {});

    const std::string& name() const override { return name_; }

    std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                      int64_t inventory, int64_t step,
                                      const MetricsSignals& signals) const override;

private:
    MomentumParams params_;
    std::string    name_ = "momentum";
};

} // namespace ramm
