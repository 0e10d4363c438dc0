#pragma once

#include "config/engine_config.hpp"
#include "strategy/strategy.hpp"

namespace ramm {

// Quotes one side per trade slot at or inside the touch, alternating sides
// and leaning against inventory.
class PassiveMarketMaker : public IStrategy {
public:
    explicit PassiveMarketMaker(const PassiveMmParams& params = {},
                                std::string name = "passive_mm");

    const std::string& name() const override { return name_; }

    std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                      int64_t inventory, int64_t step,
                                      const MetricsSignals& signals) const override;

    const PassiveMmParams& params() const { return params_; }

private:
    PassiveMmParams params_;
    std::string     name_;
};

} // namespace ramm
