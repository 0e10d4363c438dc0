#pragma once

#include "config/engine_config.hpp"
#include "strategy/strategy.hpp"

namespace ramm {

// High-cadence market maker. Forces an unwind at max_inventory regardless of
// cadence and only quotes the reducing side beyond flatten_inventory.
class AggressiveMarketMaker : public IStrategy {
public:
    explicit AggressiveMarketMaker(const AggressiveMmParams& params = {});

    const std::string& name() const override { return name_; }

    std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                      int64_t inventory, int64_t step,
                                      const MetricsSignals& signals) const override;

private:
    AggressiveMmParams params_;
    std::string        name_ = "aggressive_mm";
};

} // namespace ramm
