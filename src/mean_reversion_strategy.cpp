#include "strategy/mean_reversion_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace ramm {

MeanReversionStrategy::MeanReversionStrategy(const MeanReversionParams& params)
    : params_(params) {}

std::optional<OrderIntent> MeanReversionStrategy::decide(double bid, double ask, double /*mid*/,
                                                         int64_t inventory, int64_t /*step*/,
                                                         const MetricsSignals& signals) const {
    if (std::llabs(inventory) >= params_.max_inventory) return std::nullopt;

    const double z = signals.z_score;

    if (z < -params_.entry_z) {
        return OrderIntent{OrderSide::Buy, round_price(std::min(bid, ask - kTick), 1), params_.qty};
    }
    if (z > params_.entry_z) {
        return OrderIntent{OrderSide::Sell, round_price(std::max(ask, bid + kTick), 1), params_.qty};
    }

    if (std::abs(z) < params_.exit_z) {
        if (inventory > params_.exit_inventory) {
            return OrderIntent{OrderSide::Sell, round_price(bid, 2),
                               normalize_quantity(std::min(params_.qty, inventory))};
        }
        if (inventory < -params_.exit_inventory) {
            return OrderIntent{OrderSide::Buy, round_price(ask, 2),
                               normalize_quantity(std::min(params_.qty, -inventory))};
        }
    }
    return std::nullopt;
}

} // namespace ramm
