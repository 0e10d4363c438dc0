#include "strategy/momentum_strategy.hpp"

namespace ramm {

MomentumStrategy::MomentumStrategy(const MomentumParams& params)
    : params_(params) {}

std::optional<OrderIntent> MomentumStrategy::decide(double bid, double ask, double /*mid*/,
                                                    int64_t inventory, int64_t step,
                                                    const MetricsSignals& signals) const {
    if (step % params_.trade_freq != 0) return std::nullopt;

    const double v = signals.momentum;
    if (v > params_.entry_velocity && inventory + params_.qty <= params_.max_inventory) {
        return OrderIntent{OrderSide::Buy, round_price(bid, 2), params_.qty};
    }
    if (v < -params_.entry_velocity && inventory - params_.qty >= -params_.max_inventory) {
        return OrderIntent{OrderSide::Sell, round_price(ask, 2), params_.qty};
    }
    return std::nullopt;
}

} // namespace ramm
