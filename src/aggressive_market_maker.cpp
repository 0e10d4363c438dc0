#include "strategy/aggressive_market_maker.hpp"

namespace ramm {

namespace {
constexpr double kFlattenOffset = 0.01;
}

AggressiveMarketMaker::AggressiveMarketMaker(const AggressiveMmParams& params)
    : params_(params) {}

std::optional<OrderIntent> AggressiveMarketMaker::decide(double bid, double ask, double /*mid*/,
                                                         int64_t inventory, int64_t step,
                                                         const MetricsSignals& /*signals*/) const {
    if (inventory >= params_.max_inventory) {
        return OrderIntent{OrderSide::Sell, round_price(bid, 2), params_.unwind_qty};
    }
    if (inventory <= -params_.max_inventory) {
        return OrderIntent{OrderSide::Buy, round_price(ask, 2), params_.unwind_qty};
    }

    if (step % params_.trade_freq != 0) return std::nullopt;

    if (inventory > params_.flatten_inventory) {
        return OrderIntent{OrderSide::Sell, round_price(bid + kFlattenOffset, 2), params_.qty};
    }
    if (inventory < -params_.flatten_inventory) {
        return OrderIntent{OrderSide::Buy, round_price(ask - kFlattenOffset, 2), params_.qty};
    }

    double skew = inventory_skew(params_.skew_factor, inventory);
    if ((step / params_.trade_freq) % 2 == 0) {
        return OrderIntent{OrderSide::Buy, passive_buy_price(bid, ask, skew), params_.qty};
    }
    return OrderIntent{OrderSide::Sell, passive_sell_price(bid, ask, skew), params_.qty};
}

} // namespace ramm
