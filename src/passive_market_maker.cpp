#include "strategy/passive_market_maker.hpp"

#include <cstdlib>
#include <utility>

namespace ramm {

PassiveMarketMaker::PassiveMarketMaker(const PassiveMmParams& params, std::string name)
    : params_(params), name_(std::move(name)) {}

std::optional<OrderIntent> PassiveMarketMaker::decide(double bid, double ask, double /*mid*/,
                                                      int64_t inventory, int64_t step,
                                                      const MetricsSignals& /*signals*/) const {
    if (step % params_.trade_freq != 0) return std::nullopt;
    if (std::llabs(inventory) >= params_.max_inventory) return std::nullopt;

    double skew = inventory_skew(params_.skew_factor, inventory);

    if ((step / params_.trade_freq) % 2 == 0) {
        return OrderIntent{OrderSide::Buy, passive_buy_price(bid, ask, skew), params_.qty};
    }
    return OrderIntent{OrderSide::Sell, passive_sell_price(bid, ask, skew), params_.qty};
}

} // namespace ramm
