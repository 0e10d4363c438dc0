#include "risk/risk_overlay.hpp"
#include "strategy/strategy.hpp"

namespace ramm {

RiskOverlay::RiskOverlay(const RiskParams& params)
    : params_(params) {}

RiskDecision RiskOverlay::emergency_or_nothing(double bid, double ask, int64_t inventory,
                                               RiskOutcome otherwise) const {
    if (inventory >= params_.hard_limit) {
        return {OrderIntent{OrderSide::Sell, round_price(bid - params_.emergency_offset, 2),
                            normalize_quantity(params_.emergency_qty)},
                RiskOutcome::Emergency};
    }
    if (inventory <= -params_.hard_limit) {
        return {OrderIntent{OrderSide::Buy, round_price(ask + params_.emergency_offset, 2),
                            normalize_quantity(params_.emergency_qty)},
                RiskOutcome::Emergency};
    }
    return {std::nullopt, otherwise};
}

RiskDecision RiskOverlay::unwind_toward_buffer(double bid, double ask, int64_t inventory) const {
    if (inventory > params_.safety_buffer) {
        return {OrderIntent{OrderSide::Sell, round_price(bid, 2),
                            normalize_quantity(inventory - params_.safety_buffer)},
                RiskOutcome::Unwind};
    }
    if (inventory < -params_.safety_buffer) {
        return {OrderIntent{OrderSide::Buy, round_price(ask, 2),
                            normalize_quantity(-inventory - params_.safety_buffer)},
                RiskOutcome::Unwind};
    }
    return {std::nullopt, RiskOutcome::Blocked};
}

RiskDecision RiskOverlay::adjust(const std::optional<OrderIntent>& candidate,
                                 double bid, double ask, int64_t inventory,
                                 const RestingExposure& resting) const {
    if (!candidate) {
        return emergency_or_nothing(bid, ask, inventory, RiskOutcome::Passed);
    }
    if (candidate->price <= 0.0 || candidate->qty <= 0) {
        return emergency_or_nothing(bid, ask, inventory, RiskOutcome::Blocked);
    }

    OrderIntent order = *candidate;
    order.qty = normalize_quantity(candidate->qty);

    int64_t resulting = (order.side == OrderSide::Buy)
                            ? inventory + resting.buy_qty + order.qty
                            : inventory - resting.sell_qty - order.qty;
    if (resulting >= params_.hard_limit || resulting <= -params_.hard_limit) {
        return unwind_toward_buffer(bid, ask, inventory);
    }

    return {order, order.qty == candidate->qty ? RiskOutcome::Passed : RiskOutcome::Resized};
}

} // namespace ramm
