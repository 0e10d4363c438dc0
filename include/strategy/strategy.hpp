#pragma once

#include "execution/order.hpp"
#include "market/metrics_engine.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ramm {

inline constexpr double kTick = 0.10;

// Floor to a multiple of kLotSize, then clamp to [kMinOrderQty, kMaxOrderQty].
int64_t normalize_quantity(int64_t qty);

// Round half away from zero to the given number of decimals.
double round_price(double price, int decimals);

// Tick-aware passive quoting shared by the market makers: improve the inside
// by one tick when the spread allows, skew by inventory, never cross.
double passive_buy_price(double bid, double ask, double skew);
double passive_sell_price(double bid, double ask, double skew);

// skew = clamp(-skew_factor * inventory, -0.2, 0.2)
double inventory_skew(double skew_factor, int64_t inventory);

class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual const std::string& name() const = 0;

    virtual std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                              int64_t inventory, int64_t step,
                                              const MetricsSignals& signals) const = 0;
};

} // namespace ramm
