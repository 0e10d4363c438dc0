#pragma once

#include "execution/order.hpp"

#include <cstdint>

namespace ramm {

// Inventory and cash move only on confirmed fills.
struct PositionState {
    int64_t  inventory   = 0;     // signed units
    double   cash_flow   = 0.0;   // signed currency
    double   pnl         = 0.0;   // cash_flow + inventory * last_mid
    uint64_t orders_sent = 0;     // orders handed to the gateway

    void apply_fill(OrderSide side, double price, int64_t qty, double last_mid) {
        if (side == OrderSide::Buy) {
            inventory += qty;
            cash_flow -= static_cast<double>(qty) * price;
        } else {
            inventory -= qty;
            cash_flow += static_cast<double>(qty) * price;
        }
        mark(last_mid);
    }

    void mark(double last_mid) {
        pnl = cash_flow + static_cast<double>(inventory) * last_mid;
    }
};

// Quantity still resting on each side, not yet filled.
struct RestingExposure {
    int64_t buy_qty  = 0;
    int64_t sell_qty = 0;
};

} // namespace ramm
