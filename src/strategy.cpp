#include "strategy/strategy.hpp"

#include <algorithm>
#include <cmath>

namespace ramm {

namespace {

// Absorbs binary rounding in ask - bid (100.1 - 99.9 < 0.2).
constexpr double kPriceEpsilon = 1e-9;

bool room_to_improve(double bid, double ask) {
    return ask - bid >= 2 * kTick - kPriceEpsilon;
}

} // anonymous namespace

int64_t normalize_quantity(int64_t qty) {
    int64_t rounded = (qty / kLotSize) * kLotSize;
    return std::clamp(rounded, kMinOrderQty, kMaxOrderQty);
}

double round_price(double price, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(price * scale) / scale;
}

double inventory_skew(double skew_factor, int64_t inventory) {
    return std::clamp(-skew_factor * static_cast<double>(inventory), -0.2, 0.2);
}

double passive_buy_price(double bid, double ask, double skew) {
    double improve = room_to_improve(bid, ask) ? kTick : 0.0;
    double raw = bid + improve + skew;
    double price = std::max(bid, std::min(ask - kTick, raw));
    return round_price(std::max(kTick, price), 1);
}

double passive_sell_price(double bid, double ask, double skew) {
    double improve = room_to_improve(bid, ask) ? kTick : 0.0;
    double raw = ask - improve + skew;
    return round_price(std::min(ask, std::max(bid + kTick, raw)), 1);
}

} // namespace ramm
