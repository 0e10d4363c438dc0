#include "strategy/crash_survival_strategy.hpp"

#include <algorithm>
#include <cstdlib>

namespace ramm {

CrashSurvivalStrategy::CrashSurvivalStrategy(const CrashSurvivalParams& params)
    : params_(params) {}

std::optional<OrderIntent> CrashSurvivalStrategy::decide(double bid, double ask, double /*mid*/,
                                                         int64_t inventory, int64_t /*step*/,
                                                         const MetricsSignals& /*signals*/) const {
    const int64_t abs_inv = std::llabs(inventory);
    if (abs_inv <= params_.flatten_threshold) return std::nullopt;

    int64_t qty = normalize_quantity(std::min(params_.qty, abs_inv));
    if (inventory > 0) {
        return OrderIntent{OrderSide::Sell, round_price(bid - kCrossOffset, 2), qty};
    }
    return OrderIntent{OrderSide::Buy, round_price(ask + kCrossOffset, 2), qty};
}

} // namespace ramm
