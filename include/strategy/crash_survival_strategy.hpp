#pragma once

#include "config/engine_config.hpp"
#include "strategy/strategy.hpp"

namespace ramm {

// CRASH only. Never opens risk: crosses the touch to flatten inventory
// above flatten_threshold and otherwise stays out.
class CrashSurvivalStrategy : public IStrategy {
public:
    static constexpr double kCrossOffset = 0.10;

    explicit CrashSurvivalStrategy(const CrashSurvivalParams& params = {});

    const std::string& name() const override { return name_; }

    std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                      int64_t inventory, int64_t step,
                                      const MetricsSignals& signals) const override;

private:
    CrashSurvivalParams params_;
    std::string         name_ = "crash_survival";
};

} // namespace ramm
