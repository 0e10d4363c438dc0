#pragma once

#include "config/engine_config.hpp"
#include "market/market_view.hpp"
#include "market/metrics_engine.hpp"
#include "risk/risk_overlay.hpp"
#include "strategy/aggressive_market_maker.hpp"
#include "strategy/crash_survival_strategy.hpp"
#include "strategy/experiment_strategies.hpp"
#include "strategy/mean_reversion_strategy.hpp"
#include "strategy/momentum_strategy.hpp"
#include "strategy/passive_market_maker.hpp"
#include "strategy/regime_classifier.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>

namespace ramm {

struct Decision {
    Regime                     regime   = Regime::Calibrating;
    Regime                     previous = Regime::Calibrating;
    std::optional<OrderIntent> order;              // after the risk overlay
    std::optional<OrderIntent> candidate;          // as proposed by the strategy
    std::string                strategy;           // empty when no strategy ran
    RiskOutcome                risk = RiskOutcome::Passed;

    bool regime_changed() const { return regime != previous; }
};

// Per-step pipeline: metrics -> regime -> strategy -> risk overlay.
// With an experiment configured, its strategy replaces the regime bindings
// while metrics and regime tracking continue for the step log.
class StrategyRouter {
public:
    // Throws ConfigError for an unknown experiment.
    explicit StrategyRouter(const EngineConfig& config);

    StrategyRouter(const StrategyRouter&) = delete;
    StrategyRouter& operator=(const StrategyRouter&) = delete;

    // nullopt when the quote has no usable bid, ask or mid. Such quotes do
    // not touch the metrics or the regime state.
    std::optional<Decision> decide(const MarketSnapshot& quote, int64_t inventory,
                                   const RestingExposure& resting = {});

    // Strategy bound to a regime for the current signals, or nullptr.
    const IStrategy* select(Regime regime, const MetricsSignals& signals) const;

    const MetricsEngine& metrics() const { return metrics_; }
    const RegimeState& regime_state() const { return state_; }
    const RiskOverlay& risk() const { return risk_; }
    const IStrategy* experiment() const { return experiment_.get(); }

private:
    MetricsEngine    metrics_;
    RegimeClassifier classifier_;
    RegimeState      state_;
    RiskOverlay      risk_;

    PassiveMarketMaker    passive_normal_;
    PassiveMarketMaker    passive_hft_;
    AggressiveMarketMaker aggressive_;
    MeanReversionStrategy mean_reversion_;
    MomentumStrategy      momentum_;
    CrashSurvivalStrategy crash_survival_;
    const IStrategy*      normal_fallback_;
    std::unique_ptr<IStrategy> experiment_;

    double strong_signal_z_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace ramm
