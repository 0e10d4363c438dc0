#include "strategy/strategy_router.hpp"
#include "common/logging.hpp"

#include <cmath>

namespace ramm {

StrategyRouter::StrategyRouter(const EngineConfig& config)
    : metrics_(config.metrics),
      classifier_(config.regime),
      risk_(config.risk),
      passive_normal_(config.strategies.passive_normal, "passive_mm_normal"),
      passive_hft_(config.strategies.passive_hft, "passive_mm_hft"),
      aggressive_(config.strategies.aggressive),
      mean_reversion_(config.strategies.mean_reversion),
      momentum_(config.strategies.momentum),
      crash_survival_(config.strategies.crash_survival),
      normal_fallback_(config.strategies.normal_fallback == "momentum"
                           ? static_cast<const IStrategy*>(&momentum_)
                           : static_cast<const IStrategy*>(&aggressive_)),
      experiment_(make_experiment_strategy(config.strategies.experiment)),
      strong_signal_z_(config.strategies.strong_signal_z),
      log_(get_logger("router")) {
    if (experiment_) {
        log_->info("experiment '{}' replaces the regime strategies", experiment_->name());
    }
}

const IStrategy* StrategyRouter::select(Regime regime, const MetricsSignals& signals) const {
    switch (regime) {
        case Regime::Calibrating:
            return nullptr;
        case Regime::Crash:
            return &crash_survival_;
        case Regime::Recovery:
        case Regime::Stressed:
            return &passive_normal_;
        case Regime::Hft:
            return &passive_hft_;
        case Regime::Normal:
            if (std::abs(signals.z_score) > strong_signal_z_) return &mean_reversion_;
            return normal_fallback_;
    }
    return nullptr;
}

std::optional<Decision> StrategyRouter::decide(const MarketSnapshot& quote, int64_t inventory,
                                               const RestingExposure& resting) {
    if (!quote.has_quote()) return std::nullopt;

    metrics_.update(quote.mid, quote.ask - quote.bid, quote.bid_depth, quote.ask_depth);
    const auto& signals = metrics_.signals();

    Decision d;
    d.regime   = classifier_.classify(signals, state_);
    d.previous = state_.previous;

    if (d.regime_changed()) {
        log_->info("step {}: regime {} -> {} (spread_ratio={:.2f} velocity={:.4f} imbalance={:.2f} churn={:.2f})",
                   quote.step, to_string(d.previous), to_string(d.regime),
                   signals.spread_ratio, signals.momentum, signals.imbalance, signals.churn);
    }

    const IStrategy* strategy = experiment_ ? experiment_.get() : select(d.regime, signals);
    if (strategy) {
        d.strategy  = strategy->name();
        d.candidate = strategy->decide(quote.bid, quote.ask, quote.mid, inventory, quote.step, signals);
    }

    auto risk = risk_.adjust(d.candidate, quote.bid, quote.ask, inventory, resting);
    d.order = risk.order;
    d.risk  = risk.outcome;

    if (d.risk == RiskOutcome::Unwind || d.risk == RiskOutcome::Emergency ||
        (d.risk == RiskOutcome::Blocked && d.candidate)) {
        log_->warn("step {}: risk {} at inventory {} ({} candidate from {})",
                   quote.step, to_string(d.risk), inventory,
                   d.candidate ? to_string(d.candidate->side) : "no",
                   d.strategy.empty() ? "none" : d.strategy);
    }
    return d;
}

} // namespace ramm
