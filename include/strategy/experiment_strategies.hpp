#pragma once

#include "strategy/strategy.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ramm {

// Fixed-rule strategies for studying how a replay fills orders. A selected
// experiment replaces the regime bindings for every step, calibration
// included. Its orders still pass the risk overlay.

inline constexpr std::string_view kRegimeAdaptiveExperiment = "regime_adaptive";

// Never trades.
class PassiveObserver : public IStrategy {
public:
    explicit PassiveObserver(std::string name = "passive");

    const std::string& name() const override { return name_; }

    std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                      int64_t inventory, int64_t step,
                                      const MetricsSignals& signals) const override;

private:
    std::string name_;
};

// Crosses the spread on one side every `frequency` steps: buys at the ask
// or sells at the bid.
class AggressiveTaker : public IStrategy {
public:
    AggressiveTaker(OrderSide side, int64_t qty, int64_t frequency, std::string name);

    const std::string& name() const override { return name_; }

    std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                      int64_t inventory, int64_t step,
                                      const MetricsSignals& signals) const override;

private:
    OrderSide   side_;
    int64_t     qty_;
    int64_t     frequency_;
    std::string name_;
};

// Crosses the spread every `frequency` steps, buying on even slots and
// selling on odd ones.
class SpreadCrosser : public IStrategy {
public:
    SpreadCrosser(int64_t qty, int64_t frequency, std::string name);

    const std::string& name() const override { return name_; }

    std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                      int64_t inventory, int64_t step,
                                      const MetricsSignals& signals) const override;

private:
    int64_t     qty_;
    int64_t     frequency_;
    std::string name_;
};

// Alternating orders at mid + offset. A buy never pays more than the ask
// and a sell never asks less than the bid.
class QuantityTester : public IStrategy {
public:
    QuantityTester(int64_t qty, double price_offset, int64_t frequency, std::string name);

    const std::string& name() const override { return name_; }

    std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                      int64_t inventory, int64_t step,
                                      const MetricsSignals& signals) const override;

private:
    int64_t     qty_;
    double      price_offset_;
    int64_t     frequency_;
    std::string name_;
};

enum class PriceLevel {
    Bid,
    Ask,
    Mid,
    BelowBid,   // bid - 0.01
    AboveAsk,   // ask + 0.01
    BelowMid,   // mid - 0.5
    AboveMid,   // mid + 0.5
};

double reference_price(PriceLevel level, double bid, double ask, double mid);

// Alternating orders at one fixed reference price.
class PriceExplorer : public IStrategy {
public:
    PriceExplorer(PriceLevel level, int64_t qty, int64_t frequency, std::string name);

    const std::string& name() const override { return name_; }

    std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                      int64_t inventory, int64_t step,
                                      const MetricsSignals& signals) const override;

private:
    PriceLevel  level_;
    int64_t     qty_;
    int64_t     frequency_;
    std::string name_;
};

// Crosses the spread toward flat whenever |inventory| exceeds the threshold.
class InventoryRebalancer : public IStrategy {
public:
    InventoryRebalancer(int64_t qty, int64_t threshold, int64_t frequency, std::string name);

    const std::string& name() const override { return name_; }

    std::optional<OrderIntent> decide(double bid, double ask, double mid,
                                      int64_t inventory, int64_t step,
                                      const MetricsSignals& signals) const override;

private:
    int64_t     qty_;
    int64_t     threshold_;
    int64_t     frequency_;
    std::string name_;
};

// --- Registry ---

struct ExperimentInfo {
    std::string name;
    std::string description;
};

// Every selectable experiment in listing order, regime_adaptive first.
const std::vector<ExperimentInfo>& experiment_catalog();

bool is_known_experiment(std::string_view name);

// nullptr for regime_adaptive. Throws ConfigError for an unknown name.
std::unique_ptr<IStrategy> make_experiment_strategy(std::string_view name);

struct ExperimentRun {
    std::string scenario;
    std::string experiment;
    std::string description;
};

// Crash scenarios first, then the stressed and HFT regimes: a passive
// baseline and a qty_300 run for each.
const std::vector<ExperimentRun>& prioritized_experiment_plan();

} // namespace ramm
