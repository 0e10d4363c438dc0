#include "strategy/experiment_strategies.hpp"
#include "config/engine_config.hpp"

#include <algorithm>
#include <functional>
#include <utility>

namespace ramm {

namespace {

// Sub-tick step used for the just-outside-the-touch price levels.
constexpr double kCent = 0.01;

bool on_slot(int64_t step, int64_t frequency) {
    return step % frequency == 0;
}

bool even_slot(int64_t step, int64_t frequency) {
    return (step / frequency) % 2 == 0;
}

struct ExperimentEntry {
    ExperimentInfo info;
    std::function<std::unique_ptr<IStrategy>(const std::string&)> make;
};

std::function<std::unique_ptr<IStrategy>(const std::string&)> quantity_test(int64_t qty) {
    return [qty](const std::string& n) { return std::make_unique<QuantityTester>(qty, 0.0, 10, n); };
}

std::function<std::unique_ptr<IStrategy>(const std::string&)> price_test(PriceLevel level) {
    return [level](const std::string& n) { return std::make_unique<PriceExplorer>(level, 100, 10, n); };
}

const std::vector<ExperimentEntry>& registry() {
    static const std::vector<ExperimentEntry> entries = {
        {{std::string(kRegimeAdaptiveExperiment), "Regime-adaptive strategy router (default)"},
         [](const std::string&) { return std::unique_ptr<IStrategy>(); }},
        {{"passive", "Passive observation, baseline market evolution"},
         [](const std::string& n) { return std::make_unique<PassiveObserver>(n); }},
        {{"aggressive_buy_100", "Buy at the ask every 10 steps, qty=100"},
         [](const std::string& n) { return std::make_unique<AggressiveTaker>(OrderSide::Buy, 100, 10, n); }},
        {{"aggressive_sell_100", "Sell at the bid every 10 steps, qty=100"},
         [](const std::string& n) { return std::make_unique<AggressiveTaker>(OrderSide::Sell, 100, 10, n); }},
        {{"spread_cross_100", "Cross the spread alternating buy/sell every 10 steps, qty=100"},
         [](const std::string& n) { return std::make_unique<SpreadCrosser>(100, 10, n); }},
        {{"qty_100", "Alternate at mid every 10 steps, qty=100"}, quantity_test(100)},
        {{"qty_200", "Alternate at mid every 10 steps, qty=200"}, quantity_test(200)},
        {{"qty_300", "Alternate at mid every 10 steps, qty=300"}, quantity_test(300)},
        {{"qty_400", "Alternate at mid every 10 steps, qty=400"}, quantity_test(400)},
        {{"qty_500", "Alternate at mid every 10 steps, qty=500"}, quantity_test(500)},
        {{"price_bid", "Alternate at the bid every 10 steps"}, price_test(PriceLevel::Bid)},
        {{"price_ask", "Alternate at the ask every 10 steps"}, price_test(PriceLevel::Ask)},
        {{"price_mid", "Alternate at mid every 10 steps"}, price_test(PriceLevel::Mid)},
        {{"price_bid_minus_1", "Alternate at bid - 0.01 every 10 steps"}, price_test(PriceLevel::BelowBid)},
        {{"price_ask_plus_1", "Alternate at ask + 0.01 every 10 steps"}, price_test(PriceLevel::AboveAsk)},
        {{"price_mid_minus_half", "Alternate at mid - 0.5 every 10 steps"}, price_test(PriceLevel::BelowMid)},
        {{"price_mid_plus_half", "Alternate at mid + 0.5 every 10 steps"}, price_test(PriceLevel::AboveMid)},
        {{"inventory_mgmt", "Trade back toward flat beyond |200| every 5 steps, qty=100"},
         [](const std::string& n) { return std::make_unique<InventoryRebalancer>(100, 200, 5, n); }},
    };
    return entries;
}

const ExperimentEntry* find_entry(std::string_view name) {
    const auto& entries = registry();
    auto it = std::find_if(entries.begin(), entries.end(),
                           [name](const ExperimentEntry& e) { return e.info.name == name; });
    return it == entries.end() ? nullptr : &*it;
}

} // anonymous namespace

// --- PassiveObserver ---

PassiveObserver::PassiveObserver(std::string name)
    : name_(std::move(name)) {}

std::optional<OrderIntent> PassiveObserver::decide(double /*bid*/, double /*ask*/, double /*mid*/,
                                                   int64_t /*inventory*/, int64_t /*step*/,
                                                   const MetricsSignals& /*signals*/) const {
    return std::nullopt;
}

// --- AggressiveTaker ---

AggressiveTaker::AggressiveTaker(OrderSide side, int64_t qty, int64_t frequency, std::string name)
    : side_(side), qty_(qty), frequency_(frequency), name_(std::move(name)) {}

std::optional<OrderIntent> AggressiveTaker::decide(double bid, double ask, double /*mid*/,
                                                   int64_t /*inventory*/, int64_t step,
                                                   const MetricsSignals& /*signals*/) const {
    double touch = (side_ == OrderSide::Buy) ? ask : bid;
    if (touch <= 0.0 || !on_slot(step, frequency_)) return std::nullopt;
    return OrderIntent{side_, round_price(touch, 2), qty_};
}

// --- SpreadCrosser ---

SpreadCrosser::SpreadCrosser(int64_t qty, int64_t frequency, std::string name)
    : qty_(qty), frequency_(frequency), name_(std::move(name)) {}

std::optional<OrderIntent> SpreadCrosser::decide(double bid, double ask, double /*mid*/,
                                                 int64_t /*inventory*/, int64_t step,
                                                 const MetricsSignals& /*signals*/) const {
    if (bid <= 0.0 || ask <= 0.0 || !on_slot(step, frequency_)) return std::nullopt;
    if (even_slot(step, frequency_)) {
        return OrderIntent{OrderSide::Buy, round_price(ask, 2), qty_};
    }
    return OrderIntent{OrderSide::Sell, round_price(bid, 2), qty_};
}

// --- QuantityTester ---

QuantityTester::QuantityTester(int64_t qty, double price_offset, int64_t frequency, std::string name)
    : qty_(qty), price_offset_(price_offset), frequency_(frequency), name_(std::move(name)) {}

std::optional<OrderIntent> QuantityTester::decide(double bid, double ask, double mid,
                                                  int64_t /*inventory*/, int64_t step,
                                                  const MetricsSignals& /*signals*/) const {
    if (mid <= 0.0 || !on_slot(step, frequency_)) return std::nullopt;

    double target = round_price(mid + price_offset_, 2);
    if (even_slot(step, frequency_)) {
        double price = ask > 0.0 ? std::min(target, round_price(ask, 2)) : target;
        return OrderIntent{OrderSide::Buy, price, qty_};
    }
    double price = bid > 0.0 ? std::max(target, round_price(bid, 2)) : target;
    return OrderIntent{OrderSide::Sell, price, qty_};
}

// --- PriceExplorer ---

double reference_price(PriceLevel level, double bid, double ask, double mid) {
    switch (level) {
        case PriceLevel::Bid:      return bid;
        case PriceLevel::Ask:      return ask;
        case PriceLevel::Mid:      return mid;
        case PriceLevel::BelowBid: return bid - kCent;
        case PriceLevel::AboveAsk: return ask + kCent;
        case PriceLevel::BelowMid: return mid - 0.5;
        case PriceLevel::AboveMid: return mid + 0.5;
    }
    return mid;
}

PriceExplorer::PriceExplorer(PriceLevel level, int64_t qty, int64_t frequency, std::string name)
    : level_(level), qty_(qty), frequency_(frequency), name_(std::move(name)) {}

std::optional<OrderIntent> PriceExplorer::decide(double bid, double ask, double mid,
                                                 int64_t /*inventory*/, int64_t step,
                                                 const MetricsSignals& /*signals*/) const {
    if (bid <= 0.0 || ask <= 0.0 || mid <= 0.0) return std::nullopt;
    if (!on_slot(step, frequency_)) return std::nullopt;

    double price = round_price(reference_price(level_, bid, ask, mid), 2);
    OrderSide side = even_slot(step, frequency_) ? OrderSide::Buy : OrderSide::Sell;
    return OrderIntent{side, price, qty_};
}

// --- InventoryRebalancer ---

InventoryRebalancer::InventoryRebalancer(int64_t qty, int64_t threshold, int64_t frequency,
                                         std::string name)
    : qty_(qty), threshold_(threshold), frequency_(frequency), name_(std::move(name)) {}

std::optional<OrderIntent> InventoryRebalancer::decide(double bid, double ask, double /*mid*/,
                                                       int64_t inventory, int64_t step,
                                                       const MetricsSignals& /*signals*/) const {
    if (bid <= 0.0 || ask <= 0.0 || !on_slot(step, frequency_)) return std::nullopt;
    if (inventory > threshold_) {
        return OrderIntent{OrderSide::Sell, round_price(bid, 2), qty_};
    }
    if (inventory < -threshold_) {
        return OrderIntent{OrderSide::Buy, round_price(ask, 2), qty_};
    }
    return std::nullopt;
}

// --- Registry ---

const std::vector<ExperimentInfo>& experiment_catalog() {
    static const std::vector<ExperimentInfo> catalog = [] {
        std::vector<ExperimentInfo> out;
        for (const auto& e : registry()) out.push_back(e.info);
        return out;
    }();
    return catalog;
}

bool is_known_experiment(std::string_view name) {
    return find_entry(name) != nullptr;
}

std::unique_ptr<IStrategy> make_experiment_strategy(std::string_view name) {
    const ExperimentEntry* entry = find_entry(name);
    if (!entry) {
        throw ConfigError("unknown experiment '" + std::string(name) +
                          "' (see --list-experiments)");
    }
    return entry->make(entry->info.name);
}

const std::vector<ExperimentRun>& prioritized_experiment_plan() {
    static const std::vector<ExperimentRun> plan = {
        {"flash_crash",      "passive", "Baseline crash dynamics"},
        {"mini_flash_crash", "passive", "Baseline mini crash dynamics"},
        {"flash_crash",      "qty_300", "qty_300 through a flash crash"},
        {"mini_flash_crash", "qty_300", "qty_300 through a mini crash"},
        {"stressed_market",  "passive", "Baseline stressed market dynamics"},
        {"hft_dominated",    "passive", "Baseline HFT-dominated dynamics"},
        {"stressed_market",  "qty_300", "qty_300 in a stressed market"},
        {"hft_dominated",    "qty_300", "qty_300 in an HFT-dominated market"},
    };
    return plan;
}

} // namespace ramm
