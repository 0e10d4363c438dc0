#pragma once

#include "config/engine_config.hpp"
#include "engine/engine_events.hpp"
#include "engine/trading_engine.hpp"
#include "execution/sim_execution_gateway.hpp"
#include "logging/step_logger.hpp"

#include <spdlog/logger.h>

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace ramm {

struct BacktestConfig {
    EngineConfig engine;
    std::string  scenario    = "normal_market";  // synthetic scenario name
    size_t       num_ticks   = 2000;
    std::string  data_file;                      // CSV: step,bid,bid_qty,ask,ask_qty
    std::string  client_name = "backtest";
    uint32_t     seed        = 42;
};

// Replays snapshots through the live engine with a simulated exchange.
// Each snapshot is queued behind the fills it triggered and is only
// followed by the next one after the engine has signalled DONE.
class BacktestRunner {
public:
    explicit BacktestRunner(BacktestConfig config, StepLogger* step_log = nullptr);

    // CSV replay when data_file is set, otherwise the synthetic scenario.
    EngineStats run();

    EngineStats run_snapshots(const std::vector<MarketSnapshot>& snapshots);

    const TradingEngine& engine() const { return engine_; }
    const SimExecutionGateway& gateway() const { return gateway_; }

    void print_final_results(std::ostream& os) const { engine_.print_final_results(os); }

    // Malformed rows are skipped with a warning. Throws std::runtime_error
    // if the file cannot be opened.
    static std::vector<MarketSnapshot> load_csv(const std::string& filename);

    // Seeded synthetic book. Throws ConfigError for an unknown scenario.
    static std::vector<MarketSnapshot> generate_scenario(const std::string& scenario,
                                                         size_t num_ticks, uint32_t seed);

    static const std::vector<std::string>& scenario_names();

private:
    BacktestConfig      config_;
    EngineEventQueue    queue_;
    SimExecutionGateway gateway_;
    TradingEngine       engine_;

    std::shared_ptr<spdlog::logger> log_;
};

} // namespace ramm
