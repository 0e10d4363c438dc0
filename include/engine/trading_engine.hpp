#pragma once

#include "common/latency_stats.hpp"
#include "config/engine_config.hpp"
#include "engine/engine_events.hpp"
#include "execution/execution_gateway.hpp"
#include "execution/order_manager.hpp"
#include "logging/step_logger.hpp"
#include "strategy/strategy_router.hpp"

#include <spdlog/logger.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>

namespace ramm {

struct EngineStats {
    uint64_t steps          = 0;
    uint64_t orders_sent    = 0;
    uint64_t orders_deferred = 0;
    uint64_t cancels_sent   = 0;
    uint64_t fills          = 0;
    uint64_t errors         = 0;
    uint64_t bad_quotes     = 0;
    int64_t  inventory      = 0;
    double   cash_flow      = 0.0;
    double   pnl            = 0.0;
    std::array<uint64_t, 6> regime_steps{};   // indexed by Regime
    LatencyStats step_latency;                 // DONE sent -> next snapshot
    LatencyStats fill_latency;                 // order sent -> fill
};

// Single consumer of the event queue and sole owner of the decision state.
// Each snapshot is decided, submitted and logged before DONE is signalled.
class TradingEngine {
public:
    static constexpr int64_t kProgressInterval = 500;

    TradingEngine(const EngineConfig& config,
                  std::string client_name,
                  IExecutionGateway& gateway,
                  StepLogger* step_log = nullptr);

    // Returns false when the event ends the run.
    bool dispatch(const EngineEvent& event);

    // Blocks on the queue until a DisconnectedEvent arrives.
    void run(EngineEventQueue& queue);

    // Handles whatever is queued now without blocking. Returns false if a
    // DisconnectedEvent was seen.
    bool drain(EngineEventQueue& queue);

    void on_snapshot(const SnapshotEvent& ev);
    void on_fill(const FillEvent& ev);
    void on_error(const ErrorEvent& ev);
    void on_authenticated(const AuthenticatedEvent& ev);

    const OrderLifecycleManager& orders() const { return orders_; }
    const StrategyRouter& router() const { return router_; }
    const std::optional<Decision>& last_decision() const { return last_decision_; }
    Regime regime() const { return router_.regime_state().current; }
    double last_mid() const { return last_mid_; }

    EngineStats stats() const;
    void print_final_results(std::ostream& os) const;

private:
    void log_progress(int64_t step) const;

    StrategyRouter        router_;
    OrderLifecycleManager orders_;
    IExecutionGateway&    gateway_;
    StepLogger*           step_log_;

    double last_mid_ = 0.0;
    std::optional<Decision> last_decision_;
    std::vector<LoggedFill> fills_since_step_;
    std::optional<std::chrono::steady_clock::time_point> last_done_;

    uint64_t steps_           = 0;
    uint64_t errors_          = 0;
    uint64_t bad_quotes_      = 0;
    uint64_t orders_deferred_ = 0;
    std::array<uint64_t, 6> regime_steps_{};
    LatencyStats step_latency_;

    std::shared_ptr<spdlog::logger> log_;
};

} // namespace ramm
