#pragma once

#include "common/latency_stats.hpp"
#include "config/engine_config.hpp"
#include "execution/execution_gateway.hpp"
#include "risk/position.hpp"
#include "strategy/regime.hpp"

#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ramm {

enum class SubmitStatus {
    Accepted,   // sent to the gateway
    Deferred,   // resting-order cap reached, oldest orders cancelled instead
    Rejected,   // non-positive price or quantity
};

struct SubmitResult {
    SubmitStatus status = SubmitStatus::Rejected;
    std::string  order_id;                  // set when accepted
    std::vector<std::string> cancelled;     // self-cross and cap cancels
};

struct FillResult {
    bool                  known = false;    // id was resting locally
    std::optional<double> latency_ms;       // send-to-fill time for known ids
};

// Owns the local view of resting orders and the position they build.
// Not thread-safe; driven from the engine thread only.
class OrderLifecycleManager {
public:
    using Clock = std::chrono::steady_clock;
    using OrderMap = std::unordered_map<std::string, OrderRecord>;

    OrderLifecycleManager(const OrderManagerParams& params,
                          std::string client_name,
                          IExecutionGateway& gateway);

    SubmitResult submit(const OrderIntent& intent, int64_t step, Regime regime);

    // On the stale_check_interval cadence, cancels orders older than the
    // regime's staleness limit. Returns the cancelled ids.
    std::vector<std::string> expire_stale(int64_t step, Regime regime);

    // Applies the fill to the position whether or not the id is known.
    FillResult on_fill(const Fill& fill, double last_mid);

    // Revalues pnl at the latest mid.
    void mark(double last_mid) { position_.mark(last_mid); }

    const PositionState& position() const { return position_; }
    const OrderMap& buy_orders()  const { return buys_; }
    const OrderMap& sell_orders() const { return sells_; }
    size_t open_order_count() const { return buys_.size() + sells_.size(); }
    RestingExposure resting_exposure() const;
    bool is_resting(const std::string& order_id) const;

    uint64_t cancels_sent() const { return cancels_sent_; }
    uint64_t fills_received() const { return fills_received_; }
    const LatencyStats& fill_latency() const { return fill_latency_; }

private:
    std::vector<std::string> cancel_crossing(const OrderIntent& intent);
    std::vector<std::string> cancel_oldest(size_t n);
    void cancel(const std::string& order_id);
    std::string next_order_id(int64_t step) const;

    OrderManagerParams params_;
    std::string        client_name_;
    IExecutionGateway& gateway_;

    OrderMap buys_;
    OrderMap sells_;
    std::unordered_map<std::string, Clock::time_point> send_times_;

    PositionState position_;
    uint64_t      cancels_sent_   = 0;
    uint64_t      fills_received_ = 0;
    LatencyStats  fill_latency_;

    std::shared_ptr<spdlog::logger> log_;
};

} // namespace ramm
