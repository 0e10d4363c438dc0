#pragma once

#include "execution/execution_gateway.hpp"
#include "market/market_view.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace ramm {

// Invoked for every simulated fill.
using FillCallback = std::function<void(const Fill&)>;

// Offline exchange: resting orders fill in full at their limit once the
// opposite side of a later snapshot reaches them.
class SimExecutionGateway : public IExecutionGateway {
public:
    explicit SimExecutionGateway(FillCallback on_fill);

    void send_order(const OrderRecord& order) override;
    void cancel_order(const std::string& order_id) override;
    void signal_done() override { ++done_signals_; }

    // Buy orders fill when ask <= price, sell orders when bid >= price.
    // Returns the number of fills generated.
    size_t check_fills(const MarketSnapshot& snapshot);

    size_t   active_order_count() const { return orders_.size(); }
    uint64_t done_signals() const { return done_signals_; }

private:
    std::map<std::string, OrderRecord> orders_;
    FillCallback on_fill_;
    uint64_t done_signals_ = 0;
};

} // namespace ramm
