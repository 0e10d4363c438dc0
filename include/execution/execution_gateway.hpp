#pragma once

#include "execution/order.hpp"

#include <string>

namespace ramm {

// Outbound side of the exchange connection. Cancels are fire-and-forget.
class IExecutionGateway {
public:
    virtual ~IExecutionGateway() = default;
    virtual void send_order(const OrderRecord& order) = 0;
    virtual void cancel_order(const std::string& order_id) = 0;
    // Tells the exchange the current step is fully handled.
    virtual void signal_done() = 0;
};

} // namespace ramm
