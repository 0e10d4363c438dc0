#include "execution/sim_execution_gateway.hpp"

#include <vector>

namespace ramm {

SimExecutionGateway::SimExecutionGateway(FillCallback on_fill)
    : on_fill_(std::move(on_fill)) {}

void SimExecutionGateway::send_order(const OrderRecord& order) {
    orders_[order.id] = order;
}

void SimExecutionGateway::cancel_order(const std::string& order_id) {
    orders_.erase(order_id);
}

size_t SimExecutionGateway::check_fills(const MarketSnapshot& snapshot) {
    if (!snapshot.has_quote()) return 0;

    std::vector<Fill> fills;
    for (const auto& [id, order] : orders_) {
        bool crossed = (order.side == OrderSide::Buy) ? snapshot.ask <= order.price
                                                      : snapshot.bid >= order.price;
        if (crossed) {
            fills.push_back(Fill{id, order.side, order.price, order.qty});
        }
    }

    for (const auto& fill : fills) {
        orders_.erase(fill.order_id);
        if (on_fill_) on_fill_(fill);
    }
    return fills.size();
}

} // namespace ramm
