#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ramm {

// Exchange lot rules: every order is a whole number of lots in [min, max].
inline constexpr int64_t kLotSize     = 100;
inline constexpr int64_t kMinOrderQty = 100;
inline constexpr int64_t kMaxOrderQty = 500;

enum class OrderSide { Buy, Sell };

constexpr std::string_view to_string(OrderSide side) {
    return side == OrderSide::Buy ? "BUY" : "SELL";
}

std::optional<OrderSide> parse_side(std::string_view text);

// Candidate order produced by a strategy or the risk overlay.
struct OrderIntent {
    OrderSide side  = OrderSide::Buy;
    double    price = 0.0;
    int64_t   qty   = 0;
};

// Locally-resting order as tracked by the lifecycle manager.
struct OrderRecord {
    std::string id;
    OrderSide   side           = OrderSide::Buy;
    double      price          = 0.0;
    int64_t     qty            = 0;
    int64_t     submitted_step = 0;
};

struct Fill {
    std::string order_id;
    OrderSide   side  = OrderSide::Buy;
    double      price = 0.0;
    int64_t     qty   = 0;
};

} // namespace ramm
