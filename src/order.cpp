#include "execution/order.hpp"

namespace ramm {

std::optional<OrderSide> parse_side(std::string_view text) {
    if (text == "BUY")  return OrderSide::Buy;
    if (text == "SELL") return OrderSide::Sell;
    return std::nullopt;
}

} // namespace ramm
