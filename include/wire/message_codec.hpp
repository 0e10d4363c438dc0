#pragma once

#include "config/json_value.hpp"
#include "execution/order.hpp"
#include "market/market_view.hpp"

#include <string>

namespace ramm {

struct InboundMessage {
    enum class Kind { MarketData, Fill, Error, Authenticated, Connected, Unknown };

    Kind           kind = Kind::Unknown;
    MarketSnapshot snapshot;   // MarketData
    Fill           fill;       // Fill
    std::string    text;       // Error message, or the type tag of an Unknown message
};

// Market channel: MARKET_DATA / SNAPSHOT (or untyped with a step), CONNECTED.
// Throws ParseError on malformed JSON or mistyped fields.
InboundMessage decode_market_message(const std::string& text);

// Order channel: FILL, ERROR, AUTHENTICATED.
// Throws ParseError on malformed JSON or mistyped fields.
InboundMessage decode_order_message(const std::string& text);

std::string encode_order(const OrderRecord& order);
std::string encode_cancel(const std::string& order_id);
std::string encode_done();

} // namespace ramm
