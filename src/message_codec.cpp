#include "wire/message_codec.hpp"

#include <cmath>

namespace ramm {

namespace {

JsonValue parse_object(const std::string& text) {
    JsonValue root = parse_json(text);
    if (!root.is_object()) {
        throw ParseError("message: expected a JSON object");
    }
    return root;
}

// Absent or null -> def; present with the wrong type -> ParseError.
double number_field(const JsonValue& obj, const char* key, double def) {
    const JsonValue* v = obj.find(key);
    if (!v || v->is_null()) return def;
    if (!v->is_number()) {
        throw ParseError(std::string("message: field '") + key + "' must be a number");
    }
    return v->number;
}

int64_t int_field(const JsonValue& obj, const char* key, int64_t def) {
    double d = number_field(obj, key, static_cast<double>(def));
    if (!std::isfinite(d)) {
        throw ParseError(std::string("message: field '") + key + "' is not finite");
    }
    return static_cast<int64_t>(std::llround(d));
}

std::string string_field(const JsonValue& obj, const char* key) {
    const JsonValue* v = obj.find(key);
    if (!v || v->is_null()) return {};
    if (!v->is_string()) {
        throw ParseError(std::string("message: field '") + key + "' must be a string");
    }
    return v->str;
}

std::vector<BookLevel> levels_field(const JsonValue& obj, const char* key) {
    std::vector<BookLevel> levels;
    const JsonValue* v = obj.find(key);
    if (!v || v->is_null()) return levels;
    if (!v->is_array()) {
        throw ParseError(std::string("message: field '") + key + "' must be an array");
    }
    levels.reserve(v->arr.size());
    for (const auto& lvl : v->arr) {
        if (!lvl.is_object()) {
            throw ParseError(std::string("message: '") + key + "' entries must be objects");
        }
        levels.push_back(BookLevel{number_field(lvl, "price", 0.0), int_field(lvl, "qty", 0)});
    }
    return levels;
}

} // anonymous namespace

InboundMessage decode_market_message(const std::string& text) {
    JsonValue root = parse_object(text);
    std::string type = string_field(root, "type");

    InboundMessage msg;
    if (type == "CONNECTED") {
        msg.kind = InboundMessage::Kind::Connected;
        return msg;
    }
    if (type != "MARKET_DATA" && type != "SNAPSHOT" && !(type.empty() && root.contains("step"))) {
        msg.kind = InboundMessage::Kind::Unknown;
        msg.text = type;
        return msg;
    }

    msg.kind = InboundMessage::Kind::MarketData;
    msg.snapshot = make_snapshot(int_field(root, "step", 0),
                                 number_field(root, "bid", 0.0),
                                 number_field(root, "ask", 0.0),
                                 levels_field(root, "bids"),
                                 levels_field(root, "asks"),
                                 number_field(root, "last_trade", 0.0));
    return msg;
}

InboundMessage decode_order_message(const std::string& text) {
    JsonValue root = parse_object(text);
    std::string type = string_field(root, "type");

    InboundMessage msg;
    if (type == "AUTHENTICATED") {
        msg.kind = InboundMessage::Kind::Authenticated;
    } else if (type == "ERROR") {
        msg.kind = InboundMessage::Kind::Error;
        msg.text = string_field(root, "message");
    } else if (type == "FILL") {
        auto side = parse_side(string_field(root, "side"));
        if (!side) {
            throw ParseError("message: FILL has no valid side");
        }
        msg.kind = InboundMessage::Kind::Fill;
        msg.fill = Fill{
            .order_id = string_field(root, "order_id"),
            .side     = *side,
            .price    = number_field(root, "price", 0.0),
            .qty      = int_field(root, "qty", 0),
        };
    } else {
        msg.kind = InboundMessage::Kind::Unknown;
        msg.text = type;
    }
    return msg;
}

std::string encode_order(const OrderRecord& order) {
    JsonValue v = JsonValue::make_object();
    v.set("order_id", JsonValue::make_string(order.id));
    v.set("side", JsonValue::make_string(std::string(to_string(order.side))));
    v.set("price", JsonValue::make_number(order.price));
    v.set("qty", JsonValue::make_number(static_cast<double>(order.qty)));
    return to_json(v);
}

std::string encode_cancel(const std::string& order_id) {
    JsonValue v = JsonValue::make_object();
    v.set("action", JsonValue::make_string("CANCEL"));
    v.set("order_id", JsonValue::make_string(order_id));
    return to_json(v);
}

std::string encode_done() {
    JsonValue v = JsonValue::make_object();
    v.set("action", JsonValue::make_string("DONE"));
    return to_json(v);
}

} // namespace ramm
