#include "logging/step_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <stdexcept>

namespace ramm {

namespace {

std::string format_now(const char* fmt, bool with_millis) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    std::string out = buf;
    if (with_millis) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
        char frac[8];
        std::snprintf(frac, sizeof(frac), ".%03d", static_cast<int>(ms));
        out += frac;
    }
    return out;
}

JsonValue levels_json(const std::vector<BookLevel>& levels, size_t max_levels) {
    JsonValue arr = JsonValue::make_array();
    for (size_t i = 0; i < std::min(levels.size(), max_levels); ++i) {
        JsonValue lvl = JsonValue::make_object();
        lvl.set("price", JsonValue::make_number(levels[i].price));
        lvl.set("qty", JsonValue::make_number(static_cast<double>(levels[i].quantity)));
        arr.push(std::move(lvl));
    }
    return arr;
}

JsonValue fill_json(const LoggedFill& f) {
    JsonValue obj = JsonValue::make_object();
    obj.set("order_id", JsonValue::make_string(f.fill.order_id));
    obj.set("side", JsonValue::make_string(std::string(to_string(f.fill.side))));
    obj.set("price", JsonValue::make_number(f.fill.price));
    obj.set("qty", JsonValue::make_number(static_cast<double>(f.fill.qty)));
    obj.set("latency_ms", f.latency_ms ? JsonValue::make_number(*f.latency_ms) : JsonValue{});
    return obj;
}

} // anonymous namespace

StepLogger::StepLogger(const std::string& dir, StepLogIdentity identity)
    : identity_(std::move(identity)) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("step log: cannot create " + dir + ": " + ec.message());
    }

    std::string name = identity_.scenario + "_" + identity_.experiment + "_" + identity_.mode +
                       "_" + format_now("%Y%m%d_%H%M%S", false) + ".jsonl";
    path_ = (std::filesystem::path(dir) / name).string();

    out_.open(path_);
    if (!out_.is_open()) {
        throw std::runtime_error("step log: cannot open " + path_);
    }
}

JsonValue StepLogger::to_json_record(const StepRecord& r, const std::string& timestamp) const {
    static const MarketSnapshot kEmpty{};
    const MarketSnapshot& s = r.snapshot ? *r.snapshot : kEmpty;

    JsonValue market = JsonValue::make_object();
    market.set("bid", JsonValue::make_number(s.bid));
    market.set("ask", JsonValue::make_number(s.ask));
    market.set("mid", JsonValue::make_number(s.mid));
    market.set("spread", JsonValue::make_number(std::round(s.spread * 1e4) / 1e4));
    market.set("last_trade", JsonValue::make_number(s.last_trade));

    JsonValue book = JsonValue::make_object();
    book.set("bids", levels_json(s.bids, kMaxBookLevels));
    book.set("asks", levels_json(s.asks, kMaxBookLevels));
    book.set("bid_depth", JsonValue::make_number(static_cast<double>(s.bid_depth)));
    book.set("ask_depth", JsonValue::make_number(static_cast<double>(s.ask_depth)));

    JsonValue state = JsonValue::make_object();
    state.set("inventory", JsonValue::make_number(static_cast<double>(r.position.inventory)));
    state.set("cash_flow", JsonValue::make_number(r.position.cash_flow));
    state.set("pnl", JsonValue::make_number(r.position.pnl));
    state.set("orders_sent", JsonValue::make_number(static_cast<double>(r.position.orders_sent)));

    JsonValue action;
    if (r.action) {
        action = JsonValue::make_object();
        action.set("order_id", JsonValue::make_string(r.action->id));
        action.set("side", JsonValue::make_string(std::string(to_string(r.action->side))));
        action.set("price", JsonValue::make_number(r.action->price));
        action.set("qty", JsonValue::make_number(static_cast<double>(r.action->qty)));
    }

    JsonValue fills = JsonValue::make_array();
    for (const auto& f : r.fills) fills.push(fill_json(f));

    JsonValue rec = JsonValue::make_object();
    rec.set("step", JsonValue::make_number(static_cast<double>(s.step)));
    rec.set("timestamp", JsonValue::make_string(timestamp));
    rec.set("experiment", JsonValue::make_string(identity_.experiment));
    rec.set("scenario", JsonValue::make_string(identity_.scenario));
    rec.set("run_id", JsonValue::make_string(identity_.run_id));
    rec.set("mode", JsonValue::make_string(identity_.mode));
    rec.set("market", std::move(market));
    rec.set("book", std::move(book));
    rec.set("state", std::move(state));
    rec.set("regime", JsonValue::make_string(std::string(to_string(r.regime))));
    rec.set("action", std::move(action));
    rec.set("fill", r.fills.empty() ? JsonValue{} : fill_json(r.fills.back()));
    rec.set("fills", std::move(fills));
    return rec;
}

void StepLogger::log_step(const StepRecord& record) {
    out_ << to_json(to_json_record(record, format_now("%Y-%m-%dT%H:%M:%S", true))) << '\n';
    out_.flush();
    ++lines_written_;
}

} // namespace ramm
