#include "market/market_view.hpp"

namespace ramm {

double compute_mid(double bid, double ask) {
    if (bid > 0.0 && ask > 0.0) return (bid + ask) / 2.0;
    if (bid > 0.0) return bid;
    if (ask > 0.0) return ask;
    return 0.0;
}

double compute_spread(double bid, double ask) {
    return (bid > 0.0 && ask > 0.0) ? ask - bid : 0.0;
}

MarketSnapshot make_snapshot(int64_t step, double bid, double ask,
                             std::vector<BookLevel> bids,
                             std::vector<BookLevel> asks,
                             double last_trade) {
    MarketSnapshot snap;
    snap.step       = step;
    snap.bid        = bid;
    snap.ask        = ask;
    snap.mid        = compute_mid(bid, ask);
    snap.spread     = compute_spread(bid, ask);
    snap.last_trade = last_trade;

    if (bids.empty()) bids.push_back(BookLevel{bid, 0});
    if (asks.empty()) asks.push_back(BookLevel{ask, 0});

    for (const auto& lvl : bids) snap.bid_depth += lvl.quantity;
    for (const auto& lvl : asks) snap.ask_depth += lvl.quantity;

    snap.bids = std::move(bids);
    snap.asks = std::move(asks);
    return snap;
}

} // namespace ramm
