#pragma once

#include <cstdint>
#include <vector>

namespace ramm {

struct BookLevel {
    double  price    = 0.0;
    int64_t quantity = 0;
};

struct MarketSnapshot {
    int64_t step       = 0;
    double  bid        = 0.0;
    double  ask        = 0.0;
    double  mid        = 0.0;   // (bid + ask) / 2, or the one non-zero side
    double  spread     = 0.0;   // ask - bid when both sides are present
    int64_t bid_depth  = 0;     // sum of bid level quantities
    int64_t ask_depth  = 0;     // sum of ask level quantities
    double  last_trade = 0.0;
    std::vector<BookLevel> bids;
    std::vector<BookLevel> asks;

    bool has_quote() const { return bid > 0.0 && ask > 0.0 && mid > 0.0; }
    int64_t total_depth() const { return bid_depth + ask_depth; }
};

// Fills in mid, spread and depth from best prices and levels. Without levels
// each side degrades to a single zero-quantity level at the best price.
MarketSnapshot make_snapshot(int64_t step, double bid, double ask,
                             std::vector<BookLevel> bids = {},
                             std::vector<BookLevel> asks = {},
                             double last_trade = 0.0);

double compute_mid(double bid, double ask);
double compute_spread(double bid, double ask);

} // namespace ramm
