#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>

namespace ramm {

// Running min / max / mean of latency samples in milliseconds.
struct LatencyStats {
    uint64_t count  = 0;
    double   sum_ms = 0.0;
    double   min_ms = std::numeric_limits<double>::max();
    double   max_ms = 0.0;

    void record(double ms) {
        ++count;
        sum_ms += ms;
        min_ms = std::min(min_ms, ms);
        max_ms = std::max(max_ms, ms);
    }

    double avg_ms() const { return count ? sum_ms / static_cast<double>(count) : 0.0; }
    double min_or_zero() const { return count ? min_ms : 0.0; }
};

} // namespace ramm
