#pragma once

#include "config/engine_config.hpp"
#include "execution/order.hpp"
#include "risk/position.hpp"

#include <optional>
#include <string_view>

namespace ramm {

enum class RiskOutcome {
    Passed,      // candidate (or no candidate) unchanged
    Resized,     // quantity normalized to a valid lot
    Blocked,     // candidate dropped, nothing sent
    Unwind,      // candidate replaced by an unwind toward the safety buffer
    Emergency,   // no candidate, inventory at the hard limit
};

constexpr std::string_view to_string(RiskOutcome o) {
    switch (o) {
        case RiskOutcome::Passed:    return "PASSED";
        case RiskOutcome::Resized:   return "RESIZED";
        case RiskOutcome::Blocked:   return "BLOCKED";
        case RiskOutcome::Unwind:    return "UNWIND";
        case RiskOutcome::Emergency: return "EMERGENCY";
    }
    return "PASSED";
}

struct RiskDecision {
    std::optional<OrderIntent> order;
    RiskOutcome                outcome = RiskOutcome::Passed;
};

// Last check before an order reaches the book. Whatever a strategy proposes,
// an accepted order never takes |inventory| to the hard limit, even if every
// resting order on the same side fills too.
class RiskOverlay {
public:
    explicit RiskOverlay(const RiskParams& params = {});

    RiskDecision adjust(const std::optional<OrderIntent>& candidate,
                        double bid, double ask, int64_t inventory,
                        const RestingExposure& resting = {}) const;

    const RiskParams& params() const { return params_; }

private:
    RiskDecision emergency_or_nothing(double bid, double ask, int64_t inventory,
                                      RiskOutcome otherwise) const;
    RiskDecision unwind_toward_buffer(double bid, double ask, int64_t inventory) const;

    RiskParams params_;
};

} // namespace ramm
