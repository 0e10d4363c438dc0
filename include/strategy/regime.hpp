#pragma once

#include <cstdint>
#include <string_view>

namespace ramm {

enum class Regime { Calibrating, Normal, Stressed, Crash, Hft, Recovery };

constexpr std::string_view to_string(Regime r) {
    switch (r) {
        case Regime::Calibrating: return "CALIBRATING";
        case Regime::Normal:      return "NORMAL";
        case Regime::Stressed:    return "STRESSED";
        case Regime::Crash:       return "CRASH";
        case Regime::Hft:         return "HFT";
        case Regime::Recovery:    return "RECOVERY";
    }
    return "NORMAL";
}

// Classifier memory. Owned by the caller so independent engines never share it.
struct RegimeState {
    Regime  current         = Regime::Calibrating;
    Regime  previous        = Regime::Calibrating;
    int64_t regime_duration = 0;   // steps spent in current
    int64_t crash_cooldown  = 0;   // remaining RECOVERY steps
};

} // namespace ramm
