#pragma once

#include "config/json_value.hpp"
#include "execution/order.hpp"
#include "market/market_view.hpp"
#include "risk/position.hpp"
#include "strategy/regime.hpp"

#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace ramm {

struct LoggedFill {
    Fill                  fill;
    std::optional<double> latency_ms;
};

// Everything that happened on one step, as seen after the decision.
struct StepRecord {
    const MarketSnapshot*      snapshot = nullptr;
    PositionState              position;
    Regime                     regime = Regime::Calibrating;
    std::optional<OrderRecord> action;
    std::vector<LoggedFill>    fills;   // received since the previous step
};

struct StepLogIdentity {
    std::string scenario   = "unknown";
    std::string experiment = "default";
    std::string mode       = "active";
    std::string run_id;
};

// One JSON object per line, flushed per step so a crashed run keeps its data.
class StepLogger {
public:
    static constexpr size_t kMaxBookLevels = 10;

    // Creates <dir>/<scenario>_<experiment>_<mode>_<YYYYmmdd_HHMMSS>.jsonl.
    // Throws std::runtime_error if the file cannot be opened.
    StepLogger(const std::string& dir, StepLogIdentity identity);

    void set_run_id(const std::string& run_id) { identity_.run_id = run_id; }

    void log_step(const StepRecord& record);

    const std::string& path() const { return path_; }
    uint64_t lines_written() const { return lines_written_; }

    // Builds the JSON object for one step (exposed for tests).
    JsonValue to_json_record(const StepRecord& record, const std::string& timestamp) const;

private:
    StepLogIdentity identity_;
    std::string     path_;
    std::ofstream   out_;
    uint64_t        lines_written_ = 0;
};

} // namespace ramm
