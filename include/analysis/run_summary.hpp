#pragma once

#include "common/latency_stats.hpp"
#include "config/json_value.hpp"

#include <cstdint>
#include <iosfwd>
#include <limits>
#include <string>
#include <vector>

namespace ramm {

// min / max / mean / last of a series.
struct SeriesStats {
    size_t count = 0;
    double min   = std::numeric_limits<double>::max();
    double max   = std::numeric_limits<double>::lowest();
    double sum   = 0.0;
    double last  = 0.0;

    void add(double v);
    double avg() const { return count ? sum / static_cast<double>(count) : 0.0; }
    double min_or_zero() const { return count ? min : 0.0; }
    double max_or_zero() const { return count ? max : 0.0; }
};

struct RunSummary {
    std::string source_file;
    std::string scenario;
    std::string experiment;
    std::string run_id;
    std::string mode;

    size_t  total_steps = 0;
    int64_t first_step  = 0;
    int64_t last_step   = 0;

    // Prices only count strictly positive samples.
    SeriesStats bid;
    SeriesStats ask;
    SeriesStats mid;
    SeriesStats spread;

    SeriesStats inventory;
    SeriesStats pnl;
    double      final_cash_flow = 0.0;
    double      max_drawdown    = 0.0;   // peak-to-trough of pnl

    uint64_t buy_actions  = 0;
    uint64_t sell_actions = 0;
    uint64_t buy_fills    = 0;
    uint64_t sell_fills   = 0;
    double   total_fill_qty = 0.0;
    SeriesStats  fill_price;
    LatencyStats fill_latency;

    uint64_t total_actions() const { return buy_actions + sell_actions; }
    uint64_t total_fills() const { return buy_fills + sell_fills; }
    // Percentage of actions that were filled.
    double fill_rate_pct() const;
    double avg_fill_qty() const;
};

// One record per non-empty line. Invalid lines are skipped with a warning.
// Throws std::runtime_error if the file cannot be opened.
std::vector<JsonValue> load_jsonl(const std::string& path);

RunSummary summarize(const std::vector<JsonValue>& records);

void print_summary(const RunSummary& summary, std::ostream& os);

// One flattened row per step record.
void write_flat_csv(const std::vector<JsonValue>& records, const std::string& csv_path);

// One summary row per *.jsonl file in dir, sorted by file name. Returns the
// number of files processed. Throws std::runtime_error if dir is missing.
size_t write_directory_summary(const std::string& dir, const std::string& output_csv);

std::string summary_csv_header();
std::string summary_csv_row(const RunSummary& summary);

} // namespace ramm
