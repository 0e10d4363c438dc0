#include "backtest/backtest_runner.hpp"
#include "common/logging.hpp"
#include "strategy/strategy.hpp"

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace ramm {

namespace {

constexpr int64_t kStartBidTicks = 999;   // 99.9
constexpr int64_t kMinBidTicks   = 10;
constexpr int     kBookLevels    = 3;

// Book dynamics for one stretch of a synthetic scenario.
struct Phase {
    int64_t spread_ticks = 2;
    double  move_prob    = 0.05;   // chance of a one-tick mid move
    double  up_bias      = 0.5;    // P(up | move)
    int64_t drift_ticks  = 0;      // forced move per step, overrides move_prob
    int64_t bid_depth    = 1000;
    int64_t ask_depth    = 1000;
    int64_t depth_jitter = 100;
};

constexpr Phase kCalm{};

Phase phase_for(const std::string& scenario, size_t tick, size_t num_ticks) {
    const size_t event_start = std::max<size_t>(num_ticks * 2 / 5, 150);

    if (scenario == "normal_market") {
        return kCalm;
    }
    if (scenario == "stressed_market") {
        const size_t event_end = std::max(event_start + 100, num_ticks * 4 / 5);
        if (tick >= event_start && tick < event_end) {
            return Phase{.spread_ticks = 3, .move_prob = 0.15,
                         .bid_depth = 400, .ask_depth = 400, .depth_jitter = 50};
        }
        return kCalm;
    }
    if (scenario == "flash_crash" || scenario == "mini_flash_crash") {
        const bool mini = scenario == "mini_flash_crash";
        const size_t crash_len = mini ? 8 : 20;
        const size_t recovery_len = 100;
        if (tick >= event_start && tick < event_start + crash_len) {
            return Phase{.spread_ticks = mini ? 5 : 10, .drift_ticks = mini ? -2 : -5,
                         .bid_depth = mini ? 400 : 200, .ask_depth = mini ? 1500 : 2000,
                         .depth_jitter = 50};
        }
        if (tick >= event_start + crash_len && tick < event_start + crash_len + recovery_len) {
            return Phase{.spread_ticks = 2, .move_prob = 0.3, .up_bias = 0.8};
        }
        return kCalm;
    }
    if (scenario == "hft_dominated") {
        if (tick >= std::max<size_t>(num_ticks / 5, 150)) {
            return Phase{.spread_ticks = 1, .move_prob = 0.6, .depth_jitter = 150};
        }
        return kCalm;
    }
    throw ConfigError("unknown backtest scenario '" + scenario + "'");
}

double ticks_to_price(int64_t ticks) {
    return round_price(static_cast<double>(ticks) * kTick, 1);
}

std::vector<BookLevel> build_side(int64_t best_ticks, int64_t step_ticks, int64_t depth) {
    std::vector<BookLevel> levels;
    const int64_t per_level = depth / kBookLevels;
    for (int i = 0; i < kBookLevels; ++i) {
        int64_t qty = (i == kBookLevels - 1) ? depth - per_level * (kBookLevels - 1) : per_level;
        levels.push_back(BookLevel{ticks_to_price(best_ticks + step_ticks * i), qty});
    }
    return levels;
}

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (std::getline(iss, token, ',')) {
        tokens.push_back(token);
    }
    return tokens;
}

} // anonymous namespace

BacktestRunner::BacktestRunner(BacktestConfig config, StepLogger* step_log)
    : config_(std::move(config)),
      gateway_([this](const Fill& fill) { queue_.push(FillEvent{fill}); }),
      engine_(config_.engine, config_.client_name, gateway_, step_log),
      log_(get_logger("backtest")) {}

EngineStats BacktestRunner::run() {
    std::vector<MarketSnapshot> snapshots;
    if (!config_.data_file.empty()) {
        snapshots = load_csv(config_.data_file);
        log_->info("loaded {} snapshots from {}", snapshots.size(), config_.data_file);
    } else {
        snapshots = generate_scenario(config_.scenario, config_.num_ticks, config_.seed);
        log_->info("generated {} snapshots for scenario '{}' (seed {})",
                   snapshots.size(), config_.scenario, config_.seed);
    }
    return run_snapshots(snapshots);
}

EngineStats BacktestRunner::run_snapshots(const std::vector<MarketSnapshot>& snapshots) {
    for (const auto& snap : snapshots) {
        // Orders resting from earlier steps fill before this step is decided.
        gateway_.check_fills(snap);
        queue_.push(SnapshotEvent{snap});

        if (!engine_.drain(queue_)) {
            log_->warn("engine stopped at step {}", snap.step);
            break;
        }
    }

    auto stats = engine_.stats();
    log_->info("backtest finished: {} steps, {} orders, {} fills, inventory {}, pnl {:.2f}",
               stats.steps, stats.orders_sent, stats.fills, stats.inventory, stats.pnl);
    return stats;
}

std::vector<MarketSnapshot> BacktestRunner::load_csv(const std::string& filename) {
    std::ifstream f(filename);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open backtest data file " + filename);
    }

    auto log = get_logger("backtest");
    std::vector<MarketSnapshot> result;
    std::string line;
    size_t line_no = 0;

    while (std::getline(f, line)) {
        ++line_no;
        if (line.empty()) continue;
        if (line_no == 1 && line.rfind("step", 0) == 0) continue;   // header

        auto tokens = split_csv(line);
        if (tokens.size() < 5) {
            log->warn("{}:{}: expected 5 columns, got {}", filename, line_no, tokens.size());
            continue;
        }

        try {
            int64_t step    = std::stoll(tokens[0]);
            double  bid     = std::stod(tokens[1]);
            int64_t bid_qty = std::stoll(tokens[2]);
            double  ask     = std::stod(tokens[3]);
            int64_t ask_qty = std::stoll(tokens[4]);
            result.push_back(make_snapshot(step, bid, ask,
                                           {BookLevel{bid, bid_qty}},
                                           {BookLevel{ask, ask_qty}}));
        } catch (const std::logic_error& e) {
            // std::invalid_argument / std::out_of_range from the conversions
            log->warn("{}:{}: skipping malformed row ({})", filename, line_no, e.what());
        }
    }
    return result;
}

std::vector<MarketSnapshot> BacktestRunner::generate_scenario(const std::string& scenario,
                                                              size_t num_ticks, uint32_t seed) {
    const auto& names = scenario_names();
    if (std::find(names.begin(), names.end(), scenario) == names.end()) {
        throw ConfigError("unknown backtest scenario '" + scenario + "'");
    }

    std::vector<MarketSnapshot> result;
    result.reserve(num_ticks);

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    int64_t bid_ticks = kStartBidTicks;

    for (size_t tick = 0; tick < num_ticks; ++tick) {
        const Phase p = phase_for(scenario, tick, num_ticks);

        if (p.drift_ticks != 0) {
            bid_ticks += p.drift_ticks;
        } else if (unit(rng) < p.move_prob) {
            bid_ticks += (unit(rng) < p.up_bias) ? 1 : -1;
        }
        bid_ticks = std::max(bid_ticks, kMinBidTicks);
        const int64_t ask_ticks = bid_ticks + p.spread_ticks;

        std::uniform_int_distribution<int64_t> jitter(-p.depth_jitter, p.depth_jitter);
        const int64_t bid_depth = std::max<int64_t>(kBookLevels, p.bid_depth + jitter(rng));
        const int64_t ask_depth = std::max<int64_t>(kBookLevels, p.ask_depth + jitter(rng));

        const double bid = ticks_to_price(bid_ticks);
        const double ask = ticks_to_price(ask_ticks);
        result.push_back(make_snapshot(static_cast<int64_t>(tick), bid, ask,
                                       build_side(bid_ticks, -1, bid_depth),
                                       build_side(ask_ticks, 1, ask_depth),
                                       compute_mid(bid, ask)));
    }
    return result;
}

const std::vector<std::string>& BacktestRunner::scenario_names() {
    static const std::vector<std::string> names = {
        "normal_market", "stressed_market", "flash_crash", "mini_flash_crash", "hft_dominated",
    };
    return names;
}

} // namespace ramm
