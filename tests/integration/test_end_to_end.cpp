#include <gtest/gtest.h>
#include "backtest/backtest_runner.hpp"
#include "engine/trading_engine.hpp"
#include "support/recording_execution_gateway.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace ramm;

namespace {

SnapshotEvent quote(int64_t step, double bid, double ask, int64_t depth = 500) {
    return SnapshotEvent{make_snapshot(step, bid, ask, {BookLevel{bid, depth}}, {BookLevel{ask, depth}})};
}

uint64_t steps_in(const EngineStats& s, Regime r) {
    return s.regime_steps[static_cast<size_t>(r)];
}

} // namespace

class EndToEndTest : public ::testing::Test {
protected:
    void feed_calm(int64_t from, int64_t to) {
        for (int64_t step = from; step < to; ++step) {
            queue.push(quote(step, 99.9, 100.1));
            ASSERT_TRUE(engine.drain(queue));
        }
    }

    EngineConfig config;
    RecordingExecutionGateway gateway;
    EngineEventQueue queue;
    TradingEngine engine{config, "e2e", gateway};
};

// --- Live engine against a recording exchange ---

TEST_F(EndToEndTest, CalibratesThenDetectsCrash) {
    feed_calm(0, 100);
    EXPECT_NE(engine.regime(), Regime::Calibrating);
    EXPECT_NE(engine.regime(), Regime::Crash);

    queue.push(quote(100, 95.0, 106.0));
    ASSERT_TRUE(engine.drain(queue));
    EXPECT_EQ(engine.regime(), Regime::Crash);
    ASSERT_TRUE(engine.last_decision().has_value());
    EXPECT_TRUE(engine.last_decision()->regime_changed());
    EXPECT_EQ(engine.last_decision()->strategy, "crash_survival");
}

TEST_F(EndToEndTest, CrashSurvivalFlattensLongInventory) {
    feed_calm(0, 100);

    // A fill for an order the engine never sent still counts.
    queue.push(FillEvent{Fill{"ORD_elsewhere_1_0", OrderSide::Buy, 100.0, 1000}});
    queue.push(quote(100, 95.0, 106.0));
    ASSERT_TRUE(engine.drain(queue));

    EXPECT_EQ(engine.orders().position().inventory, 1000);
    ASSERT_FALSE(gateway.sent().empty());
    const auto& last = gateway.sent().back();
    EXPECT_EQ(last.side, OrderSide::Sell);
    EXPECT_EQ(last.submitted_step, 100);
    EXPECT_EQ(last.qty, 500);
    EXPECT_NEAR(last.price, 94.9, 1e-9);
}

TEST_F(EndToEndTest, DoneSignalledOncePerSnapshot) {
    feed_calm(0, 120);
    queue.push(FillEvent{Fill{"x", OrderSide::Sell, 100.0, 100}});
    queue.push(ErrorEvent{"order rejected"});
    ASSERT_TRUE(engine.drain(queue));

    auto stats = engine.stats();
    EXPECT_EQ(stats.steps, 120u);
    EXPECT_EQ(gateway.done_signals(), 120u);
    EXPECT_EQ(stats.errors, 1u);
    EXPECT_EQ(stats.fills, 1u);
    EXPECT_EQ(stats.step_latency.count, 119u);
}

TEST_F(EndToEndTest, BadQuoteStillSignalsDone) {
    feed_calm(0, 10);
    queue.push(quote(10, 0.0, 0.0));
    ASSERT_TRUE(engine.drain(queue));
    EXPECT_EQ(engine.stats().bad_quotes, 1u);
    EXPECT_EQ(gateway.done_signals(), 11u);
}

TEST_F(EndToEndTest, DisconnectEndsRun) {
    queue.push(quote(0, 99.9, 100.1));
    queue.push(DisconnectedEvent{"replay finished", false});
    queue.push(quote(1, 99.9, 100.1));
    engine.run(queue);
    EXPECT_EQ(engine.stats().steps, 1u);
    EXPECT_EQ(queue.size(), 1u);
}

TEST_F(EndToEndTest, InventoryStaysInsideHardLimit) {
    feed_calm(0, 100);
    // Push inventory close to the limit, then keep quoting.
    queue.push(FillEvent{Fill{"x", OrderSide::Buy, 100.0, 4400}});
    ASSERT_TRUE(engine.drain(queue));
    for (int64_t step = 100; step < 200; ++step) {
        queue.push(quote(step, 99.9, 100.1));
        ASSERT_TRUE(engine.drain(queue));
        ASSERT_TRUE(engine.last_decision().has_value());
        if (const auto& order = engine.last_decision()->order) {
            int64_t inv = engine.orders().position().inventory;
            EXPECT_FALSE(order->side == OrderSide::Buy && inv + order->qty >= config.risk.hard_limit);
        }
    }
}

TEST_F(EndToEndTest, FinalResultsPrinted) {
    feed_calm(0, 5);
    std::ostringstream os;
    engine.print_final_results(os);
    EXPECT_NE(os.str().find("Final Results"), std::string::npos);
    EXPECT_NE(os.str().find("CALIBRATING"), std::string::npos);
}

// --- Backtests ---

TEST(BacktestTest, NormalMarketNeverCrashes) {
    BacktestConfig cfg;
    cfg.scenario = "normal_market";
    cfg.num_ticks = 600;
    BacktestRunner runner(cfg);
    auto stats = runner.run();

    EXPECT_EQ(stats.steps, 600u);
    EXPECT_EQ(runner.gateway().done_signals(), 600u);
    EXPECT_EQ(steps_in(stats, Regime::Crash), 0u);
    EXPECT_GT(steps_in(stats, Regime::Normal), 0u);
    EXPECT_GT(stats.orders_sent, 0u);
    EXPECT_LT(std::llabs(stats.inventory), cfg.engine.risk.hard_limit);
}

TEST(BacktestTest, FlashCrashIsDetected) {
    BacktestConfig cfg;
    cfg.scenario = "flash_crash";
    cfg.num_ticks = 600;
    BacktestRunner runner(cfg);
    auto stats = runner.run();

    EXPECT_GT(steps_in(stats, Regime::Crash), 0u);
    EXPECT_GT(steps_in(stats, Regime::Recovery), 0u);
    EXPECT_LT(std::llabs(stats.inventory), cfg.engine.risk.hard_limit);
}

TEST(BacktestTest, PassiveExperimentNeverTrades) {
    BacktestConfig cfg;
    cfg.scenario = "flash_crash";
    cfg.num_ticks = 600;
    cfg.engine.strategies.experiment = "passive";
    BacktestRunner runner(cfg);
    auto stats = runner.run();

    EXPECT_EQ(stats.steps, 600u);
    EXPECT_EQ(stats.orders_sent, 0u);
    EXPECT_EQ(stats.inventory, 0);
    EXPECT_GT(steps_in(stats, Regime::Crash), 0u);
}

TEST(BacktestTest, TakerExperimentFillsAndStaysInsideLimit) {
    BacktestConfig cfg;
    cfg.scenario = "normal_market";
    cfg.num_ticks = 600;
    cfg.engine.strategies.experiment = "aggressive_buy_100";
    BacktestRunner runner(cfg);
    auto stats = runner.run();

    EXPECT_GT(stats.orders_sent, 0u);
    EXPECT_GT(stats.fills, 0u);
    EXPECT_LT(std::llabs(stats.inventory), cfg.engine.risk.hard_limit);
}

TEST(BacktestTest, ScenariosAreDeterministic) {
    auto a = BacktestRunner::generate_scenario("stressed_market", 300, 7);
    auto b = BacktestRunner::generate_scenario("stressed_market", 300, 7);
    ASSERT_EQ(a.size(), 300u);
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(a[i].bid, b[i].bid);
        EXPECT_EQ(a[i].ask_depth, b[i].ask_depth);
    }
    EXPECT_NEAR(a[0].spread, 0.2, 1e-9);
    EXPECT_EQ(a[0].bids.size(), 3u);
}

TEST(BacktestTest, EveryScenarioGenerates) {
    for (const auto& name : BacktestRunner::scenario_names()) {
        auto snaps = BacktestRunner::generate_scenario(name, 400, 42);
        ASSERT_EQ(snaps.size(), 400u) << name;
        for (const auto& s : snaps) {
            EXPECT_TRUE(s.has_quote()) << name << " step " << s.step;
            EXPECT_GT(s.ask, s.bid) << name << " step " << s.step;
        }
    }
}

TEST(BacktestTest, UnknownScenarioThrows) {
    EXPECT_THROW(BacktestRunner::generate_scenario("moon_landing", 10, 42), ConfigError);
}

TEST(BacktestTest, ReplaysCsv) {
    auto path = std::filesystem::temp_directory_path() / "ramm_backtest_replay.csv";
    {
        std::ofstream f(path);
        f << "step,bid,bid_qty,ask,ask_qty\n";
        for (int i = 0; i < 150; ++i) {
            f << i << ",99.9,500,100.1,500\n";
        }
        f << "150,not-a-price,500,100.1,500\n";
        f << "151,99.9,500\n";
        f << "152,95.0,500,106.0,500\n";
    }

    auto snaps = BacktestRunner::load_csv(path.string());
    ASSERT_EQ(snaps.size(), 151u);
    EXPECT_EQ(snaps.back().step, 152);

    BacktestConfig cfg;
    cfg.data_file = path.string();
    BacktestRunner runner(cfg);
    auto stats = runner.run();
    EXPECT_EQ(stats.steps, 151u);
    EXPECT_EQ(runner.engine().regime(), Regime::Crash);

    std::filesystem::remove(path);
}

TEST(BacktestTest, MissingCsvThrows) {
    EXPECT_THROW(BacktestRunner::load_csv("/nonexistent/ramm/data.csv"), std::runtime_error);
}
