#include <gtest/gtest.h>
#include "strategy/strategy_router.hpp"

using namespace ramm;

namespace {

MarketSnapshot quote(int64_t step, double bid, double ask, int64_t depth = 500) {
    return make_snapshot(step, bid, ask, {BookLevel{bid, depth}}, {BookLevel{ask, depth}});
}

EngineConfig fast_config() {
    EngineConfig c;
    c.metrics.window = 20;
    c.metrics.calibration_steps = 20;
    c.metrics.churn_window = 10;
    return c;
}

} // namespace

class StrategyRouterTest : public ::testing::Test {
protected:
    void calibrate(StrategyRouter& r, int64_t inventory = 0) {
        for (int64_t s = 0; s < 20; ++s) r.decide(quote(s, 99.9, 100.1), inventory);
    }

    EngineConfig config = fast_config();
};

TEST_F(StrategyRouterTest, NoStrategyWhileCalibrating) {
    StrategyRouter router(config);
    auto d = router.decide(quote(0, 99.9, 100.1), 0);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->regime, Regime::Calibrating);
    EXPECT_TRUE(d->strategy.empty());
    EXPECT_FALSE(d->candidate.has_value());
    EXPECT_FALSE(d->order.has_value());
}

TEST_F(StrategyRouterTest, NormalUsesConfiguredFallback) {
    StrategyRouter router(config);
    calibrate(router);
    auto d = router.decide(quote(20, 99.9, 100.1), 0);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->regime, Regime::Normal);
    EXPECT_EQ(d->strategy, "aggressive_mm");

    config.strategies.normal_fallback = "momentum";
    StrategyRouter momentum_router(config);
    calibrate(momentum_router);
    d = momentum_router.decide(quote(20, 99.9, 100.1), 0);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->strategy, "momentum");
}

TEST_F(StrategyRouterTest, StrongSignalSelectsMeanReversion) {
    StrategyRouter router(config);
    MetricsSignals s;
    s.calibrated = true;
    s.z_score = -3.0;
    ASSERT_NE(router.select(Regime::Normal, s), nullptr);
    EXPECT_EQ(router.select(Regime::Normal, s)->name(), "mean_reversion");

    s.z_score = 0.5;
    EXPECT_EQ(router.select(Regime::Normal, s)->name(), "aggressive_mm");
}

TEST_F(StrategyRouterTest, RegimeBindings) {
    StrategyRouter router(config);
    MetricsSignals s;
    EXPECT_EQ(router.select(Regime::Calibrating, s), nullptr);
    EXPECT_EQ(router.select(Regime::Crash, s)->name(), "crash_survival");
    EXPECT_EQ(router.select(Regime::Stressed, s)->name(), "passive_mm_normal");
    EXPECT_EQ(router.select(Regime::Recovery, s)->name(), "passive_mm_normal");
    EXPECT_EQ(router.select(Regime::Hft, s)->name(), "passive_mm_hft");
}

TEST_F(StrategyRouterTest, WideSpreadTriggersCrashSurvival) {
    StrategyRouter router(config);
    calibrate(router, 1000);

    auto d = router.decide(quote(20, 95.0, 106.0), 1000);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->regime, Regime::Crash);
    EXPECT_TRUE(d->regime_changed());
    EXPECT_EQ(d->strategy, "crash_survival");
    ASSERT_TRUE(d->order.has_value());
    EXPECT_EQ(d->order->side, OrderSide::Sell);
    EXPECT_NEAR(d->order->price, 95.0 - CrashSurvivalStrategy::kCrossOffset, 1e-9);
}

TEST_F(StrategyRouterTest, CrashSurvivalIdleWhenFlat) {
    StrategyRouter router(config);
    calibrate(router);
    auto d = router.decide(quote(20, 95.0, 106.0), 0);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->regime, Regime::Crash);
    EXPECT_FALSE(d->order.has_value());
}

TEST_F(StrategyRouterTest, RiskOverlayAppliedToCandidate) {
    StrategyRouter router(config);
    calibrate(router, 4450);
    // Aggressive MM unwinds at max inventory; the hard limit is not threatened.
    auto d = router.decide(quote(20, 99.9, 100.1), 4450);
    ASSERT_TRUE(d.has_value());
    ASSERT_TRUE(d->order.has_value());
    EXPECT_EQ(d->order->side, OrderSide::Sell);

    // Emergency fires without a candidate at the hard limit.
    auto e = router.decide(quote(21, 95.0, 106.0), 4500);
    ASSERT_TRUE(e.has_value());
    ASSERT_TRUE(e->order.has_value());
    EXPECT_EQ(e->order->side, OrderSide::Sell);
}

TEST_F(StrategyRouterTest, UnusableQuoteIsSkipped) {
    StrategyRouter router(config);
    EXPECT_FALSE(router.decide(quote(0, 0.0, 0.0), 0).has_value());
    EXPECT_EQ(router.metrics().samples_seen(), 0u);
    EXPECT_EQ(router.regime_state().current, Regime::Calibrating);
}

// --- Experiments ---

TEST_F(StrategyRouterTest, ExperimentReplacesRegimeStrategies) {
    config.strategies.experiment = "spread_cross_100";
    StrategyRouter router(config);
    ASSERT_NE(router.experiment(), nullptr);

    // Trades from the first step, calibration included.
    auto d = router.decide(quote(0, 99.9, 100.1), 0);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->regime, Regime::Calibrating);
    EXPECT_EQ(d->strategy, "spread_cross_100");
    ASSERT_TRUE(d->order.has_value());
    EXPECT_EQ(d->order->side, OrderSide::Buy);
    EXPECT_DOUBLE_EQ(d->order->price, 100.1);

    // Regime tracking carries on underneath.
    for (int64_t s = 1; s < 20; ++s) router.decide(quote(s, 99.9, 100.1), 0);
    d = router.decide(quote(20, 95.0, 106.0), 0);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->regime, Regime::Crash);
    EXPECT_EQ(d->strategy, "spread_cross_100");
}

TEST_F(StrategyRouterTest, DefaultHasNoExperiment) {
    StrategyRouter router(config);
    EXPECT_EQ(router.experiment(), nullptr);
}

TEST_F(StrategyRouterTest, UnknownExperimentIsConfigError) {
    config.strategies.experiment = "moon_landing";
    EXPECT_THROW(StrategyRouter router(config), ConfigError);
}

TEST_F(StrategyRouterTest, RestingOrdersReachRiskOverlay) {
    config.strategies.experiment = "aggressive_buy_100";
    StrategyRouter router(config);

    auto d = router.decide(quote(0, 99.9, 100.1), 4300);
    ASSERT_TRUE(d.has_value() && d->order.has_value());
    EXPECT_EQ(d->risk, RiskOutcome::Passed);
    EXPECT_EQ(d->order->side, OrderSide::Buy);

    d = router.decide(quote(10, 99.9, 100.1), 4300, RestingExposure{.buy_qty = 100});
    ASSERT_TRUE(d.has_value() && d->order.has_value());
    EXPECT_EQ(d->risk, RiskOutcome::Unwind);
    EXPECT_EQ(d->order->side, OrderSide::Sell);
}
