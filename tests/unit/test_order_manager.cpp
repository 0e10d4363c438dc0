#include <gtest/gtest.h>
#include "execution/order_manager.hpp"
#include "support/recording_execution_gateway.hpp"

using namespace ramm;

class OrderManagerTest : public ::testing::Test {
protected:
    SubmitResult buy(double price, int64_t step, Regime regime = Regime::Normal) {
        return manager.submit(OrderIntent{OrderSide::Buy, price, 200}, step, regime);
    }
    SubmitResult sell(double price, int64_t step, Regime regime = Regime::Normal) {
        return manager.submit(OrderIntent{OrderSide::Sell, price, 200}, step, regime);
    }

    RecordingExecutionGateway gateway;
    OrderLifecycleManager manager{OrderManagerParams{}, "bot", gateway};
};

// --- Submission ---

TEST_F(OrderManagerTest, AcceptedOrderIsSentAndTracked) {
    auto r = buy(99.9, 5);
    EXPECT_EQ(r.status, SubmitStatus::Accepted);
    EXPECT_EQ(r.order_id, "ORD_bot_5_0");
    EXPECT_TRUE(r.cancelled.empty());

    ASSERT_EQ(gateway.sent().size(), 1u);
    EXPECT_EQ(gateway.sent()[0].id, "ORD_bot_5_0");
    EXPECT_EQ(gateway.sent()[0].submitted_step, 5);
    EXPECT_TRUE(manager.is_resting("ORD_bot_5_0"));
    EXPECT_EQ(manager.buy_orders().size(), 1u);
    EXPECT_EQ(manager.position().orders_sent, 1u);

    EXPECT_EQ(sell(100.1, 5).order_id, "ORD_bot_5_1");
    EXPECT_EQ(manager.sell_orders().size(), 1u);
}

TEST_F(OrderManagerTest, RestingExposureSumsEachSide) {
    buy(99.0, 1);
    buy(98.9, 1);
    sell(101.0, 1);
    auto e = manager.resting_exposure();
    EXPECT_EQ(e.buy_qty, 400);
    EXPECT_EQ(e.sell_qty, 200);
}

TEST_F(OrderManagerTest, RejectsNonPositiveOrders) {
    auto r = manager.submit(OrderIntent{OrderSide::Buy, 0.0, 200}, 1, Regime::Normal);
    EXPECT_EQ(r.status, SubmitStatus::Rejected);
    r = manager.submit(OrderIntent{OrderSide::Sell, 100.0, 0}, 1, Regime::Normal);
    EXPECT_EQ(r.status, SubmitStatus::Rejected);
    EXPECT_TRUE(gateway.sent().empty());
    EXPECT_EQ(manager.open_order_count(), 0u);
}

TEST_F(OrderManagerTest, CancelsOwnCrossingOrders) {
    auto resting = sell(100.0, 1);
    auto passive = sell(100.5, 1);
    auto r = buy(100.1, 2);

    EXPECT_EQ(r.status, SubmitStatus::Accepted);
    ASSERT_EQ(r.cancelled.size(), 1u);
    EXPECT_EQ(r.cancelled[0], resting.order_id);
    EXPECT_FALSE(manager.is_resting(resting.order_id));
    EXPECT_TRUE(manager.is_resting(passive.order_id));
    ASSERT_EQ(gateway.cancelled().size(), 1u);
    EXPECT_EQ(manager.cancels_sent(), 1u);
}

TEST_F(OrderManagerTest, SellCancelsBuysAtOrAbove) {
    auto high = buy(100.0, 1);
    auto low = buy(99.0, 1);
    auto r = sell(100.0, 2);
    ASSERT_EQ(r.cancelled.size(), 1u);
    EXPECT_EQ(r.cancelled[0], high.order_id);
    EXPECT_TRUE(manager.is_resting(low.order_id));
}

TEST_F(OrderManagerTest, CapCancelsOldestAndDefers) {
    for (int64_t step = 0; step < 10; ++step) {
        EXPECT_EQ(buy(99.0, step).status, SubmitStatus::Accepted);
    }
    EXPECT_EQ(manager.open_order_count(), 10u);

    auto r = buy(99.0, 10);
    EXPECT_EQ(r.status, SubmitStatus::Deferred);
    EXPECT_TRUE(r.order_id.empty());
    ASSERT_EQ(r.cancelled.size(), 3u);
    EXPECT_EQ(r.cancelled[0], "ORD_bot_0_0");
    EXPECT_EQ(r.cancelled[1], "ORD_bot_1_1");
    EXPECT_EQ(r.cancelled[2], "ORD_bot_2_2");
    EXPECT_EQ(manager.open_order_count(), 7u);
    EXPECT_EQ(gateway.sent().size(), 10u);

    EXPECT_EQ(buy(99.0, 11).status, SubmitStatus::Accepted);
}

// --- Staleness ---

TEST_F(OrderManagerTest, ExpiresOnlyOnCheckInterval) {
    auto r = buy(99.0, 0);
    EXPECT_TRUE(manager.expire_stale(53, Regime::Normal).empty());

    auto expired = manager.expire_stale(55, Regime::Normal);
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0], r.order_id);
    EXPECT_EQ(manager.open_order_count(), 0u);
}

TEST_F(OrderManagerTest, HftUsesShorterStaleLimit) {
    auto r = buy(99.0, 0);
    EXPECT_TRUE(manager.expire_stale(10, Regime::Hft).empty());
    EXPECT_TRUE(manager.expire_stale(15, Regime::Normal).empty());

    auto expired = manager.expire_stale(15, Regime::Hft);
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0], r.order_id);
}

// --- Fills ---

TEST_F(OrderManagerTest, KnownFillRemovesOrderAndRecordsLatency) {
    auto r = buy(99.9, 1);
    auto f = manager.on_fill(Fill{r.order_id, OrderSide::Buy, 99.9, 200}, 100.0);

    EXPECT_TRUE(f.known);
    ASSERT_TRUE(f.latency_ms.has_value());
    EXPECT_GE(*f.latency_ms, 0.0);
    EXPECT_FALSE(manager.is_resting(r.order_id));
    EXPECT_EQ(manager.position().inventory, 200);
    EXPECT_NEAR(manager.position().cash_flow, -19980.0, 1e-9);
    EXPECT_NEAR(manager.position().pnl, 20.0, 1e-9);
    EXPECT_EQ(manager.fill_latency().count, 1u);
    EXPECT_EQ(manager.fills_received(), 1u);
}

TEST_F(OrderManagerTest, UnknownFillStillMovesPosition) {
    auto f = manager.on_fill(Fill{"ORD_other_1_0", OrderSide::Sell, 100.1, 300}, 100.0);
    EXPECT_FALSE(f.known);
    EXPECT_FALSE(f.latency_ms.has_value());
    EXPECT_EQ(manager.position().inventory, -300);
    EXPECT_EQ(manager.fill_latency().count, 0u);
}

TEST_F(OrderManagerTest, CancelledOrderFillHasNoLatency) {
    auto r = buy(99.0, 0);
    manager.expire_stale(55, Regime::Normal);
    auto f = manager.on_fill(Fill{r.order_id, OrderSide::Buy, 99.0, 200}, 100.0);
    EXPECT_FALSE(f.known);
    EXPECT_FALSE(f.latency_ms.has_value());
    EXPECT_EQ(manager.position().inventory, 200);
}
