#include <gtest/gtest.h>
#include "logging/step_logger.hpp"

#include <filesystem>
#include <fstream>

using namespace ramm;

namespace fs = std::filesystem;

class StepLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("ramm_step_logger_" + std::string(
                   ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
    }
    void TearDown() override { fs::remove_all(dir); }

    static MarketSnapshot deep_book() {
        std::vector<BookLevel> bids, asks;
        for (int i = 0; i < 12; ++i) {
            bids.push_back(BookLevel{99.9 - 0.1 * i, 100});
            asks.push_back(BookLevel{100.1 + 0.1 * i, 100});
        }
        return make_snapshot(17, 99.9, 100.1, bids, asks, 100.0);
    }

    StepLogIdentity identity{.scenario = "flash_crash", .experiment = "regime_adaptive",
                             .mode = "backtest", .run_id = "run-1"};
    fs::path dir;
};

TEST_F(StepLoggerTest, RecordCarriesIdentityAndMarket) {
    StepLogger logger(dir.string(), identity);
    auto snap = deep_book();
    StepRecord rec{.snapshot = &snap, .regime = Regime::Stressed};
    rec.position.inventory = 200;
    rec.position.pnl = 12.5;

    auto json = logger.to_json_record(rec, "2024-01-01T00:00:00.000");
    EXPECT_EQ(json.get_int("step"), 17);
    EXPECT_EQ(json.get_string("timestamp"), "2024-01-01T00:00:00.000");
    EXPECT_EQ(json.get_string("scenario"), "flash_crash");
    EXPECT_EQ(json.get_string("experiment"), "regime_adaptive");
    EXPECT_EQ(json.get_string("mode"), "backtest");
    EXPECT_EQ(json.get_string("run_id"), "run-1");
    EXPECT_EQ(json.get_string("regime"), "STRESSED");

    const JsonValue* market = json.get_object("market");
    ASSERT_NE(market, nullptr);
    EXPECT_DOUBLE_EQ(market->get_number("bid"), 99.9);
    EXPECT_NEAR(market->get_number("spread"), 0.2, 1e-9);

    const JsonValue* state = json.get_object("state");
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->get_int("inventory"), 200);
    EXPECT_DOUBLE_EQ(state->get_number("pnl"), 12.5);
}

TEST_F(StepLoggerTest, BookTruncatedToTenLevels) {
    StepLogger logger(dir.string(), identity);
    auto snap = deep_book();
    StepRecord rec{.snapshot = &snap};

    auto json = logger.to_json_record(rec, "t");
    const JsonValue* book = json.get_object("book");
    ASSERT_NE(book, nullptr);
    ASSERT_NE(book->get_array("bids"), nullptr);
    EXPECT_EQ(book->get_array("bids")->arr.size(), StepLogger::kMaxBookLevels);
    EXPECT_EQ(book->get_array("asks")->arr.size(), StepLogger::kMaxBookLevels);
    EXPECT_EQ(book->get_int("bid_depth"), 1200);
}

TEST_F(StepLoggerTest, NullActionAndFillWhenIdle) {
    StepLogger logger(dir.string(), identity);
    auto snap = deep_book();
    StepRecord rec{.snapshot = &snap};

    auto json = logger.to_json_record(rec, "t");
    ASSERT_NE(json.find("action"), nullptr);
    EXPECT_TRUE(json.find("action")->is_null());
    EXPECT_TRUE(json.find("fill")->is_null());
    ASSERT_NE(json.get_array("fills"), nullptr);
    EXPECT_TRUE(json.get_array("fills")->arr.empty());
}

TEST_F(StepLoggerTest, ActionAndFillsRecorded) {
    StepLogger logger(dir.string(), identity);
    auto snap = deep_book();
    StepRecord rec{.snapshot = &snap, .regime = Regime::Normal};
    rec.action = OrderRecord{.id = "ORD_bot_17_4", .side = OrderSide::Sell, .price = 100.1, .qty = 200};
    rec.fills.push_back(LoggedFill{Fill{"ORD_bot_15_3", OrderSide::Buy, 99.9, 200}, 1.5});
    rec.fills.push_back(LoggedFill{Fill{"ORD_x_1_0", OrderSide::Sell, 100.0, 100}, std::nullopt});

    auto json = logger.to_json_record(rec, "t");
    const JsonValue* action = json.get_object("action");
    ASSERT_NE(action, nullptr);
    EXPECT_EQ(action->get_string("order_id"), "ORD_bot_17_4");
    EXPECT_EQ(action->get_string("side"), "SELL");
    EXPECT_EQ(action->get_int("qty"), 200);

    const JsonValue* fills = json.get_array("fills");
    ASSERT_NE(fills, nullptr);
    ASSERT_EQ(fills->arr.size(), 2u);
    EXPECT_DOUBLE_EQ(fills->arr[0].get_number("latency_ms"), 1.5);
    EXPECT_TRUE(fills->arr[1].find("latency_ms")->is_null());

    const JsonValue* last = json.get_object("fill");
    ASSERT_NE(last, nullptr);
    EXPECT_EQ(last->get_string("order_id"), "ORD_x_1_0");
}

TEST_F(StepLoggerTest, WritesOneLinePerStep) {
    std::string path;
    {
        StepLogger logger(dir.string(), identity);
        path = logger.path();
        EXPECT_EQ(fs::path(path).parent_path().string(), dir.string());
        EXPECT_EQ(fs::path(path).filename().string().rfind("flash_crash_regime_adaptive_backtest_", 0), 0u);
        EXPECT_EQ(fs::path(path).extension().string(), ".jsonl");

        auto snap = deep_book();
        logger.log_step(StepRecord{.snapshot = &snap});
        logger.set_run_id("run-2");
        logger.log_step(StepRecord{.snapshot = &snap});
        EXPECT_EQ(logger.lines_written(), 2u);
    }

    std::ifstream in(path);
    std::string line;
    std::vector<JsonValue> lines;
    while (std::getline(in, line)) lines.push_back(parse_json(line));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].get_string("run_id"), "run-1");
    EXPECT_EQ(lines[1].get_string("run_id"), "run-2");
}
