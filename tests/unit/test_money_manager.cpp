// ============================================================================
// QUORUM SCAN ENGINE - Money Manager Unit Tests
// ============================================================================

#include "quorum/risk/money_manager.hpp"

#include <gtest/gtest.h>

using namespace quorum;
using namespace quorum::risk;

namespace {

order::Position long_position(double entry, double atr, const MoneyManager& money) {
    const auto levels = money.levels(entry, Side::Buy, atr);
    order::Position p;
    p.symbol = Symbol("RELIANCE");
    p.side = Side::Buy;
    p.entry_price = entry;
    p.quantity = 10;
    p.stop_loss = levels.stop_loss;
    p.take_profit = levels.take_profit;
    p.trailing_peak = entry;
    return p;
}

PerformanceStats history(size_t trades, double win_rate, double avg_win, double avg_loss) {
    PerformanceStats stats;
    stats.total_trades = trades;
    stats.win_rate = win_rate;
    stats.avg_win = avg_win;
    stats.avg_loss = avg_loss;
    return stats;
}

}  // namespace

class MoneyManagerTest : public ::testing::Test {
protected:
    MoneyManager money;
};

// ============================================================================
// Sizing
// ============================================================================

TEST_F(MoneyManagerTest, AtrSizing) {
    // 2% of 100000 = 2000 at risk, stop distance 2 x 50 = 100
    const auto sizing = money.size_by_atr(100000.0, 50.0);
    EXPECT_EQ(sizing.quantity, 20);
    EXPECT_DOUBLE_EQ(sizing.risk_amount, 2000.0);
    EXPECT_DOUBLE_EQ(sizing.stop_distance, 100.0);
    EXPECT_EQ(sizing.method, SizingMethod::Atr);
    EXPECT_FALSE(sizing.suppressed());
}

TEST_F(MoneyManagerTest, AtrSizingCappedByCapital) {
    const auto sizing = money.size_by_atr(100000.0, 1.0, 500.0);
    EXPECT_EQ(sizing.quantity, 200);
}

TEST_F(MoneyManagerTest, SuppressedWhenBudgetBelowStopDistance) {
    const auto sizing = money.size_by_atr(1000.0, 50.0);
    EXPECT_TRUE(sizing.suppressed());
    EXPECT_FALSE(sizing.reason.empty());
}

TEST_F(MoneyManagerTest, SuppressedOnZeroAtr) {
    EXPECT_TRUE(money.size_by_atr(100000.0, 0.0).suppressed());
}

TEST_F(MoneyManagerTest, QuantityNonIncreasingInAtr) {
    int64_t previous = money.size_by_atr(100000.0, 1.0).quantity;
    for (double atr = 2.0; atr <= 200.0; atr += 7.0) {
        const int64_t qty = money.size_by_atr(100000.0, atr).quantity;
        EXPECT_LE(qty, previous);
        previous = qty;
    }
}

TEST_F(MoneyManagerTest, KellyFormula) {
    // (0.6 * 200 - 0.4 * 100) / 200
    EXPECT_DOUBLE_EQ(MoneyManager::kelly(history(20, 60.0, 200.0, 100.0)), 0.4);
    EXPECT_DOUBLE_EQ(MoneyManager::kelly(history(0, 0.0, 0.0, 0.0)), 0.0);
}

TEST_F(MoneyManagerTest, HalfKellySizing) {
    const auto sizing = money.size_by_kelly(100000.0, 1000.0, history(20, 60.0, 200.0, 100.0));
    EXPECT_EQ(sizing.quantity, 20);
    EXPECT_EQ(sizing.method, SizingMethod::Kelly);
}

TEST_F(MoneyManagerTest, KellyFractionCapped) {
    // Half-Kelly asks for 20% of capital, the cap allows 2%
    MoneyConfig config;
    config.kelly_max_fraction = 0.02;
    MoneyManager capped(config);

    const auto sizing = capped.size_by_kelly(100000.0, 1000.0, history(20, 60.0, 200.0, 100.0));
    EXPECT_EQ(sizing.quantity, 2);
    EXPECT_DOUBLE_EQ(sizing.risk_amount, 2000.0);
}

TEST_F(MoneyManagerTest, NegativeKellySuppresses) {
    const auto sizing = money.size_by_kelly(100000.0, 1000.0, history(20, 20.0, 100.0, 200.0));
    EXPECT_TRUE(sizing.suppressed());
}

TEST_F(MoneyManagerTest, SizePositionFallsBackToAtr) {
    MoneyConfig config;
    config.kelly_enabled = true;
    MoneyManager kelly_money(config);

    const auto young = kelly_money.size_position(100000.0, 1000.0, 50.0, history(5, 60.0, 200.0, 100.0));
    EXPECT_EQ(young.method, SizingMethod::Atr);

    const auto mature = kelly_money.size_position(100000.0, 1000.0, 50.0, history(10, 60.0, 200.0, 100.0));
    EXPECT_EQ(mature.method, SizingMethod::Kelly);

    const auto disabled = money.size_position(100000.0, 1000.0, 50.0, history(50, 60.0, 200.0, 100.0));
    EXPECT_EQ(disabled.method, SizingMethod::Atr);
}

// ============================================================================
// Levels & Exits
// ============================================================================

TEST_F(MoneyManagerTest, LongLevels) {
    const auto levels = money.levels(2450.50, Side::Buy, 25.0);
    EXPECT_DOUBLE_EQ(levels.stop_loss, 2400.50);
    EXPECT_DOUBLE_EQ(levels.take_profit, 2550.50);
}

TEST_F(MoneyManagerTest, ShortLevels) {
    const auto levels = money.levels(1000.0, Side::Sell, 10.0);
    EXPECT_DOUBLE_EQ(levels.stop_loss, 1020.0);
    EXPECT_DOUBLE_EQ(levels.take_profit, 960.0);
}

TEST_F(MoneyManagerTest, TrailingStopAfterRetrace) {
    auto position = long_position(2450.50, 25.0, money);

    EXPECT_FALSE(money.evaluate_exit(position, 2500.0).has_value());
    EXPECT_DOUBLE_EQ(position.trailing_peak, 2500.0);

    const auto exit = money.evaluate_exit(position, 2475.0);
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(*exit, order::ExitReason::TrailingStop);
}

TEST_F(MoneyManagerTest, TakeProfitAndStopLoss) {
    auto winner = long_position(2450.50, 25.0, money);
    EXPECT_EQ(money.evaluate_exit(winner, 2550.50), order::ExitReason::TakeProfit);

    auto loser = long_position(2450.50, 25.0, money);
    EXPECT_EQ(money.evaluate_exit(loser, 2400.00), order::ExitReason::StopLoss);
}

TEST_F(MoneyManagerTest, TrailingNotArmedWithoutProfit) {
    auto position = long_position(100.0, 1.0, money);
    EXPECT_FALSE(money.evaluate_exit(position, 99.5).has_value());
    EXPECT_DOUBLE_EQ(position.trailing_peak, 100.0);
}

TEST_F(MoneyManagerTest, ShortTrailingPeakMovesDown) {
    const auto levels = money.levels(1000.0, Side::Sell, 10.0);
    order::Position position;
    position.side = Side::Sell;
    position.entry_price = 1000.0;
    position.quantity = 5;
    position.stop_loss = levels.stop_loss;
    position.take_profit = levels.take_profit;
    position.trailing_peak = 1000.0;

    EXPECT_FALSE(money.evaluate_exit(position, 980.0).has_value());
    EXPECT_DOUBLE_EQ(position.trailing_peak, 980.0);
    EXPECT_FALSE(money.evaluate_exit(position, 985.0).has_value());
    EXPECT_DOUBLE_EQ(position.trailing_peak, 980.0);
    EXPECT_EQ(money.evaluate_exit(position, 990.0), order::ExitReason::TrailingStop);
}

// ============================================================================
// Daily Gate
// ============================================================================

class DailyGateTest : public MoneyManagerTest {
protected:
    void SetUp() override {
        money.roll_day(state, now(), 100000.0);
    }

    RiskState state;
    Symbol symbol{"TCS"};
};

TEST_F(DailyGateTest, ApprovedOnFreshDay) {
    EXPECT_TRUE(money.check_gate(state, symbol).approved());
}

TEST_F(DailyGateTest, RejectsAtDailyLossLimit) {
    money.record_close(state, -4999.0);
    EXPECT_TRUE(money.check_gate(state, symbol).approved());

    money.record_close(state, -1.0);
    const auto gate = money.check_gate(state, symbol);
    EXPECT_EQ(gate.decision, GateDecision::RejectedDailyLoss);
    EXPECT_FALSE(gate.reason.empty());
}

TEST_F(DailyGateTest, ProfitsOffsetLosses) {
    money.record_close(state, 3000.0);
    money.record_close(state, -5000.0);
    EXPECT_DOUBLE_EQ(state.daily_pnl, -2000.0);
    EXPECT_DOUBLE_EQ(state.daily_loss(), 2000.0);
    EXPECT_FALSE(state.loss_limit_hit);
    EXPECT_TRUE(money.check_gate(state, symbol).approved());
}

TEST_F(DailyGateTest, LossLimitHoldsForRestOfDay) {
    money.record_close(state, -5000.0);
    EXPECT_TRUE(state.loss_limit_hit);
    EXPECT_FALSE(money.check_gate(state, symbol).approved());

    // A later winner closing does not reopen entries
    money.record_close(state, 3000.0);
    EXPECT_DOUBLE_EQ(state.daily_loss(), 2000.0);
    EXPECT_EQ(money.check_gate(state, symbol).decision, GateDecision::RejectedDailyLoss);
}

TEST_F(DailyGateTest, ProfitableDayNeverHitsLossLimit) {
    money.record_close(state, 8000.0);
    money.record_close(state, -7000.0);
    EXPECT_DOUBLE_EQ(state.daily_loss(), 0.0);
    EXPECT_TRUE(money.check_gate(state, symbol).approved());
}

TEST_F(DailyGateTest, RejectsAtMaxTradesPerSymbol) {
    for (int i = 0; i < 50; ++i) money.record_open(state, symbol);
    EXPECT_EQ(money.check_gate(state, symbol).decision, GateDecision::RejectedMaxTrades);
    EXPECT_TRUE(money.check_gate(state, Symbol("INFY")).approved());
    EXPECT_EQ(state.total_trades(), 50);
}

TEST_F(DailyGateTest, RollDayResetsCounters) {
    money.record_open(state, symbol);
    money.record_close(state, -6000.0);
    money.roll_day(state, now(), 94000.0);

    EXPECT_EQ(state.trades_for(symbol), 0);
    EXPECT_DOUBLE_EQ(state.daily_pnl, 0.0);
    EXPECT_FALSE(state.loss_limit_hit);
    EXPECT_DOUBLE_EQ(state.day_start_capital, 94000.0);
    EXPECT_TRUE(money.check_gate(state, symbol).approved());
}
