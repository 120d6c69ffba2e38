// ============================================================================
// QUORUM SCAN ENGINE - Position Ledger Unit Tests
// ============================================================================

#include "quorum/core/error.hpp"
#include "quorum/order/order_router.hpp"
#include "quorum/order/position_ledger.hpp"
#include "quorum/storage/trade_store.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <string>

using namespace quorum;
using namespace quorum::order;

namespace {

/// In-memory store whose writes can be switched to fail
class FlakyTradeStore : public storage::InMemoryTradeStore {
public:
    bool failing = false;

    void record_trade(const Trade& trade) override {
        check();
        InMemoryTradeStore::record_trade(trade);
    }
    void save_position(const Position& position) override {
        check();
        InMemoryTradeStore::save_position(position);
    }
    void remove_position(const Symbol& symbol) override {
        check();
        InMemoryTradeStore::remove_position(symbol);
    }

private:
    void check() const {
        if (failing) throw PersistenceFailure("store offline");
    }
};

OpenRequest request(const char* symbol, Side side, double price, int64_t qty = 10) {
    OpenRequest r;
    r.symbol = Symbol(symbol);
    r.side = side;
    r.price = price;
    r.quantity = qty;
    r.stop_loss = side == Side::Buy ? price - 20.0 : price + 20.0;
    r.take_profit = side == Side::Buy ? price + 40.0 : price - 40.0;
    r.strategy_id = "default-macd";
    r.at = from_epoch_ms(quorum::test::BASE_EPOCH_MS);
    return r;
}

ExecutionReport fill(const Trade& trade) {
    return ExecutionReport{true, trade.price, "TEST-1", ""};
}

ExecutionReport reject(const Trade&) {
    return ExecutionReport{false, 0.0, "", "venue closed"};
}

}  // namespace

class PositionLedgerTest : public ::testing::Test {
protected:
    FlakyTradeStore store;
    PositionLedger ledger{store};
    Timestamp later = from_epoch_ms(quorum::test::BASE_EPOCH_MS + 300000);
};

TEST_F(PositionLedgerTest, OpenCreatesExecutedTradeAndPosition) {
    const auto result = ledger.open_position(request("TCS", Side::Buy, 3500.0), fill);

    ASSERT_TRUE(result.opened());
    EXPECT_EQ(result.trade.status, TradeStatus::Executed);
    EXPECT_EQ(result.trade.id, 1);
    EXPECT_DOUBLE_EQ(result.position->trailing_peak, 3500.0);
    EXPECT_EQ(result.position->trade_id, result.trade.id);

    EXPECT_TRUE(ledger.has_position(Symbol("TCS")));
    EXPECT_EQ(ledger.open_count(), 1);
    EXPECT_EQ(store.list_trades().size(), 1);
    EXPECT_EQ(store.list_open_positions().size(), 1);
}

TEST_F(PositionLedgerTest, ExecutorSeesPendingTrade) {
    TradeStatus seen = TradeStatus::Executed;
    (void)ledger.open_position(request("TCS", Side::Buy, 3500.0), [&](const Trade& t) {
        seen = t.status;
        return fill(t);
    });
    EXPECT_EQ(seen, TradeStatus::Pending);
}

TEST_F(PositionLedgerTest, FillPriceBecomesEntry) {
    const auto result = ledger.open_position(request("TCS", Side::Buy, 3500.0), [](const Trade&) {
        return ExecutionReport{true, 3501.5, "TEST-2", ""};
    });
    EXPECT_DOUBLE_EQ(result.position->entry_price, 3501.5);
    EXPECT_DOUBLE_EQ(result.trade.price, 3501.5);
}

TEST_F(PositionLedgerTest, SecondOpenThrowsAlreadyOpen) {
    (void)ledger.open_position(request("TCS", Side::Buy, 3500.0), fill);
    EXPECT_THROW((void)ledger.open_position(request("TCS", Side::Sell, 3510.0), fill), AlreadyOpen);
    EXPECT_EQ(ledger.trades().size(), 1);
}

TEST_F(PositionLedgerTest, RejectedOrderLeavesFailedTrade) {
    const auto result = ledger.open_position(request("INFY", Side::Buy, 1500.0), reject);

    EXPECT_FALSE(result.opened());
    EXPECT_EQ(result.trade.status, TradeStatus::Failed);
    EXPECT_EQ(result.trade.exit_reason, "venue closed");
    EXPECT_FALSE(ledger.has_position(Symbol("INFY")));

    const auto stored = store.list_trades();
    ASSERT_EQ(stored.size(), 1);
    EXPECT_EQ(stored[0].status, TradeStatus::Failed);
}

TEST_F(PositionLedgerTest, ThrowingExecutorIsAFailedOrder) {
    const auto result = ledger.open_position(request("INFY", Side::Buy, 1500.0),
                                             [](const Trade&) -> ExecutionReport {
        throw std::runtime_error("connection reset");
    });
    EXPECT_FALSE(result.opened());
    EXPECT_EQ(result.trade.status, TradeStatus::Failed);
    EXPECT_EQ(result.trade.exit_reason, "connection reset");
}

TEST_F(PositionLedgerTest, CloseWithoutPositionThrows) {
    EXPECT_THROW((void)ledger.close_position(Symbol("SBIN"), 600.0, ExitReason::Manual, later),
                 NoOpenPosition);
}

TEST_F(PositionLedgerTest, CloseLongRealizesPnl) {
    (void)ledger.open_position(request("TCS", Side::Buy, 100.0), fill);
    const auto closed = ledger.close_position(Symbol("TCS"), 110.0, ExitReason::TakeProfit, later);

    EXPECT_DOUBLE_EQ(closed.pnl.value_or(0.0), 100.0);
    EXPECT_DOUBLE_EQ(closed.exit_price.value_or(0.0), 110.0);
    EXPECT_EQ(closed.exit_reason, "TAKE_PROFIT");
    EXPECT_FALSE(ledger.has_position(Symbol("TCS")));
    EXPECT_TRUE(store.list_open_positions().empty());
    EXPECT_DOUBLE_EQ(store.list_trades()[0].pnl.value_or(0.0), 100.0);
}

TEST_F(PositionLedgerTest, CloseShortRealizesPnl) {
    (void)ledger.open_position(request("TCS", Side::Sell, 100.0), fill);
    const auto closed = ledger.close_position(Symbol("TCS"), 110.0, ExitReason::StopLoss, later);
    EXPECT_DOUBLE_EQ(closed.pnl.value_or(0.0), -100.0);
}

TEST_F(PositionLedgerTest, RealizedPnlInCloseOrder) {
    (void)ledger.open_position(request("A", Side::Buy, 100.0), fill);
    (void)ledger.open_position(request("B", Side::Buy, 100.0), fill);
    (void)ledger.close_position(Symbol("B"), 95.0, ExitReason::StopLoss, later);
    (void)ledger.close_position(Symbol("A"), 120.0, ExitReason::TakeProfit, later);

    const auto pnl = ledger.realized_pnl();
    ASSERT_EQ(pnl.size(), 2);
    EXPECT_DOUBLE_EQ(pnl[0], -50.0);
    EXPECT_DOUBLE_EQ(pnl[1], 200.0);
}

TEST_F(PositionLedgerTest, TrailingPeakOnlyImproves) {
    (void)ledger.open_position(request("TCS", Side::Buy, 100.0), fill);
    EXPECT_TRUE(ledger.update_trailing_peak(Symbol("TCS"), 105.0));
    EXPECT_FALSE(ledger.update_trailing_peak(Symbol("TCS"), 103.0));
    EXPECT_DOUBLE_EQ(ledger.get_position(Symbol("TCS"))->trailing_peak, 105.0);
    EXPECT_DOUBLE_EQ(store.list_open_positions()[0].trailing_peak, 105.0);
    EXPECT_FALSE(ledger.update_trailing_peak(Symbol("NONE"), 1.0));
}

TEST_F(PositionLedgerTest, OpenPositionsSortedBySymbol) {
    (void)ledger.open_position(request("TCS", Side::Buy, 100.0), fill);
    (void)ledger.open_position(request("INFY", Side::Buy, 100.0), fill);
    const auto positions = ledger.open_positions();
    ASSERT_EQ(positions.size(), 2);
    EXPECT_EQ(positions[0].symbol, Symbol("INFY"));
    EXPECT_EQ(positions[1].symbol, Symbol("TCS"));
}

TEST_F(PositionLedgerTest, FailedWritesAreQueuedAndReplayed) {
    store.failing = true;
    const auto result = ledger.open_position(request("TCS", Side::Buy, 100.0), fill);

    // Memory stays authoritative while the store is down
    EXPECT_TRUE(result.opened());
    EXPECT_TRUE(ledger.has_position(Symbol("TCS")));
    EXPECT_EQ(ledger.pending_writes(), 2);
    EXPECT_EQ(ledger.retry_pending_writes(), 2);

    store.failing = false;
    EXPECT_EQ(ledger.retry_pending_writes(), 0);
    EXPECT_EQ(store.list_trades().size(), 1);
    EXPECT_EQ(store.list_open_positions().size(), 1);
}

TEST_F(PositionLedgerTest, QueuedWritesCollapsePerRecord) {
    store.failing = true;
    (void)ledger.open_position(request("TCS", Side::Buy, 100.0), fill);
    (void)ledger.close_position(Symbol("TCS"), 101.0, ExitReason::Manual, later);
    // Closed trade replaces the open record, removal replaces the position save
    EXPECT_EQ(ledger.pending_writes(), 2);

    store.failing = false;
    EXPECT_EQ(ledger.retry_pending_writes(), 0);
    EXPECT_TRUE(store.list_open_positions().empty());
    ASSERT_EQ(store.list_trades().size(), 1);
    EXPECT_TRUE(store.list_trades()[0].is_closed());
}

TEST_F(PositionLedgerTest, TrailingUpdatesWhileOfflineKeepOneWrite) {
    store.failing = true;
    (void)ledger.open_position(request("TCS", Side::Buy, 100.0), fill);
    for (int i = 1; i <= 100; ++i) {
        EXPECT_TRUE(ledger.update_trailing_peak(Symbol("TCS"), 100.0 + i));
    }
    EXPECT_EQ(ledger.pending_writes(), 2);

    store.failing = false;
    EXPECT_EQ(ledger.retry_pending_writes(), 0);
    const auto stored = store.list_open_positions();
    ASSERT_EQ(stored.size(), 1);
    EXPECT_DOUBLE_EQ(stored[0].trailing_peak, 200.0);
}

TEST_F(PositionLedgerTest, PermanentlyFailingStoreStaysBounded) {
    store.failing = true;
    PositionLedger bounded(store, 4);

    const std::string names[] = {"A0", "A1", "A2", "A3", "A4", "A5", "A6", "A7", "A8", "A9"};
    for (const auto& name : names) {
        (void)bounded.open_position(request(name.c_str(), Side::Buy, 100.0), fill);
        (void)bounded.close_position(Symbol(name), 105.0, ExitReason::TakeProfit, later);
    }

    // Two records per symbol, only the newest four survive
    EXPECT_EQ(bounded.pending_writes(), 4);
    EXPECT_EQ(bounded.dropped_writes(), 16);
    EXPECT_EQ(bounded.retry_pending_writes(), 4);

    // Memory stays authoritative
    EXPECT_EQ(bounded.trades().size(), 10);
    EXPECT_EQ(bounded.realized_pnl().size(), 10);
    EXPECT_EQ(bounded.open_count(), 0);

    store.failing = false;
    EXPECT_EQ(bounded.retry_pending_writes(), 0);
    EXPECT_EQ(store.list_trades().size(), 2);
}

TEST(PositionLedgerHydrationTest, RestoresFromStore) {
    storage::InMemoryTradeStore store;

    Trade closed;
    closed.id = 4;
    closed.symbol = Symbol("SBIN");
    closed.status = TradeStatus::Executed;
    closed.pnl = 25.0;
    closed.exit_timestamp = from_epoch_ms(quorum::test::BASE_EPOCH_MS);
    store.record_trade(closed);

    Trade open;
    open.id = 7;
    open.symbol = Symbol("ITC");
    open.status = TradeStatus::Executed;
    open.price = 450.0;
    open.quantity = 3;
    store.record_trade(open);

    Position position;
    position.symbol = Symbol("ITC");
    position.entry_price = 450.0;
    position.quantity = 3;
    position.trailing_peak = 450.0;
    position.trade_id = 7;
    store.save_position(position);

    PositionLedger ledger(store);
    EXPECT_TRUE(ledger.has_position(Symbol("ITC")));
    ASSERT_EQ(ledger.realized_pnl().size(), 1);
    EXPECT_DOUBLE_EQ(ledger.realized_pnl()[0], 25.0);

    const auto result = ledger.open_position(request("TCS", Side::Buy, 100.0), fill);
    EXPECT_EQ(result.trade.id, 8);

    const auto exited = ledger.close_position(Symbol("ITC"), 460.0, ExitReason::Manual,
                                              now());
    EXPECT_EQ(exited.id, 7);
    EXPECT_DOUBLE_EQ(exited.pnl.value_or(0.0), 30.0);
}

// ============================================================================
// Paper Router
// ============================================================================

TEST(PaperOrderRouterTest, FillsAtReferencePrice) {
    PaperOrderRouter router;
    const auto report = router.submit(Symbol("TCS"), Side::Buy, 5, 3500.0);
    EXPECT_TRUE(report.filled);
    EXPECT_DOUBLE_EQ(report.fill_price, 3500.0);
    EXPECT_EQ(report.order_id.rfind("PAPER-", 0), 0);
    EXPECT_EQ(router.orders_filled(), 1);
}

TEST(PaperOrderRouterTest, RejectsInvalidOrders) {
    PaperOrderRouter router;
    EXPECT_FALSE(router.submit(Symbol("TCS"), Side::Buy, 0, 3500.0).filled);
    EXPECT_FALSE(router.submit(Symbol("TCS"), Side::Sell, 5, 0.0).filled);
    EXPECT_FALSE(router.submit(Symbol("TCS"), Side::Sell, 5, std::nan("")).filled);
    EXPECT_EQ(router.orders_filled(), 0);
}

TEST(PaperOrderRouterTest, OrderIdsAreUnique) {
    PaperOrderRouter router;
    const auto a = router.submit(Symbol("TCS"), Side::Buy, 1, 10.0);
    const auto b = router.submit(Symbol("TCS"), Side::Buy, 1, 10.0);
    EXPECT_NE(a.order_id, b.order_id);
}
