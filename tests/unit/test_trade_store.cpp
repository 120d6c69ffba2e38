// ============================================================================
// QUORUM SCAN ENGINE - Trade Store Unit Tests
// ============================================================================

#include "quorum/core/error.hpp"
#include "quorum/storage/trade_store.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace quorum;
using namespace quorum::storage;

namespace {

order::Trade make_trade(uint64_t id, const char* symbol, double price) {
    order::Trade trade;
    trade.id = id;
    trade.symbol = Symbol(symbol);
    trade.side = Side::Buy;
    trade.quantity = 10;
    trade.price = price;
    trade.status = order::TradeStatus::Executed;
    trade.timestamp = from_epoch_ms(quorum::test::BASE_EPOCH_MS);
    trade.strategy_id = "default-ma_crossover";
    return trade;
}

order::Position make_position(const char* symbol, uint64_t trade_id) {
    order::Position position;
    position.symbol = Symbol(symbol);
    position.side = Side::Sell;
    position.entry_price = 1500.25;
    position.quantity = 7;
    position.stop_loss = 1520.25;
    position.take_profit = 1460.25;
    position.trailing_peak = 1490.0;
    position.opened_at = from_epoch_ms(quorum::test::BASE_EPOCH_MS);
    position.strategy_id = "default-rsi";
    position.trade_id = trade_id;
    return position;
}

}  // namespace

// ============================================================================
// In-Memory Store
// ============================================================================

TEST(InMemoryTradeStoreTest, UpsertsById) {
    InMemoryTradeStore store;
    store.record_trade(make_trade(2, "TCS", 3500.0));
    store.record_trade(make_trade(1, "INFY", 1500.0));

    auto updated = make_trade(2, "TCS", 3500.0);
    updated.pnl = 120.0;
    store.record_trade(updated);

    const auto trades = store.list_trades();
    ASSERT_EQ(trades.size(), 2);
    EXPECT_EQ(trades[0].id, 1);
    EXPECT_EQ(trades[1].id, 2);
    EXPECT_DOUBLE_EQ(trades[1].pnl.value_or(0.0), 120.0);
}

TEST(InMemoryTradeStoreTest, OnePositionPerSymbol) {
    InMemoryTradeStore store;
    store.save_position(make_position("SBIN", 1));
    store.save_position(make_position("SBIN", 2));
    ASSERT_EQ(store.list_open_positions().size(), 1);
    EXPECT_EQ(store.list_open_positions()[0].trade_id, 2);

    store.remove_position(Symbol("SBIN"));
    EXPECT_TRUE(store.list_open_positions().empty());
}

// ============================================================================
// Journal Store
// ============================================================================

class JournalTradeStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = std::filesystem::temp_directory_path() /
                (std::string("quorum_journal_") + info->name() + ".journal");
        std::filesystem::remove(path_);
    }

    void TearDown() override { std::filesystem::remove(path_); }

    std::filesystem::path path_;
};

TEST_F(JournalTradeStoreTest, StartsEmpty) {
    JournalTradeStore store(path_.string());
    EXPECT_TRUE(store.list_trades().empty());
    EXPECT_TRUE(store.list_open_positions().empty());
}

TEST_F(JournalTradeStoreTest, ReplaysOnReopen) {
    {
        JournalTradeStore store(path_.string());
        store.record_trade(make_trade(1, "RELIANCE", 2450.5));
        store.save_position(make_position("RELIANCE", 1));
    }

    JournalTradeStore reopened(path_.string());
    const auto trades = reopened.list_trades();
    ASSERT_EQ(trades.size(), 1);
    EXPECT_EQ(trades[0].symbol, Symbol("RELIANCE"));
    EXPECT_DOUBLE_EQ(trades[0].price, 2450.5);
    EXPECT_EQ(trades[0].status, order::TradeStatus::Executed);
    EXPECT_FALSE(trades[0].pnl.has_value());

    const auto positions = reopened.list_open_positions();
    ASSERT_EQ(positions.size(), 1);
    EXPECT_EQ(positions[0].side, Side::Sell);
    EXPECT_DOUBLE_EQ(positions[0].entry_price, 1500.25);
    EXPECT_DOUBLE_EQ(positions[0].trailing_peak, 1490.0);
    EXPECT_EQ(positions[0].quantity, 7);
    EXPECT_EQ(positions[0].trade_id, 1);
    EXPECT_EQ(to_epoch_ms(positions[0].opened_at), quorum::test::BASE_EPOCH_MS);
}

TEST_F(JournalTradeStoreTest, LaterRecordsSupersede) {
    {
        JournalTradeStore store(path_.string());
        store.record_trade(make_trade(1, "TCS", 3500.0));
        store.save_position(make_position("TCS", 1));

        auto closed = make_trade(1, "TCS", 3500.0);
        closed.pnl = -42.5;
        closed.exit_price = 3495.75;
        closed.exit_timestamp = from_epoch_ms(quorum::test::BASE_EPOCH_MS + 60000);
        closed.exit_reason = "STOP_LOSS";
        store.record_trade(closed);
        store.remove_position(Symbol("TCS"));
    }

    JournalTradeStore reopened(path_.string());
    EXPECT_TRUE(reopened.list_open_positions().empty());
    const auto trades = reopened.list_trades();
    ASSERT_EQ(trades.size(), 1);
    EXPECT_DOUBLE_EQ(trades[0].pnl.value_or(0.0), -42.5);
    EXPECT_DOUBLE_EQ(trades[0].exit_price.value_or(0.0), 3495.75);
    EXPECT_EQ(trades[0].exit_reason, "STOP_LOSS");
    ASSERT_TRUE(trades[0].exit_timestamp.has_value());
    EXPECT_EQ(to_epoch_ms(*trades[0].exit_timestamp), quorum::test::BASE_EPOCH_MS + 60000);
}

TEST_F(JournalTradeStoreTest, FreeTextRoundTrips) {
    auto trade = make_trade(3, "ITC", 450.0);
    trade.strategy_id = "a|b%c\nd \"quoted\"";
    trade.status = order::TradeStatus::Failed;
    trade.exit_reason = "venue said: 50% | retry";
    {
        JournalTradeStore store(path_.string());
        store.record_trade(trade);
    }

    JournalTradeStore reopened(path_.string());
    const auto trades = reopened.list_trades();
    ASSERT_EQ(trades.size(), 1);
    EXPECT_EQ(trades[0].strategy_id, "a|b%c\nd \"quoted\"");
    EXPECT_EQ(trades[0].exit_reason, "venue said: 50% | retry");
    EXPECT_EQ(trades[0].status, order::TradeStatus::Failed);
}

TEST_F(JournalTradeStoreTest, OneJsonRecordPerLine) {
    {
        JournalTradeStore store(path_.string());
        store.record_trade(make_trade(1, "TCS", 3500.0));
        store.save_position(make_position("TCS", 1));
        store.remove_position(Symbol("TCS"));
    }

    std::ifstream in(path_);
    std::vector<std::string> types;
    std::string line;
    while (std::getline(in, line)) {
        types.push_back(nlohmann::json::parse(line).at("type").get<std::string>());
    }
    EXPECT_EQ(types, (std::vector<std::string>{"trade", "position", "position_closed"}));
}

TEST_F(JournalTradeStoreTest, CorruptLineFailsOpen) {
    {
        std::ofstream out(path_);
        out << R"({"type":"trade","id":1,"symbol":"TCS","side":"BUY","quantity":10,)"
            << R"("price":3500,"status":"EXECUTED","ts_ms":0,"strategy":"sma"})" << "\n";
        out << "{not json\n";
    }
    EXPECT_THROW({ JournalTradeStore store(path_.string()); }, PersistenceFailure);
}

TEST_F(JournalTradeStoreTest, UnknownRecordTypeFailsOpen) {
    {
        std::ofstream out(path_);
        out << R"({"type":"order","symbol":"TCS"})" << "\n";
    }
    EXPECT_THROW({ JournalTradeStore store(path_.string()); }, PersistenceFailure);
}

TEST_F(JournalTradeStoreTest, UnknownSideFailsOpen) {
    {
        std::ofstream out(path_);
        out << R"({"type":"position","symbol":"TCS","side":"LONG","entry":1,"quantity":1,)"
            << R"("stop":1,"target":1,"peak":1,"opened_ms":0,"strategy":"sma","trade_id":1})" << "\n";
    }
    EXPECT_THROW({ JournalTradeStore store(path_.string()); }, PersistenceFailure);
}

TEST_F(JournalTradeStoreTest, MissingFieldFailsOpen) {
    {
        std::ofstream out(path_);
        out << R"({"type":"trade","id":1,"symbol":"TCS","side":"BUY"})" << "\n";
    }
    EXPECT_THROW({ JournalTradeStore store(path_.string()); }, PersistenceFailure);
}

TEST(TradeCodecTest, OpenTradeOmitsExitFields) {
    const auto record = encode_trade(make_trade(1, "TCS", 3500.5));
    EXPECT_EQ(record.at("type"), "trade");
    EXPECT_EQ(record.at("id"), 1);
    EXPECT_EQ(record.at("symbol"), "TCS");
    EXPECT_EQ(record.at("side"), "BUY");
    EXPECT_EQ(record.at("status"), "EXECUTED");
    EXPECT_DOUBLE_EQ(record.at("price").get<double>(), 3500.5);
    EXPECT_EQ(record.at("ts_ms").get<int64_t>(), quorum::test::BASE_EPOCH_MS);
    EXPECT_FALSE(record.contains("pnl"));
    EXPECT_FALSE(record.contains("exit_price"));
    EXPECT_FALSE(record.contains("exit_ms"));
}

TEST(TradeCodecTest, PositionRecordDecodes) {
    const auto position = make_position("SBIN", 9);
    const auto record = encode_position(position);
    EXPECT_EQ(record.at("type"), "position");
    EXPECT_EQ(record.at("side"), "SELL");

    const auto decoded = decode_position(record);
    EXPECT_EQ(decoded.symbol, Symbol("SBIN"));
    EXPECT_DOUBLE_EQ(decoded.stop_loss, 1520.25);
    EXPECT_DOUBLE_EQ(decoded.take_profit, 1460.25);
    EXPECT_EQ(decoded.trade_id, 9);
}
