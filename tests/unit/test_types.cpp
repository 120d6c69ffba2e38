// ============================================================================
// QUORUM SCAN ENGINE - Core Types Unit Tests
// ============================================================================

#include "quorum/core/error.hpp"
#include "quorum/core/types.hpp"

#include <gtest/gtest.h>
#include <unordered_set>

using namespace quorum;

// ============================================================================
// Symbol Tests
// ============================================================================

TEST(SymbolTest, DefaultIsEmpty) {
    Symbol s;
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.size(), 0);
    EXPECT_EQ(s.view(), "");
}

TEST(SymbolTest, StoresText) {
    Symbol s("RELIANCE");
    EXPECT_EQ(s.view(), "RELIANCE");
    EXPECT_EQ(s.str(), "RELIANCE");
    EXPECT_STREQ(s.c_str(), "RELIANCE");
    EXPECT_EQ(s.size(), 8);
}

TEST(SymbolTest, TruncatesLongNames) {
    Symbol s("ABCDEFGHIJKLMNOPQRSTUVWXYZ");
    EXPECT_EQ(s.size(), Symbol::MAX_LENGTH);
    EXPECT_EQ(s.view(), "ABCDEFGHIJKLMNO");
}

TEST(SymbolTest, EqualityAndOrdering) {
    EXPECT_EQ(Symbol("TCS"), Symbol("TCS"));
    EXPECT_NE(Symbol("TCS"), Symbol("INFY"));
    EXPECT_LT(Symbol("INFY"), Symbol("TCS"));
}

TEST(SymbolTest, Hashable) {
    std::unordered_set<Symbol> set;
    set.insert(Symbol("SBIN"));
    set.insert(Symbol("SBIN"));
    set.insert(Symbol("ITC"));
    EXPECT_EQ(set.size(), 2);
}

// ============================================================================
// Side / Vote Tests
// ============================================================================

TEST(SideTest, DirectionAndOpposite) {
    EXPECT_DOUBLE_EQ(direction(Side::Buy), 1.0);
    EXPECT_DOUBLE_EQ(direction(Side::Sell), -1.0);
    EXPECT_EQ(opposite(Side::Buy), Side::Sell);
    EXPECT_EQ(opposite(Side::Sell), Side::Buy);
    EXPECT_EQ(to_string(Side::Buy), "BUY");
}

TEST(VoteTest, IntegerValues) {
    EXPECT_EQ(to_int(Vote::Buy), 1);
    EXPECT_EQ(to_int(Vote::Hold), 0);
    EXPECT_EQ(to_int(Vote::Sell), -1);
    EXPECT_EQ(to_string(Vote::Hold), "HOLD");
}

TEST(VoteTest, SideOfDecision) {
    EXPECT_EQ(side_of(Vote::Buy), Side::Buy);
    EXPECT_EQ(side_of(Vote::Sell), Side::Sell);
}

TEST(EngineModeTest, Names) {
    EXPECT_EQ(to_string(EngineMode::Live), "LIVE");
    EXPECT_EQ(to_string(EngineMode::Simulation), "SIMULATION");
}

// ============================================================================
// Candle / Time Tests
// ============================================================================

TEST(CandleTest, DerivedPrices) {
    Candle c;
    c.high = 110.0;
    c.low = 90.0;
    c.close = 100.0;
    EXPECT_DOUBLE_EQ(c.typical_price(), 100.0);
    EXPECT_DOUBLE_EQ(c.median_price(), 100.0);
}

TEST(TimeTest, EpochConversions) {
    const auto ts = from_epoch_ms(1700000000123);
    EXPECT_EQ(to_epoch_ms(ts), 1700000000123);
    EXPECT_EQ(to_epoch_ms(from_epoch_seconds(1700000000)), 1700000000000);
}

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, CarriesCode) {
    try {
        throw AlreadyOpen("RELIANCE already open");
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AlreadyOpen);
        EXPECT_STREQ(e.what(), "RELIANCE already open");
    }
    EXPECT_EQ(to_string(ErrorCode::RiskLimitExceeded), "RiskLimitExceeded");
}
