// ============================================================================
// QUORUM SCAN ENGINE - Strategy Voter Unit Tests
// ============================================================================

#include "quorum/strategy/voters.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace quorum;
using namespace quorum::strategy;
using quorum::test::candles_from_closes;
using quorum::test::trend;

// ============================================================================
// Kinds and Names
// ============================================================================

TEST(VoterKindTest, KeysRoundTrip) {
    for (VoterKind kind : ALL_VOTER_KINDS) {
        const auto parsed = parse_voter_kind(to_string(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(parse_voter_kind("ichimoku").has_value());
}

TEST(VoterKindTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parse_voter_kind("MACD"), VoterKind::Macd);
}

TEST(VoterKindTest, KindFromStrategyName) {
    EXPECT_EQ(voter_kind_from_name("Moving Average Crossover"), VoterKind::SmaCross);
    EXPECT_EQ(voter_kind_from_name("EMA Crossover 9/21"), VoterKind::EmaCross);
    EXPECT_EQ(voter_kind_from_name("RSI Reversal"), VoterKind::Rsi);
    EXPECT_EQ(voter_kind_from_name("MACD momentum"), VoterKind::Macd);
    EXPECT_EQ(voter_kind_from_name("Bollinger squeeze"), VoterKind::Bollinger);
    EXPECT_EQ(voter_kind_from_name("SuperTrend"), VoterKind::SuperTrend);
    EXPECT_EQ(voter_kind_from_name("VWAP breakout"), VoterKind::Vwap);
    EXPECT_FALSE(voter_kind_from_name("Mean reversion").has_value());
}

TEST(VoterKindTest, StochasticTakesPrecedenceOverRsi) {
    EXPECT_EQ(voter_kind_from_name("Stochastic RSI"), VoterKind::StochRsi);
}

TEST(VoterKindTest, DefaultWeights) {
    EXPECT_DOUBLE_EQ(default_weight(VoterKind::SuperTrend), 1.2);
    EXPECT_DOUBLE_EQ(default_weight(VoterKind::Bollinger), 0.7);
    EXPECT_DOUBLE_EQ(default_weight(VoterKind::SmaCross), 1.0);
}

// ============================================================================
// Parameters
// ============================================================================

TEST(VoterParamsTest, OverridesApplied) {
    const auto params = make_params(VoterKind::SmaCross, {{"shortWindow", 5}, {"longWindow", 15}});
    const auto& sma = std::get<SmaCrossParams>(params);
    EXPECT_EQ(sma.short_window, 5);
    EXPECT_EQ(sma.long_window, 15);
}

TEST(VoterParamsTest, UnknownKeysIgnored) {
    const auto params = make_params(VoterKind::Rsi, {{"colour", 3}});
    EXPECT_EQ(std::get<RsiParams>(params).period, 14);
}

TEST(VoterParamsTest, InvertedWindowsRejected) {
    EXPECT_THROW((void)make_params(VoterKind::SmaCross, {{"shortWindow", 50}, {"longWindow", 20}}),
                 std::invalid_argument);
    EXPECT_THROW((void)make_params(VoterKind::Macd, {{"fast", 30}}), std::invalid_argument);
    EXPECT_THROW((void)make_params(VoterKind::Rsi, {{"rsiPeriod", 0}}), std::invalid_argument);
}

TEST(VoterParamsTest, KindOfMatchesVariant) {
    for (VoterKind kind : ALL_VOTER_KINDS) {
        EXPECT_EQ(kind_of(default_params(kind)), kind);
    }
}

// ============================================================================
// Votes
// ============================================================================

TEST(VoterTest, ShortWindowHolds) {
    const auto candles = trend(100.0, 1.0, 10);
    for (VoterKind kind : ALL_VOTER_KINDS) {
        EXPECT_EQ(cast_vote(candles, default_params(kind)), Vote::Hold) << to_string(kind);
    }
}

TEST(VoterTest, SmaCrossAboveVotesBuy) {
    // SMA(2) 9.0 -> 11.0 crosses SMA(3) 9.33 -> 10.67
    const auto candles = candles_from_closes({10.0, 10.0, 10.0, 8.0, 14.0});
    EXPECT_EQ(cast_vote(candles, SmaCrossParams{2, 3}), Vote::Buy);
}

TEST(VoterTest, SmaCrossBelowVotesSell) {
    const auto candles = candles_from_closes({10.0, 10.0, 10.0, 12.0, 6.0});
    EXPECT_EQ(cast_vote(candles, SmaCrossParams{2, 3}), Vote::Sell);
}

TEST(VoterTest, SteadyTrendWithoutCrossHolds) {
    const auto candles = trend(100.0, 1.0, 80);
    EXPECT_EQ(cast_vote(candles, SmaCrossParams{}), Vote::Hold);
    EXPECT_EQ(cast_vote(candles, EmaCrossParams{}), Vote::Hold);
}

TEST(VoterTest, RsiCrossingIntoOversoldVotesBuy) {
    // Gentle drift keeps RSI above 30, then a sharp drop pushes it below
    std::vector<double> closes;
    for (int i = 0; i < 20; ++i) closes.push_back(i % 2 == 0 ? 100.0 : 101.0);
    closes.push_back(90.0);
    const auto candles = candles_from_closes(closes);
    EXPECT_EQ(cast_vote(candles, RsiParams{}), Vote::Buy);
}

TEST(VoterTest, RsiCrossingIntoOverboughtVotesSell) {
    std::vector<double> closes;
    for (int i = 0; i < 20; ++i) closes.push_back(i % 2 == 0 ? 100.0 : 101.0);
    closes.push_back(111.0);
    const auto candles = candles_from_closes(closes);
    EXPECT_EQ(cast_vote(candles, RsiParams{}), Vote::Sell);
}

// ============================================================================
// Flat Series Breaking Out
// ============================================================================
// A constant series pins every average and band at its value, so the last bar
// decides the vote on its own

namespace {

std::vector<Candle> flat_then(size_t flat_bars, std::vector<double> tail) {
    std::vector<double> closes(flat_bars, 100.0);
    closes.insert(closes.end(), tail.begin(), tail.end());
    return candles_from_closes(closes);
}

/// 25 flat bars at volume 1000, then one bar at `close` with `volume`
std::vector<Candle> vwap_breakout(double close, double volume) {
    auto candles = flat_then(25, {});
    candles.push_back(quorum::test::make_candle(close, candles.size(), volume));
    return candles;
}

}  // namespace

TEST(VoterTest, DefaultSmaWindowsBuyOnBreakout) {
    // SMA(20) 100 -> 100.5 overtakes SMA(50) 100 -> 100.2
    EXPECT_EQ(cast_vote(flat_then(59, {110.0}), SmaCrossParams{}), Vote::Buy);
}

TEST(VoterTest, DefaultSmaWindowsSellOnBreakdown) {
    EXPECT_EQ(cast_vote(flat_then(59, {90.0}), SmaCrossParams{}), Vote::Sell);
}

TEST(VoterTest, EmaCrossVotesBothWays) {
    EXPECT_EQ(cast_vote(flat_then(40, {110.0}), EmaCrossParams{}), Vote::Buy);
    EXPECT_EQ(cast_vote(flat_then(40, {90.0}), EmaCrossParams{}), Vote::Sell);
}

TEST(VoterTest, MacdCrossAboveSignalVotesBuy) {
    // MACD 0 -> 0.80 against a signal line 0 -> 0.16
    EXPECT_EQ(cast_vote(flat_then(40, {110.0}), MacdParams{}), Vote::Buy);
}

TEST(VoterTest, MacdCrossBelowSignalVotesSell) {
    EXPECT_EQ(cast_vote(flat_then(40, {90.0}), MacdParams{}), Vote::Sell);
}

TEST(VoterTest, BollingerCloseBelowLowerBandVotesBuy) {
    // Bands collapse to 100 on the flat run, lower band is ~95.1 on the last bar
    EXPECT_EQ(cast_vote(flat_then(25, {90.0}), BollingerParams{}), Vote::Buy);
}

TEST(VoterTest, BollingerCloseAboveUpperBandVotesSell) {
    EXPECT_EQ(cast_vote(flat_then(25, {110.0}), BollingerParams{}), Vote::Sell);
}

TEST(VoterTest, VwapCrossAboveOnHeavyVolumeVotesBuy) {
    // 5000 against a 20-bar average of 1200
    EXPECT_EQ(cast_vote(vwap_breakout(110.0, 5000.0), VwapParams{}), Vote::Buy);
}

TEST(VoterTest, VwapCrossAboveOnLightVolumeHolds) {
    EXPECT_EQ(cast_vote(vwap_breakout(110.0, 1000.0), VwapParams{}), Vote::Hold);
}

TEST(VoterTest, VwapCrossBelowSellsWithoutVolume) {
    EXPECT_EQ(cast_vote(vwap_breakout(90.0, 1000.0), VwapParams{}), Vote::Sell);
}

TEST(VoterTest, SuperTrendFlipToBullishVotesBuy) {
    // The drop to 90 breaks the lower band, the jump to 110 clears the new upper band
    EXPECT_EQ(cast_vote(flat_then(15, {90.0, 110.0}), SuperTrendParams{}), Vote::Buy);
}

TEST(VoterTest, SuperTrendFlipToBearishVotesSell) {
    EXPECT_EQ(cast_vote(flat_then(15, {110.0, 90.0}), SuperTrendParams{}), Vote::Sell);
}

TEST(VoterTest, StochRsiDeepDeclineVotesBuy) {
    // RSI 0, slow %K ~3.6
    EXPECT_EQ(cast_vote(trend(200.0, -1.0, 40), StochRsiParams{}), Vote::Buy);
}

TEST(VoterTest, StochRsiSteadyRallyVotesSell) {
    // RSI 100, slow %K ~96.4
    EXPECT_EQ(cast_vote(trend(100.0, 1.0, 40), StochRsiParams{}), Vote::Sell);
}

TEST(VoterTest, StochRsiNeedsBothOscillators) {
    // A four-bar bounce lifts %K to ~32.6 while RSI is still ~25.7
    std::vector<double> closes;
    for (int i = 0; i < 40; ++i) closes.push_back(200.0 - i);
    for (double close : {162.0, 163.0, 164.0, 165.0}) closes.push_back(close);
    EXPECT_EQ(cast_vote(candles_from_closes(closes), StochRsiParams{}), Vote::Hold);
}

TEST(VoterTest, LookbackCoversIndicatorWarmup) {
    for (VoterKind kind : ALL_VOTER_KINDS) {
        const auto params = default_params(kind);
        const auto candles = trend(100.0, 0.5, lookback(params));
        // Enough data: the voter evaluates instead of failing, whatever it decides
        EXPECT_NO_THROW((void)cast_vote(candles, params)) << to_string(kind);
    }
}

TEST(VoterTest, DefaultVoterCarriesKindAndWeight) {
    const auto voter = make_default_voter(VoterKind::Macd);
    EXPECT_EQ(voter.kind(), VoterKind::Macd);
    EXPECT_EQ(voter.id, "macd");
    EXPECT_DOUBLE_EQ(voter.weight, 1.0);
}
