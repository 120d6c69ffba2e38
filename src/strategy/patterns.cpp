// ============================================================================
// QUORUM SCAN ENGINE - Candlestick Pattern Detection
// ============================================================================

#include "quorum/strategy/indicators/patterns.hpp"
#include "quorum/core/error.hpp"

#include <algorithm>
#include <cmath>

namespace quorum::strategy {

namespace {

constexpr size_t kBodyLookback = 10;

double body(const Candle& c) { return std::abs(c.close - c.open); }
double range(const Candle& c) { return c.high - c.low; }
double upper_shadow(const Candle& c) { return c.high - std::max(c.open, c.close); }
double lower_shadow(const Candle& c) { return std::min(c.open, c.close) - c.low; }
bool bullish(const Candle& c) { return c.close > c.open; }
bool bearish(const Candle& c) { return c.close < c.open; }

/// Mean body size of up to kBodyLookback candles ending before `end`
double average_body(std::span<const Candle> candles, size_t end) {
    const size_t begin = end > kBodyLookback ? end - kBodyLookback : 0;
    if (begin == end) return body(candles[end]);

    double sum = 0.0;
    for (size_t i = begin; i < end; ++i) sum += body(candles[i]);
    return sum / static_cast<double>(end - begin);
}

}  // namespace

std::vector<std::string> PatternFlags::names() const {
    std::vector<std::string> out;
    if (doji) out.emplace_back("doji");
    if (hammer) out.emplace_back("hammer");
    if (engulfing > 0) out.emplace_back("bullish_engulfing");
    if (engulfing < 0) out.emplace_back("bearish_engulfing");
    if (morning_star) out.emplace_back("morning_star");
    if (evening_star) out.emplace_back("evening_star");
    if (three_white_soldiers) out.emplace_back("three_white_soldiers");
    if (three_black_crows) out.emplace_back("three_black_crows");
    return out;
}

PatternFlags detect_patterns(std::span<const Candle> candles) {
    if (candles.size() < PATTERN_MIN_CANDLES) {
        throw InsufficientData("candlestick patterns need " +
                               std::to_string(PATTERN_MIN_CANDLES) + " candles, got " +
                               std::to_string(candles.size()));
    }

    const size_t last = candles.size() - 1;
    const Candle& c1 = candles[last - 2];
    const Candle& c2 = candles[last - 1];
    const Candle& c3 = candles[last];

    PatternFlags flags;

    // Single-candle patterns on the latest bar
    const double r3 = range(c3);
    if (r3 > 0.0) {
        flags.doji = body(c3) <= 0.1 * r3;
        flags.hammer = body(c3) > 0.0 &&
                       lower_shadow(c3) >= 2.0 * body(c3) &&
                       upper_shadow(c3) <= body(c3);
    }

    // Engulfing: latest body swallows the previous opposite-colour body
    if (bearish(c2) && bullish(c3) && c3.open <= c2.close && c3.close >= c2.open) {
        flags.engulfing = 1;
    } else if (bullish(c2) && bearish(c3) && c3.open >= c2.close && c3.close <= c2.open) {
        flags.engulfing = -1;
    }

    // Three-candle patterns referenced against the body average before c1
    const double avg = average_body(candles, last - 2);
    const bool c1_long = body(c1) > avg;
    const bool c2_small = body(c2) <= 0.3 * std::max(avg, body(c1));
    const double c1_mid = (c1.open + c1.close) / 2.0;

    flags.morning_star = bearish(c1) && c1_long && c2_small &&
                         std::max(c2.open, c2.close) < c1.close &&
                         bullish(c3) && c3.close > c1_mid;

    flags.evening_star = bullish(c1) && c1_long && c2_small &&
                         std::min(c2.open, c2.close) > c1.close &&
                         bearish(c3) && c3.close < c1_mid;

    const auto soldier = [](const Candle& prev, const Candle& cur) {
        return bullish(cur) && cur.close > prev.close &&
               cur.open >= prev.open && cur.open <= prev.close &&
               upper_shadow(cur) <= 0.3 * body(cur);
    };
    flags.three_white_soldiers = bullish(c1) && upper_shadow(c1) <= 0.3 * body(c1) &&
                                 soldier(c1, c2) && soldier(c2, c3);

    const auto crow = [](const Candle& prev, const Candle& cur) {
        return bearish(cur) && cur.close < prev.close &&
               cur.open <= prev.open && cur.open >= prev.close &&
               lower_shadow(cur) <= 0.3 * body(cur);
    };
    flags.three_black_crows = bearish(c1) && lower_shadow(c1) <= 0.3 * body(c1) &&
                              crow(c1, c2) && crow(c2, c3);

    return flags;
}

}  // namespace quorum::strategy
