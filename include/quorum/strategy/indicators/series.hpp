#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Indicator Series over Candle Windows
// ============================================================================
// Batch entry points used by the voters: each replays a candle window through
// a streaming indicator and returns the values at the last two bars.
// All throw InsufficientData when either bar has no defined value.
// ============================================================================

#include "bollinger.hpp"
#include "macd.hpp"
#include "oscillators.hpp"
#include "volatility.hpp"
#include "quorum/core/types.hpp"

#include <chrono>
#include <span>

namespace quorum::strategy {

/// Indicator value at the previous and the latest completed bar
template <typename T>
struct Trailing {
    T previous{};
    T current{};
};

[[nodiscard]] Trailing<double> trailing_sma(std::span<const Candle> candles, size_t period);
[[nodiscard]] Trailing<double> trailing_ema(std::span<const Candle> candles, size_t period);
[[nodiscard]] Trailing<double> trailing_rsi(std::span<const Candle> candles, size_t period);

[[nodiscard]] Trailing<MacdValue> trailing_macd(std::span<const Candle> candles,
                                                size_t fast, size_t slow, size_t signal);

[[nodiscard]] Trailing<BandValue> trailing_bollinger(std::span<const Candle> candles,
                                                     size_t period, double std_dev);

[[nodiscard]] Trailing<double> trailing_vwap(
    std::span<const Candle> candles,
    std::chrono::minutes session_offset = std::chrono::minutes{0});

[[nodiscard]] Trailing<SuperTrendValue> trailing_supertrend(std::span<const Candle> candles,
                                                            size_t period, double multiplier);

[[nodiscard]] Trailing<StochasticValue> trailing_stochastic(std::span<const Candle> candles,
                                                            size_t k_period, size_t smooth = 3,
                                                            size_t d_period = 3);

/// Latest-bar only
[[nodiscard]] double latest_atr(std::span<const Candle> candles, size_t period = 14);
[[nodiscard]] double latest_adx(std::span<const Candle> candles, size_t period = 14);
[[nodiscard]] double latest_williams_r(std::span<const Candle> candles, size_t period = 14);

/// Mean volume of the `period` candles ending at the latest one (inclusive)
[[nodiscard]] double average_volume(std::span<const Candle> candles, size_t period);

}  // namespace quorum::strategy
