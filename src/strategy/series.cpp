// ============================================================================
// QUORUM SCAN ENGINE - Indicator Series Implementation
// ============================================================================

#include "quorum/strategy/indicators/series.hpp"
#include "quorum/strategy/indicators/ema.hpp"
#include "quorum/strategy/indicators/rsi.hpp"
#include "quorum/strategy/indicators/vwap.hpp"
#include "quorum/core/error.hpp"

#include <optional>
#include <string>

namespace quorum::strategy {

namespace {

double close_of(const Candle& c) { return c.close; }
const Candle& candle_of(const Candle& c) { return c; }

[[noreturn]] void insufficient(const char* name, size_t needed, size_t got) {
    throw InsufficientData(std::string(name) + " needs " + std::to_string(needed) +
                           " candles, got " + std::to_string(got));
}

/// Replay `candles` through `indicator`, keeping the last two ready values
template <typename Ind, typename InputOf, typename Extract>
auto replay(std::span<const Candle> candles, Ind indicator, InputOf input_of,
            Extract extract, const char* name) {
    using Value = decltype(extract(indicator));
    std::optional<Value> previous;
    std::optional<Value> current;

    for (const auto& candle : candles) {
        indicator.update(input_of(candle));
        if (indicator.is_ready()) {
            previous = current;
            current = extract(indicator);
        }
    }

    if (!previous || !current) {
        insufficient(name, indicator.period() + 1, candles.size());
    }
    return Trailing<Value>{*previous, *current};
}

template <typename Ind, typename InputOf>
double replay_latest(std::span<const Candle> candles, Ind indicator, InputOf input_of,
                     const char* name) {
    for (const auto& candle : candles) {
        indicator.update(input_of(candle));
    }
    if (!indicator.is_ready()) {
        insufficient(name, indicator.period(), candles.size());
    }
    return indicator.value();
}

}  // namespace

Trailing<double> trailing_sma(std::span<const Candle> candles, size_t period) {
    return replay(candles, SMA(period), close_of,
                  [](const SMA& i) { return i.value(); }, "SMA");
}

Trailing<double> trailing_ema(std::span<const Candle> candles, size_t period) {
    return replay(candles, EMA(period), close_of,
                  [](const EMA& i) { return i.value(); }, "EMA");
}

Trailing<double> trailing_rsi(std::span<const Candle> candles, size_t period) {
    return replay(candles, RSI(period), close_of,
                  [](const RSI& i) { return i.value(); }, "RSI");
}

Trailing<MacdValue> trailing_macd(std::span<const Candle> candles,
                                  size_t fast, size_t slow, size_t signal) {
    return replay(candles, MACD(fast, slow, signal), close_of,
                  [](const MACD& i) { return i.snapshot(); }, "MACD");
}

Trailing<BandValue> trailing_bollinger(std::span<const Candle> candles,
                                       size_t period, double std_dev) {
    return replay(candles, BollingerBands(period, std_dev), close_of,
                  [](const BollingerBands& i) { return i.snapshot(); }, "Bollinger");
}

Trailing<double> trailing_vwap(std::span<const Candle> candles,
                               std::chrono::minutes session_offset) {
    return replay(candles, VWAP(session_offset), candle_of,
                  [](const VWAP& i) { return i.value(); }, "VWAP");
}

Trailing<SuperTrendValue> trailing_supertrend(std::span<const Candle> candles,
                                              size_t period, double multiplier) {
    return replay(candles, SuperTrend(period, multiplier), candle_of,
                  [](const SuperTrend& i) { return i.snapshot(); }, "SuperTrend");
}

Trailing<StochasticValue> trailing_stochastic(std::span<const Candle> candles,
                                              size_t k_period, size_t smooth,
                                              size_t d_period) {
    return replay(candles, Stochastic(k_period, smooth, d_period), candle_of,
                  [](const Stochastic& i) { return i.snapshot(); }, "Stochastic");
}

double latest_atr(std::span<const Candle> candles, size_t period) {
    return replay_latest(candles, ATR(period), candle_of, "ATR");
}

double latest_adx(std::span<const Candle> candles, size_t period) {
    return replay_latest(candles, ADX(period), candle_of, "ADX");
}

double latest_williams_r(std::span<const Candle> candles, size_t period) {
    return replay_latest(candles, WilliamsR(period), candle_of, "Williams %R");
}

double average_volume(std::span<const Candle> candles, size_t period) {
    if (period == 0 || candles.size() < period) {
        insufficient("Average volume", period, candles.size());
    }
    double sum = 0.0;
    for (size_t i = candles.size() - period; i < candles.size(); ++i) {
        sum += candles[i].volume;
    }
    return sum / static_cast<double>(period);
}

}  // namespace quorum::strategy
