#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Shared Test Fixtures
// ============================================================================

#include "quorum/core/types.hpp"

#include <chrono>
#include <vector>

namespace quorum::test {

/// 2024-01-01T00:00:00Z
inline constexpr int64_t BASE_EPOCH_MS = 1704067200000;

/// Candle with a 1-point range around `close`
inline Candle make_candle(double close, size_t index, double volume = 1000.0,
                          const char* symbol = "TEST") {
    Candle c;
    c.symbol = Symbol(symbol);
    c.timestamp = from_epoch_ms(BASE_EPOCH_MS) + std::chrono::minutes(5 * index);
    c.open = close;
    c.high = close + 0.5;
    c.low = close - 0.5;
    c.close = close;
    c.volume = volume;
    return c;
}

inline std::vector<Candle> candles_from_closes(const std::vector<double>& closes,
                                               const char* symbol = "TEST") {
    std::vector<Candle> out;
    out.reserve(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        out.push_back(make_candle(closes[i], i, 1000.0, symbol));
    }
    return out;
}

/// Closes moving by `step` per bar from `start`
inline std::vector<Candle> trend(double start, double step, size_t count,
                                 const char* symbol = "TEST") {
    std::vector<double> closes;
    closes.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        closes.push_back(start + step * static_cast<double>(i));
    }
    return candles_from_closes(closes, symbol);
}

}  // namespace quorum::test
