#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Candlestick Patterns
// ============================================================================
// Flags evaluated on the most recent candles. Needs at least 3 candles; the
// "long body" reference is the mean body of up to 10 candles before the pattern
// ============================================================================

#include "quorum/core/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace quorum::strategy {

struct PatternFlags {
    bool doji = false;
    bool hammer = false;
    int engulfing = 0;  // +1 bullish, -1 bearish, 0 none
    bool morning_star = false;
    bool evening_star = false;
    bool three_white_soldiers = false;
    bool three_black_crows = false;

    [[nodiscard]] bool any() const noexcept {
        return doji || hammer || engulfing != 0 || morning_star || evening_star ||
               three_white_soldiers || three_black_crows;
    }

    /// Names of the patterns that fired, e.g. {"doji", "bullish_engulfing"}
    [[nodiscard]] std::vector<std::string> names() const;
};

inline constexpr size_t PATTERN_MIN_CANDLES = 3;

/// Throws InsufficientData with fewer than PATTERN_MIN_CANDLES candles
[[nodiscard]] PatternFlags detect_patterns(std::span<const Candle> candles);

}  // namespace quorum::strategy
