#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Range Oscillators (Stochastic / Williams %R)
// ============================================================================
// Both locate the close inside the recent high-low range
// A zero-width range reads as 0 (Stochastic) and -100 (Williams %R)
// ============================================================================

#include "ema.hpp"
#include "indicator_base.hpp"

namespace quorum::strategy {

struct StochasticValue {
    double k = 0.0;  // Slow %K
    double d = 0.0;  // Slow %D
};

/// Slow stochastic: fast %K smoothed by an SMA, %D is an SMA of slow %K
/// value() is slow %K, ready after k_period + smooth - 1 candles
class Stochastic : public IndicatorBase<Stochastic, Candle> {
public:
    explicit Stochastic(size_t k_period = 14, size_t smooth = 3, size_t d_period = 3)
        : highs_(require_period(k_period, "Stochastic"))
        , lows_(k_period)
        , slow_k_(smooth)
        , slow_d_(d_period) {
        reset_impl();
    }

    void update_impl(const Candle& candle) {
        highs_.push(candle.high);
        lows_.push(candle.low);
        if (!highs_.is_full()) return;

        const double highest = highs_.max();
        const double lowest = lows_.min();
        const double range = highest - lowest;
        const double fast_k = range > 0.0 ? 100.0 * (candle.close - lowest) / range : 0.0;

        slow_k_.update(fast_k);
        if (slow_k_.is_ready()) {
            slow_d_.update(slow_k_.value());
        }
    }

    [[nodiscard]] double value_impl() const { return slow_k_.value(); }

    [[nodiscard]] double d() const { return slow_d_.value(); }

    [[nodiscard]] bool is_d_ready() const { return slow_d_.is_ready(); }

    [[nodiscard]] StochasticValue snapshot() const {
        return StochasticValue{slow_k_.value(), slow_d_.value()};
    }

    [[nodiscard]] bool is_ready_impl() const { return slow_k_.is_ready(); }

    void reset_impl() {
        highs_.reset();
        lows_.reset();
        slow_k_.reset();
        slow_d_.reset();
    }

    [[nodiscard]] size_t period_impl() const {
        return highs_.capacity() + slow_k_.period() - 1;
    }

private:
    RollingWindow highs_;
    RollingWindow lows_;
    SMA slow_k_;
    SMA slow_d_;
};

/// Williams %R in [-100, 0]. -100 is the bottom of the range
class WilliamsR : public IndicatorBase<WilliamsR, Candle> {
public:
    explicit WilliamsR(size_t period = 14)
        : highs_(require_period(period, "WilliamsR")), lows_(period) {
        reset_impl();
    }

    void update_impl(const Candle& candle) {
        highs_.push(candle.high);
        lows_.push(candle.low);
        if (!highs_.is_full()) return;

        const double highest = highs_.max();
        const double lowest = lows_.min();
        const double range = highest - lowest;
        value_ = range > 0.0 ? -100.0 * (highest - candle.close) / range : -100.0;
    }

    [[nodiscard]] double value_impl() const { return value_; }

    [[nodiscard]] bool is_ready_impl() const { return highs_.is_full(); }

    void reset_impl() {
        highs_.reset();
        lows_.reset();
        value_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return highs_.capacity(); }

private:
    RollingWindow highs_;
    RollingWindow lows_;
    double value_;
};

}  // namespace quorum::strategy
