#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Volatility & Trend Indicators (ATR / ADX / SuperTrend)
// ============================================================================
// Candle-driven indicators with Wilder smoothing
// ATR drives position sizing and exit distances; SuperTrend drives a voter
// ============================================================================

#include "indicator_base.hpp"

#include <algorithm>
#include <cmath>

namespace quorum::strategy {

/// True range of `current` given the previous close
[[nodiscard]] inline double true_range(const Candle& current, double prev_close) noexcept {
    return std::max({current.high - current.low,
                     std::abs(current.high - prev_close),
                     std::abs(current.low - prev_close)});
}

// ============================================================================
// ATR (Average True Range)
// ============================================================================
// First TR needs a previous close, so ATR(n) is ready after n + 1 candles

class ATR : public IndicatorBase<ATR, Candle> {
public:
    explicit ATR(size_t period = 14) : period_(require_period(period, "ATR")) { reset_impl(); }

    void update_impl(const Candle& candle) {
        if (!has_prev_) {
            prev_close_ = candle.close;
            has_prev_ = true;
            return;
        }

        const double tr = true_range(candle, prev_close_);
        prev_close_ = candle.close;
        ++tr_count_;

        const auto n = static_cast<double>(period_);
        if (tr_count_ <= period_) {
            tr_sum_ += tr;
            if (tr_count_ == period_) {
                atr_ = tr_sum_ / n;
            }
        } else {
            atr_ = (atr_ * (n - 1.0) + tr) / n;
        }
    }

    [[nodiscard]] double value_impl() const { return atr_; }

    [[nodiscard]] bool is_ready_impl() const { return tr_count_ >= period_; }

    void reset_impl() {
        has_prev_ = false;
        prev_close_ = 0.0;
        tr_count_ = 0;
        tr_sum_ = 0.0;
        atr_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return period_ + 1; }

private:
    size_t period_;
    bool has_prev_;
    double prev_close_;
    size_t tr_count_;
    double tr_sum_;
    double atr_;
};

// ============================================================================
// ADX (Average Directional Index)
// ============================================================================
// Smoothed +DM / -DM / TR start as plain sums, then s = s - s/n + x
// ADX seeds with the mean of the first n DX values. Ready after 2n candles

class ADX : public IndicatorBase<ADX, Candle> {
public:
    explicit ADX(size_t period = 14) : period_(require_period(period, "ADX")) { reset_impl(); }

    void update_impl(const Candle& candle) {
        if (!has_prev_) {
            prev_ = candle;
            has_prev_ = true;
            return;
        }

        const double up_move = candle.high - prev_.high;
        const double down_move = prev_.low - candle.low;
        const double plus_dm = (up_move > down_move && up_move > 0.0) ? up_move : 0.0;
        const double minus_dm = (down_move > up_move && down_move > 0.0) ? down_move : 0.0;
        const double tr = true_range(candle, prev_.close);
        prev_ = candle;
        ++change_count_;

        const auto n = static_cast<double>(period_);
        if (change_count_ <= period_) {
            smoothed_tr_ += tr;
            smoothed_plus_ += plus_dm;
            smoothed_minus_ += minus_dm;
            if (change_count_ < period_) return;
        } else {
            smoothed_tr_ = smoothed_tr_ - smoothed_tr_ / n + tr;
            smoothed_plus_ = smoothed_plus_ - smoothed_plus_ / n + plus_dm;
            smoothed_minus_ = smoothed_minus_ - smoothed_minus_ / n + minus_dm;
        }

        plus_di_ = smoothed_tr_ > 0.0 ? 100.0 * smoothed_plus_ / smoothed_tr_ : 0.0;
        minus_di_ = smoothed_tr_ > 0.0 ? 100.0 * smoothed_minus_ / smoothed_tr_ : 0.0;
        const double di_sum = plus_di_ + minus_di_;
        const double dx = di_sum > 0.0 ? 100.0 * std::abs(plus_di_ - minus_di_) / di_sum : 0.0;

        ++dx_count_;
        if (dx_count_ <= period_) {
            dx_sum_ += dx;
            if (dx_count_ == period_) {
                adx_ = dx_sum_ / n;
            }
        } else {
            adx_ = (adx_ * (n - 1.0) + dx) / n;
        }
    }

    [[nodiscard]] double value_impl() const { return adx_; }

    [[nodiscard]] double plus_di() const { return plus_di_; }
    [[nodiscard]] double minus_di() const { return minus_di_; }

    [[nodiscard]] bool is_ready_impl() const { return dx_count_ >= period_; }

    void reset_impl() {
        has_prev_ = false;
        prev_ = Candle{};
        change_count_ = 0;
        dx_count_ = 0;
        smoothed_tr_ = 0.0;
        smoothed_plus_ = 0.0;
        smoothed_minus_ = 0.0;
        plus_di_ = 0.0;
        minus_di_ = 0.0;
        dx_sum_ = 0.0;
        adx_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return 2 * period_; }

private:
    size_t period_;
    bool has_prev_;
    Candle prev_;
    size_t change_count_;
    size_t dx_count_;
    double smoothed_tr_;
    double smoothed_plus_;
    double smoothed_minus_;
    double plus_di_;
    double minus_di_;
    double dx_sum_;
    double adx_;
};

// ============================================================================
// SuperTrend
// ============================================================================
// Bands: hl2 +/- multiplier * ATR(n)
// Direction: close above the previous upper band turns bullish, close below
// the previous lower band turns bearish, otherwise the direction carries over.
// The first bar with a valid ATR starts bullish.

struct SuperTrendValue {
    double line = 0.0;
    double upper = 0.0;
    double lower = 0.0;
    int direction = 1;  // +1 bullish, -1 bearish
};

class SuperTrend : public IndicatorBase<SuperTrend, Candle> {
public:
    explicit SuperTrend(size_t period = 10, double multiplier = 3.0)
        : atr_(period), multiplier_(multiplier) {
        reset_impl();
    }

    void update_impl(const Candle& candle) {
        atr_.update(candle);
        if (!atr_.is_ready()) return;

        const double hl2 = candle.median_price();
        const double upper = hl2 + multiplier_ * atr_.value();
        const double lower = hl2 - multiplier_ * atr_.value();

        int direction = 1;
        if (ready_) {
            if (candle.close > current_.upper) {
                direction = 1;
            } else if (candle.close < current_.lower) {
                direction = -1;
            } else {
                direction = current_.direction;
            }
        }

        current_.upper = upper;
        current_.lower = lower;
        current_.direction = direction;
        current_.line = direction == 1 ? lower : upper;
        ready_ = true;
    }

    [[nodiscard]] double value_impl() const { return current_.line; }

    [[nodiscard]] int direction() const { return current_.direction; }

    [[nodiscard]] SuperTrendValue snapshot() const { return current_; }

    [[nodiscard]] bool is_ready_impl() const { return ready_; }

    void reset_impl() {
        atr_.reset();
        current_ = SuperTrendValue{};
        ready_ = false;
    }

    [[nodiscard]] size_t period_impl() const { return atr_.period(); }

private:
    ATR atr_;
    double multiplier_;
    SuperTrendValue current_;
    bool ready_;
};

}  // namespace quorum::strategy
