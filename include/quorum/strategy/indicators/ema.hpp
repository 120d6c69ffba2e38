#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Moving Averages (EMA / SMA)
// ============================================================================
// Foundation indicators for the crossover voters, MACD and Bollinger
// ============================================================================

#include "indicator_base.hpp"

namespace quorum::strategy {

/// Exponential moving average, seeded with the SMA of the first `period` values
class EMA : public IndicatorBase<EMA> {
public:
    explicit EMA(size_t period)
        : period_(require_period(period, "EMA"))
        , multiplier_(2.0 / (static_cast<double>(period) + 1.0)) {
        reset_impl();
    }

    void update_impl(double price) {
        if (count_ < period_) {
            // Still building the seed SMA
            sum_ += price;
            ema_ = sum_ / static_cast<double>(count_ + 1);
        } else {
            ema_ = (price - ema_) * multiplier_ + ema_;
        }
        ++count_;
    }

    [[nodiscard]] double value_impl() const { return ema_; }

    [[nodiscard]] bool is_ready_impl() const { return count_ >= period_; }

    void reset_impl() {
        count_ = 0;
        ema_ = 0.0;
        sum_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return period_; }

private:
    size_t period_;
    double multiplier_;
    size_t count_;
    double ema_;
    double sum_;
};

/// Simple moving average over the trailing `period` values
class SMA : public IndicatorBase<SMA> {
public:
    explicit SMA(size_t period) : window_(require_period(period, "SMA")), count_(0) {}

    void update_impl(double price) {
        window_.push(price);
        ++count_;
    }

    [[nodiscard]] double value_impl() const { return window_.mean(); }

    [[nodiscard]] bool is_ready_impl() const { return count_ >= window_.capacity(); }

    void reset_impl() {
        window_.reset();
        count_ = 0;
    }

    [[nodiscard]] size_t period_impl() const { return window_.capacity(); }

private:
    RollingWindow window_;
    size_t count_;
};

}  // namespace quorum::strategy
