#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - RSI (Relative Strength Index)
// ============================================================================
// Momentum oscillator measuring speed and magnitude of price changes
// Range: 0-100, Overbought > 70, Oversold < 30
// ============================================================================

#include "indicator_base.hpp"

#include <algorithm>

namespace quorum::strategy {

/// RSI with Wilder's smoothing. Needs period + 1 prices
class RSI : public IndicatorBase<RSI> {
public:
    static constexpr double OVERBOUGHT = 70.0;
    static constexpr double OVERSOLD = 30.0;

    explicit RSI(size_t period = 14) : period_(require_period(period, "RSI")) { reset_impl(); }

    void update_impl(double price) {
        if (count_ == 0) {
            prev_price_ = price;
            ++count_;
            return;
        }

        const double change = price - prev_price_;
        prev_price_ = price;

        const double gain = std::max(change, 0.0);
        const double loss = std::max(-change, 0.0);
        const auto n = static_cast<double>(period_);

        if (count_ <= period_) {
            gain_sum_ += gain;
            loss_sum_ += loss;

            if (count_ == period_) {
                avg_gain_ = gain_sum_ / n;
                avg_loss_ = loss_sum_ / n;
            }
        } else {
            avg_gain_ = (avg_gain_ * (n - 1.0) + gain) / n;
            avg_loss_ = (avg_loss_ * (n - 1.0) + loss) / n;
        }
        ++count_;
    }

    [[nodiscard]] double value_impl() const {
        if (!is_ready_impl()) return 50.0;  // Neutral until ready

        if (avg_loss_ == 0.0) {
            return avg_gain_ == 0.0 ? 50.0 : 100.0;
        }

        const double rs = avg_gain_ / avg_loss_;
        return 100.0 - (100.0 / (1.0 + rs));
    }

    [[nodiscard]] bool is_ready_impl() const { return count_ > period_; }

    void reset_impl() {
        count_ = 0;
        prev_price_ = 0.0;
        gain_sum_ = 0.0;
        loss_sum_ = 0.0;
        avg_gain_ = 0.0;
        avg_loss_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return period_ + 1; }

    [[nodiscard]] bool is_overbought() const { return value_impl() > OVERBOUGHT; }
    [[nodiscard]] bool is_oversold() const { return value_impl() < OVERSOLD; }

private:
    size_t period_;
    size_t count_;
    double prev_price_;
    double gain_sum_;
    double loss_sum_;
    double avg_gain_;
    double avg_loss_;
};

}  // namespace quorum::strategy
