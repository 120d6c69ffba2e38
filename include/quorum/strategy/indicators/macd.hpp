#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - MACD (Moving Average Convergence Divergence)
// ============================================================================
// Trend-following momentum indicator
// Standard settings: 12/26/9 EMAs
// ============================================================================

#include "ema.hpp"
#include "indicator_base.hpp"

#include <stdexcept>

namespace quorum::strategy {

/// MACD line, signal line and histogram at one bar
struct MacdValue {
    double macd = 0.0;
    double signal = 0.0;
    double histogram = 0.0;
};

class MACD : public IndicatorBase<MACD> {
public:
    MACD(size_t fast = 12, size_t slow = 26, size_t signal = 9)
        : fast_ema_(fast), slow_ema_(slow), signal_ema_(signal) {
        if (fast >= slow) {
            throw std::invalid_argument("MACD fast period must be less than slow period");
        }
        reset_impl();
    }

    void update_impl(double price) {
        fast_ema_.update(price);
        slow_ema_.update(price);

        if (slow_ema_.is_ready()) {
            macd_line_ = fast_ema_.value() - slow_ema_.value();
            signal_ema_.update(macd_line_);
            histogram_ = macd_line_ - signal_ema_.value();
        }
    }

    /// MACD line (fast EMA - slow EMA)
    [[nodiscard]] double value_impl() const { return macd_line_; }

    /// Signal line (EMA of MACD)
    [[nodiscard]] double signal_line() const { return signal_ema_.value(); }

    /// Histogram (MACD - Signal)
    [[nodiscard]] double histogram() const { return histogram_; }

    [[nodiscard]] MacdValue snapshot() const {
        return MacdValue{macd_line_, signal_ema_.value(), histogram_};
    }

    [[nodiscard]] bool is_ready_impl() const { return signal_ema_.is_ready(); }

    void reset_impl() {
        macd_line_ = 0.0;
        histogram_ = 0.0;
        fast_ema_.reset();
        slow_ema_.reset();
        signal_ema_.reset();
    }

    [[nodiscard]] size_t period_impl() const {
        return slow_ema_.period() + signal_ema_.period() - 1;
    }

private:
    EMA fast_ema_;
    EMA slow_ema_;
    EMA signal_ema_;

    double macd_line_;
    double histogram_;
};

}  // namespace quorum::strategy
