#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Bollinger Bands
// ============================================================================
// Volatility indicator using standard deviation bands
// Default: 20-period SMA with 2 standard deviation bands
// ============================================================================

#include "indicator_base.hpp"

namespace quorum::strategy {

struct BandValue {
    double upper = 0.0;
    double middle = 0.0;
    double lower = 0.0;
};

class BollingerBands : public IndicatorBase<BollingerBands> {
public:
    explicit BollingerBands(size_t period = 20, double std_dev_multiplier = 2.0)
        : window_(require_period(period, "BollingerBands"))
        , multiplier_(std_dev_multiplier) {
        reset_impl();
    }

    void update_impl(double price) {
        window_.push(price);
        latest_price_ = price;
        ++count_;

        if (count_ >= window_.capacity()) {
            middle_ = window_.mean();
            const double sd = window_.std_dev();
            upper_ = middle_ + multiplier_ * sd;
            lower_ = middle_ - multiplier_ * sd;
        }
    }

    /// Middle band (SMA)
    [[nodiscard]] double value_impl() const { return middle_; }

    [[nodiscard]] double upper_band() const { return upper_; }
    [[nodiscard]] double lower_band() const { return lower_; }

    [[nodiscard]] BandValue snapshot() const { return BandValue{upper_, middle_, lower_}; }

    /// Band width relative to the middle band
    [[nodiscard]] double band_width() const {
        if (middle_ == 0.0) return 0.0;
        return (upper_ - lower_) / middle_;
    }

    /// %B: 0 = at lower band, 0.5 = at middle, 1 = at upper band
    [[nodiscard]] double percent_b() const {
        if (upper_ == lower_) return 0.5;
        return (latest_price_ - lower_) / (upper_ - lower_);
    }

    [[nodiscard]] bool is_ready_impl() const { return count_ >= window_.capacity(); }

    void reset_impl() {
        window_.reset();
        count_ = 0;
        middle_ = 0.0;
        upper_ = 0.0;
        lower_ = 0.0;
        latest_price_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return window_.capacity(); }

private:
    RollingWindow window_;
    double multiplier_;
    size_t count_;
    double middle_;
    double upper_;
    double lower_;
    double latest_price_;
};

}  // namespace quorum::strategy
