#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - VWAP (Volume Weighted Average Price)
// ============================================================================
// Session-cumulative: sum(typical * volume) / sum(volume), restarting at the
// first candle of each trading day (day boundary shifted by session_offset)
// ============================================================================

#include "indicator_base.hpp"

#include <chrono>
#include <cstdint>

namespace quorum::strategy {

class VWAP : public IndicatorBase<VWAP, Candle> {
public:
    explicit VWAP(std::chrono::minutes session_offset = std::chrono::minutes{0})
        : session_offset_(session_offset) {
        reset_impl();
    }

    void update_impl(const Candle& candle) {
        const int64_t day = session_day(candle.timestamp);
        if (count_ == 0 || day != session_day_) {
            session_day_ = day;
            cum_pv_ = 0.0;
            cum_volume_ = 0.0;
        }

        cum_pv_ += candle.typical_price() * candle.volume;
        cum_volume_ += candle.volume;
        value_ = cum_volume_ > 0.0 ? cum_pv_ / cum_volume_ : candle.typical_price();
        ++count_;
    }

    [[nodiscard]] double value_impl() const { return value_; }

    [[nodiscard]] bool is_ready_impl() const { return count_ > 0; }

    void reset_impl() {
        count_ = 0;
        session_day_ = 0;
        cum_pv_ = 0.0;
        cum_volume_ = 0.0;
        value_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return 1; }

private:
    [[nodiscard]] int64_t session_day(Timestamp ts) const {
        const auto local = ts.time_since_epoch() + session_offset_;
        return std::chrono::floor<std::chrono::days>(local).count();
    }

    std::chrono::minutes session_offset_;
    size_t count_;
    int64_t session_day_;
    double cum_pv_;
    double cum_volume_;
    double value_;
};

}  // namespace quorum::strategy
