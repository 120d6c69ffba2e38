#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Indicator Base Class
// ============================================================================
// CRTP pattern for zero-overhead polymorphism
// Streaming indicators consume either a price (double) or a full Candle
// Periods are runtime values: every voter parameter is overridable per strategy
// ============================================================================

#include "quorum/core/types.hpp"

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace quorum::strategy {

// ============================================================================
// Indicator Concepts
// ============================================================================

template <typename T>
concept Indicator = requires(T indicator, double value) {
    { indicator.update(value) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
    { indicator.reset() } -> std::same_as<void>;
};

template <typename T>
concept CandleIndicator = requires(T indicator, const Candle& candle) {
    { indicator.update(candle) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
    { indicator.reset() } -> std::same_as<void>;
};

// ============================================================================
// CRTP Base Class
// ============================================================================

template <typename Derived, typename Input = double>
class IndicatorBase {
public:
    /// Feed the next observation
    void update(const Input& input) {
        static_cast<Derived*>(this)->update_impl(input);
    }

    /// Current indicator value
    [[nodiscard]] double value() const {
        return static_cast<const Derived*>(this)->value_impl();
    }

    /// True once enough observations have been seen
    [[nodiscard]] bool is_ready() const {
        return static_cast<const Derived*>(this)->is_ready_impl();
    }

    void reset() {
        static_cast<Derived*>(this)->reset_impl();
    }

    /// Number of observations needed before is_ready()
    [[nodiscard]] size_t period() const {
        return static_cast<const Derived*>(this)->period_impl();
    }

protected:
    IndicatorBase() = default;
    ~IndicatorBase() = default;
};

/// Throws std::invalid_argument on a zero period
inline size_t require_period(size_t period, const char* name) {
    if (period == 0) {
        throw std::invalid_argument(std::string(name) + " period must be positive");
    }
    return period;
}

// ============================================================================
// Rolling Window for Historical Data
// ============================================================================

class RollingWindow {
public:
    explicit RollingWindow(size_t capacity)
        : buffer_(require_period(capacity, "RollingWindow"), 0.0), size_(0), index_(0) {}

    void push(double value) {
        buffer_[index_] = value;
        index_ = (index_ + 1) % buffer_.size();
        if (size_ < buffer_.size()) {
            ++size_;
        }
    }

    [[nodiscard]] double operator[](size_t i) const {
        // i=0 is the most recent value
        if (i >= size_) return 0.0;
        return buffer_[(index_ + buffer_.size() - 1 - i) % buffer_.size()];
    }

    [[nodiscard]] double newest() const { return (*this)[0]; }

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] size_t capacity() const { return buffer_.size(); }
    [[nodiscard]] bool is_full() const { return size_ == buffer_.size(); }

    void reset() {
        size_ = 0;
        index_ = 0;
    }

    [[nodiscard]] double sum() const {
        double s = 0.0;
        for (size_t i = 0; i < size_; ++i) {
            s += buffer_[i];
        }
        return s;
    }

    [[nodiscard]] double mean() const {
        if (size_ == 0) return 0.0;
        return sum() / static_cast<double>(size_);
    }

    /// Population standard deviation
    [[nodiscard]] double std_dev() const {
        if (size_ < 2) return 0.0;
        const double m = mean();
        double variance = 0.0;
        for (size_t i = 0; i < size_; ++i) {
            const double diff = buffer_[i] - m;
            variance += diff * diff;
        }
        return std::sqrt(variance / static_cast<double>(size_));
    }

    [[nodiscard]] double max() const {
        double m = (*this)[0];
        for (size_t i = 1; i < size_; ++i) m = std::max(m, (*this)[i]);
        return m;
    }

    [[nodiscard]] double min() const {
        double m = (*this)[0];
        for (size_t i = 1; i < size_; ++i) m = std::min(m, (*this)[i]);
        return m;
    }

private:
    std::vector<double> buffer_;
    size_t size_;
    size_t index_;
};

}  // namespace quorum::strategy
