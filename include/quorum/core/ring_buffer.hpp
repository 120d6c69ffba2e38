#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Bounded Overwriting Ring Buffer
// ============================================================================
// Fixed-capacity FIFO log: a push into a full ring evicts the oldest entry
// Multiple producers, any number of readers; readers get copies
// ============================================================================

#include <algorithm>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace quorum {

template <typename T>
class OverwritingRingBuffer {
public:
    explicit OverwritingRingBuffer(size_t capacity)
        : buffer_(capacity), head_(0), size_(0) {
        if (capacity == 0) {
            throw std::invalid_argument("OverwritingRingBuffer capacity must be positive");
        }
    }

    // Non-copyable (owns a mutex)
    OverwritingRingBuffer(const OverwritingRingBuffer&) = delete;
    OverwritingRingBuffer& operator=(const OverwritingRingBuffer&) = delete;

    /// Append an entry, evicting the oldest one when full
    void push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_[head_] = std::move(item);
        head_ = (head_ + 1) % buffer_.size();
        if (size_ < buffer_.size()) {
            ++size_;
        }
    }

    /// Oldest retained entry
    [[nodiscard]] std::optional<T> front() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_ == 0) return std::nullopt;
        return buffer_[oldest_index()];
    }

    /// Newest entry
    [[nodiscard]] std::optional<T> back() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_ == 0) return std::nullopt;
        return buffer_[(head_ + buffer_.size() - 1) % buffer_.size()];
    }

    /// Copy of all entries, oldest first
    [[nodiscard]] std::vector<T> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(size_);
        const size_t start = oldest_index();
        for (size_t i = 0; i < size_; ++i) {
            out.push_back(buffer_[(start + i) % buffer_.size()]);
        }
        return out;
    }

    /// Up to `limit` most recent entries matching `pred`, oldest first
    [[nodiscard]] std::vector<T> latest(size_t limit,
                                        const std::function<bool(const T&)>& pred = {}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        const size_t start = oldest_index();
        for (size_t i = size_; i > 0 && out.size() < limit; --i) {
            const T& item = buffer_[(start + i - 1) % buffer_.size()];
            if (!pred || pred(item)) {
                out.push_back(item);
            }
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] size_t capacity() const noexcept { return buffer_.size(); }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        head_ = 0;
        size_ = 0;
    }

private:
    // Caller holds mutex_
    [[nodiscard]] size_t oldest_index() const noexcept {
        return (head_ + buffer_.size() - size_) % buffer_.size();
    }

    mutable std::mutex mutex_;
    std::vector<T> buffer_;
    size_t head_;  // Next write slot
    size_t size_;
};

}  // namespace quorum
