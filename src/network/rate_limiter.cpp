// ============================================================================
// QUORUM SCAN ENGINE - Rate Limiter
// ============================================================================

#include "quorum/network/rest_client.hpp"

#include <algorithm>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace quorum::network {

struct RateLimiter::Impl {
    int max_requests_;
    std::chrono::seconds window_;
    std::deque<std::chrono::steady_clock::time_point> requests_;
    mutable std::mutex mutex_;

    Impl(int max_requests, std::chrono::seconds window)
        : max_requests_(max_requests), window_(window) {
        if (max_requests <= 0 || window.count() <= 0) {
            throw std::invalid_argument("RateLimiter needs positive max_requests and window");
        }
    }

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        cleanup_old_requests();

        if (static_cast<int>(requests_.size()) >= max_requests_) {
            return false;
        }

        requests_.push_back(std::chrono::steady_clock::now());
        return true;
    }

    bool acquire(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!try_acquire()) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return false;
            }
            // Wake when the oldest permit expires, polling at most every 50ms
            auto pause = std::min<std::chrono::steady_clock::duration>(
                time_until_reset(), std::chrono::milliseconds(50));
            pause = std::min<std::chrono::steady_clock::duration>(pause, deadline - now);
            std::this_thread::sleep_for(std::max<std::chrono::steady_clock::duration>(
                pause, std::chrono::milliseconds(1)));
        }
        return true;
    }

    int remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto cutoff = std::chrono::steady_clock::now() - window_;
        int live = 0;
        for (const auto& t : requests_) {
            if (t >= cutoff) ++live;
        }
        return max_requests_ - live;
    }

    std::chrono::milliseconds time_until_reset() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            return std::chrono::milliseconds(0);
        }

        const auto reset_time = requests_.front() + window_;
        const auto now = std::chrono::steady_clock::now();
        if (reset_time <= now) {
            return std::chrono::milliseconds(0);
        }

        return std::chrono::duration_cast<std::chrono::milliseconds>(reset_time - now);
    }

private:
    void cleanup_old_requests() {
        const auto cutoff = std::chrono::steady_clock::now() - window_;
        while (!requests_.empty() && requests_.front() < cutoff) {
            requests_.pop_front();
        }
    }
};

RateLimiter::RateLimiter(int max_requests, std::chrono::seconds window)
    : impl_(std::make_unique<Impl>(max_requests, window)) {}

RateLimiter::~RateLimiter() = default;

bool RateLimiter::try_acquire() {
    return impl_->try_acquire();
}

bool RateLimiter::acquire(std::chrono::milliseconds timeout) {
    return impl_->acquire(timeout);
}

int RateLimiter::remaining() const {
    return impl_->remaining();
}

std::chrono::milliseconds RateLimiter::time_until_reset() const {
    return impl_->time_until_reset();
}

}  // namespace quorum::network
