#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Order Router
// ============================================================================
// Hands entry and exit orders to a venue. Only paper routing ships
// ============================================================================

#include "quorum/core/types.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace quorum::order {

struct ExecutionReport {
    bool filled = false;
    double fill_price = 0.0;
    std::string order_id;
    std::string message;   // Rejection reason when not filled
};

class IOrderRouter {
public:
    virtual ~IOrderRouter() = default;

    /// Market order at the reference price. Must not throw for venue rejections:
    /// those come back as filled == false
    [[nodiscard]] virtual ExecutionReport submit(const Symbol& symbol, Side side,
                                                 int64_t quantity, double reference_price) = 0;
};

/// Fills every valid order immediately at the reference price
class PaperOrderRouter : public IOrderRouter {
public:
    [[nodiscard]] ExecutionReport submit(const Symbol& symbol, Side side,
                                         int64_t quantity, double reference_price) override;

    [[nodiscard]] uint64_t orders_filled() const noexcept {
        return order_counter_.load(std::memory_order_relaxed);
    }

private:
    std::string generate_order_id();

    std::atomic<uint64_t> order_counter_{0};
};

}  // namespace quorum::order
