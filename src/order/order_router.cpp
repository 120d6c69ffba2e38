// ============================================================================
// QUORUM SCAN ENGINE - Paper Order Router Implementation
// ============================================================================

#include "quorum/order/order_router.hpp"
#include "quorum/utils/logger.hpp"

#include <fmt/format.h>

#include <cmath>

namespace quorum::order {

ExecutionReport PaperOrderRouter::submit(const Symbol& symbol, Side side,
                                         int64_t quantity, double reference_price) {
    ExecutionReport report;

    if (quantity <= 0) {
        report.message = fmt::format("invalid quantity {}", quantity);
    } else if (!(reference_price > 0.0) || !std::isfinite(reference_price)) {
        report.message = fmt::format("invalid reference price {}", reference_price);
    }
    if (!report.message.empty()) {
        LOG_WARN("[PAPER] Rejected {} {} {}: {}",
                 to_string(side), quantity, symbol.view(), report.message);
        return report;
    }

    report.filled = true;
    report.fill_price = reference_price;
    report.order_id = generate_order_id();

    LOG_INFO("[PAPER] {} {} {} @ {:.2f} (order {})",
             to_string(side), quantity, symbol.view(), reference_price, report.order_id);
    return report;
}

std::string PaperOrderRouter::generate_order_id() {
    const auto seq = order_counter_.fetch_add(1, std::memory_order_relaxed) + 1;
    return fmt::format("PAPER-{}-{}", to_epoch_ms(now()), seq);
}

}  // namespace quorum::order
