#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Performance Metrics
// ============================================================================
// Derived from realized trade pnl in close order, starting from initial capital
// Equity curve: initial, initial + pnl[0], initial + pnl[0] + pnl[1], ...
// ============================================================================

#include <cstddef>
#include <span>

namespace quorum::risk {

struct PerformanceStats {
    size_t total_trades = 0;
    size_t winning_trades = 0;
    size_t losing_trades = 0;
    double win_rate = 0.0;        // Percent, 0-100
    double total_pnl = 0.0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;      // Positive magnitude
    double avg_win = 0.0;
    double avg_loss = 0.0;        // Positive magnitude
    double profit_factor = 0.0;   // gross_profit / gross_loss; +inf with wins and no losses
    double max_drawdown = 0.0;    // Percent from running equity peak
    double sharpe_ratio = 0.0;    // mean / stddev of per-trade equity returns * sqrt(252)
};

[[nodiscard]] PerformanceStats compute_performance(double initial_capital,
                                                   std::span<const double> realized_pnl);

}  // namespace quorum::risk
