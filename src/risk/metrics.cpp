// ============================================================================
// QUORUM SCAN ENGINE - Performance Metrics Implementation
// ============================================================================

#include "quorum/risk/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace quorum::risk {

namespace {

constexpr double kTradingDaysPerYear = 252.0;

}  // namespace

PerformanceStats compute_performance(double initial_capital,
                                     std::span<const double> realized_pnl) {
    PerformanceStats stats;
    stats.total_trades = realized_pnl.size();
    if (realized_pnl.empty()) {
        return stats;
    }

    for (double pnl : realized_pnl) {
        stats.total_pnl += pnl;
        if (pnl > 0.0) {
            ++stats.winning_trades;
            stats.gross_profit += pnl;
        } else if (pnl < 0.0) {
            ++stats.losing_trades;
            stats.gross_loss += -pnl;
        }
    }

    stats.win_rate = 100.0 * static_cast<double>(stats.winning_trades) /
                     static_cast<double>(stats.total_trades);
    if (stats.winning_trades > 0) {
        stats.avg_win = stats.gross_profit / static_cast<double>(stats.winning_trades);
    }
    if (stats.losing_trades > 0) {
        stats.avg_loss = stats.gross_loss / static_cast<double>(stats.losing_trades);
    }

    if (stats.gross_loss > 0.0) {
        stats.profit_factor = stats.gross_profit / stats.gross_loss;
    } else if (stats.gross_profit > 0.0) {
        stats.profit_factor = std::numeric_limits<double>::infinity();
    }

    // Equity curve walk: drawdown from running peak, per-step returns
    double equity = initial_capital;
    double peak = initial_capital;
    std::vector<double> returns;
    returns.reserve(realized_pnl.size());

    for (double pnl : realized_pnl) {
        const double previous = equity;
        equity += pnl;
        peak = std::max(peak, equity);
        if (peak > 0.0) {
            stats.max_drawdown = std::max(stats.max_drawdown, 100.0 * (peak - equity) / peak);
        }
        if (previous != 0.0) {
            returns.push_back((equity - previous) / previous);
        }
    }

    if (returns.size() >= 2) {
        double mean = 0.0;
        for (double r : returns) mean += r;
        mean /= static_cast<double>(returns.size());

        // Sample standard deviation
        double variance = 0.0;
        for (double r : returns) variance += (r - mean) * (r - mean);
        variance /= static_cast<double>(returns.size() - 1);

        const double sd = std::sqrt(variance);
        if (sd > 0.0) {
            stats.sharpe_ratio = mean / sd * std::sqrt(kTradingDaysPerYear);
        }
    }

    return stats;
}

}  // namespace quorum::risk
