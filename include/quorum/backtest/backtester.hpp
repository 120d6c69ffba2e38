#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Backtester
// ============================================================================
// Replays a candle series through the same voters, aggregator and money
// manager the live loop uses. One position at a time, decided on bar close
// ============================================================================

#include "quorum/order/records.hpp"
#include "quorum/risk/metrics.hpp"
#include "quorum/risk/money_manager.hpp"
#include "quorum/strategy/signal_aggregator.hpp"
#include "quorum/strategy/voters.hpp"
#include "quorum/core/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace quorum::backtest {

struct BacktestConfig {
    double initial_capital = 100000.0;
    size_t warmup_bars = 50;              // First bar evaluated
    risk::MoneyConfig money;
    strategy::AggregatorConfig aggregator;
};

struct BacktestTrade {
    Side side = Side::Buy;
    int64_t quantity = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    Timestamp entry_time{};
    Timestamp exit_time{};
    double pnl = 0.0;
    order::ExitReason reason = order::ExitReason::OppositeSignal;
};

struct BacktestReport {
    Symbol symbol;
    size_t bars = 0;
    size_t signals = 0;                   // Directional decisions seen
    std::vector<BacktestTrade> trades;
    risk::PerformanceStats stats;
    double final_capital = 0.0;
    std::optional<order::Position> open_position;  // Still open at the last bar, not in stats
};

class Backtester {
public:
    explicit Backtester(const BacktestConfig& config = BacktestConfig{});

    /// Throws InsufficientData when the series does not reach the warmup bar
    [[nodiscard]] BacktestReport run(std::span<const Candle> candles,
                                     std::span<const strategy::Voter> voters) const;

private:
    BacktestConfig config_;
    strategy::SignalAggregator aggregator_;
    risk::MoneyManager money_;
};

}  // namespace quorum::backtest
