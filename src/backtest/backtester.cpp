// ============================================================================
// QUORUM SCAN ENGINE - Backtester Implementation
// ============================================================================

#include "quorum/backtest/backtester.hpp"
#include "quorum/core/error.hpp"
#include "quorum/strategy/indicators/series.hpp"
#include "quorum/utils/logger.hpp"

#include <fmt/format.h>

namespace quorum::backtest {

Backtester::Backtester(const BacktestConfig& config)
    : config_(config), aggregator_(config.aggregator), money_(config.money) {}

BacktestReport Backtester::run(std::span<const Candle> candles,
                               std::span<const strategy::Voter> voters) const {
    if (candles.size() <= config_.warmup_bars) {
        throw InsufficientData(fmt::format("backtest needs more than {} candles, got {}",
                                           config_.warmup_bars, candles.size()));
    }

    SCOPED_TIMER("backtest");

    BacktestReport report;
    report.symbol = candles.front().symbol;
    report.bars = candles.size();

    double capital = config_.initial_capital;
    std::vector<double> pnl_history;
    std::optional<order::Position> position;

    for (size_t i = config_.warmup_bars; i < candles.size(); ++i) {
        const auto window = candles.first(i + 1);
        const Candle& bar = candles[i];
        const double price = bar.close;

        const auto aggregate = aggregator_.aggregate(window, voters);
        if (aggregate.decision != Decision::Hold) ++report.signals;

        if (position) {
            auto exit = money_.evaluate_exit(*position, price);
            if (!exit && aggregate.decision != Decision::Hold &&
                side_of(aggregate.decision) != position->side) {
                exit = order::ExitReason::OppositeSignal;
            }
            if (exit) {
                BacktestTrade trade;
                trade.side = position->side;
                trade.quantity = position->quantity;
                trade.entry_price = position->entry_price;
                trade.exit_price = price;
                trade.entry_time = position->opened_at;
                trade.exit_time = bar.timestamp;
                trade.pnl = position->unrealized_pnl(price);
                trade.reason = *exit;

                capital += trade.pnl;
                pnl_history.push_back(trade.pnl);
                report.trades.push_back(trade);
                position.reset();
            }
            continue;
        }

        if (aggregate.decision == Decision::Hold) continue;

        double atr = 0.0;
        try {
            atr = strategy::latest_atr(window, config_.money.atr_period);
        } catch (const InsufficientData&) {
            continue;
        }

        const auto history = risk::compute_performance(config_.initial_capital, pnl_history);
        const auto sizing = money_.size_position(capital, price, atr, history);
        if (sizing.suppressed()) continue;

        const Side side = side_of(aggregate.decision);
        const auto levels = money_.levels(price, side, atr);

        order::Position opened;
        opened.symbol = bar.symbol;
        opened.side = side;
        opened.entry_price = price;
        opened.quantity = sizing.quantity;
        opened.stop_loss = levels.stop_loss;
        opened.take_profit = levels.take_profit;
        opened.trailing_peak = price;
        opened.opened_at = bar.timestamp;
        position = opened;
    }

    report.stats = risk::compute_performance(config_.initial_capital, pnl_history);
    report.final_capital = capital;
    report.open_position = position;

    LOG_INFO("Backtest {}: {} bars, {} trades, pnl {:.2f}, win rate {:.1f}%",
             report.symbol.view(), report.bars, report.stats.total_trades,
             report.stats.total_pnl, report.stats.win_rate);
    return report;
}

}  // namespace quorum::backtest
