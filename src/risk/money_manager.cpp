// ============================================================================
// QUORUM SCAN ENGINE - Money Manager Implementation
// ============================================================================

#include "quorum/risk/money_manager.hpp"
#include "quorum/utils/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace quorum::risk {

namespace {

// Price comparisons tolerate representation error on exact level hits
constexpr double kEpsilon = 1e-9;

}  // namespace

// ============================================================================
// Sizing
// ============================================================================

SizingDecision MoneyManager::size_by_atr(double capital, double atr, double price) const {
    SizingDecision decision;
    decision.method = SizingMethod::Atr;
    decision.risk_amount = capital * config_.risk_per_trade_pct;
    decision.stop_distance = atr * config_.atr_stop_multiple;

    if (!(decision.stop_distance > 0.0) || !std::isfinite(decision.stop_distance)) {
        decision.reason = "non-positive stop distance";
        return decision;
    }
    if (decision.risk_amount < decision.stop_distance) {
        decision.reason = fmt::format("risk budget {:.2f} below stop distance {:.2f}",
                                      decision.risk_amount, decision.stop_distance);
        return decision;
    }

    auto quantity = static_cast<int64_t>(std::floor(decision.risk_amount / decision.stop_distance));
    if (price > 0.0) {
        quantity = std::min(quantity, static_cast<int64_t>(std::floor(capital / price)));
        if (quantity <= 0) {
            decision.reason = fmt::format("capital {:.2f} cannot cover one share at {:.2f}",
                                          capital, price);
            return decision;
        }
    }
    decision.quantity = quantity;
    return decision;
}

double MoneyManager::kelly(const PerformanceStats& history) noexcept {
    if (history.total_trades == 0 || history.avg_win <= 0.0) return 0.0;

    const double win_rate = history.win_rate / 100.0;
    const double loss_rate = 1.0 - win_rate;
    return (win_rate * history.avg_win - loss_rate * history.avg_loss) / history.avg_win;
}

SizingDecision MoneyManager::size_by_kelly(double capital, double price,
                                           const PerformanceStats& history) const {
    SizingDecision decision;
    decision.method = SizingMethod::Kelly;

    if (price <= 0.0) {
        decision.reason = "non-positive price";
        return decision;
    }

    const double fraction = std::min(std::max(kelly(history), 0.0) * config_.kelly_fraction,
                                     config_.kelly_max_fraction);
    const double position_value = capital * fraction;
    decision.risk_amount = position_value;
    decision.quantity = static_cast<int64_t>(std::floor(position_value / price));
    if (decision.quantity <= 0) {
        decision.quantity = 0;
        decision.reason = fmt::format("kelly fraction {:.4f} sizes below one share", fraction);
    }
    return decision;
}

SizingDecision MoneyManager::size_position(double capital, double price, double atr,
                                           const PerformanceStats& history) const {
    const bool kelly_ready = config_.kelly_enabled &&
                             history.total_trades >= config_.kelly_min_trades &&
                             history.avg_win > 0.0;
    if (kelly_ready) {
        auto decision = size_by_kelly(capital, price, history);
        decision.stop_distance = atr * config_.atr_stop_multiple;
        return decision;
    }
    return size_by_atr(capital, atr, price);
}

// ============================================================================
// Levels & Exits
// ============================================================================

ExitLevels MoneyManager::levels(double entry, Side side, double atr) const noexcept {
    const double dir = direction(side);
    return ExitLevels{
        entry - dir * atr * config_.atr_stop_multiple,
        entry + dir * atr * config_.atr_target_multiple,
    };
}

std::optional<order::ExitReason> MoneyManager::evaluate_exit(order::Position& position,
                                                             double price) const noexcept {
    const bool is_long = position.side == Side::Buy;

    // Peak only ever moves in the favorable direction
    if (is_long) {
        position.trailing_peak = std::max(position.trailing_peak, price);
    } else {
        position.trailing_peak = std::min(position.trailing_peak, price);
    }

    if (is_long) {
        if (price >= position.take_profit - kEpsilon) return order::ExitReason::TakeProfit;
        if (price <= position.stop_loss + kEpsilon) return order::ExitReason::StopLoss;
    } else {
        if (price <= position.take_profit + kEpsilon) return order::ExitReason::TakeProfit;
        if (price >= position.stop_loss - kEpsilon) return order::ExitReason::StopLoss;
    }

    // Trailing stop arms only after the position has been in profit
    const double peak = position.trailing_peak;
    const double retrace = peak * config_.trailing_stop_pct;
    if (is_long && peak > position.entry_price + kEpsilon) {
        if (price <= peak - retrace + kEpsilon) return order::ExitReason::TrailingStop;
    } else if (!is_long && peak < position.entry_price - kEpsilon) {
        if (price >= peak + retrace - kEpsilon) return order::ExitReason::TrailingStop;
    }

    return std::nullopt;
}

// ============================================================================
// Daily Gate
// ============================================================================

GateResult MoneyManager::check_gate(const RiskState& state, const Symbol& symbol) const {
    GateResult result;

    const double loss_limit = state.day_start_capital * config_.max_daily_loss_pct;
    const double loss = state.daily_loss();
    if (state.loss_limit_hit || (loss > 0.0 && loss >= loss_limit)) {
        result.decision = GateDecision::RejectedDailyLoss;
        result.reason = fmt::format("daily loss {:.2f} reached limit {:.2f}",
                                    loss, loss_limit);
        return result;
    }

    const int trades = state.trades_for(symbol);
    if (trades >= config_.max_trades_per_day) {
        result.decision = GateDecision::RejectedMaxTrades;
        result.reason = fmt::format("{} trades today on {} (max {})",
                                    trades, symbol.view(), config_.max_trades_per_day);
        return result;
    }

    return result;
}

void MoneyManager::record_open(RiskState& state, const Symbol& symbol) const {
    ++state.trades_today[symbol];
}

void MoneyManager::record_close(RiskState& state, double pnl) const {
    state.daily_pnl += pnl;
    const double loss = state.daily_loss();
    if (!state.loss_limit_hit && loss > 0.0 &&
        loss >= state.day_start_capital * config_.max_daily_loss_pct) {
        state.loss_limit_hit = true;
        LOG_WARN("Daily loss limit reached: {:.2f} of {:.2f}, entries halted until rollover",
                 loss, state.day_start_capital * config_.max_daily_loss_pct);
    }
}

void MoneyManager::roll_day(RiskState& state, Timestamp day_start, double capital) const {
    state.daily_pnl = 0.0;
    state.loss_limit_hit = false;
    state.trades_today.clear();
    state.day_start = day_start;
    state.day_start_capital = capital;
}

}  // namespace quorum::risk
