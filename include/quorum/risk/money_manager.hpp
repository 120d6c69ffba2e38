#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Money Manager
// ============================================================================
// Position sizing, stop-loss / take-profit levels, trailing stop, daily gate
// Stateless over RiskState: the engine owns the state and serializes access
// ============================================================================

#include "quorum/order/records.hpp"
#include "quorum/risk/metrics.hpp"
#include "quorum/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace quorum::risk {

// ============================================================================
// Risk Parameters
// ============================================================================

struct MoneyConfig {
    double risk_per_trade_pct = 0.02;   // 2% of capital at risk per trade
    double atr_stop_multiple = 2.0;     // Stop distance = 2 x ATR
    double atr_target_multiple = 4.0;   // Target distance = 4 x ATR (2:1 R:R)
    size_t atr_period = 14;
    double trailing_stop_pct = 0.01;    // Exit on a 1% retrace from the peak

    // Daily gate
    double max_daily_loss_pct = 0.05;   // Of day-start capital
    int max_trades_per_day = 50;        // Per symbol

    // Half-Kelly sizing (opt-in)
    bool kelly_enabled = false;
    double kelly_fraction = 0.5;
    double kelly_max_fraction = 1.0;    // Ceiling on the sized fraction of capital
    size_t kelly_min_trades = 10;       // Closed trades before Kelly replaces ATR sizing
};

// ============================================================================
// Risk State (owned by the engine)
// ============================================================================

struct RiskState {
    double daily_pnl = 0.0;             // Net realized pnl today
    bool loss_limit_hit = false;        // Latched until the day rolls
    std::unordered_map<Symbol, int> trades_today;
    Timestamp day_start{};
    double day_start_capital = 0.0;

    [[nodiscard]] int trades_for(const Symbol& symbol) const {
        auto it = trades_today.find(symbol);
        return it == trades_today.end() ? 0 : it->second;
    }

    /// Net realized loss today, zero while the day is flat or up
    [[nodiscard]] double daily_loss() const noexcept {
        return daily_pnl < 0.0 ? -daily_pnl : 0.0;
    }

    [[nodiscard]] int total_trades() const {
        int total = 0;
        for (const auto& [symbol, count] : trades_today) total += count;
        return total;
    }
};

// ============================================================================
// Decisions
// ============================================================================

enum class SizingMethod : uint8_t {
    Atr,
    Kelly
};

struct SizingDecision {
    int64_t quantity = 0;
    double risk_amount = 0.0;
    double stop_distance = 0.0;
    SizingMethod method = SizingMethod::Atr;
    std::string reason;   // Why the trade was suppressed, empty otherwise

    [[nodiscard]] bool suppressed() const noexcept { return quantity <= 0; }
};

struct ExitLevels {
    double stop_loss = 0.0;
    double take_profit = 0.0;
};

enum class GateDecision : uint8_t {
    Approved,
    RejectedDailyLoss,
    RejectedMaxTrades
};

struct GateResult {
    GateDecision decision = GateDecision::Approved;
    std::string reason;

    [[nodiscard]] bool approved() const noexcept { return decision == GateDecision::Approved; }
};

// ============================================================================
// Money Manager
// ============================================================================

class MoneyManager {
public:
    explicit MoneyManager(const MoneyConfig& config = MoneyConfig{}) : config_(config) {}

    /// ATR sizing: floor(capital * risk% / (ATR * stop multiple)).
    /// Suppressed when the risk budget is below one stop distance.
    /// A positive `price` additionally caps quantity at floor(capital / price).
    [[nodiscard]] SizingDecision size_by_atr(double capital, double atr, double price = 0.0) const;

    /// Half-Kelly: capital * min(max(kelly, 0) * kelly_fraction, kelly_max_fraction) / price
    [[nodiscard]] SizingDecision size_by_kelly(double capital, double price,
                                               const PerformanceStats& history) const;

    /// Kelly when enabled and the history qualifies, ATR otherwise
    [[nodiscard]] SizingDecision size_position(double capital, double price, double atr,
                                               const PerformanceStats& history) const;

    /// (winRate * avgWin - lossRate * avgLoss) / avgWin, unclamped; 0 without wins
    [[nodiscard]] static double kelly(const PerformanceStats& history) noexcept;

    /// Stop = entry -/+ stop multiple * ATR, target = entry +/- target multiple * ATR
    [[nodiscard]] ExitLevels levels(double entry, Side side, double atr) const noexcept;

    /// Move the trailing peak favorably, then check take-profit, stop-loss and
    /// trailing stop in that order. The first hit wins.
    [[nodiscard]] std::optional<order::ExitReason> evaluate_exit(order::Position& position,
                                                                 double price) const noexcept;

    /// Daily gate for a new open on `symbol`. The loss limit compares the net
    /// realized loss and, once reached, holds for the rest of the day
    [[nodiscard]] GateResult check_gate(const RiskState& state, const Symbol& symbol) const;

    void record_open(RiskState& state, const Symbol& symbol) const;
    void record_close(RiskState& state, double pnl) const;

    /// Clear the daily counters and rebase the loss limit on `capital`
    void roll_day(RiskState& state, Timestamp day_start, double capital) const;

    [[nodiscard]] const MoneyConfig& config() const noexcept { return config_; }

private:
    MoneyConfig config_;
};

}  // namespace quorum::risk
