#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Position & Trade Records
// ============================================================================

#include "quorum/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace quorum::order {

enum class TradeStatus : uint8_t {
    Pending = 0,
    Executed = 1,
    Failed = 2
};

[[nodiscard]] constexpr std::string_view to_string(TradeStatus status) noexcept {
    switch (status) {
        case TradeStatus::Pending:  return "PENDING";
        case TradeStatus::Executed: return "EXECUTED";
        case TradeStatus::Failed:   return "FAILED";
    }
    return "PENDING";
}

enum class ExitReason : uint8_t {
    TakeProfit,
    StopLoss,
    TrailingStop,
    OppositeSignal,
    Manual
};

[[nodiscard]] constexpr std::string_view to_string(ExitReason reason) noexcept {
    switch (reason) {
        case ExitReason::TakeProfit:     return "TAKE_PROFIT";
        case ExitReason::StopLoss:       return "STOP_LOSS";
        case ExitReason::TrailingStop:   return "TRAILING_STOP";
        case ExitReason::OppositeSignal: return "OPPOSITE_SIGNAL";
        case ExitReason::Manual:         return "MANUAL";
    }
    return "MANUAL";
}

/// Open position. At most one per symbol
struct Position {
    Symbol symbol;
    Side side = Side::Buy;
    double entry_price = 0.0;
    int64_t quantity = 0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    double trailing_peak = 0.0;  // Most favorable price seen; starts at entry
    Timestamp opened_at{};
    std::string strategy_id;
    uint64_t trade_id = 0;       // Trade record created by the open

    [[nodiscard]] double unrealized_pnl(double price) const noexcept {
        return (price - entry_price) * static_cast<double>(quantity) * direction(side);
    }
};

/// Trade record. pnl and the exit fields are set when the position closes
struct Trade {
    uint64_t id = 0;
    Symbol symbol;
    Side side = Side::Buy;
    int64_t quantity = 0;
    double price = 0.0;
    TradeStatus status = TradeStatus::Pending;
    Timestamp timestamp{};
    std::string strategy_id;
    std::optional<double> pnl;
    std::optional<double> exit_price;
    std::optional<Timestamp> exit_timestamp;
    std::string exit_reason;

    [[nodiscard]] bool is_closed() const noexcept { return pnl.has_value(); }
};

}  // namespace quorum::order
