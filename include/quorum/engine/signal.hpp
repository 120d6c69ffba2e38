#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Signal Log Entries
// ============================================================================
// One WeightedSignal per symbol per scan, immutable once appended
// ============================================================================

#include "quorum/strategy/signal_aggregator.hpp"
#include "quorum/core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace quorum::engine {

/// What the engine did with the decision
enum class SignalAction : uint8_t {
    Hold,               // No directional decision, nothing open
    TradeExecuted,      // Position opened
    PositionClosed,     // Exit rule or opposite signal closed the position
    AlreadyInPosition,  // Position open, no exit fired
    Blocked,            // Daily gate rejected the open
    Suppressed,         // Sizing produced no tradable quantity
    ExecutionFailed,    // Router rejected the order
    DataUnavailable     // Fetch failed; decision is Hold
};

[[nodiscard]] constexpr std::string_view to_string(SignalAction action) noexcept {
    switch (action) {
        case SignalAction::Hold:              return "HOLD";
        case SignalAction::TradeExecuted:     return "TRADE_EXECUTED";
        case SignalAction::PositionClosed:    return "POSITION_CLOSED";
        case SignalAction::AlreadyInPosition: return "ALREADY_IN_POSITION";
        case SignalAction::Blocked:           return "BLOCKED";
        case SignalAction::Suppressed:        return "SUPPRESSED";
        case SignalAction::ExecutionFailed:   return "EXECUTION_FAILED";
        case SignalAction::DataUnavailable:   return "DATA_UNAVAILABLE";
    }
    return "HOLD";
}

struct WeightedSignal {
    Symbol symbol;
    Timestamp timestamp{};
    std::vector<strategy::Ballot> votes;
    double score = 0.0;
    Decision decision = Decision::Hold;
    double confidence = 0.0;

    double price = 0.0;          // Latest close
    int64_t quantity = 0;        // Sized quantity, or the open position's
    double stop_loss = 0.0;
    double take_profit = 0.0;
    SignalAction action = SignalAction::Hold;
    std::string detail;          // Exit reason and pnl, block reason, error text
};

}  // namespace quorum::engine
