#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Engine Configuration
// ============================================================================

#include "quorum/engine/market_hours.hpp"
#include "quorum/market/data_source.hpp"
#include "quorum/market/live_data_source.hpp"
#include "quorum/risk/money_manager.hpp"
#include "quorum/strategy/signal_aggregator.hpp"
#include "quorum/core/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace quorum::engine {

/// NSE large caps scanned when no universe is configured
[[nodiscard]] inline std::vector<Symbol> default_symbols() {
    return {Symbol("RELIANCE"), Symbol("TCS"),       Symbol("HDFCBANK"), Symbol("INFY"),
            Symbol("ICICIBANK"), Symbol("HINDUNILVR"), Symbol("SBIN"),     Symbol("BHARTIARTL"),
            Symbol("KOTAKBANK"), Symbol("ITC")};
}

struct EngineConfig {
    std::string user_id = "default";
    double initial_capital = 100000.0;
    std::vector<Symbol> symbols = default_symbols();

    std::chrono::milliseconds scan_interval{5000};      // While the market is open
    std::chrono::milliseconds closed_interval{60000};   // Re-check cadence while closed
    size_t candle_count = 100;                          // Window fetched per symbol per tick
    size_t worker_threads = 4;                          // Capped at the number of symbols
    size_t signal_log_capacity = 500;

    MarketHoursConfig market_hours;
    risk::MoneyConfig money;
    strategy::AggregatorConfig aggregator;
    market::SimulationConfig simulation;
    market::BrokerConfig broker;
};

}  // namespace quorum::engine
