#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Scan Engine (Orchestrator)
// ============================================================================
// Background scan loop: market-hours gate, per-symbol fan-out on a worker
// pool, exit-before-entry per symbol, bounded signal log, status queries
//
//   [loop thread] --tick--> [thread_pool] --per symbol--> fetch -> vote ->
//        ^                                   exit | gate+size+open -> log
//        '---- wait_for(stop_cv, scan or closed interval) <----'
//
// Lock order: risk mutex before ledger mutex
// ============================================================================

#include "quorum/engine/engine_config.hpp"
#include "quorum/engine/market_hours.hpp"
#include "quorum/engine/signal.hpp"
#include "quorum/core/ring_buffer.hpp"
#include "quorum/market/data_source.hpp"
#include "quorum/order/order_router.hpp"
#include "quorum/order/position_ledger.hpp"
#include "quorum/risk/metrics.hpp"
#include "quorum/risk/money_manager.hpp"
#include "quorum/storage/credential_store.hpp"
#include "quorum/storage/strategy_store.hpp"
#include "quorum/storage/trade_store.hpp"
#include "quorum/strategy/indicators/bollinger.hpp"
#include "quorum/strategy/indicators/macd.hpp"
#include "quorum/strategy/indicators/oscillators.hpp"
#include "quorum/strategy/indicators/patterns.hpp"
#include "quorum/strategy/indicators/volatility.hpp"
#include "quorum/strategy/signal_aggregator.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace quorum::engine {

// ============================================================================
// Status Types
// ============================================================================

struct EngineSnapshot {
    bool running = false;
    EngineMode mode = EngineMode::Simulation;
    uint64_t scan_count = 0;                   // Completed active ticks since start
    double capital = 0.0;                      // Initial capital + realized pnl
    double daily_pnl = 0.0;
    size_t open_positions = 0;
    std::optional<Timestamp> last_scan_at;

    std::string user_id;
    bool market_open = false;
    std::vector<std::string> active_voters;
    std::vector<Symbol> symbols;
    int trades_today = 0;
    size_t signals_in_memory = 0;
    std::map<Symbol, std::string> last_errors; // Only symbols whose last scan failed
};

struct TickResult {
    bool market_open = false;
    size_t scanned = 0;
    Duration next_sleep{};
};

/// Indicator readings for an on-demand preview; absent when the window is too short
struct IndicatorSnapshot {
    std::optional<double> sma_short;
    std::optional<double> sma_long;
    std::optional<double> rsi;
    std::optional<strategy::MacdValue> macd;
    std::optional<strategy::BandValue> bollinger;
    std::optional<double> atr;
    std::optional<double> adx;
    std::optional<strategy::StochasticValue> stochastic;
    std::optional<double> williams_r;
    std::optional<double> vwap;
    std::optional<strategy::SuperTrendValue> supertrend;
    std::optional<strategy::PatternFlags> patterns;
};

struct SignalPreview {
    Symbol symbol;
    Timestamp at{};
    strategy::AggregateResult aggregate;
    double price = 0.0;
    int64_t quantity = 0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    std::string sizing_note;                   // Why quantity is zero, if it is
    IndicatorSnapshot indicators;
    std::optional<order::Position> open_position;
};

// ============================================================================
// Scan Engine
// ============================================================================

class ScanEngine {
public:
    /// Picks the data source for the starting user. Default: live when
    /// credentials exist and the token exchange succeeds, simulation otherwise
    using DataSourceFactory = std::function<std::unique_ptr<market::IMarketDataSource>(
        const std::optional<storage::Credentials>&)>;

    /// Throws PersistenceFailure if the trade store cannot be read
    ScanEngine(EngineConfig config,
               storage::IStrategyStore& strategies,
               storage::ITradeStore& trades,
               storage::CredentialStore credentials,
               order::IOrderRouter& router,
               Clock clock = now,
               DataSourceFactory source_factory = {});

    ~ScanEngine();

    ScanEngine(const ScanEngine&) = delete;
    ScanEngine& operator=(const ScanEngine&) = delete;

    // ========================================================================
    // Control
    // ========================================================================

    /// Prepare and spawn the loop. Idempotent while running.
    /// Returns false, and stays stopped, on fatal misconfiguration.
    bool start(std::optional<std::string> user_id = std::nullopt);

    /// Signal the loop and join it. Idempotent
    void stop();

    /// Load voters, bind the data source and reset scanCount without
    /// spawning the loop. start() calls this
    bool prepare(std::optional<std::string> user_id = std::nullopt);

    /// One pass of the loop body. Exposed for drivers that own the cadence
    TickResult run_tick();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] EngineSnapshot snapshot() const;

    /// Most recent signals, oldest first. limit == 0 returns everything retained
    [[nodiscard]] std::vector<WeightedSignal> signals(std::optional<Symbol> symbol = std::nullopt,
                                                      size_t limit = 0) const;

    [[nodiscard]] risk::PerformanceStats risk_metrics() const;

    /// Vote, size and read indicators for one symbol without trading.
    /// Throws DataSourceUnavailable.
    [[nodiscard]] SignalPreview preview(const Symbol& symbol);

    [[nodiscard]] double capital() const;

    /// Capital less the entry notional of every open position
    [[nodiscard]] double available_capital() const;
    [[nodiscard]] risk::RiskState risk_state() const;
    [[nodiscard]] const order::PositionLedger& ledger() const noexcept { return ledger_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    void run_loop();
    void roll_day_if_needed(Timestamp at);
    void reload_voters();

    /// Returns false when abandoned because stop was requested before the fetch
    bool scan_symbol(const Symbol& symbol,
                     const std::vector<strategy::Voter>& voters,
                     const std::shared_ptr<market::IMarketDataSource>& source,
                     Timestamp at);

    void manage_position(const order::Position& position, const strategy::AggregateResult& aggregate,
                         double price, Timestamp at, WeightedSignal& signal);

    void try_open(std::span<const Candle> candles, const strategy::AggregateResult& aggregate,
                  double price, Timestamp at, WeightedSignal& signal);

    void record_error(const Symbol& symbol, const std::string& message);
    void clear_error(const Symbol& symbol);

    [[nodiscard]] std::shared_ptr<market::IMarketDataSource> data_source();
    [[nodiscard]] std::unique_ptr<market::IMarketDataSource> make_source(
        const std::optional<storage::Credentials>& credentials);

    EngineConfig config_;
    storage::IStrategyStore& strategies_;
    storage::CredentialStore credentials_;
    order::IOrderRouter& router_;
    Clock clock_;
    DataSourceFactory source_factory_;

    MarketHours hours_;
    strategy::SignalAggregator aggregator_;
    risk::MoneyManager money_;
    order::PositionLedger ledger_;
    OverwritingRingBuffer<WeightedSignal> signals_;
    boost::asio::thread_pool pool_;

    // Session state: voters, source, snapshot, errors
    mutable std::mutex state_mutex_;
    std::vector<strategy::Voter> voters_;
    std::shared_ptr<market::IMarketDataSource> source_;
    EngineSnapshot snapshot_;

    // Daily gate state
    mutable std::mutex risk_mutex_;
    risk::RiskState risk_;

    // Loop control
    std::mutex control_mutex_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

}  // namespace quorum::engine
