#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Market Data Source
// ============================================================================
// Produces OHLCV windows per symbol, oldest first, strictly increasing
// timestamps at a fixed bar interval
// ============================================================================

#include "quorum/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <random>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quorum::market {

class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    /// Latest `count` candles (fewer if the source has less history).
    /// Throws DataSourceUnavailable when the source cannot be reached.
    [[nodiscard]] virtual std::vector<Candle> fetch_candles(const Symbol& symbol, size_t count) = 0;

    [[nodiscard]] virtual EngineMode mode() const noexcept = 0;
};

// ============================================================================
// Simulated Source
// ============================================================================

struct SimulationConfig {
    uint64_t seed = 0;                               // Mixed into the per-symbol seed
    double volatility = 0.001;                       // Sigma of per-bar returns
    double bound = 0.5;                              // Close stays within base * (1 +/- bound)
    std::chrono::minutes bar_interval{5};
    size_t history_bars = 500;                       // Bars retained per symbol

    double base_price_min = 1000.0;                  // Base = min + hash % range
    uint64_t base_price_range = 5000;
    double wick_pct = 0.01;                          // High/low extend up to 1% past the body
    int64_t volume_min = 1000;
    int64_t volume_max = 100000;
};

/// Bounded random walk. The first fetch for a symbol backfills its history
/// ending at the current bar; every later fetch appends exactly one bar.
/// Identical seeds give identical series.
class SimulatedDataSource : public IMarketDataSource {
public:
    explicit SimulatedDataSource(const SimulationConfig& config = SimulationConfig{},
                                 Clock clock = now);

    [[nodiscard]] std::vector<Candle> fetch_candles(const Symbol& symbol, size_t count) override;

    [[nodiscard]] EngineMode mode() const noexcept override { return EngineMode::Simulation; }

    /// Base price the walk for `symbol` is anchored to
    [[nodiscard]] double base_price(const Symbol& symbol) const noexcept;

private:
    struct Series {
        std::mt19937_64 rng;
        double base = 0.0;
        std::deque<Candle> bars;
    };

    Series& series_for(const Symbol& symbol, size_t count);
    void append_bar(const Symbol& symbol, Series& series, Timestamp timestamp);

    SimulationConfig config_;
    Clock clock_;
    std::mutex mutex_;
    std::unordered_map<Symbol, Series> series_;
};

/// FNV-1a over the symbol text
[[nodiscard]] uint64_t symbol_hash(std::string_view symbol) noexcept;

}  // namespace quorum::market
