// ============================================================================
// QUORUM SCAN ENGINE - Simulated Data Source Implementation
// ============================================================================

#include "quorum/market/data_source.hpp"
#include "quorum/utils/logger.hpp"

#include <algorithm>
#include <cmath>

namespace quorum::market {

uint64_t symbol_hash(std::string_view symbol) noexcept {
    uint64_t hash = 14695981039346656037ULL;
    for (char c : symbol) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

SimulatedDataSource::SimulatedDataSource(const SimulationConfig& config, Clock clock)
    : config_(config), clock_(std::move(clock)) {}

double SimulatedDataSource::base_price(const Symbol& symbol) const noexcept {
    const uint64_t range = std::max<uint64_t>(config_.base_price_range, 1);
    return config_.base_price_min + static_cast<double>(symbol_hash(symbol.view()) % range);
}

std::vector<Candle> SimulatedDataSource::fetch_candles(const Symbol& symbol, size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = series_.find(symbol);
    if (it == series_.end()) {
        series_for(symbol, count);
        it = series_.find(symbol);
    } else {
        const Timestamp next = it->second.bars.back().timestamp + config_.bar_interval;
        append_bar(symbol, it->second, next);
    }

    const auto& bars = it->second.bars;
    const size_t n = std::min(count, bars.size());
    return std::vector<Candle>(bars.end() - static_cast<std::ptrdiff_t>(n), bars.end());
}

SimulatedDataSource::Series& SimulatedDataSource::series_for(const Symbol& symbol, size_t count) {
    Series series;
    series.rng.seed(symbol_hash(symbol.view()) ^ config_.seed);
    series.base = base_price(symbol);

    // Backfill so the newest bar is the one containing the current time
    const size_t backfill = std::max<size_t>(std::min(count, config_.history_bars), 1);
    const auto interval = std::chrono::duration_cast<Duration>(config_.bar_interval);
    const auto current = clock_();
    const Timestamp newest{(current.time_since_epoch() / interval) * interval};
    const Timestamp oldest = newest - interval * static_cast<int64_t>(backfill - 1);

    for (size_t i = 0; i < backfill; ++i) {
        append_bar(symbol, series, oldest + interval * static_cast<int64_t>(i));
    }

    LOG_DEBUG("Simulated series for {} anchored at {:.2f} ({} bars)",
              symbol.view(), series.base, backfill);
    return series_.emplace(symbol, std::move(series)).first->second;
}

void SimulatedDataSource::append_bar(const Symbol& symbol, Series& series, Timestamp timestamp) {
    std::normal_distribution<double> returns(0.0, config_.volatility);
    std::uniform_real_distribution<double> wick(0.0, config_.wick_pct);
    std::uniform_int_distribution<int64_t> volume(config_.volume_min, config_.volume_max);

    const double floor_price = series.base * (1.0 - config_.bound);
    const double cap_price = series.base * (1.0 + config_.bound);

    const double open = series.bars.empty() ? series.base : series.bars.back().close;
    const double close = std::clamp(open * (1.0 + returns(series.rng)), floor_price, cap_price);

    Candle candle;
    candle.symbol = symbol;
    candle.timestamp = timestamp;
    candle.open = open;
    candle.close = close;
    candle.high = std::max(open, close) * (1.0 + wick(series.rng));
    candle.low = std::min(open, close) * (1.0 - wick(series.rng));
    candle.volume = static_cast<double>(volume(series.rng));

    series.bars.push_back(candle);
    while (series.bars.size() > std::max<size_t>(config_.history_bars, 1)) {
        series.bars.pop_front();
    }
}

}  // namespace quorum::market
