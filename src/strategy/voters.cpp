// ============================================================================
// QUORUM SCAN ENGINE - Strategy Voters Implementation
// ============================================================================

#include "quorum/strategy/voters.hpp"
#include "quorum/strategy/indicators/series.hpp"
#include "quorum/core/error.hpp"
#include "quorum/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace quorum::strategy {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// a crossed above b between the previous and the current bar
bool crossed_above(double prev_a, double prev_b, double cur_a, double cur_b) {
    return prev_a <= prev_b && cur_a > cur_b;
}

/// a crossed below b between the previous and the current bar
bool crossed_below(double prev_a, double prev_b, double cur_a, double cur_b) {
    return prev_a >= prev_b && cur_a < cur_b;
}

Vote crossover_vote(const Trailing<double>& fast, const Trailing<double>& slow) {
    if (crossed_above(fast.previous, slow.previous, fast.current, slow.current)) return Vote::Buy;
    if (crossed_below(fast.previous, slow.previous, fast.current, slow.current)) return Vote::Sell;
    return Vote::Hold;
}

size_t as_period(double value, const char* key) {
    if (!std::isfinite(value) || value < 1.0) {
        throw std::invalid_argument(std::string(key) + " must be a positive integer");
    }
    return static_cast<size_t>(std::llround(value));
}

template <typename Setter>
void apply(const std::map<std::string, double>& overrides, const char* key, Setter&& set) {
    if (auto it = overrides.find(key); it != overrides.end()) {
        set(it->second);
    }
}

// ============================================================================
// Voter Rules
// ============================================================================

Vote vote(std::span<const Candle> candles, const SmaCrossParams& p) {
    return crossover_vote(trailing_sma(candles, p.short_window),
                          trailing_sma(candles, p.long_window));
}

Vote vote(std::span<const Candle> candles, const EmaCrossParams& p) {
    return crossover_vote(trailing_ema(candles, p.short_window),
                          trailing_ema(candles, p.long_window));
}

Vote vote(std::span<const Candle> candles, const RsiParams& p) {
    const auto rsi = trailing_rsi(candles, p.period);
    if (rsi.previous >= p.oversold && rsi.current < p.oversold) return Vote::Buy;
    if (rsi.previous <= p.overbought && rsi.current > p.overbought) return Vote::Sell;
    return Vote::Hold;
}

Vote vote(std::span<const Candle> candles, const MacdParams& p) {
    const auto macd = trailing_macd(candles, p.fast, p.slow, p.signal);
    if (crossed_above(macd.previous.macd, macd.previous.signal,
                      macd.current.macd, macd.current.signal)) {
        return Vote::Buy;
    }
    if (crossed_below(macd.previous.macd, macd.previous.signal,
                      macd.current.macd, macd.current.signal)) {
        return Vote::Sell;
    }
    return Vote::Hold;
}

Vote vote(std::span<const Candle> candles, const BollingerParams& p) {
    const auto bands = trailing_bollinger(candles, p.period, p.std_dev);
    const double prev_close = candles[candles.size() - 2].close;
    const double close = candles.back().close;

    if (prev_close >= bands.previous.lower && close < bands.current.lower) return Vote::Buy;
    if (prev_close <= bands.previous.upper && close > bands.current.upper) return Vote::Sell;
    return Vote::Hold;
}

Vote vote(std::span<const Candle> candles, const VwapParams& p) {
    const auto vwap = trailing_vwap(candles, p.session_offset);
    const double avg_volume = average_volume(candles, p.volume_period);
    const double prev_close = candles[candles.size() - 2].close;
    const Candle& last = candles.back();

    if (crossed_above(prev_close, vwap.previous, last.close, vwap.current) &&
        last.volume >= p.volume_multiple * avg_volume) {
        return Vote::Buy;
    }
    if (crossed_below(prev_close, vwap.previous, last.close, vwap.current)) {
        return Vote::Sell;
    }
    return Vote::Hold;
}

Vote vote(std::span<const Candle> candles, const SuperTrendParams& p) {
    const auto st = trailing_supertrend(candles, p.period, p.multiplier);
    if (st.previous.direction == -1 && st.current.direction == 1) return Vote::Buy;
    if (st.previous.direction == 1 && st.current.direction == -1) return Vote::Sell;
    return Vote::Hold;
}

Vote vote(std::span<const Candle> candles, const StochRsiParams& p) {
    const double rsi = trailing_rsi(candles, p.rsi_period).current;
    const double k = trailing_stochastic(candles, p.stoch_period).current.k;

    if (rsi < p.rsi_oversold && k < p.k_oversold) return Vote::Buy;
    if (rsi > p.rsi_overbought && k > p.k_overbought) return Vote::Sell;
    return Vote::Hold;
}

}  // namespace

// ============================================================================
// Kinds
// ============================================================================

std::string_view to_string(VoterKind kind) noexcept {
    switch (kind) {
        case VoterKind::SmaCross:   return "ma_crossover";
        case VoterKind::EmaCross:   return "ema_crossover";
        case VoterKind::Rsi:        return "rsi";
        case VoterKind::Macd:       return "macd";
        case VoterKind::Bollinger:  return "bollinger";
        case VoterKind::Vwap:       return "vwap";
        case VoterKind::SuperTrend: return "supertrend";
        case VoterKind::StochRsi:   return "stoch_rsi";
    }
    return "unknown";
}

std::optional<VoterKind> parse_voter_kind(std::string_view key) {
    const std::string lower = to_lower(key);
    for (VoterKind kind : ALL_VOTER_KINDS) {
        if (lower == to_string(kind)) return kind;
    }
    return std::nullopt;
}

std::optional<VoterKind> voter_kind_from_name(std::string_view name) {
    static const std::pair<std::string_view, VoterKind> keywords[] = {
        {"moving average", VoterKind::SmaCross},
        {"ema crossover", VoterKind::EmaCross},
        {"macd", VoterKind::Macd},
        {"stochastic", VoterKind::StochRsi},
        {"bollinger", VoterKind::Bollinger},
        {"supertrend", VoterKind::SuperTrend},
        {"vwap", VoterKind::Vwap},
        {"rsi", VoterKind::Rsi},
    };

    const std::string lower = to_lower(name);
    for (const auto& [keyword, kind] : keywords) {
        if (lower.find(keyword) != std::string::npos) return kind;
    }
    return std::nullopt;
}

double default_weight(VoterKind kind) noexcept {
    switch (kind) {
        case VoterKind::SmaCross:   return 1.0;
        case VoterKind::EmaCross:   return 1.0;
        case VoterKind::Rsi:        return 0.8;
        case VoterKind::Macd:       return 1.0;
        case VoterKind::Bollinger:  return 0.7;
        case VoterKind::Vwap:       return 0.9;
        case VoterKind::SuperTrend: return 1.2;
        case VoterKind::StochRsi:   return 0.8;
    }
    return 1.0;
}

// ============================================================================
// Parameters
// ============================================================================

VoterKind kind_of(const VoterParams& params) noexcept {
    return std::visit(Overloaded{
        [](const SmaCrossParams&) { return VoterKind::SmaCross; },
        [](const EmaCrossParams&) { return VoterKind::EmaCross; },
        [](const RsiParams&) { return VoterKind::Rsi; },
        [](const MacdParams&) { return VoterKind::Macd; },
        [](const BollingerParams&) { return VoterKind::Bollinger; },
        [](const VwapParams&) { return VoterKind::Vwap; },
        [](const SuperTrendParams&) { return VoterKind::SuperTrend; },
        [](const StochRsiParams&) { return VoterKind::StochRsi; },
    }, params);
}

VoterParams default_params(VoterKind kind) {
    switch (kind) {
        case VoterKind::SmaCross:   return SmaCrossParams{};
        case VoterKind::EmaCross:   return EmaCrossParams{};
        case VoterKind::Rsi:        return RsiParams{};
        case VoterKind::Macd:       return MacdParams{};
        case VoterKind::Bollinger:  return BollingerParams{};
        case VoterKind::Vwap:       return VwapParams{};
        case VoterKind::SuperTrend: return SuperTrendParams{};
        case VoterKind::StochRsi:   return StochRsiParams{};
    }
    return SmaCrossParams{};
}

VoterParams make_params(VoterKind kind, const std::map<std::string, double>& overrides) {
    VoterParams params = default_params(kind);

    std::visit(Overloaded{
        [&](SmaCrossParams& p) {
            apply(overrides, "shortWindow", [&](double v) { p.short_window = as_period(v, "shortWindow"); });
            apply(overrides, "longWindow", [&](double v) { p.long_window = as_period(v, "longWindow"); });
        },
        [&](EmaCrossParams& p) {
            apply(overrides, "shortWindow", [&](double v) { p.short_window = as_period(v, "shortWindow"); });
            apply(overrides, "longWindow", [&](double v) { p.long_window = as_period(v, "longWindow"); });
        },
        [&](RsiParams& p) {
            apply(overrides, "rsiPeriod", [&](double v) { p.period = as_period(v, "rsiPeriod"); });
            apply(overrides, "oversold", [&](double v) { p.oversold = v; });
            apply(overrides, "overbought", [&](double v) { p.overbought = v; });
        },
        [&](MacdParams& p) {
            apply(overrides, "fast", [&](double v) { p.fast = as_period(v, "fast"); });
            apply(overrides, "slow", [&](double v) { p.slow = as_period(v, "slow"); });
            apply(overrides, "signal", [&](double v) { p.signal = as_period(v, "signal"); });
        },
        [&](BollingerParams& p) {
            apply(overrides, "period", [&](double v) { p.period = as_period(v, "period"); });
            apply(overrides, "stdDev", [&](double v) { p.std_dev = v; });
        },
        [&](VwapParams& p) {
            apply(overrides, "volumeThreshold", [&](double v) { p.volume_multiple = v; });
            apply(overrides, "volumePeriod", [&](double v) { p.volume_period = as_period(v, "volumePeriod"); });
        },
        [&](SuperTrendParams& p) {
            apply(overrides, "period", [&](double v) { p.period = as_period(v, "period"); });
            apply(overrides, "multiplier", [&](double v) { p.multiplier = v; });
        },
        [&](StochRsiParams& p) {
            apply(overrides, "rsiPeriod", [&](double v) { p.rsi_period = as_period(v, "rsiPeriod"); });
            apply(overrides, "stochPeriod", [&](double v) { p.stoch_period = as_period(v, "stochPeriod"); });
        },
    }, params);

    validate(params);
    return params;
}

void validate(const VoterParams& params) {
    const auto require = [](bool ok, const char* message) {
        if (!ok) throw std::invalid_argument(message);
    };

    std::visit(Overloaded{
        [&](const SmaCrossParams& p) {
            require(p.short_window > 0 && p.short_window < p.long_window,
                    "SMA crossover needs 0 < shortWindow < longWindow");
        },
        [&](const EmaCrossParams& p) {
            require(p.short_window > 0 && p.short_window < p.long_window,
                    "EMA crossover needs 0 < shortWindow < longWindow");
        },
        [&](const RsiParams& p) {
            require(p.period > 0, "RSI period must be positive");
            require(p.oversold < p.overbought, "RSI oversold must be below overbought");
        },
        [&](const MacdParams& p) {
            require(p.fast > 0 && p.signal > 0 && p.fast < p.slow,
                    "MACD needs 0 < fast < slow and a positive signal period");
        },
        [&](const BollingerParams& p) {
            require(p.period > 0 && p.std_dev > 0.0, "Bollinger needs positive period and stdDev");
        },
        [&](const VwapParams& p) {
            require(p.volume_period > 0 && p.volume_multiple >= 0.0,
                    "VWAP needs a positive volume period and non-negative volume threshold");
        },
        [&](const SuperTrendParams& p) {
            require(p.period > 0 && p.multiplier > 0.0,
                    "SuperTrend needs positive period and multiplier");
        },
        [&](const StochRsiParams& p) {
            require(p.rsi_period > 0 && p.stoch_period > 0,
                    "Stochastic RSI needs positive periods");
        },
    }, params);
}

size_t lookback(const VoterParams& params) noexcept {
    return std::visit(Overloaded{
        [](const SmaCrossParams& p) { return p.long_window + 1; },
        [](const EmaCrossParams& p) { return p.long_window + 1; },
        [](const RsiParams& p) { return p.period + 2; },
        [](const MacdParams& p) { return p.slow + p.signal; },
        [](const BollingerParams& p) { return p.period + 1; },
        [](const VwapParams& p) { return std::max<size_t>(2, p.volume_period); },
        [](const SuperTrendParams& p) { return p.period + 2; },
        [](const StochRsiParams& p) { return std::max(p.rsi_period + 2, p.stoch_period + 3); },
    }, params);
}

Voter make_default_voter(VoterKind kind) {
    Voter voter;
    voter.id = std::string(to_string(kind));
    voter.name = voter.id;
    voter.params = default_params(kind);
    voter.weight = default_weight(kind);
    return voter;
}

// ============================================================================
// Dispatch
// ============================================================================

Vote cast_vote(std::span<const Candle> candles, const VoterParams& params) {
    try {
        return std::visit([&](const auto& p) { return vote(candles, p); }, params);
    } catch (const InsufficientData& e) {
        LOG_TRACE("{} holds: {}", to_string(kind_of(params)), e.what());
        return Vote::Hold;
    }
}

}  // namespace quorum::strategy
