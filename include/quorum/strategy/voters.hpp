#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Strategy Voters
// ============================================================================
// Eight rule-based voters, each a pure function (candles, params) -> Vote
// The voter set is closed: parameters live in a std::variant and a single
// std::visit dispatches, so weights and thresholds stay in one place
// ============================================================================

#include "quorum/core/types.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace quorum::strategy {

// ============================================================================
// Voter Kinds
// ============================================================================

enum class VoterKind : uint8_t {
    SmaCross,
    EmaCross,
    Rsi,
    Macd,
    Bollinger,
    Vwap,
    SuperTrend,
    StochRsi
};

inline constexpr std::array<VoterKind, 8> ALL_VOTER_KINDS = {
    VoterKind::SmaCross, VoterKind::EmaCross, VoterKind::Rsi,  VoterKind::Macd,
    VoterKind::Bollinger, VoterKind::Vwap,    VoterKind::SuperTrend, VoterKind::StochRsi};

/// Stable key: "ma_crossover", "ema_crossover", "rsi", "macd", "bollinger",
/// "vwap", "supertrend", "stoch_rsi"
[[nodiscard]] std::string_view to_string(VoterKind kind) noexcept;

/// Exact key lookup (inverse of to_string)
[[nodiscard]] std::optional<VoterKind> parse_voter_kind(std::string_view key);

/// Derive the kind from a free-form strategy name by keyword, case-insensitive.
/// Checked in order: "moving average", "ema crossover", "macd", "stochastic",
/// "bollinger", "supertrend", "vwap", "rsi"
[[nodiscard]] std::optional<VoterKind> voter_kind_from_name(std::string_view name);

/// Aggregation weight used when a strategy record carries no override
[[nodiscard]] double default_weight(VoterKind kind) noexcept;

// ============================================================================
// Voter Parameters
// ============================================================================

struct SmaCrossParams {
    size_t short_window = 20;
    size_t long_window = 50;
};

struct EmaCrossParams {
    size_t short_window = 12;
    size_t long_window = 26;
};

struct RsiParams {
    size_t period = 14;
    double oversold = 30.0;
    double overbought = 70.0;
};

struct MacdParams {
    size_t fast = 12;
    size_t slow = 26;
    size_t signal = 9;
};

struct BollingerParams {
    size_t period = 20;
    double std_dev = 2.0;
};

struct VwapParams {
    double volume_multiple = 1.5;
    size_t volume_period = 20;
    std::chrono::minutes session_offset{0};
};

struct SuperTrendParams {
    size_t period = 10;
    double multiplier = 3.0;
};

struct StochRsiParams {
    size_t rsi_period = 14;
    size_t stoch_period = 14;
    double rsi_oversold = 30.0;
    double rsi_overbought = 70.0;
    double k_oversold = 20.0;
    double k_overbought = 80.0;
};

using VoterParams = std::variant<SmaCrossParams, EmaCrossParams, RsiParams, MacdParams,
                                 BollingerParams, VwapParams, SuperTrendParams, StochRsiParams>;

[[nodiscard]] VoterKind kind_of(const VoterParams& params) noexcept;

[[nodiscard]] VoterParams default_params(VoterKind kind);

/// Build parameters from a strategy record's numeric overrides.
/// Keys: shortWindow, longWindow, rsiPeriod, overbought, oversold, fast, slow,
/// signal, period, stdDev, volumeThreshold, volumePeriod, multiplier, stochPeriod.
/// Unknown keys are ignored. Throws std::invalid_argument on unusable values.
[[nodiscard]] VoterParams make_params(VoterKind kind, const std::map<std::string, double>& overrides);

/// Throws std::invalid_argument if a period is zero or windows are inverted
void validate(const VoterParams& params);

/// Candles needed for the voter to see two completed bars of every indicator
[[nodiscard]] size_t lookback(const VoterParams& params) noexcept;

// ============================================================================
// Voter
// ============================================================================

/// An enabled strategy bound to its parameters and aggregation weight
struct Voter {
    std::string id;
    std::string name;
    VoterParams params;
    double weight = 1.0;

    [[nodiscard]] VoterKind kind() const noexcept { return kind_of(params); }
};

/// Voter with library defaults for `kind`
[[nodiscard]] Voter make_default_voter(VoterKind kind);

/// Evaluate one voter over a candle window ordered oldest first.
/// Returns Hold when the window is too short for its indicators.
[[nodiscard]] Vote cast_vote(std::span<const Candle> candles, const VoterParams& params);

}  // namespace quorum::strategy
