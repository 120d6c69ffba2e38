#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Core Types
// ============================================================================
// Fundamental type definitions shared by every layer of the engine
// Prices and volumes are doubles: the engine sizes whole shares and
// never accumulates sub-tick price arithmetic
// ============================================================================

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace quorum {

// ============================================================================
// Time Types
// ============================================================================

/// Nanosecond precision timestamp
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Duration in nanoseconds
using Duration = std::chrono::nanoseconds;

/// Get current timestamp with nanosecond precision
[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

/// Convert timestamp to Unix epoch milliseconds
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/// Convert Unix epoch milliseconds to Timestamp
[[nodiscard]] inline Timestamp from_epoch_ms(int64_t epoch_ms) noexcept {
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

/// Convert Unix epoch seconds to Timestamp (brokerage candle format)
[[nodiscard]] inline Timestamp from_epoch_seconds(int64_t epoch_s) noexcept {
    return Timestamp{std::chrono::seconds{epoch_s}};
}

/// Clock used by the engine; injectable so tests can pin the wall time
using Clock = std::function<Timestamp()>;

// ============================================================================
// Trading Types
// ============================================================================

/// Order / position side. Buy opens a long, Sell opens a short
enum class Side : uint8_t {
    Buy = 0,
    Sell = 1
};

/// +1 for long, -1 for short
[[nodiscard]] constexpr double direction(Side side) noexcept {
    return side == Side::Buy ? 1.0 : -1.0;
}

[[nodiscard]] constexpr Side opposite(Side side) noexcept {
    return side == Side::Buy ? Side::Sell : Side::Buy;
}

[[nodiscard]] constexpr std::string_view to_string(Side side) noexcept {
    return side == Side::Buy ? "BUY" : "SELL";
}

/// Discrete vote of a single voter; also used for the aggregated decision
enum class Vote : int8_t {
    Sell = -1,
    Hold = 0,
    Buy = 1
};

using Decision = Vote;

[[nodiscard]] constexpr int to_int(Vote vote) noexcept {
    return static_cast<int>(vote);
}

[[nodiscard]] constexpr std::string_view to_string(Vote vote) noexcept {
    switch (vote) {
        case Vote::Buy:  return "BUY";
        case Vote::Sell: return "SELL";
        case Vote::Hold: return "HOLD";
    }
    return "HOLD";
}

/// Side a directional decision opens. Hold has no side
[[nodiscard]] constexpr Side side_of(Vote vote) noexcept {
    return vote == Vote::Sell ? Side::Sell : Side::Buy;
}

/// Data source the engine is currently bound to
enum class EngineMode : uint8_t {
    Simulation = 0,
    Live = 1
};

[[nodiscard]] constexpr std::string_view to_string(EngineMode mode) noexcept {
    return mode == EngineMode::Live ? "LIVE" : "SIMULATION";
}

// ============================================================================
// Symbol Type
// ============================================================================

/// Exchange trading symbol (e.g., "RELIANCE")
/// Fixed inline storage, no heap allocation
class Symbol {
public:
    static constexpr size_t MAX_LENGTH = 15;

    Symbol() noexcept : length_(0) { data_[0] = '\0'; }

    explicit Symbol(std::string_view symbol) noexcept {
        length_ = static_cast<uint8_t>(std::min(symbol.size(), MAX_LENGTH));
        std::copy_n(symbol.data(), length_, data_);
        data_[length_] = '\0';
    }

    [[nodiscard]] std::string_view view() const noexcept {
        return {data_, length_};
    }

    [[nodiscard]] std::string str() const { return std::string(view()); }
    [[nodiscard]] const char* c_str() const noexcept { return data_; }
    [[nodiscard]] size_t size() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    bool operator==(const Symbol& other) const noexcept {
        return view() == other.view();
    }

    bool operator!=(const Symbol& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Symbol& other) const noexcept {
        return view() < other.view();
    }

private:
    char data_[MAX_LENGTH + 1];
    uint8_t length_;
};

// ============================================================================
// Market Data Structures
// ============================================================================

/// OHLCV bar. Timestamp is the bar open time
struct Candle {
    Symbol symbol;
    Timestamp timestamp;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    /// (high + low + close) / 3
    [[nodiscard]] double typical_price() const noexcept {
        return (high + low + close) / 3.0;
    }

    /// (high + low) / 2
    [[nodiscard]] double median_price() const noexcept {
        return (high + low) / 2.0;
    }
};

}  // namespace quorum

// ============================================================================
// Hash specializations for use with containers
// ============================================================================
template <>
struct std::hash<quorum::Symbol> {
    size_t operator()(const quorum::Symbol& s) const noexcept {
        return std::hash<std::string_view>{}(s.view());
    }
};
