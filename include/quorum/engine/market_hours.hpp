#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Market Hours
// ============================================================================
// Trading-session predicate in exchange-local time (UTC + fixed offset)
// Default: NSE cash session 09:15-15:30 IST, Monday-Friday
// ============================================================================

#include "quorum/core/types.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace quorum::engine {

struct MarketHoursConfig {
    int open_minute = 9 * 60 + 15;          // Minutes after local midnight
    int close_minute = 15 * 60 + 30;        // Inclusive
    std::chrono::minutes utc_offset{330};
    bool weekdays_only = true;
};

class MarketHours {
public:
    explicit MarketHours(const MarketHoursConfig& config = MarketHoursConfig{});

    /// Inside [open, close] on a trading day
    [[nodiscard]] bool is_open(Timestamp ts) const noexcept;

    /// Minutes since local midnight
    [[nodiscard]] int local_minute_of_day(Timestamp ts) const noexcept;

    /// Monday..Sunday as 1..7 in local time
    [[nodiscard]] unsigned local_weekday(Timestamp ts) const noexcept;

    /// UTC instant of the local midnight that starts the trading day of `ts`
    [[nodiscard]] Timestamp trading_day_start(Timestamp ts) const noexcept;

    [[nodiscard]] const MarketHoursConfig& config() const noexcept { return config_; }

private:
    MarketHoursConfig config_;
};

/// "HH:MM" -> minutes after midnight. Throws std::invalid_argument
[[nodiscard]] int parse_hhmm(std::string_view text);

[[nodiscard]] std::string format_hhmm(int minute_of_day);

}  // namespace quorum::engine
