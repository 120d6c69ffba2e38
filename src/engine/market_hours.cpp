// ============================================================================
// QUORUM SCAN ENGINE - Market Hours Implementation
// ============================================================================

#include "quorum/engine/market_hours.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace quorum::engine {

MarketHours::MarketHours(const MarketHoursConfig& config) : config_(config) {
    if (config_.open_minute < 0 || config_.close_minute >= 24 * 60 ||
        config_.open_minute > config_.close_minute) {
        throw std::invalid_argument(fmt::format("invalid market session {}-{}",
                                                format_hhmm(config_.open_minute),
                                                format_hhmm(config_.close_minute)));
    }
}

int MarketHours::local_minute_of_day(Timestamp ts) const noexcept {
    using namespace std::chrono;
    const auto local = time_point_cast<minutes>(ts) + config_.utc_offset;
    const auto since_midnight = local - floor<days>(local);
    return static_cast<int>(since_midnight.count());
}

unsigned MarketHours::local_weekday(Timestamp ts) const noexcept {
    using namespace std::chrono;
    const auto local = time_point_cast<minutes>(ts) + config_.utc_offset;
    return weekday{floor<days>(local)}.iso_encoding();
}

Timestamp MarketHours::trading_day_start(Timestamp ts) const noexcept {
    using namespace std::chrono;
    const auto local = ts + config_.utc_offset;
    return Timestamp{floor<days>(local) - config_.utc_offset};
}

bool MarketHours::is_open(Timestamp ts) const noexcept {
    if (config_.weekdays_only && local_weekday(ts) > 5) {
        return false;
    }
    const int minute = local_minute_of_day(ts);
    return minute >= config_.open_minute && minute <= config_.close_minute;
}

int parse_hhmm(std::string_view text) {
    const auto colon = text.find(':');
    // One or two digits each side of the colon
    if (colon == std::string_view::npos || colon == 0 || colon > 2 ||
        colon + 1 >= text.size() || text.size() - colon - 1 > 2) {
        throw std::invalid_argument(fmt::format("expected HH:MM, got '{}'", text));
    }

    int hours = 0;
    int minutes = 0;
    for (char c : text.substr(0, colon)) {
        if (c < '0' || c > '9') throw std::invalid_argument(fmt::format("bad hour in '{}'", text));
        hours = hours * 10 + (c - '0');
    }
    for (char c : text.substr(colon + 1)) {
        if (c < '0' || c > '9') throw std::invalid_argument(fmt::format("bad minute in '{}'", text));
        minutes = minutes * 10 + (c - '0');
    }
    if (hours > 23 || minutes > 59) {
        throw std::invalid_argument(fmt::format("time out of range: '{}'", text));
    }
    return hours * 60 + minutes;
}

std::string format_hhmm(int minute_of_day) {
    return fmt::format("{:02}:{:02}", minute_of_day / 60, minute_of_day % 60);
}

}  // namespace quorum::engine
