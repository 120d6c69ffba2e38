// ============================================================================
// QUORUM SCAN ENGINE - Live Data Source Implementation
// ============================================================================

#include "quorum/market/live_data_source.hpp"
#include "quorum/core/error.hpp"
#include "quorum/utils/logger.hpp"

#include <simdjson.h>
#include <fmt/format.h>

#include <algorithm>

namespace quorum::market {

// ============================================================================
// Wire Helpers
// ============================================================================

std::string format_exchange_time(Timestamp ts, std::chrono::minutes utc_offset) {
    using namespace std::chrono;
    const auto local = time_point_cast<seconds>(ts) + utc_offset;
    const auto day = floor<days>(local);
    const year_month_day ymd{day};
    const hh_mm_ss<seconds> hms{local - day};

    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count());
}

std::vector<Candle> parse_candle_response(const Symbol& symbol, std::string_view body) {
    std::vector<Candle> candles;

    try {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(body);
        auto doc = parser.iterate(padded);

        const std::string_view status = doc["status"].get_string().value();
        if (status != "SUCCESS") {
            throw DataSourceUnavailable(fmt::format("candle request for {} returned status {}",
                                                    symbol.view(), status));
        }

        for (auto row : doc["payload"]["candles"].get_array()) {
            double fields[6] = {};
            size_t index = 0;
            for (auto field : row.get_array()) {
                if (index < 6) fields[index] = field.get_double().value();
                ++index;
            }
            if (index < 6) {
                throw DataSourceUnavailable(fmt::format("candle row for {} has {} fields",
                                                        symbol.view(), index));
            }

            Candle candle;
            candle.symbol = symbol;
            candle.timestamp = from_epoch_seconds(static_cast<int64_t>(fields[0]));
            candle.open = fields[1];
            candle.high = fields[2];
            candle.low = fields[3];
            candle.close = fields[4];
            candle.volume = fields[5];
            candles.push_back(candle);
        }
    } catch (const simdjson::simdjson_error& e) {
        throw DataSourceUnavailable(fmt::format("malformed candle response for {}: {}",
                                                symbol.view(), e.what()));
    }

    // Oldest first, strictly increasing
    std::stable_sort(candles.begin(), candles.end(),
                     [](const Candle& a, const Candle& b) { return a.timestamp < b.timestamp; });
    candles.erase(std::unique(candles.begin(), candles.end(),
                              [](const Candle& a, const Candle& b) { return a.timestamp == b.timestamp; }),
                  candles.end());
    return candles;
}

std::string parse_access_token(std::string_view body) {
    try {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(body);
        auto doc = parser.iterate(padded);
        std::string token(doc["token"].get_string().value());
        if (token.empty()) {
            throw DataSourceUnavailable("token exchange returned an empty token");
        }
        return token;
    } catch (const simdjson::simdjson_error& e) {
        throw DataSourceUnavailable(fmt::format("malformed token response: {}", e.what()));
    }
}

// ============================================================================
// LiveDataSource
// ============================================================================

LiveDataSource::LiveDataSource(const BrokerConfig& config, storage::Credentials credentials,
                               std::unique_ptr<network::IRestClient> client, Clock clock)
    : config_(config)
    , credentials_(std::move(credentials))
    , client_(std::move(client))
    , clock_(std::move(clock))
    , limiter_(config.requests_per_minute, std::chrono::seconds(60)) {}

std::unique_ptr<LiveDataSource> LiveDataSource::create(const BrokerConfig& config,
                                                       storage::Credentials credentials) {
    network::RestClientConfig rest_config;
    rest_config.base_url = config.base_url;
    rest_config.request_timeout = config.request_timeout;
    return std::make_unique<LiveDataSource>(config, std::move(credentials),
                                            std::make_unique<network::RestClient>(rest_config));
}

void LiveDataSource::connect() {
    if (!limiter_.acquire(config_.rate_limit_wait)) {
        throw DataSourceUnavailable("rate limit reached before token exchange");
    }

    const auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        clock_().time_since_epoch()).count();
    const auto checksum = network::sha256_hex(credentials_.api_secret + std::to_string(timestamp));
    const auto body = fmt::format(R"({{"key_type":"approval","checksum":"{}","timestamp":{}}})",
                                  checksum, timestamp);

    auto response = client_->post(config_.token_path, body,
                                  {{"Authorization", "Bearer " + credentials_.api_key}});
    if (!response.is_success()) {
        throw DataSourceUnavailable(fmt::format("token exchange failed (HTTP {}): {}",
                                                response.status_code, response.body));
    }

    auto token = parse_access_token(response.body);
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        access_token_ = std::move(token);
    }
    LOG_INFO("Brokerage session established ({})", config_.base_url);
}

bool LiveDataSource::connected() const {
    std::lock_guard<std::mutex> lock(token_mutex_);
    return !access_token_.empty();
}

std::string LiveDataSource::access_token() {
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        if (!access_token_.empty()) return access_token_;
    }
    connect();
    std::lock_guard<std::mutex> lock(token_mutex_);
    return access_token_;
}

std::vector<Candle> LiveDataSource::fetch_candles(const Symbol& symbol, size_t count) {
    const auto token = access_token();

    if (!limiter_.acquire(config_.rate_limit_wait)) {
        throw DataSourceUnavailable(fmt::format("rate limit reached fetching {}", symbol.view()));
    }

    const auto end = clock_();
    const auto start = end - std::chrono::hours(24) * config_.lookback_days;

    const std::map<std::string, std::string> params{
        {"exchange", config_.exchange},
        {"segment", config_.segment},
        {"trading_symbol", symbol.str()},
        {"start_time", format_exchange_time(start, config_.utc_offset)},
        {"end_time", format_exchange_time(end, config_.utc_offset)},
        {"interval_in_minutes", std::to_string(config_.bar_interval.count())},
    };

    auto response = client_->get(config_.candle_path, params,
                                 {{"Authorization", "Bearer " + token}});

    if (response.status_code == 401) {
        // Token expired; the next fetch re-authenticates
        std::lock_guard<std::mutex> lock(token_mutex_);
        access_token_.clear();
    }
    if (!response.is_success()) {
        throw DataSourceUnavailable(fmt::format("candles for {} failed (HTTP {}): {}",
                                                symbol.view(), response.status_code, response.body));
    }

    auto candles = parse_candle_response(symbol, response.body);
    if (candles.size() > count) {
        candles.erase(candles.begin(), candles.end() - static_cast<std::ptrdiff_t>(count));
    }
    return candles;
}

}  // namespace quorum::market
