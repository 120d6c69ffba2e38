#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Live Brokerage Data Source
// ============================================================================
// Historical candles over the brokerage REST API
//   Auth:    POST token_path, Bearer <api_key>,
//            {"key_type":"approval","checksum":sha256(secret + ts),"timestamp":ts}
//   Candles: GET candle_path?exchange&segment&trading_symbol&start_time&end_time
//            &interval_in_minutes, Bearer <access token>
//            {"status":"SUCCESS","payload":{"candles":[[epoch_s,o,h,l,c,v],...]}}
// ============================================================================

#include "quorum/market/data_source.hpp"
#include "quorum/network/rest_client.hpp"
#include "quorum/storage/credential_store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace quorum::market {

struct BrokerConfig {
    std::string base_url = "https://api.groww.in";
    std::string token_path = "/v1/token/api/access";
    std::string candle_path = "/v1/historical/candle/range";
    std::string exchange = "NSE";
    std::string segment = "CASH";
    std::chrono::minutes bar_interval{5};
    int lookback_days = 5;                              // Range requested per fetch
    std::chrono::minutes utc_offset{330};               // Exchange-local time, IST
    int requests_per_minute = 300;
    std::chrono::milliseconds rate_limit_wait{2000};    // Give up waiting for a permit after this
    std::chrono::seconds request_timeout{15};
};

class LiveDataSource : public IMarketDataSource {
public:
    LiveDataSource(const BrokerConfig& config, storage::Credentials credentials,
                   std::unique_ptr<network::IRestClient> client, Clock clock = now);

    /// Build with a Beast/OpenSSL RestClient for config.base_url
    static std::unique_ptr<LiveDataSource> create(const BrokerConfig& config,
                                                  storage::Credentials credentials);

    /// Exchange the API key for an access token.
    /// Throws DataSourceUnavailable on rejection or transport failure.
    void connect();

    [[nodiscard]] bool connected() const;

    [[nodiscard]] std::vector<Candle> fetch_candles(const Symbol& symbol, size_t count) override;

    [[nodiscard]] EngineMode mode() const noexcept override { return EngineMode::Live; }

private:
    [[nodiscard]] std::string access_token();

    BrokerConfig config_;
    storage::Credentials credentials_;
    std::unique_ptr<network::IRestClient> client_;
    Clock clock_;
    network::RateLimiter limiter_;

    mutable std::mutex token_mutex_;
    std::string access_token_;
};

// ============================================================================
// Wire Helpers
// ============================================================================

/// Candles from a historical-candle response, oldest first.
/// Throws DataSourceUnavailable on a non-SUCCESS status or malformed body.
[[nodiscard]] std::vector<Candle> parse_candle_response(const Symbol& symbol, std::string_view body);

/// "token" field of the token-exchange response.
/// Throws DataSourceUnavailable when absent.
[[nodiscard]] std::string parse_access_token(std::string_view body);

/// "YYYY-MM-DD HH:MM:SS" in the exchange-local zone
[[nodiscard]] std::string format_exchange_time(Timestamp ts, std::chrono::minutes utc_offset);

}  // namespace quorum::market
