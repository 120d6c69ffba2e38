// ============================================================================
// QUORUM SCAN ENGINE - Configuration Unit Tests
// ============================================================================

#include "quorum/config/app_config.hpp"
#include "quorum/core/error.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

using namespace quorum;
using namespace quorum::config;

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    const auto config = parse_config(YAML::Load("{}"));
    EXPECT_EQ(config.engine.user_id, "default");
    EXPECT_DOUBLE_EQ(config.engine.initial_capital, 100000.0);
    EXPECT_EQ(config.engine.symbols.size(), 10);
    EXPECT_EQ(config.engine.scan_interval.count(), 5000);
    EXPECT_EQ(config.engine.closed_interval.count(), 60000);
    EXPECT_EQ(config.engine.market_hours.open_minute, 555);
    EXPECT_EQ(config.engine.market_hours.close_minute, 930);
    EXPECT_DOUBLE_EQ(config.engine.money.risk_per_trade_pct, 0.02);
    EXPECT_DOUBLE_EQ(config.engine.aggregator.buy_threshold, 0.3);
    EXPECT_EQ(config.strategies_file, "config/strategies.yaml");
    EXPECT_TRUE(config.users.empty());
}

TEST(ConfigTest, ParsesEverySection) {
    const auto config = parse_config(YAML::Load(R"(
engine:
  user_id: trader-7
  initial_capital: 250000
  symbols: [TCS, INFY]
  scan_interval_ms: 2000
  candle_count: 150
  worker_threads: 2
  bar_interval_minutes: 15
market_hours:
  open: "10:00"
  close: "14:00"
  utc_offset_minutes: 0
  weekdays_only: false
risk:
  risk_per_trade_pct: 0.01
  max_trades_per_day: 5
  kelly_enabled: true
  kelly_max_fraction: 0.05
aggregator:
  buy_threshold: 0.5
  sell_threshold: -0.5
simulation:
  seed: 42
  volatility: 0.002
broker:
  exchange: BSE
  requests_per_minute: 60
strategies_file: ""
journal_file: /tmp/trades.journal
users:
  trader-7:
    api_key: k
    api_secret: s
logging:
  level: debug
  async: false
)"));

    EXPECT_EQ(config.engine.user_id, "trader-7");
    EXPECT_DOUBLE_EQ(config.engine.initial_capital, 250000.0);
    ASSERT_EQ(config.engine.symbols.size(), 2);
    EXPECT_EQ(config.engine.symbols[1], Symbol("INFY"));
    EXPECT_EQ(config.engine.scan_interval.count(), 2000);
    EXPECT_EQ(config.engine.candle_count, 150);
    EXPECT_EQ(config.engine.worker_threads, 2);
    EXPECT_EQ(config.engine.simulation.bar_interval.count(), 15);
    EXPECT_EQ(config.engine.broker.bar_interval.count(), 15);

    EXPECT_EQ(config.engine.market_hours.open_minute, 600);
    EXPECT_EQ(config.engine.market_hours.close_minute, 840);
    EXPECT_EQ(config.engine.market_hours.utc_offset.count(), 0);
    EXPECT_FALSE(config.engine.market_hours.weekdays_only);
    EXPECT_EQ(config.engine.broker.utc_offset.count(), 0);

    EXPECT_DOUBLE_EQ(config.engine.money.risk_per_trade_pct, 0.01);
    EXPECT_EQ(config.engine.money.max_trades_per_day, 5);
    EXPECT_TRUE(config.engine.money.kelly_enabled);
    EXPECT_DOUBLE_EQ(config.engine.money.kelly_max_fraction, 0.05);
    EXPECT_DOUBLE_EQ(config.engine.aggregator.sell_threshold, -0.5);
    EXPECT_EQ(config.engine.simulation.seed, 42);
    EXPECT_EQ(config.engine.broker.exchange, "BSE");
    EXPECT_EQ(config.engine.broker.requests_per_minute, 60);

    EXPECT_TRUE(config.strategies_file.empty());
    EXPECT_EQ(config.journal_file, "/tmp/trades.journal");
    ASSERT_EQ(config.users.count("trader-7"), 1);
    EXPECT_TRUE(config.users.at("trader-7").complete());

    EXPECT_EQ(config.logging.level, utils::LogLevel::Debug);
    EXPECT_FALSE(config.logging.async);
}

TEST(ConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW((void)parse_config(YAML::Load("engine: {initial_capital: -5}")),
                 ConfigurationError);
    EXPECT_THROW((void)parse_config(YAML::Load("risk: {risk_per_trade_pct: 1.5}")),
                 ConfigurationError);
    EXPECT_THROW((void)parse_config(YAML::Load("risk: {kelly_max_fraction: 0}")),
                 ConfigurationError);
    EXPECT_THROW((void)parse_config(YAML::Load("aggregator: {buy_threshold: -0.5}")),
                 ConfigurationError);
    EXPECT_THROW((void)parse_config(YAML::Load("market_hours: {open: '25:00'}")),
                 ConfigurationError);
    EXPECT_THROW((void)parse_config(YAML::Load("market_hours: {open: '16:00', close: '09:00'}")),
                 ConfigurationError);
}

TEST(ConfigTest, WrongTypeIsConfigurationError) {
    EXPECT_THROW((void)parse_config(YAML::Load("engine: {scan_interval_ms: soon}")),
                 ConfigurationError);
}

TEST(ConfigTest, OverlongSymbolRejected) {
    EXPECT_THROW((void)parse_config(YAML::Load("engine: {symbols: [ABCDEFGHIJKLMNOPQRST]}")),
                 ConfigurationError);
}

TEST(ConfigTest, MissingFileFallsBackToDefaults) {
    const auto config = load_config("/nonexistent/quorum/config.yaml");
    EXPECT_EQ(config.engine.user_id, "default");
    EXPECT_EQ(config.engine.symbols.size(), 10);
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(utils::parse_log_level("trace"), utils::LogLevel::Trace);
    EXPECT_EQ(utils::parse_log_level("WARN"), utils::LogLevel::Warn);
    EXPECT_EQ(utils::parse_log_level("off"), utils::LogLevel::Off);
    EXPECT_EQ(utils::parse_log_level("chatty"), utils::LogLevel::Info);
}
