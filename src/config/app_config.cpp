// ============================================================================
// QUORUM SCAN ENGINE - Configuration Loader
// ============================================================================

#include "quorum/config/app_config.hpp"
#include "quorum/core/error.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <stdexcept>

namespace quorum::config {

namespace {

void require(bool ok, const std::string& message) {
    if (!ok) throw ConfigurationError(message);
}

void parse_engine(const YAML::Node& node, engine::EngineConfig& cfg) {
    cfg.user_id = node["user_id"].as<std::string>(cfg.user_id);
    cfg.initial_capital = node["initial_capital"].as<double>(cfg.initial_capital);
    require(cfg.initial_capital > 0.0, "engine.initial_capital must be positive");

    if (node["symbols"]) {
        cfg.symbols.clear();
        for (const auto& symbol : node["symbols"]) {
            const auto text = symbol.as<std::string>();
            require(!text.empty() && text.size() <= Symbol::MAX_LENGTH,
                    fmt::format("engine.symbols: '{}' is not a valid symbol", text));
            cfg.symbols.emplace_back(text);
        }
    }

    cfg.scan_interval = std::chrono::milliseconds(
        node["scan_interval_ms"].as<int64_t>(cfg.scan_interval.count()));
    cfg.closed_interval = std::chrono::milliseconds(
        node["closed_interval_ms"].as<int64_t>(cfg.closed_interval.count()));
    require(cfg.scan_interval.count() > 0 && cfg.closed_interval.count() > 0,
            "engine intervals must be positive");

    cfg.candle_count = node["candle_count"].as<size_t>(cfg.candle_count);
    cfg.worker_threads = node["worker_threads"].as<size_t>(cfg.worker_threads);
    cfg.signal_log_capacity = node["signal_log_capacity"].as<size_t>(cfg.signal_log_capacity);
    require(cfg.candle_count > 0, "engine.candle_count must be positive");
    require(cfg.signal_log_capacity > 0, "engine.signal_log_capacity must be positive");

    const auto bar_minutes = node["bar_interval_minutes"].as<int>(
        static_cast<int>(cfg.simulation.bar_interval.count()));
    require(bar_minutes > 0, "engine.bar_interval_minutes must be positive");
    cfg.simulation.bar_interval = std::chrono::minutes(bar_minutes);
    cfg.broker.bar_interval = std::chrono::minutes(bar_minutes);
}

void parse_market_hours(const YAML::Node& node, engine::MarketHoursConfig& cfg) {
    try {
        if (node["open"]) cfg.open_minute = engine::parse_hhmm(node["open"].as<std::string>());
        if (node["close"]) cfg.close_minute = engine::parse_hhmm(node["close"].as<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(fmt::format("market_hours: {}", e.what()));
    }
    require(cfg.open_minute <= cfg.close_minute, "market_hours.open must not be after close");
    cfg.utc_offset = std::chrono::minutes(
        node["utc_offset_minutes"].as<int>(static_cast<int>(cfg.utc_offset.count())));
    cfg.weekdays_only = node["weekdays_only"].as<bool>(cfg.weekdays_only);
}

void parse_risk(const YAML::Node& node, risk::MoneyConfig& cfg) {
    cfg.risk_per_trade_pct = node["risk_per_trade_pct"].as<double>(cfg.risk_per_trade_pct);
    cfg.atr_stop_multiple = node["atr_stop_multiple"].as<double>(cfg.atr_stop_multiple);
    cfg.atr_target_multiple = node["atr_target_multiple"].as<double>(cfg.atr_target_multiple);
    cfg.atr_period = node["atr_period"].as<size_t>(cfg.atr_period);
    cfg.trailing_stop_pct = node["trailing_stop_pct"].as<double>(cfg.trailing_stop_pct);
    cfg.max_daily_loss_pct = node["max_daily_loss_pct"].as<double>(cfg.max_daily_loss_pct);
    cfg.max_trades_per_day = node["max_trades_per_day"].as<int>(cfg.max_trades_per_day);
    cfg.kelly_enabled = node["kelly_enabled"].as<bool>(cfg.kelly_enabled);
    cfg.kelly_fraction = node["kelly_fraction"].as<double>(cfg.kelly_fraction);
    cfg.kelly_max_fraction = node["kelly_max_fraction"].as<double>(cfg.kelly_max_fraction);
    cfg.kelly_min_trades = node["kelly_min_trades"].as<size_t>(cfg.kelly_min_trades);

    require(cfg.risk_per_trade_pct > 0.0 && cfg.risk_per_trade_pct < 1.0,
            "risk.risk_per_trade_pct must be in (0, 1)");
    require(cfg.atr_stop_multiple > 0.0 && cfg.atr_target_multiple > 0.0,
            "risk ATR multiples must be positive");
    require(cfg.atr_period > 0, "risk.atr_period must be positive");
    require(cfg.trailing_stop_pct > 0.0 && cfg.trailing_stop_pct < 1.0,
            "risk.trailing_stop_pct must be in (0, 1)");
    require(cfg.max_daily_loss_pct > 0.0, "risk.max_daily_loss_pct must be positive");
    require(cfg.max_trades_per_day > 0, "risk.max_trades_per_day must be positive");
    require(cfg.kelly_max_fraction > 0.0 && cfg.kelly_max_fraction <= 1.0,
            "risk.kelly_max_fraction must be in (0, 1]");
}

void parse_aggregator(const YAML::Node& node, strategy::AggregatorConfig& cfg) {
    cfg.buy_threshold = node["buy_threshold"].as<double>(cfg.buy_threshold);
    cfg.sell_threshold = node["sell_threshold"].as<double>(cfg.sell_threshold);
    require(cfg.sell_threshold < cfg.buy_threshold,
            "aggregator.sell_threshold must be below buy_threshold");
}

void parse_simulation(const YAML::Node& node, market::SimulationConfig& cfg) {
    cfg.seed = node["seed"].as<uint64_t>(cfg.seed);
    cfg.volatility = node["volatility"].as<double>(cfg.volatility);
    cfg.bound = node["bound"].as<double>(cfg.bound);
    cfg.history_bars = node["history_bars"].as<size_t>(cfg.history_bars);
    require(cfg.volatility >= 0.0, "simulation.volatility must not be negative");
    require(cfg.bound > 0.0 && cfg.bound < 1.0, "simulation.bound must be in (0, 1)");
    require(cfg.history_bars > 0, "simulation.history_bars must be positive");
}

void parse_broker(const YAML::Node& node, market::BrokerConfig& cfg) {
    cfg.base_url = node["base_url"].as<std::string>(cfg.base_url);
    cfg.token_path = node["token_path"].as<std::string>(cfg.token_path);
    cfg.candle_path = node["candle_path"].as<std::string>(cfg.candle_path);
    cfg.exchange = node["exchange"].as<std::string>(cfg.exchange);
    cfg.segment = node["segment"].as<std::string>(cfg.segment);
    cfg.lookback_days = node["lookback_days"].as<int>(cfg.lookback_days);
    cfg.requests_per_minute = node["requests_per_minute"].as<int>(cfg.requests_per_minute);
    cfg.request_timeout = std::chrono::seconds(
        node["request_timeout_s"].as<int64_t>(cfg.request_timeout.count()));
    require(cfg.lookback_days > 0, "broker.lookback_days must be positive");
    require(cfg.requests_per_minute > 0, "broker.requests_per_minute must be positive");
}

void parse_logging(const YAML::Node& node, utils::LogConfig& cfg) {
    cfg.level = utils::parse_log_level(node["level"].as<std::string>("info"));
    cfg.log_file = node["file"].as<std::string>(cfg.log_file);
    cfg.pattern = node["pattern"].as<std::string>(cfg.pattern);
    cfg.async = node["async"].as<bool>(cfg.async);
    cfg.queue_size = node["queue_size"].as<size_t>(cfg.queue_size);
    cfg.flush_interval_ms = node["flush_interval_ms"].as<size_t>(cfg.flush_interval_ms);
    cfg.max_file_size_mb = node["max_file_size_mb"].as<size_t>(cfg.max_file_size_mb);
    cfg.max_files = node["max_files"].as<size_t>(cfg.max_files);
}

}  // namespace

AppConfig parse_config(const YAML::Node& root) {
    AppConfig config;

    try {
        if (root["engine"]) parse_engine(root["engine"], config.engine);
        if (root["market_hours"]) parse_market_hours(root["market_hours"], config.engine.market_hours);
        if (root["risk"]) parse_risk(root["risk"], config.engine.money);
        if (root["aggregator"]) parse_aggregator(root["aggregator"], config.engine.aggregator);
        if (root["simulation"]) parse_simulation(root["simulation"], config.engine.simulation);
        if (root["broker"]) parse_broker(root["broker"], config.engine.broker);
        if (root["logging"]) parse_logging(root["logging"], config.logging);

        config.engine.broker.utc_offset = config.engine.market_hours.utc_offset;

        config.strategies_file = root["strategies_file"].as<std::string>(config.strategies_file);
        config.journal_file = root["journal_file"].as<std::string>(config.journal_file);

        if (const auto users = root["users"]; users && users.IsMap()) {
            for (const auto& entry : users) {
                storage::Credentials credentials;
                credentials.api_key = entry.second["api_key"].as<std::string>("");
                credentials.api_secret = entry.second["api_secret"].as<std::string>("");
                config.users[entry.first.as<std::string>()] = std::move(credentials);
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(fmt::format("config: {}", e.what()));
    }

    return config;
}

AppConfig load_config(const std::string& path) {
    AppConfig config;

    try {
        config = parse_config(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Config load failed ({}), using defaults: {}", path, e.what());
    } catch (const ConfigurationError& e) {
        LOG_ERROR("Config invalid ({}), using defaults: {}", path, e.what());
    }

    const char* key = std::getenv("QUORUM_API_KEY");
    const char* secret = std::getenv("QUORUM_API_SECRET");
    if (key != nullptr && secret != nullptr && *key != '\0' && *secret != '\0') {
        config.users[config.engine.user_id] = storage::Credentials{key, secret};
    }

    return config;
}

}  // namespace quorum::config
