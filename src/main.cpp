// ============================================================================
// QUORUM SCAN ENGINE - Entry Point
// ============================================================================
// Usage:
//   quorum_engine [config.yaml] [--user ID]          run the scan loop
//   quorum_engine [config.yaml] --backtest SYMBOL    replay simulated bars
//                 [--bars N]
//
//   [scan loop] -> voters -> aggregator -> money manager -> ledger -> journal
// ============================================================================

#include "quorum/backtest/backtester.hpp"
#include "quorum/config/app_config.hpp"
#include "quorum/core/error.hpp"
#include "quorum/engine/scan_engine.hpp"
#include "quorum/market/data_source.hpp"
#include "quorum/order/order_router.hpp"
#include "quorum/storage/strategy_store.hpp"
#include "quorum/storage/trade_store.hpp"
#include "quorum/utils/logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int) {
        g_running = false;
    }

    struct CliOptions {
        std::string config_path = "config/config.yaml";
        std::optional<std::string> user_id;
        std::optional<std::string> backtest_symbol;
        size_t backtest_bars = 500;
    };

    CliOptions parse_args(int argc, char* argv[]) {
        CliOptions options;
        if (argc > 1 && argv[1][0] != '-') {
            options.config_path = argv[1];
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--user" && i + 1 < argc) {
                options.user_id = argv[++i];
            } else if (arg == "--backtest" && i + 1 < argc) {
                options.backtest_symbol = argv[++i];
            } else if (arg == "--bars" && i + 1 < argc) {
                options.backtest_bars = static_cast<size_t>(std::stoul(argv[++i]));
            }
        }
        return options;
    }

    std::unique_ptr<quorum::storage::IStrategyStore> make_strategy_store(const std::string& path) {
        if (path.empty()) {
            LOG_INFO("No strategies file configured, using the built-in strategy set");
            return std::make_unique<quorum::storage::InMemoryStrategyStore>(
                quorum::storage::default_strategy_records());
        }
        return std::make_unique<quorum::storage::YamlStrategyStore>(path);
    }

    std::unique_ptr<quorum::storage::ITradeStore> make_trade_store(const std::string& path) {
        if (path.empty()) {
            LOG_WARN("No journal file configured, trades are kept in memory only");
            return std::make_unique<quorum::storage::InMemoryTradeStore>();
        }
        const auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        return std::make_unique<quorum::storage::JournalTradeStore>(path);
    }

    void log_status(const quorum::engine::ScanEngine& engine) {
        const auto snap = engine.snapshot();
        const auto metrics = engine.risk_metrics();
        LOG_INFO("[STATUS] {} | {} | scans {} | capital {:.2f} | day pnl {:.2f} | open {} | "
                 "trades today {} | win rate {:.1f}% | errors {}",
                 snap.market_open ? "OPEN" : "CLOSED", quorum::to_string(snap.mode),
                 snap.scan_count, snap.capital, snap.daily_pnl, snap.open_positions,
                 snap.trades_today, metrics.win_rate, snap.last_errors.size());
    }

    int run_backtest(const quorum::config::AppConfig& config,
                     quorum::storage::IStrategyStore& strategies,
                     const std::string& symbol_text, size_t bars) {
        using namespace quorum;

        const auto voters = storage::build_voters(strategies.list_enabled_strategies(),
                                                  config.engine.market_hours.utc_offset);
        auto history = config.engine.simulation;
        history.history_bars = std::max(history.history_bars, bars);
        market::SimulatedDataSource long_source(history);
        const auto candles = long_source.fetch_candles(Symbol(symbol_text), bars);

        backtest::BacktestConfig bt;
        bt.initial_capital = config.engine.initial_capital;
        bt.money = config.engine.money;
        bt.aggregator = config.engine.aggregator;

        const auto report = backtest::Backtester(bt).run(candles, voters);

        std::cout << "\n=== BACKTEST " << symbol_text << " (" << report.bars << " bars, "
                  << voters.size() << " voters) ===\n"
                  << "Trades:        " << report.stats.total_trades
                  << " (" << report.stats.winning_trades << " won, "
                  << report.stats.losing_trades << " lost)\n"
                  << "Win rate:      " << report.stats.win_rate << "%\n"
                  << "Total PnL:     " << report.stats.total_pnl << "\n"
                  << "Profit factor: " << report.stats.profit_factor << "\n"
                  << "Max drawdown:  " << report.stats.max_drawdown << "%\n"
                  << "Sharpe:        " << report.stats.sharpe_ratio << "\n"
                  << "Final capital: " << report.final_capital << "\n";
        return 0;
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const auto options = parse_args(argc, argv);
    const auto config = quorum::config::load_config(options.config_path);
    quorum::utils::Logger::initialize(config.logging);

    LOG_INFO("Loaded config from {}", options.config_path);

    try {
        auto strategies = make_strategy_store(config.strategies_file);

        if (options.backtest_symbol) {
            const int rc = run_backtest(config, *strategies, *options.backtest_symbol,
                                        options.backtest_bars);
            quorum::utils::Logger::shutdown();
            return rc;
        }

        auto trades = make_trade_store(config.journal_file);
        quorum::order::PaperOrderRouter router;

        quorum::engine::ScanEngine engine(config.engine, *strategies, *trades,
                                          quorum::storage::CredentialStore(config.users), router);

        if (!engine.start(options.user_id)) {
            LOG_CRITICAL("Engine failed to start");
            quorum::utils::Logger::shutdown();
            return 1;
        }

        auto last_status = std::chrono::steady_clock::now();
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            if (std::chrono::steady_clock::now() - last_status >= std::chrono::seconds(30)) {
                log_status(engine);
                last_status = std::chrono::steady_clock::now();
            }
        }

        LOG_INFO("Shutdown requested");
        engine.stop();
        log_status(engine);

    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception: {}", e.what());
        quorum::utils::Logger::shutdown();
        return 1;
    } catch (...) {
        LOG_CRITICAL("Unknown exception");
        quorum::utils::Logger::shutdown();
        return 1;
    }

    quorum::utils::Logger::shutdown();
    return 0;
}
