// ============================================================================
// QUORUM SCAN ENGINE - Scan Engine Implementation
// ============================================================================

#include "quorum/engine/scan_engine.hpp"
#include "quorum/core/error.hpp"
#include "quorum/market/live_data_source.hpp"
#include "quorum/strategy/indicators/series.hpp"
#include "quorum/utils/logger.hpp"

#include <boost/asio/post.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <latch>
#include <numeric>

namespace quorum::engine {

namespace {

size_t pool_size(const EngineConfig& config) {
    return std::max<size_t>(1, std::min(config.symbols.size(), config.worker_threads));
}

/// Ids of the voters that agree with a directional decision, comma separated
std::string agreeing_voters(const strategy::AggregateResult& aggregate) {
    std::string ids;
    for (const auto& ballot : aggregate.ballots) {
        if (ballot.vote != aggregate.decision) continue;
        if (!ids.empty()) ids += ',';
        ids += ballot.voter_id;
    }
    return ids;
}

template <typename F>
auto optional_reading(F&& compute) -> std::optional<decltype(compute())> {
    try {
        return compute();
    } catch (const InsufficientData&) {
        return std::nullopt;
    }
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

ScanEngine::ScanEngine(EngineConfig config,
                       storage::IStrategyStore& strategies,
                       storage::ITradeStore& trades,
                       storage::CredentialStore credentials,
                       order::IOrderRouter& router,
                       Clock clock,
                       DataSourceFactory source_factory)
    : config_(std::move(config))
    , strategies_(strategies)
    , credentials_(std::move(credentials))
    , router_(router)
    , clock_(std::move(clock))
    , source_factory_(std::move(source_factory))
    , hours_(config_.market_hours)
    , aggregator_(config_.aggregator)
    , money_(config_.money)
    , ledger_(trades)
    , signals_(std::max<size_t>(config_.signal_log_capacity, 1))
    , pool_(pool_size(config_)) {
    snapshot_.user_id = config_.user_id;
    snapshot_.symbols = config_.symbols;
    snapshot_.capital = capital();
    snapshot_.open_positions = ledger_.open_count();
}

ScanEngine::~ScanEngine() {
    stop();
    pool_.join();
}

// ============================================================================
// Control
// ============================================================================

bool ScanEngine::prepare(std::optional<std::string> user_id) {
    if (config_.symbols.empty()) {
        LOG_ERROR("Engine not started: symbol universe is empty");
        return false;
    }

    std::vector<storage::StrategyRecord> records;
    try {
        records = strategies_.list_enabled_strategies();
    } catch (const PersistenceFailure& e) {
        LOG_ERROR("Engine not started: strategy store unreachable: {}", e.what());
        return false;
    }
    auto voters = storage::build_voters(records, config_.market_hours.utc_offset);

    std::string user;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (user_id) snapshot_.user_id = *user_id;
        user = snapshot_.user_id;
    }

    std::shared_ptr<market::IMarketDataSource> source = make_source(credentials_.credentials_for(user));

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        voters_ = std::move(voters);
        source_ = source;
        snapshot_.mode = source->mode();
        snapshot_.scan_count = 0;
        snapshot_.active_voters.clear();
        for (const auto& voter : voters_) snapshot_.active_voters.push_back(voter.name);
        snapshot_.last_errors.clear();
    }

    roll_day_if_needed(clock_());

    LOG_INFO("Engine prepared for user {} in {} mode: {} symbols, {} voters",
             user, to_string(source->mode()), config_.symbols.size(), snapshot().active_voters.size());
    return true;
}

bool ScanEngine::start(std::optional<std::string> user_id) {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (running_.load()) {
        LOG_DEBUG("Engine already running");
        return true;
    }

    if (!prepare(std::move(user_id))) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = false;
    }
    stopping_.store(false);
    running_.store(true);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        snapshot_.running = true;
    }

    thread_ = std::thread(&ScanEngine::run_loop, this);
    LOG_INFO("Engine started");
    return true;
}

void ScanEngine::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (!running_.load()) return;

    stopping_.store(true);
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        snapshot_.running = false;
    }
    LOG_INFO("Engine stopped");
}

void ScanEngine::run_loop() {
    while (true) {
        TickResult tick;
        try {
            tick = run_tick();
        } catch (const std::exception& e) {
            LOG_ERROR("Scan tick failed: {}", e.what());
            tick.next_sleep = config_.scan_interval;
        }

        std::unique_lock<std::mutex> lock(stop_mutex_);
        if (stop_cv_.wait_for(lock, tick.next_sleep, [this] { return stop_requested_; })) {
            break;
        }
    }
}

// ============================================================================
// Tick
// ============================================================================

TickResult ScanEngine::run_tick() {
    const Timestamp at = clock_();

    TickResult result;
    result.market_open = hours_.is_open(at);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        snapshot_.market_open = result.market_open;
    }

    if (!result.market_open) {
        result.next_sleep = config_.closed_interval;
        LOG_DEBUG("Market closed ({} local), next check in {} ms",
                  format_hhmm(hours_.local_minute_of_day(at)),
                  std::chrono::duration_cast<std::chrono::milliseconds>(result.next_sleep).count());
        return result;
    }

    SCOPED_TIMER("scan tick");

    roll_day_if_needed(at);
    ledger_.retry_pending_writes();
    reload_voters();

    std::vector<strategy::Voter> voters;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        voters = voters_;
    }
    const auto source = data_source();

    std::atomic<size_t> scanned{0};
    std::latch done(static_cast<std::ptrdiff_t>(config_.symbols.size()));
    for (const auto& symbol : config_.symbols) {
        boost::asio::post(pool_, [this, &symbol, &voters, &source, at, &scanned, &done] {
            if (scan_symbol(symbol, voters, source, at)) {
                scanned.fetch_add(1);
            }
            done.count_down();
        });
    }
    done.wait();

    result.scanned = scanned.load();
    result.next_sleep = config_.scan_interval;

    const double current_capital = capital();
    const size_t open_positions = ledger_.open_count();
    double daily_pnl = 0.0;
    {
        std::lock_guard<std::mutex> lock(risk_mutex_);
        daily_pnl = risk_.daily_pnl;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++snapshot_.scan_count;
        snapshot_.capital = current_capital;
        snapshot_.daily_pnl = daily_pnl;
        snapshot_.open_positions = open_positions;
        snapshot_.last_scan_at = at;
    }

    LOG_DEBUG("Scanned {}/{} symbols, {} open positions",
              result.scanned, config_.symbols.size(), open_positions);
    return result;
}

void ScanEngine::roll_day_if_needed(Timestamp at) {
    const Timestamp day = hours_.trading_day_start(at);
    const double current_capital = capital();

    std::lock_guard<std::mutex> lock(risk_mutex_);
    if (risk_.day_start == day) return;
    money_.roll_day(risk_, day, current_capital);
    LOG_INFO("New trading day, loss limit {:.2f} on capital {:.2f}",
             current_capital * config_.money.max_daily_loss_pct, current_capital);
}

void ScanEngine::reload_voters() {
    std::vector<storage::StrategyRecord> records;
    try {
        records = strategies_.list_enabled_strategies();
    } catch (const PersistenceFailure& e) {
        LOG_WARN("Strategy reload failed, keeping {} voters: {}", snapshot().active_voters.size(), e.what());
        return;
    }

    auto voters = storage::build_voters(records, config_.market_hours.utc_offset);

    std::lock_guard<std::mutex> lock(state_mutex_);
    voters_ = std::move(voters);
    snapshot_.active_voters.clear();
    for (const auto& voter : voters_) snapshot_.active_voters.push_back(voter.name);
}

// ============================================================================
// Per-Symbol Unit
// ============================================================================

bool ScanEngine::scan_symbol(const Symbol& symbol,
                             const std::vector<strategy::Voter>& voters,
                             const std::shared_ptr<market::IMarketDataSource>& source,
                             Timestamp at) {
    if (stopping_.load()) {
        return false;
    }

    WeightedSignal signal;
    signal.symbol = symbol;
    signal.timestamp = at;

    try {
        auto candles = source->fetch_candles(symbol, config_.candle_count);
        if (candles.empty()) {
            throw DataSourceUnavailable(fmt::format("no candles for {}", symbol.view()));
        }

        const double price = candles.back().close;
        auto aggregate = aggregator_.aggregate(candles, voters);

        signal.votes = aggregate.ballots;
        signal.score = aggregate.score;
        signal.decision = aggregate.decision;
        signal.confidence = aggregate.confidence;
        signal.price = price;

        // Exit evaluation happens-before entry, never both in one tick
        if (auto position = ledger_.get_position(symbol)) {
            manage_position(*position, aggregate, price, at, signal);
        } else if (aggregate.decision != Decision::Hold) {
            try_open(candles, aggregate, price, at, signal);
        } else {
            signal.action = SignalAction::Hold;
        }
        clear_error(symbol);

    } catch (const DataSourceUnavailable& e) {
        LOG_WARN("{}: data unavailable: {}", symbol.view(), e.what());
        signal.decision = Decision::Hold;
        signal.action = SignalAction::DataUnavailable;
        signal.detail = e.what();
        record_error(symbol, e.what());
    } catch (const EngineError& e) {
        LOG_ERROR("{}: {} during scan: {}", symbol.view(), to_string(e.code()), e.what());
        signal.action = SignalAction::Hold;
        signal.decision = Decision::Hold;
        signal.detail = e.what();
        record_error(symbol, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("{}: scan failed: {}", symbol.view(), e.what());
        signal.action = SignalAction::Hold;
        signal.decision = Decision::Hold;
        signal.detail = e.what();
        record_error(symbol, e.what());
    }

    LOG_TRACE("{} {} score {:.2f} conf {:.2f} -> {}",
              symbol.view(), to_string(signal.decision), signal.score, signal.confidence,
              to_string(signal.action));
    signals_.push(std::move(signal));
    return true;
}

void ScanEngine::manage_position(const order::Position& position,
                                 const strategy::AggregateResult& aggregate,
                                 double price, Timestamp at, WeightedSignal& signal) {
    order::Position tracked = position;
    // Only the money manager's exit rules close a live position; an opposing
    // consensus is logged with the signal but does not exit
    const auto exit_reason = money_.evaluate_exit(tracked, price);

    signal.quantity = position.quantity;
    signal.stop_loss = position.stop_loss;
    signal.take_profit = position.take_profit;

    if (!exit_reason) {
        ledger_.update_trailing_peak(position.symbol, tracked.trailing_peak);
        signal.action = SignalAction::AlreadyInPosition;
        signal.detail = fmt::format("{} x{} @ {:.2f}, unrealized {:.2f}",
                                    to_string(position.side), position.quantity,
                                    position.entry_price, position.unrealized_pnl(price));
        if (aggregate.decision != Decision::Hold && side_of(aggregate.decision) != position.side) {
            signal.detail += fmt::format(", opposing {} consensus held", to_string(aggregate.decision));
        }
        return;
    }

    const auto report = router_.submit(position.symbol, opposite(position.side),
                                       position.quantity, price);
    if (!report.filled) {
        ledger_.update_trailing_peak(position.symbol, tracked.trailing_peak);
        signal.action = SignalAction::ExecutionFailed;
        signal.detail = fmt::format("exit ({}) rejected: {}", to_string(*exit_reason), report.message);
        LOG_WARN("{}: {}", position.symbol.view(), signal.detail);
        return;
    }

    const double exit_price = report.fill_price > 0.0 ? report.fill_price : price;
    const auto trade = ledger_.close_position(position.symbol, exit_price, *exit_reason, at);
    const double pnl = trade.pnl.value_or(0.0);
    {
        std::lock_guard<std::mutex> lock(risk_mutex_);
        money_.record_close(risk_, pnl);
    }

    signal.action = SignalAction::PositionClosed;
    signal.detail = fmt::format("{} pnl {:.2f}", to_string(*exit_reason), pnl);
}

void ScanEngine::try_open(std::span<const Candle> candles,
                          const strategy::AggregateResult& aggregate,
                          double price, Timestamp at, WeightedSignal& signal) {
    const Side side = side_of(aggregate.decision);

    double atr = 0.0;
    try {
        atr = strategy::latest_atr(candles, config_.money.atr_period);
    } catch (const InsufficientData& e) {
        signal.decision = Decision::Hold;
        signal.action = SignalAction::Suppressed;
        signal.detail = e.what();
        return;
    }

    // Sizing, gate check, open and counter update are one step under the risk
    // mutex so concurrent opens never commit the same free capital twice
    std::lock_guard<std::mutex> lock(risk_mutex_);

    const auto levels = money_.levels(price, side, atr);
    const auto sizing = money_.size_position(available_capital(), price, atr, risk_metrics());
    signal.quantity = sizing.quantity;
    signal.stop_loss = levels.stop_loss;
    signal.take_profit = levels.take_profit;

    if (sizing.suppressed()) {
        signal.decision = Decision::Hold;
        signal.action = SignalAction::Suppressed;
        signal.detail = sizing.reason;
        return;
    }

    const auto gate = money_.check_gate(risk_, signal.symbol);
    if (!gate.approved()) {
        signal.decision = Decision::Hold;
        signal.action = SignalAction::Blocked;
        signal.detail = fmt::format("{}: {}", to_string(ErrorCode::RiskLimitExceeded), gate.reason);
        LOG_INFO("{} blocked: {}", signal.symbol.view(), gate.reason);
        return;
    }

    order::OpenRequest request;
    request.symbol = signal.symbol;
    request.side = side;
    request.price = price;
    request.quantity = sizing.quantity;
    request.stop_loss = levels.stop_loss;
    request.take_profit = levels.take_profit;
    request.strategy_id = agreeing_voters(aggregate);
    request.at = at;

    order::OpenResult opened;
    try {
        opened = ledger_.open_position(request, [this](const order::Trade& trade) {
            return router_.submit(trade.symbol, trade.side, trade.quantity, trade.price);
        });
    } catch (const AlreadyOpen& e) {
        signal.action = SignalAction::AlreadyInPosition;
        signal.detail = e.what();
        return;
    }

    if (!opened.opened()) {
        signal.action = SignalAction::ExecutionFailed;
        signal.detail = opened.trade.exit_reason;
        return;
    }

    money_.record_open(risk_, signal.symbol);
    signal.action = SignalAction::TradeExecuted;
    signal.detail = fmt::format("trade #{} {} x{} @ {:.2f} SL {:.2f} TP {:.2f}",
                                opened.trade.id, to_string(side), sizing.quantity,
                                opened.trade.price, levels.stop_loss, levels.take_profit);
    LOG_INFO("{} opened: {}", signal.symbol.view(), signal.detail);
}

void ScanEngine::record_error(const Symbol& symbol, const std::string& message) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    snapshot_.last_errors[symbol] = message;
}

void ScanEngine::clear_error(const Symbol& symbol) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    snapshot_.last_errors.erase(symbol);
}

// ============================================================================
// Data Source Binding
// ============================================================================

std::unique_ptr<market::IMarketDataSource> ScanEngine::make_source(
    const std::optional<storage::Credentials>& credentials) {
    if (source_factory_) {
        return source_factory_(credentials);
    }

    if (credentials) {
        auto live = market::LiveDataSource::create(config_.broker, *credentials);
        try {
            live->connect();
            return live;
        } catch (const DataSourceUnavailable& e) {
            LOG_WARN("Brokerage connection failed ({}), running in SIMULATION mode", e.what());
        }
    }
    return std::make_unique<market::SimulatedDataSource>(config_.simulation, clock_);
}

std::shared_ptr<market::IMarketDataSource> ScanEngine::data_source() {
    std::string user;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (source_) return source_;
        user = snapshot_.user_id;
    }

    std::shared_ptr<market::IMarketDataSource> source = make_source(credentials_.credentials_for(user));

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!source_) {
        source_ = std::move(source);
        snapshot_.mode = source_->mode();
    }
    return source_;
}

// ============================================================================
// Queries
// ============================================================================

EngineSnapshot ScanEngine::snapshot() const {
    EngineSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        snap = snapshot_;
    }
    {
        std::lock_guard<std::mutex> lock(risk_mutex_);
        snap.trades_today = risk_.total_trades();
        snap.daily_pnl = risk_.daily_pnl;
    }
    snap.running = running_.load();
    snap.signals_in_memory = signals_.size();
    return snap;
}

std::vector<WeightedSignal> ScanEngine::signals(std::optional<Symbol> symbol, size_t limit) const {
    const size_t n = limit == 0 ? signals_.capacity() : limit;
    if (!symbol) {
        return signals_.latest(n);
    }
    return signals_.latest(n, [&](const WeightedSignal& s) { return s.symbol == *symbol; });
}

risk::PerformanceStats ScanEngine::risk_metrics() const {
    const auto pnl = ledger_.realized_pnl();
    return risk::compute_performance(config_.initial_capital, pnl);
}

double ScanEngine::capital() const {
    const auto pnl = ledger_.realized_pnl();
    return std::accumulate(pnl.begin(), pnl.end(), config_.initial_capital);
}

double ScanEngine::available_capital() const {
    double committed = 0.0;
    for (const auto& position : ledger_.open_positions()) {
        committed += position.entry_price * static_cast<double>(position.quantity);
    }
    return std::max(capital() - committed, 0.0);
}

risk::RiskState ScanEngine::risk_state() const {
    std::lock_guard<std::mutex> lock(risk_mutex_);
    return risk_;
}

SignalPreview ScanEngine::preview(const Symbol& symbol) {
    const auto source = data_source();

    std::vector<strategy::Voter> voters;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        voters = voters_;
    }
    if (voters.empty()) {
        // Not started yet: preview against the stored strategies
        try {
            voters = storage::build_voters(strategies_.list_enabled_strategies(),
                                           config_.market_hours.utc_offset);
        } catch (const PersistenceFailure& e) {
            LOG_WARN("Preview for {} without strategies: {}", symbol.view(), e.what());
        }
    }

    const auto candles = source->fetch_candles(symbol, config_.candle_count);
    if (candles.empty()) {
        throw DataSourceUnavailable(fmt::format("no candles for {}", symbol.view()));
    }
    const std::span<const Candle> window(candles);

    SignalPreview preview;
    preview.symbol = symbol;
    preview.at = clock_();
    preview.price = candles.back().close;
    preview.aggregate = aggregator_.aggregate(window, voters);
    preview.open_position = ledger_.get_position(symbol);

    auto& ind = preview.indicators;
    ind.sma_short = optional_reading([&] { return strategy::trailing_sma(window, 20).current; });
    ind.sma_long = optional_reading([&] { return strategy::trailing_sma(window, 50).current; });
    ind.rsi = optional_reading([&] { return strategy::trailing_rsi(window, 14).current; });
    ind.macd = optional_reading([&] { return strategy::trailing_macd(window, 12, 26, 9).current; });
    ind.bollinger = optional_reading([&] { return strategy::trailing_bollinger(window, 20, 2.0).current; });
    ind.atr = optional_reading([&] { return strategy::latest_atr(window, config_.money.atr_period); });
    ind.adx = optional_reading([&] { return strategy::latest_adx(window, 14); });
    ind.stochastic = optional_reading([&] { return strategy::trailing_stochastic(window, 14).current; });
    ind.williams_r = optional_reading([&] { return strategy::latest_williams_r(window, 14); });
    ind.vwap = optional_reading([&] {
        return strategy::trailing_vwap(window, config_.market_hours.utc_offset).current;
    });
    ind.supertrend = optional_reading([&] { return strategy::trailing_supertrend(window, 10, 3.0).current; });
    ind.patterns = optional_reading([&] { return strategy::detect_patterns(window); });

    if (preview.aggregate.decision == Decision::Hold) {
        preview.sizing_note = "no directional decision";
    } else if (!ind.atr) {
        preview.sizing_note = "not enough candles for ATR";
    } else {
        const Side side = side_of(preview.aggregate.decision);
        const auto levels = money_.levels(preview.price, side, *ind.atr);
        const auto sizing = money_.size_position(available_capital(), preview.price, *ind.atr, risk_metrics());
        preview.quantity = sizing.quantity;
        preview.stop_loss = levels.stop_loss;
        preview.take_profit = levels.take_profit;
        preview.sizing_note = sizing.reason;
    }
    return preview;
}

}  // namespace quorum::engine
