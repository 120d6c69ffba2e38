// ============================================================================
// QUORUM SCAN ENGINE - Position Ledger Implementation
// ============================================================================

#include "quorum/order/position_ledger.hpp"
#include "quorum/core/error.hpp"
#include "quorum/utils/logger.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace quorum::order {

namespace {

std::string trade_key(uint64_t id) {
    return fmt::format("trade:{}", id);
}

std::string position_key(const Symbol& symbol) {
    return fmt::format("position:{}", symbol.view());
}

}  // namespace

PositionLedger::PositionLedger(storage::ITradeStore& store, size_t max_pending_writes)
    : store_(store)
    , max_pending_writes_(std::max<size_t>(max_pending_writes, 1)) {
    auto stored_trades = store_.list_trades();
    auto stored_positions = store_.list_open_positions();

    std::vector<const Trade*> closed;
    for (auto& trade : stored_trades) {
        next_trade_id_ = std::max(next_trade_id_, trade.id + 1);
        trades_[trade.id] = std::move(trade);
    }
    for (const auto& [id, trade] : trades_) {
        if (trade.is_closed()) closed.push_back(&trade);
    }
    std::stable_sort(closed.begin(), closed.end(), [](const Trade* a, const Trade* b) {
        return a->exit_timestamp.value_or(a->timestamp) < b->exit_timestamp.value_or(b->timestamp);
    });
    for (const auto* trade : closed) realized_.push_back(*trade->pnl);

    for (auto& position : stored_positions) {
        positions_[position.symbol] = std::move(position);
    }

    if (!positions_.empty() || !trades_.empty()) {
        LOG_INFO("Ledger restored {} open positions, {} trades ({} closed)",
                 positions_.size(), trades_.size(), realized_.size());
    }
}

// ============================================================================
// Mutations
// ============================================================================

OpenResult PositionLedger::open_position(const OpenRequest& request, const Executor& execute) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (positions_.count(request.symbol) > 0) {
        throw AlreadyOpen(fmt::format("position already open for {}", request.symbol.view()));
    }

    Trade trade;
    trade.id = next_trade_id_++;
    trade.symbol = request.symbol;
    trade.side = request.side;
    trade.quantity = request.quantity;
    trade.price = request.price;
    trade.status = TradeStatus::Pending;
    trade.timestamp = request.at;
    trade.strategy_id = request.strategy_id;

    ExecutionReport report;
    try {
        report = execute(trade);
    } catch (const std::exception& e) {
        report.filled = false;
        report.message = e.what();
    }

    OpenResult result;
    if (!report.filled) {
        trade.status = TradeStatus::Failed;
        trade.exit_reason = report.message;
        trades_[trade.id] = trade;
        LOG_WARN("Order for {} failed: {}", request.symbol.view(), report.message);
        persist_locked(trade_key(trade.id),
                       [trade](storage::ITradeStore& s) { s.record_trade(trade); },
                       "failed trade");
        result.trade = std::move(trade);
        return result;
    }

    trade.status = TradeStatus::Executed;
    if (report.fill_price > 0.0) trade.price = report.fill_price;

    Position position;
    position.symbol = request.symbol;
    position.side = request.side;
    position.entry_price = trade.price;
    position.quantity = request.quantity;
    position.stop_loss = request.stop_loss;
    position.take_profit = request.take_profit;
    position.trailing_peak = trade.price;
    position.opened_at = request.at;
    position.strategy_id = request.strategy_id;
    position.trade_id = trade.id;

    trades_[trade.id] = trade;
    positions_[position.symbol] = position;

    persist_locked(trade_key(trade.id),
                   [trade](storage::ITradeStore& s) { s.record_trade(trade); }, "trade");
    persist_locked(position_key(position.symbol),
                   [position](storage::ITradeStore& s) { s.save_position(position); }, "position");

    result.trade = std::move(trade);
    result.position = std::move(position);
    return result;
}

Trade PositionLedger::close_position(const Symbol& symbol, double exit_price,
                                     ExitReason reason, Timestamp at) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        throw NoOpenPosition(fmt::format("no open position for {}", symbol.view()));
    }
    const Position position = it->second;
    positions_.erase(it);

    const double pnl = position.unrealized_pnl(exit_price);

    auto trade_it = trades_.find(position.trade_id);
    if (trade_it == trades_.end()) {
        // Position restored without its trade record
        Trade trade;
        trade.id = position.trade_id != 0 ? position.trade_id : next_trade_id_++;
        trade.symbol = position.symbol;
        trade.side = position.side;
        trade.quantity = position.quantity;
        trade.price = position.entry_price;
        trade.status = TradeStatus::Executed;
        trade.timestamp = position.opened_at;
        trade.strategy_id = position.strategy_id;
        trade_it = trades_.emplace(trade.id, std::move(trade)).first;
    }

    Trade& trade = trade_it->second;
    trade.pnl = pnl;
    trade.exit_price = exit_price;
    trade.exit_timestamp = at;
    trade.exit_reason = std::string(to_string(reason));
    realized_.push_back(pnl);

    const Trade closed = trade;
    persist_locked(trade_key(closed.id),
                   [closed](storage::ITradeStore& s) { s.record_trade(closed); }, "closed trade");
    persist_locked(position_key(symbol),
                   [symbol](storage::ITradeStore& s) { s.remove_position(symbol); },
                   "position removal");

    LOG_INFO("Closed {} {} x{} entry {:.2f} exit {:.2f} pnl {:.2f} ({})",
             to_string(position.side), symbol.view(), position.quantity,
             position.entry_price, exit_price, pnl, to_string(reason));
    return closed;
}

bool PositionLedger::update_trailing_peak(const Symbol& symbol, double price) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = positions_.find(symbol);
    if (it == positions_.end()) return false;

    Position& position = it->second;
    const bool improved = position.side == Side::Buy ? price > position.trailing_peak
                                                     : price < position.trailing_peak;
    if (!improved) return false;

    position.trailing_peak = price;
    const Position snapshot = position;
    persist_locked(position_key(symbol),
                   [snapshot](storage::ITradeStore& s) { s.save_position(snapshot); },
                   "trailing peak");
    return true;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Position> PositionLedger::get_position(const Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

bool PositionLedger::has_position(const Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.count(symbol) > 0;
}

std::vector<Position> PositionLedger::open_positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& [symbol, position] : positions_) out.push_back(position);
    std::sort(out.begin(), out.end(),
              [](const Position& a, const Position& b) { return a.symbol < b.symbol; });
    return out;
}

size_t PositionLedger::open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

std::vector<Trade> PositionLedger::trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Trade> out;
    out.reserve(trades_.size());
    for (const auto& [id, trade] : trades_) out.push_back(trade);
    return out;
}

std::vector<double> PositionLedger::realized_pnl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return realized_;
}

// ============================================================================
// Write-Through
// ============================================================================

void PositionLedger::persist_locked(std::string key, StoreWrite write, std::string_view what) {
    // Each write carries the full record, so a newer one supersedes a queued one
    auto queued = std::find_if(pending_.begin(), pending_.end(),
                               [&](const PendingWrite& p) { return p.key == key; });
    if (queued != pending_.end()) {
        LOG_DEBUG("Queued store write ({}) superseded by {}", queued->what, what);
        queued->what = std::string(what);
        queued->write = std::move(write);
    } else {
        // Queued writes go first so the store sees mutations in order
        pending_.push_back(PendingWrite{std::move(key), std::string(what), std::move(write)});
        if (pending_.size() > max_pending_writes_) {
            ++dropped_writes_;
            LOG_ERROR("Store write queue full ({}), dropping {} for {} ({} dropped so far)",
                      max_pending_writes_, pending_.front().what, pending_.front().key,
                      dropped_writes_);
            pending_.pop_front();
        }
    }
    flush_pending_locked();
}

size_t PositionLedger::flush_pending_locked() {
    while (!pending_.empty()) {
        auto& next = pending_.front();
        try {
            next.write(store_);
        } catch (const PersistenceFailure& e) {
            LOG_ERROR("Store write ({}) failed, {} queued for retry: {}",
                      next.what, pending_.size(), e.what());
            break;
        }
        pending_.pop_front();
    }
    return pending_.size();
}

size_t PositionLedger::retry_pending_writes() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) return 0;
    const size_t before = pending_.size();
    const size_t remaining = flush_pending_locked();
    if (remaining < before) {
        LOG_INFO("Replayed {} queued store writes, {} pending", before - remaining, remaining);
    }
    return remaining;
}

size_t PositionLedger::pending_writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t PositionLedger::dropped_writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_writes_;
}

}  // namespace quorum::order
