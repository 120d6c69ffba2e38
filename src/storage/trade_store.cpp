// ============================================================================
// QUORUM SCAN ENGINE - Trade Store Implementation
// ============================================================================

#include "quorum/storage/trade_store.hpp"
#include "quorum/core/error.hpp"
#include "quorum/utils/logger.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace quorum::storage {

namespace {

using nlohmann::json;

Side parse_side(const std::string& field) {
    if (field == "BUY") return Side::Buy;
    if (field == "SELL") return Side::Sell;
    throw std::invalid_argument(fmt::format("unknown side '{}'", field));
}

order::TradeStatus parse_status(const std::string& field) {
    if (field == "PENDING") return order::TradeStatus::Pending;
    if (field == "EXECUTED") return order::TradeStatus::Executed;
    if (field == "FAILED") return order::TradeStatus::Failed;
    throw std::invalid_argument(fmt::format("unknown trade status '{}'", field));
}

template <typename Map>
auto values_of(const Map& map) {
    std::vector<typename Map::mapped_type> out;
    out.reserve(map.size());
    for (const auto& [key, value] : map) out.push_back(value);
    return out;
}

}  // namespace

// ============================================================================
// Record Codec
// ============================================================================

json encode_trade(const order::Trade& trade) {
    json record;
    record["type"] = "trade";
    record["id"] = trade.id;
    record["symbol"] = trade.symbol.str();
    record["side"] = std::string(to_string(trade.side));
    record["quantity"] = trade.quantity;
    record["price"] = trade.price;
    record["status"] = std::string(to_string(trade.status));
    record["ts_ms"] = to_epoch_ms(trade.timestamp);
    record["strategy"] = trade.strategy_id;
    if (trade.pnl) record["pnl"] = *trade.pnl;
    if (trade.exit_price) record["exit_price"] = *trade.exit_price;
    if (trade.exit_timestamp) record["exit_ms"] = to_epoch_ms(*trade.exit_timestamp);
    if (!trade.exit_reason.empty()) record["exit_reason"] = trade.exit_reason;
    return record;
}

json encode_position(const order::Position& position) {
    json record;
    record["type"] = "position";
    record["symbol"] = position.symbol.str();
    record["side"] = std::string(to_string(position.side));
    record["entry"] = position.entry_price;
    record["quantity"] = position.quantity;
    record["stop"] = position.stop_loss;
    record["target"] = position.take_profit;
    record["peak"] = position.trailing_peak;
    record["opened_ms"] = to_epoch_ms(position.opened_at);
    record["strategy"] = position.strategy_id;
    record["trade_id"] = position.trade_id;
    return record;
}

order::Trade decode_trade(const json& record) {
    order::Trade trade;
    trade.id = record.at("id").get<uint64_t>();
    trade.symbol = Symbol(record.at("symbol").get<std::string>());
    trade.side = parse_side(record.at("side").get<std::string>());
    trade.quantity = record.at("quantity").get<int64_t>();
    trade.price = record.at("price").get<double>();
    trade.status = parse_status(record.at("status").get<std::string>());
    trade.timestamp = from_epoch_ms(record.at("ts_ms").get<int64_t>());
    trade.strategy_id = record.value("strategy", std::string());
    if (record.contains("pnl")) trade.pnl = record["pnl"].get<double>();
    if (record.contains("exit_price")) trade.exit_price = record["exit_price"].get<double>();
    if (record.contains("exit_ms")) trade.exit_timestamp = from_epoch_ms(record["exit_ms"].get<int64_t>());
    trade.exit_reason = record.value("exit_reason", std::string());
    return trade;
}

order::Position decode_position(const json& record) {
    order::Position position;
    position.symbol = Symbol(record.at("symbol").get<std::string>());
    position.side = parse_side(record.at("side").get<std::string>());
    position.entry_price = record.at("entry").get<double>();
    position.quantity = record.at("quantity").get<int64_t>();
    position.stop_loss = record.at("stop").get<double>();
    position.take_profit = record.at("target").get<double>();
    position.trailing_peak = record.at("peak").get<double>();
    position.opened_at = from_epoch_ms(record.at("opened_ms").get<int64_t>());
    position.strategy_id = record.value("strategy", std::string());
    position.trade_id = record.at("trade_id").get<uint64_t>();
    return position;
}

// ============================================================================
// InMemoryTradeStore
// ============================================================================

void InMemoryTradeStore::record_trade(const order::Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    trades_[trade.id] = trade;
}

void InMemoryTradeStore::save_position(const order::Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_[position.symbol] = position;
}

void InMemoryTradeStore::remove_position(const Symbol& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_.erase(symbol);
}

std::vector<order::Position> InMemoryTradeStore::list_open_positions() {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_of(positions_);
}

std::vector<order::Trade> InMemoryTradeStore::list_trades() {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_of(trades_);
}

// ============================================================================
// JournalTradeStore
// ============================================================================

JournalTradeStore::JournalTradeStore(std::string path) : path_(std::move(path)) {
    replay();
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        throw PersistenceFailure(fmt::format("cannot open trade journal '{}' for append", path_));
    }
    LOG_INFO("Trade journal {} opened: {} trades, {} open positions",
             path_, trades_.size(), positions_.size());
}

JournalTradeStore::~JournalTradeStore() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

void JournalTradeStore::replay() {
    std::ifstream in(path_);
    if (!in.is_open()) {
        // First run, nothing to replay
        return;
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) continue;

        try {
            const auto record = json::parse(line);
            const auto type = record.at("type").get<std::string>();
            if (type == "trade") {
                auto trade = decode_trade(record);
                trades_[trade.id] = std::move(trade);
            } else if (type == "position") {
                auto position = decode_position(record);
                positions_[position.symbol] = std::move(position);
            } else if (type == "position_closed") {
                positions_.erase(Symbol(record.at("symbol").get<std::string>()));
            } else {
                throw std::invalid_argument(fmt::format("unknown record type '{}'", type));
            }
        } catch (const std::exception& e) {
            throw PersistenceFailure(fmt::format("trade journal '{}' line {}: {}",
                                                 path_, line_number, e.what()));
        }
    }
}

void JournalTradeStore::append(const json& record) {
    std::string line;
    try {
        line = record.dump();
    } catch (const json::exception& e) {
        throw PersistenceFailure(fmt::format("trade journal '{}' record not serializable: {}",
                                             path_, e.what()));
    }
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        throw PersistenceFailure(fmt::format("write to trade journal '{}' failed", path_));
    }
}

void JournalTradeStore::record_trade(const order::Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    append(encode_trade(trade));
    trades_[trade.id] = trade;
}

void JournalTradeStore::save_position(const order::Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    append(encode_position(position));
    positions_[position.symbol] = position;
}

void JournalTradeStore::remove_position(const Symbol& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    append(json{{"type", "position_closed"}, {"symbol", symbol.str()}});
    positions_.erase(symbol);
}

std::vector<order::Position> JournalTradeStore::list_open_positions() {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_of(positions_);
}

std::vector<order::Trade> JournalTradeStore::list_trades() {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_of(trades_);
}

}  // namespace quorum::storage
