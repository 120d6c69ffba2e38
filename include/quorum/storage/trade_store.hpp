#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Trade / Position Persistence
// ============================================================================
// Durable side of the ledger. Every method may throw PersistenceFailure
// ============================================================================

#include "quorum/order/records.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace quorum::storage {

class ITradeStore {
public:
    virtual ~ITradeStore() = default;

    /// Insert, or replace the record with the same id
    virtual void record_trade(const order::Trade& trade) = 0;

    /// Insert or replace the open position for its symbol
    virtual void save_position(const order::Position& position) = 0;

    virtual void remove_position(const Symbol& symbol) = 0;

    [[nodiscard]] virtual std::vector<order::Position> list_open_positions() = 0;

    /// All trades, ordered by id
    [[nodiscard]] virtual std::vector<order::Trade> list_trades() = 0;
};

// ============================================================================
// In-Memory Store
// ============================================================================

class InMemoryTradeStore : public ITradeStore {
public:
    void record_trade(const order::Trade& trade) override;
    void save_position(const order::Position& position) override;
    void remove_position(const Symbol& symbol) override;
    [[nodiscard]] std::vector<order::Position> list_open_positions() override;
    [[nodiscard]] std::vector<order::Trade> list_trades() override;

private:
    std::mutex mutex_;
    std::map<uint64_t, order::Trade> trades_;
    std::map<Symbol, order::Position> positions_;
};

// ============================================================================
// Append-Only Journal Store
// ============================================================================
// JSON Lines, one record per line, replayed on open:
//   {"type":"trade","id":1,"symbol":"TCS","side":"BUY","quantity":10,"price":3500.5,
//    "status":"EXECUTED","ts_ms":...,"strategy":"...","pnl":..,"exit_price":..,
//    "exit_ms":..,"exit_reason":"..."}
//   {"type":"position","symbol":"TCS","side":"SELL","entry":..,"quantity":..,"stop":..,
//    "target":..,"peak":..,"opened_ms":..,"strategy":"...","trade_id":1}
//   {"type":"position_closed","symbol":"TCS"}
// Later records supersede earlier ones. Unset optional fields are omitted.

class JournalTradeStore : public ITradeStore {
public:
    /// Opens (creating if needed) and replays the journal at `path`.
    /// Throws PersistenceFailure if the file cannot be opened or parsed.
    explicit JournalTradeStore(std::string path);
    ~JournalTradeStore() override;

    JournalTradeStore(const JournalTradeStore&) = delete;
    JournalTradeStore& operator=(const JournalTradeStore&) = delete;

    void record_trade(const order::Trade& trade) override;
    void save_position(const order::Position& position) override;
    void remove_position(const Symbol& symbol) override;
    [[nodiscard]] std::vector<order::Position> list_open_positions() override;
    [[nodiscard]] std::vector<order::Trade> list_trades() override;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    void replay();
    void append(const nlohmann::json& record);

    std::string path_;
    std::mutex mutex_;
    std::ofstream out_;
    std::map<uint64_t, order::Trade> trades_;
    std::map<Symbol, order::Position> positions_;
};

// Record codec, exposed for tests. Decoders throw nlohmann::json::exception
// or std::invalid_argument on malformed records
[[nodiscard]] nlohmann::json encode_trade(const order::Trade& trade);
[[nodiscard]] nlohmann::json encode_position(const order::Position& position);
[[nodiscard]] order::Trade decode_trade(const nlohmann::json& record);
[[nodiscard]] order::Position decode_position(const nlohmann::json& record);

}  // namespace quorum::storage
