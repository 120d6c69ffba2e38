#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Position Ledger
// ============================================================================
// Authoritative record of open positions and the trade log
// At most one open position per symbol. Every mutation is atomic under the
// ledger mutex and written through to the trade store. Failed writes are
// queued and replayed in order by retry_pending_writes(). A queued write is
// replaced in place by a later write to the same trade or position, and the
// queue is capped; past the cap the oldest write is dropped and logged
// ============================================================================

#include "quorum/order/order_router.hpp"
#include "quorum/order/records.hpp"
#include "quorum/storage/trade_store.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quorum::order {

struct OpenRequest {
    Symbol symbol;
    Side side = Side::Buy;
    double price = 0.0;
    int64_t quantity = 0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    std::string strategy_id;
    Timestamp at{};
};

struct OpenResult {
    Trade trade;                       // Executed or Failed
    std::optional<Position> position;  // Set only when the order filled

    [[nodiscard]] bool opened() const noexcept { return position.has_value(); }
};

class PositionLedger {
public:
    /// Routes the pending trade; called with the ledger lock held
    using Executor = std::function<ExecutionReport(const Trade&)>;

    static constexpr size_t kDefaultMaxPendingWrites = 1024;

    /// Hydrates open positions and trades from the store.
    /// Throws PersistenceFailure if the store cannot be read.
    explicit PositionLedger(storage::ITradeStore& store,
                            size_t max_pending_writes = kDefaultMaxPendingWrites);

    PositionLedger(const PositionLedger&) = delete;
    PositionLedger& operator=(const PositionLedger&) = delete;

    /// Create a Pending trade, execute it, then open the position on fill.
    /// A rejected order leaves a Failed trade and no position.
    /// Throws AlreadyOpen if the symbol already has a position.
    OpenResult open_position(const OpenRequest& request, const Executor& execute);

    /// Close the open position, set pnl and exit fields on its trade.
    /// Throws NoOpenPosition.
    Trade close_position(const Symbol& symbol, double exit_price, ExitReason reason, Timestamp at);

    /// Move the trailing peak in the favorable direction only.
    /// Returns false when no position is open or the peak did not move.
    bool update_trailing_peak(const Symbol& symbol, double price);

    [[nodiscard]] std::optional<Position> get_position(const Symbol& symbol) const;
    [[nodiscard]] bool has_position(const Symbol& symbol) const;
    [[nodiscard]] std::vector<Position> open_positions() const;
    [[nodiscard]] size_t open_count() const;

    /// Trade log ordered by id
    [[nodiscard]] std::vector<Trade> trades() const;

    /// Realized pnl of closed trades, in close order
    [[nodiscard]] std::vector<double> realized_pnl() const;

    /// Replay queued store writes. Returns how many are still pending
    size_t retry_pending_writes();
    [[nodiscard]] size_t pending_writes() const;

    /// Queued writes discarded because the queue was full
    [[nodiscard]] size_t dropped_writes() const;

private:
    using StoreWrite = std::function<void(storage::ITradeStore&)>;

    struct PendingWrite {
        std::string key;    // Record the write targets, "trade:<id>" or "position:<symbol>"
        std::string what;
        StoreWrite write;
    };

    void persist_locked(std::string key, StoreWrite write, std::string_view what);
    size_t flush_pending_locked();

    storage::ITradeStore& store_;
    mutable std::mutex mutex_;
    std::unordered_map<Symbol, Position> positions_;
    std::map<uint64_t, Trade> trades_;
    std::vector<double> realized_;
    std::deque<PendingWrite> pending_;
    size_t max_pending_writes_;
    size_t dropped_writes_ = 0;
    uint64_t next_trade_id_ = 1;
};

}  // namespace quorum::order
