#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Strategy Store
// ============================================================================
// Source of the enabled strategy records the engine turns into voters
// ============================================================================

#include "quorum/strategy/voters.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quorum::storage {

struct StrategyRecord {
    std::string id;
    std::string name;
    std::optional<strategy::VoterKind> kind;   // Derived from name when absent
    std::map<std::string, double> params;      // Overrides, keyed as make_params expects
    std::optional<double> weight;              // Default weight of the kind when absent
    bool enabled = true;

    /// Explicit kind, else the name keyword mapping
    [[nodiscard]] std::optional<strategy::VoterKind> resolved_kind() const;
};

class IStrategyStore {
public:
    virtual ~IStrategyStore() = default;

    /// Throws PersistenceFailure if the store cannot be read
    [[nodiscard]] virtual std::vector<StrategyRecord> list_enabled_strategies() = 0;
};

// ============================================================================
// In-Memory Store
// ============================================================================

class InMemoryStrategyStore : public IStrategyStore {
public:
    InMemoryStrategyStore() = default;
    explicit InMemoryStrategyStore(std::vector<StrategyRecord> records);

    [[nodiscard]] std::vector<StrategyRecord> list_enabled_strategies() override;

    /// Insert or replace by id
    void upsert(StrategyRecord record);
    bool remove(const std::string& id);
    bool set_enabled(const std::string& id, bool enabled);

private:
    std::mutex mutex_;
    std::vector<StrategyRecord> records_;
};

// ============================================================================
// YAML File Store
// ============================================================================
// strategies:
//   - id: sma-default
//     name: Moving Average Crossover
//     kind: ma_crossover          # optional
//     enabled: true               # optional, default true
//     weight: 1.0                 # optional
//     params: {shortWindow: 20, longWindow: 50}
//
// The file is re-read on every call so edits apply on the next tick.

class YamlStrategyStore : public IStrategyStore {
public:
    explicit YamlStrategyStore(std::string path);

    [[nodiscard]] std::vector<StrategyRecord> list_enabled_strategies() override;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/// Strategy set used when no strategies file is configured:
/// SMA crossover, RSI, MACD and SuperTrend with library defaults
[[nodiscard]] std::vector<StrategyRecord> default_strategy_records();

/// Bind records to voters. Records whose kind cannot be resolved or whose
/// params are invalid are skipped with a warning. `session_offset` is the
/// market-local offset from UTC applied to session-anchored voters (VWAP)
[[nodiscard]] std::vector<strategy::Voter> build_voters(const std::vector<StrategyRecord>& records,
                                                        std::chrono::minutes session_offset);

}  // namespace quorum::storage
