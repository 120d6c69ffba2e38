// ============================================================================
// QUORUM SCAN ENGINE - Strategy Store Implementation
// ============================================================================

#include "quorum/storage/strategy_store.hpp"
#include "quorum/core/error.hpp"
#include "quorum/utils/logger.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace quorum::storage {

std::optional<strategy::VoterKind> StrategyRecord::resolved_kind() const {
    if (kind) return kind;
    return strategy::voter_kind_from_name(name);
}

// ============================================================================
// InMemoryStrategyStore
// ============================================================================

InMemoryStrategyStore::InMemoryStrategyStore(std::vector<StrategyRecord> records)
    : records_(std::move(records)) {}

std::vector<StrategyRecord> InMemoryStrategyStore::list_enabled_strategies() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StrategyRecord> enabled;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(enabled),
                 [](const StrategyRecord& r) { return r.enabled; });
    return enabled;
}

void InMemoryStrategyStore::upsert(StrategyRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const StrategyRecord& r) { return r.id == record.id; });
    if (it != records_.end()) {
        *it = std::move(record);
    } else {
        records_.push_back(std::move(record));
    }
}

bool InMemoryStrategyStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto before = records_.size();
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [&](const StrategyRecord& r) { return r.id == id; }),
                   records_.end());
    return records_.size() != before;
}

bool InMemoryStrategyStore::set_enabled(const std::string& id, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& record : records_) {
        if (record.id == id) {
            record.enabled = enabled;
            return true;
        }
    }
    return false;
}

// ============================================================================
// YamlStrategyStore
// ============================================================================

YamlStrategyStore::YamlStrategyStore(std::string path) : path_(std::move(path)) {}

std::vector<StrategyRecord> YamlStrategyStore::list_enabled_strategies() {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path_);
    } catch (const YAML::Exception& e) {
        throw PersistenceFailure(fmt::format("cannot read strategies '{}': {}", path_, e.what()));
    }

    std::vector<StrategyRecord> records;
    const auto list = root["strategies"];
    if (!list) return records;
    if (!list.IsSequence()) {
        throw PersistenceFailure(fmt::format("'{}': strategies must be a list", path_));
    }

    size_t index = 0;
    for (const auto& node : list) {
        ++index;
        try {
            StrategyRecord record;
            record.enabled = node["enabled"].as<bool>(true);
            if (!record.enabled) continue;

            record.name = node["name"].as<std::string>("");
            record.id = node["id"].as<std::string>(fmt::format("strategy-{}", index));

            if (node["kind"]) {
                const auto key = node["kind"].as<std::string>();
                record.kind = strategy::parse_voter_kind(key);
                if (!record.kind) {
                    LOG_WARN("Strategy '{}': unknown kind '{}'", record.id, key);
                    continue;
                }
            }
            if (node["weight"]) {
                record.weight = node["weight"].as<double>();
            }
            if (const auto params = node["params"]; params && params.IsMap()) {
                for (const auto& entry : params) {
                    record.params[entry.first.as<std::string>()] = entry.second.as<double>();
                }
            }
            records.push_back(std::move(record));
        } catch (const YAML::Exception& e) {
            LOG_WARN("'{}': strategy #{} skipped: {}", path_, index, e.what());
        }
    }
    return records;
}

// ============================================================================
// Voter Binding
// ============================================================================

std::vector<StrategyRecord> default_strategy_records() {
    using strategy::VoterKind;
    std::vector<StrategyRecord> records;
    for (auto kind : {VoterKind::SmaCross, VoterKind::Rsi, VoterKind::Macd, VoterKind::SuperTrend}) {
        StrategyRecord record;
        record.id = fmt::format("default-{}", strategy::to_string(kind));
        record.name = std::string(strategy::to_string(kind));
        record.kind = kind;
        records.push_back(std::move(record));
    }
    return records;
}

std::vector<strategy::Voter> build_voters(const std::vector<StrategyRecord>& records,
                                          std::chrono::minutes session_offset) {
    std::vector<strategy::Voter> voters;
    voters.reserve(records.size());

    for (const auto& record : records) {
        const auto kind = record.resolved_kind();
        if (!kind) {
            LOG_WARN("Strategy '{}' ({}): no voter matches its name", record.id, record.name);
            continue;
        }

        strategy::Voter voter;
        voter.id = record.id;
        voter.name = record.name.empty() ? std::string(strategy::to_string(*kind)) : record.name;
        voter.weight = record.weight.value_or(strategy::default_weight(*kind));
        try {
            voter.params = strategy::make_params(*kind, record.params);
        } catch (const std::invalid_argument& e) {
            LOG_WARN("Strategy '{}' skipped: {}", record.id, e.what());
            continue;
        }
        if (auto* vwap = std::get_if<strategy::VwapParams>(&voter.params)) {
            vwap->session_offset = session_offset;
        }
        voters.push_back(std::move(voter));
    }
    return voters;
}

}  // namespace quorum::storage
