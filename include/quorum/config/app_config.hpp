#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Application Configuration
// ============================================================================
// YAML configuration (config/config.yaml). Every key is optional and falls
// back to the built-in default
// ============================================================================

#include "quorum/engine/engine_config.hpp"
#include "quorum/storage/credential_store.hpp"
#include "quorum/utils/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <map>
#include <string>

namespace quorum::config {

struct AppConfig {
    engine::EngineConfig engine;
    std::string strategies_file = "config/strategies.yaml";   // Empty: built-in strategy set
    std::string journal_file = "data/trades.jsonl";         // Empty: in-memory trades
    std::map<std::string, storage::Credentials> users;
    utils::LogConfig logging;
};

/// Build from a parsed document. Throws ConfigurationError on values of the
/// wrong type or out of range
[[nodiscard]] AppConfig parse_config(const YAML::Node& root);

/// Load `path`. A missing or malformed file is logged and defaults are used.
/// QUORUM_API_KEY / QUORUM_API_SECRET, when both set, supply credentials
/// for the configured user
[[nodiscard]] AppConfig load_config(const std::string& path);

}  // namespace quorum::config
