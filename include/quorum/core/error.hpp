#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Error Taxonomy
// ============================================================================
// Every recoverable failure the engine distinguishes carries an ErrorCode
// Per-symbol errors are caught at the symbol boundary and never abort a tick
// ============================================================================

#include <stdexcept>
#include <string>
#include <string_view>

namespace quorum {

enum class ErrorCode {
    InsufficientData,       // Indicator window too short, treated as Hold
    DataSourceUnavailable,  // Market data fetch failed, symbol skipped this tick
    AlreadyOpen,            // Ledger already holds a position for the symbol
    NoOpenPosition,         // Close requested with nothing open
    RiskLimitExceeded,      // Daily loss or trade-count gate tripped
    PersistenceFailure,     // External store write failed
    Configuration           // Fatal misconfiguration at start
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InsufficientData:      return "InsufficientData";
        case ErrorCode::DataSourceUnavailable: return "DataSourceUnavailable";
        case ErrorCode::AlreadyOpen:           return "AlreadyOpen";
        case ErrorCode::NoOpenPosition:        return "NoOpenPosition";
        case ErrorCode::RiskLimitExceeded:     return "RiskLimitExceeded";
        case ErrorCode::PersistenceFailure:    return "PersistenceFailure";
        case ErrorCode::Configuration:         return "Configuration";
    }
    return "Unknown";
}

/// Base exception for all engine failures
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class InsufficientData : public EngineError {
public:
    explicit InsufficientData(const std::string& message)
        : EngineError(ErrorCode::InsufficientData, message) {}
};

class DataSourceUnavailable : public EngineError {
public:
    explicit DataSourceUnavailable(const std::string& message)
        : EngineError(ErrorCode::DataSourceUnavailable, message) {}
};

class AlreadyOpen : public EngineError {
public:
    explicit AlreadyOpen(const std::string& message)
        : EngineError(ErrorCode::AlreadyOpen, message) {}
};

class NoOpenPosition : public EngineError {
public:
    explicit NoOpenPosition(const std::string& message)
        : EngineError(ErrorCode::NoOpenPosition, message) {}
};

class PersistenceFailure : public EngineError {
public:
    explicit PersistenceFailure(const std::string& message)
        : EngineError(ErrorCode::PersistenceFailure, message) {}
};

class ConfigurationError : public EngineError {
public:
    explicit ConfigurationError(const std::string& message)
        : EngineError(ErrorCode::Configuration, message) {}
};

}  // namespace quorum
