#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - Logger
// ============================================================================
// Process-wide logging facade over spdlog
// Messages use fmt syntax: LOG_INFO("scanned {} symbols", n)
// ============================================================================

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace quorum::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Parse "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off"
/// Unknown names map to Info
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file = "quorum_engine.log";  // Empty disables the file sink
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

    bool async = true;
    size_t queue_size = 8192;
    size_t flush_interval_ms = 1000;

    // Rotating file sink
    size_t max_file_size_mb = 100;
    size_t max_files = 10;
};

// ============================================================================
// Logger Interface
// ============================================================================

class Logger {
public:
    /// Install sinks per config. Before this, logging goes to stdout
    static void initialize(const LogConfig& config = LogConfig{});

    /// Flush and drop all sinks
    static void shutdown();

    /// Get the global logger instance
    static Logger& instance();

    void set_level(LogLevel level);

    [[nodiscard]] bool should_log(LogLevel level) const;

    template <typename... Args>
    void trace(std::string_view fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(std::string_view fmt, Args&&... args) {
        log(LogLevel::Critical, fmt, std::forward<Args>(args)...);
    }

    /// Flush all pending logs
    void flush();

private:
    Logger();
    ~Logger();

    template <typename... Args>
    void log(LogLevel level, std::string_view fmt, Args&&... args) {
        if (!should_log(level)) return;
        write(level, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
    }

    void write(LogLevel level, const std::string& message);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG_TRACE(...) ::quorum::utils::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::quorum::utils::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::quorum::utils::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...) ::quorum::utils::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::quorum::utils::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::quorum::utils::Logger::instance().critical(__VA_ARGS__)

// ============================================================================
// Scoped Timer for Performance Measurement
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(std::string_view name, LogLevel level = LogLevel::Debug)
        : name_(name), level_(level), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto duration =
            std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        log_duration(duration);
    }

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    void log_duration(int64_t microseconds) const;

    std::string_view name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

#define QUORUM_CONCAT_INNER(a, b) a##b
#define QUORUM_CONCAT(a, b) QUORUM_CONCAT_INNER(a, b)
#define SCOPED_TIMER(name) ::quorum::utils::ScopedTimer QUORUM_CONCAT(_timer_, __LINE__)(name)

}  // namespace quorum::utils
