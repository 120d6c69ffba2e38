// ============================================================================
// QUORUM SCAN ENGINE - Logger Implementation
// ============================================================================

#include "quorum/utils/logger.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace quorum::utils {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

constexpr const char* kLoggerName = "quorum";

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Logger::Impl
// ============================================================================

struct Logger::Impl {
    mutable std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger = make_default_logger();

    std::shared_ptr<spdlog::logger> get() const {
        std::lock_guard<std::mutex> lock(mutex);
        return logger;
    }

    void replace(std::shared_ptr<spdlog::logger> next) {
        std::lock_guard<std::mutex> lock(mutex);
        logger = std::move(next);
    }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::initialize(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files));
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            kLoggerName, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);
    spdlog::flush_every(std::chrono::milliseconds(config.flush_interval_ms));

    instance().impl_->replace(std::move(logger));
}

void Logger::shutdown() {
    auto& self = instance();
    if (auto logger = self.impl_->get()) {
        logger->flush();
    }
    self.impl_->replace(make_default_logger());
    spdlog::shutdown();
}

void Logger::set_level(LogLevel level) {
    impl_->get()->set_level(to_spdlog(level));
}

bool Logger::should_log(LogLevel level) const {
    return impl_->get()->should_log(to_spdlog(level));
}

void Logger::write(LogLevel level, const std::string& message) {
    impl_->get()->log(to_spdlog(level), message);
}

void Logger::flush() {
    impl_->get()->flush();
}

// ============================================================================
// ScopedTimer
// ============================================================================

void ScopedTimer::log_duration(int64_t microseconds) const {
    auto& logger = Logger::instance();
    if (!logger.should_log(level_)) return;

    switch (level_) {
        case LogLevel::Trace:    logger.trace("{} took {} us", name_, microseconds); break;
        case LogLevel::Debug:    logger.debug("{} took {} us", name_, microseconds); break;
        case LogLevel::Info:     logger.info("{} took {} us", name_, microseconds); break;
        case LogLevel::Warn:     logger.warn("{} took {} us", name_, microseconds); break;
        case LogLevel::Error:    logger.error("{} took {} us", name_, microseconds); break;
        case LogLevel::Critical: logger.critical("{} took {} us", name_, microseconds); break;
        case LogLevel::Off:      break;
    }
}

}  // namespace quorum::utils
