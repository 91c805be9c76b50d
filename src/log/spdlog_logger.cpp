#include "toolmux/log/spdlog_logger.hpp"

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <stdexcept>

namespace toolmux {

namespace {

// Loggers are never registered in spdlog's global registry, but names are
// still kept unique so several SpdlogLoggers can coexist in one process.
std::string next_logger_name(std::string_view prefix) {
    static std::atomic<std::uint64_t> sequence{0};
    return std::string(prefix) + "-" + std::to_string(sequence.fetch_add(1, std::memory_order_relaxed));
}

std::shared_ptr<spdlog::logger> configured(std::shared_ptr<spdlog::logger> logger, LogLevel level) {
    logger->set_level(SpdlogLogger::to_spdlog_level(level));
    logger->set_pattern(SpdlogLogger::default_pattern);
    return logger;
}

std::shared_ptr<spdlog::details::thread_pool> shared_async_pool(std::size_t queue_size) {
    static std::once_flag once;
    static std::shared_ptr<spdlog::details::thread_pool> pool;
    std::call_once(once, [queue_size]() {
        pool = std::make_shared<spdlog::details::thread_pool>(queue_size, 1);
    });
    return pool;
}

}  // namespace

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Fatal: return spdlog::level::critical;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

SpdlogLogger::SpdlogLogger(LogLevel min_level)
    : logger_(configured(
          std::make_shared<spdlog::logger>(
              next_logger_name("toolmux"),
              std::make_shared<spdlog::sinks::stdout_color_sink_mt>()),
          min_level))
    , min_level_(min_level)
{}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , min_level_(LogLevel::Info)
{
    if (logger_ == nullptr) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    min_level_ = from_spdlog_level(logger_->level());
}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(configured(
          std::make_shared<spdlog::logger>(next_logger_name("toolmux-multi"), sinks.begin(), sinks.end()),
          min_level))
    , min_level_(min_level)
{}

void SpdlogLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }
    logger_->log(
        spdlog::source_loc{
            record.location.file_name(),
            static_cast<int>(record.location.line()),
            record.location.function_name()
        },
        to_spdlog_level(record.level),
        "{}",
        record.message
    );
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return level_enabled(level, min_level_);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& filename, LogLevel min_level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename));
    return std::make_unique<SpdlogLogger>(std::move(sinks), min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(const std::string& filename, LogLevel min_level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename));
    return std::make_unique<SpdlogLogger>(std::move(sinks), min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(LogLevel min_level, std::size_t queue_size) {
    auto logger = std::make_shared<spdlog::async_logger>(
        next_logger_name("toolmux-async"),
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
        shared_async_pool(queue_size),
        spdlog::async_overflow_policy::block
    );
    return std::make_unique<SpdlogLogger>(configured(std::move(logger), min_level));
}

}  // namespace toolmux
