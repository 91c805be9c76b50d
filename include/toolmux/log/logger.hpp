#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,  // recoverable: dropped frame, reconnect scheduled
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool level_enabled(LogLevel level, LogLevel threshold) noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold);
}

// ─────────────────────────────────────────────────────────────────────────────
// LogRecord
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger - swappable backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string_view msg,
               std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }
    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }
    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }
    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }
    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }
    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, loc);
    }

    // Formatting is skipped entirely when the level is filtered out.
    template<typename... Args>
    void write_fmt(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void trace_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }
};

// Discards everything. Installed by default.
class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - stderr, optionally colored
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level_enabled(level, min_level_);
    }

    void set_level(LogLevel level) noexcept { min_level_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

    void set_colors_enabled(bool enabled) noexcept { colors_enabled_ = enabled; }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

// Passing nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define TOOLMUX_LOG_AT(level, msg) \
    do { if (::toolmux::get_logger().should_log(level)) \
         ::toolmux::get_logger().write(level, msg); } while(false)

#define TOOLMUX_LOG_TRACE(msg) TOOLMUX_LOG_AT(::toolmux::LogLevel::Trace, msg)
#define TOOLMUX_LOG_DEBUG(msg) TOOLMUX_LOG_AT(::toolmux::LogLevel::Debug, msg)
#define TOOLMUX_LOG_INFO(msg)  TOOLMUX_LOG_AT(::toolmux::LogLevel::Info, msg)
#define TOOLMUX_LOG_WARN(msg)  TOOLMUX_LOG_AT(::toolmux::LogLevel::Warn, msg)
#define TOOLMUX_LOG_ERROR(msg) TOOLMUX_LOG_AT(::toolmux::LogLevel::Error, msg)
#define TOOLMUX_LOG_FATAL(msg) TOOLMUX_LOG_AT(::toolmux::LogLevel::Fatal, msg)

}  // namespace toolmux
