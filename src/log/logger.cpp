#include "toolmux/log/logger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace toolmux {

namespace {

namespace ansi {
constexpr std::string_view reset   = "\033[0m";
constexpr std::string_view dim     = "\033[90m";
constexpr std::string_view cyan    = "\033[36m";
constexpr std::string_view green   = "\033[32m";
constexpr std::string_view yellow  = "\033[33m";
constexpr std::string_view red     = "\033[31m";
constexpr std::string_view magenta = "\033[35m";
constexpr std::string_view bold    = "\033[1m";
}  // namespace ansi

[[nodiscard]] std::string_view color_for(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return ansi::dim;
        case LogLevel::Debug: return ansi::cyan;
        case LogLevel::Info:  return ansi::green;
        case LogLevel::Warn:  return ansi::yellow;
        case LogLevel::Error: return ansi::red;
        case LogLevel::Fatal: return ansi::magenta;
        case LogLevel::Off:   return ansi::reset;
    }
    return ansi::reset;
}

[[nodiscard]] std::string clock_time(const std::chrono::system_clock::time_point& tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

[[nodiscard]] std::string_view basename_of(const char* path) noexcept {
    std::string_view sv(path);
    const auto slash = sv.find_last_of('/');
    if (slash == std::string_view::npos) {
        return sv;
    }
    return sv.substr(slash + 1);
}

}  // namespace

void ConsoleLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    const bool colored = colors_enabled_;
    auto paint = [colored](std::ostringstream& out, std::string_view code) {
        if (colored) {
            out << code;
        }
    };

    std::ostringstream line;
    paint(line, ansi::dim);
    line << clock_time(record.timestamp);
    paint(line, ansi::reset);
    line << ' ';
    paint(line, ansi::bold);
    paint(line, color_for(record.level));
    line << std::setw(5) << std::left << to_string(record.level);
    paint(line, ansi::reset);
    line << ' ';
    paint(line, ansi::dim);
    line << basename_of(record.location.file_name()) << ':' << record.location.line();
    paint(line, ansi::reset);
    line << ' ' << record.message << '\n';

    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << line.str();
}

namespace {

std::unique_ptr<ILogger>& installed_logger() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& installed_logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(installed_logger_mutex());
    return *installed_logger();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(installed_logger_mutex());
    if (logger == nullptr) {
        installed_logger() = std::make_unique<NullLogger>();
        return;
    }
    installed_logger() = std::move(logger);
}

}  // namespace toolmux
