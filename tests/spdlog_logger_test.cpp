// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "toolmux/log/logger.hpp"
#include "toolmux/log/spdlog_logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace toolmux;

namespace {

struct OstreamFixture {
    std::ostringstream out;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink =
        std::make_shared<spdlog::sinks::ostream_sink_mt>(out);

    std::unique_ptr<SpdlogLogger> make(LogLevel level, const std::string& pattern = "%l|%v") {
        auto logger = std::make_unique<SpdlogLogger>(std::vector<spdlog::sink_ptr>{sink}, level);
        logger->set_pattern(pattern);
        return logger;
    }
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Levels
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Level mapping round-trips through spdlog", "[log][spdlog]") {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        REQUIRE(SpdlogLogger::from_spdlog_level(SpdlogLogger::to_spdlog_level(level)) == level);
    }
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Fatal) == spdlog::level::critical);
}

TEST_CASE("Console logger honors its threshold", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));

    logger->set_level(LogLevel::Debug);
    REQUIRE(logger->should_log(LogLevel::Debug));
    REQUIRE(logger->underlying()->level() == spdlog::level::debug);
}

TEST_CASE("Wrapping an existing spdlog logger adopts its level", "[log][spdlog]") {
    auto raw = std::make_shared<spdlog::logger>("wrapped-test");
    raw->set_level(spdlog::level::err);

    SpdlogLogger logger(raw);

    REQUIRE_FALSE(logger.should_log(LogLevel::Warn));
    REQUIRE(logger.should_log(LogLevel::Error));
    REQUIRE(logger.underlying() == raw);
}

TEST_CASE("Wrapping a null spdlog logger throws", "[log][spdlog]") {
    REQUIRE_THROWS_AS(SpdlogLogger(std::shared_ptr<spdlog::logger>{}), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Messages reach the sink with spdlog level names", "[log][spdlog]") {
    OstreamFixture fx;
    auto logger = fx.make(LogLevel::Info);

    logger->debug("hidden");
    logger->info("[fs] ready with 3 tools");
    logger->warn_fmt("[{}] probe missed ({} in a row)", "fs", 2);
    logger->flush();

    const auto text = fx.out.str();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("info|[fs] ready with 3 tools") != std::string::npos);
    REQUIRE(text.find("warning|[fs] probe missed (2 in a row)") != std::string::npos);
}

TEST_CASE("Call site is forwarded to spdlog", "[log][spdlog]") {
    OstreamFixture fx;
    auto logger = fx.make(LogLevel::Trace, "%s:%#|%v");

    logger->info("located");
    logger->flush();

    const auto text = fx.out.str();
    REQUIRE(text.find("spdlog_logger_test.cpp:") != std::string::npos);
    REQUIRE(text.find("|located") != std::string::npos);
}

TEST_CASE("Braces in pre-formatted messages are not reinterpreted", "[log][spdlog]") {
    OstreamFixture fx;
    auto logger = fx.make(LogLevel::Info);

    logger->info(R"(frame {"jsonrpc":"2.0"})");
    logger->flush();

    REQUIRE(fx.out.str().find(R"({"jsonrpc":"2.0"})") != std::string::npos);
}

TEST_CASE("File logger writes records at or above its threshold", "[log][spdlog][file]") {
    const auto path = std::filesystem::temp_directory_path() / "toolmux_spdlog_file_test.log";
    std::filesystem::remove(path);

    {
        auto logger = make_spdlog_file_logger(path.string(), LogLevel::Warn);
        logger->info("not written");
        logger->error("connect failed");
        logger->flush();
    }

    const auto content = read_file(path);
    REQUIRE(content.find("not written") == std::string::npos);
    REQUIRE(content.find("connect failed") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("SpdlogLogger can be installed as the process logger", "[log][spdlog]") {
    OstreamFixture fx;
    set_logger(fx.make(LogLevel::Debug));

    TOOLMUX_LOG_DEBUG("via macro");
    get_logger().info_fmt("via {}", "get_logger");

    set_logger(nullptr);

    const auto text = fx.out.str();
    REQUIRE(text.find("debug|via macro") != std::string::npos);
    REQUIRE(text.find("info|via get_logger") != std::string::npos);
}

TEST_CASE("Async console logger accepts records", "[log][spdlog]") {
    auto logger = make_spdlog_async_console_logger(LogLevel::Error);

    REQUIRE(logger->should_log(LogLevel::Error));
    REQUIRE_FALSE(logger->should_log(LogLevel::Warn));
    logger->error("async record");
    logger->flush();
}
