#pragma once

#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolmux {

/// One dispatched server-sent event.
///
///   event: message
///   id: 42
///   data: {"jsonrpc":"2.0", ...}
///   <blank line>
///
/// Events with no data lines are never dispatched.
struct SseEvent {
    std::string type{"message"};
    std::string data;
    std::optional<std::string> id;
    std::optional<std::uint32_t> retry_ms;
};

struct SseError {
    std::size_t pending_bytes{0};
    std::size_t limit{0};
    std::string message;
};

struct SseParserConfig {
    /// Bytes of an unterminated line the parser will hold
    std::size_t max_line_size{1024 * 1024};

    /// Events whose data exceeds this are dropped and counted
    std::size_t max_event_size{16 * 1024 * 1024};
};

/// Incremental text/event-stream decoder. Chunks may split anywhere,
/// including between '\r' and '\n'.
class SseParser {
public:
    SseParser() = default;
    explicit SseParser(SseParserConfig config) : config_(config) {}

    /// Returns the events completed by this chunk. Fails only when a single
    /// unterminated line outgrows max_line_size; the parser is reset then.
    [[nodiscard]] tl::expected<std::vector<SseEvent>, SseError> feed(std::string_view chunk);

    void reset();

    /// Last id seen on the stream, for Last-Event-ID on reconnect.
    [[nodiscard]] const std::optional<std::string>& last_event_id() const noexcept {
        return last_event_id_;
    }

    [[nodiscard]] std::size_t dropped_events() const noexcept { return dropped_events_; }
    [[nodiscard]] std::size_t pending_bytes() const noexcept { return line_.size(); }

private:
    void on_line(std::string_view line, std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);

    SseParserConfig config_;
    std::string line_;
    bool skip_lf_{false};  // previous chunk ended in '\r'

    std::string type_;
    std::string data_;
    bool has_data_{false};
    std::optional<std::uint32_t> retry_;
    std::optional<std::string> last_event_id_;
    std::size_t dropped_events_{0};
};

}  // namespace toolmux
