#include "toolmux/transport/sse_parser.hpp"

#include <charconv>

namespace toolmux {

tl::expected<std::vector<SseEvent>, SseError> SseParser::feed(std::string_view chunk) {
    std::vector<SseEvent> events;

    for (const char c : chunk) {
        if (skip_lf_) {
            skip_lf_ = false;
            if (c == '\n') {
                continue;
            }
        }

        if ((c == '\n') || (c == '\r')) {
            skip_lf_ = (c == '\r');
            on_line(line_, events);
            line_.clear();
            continue;
        }

        line_.push_back(c);
        if (line_.size() > config_.max_line_size) {
            SseError error{
                line_.size(),
                config_.max_line_size,
                "SSE line exceeds " + std::to_string(config_.max_line_size) + " bytes"
            };
            reset();
            return tl::unexpected(std::move(error));
        }
    }

    return events;
}

void SseParser::reset() {
    line_.clear();
    skip_lf_ = false;
    type_.clear();
    data_.clear();
    has_data_ = false;
    retry_.reset();
}

void SseParser::on_line(std::string_view line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        dispatch(out);
        return;
    }
    if (line.front() == ':') {
        return;  // comment / keep-alive
    }

    std::string_view field = line;
    std::string_view value;
    if (const auto colon = line.find(':'); colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && (value.front() == ' ')) {
            value.remove_prefix(1);
        }
    }

    if (field == "data") {
        if (has_data_) {
            data_.push_back('\n');
        }
        data_.append(value);
        has_data_ = true;
    } else if (field == "event") {
        type_.assign(value);
    } else if (field == "id") {
        // ids containing NUL are ignored
        if (value.find('\0') == std::string_view::npos) {
            last_event_id_ = std::string(value);
        }
    } else if (field == "retry") {
        std::uint32_t ms = 0;
        const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
        if ((ec == std::errc{}) && (end == value.data() + value.size())) {
            retry_ = ms;
        }
    }
}

void SseParser::dispatch(std::vector<SseEvent>& out) {
    if (!has_data_) {
        type_.clear();
        return;
    }

    if (data_.size() > config_.max_event_size) {
        ++dropped_events_;
    } else {
        SseEvent event;
        if (!type_.empty()) {
            event.type = std::move(type_);
        }
        event.data = std::move(data_);
        event.id = last_event_id_;
        event.retry_ms = retry_;
        out.push_back(std::move(event));
    }

    type_.clear();
    data_.clear();
    has_data_ = false;
    retry_.reset();
}

}  // namespace toolmux
