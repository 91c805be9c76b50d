#include "toolmux/transport/stream_framing.hpp"
#include "toolmux/json/fast_json.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace toolmux {

namespace {

constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
constexpr std::size_t kMaxHeaderBlock = 8 * 1024;

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

TransportResult<Json> decode_body(std::string_view body) {
    auto parsed = fast_parse(body);
    if (!parsed.has_value()) {
        return tl::unexpected(TransportError::protocol(
            "Malformed JSON frame: " + parsed.error().message));
    }
    return std::move(*parsed);
}

// Value of Content-Length in a header block, matched case-insensitively.
std::optional<std::size_t> content_length_of(std::string_view headers) {
    constexpr std::string_view name = "content-length";

    std::size_t line_start = 0;
    while (line_start < headers.size()) {
        auto line_end = headers.find("\r\n", line_start);
        if (line_end == std::string_view::npos) {
            line_end = headers.size();
        }
        const auto line = headers.substr(line_start, line_end - line_start);
        line_start = line_end + 2;

        const auto colon = line.find(':');
        if (colon != name.size()) {
            continue;
        }
        const bool matches = std::equal(name.begin(), name.end(), line.begin(),
            [](char a, char b) {
                return a == std::tolower(static_cast<unsigned char>(b));
            });
        if (!matches) {
            continue;
        }

        auto value = line.substr(colon + 1);
        while (!value.empty() && ((value.front() == ' ') || (value.front() == '\t'))) {
            value.remove_prefix(1);
        }
        while (!value.empty() && ((value.back() == ' ') || (value.back() == '\t'))) {
            value.remove_suffix(1);
        }

        std::size_t length = 0;
        const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
        if ((ec != std::errc{}) || (end != value.data() + value.size()) || value.empty()) {
            return std::nullopt;
        }
        return length;
    }
    return std::nullopt;
}

}  // namespace

std::string encode_frame(const Json& message, FramingMode mode) {
    std::string body = message.dump();
    if (mode == FramingMode::NewlineDelimited) {
        body.push_back('\n');
        return body;
    }
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

FrameDecoder::FrameDecoder(FramingMode mode, std::size_t max_message_size)
    : mode_(mode)
    , max_message_size_(max_message_size)
{}

void FrameDecoder::feed(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
}

std::optional<TransportResult<Json>> FrameDecoder::next() {
    if (mode_ == FramingMode::NewlineDelimited) {
        return next_line();
    }
    return next_content_length();
}

std::optional<TransportResult<Json>> FrameDecoder::next_line() {
    for (;;) {
        const auto newline = buffer_.find('\n');

        if (discarding_line_) {
            if (newline == std::string::npos) {
                buffer_.clear();
                return std::nullopt;
            }
            buffer_.erase(0, newline + 1);
            discarding_line_ = false;
            continue;
        }

        if (newline == std::string::npos) {
            if (buffer_.size() > max_message_size_) {
                buffer_.clear();
                discarding_line_ = true;
                return TransportResult<Json>(tl::unexpected(TransportError::protocol(
                    "Frame exceeds " + std::to_string(max_message_size_) + " bytes")));
            }
            return std::nullopt;
        }

        std::string_view line(buffer_.data(), newline);
        if (!line.empty() && (line.back() == '\r')) {
            line.remove_suffix(1);
        }

        if (is_blank(line)) {
            buffer_.erase(0, newline + 1);
            continue;
        }

        TransportResult<Json> frame = (line.size() > max_message_size_)
            ? TransportResult<Json>(tl::unexpected(TransportError::protocol(
                  "Frame exceeds " + std::to_string(max_message_size_) + " bytes")))
            : decode_body(line);
        buffer_.erase(0, newline + 1);
        return frame;
    }
}

std::optional<TransportResult<Json>> FrameDecoder::next_content_length() {
    if (discard_remaining_ > 0) {
        const auto n = std::min(discard_remaining_, buffer_.size());
        buffer_.erase(0, n);
        discard_remaining_ -= n;
        if (discard_remaining_ > 0) {
            return std::nullopt;
        }
    }

    const auto header_end = buffer_.find(kHeaderTerminator);
    if (header_end == std::string::npos) {
        if (buffer_.size() > kMaxHeaderBlock) {
            buffer_.clear();
            return TransportResult<Json>(tl::unexpected(TransportError::protocol(
                "Frame header block too large")));
        }
        return std::nullopt;
    }

    const auto body_start = header_end + kHeaderTerminator.size();
    const auto length = content_length_of(std::string_view(buffer_.data(), header_end));
    if (!length.has_value()) {
        buffer_.erase(0, body_start);
        return TransportResult<Json>(tl::unexpected(TransportError::protocol(
            "Missing or invalid Content-Length header")));
    }

    if (*length > max_message_size_) {
        buffer_.erase(0, body_start);
        discard_remaining_ = *length;
        auto error = TransportResult<Json>(tl::unexpected(TransportError::protocol(
            "Frame of " + std::to_string(*length) + " bytes exceeds "
            + std::to_string(max_message_size_))));
        const auto n = std::min(discard_remaining_, buffer_.size());
        buffer_.erase(0, n);
        discard_remaining_ -= n;
        return error;
    }

    if (buffer_.size() - body_start < *length) {
        return std::nullopt;
    }

    auto frame = decode_body(std::string_view(buffer_.data() + body_start, *length));
    buffer_.erase(0, body_start + *length);
    return frame;
}

}  // namespace toolmux
