#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stream Framing
// ═══════════════════════════════════════════════════════════════════════════
// JSON message framing over byte streams (pipes and local sockets).
//
// FrameDecoder is the pure, incremental decoder. FramedStreamIo owns the
// coroutine plumbing shared by ProcessTransport and SocketTransport:
//
//   read stream ──reader_loop──► FrameDecoder ──► inbound channel ──► receive()
//   send() ──► outbound channel ──writer_loop──► write stream
//
// Both loops and both channels live on one executor (the owner's strand), so
// frames are written whole and in the order send() was called.

#include "toolmux/log/logger.hpp"
#include "toolmux/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/buffer.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/error.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace toolmux {

[[nodiscard]] std::string encode_frame(const Json& message, FramingMode mode);

// ─────────────────────────────────────────────────────────────────────────────
// FrameDecoder
// ─────────────────────────────────────────────────────────────────────────────
// Oversized or malformed frames come out as Protocol errors and decoding
// resumes at the next frame boundary.

class FrameDecoder {
public:
    FrameDecoder(FramingMode mode, std::size_t max_message_size);

    void feed(std::string_view bytes);

    /// Next decoded frame, or nullopt when more bytes are needed.
    [[nodiscard]] std::optional<TransportResult<Json>> next();

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }

private:
    std::optional<TransportResult<Json>> next_line();
    std::optional<TransportResult<Json>> next_content_length();

    FramingMode mode_;
    std::size_t max_message_size_;
    std::string buffer_;
    bool discarding_line_{false};
    std::size_t discard_remaining_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// FramedStreamIo
// ─────────────────────────────────────────────────────────────────────────────

struct StreamIoConfig {
    FramingMode framing{FramingMode::NewlineDelimited};
    std::size_t max_message_size{default_max_message_size};
    std::size_t inbound_capacity{64};
    std::size_t outbound_capacity{64};
    std::string label;  // prefix for log lines
};

template <typename ReadStream, typename WriteStream>
class FramedStreamIo : public std::enable_shared_from_this<FramedStreamIo<ReadStream, WriteStream>> {
public:
    using InboundChannel = asio::experimental::channel<void(asio::error_code, TransportResult<Json>)>;
    using OutboundChannel = asio::experimental::channel<void(asio::error_code, std::string)>;

    FramedStreamIo(
        asio::any_io_executor executor,
        std::shared_ptr<ReadStream> input,
        std::shared_ptr<WriteStream> output,
        StreamIoConfig config
    )
        : executor_(std::move(executor))
        , input_(std::move(input))
        , output_(std::move(output))
        , config_(std::move(config))
        , decoder_(config_.framing, config_.max_message_size)
        , inbound_(executor_, config_.inbound_capacity)
        , outbound_(executor_, config_.outbound_capacity)
    {}

    void start() {
        auto self = this->shared_from_this();
        asio::co_spawn(executor_, reader_loop(self), asio::detached);
        asio::co_spawn(executor_, writer_loop(self), asio::detached);
    }

    /// Stops both loops and wakes any pending receive. Streams are closed by
    /// their owner.
    void close() {
        stopped_ = true;
        if (!terminal_.has_value()) {
            terminal_ = TransportError::closed("Transport stopped");
        }
        inbound_.close();
        outbound_.close();
    }

    asio::awaitable<TransportResult<void>> send(const Json& message) {
        if (terminal_.has_value()) {
            co_return tl::unexpected(*terminal_);
        }

        std::string frame;
        try {
            frame = encode_frame(message, config_.framing);
        } catch (const nlohmann::json::exception& e) {
            co_return tl::unexpected(TransportError::protocol(
                "Cannot encode message: " + std::string(e.what())));
        }

        try {
            co_await outbound_.async_send(asio::error_code{}, std::move(frame), asio::use_awaitable);
        } catch (const std::system_error&) {
            co_return tl::unexpected(terminal_.value_or(TransportError::closed()));
        }
        co_return TransportResult<void>{};
    }

    asio::awaitable<TransportResult<Json>> receive() {
        if (terminal_.has_value() && !inbound_.ready()) {
            co_return tl::unexpected(*terminal_);
        }
        try {
            co_return co_await inbound_.async_receive(asio::use_awaitable);
        } catch (const std::system_error&) {
            co_return tl::unexpected(terminal_.value_or(TransportError::closed()));
        }
    }

    [[nodiscard]] bool is_open() const noexcept { return !terminal_.has_value(); }

    [[nodiscard]] std::size_t dropped_frames() const noexcept { return dropped_frames_; }

private:
    using Self = FramedStreamIo<ReadStream, WriteStream>;

    asio::awaitable<void> reader_loop(std::shared_ptr<Self> /*keepalive*/) {
        std::array<char, 8192> chunk{};

        while (!stopped_) {
            std::size_t n = 0;
            try {
                n = co_await input_->async_read_some(asio::buffer(chunk), asio::use_awaitable);
            } catch (const std::system_error& e) {
                end_of_stream(e.code());
                co_return;
            }

            decoder_.feed(std::string_view(chunk.data(), n));
            while (auto frame = decoder_.next()) {
                if (!frame->has_value()) {
                    ++dropped_frames_;
                    get_logger().warn_fmt("{}: dropped inbound frame: {}",
                        config_.label, frame->error().message);
                }
                try {
                    co_await inbound_.async_send(asio::error_code{}, std::move(*frame), asio::use_awaitable);
                } catch (const std::system_error&) {
                    co_return;  // closed by close()
                }
            }
        }
    }

    asio::awaitable<void> writer_loop(std::shared_ptr<Self> /*keepalive*/) {
        for (;;) {
            std::string frame;
            try {
                frame = co_await outbound_.async_receive(asio::use_awaitable);
            } catch (const std::system_error&) {
                co_return;
            }

            std::optional<std::string> failure;
            try {
                co_await asio::async_write(*output_, asio::buffer(frame), asio::use_awaitable);
            } catch (const std::system_error& e) {
                failure = e.what();
            }

            if (failure.has_value()) {
                get_logger().warn_fmt("{}: write failed: {}", config_.label, *failure);
                finish(TransportError::closed("Write failed: " + *failure));
                outbound_.close();
                co_return;
            }
        }
    }

    void end_of_stream(const asio::error_code& ec) {
        if (stopped_) {
            return;
        }
        const bool orderly = (ec == asio::error::eof);
        if (orderly) {
            get_logger().info_fmt("{}: peer closed the stream", config_.label);
            finish(TransportError::closed("End of stream"));
        } else {
            get_logger().warn_fmt("{}: read failed: {}", config_.label, ec.message());
            finish(TransportError::closed("Read failed: " + ec.message()));
        }
    }

    // Records the terminal error and hands it to a waiting receiver, if any.
    // Later receives see it through terminal_.
    void finish(TransportError error) {
        if (terminal_.has_value()) {
            return;
        }
        terminal_ = error;
        (void)inbound_.try_send(asio::error_code{}, TransportResult<Json>(tl::unexpected(std::move(error))));
    }

    asio::any_io_executor executor_;
    std::shared_ptr<ReadStream> input_;
    std::shared_ptr<WriteStream> output_;
    StreamIoConfig config_;
    FrameDecoder decoder_;
    InboundChannel inbound_;
    OutboundChannel outbound_;

    bool stopped_{false};
    std::optional<TransportError> terminal_;
    std::size_t dropped_frames_{0};
};

}  // namespace toolmux
