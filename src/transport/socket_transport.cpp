#include "toolmux/transport/socket_transport.hpp"
#include "toolmux/log/logger.hpp"

namespace toolmux {

SocketTransport::SocketTransport(
    asio::any_io_executor executor,
    SocketTarget target,
    TransportOptions options
)
    : target_(std::move(target))
    , options_(std::move(options))
    , executor_(std::move(executor))
{}

SocketTransport::~SocketTransport() {
    if (io_) {
        io_->close();
    }
    if (socket_ && socket_->is_open()) {
        asio::error_code ignored;
        socket_->close(ignored);
    }
}

asio::any_io_executor SocketTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> SocketTransport::async_start() {
    if (running_) {
        co_return tl::unexpected(TransportError::protocol("Transport already running"));
    }
    if (target_.path.empty()) {
        co_return tl::unexpected(TransportError::network("Empty socket path"));
    }

    socket_ = std::make_shared<Socket>(executor_);
    std::optional<std::string> failure;
    try {
        co_await socket_->async_connect(
            asio::local::stream_protocol::endpoint(target_.path),
            asio::use_awaitable
        );
    } catch (const std::system_error& e) {
        failure = e.what();
    }

    if (failure.has_value()) {
        asio::error_code ignored;
        socket_->close(ignored);
        get_logger().warn_fmt("{}: connect failed: {}", describe(), *failure);
        co_return tl::unexpected(TransportError::network("Connect failed: " + *failure));
    }

    io_ = std::make_shared<Io>(executor_, socket_, socket_, StreamIoConfig{
        options_.framing,
        options_.max_message_size,
        64,
        64,
        describe()
    });
    io_->start();

    running_ = true;
    get_logger().info_fmt("{}: connected", describe());
    co_return TransportResult<void>{};
}

asio::awaitable<void> SocketTransport::async_stop() {
    if (!running_.exchange(false)) {
        co_return;
    }
    if (io_) {
        io_->close();
    }
    if (socket_ && socket_->is_open()) {
        asio::error_code ignored;
        socket_->shutdown(asio::socket_base::shutdown_both, ignored);
        socket_->close(ignored);
    }
    get_logger().info_fmt("{}: closed", describe());
    co_return;
}

asio::awaitable<TransportResult<void>> SocketTransport::async_send(Json message) {
    if (!running_ || (io_ == nullptr)) {
        co_return tl::unexpected(TransportError::closed("Transport not running"));
    }
    co_return co_await io_->send(message);
}

asio::awaitable<TransportResult<Json>> SocketTransport::async_receive() {
    if (io_ == nullptr) {
        co_return tl::unexpected(TransportError::closed("Transport not started"));
    }
    co_return co_await io_->receive();
}

bool SocketTransport::is_running() const {
    return running_;
}

std::string SocketTransport::describe() const {
    return "socket:" + target_.path;
}

}  // namespace toolmux
