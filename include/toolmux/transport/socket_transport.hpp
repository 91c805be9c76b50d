#pragma once

#include "toolmux/transport/async_transport.hpp"
#include "toolmux/transport/stream_framing.hpp"
#include "toolmux/transport/transport_descriptor.hpp"

#include <asio/local/stream_protocol.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// SocketTransport
// ─────────────────────────────────────────────────────────────────────────────
// Connects to a server listening on a Unix domain stream socket. The same
// socket carries both directions; framing follows TransportOptions::framing.

class SocketTransport : public IAsyncTransport {
public:
    SocketTransport(asio::any_io_executor executor, SocketTarget target, TransportOptions options);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] std::string describe() const override;

private:
    using Socket = asio::local::stream_protocol::socket;
    using Io = FramedStreamIo<Socket, Socket>;

    SocketTarget target_;
    TransportOptions options_;
    asio::any_io_executor executor_;

    std::shared_ptr<Socket> socket_;
    std::shared_ptr<Io> io_;
    std::atomic<bool> running_{false};
};

}  // namespace toolmux
