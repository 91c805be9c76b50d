#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// One MCP message stream to one server, driven by C++20 coroutines on an
// asio executor.
//
// Contract shared by every implementation:
// - async_send and async_receive may be in flight at the same time.
// - async_receive yields frames in arrival order. A Protocol error means a
//   single bad frame was dropped and the stream continues; a Closed error
//   means the stream has ended and every later receive fails the same way.
// - async_stop is idempotent and wakes a pending async_receive.
// - All completions run on the executor passed at construction, which is
//   normally the owning connection's strand.

#include "toolmux/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/use_awaitable.hpp>

#include <memory>
#include <string>

namespace toolmux {

class IAsyncTransport {
public:
    virtual ~IAsyncTransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// Open the stream: spawn, connect, or prime the HTTP session.
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    [[nodiscard]] virtual asio::awaitable<void> async_stop() = 0;

    /// Completes once the message is queued for writing. Write failures
    /// surface later as a Closed result from async_receive.
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(Json message) = 0;

    [[nodiscard]] virtual asio::awaitable<TransportResult<Json>> async_receive() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /// Short human-readable target, e.g. "spawn:python3" or "socket:/tmp/x.sock"
    [[nodiscard]] virtual std::string describe() const = 0;
};

}  // namespace toolmux
