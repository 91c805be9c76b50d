#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport
// ═══════════════════════════════════════════════════════════════════════════
// Spawns a server with fork/exec and exchanges framed JSON over its
// stdin/stdout pipes, wrapped in asio::posix::stream_descriptor.
//
// Process exit shows up as end of stream on stdout, which async_receive
// reports as a Closed error. Stopping escalates: close stdin, SIGTERM after
// a short wait, SIGKILL once shutdown_grace has passed.

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ProcessTransport is only available on POSIX-compatible systems"
#endif

#include "toolmux/transport/async_transport.hpp"
#include "toolmux/transport/stream_framing.hpp"
#include "toolmux/transport/transport_descriptor.hpp"

#include <asio/posix/stream_descriptor.hpp>

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

#include <sys/types.h>

namespace toolmux {

class ProcessTransport : public IAsyncTransport {
public:
    ProcessTransport(asio::any_io_executor executor, SpawnTarget target, TransportOptions options);
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;
    ProcessTransport(ProcessTransport&&) = delete;
    ProcessTransport& operator=(ProcessTransport&&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] std::string describe() const override;

    /// -1 when no child is running
    [[nodiscard]] pid_t child_pid() const noexcept { return child_pid_; }

    /// Exit status once reaped; negative values are terminating signals.
    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }

    /// Only populated with StderrHandling::Capture
    [[nodiscard]] std::string captured_stderr() const;

private:
    using Pipe = asio::posix::stream_descriptor;
    using Io = FramedStreamIo<Pipe, Pipe>;

    TransportResult<void> spawn();
    asio::awaitable<void> stderr_loop(std::shared_ptr<Pipe> pipe);
    asio::awaitable<bool> wait_for_exit(std::chrono::milliseconds limit);
    bool reap(bool block);
    void close_pipes();
    void kill_now();

    SpawnTarget target_;
    TransportOptions options_;
    asio::any_io_executor executor_;

    std::shared_ptr<Pipe> stdin_pipe_;
    std::shared_ptr<Pipe> stdout_pipe_;
    std::shared_ptr<Pipe> stderr_pipe_;
    std::shared_ptr<Io> io_;

    pid_t child_pid_{-1};
    std::optional<int> exit_code_;
    std::atomic<bool> running_{false};

    mutable std::mutex stderr_mutex_;
    std::string stderr_buffer_;
};

}  // namespace toolmux
