#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════
// One supervised MCP session with one server.
//
// A Connection owns a strand. Everything it mutates (pending table, current
// transport, generation) is touched only from that strand; public
// coroutines hop onto it with co_spawn and resume the caller on the
// caller's executor.
//
// Lifecycle of one generation:
//
//   supervise ── make transport ── async_start ── initialize ──
//       notifications/initialized ── tools/list (all pages) ── Ready
//       └─ read_loop and probe_loop run until the generation is lost
//
// A lost generation fails its pending requests with Closed, drops the tool
// cache entry, stops the transport and backs off before the next attempt.
// close() ends the cycle for good.
//
// Usage:
//   auto conn = Connection::create(io.get_executor(), config, options, cache);
//   conn->start();
//   asio::co_spawn(io, [conn]() -> asio::awaitable<void> {
//       if (auto ready = co_await conn->wait_ready(); ready.has_value()) {
//           auto result = co_await conn->call_tool("echo", {{"text", "hi"}});
//       }
//       co_await conn->close();
//   }, asio::detached);

#include "toolmux/client/client_error.hpp"
#include "toolmux/client/connection_state.hpp"
#include "toolmux/client/server_config.hpp"
#include "toolmux/client/tool_cache.hpp"
#include "toolmux/protocol/mcp_types.hpp"
#include "toolmux/resilience/health_monitor.hpp"
#include "toolmux/transport/async_transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolmux {

/// Builds the transport for one connection attempt. The executor is the
/// connection's strand.
using TransportFactory = std::function<std::unique_ptr<IAsyncTransport>(
    asio::any_io_executor executor,
    const ServerConfig& config,
    const TransportOptions& options
)>;

/// Default factory: make_transport() with ServerConfig::env merged into the
/// transport's environment overrides.
[[nodiscard]] TransportFactory default_transport_factory();

/// Counters since the Connection was created.
struct ConnectionStats {
    std::uint64_t requests_sent{0};
    std::uint64_t responses_matched{0};
    std::uint64_t timeouts{0};
    std::uint64_t cancelled{0};
    std::uint64_t unmatched_responses{0};  ///< unknown, stale or duplicate ids
    std::uint64_t malformed_frames{0};
    std::uint64_t server_requests{0};
    std::uint64_t notifications{0};
    std::uint64_t reconnects{0};
};

/// Which states a request may be issued in.
enum class RequestScope {
    User,         ///< Ready only
    Handshake,    ///< Handshaking only
    Maintenance   ///< Ready or Degraded (probes, re-discovery)
};

struct RequestOptions {
    RequestScope scope{RequestScope::User};

    /// Falls back to ConnectionOptions::request_timeout. Zero disables the deadline.
    std::optional<std::chrono::milliseconds> timeout;

    /// Called on the strand right after the request id is assigned;
    /// cancel(id) is valid from then on.
    std::function<void(std::uint64_t id)> on_registered;
};

class Connection : public std::enable_shared_from_this<Connection> {
public:
    using NotificationCallback = std::function<void(
        const std::string& server_id, const std::string& method, const Json& params)>;
    using StateChangeCallback = std::function<void(
        const std::string& server_id, ConnectionState old_state, ConnectionState new_state)>;

    [[nodiscard]] static std::shared_ptr<Connection> create(
        asio::any_io_executor executor,
        ServerConfig config,
        ConnectionOptions options,
        std::shared_ptr<ToolCache> cache,
        TransportFactory factory = default_transport_factory()
    );

    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Begin the connect/supervise cycle. Only the first call has an effect.
    void start();

    /// Completes when Ready is reached, or with the last failure once the
    /// connection is Closed (attempts exhausted or close()).
    [[nodiscard]] asio::awaitable<Result<void>> wait_ready();

    /// Idempotent. Fails every pending request with Closed, then stops the
    /// transport. State ends as Closed.
    [[nodiscard]] asio::awaitable<void> close(std::string reason = "Connection closed");

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<Result<Json>> request(
        std::string method,
        std::optional<Json> params = std::nullopt,
        RequestOptions options = {}
    );

    /// Fire-and-forget message. Requires Ready or Degraded.
    [[nodiscard]] asio::awaitable<Result<void>> notify(std::string method, std::optional<Json> params = std::nullopt);

    /// tools/call. A JSON-RPC error reply or an isError result becomes ToolError.
    [[nodiscard]] asio::awaitable<Result<CallToolResult>> call_tool(
        std::string tool_name,
        Json arguments,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt,
        std::function<void(std::uint64_t id)> on_registered = {}
    );

    /// Re-run discovery and replace the cached list.
    [[nodiscard]] asio::awaitable<Result<std::vector<ToolSchema>>> refresh_tools();

    /// Resolve a pending request with Cancelled. Nothing is sent to the server.
    void cancel(std::uint64_t request_id);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries (any thread)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& id() const noexcept { return config_.id; }
    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }
    [[nodiscard]] const ConnectionOptions& options() const noexcept { return options_; }

    [[nodiscard]] ConnectionState state() const noexcept;
    [[nodiscard]] std::uint64_t generation() const noexcept;
    [[nodiscard]] std::size_t attempts() const noexcept;
    [[nodiscard]] std::string last_error() const;

    [[nodiscard]] std::vector<ToolSchema> tools() const;
    [[nodiscard]] std::optional<Implementation> server_info() const;
    [[nodiscard]] std::optional<ServerCapabilities> server_capabilities() const;
    [[nodiscard]] std::optional<std::string> server_instructions() const;

    [[nodiscard]] ConnectionStats stats() const;
    [[nodiscard]] HealthStats health() const;

    /// Number of requests awaiting a response.
    [[nodiscard]] std::size_t pending_count() const noexcept;

    // ─────────────────────────────────────────────────────────────────────────
    // Observers (register before start())
    // ─────────────────────────────────────────────────────────────────────────

    void on_notification(NotificationCallback callback);
    void on_state_change(StateChangeCallback callback);

private:
    Connection(
        asio::any_io_executor executor,
        ServerConfig config,
        ConnectionOptions options,
        std::shared_ptr<ToolCache> cache,
        TransportFactory factory
    );

    using ResultChannel = asio::experimental::channel<void(asio::error_code, Result<Json>)>;
    using SignalChannel = asio::experimental::channel<void(asio::error_code, std::string)>;
    using ReadyChannel = asio::experimental::channel<void(asio::error_code, Result<void>)>;

    struct PendingRequest {
        std::shared_ptr<ResultChannel> channel;
        std::unique_ptr<asio::steady_timer> deadline;
        std::uint64_t generation{0};
        std::string method;
    };

    struct Counters {
        std::atomic<std::uint64_t> requests_sent{0};
        std::atomic<std::uint64_t> responses_matched{0};
        std::atomic<std::uint64_t> timeouts{0};
        std::atomic<std::uint64_t> cancelled{0};
        std::atomic<std::uint64_t> unmatched_responses{0};
        std::atomic<std::uint64_t> malformed_frames{0};
        std::atomic<std::uint64_t> server_requests{0};
        std::atomic<std::uint64_t> notifications{0};
        std::atomic<std::uint64_t> reconnects{0};
    };

    // Strand-side coroutines
    asio::awaitable<void> supervise();
    asio::awaitable<Result<void>> handshake(std::uint64_t generation);
    asio::awaitable<Result<std::vector<ToolSchema>>> discover_tools(RequestScope scope, std::chrono::milliseconds timeout);
    asio::awaitable<void> read_loop(std::uint64_t generation, std::shared_ptr<IAsyncTransport> transport);
    asio::awaitable<void> probe_loop(std::uint64_t generation);
    asio::awaitable<void> verify_liveness(std::uint64_t generation);
    asio::awaitable<void> teardown(std::uint64_t generation, const std::string& reason);
    asio::awaitable<bool> backoff_before_retry();
    asio::awaitable<Result<void>> wait_ready_on_strand();
    asio::awaitable<void> close_on_strand(std::string reason);
    asio::awaitable<Result<Json>> request_on_strand(std::string method, std::optional<Json> params, RequestOptions options);
    asio::awaitable<Result<void>> notify_on_strand(std::string method, std::optional<Json> params);
    asio::awaitable<Result<std::vector<ToolSchema>>> refresh_on_strand();

    // Strand-side helpers
    void handle_message(std::uint64_t generation, const std::shared_ptr<IAsyncTransport>& transport, Json message);
    void handle_response(std::uint64_t generation, const Json& message);
    void handle_server_request(const std::shared_ptr<IAsyncTransport>& transport, const Json& message);
    void handle_notification(std::uint64_t generation, const Json& message);
    void send_detached(const std::shared_ptr<IAsyncTransport>& transport, Json message, std::optional<std::uint64_t> request_id);
    void resolve(std::uint64_t request_id, Result<Json> result);
    void fail_pending(std::optional<std::uint64_t> generation, const Error& error);
    void lose_generation(std::uint64_t generation, std::string reason);
    void settle_ready_waiters(const Result<void>& outcome);
    void enter_degraded(const std::string& reason);
    [[nodiscard]] Result<void> check_scope(RequestScope scope) const;
    [[nodiscard]] std::chrono::milliseconds effective_timeout(const RequestOptions& options) const;

    ServerConfig config_;
    ConnectionOptions options_;
    std::shared_ptr<ToolCache> cache_;
    TransportFactory factory_;
    asio::strand<asio::any_io_executor> strand_;

    ConnectionStateMachine state_;
    HealthMonitor health_;
    std::unique_ptr<IBackoffPolicy> backoff_;

    // Strand-only state
    std::shared_ptr<IAsyncTransport> transport_;
    std::unordered_map<std::uint64_t, PendingRequest> pending_;
    std::uint64_t next_request_id_{0};
    std::shared_ptr<SignalChannel> generation_lost_;
    bool lost_{false};
    bool started_{false};
    bool closing_{false};
    std::optional<Error> last_failure_;
    std::vector<std::shared_ptr<ReadyChannel>> ready_waiters_;
    asio::steady_timer retry_timer_;
    asio::steady_timer* probe_timer_{nullptr};

    std::atomic<std::uint64_t> generation_{0};
    std::atomic<std::size_t> pending_count_{0};
    Counters counters_;

    mutable std::mutex info_mutex_;
    std::optional<InitializeResult> server_;

    mutable std::mutex observer_mutex_;
    std::vector<NotificationCallback> notification_callbacks_;
};

}  // namespace toolmux
