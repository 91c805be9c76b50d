#pragma once

#include "toolmux/transport/async_transport.hpp"
#include "toolmux/transport/http_client.hpp"
#include "toolmux/transport/http_types.hpp"
#include "toolmux/transport/sse_parser.hpp"
#include "toolmux/transport/transport_descriptor.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// HttpTransport
// ─────────────────────────────────────────────────────────────────────────────
// MCP "Streamable HTTP":
//
//   async_send ── POST {message} ──► server
//                 ◄── 202 (notification accepted)
//                 ◄── 200 application/json      ─┐
//                 ◄── 200 text/event-stream     ─┴─► inbound channel
//   event-stream thread ── GET (SSE) ───────────────► inbound channel
//
// Blocking IHttpClient calls run on an asio::thread_pool that gains a thread
// whenever every worker is busy (up to max_worker_threads), so a slow
// tools/call never holds up a ping. The event stream has a dedicated thread. Frames are handed back to the transport's
// executor before they touch the channel.
//
// async_send completes when the POST does. A failed POST (connection error
// or non-2xx status) is reported to that sender as a Network error carrying
// the status code; the stream itself stays usable. A failed or rejected GET
// event stream (other than 405) surfaces from async_receive as a Network
// error, and the stream is not reopened.

struct HttpTransportSettings {
    bool open_event_stream{true};
    std::chrono::milliseconds event_stream_retry{std::chrono::seconds(1)};
    std::size_t worker_threads{2};
    std::size_t max_worker_threads{32};
    std::size_t inbound_capacity{64};
};

class HttpTransport : public IAsyncTransport {
public:
    HttpTransport(
        asio::any_io_executor executor,
        HttpTarget target,
        TransportOptions options,
        std::unique_ptr<IHttpClient> client = make_http_client(),
        HttpTransportSettings settings = {}
    );
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] std::string describe() const override;

    /// Mcp-Session-Id assigned by the server, if any
    [[nodiscard]] std::optional<std::string> session_id() const;

private:
    using InboundChannel = asio::experimental::channel<void(asio::error_code, TransportResult<Json>)>;

    // Blocking; runs on the worker pool.
    TransportResult<std::vector<Json>> exchange(const std::string& body);
    void acquire_worker();
    void release_worker();
    void event_stream_loop();
    void ensure_event_stream();
    void post_to_inbound(TransportResult<Json> frame);
    void remember_session(const HeaderMap& headers);
    [[nodiscard]] HeaderMap session_headers(std::string_view accept) const;
    [[nodiscard]] TransportResult<Json> decode_event(const SseEvent& event) const;

    HttpTarget target_;
    TransportOptions options_;
    HttpTransportSettings settings_;
    asio::any_io_executor executor_;
    std::optional<UrlComponents> url_;

    std::unique_ptr<IHttpClient> client_;
    asio::thread_pool pool_;
    std::mutex workers_mutex_;
    std::size_t workers_;
    std::size_t busy_workers_{0};
    std::vector<std::thread> extra_workers_;
    std::thread stream_thread_;
    std::atomic<bool> stream_started_{false};
    std::shared_ptr<InboundChannel> inbound_;

    std::atomic<bool> running_{false};

    mutable std::mutex session_mutex_;
    std::optional<std::string> session_id_;
    std::optional<std::string> last_event_id_;
};

}  // namespace toolmux
