#include "toolmux/transport/http_transport.hpp"
#include "toolmux/json/fast_json.hpp"
#include "toolmux/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>

#include <algorithm>
#include <cctype>

namespace toolmux {

namespace {

constexpr std::string_view kSessionHeader = "Mcp-Session-Id";
constexpr std::chrono::milliseconds kStopPollInterval{50};

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

// Session ids are visible ASCII per the Streamable HTTP rules.
bool valid_session_id(std::string_view id) {
    return !id.empty() && (id.size() <= 256)
        && std::all_of(id.begin(), id.end(), [](unsigned char c) { return c >= 0x21 && c <= 0x7E; });
}

}  // namespace

HttpTransport::HttpTransport(
    asio::any_io_executor executor,
    HttpTarget target,
    TransportOptions options,
    std::unique_ptr<IHttpClient> client,
    HttpTransportSettings settings
)
    : target_(std::move(target))
    , options_(std::move(options))
    , settings_(settings)
    , executor_(std::move(executor))
    , url_(parse_url(target_.url))
    , client_(std::move(client))
    , pool_(std::max<std::size_t>(settings_.worker_threads, 1))
    , workers_(std::max<std::size_t>(settings_.worker_threads, 1))
{}

HttpTransport::~HttpTransport() {
    running_ = false;
    if (client_) {
        client_->cancel();
    }
    if (stream_thread_.joinable()) {
        stream_thread_.join();
    }
    pool_.join();
    for (auto& worker : extra_workers_) {
        worker.join();
    }
}

asio::any_io_executor HttpTransport::get_executor() {
    return executor_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<TransportResult<void>> HttpTransport::async_start() {
    if (running_) {
        co_return tl::unexpected(TransportError::protocol("Transport already running"));
    }
    if (!url_.has_value()) {
        co_return tl::unexpected(TransportError::network("Invalid HTTP URL: " + target_.url));
    }
    if (client_ == nullptr) {
        co_return tl::unexpected(TransportError::network("No HTTP client"));
    }

    client_->reset();
    client_->set_base_url(url_->origin());
    client_->set_default_headers(target_.headers);
    client_->set_connect_timeout(options_.http_connect_timeout);
    client_->set_read_timeout(options_.http_request_timeout);

    inbound_ = std::make_shared<InboundChannel>(executor_, settings_.inbound_capacity);
    running_ = true;

    get_logger().info_fmt("{}: ready", describe());
    co_return TransportResult<void>{};
}

asio::awaitable<void> HttpTransport::async_stop() {
    if (!running_.exchange(false)) {
        co_return;
    }

    client_->cancel();
    if (inbound_) {
        inbound_->close();
    }

    // Joining may take up to one progress tick of the stream request; keep
    // that off the caller's executor.
    co_await asio::co_spawn(pool_, [this]() -> asio::awaitable<void> {
        if (stream_thread_.joinable()) {
            stream_thread_.join();
        }

        const auto session = session_id();
        if (session.has_value()) {
            client_->reset();
            HeaderMap headers{{std::string(kSessionHeader), *session}};
            auto closed = client_->del(url_->path_with_query(), headers);
            if (!closed.has_value()) {
                get_logger().debug_fmt("{}: session DELETE failed: {}", describe(), closed.error().message);
            }
            client_->cancel();
        }
        co_return;
    }, asio::use_awaitable);

    get_logger().info_fmt("{}: stopped", describe());
}

// ─────────────────────────────────────────────────────────────────────────────
// I/O
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<TransportResult<void>> HttpTransport::async_send(Json message) {
    if (!running_) {
        co_return tl::unexpected(TransportError::closed("Transport not running"));
    }

    std::string body;
    try {
        body = message.dump();
    } catch (const nlohmann::json::exception& e) {
        co_return tl::unexpected(TransportError::protocol("Cannot encode message: " + std::string(e.what())));
    }

    struct WorkerLease {
        HttpTransport* transport;
        ~WorkerLease() { transport->release_worker(); }
    };
    acquire_worker();
    WorkerLease lease{this};

    auto outcome = co_await asio::co_spawn(pool_,
        [this, body = std::move(body)]() -> asio::awaitable<TransportResult<std::vector<Json>>> {
            co_return exchange(body);
        },
        asio::use_awaitable);

    if (!outcome.has_value()) {
        co_return tl::unexpected(outcome.error());
    }

    for (auto& frame : *outcome) {
        if (!running_) {
            break;
        }
        try {
            co_await inbound_->async_send(asio::error_code{}, TransportResult<Json>(std::move(frame)), asio::use_awaitable);
        } catch (const std::system_error&) {
            co_return tl::unexpected(TransportError::closed());
        }
    }

    ensure_event_stream();
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<Json>> HttpTransport::async_receive() {
    if (inbound_ == nullptr) {
        co_return tl::unexpected(TransportError::closed("Transport not started"));
    }
    if (!running_ && !inbound_->ready()) {
        co_return tl::unexpected(TransportError::closed());
    }
    try {
        co_return co_await inbound_->async_receive(asio::use_awaitable);
    } catch (const std::system_error&) {
        co_return tl::unexpected(TransportError::closed());
    }
}

bool HttpTransport::is_running() const {
    return running_;
}

std::string HttpTransport::describe() const {
    return "http:" + target_.url;
}

std::optional<std::string> HttpTransport::session_id() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_id_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Worker-side helpers
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<std::vector<Json>> HttpTransport::exchange(const std::string& body) {
    auto result = client_->post(
        url_->path_with_query(),
        body,
        "application/json",
        session_headers("application/json, text/event-stream")
    );

    if (!result.has_value()) {
        if (result.error().code == HttpClientError::Code::Cancelled) {
            return tl::unexpected(TransportError::closed("Transport stopped"));
        }
        if (result.error().code == HttpClientError::Code::Timeout) {
            return tl::unexpected(TransportError::timeout("HTTP request timed out: " + result.error().message));
        }
        return tl::unexpected(TransportError::network("HTTP request failed: " + result.error().message));
    }

    const auto& response = *result;
    remember_session(response.headers);

    if (!response.is_success()) {
        if (response.status_code == 404) {
            std::lock_guard<std::mutex> lock(session_mutex_);
            session_id_.reset();
        }
        get_logger().warn_fmt("{}: POST returned HTTP {}", describe(), response.status_code);
        return tl::unexpected(TransportError::network(
            "HTTP " + std::to_string(response.status_code), response.status_code));
    }

    std::vector<Json> frames;
    if ((response.status_code == 202) || (response.status_code == 204) || is_blank(response.body)) {
        return frames;
    }

    if (response.body.size() > options_.max_message_size) {
        return tl::unexpected(TransportError::protocol("HTTP response body exceeds size limit"));
    }

    if (response.is_sse()) {
        SseParser parser;
        auto events = parser.feed(response.body);
        if (!events.has_value()) {
            return tl::unexpected(TransportError::protocol(events.error().message));
        }
        // A body without a trailing blank line still holds one last event.
        auto tail = parser.feed("\n\n");
        if (tail.has_value()) {
            events->insert(events->end(), tail->begin(), tail->end());
        }
        for (const auto& event : *events) {
            auto decoded = decode_event(event);
            if (decoded.has_value()) {
                frames.push_back(std::move(*decoded));
            } else {
                get_logger().warn_fmt("{}: dropped SSE event: {}", describe(), decoded.error().message);
            }
        }
        return frames;
    }

    auto parsed = fast_parse(response.body);
    if (!parsed.has_value()) {
        return tl::unexpected(TransportError::protocol("Malformed JSON response: " + parsed.error().message));
    }
    if (parsed->is_array()) {
        for (auto& item : *parsed) {
            frames.push_back(std::move(item));
        }
    } else {
        frames.push_back(std::move(*parsed));
    }
    return frames;
}

void HttpTransport::acquire_worker() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    ++busy_workers_;
    if ((busy_workers_ > workers_) && (workers_ < settings_.max_worker_threads)) {
        extra_workers_.emplace_back([this]() { pool_.attach(); });
        ++workers_;
        get_logger().debug_fmt("{}: grew to {} HTTP workers", describe(), workers_);
    }
}

void HttpTransport::release_worker() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    --busy_workers_;
}

void HttpTransport::ensure_event_stream() {
    if (!settings_.open_event_stream || stream_started_.exchange(true)) {
        return;
    }
    stream_thread_ = std::thread([this]() { event_stream_loop(); });
}

void HttpTransport::event_stream_loop() {
    get_logger().debug_fmt("{}: event stream thread started", describe());

    while (running_) {
        SseParser parser;
        bool accepted = false;

        HttpStreamHandler handler;
        handler.on_open = [&](int status, const HeaderMap& headers) {
            const auto content_type = get_header(headers, "Content-Type");
            accepted = (status == 200) && content_type.has_value()
                && (content_type->find("text/event-stream") != std::string::npos);
            return accepted;
        };
        handler.on_chunk = [&](std::string_view chunk) {
            auto events = parser.feed(chunk);
            if (!events.has_value()) {
                post_to_inbound(tl::unexpected(TransportError::protocol(events.error().message)));
                return running_.load();
            }
            for (const auto& event : *events) {
                if (event.id.has_value()) {
                    std::lock_guard<std::mutex> lock(session_mutex_);
                    last_event_id_ = event.id;
                }
                post_to_inbound(decode_event(event));
            }
            return running_.load();
        };

        auto result = client_->stream_get(url_->path_with_query(), session_headers("text/event-stream"), std::move(handler));
        if (!running_) {
            break;
        }

        if (!result.has_value()) {
            get_logger().warn_fmt("{}: event stream error: {}", describe(), result.error().message);
            post_to_inbound(tl::unexpected(TransportError::network("Event stream failed: " + result.error().message)));
            break;
        } else if (result->status_code == 405) {
            get_logger().info_fmt("{}: server offers no standalone event stream", describe());
            break;
        } else if (!accepted) {
            get_logger().warn_fmt("{}: event stream rejected with HTTP {}", describe(), result->status_code);
            post_to_inbound(tl::unexpected(TransportError::network(
                "Event stream rejected with HTTP " + std::to_string(result->status_code), result->status_code)));
            break;
        } else {
            get_logger().debug_fmt("{}: event stream ended, reopening", describe());
        }

        const auto resume_at = std::chrono::steady_clock::now() + settings_.event_stream_retry;
        while (running_ && (std::chrono::steady_clock::now() < resume_at)) {
            std::this_thread::sleep_for(kStopPollInterval);
        }
    }

    get_logger().debug_fmt("{}: event stream thread exiting", describe());
}

void HttpTransport::post_to_inbound(TransportResult<Json> frame) {
    asio::post(executor_, [channel = inbound_, frame = std::move(frame)]() mutable {
        channel->async_send(asio::error_code{}, std::move(frame), asio::detached);
    });
}

void HttpTransport::remember_session(const HeaderMap& headers) {
    const auto id = get_header(headers, kSessionHeader);
    if (!id.has_value()) {
        return;
    }
    if (!valid_session_id(*id)) {
        get_logger().warn_fmt("{}: ignoring malformed session id (length {})", describe(), id->size());
        return;
    }

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_id_ != id) {
        session_id_ = *id;
        get_logger().debug_fmt("{}: session established", describe());
    }
}

HeaderMap HttpTransport::session_headers(std::string_view accept) const {
    HeaderMap headers;
    headers["Accept"] = std::string(accept);

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_id_.has_value()) {
        headers[std::string(kSessionHeader)] = *session_id_;
    }
    if (last_event_id_.has_value() && (accept == "text/event-stream")) {
        headers["Last-Event-ID"] = *last_event_id_;
    }
    return headers;
}

TransportResult<Json> HttpTransport::decode_event(const SseEvent& event) const {
    if (event.data.size() > options_.max_message_size) {
        return tl::unexpected(TransportError::protocol("SSE event exceeds size limit"));
    }
    auto parsed = fast_parse(event.data);
    if (!parsed.has_value()) {
        return tl::unexpected(TransportError::protocol("Malformed JSON in SSE event: " + parsed.error().message));
    }
    return std::move(*parsed);
}

}  // namespace toolmux
