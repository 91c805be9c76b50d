#include "toolmux/client/connection.hpp"
#include "toolmux/log/logger.hpp"
#include "toolmux/protocol/json_rpc.hpp"
#include "toolmux/transport/transport_descriptor.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <utility>

namespace toolmux {

namespace {

constexpr std::size_t kMaxDiscoveryPages = 1000;

Result<Json> extract_result(const Json& message) {
    if (message.contains("error")) {
        RpcResult<JsonRpcError> rpc = tl::unexpected(RpcFormatError{});
        try {
            rpc = JsonRpcError::from_json(message.at("error"));
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error::protocol(std::string("Malformed error reply: ") + e.what()));
        }
        if (!rpc.has_value()) {
            return tl::unexpected(Error::protocol("Malformed error reply: " + rpc.error().message));
        }
        return tl::unexpected(Error::from_rpc_error(*rpc));
    }
    if (!message.contains("result")) {
        return tl::unexpected(Error::protocol("Response carries neither result nor error"));
    }
    return message.at("result");
}

}  // namespace

TransportFactory default_transport_factory() {
    return [](asio::any_io_executor executor, const ServerConfig& config, const TransportOptions& options) {
        TransportOptions merged = options;
        for (const auto& [key, value] : config.env) {
            merged.env_overrides[key] = value;
        }
        return make_transport(std::move(executor), config.transport, merged);
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<Connection> Connection::create(
    asio::any_io_executor executor,
    ServerConfig config,
    ConnectionOptions options,
    std::shared_ptr<ToolCache> cache,
    TransportFactory factory
) {
    return std::shared_ptr<Connection>(new Connection(
        std::move(executor), std::move(config), std::move(options), std::move(cache), std::move(factory)));
}

Connection::Connection(
    asio::any_io_executor executor,
    ServerConfig config,
    ConnectionOptions options,
    std::shared_ptr<ToolCache> cache,
    TransportFactory factory
)
    : config_(std::move(config))
    , options_(std::move(options))
    , cache_(std::move(cache))
    , factory_(std::move(factory))
    , strand_(asio::make_strand(executor))
    , health_(options_.health)
    , backoff_(options_.reconnect.make_policy())
    , retry_timer_(strand_)
{
    if (cache_ == nullptr) {
        cache_ = std::make_shared<ToolCache>();
    }
    if (factory_ == nullptr) {
        factory_ = default_transport_factory();
    }
}

Connection::~Connection() {
    get_logger().trace_fmt("[{}] connection released", config_.id);
}

// ═══════════════════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════════════════

void Connection::start() {
    asio::post(strand_, [self = shared_from_this()]() {
        if (self->started_ || self->closing_) {
            return;
        }
        self->started_ = true;
        asio::co_spawn(self->strand_, [self]() { return self->supervise(); }, asio::detached);
    });
}

asio::awaitable<Result<void>> Connection::wait_ready() {
    auto self = shared_from_this();
    co_return co_await asio::co_spawn(strand_,
        [self]() { return self->wait_ready_on_strand(); },
        asio::use_awaitable);
}

asio::awaitable<void> Connection::close(std::string reason) {
    auto self = shared_from_this();
    co_await asio::co_spawn(strand_,
        [self, reason = std::move(reason)]() mutable { return self->close_on_strand(std::move(reason)); },
        asio::use_awaitable);
}

asio::awaitable<Result<Json>> Connection::request(
    std::string method,
    std::optional<Json> params,
    RequestOptions options
) {
    auto self = shared_from_this();
    co_return co_await asio::co_spawn(strand_,
        [self, method = std::move(method), params = std::move(params), options = std::move(options)]() mutable {
            return self->request_on_strand(std::move(method), std::move(params), std::move(options));
        },
        asio::use_awaitable);
}

asio::awaitable<Result<void>> Connection::notify(std::string method, std::optional<Json> params) {
    auto self = shared_from_this();
    co_return co_await asio::co_spawn(strand_,
        [self, method = std::move(method), params = std::move(params)]() mutable {
            return self->notify_on_strand(std::move(method), std::move(params));
        },
        asio::use_awaitable);
}

asio::awaitable<Result<CallToolResult>> Connection::call_tool(
    std::string tool_name,
    Json arguments,
    std::optional<std::chrono::milliseconds> timeout,
    std::function<void(std::uint64_t id)> on_registered
) {
    CallToolParams params{std::move(tool_name), arguments.is_null() ? Json::object() : std::move(arguments)};

    RequestOptions options;
    options.scope = RequestScope::User;
    options.timeout = timeout;
    options.on_registered = std::move(on_registered);

    auto reply = co_await request(std::string(method::tools_call), params.to_json(), std::move(options));
    if (!reply.has_value()) {
        co_return tl::unexpected(reply.error());
    }
    if (!reply->is_object()) {
        co_return tl::unexpected(Error::protocol("tools/call result is not an object"));
    }

    std::optional<CallToolResult> result;
    std::string failure;
    try {
        result = CallToolResult::from_json(*reply);
    } catch (const nlohmann::json::exception& e) {
        failure = e.what();
    }
    if (!result.has_value()) {
        co_return tl::unexpected(Error::protocol("Malformed tools/call result: " + failure));
    }

    if (result->is_error) {
        auto text = result->text();
        co_return tl::unexpected(Error::tool_error(
            text.empty() ? "Tool reported an error" : std::move(text), result->raw));
    }
    co_return std::move(*result);
}

asio::awaitable<Result<std::vector<ToolSchema>>> Connection::refresh_tools() {
    auto self = shared_from_this();
    co_return co_await asio::co_spawn(strand_,
        [self]() { return self->refresh_on_strand(); },
        asio::use_awaitable);
}

void Connection::cancel(std::uint64_t request_id) {
    asio::post(strand_, [weak = weak_from_this(), request_id]() {
        auto self = weak.lock();
        if ((self == nullptr) || !self->pending_.contains(request_id)) {
            return;
        }
        self->counters_.cancelled.fetch_add(1, std::memory_order_relaxed);
        get_logger().debug_fmt("[{}] request {} cancelled", self->id(), request_id);
        self->resolve(request_id, tl::unexpected(Error::cancelled()));
    });
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

ConnectionState Connection::state() const noexcept {
    return state_.state();
}

std::uint64_t Connection::generation() const noexcept {
    return generation_.load();
}

std::size_t Connection::attempts() const noexcept {
    return state_.attempts();
}

std::string Connection::last_error() const {
    return state_.last_error();
}

std::vector<ToolSchema> Connection::tools() const {
    return cache_->tools(id());
}

std::optional<Implementation> Connection::server_info() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    if (!server_.has_value()) {
        return std::nullopt;
    }
    return server_->server_info;
}

std::optional<ServerCapabilities> Connection::server_capabilities() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    if (!server_.has_value()) {
        return std::nullopt;
    }
    return server_->capabilities;
}

std::optional<std::string> Connection::server_instructions() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    if (!server_.has_value()) {
        return std::nullopt;
    }
    return server_->instructions;
}

ConnectionStats Connection::stats() const {
    ConnectionStats out;
    out.requests_sent = counters_.requests_sent.load(std::memory_order_relaxed);
    out.responses_matched = counters_.responses_matched.load(std::memory_order_relaxed);
    out.timeouts = counters_.timeouts.load(std::memory_order_relaxed);
    out.cancelled = counters_.cancelled.load(std::memory_order_relaxed);
    out.unmatched_responses = counters_.unmatched_responses.load(std::memory_order_relaxed);
    out.malformed_frames = counters_.malformed_frames.load(std::memory_order_relaxed);
    out.server_requests = counters_.server_requests.load(std::memory_order_relaxed);
    out.notifications = counters_.notifications.load(std::memory_order_relaxed);
    out.reconnects = counters_.reconnects.load(std::memory_order_relaxed);
    return out;
}

HealthStats Connection::health() const {
    return health_.stats();
}

std::size_t Connection::pending_count() const noexcept {
    return pending_count_.load();
}

void Connection::on_notification(NotificationCallback callback) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    notification_callbacks_.push_back(std::move(callback));
}

void Connection::on_state_change(StateChangeCallback callback) {
    state_.on_state_change([server_id = config_.id, callback = std::move(callback)](
        ConnectionState old_state, ConnectionState new_state) {
        callback(server_id, old_state, new_state);
    });
}

// ═══════════════════════════════════════════════════════════════════════════
// Supervision
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Connection::supervise() {
    while (!closing_) {
        if (!state_.transition_to(ConnectionState::Connecting)) {
            break;
        }

        const auto generation = generation_.fetch_add(1) + 1;
        lost_ = false;
        generation_lost_ = std::make_shared<SignalChannel>(strand_, 1);
        health_.reset();

        std::shared_ptr<IAsyncTransport> transport = factory_(strand_, config_, options_.transport);
        if (transport == nullptr) {
            last_failure_ = Error::transport("No transport available for " + describe(config_.transport));
            state_.transition_to(ConnectionState::Disconnected, last_failure_->message);
            if ((co_await backoff_before_retry()) == false) {
                break;
            }
            continue;
        }

        get_logger().info_fmt("[{}] connecting via {} (generation {})", id(), transport->describe(), generation);
        auto started = co_await transport->async_start();
        if (closing_) {
            co_await transport->async_stop();
            break;
        }
        if (!started.has_value()) {
            last_failure_ = Error::from_transport(started.error());
            get_logger().warn_fmt("[{}] {} failed to start: {}", id(), transport->describe(), started.error().message);
            state_.transition_to(ConnectionState::Disconnected, started.error().message);
            co_await transport->async_stop();
            if ((co_await backoff_before_retry()) == false) {
                break;
            }
            continue;
        }

        transport_ = transport;
        state_.transition_to(ConnectionState::Handshaking);
        asio::co_spawn(strand_,
            [self = shared_from_this(), generation, transport]() { return self->read_loop(generation, transport); },
            asio::detached);

        auto handshaken = co_await handshake(generation);
        if (closing_) {
            break;
        }
        if (!handshaken.has_value()) {
            last_failure_ = handshaken.error();
            co_await teardown(generation, "Handshake failed: " + handshaken.error().message);
            if ((co_await backoff_before_retry()) == false) {
                break;
            }
            continue;
        }

        state_.transition_to(ConnectionState::Ready);
        settle_ready_waiters(Result<void>{});

        if (options_.health.enabled) {
            asio::co_spawn(strand_,
                [self = shared_from_this(), generation]() { return self->probe_loop(generation); },
                asio::detached);
        }

        auto signal = generation_lost_;
        std::string reason = "Connection lost";
        try {
            reason = co_await signal->async_receive(asio::use_awaitable);
        } catch (const std::system_error&) {
            // close() shuts the channel
        }
        if (closing_) {
            break;
        }

        last_failure_ = Error::closed(reason);
        co_await teardown(generation, reason);
        if ((co_await backoff_before_retry()) == false) {
            break;
        }
    }

    get_logger().debug_fmt("[{}] supervisor finished in state {}", id(), to_string(state_.state()));
}

asio::awaitable<Result<void>> Connection::handshake(std::uint64_t generation) {
    InitializeParams params;
    params.client_info = options_.client_info;

    RequestOptions options;
    options.scope = RequestScope::Handshake;
    options.timeout = options_.handshake_timeout;

    auto reply = co_await request_on_strand(std::string(method::initialize), params.to_json(), options);
    if (!reply.has_value()) {
        if (reply.error().code == ErrorCode::ToolError) {
            co_return tl::unexpected(Error::protocol("initialize rejected: " + reply.error().message));
        }
        co_return tl::unexpected(reply.error());
    }
    if (!reply->is_object()) {
        co_return tl::unexpected(Error::protocol("initialize result is not an object"));
    }

    std::optional<InitializeResult> init;
    std::string failure;
    try {
        init = InitializeResult::from_json(*reply);
    } catch (const nlohmann::json::exception& e) {
        failure = e.what();
    }
    if (!init.has_value()) {
        co_return tl::unexpected(Error::protocol("Malformed initialize result: " + failure));
    }

    get_logger().info_fmt("[{}] server {} {} (protocol {})",
        id(), init->server_info.name, init->server_info.version, init->protocol_version);
    if (init->protocol_version != MCP_PROTOCOL_VERSION) {
        get_logger().debug_fmt("[{}] server negotiated protocol {}", id(), init->protocol_version);
    }
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        server_ = std::move(*init);
    }

    auto transport = transport_;
    if ((transport == nullptr) || lost_ || (generation != generation_)) {
        co_return tl::unexpected(Error::closed("Connection lost during handshake"));
    }
    auto notified = co_await transport->async_send(JsonRpcNotification(std::string(method::initialized)).to_json());
    if (!notified.has_value()) {
        co_return tl::unexpected(Error::from_transport(notified.error()));
    }

    auto tools = co_await discover_tools(RequestScope::Handshake, options_.handshake_timeout);
    if (!tools.has_value()) {
        co_return tl::unexpected(tools.error());
    }
    if (closing_ || lost_ || (generation != generation_)) {
        co_return tl::unexpected(Error::closed("Connection lost during discovery"));
    }

    get_logger().info_fmt("[{}] discovered {} tools", id(), tools->size());
    cache_->replace(id(), std::move(*tools), generation);
    co_return Result<void>{};
}

asio::awaitable<Result<std::vector<ToolSchema>>> Connection::discover_tools(
    RequestScope scope,
    std::chrono::milliseconds timeout
) {
    std::vector<ToolSchema> tools;
    std::optional<std::string> cursor;

    for (std::size_t page = 0; page < kMaxDiscoveryPages; ++page) {
        std::optional<Json> params;
        if (cursor.has_value()) {
            params = Json{{"cursor", *cursor}};
        }

        RequestOptions options;
        options.scope = scope;
        options.timeout = timeout;

        auto reply = co_await request_on_strand(std::string(method::tools_list), std::move(params), std::move(options));
        if (!reply.has_value()) {
            co_return tl::unexpected(reply.error());
        }

        std::optional<ListToolsResult> listed;
        std::string failure;
        try {
            listed = ListToolsResult::from_json(*reply);
        } catch (const nlohmann::json::exception& e) {
            failure = e.what();
        }
        if (!listed.has_value()) {
            co_return tl::unexpected(Error::protocol("Malformed tools/list result: " + failure));
        }

        for (auto& tool : listed->tools) {
            tools.push_back(std::move(tool));
        }
        if (!listed->next_cursor.has_value()) {
            co_return tools;
        }
        if (listed->next_cursor == cursor) {
            co_return tl::unexpected(Error::protocol("tools/list returned the same cursor twice"));
        }
        cursor = std::move(listed->next_cursor);
    }

    co_return tl::unexpected(Error::protocol("tools/list pagination did not terminate"));
}

asio::awaitable<void> Connection::teardown(std::uint64_t generation, const std::string& reason) {
    lose_generation(generation, reason);
    cache_->invalidate(id());

    if (state_.state() != ConnectionState::Closed) {
        state_.transition_to(ConnectionState::Disconnected, reason);
    }

    auto transport = std::exchange(transport_, nullptr);
    if (transport) {
        co_await transport->async_stop();
    }
}

asio::awaitable<bool> Connection::backoff_before_retry() {
    if (closing_) {
        co_return false;
    }

    const auto attempts = state_.attempts();
    if (options_.reconnect.exhausted(attempts)) {
        const auto failure = last_failure_.value_or(Error::closed("Reconnection attempts exhausted"));
        get_logger().error_fmt("[{}] giving up after {} attempts: {}", id(), attempts, failure.message);
        state_.transition_to(ConnectionState::Closed, "Reconnection attempts exhausted: " + failure.message);
        cache_->invalidate(id());
        settle_ready_waiters(tl::unexpected(failure));
        co_return false;
    }

    const auto delay = backoff_->next_delay((attempts > 0) ? attempts - 1 : 0);
    get_logger().warn_fmt("[{}] reconnecting in {}ms (attempt {})", id(), delay.count(), attempts + 1);

    retry_timer_.expires_after(delay);
    asio::error_code ec;
    co_await retry_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    if (closing_) {
        co_return false;
    }

    counters_.reconnects.fetch_add(1, std::memory_order_relaxed);
    co_return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Connection::read_loop(std::uint64_t generation, std::shared_ptr<IAsyncTransport> transport) {
    while (true) {
        auto frame = co_await transport->async_receive();
        if (closing_ || lost_ || (generation != generation_)) {
            break;
        }

        if (!frame.has_value()) {
            const auto& err = frame.error();
            if (err.category == TransportError::Category::Protocol) {
                counters_.malformed_frames.fetch_add(1, std::memory_order_relaxed);
                get_logger().warn_fmt("[{}] dropped malformed frame: {}", id(), err.message);
                enter_degraded("Malformed frame: " + err.message);
                continue;
            }
            lose_generation(generation, err.message);
            break;
        }

        handle_message(generation, transport, std::move(*frame));
    }

    get_logger().debug_fmt("[{}] read loop for generation {} finished", id(), generation);
}

void Connection::handle_message(
    std::uint64_t generation,
    const std::shared_ptr<IAsyncTransport>& transport,
    Json message
) {
    switch (classify_message(message)) {
        case MessageKind::Response:
            handle_response(generation, message);
            break;
        case MessageKind::Notification:
            handle_notification(generation, message);
            break;
        case MessageKind::Request:
            handle_server_request(transport, message);
            break;
        case MessageKind::Invalid:
            counters_.malformed_frames.fetch_add(1, std::memory_order_relaxed);
            get_logger().warn_fmt("[{}] dropped frame that is not a JSON-RPC message", id());
            break;
    }
}

void Connection::handle_response(std::uint64_t generation, const Json& message) {
    const auto request_id = response_id(message);
    auto it = request_id.has_value() ? pending_.find(*request_id) : pending_.end();

    if ((it == pending_.end()) || (it->second.generation != generation)) {
        counters_.unmatched_responses.fetch_add(1, std::memory_order_relaxed);
        get_logger().warn_fmt("[{}] dropped response with unmatched id {}", id(), message.at("id").dump());
        return;
    }

    counters_.responses_matched.fetch_add(1, std::memory_order_relaxed);
    resolve(*request_id, extract_result(message));
}

void Connection::handle_server_request(const std::shared_ptr<IAsyncTransport>& transport, const Json& message) {
    counters_.server_requests.fetch_add(1, std::memory_order_relaxed);

    const auto method = message.at("method").get<std::string>();
    const auto& request_id = message.at("id");

    Json reply;
    if (method == method::ping) {
        reply = make_result_response(request_id, Json::object());
    } else {
        get_logger().debug_fmt("[{}] rejecting server request {}", id(), method);
        reply = make_error_response(request_id, JsonRpcError{rpc_code::method_not_found, "Method not found: " + method, std::nullopt});
    }
    send_detached(transport, std::move(reply), std::nullopt);
}

void Connection::handle_notification(std::uint64_t /*generation*/, const Json& message) {
    counters_.notifications.fetch_add(1, std::memory_order_relaxed);

    const auto method = message.at("method").get<std::string>();
    const Json params = message.contains("params") ? message.at("params") : Json::object();

    if (method == method::tools_list_changed) {
        get_logger().info_fmt("[{}] tool list changed, re-discovering", id());
        asio::co_spawn(strand_, [self = shared_from_this()]() -> asio::awaitable<void> {
            auto refreshed = co_await self->refresh_on_strand();
            if (!refreshed.has_value()) {
                get_logger().warn_fmt("[{}] re-discovery failed: {}", self->id(), refreshed.error().message);
            }
        }, asio::detached);
    } else {
        get_logger().debug_fmt("[{}] notification {}", id(), method);
    }

    std::vector<NotificationCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        callbacks = notification_callbacks_;
    }
    for (const auto& callback : callbacks) {
        callback(id(), method, params);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Health
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Connection::probe_loop(std::uint64_t generation) {
    asio::steady_timer timer(strand_);
    probe_timer_ = &timer;

    while (!closing_ && !lost_ && (generation == generation_)) {
        timer.expires_after(health_.next_interval());
        asio::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (closing_ || lost_ || (generation != generation_)) {
            break;
        }
        if (ec == asio::error::operation_aborted) {
            continue;  // rescheduled
        }
        if (ec) {
            break;
        }

        RequestOptions options;
        options.scope = RequestScope::Maintenance;
        options.timeout = options_.health.probe_timeout;

        auto reply = co_await request_on_strand(std::string(method::ping), std::nullopt, std::move(options));
        if (closing_ || lost_ || (generation != generation_)) {
            break;
        }

        // An error reply still proves the server is answering.
        const bool alive = reply.has_value() || (reply.error().code == ErrorCode::ToolError);
        const auto verdict = alive ? health_.record_success() : health_.record_miss();

        switch (verdict) {
            case ProbeVerdict::Alive:
                break;
            case ProbeVerdict::Recovered:
                if (state_.state() == ConnectionState::Degraded) {
                    state_.transition_to(ConnectionState::Ready, "probe answered");
                }
                break;
            case ProbeVerdict::Missed:
                get_logger().debug_fmt("[{}] probe missed ({} in a row): {}",
                    id(), health_.consecutive_misses(), reply.error().message);
                break;
            case ProbeVerdict::Degrade:
                enter_degraded(std::to_string(health_.consecutive_misses()) + " consecutive probes missed");
                break;
            case ProbeVerdict::Fail:
                lose_generation(generation,
                    "Health check failed: " + std::to_string(health_.consecutive_misses()) + " consecutive probes missed");
                break;
        }
    }

    if (probe_timer_ == &timer) {
        probe_timer_ = nullptr;
    }
}

void Connection::enter_degraded(const std::string& reason) {
    health_.mark_degraded();
    if (state_.state() != ConnectionState::Ready) {
        return;
    }
    get_logger().warn_fmt("[{}] degraded: {}", id(), reason);
    state_.transition_to(ConnectionState::Degraded, reason);
    cache_->mark_stale(id());

    // Re-arm a waiting probe with the degraded interval.
    if (probe_timer_ != nullptr) {
        probe_timer_->cancel();
    }

    // Without a probe loop nothing else would bring the connection back.
    if (!options_.health.enabled) {
        asio::co_spawn(strand_,
            [self = shared_from_this(), generation = generation_.load()]() { return self->verify_liveness(generation); },
            asio::detached);
    }
}

asio::awaitable<void> Connection::verify_liveness(std::uint64_t generation) {
    RequestOptions options;
    options.scope = RequestScope::Maintenance;
    options.timeout = options_.health.probe_timeout;

    auto reply = co_await request_on_strand(std::string(method::ping), std::nullopt, std::move(options));
    if (closing_ || lost_ || (generation != generation_)) {
        co_return;
    }

    if (!reply.has_value() && (reply.error().code != ErrorCode::ToolError)) {
        lose_generation(generation, "Liveness check failed: " + reply.error().message);
        co_return;
    }

    health_.record_success();
    if (state_.state() == ConnectionState::Degraded) {
        state_.transition_to(ConnectionState::Ready, "ping answered");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Strand-side operations
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<Result<void>> Connection::wait_ready_on_strand() {
    const auto current = state_.state();
    if (is_live(current)) {
        co_return Result<void>{};
    }
    if (closing_ || (current == ConnectionState::Closed)) {
        co_return tl::unexpected(last_failure_.value_or(Error::closed()));
    }

    auto waiter = std::make_shared<ReadyChannel>(strand_, 1);
    ready_waiters_.push_back(waiter);
    try {
        co_return co_await waiter->async_receive(asio::use_awaitable);
    } catch (const std::system_error&) {
        co_return tl::unexpected(Error::closed());
    }
}

asio::awaitable<void> Connection::close_on_strand(std::string reason) {
    if (closing_) {
        co_return;
    }
    closing_ = true;
    get_logger().info_fmt("[{}] closing: {}", id(), reason);

    retry_timer_.cancel();
    if (probe_timer_ != nullptr) {
        probe_timer_->cancel();
    }

    fail_pending(std::nullopt, Error::closed(reason));
    if (state_.state() != ConnectionState::Closed) {
        state_.transition_to(ConnectionState::Closed, reason);
    }
    cache_->invalidate(id());
    settle_ready_waiters(tl::unexpected(Error::closed(reason)));

    if (generation_lost_) {
        generation_lost_->close();
    }

    auto transport = std::exchange(transport_, nullptr);
    if (transport) {
        co_await transport->async_stop();
    }
}

asio::awaitable<Result<Json>> Connection::request_on_strand(
    std::string method,
    std::optional<Json> params,
    RequestOptions options
) {
    if (auto allowed = check_scope(options.scope); !allowed.has_value()) {
        co_return tl::unexpected(allowed.error());
    }

    const auto request_id = ++next_request_id_;
    const auto timeout = effective_timeout(options);

    PendingRequest pending;
    pending.channel = std::make_shared<ResultChannel>(strand_, 1);
    pending.generation = generation_;
    pending.method = method;

    if (timeout.count() > 0) {
        pending.deadline = std::make_unique<asio::steady_timer>(strand_, timeout);
        pending.deadline->async_wait([weak = weak_from_this(), request_id, timeout](asio::error_code ec) {
            if (ec) {
                return;
            }
            auto self = weak.lock();
            if ((self == nullptr) || !self->pending_.contains(request_id)) {
                return;
            }
            self->counters_.timeouts.fetch_add(1, std::memory_order_relaxed);
            const auto& method_name = self->pending_.at(request_id).method;
            get_logger().warn_fmt("[{}] {} (id {}) timed out after {}ms",
                self->id(), method_name, request_id, timeout.count());
            self->resolve(request_id, tl::unexpected(Error::timeout(
                method_name + " timed out after " + std::to_string(timeout.count()) + "ms")));
        });
    }

    auto channel = pending.channel;
    pending_.emplace(request_id, std::move(pending));
    pending_count_ = pending_.size();
    counters_.requests_sent.fetch_add(1, std::memory_order_relaxed);

    if (options.on_registered) {
        options.on_registered(request_id);
    }

    get_logger().trace_fmt("[{}] -> {} (id {})", id(), method, request_id);
    send_detached(
        transport_,
        JsonRpcRequest(std::move(method), static_cast<std::int64_t>(request_id), std::move(params)).to_json(),
        request_id
    );

    try {
        co_return co_await channel->async_receive(asio::use_awaitable);
    } catch (const std::system_error&) {
        // The caller was cancelled; free the slot so a late reply is unmatched.
        if (pending_.contains(request_id)) {
            counters_.cancelled.fetch_add(1, std::memory_order_relaxed);
            get_logger().debug_fmt("[{}] request {} abandoned by its caller", id(), request_id);
            resolve(request_id, tl::unexpected(Error::cancelled()));
        }
        co_return tl::unexpected(Error::cancelled());
    }
}

asio::awaitable<Result<void>> Connection::notify_on_strand(std::string method, std::optional<Json> params) {
    if (auto allowed = check_scope(RequestScope::Maintenance); !allowed.has_value()) {
        co_return tl::unexpected(allowed.error());
    }

    auto transport = transport_;
    auto sent = co_await transport->async_send(JsonRpcNotification(std::move(method), std::move(params)).to_json());
    if (!sent.has_value()) {
        co_return tl::unexpected(Error::from_transport(sent.error()));
    }
    co_return Result<void>{};
}

asio::awaitable<Result<std::vector<ToolSchema>>> Connection::refresh_on_strand() {
    if (auto allowed = check_scope(RequestScope::Maintenance); !allowed.has_value()) {
        co_return tl::unexpected(allowed.error());
    }

    const auto generation = generation_.load();
    auto tools = co_await discover_tools(RequestScope::Maintenance, options_.handshake_timeout);
    if (!tools.has_value()) {
        co_return tl::unexpected(tools.error());
    }
    if (closing_ || lost_ || (generation != generation_)) {
        co_return tl::unexpected(Error::closed("Connection lost during discovery"));
    }

    cache_->replace(id(), *tools, generation);
    get_logger().info_fmt("[{}] tool list refreshed ({} tools)", id(), tools->size());
    co_return std::move(*tools);
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

void Connection::send_detached(
    const std::shared_ptr<IAsyncTransport>& transport,
    Json message,
    std::optional<std::uint64_t> request_id
) {
    asio::co_spawn(strand_,
        [self = shared_from_this(), transport, message = std::move(message), request_id]() mutable
            -> asio::awaitable<void> {
            auto sent = co_await transport->async_send(std::move(message));
            if (sent.has_value()) {
                co_return;
            }
            get_logger().debug_fmt("[{}] send failed: {}", self->id(), sent.error().message);
            if (request_id.has_value()) {
                self->resolve(*request_id, tl::unexpected(Error::from_transport(sent.error())));
            }
        },
        asio::detached);
}

void Connection::resolve(std::uint64_t request_id, Result<Json> result) {
    auto it = pending_.find(request_id);
    if (it == pending_.end()) {
        return;
    }

    auto pending = std::move(it->second);
    pending_.erase(it);
    pending_count_ = pending_.size();

    if (pending.deadline) {
        pending.deadline->cancel();
    }
    pending.channel->try_send(asio::error_code{}, std::move(result));
}

void Connection::fail_pending(std::optional<std::uint64_t> generation, const Error& error) {
    std::vector<std::uint64_t> doomed;
    for (const auto& [request_id, pending] : pending_) {
        if (!generation.has_value() || (pending.generation == *generation)) {
            doomed.push_back(request_id);
        }
    }
    for (const auto request_id : doomed) {
        resolve(request_id, tl::unexpected(error));
    }
}

void Connection::lose_generation(std::uint64_t generation, std::string reason) {
    if (lost_ || (generation != generation_)) {
        return;
    }
    lost_ = true;
    get_logger().warn_fmt("[{}] connection lost: {}", id(), reason);

    fail_pending(generation, Error::closed(reason));
    if (probe_timer_ != nullptr) {
        probe_timer_->cancel();
    }
    if (generation_lost_) {
        generation_lost_->try_send(asio::error_code{}, std::move(reason));
    }
}

void Connection::settle_ready_waiters(const Result<void>& outcome) {
    auto waiters = std::move(ready_waiters_);
    ready_waiters_.clear();
    for (const auto& waiter : waiters) {
        waiter->try_send(asio::error_code{}, outcome);
    }
}

Result<void> Connection::check_scope(RequestScope scope) const {
    if (closing_) {
        return tl::unexpected(Error::closed());
    }

    const auto current = state_.state();
    bool allowed = false;
    switch (scope) {
        case RequestScope::User:
            allowed = (current == ConnectionState::Ready);
            break;
        case RequestScope::Handshake:
            allowed = (current == ConnectionState::Handshaking);
            break;
        case RequestScope::Maintenance:
            allowed = is_live(current);
            break;
    }
    if (!allowed) {
        return tl::unexpected(Error::not_ready(
            "Server '" + id() + "' is " + std::string(to_string(current))));
    }
    if ((transport_ == nullptr) || lost_) {
        return tl::unexpected(Error::closed("Connection lost"));
    }
    return {};
}

std::chrono::milliseconds Connection::effective_timeout(const RequestOptions& options) const {
    return options.timeout.value_or(options_.request_timeout);
}

}  // namespace toolmux
