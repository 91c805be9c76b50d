#include "toolmux/client/manager.hpp"
#include "toolmux/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>

namespace toolmux {

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

Manager::Manager(asio::any_io_executor executor, ManagerConfig config)
    : Manager(std::move(executor), std::move(config), default_transport_factory())
{}

Manager::Manager(asio::any_io_executor executor, ManagerConfig config, TransportFactory factory)
    : executor_(std::move(executor))
    , config_(std::move(config))
    , factory_(std::move(factory))
    , cache_(std::make_shared<ToolCache>())
    , observers_(std::make_shared<Observers>())
{
    if (factory_ == nullptr) {
        factory_ = default_transport_factory();
    }
}

Manager::~Manager() {
    std::map<std::string, std::shared_ptr<Connection>> remaining;
    {
        std::unique_lock lock(registry_mutex_);
        remaining.swap(connections_);
    }
    for (auto& [id, conn] : remaining) {
        asio::co_spawn(executor_,
            [conn]() { return conn->close("Manager destroyed"); },
            asio::detached);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<Result<void>> Manager::connect(ServerConfig config) {
    if (auto valid = config.validate(); !valid.has_value()) {
        co_return tl::unexpected(valid.error());
    }

    const std::string server_id = config.id;
    auto options = config.options.value_or(config_.defaults);

    std::shared_ptr<Connection> conn;
    std::shared_ptr<Connection> replaced;
    {
        std::unique_lock lock(registry_mutex_);
        auto it = connections_.find(server_id);
        if (it != connections_.end()) {
            if (it->second->state() != ConnectionState::Closed) {
                co_return tl::unexpected(Error::already_connected(server_id));
            }
            replaced = it->second;
        }

        conn = Connection::create(executor_, std::move(config), std::move(options), cache_, factory_);
        connections_[server_id] = conn;
    }

    if (replaced) {
        co_await replaced->close("Replaced by a new connection");
    }

    conn->on_notification([observers = observers_, cache = cache_](
        const std::string& id, const std::string& method, const Json& params) {
        deliver_notification(observers, cache, id, method, params);
    });
    conn->on_state_change([weak = std::weak_ptr<Observers>(observers_)](
        const std::string& id, ConnectionState old_state, ConnectionState new_state) {
        auto observers = weak.lock();
        if (observers == nullptr) {
            return;
        }
        std::vector<StateObserver> callbacks;
        {
            std::lock_guard<std::mutex> lock(observers->mutex);
            callbacks = observers->state;
        }
        for (const auto& callback : callbacks) {
            callback(id, old_state, new_state);
        }
    });

    get_logger().info_fmt("[{}] connecting to {}", server_id, describe(conn->config().transport));
    conn->start();

    auto ready = co_await conn->wait_ready();
    if (!ready.has_value()) {
        get_logger().error_fmt("[{}] connect failed: {}", server_id, ready.error().message);
        remove_if_same(server_id, conn);
        co_await conn->close("Connect failed");
        co_return tl::unexpected(ready.error());
    }

    co_return Result<void>{};
}

asio::awaitable<void> Manager::disconnect(const std::string& server_id) {
    std::shared_ptr<Connection> conn;
    {
        std::unique_lock lock(registry_mutex_);
        auto it = connections_.find(server_id);
        if (it != connections_.end()) {
            conn = std::move(it->second);
            connections_.erase(it);
        }
    }

    if (conn) {
        co_await conn->close("Disconnected by caller");
        get_logger().info_fmt("[{}] disconnected", server_id);
    }
    cache_->invalidate(server_id);
}

asio::awaitable<void> Manager::shutdown() {
    std::map<std::string, std::shared_ptr<Connection>> remaining;
    {
        std::unique_lock lock(registry_mutex_);
        remaining.swap(connections_);
    }

    get_logger().info_fmt("Shutting down {} connections", remaining.size());
    for (auto& [id, conn] : remaining) {
        co_await conn->close("Manager shutdown");
    }
    cache_->clear();
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

Result<std::vector<ToolSchema>> Manager::list_tools(const std::string& server_id) const {
    if (find(server_id) == nullptr) {
        return tl::unexpected(Error::not_found("Unknown server '" + server_id + "'"));
    }
    return cache_->tools(server_id);
}

asio::awaitable<Result<CallToolResult>> Manager::call_tool(
    const std::string& server_id,
    const std::string& tool_name,
    Json arguments,
    std::optional<std::chrono::milliseconds> timeout
) {
    auto conn = find(server_id);
    if (conn == nullptr) {
        co_return tl::unexpected(Error::not_found("Unknown server '" + server_id + "'"));
    }

    const auto current = conn->state();
    if (current != ConnectionState::Ready) {
        co_return tl::unexpected(Error::not_ready(
            "Server '" + server_id + "' is " + std::string(to_string(current))));
    }
    if (!cache_->contains(server_id, tool_name)) {
        co_return tl::unexpected(Error::not_found(
            "Server '" + server_id + "' has no tool '" + tool_name + "'"));
    }

    co_return co_await conn->call_tool(tool_name, std::move(arguments), timeout);
}

asio::awaitable<Result<std::vector<ToolSchema>>> Manager::refresh_tools(const std::string& server_id) {
    auto conn = find(server_id);
    if (conn == nullptr) {
        co_return tl::unexpected(Error::not_found("Unknown server '" + server_id + "'"));
    }
    co_return co_await conn->refresh_tools();
}

std::vector<ServerTool> Manager::list_all_tools() const {
    std::vector<ServerTool> all;
    for (const auto& server_id : server_ids()) {
        for (auto& tool : cache_->tools(server_id)) {
            all.push_back(ServerTool{server_id, std::move(tool)});
        }
    }
    return all;
}

std::optional<ServerTool> Manager::find_tool(const std::string& tool_name) const {
    for (const auto& server_id : server_ids()) {
        if (auto tool = cache_->find(server_id, tool_name); tool.has_value()) {
            return ServerTool{server_id, std::move(*tool)};
        }
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Sandbox state
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Manager::notify_sandbox_state(SandboxState state) {
    std::vector<std::shared_ptr<Connection>> targets;
    {
        std::shared_lock lock(registry_mutex_);
        for (const auto& [id, conn] : connections_) {
            if (conn->state() == ConnectionState::Ready) {
                targets.push_back(conn);
            }
        }
    }

    const Json params = state.to_json();
    for (const auto& conn : targets) {
        auto sent = co_await conn->notify(std::string(method::sandbox_state), params);
        if (!sent.has_value()) {
            get_logger().warn_fmt("[{}] sandbox state not delivered: {}", conn->id(), sent.error().message);
        }
    }
}

void Manager::deliver_notification(
    const std::shared_ptr<Observers>& observers,
    const std::shared_ptr<ToolCache>& cache,
    const std::string& server_id,
    const std::string& method,
    const Json& params
) {
    // Connections re-discover on their own.
    if (method == method::tools_list_changed) {
        return;
    }

    if ((method == method::sandbox_state) || (method == method::sandbox_state_alias)) {
        cache->mark_stale(server_id);
        const auto state = SandboxState::from_json(params);
        get_logger().info_fmt("[{}] sandbox state: enabled={} policy='{}'", server_id, state.enabled, state.policy);

        std::vector<SandboxStateObserver> callbacks;
        {
            std::lock_guard<std::mutex> lock(observers->mutex);
            callbacks = observers->sandbox;
        }
        for (const auto& callback : callbacks) {
            callback(server_id, state);
        }
        return;
    }

    std::vector<NotificationObserver> callbacks;
    {
        std::lock_guard<std::mutex> lock(observers->mutex);
        callbacks = observers->notification;
    }
    for (const auto& callback : callbacks) {
        callback(server_id, method, params);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Introspection
// ═══════════════════════════════════════════════════════════════════════════

std::vector<std::string> Manager::server_ids() const {
    std::shared_lock lock(registry_mutex_);
    std::vector<std::string> ids;
    ids.reserve(connections_.size());
    for (const auto& [id, conn] : connections_) {
        ids.push_back(id);
    }
    return ids;
}

std::optional<ConnectionState> Manager::state(const std::string& server_id) const {
    auto conn = find(server_id);
    if (conn == nullptr) {
        return std::nullopt;
    }
    return conn->state();
}

ServerHealth Manager::server_health(const std::string& server_id) const {
    auto conn = find(server_id);
    if (conn == nullptr) {
        return ServerHealth::Unknown;
    }
    switch (conn->state()) {
        case ConnectionState::Ready:    return ServerHealth::Healthy;
        case ConnectionState::Degraded: return ServerHealth::Unhealthy;
        case ConnectionState::Disconnected:
        case ConnectionState::Connecting:
        case ConnectionState::Handshaking:
        case ConnectionState::Closed:
            break;
    }
    return ServerHealth::Disconnected;
}

std::optional<Implementation> Manager::server_info(const std::string& server_id) const {
    auto conn = find(server_id);
    if (conn == nullptr) {
        return std::nullopt;
    }
    return conn->server_info();
}

std::shared_ptr<Connection> Manager::connection(const std::string& server_id) const {
    return find(server_id);
}

// ─────────────────────────────────────────────────────────────────────────────
// Observers
// ─────────────────────────────────────────────────────────────────────────────

void Manager::on_sandbox_state(SandboxStateObserver observer) {
    std::lock_guard<std::mutex> lock(observers_->mutex);
    observers_->sandbox.push_back(std::move(observer));
}

void Manager::on_notification(NotificationObserver observer) {
    std::lock_guard<std::mutex> lock(observers_->mutex);
    observers_->notification.push_back(std::move(observer));
}

void Manager::on_state_change(StateObserver observer) {
    std::lock_guard<std::mutex> lock(observers_->mutex);
    observers_->state.push_back(std::move(observer));
}

// ─────────────────────────────────────────────────────────────────────────────
// Registry helpers
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<Connection> Manager::find(const std::string& server_id) const {
    std::shared_lock lock(registry_mutex_);
    auto it = connections_.find(server_id);
    if (it == connections_.end()) {
        return nullptr;
    }
    return it->second;
}

void Manager::remove_if_same(const std::string& server_id, const std::shared_ptr<Connection>& expected) {
    std::unique_lock lock(registry_mutex_);
    auto it = connections_.find(server_id);
    if ((it != connections_.end()) && (it->second == expected)) {
        connections_.erase(it);
    }
}

}  // namespace toolmux
