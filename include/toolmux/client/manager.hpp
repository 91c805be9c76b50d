#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Manager
// ═══════════════════════════════════════════════════════════════════════════
// Registry of Connections keyed by server id, plus the dispatch front door.
//
// Usage:
//   asio::io_context io;
//   toolmux::Manager manager(io.get_executor());
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       auto ok = co_await manager.connect(ServerConfig::spawn("fs", "fs-server"));
//       auto tools = manager.list_tools("fs");
//       auto result = co_await manager.call_tool("fs", "read_file", {{"path", "/etc/hosts"}});
//       co_await manager.shutdown();
//   }, asio::detached);
//
//   io.run();
//
// The registry lock is held only to insert, remove or look up entries,
// never across a suspension point. Connections never share a lock.

#include "toolmux/client/client_error.hpp"
#include "toolmux/client/connection.hpp"
#include "toolmux/client/connection_state.hpp"
#include "toolmux/client/server_config.hpp"
#include "toolmux/client/tool_cache.hpp"
#include "toolmux/protocol/mcp_types.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace toolmux {

/// Coarse health summary for dashboards.
enum class ServerHealth {
    Healthy,       ///< Ready
    Unhealthy,     ///< Degraded
    Disconnected,  ///< connecting, reconnecting, or Closed
    Unknown        ///< id not registered
};

[[nodiscard]] constexpr std::string_view to_string(ServerHealth health) noexcept {
    switch (health) {
        case ServerHealth::Healthy:      return "Healthy";
        case ServerHealth::Unhealthy:    return "Unhealthy";
        case ServerHealth::Disconnected: return "Disconnected";
        case ServerHealth::Unknown:      return "Unknown";
    }
    return "Unknown";
}

/// A tool together with the server that exposes it.
struct ServerTool {
    std::string server_id;
    ToolSchema tool;
};

class Manager {
public:
    using SandboxStateObserver = std::function<void(const std::string& server_id, const SandboxState& state)>;
    using NotificationObserver = std::function<void(const std::string& server_id, const std::string& method, const Json& params)>;
    using StateObserver = std::function<void(const std::string& server_id, ConnectionState old_state, ConnectionState new_state)>;

    explicit Manager(asio::any_io_executor executor, ManagerConfig config = {});

    /// Custom transport construction, e.g. in-memory transports in tests.
    Manager(asio::any_io_executor executor, ManagerConfig config, TransportFactory factory);

    /// Asks every remaining connection to close without waiting for it.
    /// Call shutdown() first for an orderly stop.
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;
    Manager(Manager&&) = delete;
    Manager& operator=(Manager&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Completes once the server is Ready, or with the last failure after the
    /// reconnect policy gave up (the entry is then removed).
    /// AlreadyConnected if a connection that is not Closed exists for the id.
    [[nodiscard]] asio::awaitable<Result<void>> connect(ServerConfig config);

    /// Idempotent.
    [[nodiscard]] asio::awaitable<void> disconnect(const std::string& server_id);

    /// Close every connection. Every pending request is resolved first.
    [[nodiscard]] asio::awaitable<void> shutdown();

    // ─────────────────────────────────────────────────────────────────────────
    // Tools
    // ─────────────────────────────────────────────────────────────────────────

    /// Last discovered snapshot, in discovery order; served while Degraded.
    [[nodiscard]] Result<std::vector<ToolSchema>> list_tools(const std::string& server_id) const;

    [[nodiscard]] asio::awaitable<Result<CallToolResult>> call_tool(
        const std::string& server_id,
        const std::string& tool_name,
        Json arguments = Json::object(),
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// Re-run discovery now instead of waiting for list_changed.
    [[nodiscard]] asio::awaitable<Result<std::vector<ToolSchema>>> refresh_tools(const std::string& server_id);

    /// Every cached tool, servers in id order.
    [[nodiscard]] std::vector<ServerTool> list_all_tools() const;

    /// First server (in id order) exposing `tool_name`.
    [[nodiscard]] std::optional<ServerTool> find_tool(const std::string& tool_name) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Sandbox state
    // ─────────────────────────────────────────────────────────────────────────

    /// Send notifications/sandbox_state to every Ready server. Per-server
    /// failures are logged.
    [[nodiscard]] asio::awaitable<void> notify_sandbox_state(SandboxState state);

    // ─────────────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<std::string> server_ids() const;
    [[nodiscard]] std::optional<ConnectionState> state(const std::string& server_id) const;
    [[nodiscard]] ServerHealth server_health(const std::string& server_id) const;
    [[nodiscard]] std::optional<Implementation> server_info(const std::string& server_id) const;
    [[nodiscard]] std::shared_ptr<Connection> connection(const std::string& server_id) const;

    [[nodiscard]] const ToolCache& tool_cache() const noexcept { return *cache_; }
    [[nodiscard]] const ManagerConfig& config() const noexcept { return config_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Observers
    // ─────────────────────────────────────────────────────────────────────────

    void on_sandbox_state(SandboxStateObserver observer);
    void on_notification(NotificationObserver observer);
    void on_state_change(StateObserver observer);

private:
    // Shared with connections so late notifications outlive the Manager safely.
    struct Observers {
        std::mutex mutex;
        std::vector<SandboxStateObserver> sandbox;
        std::vector<NotificationObserver> notification;
        std::vector<StateObserver> state;
    };

    static void deliver_notification(
        const std::shared_ptr<Observers>& observers,
        const std::shared_ptr<ToolCache>& cache,
        const std::string& server_id,
        const std::string& method,
        const Json& params
    );

    [[nodiscard]] std::shared_ptr<Connection> find(const std::string& server_id) const;
    void remove_if_same(const std::string& server_id, const std::shared_ptr<Connection>& expected);

    asio::any_io_executor executor_;
    ManagerConfig config_;
    TransportFactory factory_;
    std::shared_ptr<ToolCache> cache_;
    std::shared_ptr<Observers> observers_;

    mutable std::shared_mutex registry_mutex_;
    std::map<std::string, std::shared_ptr<Connection>> connections_;
};

}  // namespace toolmux
