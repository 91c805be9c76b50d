#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server & Connection Configuration
// ═══════════════════════════════════════════════════════════════════════════

#include "toolmux/client/client_error.hpp"
#include "toolmux/protocol/mcp_types.hpp"
#include "toolmux/resilience/health_monitor.hpp"
#include "toolmux/transport/backoff_policy.hpp"
#include "toolmux/transport/transport_descriptor.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// Reconnect Policy
// ─────────────────────────────────────────────────────────────────────────────

/// Builds one backoff per Connection, so stateful policies are never shared.
using BackoffFactory = std::function<std::unique_ptr<IBackoffPolicy>()>;

struct ReconnectPolicy {
    /// Connection attempts before giving up (the first one included).
    /// 0 = keep trying forever. The count restarts whenever Ready is reached.
    std::size_t max_attempts{5};

    BackoffConfig backoff{};

    /// Override the backoff entirely, e.g. NoBackoff in tests.
    BackoffFactory policy;

    [[nodiscard]] bool exhausted(std::size_t attempts) const noexcept {
        return (max_attempts != 0) && (attempts >= max_attempts);
    }

    [[nodiscard]] std::unique_ptr<IBackoffPolicy> make_policy() const {
        if (policy) {
            return policy();
        }
        return std::make_unique<ExponentialBackoff>(backoff);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Connection Options
// ─────────────────────────────────────────────────────────────────────────────

struct ConnectionOptions {
    Implementation client_info{"toolmux", "0.1.0"};

    /// Default deadline for call_tool and other user requests
    std::chrono::milliseconds request_timeout{std::chrono::seconds(60)};

    /// Deadline for initialize and each tools/list page
    std::chrono::milliseconds handshake_timeout{std::chrono::seconds(15)};

    ReconnectPolicy reconnect;
    HealthConfig health;
    TransportOptions transport;

    // Builder-style helpers:
    //   opts.with_request_timeout(5s).with_max_attempts(0)

    ConnectionOptions& with_client_info(std::string name, std::string version);
    ConnectionOptions& with_request_timeout(std::chrono::milliseconds timeout);
    ConnectionOptions& with_handshake_timeout(std::chrono::milliseconds timeout);
    ConnectionOptions& with_max_attempts(std::size_t attempts);
    ConnectionOptions& with_backoff(BackoffConfig backoff);
    ConnectionOptions& with_backoff_policy(BackoffFactory factory);

    template <typename Policy, typename... Args>
    ConnectionOptions& with_backoff_policy(Args... args) {
        return with_backoff_policy([=]() -> std::unique_ptr<IBackoffPolicy> {
            return std::make_unique<Policy>(args...);
        });
    }
    ConnectionOptions& with_health(HealthConfig health);
    ConnectionOptions& with_framing(FramingMode framing);
    ConnectionOptions& with_stderr(StderrHandling handling);
};

// ─────────────────────────────────────────────────────────────────────────────
// Server Config
// ─────────────────────────────────────────────────────────────────────────────

struct ServerConfig {
    std::string id;
    std::string name;
    TransportDescriptor transport;

    /// Applied on top of SpawnTarget::env; ignored by other transports
    std::map<std::string, std::string> env;

    /// Replaces ManagerConfig::defaults for this server
    std::optional<ConnectionOptions> options;

    [[nodiscard]] const std::string& display_name() const noexcept {
        return name.empty() ? id : name;
    }

    [[nodiscard]] Result<void> validate() const;

    /// Accepted shapes:
    ///   {"id": "fs", "name": "Files", "command": "fs-server", "args": [...], "env": {...}}
    ///   {"id": "db", "socket": "/run/db.sock"}
    ///   {"id": "web", "url": "https://host/mcp", "headers": {...}}
    /// An explicit "transport": "spawn" | "socket" | "http" is also honored.
    static Result<ServerConfig> from_json(const Json& j);

    /// Inverse of from_json. `options` is not serialized.
    [[nodiscard]] Json to_json() const;

    // Shorthand constructors
    static ServerConfig spawn(std::string id, std::string command, std::vector<std::string> args = {});
    static ServerConfig socket(std::string id, std::string path);
    static ServerConfig http(std::string id, std::string url, HeaderMap headers = {});
};

// ─────────────────────────────────────────────────────────────────────────────
// Manager Config
// ─────────────────────────────────────────────────────────────────────────────

struct ManagerConfig {
    /// Used for every server without its own ServerConfig::options
    ConnectionOptions defaults;

    ManagerConfig& with_defaults(ConnectionOptions options);
};

}  // namespace toolmux
