#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Descriptors
// ═══════════════════════════════════════════════════════════════════════════
// The closed set of ways toolmux can reach a server, and the factory that
// turns one into a live IAsyncTransport.

#include "toolmux/transport.hpp"
#include "toolmux/transport/async_transport.hpp"

#include <asio/any_io_executor.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace toolmux {

/// Child process speaking MCP over stdin/stdout.
struct SpawnTarget {
    std::string command;                       // resolved through PATH
    std::vector<std::string> args;
    std::map<std::string, std::string> env;    // added to the inherited environment

    bool operator==(const SpawnTarget&) const = default;
};

/// Unix domain stream socket.
struct SocketTarget {
    std::string path;

    bool operator==(const SocketTarget&) const = default;
};

/// Streamable HTTP endpoint.
struct HttpTarget {
    std::string url;
    HeaderMap headers;

    bool operator==(const HttpTarget&) const = default;
};

using TransportDescriptor = std::variant<SpawnTarget, SocketTarget, HttpTarget>;

[[nodiscard]] std::string describe(const TransportDescriptor& descriptor);

enum class StderrHandling {
    Discard,      // /dev/null
    Passthrough,  // inherit the parent's stderr
    Capture       // buffered, see ProcessTransport::captured_stderr()
};

struct TransportOptions {
    FramingMode framing{FramingMode::NewlineDelimited};
    std::size_t max_message_size{default_max_message_size};
    StderrHandling stderr_handling{StderrHandling::Passthrough};

    /// Applied on top of SpawnTarget::env
    std::map<std::string, std::string> env_overrides;

    /// SIGTERM to SIGKILL grace period for spawned servers
    std::chrono::milliseconds shutdown_grace{std::chrono::seconds(2)};

    std::chrono::milliseconds http_connect_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds http_request_timeout{std::chrono::seconds(60)};
};

/// Builds the transport for `descriptor`; nothing is opened until async_start.
[[nodiscard]] std::unique_ptr<IAsyncTransport> make_transport(
    asio::any_io_executor executor,
    const TransportDescriptor& descriptor,
    const TransportOptions& options
);

}  // namespace toolmux
