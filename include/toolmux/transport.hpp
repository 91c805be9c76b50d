#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Value types shared by every transport and by the connection layer above.
//
// Concrete transports live under toolmux/transport/; the variant that names
// them is toolmux/transport/transport_descriptor.hpp.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <tl/expected.hpp>

namespace toolmux {

using Json = nlohmann::json;
using HeaderMap = std::unordered_map<std::string, std::string>;

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Network,   // I/O failure, non-2xx HTTP status, spawn failure
        Timeout,
        Protocol,  // malformed or oversized frame; the stream stays usable
        Closed     // end of stream: EOF, process exit, peer reset, stopped
    };

    Category category{};
    std::string message;
    std::optional<int> status_code{};

    [[nodiscard]] static TransportError network(std::string msg, std::optional<int> status = std::nullopt) {
        return TransportError{Category::Network, std::move(msg), status};
    }

    [[nodiscard]] static TransportError timeout(std::string msg) {
        return TransportError{Category::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError protocol(std::string msg) {
        return TransportError{Category::Protocol, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError closed(std::string msg = "Transport closed") {
        return TransportError{Category::Closed, std::move(msg), std::nullopt};
    }

    [[nodiscard]] bool is_closed() const noexcept { return category == Category::Closed; }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:  return "Network";
        case TransportError::Category::Timeout:  return "Timeout";
        case TransportError::Category::Protocol: return "Protocol";
        case TransportError::Category::Closed:   return "Closed";
    }
    return "Unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

/// How JSON messages are delimited on byte-stream transports
enum class FramingMode {
    NewlineDelimited,  // one JSON document per line (MCP stdio convention)
    ContentLength      // "Content-Length: N\r\n\r\n" header then N bytes
};

/// Upper bound for a single inbound frame.
inline constexpr std::size_t default_max_message_size = 16 * 1024 * 1024;

}  // namespace toolmux
