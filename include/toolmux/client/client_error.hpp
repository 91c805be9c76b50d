#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Error type returned by Connection and Manager operations.

#include "toolmux/protocol/json_rpc.hpp"
#include "toolmux/transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>

namespace toolmux {

enum class ErrorCode {
    TransportError,    ///< I/O failure, spawn failure, non-2xx HTTP status
    Closed,            ///< Connection closed or lost while the request was pending
    Timeout,           ///< No response before the deadline
    ProtocolError,     ///< Malformed or unexpected reply, failed handshake
    NotFound,          ///< Unknown server id or tool name
    NotReady,          ///< Server known but not Ready
    ToolError,         ///< JSON-RPC error reply or an isError tool result
    Cancelled,         ///< Cancelled by the caller
    AlreadyConnected   ///< connect() on an id that already has a live connection
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::TransportError:   return "TransportError";
        case ErrorCode::Closed:           return "Closed";
        case ErrorCode::Timeout:          return "Timeout";
        case ErrorCode::ProtocolError:    return "ProtocolError";
        case ErrorCode::NotFound:         return "NotFound";
        case ErrorCode::NotReady:         return "NotReady";
        case ErrorCode::ToolError:        return "ToolError";
        case ErrorCode::Cancelled:        return "Cancelled";
        case ErrorCode::AlreadyConnected: return "AlreadyConnected";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code;
    std::string message;
    std::optional<JsonRpcError> rpc_error;  ///< Original error reply from the server
    std::optional<Json> data;               ///< e.g. the full tool result for ToolError

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static Error transport(std::string msg) {
        return {ErrorCode::TransportError, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static Error closed(std::string msg = "Connection closed") {
        return {ErrorCode::Closed, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static Error timeout(std::string msg = "Request timed out") {
        return {ErrorCode::Timeout, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static Error protocol(std::string msg) {
        return {ErrorCode::ProtocolError, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static Error not_found(std::string msg) {
        return {ErrorCode::NotFound, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static Error not_ready(std::string msg) {
        return {ErrorCode::NotReady, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static Error tool_error(std::string msg, std::optional<Json> result = std::nullopt) {
        return {ErrorCode::ToolError, std::move(msg), std::nullopt, std::move(result)};
    }

    [[nodiscard]] static Error cancelled() {
        return {ErrorCode::Cancelled, "Request was cancelled", std::nullopt, std::nullopt};
    }

    [[nodiscard]] static Error already_connected(const std::string& server_id) {
        return {ErrorCode::AlreadyConnected, "Server '" + server_id + "' is already connected", std::nullopt, std::nullopt};
    }

    [[nodiscard]] static Error from_rpc_error(const JsonRpcError& err) {
        return {ErrorCode::ToolError, err.message, err, err.data};
    }

    /// Closed stays Closed, Timeout stays Timeout, everything else is a
    /// TransportError carrying the original message.
    [[nodiscard]] static Error from_transport(const TransportError& err) {
        switch (err.category) {
            case TransportError::Category::Closed:
                return closed(err.message);
            case TransportError::Category::Timeout:
                return timeout(err.message);
            case TransportError::Category::Network:
            case TransportError::Category::Protocol:
                break;
        }
        Error error = transport(err.message);
        if (err.status_code.has_value()) {
            error.data = Json{{"status", *err.status_code}};
        }
        return error;
    }
};

template <typename T>
using Result = tl::expected<T, Error>;

}  // namespace toolmux
