#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace toolmux {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// Standard JSON-RPC 2.0 error codes
namespace rpc_code {
inline constexpr std::int64_t parse_error      = -32700;
inline constexpr std::int64_t invalid_request  = -32600;
inline constexpr std::int64_t method_not_found = -32601;
inline constexpr std::int64_t invalid_params   = -32602;
inline constexpr std::int64_t internal_error   = -32603;
}  // namespace rpc_code

struct RpcFormatError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using RpcResult = tl::expected<T, RpcFormatError>;

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] Json to_json() const;
};

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static RpcResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static RpcResult<JsonRpcNotification> from_json(const Json& payload);

private:
    std::string method_;
    std::optional<Json> params_;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static RpcResult<JsonRpcError> from_json(const Json& payload);
};

// ─────────────────────────────────────────────────────────────────────────────
// Envelope inspection
// ─────────────────────────────────────────────────────────────────────────────

enum class MessageKind {
    Request,       // method + id
    Response,      // id, no method
    Notification,  // method, no id
    Invalid
};

[[nodiscard]] MessageKind classify_message(const Json& message) noexcept;

/// Correlation id of a response, when it is one toolmux could have issued.
/// Ids sent by toolmux are non-negative integers; anything else yields nullopt.
[[nodiscard]] std::optional<std::uint64_t> response_id(const Json& message) noexcept;

[[nodiscard]] Json make_result_response(const Json& id, Json result);
[[nodiscard]] Json make_error_response(const Json& id, const JsonRpcError& error);

}  // namespace toolmux
