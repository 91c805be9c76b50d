#include "toolmux/protocol/json_rpc.hpp"

namespace toolmux {
namespace {

bool is_structured(const Json& node) {
    return node.is_object() || node.is_array();
}

RpcResult<void> check_envelope(const Json& payload) {
    if (!payload.is_object()) {
        return tl::unexpected(RpcFormatError{
            RpcFormatError::Code::InvalidParams,
            "payload must be a JSON object"});
    }

    const auto version = payload.find("jsonrpc");
    if (version == payload.end()) {
        return tl::unexpected(RpcFormatError{
            RpcFormatError::Code::MissingField,
            "missing jsonrpc version field"});
    }
    if (!version->is_string() || (version->get<std::string>() != kJsonRpcVersion)) {
        return tl::unexpected(RpcFormatError{
            RpcFormatError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }
    return {};
}

RpcResult<std::string> method_of(const Json& payload) {
    const auto method = payload.find("method");
    if (method == payload.end()) {
        return tl::unexpected(RpcFormatError{
            RpcFormatError::Code::MissingField,
            "missing method field"});
    }
    if (!method->is_string()) {
        return tl::unexpected(RpcFormatError{
            RpcFormatError::Code::InvalidParams,
            "method must be a string"});
    }
    return method->get<std::string>();
}

RpcResult<std::optional<Json>> params_of(const Json& payload) {
    const auto params = payload.find("params");
    if (params == payload.end()) {
        return std::optional<Json>{};
    }
    if (!is_structured(*params)) {
        return tl::unexpected(RpcFormatError{
            RpcFormatError::Code::InvalidParams,
            "params must be an object or array"});
    }
    return std::optional<Json>{*params};
}

}  // namespace

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& v) { return Json(v); }, value);
}

JsonRpcRequest::JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::integer(id), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id_.to_json()},
        {"method", method_}
    };
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

RpcResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (!envelope.has_value()) {
        return tl::unexpected(envelope.error());
    }
    auto method = method_of(payload);
    if (!method.has_value()) {
        return tl::unexpected(method.error());
    }

    const auto id_node = payload.find("id");
    if (id_node == payload.end()) {
        return tl::unexpected(RpcFormatError{
            RpcFormatError::Code::InvalidId,
            "missing id field"});
    }
    JsonRpcId id;
    if (id_node->is_number_integer()) {
        id = JsonRpcId::integer(id_node->get<std::int64_t>());
    } else if (id_node->is_string()) {
        id = JsonRpcId::string(id_node->get<std::string>());
    } else {
        return tl::unexpected(RpcFormatError{
            RpcFormatError::Code::InvalidId,
            "id must be an integer or string"});
    }

    auto params = params_of(payload);
    if (!params.has_value()) {
        return tl::unexpected(params.error());
    }
    return JsonRpcRequest(std::move(*method), std::move(id), std::move(*params));
}

JsonRpcNotification::JsonRpcNotification(std::string method, std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = {
        {"jsonrpc", kJsonRpcVersion},
        {"method", method_}
    };
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

RpcResult<JsonRpcNotification> JsonRpcNotification::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (!envelope.has_value()) {
        return tl::unexpected(envelope.error());
    }
    auto method = method_of(payload);
    if (!method.has_value()) {
        return tl::unexpected(method.error());
    }
    auto params = params_of(payload);
    if (!params.has_value()) {
        return tl::unexpected(params.error());
    }
    return JsonRpcNotification(std::move(*method), std::move(*params));
}

Json JsonRpcError::to_json() const {
    Json payload = {
        {"code", code},
        {"message", message}
    };
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

RpcResult<JsonRpcError> JsonRpcError::from_json(const Json& payload) {
    if (!payload.is_object()) {
        return tl::unexpected(RpcFormatError{
            RpcFormatError::Code::InvalidParams,
            "error must be a JSON object"});
    }
    const auto code = payload.find("code");
    if ((code == payload.end()) || !code->is_number_integer()) {
        return tl::unexpected(RpcFormatError{
            RpcFormatError::Code::MissingField,
            "error.code must be an integer"});
    }

    JsonRpcError error;
    error.code = code->get<std::int64_t>();
    error.message = payload.value("message", std::string{});
    if (payload.contains("data")) {
        error.data = payload.at("data");
    }
    return error;
}

MessageKind classify_message(const Json& message) noexcept {
    if (!message.is_object()) {
        return MessageKind::Invalid;
    }
    const bool has_method = message.contains("method") && message.at("method").is_string();
    const bool has_id = message.contains("id") && !message.at("id").is_null();

    if (has_method && has_id) {
        return MessageKind::Request;
    }
    if (has_method) {
        return MessageKind::Notification;
    }
    if (has_id) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

std::optional<std::uint64_t> response_id(const Json& message) noexcept {
    if (!message.is_object()) {
        return std::nullopt;
    }
    const auto id = message.find("id");
    if (id == message.end()) {
        return std::nullopt;
    }
    if (id->is_number_unsigned()) {
        return id->get<std::uint64_t>();
    }
    if (id->is_number_integer() && id->get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(id->get<std::int64_t>());
    }
    return std::nullopt;
}

Json make_result_response(const Json& id, Json result) {
    return Json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", std::move(result)}
    };
}

Json make_error_response(const Json& id, const JsonRpcError& error) {
    return Json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", error.to_json()}
    };
}

}  // namespace toolmux
