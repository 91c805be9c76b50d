#pragma once

#include "toolmux/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        Cancelled,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool has_content_type(std::string_view type) const {
        const auto content_type = get_header(headers, "Content-Type");
        if (!content_type.has_value()) {
            return false;
        }
        return content_type->find(type) != std::string::npos;
    }

    [[nodiscard]] bool is_sse() const { return has_content_type("text/event-stream"); }
    [[nodiscard]] bool is_json() const { return has_content_type("application/json"); }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

/// Callbacks for a streamed GET. on_open sees the final status line and
/// headers before the first body byte; returning false from either callback
/// aborts the transfer.
struct HttpStreamHandler {
    std::function<bool(int status, const HeaderMap& headers)> on_open;
    std::function<bool(std::string_view chunk)> on_chunk;
};

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Blocking HTTP primitives. HttpTransport calls them from its worker pool
// and event-stream thread; tests substitute MockHttpClient.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /// scheme://host:port; request paths are appended to it
    virtual void set_base_url(const std::string& url) = 0;
    virtual void set_default_headers(const HeaderMap& headers) = 0;
    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;
    virtual void set_verify_ssl(bool verify) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers = {}
    ) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> del(
        const std::string& path,
        const HeaderMap& headers = {}
    ) = 0;

    /// Long-lived GET. Returns when the server ends the response, the
    /// handler aborts, or cancel() is called. The returned body is empty.
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> stream_get(
        const std::string& path,
        const HeaderMap& headers,
        HttpStreamHandler handler
    ) = 0;

    /// Fails new requests and aborts running streams.
    virtual void cancel() = 0;

    /// Undo cancel() so the client can be reused.
    virtual void reset() = 0;
};

/// cpr-backed implementation
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace toolmux
