#include "toolmux/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <atomic>
#include <cstdint>

namespace toolmux {

namespace {

// "HTTP/1.1 200 OK" -> 200
std::optional<int> status_from_line(std::string_view line) {
    if (line.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }
    const auto space = line.find(' ');
    if ((space == std::string_view::npos) || (line.size() < space + 4)) {
        return std::nullopt;
    }
    int status = 0;
    for (std::size_t i = space + 1; i < space + 4; ++i) {
        const char c = line[i];
        if ((c < '0') || (c > '9')) {
            return std::nullopt;
        }
        status = status * 10 + (c - '0');
    }
    return status;
}

std::string_view trim_crlf(std::string_view text) {
    while (!text.empty() && ((text.back() == '\r') || (text.back() == '\n'))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────

class CprHttpClient : public IHttpClient {
public:
    void set_base_url(const std::string& url) override { base_url_ = url; }
    void set_default_headers(const HeaderMap& headers) override { default_headers_ = headers; }
    void set_connect_timeout(std::chrono::milliseconds timeout) override { connect_timeout_ = timeout; }
    void set_read_timeout(std::chrono::milliseconds timeout) override { read_timeout_ = timeout; }
    void set_verify_ssl(bool verify) override { verify_ssl_ = verify; }

    HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers
    ) override {
        if (cancelled_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        auto request_headers = build_headers(headers);
        request_headers["Content-Type"] = content_type;

        auto response = cpr::Post(
            cpr::Url{base_url_ + path},
            request_headers,
            cpr::Body{body},
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> del(
        const std::string& path,
        const HeaderMap& headers
    ) override {
        if (cancelled_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        auto response = cpr::Delete(
            cpr::Url{base_url_ + path},
            build_headers(headers),
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> stream_get(
        const std::string& path,
        const HeaderMap& headers,
        HttpStreamHandler handler
    ) override {
        if (cancelled_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        int status = 0;
        HeaderMap received;
        bool opened = false;
        bool aborted = false;

        auto on_header = [&](auto line, intptr_t) -> bool {
            const auto text = trim_crlf(std::string_view(line));
            if (const auto code = status_from_line(text)) {
                status = *code;  // new response (redirect or 100-continue)
                received.clear();
                return true;
            }
            const auto colon = text.find(':');
            if (colon != std::string_view::npos) {
                auto value = text.substr(colon + 1);
                while (!value.empty() && (value.front() == ' ')) {
                    value.remove_prefix(1);
                }
                received[std::string(text.substr(0, colon))] = std::string(value);
            }
            return true;
        };

        auto on_body = [&](auto data, intptr_t) -> bool {
            if (cancelled_.load()) {
                aborted = true;
                return false;
            }
            if (!opened) {
                opened = true;
                if (handler.on_open && !handler.on_open(status, received)) {
                    aborted = true;
                    return false;
                }
            }
            if (handler.on_chunk && (handler.on_chunk(std::string_view(data)) == false)) {
                aborted = true;
                return false;
            }
            return true;
        };

        // Fires roughly once per second even while the stream is idle, so
        // cancel() interrupts a quiet stream.
        auto on_progress = [&](auto, auto, auto, auto, intptr_t) -> bool {
            return !cancelled_.load();
        };

        auto response = cpr::Get(
            cpr::Url{base_url_ + path},
            build_headers(headers),
            cpr::ConnectTimeout{connect_timeout_},
            cpr::VerifySsl{verify_ssl_},
            cpr::HeaderCallback{on_header},
            cpr::WriteCallback{on_body},
            cpr::ProgressCallback{on_progress}
        );

        if (aborted || cancelled_.load()) {
            if (cancelled_.load()) {
                return tl::unexpected(HttpClientError::cancelled());
            }
            HttpClientResponse partial;
            partial.status_code = status;
            partial.headers = std::move(received);
            return partial;
        }
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.headers = std::move(received);
        return result;
    }

    void cancel() override { cancelled_.store(true); }
    void reset() override { cancelled_.store(false); }

private:
    cpr::Header build_headers(const HeaderMap& extra_headers) const {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : default_headers_) {
            cpr_headers[name] = value;
        }
        for (const auto& [name, value] : extra_headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) const {
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        if (error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            return HttpClientError::timeout(msg);
        }
        const bool tls_failure = (error.code == cpr::ErrorCode::SSL_CONNECT_ERROR)
            || (msg.find("SSL") != std::string::npos)
            || (msg.find("certificate") != std::string::npos);
        if (tls_failure) {
            return HttpClientError::ssl_error(msg);
        }
        return HttpClientError::connection_failed(msg);
    }

    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds read_timeout_{60000};
    bool verify_ssl_{true};

    std::atomic<bool> cancelled_{false};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace toolmux
