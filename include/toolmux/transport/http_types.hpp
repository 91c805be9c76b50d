#pragma once

#include "toolmux/transport.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// Case-insensitive header lookup (RFC 7230 field names)
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline bool header_name_equals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

[[nodiscard]] inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = std::ranges::find_if(headers, [&name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ─────────────────────────────────────────────────────────────────────────────
// URL components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port{0};
    std::string path;     // always starts with '/'
    std::string query;    // includes the leading '?', or empty

    [[nodiscard]] bool is_secure() const { return scheme == "https"; }

    /// scheme://host:port
    [[nodiscard]] std::string origin() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }

    [[nodiscard]] std::string path_with_query() const { return path + query; }
};

/// WHATWG URL parsing via ada. Only http and https URLs with a host are
/// accepted.
[[nodiscard]] std::optional<UrlComponents> parse_url(std::string_view url);

}  // namespace toolmux
