#include "toolmux/transport/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace toolmux {

std::optional<UrlComponents> parse_url(std::string_view url) {
    auto parsed = ada::parse<ada::url_aggregator>(url);
    if (!parsed.has_value()) {
        return std::nullopt;
    }

    std::string_view protocol = parsed->get_protocol();  // "https:"
    if (!protocol.empty() && (protocol.back() == ':')) {
        protocol.remove_suffix(1);
    }
    const bool is_https = (protocol == "https");
    if ((protocol != "http") && !is_https) {
        return std::nullopt;
    }

    UrlComponents out;
    out.scheme = std::string(protocol);
    out.host = std::string(parsed->get_hostname());
    if (out.host.empty()) {
        return std::nullopt;
    }

    const std::string_view port = parsed->get_port();
    if (port.empty()) {
        out.port = is_https ? 443 : 80;
    } else {
        const auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), out.port);
        if ((ec != std::errc{}) || (end != port.data() + port.size())) {
            return std::nullopt;
        }
    }

    out.path = std::string(parsed->get_pathname());
    if (out.path.empty()) {
        out.path = "/";
    }
    out.query = std::string(parsed->get_search());
    return out;
}

}  // namespace toolmux
