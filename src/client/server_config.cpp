#include "toolmux/client/server_config.hpp"
#include "toolmux/transport/http_types.hpp"

#include <type_traits>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionOptions builders
// ─────────────────────────────────────────────────────────────────────────────

ConnectionOptions& ConnectionOptions::with_client_info(std::string name, std::string version) {
    client_info = Implementation{std::move(name), std::move(version)};
    return *this;
}

ConnectionOptions& ConnectionOptions::with_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout = timeout;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_handshake_timeout(std::chrono::milliseconds timeout) {
    handshake_timeout = timeout;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_max_attempts(std::size_t attempts) {
    reconnect.max_attempts = attempts;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_backoff(BackoffConfig backoff) {
    reconnect.backoff = backoff;
    reconnect.policy = nullptr;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_backoff_policy(BackoffFactory factory) {
    reconnect.policy = std::move(factory);
    return *this;
}

ConnectionOptions& ConnectionOptions::with_health(HealthConfig config) {
    health = config;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_framing(FramingMode framing) {
    transport.framing = framing;
    return *this;
}

ConnectionOptions& ConnectionOptions::with_stderr(StderrHandling handling) {
    transport.stderr_handling = handling;
    return *this;
}

ManagerConfig& ManagerConfig::with_defaults(ConnectionOptions options) {
    defaults = std::move(options);
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// ServerConfig
// ─────────────────────────────────────────────────────────────────────────────

namespace {

template <typename Map>
Result<Map> string_map(const Json& j, const char* field) {
    Map out;
    if (!j.contains(field) || j[field].is_null()) {
        return out;
    }
    if (j[field].is_object() == false) {
        return tl::unexpected(Error::protocol(std::string("'") + field + "' must be an object"));
    }
    for (const auto& [key, value] : j[field].items()) {
        if (!value.is_string()) {
            return tl::unexpected(Error::protocol(std::string("'") + field + "." + key + "' must be a string"));
        }
        out[key] = value.get<std::string>();
    }
    return out;
}

Result<std::string> transport_kind(const Json& j) {
    if (j.contains("transport")) {
        if (j["transport"].is_string() == false) {
            return tl::unexpected(Error::protocol("'transport' must be a string"));
        }
        return j["transport"].get<std::string>();
    }
    if (j.contains("command")) {
        return std::string("spawn");
    }
    if (j.contains("socket") || j.contains("path")) {
        return std::string("socket");
    }
    if (j.contains("url")) {
        return std::string("http");
    }
    return tl::unexpected(Error::protocol("Server entry names no transport (command, socket or url)"));
}

}  // namespace

Result<void> ServerConfig::validate() const {
    if (id.empty()) {
        return tl::unexpected(Error::protocol("Server id must not be empty"));
    }

    return std::visit([this](const auto& target) -> Result<void> {
        using T = std::decay_t<decltype(target)>;
        if constexpr (std::is_same_v<T, SpawnTarget>) {
            if (target.command.empty()) {
                return tl::unexpected(Error::protocol("Server '" + id + "': spawn command is empty"));
            }
        } else if constexpr (std::is_same_v<T, SocketTarget>) {
            if (target.path.empty()) {
                return tl::unexpected(Error::protocol("Server '" + id + "': socket path is empty"));
            }
        } else {
            if (!parse_url(target.url).has_value()) {
                return tl::unexpected(Error::protocol("Server '" + id + "': invalid URL '" + target.url + "'"));
            }
        }
        return {};
    }, transport);
}

Result<ServerConfig> ServerConfig::from_json(const Json& j) {
    if (!j.is_object()) {
        return tl::unexpected(Error::protocol("Server entry must be an object"));
    }
    if (!j.contains("id") || (j["id"].is_string() == false)) {
        return tl::unexpected(Error::protocol("Server entry needs a string 'id'"));
    }

    ServerConfig config;
    config.id = j["id"].get<std::string>();
    if (j.contains("name") && j["name"].is_string()) {
        config.name = j["name"].get<std::string>();
    }

    auto env = string_map<std::map<std::string, std::string>>(j, "env");
    if (!env.has_value()) {
        return tl::unexpected(env.error());
    }
    config.env = std::move(*env);

    auto kind = transport_kind(j);
    if (!kind.has_value()) {
        return tl::unexpected(kind.error());
    }

    if (*kind == "spawn") {
        SpawnTarget target;
        target.command = j.value("command", "");
        if (j.contains("args")) {
            if (j["args"].is_array() == false) {
                return tl::unexpected(Error::protocol("'args' must be an array"));
            }
            for (const auto& arg : j["args"]) {
                if (!arg.is_string()) {
                    return tl::unexpected(Error::protocol("'args' entries must be strings"));
                }
                target.args.push_back(arg.get<std::string>());
            }
        }
        config.transport = std::move(target);
    } else if (*kind == "socket") {
        SocketTarget target;
        target.path = j.contains("socket") ? j.value("socket", "") : j.value("path", "");
        config.transport = std::move(target);
    } else if (*kind == "http") {
        HttpTarget target;
        target.url = j.value("url", "");
        auto headers = string_map<HeaderMap>(j, "headers");
        if (!headers.has_value()) {
            return tl::unexpected(headers.error());
        }
        target.headers = std::move(*headers);
        config.transport = std::move(target);
    } else {
        return tl::unexpected(Error::protocol("Unknown transport '" + *kind + "'"));
    }

    auto valid = config.validate();
    if (!valid.has_value()) {
        return tl::unexpected(valid.error());
    }
    return config;
}

Json ServerConfig::to_json() const {
    Json j = {{"id", id}};
    if (!name.empty()) {
        j["name"] = name;
    }
    if (!env.empty()) {
        j["env"] = env;
    }

    std::visit([&j](const auto& target) {
        using T = std::decay_t<decltype(target)>;
        if constexpr (std::is_same_v<T, SpawnTarget>) {
            j["transport"] = "spawn";
            j["command"] = target.command;
            j["args"] = target.args;
        } else if constexpr (std::is_same_v<T, SocketTarget>) {
            j["transport"] = "socket";
            j["socket"] = target.path;
        } else {
            j["transport"] = "http";
            j["url"] = target.url;
            if (!target.headers.empty()) {
                j["headers"] = target.headers;
            }
        }
    }, transport);
    return j;
}

ServerConfig ServerConfig::spawn(std::string id, std::string command, std::vector<std::string> args) {
    ServerConfig config;
    config.id = std::move(id);
    config.transport = SpawnTarget{std::move(command), std::move(args), {}};
    return config;
}

ServerConfig ServerConfig::socket(std::string id, std::string path) {
    ServerConfig config;
    config.id = std::move(id);
    config.transport = SocketTarget{std::move(path)};
    return config;
}

ServerConfig ServerConfig::http(std::string id, std::string url, HeaderMap headers) {
    ServerConfig config;
    config.id = std::move(id);
    config.transport = HttpTarget{std::move(url), std::move(headers)};
    return config;
}

}  // namespace toolmux
