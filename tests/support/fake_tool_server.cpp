// ─────────────────────────────────────────────────────────────────────────────
// fake_tool_server
// ─────────────────────────────────────────────────────────────────────────────
// Minimal MCP server used by the process, socket and integration tests.
//
//   fake_tool_server [--framing newline|content-length] [--socket PATH]
//                    [--tools N] [--page-size K] [--stderr-banner]
//                    [--fail-initialize] [--no-initialize-reply] [--ignore-ping]
//
// Tools:
//   echo {text}          text back
//   add {a, b}           sum as text
//   env {name}           value of an environment variable
//   fail                 isError result
//   rpc_error            JSON-RPC error reply
//   slow {ms, text}      reply after `ms`; other requests keep flowing
//   exit {code}          exit without replying
//   change_tools         adds "late_tool" and sends tools/list_changed
//   sandbox {enabled}    emits notifications/sandbox_state, then replies
//   garbage              writes a malformed frame, then replies
//   stray                writes a response with an unknown id, then replies
//   mute_pings {count}   ignore the next `count` pings
//   server_request       sends a request to the client, then replies
//   client_replies       responses the client sent back so far
//   last_sandbox         params of the last sandbox notification received

#include <asio.hpp>
#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using Json = nlohmann::json;

namespace {

struct Options {
    bool content_length{false};
    std::string socket_path;
    int extra_tools{0};
    std::size_t page_size{0};
    bool stderr_banner{false};
    bool fail_initialize{false};
    bool no_initialize_reply{false};
    bool ignore_ping{false};
};

using Writer = std::function<void(const std::string&)>;

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(const Options& options, asio::any_io_executor executor, Writer writer)
        : options_(options), executor_(std::move(executor)), writer_(std::move(writer)) {
        for (const char* name : {"echo", "add", "env", "fail", "rpc_error", "slow", "exit",
                                 "change_tools", "sandbox", "garbage", "stray", "mute_pings",
                                 "server_request", "client_replies", "last_sandbox"}) {
            tools_.push_back(tool(name));
        }
        for (int i = 0; i < options_.extra_tools; ++i) {
            tools_.push_back(tool("tool_" + std::to_string(i)));
        }
    }

    void feed(std::string_view bytes) {
        buffer_.append(bytes);
        while (auto frame = next_frame()) {
            Json message = Json::parse(*frame, nullptr, false);
            if (message.is_discarded()) {
                continue;
            }
            handle(message);
        }
    }

    // Drops replies still waiting on a timer.
    void stop() {
        stopped_ = true;
    }

private:
    static Json tool(const std::string& name) {
        return Json{
            {"name", name},
            {"description", "Test tool " + name},
            {"inputSchema", {{"type", "object"}}}
        };
    }

    static Json text_result(const std::string& text, bool is_error = false) {
        Json result = {{"content", Json::array({{{"type", "text"}, {"text", text}}})}};
        if (is_error) {
            result["isError"] = true;
        }
        return result;
    }

    static Json result_reply(const Json& id, Json result) {
        return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
    }

    static Json error_reply(const Json& id, int code, const std::string& message) {
        return Json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
    }

    // ─────────────────────────────────────────────────────────────────────
    // Framing
    // ─────────────────────────────────────────────────────────────────────

    std::optional<std::string> next_frame() {
        if (options_.content_length == false) {
            for (;;) {
                const auto newline = buffer_.find('\n');
                if (newline == std::string::npos) {
                    return std::nullopt;
                }
                std::string line = buffer_.substr(0, newline);
                buffer_.erase(0, newline + 1);
                if ((line.empty() == false) && (line.back() == '\r')) {
                    line.pop_back();
                }
                if (line.find_first_not_of(" \t") != std::string::npos) {
                    return line;
                }
            }
        }

        const auto header_end = buffer_.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            return std::nullopt;
        }
        std::string headers = buffer_.substr(0, header_end);
        std::transform(headers.begin(), headers.end(), headers.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const auto field = headers.find("content-length:");
        if (field == std::string::npos) {
            buffer_.erase(0, header_end + 4);
            return std::nullopt;
        }
        const std::size_t length = std::strtoul(headers.c_str() + field + 15, nullptr, 10);
        if (buffer_.size() < header_end + 4 + length) {
            return std::nullopt;
        }
        std::string body = buffer_.substr(header_end + 4, length);
        buffer_.erase(0, header_end + 4 + length);
        return body;
    }

    void write_raw(const std::string& bytes) {
        if (!stopped_) {
            writer_(bytes);
        }
    }

    void send(const Json& message) {
        const std::string body = message.dump();
        if (options_.content_length) {
            write_raw("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
        } else {
            write_raw(body + "\n");
        }
    }

    void send_garbage() {
        if (options_.content_length) {
            write_raw("Content-Length: 9\r\n\r\n{not json");
        } else {
            write_raw("{not json\n");
        }
    }

    void send_later(std::chrono::milliseconds delay, Json message) {
        auto timer = std::make_shared<asio::steady_timer>(executor_, delay);
        timer->async_wait([self = shared_from_this(), timer, message = std::move(message)](std::error_code ec) {
            if (!ec) {
                self->send(message);
            }
        });
    }

    // ─────────────────────────────────────────────────────────────────────
    // Dispatch
    // ─────────────────────────────────────────────────────────────────────

    void handle(const Json& message) {
        const bool has_method = message.contains("method");
        const bool has_id = message.contains("id");

        if ((has_method == false) && has_id) {
            client_replies_.push_back(message);
            return;
        }
        if (has_method == false) {
            return;
        }

        const auto method = message["method"].get<std::string>();
        const Json params = message.contains("params") ? message["params"] : Json::object();

        if (has_id == false) {
            if ((method == "notifications/sandbox_state") || (method == "sandbox/state_changed")) {
                last_sandbox_ = params;
            }
            return;
        }

        const auto& id = message["id"];
        if (method == "initialize") {
            if (options_.no_initialize_reply) {
                return;
            }
            if (options_.fail_initialize) {
                send(error_reply(id, -32603, "Initialization refused"));
                return;
            }
            send(result_reply(id, Json{
                {"protocolVersion", params.value("protocolVersion", "2024-11-05")},
                {"capabilities", {{"tools", {{"listChanged", true}}}}},
                {"serverInfo", {{"name", "fake-tool-server"}, {"version", "1.0.0"}}}
            }));
        } else if (method == "ping") {
            if (options_.ignore_ping) {
                return;
            }
            if (muted_pings_ > 0) {
                --muted_pings_;
                return;
            }
            send(result_reply(id, Json::object()));
        } else if (method == "tools/list") {
            list_tools(id, params);
        } else if (method == "tools/call") {
            call_tool(id, params.value("name", ""), params.contains("arguments") ? params["arguments"] : Json::object());
        } else {
            send(error_reply(id, -32601, "Method not found: " + method));
        }
    }

    void list_tools(const Json& id, const Json& params) {
        std::size_t start = 0;
        if (params.contains("cursor") && params["cursor"].is_string()) {
            start = std::strtoul(params["cursor"].get<std::string>().c_str(), nullptr, 10);
        }
        const std::size_t size = (options_.page_size == 0) ? tools_.size() : options_.page_size;
        const std::size_t end = std::min(tools_.size(), start + size);

        Json page = Json::array();
        for (std::size_t i = start; i < end; ++i) {
            page.push_back(tools_[i]);
        }
        Json result = {{"tools", page}};
        if (end < tools_.size()) {
            result["nextCursor"] = std::to_string(end);
        }
        send(result_reply(id, std::move(result)));
    }

    void call_tool(const Json& id, const std::string& name, const Json& args) {
        if (name == "echo") {
            send(result_reply(id, text_result(args.value("text", ""))));
        } else if (name == "add") {
            const double sum = args.value("a", 0.0) + args.value("b", 0.0);
            send(result_reply(id, text_result(Json(sum).dump())));
        } else if (name == "env") {
            const char* value = std::getenv(args.value("name", "").c_str());
            send(result_reply(id, text_result(value ? value : "")));
        } else if (name == "fail") {
            send(result_reply(id, text_result(args.value("message", "tool failed"), true)));
        } else if (name == "rpc_error") {
            send(error_reply(id, -32602, args.value("message", "invalid arguments")));
        } else if (name == "slow") {
            const auto delay = std::chrono::milliseconds(args.value("ms", 100));
            send_later(delay, result_reply(id, text_result(args.value("text", "slow"))));
        } else if (name == "exit") {
            std::_Exit(args.value("code", 3));
        } else if (name == "change_tools") {
            tools_.push_back(tool("late_tool"));
            send(Json{{"jsonrpc", "2.0"}, {"method", "notifications/tools/list_changed"}});
            send(result_reply(id, text_result("changed")));
        } else if (name == "sandbox") {
            send(Json{{"jsonrpc", "2.0"}, {"method", "notifications/sandbox_state"},
                      {"params", {{"enabled", args.value("enabled", true)}, {"policy", "workspace-write"}}}});
            send(result_reply(id, text_result("sandbox")));
        } else if (name == "garbage") {
            send_garbage();
            send(result_reply(id, text_result("after garbage")));
        } else if (name == "stray") {
            send(result_reply(Json(987654), Json::object()));
            send(result_reply(id, text_result("after stray")));
        } else if (name == "mute_pings") {
            muted_pings_ = args.value("count", 1);
            send(result_reply(id, text_result("muted")));
        } else if (name == "server_request") {
            send(Json{{"jsonrpc", "2.0"}, {"id", "srv-" + std::to_string(++server_requests_)}, {"method", "ping"}});
            send(Json{{"jsonrpc", "2.0"}, {"id", "srv-" + std::to_string(++server_requests_)},
                      {"method", "roots/list"}, {"params", Json::object()}});
            send(result_reply(id, text_result("sent")));
        } else if (name == "client_replies") {
            send(result_reply(id, Json{{"content", Json::array()}, {"structuredContent", {{"replies", client_replies_}}}}));
        } else if (name == "last_sandbox") {
            send(result_reply(id, Json{{"content", Json::array()}, {"structuredContent", last_sandbox_}}));
        } else {
            const auto known = std::find_if(tools_.begin(), tools_.end(),
                [&](const Json& t) { return t["name"] == name; });
            if (known == tools_.end()) {
                send(error_reply(id, -32602, "Unknown tool: " + name));
                return;
            }
            send(result_reply(id, text_result(name)));
        }
    }

    const Options& options_;
    asio::any_io_executor executor_;
    Writer writer_;
    bool stopped_{false};
    std::string buffer_;
    std::vector<Json> tools_;
    Json client_replies_ = Json::array();
    Json last_sandbox_ = Json::object();
    int muted_pings_{0};
    int server_requests_{0};
};

// Feeds everything read from `in` to the session until the peer closes.
template <typename Stream>
asio::awaitable<void> pump(std::shared_ptr<Session> session, Stream& in) {
    std::array<char, 4096> chunk{};
    for (;;) {
        auto [ec, n] = co_await in.async_read_some(asio::buffer(chunk), asio::as_tuple(asio::use_awaitable));
        if (ec) {
            break;
        }
        session->feed(std::string_view(chunk.data(), n));
    }
    session->stop();
}

// One client at a time, like a stdio server that gets restarted.
asio::awaitable<void> serve_socket(const Options& options) {
    auto executor = co_await asio::this_coro::executor;

    ::unlink(options.socket_path.c_str());
    asio::local::stream_protocol::acceptor acceptor(executor,
        asio::local::stream_protocol::endpoint(options.socket_path));

    for (;;) {
        auto [ec, socket] = co_await acceptor.async_accept(asio::as_tuple(asio::use_awaitable));
        if (ec) {
            break;
        }
        auto client = std::make_shared<asio::local::stream_protocol::socket>(std::move(socket));
        auto session = std::make_shared<Session>(options, executor, [client](const std::string& bytes) {
            std::error_code write_error;
            asio::write(*client, asio::buffer(bytes), write_error);
        });
        co_await pump(session, *client);
    }
}

asio::awaitable<void> serve_stdio(const Options& options) {
    auto executor = co_await asio::this_coro::executor;

    asio::posix::stream_descriptor in(executor, ::dup(STDIN_FILENO));
    auto out = std::make_shared<asio::posix::stream_descriptor>(executor, ::dup(STDOUT_FILENO));
    auto session = std::make_shared<Session>(options, executor, [out](const std::string& bytes) {
        std::error_code write_error;
        asio::write(*out, asio::buffer(bytes), write_error);
    });
    co_await pump(session, in);
}

}  // namespace

int main(int argc, char** argv) {
    cxxopts::Options cli("fake_tool_server", "Scripted MCP server for the toolmux tests");

    cli.add_options()
        ("framing", "newline or content-length", cxxopts::value<std::string>()->default_value("newline"))
        ("socket", "Serve on a Unix socket at this path instead of stdio", cxxopts::value<std::string>())
        ("tools", "Extra tools to advertise (tool_0 ...)", cxxopts::value<int>()->default_value("0"))
        ("page-size", "tools/list page size, 0 for a single page", cxxopts::value<std::size_t>()->default_value("0"))
        ("stderr-banner", "Write a line to stderr on startup")
        ("fail-initialize", "Answer initialize with an error")
        ("no-initialize-reply", "Never answer initialize")
        ("ignore-ping", "Never answer ping")
        ("h,help", "Print usage");

    Options options;
    try {
        auto result = cli.parse(argc, argv);
        if (result.count("help")) {
            std::cout << cli.help() << "\n";
            return 0;
        }

        options.content_length = (result["framing"].as<std::string>() == "content-length");
        if (result.count("socket")) {
            options.socket_path = result["socket"].as<std::string>();
        }
        options.extra_tools = result["tools"].as<int>();
        options.page_size = result["page-size"].as<std::size_t>();
        options.stderr_banner = result.count("stderr-banner") > 0;
        options.fail_initialize = result.count("fail-initialize") > 0;
        options.no_initialize_reply = result.count("no-initialize-reply") > 0;
        options.ignore_ping = result.count("ignore-ping") > 0;
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    std::signal(SIGPIPE, SIG_IGN);

    if (options.stderr_banner) {
        std::cerr << "fake_tool_server ready" << std::endl;
    }

    asio::io_context io;
    int exit_code = 0;
    auto on_done = [&](std::exception_ptr error) {
        if (error) {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                std::cerr << "fake_tool_server: " << e.what() << "\n";
                exit_code = 1;
            }
        }
        io.stop();
    };

    if (options.socket_path.empty()) {
        asio::co_spawn(io, serve_stdio(options), on_done);
    } else {
        asio::co_spawn(io, serve_socket(options), on_done);
    }
    io.run();
    return exit_code;
}
