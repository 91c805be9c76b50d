// ─────────────────────────────────────────────────────────────────────────────
// Manager Tests
// ─────────────────────────────────────────────────────────────────────────────
// Registry, dispatch and observer behavior against in-memory servers.

#include <catch2/catch_test_macros.hpp>

#include "mocks/scripted_transport.hpp"
#include "support/async_helpers.hpp"

#include "toolmux/client/manager.hpp"

#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <chrono>

#include <map>
#include <tuple>

using namespace toolmux;
using namespace toolmux::testing;
using namespace std::chrono_literals;

namespace {

ConnectionOptions fast_options() {
    ConnectionOptions options;
    options.with_request_timeout(2s)
           .with_handshake_timeout(1s)
           .with_max_attempts(2)
           .with_backoff_policy<NoBackoff>();
    options.health.enabled = false;
    return options;
}

// One ScriptedServer per server id.
struct Farm {
    asio::io_context io;
    std::map<std::string, std::shared_ptr<ScriptedServer>> servers;
    std::unique_ptr<Manager> manager;

    Farm() {
        ManagerConfig config;
        config.with_defaults(fast_options());
        manager = std::make_unique<Manager>(io.get_executor(), config,
            [this](asio::any_io_executor executor, const ServerConfig& server, const TransportOptions& options) {
                return servers.at(server.id)->factory()(std::move(executor), server, options);
            });
    }

    ~Farm() {
        run_sync(io, manager->shutdown());
    }

    std::shared_ptr<ScriptedServer> add(const std::string& id, std::vector<std::string> tools) {
        auto server = std::make_shared<ScriptedServer>();
        server->set_tools(std::move(tools));
        servers[id] = server;
        return server;
    }

    Result<void> connect(const std::string& id) {
        return run_sync(io, manager->connect(ServerConfig::spawn(id, id + "-server")));
    }
};

std::vector<std::string> names(const std::vector<ToolSchema>& tools) {
    std::vector<std::string> out;
    for (const auto& tool : tools) {
        out.push_back(tool.name);
    }
    return out;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Manager connects a server and exposes its tools", "[manager][lifecycle]") {
    Farm farm;
    farm.add("fs", {"read_file", "write_file"});

    REQUIRE(farm.connect("fs").has_value());

    REQUIRE(farm.manager->server_ids() == std::vector<std::string>{"fs"});
    REQUIRE(farm.manager->state("fs") == ConnectionState::Ready);
    REQUIRE(farm.manager->server_health("fs") == ServerHealth::Healthy);
    REQUIRE(farm.manager->server_info("fs")->name == "scripted");

    auto tools = farm.manager->list_tools("fs");
    REQUIRE(tools.has_value());
    REQUIRE(names(*tools) == std::vector<std::string>{"read_file", "write_file"});
}

TEST_CASE("Manager refuses a second connect for a live id", "[manager][lifecycle]") {
    Farm farm;
    auto server = farm.add("fs", {"echo"});
    REQUIRE(farm.connect("fs").has_value());

    auto again = farm.connect("fs");
    REQUIRE(again.has_value() == false);
    REQUIRE(again.error().code == ErrorCode::AlreadyConnected);

    // The first connection is untouched
    REQUIRE(server->transports_created() == 1);
    REQUIRE(farm.manager->state("fs") == ConnectionState::Ready);
}

TEST_CASE("Manager rejects an invalid server config", "[manager][lifecycle]") {
    Farm farm;

    auto missing_id = run_sync(farm.io, farm.manager->connect(ServerConfig::spawn("", "srv")));
    REQUIRE(missing_id.error().code == ErrorCode::ProtocolError);

    auto missing_command = run_sync(farm.io, farm.manager->connect(ServerConfig::spawn("fs", "")));
    REQUIRE(missing_command.error().code == ErrorCode::ProtocolError);

    REQUIRE(farm.manager->server_ids().empty());
}

TEST_CASE("Manager forgets a server whose connect failed", "[manager][lifecycle]") {
    Farm farm;
    auto server = farm.add("fs", {"echo"});
    server->fail_next_starts(5);

    auto connected = farm.connect("fs");
    REQUIRE(connected.has_value() == false);
    REQUIRE(connected.error().code == ErrorCode::TransportError);
    REQUIRE(connected.error().message.find("Scripted start failure") != std::string::npos);

    REQUIRE(farm.manager->server_ids().empty());
    REQUIRE(farm.manager->server_health("fs") == ServerHealth::Unknown);
    REQUIRE(farm.manager->state("fs").has_value() == false);
}

TEST_CASE("Manager disconnect is idempotent and drops cached tools", "[manager][lifecycle]") {
    Farm farm;
    auto server = farm.add("fs", {"echo"});
    REQUIRE(farm.connect("fs").has_value());

    run_sync(farm.io, farm.manager->disconnect("fs"));
    run_sync(farm.io, farm.manager->disconnect("fs"));
    run_sync(farm.io, farm.manager->disconnect("never-connected"));

    REQUIRE(server->stops() == 1);
    REQUIRE(farm.manager->server_ids().empty());
    REQUIRE(farm.manager->tool_cache().entry("fs").has_value() == false);
    REQUIRE(farm.manager->list_tools("fs").error().code == ErrorCode::NotFound);
}

TEST_CASE("Manager can reconnect an id after disconnect", "[manager][lifecycle]") {
    Farm farm;
    auto server = farm.add("fs", {"echo"});
    REQUIRE(farm.connect("fs").has_value());
    run_sync(farm.io, farm.manager->disconnect("fs"));

    server->set_tools({"echo", "grep"});
    REQUIRE(farm.connect("fs").has_value());
    REQUIRE(names(*farm.manager->list_tools("fs")) == std::vector<std::string>{"echo", "grep"});
    REQUIRE(server->transports_created() == 2);
}

TEST_CASE("Manager shutdown closes every connection", "[manager][lifecycle]") {
    Farm farm;
    auto a = farm.add("a", {"echo"});
    auto b = farm.add("b", {"echo"});
    REQUIRE(farm.connect("a").has_value());
    REQUIRE(farm.connect("b").has_value());

    auto conn_a = farm.manager->connection("a");
    run_sync(farm.io, farm.manager->shutdown());

    REQUIRE(conn_a->state() == ConnectionState::Closed);
    REQUIRE(a->stops() == 1);
    REQUIRE(b->stops() == 1);
    REQUIRE(farm.manager->server_ids().empty());
    REQUIRE(farm.manager->list_all_tools().empty());

    auto after = run_sync(farm.io, farm.manager->call_tool("a", "echo"));
    REQUIRE(after.error().code == ErrorCode::NotFound);
}

// ═══════════════════════════════════════════════════════════════════════════
// Dispatch
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Manager routes call_tool to the named server", "[manager][call]") {
    Farm farm;
    auto a = farm.add("a", {"echo"});
    auto b = farm.add("b", {"echo"});
    b->on_tool("echo", [](const Json& args) {
        return ScriptedReply::text("b says " + args.value("text", ""));
    });
    REQUIRE(farm.connect("a").has_value());
    REQUIRE(farm.connect("b").has_value());

    auto from_b = run_sync(farm.io, farm.manager->call_tool("b", "echo", {{"text", "hi"}}));
    REQUIRE(from_b.has_value());
    REQUIRE(from_b->text() == "b says hi");

    REQUIRE(a->received_with_method("tools/call").empty());
    REQUIRE(b->received_with_method("tools/call").size() == 1);
}

TEST_CASE("Manager call_tool reports unknown servers and tools without sending", "[manager][call]") {
    Farm farm;
    auto server = farm.add("fs", {"echo"});
    REQUIRE(farm.connect("fs").has_value());

    auto no_server = run_sync(farm.io, farm.manager->call_tool("nope", "echo"));
    REQUIRE(no_server.error().code == ErrorCode::NotFound);

    auto no_tool = run_sync(farm.io, farm.manager->call_tool("fs", "delete_everything"));
    REQUIRE(no_tool.error().code == ErrorCode::NotFound);
    REQUIRE(no_tool.error().message.find("delete_everything") != std::string::npos);

    REQUIRE(server->received_with_method("tools/call").empty());
}

TEST_CASE("Manager call_tool passes tool errors through", "[manager][call]") {
    Farm farm;
    auto server = farm.add("fs", {"broken", "refusing"});
    server->on_tool("broken", [](const Json&) { return ScriptedReply::text("disk full", true); });
    server->on_tool("refusing", [](const Json&) { return ScriptedReply::rpc_error(-32000, "Refused"); });
    REQUIRE(farm.connect("fs").has_value());

    auto broken = run_sync(farm.io, farm.manager->call_tool("fs", "broken"));
    REQUIRE(broken.error().code == ErrorCode::ToolError);

    auto refusing = run_sync(farm.io, farm.manager->call_tool("fs", "refusing"));
    REQUIRE(refusing.error().code == ErrorCode::ToolError);
    REQUIRE(refusing.error().rpc_error->code == -32000);

    // Tool failures leave the server Ready
    REQUIRE(farm.manager->server_health("fs") == ServerHealth::Healthy);
}

TEST_CASE("Manager serves the cached list but refuses calls while degraded", "[manager][call]") {
    Farm farm;
    auto server = farm.add("fs", {"echo"});
    REQUIRE(farm.connect("fs").has_value());

    server->set_answer_pings(false);  // keep the liveness check pending
    server->push_error(TransportError::protocol("Invalid JSON"));
    run_sync(farm.io, [&]() -> asio::awaitable<void> {
        REQUIRE(co_await eventually([&] {
            return farm.manager->state("fs") == ConnectionState::Degraded;
        }));
    }());

    REQUIRE(farm.manager->server_health("fs") == ServerHealth::Unhealthy);
    REQUIRE(names(*farm.manager->list_tools("fs")) == std::vector<std::string>{"echo"});
    REQUIRE(farm.manager->tool_cache().is_stale("fs"));

    auto refused = run_sync(farm.io, farm.manager->call_tool("fs", "echo"));
    REQUIRE(refused.error().code == ErrorCode::NotReady);
}

TEST_CASE("Manager call_tool honors a per-call timeout", "[manager][call]") {
    Farm farm;
    auto server = farm.add("fs", {"slow"});
    server->on_tool("slow", [](const Json&) { return ScriptedReply::hold(); });
    REQUIRE(farm.connect("fs").has_value());

    auto outcome = run_sync(farm.io, farm.manager->call_tool("fs", "slow", Json::object(), 50ms));
    REQUIRE(outcome.error().code == ErrorCode::Timeout);
    REQUIRE(outcome.error().message == "tools/call timed out after 50ms");

    // A timeout is not a connection failure
    REQUIRE(farm.manager->state("fs") == ConnectionState::Ready);
}

TEST_CASE("A call timing out on one server does not hold up another", "[manager][call][timeout]") {
    Farm farm;
    auto a = farm.add("a", {"slow"});
    a->on_tool("slow", [](const Json&) { return ScriptedReply::hold(); });
    farm.add("b", {"echo"});
    REQUIRE(farm.connect("a").has_value());
    REQUIRE(farm.connect("b").has_value());

    run_sync(farm.io, [&]() -> asio::awaitable<void> {
        std::optional<Result<CallToolResult>> stuck;
        asio::co_spawn(farm.io, [&]() -> asio::awaitable<void> {
            stuck = co_await farm.manager->call_tool("a", "slow", Json::object(), 300ms);
        }, asio::detached);
        REQUIRE(co_await eventually([&] { return a->held().size() == 1; }));

        const auto started = std::chrono::steady_clock::now();
        auto prompt = co_await farm.manager->call_tool("b", "echo", Json{{"text", "prompt"}});
        REQUIRE(prompt.has_value());
        REQUIRE(prompt->text() == "prompt");
        REQUIRE((std::chrono::steady_clock::now() - started) < 200ms);
        REQUIRE(stuck.has_value() == false);

        REQUIRE(co_await eventually([&] { return stuck.has_value(); }));
        REQUIRE(stuck->error().code == ErrorCode::Timeout);
        REQUIRE(farm.manager->state("a") == ConnectionState::Ready);
        REQUIRE(farm.manager->state("b") == ConnectionState::Ready);
    }());
}

// ═══════════════════════════════════════════════════════════════════════════
// Aggregate queries
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Manager aggregates tools across servers in id order", "[manager][tools]") {
    Farm farm;
    farm.add("beta", {"search", "shared"});
    farm.add("alpha", {"shared", "read"});
    REQUIRE(farm.connect("beta").has_value());
    REQUIRE(farm.connect("alpha").has_value());

    auto all = farm.manager->list_all_tools();
    REQUIRE(all.size() == 4);
    REQUIRE(all[0].server_id == "alpha");
    REQUIRE(all[0].tool.name == "shared");
    REQUIRE(all[1].tool.name == "read");
    REQUIRE(all[2].server_id == "beta");
    REQUIRE(all[2].tool.name == "search");

    auto shared = farm.manager->find_tool("shared");
    REQUIRE(shared.has_value());
    REQUIRE(shared->server_id == "alpha");

    auto search = farm.manager->find_tool("search");
    REQUIRE(search->server_id == "beta");

    REQUIRE(farm.manager->find_tool("missing").has_value() == false);
}

TEST_CASE("Manager refresh_tools re-runs discovery", "[manager][tools]") {
    Farm farm;
    auto server = farm.add("fs", {"echo"});
    REQUIRE(farm.connect("fs").has_value());

    server->set_tools({"echo", "stat"});
    auto refreshed = run_sync(farm.io, farm.manager->refresh_tools("fs"));
    REQUIRE(refreshed.has_value());
    REQUIRE(names(*refreshed) == std::vector<std::string>{"echo", "stat"});
    REQUIRE(farm.manager->find_tool("stat")->server_id == "fs");

    auto unknown = run_sync(farm.io, farm.manager->refresh_tools("nope"));
    REQUIRE(unknown.error().code == ErrorCode::NotFound);
}

TEST_CASE("Manager picks up tools after list_changed", "[manager][tools]") {
    Farm farm;
    auto server = farm.add("fs", {"echo"});
    REQUIRE(farm.connect("fs").has_value());

    std::vector<std::string> forwarded;
    farm.manager->on_notification([&](const std::string&, const std::string& method, const Json&) {
        forwarded.push_back(method);
    });

    server->set_tools({"echo", "late_tool"});
    server->push(JsonRpcNotification("notifications/tools/list_changed").to_json());

    run_sync(farm.io, [&]() -> asio::awaitable<void> {
        REQUIRE(co_await eventually([&] { return farm.manager->find_tool("late_tool").has_value(); }));
    }());
    REQUIRE(forwarded.empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Sandbox state & observers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Manager broadcasts sandbox state to ready servers", "[manager][sandbox]") {
    Farm farm;
    auto a = farm.add("a", {"echo"});
    auto b = farm.add("b", {"echo"});
    REQUIRE(farm.connect("a").has_value());
    REQUIRE(farm.connect("b").has_value());

    SandboxState state;
    state.enabled = true;
    state.policy = "read-only";
    run_sync(farm.io, farm.manager->notify_sandbox_state(state));

    for (const auto& server : {a, b}) {
        auto sent = server->received_with_method("notifications/sandbox_state");
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0]["params"]["enabled"] == true);
        REQUIRE(sent[0]["params"]["policy"] == "read-only");
        REQUIRE(sent[0].contains("id") == false);
    }
}

TEST_CASE("Manager skips servers that are not ready when broadcasting", "[manager][sandbox]") {
    Farm farm;
    auto a = farm.add("a", {"echo"});
    auto b = farm.add("b", {"echo"});
    REQUIRE(farm.connect("a").has_value());
    REQUIRE(farm.connect("b").has_value());

    b->set_answer_pings(false);
    b->push_error(TransportError::protocol("Invalid JSON"));
    run_sync(farm.io, [&]() -> asio::awaitable<void> {
        REQUIRE(co_await eventually([&] { return farm.manager->state("b") == ConnectionState::Degraded; }));
    }());

    run_sync(farm.io, farm.manager->notify_sandbox_state(SandboxState{true, "", Json()}));

    REQUIRE(a->received_with_method("notifications/sandbox_state").size() == 1);
    REQUIRE(b->received_with_method("notifications/sandbox_state").empty());
}

TEST_CASE("Manager reports server sandbox changes to observers", "[manager][sandbox]") {
    Farm farm;
    auto server = farm.add("fs", {"echo"});
    REQUIRE(farm.connect("fs").has_value());

    std::vector<std::pair<std::string, SandboxState>> seen;
    farm.manager->on_sandbox_state([&](const std::string& id, const SandboxState& state) {
        seen.emplace_back(id, state);
    });

    server->push(JsonRpcNotification("notifications/sandbox_state", Json{{"enabled", true}, {"policy", "strict"}}).to_json());
    server->push(JsonRpcNotification("sandbox/state_changed", Json{{"enabled", false}}).to_json());

    run_sync(farm.io, [&]() -> asio::awaitable<void> {
        REQUIRE(co_await eventually([&] { return seen.size() == 2; }));
    }());

    REQUIRE(seen[0].first == "fs");
    REQUIRE(seen[0].second.enabled);
    REQUIRE(seen[0].second.policy == "strict");
    REQUIRE(seen[1].second.enabled == false);

    // Tools may differ under the new sandbox until the next discovery
    REQUIRE(farm.manager->tool_cache().is_stale("fs"));
}

TEST_CASE("Manager forwards other notifications to observers", "[manager][observers]") {
    Farm farm;
    auto server = farm.add("fs", {"echo"});
    REQUIRE(farm.connect("fs").has_value());

    std::vector<std::tuple<std::string, std::string, Json>> seen;
    farm.manager->on_notification([&](const std::string& id, const std::string& method, const Json& params) {
        seen.emplace_back(id, method, params);
    });

    server->push(JsonRpcNotification("notifications/message", Json{{"level", "info"}, {"data", "hello"}}).to_json());

    run_sync(farm.io, [&]() -> asio::awaitable<void> {
        REQUIRE(co_await eventually([&] { return seen.size() == 1; }));
    }());

    REQUIRE(std::get<0>(seen[0]) == "fs");
    REQUIRE(std::get<1>(seen[0]) == "notifications/message");
    REQUIRE(std::get<2>(seen[0])["data"] == "hello");
}

TEST_CASE("Manager reports state transitions to observers", "[manager][observers]") {
    Farm farm;
    farm.add("fs", {"echo"});

    std::vector<ConnectionState> states;
    farm.manager->on_state_change([&](const std::string& id, ConnectionState, ConnectionState next) {
        if (id == "fs") {
            states.push_back(next);
        }
    });

    REQUIRE(farm.connect("fs").has_value());
    run_sync(farm.io, farm.manager->disconnect("fs"));

    REQUIRE(states == std::vector<ConnectionState>{
        ConnectionState::Connecting,
        ConnectionState::Handshaking,
        ConnectionState::Ready,
        ConnectionState::Closed
    });
}
