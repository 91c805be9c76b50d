#include <catch2/catch_test_macros.hpp>

#include "toolmux/client/connection_state.hpp"

#include <thread>
#include <utility>
#include <vector>

using namespace toolmux;
using S = ConnectionState;

TEST_CASE("ConnectionState names", "[state]") {
    REQUIRE(to_string(S::Disconnected) == "Disconnected");
    REQUIRE(to_string(S::Handshaking) == "Handshaking");
    REQUIRE(to_string(S::Degraded) == "Degraded");
    REQUIRE(to_string(S::Closed) == "Closed");
}

TEST_CASE("is_live covers Ready and Degraded only", "[state]") {
    REQUIRE(is_live(S::Ready));
    REQUIRE(is_live(S::Degraded));
    REQUIRE(is_live(S::Handshaking) == false);
    REQUIRE(is_live(S::Closed) == false);
}

TEST_CASE("Transition table", "[state]") {
    SECTION("Forward path") {
        REQUIRE(ConnectionStateMachine::is_valid_transition(S::Disconnected, S::Connecting));
        REQUIRE(ConnectionStateMachine::is_valid_transition(S::Connecting, S::Handshaking));
        REQUIRE(ConnectionStateMachine::is_valid_transition(S::Handshaking, S::Ready));
    }

    SECTION("Health moves") {
        REQUIRE(ConnectionStateMachine::is_valid_transition(S::Ready, S::Degraded));
        REQUIRE(ConnectionStateMachine::is_valid_transition(S::Degraded, S::Ready));
    }

    SECTION("Losing the connection") {
        for (auto from : {S::Connecting, S::Handshaking, S::Ready, S::Degraded}) {
            REQUIRE(ConnectionStateMachine::is_valid_transition(from, S::Disconnected));
        }
    }

    SECTION("Anything may close, nothing leaves Closed") {
        for (auto from : {S::Disconnected, S::Connecting, S::Handshaking, S::Ready, S::Degraded}) {
            REQUIRE(ConnectionStateMachine::is_valid_transition(from, S::Closed));
        }
        for (auto to : {S::Disconnected, S::Connecting, S::Ready, S::Closed}) {
            REQUIRE(ConnectionStateMachine::is_valid_transition(S::Closed, to) == false);
        }
    }

    SECTION("Shortcuts are rejected") {
        REQUIRE(ConnectionStateMachine::is_valid_transition(S::Disconnected, S::Ready) == false);
        REQUIRE(ConnectionStateMachine::is_valid_transition(S::Connecting, S::Ready) == false);
        REQUIRE(ConnectionStateMachine::is_valid_transition(S::Degraded, S::Handshaking) == false);
        REQUIRE(ConnectionStateMachine::is_valid_transition(S::Ready, S::Connecting) == false);
    }
}

TEST_CASE("State machine starts Disconnected", "[state]") {
    ConnectionStateMachine machine;

    REQUIRE(machine.state() == S::Disconnected);
    REQUIRE(machine.attempts() == 0);
    REQUIRE(machine.last_error().empty());
}

TEST_CASE("Invalid transitions leave the state alone", "[state]") {
    ConnectionStateMachine machine;

    REQUIRE(machine.transition_to(S::Ready) == false);
    REQUIRE(machine.state() == S::Disconnected);
}

TEST_CASE("Attempts count up to Ready and then reset", "[state]") {
    ConnectionStateMachine machine;

    REQUIRE(machine.transition_to(S::Connecting));
    REQUIRE(machine.transition_to(S::Disconnected, "spawn failed"));
    REQUIRE(machine.transition_to(S::Connecting));
    REQUIRE(machine.attempts() == 2);
    REQUIRE(machine.last_error() == "spawn failed");

    REQUIRE(machine.transition_to(S::Handshaking));
    REQUIRE(machine.transition_to(S::Ready));
    REQUIRE(machine.attempts() == 0);
    REQUIRE(machine.last_error().empty());
}

TEST_CASE("Closed records its reason and is terminal", "[state]") {
    ConnectionStateMachine machine;
    machine.transition_to(S::Connecting);
    machine.transition_to(S::Closed, "attempts exhausted");

    REQUIRE(machine.state() == S::Closed);
    REQUIRE(machine.last_error() == "attempts exhausted");
    REQUIRE(machine.transition_to(S::Connecting) == false);
}

TEST_CASE("Observers see every accepted transition in order", "[state]") {
    ConnectionStateMachine machine;
    std::vector<std::pair<S, S>> seen;

    machine.on_state_change([&](S from, S to) {
        seen.emplace_back(from, to);
        // querying from inside an observer must not deadlock
        REQUIRE(machine.state() == to);
    });

    machine.transition_to(S::Connecting);
    machine.transition_to(S::Ready);  // rejected, not observed
    machine.transition_to(S::Handshaking);
    machine.transition_to(S::Ready);
    machine.transition_to(S::Degraded);

    REQUIRE(seen == std::vector<std::pair<S, S>>{
        {S::Disconnected, S::Connecting},
        {S::Connecting, S::Handshaking},
        {S::Handshaking, S::Ready},
        {S::Ready, S::Degraded},
    });
}

TEST_CASE("Concurrent readers see a valid state", "[state][concurrency]") {
    ConnectionStateMachine machine;

    std::thread writer([&] {
        for (int i = 0; i < 500; ++i) {
            machine.transition_to(S::Connecting);
            machine.transition_to(S::Handshaking);
            machine.transition_to(S::Ready);
            machine.transition_to(S::Disconnected);
        }
    });

    for (int i = 0; i < 2000; ++i) {
        const auto state = machine.state();
        REQUIRE(state != S::Closed);
    }
    writer.join();

    REQUIRE(machine.state() == S::Disconnected);
}
