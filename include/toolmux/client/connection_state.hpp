#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// Connection State
// ─────────────────────────────────────────────────────────────────────────────

/// Lifecycle of one server connection.
///
///   ┌──────────────┐  attempt   ┌────────────┐  opened   ┌─────────────┐
///   │ Disconnected │───────────▶│ Connecting │──────────▶│ Handshaking │
///   └──────────────┘            └─────┬──────┘           └──────┬──────┘
///          ▲  ▲   open failed         │                         │ discovery
///          │  └───────────────────────┘                         │ done
///          │                 handshake failed                   ▼
///          ├────────────────────────────────────────────── ┌─────────┐
///          │       failure threshold / transport closed    │  Ready  │
///          ├────────────────────────────────────────────── └──┬───▲──┘
///          │                                  missed probes   │   │ probe ok
///          │                                                ┌─▼───┴──┐
///          └────────────────────────────────────────────────│Degraded│
///                                                           └────────┘
///   Any state ──▶ Closed (disconnect, attempts exhausted). Closed is terminal.
enum class ConnectionState {
    Disconnected,
    Connecting,
    Handshaking,
    Ready,
    Degraded,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Handshaking:  return "Handshaking";
        case ConnectionState::Ready:        return "Ready";
        case ConnectionState::Degraded:     return "Degraded";
        case ConnectionState::Closed:       return "Closed";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool is_live(ConnectionState state) noexcept {
    return (state == ConnectionState::Ready) || (state == ConnectionState::Degraded);
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection State Machine
// ─────────────────────────────────────────────────────────────────────────────

/// Validates and records transitions. Thread-safe; observers run after the
/// internal lock is released, in registration order, and may query the
/// machine but should not transition it.
class ConnectionStateMachine {
public:
    using StateChangeCallback = std::function<void(ConnectionState old_state, ConnectionState new_state)>;

    ConnectionStateMachine() = default;

    ConnectionStateMachine(const ConnectionStateMachine&) = delete;
    ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;
    ConnectionStateMachine(ConnectionStateMachine&&) = delete;
    ConnectionStateMachine& operator=(ConnectionStateMachine&&) = delete;

    [[nodiscard]] static bool is_valid_transition(ConnectionState from, ConnectionState to) noexcept;

    [[nodiscard]] ConnectionState state() const noexcept;

    /// Reason given with the last transition into Disconnected or Closed.
    [[nodiscard]] std::string last_error() const;

    /// Connection attempts since the last time Ready was reached.
    [[nodiscard]] std::size_t attempts() const noexcept;

    /// Returns false (and logs) when the transition is not allowed.
    bool transition_to(ConnectionState next, std::string reason = {});

    void on_state_change(StateChangeCallback callback);

private:
    mutable std::mutex mutex_;
    ConnectionState state_{ConnectionState::Disconnected};
    std::string last_error_;
    std::size_t attempts_{0};
    std::vector<StateChangeCallback> callbacks_;
};

}  // namespace toolmux
