#include "toolmux/client/connection_state.hpp"
#include "toolmux/log/logger.hpp"

namespace toolmux {

bool ConnectionStateMachine::is_valid_transition(ConnectionState from, ConnectionState to) noexcept {
    using S = ConnectionState;

    if (from == S::Closed) {
        return false;
    }
    if (to == S::Closed) {
        return true;
    }

    switch (from) {
        case S::Disconnected:
            return to == S::Connecting;
        case S::Connecting:
            return (to == S::Handshaking) || (to == S::Disconnected);
        case S::Handshaking:
            return (to == S::Ready) || (to == S::Disconnected);
        case S::Ready:
            return (to == S::Degraded) || (to == S::Disconnected);
        case S::Degraded:
            return (to == S::Ready) || (to == S::Disconnected);
        case S::Closed:
            return false;
    }
    return false;
}

ConnectionState ConnectionStateMachine::state() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ConnectionStateMachine::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::size_t ConnectionStateMachine::attempts() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

bool ConnectionStateMachine::transition_to(ConnectionState next, std::string reason) {
    std::vector<StateChangeCallback> callbacks;
    ConnectionState old_state;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        old_state = state_;
        if (!is_valid_transition(old_state, next)) {
            get_logger().warn_fmt("Rejected state transition {} -> {}", to_string(old_state), to_string(next));
            return false;
        }

        state_ = next;
        if (next == ConnectionState::Connecting) {
            ++attempts_;
        } else if (next == ConnectionState::Ready) {
            attempts_ = 0;
            last_error_.clear();
        }
        if (!reason.empty()
            && ((next == ConnectionState::Disconnected) || (next == ConnectionState::Closed))) {
            last_error_ = reason;
        }
        callbacks = callbacks_;
    }

    if (reason.empty()) {
        get_logger().info_fmt("State {} -> {}", to_string(old_state), to_string(next));
    } else {
        get_logger().info_fmt("State {} -> {} ({})", to_string(old_state), to_string(next), reason);
    }

    for (const auto& callback : callbacks) {
        callback(old_state, next);
    }
    return true;
}

void ConnectionStateMachine::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

}  // namespace toolmux
