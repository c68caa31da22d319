#ifndef PEERCHUNKS_CONNECTION_STATE_HPP
#define PEERCHUNKS_CONNECTION_STATE_HPP

#include <ostream>
#include <string>

namespace peerchunks {
namespace network {

/**
 * ConnectionState tracks the protocol state of one peer session.
 * Implements a state machine that enforces valid state transitions and prevents invalid ones.
 */
class ConnectionState {
public:
    /**
     * Session states:
     * HANDSHAKING - Welcome text and index request are being written
     * SERVING     - Reading and dispatching frames
     * CLOSED      - Stream ended or failed, terminal
     */
    enum class State {
        HANDSHAKING,
        SERVING,
        CLOSED
    };

    /**
     * Initialize connection state to HANDSHAKING.
     */
    ConnectionState() : current_state_(State::HANDSHAKING) {}

    /**
     * Get the current connection state.
     * @return Current state
     */
    State get_state() const { return current_state_; }

    bool is_terminal() const {
        return current_state_ == State::CLOSED;
    }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    // Check if a transition is valid
    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::HANDSHAKING:
                return to == State::SERVING ||
                       to == State::CLOSED;

            case State::SERVING:
                return to == State::CLOSED;

            case State::CLOSED:
                return false;
        }
        return false;
    }

    // Convert state to string for logging
    static std::string state_to_string(State state) {
        switch (state) {
            case State::HANDSHAKING: return "HANDSHAKING";
            case State::SERVING:     return "SERVING";
            case State::CLOSED:      return "CLOSED";
            default:                 return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for ConnectionState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const ConnectionState::State& state) {
    os << ConnectionState::state_to_string(state);
    return os;
}

} // namespace network
} // namespace peerchunks

#endif // PEERCHUNKS_CONNECTION_STATE_HPP
