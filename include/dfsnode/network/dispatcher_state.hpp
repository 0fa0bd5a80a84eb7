#ifndef DFSNODE_DISPATCHER_STATE_HPP
#define DFSNODE_DISPATCHER_STATE_HPP

#include <ostream>
#include <string>

namespace dfsnode {
namespace network {

/**
 * DispatcherState tracks one connection's request handling and rejects
 * transitions that would break the one-request-per-connection protocol.
 */
class DispatcherState {
public:
    /**
     * Request handling states:
     * AWAITING_REQUEST - Reading the request frame
     * DISPATCHED       - Request parsed and routed to its handler
     * RESPONDING       - Writing the single response
     * CLOSED           - Done, the connection is torn down
     */
    enum class State {
        AWAITING_REQUEST,
        DISPATCHED,
        RESPONDING,
        CLOSED
    };

    DispatcherState() : current_state_(State::AWAITING_REQUEST) {}

    State get_state() const { return current_state_; }

    bool is_closed() const { return current_state_ == State::CLOSED; }

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

    // STATUS and failures skip DISPATCHED; any state may close
    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::AWAITING_REQUEST:
                return to == State::DISPATCHED ||
                       to == State::RESPONDING ||
                       to == State::CLOSED;

            case State::DISPATCHED:
                return to == State::RESPONDING ||
                       to == State::CLOSED;

            case State::RESPONDING:
                return to == State::CLOSED;

            case State::CLOSED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::AWAITING_REQUEST: return "AWAITING_REQUEST";
            case State::DISPATCHED:       return "DISPATCHED";
            case State::RESPONDING:       return "RESPONDING";
            case State::CLOSED:           return "CLOSED";
            default:                      return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for DispatcherState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const DispatcherState::State& state) {
    os << DispatcherState::state_to_string(state);
    return os;
}

} // namespace network
} // namespace dfsnode

#endif // DFSNODE_DISPATCHER_STATE_HPP
