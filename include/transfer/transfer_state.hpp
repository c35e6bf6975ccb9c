#ifndef BXFER_TRANSFER_STATE_HPP
#define BXFER_TRANSFER_STATE_HPP

#include <ostream>
#include <string>

namespace bxfer {
namespace transfer {

/**
 * TransferState tracks the lifecycle of one transfer session.
 * Implements a state machine that enforces valid state transitions and prevents invalid ones.
 */
class TransferState {
public:
    /**
     * Transfer session states:
     * INITIATED      - Session created, nothing sent yet
     * AUTHENTICATING - Resolving the bearer credential and opening the session
     * TRANSFERRING   - Sending chunks
     * VERIFYING      - All chunks acknowledged, awaiting whole-file confirmation
     * COMPLETED      - Receiver confirmed the file (terminal)
     * FAILED         - Session ended with an error (terminal)
     * CANCELLED      - Session stopped on request, resumable (terminal)
     */
    enum class State {
        INITIATED,
        AUTHENTICATING,
        TRANSFERRING,
        VERIFYING,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    TransferState() : current_state_(State::INITIATED) {}

    State get_state() const { return current_state_; }

    /**
     * Check if the session can no longer change state.
     * @return true if in a terminal state
     */
    bool is_terminal() const {
        return current_state_ == State::COMPLETED ||
               current_state_ == State::FAILED ||
               current_state_ == State::CANCELLED;
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

    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::INITIATED:
                return to == State::AUTHENTICATING ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::AUTHENTICATING:
                return to == State::TRANSFERRING ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::TRANSFERRING:
                return to == State::VERIFYING ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::VERIFYING:
                return to == State::COMPLETED ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::COMPLETED:
            case State::FAILED:
            case State::CANCELLED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::INITIATED:      return "INITIATED";
            case State::AUTHENTICATING: return "AUTHENTICATING";
            case State::TRANSFERRING:   return "TRANSFERRING";
            case State::VERIFYING:      return "VERIFYING";
            case State::COMPLETED:      return "COMPLETED";
            case State::FAILED:         return "FAILED";
            case State::CANCELLED:      return "CANCELLED";
            default:                    return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for TransferState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const TransferState::State& state) {
    os << TransferState::state_to_string(state);
    return os;
}

} // namespace transfer
} // namespace bxfer

#endif // BXFER_TRANSFER_STATE_HPP
