#ifndef VAULT_NODE_UPLOAD_STATE_HPP
#define VAULT_NODE_UPLOAD_STATE_HPP

#include <ostream>
#include <string>

namespace vault {
namespace node {

/**
 * UploadState tracks one upload call through its phases and refuses
 * transitions that skip or reverse a phase.
 */
class UploadState {
public:
    /**
     * Upload phases:
     * AWAIT_METADATA - Call admitted, first unit not yet read
     * STREAMING      - Metadata accepted, payload going to the temp file
     * FINALIZING     - Stream ended, choosing the final name and moving
     * COMMITTED      - Object is visible at its final path
     * FAILED         - Rejected or faulted, nothing committed
     * CANCELLED      - Aborted by the caller or the deadline
     */
    enum class State {
        AWAIT_METADATA,
        STREAMING,
        FINALIZING,
        COMMITTED,
        FAILED,
        CANCELLED
    };

    UploadState() : current_state_(State::AWAIT_METADATA) {}

    State get_state() const { return current_state_; }

    bool is_terminal() const {
        return current_state_ == State::COMMITTED ||
               current_state_ == State::FAILED ||
               current_state_ == State::CANCELLED;
    }

    /**
     * Attempt to move to a new phase.
     * @param new_state The target phase
     * @return true if the transition was allowed
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
            case State::AWAIT_METADATA:
                return to == State::STREAMING ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::STREAMING:
                return to == State::FINALIZING ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::FINALIZING:
                return to == State::COMMITTED ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::COMMITTED:
            case State::FAILED:
            case State::CANCELLED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::AWAIT_METADATA: return "AWAIT_METADATA";
            case State::STREAMING:      return "STREAMING";
            case State::FINALIZING:     return "FINALIZING";
            case State::COMMITTED:      return "COMMITTED";
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

inline std::ostream& operator<<(std::ostream& os, const UploadState::State& state) {
    os << UploadState::state_to_string(state);
    return os;
}

} // namespace node
} // namespace vault

#endif // VAULT_NODE_UPLOAD_STATE_HPP
