#pragma once

namespace CodeDrop {

    enum class SessionRole {
        Sender,
        Receiver
    };

    /**
     * @brief Transfer session lifecycle, declared in forward order
     *
     * Idle -> CodeReady -> Negotiating -> Transporting -> Verifying -> Completed,
     * with Failed and Cancelled reachable from any non-terminal state.
     */
    enum class SessionState {
        Idle,
        CodeReady,
        Negotiating,
        Transporting,
        Verifying,
        Completed,
        Failed,
        Cancelled
    };

    const char* toString(SessionRole role);
    const char* toString(SessionState state);

    inline bool isTerminal(SessionState state) {
        return state == SessionState::Completed ||
               state == SessionState::Failed ||
               state == SessionState::Cancelled;
    }

}
