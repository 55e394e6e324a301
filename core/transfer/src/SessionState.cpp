#include "SessionState.h"

namespace CodeDrop {

    const char* toString(SessionRole role) {
        switch (role) {
            case SessionRole::Sender: return "sender";
            case SessionRole::Receiver: return "receiver";
        }
        return "unknown";
    }

    const char* toString(SessionState state) {
        switch (state) {
            case SessionState::Idle: return "Idle";
            case SessionState::CodeReady: return "CodeReady";
            case SessionState::Negotiating: return "Negotiating";
            case SessionState::Transporting: return "Transporting";
            case SessionState::Verifying: return "Verifying";
            case SessionState::Completed: return "Completed";
            case SessionState::Failed: return "Failed";
            case SessionState::Cancelled: return "Cancelled";
        }
        return "Unknown";
    }

}
