#pragma once

#include "SessionState.h"

#include <cstdint>
#include <string>

namespace CodeDrop {

    /**
     * @brief Receives session events on the EventDispatcher thread
     *
     * Default implementations ignore the event. Callbacks must not block for
     * long; they share one delivery thread with every other session.
     */
    class SessionObserver {
    public:
        virtual ~SessionObserver() = default;

        virtual void onStateChanged(const std::string& transferId, SessionState from, SessionState to) {
            (void)transferId; (void)from; (void)to;
        }

        // Human-readable phase text, e.g. "Probing network"
        virtual void onStatus(const std::string& transferId, const std::string& phase) {
            (void)transferId; (void)phase;
        }

        virtual void onProgress(const std::string& transferId, uint64_t bytesTransferred,
                                uint64_t totalBytes, const std::string& currentFileName) {
            (void)transferId; (void)bytesTransferred; (void)totalBytes; (void)currentFileName;
        }
    };

}
