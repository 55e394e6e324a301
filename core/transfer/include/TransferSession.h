#pragma once

/**
 * @file TransferSession.h
 * @brief One send or receive, driven through the session state machine
 */

#include "AttemptLog.h"
#include "CancellationToken.h"
#include "NetworkProfile.h"
#include "Result.h"
#include "SecurityEngine.h"
#include "SessionObserver.h"
#include "SessionRegistry.h"
#include "SessionState.h"
#include "TransferMetadata.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace CodeDrop {

    class OrchestrationContext;

    /**
     * @brief What the caller wants a session to do
     */
    struct SessionRequest {
        SessionRole role{SessionRole::Receiver};
        std::string code;                 // sender may leave empty to generate one
        std::string fileName;             // sender only
        std::vector<uint8_t> payload;     // sender only, plaintext

        static SessionRequest send(std::string fileName, std::vector<uint8_t> payload,
                                   std::string code = "");
        static SessionRequest receive(std::string code);
    };

    /**
     * @brief Terminal result of a session
     */
    struct SessionOutcome {
        SessionState state{SessionState::Idle};
        std::optional<Error> error;
        std::string transportName;                 // backend that succeeded
        std::optional<EncryptionMode> mode;
        TransferMetadata metadata;
        std::vector<uint8_t> payload;              // receiver: verified plaintext
        std::vector<AttemptRecord> attempts;
        std::optional<NetworkProfile> profile;

        bool succeeded() const { return state == SessionState::Completed; }
    };

    struct StateTransition {
        SessionState from;
        SessionState to;
        std::chrono::system_clock::time_point at;
    };

    /**
     * @brief Per-transfer state machine
     *
     * States only move forward. cancel() moves any non-terminal session to
     * Cancelled at once and aborts the in-flight backend call through its
     * token. Once a payload passes verification the session commits to
     * Completed under the state lock, and a later cancel() is a no-op.
     * Only one session per role and transfer id may be active in a context.
     */
    class TransferSession {
    public:
        TransferSession(OrchestrationContext& context, SessionRequest request,
                        std::shared_ptr<SessionObserver> observer = nullptr);
        ~TransferSession();

        TransferSession(const TransferSession&) = delete;
        TransferSession& operator=(const TransferSession&) = delete;

        /**
         * @brief Run the session on its own thread
         * @return InvalidState if already started, TransferInProgress if the
         *         transfer id is busy
         */
        VoidResult start();

        /**
         * @brief Run the session on the calling thread
         */
        Result<SessionOutcome> run();

        // Block until the session reaches a terminal state
        SessionOutcome wait();
        std::optional<SessionOutcome> waitFor(std::chrono::milliseconds timeout);

        void cancel();

        SessionState state() const;
        SessionRole role() const { return role_; }
        const std::string& code() const { return code_; }
        const std::string& transferId() const { return transferId_; }
        std::vector<AttemptRecord> attemptLog() const { return attempts_.snapshot(); }
        std::vector<StateTransition> stateHistory() const;
        std::string selectedTransport() const;
        std::optional<EncryptionMode> selectedMode() const;

        // Seam for tests; runs on the session thread right after the session commits to Completed
        void setCompletionHook(std::function<void()> hook) { completionHook_ = std::move(hook); }

    private:
        VoidResult claim();
        void execute();
        SessionOutcome orchestrate();
        SessionOutcome runSender(SessionOutcome outcome, const std::vector<uint8_t>& key);
        SessionOutcome runReceiver(SessionOutcome outcome, const std::vector<uint8_t>& key);

        // Forward-only transition; false once the session is terminal
        bool tryAdvance(SessionState to);
        // Verifying -> Completed in one step; false if cancel() got there first
        bool commitCompleted();
        SessionOutcome finish(SessionOutcome outcome, SessionState terminal, std::optional<Error> error);
        SessionOutcome cancelledOutcome(SessionOutcome outcome);

        void publishState(SessionState from, SessionState to);
        void publishStatus(const std::string& phase);
        void publishProgress(uint64_t bytes, uint64_t total);

        OrchestrationContext& context_;
        const SessionRole role_;
        std::string code_;
        std::string transferId_;
        std::string fileName_;
        std::vector<uint8_t> payload_;
        std::shared_ptr<SessionObserver> observer_;
        std::function<void()> completionHook_;

        CancellationToken cancel_;
        AttemptLog attempts_;
        SessionRegistry::Guard guard_;

        mutable std::mutex mutex_;
        SessionState state_{SessionState::Idle};
        std::vector<StateTransition> history_;
        std::string selectedTransport_;
        std::optional<EncryptionMode> selectedMode_;
        bool started_{false};

        std::promise<SessionOutcome> promise_;
        std::shared_future<SessionOutcome> outcome_;
        std::thread worker_;
    };

}
