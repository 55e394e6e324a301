#include "TransferSession.h"

#include "LoggerMacros.h"
#include "OrchestrationContext.h"
#include "TransferCode.h"
#include "TransferPackage.h"

#include <exception>

namespace CodeDrop {

    namespace {
        const char* kComponent = "TransferSession";
    }

    SessionRequest SessionRequest::send(std::string fileName, std::vector<uint8_t> payload, std::string code) {
        SessionRequest request;
        request.role = SessionRole::Sender;
        request.fileName = std::move(fileName);
        request.payload = std::move(payload);
        request.code = std::move(code);
        return request;
    }

    SessionRequest SessionRequest::receive(std::string code) {
        SessionRequest request;
        request.role = SessionRole::Receiver;
        request.code = std::move(code);
        return request;
    }

    TransferSession::TransferSession(OrchestrationContext& context, SessionRequest request,
                                     std::shared_ptr<SessionObserver> observer)
        : context_(context),
          role_(request.role),
          fileName_(std::move(request.fileName)),
          payload_(std::move(request.payload)),
          observer_(std::move(observer)),
          outcome_(promise_.get_future().share()) {
        if (role_ == SessionRole::Sender && request.code.empty()) {
            code_ = TransferCode::generate();
        } else {
            code_ = TransferCode::normalize(request.code);
        }
        transferId_ = TransferCode::transferId(code_);

        // Too-short codes are rejected before any logging mentions them
        if (code_.size() >= SecurityEngine::MIN_CODE_LENGTH) {
            Logger::instance().redactSecret(code_);
        }
    }

    TransferSession::~TransferSession() {
        if (worker_.joinable()) {
            cancel();
            worker_.join();
        }
        if (code_.size() >= SecurityEngine::MIN_CODE_LENGTH) {
            Logger::instance().forgetSecret(code_);
        }
    }

    VoidResult TransferSession::claim() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            return Error(ErrorCode::InvalidState, "Session already started", kComponent);
        }
        if (isTerminal(state_)) {
            return Error(ErrorCode::InvalidState,
                         std::string("Session already ") + toString(state_), kComponent);
        }

        auto guard = context_.sessions().acquire(std::string(toString(role_)) + ":" + transferId_);
        if (guard.isError()) {
            return guard.error();
        }
        guard_ = guard.takeValue();
        started_ = true;
        context_.seal();
        return Ok();
    }

    VoidResult TransferSession::start() {
        auto claimed = claim();
        if (claimed.isError()) {
            return claimed;
        }
        worker_ = std::thread([this]() { execute(); });
        return Ok();
    }

    Result<SessionOutcome> TransferSession::run() {
        auto claimed = claim();
        if (claimed.isError()) {
            return claimed.error();
        }
        execute();
        return outcome_.get();
    }

    SessionOutcome TransferSession::wait() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!started_) {
                SessionOutcome outcome;
                outcome.state = state_;
                outcome.error = Error(ErrorCode::InvalidState, "Session was never started", kComponent);
                return outcome;
            }
        }
        return outcome_.get();
    }

    std::optional<SessionOutcome> TransferSession::waitFor(std::chrono::milliseconds timeout) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!started_) {
                return std::nullopt;
            }
        }
        if (outcome_.wait_for(timeout) != std::future_status::ready) {
            return std::nullopt;
        }
        return outcome_.get();
    }

    void TransferSession::cancel() {
        SessionState from;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (isTerminal(state_)) {
                return;
            }
            from = state_;
            state_ = SessionState::Cancelled;
            history_.push_back({from, state_, std::chrono::system_clock::now()});
        }
        cancel_.cancel();
        LOG_INFO_COMP_IF("Transfer " + transferId_ + " cancelled in state " + toString(from), kComponent);
        publishState(from, SessionState::Cancelled);
    }

    SessionState TransferSession::state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    std::vector<StateTransition> TransferSession::stateHistory() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_;
    }

    std::string TransferSession::selectedTransport() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return selectedTransport_;
    }

    std::optional<EncryptionMode> TransferSession::selectedMode() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return selectedMode_;
    }

    void TransferSession::execute() {
        SessionOutcome outcome;
        try {
            outcome = orchestrate();
        } catch (const std::exception& e) {
            Logger::instance().log(LogLevel::ERROR,
                "Transfer " + transferId_ + " aborted: " + e.what(), kComponent);
            outcome = finish(SessionOutcome{}, SessionState::Failed,
                             Error(ErrorCode::InternalError, e.what(), kComponent));
        }
        guard_.release();
        promise_.set_value(std::move(outcome));
    }

    SessionOutcome TransferSession::orchestrate() {
        auto& logger = Logger::instance();
        context_.metrics().incrementSessionsStarted();
        logger.log(LogLevel::INFO, "Transfer " + transferId_ + " started as " + toString(role_), kComponent);

        SessionOutcome outcome;
        outcome.metadata = TransferMetadata::forReceive(transferId_);

        if (cancel_.isCancelled()) {
            return cancelledOutcome(std::move(outcome));
        }

        publishStatus("Deriving key");
        auto derived = context_.security().strengthenCode(code_, context_.settings().securityContext);
        if (derived.isError()) {
            return finish(std::move(outcome), SessionState::Failed, derived.error());
        }

        DerivedKey key = derived.takeValue();
        if (!tryAdvance(SessionState::CodeReady)) {
            key.wipe();
            return cancelledOutcome(std::move(outcome));
        }

        SessionOutcome result = role_ == SessionRole::Sender
            ? runSender(std::move(outcome), key.key)
            : runReceiver(std::move(outcome), key.key);
        key.wipe();
        return result;
    }

    SessionOutcome TransferSession::runSender(SessionOutcome outcome, const std::vector<uint8_t>& key) {
        const SecurityEngine& security = context_.security();

        if (!tryAdvance(SessionState::Negotiating)) {
            return cancelledOutcome(std::move(outcome));
        }

        publishStatus("Probing network");
        NetworkProfile profile = context_.profiler().classify();
        outcome.profile = profile;
        if (cancel_.isCancelled()) {
            return cancelledOutcome(std::move(outcome));
        }

        const uint64_t size = payload_.size();
        const EncryptionMode mode = security.selectMode(size, profile.networkType);
        outcome.mode = mode;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            selectedMode_ = mode;
        }

        publishStatus(std::string("Encrypting with ") + toString(mode));
        auto ciphertext = security.encrypt(payload_, key, mode);
        if (ciphertext.isError()) {
            return finish(std::move(outcome), SessionState::Failed, ciphertext.error());
        }

        TransferMetadata metadata;
        metadata.transferId = transferId_;
        metadata.fileName = fileName_;
        metadata.fileSize = size;
        metadata.digest = SecurityEngine::digestHex(payload_);
        metadata.encryptionMode = toString(mode);
        outcome.metadata = metadata;

        const std::vector<uint8_t> package = TransferPackage::build(metadata, ciphertext.value());
        const auto order = context_.manager().selectOrder(profile, package.size(), cancel_);
        if (cancel_.isCancelled()) {
            return cancelledOutcome(std::move(outcome));
        }

        if (!tryAdvance(SessionState::Transporting)) {
            return cancelledOutcome(std::move(outcome));
        }
        publishProgress(0, size);

        auto observer = [this](const AttemptRecord& record, size_t index, size_t total) {
            publishStatus("Attempt " + std::to_string(index + 1) + "/" + std::to_string(total) +
                          " via " + record.transportName + ": " + toString(record.outcome));
            if (record.outcome != AttemptOutcome::Success && index + 1 < total) {
                tryAdvance(SessionState::Transporting);
            }
        };

        auto sent = context_.manager().sendWithFailover(order, package, metadata, attempts_, cancel_, observer);
        if (sent.isError()) {
            if (sent.error().error.is(ErrorCode::Cancelled)) {
                return cancelledOutcome(std::move(outcome));
            }
            return finish(std::move(outcome), SessionState::Failed, sent.error().error);
        }

        const auto records = attempts_.snapshot();
        outcome.transportName = records.empty() ? std::string() : records.back().transportName;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            selectedTransport_ = outcome.transportName;
        }
        publishProgress(size, size);

        if (!tryAdvance(SessionState::Verifying)) {
            return cancelledOutcome(std::move(outcome));
        }
        publishStatus("Delivered via " + outcome.transportName);
        if (!commitCompleted()) {
            return cancelledOutcome(std::move(outcome));
        }
        if (completionHook_) {
            completionHook_();
        }
        return finish(std::move(outcome), SessionState::Completed, std::nullopt);
    }

    SessionOutcome TransferSession::runReceiver(SessionOutcome outcome, const std::vector<uint8_t>& key) {
        const SecurityEngine& security = context_.security();

        if (!tryAdvance(SessionState::Negotiating)) {
            return cancelledOutcome(std::move(outcome));
        }

        publishStatus("Probing network");
        NetworkProfile profile = context_.profiler().classify();
        outcome.profile = profile;
        if (cancel_.isCancelled()) {
            return cancelledOutcome(std::move(outcome));
        }

        const TransferMetadata request = TransferMetadata::forReceive(transferId_);
        const auto order = context_.manager().selectOrder(profile, 0, cancel_);
        if (!tryAdvance(SessionState::Transporting)) {
            return cancelledOutcome(std::move(outcome));
        }
        publishStatus("Waiting for sender");

        auto observer = [this](const AttemptRecord& record, size_t index, size_t total) {
            publishStatus("Attempt " + std::to_string(index + 1) + "/" + std::to_string(total) +
                          " via " + record.transportName + ": " + toString(record.outcome));
            if (record.outcome != AttemptOutcome::Success && index + 1 < total) {
                tryAdvance(SessionState::Transporting);
            }
        };

        auto received = context_.manager().receiveWithFailover(order, request, attempts_, cancel_, observer);
        if (received.isError()) {
            if (received.error().error.is(ErrorCode::Cancelled)) {
                return cancelledOutcome(std::move(outcome));
            }
            return finish(std::move(outcome), SessionState::Failed, received.error().error);
        }

        const auto records = attempts_.snapshot();
        outcome.transportName = records.empty() ? std::string() : records.back().transportName;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            selectedTransport_ = outcome.transportName;
        }

        if (!tryAdvance(SessionState::Verifying)) {
            return cancelledOutcome(std::move(outcome));
        }
        publishStatus("Verifying");

        auto parsed = TransferPackage::parse(received.value());
        if (parsed.isError()) {
            return finish(std::move(outcome), SessionState::Failed, parsed.error());
        }
        TransferPackage::Parsed package = parsed.takeValue();
        if (package.metadata.transferId != transferId_) {
            return finish(std::move(outcome), SessionState::Failed,
                          Error(ErrorCode::InvalidPackage, "Package belongs to another transfer", kComponent));
        }
        outcome.metadata = package.metadata;
        fileName_ = package.metadata.fileName;

        EncryptionMode mode;
        if (package.metadata.encryptionMode.empty()) {
            mode = security.selectMode(package.metadata.fileSize, profile.networkType);
            LOG_DEBUG_COMP_IF(std::string("Header carries no mode, using ") + toString(mode), kComponent);
        } else {
            auto parsedMode = parseEncryptionMode(package.metadata.encryptionMode);
            if (!parsedMode) {
                return finish(std::move(outcome), SessionState::Failed,
                              Error(ErrorCode::InvalidPackage,
                                    "Unknown encryption mode '" + package.metadata.encryptionMode + "'",
                                    kComponent));
            }
            mode = *parsedMode;
        }
        outcome.mode = mode;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            selectedMode_ = mode;
        }

        auto plaintext = security.decrypt(package.ciphertext, key, mode);
        if (plaintext.isError()) {
            return finish(std::move(outcome), SessionState::Failed, plaintext.error());
        }

        std::vector<uint8_t> data = plaintext.takeValue();
        if (data.size() != package.metadata.fileSize ||
            !SecurityEngine::verifyDigest(data, package.metadata.digest)) {
            context_.metrics().incrementIntegrityFailures();
            return finish(std::move(outcome), SessionState::Failed,
                          Error(ErrorCode::IntegrityError, "Payload digest does not match header", kComponent));
        }

        const uint64_t delivered = data.size();
        outcome.payload = std::move(data);
        if (!commitCompleted()) {
            return cancelledOutcome(std::move(outcome));
        }
        if (completionHook_) {
            completionHook_();
        }
        publishProgress(delivered, package.metadata.fileSize);
        return finish(std::move(outcome), SessionState::Completed, std::nullopt);
    }

    bool TransferSession::tryAdvance(SessionState to) {
        SessionState from;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (isTerminal(state_)) {
                return false;
            }
            const bool selfLoop = to == SessionState::Transporting && state_ == SessionState::Transporting;
            if (!selfLoop && static_cast<int>(to) <= static_cast<int>(state_)) {
                return false;
            }
            from = state_;
            state_ = to;
            history_.push_back({from, to, std::chrono::system_clock::now()});
        }
        LOG_DEBUG_COMP_IF("Transfer " + transferId_ + ": " + toString(from) + " -> " + toString(to), kComponent);
        publishState(from, to);
        return true;
    }

    bool TransferSession::commitCompleted() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SessionState::Verifying) {
                return false;
            }
            state_ = SessionState::Completed;
            history_.push_back({SessionState::Verifying, SessionState::Completed, std::chrono::system_clock::now()});
        }
        publishState(SessionState::Verifying, SessionState::Completed);
        return true;
    }

    SessionOutcome TransferSession::finish(SessionOutcome outcome, SessionState terminal, std::optional<Error> error) {
        auto& logger = Logger::instance();
        auto& metrics = context_.metrics();

        SessionState from = SessionState::Idle;
        bool transitioned = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (isTerminal(state_)) {
                // Settled earlier by cancel() or commitCompleted()
                terminal = state_;
            } else {
                from = state_;
                state_ = terminal;
                history_.push_back({from, terminal, std::chrono::system_clock::now()});
                transitioned = true;
            }
        }

        if (terminal == SessionState::Cancelled) {
            if (!error || !error->is(ErrorCode::Cancelled)) {
                error = Error(ErrorCode::Cancelled, "Transfer cancelled", kComponent);
            }
            outcome.payload.clear();
        }
        if (transitioned) {
            publishState(from, terminal);
        }

        outcome.state = terminal;
        outcome.error = std::move(error);
        outcome.attempts = attempts_.snapshot();

        switch (terminal) {
            case SessionState::Completed:
                metrics.incrementSessionsCompleted();
                logger.log(LogLevel::INFO, "Transfer " + transferId_ + " completed via " +
                           outcome.transportName, kComponent);
                break;
            case SessionState::Cancelled:
                metrics.incrementSessionsCancelled();
                logger.log(LogLevel::INFO, "Transfer " + transferId_ + " cancelled", kComponent);
                break;
            default:
                metrics.incrementSessionsFailed();
                logger.log(LogLevel::ERROR, "Transfer " + transferId_ + " failed: " +
                           (outcome.error ? outcome.error->toString() : std::string("unknown error")),
                           kComponent);
                break;
        }
        return outcome;
    }

    SessionOutcome TransferSession::cancelledOutcome(SessionOutcome outcome) {
        return finish(std::move(outcome), SessionState::Cancelled,
                      Error(ErrorCode::Cancelled, "Transfer cancelled", kComponent));
    }

    void TransferSession::publishState(SessionState from, SessionState to) {
        if (observer_) {
            context_.dispatcher().publish(SessionEvent::stateChanged(observer_, transferId_, from, to));
        }
    }

    void TransferSession::publishStatus(const std::string& phase) {
        if (observer_) {
            context_.dispatcher().publish(SessionEvent::status(observer_, transferId_, phase));
        }
    }

    void TransferSession::publishProgress(uint64_t bytes, uint64_t total) {
        if (observer_) {
            context_.dispatcher().publish(SessionEvent::progress(observer_, transferId_, bytes, total, fileName_));
        }
    }

}
