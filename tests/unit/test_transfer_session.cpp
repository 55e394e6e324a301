/**
 * @file test_transfer_session.cpp
 * @brief Session state machine end to end over in-memory backends
 */

#include <gtest/gtest.h>

#include "MockTransports.h"
#include "OrchestrationContext.h"
#include "TransferCode.h"
#include "TransferPackage.h"
#include "TransferSession.h"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>

using namespace CodeDrop;
using namespace std::chrono_literals;

namespace {

class RecordingObserver : public SessionObserver {
public:
    void onStateChanged(const std::string&, SessionState from, SessionState to) override {
        std::lock_guard<std::mutex> lock(mutex);
        transitions.emplace_back(from, to);
    }

    void onStatus(const std::string&, const std::string& phase) override {
        std::lock_guard<std::mutex> lock(mutex);
        statuses.push_back(phase);
    }

    void onProgress(const std::string&, uint64_t bytes, uint64_t total, const std::string& fileName) override {
        std::lock_guard<std::mutex> lock(mutex);
        progress.emplace_back(bytes, total);
        lastFileName = fileName;
    }

    std::mutex mutex;
    std::vector<std::pair<SessionState, SessionState>> transitions;
    std::vector<std::string> statuses;
    std::vector<std::pair<uint64_t, uint64_t>> progress;
    std::string lastFileName;
};

const std::string kCode = "delta-lima-tango-4821";

std::vector<uint8_t> payloadOf(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

class TransferSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        build(OrchestrationSettings());
    }

    void TearDown() override {
        context_.reset();
    }

    void build(OrchestrationSettings settings) {
        settings.profiler.hosts = {"192.0.2.1"};
        settings.profiler.timeout = 300ms;
        settings.profiler.perProbeTimeout = 100ms;
        settings.transport.attemptTimeout = 3000ms;
        settings.transport.availabilityTimeout = 500ms;
        settings.transport.maxTotalTimeout = 10000ms;
        settings.poolThreads = 4;

        context_.reset();
        context_ = std::make_unique<OrchestrationContext>(settings);

        auto& profiler = context_->profiler();
        profiler.setPortProbe([](const std::string&, int, std::chrono::milliseconds) {
            return ProbeOutcome::Reachable;
        });
        profiler.setInterfaceLister([]() { return std::vector<std::string>{"eth0"}; });
        profiler.setEnvLookup([](const std::string&) { return std::optional<std::string>(); });
    }

    MockTransport* add(const std::string& name, int priority) {
        return context_->registry().emplaceTransport<MockTransport>({}, name, priority, store_).value();
    }

    SessionOutcome runToEnd(SessionRequest request, std::shared_ptr<SessionObserver> observer = nullptr) {
        auto session = context_->createSession(std::move(request), std::move(observer));
        auto outcome = session->run();
        EXPECT_TRUE(outcome.isOk());
        return outcome.takeValue();
    }

    static bool waitForState(const TransferSession& session, SessionState state) {
        for (int i = 0; i < 500; ++i) {
            if (session.state() == state) return true;
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }

    std::shared_ptr<MockTransport::Store> store_ = std::make_shared<MockTransport::Store>();
    std::unique_ptr<OrchestrationContext> context_;
};

TEST_F(TransferSessionTest, SendThenReceiveDeliversVerifiedPayload) {
    add("memory", 10);
    const auto data = payloadOf("quarterly figures, do not share");

    auto sender = context_->createSession(SessionRequest::send("figures.txt", data, kCode));
    auto sent = sender->run();
    ASSERT_TRUE(sent.isOk());
    ASSERT_TRUE(sent.value().succeeded()) << sent.value().error->toString();
    EXPECT_EQ(sent.value().mode, EncryptionMode::ChaCha20Poly1305);
    EXPECT_EQ(sent.value().transportName, "memory");

    const std::vector<SessionState> expected = {
        SessionState::CodeReady, SessionState::Negotiating, SessionState::Transporting,
        SessionState::Verifying, SessionState::Completed};
    auto history = sender->stateHistory();
    ASSERT_EQ(history.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(history[i].to, expected[i]);
    }

    // The code never leaves the process
    {
        std::lock_guard<std::mutex> lock(store_->mutex);
        const auto& stored = store_->packages.at(TransferCode::transferId(kCode));
        const std::string raw(stored.begin(), stored.end());
        EXPECT_EQ(raw.find(kCode), std::string::npos);
    }

    auto received = runToEnd(SessionRequest::receive("  Delta Lima Tango 4821 "));
    ASSERT_TRUE(received.succeeded()) << received.error->toString();
    EXPECT_EQ(received.payload, data);
    EXPECT_EQ(received.metadata.fileName, "figures.txt");
    EXPECT_EQ(received.mode, EncryptionMode::ChaCha20Poly1305);

    auto sessions = context_->metrics().snapshot().sessions;
    EXPECT_EQ(sessions.sessionsStarted, 2u);
    EXPECT_EQ(sessions.sessionsCompleted, 2u);
}

TEST_F(TransferSessionTest, SenderGeneratesCodeWhenNoneGiven) {
    auto session = context_->createSession(SessionRequest::send("a.bin", payloadOf("x")));
    EXPECT_TRUE(TransferCode::isWellFormed(session->code()));
    EXPECT_EQ(session->transferId(), TransferCode::transferId(session->code()));
    EXPECT_EQ(session->state(), SessionState::Idle);
    EXPECT_EQ(session->role(), SessionRole::Sender);
}

TEST_F(TransferSessionTest, WeakCodeFailsBeforeAnyTransport) {
    auto* backend = add("memory", 10);
    auto outcome = runToEnd(SessionRequest::receive("abc"));

    EXPECT_EQ(outcome.state, SessionState::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::WeakCode);
    EXPECT_TRUE(outcome.attempts.empty());
    EXPECT_EQ(backend->receiveCalls.load(), 0);
}

TEST_F(TransferSessionTest, ExhaustionCarriesAttemptLog) {
    auto* a = add("relay", 1);
    auto* b = add("overlay", 2);
    a->failSend = true;
    b->failSend = true;
    b->failMessage = "proxy refused CONNECT";

    auto outcome = runToEnd(SessionRequest::send("f", payloadOf("data"), kCode));
    EXPECT_EQ(outcome.state, SessionState::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::AllTransportsExhausted);
    ASSERT_EQ(outcome.attempts.size(), 2u);
    EXPECT_EQ(outcome.attempts[0].transportName, "relay");
    EXPECT_EQ(outcome.attempts[1].transportName, "overlay");
    EXPECT_NE(outcome.error->message.find("proxy refused"), std::string::npos);
}

TEST_F(TransferSessionTest, FailoverLoopsOnTransportingAndRecordsWinner) {
    auto* a = add("relay", 1);
    add("spool", 2);
    a->failSend = true;

    auto session = context_->createSession(SessionRequest::send("f", payloadOf("data"), kCode));
    auto outcome = session->run().takeValue();
    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(session->selectedTransport(), "spool");
    EXPECT_EQ(session->attemptLog().size(), 2u);

    auto history = session->stateHistory();
    auto selfLoop = std::find_if(history.begin(), history.end(), [](const StateTransition& t) {
        return t.from == SessionState::Transporting && t.to == SessionState::Transporting;
    });
    EXPECT_NE(selfLoop, history.end());
}

TEST_F(TransferSessionTest, CancelWhileTransportingStopsAttempts) {
    auto* slow = add("slow", 1);
    auto* next = add("next", 2);
    slow->delay = 5000ms;

    auto session = context_->createSession(SessionRequest::send("f", payloadOf("data"), kCode));
    ASSERT_TRUE(session->start().isOk());
    ASSERT_TRUE(waitForState(*session, SessionState::Transporting));
    std::this_thread::sleep_for(50ms);

    session->cancel();
    EXPECT_EQ(session->state(), SessionState::Cancelled);

    auto outcome = session->waitFor(3000ms);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->state, SessionState::Cancelled);
    ASSERT_TRUE(outcome->error.has_value());
    EXPECT_EQ(outcome->error->code, ErrorCode::Cancelled);
    EXPECT_EQ(next->sendCalls.load(), 0);
    EXPECT_EQ(context_->metrics().snapshot().sessions.sessionsCancelled, 1u);
}

TEST_F(TransferSessionTest, TamperedPackageFailsIntegrityWithoutRetry) {
    auto* backend = add("memory", 1);
    ASSERT_TRUE(runToEnd(SessionRequest::send("f", payloadOf("secret data"), kCode)).succeeded());

    backend->corruptOnReceive = true;
    auto outcome = runToEnd(SessionRequest::receive(kCode));
    EXPECT_EQ(outcome.state, SessionState::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::IntegrityError);
    EXPECT_TRUE(outcome.payload.empty());
    EXPECT_EQ(backend->receiveCalls.load(), 1);
}

TEST_F(TransferSessionTest, CancelAfterVerificationKeepsVerifiedPayload) {
    add("memory", 1);
    const auto data = payloadOf("verified before the user hit cancel");
    ASSERT_TRUE(runToEnd(SessionRequest::send("late.txt", data, kCode)).succeeded());

    auto session = context_->createSession(SessionRequest::receive(kCode));
    TransferSession* raw = session.get();
    SessionState seenByHook = SessionState::Idle;
    session->setCompletionHook([raw, &seenByHook]() {
        raw->cancel();
        seenByHook = raw->state();
    });

    auto outcome = session->run().takeValue();
    EXPECT_EQ(seenByHook, SessionState::Completed);
    EXPECT_EQ(outcome.state, SessionState::Completed);
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_EQ(outcome.payload, data);
    EXPECT_EQ(session->state(), SessionState::Completed);

    const auto history = session->stateHistory();
    ASSERT_FALSE(history.empty());
    EXPECT_EQ(history.back().from, SessionState::Verifying);
    EXPECT_EQ(history.back().to, SessionState::Completed);
    for (const auto& step : history) {
        EXPECT_NE(step.to, SessionState::Cancelled);
    }
    EXPECT_EQ(context_->metrics().snapshot().sessions.sessionsCancelled, 0u);
    EXPECT_EQ(context_->metrics().snapshot().sessions.sessionsCompleted, 2u);
}

TEST_F(TransferSessionTest, CancelAfterDeliveryLeavesSenderCompleted) {
    add("memory", 1);
    auto session = context_->createSession(SessionRequest::send("f", payloadOf("data"), kCode));
    TransferSession* raw = session.get();
    session->setCompletionHook([raw]() { raw->cancel(); });

    auto outcome = session->run().takeValue();
    EXPECT_EQ(outcome.state, SessionState::Completed);
    EXPECT_EQ(outcome.transportName, "memory");
    EXPECT_EQ(session->state(), SessionState::Completed);
}

TEST_F(TransferSessionTest, SecondSessionForSameTransferIsRejected) {
    auto* slow = add("slow", 1);
    slow->delay = 3000ms;

    auto first = context_->createSession(SessionRequest::receive(kCode));
    ASSERT_TRUE(first->start().isOk());

    auto second = context_->createSession(SessionRequest::receive(kCode));
    auto started = second->start();
    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, ErrorCode::TransferInProgress);
    EXPECT_EQ(second->state(), SessionState::Idle);

    first->cancel();
    first->wait();

    // The slot is free again once the first session is over
    auto third = context_->createSession(SessionRequest::receive(kCode));
    ASSERT_TRUE(third->start().isOk());
    third->cancel();
    EXPECT_EQ(third->wait().state, SessionState::Cancelled);
}

TEST_F(TransferSessionTest, StartingTwiceIsInvalid) {
    add("memory", 1);
    auto session = context_->createSession(SessionRequest::send("f", payloadOf("x"), kCode));
    ASSERT_TRUE(session->run().isOk());

    auto again = session->start();
    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
}

TEST_F(TransferSessionTest, CancelBeforeStart) {
    auto session = context_->createSession(SessionRequest::receive(kCode));
    session->cancel();
    EXPECT_EQ(session->state(), SessionState::Cancelled);
    EXPECT_TRUE(session->start().isError());
    EXPECT_FALSE(session->waitFor(10ms).has_value());
}

TEST_F(TransferSessionTest, ObserverSeesStatesStatusAndProgress) {
    add("memory", 1);
    auto observer = std::make_shared<RecordingObserver>();
    const auto data = payloadOf("0123456789");

    auto outcome = runToEnd(SessionRequest::send("digits.txt", data, kCode), observer);
    ASSERT_TRUE(outcome.succeeded());
    context_->dispatcher().flush();

    std::lock_guard<std::mutex> lock(observer->mutex);
    ASSERT_FALSE(observer->transitions.empty());
    EXPECT_EQ(observer->transitions.front().first, SessionState::Idle);
    EXPECT_EQ(observer->transitions.back().second, SessionState::Completed);
    EXPECT_FALSE(observer->statuses.empty());
    ASSERT_FALSE(observer->progress.empty());
    EXPECT_EQ(observer->progress.back(), std::make_pair(uint64_t(10), uint64_t(10)));
    EXPECT_EQ(observer->lastFileName, "digits.txt");
}

TEST_F(TransferSessionTest, ForcedModeTravelsInHeader) {
    OrchestrationSettings settings;
    settings.forcedMode = EncryptionMode::Hybrid;
    build(settings);
    add("memory", 1);

    auto sent = runToEnd(SessionRequest::send("f", payloadOf("layered"), kCode));
    ASSERT_TRUE(sent.succeeded());
    EXPECT_EQ(sent.mode, EncryptionMode::Hybrid);
    EXPECT_EQ(sent.metadata.encryptionMode, "Hybrid");

    auto received = runToEnd(SessionRequest::receive(kCode));
    ASSERT_TRUE(received.succeeded());
    EXPECT_EQ(received.mode, EncryptionMode::Hybrid);
    EXPECT_EQ(received.payload, payloadOf("layered"));
}

TEST_F(TransferSessionTest, ReceiverFallsBackToTableWhenHeaderHasNoMode) {
    add("memory", 1);
    const auto data = payloadOf("legacy sender");

    const auto& security = context_->security();
    auto key = security.strengthenCode(kCode, context_->settings().securityContext).value();
    auto ct = security.encrypt(data, key.key, EncryptionMode::ChaCha20Poly1305).value();

    TransferMetadata metadata;
    metadata.transferId = TransferCode::transferId(kCode);
    metadata.fileName = "legacy.txt";
    metadata.fileSize = data.size();
    metadata.digest = SecurityEngine::digestHex(data);
    {
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->packages[metadata.transferId] = TransferPackage::build(metadata, ct);
    }

    auto outcome = runToEnd(SessionRequest::receive(kCode));
    ASSERT_TRUE(outcome.succeeded()) << outcome.error->toString();
    EXPECT_EQ(outcome.mode, EncryptionMode::ChaCha20Poly1305);
    EXPECT_EQ(outcome.payload, data);
}

TEST_F(TransferSessionTest, PackageForAnotherTransferIsRejected) {
    add("memory", 1);
    TransferMetadata foreign;
    foreign.transferId = TransferCode::transferId("some-other-code-1234");
    foreign.fileName = "x";
    foreign.digest = SecurityEngine::digestHex({});
    foreign.encryptionMode = "AES-256-GCM";
    {
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->packages[TransferCode::transferId(kCode)] =
            TransferPackage::build(foreign, std::vector<uint8_t>(28, 0));
    }

    auto outcome = runToEnd(SessionRequest::receive(kCode));
    EXPECT_EQ(outcome.state, SessionState::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::InvalidPackage);
}

TEST_F(TransferSessionTest, EmptyFileRoundTrip) {
    add("memory", 1);
    ASSERT_TRUE(runToEnd(SessionRequest::send("empty", {}, kCode)).succeeded());
    auto outcome = runToEnd(SessionRequest::receive(kCode));
    ASSERT_TRUE(outcome.succeeded());
    EXPECT_TRUE(outcome.payload.empty());
    EXPECT_EQ(outcome.metadata.fileSize, 0u);
}
