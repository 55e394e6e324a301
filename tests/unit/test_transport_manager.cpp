/**
 * @file test_transport_manager.cpp
 * @brief Ranking and sequential failover over mock backends
 */

#include <gtest/gtest.h>

#include "MetricsCollector.h"
#include "MockTransports.h"
#include "ThreadPool.h"
#include "TransportManager.h"
#include "TransportRegistry.h"

#include <chrono>
#include <thread>

using namespace CodeDrop;
using namespace std::chrono_literals;

class TransportManagerTest : public ::testing::Test {
protected:
    TransportManagerTest() : pool_(4) {
        options_.attemptTimeout = 1000ms;
        options_.availabilityTimeout = 500ms;
        options_.maxTotalTimeout = 5000ms;
        metadata_.transferId = "00112233445566778899aabbccddeeff";
        metadata_.fileName = "notes.txt";
    }

    MockTransport* add(const std::string& name, int priority, TransportHints hints = {}) {
        auto result = registry_.emplaceTransport<MockTransport>(std::move(hints), name, priority, store_);
        EXPECT_TRUE(result.isOk());
        return result.value();
    }

    TransportManager& manager() {
        if (!manager_) {
            registry_.seal();
            manager_ = std::make_unique<TransportManager>(registry_, pool_, options_, &metrics_);
        }
        return *manager_;
    }

    std::vector<std::string> names(const std::vector<ITransport*>& order) const {
        std::vector<std::string> out;
        for (auto* t : order) out.push_back(t->getName());
        return out;
    }

    MetricsCollector metrics_;
    std::shared_ptr<MockTransport::Store> store_ = std::make_shared<MockTransport::Store>();
    TransportRegistry registry_;
    ThreadPool pool_;
    TransportManagerOptions options_;
    std::unique_ptr<TransportManager> manager_;
    TransferMetadata metadata_;
    NetworkProfile openProfile_;
    CancellationToken cancel_;
    AttemptLog log_;
};

TEST_F(TransportManagerTest, UnavailableRankedLastDespitePriority) {
    auto* a = add("A", 8);
    add("B", 60);
    a->available = false;

    auto order = manager().selectOrder(openProfile_, 100, cancel_);
    EXPECT_EQ(names(order), (std::vector<std::string>{"B", "A"}));
}

TEST_F(TransportManagerTest, PriorityThenRegistrationOrder) {
    add("relay", 20);
    add("spool", 10);
    add("overlay", 20);

    auto order = manager().selectOrder(openProfile_, 0, cancel_);
    EXPECT_EQ(names(order), (std::vector<std::string>{"spool", "relay", "overlay"}));
}

TEST_F(TransportManagerTest, RestrictiveNetworkDemotesBlockedNativePorts) {
    TransportHints relayHints;
    relayHints.nativePorts = {9009, 9010};
    add("relay", 10, relayHints);
    add("https", 30);

    NetworkProfile restrictive;
    restrictive.isRestrictive = true;
    restrictive.reachablePorts = {443};
    restrictive.networkType = NetworkType::Restrictive;

    auto ranked = manager().rank(restrictive, 0, cancel_);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].name, "https");
    EXPECT_EQ(ranked[1].name, "relay");
    EXPECT_TRUE(ranked[1].demoted);
    EXPECT_TRUE(ranked[1].available);

    // Open network keeps the relay first
    EXPECT_EQ(names(manager().selectOrder(openProfile_, 0, cancel_)),
              (std::vector<std::string>{"relay", "https"}));
}

TEST_F(TransportManagerTest, OversizedPayloadDemotes) {
    TransportHints small;
    small.maxPayloadBytes = 1024;
    add("small", 1, small);
    add("big", 50);

    EXPECT_EQ(names(manager().selectOrder(openProfile_, 4096, cancel_)),
              (std::vector<std::string>{"big", "small"}));
    EXPECT_EQ(names(manager().selectOrder(openProfile_, 512, cancel_)),
              (std::vector<std::string>{"small", "big"}));
}

TEST_F(TransportManagerTest, ExhaustionReportsEveryAttemptInOrder) {
    auto* a = add("A", 1);
    auto* b = add("B", 2);
    a->failSend = true;
    a->failMessage = "connection refused";
    b->failSend = true;
    b->failMessage = "no route to host";

    auto order = manager().selectOrder(openProfile_, 3, cancel_);
    auto result = manager().sendWithFailover(order, {1, 2, 3}, metadata_, log_, cancel_);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().error.code, ErrorCode::AllTransportsExhausted);
    EXPECT_NE(result.error().error.message.find("no route to host"), std::string::npos);

    auto attempts = log_.snapshot();
    ASSERT_EQ(attempts.size(), 2u);
    EXPECT_EQ(attempts[0].transportName, "A");
    EXPECT_EQ(attempts[0].outcome, AttemptOutcome::Failed);
    EXPECT_EQ(attempts[1].transportName, "B");
    EXPECT_EQ(result.error().attempts.size(), 2u);
}

TEST_F(TransportManagerTest, FailsOverToNextBackend) {
    auto* a = add("A", 1);
    auto* b = add("B", 2);
    a->failSend = true;

    std::vector<size_t> seen;
    auto observer = [&seen](const AttemptRecord&, size_t index, size_t total) {
        EXPECT_EQ(total, 2u);
        seen.push_back(index);
    };

    auto order = manager().selectOrder(openProfile_, 3, cancel_);
    auto result = manager().sendWithFailover(order, {9, 9, 9}, metadata_, log_, cancel_, observer);

    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(b->sendCalls.load(), 1);
    EXPECT_EQ(store_->packages[metadata_.transferId], (std::vector<uint8_t>{9, 9, 9}));
    EXPECT_EQ(seen, (std::vector<size_t>{0, 1}));

    auto attempts = log_.snapshot();
    ASSERT_EQ(attempts.size(), 2u);
    EXPECT_EQ(attempts[1].outcome, AttemptOutcome::Success);

    auto stats = metrics_.snapshot().transport;
    EXPECT_EQ(stats.attempts, 2u);
    EXPECT_EQ(stats.failovers, 1u);
    EXPECT_EQ(stats.bytesSent, 3u);
}

TEST_F(TransportManagerTest, SlowBackendTimesOutAndNextIsTried) {
    options_.attemptTimeout = 100ms;
    auto* slow = add("slow", 1);
    add("fast", 2);
    slow->delay = 2000ms;

    const auto start = std::chrono::steady_clock::now();
    auto result = manager().sendWithFailover(manager().selectOrder(openProfile_, 1, cancel_),
                                             {1}, metadata_, log_, cancel_);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);

    ASSERT_TRUE(result.isOk());
    auto attempts = log_.snapshot();
    ASSERT_EQ(attempts.size(), 2u);
    EXPECT_EQ(attempts[0].outcome, AttemptOutcome::TimedOut);
    EXPECT_EQ(attempts[1].outcome, AttemptOutcome::Success);
    EXPECT_EQ(metrics_.snapshot().transport.attemptTimeouts, 1u);
}

TEST_F(TransportManagerTest, CancellationStopsFurtherAttempts) {
    auto* a = add("A", 1);
    auto* b = add("B", 2);
    a->delay = 3000ms;

    auto order = manager().selectOrder(openProfile_, 1, cancel_);
    std::thread canceller([this]() {
        std::this_thread::sleep_for(100ms);
        cancel_.cancel();
    });
    auto result = manager().sendWithFailover(order, {1}, metadata_, log_, cancel_);
    canceller.join();

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().error.code, ErrorCode::Cancelled);
    EXPECT_EQ(b->sendCalls.load(), 0);

    auto attempts = log_.snapshot();
    ASSERT_EQ(attempts.size(), 1u);
    EXPECT_EQ(attempts[0].outcome, AttemptOutcome::Cancelled);
}

TEST_F(TransportManagerTest, PreCancelledTokenStartsNothing) {
    auto* a = add("A", 1);
    auto order = manager().selectOrder(openProfile_, 1, cancel_);
    cancel_.cancel();

    auto result = manager().receiveWithFailover(order, metadata_, log_, cancel_);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().error.code, ErrorCode::Cancelled);
    EXPECT_EQ(a->receiveCalls.load(), 0);
    EXPECT_TRUE(log_.empty());
}

TEST_F(TransportManagerTest, ThrowingBackendIsContained) {
    auto thrower = registry_.emplaceTransport<ThrowingTransport>({}, "thrower", 1, store_);
    ASSERT_TRUE(thrower.isOk());
    add("steady", 2);

    auto result = manager().sendWithFailover(openProfile_, {4, 2}, metadata_, log_, cancel_);
    ASSERT_TRUE(result.isOk());

    auto attempts = log_.snapshot();
    ASSERT_EQ(attempts.size(), 2u);
    EXPECT_EQ(attempts[0].outcome, AttemptOutcome::Failed);
    EXPECT_NE(attempts[0].error.find("backend exploded"), std::string::npos);
}

TEST_F(TransportManagerTest, OverallBudgetCapsAttempts) {
    options_.attemptTimeout = 100ms;
    options_.maxTotalTimeout = 150ms;
    for (const char* name : {"one", "two", "three"}) {
        add(name, 1)->delay = 1000ms;
    }

    auto result = manager().sendWithFailover(manager().selectOrder(openProfile_, 1, cancel_),
                                             {1}, metadata_, log_, cancel_);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().error.code, ErrorCode::AllTransportsExhausted);
    EXPECT_NE(result.error().error.message.find("budget of 150ms exhausted after"), std::string::npos);
    EXPECT_NE(result.error().error.message.find("of 3 transports"), std::string::npos);

    // Backends the budget never reached are still accounted for
    const auto records = log_.snapshot();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records.back().transportName, "three");
    EXPECT_EQ(records.back().outcome, AttemptOutcome::Skipped);
    EXPECT_EQ(records.front().outcome, AttemptOutcome::TimedOut);
    for (const auto& rec : records) {
        if (rec.outcome == AttemptOutcome::Skipped) {
            EXPECT_NE(rec.error.find("budget"), std::string::npos);
        } else {
            EXPECT_EQ(rec.outcome, AttemptOutcome::TimedOut);
        }
    }
    EXPECT_EQ(result.error().attempts.size(), 3u);
}

TEST_F(TransportManagerTest, ReceiveUsesFirstBackendThatHasThePackage) {
    auto emptyStore = std::make_shared<MockTransport::Store>();
    auto empty = registry_.emplaceTransport<MockTransport>({}, "empty", 1, emptyStore);
    ASSERT_TRUE(empty.isOk());
    add("filled", 2);
    store_->packages[metadata_.transferId] = {7, 7};

    auto result = manager().receiveWithFailover(openProfile_, metadata_, log_, cancel_);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value(), (std::vector<uint8_t>{7, 7}));
    EXPECT_EQ(log_.size(), 2u);
    EXPECT_EQ(metrics_.snapshot().transport.bytesReceived, 2u);
}

TEST_F(TransportManagerTest, EmptyRegistryIsExhaustedImmediately) {
    auto result = manager().sendWithFailover(openProfile_, {1}, metadata_, log_, cancel_);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().error.code, ErrorCode::AllTransportsExhausted);
}

TEST(TransportRegistryTest, RejectsDuplicatesAndLateRegistration) {
    TransportRegistry registry;
    EXPECT_TRUE(registry.emplaceTransport<MockTransport>({}, "A", 1).isOk());

    auto dup = registry.emplaceTransport<MockTransport>({}, "A", 2);
    ASSERT_TRUE(dup.isError());
    EXPECT_EQ(dup.error().code, ErrorCode::InvalidArgument);

    auto null = registry.registerTransport(nullptr);
    ASSERT_TRUE(null.isError());

    registry.seal();
    auto late = registry.emplaceTransport<MockTransport>({}, "B", 1);
    ASSERT_TRUE(late.isError());
    EXPECT_EQ(late.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(TransportRegistryTest, CloseAllClosesEachBackendOnce) {
    TransportRegistry registry;
    auto a = registry.emplaceTransport<MockTransport>({}, "A", 1).value();
    auto b = registry.emplaceTransport<MockTransport>({}, "B", 2).value();

    registry.closeAll();
    registry.closeAll();
    EXPECT_EQ(a->closeCalls.load(), 1);
    EXPECT_EQ(b->closeCalls.load(), 1);
    EXPECT_EQ(registry.find("B"), b);
    EXPECT_EQ(registry.find("missing"), nullptr);
}
