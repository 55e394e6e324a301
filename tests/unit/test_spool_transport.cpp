/**
 * @file test_spool_transport.cpp
 * @brief Shared-directory backend against a scratch directory
 */

#include <gtest/gtest.h>

#include "Logger.h"
#include "SpoolTransport.h"

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace CodeDrop;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class SpoolTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("codedrop_spool_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);

        config_.spoolDir = dir_.string();
        config_.callTimeout = 500ms;
        config_.extra["spool.poll_interval_ms"] = "10";

        metadata_.transferId = "00112233445566778899aabbccddeeff";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    TransportConfig config_;
    TransferMetadata metadata_;
    CancellationToken cancel_;
};

TEST_F(SpoolTransportTest, SetupCreatesDirectory) {
    SpoolTransport spool;
    ASSERT_TRUE(spool.setup(config_).isOk());
    EXPECT_TRUE(fs::is_directory(dir_));
    EXPECT_TRUE(spool.isAvailable(cancel_));
    EXPECT_EQ(spool.getName(), "local-spool");
    EXPECT_EQ(spool.getPriority(), 50);
}

TEST_F(SpoolTransportTest, SetupWithoutDirectoryFails) {
    SpoolTransport spool;
    auto result = spool.setup(TransportConfig{});
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
    EXPECT_FALSE(spool.isAvailable(cancel_));
}

TEST_F(SpoolTransportTest, SendThenReceiveConsumesFiles) {
    SpoolTransport sender("spool-a", 10);
    SpoolTransport receiver("spool-b", 10);
    ASSERT_TRUE(sender.setup(config_).isOk());
    ASSERT_TRUE(receiver.setup(config_).isOk());

    const std::vector<uint8_t> payload = {1, 2, 3, 4, 5, 0, 255};
    ASSERT_TRUE(sender.send(payload, metadata_, cancel_).isOk());
    EXPECT_TRUE(fs::exists(sender.payloadPath(metadata_.transferId)));
    EXPECT_TRUE(fs::exists(sender.readyPath(metadata_.transferId)));

    auto received = receiver.receive(metadata_, cancel_);
    ASSERT_TRUE(received.isOk()) << received.error().toString();
    EXPECT_EQ(received.value(), payload);
    EXPECT_FALSE(fs::exists(sender.payloadPath(metadata_.transferId)));
    EXPECT_FALSE(fs::exists(sender.readyPath(metadata_.transferId)));
}

TEST_F(SpoolTransportTest, ReceiveWaitsForLateSender) {
    SpoolTransport sender;
    SpoolTransport receiver;
    config_.callTimeout = 3000ms;
    ASSERT_TRUE(sender.setup(config_).isOk());
    ASSERT_TRUE(receiver.setup(config_).isOk());

    std::thread late([&] {
        std::this_thread::sleep_for(100ms);
        CancellationToken token;
        EXPECT_TRUE(sender.send({9, 9, 9}, metadata_, token).isOk());
    });

    auto received = receiver.receive(metadata_, cancel_);
    late.join();
    ASSERT_TRUE(received.isOk());
    EXPECT_EQ(received.value(), (std::vector<uint8_t>{9, 9, 9}));
}

TEST_F(SpoolTransportTest, ReceiveTimesOutWithoutPackage) {
    SpoolTransport spool;
    config_.callTimeout = 50ms;
    ASSERT_TRUE(spool.setup(config_).isOk());

    auto received = spool.receive(metadata_, cancel_);
    ASSERT_TRUE(received.isError());
    EXPECT_EQ(received.error().code, ErrorCode::ReceiveFailure);
}

TEST_F(SpoolTransportTest, ReceiveReturnsPromptlyOnCancel) {
    SpoolTransport spool;
    config_.callTimeout = 10000ms;
    ASSERT_TRUE(spool.setup(config_).isOk());

    std::thread canceller([this] {
        std::this_thread::sleep_for(50ms);
        cancel_.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto received = spool.receive(metadata_, cancel_);
    canceller.join();

    ASSERT_TRUE(received.isError());
    EXPECT_EQ(received.error().code, ErrorCode::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(SpoolTransportTest, SendRespectsCancellation) {
    SpoolTransport spool;
    ASSERT_TRUE(spool.setup(config_).isOk());
    cancel_.cancel();

    auto result = spool.send({1}, metadata_, cancel_);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_FALSE(fs::exists(spool.readyPath(metadata_.transferId)));
}

TEST_F(SpoolTransportTest, RejectsIdsThatCouldEscapeDirectory) {
    SpoolTransport spool;
    ASSERT_TRUE(spool.setup(config_).isOk());

    metadata_.transferId = "../../etc/passwd";
    auto result = spool.send({1}, metadata_, cancel_);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(SpoolTransportTest, CloseMakesBackendUnavailable) {
    SpoolTransport spool;
    ASSERT_TRUE(spool.setup(config_).isOk());
    ASSERT_TRUE(spool.close().isOk());

    EXPECT_FALSE(spool.isAvailable(cancel_));
    auto result = spool.send({1}, metadata_, cancel_);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::BackendUnavailable);
    EXPECT_TRUE(spool.close().isOk());
}

TEST_F(SpoolTransportTest, UnavailableWhenDirectoryDisappears) {
    SpoolTransport spool;
    ASSERT_TRUE(spool.setup(config_).isOk());
    fs::remove_all(dir_);
    EXPECT_FALSE(spool.isAvailable(cancel_));
}

TEST_F(SpoolTransportTest, PayloadCleanupFailureIsLoggedEvenWhenMarkerIsRemoved) {
    SpoolTransport spool;
    ASSERT_TRUE(spool.setup(config_).isOk());

    // A non-empty directory in place of the payload cannot be removed; the marker can
    const auto payloadFile = spool.payloadPath(metadata_.transferId);
    fs::create_directories(payloadFile / "pinned");
    { std::ofstream(spool.readyPath(metadata_.transferId)) << "0\n"; }

    const auto logPath = dir_.string() + ".log";
    auto& logger = Logger::instance();
    logger.setConsoleOutput(false);
    logger.setLogFile(logPath);

    auto received = spool.receive(metadata_, cancel_);

    logger.setLogFile("/dev/null");
    logger.setConsoleOutput(true);

    std::ifstream file(logPath);
    std::stringstream log;
    log << file.rdbuf();
    std::error_code ec;
    fs::remove(logPath, ec);

    ASSERT_TRUE(received.isOk());
    EXPECT_FALSE(fs::exists(spool.readyPath(metadata_.transferId)));
    EXPECT_TRUE(fs::exists(payloadFile));
    EXPECT_NE(log.str().find("Could not remove " + payloadFile.string()), std::string::npos);
}
