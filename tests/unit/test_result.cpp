#include <gtest/gtest.h>

#include "Result.h"

#include <string>

using namespace CodeDrop;

namespace {
    Result<int> parsePort(const std::string& s) {
        if (s.empty()) {
            return Error(ErrorCode::InvalidArgument, "empty port", "Parser");
        }
        return std::stoi(s);
    }
}

TEST(ResultTest, OkAndErrorAccessors) {
    auto ok = parsePort("443");
    ASSERT_TRUE(ok.isOk());
    EXPECT_EQ(ok.value(), 443);
    EXPECT_THROW(ok.error(), BadResultAccess);

    auto bad = parsePort("");
    ASSERT_TRUE(bad.isError());
    EXPECT_TRUE(bad.error().is(ErrorCode::InvalidArgument));
    EXPECT_EQ(bad.valueOr(80), 80);
    EXPECT_THROW(bad.value(), BadResultAccess);
}

TEST(ResultTest, TakeValueMovesOut) {
    Result<std::string> name(std::string("relay-eu"));
    std::string taken = name.takeValue();
    EXPECT_EQ(taken, "relay-eu");
}

TEST(ResultTest, ConvertsFromErrorOfAnotherResult) {
    auto outer = [](const std::string& s) -> Result<std::string> {
        auto port = parsePort(s);
        if (port.isError()) {
            return port.error();
        }
        return "port " + std::to_string(port.value());
    };
    EXPECT_EQ(outer("80").value(), "port 80");
    EXPECT_EQ(outer("").error().message, "empty port");
}

TEST(ResultTest, OnErrorRunsOnlyForErrors) {
    int calls = 0;
    parsePort("1").onError([&](const Error&) { calls++; });
    parsePort("").onError([&](const Error&) { calls++; });
    EXPECT_EQ(calls, 1);
}

TEST(ResultTest, VoidResult) {
    VoidResult ok = Ok();
    EXPECT_TRUE(ok.isOk());

    VoidResult failed = Err(ErrorCode::Cancelled, "stopped", "Session");
    ASSERT_TRUE(failed.isError());
    EXPECT_EQ(failed.error().toString(), "[Session] stopped (Cancelled)");
}

TEST(ResultTest, FatalClassification) {
    EXPECT_FALSE(isFatal(ErrorCode::SendFailure));
    EXPECT_FALSE(isFatal(ErrorCode::AttemptTimeout));
    EXPECT_FALSE(isFatal(ErrorCode::None));
    EXPECT_TRUE(isFatal(ErrorCode::WeakCode));
    EXPECT_TRUE(isFatal(ErrorCode::IntegrityError));
    EXPECT_TRUE(isFatal(ErrorCode::Cancelled));
}
