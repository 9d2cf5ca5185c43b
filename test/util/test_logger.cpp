#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include "util/Expected.hpp"
#include "util/Logger.hpp"

using namespace gitlanes;

// Test: GITLANES_LOG values
TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parseLevel("3"), LogLevel::Debug);
    EXPECT_EQ(Logger::parseLevel("info"), LogLevel::Info);
    EXPECT_EQ(Logger::parseLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(Logger::parseLevel("0"), LogLevel::Error);
    EXPECT_EQ(Logger::parseLevel("verbose"), LogLevel::Info);
}

// Test: Messages below the level are dropped
TEST(LoggerTest, LevelFiltersOutput) {
    Logger& log = Logger::instance();
    LogLevel saved = log.level();

    std::stringstream captured;
    std::streambuf* oldCout = std::cout.rdbuf(captured.rdbuf());

    log.setLevel(LogLevel::Info);
    log.info("shown");
    log.debug("hidden");
    log.setLevel(LogLevel::Debug);
    log.debug("now shown");

    std::cout.rdbuf(oldCout);
    log.setLevel(saved);

    EXPECT_EQ(captured.str(), "[info ] shown\n[debug] now shown\n");
}

// Test: Error code names used in CLI diagnostics
TEST(ExpectedTest, ErrorCodeNames) {
    EXPECT_STREQ(errorCodeName(ErrorCode::OrderViolation), "order-violation");
    EXPECT_STREQ(errorCodeName(ErrorCode::MalformedRecord), "malformed-record");
    EXPECT_STREQ(errorCodeName(ErrorCode::IoError), "io-error");
}

// Test: Value and error states
TEST(ExpectedTest, ValueAndError) {
    Expected<int> ok(42);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), 42);

    Expected<int> failed(Error{ErrorCode::InvalidArgs, "bad"});
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::InvalidArgs);

    Expected<void> done;
    EXPECT_TRUE(done.has_value());
}
