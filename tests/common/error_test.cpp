// =============================================================================
// tag-counter - Error Handling Tests
// =============================================================================

#include "tagc/common/error.h"

#include <gtest/gtest.h>

#include <string>
#include <system_error>

#include "tagc/common/logger.h"

namespace tagc {
namespace {

// =============================================================================
// Exit Codes
// =============================================================================

TEST(ErrorCodeTest, ExitCodes) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFormatError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kConfigError), 4);
}

TEST(ErrorCodeTest, Names) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kIOError), "I/O error");
    EXPECT_EQ(errorCodeToString(ErrorCode::kConfigError), "configuration error");
}

TEST(ErrorTest, SubclassesCarryTheirCode) {
    EXPECT_EQ(UsageError("x").code(), ErrorCode::kUsageError);
    EXPECT_EQ(IOError("x").code(), ErrorCode::kIOError);
    EXPECT_EQ(FormatError("x").code(), ErrorCode::kFormatError);
    EXPECT_EQ(ConfigError("x").exitCode(), 4);
}

TEST(ErrorTest, WhatIncludesCodeAndMessage) {
    FormatError error("bad record");
    const std::string what = error.what();
    EXPECT_NE(what.find("[format error]"), std::string::npos);
    EXPECT_NE(what.find("bad record"), std::string::npos);
    EXPECT_EQ(error.message(), "bad record");
}

TEST(ErrorTest, ContextIsFormatted) {
    ConfigError error("could not read gene id", ErrorContext("genes.csv").withLine(7));
    ASSERT_TRUE(error.context().has_value());
    ASSERT_TRUE(error.context()->lineNumber.has_value());
    EXPECT_EQ(*error.context()->lineNumber, 7u);

    const std::string what = error.what();
    EXPECT_NE(what.find("file: genes.csv"), std::string::npos);
    EXPECT_NE(what.find("line: 7"), std::string::npos);
}

TEST(ErrorTest, SystemErrorIsAppended) {
    IOError error("can't opendir reads", std::make_error_code(std::errc::no_such_file_or_directory));
    ASSERT_TRUE(error.systemError().has_value());
    EXPECT_NE(std::string(error.what()).find("can't opendir reads"), std::string::npos);
}

TEST(ErrorTest, CatchableAsBase) {
    try {
        throw IOError("disk gone");
    } catch (const TagcException& e) {
        EXPECT_EQ(e.exitCode(), 2);
    }
}

// =============================================================================
// Logger
// =============================================================================

TEST(LoggerTest, InitializedForTests) {
    EXPECT_TRUE(log::isInitialized());
    EXPECT_NE(log::logger(), nullptr);
}

}  // namespace
}  // namespace tagc
