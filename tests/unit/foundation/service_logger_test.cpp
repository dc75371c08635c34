#include <gtest/gtest.h>

#include <string>

#include "cas/foundation/service_logger.hpp"
#include "support/mock_logger.hpp"

using namespace cas::foundation;
using cas::test::log_level;
using cas::test::ScopedMockLogger;

class ServiceLoggerTest : public ::testing::Test {
protected:
    ScopedMockLogger mock_;
    ServiceLogger logger_;
};

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

TEST(LogCategoryTest, Names) {
    EXPECT_EQ(logCategoryName(LogCategory::Security), "Security");
    EXPECT_EQ(logCategoryName(LogCategory::Cache), "Cache");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
}

TEST(RedactHashTest, KeepsOnlyPrefix) {
    EXPECT_EQ(redactHash("0123456789abcdef"), "0123456789...");
    EXPECT_EQ(redactHash("short"), "short");
}

TEST_F(ServiceLoggerTest, DefaultCategoryLevels) {
    EXPECT_EQ(logger_.getCategoryLevel(LogCategory::Security), LogLevel::Info);
    EXPECT_EQ(logger_.getCategoryLevel(LogCategory::Audit), LogLevel::Info);
    EXPECT_EQ(logger_.getCategoryLevel(LogCategory::Cache), LogLevel::Warning);
    EXPECT_FALSE(logger_.isEnabled(LogLevel::Info, LogCategory::Cache));
    EXPECT_TRUE(logger_.isEnabled(LogLevel::Warning, LogCategory::Cache));
}

TEST_F(ServiceLoggerTest, FormatsCategoryAndContext) {
    LogContext ctx;
    ctx.principalId = PrincipalId("42");
    ctx.sessionId = SessionId("s-1");
    ctx.clientIp = "10.0.0.1";
    ctx.extra["reason"] = "logout";

    logger_.logWithContext(LogLevel::Info, LogCategory::Security, "Session invalidated", ctx);

    auto records = mock_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message,
              "[Security] Session invalidated "
              "{principal_id=42, session_id=s-1, client_ip=10.0.0.1, reason=logout}");
}

TEST_F(ServiceLoggerTest, FiltersBelowCategoryLevel) {
    logger_.log(LogLevel::Debug, LogCategory::Auth, "dropped");
    logger_.setCategoryLevel(LogCategory::Auth, LogLevel::Debug);
    logger_.log(LogLevel::Debug, LogCategory::Auth, "kept");

    auto records = mock_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Auth] kept");
    EXPECT_EQ(records[0].level, log_level::debug);
}

TEST_F(ServiceLoggerTest, FlushReachesDefaultLogger) {
    ASSERT_TRUE(logger_.flush().hasValue());
    EXPECT_TRUE(mock_->wasFlushed());
}

TEST_F(ServiceLoggerTest, MacroUsesProcessLogger) {
    CAS_LOG_WARN(LogCategory::Storage, "slow query");
    EXPECT_EQ(mock_->matching({"[Storage] slow query"}).size(), 1u);
}
