#include <gtest/gtest.h>
#include "cascade_log.hpp"
#include "utils/test_utils.hpp"
#include <string>

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = TestUtils::makeTempDir("logger");
        m_path = m_dir + "/logger.log";
    }
    void TearDown() override { TestUtils::removeTree(m_dir); }

    cascade::LoggingConfig config(cascade::LogLevel level) {
        return cascade::LoggingConfig()
            .appender(cascade::AppenderConfig::makeFile(m_path).layout("%p %c %m%n"))
            .logger("", level);
    }

    std::string m_dir;
    std::string m_path;
};

TEST_F(LoggerTest, DefaultName) {
    cascade::LoggingContext ctx(m_dir);
    EXPECT_EQ(cascade::Logger(ctx).name(), "cascade");
    EXPECT_EQ(cascade::Logger(ctx, "").name(), "cascade");
    EXPECT_EQ(cascade::Logger(ctx, "svc.db").name(), "svc.db");
}

TEST_F(LoggerTest, PlainLogUsesDebug) {
    cascade::LoggingContext ctx(m_dir);
    ASSERT_TRUE(ctx.initialize(config(cascade::LogLevel::TRACE)).ok());
    cascade::Logger log(ctx, "svc");
    EXPECT_TRUE(log.log("hello").ok());
    ctx.shutdown();
    EXPECT_EQ(TestUtils::readLogFile(m_path), "DEBUG svc hello\n");
}

TEST_F(LoggerTest, LevelMethods) {
    cascade::LoggingContext ctx(m_dir);
    ASSERT_TRUE(ctx.initialize(config(cascade::LogLevel::TRACE)).ok());
    cascade::Logger log(ctx, "svc");
    (void)log.trace("t");
    (void)log.debug("d");
    (void)log.info("i");
    (void)log.warn("w");
    (void)log.error("e");
    (void)log.fatal("f");
    ctx.shutdown();
    EXPECT_EQ(TestUtils::readLogFile(m_path),
              "TRACE svc t\nDEBUG svc d\nINFO svc i\nWARN svc w\nERROR svc e\nFATAL svc f\n");
}

TEST_F(LoggerTest, ConvertsNonTextMessages) {
    cascade::LoggingContext ctx(m_dir);
    ASSERT_TRUE(ctx.initialize(config(cascade::LogLevel::TRACE)).ok());
    cascade::Logger log(ctx, "svc");
    (void)log.info(nullptr);
    (void)log.info(cascade::MessageValue::undefined());
    (void)log.info(nlohmann::json::array({1, 2}));
    ctx.shutdown();
    EXPECT_EQ(TestUtils::readLogFile(m_path), "INFO svc null\nINFO svc undefined\nINFO svc [1,2]\n");
}

TEST_F(LoggerTest, FilteredRecordIsSuccess) {
    cascade::LoggingContext ctx(m_dir);
    ASSERT_TRUE(ctx.initialize(config(cascade::LogLevel::ERROR)).ok());
    cascade::Logger log(ctx, "svc");
    EXPECT_FALSE(log.isEnabled(cascade::LogLevel::WARN));
    EXPECT_TRUE(log.isEnabled(cascade::LogLevel::ERROR));
    EXPECT_TRUE(log.warn("quiet").ok());
    ctx.shutdown();
    EXPECT_FALSE(TestUtils::fileExists(m_path));
}

TEST_F(LoggerTest, UninitializedContext) {
    cascade::LoggingContext ctx(m_dir);
    cascade::Logger log(ctx, "svc");
    EXPECT_EQ(log.fatal("nobody listens").code(), cascade::StatusCode::NotInitialized);
}

TEST_F(LoggerTest, HandleSeesReinitialize) {
    cascade::LoggingContext ctx(m_dir);
    cascade::Logger log(ctx, "svc");
    ASSERT_TRUE(ctx.initialize(config(cascade::LogLevel::ERROR)).ok());
    EXPECT_FALSE(log.isEnabled(cascade::LogLevel::INFO));
    ASSERT_TRUE(ctx.initialize(config(cascade::LogLevel::INFO)).ok());
    EXPECT_TRUE(log.isEnabled(cascade::LogLevel::INFO));
}

TEST_F(LoggerTest, MacrosSkipFilteredMessages) {
    cascade::LoggingContext ctx(m_dir);
    ASSERT_TRUE(ctx.initialize(config(cascade::LogLevel::WARN)).ok());
    cascade::Logger log(ctx, "svc");

    int evaluated = 0;
    auto expensive = [&evaluated]() {
        ++evaluated;
        return std::string("computed");
    };
    CASCADE_DEBUG(log, expensive());
    EXPECT_EQ(evaluated, 0);
    CASCADE_WARN(log, expensive());
    EXPECT_EQ(evaluated, 1);
    CASCADE_LOG(log, cascade::LogLevel::FATAL, "direct");
    ctx.shutdown();
    EXPECT_EQ(TestUtils::readLogFile(m_path), "WARN svc computed\nFATAL svc direct\n");
}
