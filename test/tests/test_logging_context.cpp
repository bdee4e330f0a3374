#include <gtest/gtest.h>
#include "cascade_log.hpp"
#include "utils/test_utils.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

class LoggingContextTest : public ::testing::Test {
protected:
    void SetUp() override { m_dir = TestUtils::makeTempDir("context"); }
    void TearDown() override { TestUtils::removeTree(m_dir); }

    cascade::AppenderConfig fileAppender(const std::string& name) {
        return cascade::AppenderConfig::makeFile(m_dir + "/" + name).layout("%p %c %m%n");
    }

    std::string m_dir;
};

TEST_F(LoggingContextTest, LogBeforeInitializeIsNotInitialized) {
    cascade::LoggingContext ctx(m_dir);
    EXPECT_FALSE(ctx.isInitialized());
    cascade::Status st = ctx.log("a", cascade::LogLevel::FATAL, "dropped");
    EXPECT_EQ(st.code(), cascade::StatusCode::NotInitialized);
    EXPECT_EQ(ctx.resolveLevel("a"), cascade::LogLevel::OFF);
    EXPECT_FALSE(ctx.isEnabled("a", cascade::LogLevel::FATAL));
}

TEST_F(LoggingContextTest, FiltersByHierarchy) {
    cascade::LoggingContext ctx(m_dir);
    ASSERT_TRUE(ctx.initialize(cascade::LoggingConfig()
                                   .appender(fileAppender("h.log"))
                                   .logger("myapp", cascade::LogLevel::INFO)
                                   .logger("myapp.db", cascade::LogLevel::ERROR)).ok());

    EXPECT_TRUE(ctx.log("myapp.web", cascade::LogLevel::INFO, "web info").ok());
    EXPECT_TRUE(ctx.log("myapp.db", cascade::LogLevel::WARN, "db warn").ok());
    EXPECT_TRUE(ctx.log("myapp.db.pool", cascade::LogLevel::ERROR, "pool error").ok());
    EXPECT_TRUE(ctx.log("other", cascade::LogLevel::INFO, "other info").ok());
    EXPECT_TRUE(ctx.log("other", cascade::LogLevel::WARN, "other warn").ok());
    ctx.shutdown();

    EXPECT_EQ(TestUtils::readLogFile(m_dir + "/h.log"),
              "INFO myapp.web web info\n"
              "ERROR myapp.db.pool pool error\n"
              "WARN other other warn\n");
}

TEST_F(LoggingContextTest, RelativePathsResolveAgainstBaseDir) {
    cascade::LoggingContext ctx(m_dir);
    EXPECT_EQ(ctx.baseDirectory(), m_dir);
    ASSERT_TRUE(ctx.initialize(cascade::LoggingConfig()
                                   .appender(cascade::AppenderConfig::makeFile("log/rel.log").layout("%m%n"))
                                   .logger("", cascade::LogLevel::TRACE)).ok());
    EXPECT_TRUE(ctx.log("x", cascade::LogLevel::DEBUG, "relative").ok());
    ctx.shutdown();
    EXPECT_EQ(TestUtils::readLogFile(m_dir + "/log/rel.log"), "relative\n");
}

TEST_F(LoggingContextTest, InitializeFromJson) {
    cascade::LoggingContext ctx(m_dir);
    nlohmann::json config = nlohmann::json::parse(R"({
        "appenders": [{"appenderType": "FILE", "filePath": "json.log", "layout": "%-5p|%m%n"}],
        "loggers": [{"name": "svc", "level": "DEBUG"}]
    })");
    ASSERT_TRUE(ctx.initialize(config).ok());
    EXPECT_TRUE(ctx.log("svc.io", cascade::LogLevel::DEBUG, "from json").ok());
    ctx.shutdown();
    EXPECT_EQ(TestUtils::readLogFile(m_dir + "/json.log"), "DEBUG|from json\n");
}

TEST_F(LoggingContextTest, ReinitializeReplacesEverything) {
    cascade::LoggingContext ctx(m_dir);
    ASSERT_TRUE(ctx.initialize(cascade::LoggingConfig()
                                   .appender(fileAppender("first.log"))
                                   .logger("a", cascade::LogLevel::DEBUG)).ok());
    EXPECT_TRUE(ctx.log("a", cascade::LogLevel::DEBUG, "one").ok());

    ASSERT_TRUE(ctx.initialize(cascade::LoggingConfig()
                                   .appender(fileAppender("second.log"))).ok());
    EXPECT_TRUE(ctx.log("a", cascade::LogLevel::DEBUG, "filtered now").ok());
    EXPECT_TRUE(ctx.log("a", cascade::LogLevel::WARN, "two").ok());
    ctx.shutdown();

    EXPECT_EQ(TestUtils::readLogFile(m_dir + "/first.log"), "DEBUG a one\n");
    EXPECT_EQ(TestUtils::readLogFile(m_dir + "/second.log"), "WARN a two\n");
}

TEST_F(LoggingContextTest, MalformedConfigKeepsPreviousState) {
    cascade::LoggingContext ctx(m_dir);
    ASSERT_TRUE(ctx.initialize(cascade::LoggingConfig()
                                   .appender(fileAppender("keep.log"))
                                   .logger("", cascade::LogLevel::INFO)).ok());

    nlohmann::json bad = nlohmann::json::parse(R"({"appenders": [{"appenderType": "BOGUS"}]})");
    cascade::Status st = ctx.initialize(bad);
    EXPECT_EQ(st.code(), cascade::StatusCode::ConfigurationError);
    EXPECT_NE(st.message().find("BOGUS"), std::string::npos);

    st = ctx.initialize(cascade::LoggingConfig().appender(cascade::AppenderConfig::makeFile("")));
    EXPECT_EQ(st.code(), cascade::StatusCode::ConfigurationError);

    EXPECT_TRUE(ctx.isInitialized());
    EXPECT_TRUE(ctx.log("x", cascade::LogLevel::INFO, "still here").ok());
    ctx.shutdown();
    EXPECT_EQ(TestUtils::readLogFile(m_dir + "/keep.log"), "INFO x still here\n");
}

TEST_F(LoggingContextTest, ShutdownIsIdempotent) {
    cascade::LoggingContext ctx(m_dir);
    EXPECT_TRUE(ctx.shutdown().ok());
    ASSERT_TRUE(ctx.initialize(cascade::LoggingConfig().appender(fileAppender("s.log"))).ok());
    EXPECT_TRUE(ctx.shutdown().ok());
    EXPECT_TRUE(ctx.shutdown().ok());
    EXPECT_FALSE(ctx.isInitialized());
    EXPECT_EQ(ctx.log("x", cascade::LogLevel::FATAL, "late").code(), cascade::StatusCode::NotInitialized);
}

TEST_F(LoggingContextTest, ShutdownReleasesDescriptors) {
    int before = TestUtils::openDescriptorCount();
    if (before < 0) GTEST_SKIP() << "descriptor count unavailable";

    cascade::LoggingContext ctx(m_dir);
    for (int round = 0; round < 5; ++round) {
        ASSERT_TRUE(ctx.initialize(cascade::LoggingConfig()
                                       .appender(fileAppender("fd_a.log"))
                                       .appender(cascade::AppenderConfig::makeDailyRollingFile(m_dir + "/fd_b.log")
                                                     .useLockFile(true))).ok());
        EXPECT_TRUE(ctx.log("x", cascade::LogLevel::ERROR, "round").ok());
    }
    ctx.shutdown();
    EXPECT_EQ(TestUtils::openDescriptorCount(), before);
}

TEST_F(LoggingContextTest, AppenderErrorsReachHandler) {
    std::string blocker = m_dir + "/blocker";
    {
        std::ofstream seed(blocker);
        seed << "x";
    }
    std::vector<cascade::Status> reported;
    cascade::LoggingContext ctx(m_dir);
    ctx.setErrorHandler([&reported](const cascade::Status& st) { reported.push_back(st); });

    ASSERT_TRUE(ctx.initialize(cascade::LoggingConfig()
                                   .appender(cascade::AppenderConfig::makeFile("blocker/app.log"))
                                   .appender(fileAppender("good.log"))).ok());

    cascade::Status st = ctx.log("x", cascade::LogLevel::ERROR, "boom");
    EXPECT_EQ(st.code(), cascade::StatusCode::AppenderIOError);
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_NE(reported[0].message().find("FILE appender"), std::string::npos);
    ctx.shutdown();
    EXPECT_EQ(TestUtils::readLogFile(m_dir + "/good.log"), "ERROR x boom\n");
}

TEST_F(LoggingContextTest, FallbackNoticeWithoutHandler) {
    std::string blocker = m_dir + "/blocker";
    {
        std::ofstream seed(blocker);
        seed << "x";
    }
    std::ostringstream notices;
    cascade::LoggingContext ctx(m_dir);
    ctx.errorReporter().setFallbackStream(notices);
    ASSERT_TRUE(ctx.initialize(cascade::LoggingConfig()
                                   .appender(cascade::AppenderConfig::makeFile("blocker/app.log"))).ok());
    (void)ctx.log("x", cascade::LogLevel::ERROR, "boom");
    ctx.shutdown();

    std::string text = notices.str();
    EXPECT_EQ(text.find("===LOGGER ERROR:\n"), 0u);
    EXPECT_NE(text.find("AppenderIOError: FILE appender"), std::string::npos);
    EXPECT_NE(text.find("\n===LOGGER ERROR END:\n"), std::string::npos);
}

TEST_F(LoggingContextTest, CallerBuiltRecordKeepsTimestamp) {
    cascade::LoggingContext ctx(m_dir);
    ASSERT_TRUE(ctx.initialize(cascade::LoggingConfig()
                                   .appender(cascade::AppenderConfig::makeFile("ts.log").layout("%D{%Y-%m-%d} %m%n"))
                                   .logger("", cascade::LogLevel::INFO)).ok());
    EXPECT_TRUE(ctx.log(TestUtils::makeRecord(cascade::LogLevel::INFO, "x", "replayed",
                                               TestUtils::localNoon(2020, 3, 15))).ok());
    EXPECT_TRUE(ctx.log(TestUtils::makeRecord(cascade::LogLevel::DEBUG, "x", "filtered",
                                               TestUtils::localNoon(2020, 3, 15))).ok());
    ctx.shutdown();
    EXPECT_EQ(TestUtils::readLogFile(m_dir + "/ts.log"), "2020-03-15 replayed\n");
}

TEST_F(LoggingContextTest, DefaultBaseDirIsExecutableDirectory) {
    cascade::LoggingContext ctx;
    EXPECT_EQ(ctx.baseDirectory(), cascade::detail::executableDirectory());
    EXPECT_FALSE(ctx.baseDirectory().empty());
}
