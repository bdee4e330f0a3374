#include <gtest/gtest.h>
#include "cascade_log.hpp"
#include "utils/test_utils.hpp"
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <sys/stat.h>

class DailyRollingTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = TestUtils::makeTempDir("daily");
        m_path = m_dir + "/app.log";
        m_reporter = std::make_shared<cascade::ErrorReporter>();
        m_reporter->setHandler([this](const cascade::Status& st) { m_reported.push_back(st); });
    }

    void TearDown() override { TestUtils::removeTree(m_dir); }

    std::unique_ptr<cascade::DailyRollingFileAppender> makeAppender(unsigned int maxBackupIndex,
                                                                    bool useLockFile = false) {
        return cascade::detail::make_unique<cascade::DailyRollingFileAppender>(
            m_path, cascade::LogLevel::TRACE, cascade::PatternLayout("%m%n"),
            maxBackupIndex, useLockFile, m_reporter);
    }

    static cascade::LogRecord onDay(int day, const std::string& msg) {
        return TestUtils::makeRecord(cascade::LogLevel::INFO, "app", msg, TestUtils::localNoon(2020, 1, day));
    }

    std::string m_dir;
    std::string m_path;
    std::shared_ptr<cascade::ErrorReporter> m_reporter;
    std::vector<cascade::Status> m_reported;
};

TEST_F(DailyRollingTest, SameDayDoesNotRotate) {
    auto appender = makeAppender(16);
    appender->append(onDay(1, "morning"));
    appender->append(onDay(1, "evening"));
    EXPECT_EQ(TestUtils::readLogFile(m_path), "morning\nevening\n");
    EXPECT_FALSE(TestUtils::fileExists(m_path + ".2020-01-01"));
}

TEST_F(DailyRollingTest, RotatesOnDateChange) {
    auto appender = makeAppender(16);
    appender->append(onDay(1, "d1"));
    appender->append(onDay(2, "d2"));

    EXPECT_EQ(TestUtils::readLogFile(m_path + ".2020-01-01"), "d1\n");
    EXPECT_EQ(TestUtils::readLogFile(m_path), "d2\n");
    EXPECT_TRUE(m_reported.empty());
    EXPECT_STREQ(appender->typeName(), "DAILY_ROLLING_FILE");
}

TEST_F(DailyRollingTest, EvictsOldestBeyondMaxBackupIndex) {
    auto appender = makeAppender(2);
    for (int day = 1; day <= 4; ++day) {
        appender->append(onDay(day, "d" + std::to_string(day)));
    }

    EXPECT_FALSE(TestUtils::fileExists(m_path + ".2020-01-01"));
    EXPECT_EQ(TestUtils::readLogFile(m_path + ".2020-01-02"), "d2\n");
    EXPECT_EQ(TestUtils::readLogFile(m_path + ".2020-01-03"), "d3\n");
    EXPECT_EQ(TestUtils::readLogFile(m_path), "d4\n");

    std::vector<std::string> backups = appender->manager().listBackups();
    ASSERT_EQ(backups.size(), 2u);
    EXPECT_EQ(backups[0], m_path + ".2020-01-02");
    EXPECT_EQ(backups[1], m_path + ".2020-01-03");
}

TEST_F(DailyRollingTest, ZeroBackupsKeepsOnlyActiveFile) {
    auto appender = makeAppender(0);
    appender->append(onDay(1, "d1"));
    appender->append(onDay(2, "d2"));
    EXPECT_TRUE(appender->manager().listBackups().empty());
    EXPECT_EQ(TestUtils::readLogFile(m_path), "d2\n");
}

TEST_F(DailyRollingTest, OlderRecordGoesToCurrentFile) {
    auto appender = makeAppender(16);
    appender->append(onDay(1, "d1"));
    appender->append(onDay(2, "d2"));
    appender->append(onDay(1, "late d1"));

    EXPECT_EQ(TestUtils::readLogFile(m_path), "d2\nlate d1\n");
    EXPECT_EQ(appender->manager().listBackups().size(), 1u);
}

TEST_F(DailyRollingTest, BackupNameCollisionGetsSequence) {
    {
        std::ofstream seed(m_path + ".2020-01-01");
        seed << "from elsewhere\n";
    }
    auto appender = makeAppender(16);
    appender->append(onDay(1, "d1"));
    appender->append(onDay(2, "d2"));

    EXPECT_EQ(TestUtils::readLogFile(m_path + ".2020-01-01"), "from elsewhere\n");
    EXPECT_EQ(TestUtils::readLogFile(m_path + ".2020-01-01.1"), "d1\n");

    std::vector<std::string> backups = appender->manager().listBackups();
    ASSERT_EQ(backups.size(), 2u);
    EXPECT_EQ(backups[0], m_path + ".2020-01-01");
    EXPECT_EQ(backups[1], m_path + ".2020-01-01.1");
}

TEST_F(DailyRollingTest, RestartRotatesFileFromEarlierDay) {
    {
        std::ofstream seed(m_path);
        seed << "yesterday\n";
    }
    TestUtils::setModificationTime(m_path, TestUtils::localNoon(2020, 1, 1));

    auto appender = makeAppender(16);
    appender->append(onDay(2, "today"));

    EXPECT_EQ(TestUtils::readLogFile(m_path + ".2020-01-01"), "yesterday\n");
    EXPECT_EQ(TestUtils::readLogFile(m_path), "today\n");
}

TEST_F(DailyRollingTest, UnrelatedFilesAreNotBackups) {
    {
        std::ofstream a(m_path + ".old");
        std::ofstream b(m_path + ".2020-01-01.x");
        std::ofstream c(m_dir + "/other.log.2020-01-01");
    }
    auto appender = makeAppender(0);
    appender->append(onDay(1, "d1"));
    appender->append(onDay(2, "d2"));

    EXPECT_TRUE(TestUtils::fileExists(m_path + ".old"));
    EXPECT_TRUE(TestUtils::fileExists(m_path + ".2020-01-01.x"));
    EXPECT_TRUE(TestUtils::fileExists(m_dir + "/other.log.2020-01-01"));
}

TEST_F(DailyRollingTest, LockFileCreatedBesideLog) {
    auto appender = makeAppender(16, true);
    appender->append(onDay(1, "d1"));
    appender->append(onDay(2, "d2"));
    EXPECT_TRUE(TestUtils::fileExists(m_path + ".lock"));
    EXPECT_EQ(TestUtils::readLogFile(m_path + ".2020-01-01"), "d1\n");
    EXPECT_TRUE(m_reported.empty());
}

TEST_F(DailyRollingTest, HeldLockDefersRotation) {
    auto appender = makeAppender(16, true);
    appender->append(onDay(1, "d1"));

    {
        cascade::ScopedFileLock peer(m_path + ".lock");
        appender->append(onDay(2, "d2 while locked"));
    }

    ASSERT_EQ(m_reported.size(), 1u);
    EXPECT_EQ(m_reported[0].code(), cascade::StatusCode::LockAcquisitionError);
    EXPECT_FALSE(TestUtils::fileExists(m_path + ".2020-01-01"));
    EXPECT_EQ(TestUtils::readLogFile(m_path), "d1\nd2 while locked\n");

    appender->append(onDay(2, "d2 after release"));
    EXPECT_EQ(TestUtils::readLogFile(m_path + ".2020-01-01"), "d1\nd2 while locked\n");
    EXPECT_EQ(TestUtils::readLogFile(m_path), "d2 after release\n");
    EXPECT_EQ(m_reported.size(), 1u);
}

TEST_F(DailyRollingTest, PeerRotationIsNotRepeated) {
    auto appender = makeAppender(16);
    appender->append(onDay(1, "d1"));

    // Another process already moved the file and started a fresh one.
    ASSERT_EQ(std::rename(m_path.c_str(), (m_path + ".2020-01-01").c_str()), 0);
    {
        std::ofstream peer(m_path);
        peer << "peer d2\n";
    }

    appender->append(onDay(2, "d2"));

    EXPECT_EQ(TestUtils::readLogFile(m_path + ".2020-01-01"), "d1\n");
    EXPECT_EQ(TestUtils::readLogFile(m_path), "peer d2\nd2\n");
    EXPECT_FALSE(TestUtils::fileExists(m_path + ".2020-01-01.1"));
}

TEST_F(DailyRollingTest, TwoAppendersOnOneFileRotateOnce) {
    auto first = makeAppender(16, true);
    auto second = makeAppender(16, true);
    first->append(onDay(1, "first d1"));
    // The second writer opens a non-empty file and dates it by its mtime.
    TestUtils::setModificationTime(m_path, TestUtils::localNoon(2020, 1, 1));
    second->append(onDay(1, "second d1"));

    first->append(onDay(2, "first d2"));
    second->append(onDay(2, "second d2"));

    EXPECT_EQ(TestUtils::readLogFile(m_path + ".2020-01-01"), "first d1\nsecond d1\n");
    EXPECT_EQ(TestUtils::readLogFile(m_path), "first d2\nsecond d2\n");
    EXPECT_FALSE(TestUtils::fileExists(m_path + ".2020-01-01.1"));
}

TEST_F(DailyRollingTest, FailedReopenKeepsOldFileAndRetries) {
    const std::string logs = m_dir + "/logs";
    const std::string moved = m_dir + "/logs_moved";
    cascade::DailyRollingFileAppender appender(logs + "/app.log", cascade::LogLevel::TRACE,
                                               cascade::PatternLayout("%m%n"), 16, false, m_reporter);
    appender.append(onDay(1, "d1"));

    // The directory disappears, so the new day's file cannot be created.
    ASSERT_EQ(std::rename(logs.c_str(), moved.c_str()), 0);
    appender.append(onDay(2, "d2"));

    ASSERT_EQ(m_reported.size(), 1u);
    EXPECT_EQ(m_reported[0].code(), cascade::StatusCode::AppenderIOError);
    EXPECT_EQ(TestUtils::readLogFile(moved + "/app.log"), "d1\nd2\n");

    ASSERT_EQ(::mkdir(logs.c_str(), 0755), 0);
    appender.append(onDay(2, "d2 retried"));

    EXPECT_EQ(m_reported.size(), 1u);
    EXPECT_EQ(TestUtils::readLogFile(logs + "/app.log"), "d2 retried\n");
    EXPECT_EQ(TestUtils::readLogFile(moved + "/app.log"), "d1\nd2\n");
}
