#include <gtest/gtest.h>
#include "cascade_log.hpp"
#include "utils/test_utils.hpp"
#include <chrono>
#include <string>

class FileLockTest : public ::testing::Test {
protected:
    void SetUp() override { m_dir = TestUtils::makeTempDir("lock"); }
    void TearDown() override { TestUtils::removeTree(m_dir); }

    std::string m_dir;
};

TEST_F(FileLockTest, CreatesLockFile) {
    std::string path = m_dir + "/a.log.lock";
    cascade::ScopedFileLock lock(path);
    EXPECT_TRUE(TestUtils::fileExists(path));
    EXPECT_EQ(lock.path(), path);
}

TEST_F(FileLockTest, SecondHolderTimesOut) {
    std::string path = m_dir + "/b.log.lock";
    cascade::ScopedFileLock held(path);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(cascade::ScopedFileLock(path, std::chrono::milliseconds(50)),
                 cascade::LockAcquisitionError);
    auto waited = std::chrono::steady_clock::now() - start;
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(waited).count(), 50);
}

TEST_F(FileLockTest, ReleasedOnDestruction) {
    std::string path = m_dir + "/c.log.lock";
    {
        cascade::ScopedFileLock first(path);
    }
    EXPECT_NO_THROW(cascade::ScopedFileLock(path, std::chrono::milliseconds(0)));
}

TEST_F(FileLockTest, UnopenablePathThrows) {
    EXPECT_THROW(cascade::ScopedFileLock(m_dir + "/missing/dir/x.lock"), cascade::LockAcquisitionError);
}
