#include "test_support.hpp"
#include <platform/run_lock.hpp>

class RunLockTest : public TreeTest {};

TEST_F(RunLockTest, AcquireWritesMarkerAndReleaseRemovesIt) {
    auto lock = RunLock::acquire(top / RUN_LOCK_FILE, "run.24-01-01_10:00:00");
    ASSERT_TRUE(lock.is_ok()) << lock.error;
    EXPECT_TRUE(fs::exists(top / RUN_LOCK_FILE));
    EXPECT_NE(read_file(top / RUN_LOCK_FILE).find("job: run.24-01-01_10:00:00"),
              std::string::npos);

    lock.value->release();
    EXPECT_FALSE(lock.value->held());
    EXPECT_FALSE(fs::exists(top / RUN_LOCK_FILE));
}

TEST_F(RunLockTest, SecondAcquireIsAlreadyLocked) {
    auto first = RunLock::acquire(top / RUN_LOCK_FILE, "first");
    ASSERT_TRUE(first.is_ok());

    auto second = RunLock::acquire(top / RUN_LOCK_FILE, "second");
    EXPECT_TRUE(second.is_err());
    EXPECT_EQ(second.kind, ErrorKind::AlreadyLocked);
    EXPECT_NE(second.error.find(RUN_LOCK_FILE), std::string::npos);
    EXPECT_NE(second.error.find("job: first"), std::string::npos);

    // the holder's marker is untouched
    EXPECT_NE(read_file(top / RUN_LOCK_FILE).find("job: first"), std::string::npos);
}

TEST_F(RunLockTest, DestructorReleases) {
    {
        auto lock = RunLock::acquire(top / TRANSFER_LOCK_FILE, "transfer.x");
        ASSERT_TRUE(lock.is_ok());
    }
    EXPECT_FALSE(fs::exists(top / TRANSFER_LOCK_FILE));
    EXPECT_TRUE(RunLock::acquire(top / TRANSFER_LOCK_FILE, "transfer.y").is_ok());
}

TEST_F(RunLockTest, StaleMarkerBlocks) {
    touch(RUN_LOCK_FILE, "pid: 1\n");
    auto lock = RunLock::acquire(top / RUN_LOCK_FILE, "run");
    EXPECT_EQ(lock.kind, ErrorKind::AlreadyLocked);
    EXPECT_TRUE(fs::exists(top / RUN_LOCK_FILE));
}

TEST_F(RunLockTest, MissingDirectoryIsIoFailed) {
    auto lock = RunLock::acquire(top / "nope" / RUN_LOCK_FILE, "run");
    EXPECT_EQ(lock.kind, ErrorKind::IoFailed);
}
