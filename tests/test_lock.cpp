#include <gtest/gtest.h>
#include <licenseguard/lock.hpp>

#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace licenseguard {
namespace {

using namespace testing_support;
using std::chrono::seconds;

// ==================== MemoryLockStore Tests ====================

class MemoryLockStoreTest : public ::testing::Test {
  protected:
    ManualClock clock{at("2025-06-01 12:00:00")};
    MemoryLockStore store{clock.clock()};
};

TEST_F(MemoryLockStoreTest, SecondAcquireWithinTtlFails) {
    EXPECT_TRUE(store.try_acquire("k", seconds(8)).value());
    EXPECT_FALSE(store.try_acquire("k", seconds(8)).value());
}

TEST_F(MemoryLockStoreTest, KeysAreIndependent) {
    EXPECT_TRUE(store.try_acquire("a", seconds(8)).value());
    EXPECT_TRUE(store.try_acquire("b", seconds(8)).value());
}

TEST_F(MemoryLockStoreTest, ExpiresAfterTtl) {
    ASSERT_TRUE(store.try_acquire("k", seconds(8)).value());

    clock.advance(seconds(7));
    EXPECT_FALSE(store.try_acquire("k", seconds(8)).value());

    clock.advance(seconds(1));
    EXPECT_TRUE(store.try_acquire("k", seconds(8)).value());
}

TEST_F(MemoryLockStoreTest, ExpiredKeysAreDropped) {
    ASSERT_TRUE(store.try_acquire("a", seconds(8)).value());
    ASSERT_TRUE(store.try_acquire("b", seconds(8)).value());
    EXPECT_EQ(store.size(), 2u);

    clock.advance(seconds(9));
    ASSERT_TRUE(store.try_acquire("c", seconds(8)).value());

    EXPECT_EQ(store.size(), 1u);
}

// ==================== FileLockStore Tests ====================

class FileLockStoreTest : public ::testing::Test {
  protected:
    TempDirectory dir;
    ManualClock clock{at("2025-06-01 12:00:00")};
    FileLockStore store{(dir.path() / "locks").string(), clock.clock()};
};

TEST_F(FileLockStoreTest, CreatesDirectoryAndHashedFile) {
    auto acquired = store.try_acquire("licenseguard:activate_lock:KEY:none", seconds(8));

    ASSERT_TRUE(acquired.is_ok()) << acquired.error_message();
    EXPECT_TRUE(acquired.value());

    auto path = store.path_for("licenseguard:activate_lock:KEY:none");
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(path.parent_path(), dir.path() / "locks");
    auto name = path.filename().string();
    EXPECT_EQ(name.rfind("activate_", 0), 0u);
    EXPECT_EQ(name.size(), std::string("activate_").size() + 32 + std::string(".lock").size());
}

TEST_F(FileLockStoreTest, HeldUntilExpiry) {
    ASSERT_TRUE(store.try_acquire("k", seconds(8)).value());

    clock.advance(seconds(5));
    EXPECT_FALSE(store.try_acquire("k", seconds(8)).value());

    clock.advance(seconds(3));
    EXPECT_TRUE(store.try_acquire("k", seconds(8)).value());
}

TEST_F(FileLockStoreTest, SharedAcrossInstances) {
    FileLockStore other((dir.path() / "locks").string(), clock.clock());

    ASSERT_TRUE(store.try_acquire("k", seconds(8)).value());
    EXPECT_FALSE(other.try_acquire("k", seconds(8)).value());
}

TEST_F(FileLockStoreTest, CorruptFileIsTakenOver) {
    auto path = store.path_for("k");
    std::filesystem::create_directories(path.parent_path());
    {
        std::ofstream file(path);
        file << "garbage";
    }

    EXPECT_TRUE(store.try_acquire("k", seconds(8)).value());
}

TEST_F(FileLockStoreTest, UnwritableDirectoryIsError) {
    auto blocker = dir.path() / "blocker";
    {
        std::ofstream file(blocker);
        file << "x";
    }
    FileLockStore broken((blocker / "locks").string(), clock.clock());

    auto acquired = broken.try_acquire("k", seconds(8));

    EXPECT_TRUE(acquired.is_error());
    EXPECT_EQ(acquired.error_code(), ErrorCode::StorageError);
}

// ==================== ProcessLock Tests ====================

class ProcessLockTest : public ::testing::Test {
  protected:
    std::string lock_path() const { return (dir.path() / "run" / "auto_validate.lock").string(); }

    TempDirectory dir;
};

TEST_F(ProcessLockTest, ExcludesSecondHolder) {
    ProcessLock first(lock_path());
    ProcessLock second(lock_path());

    ASSERT_TRUE(first.try_lock_for(std::chrono::milliseconds(100)));
    EXPECT_TRUE(first.owns_lock());
    EXPECT_FALSE(second.try_lock_for(std::chrono::milliseconds(100)));
    EXPECT_FALSE(second.owns_lock());
}

TEST_F(ProcessLockTest, UnlockReleases) {
    ProcessLock first(lock_path());
    ProcessLock second(lock_path());

    ASSERT_TRUE(first.try_lock_for(std::chrono::milliseconds(100)));
    first.unlock();

    EXPECT_FALSE(first.owns_lock());
    EXPECT_TRUE(second.try_lock_for(std::chrono::milliseconds(100)));
}

TEST_F(ProcessLockTest, DestructorReleases) {
    {
        ProcessLock scoped(lock_path());
        ASSERT_TRUE(scoped.try_lock_for(std::chrono::milliseconds(100)));
    }

    ProcessLock next(lock_path());
    EXPECT_TRUE(next.try_lock_for(std::chrono::milliseconds(0)));
}

TEST_F(ProcessLockTest, RelockIsNoop) {
    ProcessLock lock(lock_path());

    ASSERT_TRUE(lock.try_lock_for(std::chrono::milliseconds(0)));
    EXPECT_TRUE(lock.try_lock_for(std::chrono::milliseconds(0)));
    EXPECT_EQ(lock.path(), lock_path());
}

}  // namespace
}  // namespace licenseguard
