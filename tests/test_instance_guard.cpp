#include "test_support.hpp"
#include <instance/instance_guard.hpp>
#include <instance/byte_range_lock.hpp>
#include <instance/pid_liveness_lock.hpp>
#include <platform/process.hpp>
#include <stdexcept>

namespace {

// Locks fine but can't persist the claim.
class UnwritableLock : public PlatformLock {
public:
    LockOutcome try_lock(const fs::path& path) override {
        return LockOutcome::acquired(LockHandle(path));
    }
    Result<void> write_claim(LockHandle&, const LockRecord&) override {
        return Result<void>::Err("disk full");
    }
    void unlock(LockHandle& handle) override {
        unlocks++;
        handle.reset();
    }
    LockStrategy strategy() const override { return LockStrategy::PidLiveness; }

    int unlocks = 0;
};

} // namespace

class InstanceGuardTest : public TempDirTest {
protected:
    fs::path lock_path() const { return test_dir / "app.lock"; }
    ByteRangeLock byte_range;
};

TEST_F(InstanceGuardTest, AcquireWritesRecord) {
    InstanceGuard guard(byte_range, lock_path(), "solo");
    ASSERT_EQ(guard.acquire(), AcquireStatus::Acquired);
    EXPECT_TRUE(guard.held());
    EXPECT_EQ(guard.state(), InstanceGuard::State::Acquired);

    ASSERT_TRUE(guard.record().has_value());
    EXPECT_EQ(guard.record()->owner_id, platform::current_pid());
    EXPECT_EQ(guard.record()->app_tag, "solo");

    auto on_disk = parse_lock_record(read_file(lock_path()));
    ASSERT_TRUE(on_disk.has_value());
    EXPECT_EQ(*on_disk, *guard.record());
}

TEST_F(InstanceGuardTest, SecondGuardIsAlreadyRunning) {
    InstanceGuard first(byte_range, lock_path(), "solo");
    ASSERT_EQ(first.acquire(), AcquireStatus::Acquired);

    InstanceGuard second(byte_range, lock_path(), "solo");
    EXPECT_EQ(second.acquire(), AcquireStatus::AlreadyRunning);
    EXPECT_FALSE(second.held());
    EXPECT_EQ(second.state(), InstanceGuard::State::Unacquired);

    // The loser must not disturb the winner's claim
    EXPECT_EQ(parse_lock_record(read_file(lock_path()))->owner_id, platform::current_pid());
}

TEST_F(InstanceGuardTest, AcquireTwiceIsHarmless) {
    InstanceGuard guard(byte_range, lock_path(), "solo");
    ASSERT_EQ(guard.acquire(), AcquireStatus::Acquired);
    EXPECT_EQ(guard.acquire(), AcquireStatus::Acquired);
    EXPECT_TRUE(guard.held());
}

TEST_F(InstanceGuardTest, ReleaseIsIdempotent) {
    InstanceGuard guard(byte_range, lock_path(), "solo");
    ASSERT_EQ(guard.acquire(), AcquireStatus::Acquired);

    guard.release();
    EXPECT_EQ(guard.state(), InstanceGuard::State::Released);
    EXPECT_FALSE(fs::exists(lock_path()));

    guard.release();
    guard.release();
    EXPECT_EQ(guard.state(), InstanceGuard::State::Released);
}

TEST_F(InstanceGuardTest, ReleaseWithoutAcquireDoesNothing) {
    write_file(lock_path(), "4242|1700000000|solo");
    InstanceGuard guard(byte_range, lock_path(), "solo");
    guard.release();
    EXPECT_EQ(guard.state(), InstanceGuard::State::Unacquired);
    EXPECT_TRUE(fs::exists(lock_path()));
}

TEST_F(InstanceGuardTest, AcquireAfterReleaseThrows) {
    InstanceGuard guard(byte_range, lock_path(), "solo");
    ASSERT_EQ(guard.acquire(), AcquireStatus::Acquired);
    guard.release();
    EXPECT_THROW(guard.acquire(), std::logic_error);
}

TEST_F(InstanceGuardTest, ReleasedClaimCanBeTakenAgain) {
    {
        InstanceGuard first(byte_range, lock_path(), "solo");
        ASSERT_EQ(first.acquire(), AcquireStatus::Acquired);
    }
    EXPECT_FALSE(fs::exists(lock_path()));

    InstanceGuard second(byte_range, lock_path(), "solo");
    EXPECT_EQ(second.acquire(), AcquireStatus::Acquired);
}

TEST_F(InstanceGuardTest, MissingDirectoryIsUnavailable) {
    InstanceGuard guard(byte_range, test_dir / "gone" / "app.lock", "solo");
    EXPECT_EQ(guard.acquire(), AcquireStatus::Unavailable);
    EXPECT_FALSE(guard.last_error().empty());
    EXPECT_FALSE(guard.held());

    // Failed acquisition leaves nothing to release
    guard.release();
    EXPECT_EQ(guard.state(), InstanceGuard::State::Unacquired);
}

TEST_F(InstanceGuardTest, OverwritesUnrelatedLeftover) {
    write_file(lock_path(), "999|1600000000|another-app");
    InstanceGuard guard(byte_range, lock_path(), "solo");
    ASSERT_EQ(guard.acquire(), AcquireStatus::Acquired);
    EXPECT_EQ(parse_lock_record(read_file(lock_path()))->app_tag, "solo");
}

TEST_F(InstanceGuardTest, FailedClaimWriteUnlocks) {
    UnwritableLock lock;
    InstanceGuard guard(lock, lock_path(), "solo");
    EXPECT_EQ(guard.acquire(), AcquireStatus::Unavailable);
    EXPECT_EQ(guard.last_error(), "disk full");
    EXPECT_EQ(lock.unlocks, 1);
    EXPECT_FALSE(guard.held());
}

TEST_F(InstanceGuardTest, StatusNames) {
    EXPECT_STREQ(to_string(AcquireStatus::Acquired), "acquired");
    EXPECT_STREQ(to_string(AcquireStatus::AlreadyRunning), "already-running");
    EXPECT_STREQ(to_string(AcquireStatus::Unavailable), "unavailable");
}

// ── pid-liveness strategy ────────────────────────────────────

TEST_F(InstanceGuardTest, PidStrategyAcquireAndRelease) {
    PidLivenessLock pid_lock("solo", platform::process_exists);
    InstanceGuard guard(pid_lock, lock_path(), "solo");
    ASSERT_EQ(guard.acquire(), AcquireStatus::Acquired);
    EXPECT_EQ(parse_lock_record(read_file(lock_path()))->owner_id, platform::current_pid());

    guard.release();
    EXPECT_FALSE(fs::exists(lock_path()));
}

TEST_F(InstanceGuardTest, PidStrategyLiveOwnerWins) {
    write_file(lock_path(), "4242|1700000000|solo");
    PidLivenessLock pid_lock("solo", [](int pid) { return pid == 4242; });
    InstanceGuard guard(pid_lock, lock_path(), "solo");
    EXPECT_EQ(guard.acquire(), AcquireStatus::AlreadyRunning);
    EXPECT_EQ(read_file(lock_path()), "4242|1700000000|solo");
}

TEST_F(InstanceGuardTest, PidStrategyTakesOverDeadOwner) {
    write_file(lock_path(), "4242|1700000000|solo");
    PidLivenessLock pid_lock("solo", nobody_alive);
    InstanceGuard guard(pid_lock, lock_path(), "solo");
    ASSERT_EQ(guard.acquire(), AcquireStatus::Acquired);
    EXPECT_EQ(parse_lock_record(read_file(lock_path()))->owner_id, platform::current_pid());
}
