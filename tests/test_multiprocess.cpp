#ifndef _WIN32

#include "test_support.hpp"
#include <instance/instance_detector.hpp>
#include <instance/instance_guard.hpp>
#include <instance/startup_check.hpp>
#include <instance/byte_range_lock.hpp>
#include <instance/pid_liveness_lock.hpp>
#include <platform/file_lock.hpp>
#include <platform/process.hpp>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace {

char attempt_code(AcquireStatus status) {
    switch (status) {
        case AcquireStatus::Acquired:       return 'A';
        case AcquireStatus::AlreadyRunning: return 'R';
        case AcquireStatus::Unavailable:    return 'U';
    }
    return '?';
}

// Blocks until every write end of the pipe is closed.
void wait_for_eof(int fd) {
    char c;
    while (read(fd, &c, 1) > 0) {}
}

void signal_parent(int fd, char c) {
    ssize_t n = write(fd, &c, 1);
    (void)n;
}

// Child that takes the claim, reports, and then idles until killed.
pid_t spawn_holder(PlatformLock& lock, const fs::path& lock_path, int report_fd) {
    pid_t pid = fork();
    if (pid != 0) return pid;

    InstanceGuard guard(lock, lock_path, "solo");
    signal_parent(report_fd, attempt_code(guard.acquire()));
    for (;;) platform::sleep_ms(1000);
}

char read_report(int fd) {
    char c = '?';
    if (read(fd, &c, 1) != 1) return '?';
    return c;
}

} // namespace

class MultiProcessTest : public TempDirTest {
protected:
    InstancePaths paths() const {
        return {test_dir / "app.lock", test_dir / "logs" / "app.log"};
    }

    void reap(pid_t pid, bool kill_first) {
        if (kill_first) kill(pid, SIGKILL);
        int status = 0;
        waitpid(pid, &status, 0);
    }
};

TEST_F(MultiProcessTest, ExactlyOneOfManyAcquires) {
    constexpr int kProcesses = 6;
    int go[2], done[2], results[2];
    ASSERT_EQ(pipe(go), 0);
    ASSERT_EQ(pipe(done), 0);
    ASSERT_EQ(pipe(results), 0);

    std::vector<pid_t> children;
    for (int i = 0; i < kProcesses; i++) {
        pid_t pid = fork();
        ASSERT_GE(pid, 0);
        if (pid == 0) {
            close(go[1]);
            close(done[1]);
            close(results[0]);
            wait_for_eof(go[0]);

            ByteRangeLock lock;
            InstanceGuard guard(lock, paths().lock_file, "solo");
            signal_parent(results[1], attempt_code(guard.acquire()));

            // Hold until every child has reported
            wait_for_eof(done[0]);
            _exit(0);
        }
        children.push_back(pid);
    }

    close(go[0]);
    close(done[0]);
    close(results[1]);
    close(go[1]);   // start them all at once

    std::string reports;
    for (int i = 0; i < kProcesses; i++) reports += read_report(results[0]);
    close(done[1]);
    close(results[0]);
    for (pid_t pid : children) reap(pid, false);

    int acquired = 0, refused = 0;
    for (char c : reports) {
        if (c == 'A') acquired++;
        if (c == 'R') refused++;
    }
    EXPECT_EQ(acquired, 1) << reports;
    EXPECT_EQ(refused, kProcesses - 1) << reports;
}

TEST_F(MultiProcessTest, DetectsHolderAndRecoversAfterKill) {
    int report[2];
    ASSERT_EQ(pipe(report), 0);

    ByteRangeLock lock;
    pid_t holder = spawn_holder(lock, paths().lock_file, report[1]);
    ASSERT_GT(holder, 0);
    close(report[1]);
    ASSERT_EQ(read_report(report[0]), 'A');
    close(report[0]);

    InstanceDetector detector(lock, paths(), "solo", platform::process_exists);
    auto seen = detector.detect();
    ASSERT_TRUE(seen.is_running());
    EXPECT_EQ(seen.method, DetectionMethod::ByteRangeLockHeld);
    ASSERT_TRUE(seen.record.has_value());
    EXPECT_EQ(seen.record->owner_id, holder);

    InstanceGuard blocked(lock, paths().lock_file, "solo");
    EXPECT_EQ(blocked.acquire(), AcquireStatus::AlreadyRunning);

    // Crash: no release, the record stays on disk
    reap(holder, true);
    EXPECT_TRUE(fs::exists(paths().lock_file));

    auto after = detector.detect();
    EXPECT_EQ(after.state, DetectionResult::State::NotRunning);
    EXPECT_FALSE(fs::exists(paths().lock_file));

    InstanceGuard guard(lock, paths().lock_file, "solo");
    EXPECT_EQ(guard.acquire(), AcquireStatus::Acquired);
}

TEST_F(MultiProcessTest, CrashedHolderNeedsNoDetectBeforeAcquire) {
    int report[2];
    ASSERT_EQ(pipe(report), 0);

    ByteRangeLock lock;
    pid_t holder = spawn_holder(lock, paths().lock_file, report[1]);
    ASSERT_GT(holder, 0);
    close(report[1]);
    ASSERT_EQ(read_report(report[0]), 'A');
    close(report[0]);
    reap(holder, true);

    InstanceGuard guard(lock, paths().lock_file, "solo");
    ASSERT_EQ(guard.acquire(), AcquireStatus::Acquired);
    EXPECT_EQ(guard.record()->owner_id, platform::current_pid());
}

#ifdef __linux__
TEST_F(MultiProcessTest, UnreapedCrashedHolderDoesNotBlockStartup) {
    int report[2];
    ASSERT_EQ(pipe(report), 0);

    ByteRangeLock lock;
    pid_t holder = spawn_holder(lock, paths().lock_file, report[1]);
    ASSERT_GT(holder, 0);
    close(report[1]);
    ASSERT_EQ(read_report(report[0]), 'A');
    close(report[0]);

    // Killed but left unreaped, as under a supervisor that reaps late
    kill(holder, SIGKILL);
    bool gone = false;
    for (int waited = 0; waited < 5000 && !gone; waited += 20) {
        gone = !platform::process_exists(holder);
        if (!gone) platform::sleep_ms(20);
    }
    ASSERT_TRUE(gone) << "a killed, unreaped child still counts as alive";

    InstanceDetector detector(lock, paths(), "solo", platform::process_exists);
    InstanceGuard guard(lock, paths().lock_file, "solo");
    auto d = run_startup_check(detector, guard, StartupPolicy{}, "solo");
    reap(holder, false);

    EXPECT_EQ(d.detection.state, DetectionResult::State::NotRunning) << summarize(d.detection);
    EXPECT_TRUE(d.proceed);
    EXPECT_TRUE(guard.held());
}
#endif

TEST_F(MultiProcessTest, PidStrategyRecoversAfterKill) {
    int report[2];
    ASSERT_EQ(pipe(report), 0);

    PidLivenessLock lock("solo", platform::process_exists);
    pid_t holder = spawn_holder(lock, paths().lock_file, report[1]);
    ASSERT_GT(holder, 0);
    close(report[1]);
    ASSERT_EQ(read_report(report[0]), 'A');
    close(report[0]);

    InstanceDetector detector(lock, paths(), "solo", platform::process_exists);
    auto seen = detector.detect();
    ASSERT_TRUE(seen.is_running());
    EXPECT_EQ(seen.method, DetectionMethod::PidLiveness);
    EXPECT_EQ(seen.record->owner_id, holder);

    InstanceGuard blocked(lock, paths().lock_file, "solo");
    EXPECT_EQ(blocked.acquire(), AcquireStatus::AlreadyRunning);

    reap(holder, true);

    EXPECT_EQ(detector.detect().state, DetectionResult::State::NotRunning);
    InstanceGuard guard(lock, paths().lock_file, "solo");
    EXPECT_EQ(guard.acquire(), AcquireStatus::Acquired);
}

TEST_F(MultiProcessTest, LockedActivityLogInAnotherProcess) {
    fs::create_directories(paths().activity_log.parent_path());
    int report[2];
    ASSERT_EQ(pipe(report), 0);

    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        close(report[0]);
        platform::FileLock log;
        bool locked = log.try_lock(paths().activity_log.string()) == platform::LockAttempt::Locked;
        signal_parent(report[1], locked ? 'A' : 'U');
        for (;;) platform::sleep_ms(1000);
    }
    close(report[1]);
    ASSERT_EQ(read_report(report[0]), 'A');
    close(report[0]);

    ByteRangeLock lock;
    InstanceDetector detector(lock, paths(), "solo", platform::process_exists);
    auto seen = detector.detect();
    reap(child, true);

    ASSERT_TRUE(seen.is_running());
    EXPECT_EQ(seen.method, DetectionMethod::FileHandleExclusivity);
    EXPECT_EQ(detector.detect().state, DetectionResult::State::NotRunning);
}

TEST_F(MultiProcessTest, CleanExitLeavesNothingBehind) {
    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        ByteRangeLock lock;
        int code = 1;
        {
            InstanceGuard guard(lock, paths().lock_file, "solo");
            if (guard.acquire() == AcquireStatus::Acquired) code = 0;
        }
        _exit(code);
    }
    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_FALSE(fs::exists(paths().lock_file));
}

#endif // _WIN32
