#ifndef _WIN32

#include "test_support.hpp"
#include <platform/process.hpp>
#include <cstdio>
#include <iostream>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

TEST(ProcessExistsTest, SelfAndInvalidIds) {
    EXPECT_TRUE(platform::process_exists(platform::current_pid()));
    EXPECT_FALSE(platform::process_exists(0));
    EXPECT_FALSE(platform::process_exists(-5));
}

TEST(ProcessExistsTest, ReapedChildIsGone) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) _exit(0);
    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    EXPECT_FALSE(platform::process_exists(pid));
}

#ifdef __linux__
TEST(ProcessExistsTest, ExitedUnreapedChildIsGone) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) _exit(0);

    // The child lingers as a zombie until waitpid; it must not count as alive
    bool gone = false;
    for (int waited = 0; waited < 5000 && !gone; waited += 20) {
        gone = !platform::process_exists(pid);
        if (!gone) platform::sleep_ms(20);
    }
    EXPECT_TRUE(gone);

    int status = 0;
    EXPECT_EQ(waitpid(pid, &status, 0), pid);
}
#endif

TEST(ChildProcessTest, ReportsExitCode) {
    auto child = platform::ChildProcess::start({"sh", "-c", "exit 7"});
    ASSERT_TRUE(child.started());
    EXPECT_EQ(child.wait(), 7);
    ASSERT_TRUE(child.poll().has_value());
    EXPECT_EQ(*child.poll(), 7);
}

TEST(ChildProcessTest, SignalDeathIs128PlusSignal) {
    auto child = platform::ChildProcess::start({"sh", "-c", "kill -9 $$"});
    ASSERT_TRUE(child.started());
    EXPECT_EQ(child.wait(), 128 + SIGKILL);
}

TEST(ChildProcessTest, MissingProgramExits127) {
    auto child = platform::ChildProcess::start({"solo-test-no-such-program"});
    ASSERT_TRUE(child.started());
    EXPECT_EQ(child.wait(), 127);
}

TEST(ChildProcessTest, EmptyCommandDoesNotStart) {
    auto child = platform::ChildProcess::start({});
    EXPECT_FALSE(child.started());
    EXPECT_EQ(child.wait(), -1);
}

TEST(ChildProcessTest, StopEndsALongRunningChild) {
    auto child = platform::ChildProcess::start({"sleep", "30"});
    ASSERT_TRUE(child.started());
    EXPECT_FALSE(child.poll().has_value());
    child.stop(2000);
    EXPECT_EQ(child.wait(), 128 + SIGTERM);
}

class ChildOutputTest : public TempDirTest {};

TEST_F(ChildOutputTest, OurPendingOutputPrecedesTheChilds) {
    fs::path captured = test_dir / "stdout.txt";
    std::cout.flush();
    std::fflush(stdout);
    int saved = dup(STDOUT_FILENO);
    ASSERT_GE(saved, 0);
    int fd = open(captured.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    ASSERT_GE(fd, 0);
    dup2(fd, STDOUT_FILENO);
    close(fd);

    // Buffered, not yet flushed: stdout is a file now
    std::cout << "lock held\n";
    std::printf("pid noted\n");
    auto child = platform::ChildProcess::start({"sh", "-c", "echo child output"});
    int code = child.wait();

    std::cout.flush();
    std::fflush(stdout);
    dup2(saved, STDOUT_FILENO);
    close(saved);

    EXPECT_EQ(code, 0);
    EXPECT_EQ(read_file(captured), "lock held\npid noted\nchild output\n");
}

#endif // _WIN32
