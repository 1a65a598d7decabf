#include <gtest/gtest.h>
#include "exec_harness/process.h"
#include "exec_harness/watchdog.h"

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

#include <chrono>

using namespace exec_harness;
using namespace std::chrono_literals;

namespace {

pid_t spawn_group_leader(int exit_code, bool hang) {
    pid_t pid = fork();
    if (pid == 0) {
        setpgid(0, 0);
        if (hang) {
            for (;;) pause();
        }
        _exit(exit_code);
    }
    setpgid(pid, pid);
    return pid;
}

} // anonymous namespace

TEST(WatchdogTest, KillsHungProcessAtDeadline) {
    pid_t pid = spawn_group_leader(0, true);
    ASSERT_GT(pid, 0);

    auto start = std::chrono::steady_clock::now();
    Watchdog watchdog(pid, 200ms);
    watchdog.start();
    ProcessManager::wait_exited(pid);
    watchdog.cancel();
    auto elapsed = std::chrono::steady_clock::now() - start;

    int status = ProcessManager::reap(pid);
    EXPECT_TRUE(watchdog.fired());
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);
    EXPECT_GE(elapsed, 150ms);
    EXPECT_LT(elapsed, 2s);
}

TEST(WatchdogTest, CancelBeforeDeadlineLeavesProcessAlone) {
    pid_t pid = spawn_group_leader(7, false);
    ASSERT_GT(pid, 0);

    auto start = std::chrono::steady_clock::now();
    Watchdog watchdog(pid, 10s);
    watchdog.start();
    ProcessManager::wait_exited(pid);
    watchdog.cancel();
    auto elapsed = std::chrono::steady_clock::now() - start;

    int status = ProcessManager::reap(pid);
    EXPECT_FALSE(watchdog.fired());
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 7);
    EXPECT_LT(elapsed, 2s);
}

TEST(WatchdogTest, CancelIsIdempotentAndSafeWithoutStart) {
    Watchdog never_started(getpid(), 1s);
    never_started.cancel();
    never_started.cancel();
    EXPECT_FALSE(never_started.fired());
}

TEST(WatchdogTest, KillsWholeProcessGroup) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);

    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        setpgid(0, 0);
        close(fds[0]);
        // Both the leader and its child keep the write end open
        if (fork() == 0) {
            for (;;) pause();
        }
        for (;;) pause();
    }
    setpgid(pid, pid);
    close(fds[1]);

    Watchdog watchdog(pid, 200ms);
    watchdog.start();
    ProcessManager::wait_exited(pid);
    watchdog.cancel();
    ProcessManager::reap(pid);

    // EOF only once every writer in the group is dead
    char c;
    EXPECT_EQ(read(fds[0], &c, 1), 0);
    close(fds[0]);
    EXPECT_TRUE(watchdog.fired());
}
