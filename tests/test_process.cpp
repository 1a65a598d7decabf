#include <gtest/gtest.h>
#include "exec_harness/process.h"

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

#include <cerrno>

using namespace exec_harness;

namespace {

pid_t spawn_hung_group_leader() {
    pid_t pid = fork();
    if (pid == 0) {
        setpgid(0, 0);
        for (;;) pause();
    }
    setpgid(pid, pid);
    return pid;
}

} // anonymous namespace

TEST(ProcessManagerTest, TerminateKillsAndReapsRunningWorker) {
    pid_t pid = spawn_hung_group_leader();
    ASSERT_GT(pid, 0);

    int status = ProcessManager::terminate(pid);
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);

    // Nothing left to reap: the worker cannot linger as a zombie
    EXPECT_EQ(waitpid(pid, nullptr, WNOHANG), -1);
    EXPECT_EQ(errno, ECHILD);
}

TEST(ProcessManagerTest, TerminateReapsAlreadyExitedWorker) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        _exit(4);
    }
    ProcessManager::wait_exited(pid);

    int status = ProcessManager::terminate(pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 4);
}

TEST(ProcessManagerTest, WaitExitedLeavesChildReapable) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        _exit(0);
    }
    ProcessManager::wait_exited(pid);
    EXPECT_TRUE(WIFEXITED(ProcessManager::reap(pid)));
}
