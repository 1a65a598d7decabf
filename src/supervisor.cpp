#include "exec_harness/supervisor.h"
#include "exec_harness/errors.h"
#include "exec_harness/interpreter.h"
#include "exec_harness/process.h"
#include "exec_harness/result_slot.h"
#include "exec_harness/watchdog.h"
#include "exec_harness/worker.h"
#include "exec_harness/workdir.h"

#include <unistd.h>
#include <sys/wait.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace exec_harness {

ExecutionResult Supervisor::execute(const std::string& program, const ExecutionPolicy& policy) {
    auto start = std::chrono::steady_clock::now();

    TempDirectory workdir(policy.temp_root);
    ResultSlot slot;

    // Buffered stdio would otherwise be flushed twice, once by the child
    std::fflush(nullptr);

    interpreter::before_fork();
    pid_t pid = fork();
    if (pid == 0) {
        // Child: own process group so the watchdog can take down anything
        // the program spawns. The parent sets it too; whichever runs first wins.
        if (setpgid(0, 0) != 0) {
            spdlog::debug("worker setpgid failed: {}", strerror(errno));
        }
        Worker::run(program, policy, workdir.path(), slot);
        // Skip destructors: the directory and the slot belong to the parent
        _exit(0);
    }
    int fork_errno = errno;
    interpreter::after_fork_parent();
    if (pid < 0) {
        throw SetupError(std::string("fork failed: ") + strerror(fork_errno));
    }

    if (setpgid(pid, pid) != 0 && errno != EACCES) {
        spdlog::debug("setpgid({}) failed: {}", pid, strerror(errno));
    }
    spdlog::debug("spawned worker {} with a {:.2f}s deadline", pid, policy.timeout_seconds);

    Watchdog watchdog(pid, std::chrono::duration<double>(policy.timeout_seconds));
    try {
        watchdog.start();
    } catch (const std::system_error& e) {
        ProcessManager::terminate(pid);
        throw SetupError(std::string("cannot start watchdog: ") + e.what());
    }

    try {
        ProcessManager::wait_exited(pid);
    } catch (const std::runtime_error& e) {
        watchdog.cancel();
        ProcessManager::terminate(pid);
        throw SetupError(std::string("lost track of worker: ") + e.what());
    }

    // The worker is still a zombie here, so its pid cannot have been reused
    // by the time the watchdog is stopped.
    watchdog.cancel();
    if (!ProcessManager::kill_group(pid)) {
        spdlog::debug("worker group {} already empty", pid);
    }
    int status = ProcessManager::reap(pid);

    if (WIFSIGNALED(status)) {
        spdlog::debug("worker {} ended by signal {}", pid, WTERMSIG(status));
    } else {
        spdlog::debug("worker {} exited with status {}", pid, WEXITSTATUS(status));
    }

    ExecutionResult result = slot.take().value_or(ExecutionResult::timed_out());
    if (watchdog.fired() && result.outcome != Outcome::TimedOut) {
        spdlog::debug("worker {} published a result just before its deadline", pid);
    }
    result.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return result;
}

} // namespace exec_harness
