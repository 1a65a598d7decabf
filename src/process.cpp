#include "exec_harness/process.h"

#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/wait.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace exec_harness {

namespace {

bool apply_rlimit(int resource, const char* name, int64_t value) {
    if (value < 0) return true;  // unlimited
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(value);
    rl.rlim_max = static_cast<rlim_t>(value);
    if (setrlimit(resource, &rl) != 0) {
        spdlog::warn("setrlimit({}, {}) refused: {}", name, value, strerror(errno));
        return false;
    }
    return true;
}

} // anonymous namespace

bool ProcessManager::apply_limits(const ResourceLimits& limits) {
    bool ok = true;
    ok &= apply_rlimit(RLIMIT_CPU, "RLIMIT_CPU", limits.max_cpu_seconds);
    ok &= apply_rlimit(RLIMIT_AS, "RLIMIT_AS", limits.max_memory_bytes);
    ok &= apply_rlimit(RLIMIT_DATA, "RLIMIT_DATA", limits.max_memory_bytes);
#ifndef __APPLE__
    // macOS refuses to lower the stack limit of a running process
    ok &= apply_rlimit(RLIMIT_STACK, "RLIMIT_STACK", limits.max_memory_bytes);
#endif
    ok &= apply_rlimit(RLIMIT_FSIZE, "RLIMIT_FSIZE", limits.max_file_size);
    ok &= apply_rlimit(RLIMIT_NOFILE, "RLIMIT_NOFILE", limits.max_open_files);
    ok &= apply_rlimit(RLIMIT_NPROC, "RLIMIT_NPROC", limits.max_processes);
    return ok;
}

bool ProcessManager::send_signal(pid_t pid, int sig) {
    return kill(pid, sig) == 0;
}

bool ProcessManager::kill_group(pid_t leader) {
    bool group = send_signal(-leader, SIGKILL);
    bool self = send_signal(leader, SIGKILL);
    return group || self;
}

void ProcessManager::wait_exited(pid_t pid) {
    siginfo_t info;
    for (;;) {
        std::memset(&info, 0, sizeof(info));
        if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) == 0) return;
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitid failed: ") + strerror(errno));
        }
    }
}

int ProcessManager::reap(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + strerror(errno));
        }
    }
    return status;
}

int ProcessManager::terminate(pid_t leader) {
    if (!kill_group(leader)) {
        spdlog::debug("worker {} already gone", leader);
    }
    return reap(leader);
}

} // namespace exec_harness
