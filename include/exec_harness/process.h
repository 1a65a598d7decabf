#pragma once

#include <cstdint>
#include <sys/types.h>

namespace exec_harness {

struct ResourceLimits {
    int64_t max_cpu_seconds = -1;   // RLIMIT_CPU, -1 = unlimited
    int64_t max_memory_bytes = -1;  // RLIMIT_AS + RLIMIT_DATA + RLIMIT_STACK
    int64_t max_file_size = -1;     // RLIMIT_FSIZE
    int64_t max_open_files = -1;    // RLIMIT_NOFILE
    int64_t max_processes = -1;     // RLIMIT_NPROC
};

class ProcessManager {
public:
    /// Apply every set limit to the calling process. Returns false if any
    /// limit was refused; the others are still applied.
    static bool apply_limits(const ResourceLimits& limits);

    /// Send a signal to a process, or to a process group when pid is negative.
    static bool send_signal(pid_t pid, int signal);

    /// SIGKILL the process group led by `leader`, and the leader itself in
    /// case it has not joined its group yet.
    static bool kill_group(pid_t leader);

    /// Block until `pid` has exited, leaving it unreaped so its pid stays
    /// reserved.
    static void wait_exited(pid_t pid);

    /// Reap an exited child. Returns the raw wait status.
    static int reap(pid_t pid);

    /// kill_group followed by reap, for a worker that must not outlive a
    /// failed run. Returns the raw wait status.
    static int terminate(pid_t leader);
};

} // namespace exec_harness
