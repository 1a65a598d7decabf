#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <sys/types.h>

namespace exec_harness {

/// Deadline timer that SIGKILLs a process group when it fires.
///
/// The owner must keep the target unreaped until cancel() has returned, so a
/// late kill can never hit a recycled pid.
class Watchdog {
public:
    Watchdog(pid_t leader, std::chrono::duration<double> timeout);
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void start();

    /// Stop the timer and join its thread. Idempotent.
    void cancel();

    /// True once the deadline passed and the kill was sent.
    bool fired() const { return fired_.load(); }

private:
    void run();

    pid_t leader_;
    std::chrono::duration<double> timeout_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    std::atomic<bool> fired_{false};
    std::thread thread_;
};

} // namespace exec_harness
