#include "exec_harness/watchdog.h"
#include "exec_harness/process.h"

#include <spdlog/spdlog.h>

namespace exec_harness {

Watchdog::Watchdog(pid_t leader, std::chrono::duration<double> timeout)
    : leader_(leader), timeout_(timeout) {}

Watchdog::~Watchdog() {
    cancel();
}

void Watchdog::start() {
    thread_ = std::thread(&Watchdog::run, this);
}

void Watchdog::cancel() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        cancelled_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void Watchdog::run() {
    std::unique_lock<std::mutex> lock(mu_);
    if (cv_.wait_for(lock, timeout_, [this] { return cancelled_; })) return;

    fired_ = true;
    if (!ProcessManager::kill_group(leader_)) {
        spdlog::debug("watchdog: process group {} already gone", leader_);
    }
    spdlog::warn("watchdog: killed worker {} after {:.2f}s", leader_, timeout_.count());
}

} // namespace exec_harness
