#include "exec_harness/check.h"
#include "exec_harness/supervisor.h"

#include <spdlog/spdlog.h>

namespace exec_harness {

CheckReport check(const std::string& program, const ExecutionPolicy& policy) {
    CheckReport report;
    report.result = Supervisor::execute(program, policy);
    report.passed = report.result.is_passed();

    for (const auto& line : report.result.diagnostics()) {
        spdlog::info("{}", line);
    }
    return report;
}

bool check_correctness(const std::string& program, double timeout_seconds, int64_t maximum_memory_bytes) {
    ExecutionPolicy policy;
    policy.timeout_seconds = timeout_seconds;
    policy.limits.max_memory_bytes = maximum_memory_bytes;
    return check(program, policy).passed;
}

} // namespace exec_harness
