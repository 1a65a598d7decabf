#pragma once

#include <cstdint>
#include <string>

#include "policy.h"
#include "result.h"

namespace exec_harness {

struct CheckReport {
    bool passed = false;
    ExecutionResult result;
};

/// Execute `program` in an isolated worker and report whether it passed,
/// together with the full result for diagnostics.
CheckReport check(const std::string& program, const ExecutionPolicy& policy = {});

/// True iff `program` runs to completion without raising within
/// `timeout_seconds`. `maximum_memory_bytes` < 0 leaves memory unlimited.
bool check_correctness(
    const std::string& program,
    double timeout_seconds = 3.0,
    int64_t maximum_memory_bytes = -1
);

} // namespace exec_harness
