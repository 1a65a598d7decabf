#pragma once

#include <cstddef>
#include <string>

#include "capabilities.h"
#include "process.h"

namespace exec_harness {

struct ExecutionPolicy {
    double timeout_seconds = 3.0;                // wall clock, enforced by the watchdog
    ResourceLimits limits;
    CapabilityTable capabilities = CapabilityTable::defaults();
    std::string temp_root;                       // empty = $TMPDIR or /tmp
    size_t output_limit_bytes = 1024 * 1024;     // captured stdout/stderr cap
    int numeric_threads = 1;                     // OMP_NUM_THREADS
};

} // namespace exec_harness
