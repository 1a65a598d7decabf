#pragma once

#include <string>

#include "policy.h"
#include "result.h"

namespace exec_harness {

/// Runs program text in a dedicated worker process under a wall-clock
/// deadline.
class Supervisor {
public:
    /// Fork a worker, let it execute `program` under `policy`, and collect
    /// its result. A worker that is killed, crashes or exits without
    /// publishing yields TimedOut. Throws SetupError if the temporary
    /// directory, the result slot or the process cannot be created.
    static ExecutionResult execute(const std::string& program, const ExecutionPolicy& policy = {});
};

} // namespace exec_harness
