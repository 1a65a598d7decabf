#pragma once

#include <string>

#include "policy.h"
#include "result.h"
#include "result_slot.h"

namespace exec_harness {

/// Filename under which program text is compiled, as seen in tracebacks.
extern const char* const kProgramFilename;

/// Runs untrusted program text inside the current process. Only ever called
/// in a forked child: the restrictions it installs are permanent.
class Worker {
public:
    /// Attach an interpreter, restrict capabilities, enter `workdir`, silence
    /// I/O, execute `program` and publish exactly one classified result into
    /// `slot`. Never throws.
    static void run(
        const std::string& program,
        const ExecutionPolicy& policy,
        const std::string& workdir,
        ResultSlot& slot
    ) noexcept;

    /// Compile and execute `program` in a fresh __main__ namespace and
    /// classify the outcome. Requires an attached interpreter.
    static ExecutionResult execute(const std::string& program);
};

} // namespace exec_harness
