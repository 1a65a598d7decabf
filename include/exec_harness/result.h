#pragma once

#include <optional>
#include <string>
#include <vector>

namespace exec_harness {

enum class Outcome {
    Passed,
    Failed,     // syntax error or raised exception
    TimedOut,   // no result before the deadline, or the worker died silently
};

struct ExecutionResult {
    Outcome outcome = Outcome::TimedOut;
    std::string error_kind;                   // exception class name
    int line_number = 0;                      // 1-based, 0 if unknown
    std::string detail;
    std::optional<std::string> offending_line;
    double elapsed_seconds = 0.0;

    static ExecutionResult passed();
    static ExecutionResult timed_out();
    static ExecutionResult failed(
        const std::string& error_kind,
        int line_number,
        const std::string& detail,
        const std::string& program
    );

    bool is_passed() const { return outcome == Outcome::Passed; }

    /// First diagnostic line: "passed", "timed out" or
    /// "failed: <kind> at line <n>: <detail>".
    std::string message() const;

    /// message() followed by "Offending line: ..." when the line is known.
    std::vector<std::string> diagnostics() const;
};

/// Line `line_number` (1-based) of `program`, split on '\n'. Empty when out
/// of range.
std::optional<std::string> source_line(const std::string& program, int line_number);

const char* to_string(Outcome outcome);

} // namespace exec_harness
