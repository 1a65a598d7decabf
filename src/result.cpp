#include "exec_harness/result.h"

namespace exec_harness {

ExecutionResult ExecutionResult::passed() {
    ExecutionResult r;
    r.outcome = Outcome::Passed;
    return r;
}

ExecutionResult ExecutionResult::timed_out() {
    return ExecutionResult{};
}

ExecutionResult ExecutionResult::failed(
    const std::string& error_kind,
    int line_number,
    const std::string& detail,
    const std::string& program
) {
    ExecutionResult r;
    r.outcome = Outcome::Failed;
    r.error_kind = error_kind;
    r.line_number = line_number;
    r.detail = detail;
    r.offending_line = source_line(program, line_number);
    return r;
}

std::string ExecutionResult::message() const {
    switch (outcome) {
        case Outcome::Passed:
            return "passed";
        case Outcome::TimedOut:
            return "timed out";
        case Outcome::Failed:
            break;
    }
    return "failed: " + error_kind + " at line " + std::to_string(line_number) + ": " + detail;
}

std::vector<std::string> ExecutionResult::diagnostics() const {
    std::vector<std::string> lines{message()};
    if (outcome == Outcome::Failed && offending_line) {
        lines.push_back("Offending line: " + *offending_line);
    }
    return lines;
}

std::optional<std::string> source_line(const std::string& program, int line_number) {
    if (line_number < 1) return std::nullopt;

    size_t start = 0;
    for (int line = 1; line < line_number; ++line) {
        size_t nl = program.find('\n', start);
        if (nl == std::string::npos) return std::nullopt;
        start = nl + 1;
    }
    size_t end = program.find('\n', start);
    return program.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

const char* to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Passed:   return "Passed";
        case Outcome::Failed:   return "Failed";
        case Outcome::TimedOut: return "TimedOut";
    }
    return "?";
}

} // namespace exec_harness
