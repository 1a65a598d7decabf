#pragma once

#include <stdexcept>
#include <string>

namespace exec_harness {

/// The isolation unit could not be prepared (temporary directory, result
/// slot or process creation failed). Never raised for untrusted-code failures.
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace exec_harness
