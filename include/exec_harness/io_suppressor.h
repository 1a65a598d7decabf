#pragma once

#include <cstddef>

#include <pybind11/pybind11.h>

namespace exec_harness {

/// Silences standard I/O for the lifetime of the object, both for Python code
/// (sys.stdin/stdout/stderr) and at the descriptor level (fds 0, 1, 2).
///
/// Reads from stdin fail with OSError (EBADF at the fd level). Writes are
/// accepted and kept in a C++-side buffer capped at `limit` bytes, or dropped
/// into /dev/null for raw descriptor writes. Requires the GIL.
class SuppressedIo {
public:
    explicit SuppressedIo(size_t limit);
    ~SuppressedIo();

    SuppressedIo(const SuppressedIo&) = delete;
    SuppressedIo& operator=(const SuppressedIo&) = delete;

private:
    void redirect_descriptors();
    void restore_descriptors();

    pybind11::object buffer_;
    pybind11::object saved_stdin_;
    pybind11::object saved_stdout_;
    pybind11::object saved_stderr_;
    int saved_fds_[3] = {-1, -1, -1};
};

} // namespace exec_harness
