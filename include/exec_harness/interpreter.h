#pragma once

namespace exec_harness {

/// CPython lifecycle around fork().
///
/// The supervisor may run inside a plain C++ process (no interpreter) or
/// inside a Python process that loaded the bindings. In the latter case the
/// calling thread holds the GIL and CPython's fork protocol has to be
/// followed so the child inherits a usable interpreter.
namespace interpreter {

/// Call in the parent right before fork(). No-op without an interpreter.
void before_fork();

/// Call in the parent right after fork().
void after_fork_parent();

/// Call in the child: reinitialises an inherited interpreter, or starts a
/// fresh embedded one. Never finalised; the child leaves through _exit().
/// Throws std::runtime_error if an inherited interpreter is not usable from
/// this thread.
void attach_in_child();

} // namespace interpreter

} // namespace exec_harness
