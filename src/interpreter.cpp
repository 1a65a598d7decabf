#include "exec_harness/interpreter.h"

#include <pybind11/embed.h>

#include <stdexcept>

namespace py = pybind11;

namespace exec_harness {
namespace interpreter {

namespace {

bool hosted_with_gil() {
    return Py_IsInitialized() && PyGILState_Check();
}

} // anonymous namespace

void before_fork() {
    if (hosted_with_gil()) PyOS_BeforeFork();
}

void after_fork_parent() {
    if (hosted_with_gil()) PyOS_AfterFork_Parent();
}

void attach_in_child() {
    if (!Py_IsInitialized()) {
        py::initialize_interpreter();
        return;
    }
    if (!PyGILState_Check()) {
        throw std::runtime_error("inherited interpreter is not owned by the forking thread");
    }
    PyOS_AfterFork_Child();
}

} // namespace interpreter
} // namespace exec_harness
