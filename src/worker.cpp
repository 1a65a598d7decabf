#include "exec_harness/worker.h"
#include "exec_harness/capabilities.h"
#include "exec_harness/interpreter.h"
#include "exec_harness/io_suppressor.h"
#include "exec_harness/workdir.h"

#include <unistd.h>

#include <pybind11/pybind11.h>
#include <spdlog/spdlog.h>

#include <exception>

namespace py = pybind11;

namespace exec_harness {

const char* const kProgramFilename = "<program>";

namespace {

const char* const kHarnessError = "HarnessError";

// str() of an object the program controls; its __str__ may raise.
std::string safe_str(py::handle value) {
    try {
        return py::str(value).cast<std::string>();
    } catch (const py::error_already_set&) {
        return "<unprintable " + py::str(py::type::handle_of(value).attr("__name__")).cast<std::string>() + ">";
    }
}

// 0 when the attribute is None or not representable as an int; programs can
// raise exceptions carrying arbitrary line values.
int int_attr(py::handle obj, const char* name) {
    py::object v = obj.attr(name);
    if (v.is_none()) return 0;
    try {
        return v.cast<int>();
    } catch (const py::cast_error&) {
        return 0;
    }
}

std::string kind_of(const py::error_already_set& e) {
    return e.type().attr("__name__").cast<std::string>();
}

/// Line of the deepest traceback frame, whether it runs program code or a
/// library the program called. 0 without a traceback.
int deepest_line(py::handle traceback) {
    int line = 0;
    py::object tb = py::reinterpret_borrow<py::object>(traceback);
    while (tb && !tb.is_none()) {
        line = int_attr(tb, "tb_lineno");
        tb = tb.attr("tb_next");
    }
    return line;
}

ExecutionResult classify_syntax_error(const py::error_already_set& e, const std::string& program) {
    const py::object& value = e.value();
    return ExecutionResult::failed(
        kind_of(e),
        int_attr(value, "lineno"),
        safe_str(value.attr("msg")),
        program
    );
}

ExecutionResult classify_exception(const py::error_already_set& e, const std::string& program) {
    return ExecutionResult::failed(
        kind_of(e),
        deepest_line(e.trace()),
        safe_str(e.value()),
        program
    );
}

} // anonymous namespace

ExecutionResult Worker::execute(const std::string& program) {
    py::module_ builtins = py::module_::import("builtins");
    try {
        py::object code = builtins.attr("compile")(program, kProgramFilename, "exec");

        py::dict globals;
        globals["__name__"] = "__main__";
        globals["__builtins__"] = builtins;
        builtins.attr("exec")(code, globals);
        return ExecutionResult::passed();
    } catch (const py::error_already_set& e) {
        if (e.matches(PyExc_SyntaxError)) {
            return classify_syntax_error(e, program);
        }
        return classify_exception(e, program);
    }
}

void Worker::run(
    const std::string& program,
    const ExecutionPolicy& policy,
    const std::string& workdir,
    ResultSlot& slot
) noexcept {
    ExecutionResult result;
    try {
        interpreter::attach_in_child();
        spdlog::debug("worker {} restricting capabilities", getpid());
        CapabilityRestrictor::apply(policy);

        ScopedWorkingDirectory cwd(workdir);
        SuppressedIo io(policy.output_limit_bytes);
        result = execute(program);
    } catch (const std::exception& e) {
        result = ExecutionResult::failed(kHarnessError, 0, e.what(), program);
    }

    if (!slot.publish(result)) {
        spdlog::error("worker {} found its result slot already written", getpid());
    }
}

} // namespace exec_harness
