#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <spdlog/cfg/env.h>

#include "exec_harness/capabilities.h"
#include "exec_harness/check.h"
#include "exec_harness/errors.h"
#include "exec_harness/policy.h"
#include "exec_harness/process.h"
#include "exec_harness/result.h"
#include "exec_harness/supervisor.h"

namespace py = pybind11;
using namespace exec_harness;

// The calls that fork keep the GIL: CPython's fork protocol needs it held by
// the forking thread, and the child continues on that thread.
PYBIND11_MODULE(exec_harness, m) {
    m.doc() = "Isolated execution of untrusted Python snippets in restricted, time-limited worker processes";

    spdlog::cfg::load_env_levels();

    py::register_exception<SetupError>(m, "SetupError", PyExc_RuntimeError);

    // ── Policy ──────────────────────────────────────────────────────────

    py::class_<ResourceLimits>(m, "ResourceLimits")
        .def(py::init<>())
        .def_readwrite("max_cpu_seconds", &ResourceLimits::max_cpu_seconds)
        .def_readwrite("max_memory_bytes", &ResourceLimits::max_memory_bytes)
        .def_readwrite("max_file_size", &ResourceLimits::max_file_size)
        .def_readwrite("max_open_files", &ResourceLimits::max_open_files)
        .def_readwrite("max_processes", &ResourceLimits::max_processes);

    py::class_<Capability>(m, "Capability")
        .def_readonly("name", &Capability::name)
        .def_readonly("enabled", &Capability::enabled);

    py::class_<CapabilityTable>(m, "CapabilityTable")
        .def(py::init(&CapabilityTable::defaults))
        .def_static("defaults", &CapabilityTable::defaults)
        .def("set_enabled", &CapabilityTable::set_enabled, py::arg("name"), py::arg("enabled"))
        .def("is_enabled", &CapabilityTable::is_enabled, py::arg("name"))
        .def("disabled", &CapabilityTable::disabled)
        .def("entries", &CapabilityTable::entries);

    py::class_<ExecutionPolicy>(m, "ExecutionPolicy")
        .def(py::init<>())
        .def_readwrite("timeout_seconds", &ExecutionPolicy::timeout_seconds)
        .def_readwrite("limits", &ExecutionPolicy::limits)
        .def_readwrite("capabilities", &ExecutionPolicy::capabilities)
        .def_readwrite("temp_root", &ExecutionPolicy::temp_root)
        .def_readwrite("output_limit_bytes", &ExecutionPolicy::output_limit_bytes)
        .def_readwrite("numeric_threads", &ExecutionPolicy::numeric_threads);

    // ── Results ─────────────────────────────────────────────────────────

    py::enum_<Outcome>(m, "Outcome")
        .value("Passed", Outcome::Passed)
        .value("Failed", Outcome::Failed)
        .value("TimedOut", Outcome::TimedOut);

    py::class_<ExecutionResult>(m, "ExecutionResult")
        .def_readonly("outcome", &ExecutionResult::outcome)
        .def_readonly("error_kind", &ExecutionResult::error_kind)
        .def_readonly("line_number", &ExecutionResult::line_number)
        .def_readonly("detail", &ExecutionResult::detail)
        .def_readonly("offending_line", &ExecutionResult::offending_line)
        .def_readonly("elapsed_seconds", &ExecutionResult::elapsed_seconds)
        .def("is_passed", &ExecutionResult::is_passed)
        .def("message", &ExecutionResult::message)
        .def("diagnostics", &ExecutionResult::diagnostics)
        .def("__repr__", [](const ExecutionResult& r) {
            return "<ExecutionResult " + r.message() + ">";
        });

    py::class_<CheckReport>(m, "CheckReport")
        .def_readonly("passed", &CheckReport::passed)
        .def_readonly("result", &CheckReport::result);

    // ── Entry points ────────────────────────────────────────────────────

    m.def("check_correctness", &check_correctness,
          py::arg("program"), py::arg("timeout_seconds") = 3.0, py::arg("maximum_memory_bytes") = -1);
    m.def("check", &check, py::arg("program"), py::arg("policy") = ExecutionPolicy{});
    m.def("execute", &Supervisor::execute, py::arg("program"), py::arg("policy") = ExecutionPolicy{});
}
