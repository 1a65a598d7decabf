#include "exec_harness/capabilities.h"
#include "exec_harness/policy.h"

#include <pybind11/pybind11.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace py = pybind11;

namespace exec_harness {

namespace {

const char* const kDefaultDisabled[] = {
    // process and host control
    "builtins.exit",
    "builtins.quit",
    "os.kill",
    "os.killpg",
    "os.system",
    "os.fork",
    "os.forkpty",
    "subprocess.Popen",
    // filesystem mutation
    "os.remove",
    "os.removedirs",
    "os.rmdir",
    "os.rename",
    "os.renames",
    "os.replace",
    "os.unlink",
    "os.truncate",
    "os.fchmod",
    "os.fchown",
    "os.chmod",
    "os.chown",
    "os.chroot",
    "os.lchflags",
    "os.lchmod",
    "os.lchown",
    "shutil.rmtree",
    "shutil.move",
    "shutil.chown",
    // environment and identity
    "os.putenv",
    "os.setuid",
    "os.getcwd",
    "os.chdir",
    "os.fchdir",
    // debugging and introspection surfaces
    "builtins.help",
    "module:ipdb",
    "module:joblib",
    "module:resource",
    "module:psutil",
    "module:tkinter",
};

const std::string kModulePrefix = "module:";

void disable_module(const std::string& name) {
    py::module_::import("sys").attr("modules")[py::str(name)] = py::none();
}

void disable_attribute(const std::string& name) {
    auto dot = name.rfind('.');
    if (dot == std::string::npos) {
        throw std::invalid_argument("capability name has no module: " + name);
    }
    py::module_ module = py::module_::import(name.substr(0, dot).c_str());
    module.attr(py::str(name.substr(dot + 1))) = py::none();
}

void limit_numeric_threads(int threads) {
    std::string value = std::to_string(threads);
    if (setenv("OMP_NUM_THREADS", value.c_str(), 1) != 0) {
        spdlog::warn("setenv OMP_NUM_THREADS failed: {}", strerror(errno));
    }
    // os.environ is a snapshot taken at interpreter start
    py::module_::import("os").attr("environ")["OMP_NUM_THREADS"] = value;
}

} // anonymous namespace

CapabilityTable CapabilityTable::defaults() {
    CapabilityTable table;
    for (const char* name : kDefaultDisabled) {
        table.entries_.push_back({name, false});
    }
    return table;
}

void CapabilityTable::set_enabled(const std::string& name, bool enabled) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Capability& c) { return c.name == name; });
    if (it == entries_.end()) {
        throw std::invalid_argument("unknown capability: " + name);
    }
    it->enabled = enabled;
}

bool CapabilityTable::is_enabled(const std::string& name) const {
    for (const auto& c : entries_) {
        if (c.name == name) return c.enabled;
    }
    throw std::invalid_argument("unknown capability: " + name);
}

std::vector<std::string> CapabilityTable::disabled() const {
    std::vector<std::string> names;
    for (const auto& c : entries_) {
        if (!c.enabled) names.push_back(c.name);
    }
    return names;
}

size_t CapabilityRestrictor::apply(const ExecutionPolicy& policy) {
    if (!ProcessManager::apply_limits(policy.limits)) {
        spdlog::warn("some resource limits could not be applied");
    }

    // os.environ writes go through os.putenv, so this precedes the table
    limit_numeric_threads(policy.numeric_threads);
    py::module_::import("faulthandler").attr("disable")();

    size_t disabled = 0;
    for (const auto& name : policy.capabilities.disabled()) {
        try {
            if (name.compare(0, kModulePrefix.size(), kModulePrefix) == 0) {
                disable_module(name.substr(kModulePrefix.size()));
            } else {
                disable_attribute(name);
            }
            ++disabled;
        } catch (const py::error_already_set& e) {
            // the module is not importable here, so the program cannot reach it either
            spdlog::debug("capability {} skipped: {}", name, e.what());
        }
    }
    spdlog::debug("disabled {} capabilities", disabled);
    return disabled;
}

} // namespace exec_harness
