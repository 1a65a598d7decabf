#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace exec_harness {

struct ExecutionPolicy;

/// A host-affecting operation the untrusted program could reach.
///
/// Names take two forms:
///   "<module>.<attribute>"  the attribute is replaced by None, so calling it
///                           raises TypeError ("os.remove", "builtins.exit")
///   "module:<name>"         the module is made unimportable ("module:psutil")
struct Capability {
    std::string name;
    bool enabled = false;
};

class CapabilityTable {
public:
    /// Every operation the worker knows how to disable, all disabled.
    static CapabilityTable defaults();

    /// Throws std::invalid_argument for a name not in the table.
    void set_enabled(const std::string& name, bool enabled);
    bool is_enabled(const std::string& name) const;

    std::vector<std::string> disabled() const;
    const std::vector<Capability>& entries() const { return entries_; }

private:
    std::vector<Capability> entries_;
};

/// Irreversibly narrows what the current process can do. Meant to run once,
/// inside the worker, with the interpreter attached and before any untrusted
/// code. Best-effort: refused rlimits and missing modules are logged and
/// skipped.
class CapabilityRestrictor {
public:
    /// Returns the number of capabilities that were disabled.
    static size_t apply(const ExecutionPolicy& policy);
};

} // namespace exec_harness
