#pragma once

#include <string>

namespace exec_harness {

/// Uniquely named directory, deleted recursively when the object dies.
class TempDirectory {
public:
    /// Create "<root>/exec_harness-XXXXXX". An empty root means $TMPDIR, or
    /// /tmp when that is unset. Throws SetupError on failure.
    explicit TempDirectory(const std::string& root = "");
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/// Makes `dir` the process working directory for the lifetime of the object.
/// The path "." is a no-op. Not reentrant: the working directory is
/// process-global.
class ScopedWorkingDirectory {
public:
    explicit ScopedWorkingDirectory(const std::string& dir);
    ~ScopedWorkingDirectory();

    ScopedWorkingDirectory(const ScopedWorkingDirectory&) = delete;
    ScopedWorkingDirectory& operator=(const ScopedWorkingDirectory&) = delete;

private:
    std::string previous_;
    bool changed_ = false;
};

/// Delete a directory tree without following symlinks. Directories that were
/// left unreadable or unwritable are made accessible first. Returns false if
/// anything could not be removed.
bool remove_tree(const std::string& path);

} // namespace exec_harness
