#include "exec_harness/workdir.h"
#include "exec_harness/errors.h"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace exec_harness {

namespace {

std::string default_temp_root() {
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir && *tmpdir) return tmpdir;
    return "/tmp";
}

std::string current_directory() {
    char buf[PATH_MAX];
    if (!getcwd(buf, sizeof(buf))) {
        throw std::runtime_error(std::string("getcwd failed: ") + strerror(errno));
    }
    return buf;
}

} // anonymous namespace

TempDirectory::TempDirectory(const std::string& root) {
    std::string base = root.empty() ? default_temp_root() : root;
    std::vector<char> templ(base.begin(), base.end());
    const char suffix[] = "/exec_harness-XXXXXX";
    templ.insert(templ.end(), suffix, suffix + sizeof(suffix));  // keeps the NUL

    if (!mkdtemp(templ.data())) {
        throw SetupError("mkdtemp in " + base + " failed: " + strerror(errno));
    }
    path_ = templ.data();
    spdlog::debug("created sandbox directory {}", path_);
}

TempDirectory::~TempDirectory() {
    if (!remove_tree(path_)) {
        spdlog::warn("sandbox directory {} was not fully removed", path_);
    }
}

ScopedWorkingDirectory::ScopedWorkingDirectory(const std::string& dir) {
    if (dir == ".") return;
    previous_ = current_directory();
    if (chdir(dir.c_str()) != 0) {
        throw std::runtime_error("chdir to " + dir + " failed: " + strerror(errno));
    }
    changed_ = true;
}

ScopedWorkingDirectory::~ScopedWorkingDirectory() {
    if (!changed_) return;
    if (chdir(previous_.c_str()) != 0) {
        spdlog::error("cannot restore working directory {}: {}", previous_, strerror(errno));
    }
}

bool remove_tree(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) return errno == ENOENT;

    if (!S_ISDIR(st.st_mode)) {
        return unlink(path.c_str()) == 0;
    }

    // A directory created with mode 0 cannot be listed or emptied
    if ((st.st_mode & S_IRWXU) != S_IRWXU && chmod(path.c_str(), st.st_mode | S_IRWXU) != 0) {
        spdlog::debug("chmod {} failed: {}", path, strerror(errno));
    }

    bool ok = true;
    DIR* d = opendir(path.c_str());
    if (d) {
        struct dirent* entry;
        while ((entry = readdir(d)) != nullptr) {
            const char* name = entry->d_name;
            if (name[0] == '.' && (name[1] == '\0' || (name[1] == '.' && name[2] == '\0')))
                continue;
            ok &= remove_tree(path + "/" + name);
        }
        closedir(d);
    } else {
        ok = false;
    }

    if (rmdir(path.c_str()) != 0) {
        spdlog::debug("rmdir {} failed: {}", path, strerror(errno));
        return false;
    }
    return ok;
}

} // namespace exec_harness
