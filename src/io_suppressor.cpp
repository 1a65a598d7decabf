#include "exec_harness/io_suppressor.h"

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

namespace py = pybind11;

namespace exec_harness {

namespace {

// One object stands in for all three streams. Its write() is bound per
// instance to a C++ callable that owns the captured text.
const char* const kWriteOnlyStream = R"PY(
import io

class WriteOnlyStream(io.TextIOBase):
    def readable(self):
        return False

    def writable(self):
        return True

    def read(self, *args, **kwargs):
        raise OSError("standard input is not available")

    def readline(self, *args, **kwargs):
        raise OSError("standard input is not available")

    def readlines(self, *args, **kwargs):
        raise OSError("standard input is not available")
)PY";

struct CappedSink {
    std::string data;
    size_t limit;
};

py::object make_stream(size_t limit) {
    py::dict scope;
    scope["__builtins__"] = py::module_::import("builtins");
    py::exec(kWriteOnlyStream, scope);

    auto sink = std::make_shared<CappedSink>();
    sink->limit = limit;
    py::object stream = scope["WriteOnlyStream"]();
    stream.attr("write") = py::cpp_function([sink](const py::str& text) {
        if (sink->data.size() < sink->limit) {
            std::string bytes = text;
            sink->data.append(bytes, 0, sink->limit - sink->data.size());
        }
        return py::len(text);
    });
    return stream;
}

void replace_fd(int source, int target) {
    if (dup2(source, target) < 0) {
        throw std::runtime_error("dup2 onto fd " + std::to_string(target) + " failed: " + strerror(errno));
    }
}

} // anonymous namespace

SuppressedIo::SuppressedIo(size_t limit) {
    redirect_descriptors();
    try {
        buffer_ = make_stream(limit);
        py::module_ sys = py::module_::import("sys");
        saved_stdin_ = sys.attr("stdin");
        saved_stdout_ = sys.attr("stdout");
        saved_stderr_ = sys.attr("stderr");
        sys.attr("stdin") = buffer_;
        sys.attr("stdout") = buffer_;
        sys.attr("stderr") = buffer_;
    } catch (...) {
        restore_descriptors();
        throw;
    }
}

SuppressedIo::~SuppressedIo() {
    try {
        py::module_ sys = py::module_::import("sys");
        sys.attr("stdin") = saved_stdin_;
        sys.attr("stdout") = saved_stdout_;
        sys.attr("stderr") = saved_stderr_;
    } catch (const py::error_already_set& e) {
        spdlog::error("cannot restore sys standard streams: {}", e.what());
    }
    restore_descriptors();
}

void SuppressedIo::redirect_descriptors() {
    std::fflush(stdout);
    std::fflush(stderr);

    for (int fd = 0; fd < 3; ++fd) {
        // -1 (EBADF) when the descriptor was already closed; restored as closed
        saved_fds_[fd] = fcntl(fd, F_DUPFD_CLOEXEC, 3);
    }

    try {
        // A write-only pipe end as stdin: read(0) fails with EBADF instead of
        // blocking or seeing the caller's input.
        int pipefd[2];
        if (pipe2(pipefd, O_CLOEXEC) != 0) {
            throw std::runtime_error(std::string("pipe2 failed: ") + strerror(errno));
        }
        close(pipefd[0]);
        replace_fd(pipefd[1], STDIN_FILENO);
        close(pipefd[1]);

        int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (devnull < 0) {
            throw std::runtime_error(std::string("open /dev/null failed: ") + strerror(errno));
        }
        replace_fd(devnull, STDOUT_FILENO);
        replace_fd(devnull, STDERR_FILENO);
        close(devnull);
    } catch (...) {
        restore_descriptors();
        throw;
    }
}

void SuppressedIo::restore_descriptors() {
    std::fflush(stdout);
    std::fflush(stderr);

    for (int fd = 0; fd < 3; ++fd) {
        if (saved_fds_[fd] < 0) {
            close(fd);
            continue;
        }
        if (dup2(saved_fds_[fd], fd) < 0) {
            spdlog::error("cannot restore fd {}: {}", fd, strerror(errno));
        }
        close(saved_fds_[fd]);
        saved_fds_[fd] = -1;
    }
}

} // namespace exec_harness
