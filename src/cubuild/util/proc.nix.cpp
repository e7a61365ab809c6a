#ifndef _WIN32
#include "./proc.hpp"

#include <cubuild/util/log.hpp>
#include <cubuild/util/signal.hpp>

#include <fmt/core.h>

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <utility>

using namespace cubuild;

namespace {

void check_rc(bool b, std::string_view s) {
    if (!b) {
        throw std::system_error(std::error_code(errno, std::system_category()), std::string(s));
    }
}

/// Owns one end of the output pipe
class pipe_fd {
    int _fd = -1;

public:
    explicit pipe_fd(int fd) noexcept
        : _fd(fd) {}

    pipe_fd(const pipe_fd&) = delete;
    pipe_fd& operator=(const pipe_fd&) = delete;

    ~pipe_fd() { close(); }

    int get() const noexcept { return _fd; }

    void close() noexcept {
        if (_fd != -1) {
            ::close(std::exchange(_fd, -1));
        }
    }
};

/**
 * @brief Reaps a child process. If the parent leaves run_proc() early by exception, the child is
 * still waited for, so that it does not linger as a zombie.
 */
class child_process {
    ::pid_t  _pid;
    pipe_fd& _output;
    bool     _reaped = false;

public:
    child_process(::pid_t pid, pipe_fd& output) noexcept
        : _pid(pid)
        , _output(output) {}

    child_process(const child_process&) = delete;
    child_process& operator=(const child_process&) = delete;

    ~child_process() {
        if (!_reaped) {
            // A child blocked on a full pipe receives SIGPIPE instead of hanging
            _output.close();
            int status = 0;
            while (::waitpid(_pid, &status, 0) == -1 && errno == EINTR) {}
        }
    }

    int wait() {
        int status = 0;
        int rc     = 0;
        do {
            rc = ::waitpid(_pid, &status, 0);
        } while (rc == -1 && errno == EINTR);
        check_rc(rc >= 0, "Failed in waitpid()");
        _reaped = true;
        return status;
    }
};

[[noreturn]] void child_fail(const char* what) noexcept {
    std::fputs("[cubuild child executor] ", stderr);
    std::fputs(what, stderr);
    std::fputs(": ", stderr);
    std::fputs(std::strerror(errno), stderr);
    std::fputs("\n", stderr);
    std::_Exit(-1);
}

::pid_t spawn_child(const proc_options& opts, int stdout_pipe, int close_me) {
    // We must allocate BEFORE fork(), since the CRT might stumble with malloc()-related locks that
    // are held during the fork().
    std::vector<const char*> strings;
    strings.reserve(opts.command.size() + 1);
    for (auto& s : opts.command) {
        strings.push_back(s.data());
    }
    strings.push_back(nullptr);

    std::string workdir = opts.cwd.value_or(fs::current_path()).string();
    auto        not_found_err
        = fmt::format("[cubuild child executor] The requested executable [{}] could not be found.\n",
                      strings[0]);

    auto child_pid = ::fork();
    check_rc(child_pid != -1, "Failed to fork() a subprocess");
    if (child_pid != 0) {
        return child_pid;
    }
    // We are child
    ::close(close_me);
    if (::dup2(stdout_pipe, STDOUT_FILENO) == -1) {
        child_fail("Failed to dup2 stdout");
    }
    if (::dup2(stdout_pipe, STDERR_FILENO) == -1) {
        child_fail("Failed to dup2 stderr");
    }
    if (::chdir(workdir.data()) == -1) {
        child_fail("Failed to chdir() for subprocess");
    }

    ::execvp(strings[0], (char* const*)strings.data());

    if (errno == ENOENT) {
        std::fputs(not_found_err.c_str(), stderr);
        std::_Exit(-1);
    }

    child_fail("execvp returned! This is a fatal error");
}

}  // namespace

proc_result cubuild::run_proc(const proc_options& opts) {
    if (opts.cwd) {
        cubuild_log(debug,
                    "Spawning subprocess: {}\n\tIn directory: [{}]",
                    quote_command(opts.command),
                    opts.cwd->string());
    } else {
        cubuild_log(debug, "Spawning subprocess: {}", quote_command(opts.command));
    }
    int  stdio_pipe[2] = {};
    auto rc            = ::pipe(stdio_pipe);
    check_rc(rc == 0, "Create stdio pipe for subprocess");

    pipe_fd read_pipe{stdio_pipe[0]};
    pipe_fd write_pipe{stdio_pipe[1]};

    // Flush our own output before the child's output begins to interleave with it
    std::fflush(stdout);
    child_process child{spawn_child(opts, write_pipe.get(), read_pipe.get()), read_pipe};

    // Only the child writes. Without this, read() would never see the end of the output.
    write_pipe.close();

    proc_result res;
    std::string buffer;
    buffer.resize(4096);
    while (true) {
        auto nread = ::read(read_pipe.get(), buffer.data(), buffer.size());
        if (nread == -1 && errno == EINTR) {
            continue;
        }
        check_rc(nread >= 0, "Failed in read()");
        if (nread == 0) {
            break;
        }
        auto chunk = std::string_view(buffer).substr(0, static_cast<std::size_t>(nread));
        if (opts.echo_output) {
            std::fwrite(chunk.data(), 1, chunk.size(), stdout);
            std::fflush(stdout);
        }
        res.output.append(chunk);
    }
    read_pipe.close();

    auto status = child.wait();

    if (WIFEXITED(status)) {
        res.retc = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.signal = WTERMSIG(status);
    }

    cancellation_point();
    return res;
}

#endif  // _WIN32
